#include "output/sweep_csv.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace plasticity::test
{

namespace fs = std::filesystem;

class SweepCsvTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              (std::string("plasticity_csv_") + info->name());
        fs::remove_all(dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    static std::vector<std::string> lines(const fs::path& path)
    {
        std::ifstream in(path);
        std::vector<std::string> out;
        for (std::string line; std::getline(in, line);)
            out.push_back(line);
        return out;
    }

    static SampleLog twoSamples()
    {
        SampleLog log;
        log.append({0.0, 0.1, 2e-9, "LTP_read"});
        log.append({0.25, 1.0, 5e-8, "LTP_write"});
        return log;
    }

    fs::path dir;
};

TEST_F(SweepCsvTest, WritesHeaderAndRowsWithLabels)
{
    const auto path = output::writeSweepCsv(dir, "ltpltd_raw_data",
                                            twoSamples());
    ASSERT_TRUE(path);
    EXPECT_EQ(path->filename().string(), "ltpltd_raw_data.csv");

    const auto rows = lines(*path);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], "Time(s),Voltage(V),Current(A),Label");
    EXPECT_EQ(rows[1], "0,0.1,2e-09,LTP_read");
    EXPECT_EQ(rows[2], "0.25,1,5e-08,LTP_write");
}

TEST_F(SweepCsvTest, LabelColumnCanBeDropped)
{
    const auto path =
        output::writeSweepCsv(dir, "sine_raw_data", twoSamples(), false);
    ASSERT_TRUE(path);

    const auto rows = lines(*path);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], "Time(s),Voltage(V),Current(A)");
    EXPECT_EQ(rows[2], "0.25,1,5e-08");
}

TEST_F(SweepCsvTest, NeverOverwritesExistingFiles)
{
    const auto first = output::writeSweepCsv(dir, "run", twoSamples());
    const auto second = output::writeSweepCsv(dir, "run", twoSamples());
    const auto third = output::writeSweepCsv(dir, "run", SampleLog{});

    ASSERT_TRUE(first && second && third);
    EXPECT_EQ(first->filename().string(), "run.csv");
    EXPECT_EQ(second->filename().string(), "run_1.csv");
    EXPECT_EQ(third->filename().string(), "run_2.csv");
    EXPECT_EQ(lines(*first).size(), 3u);
    EXPECT_EQ(lines(*third).size(), 1u);
}

TEST_F(SweepCsvTest, UniquePathSkipsTakenNames)
{
    fs::create_directories(dir);
    EXPECT_EQ(output::uniquePath(dir, "iv").string(),
              (dir / "iv.csv").string());
    std::ofstream(dir / "iv.csv") << "x\n";
    std::ofstream(dir / "iv_1.csv") << "x\n";
    EXPECT_EQ(output::uniquePath(dir, "iv").string(),
              (dir / "iv_2.csv").string());
    EXPECT_EQ(output::uniquePath(dir, "iv", ".log").string(),
              (dir / "iv.log").string());
}

TEST_F(SweepCsvTest, WritesDerivedPoints)
{
    const std::vector<Point> window{{-0.05, -0.1}, {0.02, 0.2}};
    const auto path =
        output::writePointsCsv(dir, "stdp_delta", "Delta_t", "Delta_g", window);
    ASSERT_TRUE(path);

    const auto rows = lines(*path);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], "Delta_t,Delta_g");
    EXPECT_EQ(rows[1], "-0.05,-0.1");
    EXPECT_EQ(rows[2], "0.02,0.2");
}

} // namespace plasticity::test
