#include "buildjson/buildjson.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace plasticity::test
{

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              (std::string("plasticity_config_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string write(const std::string& body)
    {
        const auto path = dir / "plasticity.json";
        std::ofstream(path) << body;
        return path.string();
    }

    fs::path dir;
};

TEST_F(ConfigTest, ParsesBasicSettingsAndExperiments)
{
    const auto path = write(R"({
        "basic settings": [{
            "outputdir": "/tmp/run42",
            "sessionlog": "/tmp/run42/session.log",
            "currentlimit": 1e-6,
            "nplc": 0.1,
            "writelabels": false
        }],
        "experiment": [
            {"type": "ltpltd", "priority": 4, "pulsetime": 30,
             "pulsewidth": 0.05, "writedvoltage": -1.2},
            {"type": "ppd", "priority": 2, "intervals": [0.02, 0.2],
             "repetitions": 5},
            {"type": "ivconvergence", "vmax": 0.8,
             "stepsizes": [0.2, 0.1], "targetr2": 0.95, "maxattempts": 8},
            {"type": "sine", "enable": false, "cycles": 2}
        ]
    })");

    const auto cfg = loadConfigFromJsonFile(path);
    EXPECT_EQ(cfg.basic.outputDir, "/tmp/run42");
    EXPECT_EQ(cfg.basic.sessionLog, "/tmp/run42/session.log");
    EXPECT_DOUBLE_EQ(cfg.basic.currentLimit, 1e-6);
    EXPECT_DOUBLE_EQ(cfg.basic.nplc, 0.1);
    EXPECT_FALSE(cfg.basic.writeLabels);
    EXPECT_TRUE(cfg.basic.simulate);

    ASSERT_TRUE(cfg.ltpLtd);
    EXPECT_EQ(cfg.ltpLtd->priority, 4);
    EXPECT_TRUE(cfg.ltpLtd->enabled);
    EXPECT_EQ(cfg.ltpLtd->params.pulseTime, 30);
    EXPECT_DOUBLE_EQ(cfg.ltpLtd->params.pulseWidth, 0.05);
    EXPECT_DOUBLE_EQ(cfg.ltpLtd->params.writeDVoltage, -1.2);
    EXPECT_DOUBLE_EQ(cfg.ltpLtd->params.readVoltage, 0.1);

    ASSERT_TRUE(cfg.pairedPulse);
    EXPECT_EQ(cfg.pairedPulse->params.intervals,
              (std::vector<double>{0.02, 0.2}));
    EXPECT_EQ(cfg.pairedPulse->params.repetitions, 5);

    ASSERT_TRUE(cfg.ivConvergence);
    EXPECT_EQ(cfg.ivConvergence->priority, 7);
    EXPECT_DOUBLE_EQ(cfg.ivConvergence->vMax, 0.8);
    EXPECT_EQ(cfg.ivConvergence->convergence.stepSizes,
              (std::vector<double>{0.2, 0.1}));
    EXPECT_DOUBLE_EQ(cfg.ivConvergence->convergence.targetR2, 0.95);
    EXPECT_EQ(cfg.ivConvergence->convergence.maxAttempts, 8);
    EXPECT_EQ(cfg.ivConvergence->convergence.minAttempts, 3);

    ASSERT_TRUE(cfg.sine);
    EXPECT_FALSE(cfg.sine->enabled);
    EXPECT_EQ(cfg.sine->params.cycles, 2);

    EXPECT_FALSE(cfg.stdp);
    EXPECT_FALSE(cfg.srdp);
    EXPECT_FALSE(cfg.ltm);
}

TEST_F(ConfigTest, InvalidFieldsFallBackToDefaults)
{
    const auto path = write(R"({
        "basic settings": [{"currentlimit": -1, "nplc": "fast"}],
        "experiment": [
            {"type": "stdp", "readnum": -3, "pulsewidth": "long",
             "timings": [0.1, "x"], "spikevoltage": 0.6},
            {"type": "teleport"}
        ]
    })");

    const auto cfg = loadConfigFromJsonFile(path);
    EXPECT_DOUBLE_EQ(cfg.basic.currentLimit, 1e-7);
    EXPECT_DOUBLE_EQ(cfg.basic.nplc, 1.0);

    ASSERT_TRUE(cfg.stdp);
    const exp::StdpParams defaults;
    EXPECT_EQ(cfg.stdp->params.readNum, defaults.readNum);
    EXPECT_DOUBLE_EQ(cfg.stdp->params.pulseWidth, defaults.pulseWidth);
    EXPECT_EQ(cfg.stdp->params.timings, defaults.timings);
    EXPECT_DOUBLE_EQ(cfg.stdp->params.spikeVoltage, 0.6);
    EXPECT_EQ(cfg.stdp->priority, 3);
}

TEST_F(ConfigTest, TinyIvStepSizesAreDropped)
{
    const auto path = write(R"({
        "experiment": [
            {"type": "ivconvergence", "stepsizes": [0.1, 1e-12, 0.02, 0]}
        ]
    })");

    const auto cfg = loadConfigFromJsonFile(path);
    ASSERT_TRUE(cfg.ivConvergence);
    EXPECT_EQ(cfg.ivConvergence->convergence.stepSizes,
              (std::vector<double>{0.1, 0.02}));
}

TEST_F(ConfigTest, MissingSectionsUseDefaults)
{
    const auto cfg = loadConfigFromJsonFile(write("{}"));
    EXPECT_EQ(cfg.basic.outputDir, "./plasticity-data");
    EXPECT_TRUE(cfg.basic.writeLabels);
    EXPECT_FALSE(cfg.ltpLtd);
    EXPECT_FALSE(cfg.ivConvergence);
}

TEST_F(ConfigTest, MissingFileThrows)
{
    EXPECT_THROW(loadConfigFromJsonFile((dir / "absent.json").string()),
                 std::runtime_error);
}

TEST_F(ConfigTest, MalformedFileThrows)
{
    EXPECT_THROW(loadConfigFromJsonFile(write("{\"experiment\": [")),
                 std::runtime_error);
}

TEST(DefaultConfigTest, EnablesEveryExperimentInOrder)
{
    const auto cfg = defaultConfig();
    ASSERT_TRUE(cfg.ltpLtd && cfg.pairedPulse && cfg.stdp && cfg.srdp &&
                cfg.ltm && cfg.sine && cfg.ivConvergence);
    EXPECT_EQ(cfg.ltpLtd->priority, 1);
    EXPECT_EQ(cfg.ivConvergence->priority, 7);
    EXPECT_TRUE(cfg.ltm->enabled);
    EXPECT_EQ(cfg.pairedPulse->params.intervals,
              exp::PairedPulseParams{}.intervals);
}

} // namespace plasticity::test
