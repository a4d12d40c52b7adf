#include "core/sample_log.hpp"

#include <gtest/gtest.h>

namespace plasticity::test
{

namespace
{

SampleLog makeLog()
{
    SampleLog log;
    log.append({12.5, 0.1, 1e-9, "LTP_read"});
    log.append({12.7, 1.0, 5e-9, "LTP_write"});
    log.append({12.9, 0.1, 2e-9, "ltd_READ"});
    log.append({13.4, -1.0, -3e-9, "LTD_write"});
    return log;
}

} // namespace

TEST(SampleLogTest, NormalizeStartsAtZero)
{
    auto log = makeLog();
    log.normalize();

    ASSERT_EQ(log.size(), 4u);
    EXPECT_DOUBLE_EQ(log[0].timestamp, 0.0);
    EXPECT_NEAR(log[1].timestamp, 0.2, 1e-12);
    EXPECT_NEAR(log[3].timestamp, 0.9, 1e-12);
}

TEST(SampleLogTest, NormalizeTwiceIsNoOp)
{
    auto log = makeLog();
    log.normalize();
    const auto once = log.samples();
    log.normalize();

    ASSERT_EQ(log.size(), once.size());
    for (size_t i = 0; i < once.size(); ++i)
        EXPECT_DOUBLE_EQ(log[i].timestamp, once[i].timestamp);
}

TEST(SampleLogTest, NormalizeEmptyLogIsHarmless)
{
    SampleLog log;
    log.normalize();
    EXPECT_TRUE(log.empty());
}

TEST(SampleLogTest, FilterIsCaseInsensitiveAndKeepsOrder)
{
    const auto log = makeLog();

    const auto reads = log.filter("read");
    ASSERT_EQ(reads.size(), 2u);
    EXPECT_EQ(reads[0].label, "LTP_read");
    EXPECT_EQ(reads[1].label, "ltd_READ");

    const auto ltd = log.filter("LTD");
    ASSERT_EQ(ltd.size(), 2u);
    EXPECT_EQ(ltd[0].label, "ltd_READ");
    EXPECT_EQ(ltd[1].label, "LTD_write");

    EXPECT_TRUE(log.filter("pulse").empty());
    EXPECT_EQ(log.filter("").size(), 4u);
}

TEST(SampleLogTest, PointViewsFollowSampleOrder)
{
    const auto log = makeLog();
    const auto iv = ivPoints(log.samples());
    ASSERT_EQ(iv.size(), 4u);
    EXPECT_DOUBLE_EQ(iv[3].first, -1.0);
    EXPECT_DOUBLE_EQ(iv[3].second, -3e-9);

    const auto tc = timeCurrentPoints(log.samples());
    EXPECT_DOUBLE_EQ(tc[1].first, 12.7);
    EXPECT_DOUBLE_EQ(tc[1].second, 5e-9);
}

} // namespace plasticity::test
