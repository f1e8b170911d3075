#include <gtest/gtest.h>

#include "os/Os.hpp"
#include "os/Weight.hpp"

namespace
{

TEST(WeightTest, NiceZeroIsTheBaseline)
{
    EXPECT_EQ(Os::weight_of(0), Os::NICE_0_WEIGHT);
    EXPECT_EQ(Os::weight_of(0), 1024U);
}

TEST(WeightTest, TableEndpoints)
{
    EXPECT_EQ(Os::weight_of(-20), 88761U);
    EXPECT_EQ(Os::weight_of(-1), 1277U);
    EXPECT_EQ(Os::weight_of(1), 820U);
    EXPECT_EQ(Os::weight_of(19), 15U);
}

TEST(WeightTest, OutOfRangeNiceHasNoWeight)
{
    EXPECT_FALSE(Os::weight_of(-21).has_value());
    EXPECT_FALSE(Os::weight_of(20).has_value());
    EXPECT_FALSE(Os::nice_in_range(100));
    EXPECT_TRUE(Os::nice_in_range(Os::NICE_MIN));
    EXPECT_TRUE(Os::nice_in_range(Os::NICE_MAX));
}

TEST(WeightTest, StrictlyDecreasingWithRoughlyConstantRatio)
{
    for (auto nice = Os::NICE_MIN + 1; nice <= Os::NICE_MAX; ++nice) {
        const auto heavier = *Os::weight_of(nice - 1);
        const auto lighter = *Os::weight_of(nice);
        ASSERT_GT(heavier, lighter) << "nice " << nice;

        const auto ratio = static_cast<double>(heavier) / static_cast<double>(lighter);
        EXPECT_NEAR(ratio, 1.25, 0.05) << "nice " << nice;
    }
}

TEST(WeightTest, VruntimeAdvancesInverselyToWeight)
{
    EXPECT_EQ(Os::delta_vruntime(1, Os::NICE_0_WEIGHT), Os::VRUNTIME_SCALE);
    EXPECT_EQ(Os::delta_vruntime(7, Os::NICE_0_WEIGHT), 7 * Os::VRUNTIME_SCALE);

    // 10 * 1024 * 1024 / 3121, truncated.
    EXPECT_EQ(Os::delta_vruntime(10, 3121), 3359U);

    EXPECT_LT(Os::delta_vruntime(10, *Os::weight_of(-5)), Os::delta_vruntime(10, *Os::weight_of(5)));
    EXPECT_DOUBLE_EQ(Os::vruntime_as_ticks(3 * Os::VRUNTIME_SCALE), 3.0);
}

TEST(ProcessTest, FromDescriptorValidatesNiceAndBurst)
{
    EXPECT_FALSE(Os::Process::from_descriptor({ .name = "bad", .pid = 1, .nice = 20, .burst = 5 }).has_value());
    EXPECT_FALSE(Os::Process::from_descriptor({ .name = "empty", .pid = 2, .nice = 0, .burst = 0 }).has_value());

    const auto process = Os::Process::from_descriptor({ .name = "ok", .pid = 3, .nice = -5, .burst = 8, .arrival = 2 });
    ASSERT_TRUE(process.has_value());
    EXPECT_EQ(process->weight, 3121U);
    EXPECT_EQ(process->remaining_burst, 8U);
    EXPECT_EQ(process->vruntime, 0U);
    EXPECT_FALSE(process->finished());
    EXPECT_FALSE(process->waiting_time().has_value());
}

} // namespace
