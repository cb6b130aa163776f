#include <gtest/gtest.h>
#include "action_decoder.h"

using namespace orbit_transfer_core;

TEST(ActionDecoderTest, DefaultGrid) {
    ActionDecoder dec;
    EXPECT_EQ(dec.size(), 24);
    EXPECT_EQ(dec.wait_levels(), 4);
    EXPECT_EQ(dec.thrust_levels(), 6);

    const std::vector<double> waits = {0.0, 0.25, 0.5, 0.75};
    const std::vector<double> thrusts = {-0.5, -0.2, 0.1, 0.4, 0.7, 1.0};
    for (size_t i = 0; i < waits.size(); ++i) EXPECT_NEAR(dec.wait_grid()[i], waits[i], 1e-12);
    for (size_t i = 0; i < thrusts.size(); ++i) EXPECT_NEAR(dec.thrust_grid()[i], thrusts[i], 1e-12);
}

TEST(ActionDecoderTest, ExtremeIndicesDecodeToGridCorners) {
    ActionDecoder dec;
    const Action& first = dec.decode(0);
    EXPECT_DOUBLE_EQ(first.wait_fraction, 0.0);
    EXPECT_DOUBLE_EQ(first.thrust, -0.5);

    const Action& last = dec.decode(dec.size() - 1);
    EXPECT_DOUBLE_EQ(last.wait_fraction, 0.75);
    EXPECT_DOUBLE_EQ(last.thrust, 1.0);
}

TEST(ActionDecoderTest, RowMajorOrderOverWaitThenThrust) {
    ActionDecoder dec;
    const Action& a = dec.decode(7);
    EXPECT_NEAR(a.wait_fraction, 0.25, 1e-12);
    EXPECT_NEAR(a.thrust, -0.2, 1e-12);
    const Action& b = dec.decode(17);
    EXPECT_NEAR(b.wait_fraction, 0.5, 1e-12);
    EXPECT_NEAR(b.thrust, 1.0, 1e-12);
}

TEST(ActionDecoderTest, OutOfRangeIndexFails) {
    ActionDecoder dec;
    EXPECT_THROW(dec.decode(-1), std::out_of_range);
    EXPECT_THROW(dec.decode(dec.size()), std::out_of_range);
    EXPECT_THROW(dec.decode(1000), std::out_of_range);
}

TEST(ActionDecoderTest, DecodingIsStable) {
    ActionDecoder dec;
    const Action* p1 = &dec.decode(11);
    const Action* p2 = &dec.decode(11);
    EXPECT_EQ(p1, p2);
    EXPECT_EQ(p1->wait_fraction, p2->wait_fraction);
    EXPECT_EQ(p1->thrust, p2->thrust);
}

TEST(ActionDecoderTest, CustomAndSingleLevelGrids) {
    ActionGridConfig cfg;
    cfg.wait_levels = 1;
    cfg.thrust_levels = 3;
    cfg.max_thrust = 2.0;
    ActionDecoder dec(cfg);
    EXPECT_EQ(dec.size(), 3);
    EXPECT_DOUBLE_EQ(dec.decode(0).wait_fraction, 0.0);
    EXPECT_DOUBLE_EQ(dec.decode(0).thrust, -1.0);
    EXPECT_NEAR(dec.decode(1).thrust, 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(dec.decode(2).thrust, 2.0);

    cfg.thrust_levels = 0;
    EXPECT_THROW(ActionDecoder bad(cfg), std::invalid_argument);
}

TEST(ActionDecoderTest, Linspace) {
    EXPECT_TRUE(linspace(0.0, 1.0, 0).empty());
    std::vector<double> one = linspace(3.0, 9.0, 1);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0], 3.0);
    std::vector<double> five = linspace(0.0, 1.0, 5);
    ASSERT_EQ(five.size(), 5u);
    EXPECT_DOUBLE_EQ(five[2], 0.5);
    EXPECT_EQ(five.back(), 1.0);
}
