#include <gtest/gtest.h>

#include "fallwatch/sensitivity_profile.hpp"

using namespace fallwatch;

TEST(SensitivityProfileTest, NamedPresets) {
    const Thresholds low = thresholds_for("low");
    EXPECT_DOUBLE_EQ(low.angle_deg, 25.0);
    EXPECT_DOUBLE_EQ(low.speed, 50.0);
    EXPECT_DOUBLE_EQ(low.aspect, 1.5);

    const Thresholds medium = thresholds_for("medium");
    EXPECT_DOUBLE_EQ(medium.angle_deg, 35.0);
    EXPECT_DOUBLE_EQ(medium.speed, 30.0);
    EXPECT_DOUBLE_EQ(medium.aspect, 1.3);

    const Thresholds high = thresholds_for("high");
    EXPECT_DOUBLE_EQ(high.angle_deg, 45.0);
    EXPECT_DOUBLE_EQ(high.speed, 20.0);
    EXPECT_DOUBLE_EQ(high.aspect, 1.1);
}

TEST(SensitivityProfileTest, UnknownNameFallsBackToMedium) {
    EXPECT_EQ(parse_sensitivity("extreme"), Sensitivity::MEDIUM);
    const Thresholds t = thresholds_for("extreme");
    EXPECT_DOUBLE_EQ(t.angle_deg, 35.0);
    EXPECT_DOUBLE_EQ(t.speed, 30.0);
    EXPECT_DOUBLE_EQ(t.aspect, 1.3);

    EXPECT_EQ(parse_sensitivity(""), Sensitivity::MEDIUM);
}

TEST(SensitivityProfileTest, NamesAreCaseInsensitive) {
    EXPECT_EQ(parse_sensitivity("HIGH"), Sensitivity::HIGH);
    EXPECT_EQ(parse_sensitivity(" Low "), Sensitivity::LOW);
}

TEST(SensitivityProfileTest, RoundTripsThroughString) {
    for (Sensitivity s : {Sensitivity::LOW, Sensitivity::MEDIUM, Sensitivity::HIGH}) {
        EXPECT_EQ(parse_sensitivity(sensitivity_to_string(s)), s);
    }
}

TEST(SensitivityProfileTest, HigherSensitivityLoosensEveryThreshold) {
    const Thresholds low = thresholds_for(Sensitivity::LOW);
    const Thresholds high = thresholds_for(Sensitivity::HIGH);
    EXPECT_GT(high.angle_deg, low.angle_deg);
    EXPECT_LT(high.speed, low.speed);
    EXPECT_LT(high.aspect, low.aspect);
}
