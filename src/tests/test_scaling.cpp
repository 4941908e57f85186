#include <gtest/gtest.h>

#include <QVariantList>

#include "modua/modbus/scaling.h"

using namespace modua::modbus;

namespace {

ScalingConfig linear(double rl, double rh, double sl, double sh) {
    ScalingConfig cfg;
    cfg.type = ScalingConfig::Type::Linear;
    cfg.rawLow = rl;
    cfg.rawHigh = rh;
    cfg.scaledLow = sl;
    cfg.scaledHigh = sh;
    return cfg;
}

} // namespace

TEST(ScalingTest, NoneIsPassThrough) {
    ScalingConfig cfg;
    EXPECT_FALSE(cfg.enabled());
    EXPECT_DOUBLE_EQ(applyScaling(42.0, cfg), 42.0);
}

TEST(ScalingTest, LinearMapsRange) {
    const ScalingConfig cfg = linear(0, 1000, 0, 100);
    EXPECT_DOUBLE_EQ(applyScaling(500.0, cfg), 50.0);
    EXPECT_DOUBLE_EQ(applyScaling(0.0, cfg), 0.0);
    EXPECT_DOUBLE_EQ(reverseScaling(25.0, cfg, true), 250.0);
}

TEST(ScalingTest, SquareRoot) {
    ScalingConfig cfg = linear(0, 100, 0, 10);
    cfg.type = ScalingConfig::Type::SquareRoot;
    EXPECT_DOUBLE_EQ(applyScaling(25.0, cfg), 5.0);
    // 低于下限时归一化值取 0
    EXPECT_DOUBLE_EQ(applyScaling(-10.0, cfg), 0.0);
    EXPECT_DOUBLE_EQ(reverseScaling(5.0, cfg, false), 25.0);
}

TEST(ScalingTest, NegateBeforeClamp) {
    ScalingConfig cfg = linear(0, 100, 0, 100);
    cfg.negate = true;
    cfg.clampLow = true;
    EXPECT_DOUBLE_EQ(applyScaling(30.0, cfg), 0.0);

    cfg.clampLow = false;
    EXPECT_DOUBLE_EQ(applyScaling(30.0, cfg), -30.0);
}

TEST(ScalingTest, ClampHigh) {
    ScalingConfig cfg = linear(0, 100, 0, 50);
    cfg.clampHigh = true;
    EXPECT_DOUBLE_EQ(applyScaling(200.0, cfg), 50.0);
}

TEST(ScalingTest, ZeroRawRangeReturnsRaw) {
    const ScalingConfig cfg = linear(10, 10, 0, 100);
    EXPECT_DOUBLE_EQ(applyScaling(7.0, cfg), 7.0);
}

TEST(ScalingTest, VariantScalingHandlesListsAndNonNumeric) {
    const ScalingConfig cfg = linear(0, 10, 0, 100);
    const QVariant list = applyScaling(QVariant(QVariantList{quint64(1), quint64(2)}), cfg);
    ASSERT_EQ(list.toList().size(), 2);
    EXPECT_DOUBLE_EQ(list.toList().at(1).toDouble(), 20.0);

    EXPECT_EQ(applyScaling(QVariant(QString("text")), cfg).toString(), "text");
    EXPECT_TRUE(applyScaling(QVariant(true), cfg).toBool());
}

TEST(ScalingTest, ReverseRoundsForIntegerRaw) {
    const ScalingConfig cfg = linear(0, 1000, 0, 100);
    const QVariant raw = reverseScaling(QVariant(12.34), cfg, TagType{DataType::Word, false});
    EXPECT_EQ(raw.toLongLong(), 123);
    const QVariant floatRaw = reverseScaling(QVariant(12.34), cfg, TagType{DataType::Float, false});
    EXPECT_NEAR(floatRaw.toDouble(), 123.4, 1e-9);
}

TEST(ScalingTest, FromJsonAcceptsYesNoAndNumbers) {
    const ScalingConfig cfg = ScalingConfig::fromJson(QJsonObject{
        {"type", "Square Root"}, {"raw_low", 4}, {"raw_high", 20}, {"scaled_type", "Double"},
        {"clamp_low", "Yes"}, {"clamp_high", 1}, {"negate", "No"}, {"units", "bar"}});
    EXPECT_EQ(cfg.type, ScalingConfig::Type::SquareRoot);
    EXPECT_DOUBLE_EQ(cfg.rawLow, 4.0);
    EXPECT_TRUE(cfg.clampLow);
    EXPECT_TRUE(cfg.clampHigh);
    EXPECT_FALSE(cfg.negate);
    EXPECT_EQ(cfg.units, "bar");
    EXPECT_EQ(cfg.toJson().value("type").toString(), "Square Root");
    EXPECT_EQ(ScalingConfig::parseType("sqrt"), ScalingConfig::Type::SquareRoot);
}
