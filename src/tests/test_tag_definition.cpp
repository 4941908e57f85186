#include <gtest/gtest.h>

#include "modua/modbus/tag_definition.h"

using namespace modua::modbus;

namespace {

QJsonObject tagConfig(const QString& type, const QString& address, const QString& access = "Read/Write") {
    return QJsonObject{{"general", QJsonObject{{"name", "T"}, {"data_type", type}, {"address", address},
                                               {"access", access}, {"scan_rate", 250}}}};
}

} // namespace

TEST(DeviceSettingsTest, ParsesSectionsWithDefaults) {
    const DeviceSettings defaults = DeviceSettings::fromJson(QJsonObject());
    EXPECT_EQ(defaults.unitId, 1);
    EXPECT_EQ(defaults.timing.requestTimeoutMs, 1000);
    EXPECT_FALSE(defaults.dataAccess.zeroBased);
    EXPECT_TRUE(defaults.dataAccess.zeroBasedBit);
    EXPECT_EQ(defaults.blockSizes.holdRegs, 120);

    const DeviceSettings s = DeviceSettings::fromJson(QJsonObject{
        {"general", QJsonObject{{"name", "PLC"}, {"device_id", 17}}},
        {"timing", QJsonObject{{"request_timeout", 250}, {"attempts_before_timeout", 0}}},
        {"data_access", QJsonObject{{"zero_based", "Enable"}, {"func_06", 0}}},
        {"block_sizes", QJsonObject{{"hold_regs", 32}}}});
    EXPECT_EQ(s.name, "PLC");
    EXPECT_EQ(s.unitId, 17);
    EXPECT_EQ(s.timing.requestTimeoutMs, 250);
    EXPECT_EQ(s.timing.attemptsBeforeTimeout, 1);
    EXPECT_TRUE(s.dataAccess.zeroBased);
    EXPECT_FALSE(s.dataAccess.func06);
    EXPECT_EQ(s.blockSizes.limitFor(AddressType::HoldingRegister), 32);
}

TEST(TagDefinitionTest, BuildsRegisterTag) {
    TagDefinition tag;
    QString error;
    ASSERT_TRUE(TagDefinition::fromConfig(tagConfig("Float", "400010"), DeviceSettings(), "C.D.T", tag, error))
        << qPrintable(error);
    EXPECT_EQ(tag.path, "C.D.T");
    EXPECT_TRUE(tag.readWrite);
    EXPECT_EQ(tag.wire, 10);
    EXPECT_EQ(tag.span(), 2);
    EXPECT_EQ(tag.end(), 11);
    EXPECT_EQ(tag.scanRateMs, 250);
}

TEST(TagDefinitionTest, ZeroBasedShiftsRegisters) {
    DeviceSettings device;
    device.dataAccess.zeroBased = true;
    TagDefinition tag;
    QString error;
    ASSERT_TRUE(TagDefinition::fromConfig(tagConfig("Word", "400010"), device, "p", tag, error));
    EXPECT_EQ(tag.wire, 9);
}

TEST(TagDefinitionTest, ArraySpan) {
    TagDefinition tag;
    QString error;
    ASSERT_TRUE(TagDefinition::fromConfig(tagConfig("DWord(Array)", "400000 [5]"), DeviceSettings(), "p", tag,
                                          error));
    EXPECT_EQ(tag.elementCount(), 5);
    EXPECT_EQ(tag.span(), 10);
}

TEST(TagDefinitionTest, InputAreaForcesReadOnly) {
    TagDefinition tag;
    QString error;
    ASSERT_TRUE(TagDefinition::fromConfig(tagConfig("Word", "300001"), DeviceSettings(), "p", tag, error));
    EXPECT_FALSE(tag.readWrite);
}

TEST(TagDefinitionTest, RejectsInvalidConfigs) {
    TagDefinition tag;
    QString error;
    EXPECT_FALSE(TagDefinition::fromConfig(tagConfig("Nope", "400000"), DeviceSettings(), "p", tag, error));
    EXPECT_TRUE(error.contains("unknown data type"));
    EXPECT_FALSE(TagDefinition::fromConfig(tagConfig("Word", "000001"), DeviceSettings(), "p", tag, error));
    EXPECT_FALSE(TagDefinition::fromConfig(tagConfig("Word", "bad"), DeviceSettings(), "p", tag, error));
    EXPECT_FALSE(TagDefinition::fromConfig(tagConfig("Double", "465535"), DeviceSettings(), "p", tag, error));
}

TEST(TagDefinitionTest, BooleanIgnoresScaling) {
    QJsonObject cfg = tagConfig("Boolean", "000003");
    cfg["scaling"] = QJsonObject{{"type", "Linear"}};
    TagDefinition tag;
    QString error;
    ASSERT_TRUE(TagDefinition::fromConfig(cfg, DeviceSettings(), "p", tag, error));
    EXPECT_TRUE(tag.isBitArea());
    EXPECT_FALSE(tag.scaling.enabled());
}
