#include <gtest/gtest.h>

#include "modua/modbus/read_planner.h"

using namespace modua::modbus;

namespace {

TagDefinition makeTag(const QString& path, AddressType area, int wire, DataType base = DataType::Word,
                      int arraySize = 0, int unitId = 1) {
    TagDefinition tag;
    tag.path = path;
    tag.type = TagType{base, arraySize > 0};
    tag.address.type = area;
    tag.address.index = wire;
    tag.address.arraySize = arraySize;
    tag.wire = wire;
    tag.unitId = unitId;
    return tag;
}

QVector<int> allIndices(const QVector<TagDefinition>& tags) {
    QVector<int> out;
    for (int i = 0; i < tags.size(); ++i) out.append(i);
    return out;
}

} // namespace

TEST(ReadPlannerTest, MergesContiguousRegisters) {
    const QVector<TagDefinition> tags = {
        makeTag("a", AddressType::HoldingRegister, 0),
        makeTag("b", AddressType::HoldingRegister, 1, DataType::Float),
        makeTag("c", AddressType::HoldingRegister, 3),
    };
    const auto batches = planReads(tags, allIndices(tags), BlockSizes());
    ASSERT_EQ(batches.size(), 1);
    EXPECT_EQ(batches[0].start, 0);
    EXPECT_EQ(batches[0].count, 4);
    EXPECT_EQ(batches[0].function, FunctionCode::ReadHoldingRegisters);
    EXPECT_EQ(batches[0].tagIndices.size(), 3);
}

TEST(ReadPlannerTest, GapsAllowedWithinBlockSize) {
    const QVector<TagDefinition> tags = {
        makeTag("a", AddressType::HoldingRegister, 10),
        makeTag("b", AddressType::HoldingRegister, 50),
    };
    const auto batches = planReads(tags, allIndices(tags), BlockSizes());
    ASSERT_EQ(batches.size(), 1);
    EXPECT_EQ(batches[0].start, 10);
    EXPECT_EQ(batches[0].count, 41);
}

TEST(ReadPlannerTest, SplitsWhenSpanExceedsBlockSize) {
    BlockSizes sizes;
    sizes.holdRegs = 10;
    const QVector<TagDefinition> tags = {
        makeTag("a", AddressType::HoldingRegister, 0),
        makeTag("b", AddressType::HoldingRegister, 9),
        makeTag("c", AddressType::HoldingRegister, 10),
    };
    const auto batches = planReads(tags, allIndices(tags), sizes);
    ASSERT_EQ(batches.size(), 2);
    EXPECT_EQ(batches[0].count, 10);
    EXPECT_EQ(batches[1].start, 10);
}

TEST(ReadPlannerTest, SeparatesAreasAndUnits) {
    const QVector<TagDefinition> tags = {
        makeTag("coil", AddressType::Coil, 0, DataType::Boolean),
        makeTag("hr", AddressType::HoldingRegister, 0),
        makeTag("ir", AddressType::InputRegister, 0),
        makeTag("hr2", AddressType::HoldingRegister, 1, DataType::Word, 0, 2),
    };
    const auto batches = planReads(tags, allIndices(tags), BlockSizes());
    EXPECT_EQ(batches.size(), 4);
    for (const ReadBatch& batch : batches) {
        EXPECT_EQ(batch.tagIndices.size(), 1);
        EXPECT_EQ(batch.function, readFunctionFor(batch.type));
    }
}

TEST(ReadPlannerTest, OnlyDueTagsArePlanned) {
    const QVector<TagDefinition> tags = {
        makeTag("a", AddressType::HoldingRegister, 0),
        makeTag("b", AddressType::HoldingRegister, 5),
    };
    const auto batches = planReads(tags, {1, 7}, BlockSizes());
    ASSERT_EQ(batches.size(), 1);
    EXPECT_EQ(batches[0].start, 5);
    EXPECT_EQ(batches[0].tagIndices, QVector<int>{1});
}

TEST(ReadPlannerTest, OversizedArrayIsItsOwnBatch) {
    BlockSizes sizes;
    sizes.holdRegs = 8;
    const QVector<TagDefinition> tags = {
        makeTag("arr", AddressType::HoldingRegister, 0, DataType::Word, 20),
    };
    const auto batches = planReads(tags, allIndices(tags), sizes);
    ASSERT_EQ(batches.size(), 1);
    EXPECT_EQ(batches[0].count, 20);
}
