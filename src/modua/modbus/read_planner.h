#pragma once

#include <QVector>

#include "modua/modbus/modbus_types.h"
#include "modua/modbus/tag_definition.h"
#include "modua/modua_export.h"

namespace modua::modbus {

/**
 * 一次批量读取
 */
struct MODUA_API ReadBatch {
    int unitId = 1;
    AddressType type = AddressType::HoldingRegister;
    FunctionCode function = FunctionCode::ReadHoldingRegisters;
    int start = 0;
    int count = 0;
    QVector<int> tagIndices;   // 指向输入标签数组的下标
};

/**
 * 将到期标签合并为批量读取
 *
 * 按 (unitId, 地址区) 分桶，按地址排序，只要批次起点到标签终点的
 * 跨度不超过该地址区的块大小就合并（允许中间有空洞）。
 * 单个标签超过块大小时独立成批，由调用方分段读取。
 */
MODUA_API QVector<ReadBatch> planReads(const QVector<TagDefinition>& tags,
                                       const QVector<int>& dueIndices,
                                       const BlockSizes& blockSizes);

} // namespace modua::modbus
