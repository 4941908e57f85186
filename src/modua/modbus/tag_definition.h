#pragma once

#include <QJsonObject>
#include <QString>

#include "modua/modbus/modbus_types.h"
#include "modua/modbus/scaling.h"
#include "modua/modua_export.h"

namespace modua::modbus {

struct MODUA_API DeviceTiming {
    int connectTimeoutSec = 3;
    int connectAttempts = 1;
    int requestTimeoutMs = 1000;
    int attemptsBeforeTimeout = 1;
    int interRequestDelayMs = 0;
};

struct MODUA_API DataAccess {
    bool zeroBased = false;
    bool zeroBasedBit = true;
    bool bitWrites = false;
    bool func06 = true;
    bool func05 = true;
};

struct MODUA_API BlockSizes {
    int outCoils = 2000;
    int inCoils = 2000;
    int intRegs = 120;
    int holdRegs = 120;

    int limitFor(AddressType type) const;
};

/**
 * 设备运行参数，由设备节点配置解析而来
 */
struct MODUA_API DeviceSettings {
    QString name;
    int unitId = 1;
    DeviceTiming timing;
    DataAccess dataAccess;
    DeviceEncoding encoding;
    BlockSizes blockSizes;

    static DeviceSettings fromJson(const QJsonObject& device);
};

/**
 * 运行时标签定义
 */
struct MODUA_API TagDefinition {
    QString path;
    QString name;
    TagType type;
    bool readWrite = false;
    ParsedAddress address;
    int wire = 0;          // 线上起始地址
    int unitId = 1;
    int scanRateMs = 10;
    ScalingConfig scaling;

    int elementCount() const { return address.arraySize > 0 ? address.arraySize : 1; }
    /** 占用的寄存器（或位）数 */
    int span() const;
    int end() const { return wire + span() - 1; }
    bool isBitArea() const { return isBitAddress(address.type); }

    /**
     * 由标签节点配置 {general:{...}, scaling:{...}} 构建
     */
    static bool fromConfig(const QJsonObject& tag, const DeviceSettings& device,
                           const QString& path, TagDefinition& out, QString& error);
};

} // namespace modua::modbus
