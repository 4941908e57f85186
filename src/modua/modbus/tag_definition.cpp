#include "tag_definition.h"

#include "modua/core/constants.h"
#include "modua/utils/config_utils.h"

namespace modua::modbus {

int BlockSizes::limitFor(AddressType type) const
{
    switch (type) {
    case AddressType::Coil:
        return outCoils;
    case AddressType::DiscreteInput:
        return inCoils;
    case AddressType::InputRegister:
        return intRegs;
    case AddressType::HoldingRegister:
        return holdRegs;
    }
    return holdRegs;
}

DeviceSettings DeviceSettings::fromJson(const QJsonObject& device)
{
    DeviceSettings s;
    const QJsonObject general = safeGetObject(device, "general");
    s.name = safeGetString(general, "name", safeGetString(device, "text"));
    s.unitId = safeGetInt(general, "device_id", 1);

    const QJsonObject timing = safeGetObject(device, "timing");
    s.timing.connectTimeoutSec = safeGetInt(timing, "connect_timeout", kDefaultConnectTimeoutSec);
    s.timing.connectAttempts = qMax(1, safeGetInt(timing, "connect_attempts", kDefaultConnectAttempts));
    s.timing.requestTimeoutMs = safeGetInt(timing, "request_timeout", kDefaultRequestTimeoutMs);
    s.timing.attemptsBeforeTimeout =
        qMax(1, safeGetInt(timing, "attempts_before_timeout", kDefaultAttemptsBeforeTimeout));
    s.timing.interRequestDelayMs = qMax(0, safeGetInt(timing, "inter_request_delay", kDefaultInterRequestDelayMs));

    const QJsonObject access = safeGetObject(device, "data_access");
    s.dataAccess.zeroBased = toNumericFlag(access.value("zero_based"), 0) == 1;
    s.dataAccess.zeroBasedBit = toNumericFlag(access.value("zero_based_bit"), 1) == 1;
    s.dataAccess.bitWrites = toNumericFlag(access.value("bit_writes"), 0) == 1;
    s.dataAccess.func06 = toNumericFlag(access.value("func_06"), 1) == 1;
    s.dataAccess.func05 = toNumericFlag(access.value("func_05"), 1) == 1;

    s.encoding = DeviceEncoding::fromJson(safeGetObject(device, "encoding"));

    const QJsonObject blocks = safeGetObject(device, "block_sizes");
    s.blockSizes.outCoils = qMax(1, safeGetInt(blocks, "out_coils", kDefaultOutCoils));
    s.blockSizes.inCoils = qMax(1, safeGetInt(blocks, "in_coils", kDefaultInCoils));
    s.blockSizes.intRegs = qMax(1, safeGetInt(blocks, "int_regs", kDefaultIntRegs));
    s.blockSizes.holdRegs = qMax(1, safeGetInt(blocks, "hold_regs", kDefaultHoldRegs));
    return s;
}

int TagDefinition::span() const
{
    if (isBitArea()) return elementCount();
    return type.elementRegisters() * elementCount();
}

bool TagDefinition::fromConfig(const QJsonObject& tag, const DeviceSettings& device,
                               const QString& path, TagDefinition& out, QString& error)
{
    const QJsonObject general = safeGetObject(tag, "general");
    TagDefinition def;
    def.path = path;
    def.name = safeGetString(general, "name", safeGetString(tag, "text"));
    def.unitId = device.unitId;

    const QString typeName = safeGetString(general, "data_type", "Word");
    if (!parseDataType(typeName, def.type)) {
        error = QString("tag %1: unknown data type '%2'").arg(path, typeName);
        return false;
    }

    const QString access = safeGetString(general, "access", kAccessReadWrite);
    def.readWrite = access.compare(kAccessReadWrite, Qt::CaseInsensitive) == 0
        || access.compare("R/W", Qt::CaseInsensitive) == 0;

    if (!parseAddress(safeGetString(general, "address"), def.address, error)) {
        error = QString("tag %1: %2").arg(path, error);
        return false;
    }
    if (def.type.isArray && def.address.arraySize == 0) {
        def.address.arraySize = 1;
    }

    // 非布尔类型不能使用位地址；布尔类型放在寄存器区时按寄存器非零判断
    if (!def.type.isBoolean() && isBitAddress(def.address.type)) {
        error = QString("tag %1: %2 cannot use a bit address").arg(path, def.type.displayName());
        return false;
    }
    // 离散输入和输入寄存器只读
    if (def.address.type == AddressType::DiscreteInput
        || def.address.type == AddressType::InputRegister) {
        def.readWrite = false;
    }

    def.wire = wireAddress(def.address, device.dataAccess.zeroBased, device.dataAccess.zeroBasedBit);
    if (def.wire < 0 || def.wire + def.span() - 1 > 65535) {
        error = QString("tag %1: address out of range").arg(path);
        return false;
    }

    def.scanRateMs = qMax(1, safeGetInt(general, "scan_rate", kDefaultScanRateMs));
    def.scaling = ScalingConfig::fromJson(safeGetObject(tag, "scaling"));
    if (def.type.isBoolean()) {
        def.scaling.type = ScalingConfig::Type::None;
    }

    out = def;
    error.clear();
    return true;
}

} // namespace modua::modbus
