#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <cstdint>

#include "modua/modua_export.h"

namespace modua::modbus {

/**
 * Modbus 功能码
 */
enum class FunctionCode : uint8_t {
    ReadCoils = 0x01,
    ReadDiscreteInputs = 0x02,
    ReadHoldingRegisters = 0x03,
    ReadInputRegisters = 0x04,
    WriteSingleCoil = 0x05,
    WriteSingleRegister = 0x06,
    WriteMultipleCoils = 0x0F,
    WriteMultipleRegisters = 0x10
};

/**
 * Modbus 异常码
 */
enum class ExceptionCode : uint8_t {
    None = 0x00,
    IllegalFunction = 0x01,
    IllegalDataAddress = 0x02,
    IllegalDataValue = 0x03,
    SlaveDeviceFailure = 0x04,
    Acknowledge = 0x05,
    SlaveDeviceBusy = 0x06,
    MemoryParityError = 0x08,
    GatewayPathUnavailable = 0x0A,
    GatewayTargetDeviceFailedToRespond = 0x0B
};

MODUA_API QString exceptionMessage(ExceptionCode code);

/**
 * 地址区类型，对应六位地址的首位前缀
 * 0xxxxx 线圈 / 1xxxxx 离散输入 / 3xxxxx 输入寄存器 / 4xxxxx 保持寄存器
 */
enum class AddressType {
    Coil,
    DiscreteInput,
    InputRegister,
    HoldingRegister
};

MODUA_API QChar addressPrefix(AddressType type);
MODUA_API bool addressTypeFromPrefix(QChar prefix, AddressType& type);
MODUA_API FunctionCode readFunctionFor(AddressType type);
MODUA_API bool isBitAddress(AddressType type);
MODUA_API QString addressTypeName(AddressType type);

/**
 * 标签数据类型
 */
enum class DataType {
    Boolean,
    Char,
    Byte,
    Short,
    Word,
    Int,
    DInt,
    Long,
    DWord,
    Float,
    Real,
    Double,
    BCD,
    LBCD,
    LLong,
    QWord,
    String
};

/**
 * 完整的标签类型：基础类型 + 是否数组
 */
struct MODUA_API TagType {
    DataType base = DataType::Word;
    bool isArray = false;

    bool isBoolean() const { return base == DataType::Boolean; }
    /** 单个元素占用的寄存器数（布尔为 1 个位） */
    int elementRegisters() const;
    /** 显示名，如 "Word" 或 "Word(Array)" */
    QString displayName() const;
    bool operator==(const TagType& other) const {
        return base == other.base && isArray == other.isArray;
    }
};

/**
 * 解析数据类型字符串，接受 "Word"、"Word(Array)"、"Word Array"、"Word[]"
 */
MODUA_API bool parseDataType(const QString& str, TagType& type);
MODUA_API QString dataTypeName(DataType type);
MODUA_API int registerCount(DataType type);
MODUA_API bool isIntegerType(DataType type);
MODUA_API bool isSignedType(DataType type);

/** 对话框中可选的全部数据类型（标量及数组） */
MODUA_API QStringList tagDataTypeNames();
/** 缩放目标类型 */
MODUA_API QStringList scaledDataTypeNames();

/**
 * 解析后的地址
 */
struct MODUA_API ParsedAddress {
    AddressType type = AddressType::HoldingRegister;
    int index = 0;          // 五位序号 (0-65536)
    int arraySize = 0;      // "400000 [25]" 中的 25；非数组为 0
    bool isArray() const { return arraySize > 0; }
};

/**
 * 解析六位地址字符串，如 "400001" 或 "400000 [25]"
 */
MODUA_API bool parseAddress(const QString& address, ParsedAddress& out, QString& error);

/**
 * 计算线上协议地址
 * 寄存器：zero_based 启用时序号减 1
 * 位：zero_based_bit 禁用时序号减 1
 * 返回 -1 表示越界
 */
MODUA_API int wireAddress(const ParsedAddress& address, bool zeroBased, bool zeroBasedBit);

MODUA_API QString formatAddress(QChar prefix, int index, int arraySize = 0);

/**
 * 标签类型与访问权限决定地址前缀
 */
MODUA_API QChar prefixFor(const TagType& type, bool readWrite);

/**
 * 设备数据编码设置
 */
struct MODUA_API DeviceEncoding {
    bool byteOrderBig = true;     // byte_order: Enable = 大端
    bool wordLowHigh = true;      // word_order: Enable = 低字在前
    bool dwordLowHigh = true;     // dword_order: Enable = 低双字在前
    bool bitOrderMsb = false;     // bit_order: Enable = Modicon 位序
    bool longsAsDecimals = false; // treat_longs_as_decimals

    static DeviceEncoding fromJson(const QJsonObject& obj);
    QJsonObject toJson() const;
};

} // namespace modua::modbus
