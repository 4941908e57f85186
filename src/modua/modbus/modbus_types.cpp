#include "modbus_types.h"

#include <QRegularExpression>

#include "modua/core/constants.h"
#include "modua/utils/config_utils.h"

namespace modua::modbus {

QString exceptionMessage(ExceptionCode code)
{
    switch (code) {
    case ExceptionCode::None:
        return "No error";
    case ExceptionCode::IllegalFunction:
        return "Illegal function";
    case ExceptionCode::IllegalDataAddress:
        return "Illegal data address";
    case ExceptionCode::IllegalDataValue:
        return "Illegal data value";
    case ExceptionCode::SlaveDeviceFailure:
        return "Slave device failure";
    case ExceptionCode::Acknowledge:
        return "Acknowledge";
    case ExceptionCode::SlaveDeviceBusy:
        return "Slave device busy";
    case ExceptionCode::MemoryParityError:
        return "Memory parity error";
    case ExceptionCode::GatewayPathUnavailable:
        return "Gateway path unavailable";
    case ExceptionCode::GatewayTargetDeviceFailedToRespond:
        return "Gateway target device failed to respond";
    }
    return QString("Unknown exception: 0x%1").arg(static_cast<int>(code), 2, 16, QChar('0'));
}

QChar addressPrefix(AddressType type)
{
    switch (type) {
    case AddressType::Coil:
        return '0';
    case AddressType::DiscreteInput:
        return '1';
    case AddressType::InputRegister:
        return '3';
    case AddressType::HoldingRegister:
        return '4';
    }
    return '4';
}

bool addressTypeFromPrefix(QChar prefix, AddressType& type)
{
    switch (prefix.toLatin1()) {
    case '0':
        type = AddressType::Coil;
        return true;
    case '1':
        type = AddressType::DiscreteInput;
        return true;
    case '3':
        type = AddressType::InputRegister;
        return true;
    case '4':
        type = AddressType::HoldingRegister;
        return true;
    default:
        return false;
    }
}

FunctionCode readFunctionFor(AddressType type)
{
    switch (type) {
    case AddressType::Coil:
        return FunctionCode::ReadCoils;
    case AddressType::DiscreteInput:
        return FunctionCode::ReadDiscreteInputs;
    case AddressType::InputRegister:
        return FunctionCode::ReadInputRegisters;
    case AddressType::HoldingRegister:
        return FunctionCode::ReadHoldingRegisters;
    }
    return FunctionCode::ReadHoldingRegisters;
}

bool isBitAddress(AddressType type)
{
    return type == AddressType::Coil || type == AddressType::DiscreteInput;
}

QString addressTypeName(AddressType type)
{
    switch (type) {
    case AddressType::Coil:
        return "coil";
    case AddressType::DiscreteInput:
        return "discrete_input";
    case AddressType::InputRegister:
        return "input_register";
    case AddressType::HoldingRegister:
        return "holding_register";
    }
    return "holding_register";
}

namespace {

struct TypeEntry {
    DataType type;
    const char* name;
    int registers;
};

// 每种类型占用的寄存器数
const TypeEntry kTypeTable[] = {
    {DataType::Boolean, "Boolean", 1},
    {DataType::Char, "Char", 1},
    {DataType::Byte, "Byte", 1},
    {DataType::Short, "Short", 1},
    {DataType::Word, "Word", 1},
    {DataType::Int, "Int", 1},
    {DataType::DInt, "DInt", 2},
    {DataType::Long, "Long", 2},
    {DataType::DWord, "DWord", 2},
    {DataType::Float, "Float", 2},
    {DataType::Real, "Real", 2},
    {DataType::Double, "Double", 4},
    {DataType::BCD, "BCD", 1},
    {DataType::LBCD, "LBCD", 2},
    {DataType::LLong, "LLong", 4},
    {DataType::QWord, "QWord", 4},
    {DataType::String, "String", 6},
};

} // namespace

QString dataTypeName(DataType type)
{
    for (const auto& entry : kTypeTable) {
        if (entry.type == type) return QString::fromLatin1(entry.name);
    }
    return "Word";
}

int registerCount(DataType type)
{
    for (const auto& entry : kTypeTable) {
        if (entry.type == type) return entry.registers;
    }
    return 1;
}

bool isIntegerType(DataType type)
{
    switch (type) {
    case DataType::Float:
    case DataType::Real:
    case DataType::Double:
    case DataType::String:
    case DataType::Boolean:
        return false;
    default:
        return true;
    }
}

bool isSignedType(DataType type)
{
    switch (type) {
    case DataType::Char:
    case DataType::Short:
    case DataType::Int:
    case DataType::DInt:
    case DataType::Long:
    case DataType::LLong:
    case DataType::Float:
    case DataType::Real:
    case DataType::Double:
        return true;
    default:
        return false;
    }
}

int TagType::elementRegisters() const
{
    return registerCount(base);
}

QString TagType::displayName() const
{
    const QString name = dataTypeName(base);
    return isArray ? name + "(Array)" : name;
}

bool parseDataType(const QString& str, TagType& type)
{
    QString s = str.trimmed();
    bool isArray = false;

    static const QRegularExpression arraySuffix(
        R"(\s*(\(\s*array\s*\)|\barray\b|\[\s*\d*\s*\])\s*$)",
        QRegularExpression::CaseInsensitiveOption);
    const auto match = arraySuffix.match(s);
    if (match.hasMatch()) {
        isArray = true;
        s = s.left(match.capturedStart()).trimmed();
    }

    for (const auto& entry : kTypeTable) {
        if (s.compare(QLatin1String(entry.name), Qt::CaseInsensitive) == 0) {
            type.base = entry.type;
            type.isArray = isArray;
            return true;
        }
    }

    // 常见别名
    const QString lower = s.toLower();
    if (lower == "bool") {
        type = {DataType::Boolean, isArray};
    } else if (lower == "int16") {
        type = {DataType::Short, isArray};
    } else if (lower == "uint16") {
        type = {DataType::Word, isArray};
    } else if (lower == "int32") {
        type = {DataType::Long, isArray};
    } else if (lower == "uint32") {
        type = {DataType::DWord, isArray};
    } else if (lower == "float32") {
        type = {DataType::Float, isArray};
    } else if (lower == "float64") {
        type = {DataType::Double, isArray};
    } else if (lower == "int64") {
        type = {DataType::LLong, isArray};
    } else if (lower == "uint64") {
        type = {DataType::QWord, isArray};
    } else {
        return false;
    }
    return true;
}

QStringList tagDataTypeNames()
{
    static const DataType order[] = {
        DataType::Boolean, DataType::Word, DataType::Short, DataType::Long,
        DataType::DWord, DataType::Float, DataType::Double, DataType::BCD,
        DataType::LBCD, DataType::LLong, DataType::QWord, DataType::Char,
        DataType::Byte, DataType::String};

    QStringList names;
    for (DataType t : order) {
        names << dataTypeName(t);
        names << dataTypeName(t) + "(Array)";
    }
    return names;
}

QStringList scaledDataTypeNames()
{
    return {"Char", "Byte", "Short", "Word", "Long", "DWord", "Float", "Double", "LLong", "QWord"};
}

bool parseAddress(const QString& address, ParsedAddress& out, QString& error)
{
    static const QRegularExpression re(R"(^\s*(\d{1,6})\s*(?:\[\s*(\d+)\s*\])?\s*$)");
    const auto match = re.match(address);
    if (!match.hasMatch()) {
        error = "invalid address: " + address;
        return false;
    }

    // 少于六位时左侧补零，如 "1" -> "000001"
    const QString digits = match.captured(1).rightJustified(kAddressSequenceWidth + 1, '0');
    AddressType type;
    if (!addressTypeFromPrefix(digits.at(0), type)) {
        error = "invalid address prefix: " + QString(digits.at(0));
        return false;
    }

    const int index = digits.mid(1).toInt();
    if (index > kMaxAddressIndex) {
        error = "address out of range: " + address;
        return false;
    }

    int arraySize = 0;
    if (!match.captured(2).isEmpty()) {
        arraySize = match.captured(2).toInt();
        if (arraySize <= 0) {
            error = "invalid array size: " + match.captured(2);
            return false;
        }
    }

    out.type = type;
    out.index = index;
    out.arraySize = arraySize;
    error.clear();
    return true;
}

int wireAddress(const ParsedAddress& address, bool zeroBased, bool zeroBasedBit)
{
    int offset = address.index;
    if (isBitAddress(address.type)) {
        if (!zeroBasedBit) offset -= 1;
    } else if (zeroBased) {
        offset -= 1;
    }
    if (offset < 0 || offset > 65535) return -1;
    return offset;
}

QString formatAddress(QChar prefix, int index, int arraySize)
{
    QString result = QString(prefix) + QString::number(index).rightJustified(kAddressSequenceWidth, '0');
    if (arraySize > 0) {
        result += QString(" [%1]").arg(arraySize);
    }
    return result;
}

QChar prefixFor(const TagType& type, bool readWrite)
{
    if (type.isBoolean()) {
        return readWrite ? '0' : '1';
    }
    return readWrite ? '4' : '3';
}

DeviceEncoding DeviceEncoding::fromJson(const QJsonObject& obj)
{
    DeviceEncoding enc;
    enc.byteOrderBig = toNumericFlag(obj.value("byte_order"), 1) == 1;
    enc.wordLowHigh = toNumericFlag(obj.value("word_order"), 1) == 1;
    enc.dwordLowHigh = toNumericFlag(obj.value("dword_order"), 1) == 1;
    enc.bitOrderMsb = toNumericFlag(obj.value("bit_order"), 0) == 1;
    enc.longsAsDecimals = toNumericFlag(obj.value("treat_longs_as_decimals"), 0) == 1;
    return enc;
}

QJsonObject DeviceEncoding::toJson() const
{
    QJsonObject obj;
    obj["byte_order"] = byteOrderBig ? 1 : 0;
    obj["word_order"] = wordLowHigh ? 1 : 0;
    obj["dword_order"] = dwordLowHigh ? 1 : 0;
    obj["bit_order"] = bitOrderMsb ? 1 : 0;
    obj["treat_longs_as_decimals"] = longsAsDecimals ? 1 : 0;
    return obj;
}

} // namespace modua::modbus
