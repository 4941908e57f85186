#include "value_codec.h"

#include <cmath>
#include <cstring>
#include <limits>
#include <utility>

namespace modua::modbus {

namespace {

constexpr int kStringChars = 12;

bool isFloating(const QVariant& value)
{
    return value.typeId() == QMetaType::Double || value.typeId() == QMetaType::Float;
}

// 浮点转整型时 QVariant 会四舍五入，带小数的输入一律拒绝
bool toSigned(const QVariant& value, qint64& out)
{
    bool ok = false;
    if (value.typeId() == QMetaType::Bool) {
        out = value.toBool() ? 1 : 0;
        return true;
    }
    if (!isFloating(value)) {
        out = value.toLongLong(&ok);
        if (ok) return true;
    }
    const double d = value.toDouble(&ok);
    if (!ok || !std::isfinite(d) || std::trunc(d) != d) return false;
    if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) return false;
    out = static_cast<qint64>(d);
    return true;
}

bool toUnsigned(const QVariant& value, quint64& out)
{
    bool ok = false;
    if (!isFloating(value) && value.typeId() != QMetaType::Bool) {
        const quint64 u = value.toULongLong(&ok);
        if (ok) {
            out = u;
            return true;
        }
    }
    qint64 s = 0;
    if (!toSigned(value, s) || s < 0) return false;
    out = static_cast<quint64>(s);
    return true;
}

bool isFractional(const QVariant& value)
{
    bool ok = false;
    const double d = value.toDouble(&ok);
    return ok && std::isfinite(d) && std::trunc(d) != d;
}

QString integerError(DataType type, const QVariant& value)
{
    if (isFractional(value)) {
        return QString("%1 is not a whole number, %2 needs an integer").arg(value.toString(), dataTypeName(type));
    }
    return "value out of range for " + dataTypeName(type) + ": " + value.toString();
}

bool inRange(qint64 v, qint64 lo, qint64 hi) { return v >= lo && v <= hi; }

} // namespace

bool variantToBool(const QVariant& value, bool& out)
{
    if (value.typeId() == QMetaType::Bool) {
        out = value.toBool();
        return true;
    }
    if (value.typeId() == QMetaType::QString) {
        const QString s = value.toString().trimmed().toLower();
        if (s == "true" || s == "1" || s == "on" || s == "yes") {
            out = true;
            return true;
        }
        if (s == "false" || s == "0" || s == "off" || s == "no") {
            out = false;
            return true;
        }
        return false;
    }
    bool ok = false;
    const double d = value.toDouble(&ok);
    if (!ok) return false;
    out = d != 0.0;
    return true;
}

ValueCodec::ValueCodec(const DeviceEncoding& encoding)
    : m_encoding(encoding)
{
}

uint16_t ValueCodec::swapBytes(uint16_t value)
{
    return static_cast<uint16_t>(((value & 0xFF) << 8) | ((value >> 8) & 0xFF));
}

uint16_t ValueCodec::reverseBits16(uint16_t value)
{
    uint16_t result = 0;
    for (int i = 0; i < 16; ++i) {
        if (value & (1u << i)) {
            result |= static_cast<uint16_t>(1u << (15 - i));
        }
    }
    return result;
}

bool ValueCodec::bcdToInt(uint64_t raw, int digits, uint64_t& value)
{
    value = 0;
    uint64_t multiplier = 1;
    for (int i = 0; i < digits; ++i) {
        const uint64_t nibble = (raw >> (i * 4)) & 0xF;
        if (nibble > 9) return false;
        value += nibble * multiplier;
        multiplier *= 10;
    }
    return true;
}

uint64_t ValueCodec::intToBcd(uint64_t value, int digits)
{
    uint64_t result = 0;
    for (int i = 0; i < digits; ++i) {
        result |= (value % 10) << (i * 4);
        value /= 10;
    }
    return result;
}

uint16_t ValueCodec::wordIn(uint16_t reg) const
{
    return m_encoding.byteOrderBig ? reg : swapBytes(reg);
}

uint16_t ValueCodec::wordOut(uint16_t value) const
{
    return m_encoding.byteOrderBig ? value : swapBytes(value);
}

uint16_t ValueCodec::toUInt16(const QVector<uint16_t>& regs, int offset) const
{
    if (offset < 0 || offset >= regs.size()) return 0;
    return wordIn(regs[offset]);
}

uint32_t ValueCodec::toUInt32(const QVector<uint16_t>& regs, int offset) const
{
    if (offset < 0 || offset + 1 >= regs.size()) return 0;
    uint16_t w0 = wordIn(regs[offset]);
    uint16_t w1 = wordIn(regs[offset + 1]);
    if (m_encoding.wordLowHigh) std::swap(w0, w1);
    return (static_cast<uint32_t>(w0) << 16) | w1;
}

uint64_t ValueCodec::toUInt64(const QVector<uint16_t>& regs, int offset) const
{
    if (offset < 0 || offset + 3 >= regs.size()) return 0;
    uint16_t w[4];
    for (int i = 0; i < 4; ++i) w[i] = wordIn(regs[offset + i]);

    if (m_encoding.wordLowHigh) {
        std::swap(w[0], w[1]);
        std::swap(w[2], w[3]);
    }
    if (m_encoding.dwordLowHigh) {
        std::swap(w[0], w[2]);
        std::swap(w[1], w[3]);
    }

    return (static_cast<uint64_t>(w[0]) << 48) | (static_cast<uint64_t>(w[1]) << 32)
        | (static_cast<uint64_t>(w[2]) << 16) | w[3];
}

QVector<uint16_t> ValueCodec::fromUInt16(uint16_t value) const
{
    return {wordOut(value)};
}

QVector<uint16_t> ValueCodec::fromUInt32(uint32_t value) const
{
    uint16_t w0 = static_cast<uint16_t>(value >> 16);
    uint16_t w1 = static_cast<uint16_t>(value & 0xFFFF);
    if (m_encoding.wordLowHigh) std::swap(w0, w1);
    return {wordOut(w0), wordOut(w1)};
}

QVector<uint16_t> ValueCodec::fromUInt64(uint64_t value) const
{
    uint16_t w[4] = {
        static_cast<uint16_t>(value >> 48),
        static_cast<uint16_t>((value >> 32) & 0xFFFF),
        static_cast<uint16_t>((value >> 16) & 0xFFFF),
        static_cast<uint16_t>(value & 0xFFFF)};

    if (m_encoding.dwordLowHigh) {
        std::swap(w[0], w[2]);
        std::swap(w[1], w[3]);
    }
    if (m_encoding.wordLowHigh) {
        std::swap(w[0], w[1]);
        std::swap(w[2], w[3]);
    }
    return {wordOut(w[0]), wordOut(w[1]), wordOut(w[2]), wordOut(w[3])};
}

QVariant ValueCodec::decodeElement(DataType type, const QVector<uint16_t>& regs, int offset) const
{
    const int needed = registerCount(type);
    if (offset < 0 || offset + needed > regs.size()) {
        return QVariant();
    }

    auto word16 = [&]() {
        uint16_t w = toUInt16(regs, offset);
        if (m_encoding.bitOrderMsb) w = reverseBits16(w);
        return w;
    };

    switch (type) {
    case DataType::Boolean:
        return QVariant(toUInt16(regs, offset) != 0);
    case DataType::Char:
        return QVariant(static_cast<qint64>(static_cast<int8_t>(word16() & 0xFF)));
    case DataType::Byte:
        return QVariant(static_cast<quint64>(word16() & 0xFF));
    case DataType::Short:
    case DataType::Int:
        return QVariant(static_cast<qint64>(static_cast<int16_t>(word16())));
    case DataType::Word:
        return QVariant(static_cast<quint64>(word16()));
    case DataType::BCD: {
        uint64_t v = 0;
        if (!bcdToInt(word16(), 4, v)) return QVariant();
        return QVariant(static_cast<quint64>(v));
    }
    case DataType::DInt:
    case DataType::Long:
        return QVariant(static_cast<qint64>(static_cast<int32_t>(toUInt32(regs, offset))));
    case DataType::DWord:
        return QVariant(static_cast<quint64>(toUInt32(regs, offset)));
    case DataType::LBCD: {
        uint64_t v = 0;
        if (!bcdToInt(toUInt32(regs, offset), 8, v)) return QVariant();
        return QVariant(static_cast<quint64>(v));
    }
    case DataType::Float:
    case DataType::Real: {
        const uint32_t raw = toUInt32(regs, offset);
        float f;
        std::memcpy(&f, &raw, sizeof(f));
        return QVariant(static_cast<double>(f));
    }
    case DataType::Double: {
        const uint64_t raw = toUInt64(regs, offset);
        double d;
        std::memcpy(&d, &raw, sizeof(d));
        return QVariant(d);
    }
    case DataType::LLong:
    case DataType::QWord: {
        const uint64_t raw = toUInt64(regs, offset);
        if (m_encoding.longsAsDecimals) {
            const uint64_t hi = (raw >> 32) & 0xFFFF;
            const uint64_t lo = raw & 0xFFFF;
            const uint64_t v = hi * 10000 + lo;
            if (type == DataType::LLong) return QVariant(static_cast<qint64>(v));
            return QVariant(static_cast<quint64>(v));
        }
        if (type == DataType::LLong) return QVariant(static_cast<qint64>(raw));
        return QVariant(static_cast<quint64>(raw));
    }
    case DataType::String: {
        QByteArray bytes;
        for (int i = 0; i < needed; ++i) {
            const uint16_t w = toUInt16(regs, offset + i);
            bytes.append(static_cast<char>((w >> 8) & 0xFF));
            bytes.append(static_cast<char>(w & 0xFF));
        }
        const int nul = bytes.indexOf('\0');
        if (nul >= 0) bytes.truncate(nul);
        return QVariant(QString::fromLatin1(bytes));
    }
    }
    return QVariant();
}

QVariant ValueCodec::decodeRegisters(const TagType& type, const QVector<uint16_t>& regs,
                                     int offset, int count) const
{
    if (!type.isArray && count <= 0) {
        return decodeElement(type.base, regs, offset);
    }

    const int step = type.elementRegisters();
    const int elements = count > 0 ? count : 1;
    QVariantList list;
    list.reserve(elements);
    for (int i = 0; i < elements; ++i) {
        const QVariant v = decodeElement(type.base, regs, offset + i * step);
        if (!v.isValid()) return QVariant();
        list.append(v);
    }
    return list;
}

QVariant ValueCodec::decodeBits(const QVector<bool>& bits, int offset, int count) const
{
    if (count <= 0) {
        if (offset < 0 || offset >= bits.size()) return QVariant();
        return QVariant(bits[offset]);
    }
    if (offset < 0 || offset + count > bits.size()) return QVariant();
    QVariantList list;
    list.reserve(count);
    for (int i = 0; i < count; ++i) {
        list.append(bits[offset + i]);
    }
    return list;
}

bool ValueCodec::encodeElement(DataType type, const QVariant& value, QVector<uint16_t>& out,
                               QString& error) const
{
    auto put16 = [&](uint16_t w) {
        if (m_encoding.bitOrderMsb) w = reverseBits16(w);
        out.append(wordOut(w));
    };

    switch (type) {
    case DataType::Boolean: {
        bool b = false;
        if (!variantToBool(value, b)) {
            error = "invalid boolean value: " + value.toString();
            return false;
        }
        out.append(wordOut(b ? 1 : 0));
        return true;
    }
    case DataType::Char:
    case DataType::Short:
    case DataType::Int: {
        qint64 v = 0;
        const qint64 lo = type == DataType::Char ? -128 : -32768;
        const qint64 hi = type == DataType::Char ? 127 : 32767;
        if (!toSigned(value, v) || !inRange(v, lo, hi)) {
            error = integerError(type, value);
            return false;
        }
        put16(static_cast<uint16_t>(type == DataType::Char ? (v & 0xFF) : (v & 0xFFFF)));
        return true;
    }
    case DataType::Byte:
    case DataType::Word:
    case DataType::BCD: {
        quint64 v = 0;
        const quint64 hi = type == DataType::Byte ? 255 : (type == DataType::BCD ? 9999 : 65535);
        if (!toUnsigned(value, v) || v > hi) {
            error = integerError(type, value);
            return false;
        }
        if (type == DataType::BCD) v = intToBcd(v, 4);
        put16(static_cast<uint16_t>(v));
        return true;
    }
    case DataType::DInt:
    case DataType::Long: {
        qint64 v = 0;
        if (!toSigned(value, v) || !inRange(v, std::numeric_limits<int32_t>::min(),
                                            std::numeric_limits<int32_t>::max())) {
            error = integerError(type, value);
            return false;
        }
        out += fromUInt32(static_cast<uint32_t>(static_cast<int32_t>(v)));
        return true;
    }
    case DataType::DWord:
    case DataType::LBCD: {
        quint64 v = 0;
        const quint64 hi = type == DataType::LBCD ? 99999999ULL : 0xFFFFFFFFULL;
        if (!toUnsigned(value, v) || v > hi) {
            error = integerError(type, value);
            return false;
        }
        if (type == DataType::LBCD) v = intToBcd(v, 8);
        out += fromUInt32(static_cast<uint32_t>(v));
        return true;
    }
    case DataType::Float:
    case DataType::Real: {
        bool ok = false;
        const double d = value.toDouble(&ok);
        if (!ok) {
            error = "invalid float value: " + value.toString();
            return false;
        }
        if (std::isfinite(d) && std::fabs(d) > std::numeric_limits<float>::max()) {
            error = QString("%1 is out of range for %2").arg(value.toString(), dataTypeName(type));
            return false;
        }
        const float f = static_cast<float>(d);
        uint32_t raw;
        std::memcpy(&raw, &f, sizeof(raw));
        out += fromUInt32(raw);
        return true;
    }
    case DataType::Double: {
        bool ok = false;
        const double d = value.toDouble(&ok);
        if (!ok) {
            error = "invalid double value: " + value.toString();
            return false;
        }
        uint64_t raw;
        std::memcpy(&raw, &d, sizeof(raw));
        out += fromUInt64(raw);
        return true;
    }
    case DataType::LLong:
    case DataType::QWord: {
        if (m_encoding.longsAsDecimals) {
            qint64 v = 0;
            if (!toSigned(value, v)) {
                error = integerError(type, value);
                return false;
            }
            quint64 u = v < 0 ? 0 : static_cast<quint64>(v);
            if (u > kMaxDecimalLong) u = kMaxDecimalLong;
            const uint64_t packed = ((u / 10000) << 32) | (u % 10000);
            out += fromUInt64(packed);
            return true;
        }
        if (type == DataType::LLong) {
            qint64 v = 0;
            if (!toSigned(value, v)) {
                error = integerError(type, value);
                return false;
            }
            out += fromUInt64(static_cast<uint64_t>(v));
        } else {
            quint64 v = 0;
            if (!toUnsigned(value, v)) {
                error = integerError(type, value);
                return false;
            }
            out += fromUInt64(v);
        }
        return true;
    }
    case DataType::String: {
        QByteArray bytes = value.toString().toLatin1().left(kStringChars);
        bytes.append(QByteArray(kStringChars - bytes.size(), '\0'));
        for (int i = 0; i < kStringChars; i += 2) {
            const uint16_t w = static_cast<uint16_t>((static_cast<uint8_t>(bytes[i]) << 8)
                                                     | static_cast<uint8_t>(bytes[i + 1]));
            out.append(wordOut(w));
        }
        return true;
    }
    }
    error = "unsupported data type";
    return false;
}

bool ValueCodec::encodeRegisters(const TagType& type, const QVariant& value,
                                 QVector<uint16_t>& regs, QString& error) const
{
    regs.clear();
    if (value.typeId() == QMetaType::QVariantList || value.typeId() == QMetaType::QStringList) {
        const QVariantList list = value.toList();
        for (const QVariant& item : list) {
            if (!encodeElement(type.base, item, regs, error)) return false;
        }
        return true;
    }
    return encodeElement(type.base, value, regs, error);
}

bool ValueCodec::encodeBits(const QVariant& value, QVector<bool>& bits, QString& error) const
{
    bits.clear();
    if (value.typeId() == QMetaType::QVariantList || value.typeId() == QMetaType::QStringList) {
        for (const QVariant& item : value.toList()) {
            bool b = false;
            if (!variantToBool(item, b)) {
                error = "invalid boolean value: " + item.toString();
                return false;
            }
            bits.append(b);
        }
        return true;
    }
    bool b = false;
    if (!variantToBool(value, b)) {
        error = "invalid boolean value: " + value.toString();
        return false;
    }
    bits.append(b);
    return true;
}

} // namespace modua::modbus
