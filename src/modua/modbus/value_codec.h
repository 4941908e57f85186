#pragma once

#include <QString>
#include <QVariant>
#include <QVector>
#include <cstdint>

#include "modua/modbus/modbus_types.h"
#include "modua/modua_export.h"

namespace modua::modbus {

/**
 * 寄存器 <-> 数值 编解码器
 *
 * 解码顺序：字内字节序 -> 双字内字序 -> 四字内双字序 -> 按大端解释
 * 编码顺序与之相反。
 *
 * 数值在 QVariant 中的表示：
 * - Boolean: bool
 * - 有符号整数: qint64，无符号整数: quint64
 * - Float/Real/Double: double
 * - String: QString
 * - 数组: QVariantList
 */
class MODUA_API ValueCodec {
public:
    explicit ValueCodec(const DeviceEncoding& encoding = DeviceEncoding());

    const DeviceEncoding& encoding() const { return m_encoding; }

    /**
     * 从寄存器解码一个标签值
     * @param count 数组元素个数；标量传 0
     * @return 寄存器不足或 BCD 非法时返回无效 QVariant
     */
    QVariant decodeRegisters(const TagType& type, const QVector<uint16_t>& regs,
                             int offset = 0, int count = 0) const;

    /**
     * 从位数组解码布尔值或布尔数组
     */
    QVariant decodeBits(const QVector<bool>& bits, int offset = 0, int count = 0) const;

    /**
     * 编码为寄存器序列；数组值按元素依次编码
     */
    bool encodeRegisters(const TagType& type, const QVariant& value,
                         QVector<uint16_t>& regs, QString& error) const;

    /**
     * 编码为位序列
     */
    bool encodeBits(const QVariant& value, QVector<bool>& bits, QString& error) const;

    // 基础转换
    uint16_t toUInt16(const QVector<uint16_t>& regs, int offset) const;
    uint32_t toUInt32(const QVector<uint16_t>& regs, int offset) const;
    uint64_t toUInt64(const QVector<uint16_t>& regs, int offset) const;
    QVector<uint16_t> fromUInt16(uint16_t value) const;
    QVector<uint16_t> fromUInt32(uint32_t value) const;
    QVector<uint16_t> fromUInt64(uint64_t value) const;

    static uint16_t swapBytes(uint16_t value);
    static uint16_t reverseBits16(uint16_t value);
    static bool bcdToInt(uint64_t raw, int digits, uint64_t& value);
    static uint64_t intToBcd(uint64_t value, int digits);

    /** 十进制长整型：value = hi * 10000 + lo，上限 99999999 */
    static constexpr uint64_t kMaxDecimalLong = 99999999ULL;

private:
    QVariant decodeElement(DataType type, const QVector<uint16_t>& regs, int offset) const;
    bool encodeElement(DataType type, const QVariant& value, QVector<uint16_t>& out,
                       QString& error) const;
    uint16_t wordIn(uint16_t reg) const;
    uint16_t wordOut(uint16_t value) const;

    DeviceEncoding m_encoding;
};

/**
 * 将字符串或 QVariant 解析为布尔值（true/false/1/0/on/off/yes/no）
 */
MODUA_API bool variantToBool(const QVariant& value, bool& out);

} // namespace modua::modbus
