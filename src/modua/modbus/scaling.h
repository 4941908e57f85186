#pragma once

#include <QJsonObject>
#include <QString>
#include <QVariant>

#include "modua/modbus/modbus_types.h"
#include "modua/modua_export.h"

namespace modua::modbus {

/**
 * 标签缩放配置
 *
 * Linear:      scaled = (raw - rl) * (sh - sl) / (rh - rl) + sl
 * Square Root: scaled = sqrt(max(0, (raw - rl) / (rh - rl))) * (sh - sl) + sl
 * 取反在钳位之前执行；原始量程为 0 时直接返回原始值。
 */
struct MODUA_API ScalingConfig {
    enum class Type { None, Linear, SquareRoot };

    Type type = Type::None;
    double rawLow = 0.0;
    double rawHigh = 1000.0;
    QString scaledType = "Float";
    double scaledLow = 0.0;
    double scaledHigh = 100.0;
    bool clampLow = false;
    bool clampHigh = false;
    bool negate = false;
    QString units;

    bool enabled() const { return type != Type::None; }

    static ScalingConfig fromJson(const QJsonObject& obj);
    QJsonObject toJson() const;

    static QString typeName(Type type);
    static Type parseType(const QString& name);
};

MODUA_API double applyScaling(double raw, const ScalingConfig& cfg);

/**
 * 反向缩放，写入时把工程量换算回原始值
 * @param integerRaw 原始类型为整数时四舍五入
 */
MODUA_API double reverseScaling(double scaled, const ScalingConfig& cfg, bool integerRaw);

/**
 * 对 QVariant（标量或数组）执行缩放；非数值（布尔、字符串）原样返回
 */
MODUA_API QVariant applyScaling(const QVariant& raw, const ScalingConfig& cfg);
MODUA_API QVariant reverseScaling(const QVariant& scaled, const ScalingConfig& cfg, const TagType& rawType);

} // namespace modua::modbus
