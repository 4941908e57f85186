#include "scaling.h"

#include <QtGlobal>
#include <algorithm>
#include <cmath>

#include "modua/utils/config_utils.h"

namespace modua::modbus {

namespace {

bool yesNo(const QJsonObject& obj, const QString& key)
{
    const QJsonValue v = obj.value(key);
    if (v.isString()) {
        return v.toString().trimmed().compare("Yes", Qt::CaseInsensitive) == 0;
    }
    return toNumericFlag(v, 0) == 1;
}

bool isNumeric(const QVariant& v)
{
    switch (v.typeId()) {
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Double:
    case QMetaType::Float:
        return true;
    default:
        return false;
    }
}

} // namespace

QString ScalingConfig::typeName(Type type)
{
    switch (type) {
    case Type::Linear:
        return "Linear";
    case Type::SquareRoot:
        return "Square Root";
    case Type::None:
        break;
    }
    return "None";
}

ScalingConfig::Type ScalingConfig::parseType(const QString& name)
{
    const QString s = name.trimmed().toLower();
    if (s == "linear") return Type::Linear;
    if (s == "square root" || s == "squareroot" || s == "sqrt") return Type::SquareRoot;
    return Type::None;
}

ScalingConfig ScalingConfig::fromJson(const QJsonObject& obj)
{
    ScalingConfig cfg;
    cfg.type = parseType(safeGetString(obj, "type", "None"));
    cfg.rawLow = safeGetDouble(obj, "raw_low", cfg.rawLow);
    cfg.rawHigh = safeGetDouble(obj, "raw_high", cfg.rawHigh);
    cfg.scaledType = safeGetString(obj, "scaled_type", cfg.scaledType);
    cfg.scaledLow = safeGetDouble(obj, "scaled_low", cfg.scaledLow);
    cfg.scaledHigh = safeGetDouble(obj, "scaled_high", cfg.scaledHigh);
    cfg.clampLow = yesNo(obj, "clamp_low");
    cfg.clampHigh = yesNo(obj, "clamp_high");
    cfg.negate = yesNo(obj, "negate");
    cfg.units = safeGetString(obj, "units");
    return cfg;
}

QJsonObject ScalingConfig::toJson() const
{
    QJsonObject obj;
    obj["type"] = typeName(type);
    obj["raw_low"] = rawLow;
    obj["raw_high"] = rawHigh;
    obj["scaled_type"] = scaledType;
    obj["scaled_low"] = scaledLow;
    obj["scaled_high"] = scaledHigh;
    obj["clamp_low"] = clampLow ? "Yes" : "No";
    obj["clamp_high"] = clampHigh ? "Yes" : "No";
    obj["negate"] = negate ? "Yes" : "No";
    obj["units"] = units;
    return obj;
}

double applyScaling(double raw, const ScalingConfig& cfg)
{
    if (!cfg.enabled()) return raw;

    const double rawRange = cfg.rawHigh - cfg.rawLow;
    if (rawRange == 0.0) {
        qWarning("Scaling raw range is zero, returning raw value");
        return raw;
    }
    const double scaledRange = cfg.scaledHigh - cfg.scaledLow;

    double scaled = 0.0;
    if (cfg.type == ScalingConfig::Type::Linear) {
        scaled = (raw - cfg.rawLow) * scaledRange / rawRange + cfg.scaledLow;
    } else {
        const double normalized = std::max(0.0, (raw - cfg.rawLow) / rawRange);
        scaled = std::sqrt(normalized) * scaledRange + cfg.scaledLow;
    }

    if (cfg.negate) scaled = -scaled;
    if (cfg.clampLow && scaled < cfg.scaledLow) scaled = cfg.scaledLow;
    if (cfg.clampHigh && scaled > cfg.scaledHigh) scaled = cfg.scaledHigh;
    return scaled;
}

double reverseScaling(double scaled, const ScalingConfig& cfg, bool integerRaw)
{
    if (!cfg.enabled()) return scaled;

    double value = cfg.negate ? -scaled : scaled;
    const double scaledRange = cfg.scaledHigh - cfg.scaledLow;
    if (scaledRange == 0.0) {
        qWarning("Scaling scaled range is zero, returning scaled value");
        return scaled;
    }
    const double rawRange = cfg.rawHigh - cfg.rawLow;

    double raw = 0.0;
    if (cfg.type == ScalingConfig::Type::Linear) {
        raw = (value - cfg.scaledLow) * rawRange / scaledRange + cfg.rawLow;
    } else {
        const double normalized = std::max(0.0, (value - cfg.scaledLow) / scaledRange);
        raw = normalized * normalized * rawRange + cfg.rawLow;
    }

    return integerRaw ? std::round(raw) : raw;
}

QVariant applyScaling(const QVariant& raw, const ScalingConfig& cfg)
{
    if (!cfg.enabled() || !raw.isValid()) return raw;

    if (raw.typeId() == QMetaType::QVariantList) {
        QVariantList out;
        for (const QVariant& item : raw.toList()) {
            out.append(applyScaling(item, cfg));
        }
        return out;
    }
    if (!isNumeric(raw)) return raw;
    return QVariant(applyScaling(raw.toDouble(), cfg));
}

QVariant reverseScaling(const QVariant& scaled, const ScalingConfig& cfg, const TagType& rawType)
{
    if (!cfg.enabled() || !scaled.isValid() || rawType.isBoolean()) return scaled;

    if (scaled.typeId() == QMetaType::QVariantList) {
        QVariantList out;
        for (const QVariant& item : scaled.toList()) {
            out.append(reverseScaling(item, cfg, rawType));
        }
        return out;
    }

    bool ok = false;
    const double v = scaled.toDouble(&ok);
    if (!ok) return scaled;
    const bool integerRaw = isIntegerType(rawType.base);
    const double raw = reverseScaling(v, cfg, integerRaw);
    if (integerRaw) return QVariant(static_cast<qint64>(raw));
    return QVariant(raw);
}

} // namespace modua::modbus
