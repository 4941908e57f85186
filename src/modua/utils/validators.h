#pragma once

#include <QString>

#include "modua/modua_export.h"

namespace modua {

MODUA_API bool isValidIp(const QString& ip);
MODUA_API bool isValidPort(int port);
MODUA_API bool isValidModbusAddress(int address);
MODUA_API bool isValidFunctionCode(int functionCode);
MODUA_API bool isValidDeviceId(int deviceId);
MODUA_API bool isValidUnitId(int unitId);
MODUA_API bool isValidTagName(const QString& name);
MODUA_API bool isValidScanRate(int ms);

} // namespace modua
