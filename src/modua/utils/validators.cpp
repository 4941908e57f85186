#include "validators.h"

#include <QHostAddress>

#include "modua/core/constants.h"

namespace modua {

bool isValidIp(const QString& ip)
{
    QHostAddress addr;
    return addr.setAddress(ip.trimmed()) && addr.protocol() == QAbstractSocket::IPv4Protocol;
}

bool isValidPort(int port)
{
    return port >= 1 && port <= 65535;
}

bool isValidModbusAddress(int address)
{
    return address >= 0 && address <= 65535;
}

bool isValidFunctionCode(int functionCode)
{
    switch (functionCode) {
    case 1:
    case 2:
    case 3:
    case 4:
    case 5:
    case 6:
    case 15:
    case 16:
    case 23:
        return true;
    default:
        return false;
    }
}

bool isValidDeviceId(int deviceId)
{
    return deviceId >= kMinDeviceId && deviceId <= kMaxDeviceId;
}

bool isValidUnitId(int unitId)
{
    return unitId >= 0 && unitId <= 247;
}

bool isValidTagName(const QString& name)
{
    const QString trimmed = name.trimmed();
    return !trimmed.isEmpty() && !trimmed.contains(kGroupSeparator);
}

bool isValidScanRate(int ms)
{
    return ms >= 1;
}

} // namespace modua
