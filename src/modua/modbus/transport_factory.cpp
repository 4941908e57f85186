#include "transport_factory.h"

#include "modua/core/constants.h"
#include "modua/utils/config_utils.h"

namespace modua::modbus {

bool parseDriverKind(const QString& name, DriverKind& kind)
{
    const QString n = name.trimmed().toLower();
    if (n.contains("serial") || n == "rtu") {
        kind = DriverKind::RtuSerial;
        return true;
    }
    if (n.contains("over tcp") || n == "overtcp") {
        kind = DriverKind::RtuOverTcp;
        return true;
    }
    if (isTcpLikeDriver(n)) {
        kind = DriverKind::TcpEthernet;
        return true;
    }
    return false;
}

QString driverKindName(DriverKind kind)
{
    switch (kind) {
    case DriverKind::RtuSerial:
        return kDriverRtuSerial;
    case DriverKind::RtuOverTcp:
        return kDriverRtuOverTcp;
    case DriverKind::TcpEthernet:
        return kDriverTcpEthernet;
    }
    return kDriverTcpEthernet;
}

bool ChannelSettings::fromJson(const QJsonObject& channel, ChannelSettings& out, QString& error)
{
    const QJsonObject general = safeGetObject(channel, "general");
    const QJsonObject comm = safeGetObject(channel, "communication");
    const QJsonValue driverValue = channel.value("driver");
    const QJsonObject driver = driverValue.isObject() ? driverValue.toObject() : QJsonObject();
    const QJsonObject params = safeGetObject(driver, "params");

    ChannelSettings s;
    s.name = safeGetString(general, "channel_name",
                           safeGetString(channel, "name", safeGetString(channel, "text")));

    const QString driverName = driverValue.isString() ? driverValue.toString()
                                                      : safeGetString(driver, "type");
    if (!parseDriverKind(driverName, s.driver)) {
        error = QString("channel %1: unknown driver '%2'").arg(s.name, driverName);
        return false;
    }

    if (s.driver == DriverKind::RtuSerial) {
        s.serial.portName = safeGetString(comm, "com", safeGetString(channel, "com"));
        s.serial.baudRate = safeGetInt(comm, "baud", safeGetInt(channel, "baud", kDefaultBaudRate));
        s.serial.dataBits = safeGetInt(comm, "data_bits", safeGetInt(channel, "data_bits", kDefaultDataBits));
        s.serial.parity = safeGetString(comm, "parity", safeGetString(channel, "parity", "None"));
        s.serial.stopBits = safeGetString(comm, "stop", safeGetString(channel, "stop", "1"));
        s.serial.flowControl = safeGetString(comm, "flow", safeGetString(channel, "flow", "None"));
        if (s.serial.portName.isEmpty()) {
            error = QString("channel %1: serial port not set").arg(s.name);
            return false;
        }
    } else {
        s.host = safeGetString(params, "ip", safeGetString(channel, "ip", kDefaultTcpIp));
        const int port = safeGetInt(params, "port", safeGetInt(channel, "port", kDefaultTcpPort));
        if (port < 1 || port > 65535) {
            error = QString("channel %1: invalid port %2").arg(s.name).arg(port);
            return false;
        }
        s.port = static_cast<quint16>(port);
        s.protocol = safeGetString(params, "protocol", safeGetString(channel, "protocol", "TCP/IP"));
    }

    out = s;
    error.clear();
    return true;
}

std::unique_ptr<ModbusTransport> createTransport(const ChannelSettings& channel, QString& error)
{
    switch (channel.driver) {
    case DriverKind::RtuSerial:
        return std::make_unique<ModbusRtuSerialTransport>(channel.serial);
    case DriverKind::RtuOverTcp:
    case DriverKind::TcpEthernet:
        if (channel.protocol.compare("UDP", Qt::CaseInsensitive) == 0) {
            error = QString("channel %1: UDP transport is not supported").arg(channel.name);
            return nullptr;
        }
        if (channel.driver == DriverKind::RtuOverTcp) {
            return std::make_unique<ModbusRtuOverTcpTransport>(channel.host, channel.port);
        }
        return std::make_unique<ModbusTcpTransport>(channel.host, channel.port);
    }
    error = "unknown driver";
    return nullptr;
}

} // namespace modua::modbus
