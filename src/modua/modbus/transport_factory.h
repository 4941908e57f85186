#pragma once

#include <QJsonObject>
#include <QString>
#include <memory>

#include "modua/modbus/modbus_transport.h"
#include "modua/modua_export.h"

namespace modua::modbus {

enum class DriverKind {
    RtuSerial,
    RtuOverTcp,
    TcpEthernet
};

/**
 * 通道运行参数，由通道节点配置解析而来
 */
struct MODUA_API ChannelSettings {
    QString name;
    DriverKind driver = DriverKind::TcpEthernet;
    QString host = "127.0.0.1";
    quint16 port = 502;
    QString protocol = "TCP/IP";
    SerialParams serial;

    /**
     * 接受分节形式 {general, driver:{type, params}, communication}
     * 或扁平形式 {name, driver, ip, port, com, baud, ...}
     */
    static bool fromJson(const QJsonObject& channel, ChannelSettings& out, QString& error);
};

MODUA_API bool parseDriverKind(const QString& name, DriverKind& kind);
MODUA_API QString driverKindName(DriverKind kind);

MODUA_API std::unique_ptr<ModbusTransport> createTransport(const ChannelSettings& channel, QString& error);

} // namespace modua::modbus
