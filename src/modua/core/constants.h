#pragma once

#include <QString>
#include <QStringList>

namespace modua {

// 应用信息
inline const QString kAppName = QStringLiteral("ModUA");
inline const QString kAppVersion = QStringLiteral("1.0.0");

// 树节点分隔符（标签路径 Channel.Device.Group.Tag）
inline const QChar kGroupSeparator = QLatin1Char('.');

// 驱动名称
inline const QString kDriverRtuSerial = QStringLiteral("Modbus RTU Serial");
inline const QString kDriverRtuOverTcp = QStringLiteral("Modbus RTU over TCP");
inline const QString kDriverTcpEthernet = QStringLiteral("Modbus TCP/IP Ethernet");

inline QStringList driverTypes() {
    return {kDriverRtuSerial, kDriverRtuOverTcp, kDriverTcpEthernet};
}

// 串口参数
inline QStringList baudRates() {
    return {"4800", "9600", "19200", "38400", "57600", "115200"};
}
inline QStringList dataBitsOptions() { return {"5", "6", "7", "8"}; }
inline QStringList parityOptions() { return {"None", "Odd", "Even"}; }
inline QStringList stopBitsOptions() { return {"1", "2"}; }
inline QStringList flowControlOptions() {
    return {"None", "DTR", "RTS", "RTS/DTR", "RTS Always", "RTS Manual"};
}
inline QStringList networkProtocols() { return {"TCP/IP", "UDP"}; }

constexpr int kDefaultBaudRate = 9600;
constexpr int kDefaultDataBits = 8;
inline const QString kDefaultTcpIp = QStringLiteral("127.0.0.1");
constexpr int kDefaultTcpPort = 502;

// 设备 Timing 默认值
constexpr int kDefaultConnectTimeoutSec = 3;
constexpr int kDefaultConnectAttempts = 1;
constexpr int kDefaultRequestTimeoutMs = 1000;
constexpr int kDefaultAttemptsBeforeTimeout = 1;
constexpr int kDefaultInterRequestDelayMs = 0;

// 块大小默认值
constexpr int kDefaultOutCoils = 2000;
constexpr int kDefaultInCoils = 2000;
constexpr int kDefaultIntRegs = 120;
constexpr int kDefaultHoldRegs = 120;

constexpr int kMinDeviceId = 1;
constexpr int kMaxDeviceId = 65535;

// 标签默认值
constexpr int kDefaultScanRateMs = 10;
inline const QString kAccessReadWrite = QStringLiteral("Read/Write");
inline const QString kAccessReadOnly = QStringLiteral("Read Only");

// 地址格式：前缀 1 位 + 序号 5 位
constexpr int kAddressSequenceWidth = 5;
constexpr int kMaxAddressIndex = 65536;

// 缩放默认值
constexpr double kDefaultRawLow = 0.0;
constexpr double kDefaultRawHigh = 1000.0;
constexpr double kDefaultScaledLow = 0.0;
constexpr double kDefaultScaledHigh = 100.0;
inline const QString kDefaultScaledType = QStringLiteral("Float");

// 运行时
constexpr int kDataBufferMaxSize = 2000;
constexpr int kDiagnosticsCapacity = 5000;
constexpr int kWriteQueueMaxPending = 100;
constexpr int kWriteBatchSize = 5;
constexpr int kDutyCycleRatio = 3;
constexpr int kRetryDelayMs = 100;
constexpr int kFailureBackoffMs = 1000;
constexpr int kCycleSleepMs = 200;

// OPC UA 默认值
inline const QString kDefaultOpcAppName = QStringLiteral("ModUA");
inline const QString kDefaultOpcNamespace = QStringLiteral("ModUA");
constexpr int kDefaultOpcPort = 48480;
constexpr int kDefaultOpcMaxSessions = 4096;
constexpr int kDefaultOpcPublishInterval = 1000;
constexpr int kDefaultCertValidityYears = 20;

// 监视表缓存行数
constexpr int kMonitorVisibleRows = 30;

} // namespace modua
