#pragma once

#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVector>
#include <functional>
#include <memory>
#include <vector>

#include "modua/model/project_node.h"
#include "modua/modbus/tag_definition.h"
#include "modua/modbus/transport_factory.h"
#include "modua/modua_export.h"
#include "modua/opcua/opcua_server.h"
#include "modua/opcua/opcua_settings.h"

namespace modua {

class DataBuffer;
class DiagnosticsManager;
class PollWorker;

/**
 * 一个轮询组：同一 (通道, 设备) 下的全部标签
 */
struct MODUA_API DeviceGroup {
    QString configId;
    modbus::ChannelSettings channel;
    modbus::DeviceSettings device;
    QVector<modbus::TagDefinition> tags;
    QHash<QString, QString> dataTypes; // path -> data_type
    QHash<QString, QString> access;    // path -> access
};

/**
 * 运行时监视器
 *
 * 遍历工程树，按 "Channel_Device" 分组创建传输与轮询线程，
 * 把轮询结果写入数据缓冲和 OPC UA 服务器，并把写请求（界面或 OPC UA 客户端）
 * 转发给所属的轮询线程。
 */
class MODUA_API RuntimeMonitor : public QObject {
    Q_OBJECT

public:
    using TransportFactory =
        std::function<std::unique_ptr<modbus::ModbusTransport>(const modbus::ChannelSettings&, QString&)>;

    RuntimeMonitor(DataBuffer* buffer, DiagnosticsManager* diagnostics, QObject* parent = nullptr);
    ~RuntimeMonitor() override;

    /** 替换传输创建函数（测试注入假传输） */
    void setTransportFactory(TransportFactory factory);

    /**
     * 启用 OPC UA；start 时一并启动服务器
     */
    void setOpcUa(const OpcUaSettings& settings, bool enabled, const QString& certificateDir = QString());

    /**
     * 构建并启动全部轮询线程；无有效标签时返回 false
     * 个别标签配置错误只记录警告，不阻止启动
     */
    bool start(const ProjectNode& root, QString& error);
    void stop();
    bool isRunning() const { return m_running; }

    /**
     * 写入标签（工程量），转发给拥有该标签的轮询线程
     */
    bool writeTag(const QString& path, const QVariant& value, QString& error);

    QStringList configIds() const;
    PollWorker* worker(const QString& configId) const;
    OpcUaServer* opcUaServer() const { return m_opcUa.get(); }
    QStringList warnings() const { return m_warnings; }

    /**
     * 由工程树生成轮询组；标签解析失败时写入 warnings 并跳过
     */
    static QList<DeviceGroup> collectDeviceGroups(const ProjectNode& root, QStringList& warnings);

    /** 由工程树生成 OPC UA 变量列表 */
    static QList<OpcUaVariable> collectOpcUaVariables(const ProjectNode& root);

signals:
    void tagUpdated(const QString& path);
    void connectionStateChanged(const QString& configId, bool connected);
    void runningChanged(bool running);

private:
    void onTagPolled(const QString& path, const QVariant& value, const QString& quality);

    DataBuffer* m_buffer;
    DiagnosticsManager* m_diagnostics;
    TransportFactory m_factory;

    OpcUaSettings m_opcUaSettings;
    bool m_opcUaEnabled = false;
    QString m_certificateDir;
    std::unique_ptr<OpcUaServer> m_opcUa;

    std::vector<std::unique_ptr<PollWorker>> m_workers;
    QHash<QString, PollWorker*> m_workerByPath;
    QStringList m_warnings;
    bool m_running = false;

    QMutex m_countMutex;
    QHash<QString, int> m_updateCounts;
};

} // namespace modua
