#pragma once

#include <QList>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <functional>
#include <memory>

#include "modua/modua_export.h"
#include "modua/opcua/opcua_settings.h"

namespace modua {

/**
 * 暴露到地址空间的一个变量
 * 节点 id 为 ns=<namespace>;s=<path>，folders 为自上而下的文件夹名
 */
struct MODUA_API OpcUaVariable {
    QString path;
    QString displayName;
    QStringList folders;
    OpcUaType type = OpcUaType::Double;
    uint8_t accessLevel = kAccessRead;
    bool isArray = false;
    int arraySize = 0;
    QString description;
};

/**
 * 基于 open62541 的 OPC UA 服务器
 *
 * 服务器在独立线程中迭代；updateValue 可从任意线程调用。
 * 客户端写入可写变量时通过 WriteHandler 转发，处理器返回 false 时客户端收到 BadUserAccessDenied。
 */
class MODUA_API OpcUaServer {
public:
    using WriteHandler = std::function<bool(const QString& path, const QVariant& value, QString& error)>;

    explicit OpcUaServer(const OpcUaSettings& settings);
    ~OpcUaServer();

    OpcUaServer(const OpcUaServer&) = delete;
    OpcUaServer& operator=(const OpcUaServer&) = delete;

    /** 证书与私钥所在目录，需要证书时使用 */
    void setCertificateDirectory(const QString& dir);
    void setWriteHandler(WriteHandler handler);

    /**
     * 配置服务器、创建节点并启动迭代线程
     */
    bool start(const QList<OpcUaVariable>& variables, QString& error);

    /**
     * 停止并等待线程退出
     */
    void stop();

    bool isRunning() const;
    bool hasVariable(const QString& path) const;
    int variableCount() const;

    /**
     * 更新变量值，按变量类型转换；类型不兼容或变量不存在时返回 false
     */
    bool updateValue(const QString& path, const QVariant& value);

    QString endpointUrl() const;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};

} // namespace modua
