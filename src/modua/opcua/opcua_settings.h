#pragma once

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <cstdint>

#include "modua/modua_export.h"

namespace modua {

/**
 * OPC UA 变量类型
 */
enum class OpcUaType {
    Boolean,
    Byte,
    Int16,
    UInt16,
    Int32,
    Int64,
    Float,
    Double,
    String
};

/**
 * 标签数据类型 -> OPC UA 类型；数组后缀被忽略，未知类型为 Double
 */
MODUA_API OpcUaType opcUaTypeFor(const QString& dataType);
MODUA_API QString opcUaTypeName(OpcUaType type);

/**
 * 变量实际暴露的类型：启用缩放时取 scaled_type，否则取 data_type
 */
MODUA_API OpcUaType opcUaVariableType(const QString& dataType, const QJsonObject& scaling);

// AccessLevel 位：CurrentRead = 0x01, CurrentWrite = 0x02
constexpr uint8_t kAccessRead = 0x01;
constexpr uint8_t kAccessWrite = 0x02;

/**
 * "Read/Write"、"R/W"、"RW" -> 0x03；仅含 write -> 0x02；其余 0x01
 */
MODUA_API uint8_t opcUaAccessLevel(const QString& access);

/**
 * 安全策略
 */
struct MODUA_API SecurityPolicyInfo {
    enum class Mode { None, Sign, SignAndEncrypt };

    QString key;        // 设置中的开关名，如 policy_sign_aes128
    QString policyUri;
    Mode mode = Mode::None;
};

/** 全部七个策略开关，顺序与设置对话框一致 */
MODUA_API QList<SecurityPolicyInfo> securityPolicyInfos();
MODUA_API bool securityPolicyForKey(const QString& key, SecurityPolicyInfo& policy);

/**
 * OPC UA 服务器设置
 *
 * 接受分节格式 {general, authentication, security_policies, certificate}
 * 或扁平格式，分节优先。
 */
struct MODUA_API OpcUaSettings {
    QString applicationName = "ModUA";
    QString namespaceUri = "ModUA";
    QString host = "0.0.0.0";
    int port = 48480;
    int maxSessions = 4096;
    int publishIntervalMs = 1000;

    bool anonymous = true;
    QString username;
    QString password;

    QStringList enabledPolicies{"policy_none"};

    bool autoGenerateCertificate = true;
    QString commonName;
    QString organization = "ModUA Organization";
    QString organizationUnit = "OPC UA Server";
    QString locality;
    QString state;
    QString country = "TW";
    int certValidityYears = 20;

    /**
     * 解析设置；未启用任何安全策略、端口越界或用户名为空时返回 false
     */
    static bool fromJson(const QJsonObject& obj, OpcUaSettings& out, QString& error);
    QJsonObject toJson() const;

    /** opc.tcp://host:port/ */
    QString endpointUrl() const;
    QList<SecurityPolicyInfo> policies() const;
    /** 启用了 None 以外的策略时需要证书 */
    bool needsCertificate() const;
};

} // namespace modua
