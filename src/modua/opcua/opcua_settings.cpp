#include "opcua_settings.h"

#include "modua/utils/config_utils.h"
#include "modua/utils/validators.h"

namespace modua {

namespace {

const QStringList kSections = {"general", "authentication", "security_policies", "certificate"};

QString baseTypeName(const QString& dataType)
{
    QString s = dataType.trimmed();
    const int paren = s.indexOf('(');
    if (paren >= 0) s = s.left(paren);
    s.remove("[]");
    if (s.endsWith(" Array", Qt::CaseInsensitive)) s.chop(6);
    return s.trimmed().toLower();
}

} // namespace

OpcUaType opcUaTypeFor(const QString& dataType)
{
    const QString s = baseTypeName(dataType);
    if (s == "boolean" || s == "bool") return OpcUaType::Boolean;
    if (s == "byte" || s == "char") return OpcUaType::Byte;
    if (s == "short" || s == "bcd") return OpcUaType::Int16;
    if (s == "word" || s == "int") return OpcUaType::UInt16;
    if (s == "long" || s == "dword" || s == "dint" || s == "lbcd") return OpcUaType::Int32;
    if (s == "llong" || s == "qword") return OpcUaType::Int64;
    if (s == "float" || s == "real") return OpcUaType::Float;
    if (s == "double") return OpcUaType::Double;
    if (s == "string") return OpcUaType::String;
    return OpcUaType::Double;
}

QString opcUaTypeName(OpcUaType type)
{
    switch (type) {
    case OpcUaType::Boolean: return "Boolean";
    case OpcUaType::Byte: return "Byte";
    case OpcUaType::Int16: return "Int16";
    case OpcUaType::UInt16: return "UInt16";
    case OpcUaType::Int32: return "Int32";
    case OpcUaType::Int64: return "Int64";
    case OpcUaType::Float: return "Float";
    case OpcUaType::Double: return "Double";
    case OpcUaType::String: return "String";
    }
    return "Double";
}

OpcUaType opcUaVariableType(const QString& dataType, const QJsonObject& scaling)
{
    const QString scaleType = safeGetString(scaling, "type", "None");
    if (!scaleType.isEmpty() && scaleType.compare("None", Qt::CaseInsensitive) != 0) {
        const QString scaled = safeGetString(scaling, "scaled_type");
        if (!scaled.isEmpty()) return opcUaTypeFor(scaled);
    }
    return opcUaTypeFor(dataType);
}

uint8_t opcUaAccessLevel(const QString& access)
{
    const QString s = access.trimmed().toLower();
    if (s.isEmpty()) return kAccessRead;
    const bool writable = s.contains("r/w") || s == "rw" || (s.contains("read") && s.contains("write"));
    if (writable) return kAccessRead | kAccessWrite;
    if (s.contains("write")) return kAccessWrite;
    return kAccessRead;
}

QList<SecurityPolicyInfo> securityPolicyInfos()
{
    using Mode = SecurityPolicyInfo::Mode;
    const QString base = "http://opcfoundation.org/UA/SecurityPolicy#";
    return {
        {"policy_none", base + "None", Mode::None},
        {"policy_sign_aes128", base + "Aes128_Sha256_RsaOaep", Mode::Sign},
        {"policy_sign_aes256", base + "Aes256_Sha256_RsaPss", Mode::Sign},
        {"policy_sign_basic256sha256", base + "Basic256Sha256", Mode::Sign},
        {"policy_encrypt_aes128", base + "Aes128_Sha256_RsaOaep", Mode::SignAndEncrypt},
        {"policy_encrypt_aes256", base + "Aes256_Sha256_RsaPss", Mode::SignAndEncrypt},
        {"policy_encrypt_basic256sha256", base + "Basic256Sha256", Mode::SignAndEncrypt},
    };
}

bool securityPolicyForKey(const QString& key, SecurityPolicyInfo& policy)
{
    for (const SecurityPolicyInfo& s : securityPolicyInfos()) {
        if (s.key == key) {
            policy = s;
            return true;
        }
    }
    return false;
}

bool OpcUaSettings::fromJson(const QJsonObject& obj, OpcUaSettings& out, QString& error)
{
    const QJsonObject flat = mergeFlatAndNested(obj, kSections);
    OpcUaSettings s;

    s.applicationName = safeGetString(flat, "application_Name",
                                      safeGetString(flat, "application_name", s.applicationName));
    s.namespaceUri = safeGetString(flat, "namespace", s.namespaceUri);
    s.host = safeGetString(flat, "network_adapter_ip", s.host);
    s.port = safeGetInt(flat, "port", s.port);
    s.maxSessions = safeGetInt(flat, "max_sessions", s.maxSessions);
    s.publishIntervalMs = safeGetInt(flat, "publish_interval", s.publishIntervalMs);

    if (!isValidPort(s.port)) {
        error = QString("invalid OPC UA port %1").arg(s.port);
        return false;
    }
    if (!s.host.isEmpty() && !isValidIp(s.host)) {
        error = QString("invalid OPC UA host '%1'").arg(s.host);
        return false;
    }

    // 旧格式把认证方式直接写成字符串 "authentication"，合并分节时会被丢弃，需从原对象读取
    const QString legacyAuth = obj.value("authentication").isString() ? obj.value("authentication").toString()
                                                                      : QStringLiteral("Anonymous");
    const QString auth = safeGetString(flat, "auth_type", legacyAuth);
    s.anonymous = auth.compare("Username/Password", Qt::CaseInsensitive) != 0;
    s.username = safeGetString(flat, "username");
    s.password = safeGetString(flat, "password");
    if (!s.anonymous && s.username.isEmpty()) {
        error = "username is required for Username/Password authentication";
        return false;
    }

    s.enabledPolicies.clear();
    for (const SecurityPolicyInfo& policy : securityPolicyInfos()) {
        const bool def = policy.key == "policy_none" && !flat.contains(policy.key) && !obj.contains("security_policies");
        if (toNumericFlag(flat.value(policy.key), def ? 1 : 0) == 1) s.enabledPolicies << policy.key;
    }
    if (s.enabledPolicies.isEmpty()) {
        error = "no security policy enabled, enable at least one";
        return false;
    }

    s.autoGenerateCertificate = safeGetBool(flat, "auto_generate", s.autoGenerateCertificate);
    s.commonName = safeGetString(flat, "common_name", s.commonName);
    s.organization = safeGetString(flat, "organization", s.organization);
    s.organizationUnit = safeGetString(flat, "organization_unit", s.organizationUnit);
    s.locality = safeGetString(flat, "locality", s.locality);
    s.state = safeGetString(flat, "state", s.state);
    s.country = safeGetString(flat, "country", s.country);
    s.certValidityYears = qBound(1, safeGetInt(flat, "cert_validity", s.certValidityYears), 20);

    out = s;
    return true;
}

QJsonObject OpcUaSettings::toJson() const
{
    QJsonObject policiesObj;
    for (const SecurityPolicyInfo& policy : securityPolicyInfos()) {
        policiesObj[policy.key] = enabledPolicies.contains(policy.key);
    }

    return QJsonObject{
        {"general", QJsonObject{
            {"application_Name", applicationName},
            {"namespace", namespaceUri},
            {"port", port},
            {"network_adapter_ip", host},
            {"product_uri", endpointUrl()},
            {"max_sessions", maxSessions},
            {"publish_interval", publishIntervalMs},
        }},
        {"authentication", QJsonObject{
            {"auth_type", anonymous ? "Anonymous" : "Username/Password"},
            {"username", username},
            {"password", password},
        }},
        {"security_policies", policiesObj},
        {"certificate", QJsonObject{
            {"auto_generate", autoGenerateCertificate},
            {"common_name", commonName},
            {"organization", organization},
            {"organization_unit", organizationUnit},
            {"locality", locality},
            {"state", state},
            {"country", country},
            {"cert_validity", certValidityYears},
        }},
    };
}

QString OpcUaSettings::endpointUrl() const
{
    return QString("opc.tcp://%1:%2/").arg(host.isEmpty() ? "0.0.0.0" : host).arg(port);
}

QList<SecurityPolicyInfo> OpcUaSettings::policies() const
{
    QList<SecurityPolicyInfo> out;
    for (const SecurityPolicyInfo& policy : securityPolicyInfos()) {
        if (enabledPolicies.contains(policy.key)) out << policy;
    }
    return out;
}

bool OpcUaSettings::needsCertificate() const
{
    for (const SecurityPolicyInfo& policy : policies()) {
        if (policy.mode != SecurityPolicyInfo::Mode::None) return true;
    }
    return false;
}

} // namespace modua
