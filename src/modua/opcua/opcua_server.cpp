#include "opcua_server.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QHash>
#include <QMutex>
#include <QMutexLocker>
#include <QSet>
#include <QThread>
#include <QVector>
#include <atomic>
#include <cstring>
#include <map>

#include <open62541/plugin/accesscontrol_default.h>
#include <open62541/plugin/log_stdout.h>
#include <open62541/server.h>
#include <open62541/server_config_default.h>
#ifdef UA_ENABLE_ENCRYPTION
#include <open62541/plugin/create_certificate.h>
#endif

#include "modua/utils/file_utils.h"

namespace modua {

namespace {

const UA_DataType* uaDataType(OpcUaType type)
{
    switch (type) {
    case OpcUaType::Boolean: return &UA_TYPES[UA_TYPES_BOOLEAN];
    case OpcUaType::Byte: return &UA_TYPES[UA_TYPES_BYTE];
    case OpcUaType::Int16: return &UA_TYPES[UA_TYPES_INT16];
    case OpcUaType::UInt16: return &UA_TYPES[UA_TYPES_UINT16];
    case OpcUaType::Int32: return &UA_TYPES[UA_TYPES_INT32];
    case OpcUaType::Int64: return &UA_TYPES[UA_TYPES_INT64];
    case OpcUaType::Float: return &UA_TYPES[UA_TYPES_FLOAT];
    case OpcUaType::Double: return &UA_TYPES[UA_TYPES_DOUBLE];
    case OpcUaType::String: return &UA_TYPES[UA_TYPES_STRING];
    }
    return &UA_TYPES[UA_TYPES_DOUBLE];
}

QString uaToQString(const UA_String& s)
{
    return QString::fromUtf8(reinterpret_cast<const char*>(s.data), static_cast<int>(s.length));
}

template <typename T, typename Conv>
UA_StatusCode setVariant(UA_Variant* out, const QVariant& value, bool isArray, const UA_DataType* type, Conv conv)
{
    if (!isArray) {
        T v = conv(value);
        return UA_Variant_setScalarCopy(out, &v, type);
    }
    const QVariantList list = value.toList();
    QVector<T> items;
    items.reserve(list.size());
    for (const QVariant& item : list) items.append(conv(item));
    return UA_Variant_setArrayCopy(out, items.constData(), static_cast<size_t>(items.size()), type);
}

UA_StatusCode setStringVariant(UA_Variant* out, const QVariant& value, bool isArray)
{
    const QStringList texts = isArray ? value.toStringList() : QStringList{value.toString()};
    QList<QByteArray> storage;
    QVector<UA_String> items;
    for (const QString& t : texts) {
        storage.append(t.toUtf8());
        UA_String s;
        s.length = static_cast<size_t>(storage.last().size());
        s.data = reinterpret_cast<UA_Byte*>(storage.last().data());
        items.append(s);
    }
    if (!isArray) return UA_Variant_setScalarCopy(out, &items[0], &UA_TYPES[UA_TYPES_STRING]);
    return UA_Variant_setArrayCopy(out, items.constData(), static_cast<size_t>(items.size()),
                                   &UA_TYPES[UA_TYPES_STRING]);
}

UA_StatusCode toUaVariant(const QVariant& value, OpcUaType type, bool isArray, UA_Variant* out)
{
    const UA_DataType* t = uaDataType(type);
    switch (type) {
    case OpcUaType::Boolean:
        return setVariant<UA_Boolean>(out, value, isArray, t, [](const QVariant& v) { return v.toBool(); });
    case OpcUaType::Byte:
        return setVariant<UA_Byte>(out, value, isArray, t,
                                   [](const QVariant& v) { return static_cast<UA_Byte>(v.toUInt()); });
    case OpcUaType::Int16:
        return setVariant<UA_Int16>(out, value, isArray, t,
                                    [](const QVariant& v) { return static_cast<UA_Int16>(v.toInt()); });
    case OpcUaType::UInt16:
        return setVariant<UA_UInt16>(out, value, isArray, t,
                                     [](const QVariant& v) { return static_cast<UA_UInt16>(v.toUInt()); });
    case OpcUaType::Int32:
        return setVariant<UA_Int32>(out, value, isArray, t,
                                    [](const QVariant& v) { return static_cast<UA_Int32>(v.toLongLong()); });
    case OpcUaType::Int64:
        return setVariant<UA_Int64>(out, value, isArray, t,
                                    [](const QVariant& v) { return static_cast<UA_Int64>(v.toLongLong()); });
    case OpcUaType::Float:
        return setVariant<UA_Float>(out, value, isArray, t,
                                    [](const QVariant& v) { return static_cast<UA_Float>(v.toDouble()); });
    case OpcUaType::Double:
        return setVariant<UA_Double>(out, value, isArray, t, [](const QVariant& v) { return v.toDouble(); });
    case OpcUaType::String:
        return setStringVariant(out, value, isArray);
    }
    return UA_STATUSCODE_BADTYPEMISMATCH;
}

template <typename T>
QVariant elementAt(const UA_Variant& v, size_t i)
{
    return QVariant::fromValue(static_cast<const T*>(v.data)[i]);
}

QVariant element(const UA_Variant& v, size_t i)
{
    const UA_DataType* t = v.type;
    if (t == &UA_TYPES[UA_TYPES_BOOLEAN]) return QVariant(static_cast<const UA_Boolean*>(v.data)[i] != 0);
    if (t == &UA_TYPES[UA_TYPES_BYTE]) return QVariant(static_cast<uint>(static_cast<const UA_Byte*>(v.data)[i]));
    if (t == &UA_TYPES[UA_TYPES_SBYTE]) return QVariant(static_cast<int>(static_cast<const UA_SByte*>(v.data)[i]));
    if (t == &UA_TYPES[UA_TYPES_INT16]) return QVariant(static_cast<int>(static_cast<const UA_Int16*>(v.data)[i]));
    if (t == &UA_TYPES[UA_TYPES_UINT16]) return QVariant(static_cast<uint>(static_cast<const UA_UInt16*>(v.data)[i]));
    if (t == &UA_TYPES[UA_TYPES_INT32]) return elementAt<UA_Int32>(v, i);
    if (t == &UA_TYPES[UA_TYPES_UINT32]) return elementAt<UA_UInt32>(v, i);
    if (t == &UA_TYPES[UA_TYPES_INT64]) return QVariant(static_cast<qlonglong>(static_cast<const UA_Int64*>(v.data)[i]));
    if (t == &UA_TYPES[UA_TYPES_UINT64]) return QVariant(static_cast<qulonglong>(static_cast<const UA_UInt64*>(v.data)[i]));
    if (t == &UA_TYPES[UA_TYPES_FLOAT]) return QVariant(static_cast<double>(static_cast<const UA_Float*>(v.data)[i]));
    if (t == &UA_TYPES[UA_TYPES_DOUBLE]) return elementAt<UA_Double>(v, i);
    if (t == &UA_TYPES[UA_TYPES_STRING]) return QVariant(uaToQString(static_cast<const UA_String*>(v.data)[i]));
    return QVariant();
}

QVariant fromUaVariant(const UA_Variant& v)
{
    if (UA_Variant_isEmpty(&v)) return QVariant();
    if (UA_Variant_isScalar(&v)) return element(v, 0);
    QVariantList list;
    for (size_t i = 0; i < v.arrayLength; ++i) list.append(element(v, i));
    return list;
}

QVariant defaultValue(const OpcUaVariable& var)
{
    QVariant scalar;
    switch (var.type) {
    case OpcUaType::Boolean: scalar = false; break;
    case OpcUaType::Float:
    case OpcUaType::Double: scalar = 0.0; break;
    case OpcUaType::String: scalar = QString(); break;
    default: scalar = 0; break;
    }
    if (!var.isArray) return scalar;
    QVariantList list;
    for (int i = 0; i < qMax(1, var.arraySize); ++i) list.append(scalar);
    return list;
}

} // namespace

struct OpcUaServer::Impl {
    /**
     * 变量绑定，作为节点上下文传给数据源回调
     */
    struct Binding {
        Impl* owner = nullptr;
        OpcUaVariable variable;
        UA_Variant value;
        UA_DateTime timestamp = 0;
    };

    OpcUaSettings settings;
    QString certDir;
    WriteHandler writeHandler;

    UA_Server* server = nullptr;
    UA_UInt16 nsIndex = 1;

    std::map<QString, std::unique_ptr<Binding>> bindings;
    mutable QMutex mutex;

    QThread* thread = nullptr;
    std::atomic<bool> stopped{true};

    ~Impl() { clearBindings(); }

    void clearBindings()
    {
        for (auto& it : bindings) UA_Variant_clear(&it.second->value);
        bindings.clear();
    }

    bool configure(UA_ServerConfig* config, QString& error);
    bool loadCertificate(UA_ByteString& cert, UA_ByteString& key, QString& error);
    bool addFolders(const QList<OpcUaVariable>& variables, QHash<QString, UA_NodeId>& folders, QString& error);
    bool addVariable(Binding* binding, const UA_NodeId& parent, QString& error);
    void runLoop();

    static UA_StatusCode readValue(UA_Server* server, const UA_NodeId* sessionId, void* sessionContext,
                                   const UA_NodeId* nodeId, void* nodeContext, UA_Boolean includeSourceTimeStamp,
                                   const UA_NumericRange* range, UA_DataValue* value);
    static UA_StatusCode writeValue(UA_Server* server, const UA_NodeId* sessionId, void* sessionContext,
                                    const UA_NodeId* nodeId, void* nodeContext, const UA_NumericRange* range,
                                    const UA_DataValue* value);
};

bool OpcUaServer::Impl::loadCertificate(UA_ByteString& cert, UA_ByteString& key, QString& error)
{
    const QString dir = certDir.isEmpty() ? QDir::currentPath() + "/certs" : certDir;
    const QString certPath = dir + "/server_certificate.der";
    const QString keyPath = dir + "/server_private_key.der";

    QByteArray certData;
    QByteArray keyData;
    if (QFile::exists(certPath) && QFile::exists(keyPath)) {
        if (!readFile(certPath, certData, error) || !readFile(keyPath, keyData, error)) return false;
        qInfo().noquote() << "OPC UA using certificate" << certPath;
    } else {
        if (!settings.autoGenerateCertificate) {
            error = QString("server certificate not found in %1").arg(dir);
            return false;
        }
#ifdef UA_ENABLE_ENCRYPTION
        QStringList subject;
        if (!settings.country.isEmpty()) subject << "C=" + settings.country;
        if (!settings.state.isEmpty()) subject << "ST=" + settings.state;
        if (!settings.locality.isEmpty()) subject << "L=" + settings.locality;
        if (!settings.organization.isEmpty()) subject << "O=" + settings.organization;
        if (!settings.organizationUnit.isEmpty()) subject << "OU=" + settings.organizationUnit;
        subject << "CN=" + (settings.commonName.isEmpty() ? settings.applicationName : settings.commonName);

        const QStringList altNames = {
            "DNS:localhost",
            "URI:urn:modua:" + settings.applicationName,
        };

        QList<QByteArray> storage;
        auto toUa = [&storage](const QStringList& list) {
            QVector<UA_String> out;
            for (const QString& s : list) {
                storage.append(s.toUtf8());
                UA_String u;
                u.length = static_cast<size_t>(storage.last().size());
                u.data = reinterpret_cast<UA_Byte*>(storage.last().data());
                out.append(u);
            }
            return out;
        };
        QVector<UA_String> subj = toUa(subject);
        QVector<UA_String> alt = toUa(altNames);

        UA_KeyValueMap params = UA_KEYVALUEMAP_NULL;
        UA_UInt16 days = static_cast<UA_UInt16>(settings.certValidityYears * 365);
        UA_KeyValueMap_setScalar(&params, UA_QUALIFIEDNAME(0, const_cast<char*>("expires-in-days")),
                                 &days, &UA_TYPES[UA_TYPES_UINT16]);

        UA_ByteString genKey = UA_BYTESTRING_NULL;
        UA_ByteString genCert = UA_BYTESTRING_NULL;
        const UA_StatusCode rc = UA_CreateCertificate(UA_Log_Stdout, subj.constData(), subj.size(), alt.constData(),
                                                      alt.size(), UA_CERTIFICATEFORMAT_DER, &params, &genKey,
                                                      &genCert);
        UA_KeyValueMap_clear(&params);
        if (rc != UA_STATUSCODE_GOOD) {
            error = QString("certificate generation failed: %1").arg(UA_StatusCode_name(rc));
            return false;
        }
        certData = QByteArray(reinterpret_cast<const char*>(genCert.data), static_cast<int>(genCert.length));
        keyData = QByteArray(reinterpret_cast<const char*>(genKey.data), static_cast<int>(genKey.length));
        UA_ByteString_clear(&genCert);
        UA_ByteString_clear(&genKey);

        if (!QDir().mkpath(dir)) {
            error = QString("cannot create certificate directory %1").arg(dir);
            return false;
        }
        if (!atomicWrite(certPath, certData, error) || !atomicWrite(keyPath, keyData, error)) return false;
        qInfo().noquote() << "OPC UA generated self-signed certificate" << certPath;
#else
        error = "open62541 was built without encryption support, only policy_none is available";
        return false;
#endif
    }

    UA_ByteString_allocBuffer(&cert, static_cast<size_t>(certData.size()));
    memcpy(cert.data, certData.constData(), static_cast<size_t>(certData.size()));
    UA_ByteString_allocBuffer(&key, static_cast<size_t>(keyData.size()));
    memcpy(key.data, keyData.constData(), static_cast<size_t>(keyData.size()));
    return true;
}

bool OpcUaServer::Impl::configure(UA_ServerConfig* config, QString& error)
{
    UA_StatusCode rc = UA_ServerConfig_setBasics_withPort(config, static_cast<UA_UInt16>(settings.port));
    if (rc != UA_STATUSCODE_GOOD) {
        error = QString("failed to configure server: %1").arg(UA_StatusCode_name(rc));
        return false;
    }

    UA_ByteString cert = UA_BYTESTRING_NULL;
    UA_ByteString key = UA_BYTESTRING_NULL;
    if (settings.needsCertificate() && !loadCertificate(cert, key, error)) return false;

    QSet<QString> addedPolicies;
    for (const SecurityPolicyInfo& policy : settings.policies()) {
        if (addedPolicies.contains(policy.policyUri)) continue;
        if (policy.mode == SecurityPolicyInfo::Mode::None) {
            rc = UA_ServerConfig_addSecurityPolicyNone(config, cert.length ? &cert : nullptr);
        }
#ifdef UA_ENABLE_ENCRYPTION
        else if (policy.policyUri.endsWith("Basic256Sha256")) {
            rc = UA_ServerConfig_addSecurityPolicyBasic256Sha256(config, &cert, &key);
        } else if (policy.policyUri.endsWith("Aes128_Sha256_RsaOaep")) {
            rc = UA_ServerConfig_addSecurityPolicyAes128Sha256RsaOaep(config, &cert, &key);
        } else if (policy.policyUri.endsWith("Aes256_Sha256_RsaPss")) {
            rc = UA_ServerConfig_addSecurityPolicyAes256Sha256RsaPss(config, &cert, &key);
        }
#endif
        else {
            rc = UA_STATUSCODE_BADSECURITYPOLICYREJECTED;
        }
        if (rc != UA_STATUSCODE_GOOD) {
            error = QString("cannot enable %1: %2").arg(policy.key, UA_StatusCode_name(rc));
            UA_ByteString_clear(&cert);
            UA_ByteString_clear(&key);
            return false;
        }
        addedPolicies.insert(policy.policyUri);
    }
    UA_ByteString_clear(&cert);
    UA_ByteString_clear(&key);

    for (const SecurityPolicyInfo& policy : settings.policies()) {
        UA_MessageSecurityMode mode = UA_MESSAGESECURITYMODE_NONE;
        if (policy.mode == SecurityPolicyInfo::Mode::Sign) mode = UA_MESSAGESECURITYMODE_SIGN;
        if (policy.mode == SecurityPolicyInfo::Mode::SignAndEncrypt) mode = UA_MESSAGESECURITYMODE_SIGNANDENCRYPT;
        QByteArray uri = policy.policyUri.toUtf8();
        UA_String uaUri;
        uaUri.length = static_cast<size_t>(uri.size());
        uaUri.data = reinterpret_cast<UA_Byte*>(uri.data());
        rc = UA_ServerConfig_addEndpoint(config, uaUri, mode);
        if (rc != UA_STATUSCODE_GOOD) {
            error = QString("cannot add endpoint for %1: %2").arg(policy.key, UA_StatusCode_name(rc));
            return false;
        }
    }

    // 访问控制需在安全策略之后设置
    if (settings.anonymous) {
        rc = UA_AccessControl_default(config, true, nullptr, 0, nullptr);
    } else {
        QByteArray user = settings.username.toUtf8();
        QByteArray pass = settings.password.toUtf8();
        UA_UsernamePasswordLogin login;
        login.username.length = static_cast<size_t>(user.size());
        login.username.data = reinterpret_cast<UA_Byte*>(user.data());
        login.password.length = static_cast<size_t>(pass.size());
        login.password.data = reinterpret_cast<UA_Byte*>(pass.data());
        rc = UA_AccessControl_default(config, false, nullptr, 1, &login);
    }
    if (rc != UA_STATUSCODE_GOOD) {
        error = QString("failed to configure access control: %1").arg(UA_StatusCode_name(rc));
        return false;
    }

    const QByteArray appName = settings.applicationName.toUtf8();
    const QByteArray appUri = QString("urn:modua:%1").arg(settings.applicationName).toUtf8();
    UA_LocalizedText_clear(&config->applicationDescription.applicationName);
    config->applicationDescription.applicationName = UA_LOCALIZEDTEXT_ALLOC("en-US", appName.constData());
    UA_String_clear(&config->applicationDescription.applicationUri);
    config->applicationDescription.applicationUri = UA_STRING_ALLOC(appUri.constData());

    if (!settings.host.isEmpty() && settings.host != "0.0.0.0") {
        const QByteArray url = QString("opc.tcp://%1:%2").arg(settings.host).arg(settings.port).toUtf8();
        UA_Array_delete(config->serverUrls, config->serverUrlsSize, &UA_TYPES[UA_TYPES_STRING]);
        config->serverUrls = static_cast<UA_String*>(UA_Array_new(1, &UA_TYPES[UA_TYPES_STRING]));
        config->serverUrls[0] = UA_STRING_ALLOC(url.constData());
        config->serverUrlsSize = 1;
    }

    config->maxSessions = static_cast<decltype(config->maxSessions)>(settings.maxSessions);
    config->publishingIntervalLimits.min = settings.publishIntervalMs;
    return true;
}

bool OpcUaServer::Impl::addFolders(const QList<OpcUaVariable>& variables, QHash<QString, UA_NodeId>& folders,
                                   QString& error)
{
    const UA_NodeId objects = UA_NODEID_NUMERIC(0, UA_NS0ID_OBJECTSFOLDER);
    for (const OpcUaVariable& var : variables) {
        QString key;
        UA_NodeId parent = objects;
        for (const QString& name : var.folders) {
            key = key.isEmpty() ? name : key + "." + name;
            auto it = folders.constFind(key);
            if (it != folders.constEnd()) {
                parent = it.value();
                continue;
            }

            const QByteArray utf8 = name.toUtf8();
            UA_ObjectAttributes attr = UA_ObjectAttributes_default;
            attr.displayName = UA_LOCALIZEDTEXT(const_cast<char*>("en-US"), const_cast<char*>(utf8.constData()));

            UA_NodeId folderId;
            const UA_StatusCode rc = UA_Server_addObjectNode(
                server, UA_NODEID_NUMERIC(nsIndex, 0), parent, UA_NODEID_NUMERIC(0, UA_NS0ID_ORGANIZES),
                UA_QUALIFIEDNAME(nsIndex, const_cast<char*>(utf8.constData())),
                UA_NODEID_NUMERIC(0, UA_NS0ID_FOLDERTYPE), attr, nullptr, &folderId);
            if (rc != UA_STATUSCODE_GOOD) {
                error = QString("failed to create folder %1: %2").arg(key, UA_StatusCode_name(rc));
                return false;
            }
            folders.insert(key, folderId);
            parent = folderId;
        }
    }
    return true;
}

bool OpcUaServer::Impl::addVariable(Binding* binding, const UA_NodeId& parent, QString& error)
{
    const OpcUaVariable& var = binding->variable;
    const UA_DataType* type = uaDataType(var.type);
    const QByteArray display = var.displayName.toUtf8();
    const QByteArray path = var.path.toUtf8();
    const QByteArray desc = var.description.toUtf8();

    UA_VariableAttributes attr = UA_VariableAttributes_default;
    attr.displayName = UA_LOCALIZEDTEXT(const_cast<char*>("en-US"), const_cast<char*>(display.constData()));
    attr.description = UA_LOCALIZEDTEXT(const_cast<char*>("en-US"), const_cast<char*>(desc.constData()));
    attr.dataType = type->typeId;
    attr.accessLevel = var.accessLevel;
    attr.userAccessLevel = var.accessLevel;
    UA_UInt32 dim = static_cast<UA_UInt32>(qMax(1, var.arraySize));
    if (var.isArray) {
        attr.valueRank = UA_VALUERANK_ONE_DIMENSION;
        attr.arrayDimensionsSize = 1;
        attr.arrayDimensions = &dim;
    } else {
        attr.valueRank = UA_VALUERANK_SCALAR;
    }

    UA_DataSource source;
    source.read = &Impl::readValue;
    source.write = &Impl::writeValue;

    const UA_StatusCode rc = UA_Server_addDataSourceVariableNode(
        server, UA_NODEID_STRING(nsIndex, const_cast<char*>(path.constData())), parent,
        UA_NODEID_NUMERIC(0, UA_NS0ID_ORGANIZES), UA_QUALIFIEDNAME(nsIndex, const_cast<char*>(display.constData())),
        UA_NODEID_NUMERIC(0, UA_NS0ID_BASEDATAVARIABLETYPE), attr, source, binding, nullptr);
    if (rc != UA_STATUSCODE_GOOD) {
        error = QString("failed to add variable %1: %2").arg(var.path, UA_StatusCode_name(rc));
        return false;
    }
    return true;
}

UA_StatusCode OpcUaServer::Impl::readValue(UA_Server*, const UA_NodeId*, void*, const UA_NodeId*, void* nodeContext,
                                           UA_Boolean includeSourceTimeStamp, const UA_NumericRange* range,
                                           UA_DataValue* value)
{
    auto* binding = static_cast<Binding*>(nodeContext);
    if (!binding || !binding->owner) return UA_STATUSCODE_BADINTERNALERROR;

    QMutexLocker lock(&binding->owner->mutex);
    const UA_StatusCode rc = range ? UA_Variant_copyRange(&binding->value, &value->value, *range)
                                   : UA_Variant_copy(&binding->value, &value->value);
    if (rc != UA_STATUSCODE_GOOD) return rc;
    value->hasValue = true;
    if (includeSourceTimeStamp && binding->timestamp != 0) {
        value->hasSourceTimestamp = true;
        value->sourceTimestamp = binding->timestamp;
    }
    return UA_STATUSCODE_GOOD;
}

UA_StatusCode OpcUaServer::Impl::writeValue(UA_Server*, const UA_NodeId*, void*, const UA_NodeId*,
                                            void* nodeContext, const UA_NumericRange* range, const UA_DataValue* data)
{
    auto* binding = static_cast<Binding*>(nodeContext);
    if (!binding || !binding->owner || !data || !data->hasValue) return UA_STATUSCODE_BADINTERNALERROR;
    if (range) return UA_STATUSCODE_BADINDEXRANGEINVALID;
    if (!(binding->variable.accessLevel & kAccessWrite)) return UA_STATUSCODE_BADNOTWRITABLE;
    if (data->value.type != uaDataType(binding->variable.type)) return UA_STATUSCODE_BADTYPEMISMATCH;

    Impl* owner = binding->owner;
    const QString path = binding->variable.path;
    const QVariant value = fromUaVariant(data->value);
    if (!owner->writeHandler) {
        qWarning().noquote() << "OPC UA write to" << path << "rejected: no write handler";
        return UA_STATUSCODE_BADNOTWRITABLE;
    }

    QString error;
    if (!owner->writeHandler(path, value, error)) {
        qWarning().noquote() << "OPC UA write to" << path << "rejected:" << error;
        return UA_STATUSCODE_BADUSERACCESSDENIED;
    }

    // 立即反映写入值，轮询结果随后覆盖
    QMutexLocker lock(&owner->mutex);
    UA_Variant next;
    UA_Variant_init(&next);
    if (UA_Variant_copy(&data->value, &next) == UA_STATUSCODE_GOOD) {
        UA_Variant_clear(&binding->value);
        binding->value = next;
        binding->timestamp = UA_DateTime_now();
    }
    qInfo().noquote() << "OPC UA client wrote" << path << "=" << value.toString();
    return UA_STATUSCODE_GOOD;
}

void OpcUaServer::Impl::runLoop()
{
    while (!stopped.load()) {
        UA_Server_run_iterate(server, true);
    }
}

OpcUaServer::OpcUaServer(const OpcUaSettings& settings)
    : d(std::make_unique<Impl>())
{
    d->settings = settings;
}

OpcUaServer::~OpcUaServer()
{
    stop();
}

void OpcUaServer::setCertificateDirectory(const QString& dir)
{
    d->certDir = dir;
}

void OpcUaServer::setWriteHandler(WriteHandler handler)
{
    d->writeHandler = std::move(handler);
}

bool OpcUaServer::start(const QList<OpcUaVariable>& variables, QString& error)
{
    if (isRunning()) {
        error = "OPC UA server already running";
        return false;
    }

    UA_ServerConfig config;
    memset(&config, 0, sizeof(UA_ServerConfig));
    if (!d->configure(&config, error)) {
        UA_ServerConfig_clean(&config);
        return false;
    }

    d->server = UA_Server_newWithConfig(&config);
    if (!d->server) {
        error = "failed to create OPC UA server";
        return false;
    }

    const QByteArray ns = d->settings.namespaceUri.toUtf8();
    d->nsIndex = UA_Server_addNamespace(d->server, ns.constData());

    QHash<QString, UA_NodeId> folders;
    bool ok = d->addFolders(variables, folders, error);
    for (int i = 0; ok && i < variables.size(); ++i) {
        const OpcUaVariable& var = variables.at(i);
        if (d->bindings.count(var.path)) {
            qWarning().noquote() << "OPC UA duplicate variable path" << var.path << "skipped";
            continue;
        }
        auto binding = std::make_unique<Impl::Binding>();
        binding->owner = d.get();
        binding->variable = var;
        UA_Variant_init(&binding->value);
        toUaVariant(defaultValue(var), var.type, var.isArray, &binding->value);

        const UA_NodeId parent = var.folders.isEmpty()
                                     ? UA_NODEID_NUMERIC(0, UA_NS0ID_OBJECTSFOLDER)
                                     : folders.value(var.folders.join("."));
        Impl::Binding* raw = binding.get();
        d->bindings.emplace(var.path, std::move(binding));
        ok = d->addVariable(raw, parent, error);
    }
    for (UA_NodeId& id : folders) UA_NodeId_clear(&id);

    if (ok) {
        const UA_StatusCode rc = UA_Server_run_startup(d->server);
        if (rc != UA_STATUSCODE_GOOD) {
            error = QString("OPC UA server startup failed: %1").arg(UA_StatusCode_name(rc));
            ok = false;
        }
    }
    if (!ok) {
        UA_Server_delete(d->server);
        d->server = nullptr;
        d->clearBindings();
        return false;
    }

    d->stopped.store(false);
    d->thread = new QThread();
    QObject::connect(d->thread, &QThread::started, [this]() { d->runLoop(); });
    d->thread->start();

    qInfo().noquote() << "OPC UA server listening on" << endpointUrl() << "with"
                      << static_cast<int>(d->bindings.size()) << "variable(s)";
    return true;
}

void OpcUaServer::stop()
{
    if (!d->server) return;
    d->stopped.store(true);

    if (d->thread) {
        d->thread->quit();
        // run_iterate 最多阻塞一个事件循环周期
        d->thread->wait();
        delete d->thread;
        d->thread = nullptr;
    }

    UA_Server_run_shutdown(d->server);
    UA_Server_delete(d->server);
    d->server = nullptr;

    QMutexLocker lock(&d->mutex);
    d->clearBindings();
    qInfo("OPC UA server stopped");
}

bool OpcUaServer::isRunning() const
{
    return d->server != nullptr && !d->stopped.load();
}

bool OpcUaServer::hasVariable(const QString& path) const
{
    QMutexLocker lock(&d->mutex);
    return d->bindings.count(path) > 0;
}

int OpcUaServer::variableCount() const
{
    QMutexLocker lock(&d->mutex);
    return static_cast<int>(d->bindings.size());
}

bool OpcUaServer::updateValue(const QString& path, const QVariant& value)
{
    QMutexLocker lock(&d->mutex);
    auto it = d->bindings.find(path);
    if (it == d->bindings.end()) return false;

    Impl::Binding* binding = it->second.get();
    UA_Variant next;
    UA_Variant_init(&next);
    const UA_StatusCode rc = toUaVariant(value, binding->variable.type, binding->variable.isArray, &next);
    if (rc != UA_STATUSCODE_GOOD) {
        UA_Variant_clear(&next);
        return false;
    }
    UA_Variant_clear(&binding->value);
    binding->value = next;
    binding->timestamp = UA_DateTime_now();
    return true;
}

QString OpcUaServer::endpointUrl() const
{
    return d->settings.endpointUrl();
}

} // namespace modua
