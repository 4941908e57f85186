#include "runtime_monitor.h"

#include <QDateTime>
#include <QDebug>

#include "modua/runtime/data_buffer.h"
#include "modua/runtime/diagnostics.h"
#include "modua/runtime/poll_worker.h"
#include "modua/utils/config_utils.h"

namespace modua {

RuntimeMonitor::RuntimeMonitor(DataBuffer* buffer, DiagnosticsManager* diagnostics, QObject* parent)
    : QObject(parent)
    , m_buffer(buffer)
    , m_diagnostics(diagnostics)
    , m_factory(&modbus::createTransport)
{
}

RuntimeMonitor::~RuntimeMonitor()
{
    stop();
}

void RuntimeMonitor::setTransportFactory(TransportFactory factory)
{
    m_factory = std::move(factory);
}

void RuntimeMonitor::setOpcUa(const OpcUaSettings& settings, bool enabled, const QString& certificateDir)
{
    m_opcUaSettings = settings;
    m_opcUaEnabled = enabled;
    m_certificateDir = certificateDir;
}

QList<DeviceGroup> RuntimeMonitor::collectDeviceGroups(const ProjectNode& root, QStringList& warnings)
{
    QList<DeviceGroup> groups;
    for (ProjectNode* channel : root.childrenOfKind(ProjectNode::Kind::Channel)) {
        modbus::ChannelSettings channelSettings;
        QString error;
        if (!modbus::ChannelSettings::fromJson(channel->config(), channelSettings, error)) {
            warnings << error;
            continue;
        }
        if (channelSettings.name.isEmpty()) channelSettings.name = channel->name();

        for (ProjectNode* device : channel->childrenOfKind(ProjectNode::Kind::Device)) {
            DeviceGroup group;
            group.configId = configIdFor(device);
            group.channel = channelSettings;
            group.device = modbus::DeviceSettings::fromJson(device->config());
            if (group.device.name.isEmpty()) group.device.name = device->name();

            for (ProjectNode* tag : collectTags(device)) {
                modbus::TagDefinition def;
                const QString path = tag->path();
                if (!modbus::TagDefinition::fromConfig(tag->config(), group.device, path, def, error)) {
                    warnings << QString("%1: %2").arg(path, error);
                    continue;
                }
                const QJsonObject general = tag->general();
                group.tags.append(def);
                group.dataTypes.insert(path, safeGetString(general, "data_type"));
                group.access.insert(path, safeGetString(general, "access"));
            }
            if (group.tags.isEmpty()) continue;
            groups.append(group);
        }
    }
    return groups;
}

QList<OpcUaVariable> RuntimeMonitor::collectOpcUaVariables(const ProjectNode& root)
{
    QList<ProjectNode*> tags;
    for (ProjectNode* channel : root.childrenOfKind(ProjectNode::Kind::Channel)) tags += collectTags(channel);

    QList<OpcUaVariable> variables;
    for (ProjectNode* tag : tags) {
        const QJsonObject general = tag->general();
        const TagMetadata meta = tagMetadata(*tag);

        OpcUaVariable var;
        var.path = tag->path();
        var.displayName = tag->name();
        var.folders = var.path.split('.');
        var.folders.removeLast();
        var.type = opcUaVariableType(safeGetString(general, "data_type"), safeGetObject(tag->config(), "scaling"));
        var.accessLevel = opcUaAccessLevel(safeGetString(general, "access"));
        var.isArray = meta.isArray;
        var.arraySize = meta.isArray ? meta.arraySize : 0;
        var.description = safeGetString(general, "description");
        variables.append(var);
    }
    return variables;
}

bool RuntimeMonitor::start(const ProjectNode& root, QString& error)
{
    if (m_running) {
        error = "runtime already running";
        return false;
    }

    m_warnings.clear();
    const QList<DeviceGroup> groups = collectDeviceGroups(root, m_warnings);
    for (const QString& w : m_warnings) qWarning().noquote() << "Runtime:" << w;
    if (groups.isEmpty()) {
        error = "no device with valid tags to poll";
        return false;
    }

    for (const DeviceGroup& group : groups) {
        std::unique_ptr<modbus::ModbusTransport> transport = m_factory(group.channel, error);
        if (!transport) {
            error = QString("%1: %2").arg(group.configId, error);
            m_workers.clear();
            m_workerByPath.clear();
            return false;
        }

        auto worker = std::make_unique<PollWorker>(group.configId, std::move(transport), group.device, group.tags);
        worker->setDiagnostics(m_diagnostics);
        // 缓冲与 OPC UA 均线程安全，直接在轮询线程中更新
        connect(worker.get(), &PollWorker::tagPolled, this, &RuntimeMonitor::onTagPolled, Qt::DirectConnection);
        connect(worker.get(), &PollWorker::connectionStateChanged, this, &RuntimeMonitor::connectionStateChanged);

        for (const modbus::TagDefinition& tag : group.tags) {
            m_workerByPath.insert(tag.path, worker.get());
            if (m_buffer) {
                m_buffer->setTagInfo(tag.path, group.dataTypes.value(tag.path), group.access.value(tag.path));
            }
        }
        m_workers.push_back(std::move(worker));
    }

    if (m_opcUaEnabled) {
        m_opcUa = std::make_unique<OpcUaServer>(m_opcUaSettings);
        m_opcUa->setCertificateDirectory(m_certificateDir);
        m_opcUa->setWriteHandler([this](const QString& path, const QVariant& value, QString& err) {
            return writeTag(path, value, err);
        });
        if (!m_opcUa->start(collectOpcUaVariables(root), error)) {
            m_opcUa.reset();
            m_workers.clear();
            m_workerByPath.clear();
            return false;
        }
    }

    {
        QMutexLocker lock(&m_countMutex);
        m_updateCounts.clear();
    }
    for (auto& worker : m_workers) worker->start();
    m_running = true;
    qInfo().noquote() << "Runtime started with" << static_cast<int>(m_workers.size()) << "device worker(s)";
    emit runningChanged(true);
    return true;
}

void RuntimeMonitor::stop()
{
    if (!m_running) return;

    // 轮询线程会推送到 OPC UA，需先停；OPC UA 写回调引用 worker，需在销毁 worker 之前停
    for (auto& worker : m_workers) worker->stop();
    if (m_opcUa) {
        m_opcUa->stop();
        m_opcUa.reset();
    }
    m_workers.clear();
    m_workerByPath.clear();
    m_running = false;
    qInfo("Runtime stopped");
    emit runningChanged(false);
}

bool RuntimeMonitor::writeTag(const QString& path, const QVariant& value, QString& error)
{
    PollWorker* worker = m_workerByPath.value(path, nullptr);
    if (!worker) {
        error = QString("tag '%1' is not being polled").arg(path);
        return false;
    }
    if (!worker->requestWrite(path, value, error)) return false;
    if (m_buffer) m_buffer->writeTagValue(path, value);
    return true;
}

QStringList RuntimeMonitor::configIds() const
{
    QStringList ids;
    for (const auto& worker : m_workers) ids << worker->configId();
    return ids;
}

PollWorker* RuntimeMonitor::worker(const QString& configId) const
{
    for (const auto& worker : m_workers) {
        if (worker->configId() == configId) return worker.get();
    }
    return nullptr;
}

void RuntimeMonitor::onTagPolled(const QString& path, const QVariant& value, const QString& quality)
{
    const bool good = quality == "Good";
    int count = 0;
    {
        QMutexLocker lock(&m_countMutex);
        int& c = m_updateCounts[path];
        if (good) ++c;
        count = c;
    }

    const double now = QDateTime::currentMSecsSinceEpoch() / 1000.0;
    if (m_buffer) {
        // 读取失败时保留上次的值
        const QVariant stored = good ? value : m_buffer->tagValue(path);
        m_buffer->updateTag(path, stored, now, quality, count);
    }
    if (good && m_opcUa && !m_opcUa->updateValue(path, value)) {
        qDebug().noquote() << "OPC UA update skipped for" << path;
    }
    emit tagUpdated(path);
}

} // namespace modua
