#include "project_node.h"

#include <QHash>
#include <QRegularExpression>
#include <QSet>
#include <algorithm>

#include "modua/core/constants.h"
#include "modua/modbus/modbus_types.h"
#include "modua/utils/config_utils.h"

namespace modua {

ProjectNode::ProjectNode(Kind kind, const QString& name, const QJsonObject& config)
    : m_kind(kind)
    , m_config(config)
{
    setName(name.isEmpty() && kind != Kind::Root
                ? safeGetString(safeGetObject(config, "general"), nameKey(kind))
                : name);
}

void ProjectNode::setName(const QString& name)
{
    m_name = name;
    if (m_kind == Kind::Root) return;
    QJsonObject general = safeGetObject(m_config, "general");
    general[nameKey(m_kind)] = name;
    m_config["general"] = general;
}

void ProjectNode::setConfig(const QJsonObject& config)
{
    m_config = config;
    const QString name = safeGetString(safeGetObject(config, "general"), nameKey(m_kind));
    setName(name.isEmpty() ? m_name : name);
}

QJsonObject ProjectNode::general() const
{
    return safeGetObject(m_config, "general");
}

ProjectNode* ProjectNode::child(int index) const
{
    if (index < 0 || index >= childCount()) return nullptr;
    return m_children[static_cast<size_t>(index)].get();
}

int ProjectNode::indexOf(const ProjectNode* child) const
{
    for (size_t i = 0; i < m_children.size(); ++i) {
        if (m_children[i].get() == child) return static_cast<int>(i);
    }
    return -1;
}

int ProjectNode::row() const
{
    return m_parent ? m_parent->indexOf(this) : 0;
}

ProjectNode* ProjectNode::addChild(std::unique_ptr<ProjectNode> child)
{
    return insertChild(childCount(), std::move(child));
}

ProjectNode* ProjectNode::insertChild(int index, std::unique_ptr<ProjectNode> child)
{
    if (!child) return nullptr;
    index = std::clamp(index, 0, childCount());
    child->m_parent = this;
    ProjectNode* raw = child.get();
    m_children.insert(m_children.begin() + index, std::move(child));
    return raw;
}

std::unique_ptr<ProjectNode> ProjectNode::takeChild(int index)
{
    if (index < 0 || index >= childCount()) return nullptr;
    std::unique_ptr<ProjectNode> out = std::move(m_children[static_cast<size_t>(index)]);
    m_children.erase(m_children.begin() + index);
    out->m_parent = nullptr;
    return out;
}

void ProjectNode::clearChildren()
{
    m_children.clear();
}

ProjectNode* ProjectNode::findChild(const QString& name, Kind kind) const
{
    for (const auto& c : m_children) {
        if (c->m_kind == kind && c->m_name == name) return c.get();
    }
    return nullptr;
}

QList<ProjectNode*> ProjectNode::childrenOfKind(Kind kind) const
{
    QList<ProjectNode*> out;
    for (const auto& c : m_children) {
        if (c->m_kind == kind) out.append(c.get());
    }
    return out;
}

ProjectNode* ProjectNode::ancestor(Kind kind) const
{
    const ProjectNode* n = this;
    while (n) {
        if (n->m_kind == kind) return const_cast<ProjectNode*>(n);
        n = n->m_parent;
    }
    return nullptr;
}

QString ProjectNode::path() const
{
    QStringList parts;
    for (const ProjectNode* n = this; n && n->m_kind != Kind::Root; n = n->m_parent) {
        parts.prepend(n->m_name);
    }
    return parts.join(kGroupSeparator);
}

std::unique_ptr<ProjectNode> ProjectNode::clone() const
{
    auto copy = std::make_unique<ProjectNode>(m_kind, m_name, m_config);
    for (const auto& c : m_children) {
        copy->addChild(c->clone());
    }
    return copy;
}

QString ProjectNode::kindName(Kind kind)
{
    switch (kind) {
    case Kind::Root:
        return "Connectivity";
    case Kind::Channel:
        return "Channel";
    case Kind::Device:
        return "Device";
    case Kind::Group:
        return "Group";
    case Kind::Tag:
        return "Tag";
    }
    return QString();
}

bool ProjectNode::parseKind(const QString& name, Kind& kind)
{
    static const QHash<QString, Kind> kinds = {
        {"connectivity", Kind::Root}, {"project", Kind::Root}, {"channel", Kind::Channel},
        {"device", Kind::Device},     {"group", Kind::Group},  {"tag", Kind::Tag},
    };
    auto it = kinds.constFind(name.trimmed().toLower());
    if (it == kinds.constEnd()) return false;
    kind = it.value();
    return true;
}

QString ProjectNode::nameKey(Kind kind)
{
    return kind == Kind::Channel ? QStringLiteral("channel_name") : QStringLiteral("name");
}

bool ProjectNode::canContain(Kind parent, Kind child)
{
    switch (child) {
    case Kind::Channel:
        return parent == Kind::Root;
    case Kind::Device:
        return parent == Kind::Channel;
    case Kind::Group:
    case Kind::Tag:
        return parent == Kind::Device || parent == Kind::Group;
    case Kind::Root:
        return false;
    }
    return false;
}

// ---------------------------------------------------------------------------

TagMetadata tagMetadata(const ProjectNode& tag)
{
    TagMetadata meta;
    const QJsonObject general = tag.general();
    const QString address = safeGetString(general, "address");
    const QString dataType = safeGetString(general, "data_type");

    static const QRegularExpression digits("(\\d+)");
    static const QRegularExpression arrayPart("\\[\\s*(\\d+)\\s*\\]");

    const QRegularExpressionMatch d = digits.match(address);
    if (d.hasMatch()) meta.addrnum = d.captured(1).toInt();

    const QRegularExpressionMatch a = arrayPart.match(address);
    meta.isArray = dataType.contains("array", Qt::CaseInsensitive) || a.hasMatch();
    if (meta.isArray && a.hasMatch()) meta.arraySize = qMax(1, a.captured(1).toInt());
    return meta;
}

QList<ProjectNode*> collectTags(ProjectNode* node)
{
    QList<ProjectNode*> out;
    if (!node) return out;
    if (node->kind() == ProjectNode::Kind::Tag) {
        out.append(node);
        return out;
    }
    for (int i = 0; i < node->childCount(); ++i) {
        out += collectTags(node->child(i));
    }
    return out;
}

int nextDeviceId(const ProjectNode* channel)
{
    if (!channel) return kMinDeviceId;
    int maxId = 0;
    for (ProjectNode* device : channel->childrenOfKind(ProjectNode::Kind::Device)) {
        maxId = qMax(maxId, safeGetInt(device->general(), "device_id", 0));
    }
    return std::clamp(maxId + 1, kMinDeviceId, kMaxDeviceId);
}

namespace {

int elementSize(const QString& dataType)
{
    modbus::TagType type;
    if (!modbus::parseDataType(dataType, type)) return 1;
    return type.elementRegisters();
}

} // namespace

QString nextTagAddress(const ProjectNode* parent, QChar prefix)
{
    int maxEnd = -1;
    if (parent) {
        for (ProjectNode* tag : parent->childrenOfKind(ProjectNode::Kind::Tag)) {
            const QJsonObject general = tag->general();
            modbus::ParsedAddress addr;
            QString error;
            if (!modbus::parseAddress(safeGetString(general, "address"), addr, error)) continue;
            if (modbus::addressPrefix(addr.type) != prefix) continue;

            const TagMetadata meta = tagMetadata(*tag);
            const int size = elementSize(safeGetString(general, "data_type"));
            const int span = meta.isArray ? meta.arraySize * size : size;
            maxEnd = qMax(maxEnd, addr.index + span - 1);
        }
    }
    const int next = qMin(maxEnd + 1, kMaxAddressIndex);
    return modbus::formatAddress(prefix, next);
}

QString uniqueName(const ProjectNode* parent, const QString& base, ProjectNode::Kind kind)
{
    QSet<QString> used;
    if (parent) {
        for (ProjectNode* sibling : parent->childrenOfKind(kind)) used.insert(sibling->name());
    }

    // 去掉末尾重复的 _Copy / _CopyN
    static const QRegularExpression copySuffix("(_Copy\\d+|_Copy)$");
    QString clean = base;
    while (true) {
        const QRegularExpressionMatch m = copySuffix.match(clean);
        if (!m.hasMatch()) break;
        clean.truncate(m.capturedStart());
    }
    if (clean.isEmpty()) clean = ProjectNode::kindName(kind);

    auto maxSuffix = [&used](const QString& root) {
        const QRegularExpression re("^" + QRegularExpression::escape(root) + "(\\d+)$");
        int best = -1;
        for (const QString& u : used) {
            const QRegularExpressionMatch m = re.match(u);
            if (m.hasMatch()) best = qMax(best, m.captured(1).toInt());
        }
        return best;
    };

    // 尾部数字作为计数器，如 Tag12
    static const QRegularExpression trailingNumber("^(.*?)(\\d+)$");
    const QRegularExpressionMatch num = trailingNumber.match(clean);
    if (num.hasMatch()) {
        const QString root = num.captured(1);
        const int baseIdx = num.captured(2).toInt();
        const int existing = maxSuffix(root);
        int next = existing >= 0 ? existing + 1 : (used.contains(clean) ? baseIdx + 1 : baseIdx);
        while (used.contains(root + QString::number(next))) ++next;
        return root + QString::number(next);
    }

    if (!used.contains(clean)) return clean;

    const int existing = maxSuffix(clean);
    int next = existing >= 0 ? existing + 1 : 1;
    while (used.contains(clean + QString::number(next))) ++next;
    return clean + QString::number(next);
}

QString configIdFor(const ProjectNode* device)
{
    if (!device) return QString();
    const ProjectNode* channel = device->ancestor(ProjectNode::Kind::Channel);
    return QString("%1_%2").arg(channel ? channel->name() : QString(), device->name());
}

} // namespace modua
