#include "project_clipboard.h"

#include <QSet>

#include "modua/model/project_serializer.h"
#include "modua/modbus/modbus_types.h"
#include "modua/utils/config_utils.h"

namespace modua {

namespace {

void collectTagJson(const QJsonObject& node, QJsonArray& out)
{
    if (safeGetString(node, "type").compare("Tag", Qt::CaseInsensitive) == 0) {
        out.append(node);
        return;
    }
    for (const QJsonValue& c : node.value("children").toArray()) {
        collectTagJson(c.toObject(), out);
    }
}

bool isDescendant(const ProjectNode* node, const ProjectNode* ancestor)
{
    for (const ProjectNode* n = node; n; n = n->parent()) {
        if (n == ancestor) return true;
    }
    return false;
}

/**
 * 去掉空指针、根节点、重复项以及祖先已在列表中的节点
 */
QList<ProjectNode*> topLevelNodes(const QList<ProjectNode*>& nodes)
{
    QList<ProjectNode*> out;
    for (ProjectNode* node : nodes) {
        if (!node || node->kind() == ProjectNode::Kind::Root || out.contains(node)) continue;
        bool covered = false;
        for (const ProjectNode* other : nodes) {
            if (other && other != node && isDescendant(node, other)) {
                covered = true;
                break;
            }
        }
        if (!covered) out.append(node);
    }
    return out;
}

} // namespace

void ProjectClipboard::copy(const QList<ProjectNode*>& nodes)
{
    QJsonArray items;
    for (const ProjectNode* node : topLevelNodes(nodes)) {
        items.append(ProjectSerializer::nodeToJson(*node));
    }
    m_items = items;
}

void ProjectClipboard::cut(const QList<ProjectNode*>& nodes)
{
    const QList<ProjectNode*> top = topLevelNodes(nodes);
    copy(top);
    for (ProjectNode* node : top) {
        ProjectNode* parent = node->parent();
        if (!parent) continue;
        parent->takeChild(parent->indexOf(node));
    }
}

bool ProjectClipboard::payloadKind(ProjectNode::Kind& kind) const
{
    if (m_items.isEmpty()) return false;
    return ProjectNode::parseKind(safeGetString(m_items.first().toObject(), "type"), kind);
}

ProjectNode* ProjectClipboard::resolveParent(ProjectNode* target) const
{
    ProjectNode::Kind copyKind;
    if (!target || !payloadKind(copyKind)) return nullptr;

    if (ProjectNode::canContain(target->kind(), copyKind)) return target;
    if (copyKind == target->kind()) return target->parent();
    return nullptr;
}

ProjectNode* ProjectClipboard::insertCopy(ProjectNode* parent, const QJsonObject& item, QString& error)
{
    std::unique_ptr<ProjectNode> node = ProjectSerializer::nodeFromJson(item, error);
    if (!node) return nullptr;
    if (!ProjectNode::canContain(parent->kind(), node->kind())) {
        error = QString("cannot paste %1 into %2").arg(node->kindName(), parent->kindName());
        return nullptr;
    }

    node->setName(uniqueName(parent, node->name(), node->kind()));

    if (node->kind() == ProjectNode::Kind::Device) {
        QJsonObject cfg = node->config();
        QJsonObject general = node->general();
        general["device_id"] = nextDeviceId(parent);
        cfg["general"] = general;
        node->setConfig(cfg);
    } else if (node->kind() == ProjectNode::Kind::Tag) {
        QJsonObject general = node->general();
        const QString address = safeGetString(general, "address");

        QSet<QString> usedAddresses;
        for (ProjectNode* sibling : parent->childrenOfKind(ProjectNode::Kind::Tag)) {
            usedAddresses.insert(safeGetString(sibling->general(), "address"));
        }

        if (address.isEmpty() || usedAddresses.contains(address)) {
            modbus::TagType type;
            if (!modbus::parseDataType(safeGetString(general, "data_type", "Word"), type)) {
                type = modbus::TagType();
            }
            const QString access = safeGetString(general, "access", "Read/Write");
            const bool rw = access.compare("Read Only", Qt::CaseInsensitive) != 0;
            QString next = nextTagAddress(parent, modbus::prefixFor(type, rw));
            if (type.isArray) {
                const TagMetadata meta = tagMetadata(*node);
                next += QString(" [%1]").arg(meta.arraySize > 1 ? meta.arraySize : 10);
            }
            general["address"] = next;
            QJsonObject cfg = node->config();
            cfg["general"] = general;
            node->setConfig(cfg);
        }
    }

    return parent->addChild(std::move(node));
}

QList<ProjectNode*> ProjectClipboard::paste(ProjectNode* target, QString& error)
{
    QList<ProjectNode*> pasted;
    ProjectNode::Kind copyKind;
    if (!target || !payloadKind(copyKind)) {
        error = "clipboard is empty";
        return pasted;
    }

    // 设备粘贴到组上：只取出其中的标签
    if (copyKind == ProjectNode::Kind::Device && target->kind() == ProjectNode::Kind::Group) {
        QJsonArray tags;
        for (const QJsonValue& v : m_items) collectTagJson(v.toObject(), tags);
        for (const QJsonValue& t : tags) {
            ProjectNode* n = insertCopy(target, t.toObject(), error);
            if (!n) return pasted;
            pasted.append(n);
        }
        return pasted;
    }

    ProjectNode* parent = resolveParent(target);
    if (!parent) {
        error = QString("cannot paste %1 into %2").arg(ProjectNode::kindName(copyKind), target->kindName());
        return pasted;
    }

    for (const QJsonValue& v : m_items) {
        ProjectNode* n = insertCopy(parent, v.toObject(), error);
        if (!n) return pasted;
        pasted.append(n);
    }
    return pasted;
}

bool ProjectClipboard::moveNode(ProjectNode* node, ProjectNode* newParent, int row, QString& error)
{
    if (!node || !newParent || !node->parent()) {
        error = "invalid move";
        return false;
    }
    if (!ProjectNode::canContain(newParent->kind(), node->kind())) {
        error = QString("cannot move %1 into %2").arg(node->kindName(), newParent->kindName());
        return false;
    }
    if (isDescendant(newParent, node)) {
        error = "cannot move a node into its own subtree";
        return false;
    }

    ProjectNode* oldParent = node->parent();
    const int oldRow = oldParent->indexOf(node);
    std::unique_ptr<ProjectNode> taken = oldParent->takeChild(oldRow);
    if (oldParent == newParent && row > oldRow) --row;
    if (oldParent != newParent) {
        taken->setName(uniqueName(newParent, taken->name(), taken->kind()));
    }
    newParent->insertChild(row < 0 ? newParent->childCount() : row, std::move(taken));
    return true;
}

} // namespace modua
