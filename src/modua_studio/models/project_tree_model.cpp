#include "project_tree_model.h"

#include <QDataStream>
#include <QIODevice>
#include <QMimeData>

#include "modua/model/project_clipboard.h"
#include "ui/app_style.h"

using modua::ProjectNode;

namespace {

bool isInSubtree(const ProjectNode *node, const ProjectNode *ancestor)
{
    for (const ProjectNode *n = node; n; n = n->parent()) {
        if (n == ancestor) return true;
    }
    return false;
}

QStringList decodePaths(const QMimeData *data)
{
    QStringList paths;
    if (!data || !data->hasFormat(ProjectTreeModel::kMimeType)) return paths;
    QByteArray encoded = data->data(ProjectTreeModel::kMimeType);
    QDataStream stream(&encoded, QIODevice::ReadOnly);
    stream >> paths;
    return paths;
}

} // namespace

ProjectTreeModel::ProjectTreeModel(QObject *parent)
    : QAbstractItemModel(parent)
    , m_root(std::make_unique<ProjectNode>(ProjectNode::Kind::Root, "Project"))
{
}

ProjectTreeModel::~ProjectTreeModel() = default;

ProjectNode *ProjectTreeModel::nodeFromIndex(const QModelIndex &index) const
{
    if (!index.isValid()) return m_root.get();
    return static_cast<ProjectNode *>(index.internalPointer());
}

QModelIndex ProjectTreeModel::indexForNode(const ProjectNode *node) const
{
    if (!node || node == m_root.get() || !node->parent()) return QModelIndex();
    return createIndex(node->row(), 0, const_cast<ProjectNode *>(node));
}

QModelIndex ProjectTreeModel::index(int row, int column, const QModelIndex &parent) const
{
    if (column != 0) return QModelIndex();
    ProjectNode *parentNode = nodeFromIndex(parent);
    ProjectNode *child = parentNode ? parentNode->child(row) : nullptr;
    return child ? createIndex(row, 0, child) : QModelIndex();
}

QModelIndex ProjectTreeModel::parent(const QModelIndex &child) const
{
    if (!child.isValid()) return QModelIndex();
    return indexForNode(nodeFromIndex(child)->parent());
}

int ProjectTreeModel::rowCount(const QModelIndex &parent) const
{
    if (parent.column() > 0) return 0;
    const ProjectNode *node = nodeFromIndex(parent);
    return node ? node->childCount() : 0;
}

int ProjectTreeModel::columnCount(const QModelIndex &) const
{
    return 1;
}

QVariant ProjectTreeModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid()) return QVariant();
    const ProjectNode *node = nodeFromIndex(index);

    switch (role) {
    case Qt::DisplayRole:
    case Qt::EditRole:
        return node->name();
    case Qt::DecorationRole:
        return AppStyle::nodeIcon(node->kind());
    case Qt::ToolTipRole: {
        const QString description = node->general().value("description").toString();
        if (node->kind() == ProjectNode::Kind::Tag) {
            return QString("%1\n%2 @ %3").arg(node->path(),
                                              node->general().value("data_type").toString(),
                                              node->general().value("address").toString());
        }
        return description.isEmpty() ? node->path() : node->path() + "\n" + description;
    }
    default:
        return QVariant();
    }
}

Qt::ItemFlags ProjectTreeModel::flags(const QModelIndex &index) const
{
    if (!index.isValid()) return Qt::ItemIsDropEnabled;
    Qt::ItemFlags f = Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsDragEnabled;
    if (nodeFromIndex(index)->kind() != ProjectNode::Kind::Tag) f |= Qt::ItemIsDropEnabled;
    return f;
}

Qt::DropActions ProjectTreeModel::supportedDragActions() const
{
    return Qt::MoveAction;
}

Qt::DropActions ProjectTreeModel::supportedDropActions() const
{
    return Qt::MoveAction;
}

QStringList ProjectTreeModel::mimeTypes() const
{
    return {kMimeType};
}

QMimeData *ProjectTreeModel::mimeData(const QModelIndexList &indexes) const
{
    QStringList paths;
    for (const QModelIndex &idx : indexes) {
        if (idx.isValid() && idx.column() == 0) paths << nodeFromIndex(idx)->path();
    }
    QByteArray encoded;
    QDataStream stream(&encoded, QIODevice::WriteOnly);
    stream << paths;

    auto *mime = new QMimeData;
    mime->setData(kMimeType, encoded);
    return mime;
}

ProjectNode *ProjectTreeModel::findByPath(const QString &path) const
{
    if (path.isEmpty()) return nullptr;
    ProjectNode *node = m_root.get();
    for (const QString &name : path.split('.')) {
        ProjectNode *next = nullptr;
        for (int i = 0; i < node->childCount(); ++i) {
            if (node->child(i)->name() == name) {
                next = node->child(i);
                break;
            }
        }
        if (!next) return nullptr;
        node = next;
    }
    return node;
}

bool ProjectTreeModel::canDropMimeData(const QMimeData *data, Qt::DropAction action,
                                       int, int, const QModelIndex &parent) const
{
    if (action != Qt::MoveAction) return false;
    const QStringList paths = decodePaths(data);
    if (paths.isEmpty()) return false;

    const ProjectNode *target = nodeFromIndex(parent);
    for (const QString &path : paths) {
        const ProjectNode *node = findByPath(path);
        if (!node) return false;
        if (!ProjectNode::canContain(target->kind(), node->kind())) return false;
        if (isInSubtree(target, node)) return false;
    }
    return true;
}

bool ProjectTreeModel::dropMimeData(const QMimeData *data, Qt::DropAction action,
                                    int row, int column, const QModelIndex &parent)
{
    if (!canDropMimeData(data, action, row, column, parent)) return false;

    ProjectNode *target = nodeFromIndex(parent);
    for (const QString &path : decodePaths(data)) {
        ProjectNode *node = findByPath(path);
        if (!node) continue;
        QString error;
        if (!moveNode(node, target, row, error)) {
            emit moveFailed(error);
            continue;
        }
        if (row >= 0) row = node->row() + 1;
    }
    // 移动已在模型内完成，返回 false 避免视图再删除源行
    return false;
}

bool ProjectTreeModel::moveNode(ProjectNode *node, ProjectNode *newParent, int row, QString &error)
{
    if (!node || !newParent || !node->parent()) {
        error = tr("invalid move");
        return false;
    }
    if (!ProjectNode::canContain(newParent->kind(), node->kind()) || isInSubtree(newParent, node)) {
        error = tr("cannot move %1 '%2' into %3 '%4'")
                    .arg(node->kindName(), node->name(), newParent->kindName(), newParent->name());
        return false;
    }

    ProjectNode *oldParent = node->parent();
    const int oldRow = node->row();
    const int destRow = row < 0 ? newParent->childCount() : qMin(row, newParent->childCount());

    // 原位置不变
    if (oldParent == newParent && (destRow == oldRow || destRow == oldRow + 1)) return true;

    beginMoveRows(indexForNode(oldParent), oldRow, oldRow, indexForNode(newParent), destRow);
    const bool ok = modua::ProjectClipboard::moveNode(node, newParent, destRow, error);
    endMoveRows();
    if (!ok) return false;

    const QModelIndex idx = indexForNode(node);
    emit dataChanged(idx, idx);
    return true;
}

ProjectNode *ProjectTreeModel::addNode(ProjectNode *parent, std::unique_ptr<ProjectNode> node)
{
    if (!parent) parent = m_root.get();
    const int row = parent->childCount();
    beginInsertRows(indexForNode(parent), row, row);
    ProjectNode *added = parent->addChild(std::move(node));
    endInsertRows();
    return added;
}

void ProjectTreeModel::removeNode(ProjectNode *node)
{
    if (!node || !node->parent()) return;
    ProjectNode *parent = node->parent();
    const int row = node->row();
    beginRemoveRows(indexForNode(parent), row, row);
    parent->takeChild(row);
    endRemoveRows();
}

void ProjectTreeModel::nodeChanged(ProjectNode *node)
{
    const QModelIndex idx = indexForNode(node);
    if (idx.isValid()) emit dataChanged(idx, idx);
}

void ProjectTreeModel::resetWith(const std::function<void()> &change)
{
    beginResetModel();
    change();
    endResetModel();
}
