#ifndef PROJECT_TREE_MODEL_H
#define PROJECT_TREE_MODEL_H

#include <QAbstractItemModel>
#include <functional>
#include <memory>

#include "modua/model/project_node.h"

/**
 * 连接树模型，单列显示节点名称与图标
 *
 * 拖放在模型内部完成（MIME 中携带节点路径），遵循 ProjectNode::canContain 规则。
 */
class ProjectTreeModel : public QAbstractItemModel
{
    Q_OBJECT

public:
    static constexpr const char *kMimeType = "application/x-modua-node-paths";

    explicit ProjectTreeModel(QObject *parent = nullptr);
    ~ProjectTreeModel() override;

    modua::ProjectNode *root() const { return m_root.get(); }

    QModelIndex index(int row, int column, const QModelIndex &parent = QModelIndex()) const override;
    QModelIndex parent(const QModelIndex &child) const override;
    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;

    Qt::DropActions supportedDragActions() const override;
    Qt::DropActions supportedDropActions() const override;
    QStringList mimeTypes() const override;
    QMimeData *mimeData(const QModelIndexList &indexes) const override;
    bool canDropMimeData(const QMimeData *data, Qt::DropAction action,
                         int row, int column, const QModelIndex &parent) const override;
    bool dropMimeData(const QMimeData *data, Qt::DropAction action,
                      int row, int column, const QModelIndex &parent) override;

    modua::ProjectNode *nodeFromIndex(const QModelIndex &index) const;
    QModelIndex indexForNode(const modua::ProjectNode *node) const;
    modua::ProjectNode *findByPath(const QString &path) const;

    modua::ProjectNode *addNode(modua::ProjectNode *parent, std::unique_ptr<modua::ProjectNode> node);
    void removeNode(modua::ProjectNode *node);
    /** 节点名称或配置修改后刷新显示 */
    void nodeChanged(modua::ProjectNode *node);

    /** 节点拖放移动，失败时设置 error */
    bool moveNode(modua::ProjectNode *node, modua::ProjectNode *newParent, int row, QString &error);

    /** 结构性批量修改（粘贴、剪切、导入、加载工程）后整体刷新 */
    void resetWith(const std::function<void()> &change);

signals:
    void moveFailed(const QString &error);

private:
    std::unique_ptr<modua::ProjectNode> m_root;
};

#endif // PROJECT_TREE_MODEL_H
