#pragma once

#include <QJsonArray>
#include <QList>
#include <QString>

#include "modua/model/project_node.h"
#include "modua/modua_export.h"

namespace modua {

/**
 * 连接树剪贴板
 *
 * 复制的子树以 JSON 保存，粘贴时重新构建节点并重命名，
 * 设备分配新 id，地址冲突的标签分配新地址。
 */
class MODUA_API ProjectClipboard {
public:
    void copy(const QList<ProjectNode*>& nodes);

    /**
     * 复制后把节点从树中移除（节点被销毁）
     */
    void cut(const QList<ProjectNode*>& nodes);

    bool isEmpty() const { return m_items.isEmpty(); }
    void clear() { m_items = QJsonArray(); }
    const QJsonArray& payload() const { return m_items; }

    /** 剪贴内容的节点类型（混合时取第一个） */
    bool payloadKind(ProjectNode::Kind& kind) const;

    /**
     * 计算粘贴到 target 时的父节点；不允许时返回 nullptr
     * Group/Tag -> Device/Group，Device -> Channel，Channel -> Root，同类型 -> 同级
     */
    ProjectNode* resolveParent(ProjectNode* target) const;

    /**
     * 粘贴；返回新建的顶层节点，失败时为空并设置 error
     */
    QList<ProjectNode*> paste(ProjectNode* target, QString& error);

    /**
     * 拖放移动：遵循同样的父子规则，不能移入自身的子树
     */
    static bool moveNode(ProjectNode* node, ProjectNode* newParent, int row, QString& error);

private:
    ProjectNode* insertCopy(ProjectNode* parent, const QJsonObject& item, QString& error);

    QJsonArray m_items;
};

} // namespace modua
