#pragma once

#include <QJsonObject>
#include <QList>
#include <QString>
#include <memory>
#include <vector>

#include "modua/modua_export.h"

namespace modua {

/**
 * 连接树节点：Root -> Channel -> Device -> Group* -> Tag
 *
 * 父节点拥有子节点。config 保存节点的分节配置，
 * 名称同时写入 config 的 general 节。
 */
class MODUA_API ProjectNode {
public:
    enum class Kind { Root, Channel, Device, Group, Tag };

    explicit ProjectNode(Kind kind, const QString& name = QString(),
                         const QJsonObject& config = QJsonObject());

    ProjectNode(const ProjectNode&) = delete;
    ProjectNode& operator=(const ProjectNode&) = delete;

    Kind kind() const { return m_kind; }
    QString kindName() const { return kindName(m_kind); }

    QString name() const { return m_name; }
    void setName(const QString& name);

    const QJsonObject& config() const { return m_config; }
    void setConfig(const QJsonObject& config);

    /** config.general 下的字段 */
    QJsonObject general() const;

    ProjectNode* parent() const { return m_parent; }
    int childCount() const { return static_cast<int>(m_children.size()); }
    ProjectNode* child(int index) const;
    int indexOf(const ProjectNode* child) const;
    int row() const;

    ProjectNode* addChild(std::unique_ptr<ProjectNode> child);
    ProjectNode* insertChild(int index, std::unique_ptr<ProjectNode> child);
    std::unique_ptr<ProjectNode> takeChild(int index);
    void clearChildren();

    ProjectNode* findChild(const QString& name, Kind kind) const;
    QList<ProjectNode*> childrenOfKind(Kind kind) const;

    /** 向上查找指定类型的祖先（含自身） */
    ProjectNode* ancestor(Kind kind) const;

    /** 根以下各级名称以 '.' 连接，如 Ch1.Dev1.Grp.Tag */
    QString path() const;

    std::unique_ptr<ProjectNode> clone() const;

    static QString kindName(Kind kind);
    static bool parseKind(const QString& name, Kind& kind);
    /** config.general 中保存名称的键：通道为 channel_name，其余为 name */
    static QString nameKey(Kind kind);
    static bool canContain(Kind parent, Kind child);

private:
    Kind m_kind;
    QString m_name;
    QJsonObject m_config;
    ProjectNode* m_parent = nullptr;
    std::vector<std::unique_ptr<ProjectNode>> m_children;
};

/**
 * 标签元数据，由地址和类型推导
 */
struct MODUA_API TagMetadata {
    int addrnum = -1;
    bool isArray = false;
    int arraySize = 1;
};

MODUA_API TagMetadata tagMetadata(const ProjectNode& tag);

/** 递归收集节点下的全部标签 */
MODUA_API QList<ProjectNode*> collectTags(ProjectNode* node);

/** 通道下设备 id 最大值 + 1，限制在 [1, 65535] */
MODUA_API int nextDeviceId(const ProjectNode* channel);

/**
 * 计算下一个可用地址：同前缀兄弟标签的最大结束地址 + 1
 * 数组按 array_size x 单元素寄存器数计算；无同前缀标签时为 prefix + 00000
 */
MODUA_API QString nextTagAddress(const ProjectNode* parent, QChar prefix);

/**
 * 生成同级唯一名称：去掉 _Copy/_CopyN 后缀，尾部数字视为计数器
 */
MODUA_API QString uniqueName(const ProjectNode* parent, const QString& base, ProjectNode::Kind kind);

/** 轮询线程的键："Channel_Device" */
MODUA_API QString configIdFor(const ProjectNode* device);

} // namespace modua
