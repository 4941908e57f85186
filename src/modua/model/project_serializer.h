#pragma once

#include <QJsonObject>
#include <QString>
#include <memory>

#include "modua/model/project_node.h"
#include "modua/modua_export.h"

namespace modua {

/**
 * 工程文件读写
 *
 * 格式：{"type":"Project","channels":[...],"opcua":{...}}
 * 各节点带 type 与 text，子节点放在 children 中。
 */
class MODUA_API ProjectSerializer {
public:
    static QJsonObject nodeToJson(const ProjectNode& node);

    /**
     * 解析单个节点（含子树）；未知类型或结构错误时返回 nullptr
     */
    static std::unique_ptr<ProjectNode> nodeFromJson(const QJsonObject& obj, QString& error);

    static QJsonObject projectToJson(const ProjectNode& root, const QJsonObject& opcua);

    /**
     * 用 JSON 内容替换 root 的子节点
     */
    static bool projectFromJson(const QJsonObject& doc, ProjectNode& root, QJsonObject& opcua,
                                QString& error);

    static bool saveProject(const ProjectNode& root, const QJsonObject& opcua,
                            const QString& path, QString& error);
    static bool loadProject(const QString& path, ProjectNode& root, QJsonObject& opcua,
                            QString& error);

    /** 设备缺省的编码设置：byte 1, word 1, dword 1, bit 0, decimals 0 */
    static QJsonObject defaultEncoding();
};

} // namespace modua
