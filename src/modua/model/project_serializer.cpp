#include "project_serializer.h"

#include <QJsonArray>
#include <QJsonDocument>

#include "modua/utils/config_utils.h"
#include "modua/utils/file_utils.h"

namespace modua {

namespace {

const QStringList kChannelSections = {"general", "driver", "communication"};
const QStringList kDeviceSections = {"general", "timing", "data_access", "encoding", "block_sizes"};

void copySections(const QJsonObject& from, QJsonObject& to, const QStringList& sections)
{
    for (const QString& s : sections) {
        const QJsonValue v = from.value(s);
        if (v.isObject()) to.insert(s, v);
    }
}

QJsonObject normalizeDriver(const QJsonValue& raw)
{
    if (raw.isString()) {
        return QJsonObject{{"type", raw.toString()}, {"params", QJsonObject()}};
    }
    QJsonObject driver = raw.toObject();
    // 旧文件中 type 可能嵌套一层
    if (driver.value("type").isObject()) {
        const QJsonObject inner = driver.value("type").toObject();
        QJsonObject params = safeGetObject(inner, "params");
        if (params.isEmpty()) params = safeGetObject(driver, "params");
        return QJsonObject{{"type", safeGetString(inner, "type")}, {"params", params}};
    }
    if (!driver.value("params").isObject()) driver["params"] = QJsonObject();
    return driver;
}

} // namespace

QJsonObject ProjectSerializer::defaultEncoding()
{
    return QJsonObject{
        {"byte_order", 1},
        {"word_order", 1},
        {"dword_order", 1},
        {"bit_order", 0},
        {"treat_longs_as_decimals", 0},
    };
}

QJsonObject ProjectSerializer::nodeToJson(const ProjectNode& node)
{
    QJsonObject out;
    out["type"] = node.kindName();
    out["text"] = node.name();

    const QJsonObject& cfg = node.config();
    switch (node.kind()) {
    case ProjectNode::Kind::Channel:
        copySections(cfg, out, kChannelSections);
        break;
    case ProjectNode::Kind::Device:
        copySections(cfg, out, kDeviceSections);
        if (!out.contains("encoding")) out["encoding"] = defaultEncoding();
        break;
    case ProjectNode::Kind::Group:
        out["description"] = safeGetString(node.general(), "description");
        break;
    case ProjectNode::Kind::Tag: {
        out["general"] = node.general();
        const QJsonObject scaling = safeGetObject(cfg, "scaling");
        const QString type = safeGetString(scaling, "type", "None");
        if (!scaling.isEmpty() && type.compare("None", Qt::CaseInsensitive) != 0) {
            out["scaling"] = scaling;
        }
        return out; // 标签没有子节点
    }
    case ProjectNode::Kind::Root:
        break;
    }

    QJsonArray children;
    for (int i = 0; i < node.childCount(); ++i) {
        children.append(nodeToJson(*node.child(i)));
    }
    out["children"] = children;
    return out;
}

std::unique_ptr<ProjectNode> ProjectSerializer::nodeFromJson(const QJsonObject& obj, QString& error)
{
    ProjectNode::Kind kind;
    const QString typeName = safeGetString(obj, "type");
    if (!ProjectNode::parseKind(typeName, kind) || kind == ProjectNode::Kind::Root) {
        error = QString("unknown node type '%1'").arg(typeName);
        return nullptr;
    }

    QJsonObject general = safeGetObject(obj, "general");
    QString name = safeGetString(obj, "text", safeGetString(general, ProjectNode::nameKey(kind)));
    if (name.isEmpty()) name = safeGetString(obj, "name");

    QJsonObject config;
    switch (kind) {
    case ProjectNode::Kind::Channel:
        copySections(obj, config, kChannelSections);
        config["driver"] = normalizeDriver(obj.value("driver"));
        if (!config.contains("communication")) config["communication"] = QJsonObject();
        break;
    case ProjectNode::Kind::Device: {
        copySections(obj, config, kDeviceSections);
        QJsonObject encoding = defaultEncoding();
        const QJsonObject stored = safeGetObject(obj, "encoding");
        for (auto it = stored.begin(); it != stored.end(); ++it) encoding[it.key()] = it.value();
        config["encoding"] = encoding;
        break;
    }
    case ProjectNode::Kind::Group:
        general["description"] = safeGetString(obj, "description", safeGetString(general, "description"));
        config["general"] = general;
        break;
    case ProjectNode::Kind::Tag:
        config["general"] = general;
        if (obj.value("scaling").isObject()) config["scaling"] = obj.value("scaling");
        break;
    case ProjectNode::Kind::Root:
        break;
    }

    auto node = std::make_unique<ProjectNode>(kind, name, config);

    const QJsonArray children = obj.value("children").toArray();
    for (const QJsonValue& v : children) {
        std::unique_ptr<ProjectNode> child = nodeFromJson(v.toObject(), error);
        if (!child) {
            error = QString("%1 '%2': %3").arg(node->kindName(), name, error);
            return nullptr;
        }
        if (!ProjectNode::canContain(kind, child->kind())) {
            error = QString("%1 '%2' cannot contain %3 '%4'")
                        .arg(node->kindName(), name, child->kindName(), child->name());
            return nullptr;
        }
        node->addChild(std::move(child));
    }
    return node;
}

QJsonObject ProjectSerializer::projectToJson(const ProjectNode& root, const QJsonObject& opcua)
{
    QJsonArray channels;
    for (ProjectNode* ch : root.childrenOfKind(ProjectNode::Kind::Channel)) {
        channels.append(nodeToJson(*ch));
    }
    QJsonObject doc;
    doc["type"] = "Project";
    doc["channels"] = channels;
    doc["opcua"] = opcua;
    return doc;
}

bool ProjectSerializer::projectFromJson(const QJsonObject& doc, ProjectNode& root, QJsonObject& opcua,
                                        QString& error)
{
    if (!doc.value("channels").isArray()) {
        error = "project file has no 'channels' array";
        return false;
    }

    std::vector<std::unique_ptr<ProjectNode>> channels;
    for (const QJsonValue& v : doc.value("channels").toArray()) {
        std::unique_ptr<ProjectNode> ch = nodeFromJson(v.toObject(), error);
        if (!ch) return false;
        if (ch->kind() != ProjectNode::Kind::Channel) {
            error = QString("top-level node '%1' is not a channel").arg(ch->name());
            return false;
        }
        channels.push_back(std::move(ch));
    }

    // 全部解析成功后才替换
    root.clearChildren();
    for (auto& ch : channels) root.addChild(std::move(ch));
    opcua = safeGetObject(doc, "opcua");
    return true;
}

bool ProjectSerializer::saveProject(const ProjectNode& root, const QJsonObject& opcua,
                                    const QString& path, QString& error)
{
    const QJsonDocument doc(projectToJson(root, opcua));
    return atomicWrite(path, doc.toJson(QJsonDocument::Indented), error);
}

bool ProjectSerializer::loadProject(const QString& path, ProjectNode& root, QJsonObject& opcua,
                                    QString& error)
{
    QJsonObject doc;
    if (!readJsonObject(path, doc, error)) return false;
    return projectFromJson(doc, root, opcua, error);
}

} // namespace modua
