#include <gtest/gtest.h>
#include <QJsonArray>
#include <QTemporaryDir>

#include "modua/model/project_clipboard.h"
#include "modua/model/project_node.h"
#include "modua/model/project_serializer.h"

using namespace modua;
using Kind = ProjectNode::Kind;

namespace {

QJsonObject tagConfig(const QString& name, const QString& type, const QString& address,
                      const QString& access = "Read/Write") {
    return QJsonObject{{"general", QJsonObject{{"name", name}, {"data_type", type}, {"address", address},
                                               {"access", access}, {"scan_rate", 100}}}};
}

ProjectNode* addChannel(ProjectNode& root, const QString& name) {
    const QJsonObject cfg{{"general", QJsonObject{{"channel_name", name}}},
                          {"driver", QJsonObject{{"type", "Modbus TCP/IP Ethernet"},
                                                 {"params", QJsonObject{{"ip", "127.0.0.1"}, {"port", 502}}}}},
                          {"communication", QJsonObject()}};
    return root.addChild(std::make_unique<ProjectNode>(Kind::Channel, name, cfg));
}

ProjectNode* addDevice(ProjectNode* channel, const QString& name, int id) {
    const QJsonObject cfg{{"general", QJsonObject{{"name", name}, {"device_id", id}}}};
    return channel->addChild(std::make_unique<ProjectNode>(Kind::Device, name, cfg));
}

ProjectNode* addTag(ProjectNode* parent, const QString& name, const QString& type, const QString& address) {
    return parent->addChild(std::make_unique<ProjectNode>(Kind::Tag, name, tagConfig(name, type, address)));
}

ProjectNode* addGroup(ProjectNode* parent, const QString& name) {
    return parent->addChild(std::make_unique<ProjectNode>(
        Kind::Group, name, QJsonObject{{"general", QJsonObject{{"name", name}}}}));
}

} // namespace

class ProjectModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel = addChannel(root, "Ch1");
        device = addDevice(channel, "Dev1", 1);
        group = addGroup(device, "Pumps");
        temp = addTag(device, "Temp", "Word", "400000");
        level = addTag(group, "Level", "Float", "400002");
    }

    ProjectNode root{Kind::Root};
    ProjectNode* channel = nullptr;
    ProjectNode* device = nullptr;
    ProjectNode* group = nullptr;
    ProjectNode* temp = nullptr;
    ProjectNode* level = nullptr;
};

TEST_F(ProjectModelTest, NameIsMirroredIntoGeneral) {
    EXPECT_EQ(channel->general().value("channel_name").toString(), "Ch1");
    temp->setName("Temperature");
    EXPECT_EQ(temp->general().value("name").toString(), "Temperature");

    QJsonObject cfg = temp->config();
    QJsonObject general = cfg["general"].toObject();
    general["name"] = "T2";
    cfg["general"] = general;
    temp->setConfig(cfg);
    EXPECT_EQ(temp->name(), "T2");
}

TEST_F(ProjectModelTest, PathsAndAncestors) {
    EXPECT_EQ(level->path(), "Ch1.Dev1.Pumps.Level");
    EXPECT_EQ(level->ancestor(Kind::Device), device);
    EXPECT_EQ(level->ancestor(Kind::Channel), channel);
    EXPECT_EQ(channel->ancestor(Kind::Device), nullptr);
    EXPECT_EQ(configIdFor(device), "Ch1_Dev1");
    EXPECT_EQ(collectTags(device).size(), 2);
    EXPECT_EQ(temp->row(), 1);
}

TEST_F(ProjectModelTest, ContainmentRules) {
    EXPECT_TRUE(ProjectNode::canContain(Kind::Root, Kind::Channel));
    EXPECT_TRUE(ProjectNode::canContain(Kind::Group, Kind::Group));
    EXPECT_TRUE(ProjectNode::canContain(Kind::Device, Kind::Tag));
    EXPECT_FALSE(ProjectNode::canContain(Kind::Channel, Kind::Tag));
    EXPECT_FALSE(ProjectNode::canContain(Kind::Tag, Kind::Tag));
    EXPECT_FALSE(ProjectNode::canContain(Kind::Root, Kind::Device));

    Kind kind;
    EXPECT_TRUE(ProjectNode::parseKind("  DEVICE ", kind));
    EXPECT_EQ(kind, Kind::Device);
    EXPECT_FALSE(ProjectNode::parseKind("folder", kind));
}

TEST_F(ProjectModelTest, TagMetadataFromAddress) {
    ProjectNode* arr = addTag(device, "Arr", "Word(Array)", "400010 [5]");
    const TagMetadata meta = tagMetadata(*arr);
    EXPECT_EQ(meta.addrnum, 400010);
    EXPECT_TRUE(meta.isArray);
    EXPECT_EQ(meta.arraySize, 5);

    const TagMetadata scalar = tagMetadata(*temp);
    EXPECT_FALSE(scalar.isArray);
    EXPECT_EQ(scalar.arraySize, 1);
}

TEST_F(ProjectModelTest, NextTagAddressFollowsLargestEnd) {
    EXPECT_EQ(nextTagAddress(device, '4'), "400001");
    EXPECT_EQ(nextTagAddress(group, '4'), "400004");
    EXPECT_EQ(nextTagAddress(device, '0'), "000000");

    addTag(device, "Arr", "DWord(Array)", "400010 [5]");
    EXPECT_EQ(nextTagAddress(device, '4'), "400020");
}

TEST_F(ProjectModelTest, NextDeviceIdIsMaxPlusOne) {
    addDevice(channel, "Dev7", 7);
    EXPECT_EQ(nextDeviceId(channel), 8);
    EXPECT_EQ(nextDeviceId(addChannel(root, "Empty")), 1);
}

TEST_F(ProjectModelTest, UniqueNames) {
    EXPECT_EQ(uniqueName(device, "Fresh", Kind::Tag), "Fresh");
    EXPECT_EQ(uniqueName(device, "Temp", Kind::Tag), "Temp1");
    EXPECT_EQ(uniqueName(device, "Temp_Copy_Copy2", Kind::Tag), "Temp1");
    addTag(device, "Temp1", "Word", "400005");
    EXPECT_EQ(uniqueName(device, "Temp", Kind::Tag), "Temp2");

    addTag(device, "Tag3", "Word", "400006");
    EXPECT_EQ(uniqueName(device, "Tag3", Kind::Tag), "Tag4");
    EXPECT_EQ(uniqueName(device, "Tag9", Kind::Tag), "Tag4");
    // 其他类型的同名节点不冲突
    EXPECT_EQ(uniqueName(device, "Pumps", Kind::Tag), "Pumps");
}

TEST_F(ProjectModelTest, CloneCopiesSubtree) {
    auto copy = device->clone();
    EXPECT_EQ(copy->parent(), nullptr);
    EXPECT_EQ(copy->childCount(), 2);
    EXPECT_EQ(collectTags(copy.get()).size(), 2);
}

TEST_F(ProjectModelTest, SerializerRoundTripThroughFile) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    const QString path = tmpDir.filePath("plant.mua");

    QJsonObject tagCfg = level->config();
    tagCfg["scaling"] = QJsonObject{{"type", "Linear"}, {"raw_low", 0}, {"raw_high", 4095}};
    level->setConfig(tagCfg);

    QString error;
    const QJsonObject opcua{{"server_name", "Plant"}};
    ASSERT_TRUE(ProjectSerializer::saveProject(root, opcua, path, error)) << qPrintable(error);

    ProjectNode loaded(Kind::Root);
    QJsonObject loadedOpcUa;
    ASSERT_TRUE(ProjectSerializer::loadProject(path, loaded, loadedOpcUa, error)) << qPrintable(error);
    EXPECT_EQ(loadedOpcUa.value("server_name").toString(), "Plant");
    ASSERT_EQ(loaded.childCount(), 1);

    ProjectNode* dev = loaded.child(0)->child(0);
    ASSERT_NE(dev, nullptr);
    EXPECT_EQ(dev->general().value("device_id").toInt(), 1);
    EXPECT_EQ(dev->config().value("encoding").toObject().value("word_order").toInt(), 1);

    QList<ProjectNode*> tags = collectTags(dev);
    ASSERT_EQ(tags.size(), 2);
    EXPECT_EQ(tags[0]->path(), "Ch1.Dev1.Pumps.Level");
    EXPECT_EQ(tags[0]->config().value("scaling").toObject().value("type").toString(), "Linear");
    // 未启用缩放的标签不写 scaling 节
    EXPECT_FALSE(ProjectSerializer::nodeToJson(*tags[1]).contains("scaling"));
}

TEST(ProjectSerializerTest, NormalizesLegacyDriver) {
    QString error;
    auto channel = ProjectSerializer::nodeFromJson(
        QJsonObject{{"type", "Channel"}, {"text", "Old"}, {"driver", "Modbus RTU Serial"}}, error);
    ASSERT_TRUE(channel != nullptr) << qPrintable(error);
    EXPECT_EQ(channel->name(), "Old");
    const QJsonObject driver = channel->config().value("driver").toObject();
    EXPECT_EQ(driver.value("type").toString(), "Modbus RTU Serial");
    EXPECT_TRUE(driver.value("params").isObject());

    auto nested = ProjectSerializer::nodeFromJson(
        QJsonObject{{"type", "Channel"},
                    {"text", "N"},
                    {"driver", QJsonObject{{"type", QJsonObject{{"type", "Modbus RTU over TCP"},
                                                                {"params", QJsonObject{{"port", 4001}}}}}}}},
        error);
    ASSERT_TRUE(nested != nullptr);
    const QJsonObject d2 = nested->config().value("driver").toObject();
    EXPECT_EQ(d2.value("type").toString(), "Modbus RTU over TCP");
    EXPECT_EQ(d2.value("params").toObject().value("port").toInt(), 4001);
}

TEST(ProjectSerializerTest, RejectsInvalidStructure) {
    QString error;
    EXPECT_TRUE(ProjectSerializer::nodeFromJson(QJsonObject{{"type", "Folder"}}, error) == nullptr);
    EXPECT_TRUE(error.contains("Folder"));

    const QJsonObject badNesting{{"type", "Channel"},
                                 {"text", "C"},
                                 {"children", QJsonArray{QJsonObject{{"type", "Tag"}, {"text", "T"}}}}};
    EXPECT_TRUE(ProjectSerializer::nodeFromJson(badNesting, error) == nullptr);
    EXPECT_TRUE(error.contains("cannot contain"));

    ProjectNode root(Kind::Root);
    addChannel(root, "Keep");
    QJsonObject opcua;
    EXPECT_FALSE(ProjectSerializer::projectFromJson(QJsonObject{{"type", "Project"}}, root, opcua, error));
    const QJsonObject deviceAtTop{{"channels", QJsonArray{QJsonObject{{"type", "Device"}, {"text", "D"}}}}};
    EXPECT_FALSE(ProjectSerializer::projectFromJson(deviceAtTop, root, opcua, error));
    // 失败时不修改原有内容
    ASSERT_EQ(root.childCount(), 1);
    EXPECT_EQ(root.child(0)->name(), "Keep");
}

TEST_F(ProjectModelTest, PasteTagRenamesAndReaddresses) {
    ProjectClipboard clipboard;
    clipboard.copy({temp});
    QString error;
    const QList<ProjectNode*> pasted = clipboard.paste(temp, error);
    ASSERT_EQ(pasted.size(), 1) << qPrintable(error);
    EXPECT_EQ(pasted[0]->parent(), device);
    EXPECT_EQ(pasted[0]->name(), "Temp1");
    EXPECT_EQ(pasted[0]->general().value("address").toString(), "400001");
}

TEST_F(ProjectModelTest, PasteTagKeepsFreeAddress) {
    ProjectClipboard clipboard;
    clipboard.copy({level});
    QString error;
    const QList<ProjectNode*> pasted = clipboard.paste(device, error);
    ASSERT_EQ(pasted.size(), 1);
    EXPECT_EQ(pasted[0]->name(), "Level");
    EXPECT_EQ(pasted[0]->general().value("address").toString(), "400002");
}

TEST_F(ProjectModelTest, PasteDeviceAssignsNewId) {
    ProjectClipboard clipboard;
    clipboard.copy({device});
    QString error;
    const QList<ProjectNode*> pasted = clipboard.paste(channel, error);
    ASSERT_EQ(pasted.size(), 1);
    EXPECT_EQ(pasted[0]->name(), "Dev2");
    EXPECT_EQ(pasted[0]->general().value("device_id").toInt(), 2);
    EXPECT_EQ(collectTags(pasted[0]).size(), 2);
}

TEST_F(ProjectModelTest, PasteDeviceOntoGroupExtractsTags) {
    ProjectClipboard clipboard;
    clipboard.copy({device});
    QString error;
    const QList<ProjectNode*> pasted = clipboard.paste(group, error);
    ASSERT_EQ(pasted.size(), 2);
    for (ProjectNode* n : pasted) {
        EXPECT_EQ(n->kind(), Kind::Tag);
        EXPECT_EQ(n->parent(), group);
    }
}

TEST_F(ProjectModelTest, PasteRejectsWrongTarget) {
    ProjectClipboard clipboard;
    QString error;
    EXPECT_TRUE(clipboard.paste(device, error).isEmpty());
    EXPECT_EQ(error, "clipboard is empty");

    clipboard.copy({channel});
    EXPECT_TRUE(clipboard.paste(temp, error).isEmpty());
    EXPECT_TRUE(error.contains("cannot paste"));
    EXPECT_EQ(clipboard.resolveParent(channel), &root);
}

TEST_F(ProjectModelTest, CutRemovesNodes) {
    ProjectClipboard clipboard;
    clipboard.cut({temp});
    EXPECT_EQ(device->childCount(), 1);
    Kind kind;
    ASSERT_TRUE(clipboard.payloadKind(kind));
    EXPECT_EQ(kind, Kind::Tag);

    QString error;
    const QList<ProjectNode*> pasted = clipboard.paste(group, error);
    ASSERT_EQ(pasted.size(), 1);
    EXPECT_EQ(pasted[0]->name(), "Temp");
}

TEST_F(ProjectModelTest, CutIgnoresNodesInsideCutAncestors) {
    ProjectClipboard clipboard;
    clipboard.cut({level, group, temp, group});
    EXPECT_EQ(device->childCount(), 0);

    QString error;
    ProjectNode* other = addDevice(channel, "Dev2", 2);
    const QList<ProjectNode*> pasted = clipboard.paste(other, error);
    ASSERT_EQ(pasted.size(), 2) << qPrintable(error);
    ProjectNode* pastedGroup = other->findChild("Pumps", Kind::Group);
    ASSERT_NE(pastedGroup, nullptr);
    EXPECT_NE(pastedGroup->findChild("Level", Kind::Tag), nullptr);
    EXPECT_NE(other->findChild("Temp", Kind::Tag), nullptr);
}

TEST_F(ProjectModelTest, MoveNodeRules) {
    QString error;
    ProjectNode* other = addDevice(channel, "Dev2", 2);
    addTag(other, "Level", "Word", "400000");

    ASSERT_TRUE(ProjectClipboard::moveNode(level, other, -1, error)) << qPrintable(error);
    EXPECT_EQ(level->parent(), other);
    EXPECT_EQ(level->name(), "Level1");
    // 地址保持不变
    EXPECT_EQ(level->general().value("address").toString(), "400002");

    ProjectNode* inner = addGroup(group, "Inner");
    EXPECT_FALSE(ProjectClipboard::moveNode(group, inner, 0, error));
    EXPECT_TRUE(error.contains("own subtree"));
    EXPECT_FALSE(ProjectClipboard::moveNode(channel, device, 0, error));

    // 同级内移动
    ASSERT_TRUE(ProjectClipboard::moveNode(temp, device, 0, error));
    EXPECT_EQ(device->child(0), temp);
}
