#include <gtest/gtest.h>

#include <QMimeData>

#include "models/project_tree_model.h"

using modua::ProjectNode;

namespace {

std::unique_ptr<ProjectNode> makeTag(const QString& name, const QString& address) {
    return std::make_unique<ProjectNode>(
        ProjectNode::Kind::Tag, name,
        QJsonObject{{"general", QJsonObject{{"name", name}, {"data_type", "Word"}, {"address", address},
                                            {"access", "Read/Write"}}}});
}

} // namespace

class ProjectTreeModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        ch1 = model.addNode(nullptr, std::make_unique<ProjectNode>(ProjectNode::Kind::Channel, "Ch1"));
        dev1 = model.addNode(ch1, std::make_unique<ProjectNode>(ProjectNode::Kind::Device, "Dev1"));
        dev2 = model.addNode(ch1, std::make_unique<ProjectNode>(ProjectNode::Kind::Device, "Dev2"));
        group = model.addNode(dev1, std::make_unique<ProjectNode>(ProjectNode::Kind::Group, "Pumps"));
        temp = model.addNode(dev1, makeTag("Temp", "400000"));
        flow = model.addNode(group, makeTag("Flow", "400001"));
    }

    QMimeData* mimeFor(const ProjectNode* node) const {
        return model.mimeData({model.indexForNode(node)});
    }

    ProjectTreeModel model;
    ProjectNode* ch1 = nullptr;
    ProjectNode* dev1 = nullptr;
    ProjectNode* dev2 = nullptr;
    ProjectNode* group = nullptr;
    ProjectNode* temp = nullptr;
    ProjectNode* flow = nullptr;
};

TEST_F(ProjectTreeModelTest, Structure) {
    EXPECT_EQ(model.root()->name(), "Project");
    EXPECT_EQ(model.rowCount(), 1);
    EXPECT_EQ(model.columnCount(), 1);

    const QModelIndex chIdx = model.index(0, 0);
    EXPECT_EQ(model.data(chIdx).toString(), "Ch1");
    EXPECT_EQ(model.rowCount(chIdx), 2);

    const QModelIndex devIdx = model.index(0, 0, chIdx);
    EXPECT_EQ(model.nodeFromIndex(devIdx), dev1);
    EXPECT_EQ(model.parent(devIdx), chIdx);
    EXPECT_FALSE(model.parent(chIdx).isValid());
    EXPECT_FALSE(model.index(0, 1, chIdx).isValid());

    EXPECT_EQ(model.findByPath("Ch1.Dev1.Pumps.Flow"), flow);
    EXPECT_EQ(model.findByPath("Ch1.Nope"), nullptr);
    EXPECT_EQ(model.findByPath(""), nullptr);

    EXPECT_TRUE(model.data(model.indexForNode(temp), Qt::ToolTipRole).toString().contains("Word @ 400000"));
}

TEST_F(ProjectTreeModelTest, TagsAreNotDropTargets) {
    EXPECT_FALSE(model.flags(model.indexForNode(temp)).testFlag(Qt::ItemIsDropEnabled));
    EXPECT_TRUE(model.flags(model.indexForNode(group)).testFlag(Qt::ItemIsDropEnabled));
    EXPECT_TRUE(model.flags(QModelIndex()).testFlag(Qt::ItemIsDropEnabled));
}

TEST_F(ProjectTreeModelTest, RemoveNode) {
    model.removeNode(group);
    EXPECT_EQ(dev1->childCount(), 1);
    EXPECT_EQ(model.findByPath("Ch1.Dev1.Pumps"), nullptr);
    // 根节点不可删除
    model.removeNode(model.root());
    EXPECT_EQ(model.rowCount(), 1);
}

TEST_F(ProjectTreeModelTest, CanDropFollowsContainmentRules) {
    std::unique_ptr<QMimeData> tagMime(mimeFor(temp));
    EXPECT_TRUE(model.canDropMimeData(tagMime.get(), Qt::MoveAction, -1, 0, model.indexForNode(group)));
    EXPECT_TRUE(model.canDropMimeData(tagMime.get(), Qt::MoveAction, -1, 0, model.indexForNode(dev2)));
    EXPECT_FALSE(model.canDropMimeData(tagMime.get(), Qt::MoveAction, -1, 0, model.indexForNode(ch1)));
    EXPECT_FALSE(model.canDropMimeData(tagMime.get(), Qt::CopyAction, -1, 0, model.indexForNode(group)));

    std::unique_ptr<QMimeData> groupMime(mimeFor(group));
    // 组不能放进自身
    EXPECT_FALSE(model.canDropMimeData(groupMime.get(), Qt::MoveAction, -1, 0, model.indexForNode(group)));

    QMimeData foreign;
    foreign.setText("Ch1.Dev1.Temp");
    EXPECT_FALSE(model.canDropMimeData(&foreign, Qt::MoveAction, -1, 0, model.indexForNode(group)));
}

TEST_F(ProjectTreeModelTest, DropMovesNodeInsideModel) {
    std::unique_ptr<QMimeData> mime(mimeFor(temp));
    // 移动在模型内完成，返回 false 以免视图删除源行
    EXPECT_FALSE(model.dropMimeData(mime.get(), Qt::MoveAction, -1, 0, model.indexForNode(dev2)));
    EXPECT_EQ(temp->parent(), dev2);
    EXPECT_EQ(temp->path(), "Ch1.Dev2.Temp");
    EXPECT_EQ(temp->general().value("address").toString(), "400000");
}

TEST_F(ProjectTreeModelTest, MoveRenamesOnConflict) {
    model.addNode(dev2, makeTag("Temp", "400005"));
    QString error;
    ASSERT_TRUE(model.moveNode(temp, dev2, -1, error)) << qPrintable(error);
    EXPECT_EQ(temp->name(), "Temp1");
    EXPECT_EQ(dev2->child(1), temp);
}

TEST_F(ProjectTreeModelTest, ReorderWithinParent) {
    QString error;
    // group 在第 0 行，temp 在第 1 行
    ASSERT_TRUE(model.moveNode(temp, dev1, 0, error));
    EXPECT_EQ(dev1->child(0), temp);
    EXPECT_EQ(dev1->child(1), group);

    // 原位置不变
    ASSERT_TRUE(model.moveNode(temp, dev1, 1, error));
    EXPECT_EQ(dev1->child(0), temp);
}

TEST_F(ProjectTreeModelTest, InvalidMoveReportsError) {
    QString error;
    EXPECT_FALSE(model.moveNode(dev1, group, -1, error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(model.moveNode(model.root(), ch1, -1, error));

    int failures = 0;
    QObject::connect(&model, &ProjectTreeModel::moveFailed, [&failures](const QString&) { ++failures; });
    // 设备不能放入组，canDropMimeData 先行拒绝
    std::unique_ptr<QMimeData> mime(mimeFor(dev1));
    EXPECT_FALSE(model.dropMimeData(mime.get(), Qt::MoveAction, -1, 0, model.indexForNode(group)));
    EXPECT_EQ(failures, 0);
    EXPECT_EQ(dev1->parent(), ch1);
}

TEST_F(ProjectTreeModelTest, ResetWithRebuildsView) {
    int resets = 0;
    QObject::connect(&model, &QAbstractItemModel::modelReset, [&resets]() { ++resets; });
    model.resetWith([this]() { model.root()->clearChildren(); });
    EXPECT_EQ(resets, 1);
    EXPECT_EQ(model.rowCount(), 0);
}
