#include <gtest/gtest.h>
#include <QTemporaryDir>

#include "modua/model/tag_csv.h"

using namespace modua;
using Kind = ProjectNode::Kind;

namespace {

ProjectNode* addTag(ProjectNode* parent, const QString& name, const QString& type, const QString& address,
                    const QJsonObject& scaling = QJsonObject()) {
    QJsonObject cfg{{"general", QJsonObject{{"name", name}, {"data_type", type}, {"address", address},
                                            {"access", "Read/Write"}, {"scan_rate", 100},
                                            {"description", "d, \"q\""}}}};
    if (!scaling.isEmpty()) cfg["scaling"] = scaling;
    return parent->addChild(std::make_unique<ProjectNode>(Kind::Tag, name, cfg));
}

QStringList dataLines(const QByteArray& csv) {
    QStringList lines = QString::fromUtf8(csv.mid(3)).split("\r\n", Qt::SkipEmptyParts);
    lines.removeFirst();
    return lines;
}

} // namespace

class TagCsvTest : public ::testing::Test {
protected:
    void SetUp() override {
        ProjectNode* group = device.addChild(std::make_unique<ProjectNode>(
            Kind::Group, "Pumps", QJsonObject{{"general", QJsonObject{{"name", "Pumps"}}}}));
        addTag(&device, "Arr", "Word(Array)", "400010 [4]");
        addTag(group, "Flow", "Float", "400002",
               QJsonObject{{"type", "Linear"}, {"raw_low", 0}, {"raw_high", 4095}, {"scaled_low", 0},
                           {"scaled_high", 100}, {"scaled_type", "Float"}, {"units", "m3/h"}});
        addTag(&device, "Temp", "Word", "400000");
        addTag(&device, "Run", "Boolean", "000005");
    }

    ProjectNode device{Kind::Device, "Dev1"};
};

TEST(CsvTest, EscapeAndParse) {
    EXPECT_EQ(csvEscape("plain"), "plain");
    EXPECT_EQ(csvEscape("a,b"), "\"a,b\"");
    EXPECT_EQ(csvEscape("say \"hi\""), "\"say \"\"hi\"\"\"");

    const QList<QStringList> rows = parseCsv("a,\"b,c\",\"d\"\"e\"\r\n\r\nx,,\"multi\nline\"\n");
    ASSERT_EQ(rows.size(), 2);
    EXPECT_EQ(rows[0], (QStringList{"a", "b,c", "d\"e"}));
    EXPECT_EQ(rows[1], (QStringList{"x", "", "multi\nline"}));
}

TEST_F(TagCsvTest, ExportOrdersScalarsBeforeArrays) {
    const QByteArray csv = exportTagsCsv(device);
    ASSERT_TRUE(csv.startsWith("\xEF\xBB\xBF"));
    EXPECT_TRUE(QString::fromUtf8(csv.mid(3)).startsWith(tagCsvColumns().join(',')));
    EXPECT_EQ(tagCsvColumns().size(), 17);

    const QStringList lines = dataLines(csv);
    ASSERT_EQ(lines.size(), 4);
    EXPECT_TRUE(lines[0].startsWith("Run,5,Boolean,1,R/W,100"));
    EXPECT_TRUE(lines[1].startsWith("Temp,400000,Word,1,R/W,100,,"));
    EXPECT_TRUE(lines[2].startsWith("Pumps.Flow,400002,Float,1,R/W,100,Linear,0,4095,0,100,Float"));
    EXPECT_TRUE(lines[2].contains("m3/h"));
    EXPECT_TRUE(lines[3].startsWith("Arr,400010 [4],Word Array"));
    EXPECT_TRUE(lines[3].contains("\"d, \"\"q\"\"\""));
}

TEST_F(TagCsvTest, ImportRecreatesGroupsAndScaling) {
    const QByteArray csv = exportTagsCsv(device);

    ProjectNode target(Kind::Device, "Dev2");
    CsvImportReport report;
    QString error;
    ASSERT_TRUE(importTagsCsv(&target, csv, report, error)) << qPrintable(error);
    EXPECT_EQ(report.imported, 4);
    EXPECT_EQ(report.groupsCreated, 1);
    EXPECT_TRUE(report.errors.isEmpty());

    ProjectNode* group = target.findChild("Pumps", Kind::Group);
    ASSERT_NE(group, nullptr);
    ProjectNode* flow = group->findChild("Flow", Kind::Tag);
    ASSERT_NE(flow, nullptr);
    const QJsonObject scaling = flow->config().value("scaling").toObject();
    EXPECT_EQ(scaling.value("type").toString(), "Linear");
    EXPECT_DOUBLE_EQ(scaling.value("raw_high").toDouble(), 4095.0);
    EXPECT_EQ(scaling.value("units").toString(), "m3/h");

    ProjectNode* run = target.findChild("Run", Kind::Tag);
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->general().value("address").toString(), "000005");
    EXPECT_EQ(run->general().value("access").toString(), "Read/Write");

    ProjectNode* arr = target.findChild("Arr", Kind::Tag);
    ASSERT_NE(arr, nullptr);
    EXPECT_EQ(arr->general().value("data_type").toString(), "Word(Array)");
    EXPECT_EQ(arr->general().value("address").toString(), "400010 [4]");
}

TEST_F(TagCsvTest, ImportOverwritesExistingAndReportsBadRows) {
    const QByteArray csv =
        "Tag Name,Address,Data Type,Client Access\n"
        "Temp,400020,DWord,RO\n"
        "Bad,4000x1,Word,R/W\n"
        "Odd,400030,Quaternion,R/W\n"
        ",400040,Word,R/W\n"
        "NoAddr,,Word,R/W\n";
    CsvImportReport report;
    QString error;
    ASSERT_TRUE(importTagsCsv(&device, csv, report, error));
    EXPECT_EQ(report.imported, 1);
    EXPECT_EQ(report.errors.size(), 3);
    EXPECT_TRUE(report.errors[0].startsWith("row 3"));

    ProjectNode* temp = device.findChild("Temp", Kind::Tag);
    ASSERT_NE(temp, nullptr);
    EXPECT_EQ(temp->general().value("address").toString(), "400020");
    EXPECT_EQ(temp->general().value("data_type").toString(), "DWord");
    EXPECT_EQ(temp->general().value("access").toString(), "Read Only");
}

TEST_F(TagCsvTest, ImportRejectsTypeAreaMismatch) {
    const QByteArray csv =
        "Tag Name,Address,Data Type,Client Access\n"
        "Valve,400001,Boolean,R/W\n"
        "Speed,000001,Word,R/W\n"
        "Alarm,100003,Boolean,RO\n"
        "Level,300004,Float,RO\n";
    CsvImportReport report;
    QString error;
    ASSERT_TRUE(importTagsCsv(&device, csv, report, error)) << qPrintable(error);
    EXPECT_EQ(report.imported, 2);
    ASSERT_EQ(report.errors.size(), 2);
    EXPECT_TRUE(report.errors[0].startsWith("row 2"));
    EXPECT_TRUE(report.errors[0].contains("coil or discrete input"));
    EXPECT_TRUE(report.errors[1].startsWith("row 3"));
    EXPECT_TRUE(report.errors[1].contains("register"));
    EXPECT_EQ(device.findChild("Valve", Kind::Tag), nullptr);
    EXPECT_EQ(device.findChild("Speed", Kind::Tag), nullptr);
    EXPECT_NE(device.findChild("Alarm", Kind::Tag), nullptr);
}

TEST_F(TagCsvTest, ImportRejectsBadInput) {
    CsvImportReport report;
    QString error;
    EXPECT_FALSE(importTagsCsv(&device, "Name,Address\nx,400001\n", report, error));
    EXPECT_TRUE(error.contains("Tag Name"));
    EXPECT_FALSE(importTagsCsv(&device, "", report, error));

    ProjectNode group(Kind::Group, "G");
    EXPECT_FALSE(importTagsCsv(&group, "Tag Name\nA\n", report, error));
}

TEST_F(TagCsvTest, FileRoundTrip) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    const QString path = tmpDir.filePath("tags.csv");
    QString error;
    ASSERT_TRUE(exportTagsCsvFile(device, path, error)) << qPrintable(error);

    ProjectNode target(Kind::Device, "Dev2");
    CsvImportReport report;
    ASSERT_TRUE(importTagsCsvFile(&target, path, report, error)) << qPrintable(error);
    EXPECT_EQ(report.imported, 4);

    EXPECT_FALSE(importTagsCsvFile(&target, tmpDir.filePath("missing.csv"), report, error));
}
