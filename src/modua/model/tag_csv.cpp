#include "tag_csv.h"

#include <QHash>
#include <algorithm>

#include "modua/core/constants.h"
#include "modua/modbus/modbus_types.h"
#include "modua/modbus/scaling.h"
#include "modua/utils/config_utils.h"
#include "modua/utils/file_utils.h"
#include "modua/utils/validators.h"

namespace modua {

namespace {

const QByteArray kUtf8Bom("\xEF\xBB\xBF");

struct CsvRow {
    QString name;
    const ProjectNode* tag = nullptr;
    int addrnum = 0;
    bool isArray = false;
};

void walkTags(const ProjectNode* node, const QString& prefix, QList<CsvRow>& rows)
{
    for (int i = 0; i < node->childCount(); ++i) {
        const ProjectNode* child = node->child(i);
        const QString qualified = prefix.isEmpty() ? child->name()
                                                   : prefix + kGroupSeparator + child->name();
        if (child->kind() == ProjectNode::Kind::Tag) {
            const TagMetadata meta = tagMetadata(*child);
            rows.append({qualified, child, qMax(0, meta.addrnum), meta.isArray});
        } else {
            walkTags(child, qualified, rows);
        }
    }
}

QString stripLeadingZeros(const QString& address)
{
    const int bracket = address.indexOf(" [");
    QString head = bracket >= 0 ? address.left(bracket) : address;
    const QString tail = bracket >= 0 ? address.mid(bracket) : QString();

    int i = 0;
    while (i < head.size() && head.at(i) == QLatin1Char('0')) ++i;
    head = head.mid(i);
    if (head.isEmpty()) head = "0";
    return head + tail;
}

QString zeroFillAddress(const QString& address)
{
    const int bracket = address.indexOf('[');
    if (bracket >= 0) {
        const QString head = address.left(bracket).trimmed();
        return head.rightJustified(6, QLatin1Char('0')) + " " + address.mid(bracket).trimmed();
    }
    return address.rightJustified(6, QLatin1Char('0'));
}

QString numberText(const QJsonValue& v)
{
    if (v.isDouble()) return QString::number(v.toDouble());
    return v.toString();
}

QString cell(const QStringList& fields, const QHash<QString, int>& columns, const QString& name,
             const QString& fallback = QString())
{
    const int idx = columns.value(name, -1);
    if (idx < 0 || idx >= fields.size()) return fallback;
    const QString v = fields.at(idx).trimmed();
    return v.isEmpty() ? fallback : v;
}

ProjectNode* findOrCreateGroup(ProjectNode* parent, const QString& name, int& created)
{
    if (ProjectNode* g = parent->findChild(name, ProjectNode::Kind::Group)) return g;
    QJsonObject cfg;
    cfg["general"] = QJsonObject{{"name", name}, {"description", ""}};
    ++created;
    return parent->addChild(std::make_unique<ProjectNode>(ProjectNode::Kind::Group, name, cfg));
}

} // namespace

QStringList tagCsvColumns()
{
    return {"Tag Name", "Address", "Data Type", "Respect Data Type", "Client Access",
            "Scan Rate", "Scaling", "Raw Low", "Raw High", "Scaled Low", "Scaled High",
            "Scaled Data Type", "Clamp Low", "Clamp High", "Eng Units", "Description",
            "Negate Value"};
}

QString csvEscape(const QString& field)
{
    if (field.contains(',') || field.contains('"') || field.contains('\n') || field.contains('\r')) {
        QString quoted = field;
        quoted.replace("\"", "\"\"");
        return "\"" + quoted + "\"";
    }
    return field;
}

QList<QStringList> parseCsv(const QString& text)
{
    QList<QStringList> rows;
    QStringList fields;
    QString field;
    bool inQuotes = false;
    bool rowHasContent = false;

    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text.at(i + 1) == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }
        if (c == '"') {
            inQuotes = true;
            rowHasContent = true;
        } else if (c == ',') {
            fields.append(field);
            field.clear();
            rowHasContent = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && i + 1 < text.size() && text.at(i + 1) == '\n') ++i;
            if (rowHasContent || !field.isEmpty()) {
                fields.append(field);
                rows.append(fields);
            }
            fields.clear();
            field.clear();
            rowHasContent = false;
        } else {
            field += c;
            rowHasContent = true;
        }
    }
    if (rowHasContent || !field.isEmpty()) {
        fields.append(field);
        rows.append(fields);
    }
    return rows;
}

QByteArray exportTagsCsv(const ProjectNode& device)
{
    QList<CsvRow> rows;
    walkTags(&device, QString(), rows);

    // 标量在前、数组在后，各自按地址排序
    std::stable_sort(rows.begin(), rows.end(), [](const CsvRow& a, const CsvRow& b) {
        if (a.isArray != b.isArray) return !a.isArray;
        if (a.addrnum != b.addrnum) return a.addrnum < b.addrnum;
        return a.name < b.name;
    });

    QStringList lines;
    QStringList header;
    for (const QString& c : tagCsvColumns()) header << csvEscape(c);
    lines << header.join(',');

    for (const CsvRow& row : rows) {
        const QJsonObject general = row.tag->general();
        const QJsonObject scaling = safeGetObject(row.tag->config(), "scaling");
        const QString scalingType = safeGetString(scaling, "type", "None");
        const bool hasScaling = !scaling.isEmpty() && scalingType.compare("None", Qt::CaseInsensitive) != 0;

        QString access = safeGetString(general, "access", kAccessReadWrite);
        if (access == kAccessReadWrite) access = "R/W";
        else if (access == kAccessReadOnly) access = "RO";

        QString dataType = safeGetString(general, "data_type");
        dataType.replace("(Array)", " Array");

        const QString address = safeGetString(general, "address");

        auto sc = [&](const QString& key) {
            return hasScaling ? numberText(scaling.value(key)) : QString();
        };

        const QStringList fields = {
            row.name,
            address.isEmpty() ? QString() : stripLeadingZeros(address),
            dataType,
            "1",
            access,
            numberText(general.value("scan_rate")),
            hasScaling ? scalingType : QString(),
            sc("raw_low"),
            sc("raw_high"),
            sc("scaled_low"),
            sc("scaled_high"),
            sc("scaled_type"),
            sc("clamp_low"),
            sc("clamp_high"),
            sc("units"),
            safeGetString(general, "description"),
            sc("negate"),
        };
        QStringList escaped;
        for (const QString& f : fields) escaped << csvEscape(f);
        lines << escaped.join(',');
    }

    return kUtf8Bom + lines.join("\r\n").toUtf8() + "\r\n";
}

bool exportTagsCsvFile(const ProjectNode& device, const QString& path, QString& error)
{
    if (device.kind() != ProjectNode::Kind::Device) {
        error = "CSV export requires a device node";
        return false;
    }
    return atomicWrite(path, exportTagsCsv(device), error);
}

bool importTagsCsv(ProjectNode* device, const QByteArray& data, CsvImportReport& report, QString& error)
{
    if (!device || device->kind() != ProjectNode::Kind::Device) {
        error = "CSV import requires a device node";
        return false;
    }

    QByteArray content = data;
    if (content.startsWith(kUtf8Bom)) content = content.mid(kUtf8Bom.size());

    const QList<QStringList> rows = parseCsv(QString::fromUtf8(content));
    if (rows.isEmpty()) {
        error = "CSV file is empty";
        return false;
    }

    QHash<QString, int> columns;
    for (int i = 0; i < rows.first().size(); ++i) columns.insert(rows.first().at(i).trimmed(), i);
    if (!columns.contains("Tag Name")) {
        error = "CSV header has no 'Tag Name' column";
        return false;
    }

    for (int r = 1; r < rows.size(); ++r) {
        const QStringList& fields = rows.at(r);
        const int lineNo = r + 1;
        const QString fullName = cell(fields, columns, "Tag Name");
        if (fullName.isEmpty()) continue;

        QStringList parts = fullName.split(kGroupSeparator);
        const QString tagName = parts.takeLast().trimmed();
        if (!isValidTagName(tagName)) {
            report.errors << QString("row %1: invalid tag name '%2'").arg(lineNo).arg(tagName);
            continue;
        }

        QString address = cell(fields, columns, "Address");
        if (address.isEmpty()) {
            report.errors << QString("row %1: missing address").arg(lineNo);
            continue;
        }
        address = zeroFillAddress(address);
        modbus::ParsedAddress parsed;
        QString addrError;
        if (!modbus::parseAddress(address, parsed, addrError)) {
            report.errors << QString("row %1: %2").arg(lineNo).arg(addrError);
            continue;
        }

        QString dataType = cell(fields, columns, "Data Type", "Word");
        dataType.replace(" Array", "(Array)");
        modbus::TagType type;
        if (!modbus::parseDataType(dataType, type)) {
            report.errors << QString("row %1: unknown data type '%2'").arg(lineNo).arg(dataType);
            continue;
        }
        // 布尔量只能放在线圈/离散输入区，其余类型只能放在寄存器区
        if (type.isBoolean() != modbus::isBitAddress(parsed.type)) {
            report.errors << QString("row %1: %2 cannot use address %3, expected a %4 address")
                                 .arg(lineNo)
                                 .arg(type.displayName(), address,
                                      type.isBoolean() ? QString("coil or discrete input") : QString("register"));
            continue;
        }

        QString access = cell(fields, columns, "Client Access", "R/W");
        if (access == "R/W") access = kAccessReadWrite;
        else if (access == "RO") access = kAccessReadOnly;

        QJsonObject general;
        general["name"] = tagName;
        general["description"] = cell(fields, columns, "Description");
        general["data_type"] = type.displayName();
        general["access"] = access;
        general["address"] = address;
        general["scan_rate"] = cell(fields, columns, "Scan Rate", QString::number(kDefaultScanRateMs));

        modbus::ScalingConfig scaling;
        const QString scalingType = cell(fields, columns, "Scaling", "None");
        if (scalingType.compare("None", Qt::CaseInsensitive) != 0) {
            QJsonObject raw{
                {"type", scalingType},
                {"raw_low", cell(fields, columns, "Raw Low", "0")},
                {"raw_high", cell(fields, columns, "Raw High", "1000")},
                {"scaled_type", cell(fields, columns, "Scaled Data Type", kDefaultScaledType)},
                {"scaled_low", cell(fields, columns, "Scaled Low", "0.0")},
                {"scaled_high", cell(fields, columns, "Scaled High", "100.0")},
                {"clamp_low", cell(fields, columns, "Clamp Low", "No")},
                {"clamp_high", cell(fields, columns, "Clamp High", "No")},
                {"negate", cell(fields, columns, "Negate Value", "No")},
                {"units", cell(fields, columns, "Eng Units")},
            };
            scaling = modbus::ScalingConfig::fromJson(raw);
        }

        ProjectNode* parent = device;
        for (const QString& g : parts) {
            const QString groupName = g.trimmed();
            if (groupName.isEmpty()) continue;
            parent = findOrCreateGroup(parent, groupName, report.groupsCreated);
        }

        QJsonObject cfg;
        cfg["general"] = general;
        cfg["scaling"] = scaling.toJson();

        if (ProjectNode* existing = parent->findChild(tagName, ProjectNode::Kind::Tag)) {
            existing->setConfig(cfg);
        } else {
            parent->addChild(std::make_unique<ProjectNode>(ProjectNode::Kind::Tag, tagName, cfg));
        }
        ++report.imported;
    }

    if (!report.errors.isEmpty()) {
        qWarning("CSV import skipped %d row(s)", static_cast<int>(report.errors.size()));
    }
    return true;
}

bool importTagsCsvFile(ProjectNode* device, const QString& path, CsvImportReport& report, QString& error)
{
    QByteArray content;
    if (!readFile(path, content, error)) return false;
    return importTagsCsv(device, content, report, error);
}

} // namespace modua
