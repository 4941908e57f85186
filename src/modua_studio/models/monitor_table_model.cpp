#include "monitor_table_model.h"

#include <QDateTime>

#include "modua/model/project_node.h"
#include "ui/app_style.h"

MonitorTableModel::MonitorTableModel(modua::DataBuffer *buffer, QObject *parent)
    : QAbstractTableModel(parent)
    , m_buffer(buffer)
{
}

int MonitorTableModel::rowCount(const QModelIndex &parent) const
{
    return parent.isValid() ? 0 : m_rows.size();
}

int MonitorTableModel::columnCount(const QModelIndex &parent) const
{
    return parent.isValid() ? 0 : ColumnCount;
}

QVariant MonitorTableModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation != Qt::Horizontal || role != Qt::DisplayRole) return QVariant();
    switch (section) {
    case NameColumn:        return tr("Tag Name");
    case DataTypeColumn:    return tr("Data Type");
    case AccessColumn:      return tr("Client Access");
    case ValueColumn:       return tr("Value");
    case TimestampColumn:   return tr("Timestamp");
    case QualityColumn:     return tr("Quality");
    case UpdateCountColumn: return tr("Update Count");
    default:                return QVariant();
    }
}

QVariant MonitorTableModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= m_rows.size()) return QVariant();
    const Row &row = m_rows.at(index.row());

    if (role == Qt::DisplayRole) {
        switch (index.column()) {
        case NameColumn:        return row.name;
        case DataTypeColumn:    return row.dataType;
        case AccessColumn:      return row.access;
        case ValueColumn:       return formatValue(row.snapshot.value);
        case TimestampColumn:   return formatTimestamp(row.snapshot.timestamp);
        case QualityColumn:     return row.snapshot.quality;
        case UpdateCountColumn: return row.snapshot.updateCount;
        default:                return QVariant();
        }
    }
    if (role == Qt::ForegroundRole && index.column() == QualityColumn) {
        return AppStyle::qualityColor(row.snapshot.quality);
    }
    if (role == Qt::ToolTipRole) {
        return row.path;
    }
    if (role == Qt::TextAlignmentRole && index.column() == UpdateCountColumn) {
        return int(Qt::AlignRight | Qt::AlignVCenter);
    }
    return QVariant();
}

void MonitorTableModel::setDevice(const modua::ProjectNode *device)
{
    beginResetModel();
    m_rows.clear();
    if (device) {
        const QString prefix = device->path() + ".";
        for (modua::ProjectNode *tag : modua::collectTags(const_cast<modua::ProjectNode *>(device))) {
            Row row;
            row.path = tag->path();
            row.name = row.path.startsWith(prefix) ? row.path.mid(prefix.size()) : tag->name();
            row.dataType = tag->general().value("data_type").toString();
            row.access = tag->general().value("access").toString();
            if (m_buffer) m_buffer->tagData(row.path, row.snapshot);
            m_rows.append(row);
        }
    }
    endResetModel();
}

void MonitorTableModel::clear()
{
    setDevice(nullptr);
}

void MonitorTableModel::refresh()
{
    if (!m_buffer) return;
    for (int i = 0; i < m_rows.size(); ++i) {
        Row &row = m_rows[i];
        modua::TagSnapshot snap;
        if (!m_buffer->tagData(row.path, snap)) continue;
        if (snap.updateCount == row.snapshot.updateCount && snap.quality == row.snapshot.quality
            && snap.value == row.snapshot.value) {
            continue;
        }
        row.snapshot = snap;
        emit dataChanged(index(i, ValueColumn), index(i, UpdateCountColumn));
    }
}

QString MonitorTableModel::pathAt(int row) const
{
    return row >= 0 && row < m_rows.size() ? m_rows.at(row).path : QString();
}

QString MonitorTableModel::dataTypeAt(int row) const
{
    return row >= 0 && row < m_rows.size() ? m_rows.at(row).dataType : QString();
}

QString MonitorTableModel::accessAt(int row) const
{
    return row >= 0 && row < m_rows.size() ? m_rows.at(row).access : QString();
}

QVariant MonitorTableModel::valueAt(int row) const
{
    return row >= 0 && row < m_rows.size() ? m_rows.at(row).snapshot.value : QVariant();
}

int MonitorTableModel::rowForPath(const QString &path) const
{
    for (int i = 0; i < m_rows.size(); ++i) {
        if (m_rows.at(i).path == path) return i;
    }
    return -1;
}

QString MonitorTableModel::formatValue(const QVariant &value)
{
    if (!value.isValid()) return QString();
    if (value.typeId() == QMetaType::QVariantList) {
        QStringList parts;
        for (const QVariant &v : value.toList()) parts << formatValue(v);
        return "[" + parts.join(", ") + "]";
    }
    if (value.typeId() == QMetaType::Bool) return value.toBool() ? "true" : "false";
    if (value.typeId() == QMetaType::Double || value.typeId() == QMetaType::Float) {
        return QString::number(value.toDouble(), 'g', 10);
    }
    return value.toString();
}

QString MonitorTableModel::formatTimestamp(double epochSeconds)
{
    if (epochSeconds <= 0.0) return QString();
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(epochSeconds * 1000.0))
        .toString("yyyy-MM-dd HH:mm:ss.zzz");
}
