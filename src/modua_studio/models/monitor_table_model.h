#ifndef MONITOR_TABLE_MODEL_H
#define MONITOR_TABLE_MODEL_H

#include <QAbstractTableModel>
#include <QVector>

#include "modua/runtime/data_buffer.h"

namespace modua {
class ProjectNode;
}

/**
 * 监视表：显示选中设备下全部标签的实时数据
 *
 * 数据由 refresh() 从 DataBuffer 拉取，只对变化的行发出 dataChanged。
 */
class MonitorTableModel : public QAbstractTableModel
{
    Q_OBJECT

public:
    enum Column {
        NameColumn,
        DataTypeColumn,
        AccessColumn,
        ValueColumn,
        TimestampColumn,
        QualityColumn,
        UpdateCountColumn,
        ColumnCount
    };

    explicit MonitorTableModel(modua::DataBuffer *buffer, QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    /** 显示 device（或组）下的标签；nullptr 清空 */
    void setDevice(const modua::ProjectNode *device);
    void clear();
    void refresh();

    QString pathAt(int row) const;
    QString dataTypeAt(int row) const;
    QString accessAt(int row) const;
    QVariant valueAt(int row) const;
    int rowForPath(const QString &path) const;

    static QString formatValue(const QVariant &value);
    static QString formatTimestamp(double epochSeconds);

private:
    struct Row {
        QString path;
        QString name;
        QString dataType;
        QString access;
        modua::TagSnapshot snapshot;
    };

    modua::DataBuffer *m_buffer;
    QVector<Row> m_rows;
};

#endif // MONITOR_TABLE_MODEL_H
