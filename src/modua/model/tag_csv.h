#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

#include "modua/model/project_node.h"
#include "modua/modua_export.h"

namespace modua {

/**
 * 设备标签 CSV 导入导出
 *
 * 列顺序固定（17 列），组路径以 '.' 拼接在标签名前。
 * 文件编码为带 BOM 的 UTF-8。
 */
MODUA_API QStringList tagCsvColumns();

struct MODUA_API CsvImportReport {
    int imported = 0;
    int groupsCreated = 0;
    QStringList errors; // "row N: ..."，对应行被跳过
};

MODUA_API QByteArray exportTagsCsv(const ProjectNode& device);
MODUA_API bool exportTagsCsvFile(const ProjectNode& device, const QString& path, QString& error);

/**
 * 导入到设备节点；同名标签覆盖配置，缺失的组自动创建
 * 表头缺少 Tag Name 列时返回 false
 */
MODUA_API bool importTagsCsv(ProjectNode* device, const QByteArray& data,
                             CsvImportReport& report, QString& error);
MODUA_API bool importTagsCsvFile(ProjectNode* device, const QString& path,
                                 CsvImportReport& report, QString& error);

// CSV 基础工具
MODUA_API QString csvEscape(const QString& field);
MODUA_API QList<QStringList> parseCsv(const QString& text);

} // namespace modua
