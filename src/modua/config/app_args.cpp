#include "app_args.h"

namespace modua {

namespace {

const QStringList kLogLevels = {"debug", "info", "warn", "error"};

/**
 * 取选项值，支持 --name=value 与 --name value 两种写法
 * 返回 false 表示 arg 不是该选项
 */
bool takeValue(const QStringList& args, int& i, const QString& name, QString& value)
{
    const QString& arg = args.at(i);
    if (arg == name) {
        value = i + 1 < args.size() ? args.at(++i) : QString();
        return true;
    }
    if (arg.startsWith(name + '=')) {
        value = arg.mid(name.size() + 1);
        return true;
    }
    return false;
}

} // namespace

AppArgs AppArgs::parse(const QStringList& args)
{
    AppArgs result;
    QString value;

    for (int i = 1; i < args.size(); ++i) {
        const QString& arg = args.at(i);
        if (arg == "-h" || arg == "--help") {
            result.help = true;
        } else if (arg == "-v" || arg == "--version") {
            result.version = true;
        } else if (takeValue(args, i, "--data-root", value)) {
            if (value.isEmpty()) {
                result.error = "--data-root requires a directory";
                break;
            }
            result.dataRoot = value;
        } else if (takeValue(args, i, "--log-level", value)) {
            if (!kLogLevels.contains(value)) {
                result.error = QString("invalid log level '%1', expected %2").arg(value, kLogLevels.join('|'));
                break;
            }
            result.logLevel = value;
            result.hasLogLevel = true;
        } else if (takeValue(args, i, "--project", value) || !arg.startsWith('-')) {
            // 无前缀参数视为工程文件（文件关联打开）
            const QString file = arg.startsWith('-') ? value : arg;
            if (file.isEmpty()) {
                result.error = "--project requires a file";
                break;
            }
            if (result.hasProject) {
                result.error = "only one project file can be given";
                break;
            }
            result.project = file;
            result.hasProject = true;
        } else {
            result.error = "unknown option: " + arg;
            break;
        }
    }
    return result;
}

QString AppArgs::usage()
{
    return QStringLiteral(
        "Usage: modua_studio [options] [FILE]\n"
        "  -h, --help            show this help\n"
        "  -v, --version         show version\n"
        "  --data-root DIR       directory holding config.json, logs/ and certs/\n"
        "  --log-level LEVEL     debug|info|warn|error\n"
        "  --project FILE        project file to open on startup\n"
        "  FILE                  same as --project FILE\n");
}

} // namespace modua
