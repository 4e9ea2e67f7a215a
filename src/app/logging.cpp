#include "app/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QStandardPaths>
#include <QTextStream>
#include <QtGlobal>

namespace docsync::app {
namespace {

constexpr qint64 kRotateBytes = 4 * 1024 * 1024;

QString log_path() {
    const auto overridePath = qEnvironmentVariable("DOCSYNC_LOG_PATH");
    if (!overridePath.isEmpty()) {
        return QFileInfo(overridePath).absoluteFilePath();
    }
    const auto dataDir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    return dataDir.isEmpty() ? QString{} : QDir(dataDir).filePath(QStringLiteral("logs/docsync.log"));
}

QChar severity(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return QLatin1Char('D');
        case QtInfoMsg: return QLatin1Char('I');
        case QtWarningMsg: return QLatin1Char('W');
        case QtCriticalMsg: return QLatin1Char('C');
        case QtFatalMsg: return QLatin1Char('F');
    }
    return QLatin1Char('?');
}

// One sink per process; Qt may call the handler from any thread.
class LogSink {
public:
    static LogSink& instance() {
        static LogSink sink;
        return sink;
    }

    void write(QtMsgType type, const char* category, const QString& message) {
        QMutexLocker lock(&mutex_);
        if (!opened_) open();

        const auto cat = category ? QString::fromLatin1(category) : QString{};
        if (file_.isOpen()) {
            const auto line = QStringLiteral("%1 %2 %3 %4\n")
                                  .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs))
                                  .arg(severity(type))
                                  .arg(cat, message);
            file_.write(line.toUtf8());
            file_.flush();
        }

        // stdout carries command output only.
        if (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg) {
            QTextStream(stderr) << cat << ' ' << message << '\n';
        }
    }

private:
    QMutex mutex_;
    QFile file_;
    bool opened_ = false;

    void open() {
        opened_ = true;
        const auto path = log_path();
        if (path.isEmpty()) return;

        QFileInfo info(path);
        QDir().mkpath(info.absolutePath());
        // Keep one previous generation next to the live file.
        if (info.exists() && info.size() > kRotateBytes) {
            const auto previous = path + QStringLiteral(".1");
            QFile::remove(previous);
            QFile::rename(path, previous);
        }

        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            QTextStream(stderr) << "docsync: cannot open log file " << path << ": "
                                << file_.errorString() << '\n';
        }
    }
};

void handle_message(QtMsgType type, const QMessageLogContext& context, const QString& message) {
    LogSink::instance().write(type, context.category, message);
}

} // namespace

void install_file_logging() {
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    qInstallMessageHandler(handle_message);
}

QString default_log_file_path() {
    return log_path();
}

void enable_sync_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("docsync.*.debug=true"));
}

bool sync_debug_requested() {
    const auto value = qEnvironmentVariable("DOCSYNC_DEBUG_SYNC").trimmed();
    return !value.isEmpty() && value != QStringLiteral("0");
}

} // namespace docsync::app
