#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(quireTxnLog, "quire.txn")
Q_LOGGING_CATEGORY(quireConflictLog, "quire.conflict")
Q_LOGGING_CATEGORY(quireHistoryLog, "quire.history")
Q_LOGGING_CATEGORY(quireIntegrityLog, "quire.integrity")
Q_LOGGING_CATEGORY(quireBackupLog, "quire.backup")
Q_LOGGING_CATEGORY(quireConsistencyLog, "quire.consistency")
Q_LOGGING_CATEGORY(quireStorageLog, "quire.storage")

namespace quire {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QString path;
    bool initialized = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    if (s.path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(s.path).absolutePath());
    if (!dir.mkpath(QStringLiteral("."))) {
        std::fprintf(stderr, "quire: cannot create log directory %s\n", qPrintable(dir.path()));
        return;
    }

    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "quire: cannot open log file %s\n", qPrintable(s.path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto bytes = line.toUtf8();

    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
    std::fputs(bytes.constData(), stderr);
}

} // namespace

void install_file_logging(const QString& path) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        s.path = path.isEmpty() ? default_log_file_path() : path;
        s.initialized = false;
        if (s.file.isOpen()) {
            s.file.close();
        }
    }
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/quire.log"));
}

} // namespace quire
