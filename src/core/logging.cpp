#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(konnectDiscoveryLog, "konnect.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(konnectTransportLog, "konnect.transport", QtInfoMsg)
Q_LOGGING_CATEGORY(konnectPairingLog, "konnect.pairing", QtInfoMsg)
Q_LOGGING_CATEGORY(konnectTrustLog, "konnect.trust", QtInfoMsg)
Q_LOGGING_CATEGORY(konnectPayloadLog, "konnect.payload", QtInfoMsg)
Q_LOGGING_CATEGORY(konnectDaemonLog, "konnect.daemon", QtInfoMsg)

namespace konnect {
namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/konnect.log"));
}

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

// The previous file is kept as <path>.1 once the current one grows past this.
constexpr qint64 MAX_LOG_FILE_SIZE = 4 * 1024 * 1024;

void rotate_if_needed(LoggerState& s) {
    if (s.file.isOpen() && s.file.size() < MAX_LOG_FILE_SIZE) {
        return;
    }
    if (s.file.isOpen()) {
        s.file.close();
    }
    if (QFileInfo(s.path).size() >= MAX_LOG_FILE_SIZE) {
        const QString previous = s.path + QStringLiteral(".1");
        QFile::remove(previous);
        if (!QFile::rename(s.path, previous)) {
            std::fprintf(stderr, "konnect: cannot rotate log file %s\n", qPrintable(s.path));
        }
    }
    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "konnect: cannot open log file %s\n", qPrintable(s.path));
    }
}

void ensure_open(LoggerState& s) {
    if (s.path.isEmpty()) {
        return;
    }
    if (!s.initialized) {
        s.initialized = true;
        QDir().mkpath(QFileInfo(s.path).absolutePath());
    }
    rotate_if_needed(s);
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
    std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
}

} // namespace

void install_file_logging(const QString& path) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }
        s.path = path.isEmpty() ? compute_log_file_path() : path;
        s.initialized = false;
    }
    qInstallMessageHandler(message_handler);
}

void uninstall_file_logging() {
    qInstallMessageHandler(nullptr);
    auto& s = state();
    QMutexLocker lock(&s.mu);
    if (s.file.isOpen()) {
        s.file.close();
    }
    s.path.clear();
    s.initialized = false;
}

QString default_log_file_path() {
    return compute_log_file_path();
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("konnect.*.debug=true"));
}

} // namespace konnect
