#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(lcConfig, "clipsync.config", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStore, "clipsync.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcServer, "clipsync.server", QtInfoMsg)
Q_LOGGING_CATEGORY(lcClient, "clipsync.client", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSync, "clipsync.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(lcClipboard, "clipsync.clipboard", QtInfoMsg)

namespace clipsync {
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
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void open_log_file(LoggerState& s, const QString& path) {
    if (path.isEmpty()) {
        return;
    }
    QDir dir(QFileInfo(path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "clipsync: cannot open log file %s: %s\n",
                     qPrintable(path), qPrintable(s.file.errorString()));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto bytes = line.toUtf8();

    std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
    std::fflush(stderr);

    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
}

} // namespace

void install_logging(const QString& log_file) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        open_log_file(s, log_file);
    }
    qInstallMessageHandler(message_handler);
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("clipsync.*.debug=true\n"));
}

} // namespace clipsync
