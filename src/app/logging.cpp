#include "app/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(wsbeaconAppLog, "wsbeacon.app")

namespace wsbeacon::app {
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

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg)
                          .toUtf8();

    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);

    if (s.file.isOpen()) {
        s.file.write(line);
        s.file.flush();
    }
}

} // namespace

bool install_logging(const QString& log_file) {
    bool opened = true;
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }
        if (!log_file.isEmpty()) {
            QDir dir(QFileInfo(log_file).absolutePath());
            dir.mkpath(QStringLiteral("."));

            s.file.setFileName(log_file);
            opened = s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
        }
    }

    // Keep the pattern stable; our message handler already stamps time/level/category.
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    qInstallMessageHandler(message_handler);

    if (!opened) {
        qCWarning(wsbeaconAppLog).noquote() << "cannot open log file" << log_file
                                            << "- logging to stderr only";
    }
    return opened;
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("wsbeacon.*.debug=true"));
}

} // namespace wsbeacon::app
