#include "AppLogging.hpp"

#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <cstdio>

Q_LOGGING_CATEGORY(lcTransfer, "iftpfm.transfer")
Q_LOGGING_CATEGORY(lcInstance, "iftpfm.instance")
Q_LOGGING_CATEGORY(lcApp, "iftpfm.app")

namespace iftpfm {

namespace {

QMutex g_logMutex;
QFile* g_logFile = nullptr;
thread_local int t_worker = 0;

void writeLine(QtMsgType, const QMessageLogContext&, const QString& msg) {
    const QString line = formatLogLine(QDateTime::currentDateTime(), t_worker, msg) + '\n';
    const QByteArray bytes = line.toUtf8();
    QMutexLocker lock(&g_logMutex);
    if (g_logFile) {
        g_logFile->write(bytes);
        g_logFile->flush();
    } else {
        std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stdout);
        std::fflush(stdout);
    }
}

} // namespace

QString formatLogLine(const QDateTime& when, int worker, const QString& message) {
    return when.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")) + QStringLiteral(" [T") +
           QString::number(worker) + QStringLiteral("] ") + message;
}

void setLogWorker(int worker) {
    t_worker = worker;
}

int logWorker() {
    return t_worker;
}

bool installLogOutput(const QString& logFile, bool debug, QString& err) {
    QMutexLocker lock(&g_logMutex);
    if (!logFile.isEmpty()) {
        auto* f = new QFile(logFile);
        if (!f->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            err = QStringLiteral("cannot open log file %1: %2").arg(logFile, f->errorString());
            delete f;
            return false;
        }
        delete g_logFile;
        g_logFile = f;
    }
    QLoggingCategory::setFilterRules(debug ? QStringLiteral("iftpfm.*.debug=true")
                                           : QStringLiteral("iftpfm.*.debug=false"));
    qInstallMessageHandler(writeLine);
    return true;
}

void shutdownLogOutput() {
    qInstallMessageHandler(nullptr);
    QMutexLocker lock(&g_logMutex);
    if (g_logFile) {
        g_logFile->close();
        delete g_logFile;
        g_logFile = nullptr;
    }
}

QString describeEvent(const LogEvent& ev) {
    QString text;
    if (!ev.entry.empty())
        text += QString::fromStdString(ev.entry) + QStringLiteral(": ");
    if (!ev.file.empty())
        text += QString::fromStdString(ev.file) + QStringLiteral(": ");
    text += QString::fromStdString(ev.message);
    return text;
}

LogSink makeQtLogSink() {
    return [](const LogEvent& ev) {
        const int previous = logWorker();
        setLogWorker(ev.worker);
        const QString text = describeEvent(ev);
        using CategoryFn = const QLoggingCategory& (*)();
        CategoryFn cat = lcTransfer;
        if (ev.stage == Stage::Instance)
            cat = lcInstance;
        else if (ev.entry.empty())
            cat = lcApp;
        switch (ev.level) {
        case LogLevel::Debug:
            qCDebug(cat).noquote() << text;
            break;
        case LogLevel::Info:
            qCInfo(cat).noquote() << text;
            break;
        case LogLevel::Warning:
            qCWarning(cat).noquote() << text;
            break;
        case LogLevel::Error:
            qCCritical(cat).noquote() << text;
            break;
        }
        setLogWorker(previous);
    };
}

} // namespace iftpfm
