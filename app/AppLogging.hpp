// Log output for the command-line tool: Qt logging categories, one message
// handler writing timestamped lines to stdout or a log file, and the adapter
// that turns core LogEvents into category messages.
#pragma once
#include "iftpfm/RuntimeLogging.hpp"
#include <QDateTime>
#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcTransfer)
Q_DECLARE_LOGGING_CATEGORY(lcInstance)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

namespace iftpfm {

// Opens the log target (append mode for files; stdout when logFile is empty)
// and installs the message handler. Debug categories are enabled only when
// debug is set.
bool installLogOutput(const QString& logFile, bool debug, QString& err);

// Restores Qt's default handler and closes the log file.
void shutdownLogOutput();

// "YYYY-MM-DD HH:MM:SS [T<worker>] <message>"
QString formatLogLine(const QDateTime& when, int worker, const QString& message);

// Worker number stamped on lines logged from the calling thread.
void setLogWorker(int worker);
int logWorker();

// Routes core events to lcTransfer / lcInstance / lcApp.
LogSink makeQtLogSink();

// Text of an event without timestamp or worker prefix.
QString describeEvent(const LogEvent& ev);

} // namespace iftpfm
