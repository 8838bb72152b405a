#include "CliOptions.hpp"
#include "iftpfm/RuntimeLogging.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

#ifndef IFTPFM_VERSION
#define IFTPFM_VERSION "0.0.0"
#endif

namespace iftpfm {

namespace {

bool parseInt(const QString& text, int minimum, int& out) {
    bool ok = false;
    const int v = text.toInt(&ok);
    if (!ok || v < minimum)
        return false;
    out = v;
    return true;
}

} // namespace

CliStatus parseCommandLine(const QStringList& arguments, CliOptions& out, QString& message) {
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Moves files between FTP, FTPS and SFTP servers."));
    parser.addPositionalArgument(QStringLiteral("config"),
                                 QStringLiteral("JSONL configuration file."));

    const QCommandLineOption helpOpt({QStringLiteral("h"), QStringLiteral("help")},
                                     QStringLiteral("Show this help and exit."));
    const QCommandLineOption versionOpt({QStringLiteral("v"), QStringLiteral("version")},
                                        QStringLiteral("Print version and exit."));
    const QCommandLineOption deleteOpt(QStringLiteral("d"),
                                       QStringLiteral("Delete source files after a verified transfer."));
    const QCommandLineOption randomOpt(QStringLiteral("r"),
                                       QStringLiteral("Process configuration entries in random order."));
    const QCommandLineOption workersOpt(QStringLiteral("p"),
                                        QStringLiteral("Number of parallel workers."),
                                        QStringLiteral("N"), QStringLiteral("1"));
    const QCommandLineOption graceOpt(QStringLiteral("g"),
                                      QStringLiteral("Seconds to wait for a running instance to exit."),
                                      QStringLiteral("S"), QStringLiteral("30"));
    const QCommandLineOption timeoutOpt(QStringLiteral("t"),
                                        QStringLiteral("Connect timeout in seconds."),
                                        QStringLiteral("S"), QStringLiteral("30"));
    const QCommandLineOption scratchOpt(QStringLiteral("T"),
                                        QStringLiteral("Directory for disk transfer buffers."),
                                        QStringLiteral("DIR"));
    const QCommandLineOption ramOpt(QStringLiteral("ram-threshold"),
                                    QStringLiteral("Largest file kept in memory, in bytes (0: always memory)."),
                                    QStringLiteral("BYTES"), QString::number(kDefaultRamThreshold));
    const QCommandLineOption skipVerifyOpt(QStringLiteral("insecure-skip-verify"),
                                           QStringLiteral("Do not verify FTPS server certificates."));
    const QCommandLineOption policyOpt(QStringLiteral("known-hosts-policy"),
                                       QStringLiteral("SSH host key policy: strict, accept-new or off."),
                                       QStringLiteral("POLICY"), QStringLiteral("off"));
    const QCommandLineOption knownHostsOpt(QStringLiteral("known-hosts"),
                                           QStringLiteral("known_hosts file (default ~/.ssh/known_hosts)."),
                                           QStringLiteral("FILE"));
    const QCommandLineOption lockOpt(QStringLiteral("lock-file"),
                                     QStringLiteral("Instance lock file."),
                                     QStringLiteral("FILE"));
    const QCommandLineOption debugOpt(QStringLiteral("debug"),
                                      QStringLiteral("Log debug-level events."));
    const QCommandLineOption logOpt(QStringLiteral("l"),
                                    QStringLiteral("Append log lines to FILE."),
                                    QStringLiteral("FILE"));
    const QCommandLineOption stdoutOpt(QStringLiteral("s"),
                                       QStringLiteral("Log to standard output (default)."));

    parser.addOptions({helpOpt, versionOpt, deleteOpt, randomOpt, workersOpt, graceOpt,
                       timeoutOpt, scratchOpt, ramOpt, skipVerifyOpt, policyOpt,
                       knownHostsOpt, lockOpt, debugOpt, logOpt, stdoutOpt});

    if (!parser.parse(arguments)) {
        message = parser.errorText();
        return CliStatus::ExitError;
    }
    if (parser.isSet(helpOpt)) {
        message = parser.helpText();
        return CliStatus::ExitOk;
    }
    if (parser.isSet(versionOpt)) {
        message = QStringLiteral("iftpfm version ") + QString::fromLatin1(IFTPFM_VERSION);
        return CliStatus::ExitOk;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        message = positional.isEmpty() ? QStringLiteral("missing configuration file")
                                       : QStringLiteral("exactly one configuration file expected");
        return CliStatus::ExitError;
    }
    out.configPath = positional.front();

    if (parser.isSet(logOpt) && parser.isSet(stdoutOpt)) {
        message = QStringLiteral("-l and -s are mutually exclusive");
        return CliStatus::ExitError;
    }
    if (parser.isSet(logOpt)) {
        out.logFile = parser.value(logOpt);
        if (out.logFile.isEmpty()) {
            message = QStringLiteral("-l needs a file name");
            return CliStatus::ExitError;
        }
    }

    out.deleteSource = parser.isSet(deleteOpt);
    out.randomize = parser.isSet(randomOpt);
    out.insecureSkipVerify = parser.isSet(skipVerifyOpt);
    out.debug = parser.isSet(debugOpt) || debugLoggingFromEnv();

    if (!parseInt(parser.value(workersOpt), 1, out.workers)) {
        message = QStringLiteral("-p expects a positive integer, got '%1'").arg(parser.value(workersOpt));
        return CliStatus::ExitError;
    }
    if (!parseInt(parser.value(graceOpt), 0, out.graceSeconds)) {
        message = QStringLiteral("-g expects a non-negative integer, got '%1'").arg(parser.value(graceOpt));
        return CliStatus::ExitError;
    }
    if (!parseInt(parser.value(timeoutOpt), 1, out.connectTimeoutSeconds)) {
        message = QStringLiteral("-t expects a positive integer, got '%1'").arg(parser.value(timeoutOpt));
        return CliStatus::ExitError;
    }

    bool ok = false;
    const qulonglong threshold = parser.value(ramOpt).toULongLong(&ok);
    if (!ok) {
        message = QStringLiteral("--ram-threshold expects a byte count, got '%1'").arg(parser.value(ramOpt));
        return CliStatus::ExitError;
    }
    out.ramThreshold = threshold;

    if (!parseKnownHostsPolicy(parser.value(policyOpt).toStdString(), out.knownHostsPolicy)) {
        message = QStringLiteral("unknown --known-hosts-policy '%1'").arg(parser.value(policyOpt));
        return CliStatus::ExitError;
    }
    out.knownHostsPath = parser.value(knownHostsOpt);
    out.scratchDir = parser.value(scratchOpt);
    out.lockPath = parser.value(lockOpt);
    return CliStatus::Run;
}

} // namespace iftpfm
