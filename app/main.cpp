// iftpfm: moves files between FTP, FTPS and SFTP servers as configured in a
// JSON Lines file. One instance per user; a new run preempts the old one.
#include "AppLogging.hpp"
#include "CliOptions.hpp"
#include "ConfigLoader.hpp"
#include "iftpfm/InstanceGuard.hpp"
#include "iftpfm/ParallelScheduler.hpp"
#include "iftpfm/ShutdownCoordinator.hpp"
#include "iftpfm/TransferPipeline.hpp"

#include <QCoreApplication>
#include <QTextStream>
#include <cstdio>

#ifndef IFTPFM_VERSION
#define IFTPFM_VERSION "0.0.0"
#endif

using namespace iftpfm;

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("iftpfm"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(IFTPFM_VERSION));

    CliOptions cli;
    QString message;
    switch (parseCommandLine(app.arguments(), cli, message)) {
    case CliStatus::ExitOk:
        QTextStream(stdout) << message << "\n";
        return 0;
    case CliStatus::ExitError:
        QTextStream(stderr) << "iftpfm: " << message << "\n"
                            << "Try 'iftpfm -h' for more information.\n";
        return 1;
    case CliStatus::Run:
        break;
    }

    QString why;
    if (!installLogOutput(cli.logFile, cli.debug, why)) {
        QTextStream(stderr) << "iftpfm: " << why << "\n";
        return 1;
    }
    qCInfo(lcApp).noquote() << "iftpfm version" << IFTPFM_VERSION << "started";

    const std::string scratchDir =
        cli.scratchDir.isEmpty() ? defaultScratchDirectory() : cli.scratchDir.toStdString();
    std::string err;
    if (!checkScratchDirectory(scratchDir, err)) {
        qCCritical(lcApp).noquote() << QString::fromStdString(err);
        shutdownLogOutput();
        return 1;
    }

    const LogSink sink = makeQtLogSink();

    InstanceOptions instanceOpt;
    instanceOpt.lock_path = cli.lockPath.toStdString();
    instanceOpt.grace = std::chrono::seconds(cli.graceSeconds);
    InstanceGuard guard;
    if (!guard.acquire(instanceOpt, sink, err)) {
        qCCritical(lcInstance).noquote() << "Cannot acquire instance lock:" << QString::fromStdString(err);
        shutdownLogOutput();
        return 1;
    }

    ShutdownCoordinator shutdown;
    if (!shutdown.installSignalHandlers())
        qCWarning(lcApp) << "Cannot install SIGINT/SIGTERM handlers";

    std::vector<ConfigEntry> entries;
    if (!loadConfigFile(cli.configPath, entries, message)) {
        qCCritical(lcApp).noquote() << "Error parsing config file:" << message;
        guard.release();
        shutdownLogOutput();
        return 1;
    }
    qCDebug(lcApp) << "loaded" << entries.size() << "entries from" << cli.configPath;

    ClientOptions clientOpt;
    clientOpt.insecure_skip_verify = cli.insecureSkipVerify;
    clientOpt.known_hosts_policy = cli.knownHostsPolicy;
    if (!cli.knownHostsPath.isEmpty())
        clientOpt.known_hosts_path = cli.knownHostsPath.toStdString();

    PipelineOptions pipelineOpt;
    pipelineOpt.delete_source = cli.deleteSource;
    pipelineOpt.connect_timeout = std::chrono::seconds(cli.connectTimeoutSeconds);
    pipelineOpt.ram_threshold = cli.ramThreshold;
    pipelineOpt.scratch_dir = scratchDir;
    pipelineOpt.debug = cli.debug;
    TransferPipeline pipeline(pipelineOpt, defaultClientFactory(clientOpt), shutdown, sink);

    SchedulerOptions schedOpt;
    schedOpt.workers = cli.workers;
    schedOpt.randomize = cli.randomize;
    ParallelScheduler scheduler(schedOpt, shutdown, sink);
    const RunSummary summary = scheduler.run(
        std::move(entries),
        [&pipeline](const ConfigEntry& entry, int worker) { return pipeline.run(entry, worker); });

    if (summary.interrupted) {
        qCInfo(lcApp).noquote() << "iftpfm version" << IFTPFM_VERSION
                                << "terminated due to shutdown request, transferred"
                                << summary.transferred << "file(s)";
    } else {
        qCInfo(lcApp).noquote() << "iftpfm version" << IFTPFM_VERSION
                                << "finished, successfully transferred" << summary.transferred
                                << "file(s)";
    }

    shutdown.uninstallSignalHandlers();
    guard.release();
    shutdownLogOutput();
    return 0;
}
