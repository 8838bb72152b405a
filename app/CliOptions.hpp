// Command-line options of the iftpfm executable.
#pragma once
#include "iftpfm/TransferBuffer.hpp"
#include "iftpfm/TransferTypes.hpp"
#include <QString>
#include <QStringList>
#include <cstdint>

namespace iftpfm {

struct CliOptions {
    QString configPath;
    bool deleteSource = false;
    bool randomize = false;
    int workers = 1;
    int graceSeconds = 30;
    int connectTimeoutSeconds = 30;
    QString scratchDir;
    std::uint64_t ramThreshold = kDefaultRamThreshold;
    bool insecureSkipVerify = false;
    KnownHostsPolicy knownHostsPolicy = KnownHostsPolicy::Off;
    QString knownHostsPath;
    QString lockPath;
    bool debug = false;
    QString logFile; // empty: stdout
};

enum class CliStatus {
    Run,       // options parsed, go ahead
    ExitOk,    // -h / -v; message holds the text to print
    ExitError  // message holds the error
};

CliStatus parseCommandLine(const QStringList& arguments, CliOptions& out, QString& message);

} // namespace iftpfm
