// Structured log events emitted by the core and the runtime switches that
// control their verbosity. The core never writes output itself; the
// application installs a LogSink.
#pragma once

#include <cctype>
#include <cstdlib>
#include <functional>
#include <string>

namespace iftpfm {

enum class LogLevel { Debug, Info, Warning, Error };

// State-machine step that produced an event.
enum class Stage {
    Connect,
    Login,
    ChangeDirectory,
    List,
    Filter,
    Select,
    Download,
    Upload,
    Verify,
    Rename,
    DeleteSource,
    Close,
    Summary,
    Instance,
    Shutdown
};

struct LogEvent {
    LogLevel level = LogLevel::Info;
    int worker = 0;      // 0 = main thread
    std::string entry;   // "ftp://a:21/in -> sftp://b:22/out"
    Stage stage = Stage::Summary;
    std::string file;    // empty for entry-level events
    std::string message;
};

using LogSink = std::function<void(const LogEvent&)>;

inline const char* stageName(Stage s) {
    switch (s) {
    case Stage::Connect:
        return "connect";
    case Stage::Login:
        return "login";
    case Stage::ChangeDirectory:
        return "cwd";
    case Stage::List:
        return "list";
    case Stage::Filter:
        return "filter";
    case Stage::Select:
        return "select";
    case Stage::Download:
        return "download";
    case Stage::Upload:
        return "upload";
    case Stage::Verify:
        return "verify";
    case Stage::Rename:
        return "rename";
    case Stage::DeleteSource:
        return "delete";
    case Stage::Close:
        return "close";
    case Stage::Summary:
        return "summary";
    case Stage::Instance:
        return "instance";
    case Stage::Shutdown:
        return "shutdown";
    }
    return "unknown";
}

inline std::string normalizedEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    std::string out(raw);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    out = out.substr(start, end - start);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// IFTPFM_DEBUG=1 behaves like --debug.
inline bool debugLoggingFromEnv() {
    return envFlagEnabled("IFTPFM_DEBUG");
}

} // namespace iftpfm
