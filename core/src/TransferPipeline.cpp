#include "iftpfm/TransferPipeline.hpp"

#include <unistd.h>
#include <vector>

namespace iftpfm {

namespace {

const char kTempSuffix[] = ".tmp";

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string errorText(const ClientError& err) {
    return std::string(errorKindName(err.kind)) + ": " + err.message;
}

} // namespace

std::string temporaryNameFor(const std::string& name) {
    return "." + name + "." + std::to_string(::getpid()) + kTempSuffix;
}

bool isTemporaryName(const std::string& name) {
    if (name.size() < 7 || name.front() != '.' || !endsWith(name, kTempSuffix))
        return false;
    const std::string core = name.substr(1, name.size() - 1 - (sizeof(kTempSuffix) - 1));
    const auto dot = core.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == core.size())
        return false;
    for (std::size_t i = dot + 1; i < core.size(); ++i) {
        if (core[i] < '0' || core[i] > '9')
            return false;
    }
    return true;
}

Connection::Connection(std::unique_ptr<RemoteClient> client, const char* side)
    : client_(std::move(client)), side_(side) {}

Connection::~Connection() {
    close();
}

bool Connection::open(const Endpoint& ep, std::chrono::milliseconds timeout,
                      ClientError& err) {
    if (!client_->connect(ep.host, ep.port, timeout, err))
        return false;
    return client_->login(ep.login, ep.credential, err);
}

bool Connection::changeDirectory(const std::string& path, ClientError& err) {
    if (!client_->changeDirectory(path, err))
        return false;
    directory_ = client_->currentDirectory();
    return true;
}

bool Connection::ensureBinary(ClientError& err) {
    if (binary_)
        return true;
    if (!client_->setBinaryMode(err))
        return false;
    binary_ = true;
    return true;
}

void Connection::close() {
    if (client_)
        client_->close();
    binary_ = false;
}

struct TransferPipeline::FileContext {
    const ConfigEntry* entry = nullptr;
    int worker = 0;
    std::string label;
};

TransferPipeline::TransferPipeline(PipelineOptions opt,
                                   ClientFactory factory,
                                   const ShutdownCoordinator& shutdown,
                                   LogSink log)
    : opt_(std::move(opt)),
      factory_(std::move(factory)),
      shutdown_(shutdown),
      log_(std::move(log)) {
    if (!opt_.now)
        opt_.now = [] { return static_cast<std::int64_t>(std::time(nullptr)); };
}

void TransferPipeline::emit(const FileContext& ctx, LogLevel level, Stage stage,
                            const std::string& file, const std::string& message) const {
    if (!log_ || (level == LogLevel::Debug && !opt_.debug))
        return;
    LogEvent ev;
    ev.level = level;
    ev.worker = ctx.worker;
    ev.entry = ctx.label;
    ev.stage = stage;
    ev.file = file;
    ev.message = message;
    log_(ev);
}

std::unique_ptr<Connection> TransferPipeline::openSide(const Endpoint& ep,
                                                       const char* side,
                                                       FileContext& ctx) {
    std::unique_ptr<RemoteClient> client = factory_ ? factory_(ep.protocol) : nullptr;
    if (!client) {
        emit(ctx, LogLevel::Error, Stage::Connect, {},
             std::string("no backend for protocol ") + protocolName(ep.protocol));
        return nullptr;
    }
    auto conn = std::make_unique<Connection>(std::move(client), side);
    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(opt_.connect_timeout);
    const std::string where = ep.host + ":" + std::to_string(ep.port);

    ClientError err;
    if (!conn->open(ep, timeout, err)) {
        const Stage stage = err.kind == ErrorKind::Auth ? Stage::Login : Stage::Connect;
        emit(ctx, LogLevel::Error, stage, {},
             std::string("Cannot connect to ") + side + " " + where + " as " + ep.login +
                 ": " + errorText(err));
        return nullptr;
    }
    emit(ctx, LogLevel::Info, Stage::Login, {},
         std::string("Connected to ") + side + " " + where + " as " + ep.login + " (" +
             protocolName(ep.protocol) + ")");

    if (!conn->changeDirectory(ep.path, err)) {
        emit(ctx, LogLevel::Error, Stage::ChangeDirectory, {},
             std::string("Cannot change ") + side + " directory to " + ep.path + ": " +
                 errorText(err));
        return nullptr;
    }
    if (!conn->ensureBinary(err)) {
        emit(ctx, LogLevel::Error, Stage::ChangeDirectory, {},
             std::string("Cannot switch ") + side + " to binary mode: " + errorText(err));
        return nullptr;
    }
    emit(ctx, LogLevel::Debug, Stage::ChangeDirectory, {},
         std::string(side) + " directory is " + conn->directory());
    return conn;
}

int TransferPipeline::run(const ConfigEntry& entry, int worker) {
    FileContext ctx;
    ctx.entry = &entry;
    ctx.worker = worker;
    ctx.label = describeEndpoint(entry.from) + " -> " + describeEndpoint(entry.to);

    auto src = openSide(entry.from, "source", ctx);
    if (!src)
        return 0;
    auto dst = openSide(entry.to, "destination", ctx);
    if (!dst) {
        src->close();
        return 0;
    }

    std::vector<std::string> names;
    ClientError err;
    if (!src->client().list(names, err)) {
        emit(ctx, LogLevel::Error, Stage::List, {},
             "Cannot list source directory " + src->directory() + ": " + errorText(err));
        src->close();
        dst->close();
        return 0;
    }
    emit(ctx, LogLevel::Debug, Stage::List, {},
         std::to_string(names.size()) + " name(s) in " + src->directory());

    int transferred = 0;
    for (const std::string& name : names) {
        if (shutdown_.shutdownRequested()) {
            emit(ctx, LogLevel::Warning, Stage::Shutdown, {},
                 "Shutdown requested, not starting further files");
            break;
        }
        if (processFile(*src, *dst, name, ctx) == FileResult::Transferred)
            ++transferred;
    }

    src->close();
    dst->close();
    emit(ctx, LogLevel::Debug, Stage::Close, {}, "connections closed");
    emit(ctx, LogLevel::Info, Stage::Summary, {},
         "Successfully transferred " + std::to_string(transferred) + " files out of " +
             std::to_string(names.size()));
    return transferred;
}

bool TransferPipeline::selectFile(Connection& src, const std::string& name,
                                  std::uint64_t& size, FileContext& ctx) {
    ClientError err;
    const ConfigEntry& entry = *ctx.entry;
    if (entry.min_age_seconds > 0) {
        std::int64_t mtime = 0;
        if (!src.client().modTime(name, mtime, err)) {
            emit(ctx, LogLevel::Warning, Stage::Filter, name,
                 "Cannot get modification time, skipping: " + errorText(err));
            return false;
        }
        const std::int64_t age = opt_.now() - mtime;
        if (age < static_cast<std::int64_t>(entry.min_age_seconds)) {
            emit(ctx, LogLevel::Debug, Stage::Filter, name,
                 "Skipping file, age " + std::to_string(age) + "s is below " +
                     std::to_string(entry.min_age_seconds) + "s");
            return false;
        }
    }
    if (!src.client().size(name, size, err)) {
        emit(ctx, LogLevel::Warning, Stage::Select, name,
             "Cannot get file size, skipping: " + errorText(err));
        return false;
    }
    return true;
}

bool TransferPipeline::verifySize(Connection& dst, const std::string& name,
                                  std::uint64_t expected, FileContext& ctx) {
    ClientError err;
    std::uint64_t actual = 0;
    if (!dst.client().size(name, actual, err)) {
        emit(ctx, LogLevel::Error, Stage::Verify, name,
             "VerificationError: cannot get destination size: " + errorText(err));
        return false;
    }
    if (actual != expected) {
        emit(ctx, LogLevel::Error, Stage::Verify, name,
             "VerificationError: destination has " + std::to_string(actual) +
                 " bytes, source has " + std::to_string(expected));
        return false;
    }
    emit(ctx, LogLevel::Debug, Stage::Verify, name,
         "size verified (" + std::to_string(actual) + " bytes)");
    return true;
}

bool TransferPipeline::renameWithFallback(Connection& dst, const std::string& tmp,
                                          const std::string& name, FileContext& ctx) {
    ClientError err;
    if (dst.client().rename(tmp, name, err))
        return true;

    // Not atomic: between remove() and the retry the final name is absent.
    emit(ctx, LogLevel::Warning, Stage::Rename, name,
         "Rename of " + tmp + " failed (" + errorText(err) +
             "), removing existing file and retrying");
    ClientError rmErr;
    if (!dst.client().remove(name, rmErr)) {
        emit(ctx, LogLevel::Warning, Stage::Rename, name,
             "Cannot remove existing destination file: " + errorText(rmErr));
    }
    err.clear();
    if (!dst.client().rename(tmp, name, err)) {
        emit(ctx, LogLevel::Error, Stage::Rename, name,
             "RenameError: " + tmp + " -> " + name + ": " + errorText(err));
        return false;
    }
    return true;
}

void TransferPipeline::discardTemporary(Connection& dst, const std::string& tmp,
                                        FileContext& ctx) {
    ClientError err;
    if (!dst.client().remove(tmp, err)) {
        emit(ctx, LogLevel::Warning, Stage::Upload, tmp,
             "Cannot remove temporary file: " + errorText(err));
    }
}

TransferPipeline::FileResult TransferPipeline::processFile(Connection& src,
                                                           Connection& dst,
                                                           const std::string& name,
                                                           FileContext& ctx) {
    if (isTemporaryName(name)) {
        emit(ctx, LogLevel::Debug, Stage::Filter, name, "Skipping in-flight temporary file");
        return FileResult::Skipped;
    }
    if (!ctx.entry->matches(name)) {
        emit(ctx, LogLevel::Debug, Stage::Filter, name,
             "Skipping file, name does not match " + ctx.entry->pattern_text);
        return FileResult::Skipped;
    }

    std::uint64_t size = 0;
    if (!selectFile(src, name, size, ctx))
        return FileResult::Skipped;
    emit(ctx, LogLevel::Info, Stage::Select, name,
         "Transferring file (" + std::to_string(size) + " bytes)");

    std::string why;
    const std::string scratch = opt_.scratch_dir.empty() ? defaultScratchDirectory()
                                                         : opt_.scratch_dir;
    std::unique_ptr<TransferBuffer> buffer =
        makeTransferBuffer(size, opt_.ram_threshold, scratch, why);
    if (!buffer) {
        emit(ctx, LogLevel::Error, Stage::Download, name, "Cannot create buffer: " + why);
        return FileResult::Failed;
    }
    emit(ctx, LogLevel::Debug, Stage::Download, name,
         std::string("using ") + bufferKindName(buffer->kind()) + " buffer" +
             (buffer->path().empty() ? std::string() : " " + buffer->path()));

    ClientError err;
    if (!src.client().download(name, *buffer, err)) {
        emit(ctx, LogLevel::Error, Stage::Download, name, "Download failed: " + errorText(err));
        return FileResult::Failed;
    }
    if (buffer->size() != size) {
        emit(ctx, LogLevel::Error, Stage::Download, name,
             "Downloaded " + std::to_string(buffer->size()) + " bytes, expected " +
                 std::to_string(size));
        return FileResult::Failed;
    }
    if (!buffer->rewind(why)) {
        emit(ctx, LogLevel::Error, Stage::Download, name, "IoError: " + why);
        return FileResult::Failed;
    }

    const std::string tmp = temporaryNameFor(name);
    emit(ctx, LogLevel::Debug, Stage::Upload, name, "uploading as " + tmp);
    if (!dst.client().upload(tmp, *buffer, err)) {
        emit(ctx, LogLevel::Error, Stage::Upload, name, "Upload failed: " + errorText(err));
        discardTemporary(dst, tmp, ctx);
        return FileResult::Failed;
    }
    if (!verifySize(dst, tmp, size, ctx)) {
        discardTemporary(dst, tmp, ctx);
        return FileResult::Failed;
    }
    if (!renameWithFallback(dst, tmp, name, ctx)) {
        discardTemporary(dst, tmp, ctx);
        return FileResult::Failed;
    }
    if (!verifySize(dst, name, size, ctx))
        return FileResult::Failed;

    if (opt_.delete_source) {
        err.clear();
        if (!src.client().remove(name, err)) {
            emit(ctx, LogLevel::Error, Stage::DeleteSource, name,
                 "Cannot delete source file: " + errorText(err));
        } else {
            emit(ctx, LogLevel::Info, Stage::DeleteSource, name, "Deleted source file");
        }
    }
    emit(ctx, LogLevel::Info, Stage::Rename, name, "Transferred");
    return FileResult::Transferred;
}

} // namespace iftpfm
