// Per-entry transfer state machine:
//   connect source -> connect destination -> list ->
//   { filter -> select -> download -> upload(temp) -> verify -> rename
//     -> delete source? } per file -> close.
// Entry-level failures (connect, login, cwd, list) end the entry with zero
// transfers; per-file failures skip that file only.
#pragma once
#include "RemoteClient.hpp"
#include "RuntimeLogging.hpp"
#include "ShutdownCoordinator.hpp"
#include "TransferBuffer.hpp"
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <string>

namespace iftpfm {

struct PipelineOptions {
    bool delete_source = false;
    std::chrono::seconds connect_timeout{30};
    std::uint64_t ram_threshold = kDefaultRamThreshold;
    std::string scratch_dir; // empty: defaultScratchDirectory()
    bool debug = false;
    // Wall clock used for age checks; replaceable in tests.
    std::function<std::int64_t()> now = [] {
        return static_cast<std::int64_t>(std::time(nullptr));
    };
};

// Destination name used while a file is in flight: ".<name>.<pid>.tmp".
std::string temporaryNameFor(const std::string& name);
bool isTemporaryName(const std::string& name);

// One live session plus the state tracked alongside it. Closes on destruction.
class Connection {
public:
    Connection(std::unique_ptr<RemoteClient> client, const char* side);
    ~Connection();
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    RemoteClient& client() { return *client_; }
    const char* side() const { return side_; }
    const std::string& directory() const { return directory_; }

    bool open(const Endpoint& ep, std::chrono::milliseconds timeout, ClientError& err);
    bool changeDirectory(const std::string& path, ClientError& err);
    bool ensureBinary(ClientError& err);
    void close();

private:
    std::unique_ptr<RemoteClient> client_;
    const char* side_;
    std::string directory_;
    bool binary_ = false;
};

class TransferPipeline {
public:
    TransferPipeline(PipelineOptions opt,
                     ClientFactory factory,
                     const ShutdownCoordinator& shutdown,
                     LogSink log);

    // Runs one entry and returns the number of files fully transferred.
    int run(const ConfigEntry& entry, int worker = 0);

private:
    struct FileContext;

    enum class FileResult { Skipped, Failed, Transferred };

    std::unique_ptr<Connection> openSide(const Endpoint& ep,
                                         const char* side,
                                         FileContext& ctx);
    FileResult processFile(Connection& src,
                           Connection& dst,
                           const std::string& name,
                           FileContext& ctx);
    bool selectFile(Connection& src, const std::string& name,
                    std::uint64_t& size, FileContext& ctx);
    bool verifySize(Connection& dst, const std::string& name,
                    std::uint64_t expected, FileContext& ctx);
    bool renameWithFallback(Connection& dst, const std::string& tmp,
                            const std::string& name, FileContext& ctx);
    void discardTemporary(Connection& dst, const std::string& tmp, FileContext& ctx);

    void emit(const FileContext& ctx, LogLevel level, Stage stage,
              const std::string& file, const std::string& message) const;

    PipelineOptions opt_;
    ClientFactory factory_;
    const ShutdownCoordinator& shutdown_;
    LogSink log_;
};

} // namespace iftpfm
