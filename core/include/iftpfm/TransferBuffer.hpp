// Scratch storage for one file between download and upload: RAM for small
// files, a temporary file on disk for large ones.
#pragma once
#include "RemoteClient.hpp"
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace iftpfm {

constexpr std::uint64_t kDefaultRamThreshold = 10ull * 1024 * 1024;

enum class BufferKind { Memory, Disk };

const char* bufferKindName(BufferKind k);

// threshold == 0 always selects memory; otherwise size <= threshold selects
// memory and anything larger goes to disk.
BufferKind chooseBufferKind(std::uint64_t size, std::uint64_t threshold);

// Written once by download(), then rewound and read once by upload().
class TransferBuffer : public ByteSink, public ByteSource {
public:
    virtual BufferKind kind() const = 0;
    // Switches from writing to reading.
    virtual bool rewind(std::string& err) = 0;
    // Backing file, empty for memory buffers.
    virtual std::string path() const { return {}; }
};

class MemoryTransferBuffer : public TransferBuffer {
public:
    explicit MemoryTransferBuffer(std::uint64_t expected = 0);

    bool write(const char* data, std::size_t len, std::string& err) override;
    std::size_t read(char* data, std::size_t len, std::string& err) override;
    std::uint64_t size() const override { return data_.size(); }
    BufferKind kind() const override { return BufferKind::Memory; }
    bool rewind(std::string& err) override;

    const std::vector<char>& bytes() const { return data_; }

private:
    std::vector<char> data_;
    std::size_t readPos_ = 0;
};

// Temporary file created with mkstemp() in the scratch directory and removed
// by the destructor whatever the outcome of the transfer.
class DiskTransferBuffer : public TransferBuffer {
public:
    ~DiskTransferBuffer() override;
    DiskTransferBuffer(const DiskTransferBuffer&) = delete;
    DiskTransferBuffer& operator=(const DiskTransferBuffer&) = delete;

    static std::unique_ptr<DiskTransferBuffer> create(const std::string& dir,
                                                      std::string& err);

    bool write(const char* data, std::size_t len, std::string& err) override;
    std::size_t read(char* data, std::size_t len, std::string& err) override;
    std::uint64_t size() const override { return size_; }
    BufferKind kind() const override { return BufferKind::Disk; }
    bool rewind(std::string& err) override;
    std::string path() const override { return path_; }

private:
    DiskTransferBuffer(std::FILE* f, std::string path);

    std::FILE* file_ = nullptr;
    std::string path_;
    std::uint64_t size_ = 0;
};

// Directory used when no scratch directory is configured (TMPDIR or /tmp).
std::string defaultScratchDirectory();

// Creates and removes a file to prove the scratch directory is usable.
bool checkScratchDirectory(const std::string& dir, std::string& err);

// Allocates the buffer chosen by chooseBufferKind(size, threshold).
std::unique_ptr<TransferBuffer> makeTransferBuffer(std::uint64_t size,
                                                   std::uint64_t threshold,
                                                   const std::string& scratchDir,
                                                   std::string& err);

} // namespace iftpfm
