#include "iftpfm/TransferBuffer.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>
#include <unistd.h>

namespace iftpfm {

namespace {

// The announced size comes from the server; never pre-allocate more than this.
constexpr std::uint64_t kMaxReserve = 4ull * 1024 * 1024;

} // namespace

const char* bufferKindName(BufferKind k) {
    return k == BufferKind::Memory ? "memory" : "disk";
}

BufferKind chooseBufferKind(std::uint64_t size, std::uint64_t threshold) {
    if (threshold == 0)
        return BufferKind::Memory;
    return size <= threshold ? BufferKind::Memory : BufferKind::Disk;
}

MemoryTransferBuffer::MemoryTransferBuffer(std::uint64_t expected) {
    data_.reserve(static_cast<std::size_t>(expected < kMaxReserve ? expected : kMaxReserve));
}

bool MemoryTransferBuffer::write(const char* data, std::size_t len, std::string& err) {
    try {
        data_.insert(data_.end(), data, data + len);
    } catch (const std::bad_alloc&) {
        err = "out of memory buffering " + std::to_string(data_.size() + len) + " bytes";
        return false;
    } catch (const std::length_error&) {
        err = "memory buffer limit reached at " + std::to_string(data_.size()) + " bytes";
        return false;
    }
    return true;
}

std::size_t MemoryTransferBuffer::read(char* data, std::size_t len, std::string&) {
    const std::size_t left = data_.size() - readPos_;
    const std::size_t n = len < left ? len : left;
    if (n > 0) {
        std::memcpy(data, data_.data() + readPos_, n);
        readPos_ += n;
    }
    return n;
}

bool MemoryTransferBuffer::rewind(std::string&) {
    readPos_ = 0;
    return true;
}

DiskTransferBuffer::DiskTransferBuffer(std::FILE* f, std::string path)
    : file_(f), path_(std::move(path)) {}

DiskTransferBuffer::~DiskTransferBuffer() {
    if (file_)
        std::fclose(file_);
    if (!path_.empty())
        ::unlink(path_.c_str());
}

std::unique_ptr<DiskTransferBuffer> DiskTransferBuffer::create(const std::string& dir,
                                                               std::string& err) {
    std::string tmpl = (dir.empty() ? defaultScratchDirectory() : dir);
    if (tmpl.back() != '/')
        tmpl += '/';
    tmpl += "iftpfm-buffer-XXXXXX";
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');
    const int fd = ::mkstemp(name.data());
    if (fd == -1) {
        err = "cannot create scratch file in " + dir + ": " + std::strerror(errno);
        return nullptr;
    }
    std::FILE* f = ::fdopen(fd, "w+b");
    if (!f) {
        err = std::string("fdopen failed: ") + std::strerror(errno);
        ::close(fd);
        ::unlink(name.data());
        return nullptr;
    }
    return std::unique_ptr<DiskTransferBuffer>(new DiskTransferBuffer(f, name.data()));
}

bool DiskTransferBuffer::write(const char* data, std::size_t len, std::string& err) {
    if (len == 0)
        return true;
    if (std::fwrite(data, 1, len, file_) != len) {
        err = "write to " + path_ + " failed: " + std::strerror(errno);
        return false;
    }
    size_ += len;
    return true;
}

std::size_t DiskTransferBuffer::read(char* data, std::size_t len, std::string& err) {
    const std::size_t n = std::fread(data, 1, len, file_);
    if (n == 0 && std::ferror(file_))
        err = "read from " + path_ + " failed: " + std::strerror(errno);
    return n;
}

bool DiskTransferBuffer::rewind(std::string& err) {
    if (std::fflush(file_) != 0 || std::fseek(file_, 0, SEEK_SET) != 0) {
        err = "rewind of " + path_ + " failed: " + std::strerror(errno);
        return false;
    }
    std::clearerr(file_);
    return true;
}

std::string defaultScratchDirectory() {
    const char* env = std::getenv("TMPDIR");
    if (env && *env)
        return env;
    return "/tmp";
}

bool checkScratchDirectory(const std::string& dir, std::string& err) {
    std::string why;
    auto scratch = DiskTransferBuffer::create(dir, why);
    if (!scratch) {
        err = "scratch directory unusable: " + why;
        return false;
    }
    if (!scratch->write("x", 1, why) || !scratch->rewind(why)) {
        err = "scratch directory unusable: " + why;
        return false;
    }
    return true;
}

std::unique_ptr<TransferBuffer> makeTransferBuffer(std::uint64_t size,
                                                   std::uint64_t threshold,
                                                   const std::string& scratchDir,
                                                   std::string& err) {
    if (chooseBufferKind(size, threshold) == BufferKind::Disk)
        return DiskTransferBuffer::create(scratchDir, err);
    try {
        return std::make_unique<MemoryTransferBuffer>(size);
    } catch (const std::bad_alloc&) {
        err = "out of memory allocating a buffer for " + std::to_string(size) + " bytes";
        return nullptr;
    }
}

} // namespace iftpfm
