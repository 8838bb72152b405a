// Transfer buffer selection and scratch-file lifetime.
#include "iftpfm/TransferBuffer.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

bool fileExists(const std::string &path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0;
}

std::string makeScratchDir() {
    char tmpl[] = "/tmp/iftpfm-buffer-test-XXXXXX";
    const char *dir = ::mkdtemp(tmpl);
    return dir ? std::string(dir) : std::string();
}

void test_selection_policy(TestContext &t) {
    using iftpfm::BufferKind;
    using iftpfm::chooseBufferKind;
    t.check(chooseBufferKind(0, 100) == BufferKind::Memory, "0 bytes fit in memory");
    t.check(chooseBufferKind(100, 100) == BufferKind::Memory, "size == threshold is memory");
    t.check(chooseBufferKind(101, 100) == BufferKind::Disk, "size > threshold is disk");
    t.check(chooseBufferKind(0, 0) == BufferKind::Memory, "threshold 0 with empty file is memory");
    t.check(chooseBufferKind(1ull << 40, 0) == BufferKind::Memory,
            "threshold 0 always selects memory");
    t.check(chooseBufferKind(6, iftpfm::kDefaultRamThreshold) == BufferKind::Memory,
            "small files use memory with the default threshold");
    t.check(chooseBufferKind(iftpfm::kDefaultRamThreshold + 1, iftpfm::kDefaultRamThreshold) ==
                BufferKind::Disk,
            "files above 10 MiB use disk with the default threshold");
}

void test_memory_buffer_roundtrip(TestContext &t) {
    iftpfm::MemoryTransferBuffer buf(6);
    std::string err;
    t.check(buf.write("abc", 3, err) && buf.write("def", 3, err), "memory writes succeed");
    t.check(buf.size() == 6, "memory buffer size counts written bytes");
    t.check(buf.rewind(err), "rewind succeeds");
    char out[4] = {};
    t.check(buf.read(out, 4, err) == 4 && std::string(out, 4) == "abcd", "first read");
    t.check(buf.read(out, 4, err) == 2 && std::string(out, 2) == "ef", "second read");
    t.check(buf.read(out, 4, err) == 0 && err.empty(), "end of data is 0 without error");
}

void test_disk_buffer_is_removed(TestContext &t) {
    const std::string dir = makeScratchDir();
    t.check(!dir.empty(), "scratch dir created");
    std::string path;
    {
        std::string err;
        auto buf = iftpfm::makeTransferBuffer(1024, 100, dir, err);
        t.check(buf != nullptr, "disk buffer created: " + err);
        if (!buf)
            return;
        t.check(buf->kind() == iftpfm::BufferKind::Disk, "size above threshold uses disk");
        path = buf->path();
        t.check(path.compare(0, dir.size(), dir) == 0, "disk buffer lives in the scratch dir");
        t.check(fileExists(path), "backing file exists while the buffer lives");

        std::vector<char> data(1024);
        for (std::size_t i = 0; i < data.size(); ++i)
            data[i] = static_cast<char>(i * 7);
        t.check(buf->write(data.data(), data.size(), err), "disk write succeeds");
        t.check(buf->size() == 1024, "disk size counts written bytes");
        t.check(buf->rewind(err), "disk rewind succeeds");
        std::vector<char> back(2048);
        const std::size_t n = buf->read(back.data(), back.size(), err);
        t.check(n == 1024, "disk read returns everything written");
        back.resize(n);
        t.check(back == data, "disk content survives the round trip");
    }
    t.check(!path.empty() && !fileExists(path), "backing file removed when the buffer is dropped");
    ::rmdir(dir.c_str());
}

void test_memory_choice_has_no_file(TestContext &t) {
    std::string err;
    auto buf = iftpfm::makeTransferBuffer(6, iftpfm::kDefaultRamThreshold, "/nonexistent", err);
    t.check(buf != nullptr, "memory buffer does not need the scratch dir");
    t.check(buf && buf->kind() == iftpfm::BufferKind::Memory, "memory kind");
    t.check(buf && buf->path().empty(), "memory buffer has no path");
}

void test_huge_announced_size(TestContext &t) {
    // A server may announce any size; with threshold 0 it still lands in memory.
    std::unique_ptr<iftpfm::TransferBuffer> buf;
    std::string err;
    bool wrote = false;
    std::string back;
    std::thread worker([&] {
        buf = iftpfm::makeTransferBuffer(1ull << 62, 0, "/tmp", err);
        if (!buf)
            return;
        std::string werr;
        wrote = buf->write("payload", 7, werr) && buf->rewind(werr);
        char out[8] = {};
        back.assign(out, buf->read(out, sizeof(out), werr));
    });
    worker.join();
    t.check(buf != nullptr, "huge announced size still yields a buffer: " + err);
    if (!buf)
        return;
    t.check(buf->kind() == iftpfm::BufferKind::Memory, "threshold 0 keeps it in memory");
    t.check(wrote && back == "payload", "buffer usable after a huge announcement");
    const auto *mem = dynamic_cast<const iftpfm::MemoryTransferBuffer *>(buf.get());
    t.check(mem && mem->bytes().capacity() < (64u << 20), "announced size is not pre-allocated");
}

void test_scratch_directory_check(TestContext &t) {
    const std::string dir = makeScratchDir();
    std::string err;
    t.check(iftpfm::checkScratchDirectory(dir, err), "writable scratch dir accepted");
    t.check(::rmdir(dir.c_str()) == 0, "check leaves no file behind");

    err.clear();
    t.check(!iftpfm::checkScratchDirectory("/nonexistent/iftpfm", err),
            "missing scratch dir rejected");
    t.check(!err.empty(), "rejection is explained");

    err.clear();
    auto buf = iftpfm::makeTransferBuffer(1000, 10, "/nonexistent/iftpfm", err);
    t.check(buf == nullptr && !err.empty(), "disk buffer in a missing dir fails with a message");
}

} // namespace

int main() {
    TestContext t;
    test_selection_policy(t);
    test_memory_buffer_roundtrip(t);
    test_disk_buffer_is_removed(t);
    test_memory_choice_has_no_file(t);
    test_huge_announced_size(t);
    test_scratch_directory_check(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] core_buffer_tests\n";
    return EXIT_SUCCESS;
}
