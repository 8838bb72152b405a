// URL construction of the libcurl FTP backend. connect() only records the
// endpoint, so no server is needed.
#include "iftpfm/CurlFtpClient.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

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

std::string urlFor(const std::string &host, const std::string &path, bool isDir) {
    iftpfm::CurlFtpClient client;
    iftpfm::ClientError err;
    if (!client.connect(host, 21, std::chrono::milliseconds(1000), err))
        return "connect failed: " + err.message;
    return client.urlFor(path, isDir);
}

void test_host_names(TestContext &t) {
    t.check(urlFor("ftp.example", "/in", true) == "ftp://ftp.example/%2fin/",
            "directory URL for a host name");
    t.check(urlFor("ftp.example", "/in/a b.txt", false) == "ftp://ftp.example/%2fin/a%20b.txt",
            "file name components are escaped");
    t.check(urlFor("192.0.2.7", "/", true) == "ftp://192.0.2.7/%2f/", "root directory of an IPv4 host");
}

void test_ipv6_literals(TestContext &t) {
    t.check(urlFor("::1", "/in", true) == "ftp://[::1]/%2fin/", "IPv6 loopback is bracketed");
    t.check(urlFor("2001:db8::21", "/in/a.txt", false) == "ftp://[2001:db8::21]/%2fin/a.txt",
            "IPv6 address is bracketed for files");
    t.check(urlFor("[::1]", "/in", true) == "ftp://[::1]/%2fin/",
            "already bracketed host is left alone");
}

} // namespace

int main() {
    TestContext t;
    test_host_names(t);
    test_ipv6_literals(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] core_curl_tests\n";
    return EXIT_SUCCESS;
}
