// Integration tests for Libssh2SftpClient against a real SFTP server.
// Skipped (exit code 77) unless the FERRY_IT_* env vars are set.
#include "ferry/Libssh2SftpClient.hpp"
#include "ferry/RemotePath.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    char *end = nullptr;
    const long n = std::strtol(raw->c_str(), &end, 10);
    if (!end || *end != '\0' || n < 1 || n > 65535)
        return false;
    out = static_cast<std::uint16_t>(n);
    return true;
}

std::string slurp(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
}

} // namespace

int main() {
    const auto host = envValue("FERRY_IT_SFTP_HOST");
    const auto user = envValue("FERRY_IT_SFTP_USER");
    const auto pass = envValue("FERRY_IT_SFTP_PASS");
    const auto keyPath = envValue("FERRY_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("FERRY_IT_SFTP_KEY_PASSPHRASE");
    const std::string remoteBase = envValue("FERRY_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] ferry_sftp_integration_tests requires env vars: "
                  << "FERRY_IT_SFTP_HOST, FERRY_IT_SFTP_USER and one auth method "
                  << "(FERRY_IT_SFTP_PASS or FERRY_IT_SFTP_KEY)\n";
        return kSkipExitCode;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("FERRY_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] FERRY_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    ferry::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    if (pass.has_value())
        opt.password = *pass;
    if (keyPath.has_value()) {
        opt.private_key_path = *keyPath;
        if (keyPassphrase.has_value())
            opt.private_key_passphrase = *keyPassphrase;
    }
    opt.known_hosts_policy = ferry::KnownHostsPolicy::Off;
    opt.connect_timeout_ms = 15000;
    opt.keepalive_interval_s = 30;

    const std::string token = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    const std::string suiteDir = ferry::joinRemotePath(remoteBase, "ferry-it-" + token);
    const std::string remoteSrc = ferry::joinRemotePath(suiteDir, "payload.bin");
    const std::string remoteMoved = ferry::joinRemotePath(suiteDir, "payload-moved.bin");
    const std::string remoteNote = ferry::joinRemotePath(suiteDir, "note.txt");

    const fs::path localRoot = fs::temp_directory_path() / ("ferry-it-" + token);
    std::error_code ec;
    fs::create_directories(localRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message() << "\n";
        return EXIT_FAILURE;
    }
    const fs::path localSrc = localRoot / "payload.bin";
    const fs::path localDst = localRoot / "payload-downloaded.bin";
    std::string payload(300 * 1024, '\0');
    for (std::size_t i = 0; i < payload.size(); ++i)
        payload[i] = static_cast<char>(i * 31 + 7);
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        out << payload;
    }

    ferry::Libssh2SftpClient client;
    std::string err;
    t.check(client.connect(opt, err), "connect should succeed: " + err);

    if (t.failures == 0) {
        std::string home;
        err.clear();
        t.check(client.realPath(".", home, err) && ferry::isAbsoluteRemotePath(home),
                "realPath(.) should be absolute: " + err);
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.mkdir(suiteDir, err, 0755), "mkdir suite dir should succeed: " + err);
    }
    if (t.failures == 0) {
        std::size_t lastDone = 0, steps = 0;
        err.clear();
        const bool ok = client.put(localSrc.string(), remoteSrc, err,
                                   [&](std::size_t done, std::size_t, std::size_t total) {
                                       lastDone = done;
                                       ++steps;
                                       t.check(total == payload.size(), "put step reports total");
                                   });
        t.check(ok, "put should succeed: " + err);
        t.check(steps > 1, "put should step more than once");
        t.check(lastDone == payload.size(), "put should report every byte");
    }
    if (t.failures == 0) {
        ferry::FileInfo st{};
        err.clear();
        t.check(client.stat(remoteSrc, st, err) && st.size == payload.size(),
                "remote size should match payload: " + err);
        bool isDir = true;
        t.check(client.exists(remoteSrc, isDir, err) && !isDir, "exists should report a file");
        err = "stale";
        t.check(!client.exists(remoteSrc + ".nope", isDir, err), "missing path should not exist");
        t.check(err.empty(), "missing path should not be an error");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.get(remoteSrc, localDst.string(), err), "get should succeed: " + err);
        t.check(slurp(localDst) == payload, "downloaded content should match");

        int polls = 0;
        err.clear();
        const bool cancelled = !client.get(remoteSrc, localDst.string(), err, {},
                                           [&]() { return ++polls > 1; });
        t.check(cancelled, "get should stop when cancelled");
        t.check(err.find("Canceled") != std::string::npos, "cancel should be reported");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.writeFile(remoteNote, "hello\n", err), "writeFile should succeed: " + err);
        std::string back;
        t.check(client.readFile(remoteNote, back, err) && back == "hello\n",
                "readFile should return written content: " + err);
        std::vector<ferry::FileInfo> entries;
        t.check(client.list(suiteDir, entries, err), "list should succeed: " + err);
        t.check(std::any_of(entries.begin(), entries.end(),
                            [](const ferry::FileInfo &e) { return e.name == "note.txt"; }),
                "list should include note.txt");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.rename(remoteSrc, remoteMoved, err), "rename should succeed: " + err);
        std::string second;
        auto other = client.newConnectionLike(opt, second);
        t.check(other && other->isConnected(), "newConnectionLike should connect: " + second);
        bool isDir = false;
        if (other)
            t.check(other->exists(remoteMoved, isDir, second), "second session sees the rename");
    }

    // Best-effort cleanup regardless of test result.
    std::string cleanupErr;
    (void)client.removeFile(remoteSrc, cleanupErr);
    (void)client.removeFile(remoteMoved, cleanupErr);
    (void)client.removeFile(remoteNote, cleanupErr);
    (void)client.removeDir(suiteDir, cleanupErr);
    client.disconnect();
    t.check(!client.isConnected(), "disconnect should drop the session");
    fs::remove_all(localRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] ferry_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
