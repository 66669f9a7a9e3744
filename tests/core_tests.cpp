// Core unit tests without external framework (run via CTest).
#include "ferry/Libssh2SftpClient.hpp"
#include "ferry/MockSftpClient.hpp"
#include "ferry/RemotePath.hpp"
#include "ferry/SpeedEstimator.hpp"
#include "ferry/TransferTracker.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <libssh2.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

// Manually advanced steady clock.
struct ManualClock {
    std::chrono::steady_clock::time_point now{std::chrono::steady_clock::time_point{} + 1h};
    ferry::TransferTracker::Clock fn() {
        return [this] { return now; };
    }
};

ferry::SessionOptions validOptions() {
    ferry::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

fs::path tempDir(const std::string &tag) {
    const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path p = fs::temp_directory_path() / ("ferry-core-" + tag + "-" + std::to_string(tick));
    fs::create_directories(p);
    return p;
}

void test_speed_math(TestContext &t) {
    using ferry::speed::bytesPerSecond;
    t.check(bytesPerSecond(0, 1000, 99ms) == 0,
            "samples closer than 100ms should report speed 0");
    t.check(bytesPerSecond(0, 1000, 100ms) == 10000,
            "1000 bytes in 100ms should be 10000 B/s");
    t.check(bytesPerSecond(5000, 4000, 1s) == 0,
            "byte count going backwards should report 0");
    t.check(bytesPerSecond(100, 100, 1s) == 0, "no progress should report 0");
    t.check(bytesPerSecond(0, 1, 3s) == 0, "0.33 B/s should round to 0");
    t.check(bytesPerSecond(0, 2, 3s) == 1, "0.67 B/s should round to 1");

    using ferry::speed::remainingSeconds;
    t.check(remainingSeconds(0, 1000, 0) == 0, "no speed means no ETA");
    t.check(remainingSeconds(500, 1000, 100) == 5, "500 bytes at 100 B/s is 5s");
    t.check(remainingSeconds(1000, 1000, 100) == 0, "finished transfer has ETA 0");
    t.check(remainingSeconds(2000, 1000, 100) == 0, "overshoot never goes negative");

    using ferry::speed::percent;
    t.check(percent(0, 0) == 0, "unknown total reports 0%");
    t.check(percent(1, 3) == 33, "1/3 rounds to 33%");
    t.check(percent(2, 3) == 67, "2/3 rounds to 67%");
    t.check(percent(10, 5) == 100, "percent is clamped at 100");
}

void test_remote_paths(TestContext &t) {
    t.check(ferry::normalizeRemotePath("~") == ".", "~ maps to the working directory");
    t.check(ferry::normalizeRemotePath("") == ".", "empty path maps to the working directory");
    t.check(ferry::normalizeRemotePath("~/docs/a.txt") == "docs/a.txt", "leading ~/ is stripped");
    t.check(ferry::normalizeRemotePath("/etc/hosts") == "/etc/hosts", "absolute paths are kept");
    t.check(ferry::normalizeRemotePath("~user") == "~user", "~user is left alone");

    t.check(ferry::joinRemotePath("/home/a", "x") == "/home/a/x", "join adds a separator");
    t.check(ferry::joinRemotePath("/", "etc") == "/etc", "join under root");
    t.check(ferry::joinRemotePath("/home/a/", "x") == "/home/a/x", "join keeps a single separator");
    t.check(ferry::joinRemotePath(".", "x") == "x", "join under . stays relative");

    t.check(ferry::remoteBaseName("/a/b/") == "b", "base name ignores trailing slash");
    t.check(ferry::remoteBaseName("/") == "/", "base name of root");
    t.check(ferry::remoteBaseName("file.txt") == "file.txt", "base name of a bare name");
    t.check(ferry::remoteParent("/a/b") == "/a", "parent of nested path");
    t.check(ferry::remoteParent("/a") == "/", "parent of top-level entry is root");
    t.check(ferry::remoteParent("b") == "", "relative name has no parent");
}

void test_tracker_lifecycle(TestContext &t) {
    ManualClock clock;
    ferry::TransferTracker tracker(clock.fn());

    ferry::TransferMeta meta;
    meta.type = ferry::TransferType::Download;
    meta.fileName = "big.iso";
    meta.totalBytes = 1000;
    t.check(tracker.begin("download-1", meta), "begin should register the transfer");
    t.check(!tracker.begin("download-1", meta), "begin should refuse a live id");
    t.check(tracker.size() == 1, "tracker should hold one record");

    clock.now += 50ms;
    auto ev = tracker.update("download-1", 100, 1000);
    t.check(ev.has_value(), "update of a live id should yield an event");
    t.check(ev && ev->transferSpeed == 0, "first sample under 100ms reports speed 0");
    t.check(ev && ev->progress == 10, "100/1000 is 10%");
    t.check(ev && ev->fileName == "big.iso", "event carries the file name");

    clock.now += 500ms;
    ev = tracker.update("download-1", 600, 1000);
    t.check(ev && ev->transferSpeed == 1000, "500 bytes in 500ms is 1000 B/s");
    t.check(ev && ev->remainingTime == 0, "400 bytes at 1000 B/s rounds to 0s");

    clock.now += 100ms;
    ev = tracker.update("download-1", 700, 1000);
    t.check(ev && ev->transferSpeed == 1000, "only the latest sample counts");
    t.check(ev && ev->remainingTime == 0, "300 bytes at 1000 B/s rounds to 0s");

    const auto rec = tracker.find("download-1");
    t.check(rec && rec->lastBytes == 700, "lastBytes follows the latest sample");
    t.check(rec && rec->transferredBytes == 700, "transferredBytes follows the latest sample");

    tracker.end("download-1");
    t.check(!tracker.contains("download-1"), "end should drop the record");
    t.check(!tracker.update("download-1", 800, 1000).has_value(),
            "update after end should yield nothing");
}

void test_tracker_cancellation(TestContext &t) {
    ferry::TransferTracker tracker;
    t.check(!tracker.requestCancel("nope"), "cancel of an unknown id should fail");
    t.check(tracker.pendingCancellations() == 0, "unknown cancel leaves no flag");

    ferry::TransferMeta meta;
    meta.totalBytes = 10;
    tracker.begin("upload-1", meta);
    t.check(tracker.requestCancel("upload-1"), "cancel of a live id should succeed");
    t.check(tracker.isCancelRequested("upload-1"), "flag should be visible");

    tracker.end("upload-1");
    t.check(!tracker.isCancelRequested("upload-1"), "end should clear the flag");
    t.check(tracker.pendingCancellations() == 0, "no flag should survive end");

    tracker.begin("upload-1", meta);
    t.check(!tracker.isCancelRequested("upload-1"), "reused id should start uncancelled");
    tracker.end("upload-1");
}

void test_mock_connect_validation(TestContext &t) {
    ferry::MockSftpClient c;
    std::string err;
    ferry::SessionOptions opt;
    opt.username = "alice";
    t.check(!c.connect(opt, err), "connect should fail when host is empty");
    t.check(!err.empty(), "connect failure should explain itself");

    err.clear();
    opt.host = "example.test";
    t.check(c.connect(opt, err), "connect should succeed with host+username");
    t.check(c.isConnected(), "client should report connected");
    c.disconnect();
    t.check(!c.isConnected(), "disconnect should flip isConnected");
    t.check(c.state()->disconnects.load() == 1, "disconnect should be counted");

    std::vector<ferry::FileInfo> out;
    err.clear();
    t.check(!c.list("/", out, err), "list should fail while disconnected");
}

void test_mock_listing(TestContext &t) {
    ferry::MockSftpClient c;
    std::string err;
    c.connect(validOptions(), err);

    std::vector<ferry::FileInfo> out;
    t.check(c.list("/", out, err), "list(/) should succeed");
    t.check(out.size() == 3, "root holds home, var and readme.txt");
    t.check(!out.empty() && out.front().is_dir, "directories come first");
    t.check(!out.empty() && out.back().name == "readme.txt", "files come last");

    out.clear();
    t.check(c.list(".", out, err), "list(.) should list the home directory");
    bool sawNotes = false;
    for (const auto &e : out)
        sawNotes = sawNotes || e.name == "notes.md";
    t.check(sawNotes, "home should contain notes.md");

    std::string resolved;
    t.check(c.realPath(".", resolved, err) && resolved == "/home/alice",
            "realPath(.) should be the home directory");
    t.check(c.realPath("projects/../notes.md", resolved, err) &&
                resolved == "/home/alice/notes.md",
            "realPath should collapse ..");

    err.clear();
    t.check(!c.list("/missing", out, err), "missing directory should fail");
    t.checkContains(err, "not found", "missing directory error should say so");
}

void test_mock_transfers(TestContext &t) {
    ferry::MockSftpClient c;
    std::string err;
    c.connect(validOptions(), err);
    c.state()->chunkSize = 100;

    const fs::path dir = tempDir("xfer");
    const fs::path src = dir / "src.bin";
    {
        std::ofstream out(src, std::ios::binary);
        out << std::string(250, 'x');
    }

    std::vector<std::size_t> steps;
    auto step = [&](std::size_t done, std::size_t, std::size_t total) {
        steps.push_back(done);
        t.check(total == 250, "step should report the full size");
    };
    t.check(c.put(src.string(), "/home/alice/up.bin", err, step),
            "put should succeed: " + err);
    t.check(steps == std::vector<std::size_t>({100, 200, 250}),
            "put should step per chunk");

    ferry::FileInfo info;
    t.check(c.stat("/home/alice/up.bin", info, err) && info.size == 250,
            "uploaded file should have 250 bytes");

    const fs::path dst = dir / "down.bin";
    steps.clear();
    t.check(c.get("up.bin", dst.string(), err, step), "get should succeed: " + err);
    t.check(steps.size() == 3, "get should step per chunk");
    std::ifstream in(dst, std::ios::binary);
    const std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    t.check(data == std::string(250, 'x'), "downloaded content should match");

    int polls = 0;
    auto cancelSecond = [&]() { return ++polls >= 2; };
    err.clear();
    t.check(!c.put(src.string(), "/home/alice/cancel.bin", err, {}, cancelSecond),
            "put should stop when cancelled");
    t.checkContains(err, "Canceled", "cancel should be reported");

    c.state()->failAfterBytes = 150;
    err.clear();
    t.check(!c.get("/home/alice/up.bin", dst.string(), err),
            "get should fail past failAfterBytes");
    t.checkContains(err, "failed", "injected failure should be reported");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_mock_mutations(TestContext &t) {
    ferry::MockSftpClient c;
    std::string err;
    c.connect(validOptions(), err);

    t.check(c.mkdir("/srv", err), "mkdir should succeed");
    t.check(!c.mkdir("/srv", err), "mkdir of an existing path should fail");
    t.check(!c.mkdir("/nope/deeper", err), "mkdir without a parent should fail");
    t.check(c.writeFile("/srv/a.txt", "hello", err), "writeFile should succeed");
    t.check(c.mkdir("/srv-b", err), "sibling with a shared prefix is fine");

    std::string content;
    t.check(c.readFile("/srv/a.txt", content, err) && content == "hello",
            "readFile should return written content");

    err.clear();
    t.check(!c.removeDir("/srv", err), "removeDir should refuse a non-empty directory");
    t.check(c.removeDir("/srv-b", err), "removeDir of an empty directory should succeed");

    t.check(c.rename("/srv", "/opt", err), "rename should move a directory");
    bool isDir = false;
    t.check(c.exists("/opt/a.txt", isDir, err) && !isDir, "children move with the directory");
    err = "stale";
    t.check(!c.exists("/srv/a.txt", isDir, err), "old path should be gone");
    t.check(err.empty(), "missing path should not be an error");

    t.check(c.removeFile("/opt/a.txt", err), "removeFile should succeed");
    t.check(c.removeDir("/opt", err), "emptied directory can be removed");
}

void test_mock_connection_like(TestContext &t) {
    ferry::MockSftpClient proto;
    std::string err;
    auto conn = proto.newConnectionLike(validOptions(), err);
    t.check(static_cast<bool>(conn), "newConnectionLike should return a client");
    t.check(conn && conn->isConnected(), "new client should be connected");
    t.check(proto.state()->connectAttempts.load() == 1, "one connect should be counted");
    t.check(conn && conn->writeFile("/shared.txt", "x", err), "write through the new client");
    bool isDir = false;
    proto.connect(validOptions(), err);
    t.check(proto.exists("/shared.txt", isDir, err), "clients share one remote state");

    proto.state()->connectError = "Connection refused";
    err.clear();
    t.check(!proto.newConnectionLike(validOptions(), err), "injected connect error should fail");
    t.check(err == "Connection refused", "injected connect error should be reported");
}

void test_mock_unreadable_and_host_keys(TestContext &t) {
    ferry::MockSftpClient c;
    std::string err;
    t.check(c.connect(validOptions(), err), "mock connect");
    c.state()->unreadable.insert("/home/alice/notes.md");

    ferry::FileInfo info;
    t.check(c.stat("notes.md", info, err), "unreadable file still stats");
    std::string body;
    t.check(!c.readFile("notes.md", body, err), "unreadable file cannot be read");
    t.check(err == "Could not open remote file for reading", "read error text");

    const fs::path dir = tempDir("unreadable");
    const fs::path dst = dir / "notes.md";
    err.clear();
    t.check(!c.get("notes.md", dst.string(), err), "unreadable file cannot be downloaded");
    t.check(!fs::exists(dst), "failed open must not create the local file");
    fs::remove_all(dir);

    c.state()->unknownHostKey = true;
    ferry::SessionOptions strict = validOptions();
    err.clear();
    t.check(!c.newConnectionLike(strict, err), "strict policy rejects an unknown host key");

    ferry::SessionOptions acceptNew = validOptions();
    acceptNew.known_hosts_policy = ferry::KnownHostsPolicy::AcceptNew;
    std::string seenFingerprint;
    acceptNew.hostkey_confirm_cb = [&](const std::string &, std::uint16_t,
                                       const std::string &, const std::string &fp) {
        seenFingerprint = fp;
        return true;
    };
    err.clear();
    t.check(static_cast<bool>(c.newConnectionLike(acceptNew, err)), "confirmed host key connects");
    t.checkContains(seenFingerprint, "SHA256:", "confirm callback receives the fingerprint");

    ferry::SessionOptions off = validOptions();
    off.known_hosts_policy = ferry::KnownHostsPolicy::Off;
    err.clear();
    t.check(static_cast<bool>(c.newConnectionLike(off, err)), "policy off skips host key checks");
}

void test_libssh2_session_loss(TestContext &t) {
    using ferry::Libssh2SftpClient;
    t.check(Libssh2SftpClient::isSessionLost(LIBSSH2_ERROR_SOCKET_DISCONNECT), "peer disconnect loses the session");
    t.check(Libssh2SftpClient::isSessionLost(LIBSSH2_ERROR_SOCKET_SEND), "send failure loses the session");
    t.check(Libssh2SftpClient::isSessionLost(LIBSSH2_ERROR_SOCKET_RECV), "recv failure loses the session");
    t.check(Libssh2SftpClient::isSessionLost(LIBSSH2_ERROR_SOCKET_TIMEOUT), "socket timeout loses the session");
    t.check(Libssh2SftpClient::isSessionLost(LIBSSH2_ERROR_TIMEOUT), "blocking timeout loses the session");
    t.check(Libssh2SftpClient::isSessionLost(LIBSSH2_ERROR_DECRYPT), "decrypt failure loses the session");

    t.check(!Libssh2SftpClient::isSessionLost(LIBSSH2_ERROR_NONE), "no error keeps the session");
    t.check(!Libssh2SftpClient::isSessionLost(LIBSSH2_ERROR_SFTP_PROTOCOL), "SFTP status errors keep the session");
    t.check(!Libssh2SftpClient::isSessionLost(LIBSSH2_ERROR_EAGAIN), "EAGAIN keeps the session");
    t.check(!Libssh2SftpClient::isSessionLost(LIBSSH2_ERROR_AUTHENTICATION_FAILED), "auth failures keep the session");

    // A client that never connected reports so without touching libssh2.
    Libssh2SftpClient idle;
    std::string err;
    ferry::FileInfo info;
    t.check(!idle.isConnected(), "fresh libssh2 client is not connected");
    t.check(!idle.stat("/", info, err) && err == "Not connected", "stat on a fresh client fails cleanly");
}

} // namespace

int main() {
    TestContext t;
    test_speed_math(t);
    test_remote_paths(t);
    test_tracker_lifecycle(t);
    test_tracker_cancellation(t);
    test_mock_connect_validation(t);
    test_mock_listing(t);
    test_mock_transfers(t);
    test_mock_mutations(t);
    test_mock_connection_like(t);
    test_mock_unreadable_and_host_keys(t);
    test_libssh2_session_loss(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] ferry_core_tests\n";
    return EXIT_SUCCESS;
}
