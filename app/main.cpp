// ferry: command-line front end over TransferService.
// Usage: ferry --host H --user U <command> [args...]
#include "InterruptRouter.hpp"
#include "ServiceSettings.hpp"
#include "TransferService.hpp"
#include "ferry/Libssh2SftpClient.hpp"
#include "ferry/MockSftpClient.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>

namespace {

std::atomic<InterruptRouter*> g_router{nullptr};

// Cancels the running transfer; with none running, dies of SIGINT as usual.
void onSigint(int sig) {
    InterruptRouter* router = g_router.load();
    if (router && router->interrupt() == InterruptRouter::Action::CancelTransfer)
        return;
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

// Routes SIGINT to the router for the lifetime of the scope.
struct SigintScope {
    explicit SigintScope(InterruptRouter& router) {
        g_router = &router;
        std::signal(SIGINT, onSigint);
    }
    ~SigintScope() {
        std::signal(SIGINT, SIG_DFL);
        g_router = nullptr;
    }
};

// In-place progress line on stderr.
void printProgress(const ferry::ProgressEvent& ev) {
    std::fprintf(stderr, "\r%s %3d%%  %llu/%llu bytes  %llu B/s  eta %llus   ",
                 ev.fileName.c_str(), ev.progress,
                 (unsigned long long)ev.transferredBytes,
                 (unsigned long long)ev.totalBytes,
                 (unsigned long long)ev.transferSpeed,
                 (unsigned long long)ev.remainingTime);
    if (ev.progress >= 100)
        std::fputc('\n', stderr);
}

int report(bool success, ErrorKind kind, const std::string& message, const std::string& error) {
    if (success) {
        if (!message.empty())
            std::cout << message << "\n";
        return EXIT_SUCCESS;
    }
    std::cerr << "ferry: " << errorKindName(kind) << " error: " << error << "\n";
    return EXIT_FAILURE;
}

int report(const OpResult& r) {
    return report(r.success, r.errorKind, r.message, r.error);
}

int reportTransfer(const TransferResult& r) {
    if (r.cancelled) {
        std::cerr << "ferry: transfer " << r.transferId << " cancelled\n";
        return 130;
    }
    return report(r.success, r.errorKind, r.message, r.error);
}

bool needArgs(const QStringList& args, int n, const char* usage) {
    if (args.size() >= n + 1)
        return true;
    std::cerr << "usage: ferry [options] " << usage << "\n";
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Ferry");
    QCoreApplication::setApplicationName("Ferry");
    QCoreApplication::setApplicationVersion("0.3.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Pooled SFTP transfers.\n"
        "Commands: ls [dir] | get <remote> <local> | put <local> <remote> |\n"
        "          put-dir <localDir> <remoteDir> | rm [-r] <path> | mv <from> <to> |\n"
        "          mkdir <path> | touch <path> [content] | preview <path>\n"
        "The password is read from FERRY_PASSWORD.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption hostOpt({"H", "host"}, "Remote host.", "host");
    QCommandLineOption portOpt({"p", "port"}, "SSH port (default 22).", "port", "22");
    QCommandLineOption userOpt({"u", "user"}, "User name.", "user");
    QCommandLineOption keyOpt({"i", "identity"}, "Private key file.", "path");
    QCommandLineOption knownHostsOpt("known-hosts", "known_hosts file.", "path");
    QCommandLineOption policyOpt("host-key-policy", "strict, accept-new or off (default strict).",
                                 "policy", "strict");
    QCommandLineOption connectTimeoutOpt("connect-timeout-ms", "Connection setup timeout.", "ms");
    QCommandLineOption idleTimeoutOpt("idle-timeout-ms", "Idle session timeout.", "ms");
    QCommandLineOption mockOpt("mock", "Use the in-memory backend instead of a real server.");
    parser.addOptions({hostOpt, portOpt, userOpt, keyOpt, knownHostsOpt, policyOpt,
                       connectTimeoutOpt, idleTimeoutOpt, mockOpt});
    parser.addPositionalArgument("command", "Command to run.");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(2);

    ServiceSettings settings = ServiceSettings::loadDefault();
    bool ok = false;
    if (parser.isSet(idleTimeoutOpt)) {
        const int v = parser.value(idleTimeoutOpt).toInt(&ok);
        if (ok && v > 0) settings.idleTimeoutMs = v;
    }
    if (parser.isSet(connectTimeoutOpt)) {
        const int v = parser.value(connectTimeoutOpt).toInt(&ok);
        if (ok && v > 0) settings.connectTimeoutMs = v;
    }
    // One-shot process: nothing lives long enough to need sweeping.
    settings.reaperEnabled = false;

    ferry::SessionOptions conn;
    conn.host = parser.value(hostOpt).toStdString();
    conn.username = parser.value(userOpt).toStdString();
    const uint port = parser.value(portOpt).toUInt(&ok);
    if (!ok || port == 0 || port > 65535) {
        std::cerr << "ferry: invalid port\n";
        return 2;
    }
    conn.port = static_cast<std::uint16_t>(port);
    if (const char* pw = std::getenv("FERRY_PASSWORD"))
        conn.password = std::string(pw);
    if (parser.isSet(keyOpt))
        conn.private_key_path = parser.value(keyOpt).toStdString();
    if (parser.isSet(knownHostsOpt))
        conn.known_hosts_path = parser.value(knownHostsOpt).toStdString();
    const QString policy = parser.value(policyOpt).toLower();
    if (policy == "off") {
        conn.known_hosts_policy = ferry::KnownHostsPolicy::Off;
    } else if (policy == "accept-new") {
        conn.known_hosts_policy = ferry::KnownHostsPolicy::AcceptNew;
        conn.hostkey_confirm_cb = [](const std::string& host, std::uint16_t p,
                                     const std::string& alg, const std::string& fp) {
            std::cerr << "Accepting new host key for " << host << ":" << p
                      << " (" << alg << ") " << fp << "\n";
            return true;
        };
    } else if (policy != "strict") {
        std::cerr << "ferry: unknown host key policy: " << policy.toStdString() << "\n";
        return 2;
    }

    std::shared_ptr<ferry::SftpClient> backend;
    if (parser.isSet(mockOpt))
        backend = std::make_shared<ferry::MockSftpClient>();
    else
        backend = std::make_shared<ferry::Libssh2SftpClient>();
    TransferService service(backend, settings);

    // Ctrl+C cancels the running transfer at the next chunk boundary.
    InterruptRouter router(service);
    SigintScope sigint(router);
    TransferOptions xferOpts;
    xferOpts.onProgress = printProgress;

    const QString cmd = args.at(0);
    auto arg = [&args](int i) { return args.at(i).toStdString(); };
    int rc = EXIT_FAILURE;

    if (cmd == "ls") {
        const ListResult r = service.listFiles(conn, args.size() > 1 ? arg(1) : std::string("~"));
        if (r.success) {
            for (const auto& e : r.data) {
                std::printf("%s %12llu  %s  %s\n", e.isDirectory ? "d" : "-",
                            (unsigned long long)e.size, e.mtime.c_str(), e.path.c_str());
            }
        }
        rc = report(r.success, r.errorKind, {}, r.error);
    } else if (cmd == "get") {
        if (!needArgs(args, 2, "get <remote> <local>")) return 2;
        rc = reportTransfer(service.downloadFile(conn, arg(1), arg(2), xferOpts));
    } else if (cmd == "put") {
        if (!needArgs(args, 2, "put <local> <remote>")) return 2;
        rc = reportTransfer(service.uploadFile(conn, arg(1), arg(2), xferOpts));
    } else if (cmd == "put-dir") {
        if (!needArgs(args, 2, "put-dir <localDir> <remoteDir>")) return 2;
        rc = reportTransfer(service.uploadFolder(conn, arg(1), arg(2), xferOpts));
    } else if (cmd == "rm") {
        const bool recursive = args.size() > 2 && args.at(1) == "-r";
        if (!needArgs(args, recursive ? 2 : 1, "rm [-r] <path>")) return 2;
        rc = report(service.deleteFile(conn, arg(recursive ? 2 : 1), recursive));
    } else if (cmd == "mv") {
        if (!needArgs(args, 2, "mv <from> <to>")) return 2;
        rc = report(service.renameFile(conn, arg(1), arg(2)));
    } else if (cmd == "mkdir") {
        if (!needArgs(args, 1, "mkdir <path>")) return 2;
        rc = report(service.createFolder(conn, arg(1)));
    } else if (cmd == "touch") {
        if (!needArgs(args, 1, "touch <path> [content]")) return 2;
        rc = report(service.createFile(conn, arg(1), args.size() > 2 ? arg(2) : std::string()));
    } else if (cmd == "preview") {
        if (!needArgs(args, 1, "preview <path>")) return 2;
        const PreviewResult r = service.previewFile(conn, arg(1));
        if (r.success) {
            std::cout << r.fileName << " (" << r.mimeType << ", " << r.fileSize << " bytes)\n";
            if (r.preview.type == "text" || r.preview.type == "image")
                std::cout << r.preview.content << "\n";
            else
                std::cout << "[" << r.preview.type << "] " << r.preview.message << "\n";
        }
        rc = report(r.success, r.errorKind, {}, r.error);
    } else {
        std::cerr << "ferry: unknown command: " << cmd.toStdString() << "\n";
        return 2;
    }

    service.closeAllConnections();
    return rc;
}
