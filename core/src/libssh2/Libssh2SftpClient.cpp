// libssh2 backend: TCP socket, SSH session and SFTP channel.
// Covers known_hosts validation, password/keyboard-interactive/key/agent
// auth, keepalive, and chunked transfers with cooperative cancellation.
#include "ferry/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace ferry {

namespace {

// libssh2_init must run once per process, before any session exists.
std::once_flag g_libssh2_once;

constexpr std::size_t kChunk = 64 * 1024;

// Context for keyboard-interactive: answers with user or password by prompt.
struct KbdIntCtx {
    const std::string* user;
    const std::string* pass;
    const KbdIntPromptsCB* cb; // optional UI callback
};

void fillResponse(const std::string& answer,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE& response) {
    response.text = nullptr;
    response.length = 0;
    if (answer.empty())
        return;
    // libssh2 frees the buffer with its default allocator.
    char* buf = static_cast<char*>(std::malloc(answer.size() + 1));
    if (!buf)
        return;
    std::memcpy(buf, answer.data(), answer.size());
    buf[answer.size()] = '\0';
    response.text = buf;
    response.length = (unsigned int)answer.size();
}

bool promptAsksForUser(const char* prompt) {
    std::string p = prompt ? prompt : "";
    for (char& c : p)
        c = (char)std::tolower((unsigned char)c);
    return p.find("user") != std::string::npos ||
           p.find("name") != std::string::npos;
}

void kbint_callback(const char* name, int name_len,
                    const char* instruction, int instruction_len,
                    int num_prompts,
                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                    void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    // Give the UI callback a chance to answer every prompt first.
    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> texts;
        texts.reserve((size_t)num_prompts);
        for (int i = 0; i < num_prompts; ++i) {
            const char* t = (prompts && prompts[i].text)
                                ? reinterpret_cast<const char*>(prompts[i].text)
                                : "";
            texts.emplace_back(t, prompts ? (size_t)prompts[i].length : 0);
        }
        std::vector<std::string> answers;
        const std::string nm = (name && name_len > 0) ? std::string(name, (size_t)name_len) : std::string();
        const std::string ins = (instruction && instruction_len > 0) ? std::string(instruction, (size_t)instruction_len) : std::string();
        if ((*(ctx->cb))(nm, ins, texts, answers) && (int)answers.size() >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i)
                fillResponse(answers[(size_t)i], responses[i]);
            return;
        }
    }
    // Fallback heuristic: prompts mentioning "user"/"name" get the username.
    for (int i = 0; i < num_prompts; ++i) {
        const char* prompt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        const std::string* ans = promptAsksForUser(prompt) ? ctx->user : ctx->pass;
        fillResponse(ans ? *ans : std::string(), responses[i]);
    }
}

template <typename Fn>
int retryEagain(Fn fn) {
    int rc = 0;
    for (;;) {
        rc = fn();
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return rc;
}

int knownHostAlgorithm(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

const char* hostKeyTypeName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
    case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
    default: return "UNKNOWN";
    }
}

std::string fingerprint(LIBSSH2_SESSION* session) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA256;
    const int hashLen = 32;
    const char* label = "SHA256:";
#else
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA1;
    const int hashLen = 20;
    const char* label = "SHA1:";
#endif
    const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session, hashType);
    if (!h)
        return {};
    std::ostringstream oss;
    oss << label;
    for (int i = 0; i < hashLen; ++i) {
        if (i) oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
        oss << b;
    }
    return oss.str();
}

bool isDirMode(const LIBSSH2_SFTP_ATTRIBUTES& a) {
    return (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
           ((a.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR);
}

void fillInfo(const LIBSSH2_SFTP_ATTRIBUTES& a, FileInfo& fi) {
    fi.is_dir = isDirMode(a);
    fi.size = (a.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::uint64_t)a.filesize : 0;
    fi.mtime = (a.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? (std::uint64_t)a.mtime : 0;
    fi.mode = (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? (std::uint32_t)a.permissions : 0;
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, [] { (void)libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string portStr = std::to_string(port);
    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // SO_RCVTIMEO/SO_SNDTIMEO are left alone: they break userauth on some
        // servers. libssh2_session_set_timeout bounds the handshake instead.
        int on = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not connect to host/port";
    return false;
}

std::string Libssh2SftpClient::lastSessionError() {
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, (size_t)len) : std::string();
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }
    struct KnownHostsGuard {
        LIBSSH2_KNOWNHOSTS* nh;
        ~KnownHostsGuard() { libssh2_knownhost_free(nh); }
    } guard{nh};

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char* home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }

    const bool khLoaded = !khPath.empty() &&
        libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        err = "Could not read the server host key";
        return false;
    }

    const int alg = knownHostAlgorithm(keytype);
    struct libssh2_knownhost* entry = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &entry);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &entry);
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH)
        return true;

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        const bool confirmed = opt.hostkey_confirm_cb &&
            opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyTypeName(keytype), fingerprint(session_));
        if (!confirmed) {
            err = "Unknown host: fingerprint not confirmed by the user";
            return false;
        }
        if (khPath.empty()) {
            err = "known_hosts path is not defined";
            return false;
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        if (libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr, hostkey, keylen,
                                   nullptr, 0, addMask, nullptr) != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            err = "Could not add the host to known_hosts";
            return false;
        }
        return true;
    }

    // AcceptNew tolerates nothing but NOTFOUND (handled above).
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key does not match known_hosts"
              : "Unknown host in known_hosts";
    return false;
}

bool Libssh2SftpClient::tryAgentAuth(const std::string& user) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent)
        return false;
    bool authed = false;
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        const int kMaxAgentTries = 3; // servers drop us after a few failures
        int tries = 0;
        while (!authed && tries < kMaxAgentTries &&
               libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            authed = retryEagain([&] {
                return libssh2_agent_userauth(agent, user.c_str(), identity);
            }) == 0;
        }
    }
    libssh2_agent_disconnect(agent);
    libssh2_agent_free(agent);
    return authed;
}

bool Libssh2SftpClient::authenticate(const SessionOptions& opt, std::string& err) {
    const std::string& user = opt.username;

    // 1) An explicit private key always goes first.
    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        const int rc = libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                                                           opt.private_key_path->c_str(), passphrase);
        if (rc != 0) {
            err = "Public key authentication failed";
            return false;
        }
        return true;
    }

    auto authList = [&]() {
        char* methods = libssh2_userauth_list(session_, user.c_str(), (unsigned)user.size());
        return methods ? std::string(methods) : std::string();
    };

    // 2) Password, then keyboard-interactive when the server offers it.
    if (opt.password.has_value()) {
        const int rcPw = retryEagain([&] {
            return libssh2_userauth_password(session_, user.c_str(), opt.password->c_str());
        });
        if (rcPw == 0)
            return true;
        if (rcPw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rcPw == LIBSSH2_ERROR_SOCKET_SEND ||
            rcPw == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after the password attempt";
            return false;
        }
        const std::string methods = authList();
        int rcKbd = -1;
        if (methods.find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{&user, &*opt.password, &opt.keyboard_interactive_cb};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            rcKbd = retryEagain([&] {
                return libssh2_userauth_keyboard_interactive(session_, user.c_str(), kbint_callback);
            });
            if (abs) *abs = nullptr;
        }
        if (rcKbd == 0)
            return true;
        if (methods.find("publickey") != std::string::npos && tryAgentAuth(user))
            return true;
        const std::string last = lastSessionError();
        err = "Password/keyboard-interactive authentication failed" +
              (methods.empty() ? std::string() : " (methods: " + methods + ")") +
              (last.empty() ? std::string() : ": " + last) +
              " [rc_pw=" + std::to_string(rcPw) + ", rc_kbd=" + std::to_string(rcKbd) + "]";
        return false;
    }

    // 3) No credentials: ssh-agent if the server accepts public keys.
    if (authList().find("publickey") != std::string::npos && tryAgentAuth(user))
        return true;
    err = "No credentials: key, agent and password are unavailable";
    return false;
}

bool Libssh2SftpClient::sshHandshakeAuth(const SessionOptions& opt, std::string& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    if (opt.connect_timeout_ms > 0)
        libssh2_session_set_timeout(session_, opt.connect_timeout_ms);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed";
        return false;
    }
    if (opt.keepalive_interval_s > 0)
        libssh2_keepalive_config(session_, 1, (unsigned)opt.keepalive_interval_s);

    if (!verifyHostKey(opt, err))
        return false;
    if (!authenticate(opt, err))
        return false;

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not initialize the SFTP subsystem";
        return false;
    }
    // The timeout only bounds connection setup; transfers run unbounded.
    libssh2_session_set_timeout(session_, 0);
    return true;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err) || !sshHandshakeAuth(opt, err)) {
        closeLocked();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::closeLocked() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

void Libssh2SftpClient::disconnect() {
    std::lock_guard<std::mutex> lk(ioMutex_);
    closeLocked();
}

bool Libssh2SftpClient::isSessionLost(int libssh2Error) {
    switch (libssh2Error) {
    case LIBSSH2_ERROR_SOCKET_NONE:
    case LIBSSH2_ERROR_BANNER_RECV:
    case LIBSSH2_ERROR_BANNER_SEND:
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_DECRYPT:
    case LIBSSH2_ERROR_PROTO:
        return true;
    default:
        return false;
    }
}

void Libssh2SftpClient::failLocked(std::string& err, const std::string& message) {
    err = message;
    if (!session_)
        return;
    if (isSessionLost(libssh2_session_last_errno(session_))) {
        connected_ = false;
        err += " (connection lost)";
    }
}

bool Libssh2SftpClient::realPath(const std::string& remote_path,
                                 std::string& out,
                                 std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    const std::string path = remote_path.empty() ? "." : remote_path;
    char target[4096];
    const int rc = libssh2_sftp_symlink_ex(sftp_, path.c_str(), (unsigned)path.size(),
                                           target, sizeof(target), LIBSSH2_SFTP_REALPATH);
    if (rc < 0) {
        failLocked(err, "sftp_realpath failed for: " + path);
        return false;
    }
    out.assign(target, (size_t)rc);
    return true;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    const std::string path = remote_path.empty() ? "." : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        failLocked(err, "sftp_opendir failed for: " + path);
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    for (;;) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry), &attrs);
        if (rc == 0)
            break; // end of directory
        if (rc < 0) {
            failLocked(err, "sftp_readdir_ex failed");
            libssh2_sftp_closedir(dir);
            return false;
        }
        FileInfo fi{};
        fi.name.assign(filename, (size_t)rc);
        if (fi.name == "." || fi.name == "..") continue;
        fillInfo(attrs, fi);
        out.push_back(std::move(fi));
    }
    libssh2_sftp_closedir(dir);
    return true;
}

int Libssh2SftpClient::statLocked(const std::string& remote_path, FileInfo& info) {
    LIBSSH2_SFTP_ATTRIBUTES st{};
    const int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                                        LIBSSH2_SFTP_STAT, &st);
    if (rc == 0) {
        info.name.clear();
        fillInfo(st, info);
        return 1;
    }
    const unsigned long sftpErr = libssh2_sftp_last_error(sftp_);
    if (sftpErr == LIBSSH2_FX_NO_SUCH_FILE || sftpErr == LIBSSH2_FX_NO_SUCH_PATH)
        return 0;
    return -1;
}

// Remote -> local, one chunk per lock so other users of the session interleave.
bool Libssh2SftpClient::get(const std::string& remote,
                            const std::string& local,
                            std::string& err,
                            StepCB step,
                            CancelCB shouldCancel) {
    LIBSSH2_SFTP_HANDLE* rh = nullptr;
    std::size_t total = 0;
    {
        std::lock_guard<std::mutex> lk(ioMutex_);
        if (!connected_ || !sftp_) {
            err = "Not connected";
            return false;
        }
        FileInfo info;
        if (statLocked(remote, info) != 1) {
            failLocked(err, "Could not stat remote file");
            return false;
        }
        total = (std::size_t)info.size;
        rh = libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                                  LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
        if (!rh) {
            failLocked(err, "Could not open remote file for reading");
            return false;
        }
    }
    auto closeRemote = [&]() {
        std::lock_guard<std::mutex> lk(ioMutex_);
        libssh2_sftp_close(rh);
    };

    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        closeRemote();
        err = "Could not open local file for writing";
        return false;
    }

    std::vector<char> buf(kChunk);
    std::size_t done = 0;
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            err = "Canceled by user";
            std::fclose(lf);
            closeRemote();
            return false;
        }
        ssize_t n = 0;
        {
            std::lock_guard<std::mutex> lk(ioMutex_);
            n = libssh2_sftp_read(rh, buf.data(), buf.size());
            if (n < 0)
                failLocked(err, "Remote read failed");
        }
        if (n == 0)
            break; // EOF
        if (n < 0) {
            std::fclose(lf);
            closeRemote();
            return false;
        }
        if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
            err = "Local write failed";
            std::fclose(lf);
            closeRemote();
            return false;
        }
        done += (std::size_t)n;
        if (step) step(done, (std::size_t)n, total);
    }

    const bool flushed = std::fclose(lf) == 0;
    closeRemote();
    if (!flushed) {
        err = "Local write failed";
        return false;
    }
    return true;
}

// Local -> remote (create/truncate). Reports every chunk, polls cancellation.
bool Libssh2SftpClient::put(const std::string& local,
                            const std::string& remote,
                            std::string& err,
                            StepCB step,
                            CancelCB shouldCancel) {
    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading";
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    const long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::size_t total = fsz > 0 ? (std::size_t)fsz : 0;

    LIBSSH2_SFTP_HANDLE* wh = nullptr;
    {
        std::lock_guard<std::mutex> lk(ioMutex_);
        if (!connected_ || !sftp_) {
            std::fclose(lf);
            err = "Not connected";
            return false;
        }
        wh = libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                                  LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                  0644, LIBSSH2_SFTP_OPENFILE);
        if (!wh)
            failLocked(err, "Could not open remote file for writing");
    }
    if (!wh) {
        std::fclose(lf);
        return false;
    }
    auto closeAll = [&]() {
        {
            std::lock_guard<std::mutex> lk(ioMutex_);
            libssh2_sftp_close(wh);
        }
        std::fclose(lf);
    };

    std::vector<char> buf(kChunk);
    std::size_t done = 0;
    for (;;) {
        const size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err = "Local read failed";
                closeAll();
                return false;
            }
            break; // EOF
        }
        if (shouldCancel && shouldCancel()) {
            err = "Canceled by user";
            closeAll();
            return false;
        }
        size_t remain = n;
        {
            std::lock_guard<std::mutex> lk(ioMutex_);
            const char* p = buf.data();
            while (remain > 0) {
                const ssize_t w = libssh2_sftp_write(wh, p, remain);
                if (w < 0) {
                    failLocked(err, "Remote write failed");
                    break;
                }
                remain -= (size_t)w;
                p += w;
            }
        }
        if (remain > 0) {
            closeAll();
            return false;
        }
        done += n;
        if (step) step(done, n, total);
    }
    closeAll();
    return true;
}

bool Libssh2SftpClient::readFile(const std::string& remote,
                                 std::string& out,
                                 std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                                                   LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        failLocked(err, "Could not open remote file for reading");
        return false;
    }
    out.clear();
    std::vector<char> buf(kChunk);
    for (;;) {
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            failLocked(err, "Remote read failed");
            libssh2_sftp_close(rh);
            return false;
        }
        out.append(buf.data(), (size_t)n);
    }
    libssh2_sftp_close(rh);
    return true;
}

bool Libssh2SftpClient::writeFile(const std::string& remote,
                                  const std::string& content,
                                  std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                                                   LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                                   0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        failLocked(err, "Could not open remote file for writing");
        return false;
    }
    const char* p = content.data();
    size_t remain = content.size();
    while (remain > 0) {
        const ssize_t w = libssh2_sftp_write(wh, p, remain);
        if (w < 0) {
            failLocked(err, "Remote write failed");
            libssh2_sftp_close(wh);
            return false;
        }
        remain -= (size_t)w;
        p += w;
    }
    libssh2_sftp_close(wh);
    return true;
}

bool Libssh2SftpClient::exists(const std::string& remote_path,
                               bool& isDir,
                               std::string& err) {
    isDir = false;
    FileInfo info;
    if (!stat(remote_path, info, err))
        return false;
    isDir = info.is_dir;
    return true;
}

bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    const int rc = statLocked(remote_path, info);
    if (rc == 1)
        return true;
    if (rc == 0)
        err.clear(); // does not exist
    else
        failLocked(err, "Remote stat failed");
    return false;
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir,
                              std::string& err,
                              unsigned int mode) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode) != 0) {
        failLocked(err, "sftp_mkdir failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path,
                                   std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        failLocked(err, "sftp_unlink failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string& remote_dir,
                                  std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        failLocked(err, "sftp_rmdir failed (directory not empty?)");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string& from,
                               const std::string& to,
                               std::string& err,
                               bool overwrite) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    if (libssh2_sftp_rename_ex(sftp_, from.c_str(), (unsigned)from.size(),
                               to.c_str(), (unsigned)to.size(), flags) != 0) {
        failLocked(err, "sftp_rename_ex failed");
        return false;
    }
    return true;
}

std::unique_ptr<SftpClient> Libssh2SftpClient::newConnectionLike(const SessionOptions& opt,
                                                                 std::string& err) {
    auto ptr = std::make_unique<Libssh2SftpClient>();
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace ferry
