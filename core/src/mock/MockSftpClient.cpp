#include "ferry/MockSftpClient.hpp"
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

namespace ferry {

namespace {

std::shared_ptr<MockRemoteState> seededState() {
    auto st = std::make_shared<MockRemoteState>();
    const std::uint64_t now = (std::uint64_t)std::time(nullptr);
    auto dir = [&](const std::string& p) {
        MockRemoteState::Node n;
        n.is_dir = true;
        n.mtime = now;
        st->nodes[p] = n;
    };
    auto file = [&](const std::string& p, const std::string& data) {
        MockRemoteState::Node n;
        n.data = data;
        n.mtime = now;
        st->nodes[p] = n;
    };
    dir("/");
    dir("/home");
    dir("/home/alice");
    dir("/home/alice/projects");
    dir("/home/guest");
    dir("/var");
    dir("/var/log");
    file("/readme.txt", std::string(1280, 'r'));
    file("/home/alice/notes.md", "# notes\n- buy milk\n");
    file("/home/alice/photo.png", std::string("\x89PNG\r\n\x1a\n", 8) + std::string(120, '\0'));
    file("/var/log/syslog", "boot ok\n");
    return st;
}

// Collapse "." and ".." in an absolute path.
std::string collapse(const std::string& abs) {
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= abs.size()) {
        std::size_t j = abs.find('/', i);
        if (j == std::string::npos)
            j = abs.size();
        const std::string part = abs.substr(i, j - i);
        if (part == "..") {
            if (!parts.empty())
                parts.pop_back();
        } else if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
        i = j + 1;
    }
    std::string out;
    for (const auto& p : parts)
        out += "/" + p;
    return out.empty() ? std::string("/") : out;
}

std::string parentOf(const std::string& abs) {
    const std::size_t cut = abs.rfind('/');
    if (cut == 0 || cut == std::string::npos)
        return "/";
    return abs.substr(0, cut);
}

} // namespace

MockSftpClient::MockSftpClient() : state_(seededState()) {}

MockSftpClient::MockSftpClient(std::shared_ptr<MockRemoteState> state)
    : state_(state ? std::move(state) : seededState()) {}

std::string MockSftpClient::resolve(const std::string& path) const {
    if (path.empty() || path == ".")
        return state_->home;
    if (path.front() == '/')
        return collapse(path);
    return collapse(state_->home + "/" + path);
}

bool MockSftpClient::requireConnected(std::string& err) const {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    return true;
}

bool MockSftpClient::connect(const SessionOptions& opt, std::string& err) {
    state_->connectAttempts.fetch_add(1);
    if (state_->connectDelay.count() > 0)
        std::this_thread::sleep_for(state_->connectDelay);
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and user are required";
        return false;
    }
    if (!state_->connectError.empty()) {
        err = state_->connectError;
        return false;
    }
    if (state_->unknownHostKey && opt.known_hosts_policy != KnownHostsPolicy::Off) {
        const bool confirmed = opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
            opt.hostkey_confirm_cb &&
            opt.hostkey_confirm_cb(opt.host, opt.port, "ssh-ed25519", "SHA256:mockhostkey");
        if (!confirmed) {
            err = "Unknown host: fingerprint not confirmed by the user";
            return false;
        }
    }
    connected_ = true;
    lastOpt_ = opt;
    return true;
}

void MockSftpClient::disconnect() {
    if (connected_.exchange(false))
        state_->disconnects.fetch_add(1);
}

bool MockSftpClient::realPath(const std::string& remote_path,
                              std::string& out,
                              std::string& err) {
    if (!requireConnected(err))
        return false;
    const std::string abs = resolve(remote_path);
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->nodes.count(abs) == 0) {
        err = "No such file: " + remote_path;
        return false;
    }
    out = abs;
    return true;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          std::string& err) {
    if (!requireConnected(err))
        return false;
    const std::string dir = resolve(remote_path);
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->nodes.find(dir);
    if (it == state_->nodes.end() || !it->second.is_dir) {
        err = "Remote path not found in mock: " + remote_path;
        return false;
    }
    const std::string prefix = (dir == "/") ? dir : dir + "/";
    out.clear();
    for (const auto& kv : state_->nodes) {
        const std::string& p = kv.first;
        if (p == dir || p.compare(0, prefix.size(), prefix) != 0)
            continue;
        const std::string rest = p.substr(prefix.size());
        if (rest.empty() || rest.find('/') != std::string::npos)
            continue;
        FileInfo fi;
        fi.name = rest;
        fi.is_dir = kv.second.is_dir;
        fi.size = kv.second.is_dir ? 0 : kv.second.data.size();
        fi.mtime = kv.second.mtime;
        fi.mode = kv.second.is_dir ? 040755 : 0100644;
        out.push_back(std::move(fi));
    }
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
        if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // dirs first
        return a.name < b.name;
    });
    return true;
}

bool MockSftpClient::get(const std::string& remote,
                         const std::string& local,
                         std::string& err,
                         StepCB step,
                         CancelCB shouldCancel) {
    if (!requireConnected(err))
        return false;
    const std::string abs = resolve(remote);
    std::string data;
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        auto it = state_->nodes.find(abs);
        if (it == state_->nodes.end() || it->second.is_dir || state_->unreadable.count(abs)) {
            err = "Could not open remote file for reading";
            return false;
        }
        data = it->second.data;
    }

    std::ofstream lf(local, std::ios::binary | std::ios::trunc);
    if (!lf.is_open()) {
        err = "Could not open local file for writing";
        return false;
    }

    const std::size_t total = data.size();
    const std::size_t chunk = std::max<std::size_t>(1, state_->chunkSize);
    std::size_t done = 0;
    while (done < total) {
        if (shouldCancel && shouldCancel()) {
            err = "Canceled by user";
            return false;
        }
        if (state_->onChunk)
            state_->onChunk();
        const std::size_t n = std::min(chunk, total - done);
        if (state_->failAfterBytes && done + n > state_->failAfterBytes) {
            err = "Remote read failed";
            return false;
        }
        lf.write(data.data() + done, (std::streamsize)n);
        if (!lf) {
            err = "Local write failed";
            return false;
        }
        done += n;
        if (step)
            step(done, n, total);
    }
    return true;
}

bool MockSftpClient::put(const std::string& local,
                         const std::string& remote,
                         std::string& err,
                         StepCB step,
                         CancelCB shouldCancel) {
    if (!requireConnected(err))
        return false;
    std::ifstream lf(local, std::ios::binary);
    if (!lf.is_open()) {
        err = "Could not open local file for reading";
        return false;
    }
    const std::string data((std::istreambuf_iterator<char>(lf)),
                           std::istreambuf_iterator<char>());

    const std::string abs = resolve(remote);
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        auto parent = state_->nodes.find(parentOf(abs));
        if (parent == state_->nodes.end() || !parent->second.is_dir) {
            err = "Could not open remote file for writing";
            return false;
        }
        auto target = state_->nodes.find(abs);
        if (target != state_->nodes.end() && target->second.is_dir) {
            err = "Could not open remote file for writing";
            return false;
        }
        MockRemoteState::Node n;
        n.mtime = (std::uint64_t)std::time(nullptr);
        state_->nodes[abs] = n;
    }

    const std::size_t total = data.size();
    const std::size_t chunk = std::max<std::size_t>(1, state_->chunkSize);
    std::size_t done = 0;
    while (done < total) {
        if (shouldCancel && shouldCancel()) {
            err = "Canceled by user";
            return false;
        }
        if (state_->onChunk)
            state_->onChunk();
        const std::size_t n = std::min(chunk, total - done);
        if (state_->failAfterBytes && done + n > state_->failAfterBytes) {
            err = "Remote write failed";
            return false;
        }
        {
            std::lock_guard<std::mutex> lk(state_->mtx);
            state_->nodes[abs].data.append(data, done, n);
        }
        done += n;
        if (step)
            step(done, n, total);
    }
    return true;
}

bool MockSftpClient::readFile(const std::string& remote,
                              std::string& out,
                              std::string& err) {
    if (!requireConnected(err))
        return false;
    const std::string abs = resolve(remote);
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->nodes.find(abs);
    if (it == state_->nodes.end() || it->second.is_dir || state_->unreadable.count(abs)) {
        err = "Could not open remote file for reading";
        return false;
    }
    out = it->second.data;
    return true;
}

bool MockSftpClient::writeFile(const std::string& remote,
                               const std::string& content,
                               std::string& err) {
    if (!requireConnected(err))
        return false;
    const std::string abs = resolve(remote);
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto parent = state_->nodes.find(parentOf(abs));
    auto target = state_->nodes.find(abs);
    if (parent == state_->nodes.end() || !parent->second.is_dir ||
        (target != state_->nodes.end() && target->second.is_dir)) {
        err = "Could not open remote file for writing";
        return false;
    }
    MockRemoteState::Node n;
    n.data = content;
    n.mtime = (std::uint64_t)std::time(nullptr);
    state_->nodes[abs] = std::move(n);
    return true;
}

bool MockSftpClient::exists(const std::string& remote_path,
                            bool& isDir,
                            std::string& err) {
    isDir = false;
    if (!requireConnected(err))
        return false;
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->nodes.find(resolve(remote_path));
    if (it == state_->nodes.end()) {
        err.clear();
        return false;
    }
    isDir = it->second.is_dir;
    return true;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          std::string& err) {
    if (!requireConnected(err))
        return false;
    const std::string abs = resolve(remote_path);
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->nodes.find(abs);
    if (it == state_->nodes.end()) {
        err.clear();
        return false;
    }
    info.name.clear();
    info.is_dir = it->second.is_dir;
    info.size = it->second.is_dir ? 0 : it->second.data.size();
    info.mtime = it->second.mtime;
    info.mode = it->second.is_dir ? 040755 : 0100644;
    return true;
}

bool MockSftpClient::mkdir(const std::string& remote_dir,
                           std::string& err,
                           unsigned int /*mode*/) {
    if (!requireConnected(err))
        return false;
    const std::string abs = resolve(remote_dir);
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->nodes.count(abs) > 0) {
        err = "sftp_mkdir failed: already exists";
        return false;
    }
    auto parent = state_->nodes.find(parentOf(abs));
    if (parent == state_->nodes.end() || !parent->second.is_dir) {
        err = "sftp_mkdir failed: no such parent directory";
        return false;
    }
    MockRemoteState::Node n;
    n.is_dir = true;
    n.mtime = (std::uint64_t)std::time(nullptr);
    state_->nodes[abs] = n;
    return true;
}

bool MockSftpClient::removeFile(const std::string& remote_path,
                                std::string& err) {
    if (!requireConnected(err))
        return false;
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->nodes.find(resolve(remote_path));
    if (it == state_->nodes.end() || it->second.is_dir) {
        err = "sftp_unlink failed";
        return false;
    }
    state_->nodes.erase(it);
    return true;
}

bool MockSftpClient::removeDir(const std::string& remote_dir,
                               std::string& err) {
    if (!requireConnected(err))
        return false;
    const std::string abs = resolve(remote_dir);
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->nodes.find(abs);
    if (it == state_->nodes.end() || !it->second.is_dir || abs == "/") {
        err = "sftp_rmdir failed";
        return false;
    }
    const std::string prefix = abs + "/";
    auto next = state_->nodes.lower_bound(prefix);
    if (next != state_->nodes.end() &&
        next->first.compare(0, prefix.size(), prefix) == 0) {
        err = "sftp_rmdir failed (directory not empty?)";
        return false;
    }
    state_->nodes.erase(it);
    return true;
}

bool MockSftpClient::rename(const std::string& from,
                            const std::string& to,
                            std::string& err,
                            bool overwrite) {
    if (!requireConnected(err))
        return false;
    const std::string src = resolve(from);
    const std::string dst = resolve(to);
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->nodes.count(src) == 0) {
        err = "sftp_rename_ex failed: no such file";
        return false;
    }
    auto parent = state_->nodes.find(parentOf(dst));
    if (parent == state_->nodes.end() || !parent->second.is_dir) {
        err = "sftp_rename_ex failed: no such target directory";
        return false;
    }
    if (state_->nodes.count(dst) > 0 && !overwrite) {
        err = "sftp_rename_ex failed: target exists";
        return false;
    }
    // Move the node and everything below it.
    std::vector<std::pair<std::string, MockRemoteState::Node>> moved;
    const std::string prefix = src + "/";
    for (auto it = state_->nodes.begin(); it != state_->nodes.end();) {
        if (it->first == src || it->first.compare(0, prefix.size(), prefix) == 0) {
            moved.emplace_back(dst + it->first.substr(src.size()), it->second);
            it = state_->nodes.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& kv : moved)
        state_->nodes[kv.first] = std::move(kv.second);
    return true;
}

std::unique_ptr<SftpClient> MockSftpClient::newConnectionLike(const SessionOptions& opt,
                                                              std::string& err) {
    auto ptr = std::make_unique<MockSftpClient>(state_);
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace ferry
