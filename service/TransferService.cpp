#include "TransferService.hpp"
#include "IdleReaper.hpp"
#include "LogCategories.hpp"
#include "ferry/RemotePath.hpp"
#include "ferry/RuntimeLogging.hpp"
#include "ferry/SftpClient.hpp"
#include <QByteArray>
#include <QDateTime>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QMimeDatabase>
#include <QMimeType>
#include <algorithm>
#include <set>

namespace {

// Ends the tracker record on every exit path of a transfer.
struct TrackerGuard {
    ferry::TransferTracker& tracker;
    std::string id;
    ~TrackerGuard() { tracker.end(id); }
};

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

QString logPath(const std::string& p) {
    return qs(ferry::loggablePath(p));
}

std::string mimeTypeFor(const std::string& fileName) {
    static const QMimeDatabase db;
    const QMimeType mt = db.mimeTypeForFile(qs(fileName), QMimeDatabase::MatchExtension);
    if (!mt.isValid() || mt.isDefault())
        return "application/octet-stream";
    return mt.name().toStdString();
}

bool isTextMime(const std::string& mime) {
    return mime.rfind("text/", 0) == 0 || mime == "application/json" ||
           mime == "application/xml" || mime == "application/javascript";
}

std::string isoUtc(std::uint64_t epochSecs) {
    const QDateTime dt = QDateTime::fromSecsSinceEpoch(static_cast<qint64>(epochSecs)).toUTC();
    return dt.toString(Qt::ISODateWithMs).toStdString();
}

OpResult opFailure(ErrorKind kind, const std::string& error) {
    OpResult r;
    r.errorKind = kind;
    r.error = error;
    return r;
}

OpResult opSuccess(const std::string& message) {
    OpResult r;
    r.success = true;
    r.message = message;
    return r;
}

TransferResult transferFailure(ErrorKind kind, const std::string& error) {
    TransferResult r;
    r.errorKind = kind;
    r.error = error;
    return r;
}

// mkdir -p: existing directories are fine, any other existing entry is not.
bool makeRemoteDirs(ferry::SftpClient& c, const std::string& path, std::string& err) {
    if (path.empty() || path == "." || path == "/")
        return true;
    std::string prefix = ferry::isAbsoluteRemotePath(path) ? "/" : "";
    std::size_t pos = 0;
    while (pos <= path.size()) {
        std::size_t next = path.find('/', pos);
        if (next == std::string::npos)
            next = path.size();
        const std::string part = path.substr(pos, next - pos);
        pos = next + 1;
        if (part.empty() || part == ".")
            continue;
        prefix = ferry::joinRemotePath(prefix, part);
        bool isDir = false;
        std::string e;
        if (c.exists(prefix, isDir, e)) {
            if (!isDir) {
                err = "Not a directory: " + prefix;
                return false;
            }
            continue;
        }
        if (!e.empty()) {
            err = e;
            return false;
        }
        if (!c.mkdir(prefix, e)) {
            err = e.empty() ? "mkdir failed: " + prefix : e;
            return false;
        }
    }
    return true;
}

bool removeRemoteTree(ferry::SftpClient& c, const std::string& dir, std::string& err) {
    std::vector<ferry::FileInfo> entries;
    if (!c.list(dir, entries, err))
        return false;
    for (const auto& e : entries) {
        const std::string child = ferry::joinRemotePath(dir, e.name);
        const bool ok = e.is_dir ? removeRemoteTree(c, child, err) : c.removeFile(child, err);
        if (!ok)
            return false;
    }
    return c.removeDir(dir, err);
}

} // namespace

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Connection:
        return "connection";
    case ErrorKind::Path:
        return "path";
    case ErrorKind::Transfer:
        return "transfer";
    case ErrorKind::Request:
        return "request";
    }
    return "unknown";
}

TransferService::TransferService(std::shared_ptr<ferry::SftpClient> backend,
                                 const ServiceSettings& settings,
                                 QObject* parent,
                                 ConnectionPool::Clock poolClock,
                                 ferry::TransferTracker::Clock trackerClock)
    : QObject(parent),
      settings_(settings),
      pool_(std::move(backend), std::chrono::milliseconds(settings.idleTimeoutMs), std::move(poolClock)),
      tracker_(std::move(trackerClock)) {
    qRegisterMetaType<ferry::ProgressEvent>("ferry::ProgressEvent");
    reaper_ = std::make_unique<IdleReaper>(pool_, settings_.sweepIntervalMs);
    if (settings_.reaperEnabled)
        reaper_->start();
}

TransferService::~TransferService() {
    reaper_->stop();
    closeAllConnections();
}

ferry::SessionOptions TransferService::withTransportDefaults(const ferry::SessionOptions& conn) const {
    ferry::SessionOptions opt = conn;
    if (opt.port == 0)
        opt.port = 22;
    if (opt.connect_timeout_ms <= 0)
        opt.connect_timeout_ms = settings_.connectTimeoutMs;
    if (opt.keepalive_interval_s <= 0)
        opt.keepalive_interval_s = settings_.keepaliveSec;
    return opt;
}

std::string TransferService::nextTransferId(ferry::TransferType type) {
    return std::string(ferry::transferTypeName(type)) + "-" +
           std::to_string(QDateTime::currentMSecsSinceEpoch()) + "-" +
           std::to_string(++seq_);
}

void TransferService::publish(const ferry::ProgressEvent& ev, const TransferOptions& options) {
    if (options.onProgress)
        options.onProgress(ev);
    emit transferProgress(ev);
}

// Maps the outcome of a copy to a result. Must run while the record is live,
// since cancellation is read from the tracker.
TransferResult TransferService::finishTransfer(const std::string& id, bool ok,
                                               const std::string& err,
                                               const std::string& successMessage) {
    TransferResult r;
    r.transferId = id;
    if (ok) {
        r.success = true;
        r.message = successMessage;
        qCInfo(ferryXfer) << "Transfer done" << qs(id);
    } else if (tracker_.isCancelRequested(id)) {
        r.cancelled = true;
        r.message = "Transfer cancelled";
        qCInfo(ferryXfer) << "Transfer cancelled" << qs(id);
    } else {
        r.errorKind = ErrorKind::Transfer;
        r.error = err.empty() ? "Transfer failed" : err;
        qCWarning(ferryXfer) << "Transfer failed" << qs(id) << qs(r.error);
    }
    emit transferFinished(qs(id), r.success, r.cancelled, qs(r.error));
    return r;
}

ListResult TransferService::listFiles(const ferry::SessionOptions& conn, const std::string& dirPath) {
    ListResult r;
    std::string err;
    ConnectionLease lease = pool_.acquire(withTransportDefaults(conn), err);
    if (!lease) {
        r.errorKind = ErrorKind::Connection;
        r.error = err;
        return r;
    }
    ferry::SftpClient& c = *lease.client();

    const std::string path = ferry::normalizeRemotePath(dirPath);
    std::vector<ferry::FileInfo> entries;
    if (!c.list(path, entries, err)) {
        qCWarning(ferryXfer) << "List failed" << logPath(path) << qs(err);
        r.errorKind = ErrorKind::Request;
        r.error = err;
        return r;
    }

    std::string base = path;
    if (!ferry::isAbsoluteRemotePath(path)) {
        std::string resolved, rerr;
        if (c.realPath(path, resolved, rerr)) {
            base = resolved;
        } else {
            qCWarning(ferryXfer) << "realpath failed for" << logPath(path) << qs(rerr);
            if (path == ".")
                base = "/";
        }
    }

    r.data.reserve(entries.size());
    for (const auto& e : entries) {
        RemoteEntry out;
        out.name = e.name;
        out.path = ferry::joinRemotePath(base, e.name);
        out.isDirectory = e.is_dir;
        out.size = e.size;
        out.mtime = isoUtc(e.mtime);
        if (!e.is_dir)
            out.mimeType = mimeTypeFor(e.name);
        r.data.push_back(std::move(out));
    }
    r.success = true;
    return r;
}

PreviewResult TransferService::previewFile(const ferry::SessionOptions& conn, const std::string& filePath) {
    PreviewResult r;
    std::string err;
    ConnectionLease lease = pool_.acquire(withTransportDefaults(conn), err);
    if (!lease) {
        r.errorKind = ErrorKind::Connection;
        r.error = err;
        return r;
    }
    ferry::SftpClient& c = *lease.client();

    const std::string path = ferry::normalizeRemotePath(filePath);
    ferry::FileInfo info;
    if (!c.stat(path, info, err)) {
        r.errorKind = ErrorKind::Request;
        r.error = err.empty() ? "No such file: " + path : err;
        return r;
    }
    if (info.is_dir) {
        r.errorKind = ErrorKind::Path;
        r.error = "Cannot preview a directory: " + path;
        return r;
    }

    const std::string mime = mimeTypeFor(path);
    r.fileName = ferry::remoteBaseName(path);
    r.fileSize = info.size;
    r.mimeType = mime;
    r.preview.mimeType = mime;
    r.success = true;

    const bool text = isTextMime(mime);
    const bool image = mime.rfind("image/", 0) == 0;
    if (!text && !image) {
        r.preview.type = "unsupported";
        r.preview.message = "Preview not supported for file type: " + mime;
        return r;
    }

    const qint64 limit = text ? settings_.textPreviewLimitBytes : settings_.imagePreviewLimitBytes;
    if (info.size > static_cast<std::uint64_t>(limit)) {
        r.preview.type = "error";
        r.preview.message = std::string(text ? "File" : "Image") + " too large to preview (>" +
                            std::to_string(limit / (1024 * 1024)) + "MB)";
        return r;
    }

    std::string data;
    if (!c.readFile(path, data, err)) {
        qCWarning(ferryXfer) << "Preview read failed" << logPath(path) << qs(err);
        r = PreviewResult();
        r.errorKind = ErrorKind::Request;
        r.error = err;
        return r;
    }
    if (text) {
        r.preview.type = "text";
        r.preview.content = QString::fromUtf8(data.data(), static_cast<int>(data.size())).toStdString();
    } else {
        r.preview.type = "image";
        r.preview.content = QByteArray::fromStdString(data).toBase64().toStdString();
    }
    return r;
}

TransferResult TransferService::uploadFile(const ferry::SessionOptions& conn,
                                           const std::string& localPath,
                                           const std::string& remotePath,
                                           const TransferOptions& options) {
    std::string err;
    ConnectionLease lease = pool_.acquire(withTransportDefaults(conn), err);
    if (!lease)
        return transferFailure(ErrorKind::Connection, err);

    const QFileInfo fi(qs(localPath));
    if (!fi.exists() || !fi.isFile())
        return transferFailure(ErrorKind::Path, "Local file not found: " + localPath);
    if (!fi.isReadable())
        return transferFailure(ErrorKind::Path, "Local file is not readable: " + localPath);

    const std::string remote = ferry::normalizeRemotePath(remotePath);
    const std::string id = nextTransferId(ferry::TransferType::Upload);
    ferry::TransferMeta meta;
    meta.type = ferry::TransferType::Upload;
    meta.srcPath = localPath;
    meta.destPath = remote;
    meta.fileName = fi.fileName().toStdString();
    meta.totalBytes = static_cast<std::uint64_t>(fi.size());
    tracker_.begin(id, meta);
    TrackerGuard guard{tracker_, id};

    qCInfo(ferryXfer) << "Upload started" << qs(id) << logPath(localPath) << "->" << logPath(remote);
    emit transferStarted(qs(id), QStringLiteral("upload"), qs(meta.fileName));

    auto step = [&](std::size_t done, std::size_t, std::size_t total) {
        if (auto ev = tracker_.update(id, done, total))
            publish(*ev, options);
    };
    auto cancelled = [&]() { return tracker_.isCancelRequested(id); };

    const bool ok = lease.client()->put(localPath, remote, err, step, cancelled);
    return finishTransfer(id, ok, err, "File uploaded: " + remote);
}

TransferResult TransferService::downloadFile(const ferry::SessionOptions& conn,
                                             const std::string& remotePath,
                                             const std::string& localPath,
                                             const TransferOptions& options) {
    std::string err;
    ConnectionLease lease = pool_.acquire(withTransportDefaults(conn), err);
    if (!lease)
        return transferFailure(ErrorKind::Connection, err);
    ferry::SftpClient& c = *lease.client();

    const std::string remote = ferry::normalizeRemotePath(remotePath);
    ferry::FileInfo info;
    if (!c.stat(remote, info, err))
        return transferFailure(ErrorKind::Path, err.empty() ? "Remote file not found: " + remote : err);
    if (info.is_dir)
        return transferFailure(ErrorKind::Path, "Remote path is a directory: " + remote);

    const QFileInfo target(qs(localPath));
    if (!QDir().mkpath(target.absolutePath()))
        return transferFailure(ErrorKind::Path, "Could not create local directory: " +
                                                    target.absolutePath().toStdString());

    const std::string id = nextTransferId(ferry::TransferType::Download);
    ferry::TransferMeta meta;
    meta.type = ferry::TransferType::Download;
    meta.srcPath = remote;
    meta.destPath = localPath;
    meta.fileName = ferry::remoteBaseName(remote);
    meta.totalBytes = info.size;
    tracker_.begin(id, meta);
    TrackerGuard guard{tracker_, id};

    qCInfo(ferryXfer) << "Download started" << qs(id) << logPath(remote) << "->" << logPath(localPath);
    emit transferStarted(qs(id), QStringLiteral("download"), qs(meta.fileName));

    auto step = [&](std::size_t done, std::size_t, std::size_t total) {
        if (auto ev = tracker_.update(id, done, total))
            publish(*ev, options);
    };
    auto cancelled = [&]() { return tracker_.isCancelRequested(id); };

    // Bytes land in a sibling file; the target is replaced only on success.
    const std::string partPath = localPath + "." + id + ".part";
    bool ok = c.get(remote, partPath, err, step, cancelled);
    if (ok && QFile::exists(qs(localPath)) && !QFile::remove(qs(localPath))) {
        ok = false;
        err = "Could not replace local file: " + localPath;
    }
    if (ok && !QFile::rename(qs(partPath), qs(localPath))) {
        ok = false;
        err = "Could not move download into place: " + localPath;
    }
    if (!ok && QFile::exists(qs(partPath)) && !QFile::remove(qs(partPath)))
        qCWarning(ferryXfer) << "Could not remove partial download" << logPath(partPath);
    return finishTransfer(id, ok, err, "File downloaded: " + localPath);
}

TransferResult TransferService::uploadFolder(const ferry::SessionOptions& conn,
                                             const std::string& localDir,
                                             const std::string& remoteDir,
                                             const TransferOptions& options) {
    std::string err;
    ConnectionLease lease = pool_.acquire(withTransportDefaults(conn), err);
    if (!lease)
        return transferFailure(ErrorKind::Connection, err);
    ferry::SftpClient& c = *lease.client();

    const QFileInfo root(qs(localDir));
    if (!root.exists() || !root.isDir())
        return transferFailure(ErrorKind::Path, "Local folder not found: " + localDir);

    struct LocalFile {
        std::string abs;
        std::string rel; // '/'-separated, relative to localDir
        std::uint64_t size = 0;
    };
    std::vector<LocalFile> files;
    std::vector<std::string> dirs;
    const QDir base(root.absoluteFilePath());
    QDirIterator it(root.absoluteFilePath(),
                    QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo fi = it.fileInfo();
        const std::string rel = base.relativeFilePath(fi.absoluteFilePath()).toStdString();
        if (fi.isDir())
            dirs.push_back(rel);
        else if (fi.isFile())
            files.push_back({fi.absoluteFilePath().toStdString(), rel, static_cast<std::uint64_t>(fi.size())});
    }
    std::sort(files.begin(), files.end(),
              [](const LocalFile& a, const LocalFile& b) { return a.rel < b.rel; });
    std::sort(dirs.begin(), dirs.end());

    if (files.empty()) {
        TransferResult r;
        r.success = true;
        r.message = "Folder is empty, nothing to upload";
        return r;
    }

    const std::string remoteRoot = ferry::normalizeRemotePath(remoteDir);
    if (!makeRemoteDirs(c, remoteRoot, err))
        return transferFailure(ErrorKind::Transfer, err);

    std::uint64_t totalBytes = 0;
    for (const auto& f : files)
        totalBytes += f.size;

    const std::string id = nextTransferId(ferry::TransferType::Upload);
    ferry::TransferMeta meta;
    meta.type = ferry::TransferType::Upload;
    meta.srcPath = localDir;
    meta.destPath = remoteRoot;
    meta.fileName = root.fileName().toStdString();
    meta.totalBytes = totalBytes;
    tracker_.begin(id, meta);
    TrackerGuard guard{tracker_, id};

    qCInfo(ferryXfer) << "Folder upload started" << qs(id) << files.size() << "file(s)"
                      << totalBytes << "bytes";
    emit transferStarted(qs(id), QStringLiteral("upload"), qs(meta.fileName));

    auto cancelled = [&]() { return tracker_.isCancelRequested(id); };

    // Empty subdirectories are recreated too.
    std::set<std::string> created;
    for (const auto& d : dirs) {
        const std::string remote = ferry::joinRemotePath(remoteRoot, d);
        if (!makeRemoteDirs(c, remote, err))
            return finishTransfer(id, false, err, {});
        created.insert(remote);
    }

    std::uint64_t doneBefore = 0;
    int count = 0;
    for (const auto& f : files) {
        if (cancelled()) {
            TransferResult r = finishTransfer(id, false, "Canceled by user", {});
            r.filesTransferred = count;
            return r;
        }
        const std::string remote = ferry::joinRemotePath(remoteRoot, f.rel);
        const std::string parent = ferry::remoteParent(remote);
        if (created.insert(parent).second && !makeRemoteDirs(c, parent, err)) {
            TransferResult r = finishTransfer(id, false, err, {});
            r.filesTransferred = count;
            return r;
        }
        auto step = [&](std::size_t done, std::size_t, std::size_t) {
            if (auto ev = tracker_.update(id, doneBefore + done, totalBytes))
                publish(*ev, options);
        };
        if (!c.put(f.abs, remote, err, step, cancelled)) {
            TransferResult r = finishTransfer(id, false, "Failed to upload " + f.rel + ": " + err, {});
            r.filesTransferred = count;
            return r;
        }
        doneBefore += f.size;
        ++count;
    }

    TransferResult r = finishTransfer(id, true, {},
                                      "Uploaded " + std::to_string(count) + " file(s) to " + remoteRoot);
    r.filesTransferred = count;
    return r;
}

OpResult TransferService::cancelTransfer(const std::string& transferId) {
    if (!tracker_.requestCancel(transferId)) {
        qCInfo(ferryXfer) << "Cancel for unknown transfer" << qs(transferId);
        return opFailure(ErrorKind::Request, "Transfer not found or already finished: " + transferId);
    }
    qCInfo(ferryXfer) << "Cancel requested" << qs(transferId);
    return opSuccess("Transfer marked for cancellation");
}

OpResult TransferService::deleteFile(const ferry::SessionOptions& conn, const std::string& path, bool isDirectory) {
    std::string err;
    ConnectionLease lease = pool_.acquire(withTransportDefaults(conn), err);
    if (!lease)
        return opFailure(ErrorKind::Connection, err);

    const std::string target = ferry::normalizeRemotePath(path);
    const bool ok = isDirectory ? removeRemoteTree(*lease.client(), target, err)
                                : lease.client()->removeFile(target, err);
    if (!ok) {
        qCWarning(ferryXfer) << "Delete failed" << logPath(target) << qs(err);
        return opFailure(ErrorKind::Request, err);
    }
    return opSuccess("Deleted: " + target);
}

OpResult TransferService::renameFile(const ferry::SessionOptions& conn, const std::string& oldPath,
                                     const std::string& newPath) {
    std::string err;
    ConnectionLease lease = pool_.acquire(withTransportDefaults(conn), err);
    if (!lease)
        return opFailure(ErrorKind::Connection, err);

    const std::string from = ferry::normalizeRemotePath(oldPath);
    const std::string to = ferry::normalizeRemotePath(newPath);
    if (!lease.client()->rename(from, to, err)) {
        qCWarning(ferryXfer) << "Rename failed" << logPath(from) << qs(err);
        return opFailure(ErrorKind::Request, err);
    }
    return opSuccess("Renamed: " + from + " -> " + to);
}

OpResult TransferService::createFolder(const ferry::SessionOptions& conn, const std::string& path) {
    std::string err;
    ConnectionLease lease = pool_.acquire(withTransportDefaults(conn), err);
    if (!lease)
        return opFailure(ErrorKind::Connection, err);

    const std::string target = ferry::normalizeRemotePath(path);
    if (!makeRemoteDirs(*lease.client(), target, err))
        return opFailure(ErrorKind::Request, err);
    return opSuccess("Folder created: " + target);
}

OpResult TransferService::createFile(const ferry::SessionOptions& conn, const std::string& path,
                                     const std::string& content) {
    std::string err;
    ConnectionLease lease = pool_.acquire(withTransportDefaults(conn), err);
    if (!lease)
        return opFailure(ErrorKind::Connection, err);

    const std::string target = ferry::normalizeRemotePath(path);
    if (!lease.client()->writeFile(target, content, err))
        return opFailure(ErrorKind::Request, err);
    return opSuccess("File created: " + target);
}

void TransferService::closeAllConnections() {
    const int closed = pool_.closeAll();
    qCInfo(ferryPool) << "Closed all connections:" << closed;
}
