// Public surface of the transfer manager: uploads, downloads and single-shot
// remote file operations over pooled sessions, with progress tracking and
// cooperative cancellation. Operations block the calling thread; call them
// from worker threads to run transfers concurrently.
#pragma once
#include "ConnectionPool.hpp"
#include "ServiceSettings.hpp"
#include "ferry/TransferTracker.hpp"
#include <QMetaType>
#include <QObject>
#include <QString>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ferry { class SftpClient; }
class IdleReaper;

enum class ErrorKind {
    None,
    Connection, // the session could not be obtained
    Path,       // local/remote path missing or of the wrong kind
    Transfer,   // the copy itself failed
    Request     // a single remote request failed or was rejected
};

const char* errorKindName(ErrorKind kind);

struct OpResult {
    bool success = false;
    ErrorKind errorKind = ErrorKind::None;
    std::string message;
    std::string error;
};

struct TransferResult {
    bool success = false;
    bool cancelled = false;
    ErrorKind errorKind = ErrorKind::None;
    std::string transferId;
    std::string message;
    std::string error;
    int filesTransferred = 0;
};

struct RemoteEntry {
    std::string name;
    std::string path;
    bool isDirectory = false;
    std::uint64_t size = 0;
    std::string mtime;    // ISO-8601, UTC
    std::string mimeType; // empty for directories
};

struct ListResult {
    bool success = false;
    ErrorKind errorKind = ErrorKind::None;
    std::vector<RemoteEntry> data;
    std::string error;
};

struct FilePreview {
    std::string type;     // "text", "image" (base64 content), "error", "unsupported"
    std::string content;
    std::string message;
    std::string mimeType;
};

struct PreviewResult {
    bool success = false;
    ErrorKind errorKind = ErrorKind::None;
    FilePreview preview;
    std::string fileName;
    std::uint64_t fileSize = 0;
    std::string mimeType;
    std::string error;
};

struct TransferOptions {
    // Called on the transferring thread after every chunk.
    std::function<void(const ferry::ProgressEvent&)> onProgress;
};

Q_DECLARE_METATYPE(ferry::ProgressEvent)

class TransferService : public QObject {
    Q_OBJECT
public:
    // backend->newConnectionLike() opens the pooled sessions.
    explicit TransferService(std::shared_ptr<ferry::SftpClient> backend,
                             const ServiceSettings& settings = ServiceSettings(),
                             QObject* parent = nullptr,
                             ConnectionPool::Clock poolClock = {},
                             ferry::TransferTracker::Clock trackerClock = {});
    ~TransferService() override;

    ListResult listFiles(const ferry::SessionOptions& conn, const std::string& dirPath);
    PreviewResult previewFile(const ferry::SessionOptions& conn, const std::string& filePath);

    TransferResult uploadFile(const ferry::SessionOptions& conn,
                              const std::string& localPath,
                              const std::string& remotePath,
                              const TransferOptions& options = {});
    TransferResult uploadFolder(const ferry::SessionOptions& conn,
                                const std::string& localDir,
                                const std::string& remoteDir,
                                const TransferOptions& options = {});
    TransferResult downloadFile(const ferry::SessionOptions& conn,
                                const std::string& remotePath,
                                const std::string& localPath,
                                const TransferOptions& options = {});

    // Flags an in-flight transfer. The outcome arrives through the call that
    // started it, as a cancelled result.
    OpResult cancelTransfer(const std::string& transferId);

    OpResult deleteFile(const ferry::SessionOptions& conn, const std::string& path, bool isDirectory);
    OpResult renameFile(const ferry::SessionOptions& conn, const std::string& oldPath, const std::string& newPath);
    OpResult createFolder(const ferry::SessionOptions& conn, const std::string& path);
    OpResult createFile(const ferry::SessionOptions& conn, const std::string& path, const std::string& content);

    void closeAllConnections();

    ConnectionPool& pool() { return pool_; }
    const ferry::TransferTracker& tracker() const { return tracker_; }
    IdleReaper* reaper() const { return reaper_.get(); }
    const ServiceSettings& settings() const { return settings_; }

signals:
    void transferStarted(const QString& transferId, const QString& type, const QString& fileName);
    void transferProgress(const ferry::ProgressEvent& event);
    void transferFinished(const QString& transferId, bool success, bool cancelled, const QString& error);

private:
    ferry::SessionOptions withTransportDefaults(const ferry::SessionOptions& conn) const;
    std::string nextTransferId(ferry::TransferType type);
    void publish(const ferry::ProgressEvent& ev, const TransferOptions& options);
    TransferResult finishTransfer(const std::string& id, bool ok, const std::string& err,
                                  const std::string& successMessage);

    ServiceSettings settings_;
    ConnectionPool pool_;
    ferry::TransferTracker tracker_;
    std::unique_ptr<IdleReaper> reaper_;
    std::atomic<std::uint64_t> seq_{0};
};
