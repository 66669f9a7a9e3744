// Abstract interface for SFTP operations. Concrete backends (libssh2, mock)
// implement this API so the transfer service stays decoupled from them.
#pragma once
#include "SftpTypes.hpp"
#include <cstddef>
#include <functional>
#include <memory>

namespace ferry {

class SftpClient {
public:
    // Invoked after every chunk: bytes done so far, size of this chunk, total.
    using StepCB = std::function<void(std::size_t /*done*/,
                                      std::size_t /*chunk*/,
                                      std::size_t /*total*/)>;
    // Polled by the copy loop between chunks; true aborts the transfer.
    using CancelCB = std::function<bool()>;

    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Resolve a (possibly relative) remote path to an absolute one.
    virtual bool realPath(const std::string& remote_path,
                          std::string& out,
                          std::string& err) = 0;

    // Remote directory listing ("." and ".." are skipped)
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Download a remote file to a local path, chunk by chunk.
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     std::string& err,
                     StepCB step = {},
                     CancelCB shouldCancel = {}) = 0;

    // Upload a local file to a remote path (create/truncate), chunk by chunk.
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     std::string& err,
                     StepCB step = {},
                     CancelCB shouldCancel = {}) = 0;

    // Read a whole remote file into memory.
    virtual bool readFile(const std::string& remote,
                          std::string& out,
                          std::string& err) = 0;

    // Create or truncate a remote file with the given content.
    virtual bool writeFile(const std::string& remote,
                           const std::string& content,
                           std::string& err) = 0;

    // Existence check (leaves err empty when the path does not exist)
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        std::string& err) = 0;

    // Detailed metadata. Returns true when the path exists; err stays empty
    // when it simply does not.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    // File/folder operations (remote side)
    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           std::string& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        std::string& err,
                        bool overwrite = false) = 0;

    // Create a new, connected client of the same kind.
    virtual std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                          std::string& err) = 0;
};

} // namespace ferry
