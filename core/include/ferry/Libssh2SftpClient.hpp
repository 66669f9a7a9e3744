#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations of libssh2's internal types (leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace ferry {

// One TCP socket, one SSH session, one SFTP channel.
// libssh2 sessions are not thread-safe: every libssh2 call on this object
// runs under ioMutex_, taken per call (per chunk during get/put), so several
// transfers can share the session and interleave chunk by chunk.
class Libssh2SftpClient : public SftpClient {
public:
  Libssh2SftpClient();
  ~Libssh2SftpClient() override;

  bool connect(const SessionOptions& opt, std::string& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_.load(); }

  bool realPath(const std::string& remote_path,
                std::string& out,
                std::string& err) override;

  bool list(const std::string& remote_path,
            std::vector<FileInfo>& out,
            std::string& err) override;

  bool get(const std::string& remote,
           const std::string& local,
           std::string& err,
           StepCB step = {},
           CancelCB shouldCancel = {}) override;

  bool put(const std::string& local,
           const std::string& remote,
           std::string& err,
           StepCB step = {},
           CancelCB shouldCancel = {}) override;

  bool readFile(const std::string& remote,
                std::string& out,
                std::string& err) override;

  bool writeFile(const std::string& remote,
                 const std::string& content,
                 std::string& err) override;

  bool exists(const std::string& remote_path,
              bool& isDir,
              std::string& err) override;

  bool stat(const std::string& remote_path,
            FileInfo& info,
            std::string& err) override;

  bool mkdir(const std::string& remote_dir,
             std::string& err,
             unsigned int mode = 0755) override;

  bool removeFile(const std::string& remote_path,
                  std::string& err) override;

  bool removeDir(const std::string& remote_dir,
                 std::string& err) override;

  bool rename(const std::string& from,
              const std::string& to,
              std::string& err,
              bool overwrite = false) override;

  std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                std::string& err) override;

  // True for libssh2 error codes after which the session cannot be reused
  // (socket closed or failed, timeout, transport corruption).
  static bool isSessionLost(int libssh2Error);

private:
  std::atomic<bool> connected_{false};
  int  sock_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr;
  _LIBSSH2_SFTP*    sftp_    = nullptr;
  std::mutex ioMutex_;

  bool tcpConnect(const std::string& host, uint16_t port, std::string& err);
  bool verifyHostKey(const SessionOptions& opt, std::string& err);
  bool authenticate(const SessionOptions& opt, std::string& err);
  bool tryAgentAuth(const std::string& user);
  bool sshHandshakeAuth(const SessionOptions& opt, std::string& err);
  // Returns 1 = exists, 0 = does not exist, -1 = error. Caller holds ioMutex_.
  int statLocked(const std::string& remote_path, FileInfo& info);
  void closeLocked();
  // Sets err; marks the session disconnected when the last libssh2 error
  // means the transport is gone. Caller holds ioMutex_.
  void failLocked(std::string& err, const std::string& message);
  std::string lastSessionError();
};

} // namespace ferry
