#pragma once
#include "SftpClient.hpp"
#include <string>

// Forward a los tipos INTERNOS (con guion bajo)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace sftpshare {

class Libssh2SftpClient : public SftpClient {
public:
  Libssh2SftpClient();
  ~Libssh2SftpClient() override;

  Libssh2SftpClient(const Libssh2SftpClient&) = delete;
  Libssh2SftpClient& operator=(const Libssh2SftpClient&) = delete;

  bool connect(const ConnectionParams& opt, std::string& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_; }

  bool get(const std::string& remote,
           const std::string& local,
           std::string& err,
           ProgressCB progress,
           CancelCB shouldCancel) override;

  bool put(const std::string& local,
           const std::string& remote,
           std::string& err,
           ProgressCB progress,
           CancelCB shouldCancel) override;

  bool stat(const std::string& remote_path,
            FileInfo& info,
            std::string& err) override;

private:
  bool connected_ = false;
  int  sock_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr;
  _LIBSSH2_SFTP*    sftp_    = nullptr;

  bool tcpConnect(const std::string& host, uint16_t port, std::string& err);
  bool sshHandshake(const ConnectionParams& opt, std::string& err);
  bool verifyHostKey(const ConnectionParams& opt, std::string& err);
  bool authenticate(const ConnectionParams& opt, std::string& err);
  std::string lastSessionError() const;
};

} // namespace sftpshare
