#pragma once
#include "SftpClient.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sftpshare {

// Estado del "servidor remoto" simulado. Se comparte entre todas las
// sesiones creadas para un test, igual que un servidor real entre conexiones.
struct MockRemote {
  // Mini "FS remoto": ruta relativa -> contenido
  std::map<std::string, std::string> files;
  // usuario -> contraseña aceptada
  std::map<std::string, std::string> users = { {"u", "p"} };
  // Hosts alcanzables; vacío = cualquiera
  std::vector<std::string> reachableHosts;

  std::size_t chunkSize = 4;     // bytes por write/read simulado
  long failAfterBytes = -1;      // >=0: corta la transferencia tras N bytes
  bool failHandshake = false;

  // Registro de llamadas ("connect", "put a.txt", "disconnect", ...)
  std::vector<std::string> events;
  int openSessions = 0;
  int bytesMoved = 0;

  mutable std::mutex mtx;

  void log(const std::string& e) {
    std::lock_guard<std::mutex> lk(mtx);
    events.push_back(e);
  }
  std::vector<std::string> eventsSnapshot() const {
    std::lock_guard<std::mutex> lk(mtx);
    return events;
  }
};

class MockSftpClient : public SftpClient {
public:
  explicit MockSftpClient(std::shared_ptr<MockRemote> remote = std::make_shared<MockRemote>());
  ~MockSftpClient() override;

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

  const std::shared_ptr<MockRemote>& remote() const { return remote_; }
  const ConnectionParams& lastParams() const { return lastOpt_; }

  // Fábrica para el orquestador: cada sesión nueva comparte el mismo remoto.
  static SftpClientFactory factoryFor(std::shared_ptr<MockRemote> remote);

private:
  std::shared_ptr<MockRemote> remote_;
  bool connected_ = false;
  ConnectionParams lastOpt_{};
};

} // namespace sftpshare
