#include "sftpshare/MockSftpClient.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>

namespace sftpshare {

MockSftpClient::MockSftpClient(std::shared_ptr<MockRemote> remote)
  : remote_(std::move(remote)) {}

MockSftpClient::~MockSftpClient() {
  disconnect();
}

SftpClientFactory MockSftpClient::factoryFor(std::shared_ptr<MockRemote> remote) {
  return [remote]() -> std::unique_ptr<SftpClient> {
    return std::make_unique<MockSftpClient>(remote);
  };
}

bool MockSftpClient::connect(const ConnectionParams& opt, std::string& err) {
  clearError();
  if (connected_) {
    return fail(ErrorKind::Connection, "already connected", err);
  }
  if (const auto missing = firstMissingField(opt)) {
    return fail(ErrorKind::Validation, "missing connection field: " + *missing, err);
  }
  remote_->log("connect " + opt.host + ":" + std::to_string(opt.port));
  const auto& hosts = remote_->reachableHosts;
  if (!hosts.empty() && std::find(hosts.begin(), hosts.end(), opt.host) == hosts.end()) {
    return fail(ErrorKind::Connection, "could not connect to " + opt.host + ":" + std::to_string(opt.port), err);
  }
  if (remote_->failHandshake) {
    return fail(ErrorKind::Connection, "SSH handshake failed", err);
  }
  auto it = remote_->users.find(opt.username);
  if (it == remote_->users.end() || it->second != opt.password) {
    return fail(ErrorKind::Connection, "authentication rejected", err);
  }
  connected_ = true;
  lastOpt_ = opt;
  {
    std::lock_guard<std::mutex> lk(remote_->mtx);
    ++remote_->openSessions;
  }
  return true;
}

void MockSftpClient::disconnect() {
  if (!connected_) return;
  connected_ = false;
  remote_->log("disconnect");
  std::lock_guard<std::mutex> lk(remote_->mtx);
  --remote_->openSessions;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          std::string& err) {
  clearError();
  err.clear();
  if (!connected_) {
    return fail(ErrorKind::Connection, "not connected", err);
  }
  std::lock_guard<std::mutex> lk(remote_->mtx);
  auto it = remote_->files.find(remote_path);
  if (it == remote_->files.end()) {
    return fail(ErrorKind::NotFound, "", err);
  }
  info = FileInfo{};
  info.name = remote_path;
  info.size = it->second.size();
  info.mode = 0100644;
  return true;
}

bool MockSftpClient::get(const std::string& remote,
                         const std::string& local,
                         std::string& err,
                         ProgressCB progress,
                         CancelCB shouldCancel) {
  clearError();
  if (!connected_) {
    return fail(ErrorKind::Connection, "not connected", err);
  }
  remote_->log("get " + remote);
  std::string content;
  {
    std::lock_guard<std::mutex> lk(remote_->mtx);
    auto it = remote_->files.find(remote);
    if (it == remote_->files.end()) {
      return fail(ErrorKind::NotFound, "remote file not found: " + remote, err);
    }
    content = it->second;
  }
  std::ofstream out(local, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return fail(ErrorKind::Io, "cannot open local file for writing: " + local, err);
  }
  const std::size_t total = content.size();
  const std::size_t chunk = std::max<std::size_t>(1, remote_->chunkSize);
  std::size_t done = 0;
  while (done < total) {
    if (shouldCancel && shouldCancel()) {
      return fail(ErrorKind::Canceled, "canceled by user", err);
    }
    if (remote_->failAfterBytes >= 0 && done >= (std::size_t)remote_->failAfterBytes) {
      return fail(ErrorKind::Io, "remote read failed: connection lost", err);
    }
    const std::size_t n = std::min(chunk, total - done);
    out.write(content.data() + done, (std::streamsize)n);
    if (!out) {
      return fail(ErrorKind::Io, "local write failed", err);
    }
    done += n;
    {
      std::lock_guard<std::mutex> lk(remote_->mtx);
      remote_->bytesMoved += (int)n;
    }
    if (progress) progress(done, total);
  }
  out.close();
  if (!out) {
    return fail(ErrorKind::Io, "cannot close local file: " + local, err);
  }
  return true;
}

bool MockSftpClient::put(const std::string& local,
                         const std::string& remote,
                         std::string& err,
                         ProgressCB progress,
                         CancelCB shouldCancel) {
  clearError();
  if (!connected_) {
    return fail(ErrorKind::Connection, "not connected", err);
  }
  remote_->log("put " + remote);
  std::ifstream in(local, std::ios::binary);
  if (!in.is_open()) {
    return fail(ErrorKind::Io, "cannot open local file for reading: " + local, err);
  }
  const std::string content((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());
  const std::size_t total = content.size();
  const std::size_t chunk = std::max<std::size_t>(1, remote_->chunkSize);
  {
    // crea/trunca; los bytes ya escritos quedan si se corta (sin rollback)
    std::lock_guard<std::mutex> lk(remote_->mtx);
    remote_->files[remote].clear();
  }
  std::size_t done = 0;
  while (done < total) {
    if (shouldCancel && shouldCancel()) {
      return fail(ErrorKind::Canceled, "canceled by user", err);
    }
    if (remote_->failAfterBytes >= 0 && done >= (std::size_t)remote_->failAfterBytes) {
      return fail(ErrorKind::Io, "remote write failed: connection lost", err);
    }
    const std::size_t n = std::min(chunk, total - done);
    {
      std::lock_guard<std::mutex> lk(remote_->mtx);
      remote_->files[remote].append(content, done, n);
      remote_->bytesMoved += (int)n;
    }
    done += n;
    if (progress) progress(done, total);
  }
  return true;
}

} // namespace sftpshare
