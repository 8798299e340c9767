// Interfaz abstracta de una sesión SFTP de una sola transferencia.
// Implementaciones concretas (libssh2, mock) deben respetar esta API para que
// el orquestador no dependa del backend.
#pragma once
#include "SftpTypes.hpp"
#include <memory>
#include <string>
#include <utility>

namespace sftpshare {

class SftpClient {
public:
    virtual ~SftpClient() = default;

    // Conectar (TCP + handshake + auth + subsistema SFTP) y desconectar.
    // disconnect() es idempotente y seguro tras un connect fallido.
    virtual bool connect(const ConnectionParams& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Descargar archivo remoto a local. Consulta el tamaño remoto antes de
    // crear el archivo local; si no existe falla con ErrorKind::NotFound.
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     std::string& err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    // Subir archivo local a remoto (crea/trunca). Sin rollback del remoto
    // parcial si falla a mitad.
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     std::string& err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    // Metadatos (stat). Devuelve true si existe; deja err vacío si "no existe".
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    // Clasificación del último fallo (None tras una operación exitosa).
    ErrorKind lastErrorKind() const { return lastKind_; }

protected:
    bool fail(ErrorKind kind, std::string msg, std::string& err) {
        lastKind_ = kind;
        err = std::move(msg);
        return false;
    }
    void clearError() { lastKind_ = ErrorKind::None; }

private:
    ErrorKind lastKind_ = ErrorKind::None;
};

using SftpClientFactory = std::function<std::unique_ptr<SftpClient>()>;

} // namespace sftpshare
