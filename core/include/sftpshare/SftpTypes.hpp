// Tipos básicos compartidos entre la app y el core: parámetros de conexión,
// metadatos remotos, muestras de progreso y clasificación de errores.
#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include <functional>

namespace sftpshare {

// Política de validación de known_hosts para la clave del servidor.
enum class KnownHostsPolicy {
    Strict,     // Requiere coincidencia exacta con known_hosts.
    AcceptNew,  // TOFU: acepta y guarda nuevos hosts; rechaza cambios de clave.
    Off         // Sin verificación (no recomendado).
};

// Clasificación del último fallo de una sesión.
enum class ErrorKind {
    None,
    Validation,
    Connection,
    NotFound,
    Io,
    Canceled,
    Storage,
    Busy
};

struct FileInfo {
    std::string   name;     // nombre base
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (si aplica)
    std::uint64_t mtime = 0;  // epoch (segundos)
    std::uint32_t mode  = 0;  // bits POSIX (permisos/tipo)
};

// (transferidos, total) en bytes. transferred <= total.
struct ProgressSample {
    std::uint64_t transferred = 0;
    std::uint64_t total = 0;

    double fraction() const {
        if (complete() || total == 0) return 1.0;
        return static_cast<double>(transferred) / static_cast<double>(total);
    }
    bool complete() const { return transferred == total; }
};

inline bool operator==(const ProgressSample& a, const ProgressSample& b) {
    return a.transferred == b.transferred && a.total == b.total;
}
inline bool operator!=(const ProgressSample& a, const ProgressSample& b) {
    return !(a == b);
}

using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;
using CancelCB = std::function<bool()>;

// Parámetros de una conexión. Un único par usuario/contraseña.
struct ConnectionParams {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::string password;

    // Seguridad SSH
    std::optional<std::string> known_hosts_path; // por defecto: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;

    // Confirmación de huella (TOFU) cuando known_hosts no tiene entrada.
    // Devuelve true para aceptar y guardar, false para rechazar.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    // Timeout de las llamadas bloqueantes de libssh2 (ms). 0 = sin timeout.
    long timeout_ms = 20000;
};

// Nombre del primer campo obligatorio vacío; nullopt si están todos.
inline std::optional<std::string> firstMissingField(const ConnectionParams& p) {
    if (p.host.empty()) return std::string("host");
    if (p.port == 0) return std::string("port");
    if (p.username.empty()) return std::string("username");
    if (p.password.empty()) return std::string("credential");
    return std::nullopt;
}

} // namespace sftpshare
