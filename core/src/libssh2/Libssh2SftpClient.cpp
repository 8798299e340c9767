// Backend libssh2: gestiona socket TCP, sesión SSH y canal SFTP para una
// única transferencia. Incluye keepalive y validación de known_hosts.
#include "sftpshare/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cstring>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <mutex>
#include <cstdlib>
#include <cstdio>
#include <sstream>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace sftpshare {

namespace {

// Inicialización global de libssh2 (una vez por proceso)
std::once_flag g_libssh2_once;

const std::size_t kChunk = 64 * 1024;

struct KbdIntCtx {
    const char* user;
    const char* pass;
};

char* dupResponse(const char* s, std::size_t len) {
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

// Callback keyboard-interactive: responde a prompts con user/password según el texto
void kbint_password_callback(const char* /*name*/, int /*name_len*/,
                             const char* /*instruction*/, int /*instruction_len*/,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                             void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        const char* prompt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        std::string lower(prompt);
        for (char& c : lower) {
            if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
        }
        // Heurística simple: si el prompt menciona "user" o "name", enviar usuario; si no, contraseña
        const bool wantUser = lower.find("user") != std::string::npos ||
                              lower.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = (alen > 0) ? dupResponse(ans, alen) : nullptr;
        responses[i].length = responses[i].text ? (unsigned int)alen : 0;
    }
}

std::string hostKeyAlgorithmName(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
        case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
#endif
        default: return "UNKNOWN";
    }
}

int knownHostKeyMask(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default: return 0;
    }
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, [] {
        int rc = libssh2_init(0);
        (void)rc;
    });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

std::string Libssh2SftpClient::lastSessionError() const {
    if (!session_) return {};
    char* emsgPtr = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
    return (emsgPtr && emlen > 0) ? std::string(emsgPtr, (size_t)emlen) : std::string();
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        return fail(ErrorKind::Connection, std::string("getaddrinfo: ") + gai_strerror(gai), err);
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // Activar keepalive de TCP
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __linux__
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    return fail(ErrorKind::Connection, "could not connect to " + host + ":" + portStr, err);
}

bool Libssh2SftpClient::sshHandshake(const ConnectionParams& opt, std::string& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        return fail(ErrorKind::Connection, "libssh2_session_init failed", err);
    }

    libssh2_session_set_blocking(session_, 1);
    if (opt.timeout_ms > 0) {
        libssh2_session_set_timeout(session_, opt.timeout_ms);
    }

    if (libssh2_session_handshake(session_, sock_) != 0) {
        return fail(ErrorKind::Connection, "SSH handshake failed: " + lastSessionError(), err);
    }

    // Keepalive SSH: pedir que libssh2 envíe mensajes cada 30s si el peer lo permite
    libssh2_keepalive_config(session_, 1, 30);
    return true;
}

// Verificación de host key según política de known_hosts
bool Libssh2SftpClient::verifyHostKey(const ConnectionParams& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        return fail(ErrorKind::Connection, "cannot initialise known_hosts", err);
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        return fail(ErrorKind::Connection, "known_hosts missing or unreadable (strict policy)", err);
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        return fail(ErrorKind::Connection, "cannot obtain host key", err);
    }

    const int alg = knownHostKeyMask(keytype);
    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        libssh2_knownhost_free(nh);
        return fail(ErrorKind::Connection, "host key does not match known_hosts", err);
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        return fail(ErrorKind::Connection, "unknown host in known_hosts", err);
    }

    // TOFU: pedir confirmación al usuario
    std::string fpStr;
    const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (h) {
        std::ostringstream oss;
        oss << "SHA256:";
        for (int i = 0; i < 32; ++i) {
            if (i) oss << ':';
            char b[4];
            std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
            oss << b;
        }
        fpStr = oss.str();
    }
    const bool confirmed = opt.hostkey_confirm_cb &&
                           opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyAlgorithmName(keytype), fpStr);
    if (!confirmed) {
        libssh2_knownhost_free(nh);
        return fail(ErrorKind::Connection, "unknown host: fingerprint not confirmed by the user", err);
    }
    if (khPath.empty()) {
        libssh2_knownhost_free(nh);
        return fail(ErrorKind::Connection, "known_hosts path not defined", err);
    }
    const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                             hostkey, keylen,
                                             nullptr, 0, addMask, nullptr);
    if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        libssh2_knownhost_free(nh);
        return fail(ErrorKind::Connection, "cannot add/write host to known_hosts", err);
    }
    libssh2_knownhost_free(nh);
    return true;
}

// Autenticación con el único par usuario/contraseña: password primero y, si
// el servidor sigue vivo y lo admite, keyboard-interactive con las mismas credenciales.
bool Libssh2SftpClient::authenticate(const ConnectionParams& opt, std::string& err) {
    int rc_pw = -1;
    for (;;) {
        rc_pw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password.c_str());
        if (rc_pw != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (rc_pw == 0) return true;
    if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
        rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
        return fail(ErrorKind::Connection, "server closed the connection after the password attempt", err);
    }

    const std::string pwErr = lastSessionError();
    char* methods = libssh2_userauth_list(session_, opt.username.c_str(), (unsigned)opt.username.size());
    const std::string authlist = methods ? std::string(methods) : std::string();
    int rc_kbd = -1;
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{opt.username.c_str(), opt.password.c_str()};
        void** abs = libssh2_session_abstract(session_);
        if (abs) *abs = &ctx;
        for (;;) {
            rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbint_password_callback);
            if (rc_kbd != LIBSSH2_ERROR_EAGAIN) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (abs) *abs = nullptr;
        if (rc_kbd == 0) return true;
    }

    return fail(ErrorKind::Connection,
                std::string("authentication rejected") +
                    (authlist.empty() ? std::string() : (" (methods: " + authlist + ")")) +
                    (pwErr.empty() ? std::string() : (": " + pwErr)) +
                    " [rc_pw=" + std::to_string(rc_pw) + ", rc_kbd=" + std::to_string(rc_kbd) + "]",
                err);
}

bool Libssh2SftpClient::connect(const ConnectionParams& opt, std::string& err) {
    clearError();
    if (connected_) {
        return fail(ErrorKind::Connection, "already connected", err);
    }
    if (const auto missing = firstMissingField(opt)) {
        return fail(ErrorKind::Validation, "missing connection field: " + *missing, err);
    }
    // Cualquier fallo intermedio libera socket y sesión
    if (!tcpConnect(opt.host, opt.port, err) ||
        !sshHandshake(opt, err) ||
        !verifyHostKey(opt, err) ||
        !authenticate(opt, err)) {
        disconnect();
        return false;
    }
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        fail(ErrorKind::Connection, "cannot start SFTP subsystem: " + lastSessionError(), err);
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             std::string& err) {
    clearError();
    err.clear();
    if (!connected_ || !sftp_) {
        return fail(ErrorKind::Connection, "not connected", err);
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        const unsigned long code = libssh2_sftp_last_error(sftp_);
        if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) {
            return fail(ErrorKind::NotFound, "", err);
        }
        return fail(ErrorKind::Io, "sftp_stat failed for: " + remote_path +
                                       " (SFTP code " + std::to_string(code) + ")", err);
    }
    const auto slash = remote_path.find_last_of('/');
    info = FileInfo{};
    info.name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        info.mode = st.permissions;
        info.is_dir = (st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
    }
    if (st.flags & LIBSSH2_SFTP_ATTR_SIZE) info.size = st.filesize;
    if (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) info.mtime = st.mtime;
    return true;
}

// Descarga archivo remoto a local. Reporta progreso e integra cancelación cooperativa.
bool Libssh2SftpClient::get(const std::string& remote,
                            const std::string& local,
                            std::string& err,
                            ProgressCB progress,
                            CancelCB shouldCancel) {
    clearError();
    if (!connected_ || !sftp_) {
        return fail(ErrorKind::Connection, "not connected", err);
    }
    // Tamaño remoto antes de tocar el disco local
    FileInfo info;
    std::string statErr;
    if (!stat(remote, info, statErr)) {
        if (lastErrorKind() == ErrorKind::NotFound) {
            return fail(ErrorKind::NotFound, "remote file not found: " + remote, err);
        }
        return fail(lastErrorKind(), statErr, err);
    }
    if (info.is_dir) {
        return fail(ErrorKind::Io, "remote path is a directory: " + remote, err);
    }
    const std::size_t total = (std::size_t)info.size;

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        return fail(ErrorKind::Io, "cannot open remote file for reading: " + remote, err);
    }
    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        return fail(ErrorKind::Io, "cannot open local file for writing: " + local, err);
    }

    std::vector<char> buf(kChunk);
    std::size_t done = 0;
    while (true) {
        if (shouldCancel && shouldCancel()) {
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return fail(ErrorKind::Canceled, "canceled by user", err);
        }
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
                std::fclose(lf);
                libssh2_sftp_close(rh);
                return fail(ErrorKind::Io, "local write failed", err);
            }
            done += (std::size_t)n;
            if (progress) progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return fail(ErrorKind::Io, "remote read failed: " + lastSessionError(), err);
        }
    }
    libssh2_sftp_close(rh);
    if (std::fclose(lf) != 0) {
        return fail(ErrorKind::Io, "cannot close local file: " + local, err);
    }
    return true;
}

// Sube archivo local a remoto (crear/truncar). Reporta progreso y cancelación.
bool Libssh2SftpClient::put(const std::string& local,
                            const std::string& remote,
                            std::string& err,
                            ProgressCB progress,
                            CancelCB shouldCancel) {
    clearError();
    if (!connected_ || !sftp_) {
        return fail(ErrorKind::Connection, "not connected", err);
    }
    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        return fail(ErrorKind::Io, "cannot open local file for reading: " + local, err);
    }
    // Tamaño local, una sola vez antes de empezar
    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::size_t total = fsz > 0 ? (std::size_t)fsz : 0;

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        return fail(ErrorKind::Io, "cannot open remote file for writing: " + remote, err);
    }

    std::vector<char> buf(kChunk);
    std::size_t done = 0;
    while (true) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return fail(ErrorKind::Io, "local read failed", err);
            }
            break; // EOF
        }
        char* p = buf.data();
        size_t remain = n;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return fail(ErrorKind::Canceled, "canceled by user", err);
            }
            ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return fail(ErrorKind::Io, "remote write failed: " + lastSessionError(), err);
            }
            remain -= (size_t)w;
            p += w;
            done += (size_t)w;
            if (progress) progress(done, total);
        }
    }
    std::fclose(lf);
    if (libssh2_sftp_close(wh) != 0) {
        return fail(ErrorKind::Io, "remote close failed: " + lastSessionError(), err);
    }
    return true;
}

} // namespace sftpshare
