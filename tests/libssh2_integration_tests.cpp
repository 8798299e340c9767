// Integration tests for the real Libssh2SftpClient against a test SFTP server.
// Skipped (exit code 77) unless the SFTPSHARE_IT_* env vars exist. Files are
// placed in the login directory, the same place the application uses.
#include "sftpshare/Libssh2SftpClient.hpp"
#include "sftpshare/RuntimeLogging.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

} // namespace

int main() {
    using sftpshare::envValue;
    const auto host = envValue("SFTPSHARE_IT_SFTP_HOST");
    const auto user = envValue("SFTPSHARE_IT_SFTP_USER");
    const auto pass = envValue("SFTPSHARE_IT_SFTP_PASS");

    if (!host.has_value() || !user.has_value() || !pass.has_value()) {
        std::cout << "[SKIP] sftpshare_sftp_integration_tests requires env vars: "
                  << "SFTPSHARE_IT_SFTP_HOST, SFTPSHARE_IT_SFTP_USER and "
                     "SFTPSHARE_IT_SFTP_PASS\n";
        return kSkipExitCode;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("SFTPSHARE_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] SFTPSHARE_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    sftpshare::ConnectionParams opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    opt.password = *pass;
    opt.known_hosts_policy = sftpshare::KnownHostsPolicy::Off;

    const std::string token = uniqueToken();
    const std::string remoteName = "sftpshare-it-" + token + ".txt";
    const std::string missingName = "sftpshare-it-" + token + "-missing.bin";

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("sftpshare-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    const fs::path localSrc = localTmpRoot / "payload.txt";
    const fs::path localDst = localTmpRoot / "payload-downloaded.txt";
    const fs::path localMissing = localTmpRoot / "missing.bin";
    std::string payload = "SFTPShare integration payload\n";
    payload.append(200 * 1024, 'x'); // several 64 KiB chunks
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FAIL] could not create source file\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        out << payload;
    }

    sftpshare::Libssh2SftpClient client;
    std::string err;

    const bool connected = client.connect(opt, err);
    t.check(connected, std::string("connect should succeed: ") + err);
    if (t.failures == 0) {
        err.clear();
        std::size_t lastDone = 0;
        std::size_t reports = 0;
        t.check(client.put(localSrc.string(), remoteName, err,
                           [&](std::size_t done, std::size_t) {
                               ++reports;
                               lastDone = done;
                           },
                           {}),
                std::string("put should succeed: ") + err);
        t.check(reports >= 3, "put should report progress per chunk");
        t.check(lastDone == payload.size(),
                "last put progress should equal the file size");
    }
    if (t.failures == 0) {
        sftpshare::FileInfo st{};
        err.clear();
        t.check(client.stat(remoteName, st, err),
                std::string("stat should succeed: ") + err);
        t.check(st.size == payload.size(),
                "remote file size should match payload size");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.get(remoteName, localDst.string(), err, {}, {}),
                std::string("get should succeed: ") + err);
        std::string downloaded;
        t.check(readFile(localDst, downloaded),
                "downloaded file should be readable");
        t.check(downloaded == payload,
                "downloaded content should match uploaded payload");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(!client.get(missingName, localMissing.string(), err, {}, {}),
                "get of a missing remote file should fail");
        t.check(client.lastErrorKind() == sftpshare::ErrorKind::NotFound,
                "missing remote file should be NotFound");
        t.check(!fs::exists(localMissing),
                "no local file should be created for a missing remote");
    }

    client.disconnect();
    t.check(!client.isConnected(), "client should be disconnected");
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sftpshare_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
