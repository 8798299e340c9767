// Persistent preferences (QSettings) with environment overrides.
#pragma once
#include <QString>
#include <cstdint>
#include <optional>
#include "sftpshare/SftpTypes.hpp"

class QSettings;

struct AppSettings {
    QString historyFile;
    QString host;     // last used, may be empty
    QString username; // last used, may be empty
    std::uint16_t port = 22;
    int timeoutMs = 20000;
    sftpshare::KnownHostsPolicy knownHostsPolicy =
        sftpshare::KnownHostsPolicy::AcceptNew;
    QString knownHostsPath; // empty = ~/.ssh/known_hosts

    // QSettings("SFTPShare", "SFTPShare") plus SFTPSHARE_HISTORY_FILE.
    static AppSettings load();
    static AppSettings load(QSettings &s);
    void save() const;
    void save(QSettings &s) const;

    // Connection parameters without the credential.
    sftpshare::ConnectionParams connectionParams() const;

    static QString defaultHistoryFile();
    static QString policyName(sftpshare::KnownHostsPolicy p);
    static std::optional<sftpshare::KnownHostsPolicy>
    parsePolicy(const QString &name);
};
