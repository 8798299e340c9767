#include "AppSettings.hpp"
#include "sftpshare/RuntimeLogging.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

QString AppSettings::defaultHistoryFile() {
    QString dir =
        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dir.isEmpty())
        dir = QDir::homePath() + "/.sftpshare";
    return dir + "/transfer_history.json";
}

QString AppSettings::policyName(sftpshare::KnownHostsPolicy p) {
    switch (p) {
    case sftpshare::KnownHostsPolicy::Strict:
        return QStringLiteral("strict");
    case sftpshare::KnownHostsPolicy::AcceptNew:
        return QStringLiteral("accept-new");
    case sftpshare::KnownHostsPolicy::Off:
        return QStringLiteral("off");
    }
    return QStringLiteral("accept-new");
}

std::optional<sftpshare::KnownHostsPolicy>
AppSettings::parsePolicy(const QString &name) {
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("strict"))
        return sftpshare::KnownHostsPolicy::Strict;
    if (n == QLatin1String("accept-new") || n == QLatin1String("acceptnew"))
        return sftpshare::KnownHostsPolicy::AcceptNew;
    if (n == QLatin1String("off"))
        return sftpshare::KnownHostsPolicy::Off;
    return std::nullopt;
}

AppSettings AppSettings::load() {
    QSettings s("SFTPShare", "SFTPShare");
    return load(s);
}

AppSettings AppSettings::load(QSettings &s) {
    AppSettings a;
    a.historyFile =
        s.value("History/file", defaultHistoryFile()).toString().trimmed();
    if (a.historyFile.isEmpty())
        a.historyFile = defaultHistoryFile();
    if (const auto env = sftpshare::envValue("SFTPSHARE_HISTORY_FILE"))
        a.historyFile = QString::fromStdString(*env);

    a.host = s.value("Connection/host").toString().trimmed();
    a.username = s.value("Connection/user").toString().trimmed();
    const uint port = s.value("Connection/port", 22).toUInt();
    a.port = (port >= 1 && port <= 65535) ? static_cast<std::uint16_t>(port)
                                          : std::uint16_t(22);
    a.timeoutMs = qMax(0, s.value("Connection/timeoutMs", 20000).toInt());

    const auto policy =
        parsePolicy(s.value("Security/knownHostsPolicy", "accept-new").toString());
    a.knownHostsPolicy = policy.value_or(sftpshare::KnownHostsPolicy::AcceptNew);
    a.knownHostsPath = s.value("Security/knownHostsPath").toString().trimmed();
    return a;
}

void AppSettings::save() const {
    QSettings s("SFTPShare", "SFTPShare");
    save(s);
}

void AppSettings::save(QSettings &s) const {
    s.setValue("History/file", historyFile);
    s.setValue("Connection/host", host);
    s.setValue("Connection/user", username);
    s.setValue("Connection/port", static_cast<int>(port));
    s.setValue("Connection/timeoutMs", timeoutMs);
    s.setValue("Security/knownHostsPolicy", policyName(knownHostsPolicy));
    s.setValue("Security/knownHostsPath", knownHostsPath);
    s.sync();
}

sftpshare::ConnectionParams AppSettings::connectionParams() const {
    sftpshare::ConnectionParams p;
    p.host = host.toStdString();
    p.port = port;
    p.username = username.toStdString();
    p.known_hosts_policy = knownHostsPolicy;
    if (!knownHostsPath.isEmpty())
        p.known_hosts_path = knownHostsPath.toStdString();
    p.timeout_ms = timeoutMs;
    return p;
}
