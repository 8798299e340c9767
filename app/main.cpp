// Command-line front end: collects connection parameters and a request, runs
// one transfer on a background thread and prints progress and the outcome.
#include "AppSettings.hpp"
#include "HistoryStore.hpp"
#include "ProgressReporter.hpp"
#include "TransferOrchestrator.hpp"
#include "sftpshare/Libssh2SftpClient.hpp"
#include "sftpshare/RuntimeLogging.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QStringList>
#include <QVector>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <termios.h>
#include <unistd.h>

Q_LOGGING_CATEGORY(sfCli, "sftpshare.cli")

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

std::atomic<TransferOrchestrator *> g_active{nullptr};

void onInterrupt(int) {
    if (TransferOrchestrator *o = g_active.load())
        o->cancel();
}

// Best-effort memory scrubbing for the credential
void secureClear(std::string &s) {
    volatile char *p = s.empty() ? nullptr : &s[0];
    for (std::size_t i = 0; i < s.size(); ++i)
        p[i] = 0;
    s.clear();
}

std::string promptLine(const std::string &question) {
    std::cerr << question << std::flush;
    std::string line;
    if (!std::getline(std::cin, line))
        return {};
    return line;
}

std::string promptSecret(const std::string &question) {
    termios oldt{};
    const bool tty = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &oldt) == 0;
    if (tty) {
        termios noecho = oldt;
        noecho.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        ::tcsetattr(STDIN_FILENO, TCSANOW, &noecho);
    }
    std::string line = promptLine(question);
    if (tty) {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
        std::cerr << "\n";
    }
    return line;
}

bool confirmHostKey(bool trustNew, const std::string &host, std::uint16_t port,
                    const std::string &alg, const std::string &fp) {
    std::cerr << "Unknown host " << host << ":" << port << "\n"
              << "  " << alg << " " << fp << "\n";
    if (trustNew) {
        std::cerr << "  trusted (--trust-new-host)\n";
        return true;
    }
    const std::string answer = promptLine("Trust this host and save its key? [y/N] ");
    return answer == "y" || answer == "Y" || answer == "yes";
}

void printHistory(const HistoryStore &store) {
    const auto entries = store.newestFirst();
    if (entries.isEmpty()) {
        std::cout << "No transfers recorded.\n";
        return;
    }
    for (const auto &e : entries) {
        std::cout << e.date().toStdString() << "  "
                  << HistoryEntry::directionName(e.direction).toStdString()
                  << "  " << e.file.toStdString() << "  "
                  << HistoryEntry::outcomeName(e.outcome).toStdString() << "\n";
    }
}

bool confirm(const QCommandLineParser &parser, const std::string &question) {
    if (parser.isSet("yes"))
        return true;
    const std::string answer = promptLine(question + " [y/N] ");
    return answer == "y" || answer == "Y" || answer == "yes";
}

int runHistory(const QCommandLineParser &parser, HistoryStore &store) {
    if (parser.isSet("clear")) {
        if (!confirm(parser, "Clear all " + std::to_string(store.size()) +
                                 " history entries?")) {
            std::cout << "Nothing removed.\n";
            return kExitOk;
        }
        const auto res = store.clear();
        if (!res.ok()) {
            std::cerr << "Could not clear history: " << res.detail.toStdString() << "\n";
            return kExitFailed;
        }
        std::cout << "History cleared.\n";
        return kExitOk;
    }
    if (parser.isSet("delete")) {
        QVector<HistoryKey> keys;
        for (const QString &raw : parser.values("delete")) {
            HistoryKey key;
            if (!HistoryKey::parse(raw, key)) {
                std::cerr << "--delete expects \"YYYY-MM-DD HH:MM|FILE|success|failed\", got \""
                          << raw.toStdString() << "\"\n";
                return kExitUsage;
            }
            keys.push_back(key);
        }
        if (!confirm(parser, "Delete " + std::to_string(keys.size()) +
                                 (keys.size() == 1 ? " entry?" : " entries?"))) {
            std::cout << "Nothing removed.\n";
            return kExitOk;
        }
        const auto res = store.removeMatching(keys);
        if (!res.ok()) {
            std::cerr << res.detail.toStdString() << "\n";
            return kExitFailed;
        }
        std::cout << keys.size() << (keys.size() == 1 ? " entry" : " entries")
                  << " deleted.\n";
        return kExitOk;
    }
    printHistory(store);
    return kExitOk;
}

int runSettings(const QCommandLineParser &parser, AppSettings settings) {
    if (parser.isSet("save")) {
        settings.save();
        std::cout << "Settings saved.\n";
    }
    std::cout << "history-file        " << settings.historyFile.toStdString() << "\n"
              << "host                " << settings.host.toStdString() << "\n"
              << "user                " << settings.username.toStdString() << "\n"
              << "port                " << settings.port << "\n"
              << "timeout-ms          " << settings.timeoutMs << "\n"
              << "known-hosts-policy  "
              << AppSettings::policyName(settings.knownHostsPolicy).toStdString() << "\n"
              << "known-hosts-path    "
              << (settings.knownHostsPath.isEmpty() ? std::string("~/.ssh/known_hosts")
                                                    : settings.knownHostsPath.toStdString())
              << "\n";
    return kExitOk;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("SFTPShare");
    QCoreApplication::setApplicationName("SFTPShare");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Upload or download a single file over SFTP and keep a transfer history.");
    parser.addHelpOption();
    parser.addPositionalArgument("command", "upload | download | history | settings");
    parser.addPositionalArgument("target", "Local file (upload) or remote file name (download)",
                                 "[target]");
    parser.addOptions({
        {"host", "Remote host.", "host"},
        {"port", "SSH port (default 22).", "port"},
        {"user", "User name.", "user"},
        {{"o", "output"}, "Download destination; asked interactively when absent.", "path"},
        {"history-file", "History JSON file.", "file"},
        {"known-hosts-policy", "strict | accept-new | off.", "policy"},
        {"known-hosts", "known_hosts file.", "file"},
        {"timeout-ms", "Timeout for blocking SSH calls.", "ms"},
        {"trust-new-host", "Accept an unknown host key without asking."},
        {"clear", "history: remove every entry."},
        {"delete", "history: remove the entry \"DATE|FILE|STATUS\" (repeatable).", "key"},
        {{"y", "yes"}, "history: skip the confirmation for --delete and --clear."},
        {"save", "settings: store the given options as defaults."},
    });
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(kExitUsage);
    }
    const QString command = args.first();

    AppSettings settings = AppSettings::load();
    if (parser.isSet("history-file"))
        settings.historyFile = parser.value("history-file");
    if (parser.isSet("host"))
        settings.host = parser.value("host");
    if (parser.isSet("user"))
        settings.username = parser.value("user");
    if (parser.isSet("port")) {
        bool ok = false;
        const uint port = parser.value("port").toUInt(&ok);
        if (!ok || port < 1 || port > 65535) {
            std::cerr << "Invalid --port\n";
            return kExitUsage;
        }
        settings.port = static_cast<std::uint16_t>(port);
    }
    if (parser.isSet("timeout-ms"))
        settings.timeoutMs = qMax(0, parser.value("timeout-ms").toInt());
    if (parser.isSet("known-hosts-policy")) {
        const auto p = AppSettings::parsePolicy(parser.value("known-hosts-policy"));
        if (!p) {
            std::cerr << "Invalid --known-hosts-policy\n";
            return kExitUsage;
        }
        settings.knownHostsPolicy = *p;
    }
    if (parser.isSet("known-hosts"))
        settings.knownHostsPath = parser.value("known-hosts");

    if (command == QLatin1String("settings"))
        return runSettings(parser, settings);

    HistoryStore history(settings.historyFile);
    history.load();

    if (command == QLatin1String("history"))
        return runHistory(parser, history);

    const bool isUpload = command == QLatin1String("upload");
    if (!isUpload && command != QLatin1String("download")) {
        std::cerr << "Unknown command: " << command.toStdString() << "\n";
        return kExitUsage;
    }
    const QString target = args.size() > 1 ? args.at(1) : QString();

    TransferRequest request;
    if (isUpload) {
        request = TransferRequest::upload(target);
        const QFileInfo fi(target);
        if (!target.isEmpty() && fi.isFile())
            std::cout << "Selected: " << fi.fileName().toStdString() << " ("
                      << fi.size() << " bytes)\n";
    } else {
        request = TransferRequest::download(target, parser.value("output"));
        request.resolveSavePath = [](const QString &remoteName) -> std::optional<QString> {
            const std::string path = promptLine(
                "Save '" + remoteName.toStdString() + "' as (empty to cancel): ");
            if (path.empty())
                return std::nullopt;
            return QString::fromStdString(path);
        };
    }

    sftpshare::ConnectionParams params = settings.connectionParams();
    std::string secret = sftpshare::envValue("SFTPSHARE_PASSWORD").value_or(std::string());
    if (secret.empty() && !params.host.empty() && !params.username.empty())
        secret = promptSecret("Password for " + params.username + "@" + params.host + ": ");
    params.password = secret;
    secureClear(secret);
    const bool trustNew = parser.isSet("trust-new-host");
    params.hostkey_confirm_cb = [trustNew](const std::string &h, std::uint16_t p,
                                           const std::string &alg,
                                           const std::string &fp) {
        return confirmHostKey(trustNew, h, p, alg, fp);
    };

    ProgressReporter reporter;
    TransferOrchestrator orchestrator(history, [] {
        return std::unique_ptr<sftpshare::SftpClient>(
            std::make_unique<sftpshare::Libssh2SftpClient>());
    });
    orchestrator.setProgressReporter(&reporter);

    QObject::connect(&reporter, &ProgressReporter::progress,
                     [](const sftpshare::ProgressSample &s) {
                         std::cerr << "\r" << ProgressReporter::describe(s).toStdString()
                                   << std::flush;
                     });
    QObject::connect(&orchestrator, &TransferOrchestrator::stateChanged, &app,
                     [](TransferOrchestrator::State st) {
                         if (st == TransferOrchestrator::State::Connecting)
                             std::cerr << "Connecting...\n";
                     });
    int exitCode = kExitFailed;
    QObject::connect(&orchestrator, &TransferOrchestrator::finished, &app,
                     [&exitCode](const TransferOutcome &out) {
                         std::cerr << "\n";
                         if (out.ok()) {
                             std::cout << out.message.toStdString() << "\n";
                             exitCode = kExitOk;
                         } else {
                             std::cerr << out.message.toStdString() << "\n";
                             exitCode = kExitFailed;
                         }
                         if (!out.historyWarning.isEmpty())
                             std::cerr << "warning: " << out.historyWarning.toStdString() << "\n";
                         QCoreApplication::quit();
                     });

    g_active.store(&orchestrator);
    std::signal(SIGINT, onInterrupt);
    if (!orchestrator.start(params, request)) {
        qCWarning(sfCli) << "could not start transfer";
        return kExitFailed;
    }
    params.password.assign(params.password.size(), '\0');
    app.exec();
    orchestrator.wait();
    g_active.store(nullptr);
    return exitCode;
}
