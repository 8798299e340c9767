// Transfer attempt: one fresh session per request, closed on every exit path
// before the outcome is recorded.
#include "TransferOrchestrator.hpp"
#include "ProgressReporter.hpp"
#include "sftpshare/RuntimeLogging.hpp"

#include <QFileInfo>
#include <QLoggingCategory>
#include <exception>
#include <memory>
#include <utility>

Q_LOGGING_CATEGORY(sfXfer, "sftpshare.transfer")

using sftpshare::ErrorKind;

TransferRequest TransferRequest::upload(const QString &localPath) {
    TransferRequest r;
    r.type = Type::Upload;
    r.localPath = localPath;
    return r;
}

TransferRequest TransferRequest::download(const QString &remoteName,
                                          const QString &localSavePath) {
    TransferRequest r;
    r.type = Type::Download;
    r.remoteName = remoteName;
    r.localSavePath = localSavePath;
    return r;
}

QString TransferRequest::effectiveRemoteName() const {
    if (type == Type::Download)
        return remoteName;
    if (!remoteName.isEmpty())
        return remoteName;
    return QFileInfo(localPath).fileName();
}

const char *missingFieldName(MissingField f) {
    switch (f) {
    case MissingField::None:
        return "none";
    case MissingField::Host:
        return "host";
    case MissingField::Port:
        return "port";
    case MissingField::Username:
        return "username";
    case MissingField::Credential:
        return "credential";
    case MissingField::LocalFile:
        return "local file";
    case MissingField::RemoteName:
        return "remote file name";
    case MissingField::SaveDestination:
        return "save destination";
    }
    return "unknown";
}

const char *errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Validation:
        return "Validation";
    case ErrorKind::Connection:
        return "Connection";
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::Io:
        return "Io";
    case ErrorKind::Canceled:
        return "Canceled";
    case ErrorKind::Storage:
        return "Storage";
    case ErrorKind::Busy:
        return "Busy";
    }
    return "Unknown";
}

static MissingField missingFromParams(const sftpshare::ConnectionParams &p) {
    const auto missing = sftpshare::firstMissingField(p);
    if (!missing)
        return MissingField::None;
    if (*missing == "host")
        return MissingField::Host;
    if (*missing == "port")
        return MissingField::Port;
    if (*missing == "username")
        return MissingField::Username;
    return MissingField::Credential;
}

static QString actionName(TransferRequest::Type t) {
    return t == TransferRequest::Type::Upload ? QStringLiteral("Upload")
                                              : QStringLiteral("Download");
}

namespace {
// Clears the busy flag on every exit path of an attempt.
struct BusyReset {
    std::atomic<bool> &flag;
    ~BusyReset() { flag.store(false); }
};
} // namespace

TransferOrchestrator::TransferOrchestrator(HistoryStore &history,
                                           sftpshare::SftpClientFactory factory,
                                           QObject *parent)
    : QObject(parent), history_(history), factory_(std::move(factory)) {
    qRegisterMetaType<TransferOutcome>("TransferOutcome");
    qRegisterMetaType<TransferOrchestrator::State>(
        "TransferOrchestrator::State");
}

TransferOrchestrator::~TransferOrchestrator() {
    cancel();
    wait();
}

TransferOutcome
TransferOrchestrator::run(const sftpshare::ConnectionParams &params,
                          const TransferRequest &request) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        TransferOutcome out;
        out.type = request.type;
        out.fileName = request.effectiveRemoteName();
        out.error = ErrorKind::Busy;
        out.message = QStringLiteral("%1 refused: another transfer is in progress")
                          .arg(actionName(request.type));
        return out;
    }
    BusyReset reset{busy_};
    cancelRequested_.store(false);
    return guardedAttempt(params, request);
}

bool TransferOrchestrator::start(const sftpshare::ConnectionParams &params,
                                 const TransferRequest &request) {
    std::lock_guard<std::mutex> wl(workerMutex_);
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        qCInfo(sfXfer) << "start refused; attempt already in flight";
        return false;
    }
    // The previous worker already cleared busy_; joining only reaps it.
    if (worker_.joinable())
        worker_.join();
    cancelRequested_.store(false);
    worker_ = std::thread([this, params, request] {
        TransferOutcome out;
        {
            BusyReset reset{busy_};
            out = guardedAttempt(params, request);
        }
        emit finished(out);
    });
    return true;
}

void TransferOrchestrator::wait() {
    std::lock_guard<std::mutex> wl(workerMutex_);
    if (worker_.joinable())
        worker_.join();
}

void TransferOrchestrator::setState(State s) {
    emit stateChanged(s);
}

TransferOutcome
TransferOrchestrator::guardedAttempt(const sftpshare::ConnectionParams &params,
                                     const TransferRequest &request) {
    try {
        return attempt(params, request);
    } catch (const std::exception &e) {
        TransferOutcome out;
        out.type = request.type;
        out.fileName = request.effectiveRemoteName();
        return transferFailure(std::move(out), ErrorKind::Io,
                               QString::fromLocal8Bit(e.what()));
    }
}

TransferOutcome
TransferOrchestrator::attempt(const sftpshare::ConnectionParams &params,
                              const TransferRequest &request) {
    const bool isUpload = request.type == TransferRequest::Type::Upload;
    TransferOutcome out;
    out.type = request.type;
    out.fileName = request.effectiveRemoteName();

    setState(State::Validating);

    // Request fields first: these never reach the history log.
    if (isUpload && request.localPath.isEmpty())
        return validationFailure(std::move(out), MissingField::LocalFile,
                                 QStringLiteral("Please choose a file to upload"));
    if (!isUpload && request.remoteName.isEmpty())
        return validationFailure(
            std::move(out), MissingField::RemoteName,
            QStringLiteral("Please enter the remote file name to download"));

    const MissingField paramField = missingFromParams(params);
    if (paramField != MissingField::None)
        return validationFailure(
            std::move(out), paramField,
            QStringLiteral("Please fill in all connection fields (missing: %1)")
                .arg(QLatin1String(missingFieldName(paramField))));

    QString savePath = request.localSavePath;
    if (!isUpload && savePath.isEmpty() && request.resolveSavePath) {
        const auto chosen = request.resolveSavePath(request.remoteName);
        if (chosen)
            savePath = *chosen;
    }
    if (!isUpload && savePath.isEmpty()) {
        // Declining the destination is recorded as a failed download.
        out = validationFailure(std::move(out), MissingField::SaveDestination,
                                QStringLiteral("Download stopped: no save destination chosen"));
        record(out, HistoryEntry::Outcome::Failed);
        return out;
    }

    if (isUpload) {
        const QFileInfo fi(request.localPath);
        if (!fi.exists() || !fi.isFile() || !fi.isReadable())
            return transferFailure(
                std::move(out), ErrorKind::Io,
                QStringLiteral("local file is missing or unreadable: %1")
                    .arg(fi.fileName()));
    }

    setState(State::Connecting);
    qCInfo(sfXfer) << "connecting"
                   << "host=" << QString::fromStdString(sftpshare::redacted(params.host))
                   << "port=" << params.port
                   << "user=" << QString::fromStdString(sftpshare::redacted(params.username));

    std::unique_ptr<sftpshare::SftpClient> session = factory_ ? factory_() : nullptr;
    if (!session)
        return transferFailure(std::move(out), ErrorKind::Connection,
                               QStringLiteral("no SFTP backend available"));

    std::string err;
    if (!session->connect(params, err)) {
        session->disconnect();
        return transferFailure(std::move(out), ErrorKind::Connection,
                               QString::fromStdString(err));
    }

    setState(State::Transferring);
    if (reporter_)
        reporter_->reset();
    std::uint64_t lastDone = 0;
    auto onProgress = [this, &lastDone](std::size_t done, std::size_t total) {
        lastDone = done;
        if (reporter_)
            reporter_->publish(done, total);
    };
    auto shouldCancel = [this] { return cancelRequested_.load(); };

    const std::string remote = out.fileName.toStdString();
    bool ok = false;
    if (isUpload) {
        qCInfo(sfXfer) << "upload begin" << "file=" << out.fileName;
        ok = session->put(request.localPath.toStdString(), remote, err,
                          onProgress, shouldCancel);
        out.effectivePath = out.fileName;
    } else {
        qCInfo(sfXfer) << "download begin" << "file=" << out.fileName << "dest="
                       << QString::fromStdString(sftpshare::redacted(savePath.toStdString()));
        ok = session->get(remote, savePath.toStdString(), err, onProgress,
                          shouldCancel);
        out.effectivePath = savePath;
    }
    const ErrorKind kind = session->lastErrorKind();

    // Close before anything is recorded.
    session->disconnect();
    session.reset();

    if (!ok) {
        out.effectivePath.clear();
        return transferFailure(std::move(out),
                               kind == ErrorKind::None ? ErrorKind::Io : kind,
                               QString::fromStdString(err));
    }

    setState(State::Recording);
    if (reporter_)
        reporter_->finish(lastDone);
    out.status = TransferOutcome::Status::Success;
    out.error = ErrorKind::None;
    out.message = isUpload ? QStringLiteral("File '%1' uploaded to %2")
                                 .arg(out.fileName, out.effectivePath)
                           : QStringLiteral("File '%1' saved to %2")
                                 .arg(out.fileName, out.effectivePath);
    record(out, HistoryEntry::Outcome::Success);
    qCInfo(sfXfer) << actionName(out.type) << "done" << "file=" << out.fileName
                   << "bytes=" << lastDone;
    setState(State::Done);
    return out;
}

TransferOutcome TransferOrchestrator::validationFailure(TransferOutcome out,
                                                       MissingField f,
                                                       const QString &message) {
    out.status = TransferOutcome::Status::Failed;
    out.error = ErrorKind::Validation;
    out.missingField = f;
    out.message = message;
    qCInfo(sfXfer) << actionName(out.type) << "not started;"
                   << "missing=" << missingFieldName(f);
    setState(State::Failed);
    return out;
}

TransferOutcome TransferOrchestrator::transferFailure(TransferOutcome out,
                                                     ErrorKind kind,
                                                     const QString &cause) {
    out.status = TransferOutcome::Status::Failed;
    out.error = kind;
    const QString detail = cause.isEmpty() ? QString::fromLatin1(errorKindName(kind)) : cause;
    out.message = QStringLiteral("%1 failed: %2").arg(actionName(out.type), detail);
    qCWarning(sfXfer) << actionName(out.type) << "failed"
                      << "kind=" << errorKindName(kind) << "file=" << out.fileName
                      << "cause=" << detail;
    setState(State::Recording);
    record(out, HistoryEntry::Outcome::Failed);
    setState(State::Failed);
    return out;
}

void TransferOrchestrator::record(TransferOutcome &out,
                                  HistoryEntry::Outcome result) {
    const HistoryEntry::Direction dir =
        out.type == TransferRequest::Type::Upload
            ? HistoryEntry::Direction::Upload
            : HistoryEntry::Direction::Download;
    const auto res = history_.append(HistoryEntry::now(dir, out.fileName, result));
    out.recorded = true;
    if (!res.ok()) {
        out.historyWarning =
            QStringLiteral("Transfer history could not be saved: %1").arg(res.detail);
        qCWarning(sfXfer) << "history append not persisted" << res.detail;
    }
}
