// Single-transfer state machine: validate, connect, transfer, close, record.
#pragma once
#include <QMetaType>
#include <QObject>
#include <QString>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include "HistoryStore.hpp"
#include "sftpshare/SftpClient.hpp"

class ProgressReporter;

// What the caller wants moved. The request value carries everything; the
// orchestrator keeps no "currently selected file" state.
struct TransferRequest {
    enum class Type { Upload, Download } type = Type::Upload;
    QString localPath;     // Upload: file to send
    QString remoteName;    // Download: remote file (Upload: derived)
    QString localSavePath; // Download: destination
    // Download only: asked for a destination when localSavePath is empty.
    // Returning nullopt/empty means the user declined.
    std::function<std::optional<QString>(const QString &remoteName)>
        resolveSavePath;

    static TransferRequest upload(const QString &localPath);
    static TransferRequest download(const QString &remoteName,
                                    const QString &localSavePath = QString());

    // Remote name used on the wire and in the history log.
    QString effectiveRemoteName() const;
};

enum class MissingField {
    None,
    Host,
    Port,
    Username,
    Credential,
    LocalFile,
    RemoteName,
    SaveDestination
};

const char *missingFieldName(MissingField f);
const char *errorKindName(sftpshare::ErrorKind k);

// Exactly one per attempt.
struct TransferOutcome {
    enum class Status { Success, Failed } status = Status::Failed;
    TransferRequest::Type type = TransferRequest::Type::Upload;
    sftpshare::ErrorKind error = sftpshare::ErrorKind::None;
    MissingField missingField = MissingField::None;
    QString fileName;      // name recorded in history
    QString effectivePath; // Success: remote name (upload) or local path
    QString message;       // human readable, names action and cause
    bool recorded = false; // a history entry was appended
    QString historyWarning; // non-empty when the history flush failed

    bool ok() const { return status == Status::Success; }
};

Q_DECLARE_METATYPE(TransferOutcome)

class TransferOrchestrator : public QObject {
    Q_OBJECT
public:
    enum class State {
        Idle,
        Validating,
        Connecting,
        Transferring,
        Recording,
        Done,
        Failed
    };
    Q_ENUM(State)

    // `history` must outlive the orchestrator. The factory yields one fresh
    // session per attempt.
    TransferOrchestrator(HistoryStore &history,
                         sftpshare::SftpClientFactory factory,
                         QObject *parent = nullptr);
    ~TransferOrchestrator() override;

    // Optional observer sink; not owned.
    void setProgressReporter(ProgressReporter *r) { reporter_ = r; }

    // Runs one attempt on the calling thread (blocking).
    TransferOutcome run(const sftpshare::ConnectionParams &params,
                        const TransferRequest &request);

    // Runs one attempt on a background thread and emits finished().
    // Returns false while another attempt is in flight. Must not be called
    // from a slot running on the worker thread.
    bool start(const sftpshare::ConnectionParams &params,
               const TransferRequest &request);

    bool isBusy() const { return busy_.load(); }

    // Cooperative: checked between chunks.
    void cancel() { cancelRequested_.store(true); }

    // Joins a finished or running background attempt.
    void wait();

signals:
    void stateChanged(TransferOrchestrator::State state);
    void finished(TransferOutcome outcome);

private:
    HistoryStore &history_;
    sftpshare::SftpClientFactory factory_;
    ProgressReporter *reporter_ = nullptr; // not owned
    std::atomic<bool> busy_{false};
    std::atomic<bool> cancelRequested_{false};
    std::thread worker_;
    std::mutex workerMutex_;

    TransferOutcome attempt(const sftpshare::ConnectionParams &params,
                            const TransferRequest &request);
    // attempt() with exceptions turned into a recorded Io failure.
    TransferOutcome guardedAttempt(const sftpshare::ConnectionParams &params,
                                   const TransferRequest &request);
    TransferOutcome validationFailure(TransferOutcome out, MissingField f,
                                      const QString &message);
    TransferOutcome transferFailure(TransferOutcome out,
                                    sftpshare::ErrorKind kind,
                                    const QString &cause);
    void record(TransferOutcome &out, HistoryEntry::Outcome result);
    void setState(State s);
};
