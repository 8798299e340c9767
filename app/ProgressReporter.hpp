// Hands progress samples from a transfer worker to the thread that owns the
// reporter (usually the UI/CLI thread) through the Qt event loop.
#pragma once
#include <QMetaType>
#include <QObject>
#include <QString>
#include <mutex>
#include <optional>
#include "sftpshare/SftpTypes.hpp"

Q_DECLARE_METATYPE(sftpshare::ProgressSample)

class ProgressReporter : public QObject {
    Q_OBJECT
public:
    explicit ProgressReporter(QObject *parent = nullptr);

    // Starts a new transfer: forgets the previous stream and any sample
    // still waiting for delivery.
    void reset();

    // Safe from any thread. Only the latest undelivered sample is kept;
    // delivery happens on the reporter's thread via `progress`.
    void publish(std::uint64_t transferred, std::uint64_t total);

    // Terminal sample {bytes, bytes}. Always delivered.
    void finish(std::uint64_t bytes);

    // Last sample accepted by publish()/finish().
    std::optional<sftpshare::ProgressSample> latest() const;

    // "45.0% (450/1000 bytes)"
    static QString describe(const sftpshare::ProgressSample &s);

signals:
    void progress(sftpshare::ProgressSample sample);

private:
    mutable std::mutex mtx_;
    std::optional<sftpshare::ProgressSample> last_;
    std::optional<sftpshare::ProgressSample> pending_;
    bool dispatchQueued_ = false;

    void enqueueLocked(const sftpshare::ProgressSample &s);
    void deliver();
};
