#include "ProgressReporter.hpp"
#include <QMetaObject>
#include <algorithm>

ProgressReporter::ProgressReporter(QObject *parent) : QObject(parent) {
    qRegisterMetaType<sftpshare::ProgressSample>("sftpshare::ProgressSample");
}

void ProgressReporter::reset() {
    std::lock_guard<std::mutex> lk(mtx_);
    last_.reset();
    pending_.reset();
}

void ProgressReporter::publish(std::uint64_t transferred, std::uint64_t total) {
    std::lock_guard<std::mutex> lk(mtx_);
    sftpshare::ProgressSample s;
    // Never regress, never report more than the total.
    s.transferred = last_ ? std::max(transferred, last_->transferred)
                          : transferred;
    s.total = std::max(total, s.transferred);
    if (last_ && *last_ == s)
        return;
    enqueueLocked(s);
}

void ProgressReporter::finish(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    sftpshare::ProgressSample s;
    s.transferred = last_ ? std::max(bytes, last_->transferred) : bytes;
    s.total = s.transferred;
    if (last_ && *last_ == s)
        return;
    enqueueLocked(s);
}

std::optional<sftpshare::ProgressSample> ProgressReporter::latest() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return last_;
}

QString ProgressReporter::describe(const sftpshare::ProgressSample &s) {
    return QStringLiteral("%1% (%2/%3 bytes)")
        .arg(s.fraction() * 100.0, 0, 'f', 1)
        .arg(s.transferred)
        .arg(s.total);
}

void ProgressReporter::enqueueLocked(const sftpshare::ProgressSample &s) {
    last_ = s;
    pending_ = s;
    if (dispatchQueued_)
        return; // the queued delivery will pick up the newer sample
    dispatchQueued_ = true;
    QMetaObject::invokeMethod(
        this, [this] { deliver(); }, Qt::QueuedConnection);
}

void ProgressReporter::deliver() {
    std::optional<sftpshare::ProgressSample> s;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        dispatchQueued_ = false;
        s.swap(pending_);
    }
    if (s)
        emit progress(*s);
}
