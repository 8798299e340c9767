// History persistence: JSON array of {date,type,file,status} string records,
// UTF-8, written atomically after every mutation.
#include "HistoryStore.hpp"
#include "TimeUtils.hpp"
#include "sftpshare/RuntimeLogging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QStringList>
#include <algorithm>
#include <utility>

Q_LOGGING_CATEGORY(sfHistory, "sftpshare.history")

HistoryEntry HistoryEntry::now(Direction d, const QString &file, Outcome o) {
    HistoryEntry e;
    e.timestamp =
        sftpshareapp::truncatedToMinute(QDateTime::currentDateTime());
    e.direction = d;
    e.file = file;
    e.outcome = o;
    return e;
}

QString HistoryEntry::date() const {
    if (!dateText.isEmpty())
        return dateText;
    return sftpshareapp::historyDate(timestamp);
}

QString HistoryEntry::directionName(Direction d) {
    return d == Direction::Upload ? QStringLiteral("upload")
                                  : QStringLiteral("download");
}

QString HistoryEntry::outcomeName(Outcome o) {
    return o == Outcome::Success ? QStringLiteral("success")
                                 : QStringLiteral("failed");
}

bool HistoryEntry::parseDirection(const QString &s, Direction &out) {
    if (s == QLatin1String("upload")) {
        out = Direction::Upload;
        return true;
    }
    if (s == QLatin1String("download")) {
        out = Direction::Download;
        return true;
    }
    return false;
}

bool HistoryEntry::parseOutcome(const QString &s, Outcome &out) {
    if (s == QLatin1String("success")) {
        out = Outcome::Success;
        return true;
    }
    if (s == QLatin1String("failed")) {
        out = Outcome::Failed;
        return true;
    }
    return false;
}

bool operator==(const HistoryEntry &a, const HistoryEntry &b) {
    return a.date() == b.date() && a.direction == b.direction &&
           a.file == b.file && a.outcome == b.outcome;
}

bool HistoryKey::parse(const QString &text, HistoryKey &out) {
    const QStringList parts = text.split(QLatin1Char('|'));
    if (parts.size() != 3)
        return false;
    HistoryKey k;
    k.date = parts[0].trimmed();
    k.file = parts[1];
    if (k.date.isEmpty() || k.file.isEmpty() ||
        !HistoryEntry::parseOutcome(parts[2].trimmed(), k.outcome))
        return false;
    out = std::move(k);
    return true;
}

static QJsonObject toJson(const HistoryEntry &e) {
    QJsonObject o;
    o.insert(QStringLiteral("date"), e.date());
    o.insert(QStringLiteral("type"), HistoryEntry::directionName(e.direction));
    o.insert(QStringLiteral("file"), e.file);
    o.insert(QStringLiteral("status"), HistoryEntry::outcomeName(e.outcome));
    return o;
}

static bool fromJson(const QJsonValue &v, HistoryEntry &out) {
    if (!v.isObject())
        return false;
    const QJsonObject o = v.toObject();
    const QJsonValue date = o.value(QStringLiteral("date"));
    const QJsonValue type = o.value(QStringLiteral("type"));
    const QJsonValue file = o.value(QStringLiteral("file"));
    const QJsonValue status = o.value(QStringLiteral("status"));
    if (!date.isString() || !type.isString() || !file.isString() ||
        !status.isString())
        return false;
    HistoryEntry e;
    // The date string is the record's identity; it is kept as written even
    // when it does not parse as a local time (e.g. inside a DST gap).
    e.dateText = date.toString();
    if (e.dateText.isEmpty())
        return false;
    e.timestamp = sftpshareapp::parseHistoryDate(e.dateText);
    if (!HistoryEntry::parseDirection(type.toString(), e.direction) ||
        !HistoryEntry::parseOutcome(status.toString(), e.outcome))
        return false;
    e.file = file.toString();
    out = std::move(e);
    return true;
}

HistoryStore::HistoryStore(QString filePath) : path_(std::move(filePath)) {}

QVector<HistoryEntry> HistoryStore::load() {
    std::lock_guard<std::mutex> wl(writeMtx_);
    QVector<Record> loaded;
    const QString where =
        QString::fromStdString(sftpshare::redacted(path_.toStdString()));

    QFile f(path_);
    if (f.exists()) {
        if (!f.open(QIODevice::ReadOnly)) {
            qCWarning(sfHistory) << "history unreadable, starting empty"
                                 << "file=" << where
                                 << "error=" << f.errorString();
        } else {
            QJsonParseError perr{};
            const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
            if (perr.error != QJsonParseError::NoError || !doc.isArray()) {
                qCWarning(sfHistory)
                    << "history corrupt, starting empty"
                    << "file=" << where << "error="
                    << (perr.error != QJsonParseError::NoError
                            ? perr.errorString()
                            : QStringLiteral("root is not an array"));
            } else {
                const QJsonArray arr = doc.array();
                int kept = 0;
                loaded.reserve(arr.size());
                for (const QJsonValue &v : arr) {
                    Record r;
                    r.raw = v;
                    if (!fromJson(v, r.entry)) {
                        r.parsed = false;
                        ++kept;
                    }
                    loaded.push_back(std::move(r));
                }
                if (kept > 0)
                    qCWarning(sfHistory)
                        << "unrecognised history records kept as-is"
                        << "count=" << kept;
                qCInfo(sfHistory) << "history loaded"
                                  << "records=" << loaded.size();
            }
        }
    }

    std::lock_guard<std::mutex> lk(mtx_);
    records_ = std::move(loaded);
    QVector<HistoryEntry> out;
    for (const auto &r : records_)
        if (r.parsed)
            out.push_back(r.entry);
    return out;
}

QVector<HistoryEntry> HistoryStore::entries() const {
    std::lock_guard<std::mutex> lk(mtx_);
    QVector<HistoryEntry> out;
    out.reserve(records_.size());
    for (const auto &r : records_)
        if (r.parsed)
            out.push_back(r.entry);
    return out;
}

QVector<HistoryEntry> HistoryStore::newestFirst() const {
    QVector<HistoryEntry> out = entries();
    std::reverse(out.begin(), out.end());
    return out;
}

int HistoryStore::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(std::count_if(
        records_.begin(), records_.end(),
        [](const Record &r) { return r.parsed; }));
}

HistoryStore::PersistResult HistoryStore::append(const HistoryEntry &entry) {
    std::lock_guard<std::mutex> wl(writeMtx_);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        Record r;
        r.entry = entry;
        records_.push_back(std::move(r));
    }
    return flushLocked();
}

HistoryStore::PersistResult
HistoryStore::removeMatching(const HistoryKey &key) {
    return removeMatching(QVector<HistoryKey>{key});
}

HistoryStore::PersistResult
HistoryStore::removeMatching(const QVector<HistoryKey> &keys) {
    if (keys.isEmpty())
        return {PersistStatus::NoMatch,
                QStringLiteral("No history entry selected")};
    std::lock_guard<std::mutex> wl(writeMtx_);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        QVector<Record> next = records_;
        for (const HistoryKey &key : keys) {
            auto it = std::find_if(next.begin(), next.end(),
                                   [&key](const Record &r) {
                                       return r.parsed && key.matches(r.entry);
                                   });
            if (it == next.end())
                return {PersistStatus::NoMatch,
                        QStringLiteral("No history entry matches %1 | %2 | %3")
                            .arg(key.date, key.file,
                                 HistoryEntry::outcomeName(key.outcome))};
            next.erase(it);
        }
        records_ = std::move(next);
    }
    return flushLocked();
}

HistoryStore::PersistResult
HistoryStore::removeIf(const std::function<bool(const HistoryEntry &)> &pred) {
    std::lock_guard<std::mutex> wl(writeMtx_);
    QVector<Record> snapshot;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        snapshot = records_;
    }
    // Predicate runs without mtx_ held so it can read the store.
    QVector<Record> next;
    next.reserve(snapshot.size());
    for (auto &r : snapshot)
        if (!r.parsed || !pred(r.entry))
            next.push_back(std::move(r));
    if (next.size() == snapshot.size())
        return {PersistStatus::NoMatch,
                QStringLiteral("No history entry matches")};
    {
        std::lock_guard<std::mutex> lk(mtx_);
        records_ = std::move(next);
    }
    return flushLocked();
}

HistoryStore::PersistResult HistoryStore::clear() {
    std::lock_guard<std::mutex> wl(writeMtx_);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        records_.clear();
    }
    return flushLocked();
}

HistoryStore::PersistResult HistoryStore::flushLocked() const {
    const QFileInfo fi(path_);
    if (!QDir().mkpath(fi.absolutePath())) {
        qCWarning(sfHistory) << "history directory not writable";
        return {PersistStatus::WriteFailed,
                QStringLiteral("Cannot create directory %1")
                    .arg(fi.absolutePath())};
    }

    // Only writers touch records_, and the caller holds writeMtx_.
    QJsonArray arr;
    for (const auto &r : records_)
        arr.append(r.parsed && r.raw.isNull() ? QJsonValue(toJson(r.entry))
                                                : r.raw);

    QSaveFile out(path_);
    if (!out.open(QIODevice::WriteOnly)) {
        qCWarning(sfHistory) << "history write failed" << out.errorString();
        return {PersistStatus::WriteFailed, out.errorString()};
    }
    const QByteArray bytes = QJsonDocument(arr).toJson(QJsonDocument::Indented);
    if (out.write(bytes) != bytes.size() || !out.commit()) {
        qCWarning(sfHistory) << "history write failed" << out.errorString();
        return {PersistStatus::WriteFailed, out.errorString()};
    }
    return {};
}
