// Durable log of past transfer attempts (JSON file, insertion order).
#pragma once
#include <QDateTime>
#include <QJsonValue>
#include <QString>
#include <QVector>
#include <functional>
#include <mutex>

// One finished attempt. Immutable once recorded.
struct HistoryEntry {
    enum class Direction { Upload, Download };
    enum class Outcome { Success, Failed };

    QDateTime timestamp; // local time, truncated to the minute
    QString dateText;    // persisted "date" string, kept verbatim when loaded
    Direction direction = Direction::Upload;
    QString file;
    Outcome outcome = Outcome::Failed;

    // Entry stamped with the current local minute.
    static HistoryEntry now(Direction d, const QString &file, Outcome o);

    // dateText when loaded from disk, otherwise derived from timestamp.
    QString date() const; // "YYYY-MM-DD HH:MM"

    static QString directionName(Direction d); // "upload" | "download"
    static QString outcomeName(Outcome o);     // "success" | "failed"
    static bool parseDirection(const QString &s, Direction &out);
    static bool parseOutcome(const QString &s, Outcome &out);
};

bool operator==(const HistoryEntry &a, const HistoryEntry &b);

// Identifies an entry the way a user picks it from the list.
struct HistoryKey {
    QString date;
    QString file;
    HistoryEntry::Outcome outcome = HistoryEntry::Outcome::Failed;

    static HistoryKey of(const HistoryEntry &e) {
        return {e.date(), e.file, e.outcome};
    }
    bool matches(const HistoryEntry &e) const {
        return e.date() == date && e.file == file && e.outcome == outcome;
    }

    // "DATE|FILE|STATUS" as shown by the CLI. False on a malformed key.
    static bool parse(const QString &text, HistoryKey &out);
};

class HistoryStore {
public:
    enum class PersistStatus { Stored, NoMatch, WriteFailed };
    struct PersistResult {
        PersistStatus status = PersistStatus::Stored;
        QString detail;
        bool ok() const { return status == PersistStatus::Stored; }
    };

    explicit HistoryStore(QString filePath);

    const QString &filePath() const { return path_; }

    // Replaces the in-memory log with the persisted one. Missing, unreadable
    // or corrupt files yield an empty log (logged, never reported).
    QVector<HistoryEntry> load();

    QVector<HistoryEntry> entries() const;     // insertion order
    QVector<HistoryEntry> newestFirst() const; // display order
    int size() const;

    // Each mutation flushes synchronously. On WriteFailed the in-memory log
    // keeps the mutation and `detail` carries the cause.
    PersistResult append(const HistoryEntry &entry);
    PersistResult removeMatching(const HistoryKey &key); // first match only
    // All keys or nothing: NoMatch (and no change) if any key is unmatched.
    // Each key removes one entry; duplicate keys remove duplicates.
    PersistResult removeMatching(const QVector<HistoryKey> &keys);
    // `pred` runs on a snapshot and may read the store. It must not mutate it.
    PersistResult removeIf(const std::function<bool(const HistoryEntry &)> &pred);
    // Also drops records that could not be parsed.
    PersistResult clear();

private:
    // Loaded records keep their JSON (`raw`) and are written back unchanged,
    // including the ones that could not be parsed (parsed == false).
    // Appended entries have a null `raw` and are serialised from `entry`.
    struct Record {
        HistoryEntry entry;
        QJsonValue raw;
        bool parsed = true;
    };

    QString path_;
    QVector<Record> records_;
    std::mutex writeMtx_;    // one mutation (and its flush) at a time
    mutable std::mutex mtx_; // guards records_ for readers

    PersistResult flushLocked() const; // requires writeMtx_
};
