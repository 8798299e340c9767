// History log persistence tests (run via CTest).
#include "HistoryStore.hpp"

#include <QByteArray>
#include <QDate>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QTime>

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

HistoryEntry entryAt(int day, int hour, int minute,
                     HistoryEntry::Direction d, const QString &file,
                     HistoryEntry::Outcome o) {
    HistoryEntry e;
    e.timestamp = QDateTime(QDate(2024, 5, day), QTime(hour, minute));
    e.direction = d;
    e.file = file;
    e.outcome = o;
    return e;
}

QByteArray readAll(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {};
    return f.readAll();
}

void writeAll(const QString &path, const QByteArray &bytes) {
    QFile f(path);
    if (f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        f.write(bytes);
}

void test_missing_file_is_empty(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("history.json");
    HistoryStore store(path);
    t.check(store.load().isEmpty(), "missing history file should load empty");
    t.check(!QFile::exists(path), "loading should not create the file");
}

void test_append_persists_record_format(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("nested/history.json");
    HistoryStore store(path);
    store.load();
    const auto e = entryAt(1, 10, 30, HistoryEntry::Direction::Upload,
                           QStringLiteral("año.txt"),
                           HistoryEntry::Outcome::Success);
    t.check(store.append(e).ok(), "append should persist");
    t.check(QFile::exists(path), "append should create missing directories");

    const QByteArray raw = readAll(path);
    t.check(raw.contains(QStringLiteral("año.txt").toUtf8()),
            "non-ASCII names should be stored as literal UTF-8");
    const QJsonDocument doc = QJsonDocument::fromJson(raw);
    t.check(doc.isArray() && doc.array().size() == 1,
            "history file should be a one-element array");
    const QJsonObject o = doc.array().at(0).toObject();
    t.check(o.value("date").toString() == "2024-05-01 10:30",
            "date should be minute precision local time");
    t.check(o.value("type").toString() == "upload", "type should be upload");
    t.check(o.value("file").toString() == QStringLiteral("año.txt"),
            "file should round through JSON");
    t.check(o.value("status").toString() == "success",
            "status should be success");
    t.check(o.keys().size() == 4, "record should carry exactly four fields");
}

void test_reload_keeps_order(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("history.json");
    {
        HistoryStore store(path);
        store.load();
        store.append(entryAt(1, 9, 0, HistoryEntry::Direction::Upload, "a.txt",
                             HistoryEntry::Outcome::Success));
        store.append(entryAt(2, 9, 0, HistoryEntry::Direction::Download,
                             "b.txt", HistoryEntry::Outcome::Failed));
        store.append(entryAt(3, 9, 0, HistoryEntry::Direction::Upload, "c.txt",
                             HistoryEntry::Outcome::Success));
    }
    HistoryStore reloaded(path);
    const auto entries = reloaded.load();
    t.check(entries.size() == 3, "reload should see three entries");
    if (entries.size() == 3) {
        t.check(entries[0].file == "a.txt" && entries[2].file == "c.txt",
                "entries should keep insertion order");
        t.check(entries[1].direction == HistoryEntry::Direction::Download &&
                    entries[1].outcome == HistoryEntry::Outcome::Failed,
                "direction and outcome should survive reload");
    }
    const auto newest = reloaded.newestFirst();
    t.check(!newest.isEmpty() && newest.first().file == "c.txt",
            "display order should be newest first");
}

void test_remove_matching_first_only(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("history.json");
    HistoryStore store(path);
    store.load();
    const auto dup = entryAt(4, 12, 0, HistoryEntry::Direction::Upload,
                             "same.txt", HistoryEntry::Outcome::Failed);
    store.append(dup);
    store.append(entryAt(4, 12, 5, HistoryEntry::Direction::Upload, "other.txt",
                         HistoryEntry::Outcome::Success));
    store.append(dup);

    const auto res = store.removeMatching(HistoryKey::of(dup));
    t.check(res.ok(), "removing an existing key should persist");
    t.check(store.size() == 2, "only one duplicate should be removed");
    const auto left = store.entries();
    t.check(left.size() == 2 && left[0].file == "other.txt" &&
                left[1].file == "same.txt",
            "the first matching entry should be the one removed");

    HistoryStore reloaded(path);
    t.check(reloaded.load().size() == 2, "removal should be persisted");
}

void test_remove_without_match(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("history.json");
    HistoryStore store(path);
    store.load();
    store.append(entryAt(5, 8, 0, HistoryEntry::Direction::Download, "x.bin",
                         HistoryEntry::Outcome::Success));
    const QByteArray before = readAll(path);

    HistoryKey key{QStringLiteral("2024-05-05 08:00"), QStringLiteral("x.bin"),
                   HistoryEntry::Outcome::Failed};
    const auto res = store.removeMatching(key);
    t.check(res.status == HistoryStore::PersistStatus::NoMatch,
            "status mismatch should report NoMatch");
    t.check(!res.detail.isEmpty(), "NoMatch should carry a message");
    t.check(store.size() == 1, "log should be unchanged");
    t.check(readAll(path) == before, "file should not be rewritten");
}

void test_remove_if_and_clear(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("history.json");
    HistoryStore store(path);
    store.load();
    store.append(entryAt(6, 1, 0, HistoryEntry::Direction::Upload, "ok.txt",
                         HistoryEntry::Outcome::Success));
    store.append(entryAt(6, 2, 0, HistoryEntry::Direction::Upload, "bad.txt",
                         HistoryEntry::Outcome::Failed));
    t.check(store
                .removeIf([](const HistoryEntry &e) {
                    return e.outcome == HistoryEntry::Outcome::Failed;
                })
                .ok(),
            "removeIf should persist");
    t.check(store.size() == 1 && store.entries().first().file == "ok.txt",
            "removeIf should keep only successful entries");

    t.check(store.clear().ok(), "clear should persist");
    HistoryStore reloaded(path);
    t.check(reloaded.load().isEmpty(), "cleared log should reload empty");
    t.check(QFile::exists(path), "cleared log should still be a file");
}

void test_corrupt_file_loads_empty(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("history.json");
    writeAll(path, "{ not json ");
    HistoryStore store(path);
    t.check(store.load().isEmpty(), "corrupt file should load as empty log");

    writeAll(path, "{\"date\": \"2024-05-01 10:30\"}");
    t.check(store.load().isEmpty(), "non-array root should load as empty log");

    t.check(store.append(entryAt(7, 7, 7, HistoryEntry::Direction::Upload,
                                 "fresh.txt", HistoryEntry::Outcome::Success))
                .ok(),
            "append after corrupt load should succeed");
    HistoryStore reloaded(path);
    t.check(reloaded.load().size() == 1, "append should replace corrupt file");
}

void test_unrecognised_records_survive_writes(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("history.json");
    writeAll(path,
             "[{\"date\":\"2024-05-01 10:30\",\"type\":\"upload\","
             "\"file\":\"good.txt\",\"status\":\"success\"},"
             "{\"date\":\"2024-05-01 10:31\",\"type\":\"sideways\","
             "\"file\":\"bad.txt\",\"status\":\"success\"},"
             "{\"date\":\"yesterday\",\"type\":\"download\","
             "\"file\":\"odd-date.txt\",\"status\":\"failed\"},"
             "42]");
    HistoryStore store(path);
    const auto entries = store.load();
    t.check(entries.size() == 2,
            "records with a valid type and status should load");
    t.check(entries.size() == 2 && entries[1].date() == "yesterday",
            "an unparseable date should be kept verbatim");

    t.check(store.append(entryAt(9, 9, 9, HistoryEntry::Direction::Upload,
                                 "new.txt", HistoryEntry::Outcome::Success))
                .ok(),
            "append should persist");

    const QJsonDocument doc = QJsonDocument::fromJson(readAll(path));
    const QJsonArray arr = doc.array();
    t.check(arr.size() == 5, "every loaded record should still be on disk");
    if (arr.size() == 5) {
        t.check(arr.at(1).toObject().value("type").toString() == "sideways",
                "an unknown type should be written back unchanged");
        t.check(arr.at(2).toObject().value("date").toString() == "yesterday",
                "the odd date should be written back unchanged");
        t.check(arr.at(3).toInt() == 42,
                "a non-object element should be written back unchanged");
        t.check(arr.at(4).toObject().value("file").toString() == "new.txt",
                "the new entry should be appended last");
    }

    HistoryKey key;
    t.check(HistoryKey::parse("yesterday|odd-date.txt|failed", key),
            "key with an opaque date should parse");
    t.check(store.removeMatching(key).ok(),
            "an entry should be removable by its stored date string");
    HistoryStore reloaded(path);
    reloaded.load();
    t.check(reloaded.size() == 2, "two parsed entries should remain");
    t.check(QJsonDocument::fromJson(readAll(path)).array().size() == 4,
            "unrecognised records should survive the removal");
}

void test_extra_fields_preserved(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("history.json");
    writeAll(path,
             "[{\"date\":\"2024-05-01 10:30\",\"type\":\"upload\","
             "\"file\":\"a.txt\",\"status\":\"success\",\"note\":\"kept\"}]");
    HistoryStore store(path);
    store.load();
    store.append(entryAt(2, 2, 2, HistoryEntry::Direction::Upload, "b.txt",
                         HistoryEntry::Outcome::Failed));
    const QJsonArray arr = QJsonDocument::fromJson(readAll(path)).array();
    t.check(!arr.isEmpty() &&
                arr.at(0).toObject().value("note").toString() == "kept",
            "fields of loaded records should be written back");
}

void test_remove_several_keys(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("history.json");
    HistoryStore store(path);
    store.load();
    const auto a = entryAt(10, 1, 0, HistoryEntry::Direction::Upload, "a.txt",
                           HistoryEntry::Outcome::Success);
    const auto b = entryAt(10, 2, 0, HistoryEntry::Direction::Download, "b.txt",
                           HistoryEntry::Outcome::Failed);
    const auto c = entryAt(10, 3, 0, HistoryEntry::Direction::Upload, "c.txt",
                           HistoryEntry::Outcome::Success);
    store.append(a);
    store.append(b);
    store.append(c);

    const QVector<HistoryKey> missing = {
        HistoryKey::of(a),
        HistoryKey{QStringLiteral("2024-05-10 09:00"), QStringLiteral("zzz"),
                   HistoryEntry::Outcome::Failed}};
    t.check(store.removeMatching(missing).status ==
                HistoryStore::PersistStatus::NoMatch,
            "an unmatched key should reject the whole selection");
    t.check(store.size() == 3, "a rejected selection should remove nothing");

    t.check(store.removeMatching(QVector<HistoryKey>{HistoryKey::of(a),
                                                     HistoryKey::of(c)})
                .ok(),
            "a matched selection should be removed in one pass");
    const auto left = store.entries();
    t.check(left.size() == 1 && left.first().file == "b.txt",
            "only the unselected entry should remain");

    t.check(store.removeMatching(QVector<HistoryKey>{}).status ==
                HistoryStore::PersistStatus::NoMatch,
            "an empty selection should report NoMatch");
}

void test_key_parsing(TestContext &t) {
    HistoryKey k;
    t.check(HistoryKey::parse(" 2024-05-01 10:30 |a b.txt| failed ", k),
            "date and status should be trimmed");
    t.check(k.date == "2024-05-01 10:30" && k.file == "a b.txt" &&
                k.outcome == HistoryEntry::Outcome::Failed,
            "parsed key fields should match");
    t.check(!HistoryKey::parse("2024-05-01 10:30|a.txt", k),
            "a key needs three fields");
    t.check(!HistoryKey::parse("2024-05-01 10:30|a.txt|done", k),
            "an unknown status should be rejected");
    t.check(!HistoryKey::parse("|a.txt|success", k),
            "an empty date should be rejected");
}

void test_remove_if_predicate_reads_store(TestContext &t) {
    QTemporaryDir dir;
    HistoryStore store(dir.filePath("history.json"));
    store.load();
    store.append(entryAt(11, 1, 0, HistoryEntry::Direction::Upload, "a.txt",
                         HistoryEntry::Outcome::Success));
    store.append(entryAt(11, 2, 0, HistoryEntry::Direction::Upload, "b.txt",
                         HistoryEntry::Outcome::Success));
    int seenSize = -1;
    const auto res = store.removeIf([&](const HistoryEntry &e) {
        seenSize = store.size();
        return e.file == "a.txt";
    });
    t.check(res.ok(), "removeIf should persist");
    t.check(seenSize == 2, "the predicate should see the store unchanged");
    t.check(store.size() == 1, "one entry should be removed");
}

void test_write_failure_is_reported(TestContext &t) {
    QTemporaryDir dir;
    // A regular file where the parent directory should be.
    const QString blocker = dir.filePath("blocker");
    writeAll(blocker, "x");
    HistoryStore store(blocker + "/history.json");
    store.load();
    const auto res = store.append(entryAt(8, 8, 8, HistoryEntry::Direction::Upload,
                                          "a.txt", HistoryEntry::Outcome::Success));
    t.check(res.status == HistoryStore::PersistStatus::WriteFailed,
            "unwritable location should report WriteFailed");
    t.check(!res.detail.isEmpty(), "WriteFailed should carry a cause");
    t.check(store.size() == 1, "in-memory log should keep the entry");
}

void test_entry_names(TestContext &t) {
    HistoryEntry::Outcome o = HistoryEntry::Outcome::Success;
    t.check(HistoryEntry::parseOutcome("failed", o) &&
                o == HistoryEntry::Outcome::Failed,
            "parseOutcome should accept failed");
    t.check(!HistoryEntry::parseOutcome("FAILED", o),
            "parseOutcome should be case-sensitive");
    HistoryEntry::Direction d = HistoryEntry::Direction::Upload;
    t.check(HistoryEntry::parseDirection("download", d) &&
                d == HistoryEntry::Direction::Download,
            "parseDirection should accept download");
    const auto now = HistoryEntry::now(HistoryEntry::Direction::Upload, "n.txt",
                                       HistoryEntry::Outcome::Success);
    t.check(now.timestamp.time().second() == 0,
            "new entries should be truncated to the minute");
    t.check(now.date().size() == 16, "date should be YYYY-MM-DD HH:MM");
}

} // namespace

int main() {
    TestContext t;
    test_missing_file_is_empty(t);
    test_append_persists_record_format(t);
    test_reload_keeps_order(t);
    test_remove_matching_first_only(t);
    test_remove_without_match(t);
    test_remove_if_and_clear(t);
    test_corrupt_file_loads_empty(t);
    test_unrecognised_records_survive_writes(t);
    test_extra_fields_preserved(t);
    test_remove_several_keys(t);
    test_key_parsing(t);
    test_remove_if_predicate_reads_store(t);
    test_write_failure_is_reported(t);
    test_entry_names(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sftpshare_history_tests\n";
    return EXIT_SUCCESS;
}
