#include <catch2/catch_test_macros.hpp>
#include "consistency/backup_service.hpp"
#include "consistency/transaction_manager.hpp"
#include "core/checksum.hpp"
#include "support/store_fixture.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <algorithm>
#include <chrono>

using namespace quire;
using namespace quire::consistency;
using quire::testing::make_entity;
using quire::testing::make_link;

namespace {

struct Services {
    QTemporaryDir dir;
    quire::testing::Store store;
    TransactionManager txns{store.repo, {}};
    IntegrityMonitor monitor{store.repo, {}};
    BackupService backups;

    explicit Services(BackupService::Options options = {})
        : backups(store.repo, txns, monitor, with_dir(std::move(options))) {}

    BackupService::Options with_dir(BackupService::Options options) {
        options.backup_dir = dir.path().toStdString();
        return options;
    }

    std::string checksum() { return store.repo.checksum().unwrap(); }
};

QByteArray read_all(const std::string& path) {
    QFile file(QString::fromStdString(path));
    REQUIRE(file.open(QIODevice::ReadOnly));
    return file.readAll();
}

void overwrite(const std::string& path, const QByteArray& bytes) {
    QFile file(QString::fromStdString(path));
    REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    REQUIRE(file.write(bytes) == bytes.size());
}

void rewrite_header(const std::string& path, const QString& key, const QJsonValue& value) {
    auto doc = QJsonDocument::fromJson(read_all(path));
    REQUIRE(doc.isObject());
    auto root = doc.object();
    REQUIRE(root.contains(key));
    root.insert(key, value);
    overwrite(path, QJsonDocument(root).toJson(QJsonDocument::Compact));
}

// Flags entities titled "Poison"; nothing in structural repair clears it.
class PoisonValidator : public Validator {
public:
    [[nodiscard]] std::string name() const override { return "poison"; }
    [[nodiscard]] bool is_critical() const override { return true; }
    [[nodiscard]] Res<std::vector<IntegrityIssue>> validate(const ValidationContext& ctx) const override {
        std::vector<IntegrityIssue> out;
        for (const auto& [id, entity] : ctx.state.entities) {
            if (entity.title == "Poison") {
                out.push_back({IssueSeverity::Critical, IssueCategory::DataCorruption, "poisoned", {id}, name()});
            }
        }
        return Res<std::vector<IntegrityIssue>>::ok(std::move(out));
    }
};

} // anonymous namespace

TEST_CASE("Backups are written, listed and verified", "[backup]") {
    Services s;
    REQUIRE(s.dir.isValid());
    auto a = make_entity("Alpha");
    auto b = make_entity("Beta");
    REQUIRE(s.store.repo.insert_entity(a).is_ok());
    REQUIRE(s.store.repo.insert_entity(b).is_ok());
    REQUIRE(s.store.repo.insert_link(make_link(a.id, b.id)).is_ok());

    auto meta = s.backups.create_backup().unwrap();
    REQUIRE(meta.trigger == BackupTrigger::Manual);
    REQUIRE(meta.type == "full");
    REQUIRE(meta.entity_count == 2);
    REQUIRE(meta.link_count == 1);
    REQUIRE(meta.checksum.size() == 64);
    REQUIRE(meta.checksum != s.checksum());
    REQUIRE(meta.size_bytes > 0);
    REQUIRE(QFile::exists(QString::fromStdString(s.backups.backup_path(meta.id))));
    REQUIRE_FALSE(s.backups.is_busy());

    REQUIRE(s.backups.verify_backup(meta.id).is_ok());

    auto second = s.backups.create_backup(BackupTrigger::Periodic).unwrap();
    auto listed = s.backups.list_backups().unwrap();
    REQUIRE(listed.size() == 2);
    REQUIRE(listed.front().created_at >= listed.back().created_at);

    SECTION("Unreadable files are skipped when listing") {
        overwrite(s.dir.filePath("junk.backup").toStdString(), "not json");
        REQUIRE(s.backups.list_backups().unwrap().size() == 2);
    }

    SECTION("Deleting") {
        REQUIRE(s.backups.delete_backup(second.id).is_ok());
        REQUIRE(s.backups.list_backups().unwrap().size() == 1);

        auto missing = s.backups.delete_backup(second.id);
        REQUIRE(missing.is_err());
        REQUIRE(missing.unwrap_err().code == ErrorCode::NotFound);
    }

    SECTION("Stats") {
        auto stats = s.backups.stats().unwrap();
        REQUIRE(stats.count == 2);
        REQUIRE(stats.total_bytes >= meta.size_bytes);
        REQUIRE(*stats.newest >= *stats.oldest);
        REQUIRE_FALSE(stats.last_repair.has_value());
    }
}

TEST_CASE("Backups need a directory", "[backup]") {
    quire::testing::Store store;
    TransactionManager txns(store.repo, {});
    IntegrityMonitor monitor(store.repo, {});
    BackupService backups(store.repo, txns, monitor, {});

    auto result = backups.create_backup();
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().code == ErrorCode::InvalidState);
    REQUIRE(backups.list_backups().unwrap().empty());
}

TEST_CASE("Restore replaces the store with the backup", "[backup]") {
    Services s;
    REQUIRE(s.store.repo.insert_entity(make_entity("Alpha")).is_ok());
    auto meta = s.backups.create_backup().unwrap();
    const auto saved = s.checksum();

    auto later = make_entity("Later");
    REQUIRE(s.store.repo.insert_entity(later).is_ok());
    REQUIRE(s.checksum() != saved);

    REQUIRE(s.backups.restore(meta.id).is_ok());
    REQUIRE(s.checksum() == saved);
    REQUIRE_FALSE(s.store.repo.get_entity(later.id).unwrap().has_value());

    // A pre-restore backup of the replaced state was kept
    auto listed = s.backups.list_backups().unwrap();
    REQUIRE(listed.size() == 2);
    auto pre = std::find_if(listed.begin(), listed.end(), [](const auto& m) {
        return m.trigger == BackupTrigger::PreRestore;
    });
    REQUIRE(pre != listed.end());
    REQUIRE(pre->entity_count == 2);
}

TEST_CASE("Damaged backups are refused without touching the store", "[backup]") {
    Services s;
    REQUIRE(s.store.repo.insert_entity(make_entity("Alpha")).is_ok());
    auto meta = s.backups.create_backup().unwrap();
    REQUIRE(s.store.repo.insert_entity(make_entity("Gamma")).is_ok());
    const auto before = s.checksum();
    const auto path = s.backups.backup_path(meta.id);

    SECTION("Altered content") {
        auto bytes = read_all(path);
        REQUIRE(bytes.contains("Alpha"));
        bytes.replace("Alpha", "Alphz");
        overwrite(path, bytes);
    }

    SECTION("Truncated file") {
        auto bytes = read_all(path);
        overwrite(path, bytes.left(bytes.size() / 2));
    }

    SECTION("Shifted creation time") {
        rewrite_header(path, "created_at", static_cast<double>(meta.created_at.millis() + 1));
    }

    SECTION("Changed trigger") {
        rewrite_header(path, "trigger", "periodic");
    }

    SECTION("Changed type") {
        rewrite_header(path, "type", "fulL");
    }

    SECTION("Header claims another id") {
        rewrite_header(path, "id", QString::fromStdString(Uuid::generate().to_string()));
    }

    auto verified = s.backups.verify_backup(meta.id);
    REQUIRE(verified.is_err());
    REQUIRE(verified.unwrap_err().code == ErrorCode::ChecksumMismatch);

    auto restored = s.backups.restore(meta.id);
    REQUIRE(restored.is_err());
    REQUIRE(restored.unwrap_err().code == ErrorCode::ChecksumMismatch);
    REQUIRE(s.checksum() == before);
}

TEST_CASE("A restore that fails integrity checks is rolled back", "[backup]") {
    Services s;
    auto orphan = make_entity("Orphan");
    orphan.payload.clear();
    REQUIRE(s.store.repo.insert_entity(orphan).is_ok());
    auto broken = s.backups.create_backup().unwrap();

    REQUIRE(s.store.repo.remove_entity(orphan.id).is_ok());
    REQUIRE(s.store.repo.insert_entity(make_entity("Healthy")).is_ok());
    const auto before = s.checksum();

    auto restored = s.backups.restore(broken.id);
    REQUIRE(restored.is_err());
    REQUIRE(restored.unwrap_err().code == ErrorCode::OperationFailed);
    REQUIRE_FALSE(restored.unwrap_err().is_fatal());
    REQUIRE(s.checksum() == before);
}

TEST_CASE("Retention deletes old and surplus backups", "[backup]") {
    Services s({.max_age = std::chrono::hours(1), .max_count = 2});
    REQUIRE(s.store.repo.insert_entity(make_entity("Alpha")).is_ok());
    for (int i = 0; i < 3; ++i) {
        REQUIRE(s.backups.create_backup().is_ok());
    }

    REQUIRE(s.backups.apply_retention().unwrap() == 1);
    REQUIRE(s.backups.list_backups().unwrap().size() == 2);

    // Two hours later everything is past the age limit
    auto later = Timestamp::now() + std::chrono::hours(2);
    REQUIRE(s.backups.apply_retention(later).unwrap() == 2);
    REQUIRE(s.backups.list_backups().unwrap().empty());
}

TEST_CASE("Automatic backup triggers", "[backup]") {
    Services s({.bulk_import_threshold = 2});
    auto a = make_entity("A");

    REQUIRE(s.backups.should_create_automatic_backup(make_change(changes::EntityDeleted{a.id})));
    REQUIRE(s.backups.should_create_automatic_backup(
        make_change(changes::LinkRemoved{make_link(a.id, Uuid::generate())})));
    REQUIRE_FALSE(s.backups.should_create_automatic_backup(make_change(changes::EntityCreated{a})));

    changes::BulkImport small{{make_entity("1"), make_entity("2")}};
    changes::BulkImport large{{make_entity("1"), make_entity("2"), make_entity("3")}};
    REQUIRE_FALSE(s.backups.should_create_automatic_backup(make_change(small)));
    REQUIRE(s.backups.should_create_automatic_backup(make_change(large)));
}

TEST_CASE("repair_state fixes structural damage", "[backup][repair]") {
    StoreState state;
    auto kept = make_entity("Same", 0);
    auto duplicate = kept;
    duplicate.id = Uuid::generate();
    duplicate.created_at = quire::testing::at_seconds(10);
    auto untitled = make_entity("Untitled");
    untitled.title.clear();
    auto orphan = make_entity("Orphan");
    orphan.payload.clear();
    auto tagged = make_entity("Tagged");
    tagged.tags = {"fine", ""};

    for (const auto& e : {kept, duplicate, untitled, orphan, tagged}) state.entities[e.id] = e;
    auto to_duplicate = make_link(tagged.id, duplicate.id);
    auto to_orphan = make_link(tagged.id, orphan.id);
    auto self = make_link(kept.id, kept.id);
    for (const auto& l : {to_duplicate, to_orphan, self}) state.links[l.id] = l;

    std::map<IssueCategory, size_t> repairs;
    auto repaired = repair_state(state, 50, Timestamp::now(), repairs);

    REQUIRE(repairs[IssueCategory::OrphanedData] == 1);
    REQUIRE(repairs[IssueCategory::DuplicateEntry] == 1);
    REQUIRE(repairs[IssueCategory::MissingReference] == 1);
    // Dangling link, self link and the empty tag
    REQUIRE(repairs[IssueCategory::InvalidRelationship] == 3);

    REQUIRE(repaired.entities.count(orphan.id) == 0);
    REQUIRE(repaired.entities.count(duplicate.id) == 0);
    REQUIRE(repaired.entities.at(untitled.id).title == "note_" + untitled.id.short_hex());
    REQUIRE(repaired.entities.at(tagged.id).tags == std::vector<std::string>{"fine"});

    // The link to the duplicate now points at the kept copy
    REQUIRE(repaired.links.size() == 1);
    REQUIRE(repaired.links.at(to_duplicate.id).target == kept.id);
}

TEST_CASE("detect_and_repair_corruption repairs in place", "[backup][repair]") {
    Services s;
    auto a = make_entity("A");
    a.tags = {std::string(80, 'x')};
    auto orphan = make_entity("Orphan");
    orphan.payload.clear();
    REQUIRE(s.store.repo.insert_entity(a).is_ok());
    REQUIRE(s.store.repo.insert_entity(orphan).is_ok());
    REQUIRE(s.store.repo.insert_link(make_link(a.id, orphan.id)).is_ok());
    s.store.db.execute("DELETE FROM entity_fts WHERE entity_id = '" + a.id.to_string() + "';").unwrap();

    auto report = s.backups.detect_and_repair_corruption().unwrap();
    REQUIRE_FALSE(report.issues_before.empty());
    REQUIRE(report.repairs[IssueCategory::OrphanedData] == 1);
    REQUIRE(report.repairs[IssueCategory::InvalidRelationship] == 2);
    REQUIRE(report.cache_rebuilt);
    REQUIRE_FALSE(report.restored_from.has_value());
    REQUIRE(std::none_of(report.issues_after.begin(), report.issues_after.end(), [](const auto& i) {
        return i.severity == IssueSeverity::Critical;
    }));

    REQUIRE(s.store.repo.all_links().unwrap().empty());
    REQUIRE(s.store.repo.get_entity(a.id).unwrap()->tags.empty());

    // A second pass finds nothing left to do
    const auto after_first = s.checksum();
    auto again = s.backups.detect_and_repair_corruption().unwrap();
    REQUIRE(again.total() == 0);
    REQUIRE(s.checksum() == after_first);
    REQUIRE(s.backups.stats().unwrap().last_repair.has_value());
}

TEST_CASE("Unrepairable damage falls back to the newest good backup", "[backup][repair]") {
    Services s;
    s.monitor.add_validator(std::make_unique<PoisonValidator>());

    SECTION("Restores from a verifying backup") {
        REQUIRE(s.store.repo.insert_entity(make_entity("Clean")).is_ok());
        auto good = s.backups.create_backup().unwrap();
        REQUIRE(s.store.repo.insert_entity(make_entity("Poison")).is_ok());

        auto report = s.backups.detect_and_repair_corruption().unwrap();
        REQUIRE(report.restored_from == good.id);
        REQUIRE(s.checksum() == good.checksum);
    }

    SECTION("Fails without one") {
        REQUIRE(s.store.repo.insert_entity(make_entity("Poison")).is_ok());
        auto report = s.backups.detect_and_repair_corruption();
        REQUIRE(report.is_err());
        REQUIRE(report.unwrap_err().code == ErrorCode::NoBackupAvailable);
    }
}
