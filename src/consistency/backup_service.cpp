#include "consistency/backup_service.hpp"
#include "consistency/transaction_manager.hpp"
#include "consistency/version.hpp"
#include "core/checksum.hpp"
#include "core/file_io.hpp"
#include "core/logging.hpp"
#include "core/serialization.hpp"
#include "storage/entity_repository.hpp"
#include "storage/migrations.hpp"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <numeric>
#include <tuple>

namespace quire::consistency {

namespace {

constexpr const char* kBackupSuffix = ".backup";

Error unreadable(const std::string& path, const Error& cause) {
    return Error::structural("Backup " + path + " is unreadable: " + cause.message,
                             ErrorCode::ChecksumMismatch);
}

bool invalid_tag(const std::string& tag, size_t max_length) {
    return tag.empty() || tag.size() > max_length;
}

// Digest over the header fields and the canonical state, so damage to
// either is caught.
std::string backup_digest(const BackupMetadata& meta, const StoreState& state) {
    QJsonObject header{
        {"id", json::to_qstring(meta.id.to_string())},
        {"created_at", static_cast<double>(meta.created_at.millis())},
        {"type", json::to_qstring(meta.type)},
        {"trigger", trigger_name(meta.trigger)},
        {"entity_count", static_cast<double>(meta.entity_count)},
        {"link_count", static_cast<double>(meta.link_count)},
    };
    auto bytes = QJsonDocument(header).toJson(QJsonDocument::Compact);
    bytes.append('\n');
    bytes.append(json::canonical_bytes(state));
    return checksum_hex(bytes);
}

void rewire(StoreState& state, const Uuid& from, const Uuid& to) {
    for (auto& [id, link] : state.links) {
        if (link.source == from) link.source = to;
        if (link.target == from) link.target = to;
    }
}

} // anonymous namespace

const char* trigger_name(BackupTrigger trigger) {
    switch (trigger) {
        case BackupTrigger::Manual: return "manual";
        case BackupTrigger::Periodic: return "periodic";
        case BackupTrigger::PreRestore: return "pre-restore";
        case BackupTrigger::Automatic: return "automatic";
    }
    return "unknown";
}

std::optional<BackupTrigger> parse_trigger(const std::string& name) {
    for (auto trigger : {BackupTrigger::Manual, BackupTrigger::Periodic,
                         BackupTrigger::PreRestore, BackupTrigger::Automatic}) {
        if (name == trigger_name(trigger)) return trigger;
    }
    return std::nullopt;
}

size_t RepairReport::total() const {
    return std::accumulate(repairs.begin(), repairs.end(), size_t{0},
                           [](size_t sum, const auto& entry) { return sum + entry.second; });
}

StoreState repair_state(const StoreState& state, size_t max_tag_length, Timestamp now,
                        std::map<IssueCategory, size_t>& repairs) {
    StoreState out = state;

    // Orphaned: entities whose content is gone
    for (auto it = out.entities.begin(); it != out.entities.end();) {
        if (it->second.payload.empty()) {
            it = out.entities.erase(it);
            ++repairs[IssueCategory::OrphanedData];
        } else {
            ++it;
        }
    }

    // Duplicates: keep the first-seen copy and point links at it
    std::vector<const Entity*> ordered;
    for (const auto& [id, entity] : out.entities) ordered.push_back(&entity);
    std::stable_sort(ordered.begin(), ordered.end(), [](const Entity* a, const Entity* b) {
        return std::tie(a->created_at, a->id) < std::tie(b->created_at, b->id);
    });
    std::map<std::pair<std::string, std::vector<uint8_t>>, Uuid> first_seen;
    std::vector<std::pair<Uuid, Uuid>> duplicates;
    for (const auto* entity : ordered) {
        if (entity->title.empty()) continue;
        auto [it, inserted] = first_seen.emplace(std::make_pair(entity->title, entity->payload), entity->id);
        if (!inserted) duplicates.emplace_back(entity->id, it->second);
    }
    for (const auto& [duplicate, kept] : duplicates) {
        rewire(out, duplicate, kept);
        out.entities.erase(duplicate);
        ++repairs[IssueCategory::DuplicateEntry];
    }

    // Schema: nil ids get fresh ones
    if (auto it = out.entities.find(Uuid{}); it != out.entities.end()) {
        Entity entity = it->second;
        out.entities.erase(it);
        entity.id = Uuid::generate();
        rewire(out, Uuid{}, entity.id);
        out.entities[entity.id] = std::move(entity);
        ++repairs[IssueCategory::SchemaViolation];
    }
    if (auto it = out.links.find(Uuid{}); it != out.links.end()) {
        Link link = it->second;
        out.links.erase(it);
        link.id = Uuid::generate();
        out.links[link.id] = link;
        ++repairs[IssueCategory::SchemaViolation];
    }

    // Missing references: synthesize minimal valid values
    for (auto& [id, entity] : out.entities) {
        bool repaired = false;
        if (entity.title.empty()) {
            entity.title = "note_" + id.short_hex();
            repaired = true;
        }
        if (entity.created_at.millis() < 0) {
            entity.created_at = now;
            if (entity.updated_at < entity.created_at) entity.updated_at = entity.created_at;
            repaired = true;
        }
        if (repaired) ++repairs[IssueCategory::MissingReference];
    }

    // Invalid relationships: drop broken links, strip bad tags
    for (auto it = out.links.begin(); it != out.links.end();) {
        const auto& link = it->second;
        const bool broken = link.source == link.target ||
                            !out.entities.count(link.source) ||
                            !out.entities.count(link.target);
        if (broken) {
            it = out.links.erase(it);
            ++repairs[IssueCategory::InvalidRelationship];
        } else {
            ++it;
        }
    }
    for (auto& [id, entity] : out.entities) {
        auto bad = std::remove_if(entity.tags.begin(), entity.tags.end(), [&](const std::string& tag) {
            return invalid_tag(tag, max_tag_length);
        });
        if (bad != entity.tags.end()) {
            entity.tags.erase(bad, entity.tags.end());
            ++repairs[IssueCategory::InvalidRelationship];
        }
    }

    return out;
}

BackupService::BackupService(storage::EntityRepository& repo,
                             TransactionManager& txns,
                             IntegrityMonitor& monitor,
                             Options options)
    : repo_(repo), txns_(txns), monitor_(monitor), options_(std::move(options)) {}

std::string BackupService::backup_path(const Uuid& backup_id) const {
    return options_.backup_dir + "/" + backup_id.to_string() + kBackupSuffix;
}

bool BackupService::should_create_automatic_backup(const ChangeRecord& change) const {
    if (is_deletion(change)) return true;
    if (auto* import = std::get_if<changes::BulkImport>(&change.kind)) {
        return import->entities.size() > options_.bulk_import_threshold;
    }
    return false;
}

Res<BackupMetadata> BackupService::create_backup(BackupTrigger trigger) {
    if (options_.backup_dir.empty()) {
        return Res<BackupMetadata>::err(Error::structural("No backup directory configured",
                                                          ErrorCode::InvalidState));
    }
    if (in_flight_.exchange(true)) {
        return Res<BackupMetadata>::err(Error::transient("Another backup is being written",
                                                         ErrorCode::BackupInProgress));
    }
    struct Release {
        std::atomic<bool>& flag;
        ~Release() { flag.store(false); }
    } release{in_flight_};

    auto state = repo_.export_state();
    if (state.is_err()) {
        return Res<BackupMetadata>::err(state.unwrap_err().with_context("Cannot export store for backup"));
    }

    BackupMetadata meta;
    meta.id = Uuid::generate();
    meta.created_at = Timestamp::now();
    meta.trigger = trigger;
    meta.entity_count = state.unwrap().entities.size();
    meta.link_count = state.unwrap().links.size();
    meta.checksum = backup_digest(meta, state.unwrap());
    meta.path = backup_path(meta.id);

    QJsonObject root{
        {"id", json::to_qstring(meta.id.to_string())},
        {"created_at", static_cast<double>(meta.created_at.millis())},
        {"type", json::to_qstring(meta.type)},
        {"trigger", trigger_name(trigger)},
        {"checksum", json::to_qstring(meta.checksum)},
        {"entity_count", static_cast<double>(meta.entity_count)},
        {"link_count", static_cast<double>(meta.link_count)},
        {"state", json::to_json(state.unwrap())},
    };
    const auto bytes = QJsonDocument(root).toJson(QJsonDocument::Compact);
    meta.size_bytes = static_cast<size_t>(bytes.size());

    auto written = write_file_atomic(meta.path, bytes);
    if (written.is_err()) {
        qCWarning(quireBackupLog) << "BackupService: write failed:" << written.unwrap_err().message.c_str();
        return Res<BackupMetadata>::err(written.unwrap_err().with_context("Cannot write backup"));
    }

    qCInfo(quireBackupLog) << "BackupService: created" << trigger_name(trigger) << "backup"
                           << meta.id.to_string().c_str() << "with" << meta.entity_count << "entities";
    return Res<BackupMetadata>::ok(std::move(meta));
}

Res<BackupService::LoadedBackup> BackupService::load(const std::string& path) const {
    using Out = Res<LoadedBackup>;

    auto bytes = read_file_bytes(path);
    if (bytes.is_err()) return Out::err(bytes.unwrap_err());

    auto root = json::parse_object(bytes.unwrap());
    if (root.is_err()) return Out::err(unreadable(path, root.unwrap_err()));
    const auto& obj = root.unwrap();

    auto id = Uuid::parse(json::to_std(obj.value("id").toString()));
    auto trigger = parse_trigger(json::to_std(obj.value("trigger").toString()));
    if (!id || !trigger || !obj.value("checksum").isString() || !obj.value("state").isObject()) {
        return Out::err(unreadable(path, Error{"missing header fields", ErrorCode::Parse}));
    }

    auto state = json::state_from_json(obj.value("state").toObject());
    if (state.is_err()) return Out::err(unreadable(path, state.unwrap_err()));

    LoadedBackup loaded;
    loaded.metadata.id = *id;
    loaded.metadata.created_at = Timestamp(static_cast<int64_t>(obj.value("created_at").toDouble()));
    loaded.metadata.type = json::to_std(obj.value("type").toString());
    loaded.metadata.trigger = *trigger;
    loaded.metadata.checksum = json::to_std(obj.value("checksum").toString());
    loaded.metadata.entity_count = static_cast<size_t>(obj.value("entity_count").toDouble());
    loaded.metadata.link_count = static_cast<size_t>(obj.value("link_count").toDouble());
    loaded.metadata.size_bytes = static_cast<size_t>(bytes.unwrap().size());
    loaded.metadata.path = path;
    loaded.state = std::move(state).unwrap();
    return Out::ok(std::move(loaded));
}

Res<BackupService::LoadedBackup> BackupService::load_verified(const Uuid& backup_id) const {
    auto loaded = load(backup_path(backup_id));
    if (loaded.is_err()) return loaded;

    const auto& backup = loaded.unwrap();
    if (backup.metadata.id != backup_id) {
        return Res<LoadedBackup>::err(Error::structural(
            "Backup file for " + backup_id.to_string() + " claims id " + backup.metadata.id.to_string(),
            ErrorCode::ChecksumMismatch));
    }
    const auto actual = backup_digest(backup.metadata, backup.state);
    if (actual != backup.metadata.checksum ||
        backup.state.entities.size() != backup.metadata.entity_count ||
        backup.state.links.size() != backup.metadata.link_count) {
        return Res<LoadedBackup>::err(Error::structural(
            "Backup " + backup_id.to_string() + " checksum mismatch: recorded " +
                backup.metadata.checksum + ", content " + actual,
            ErrorCode::ChecksumMismatch));
    }
    return loaded;
}

Status BackupService::verify_backup(const Uuid& backup_id) const {
    auto loaded = load_verified(backup_id);
    if (loaded.is_err()) return Status::err(loaded.unwrap_err());
    return Status::ok();
}

Res<std::vector<BackupMetadata>> BackupService::list_backups() const {
    std::vector<BackupMetadata> out;
    QDir dir(json::to_qstring(options_.backup_dir));
    if (options_.backup_dir.empty() || !dir.exists()) {
        return Res<std::vector<BackupMetadata>>::ok(std::move(out));
    }

    const auto files = dir.entryList({QStringLiteral("*") + kBackupSuffix}, QDir::Files);
    for (const auto& file : files) {
        auto loaded = load(json::to_std(dir.filePath(file)));
        if (loaded.is_err()) {
            qCWarning(quireBackupLog) << "BackupService: skipping" << file << ":"
                                      << loaded.unwrap_err().message.c_str();
            continue;
        }
        out.push_back(std::move(loaded).unwrap().metadata);
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.created_at > b.created_at;
    });
    return Res<std::vector<BackupMetadata>>::ok(std::move(out));
}

Status BackupService::replace_store(const StoreState& target, const StoreState& current) {
    return txns_.run({ops::custom(
        "replace store contents",
        [&target](storage::EntityRepository& repo) { return repo.replace_all(target); },
        [&current](storage::EntityRepository& repo) { return repo.replace_all(current); })});
}

Status BackupService::restore(const Uuid& backup_id) {
    auto loaded = load_verified(backup_id);
    if (loaded.is_err()) {
        qCWarning(quireBackupLog) << "BackupService: refusing restore:" << loaded.unwrap_err().message.c_str();
        return Status::err(loaded.unwrap_err());
    }
    const auto& target = loaded.unwrap().state;

    auto current = repo_.export_state();
    if (current.is_err()) {
        return Status::err(current.unwrap_err().with_context("Cannot export store before restore"));
    }

    auto pre_restore = create_backup(BackupTrigger::PreRestore);
    if (pre_restore.is_err()) {
        qCWarning(quireBackupLog) << "BackupService: pre-restore backup failed, continuing:"
                                  << pre_restore.unwrap_err().message.c_str();
    }

    auto replaced = replace_store(target, current.unwrap());
    if (replaced.is_err()) {
        return Status::err(replaced.unwrap_err().with_context("Restore of " + backup_id.to_string()));
    }

    auto check = monitor_.inspect(CheckDepth::Full);
    if (check.is_ok() && !check.unwrap().has_critical()) {
        qCInfo(quireBackupLog) << "BackupService: restored" << backup_id.to_string().c_str();
        return Status::ok();
    }

    const std::string reason = check.is_err() ? check.unwrap_err().message
                                              : std::to_string(check.unwrap().critical_count()) +
                                                    " critical issue(s)";
    qCWarning(quireBackupLog) << "BackupService: restored state failed integrity check:" << reason.c_str();

    StoreState previous = current.unwrap();
    if (pre_restore.is_ok()) {
        auto saved = load_verified(pre_restore.unwrap().id);
        if (saved.is_ok()) {
            previous = std::move(saved).unwrap().state;
        } else {
            qCWarning(quireBackupLog) << "BackupService: pre-restore backup unusable, using in-memory copy";
        }
    }

    auto rolled_back = replace_store(previous, target);
    if (rolled_back.is_err()) {
        qCCritical(quireBackupLog) << "BackupService: rollback after failed restore failed:"
                                   << rolled_back.unwrap_err().message.c_str();
        return Status::err(Error::fatal("Restore of " + backup_id.to_string() + " failed (" + reason +
                                        ") and rollback failed: " + rolled_back.unwrap_err().message));
    }
    return Status::err(Error::structural("Restore of " + backup_id.to_string() + " rolled back: " + reason,
                                         ErrorCode::OperationFailed));
}

Status BackupService::delete_backup(const Uuid& backup_id) {
    const auto path = json::to_qstring(backup_path(backup_id));
    if (!QFile::exists(path)) {
        return Status::err(Error::structural("No backup " + backup_id.to_string(), ErrorCode::NotFound));
    }
    if (!QFile::remove(path)) {
        return Status::err(Error::transient("Cannot delete backup " + backup_id.to_string(), ErrorCode::Io));
    }
    qCDebug(quireBackupLog) << "BackupService: deleted" << backup_id.to_string().c_str();
    return Status::ok();
}

Res<size_t> BackupService::apply_retention(Timestamp now) {
    auto backups = list_backups();
    if (backups.is_err()) return Res<size_t>::err(backups.unwrap_err());

    size_t deleted = 0;
    size_t kept = 0;
    const auto cutoff = now - options_.max_age;
    for (const auto& backup : backups.unwrap()) {
        if (backup.created_at >= cutoff && kept < options_.max_count) {
            ++kept;
            continue;
        }
        auto removed = delete_backup(backup.id);
        if (removed.is_err()) return Res<size_t>::err(removed.unwrap_err());
        ++deleted;
    }
    if (deleted > 0) {
        qCInfo(quireBackupLog) << "BackupService: retention removed" << deleted << "backup(s)";
    }
    return Res<size_t>::ok(deleted);
}

Status BackupService::restore_fallback(RepairReport& report) {
    auto backups = list_backups();
    if (backups.is_err()) return Status::err(backups.unwrap_err());

    for (const auto& backup : backups.unwrap()) {
        if (backup.trigger == BackupTrigger::PreRestore) continue;
        if (verify_backup(backup.id).is_err()) continue;

        auto restored = restore(backup.id);
        if (restored.is_ok()) {
            report.restored_from = backup.id;
            return Status::ok();
        }
        if (restored.unwrap_err().is_fatal()) return restored;
        qCWarning(quireBackupLog) << "BackupService: fallback restore of" << backup.id.to_string().c_str()
                                  << "failed:" << restored.unwrap_err().message.c_str();
    }
    return Status::err(Error::structural("No verifying backup could repair the store",
                                         ErrorCode::NoBackupAvailable));
}

Res<RepairReport> BackupService::detect_and_repair_corruption() {
    using Out = Res<RepairReport>;

    auto before = monitor_.inspect(CheckDepth::Full);
    if (before.is_err()) return Out::err(before.unwrap_err());

    RepairReport report;
    report.issues_before = before.unwrap().issues;

    const auto& issues = report.issues_before;
    auto any = [&](auto predicate) { return std::any_of(issues.begin(), issues.end(), predicate); };
    const bool schema_behind = any([](const IntegrityIssue& i) {
        return i.category == IssueCategory::SchemaViolation && i.severity == IssueSeverity::Critical &&
               i.affected.empty();
    });
    const bool cache_stale = any([](const IntegrityIssue& i) {
        return i.category == IssueCategory::CacheInconsistency;
    });

    if (schema_behind) {
        auto migrated = storage::initialize_database(repo_.database());
        if (migrated.is_err()) return Out::err(migrated.unwrap_err().with_context("Schema repair"));
        report.schema_migrated = true;
        ++report.repairs[IssueCategory::SchemaViolation];
    }

    if (before.unwrap().has_critical()) {
        auto state = repo_.export_state();
        if (state.is_err()) return Out::err(state.unwrap_err());

        auto repaired = repair_state(state.unwrap(), options_.max_tag_length, Timestamp::now(), report.repairs);
        auto plan = plan_replace(state.unwrap(), repaired);
        if (!plan.empty()) {
            auto applied = txns_.run(std::move(plan));
            if (applied.is_err()) {
                qCCritical(quireBackupLog) << "BackupService: structural repair failed:"
                                           << applied.unwrap_err().message.c_str();
                return Out::err(applied.unwrap_err().with_context("Structural repair"));
            }
        }
    }

    if (cache_stale) {
        auto rebuilt = txns_.run({ops::custom(
            "rebuild search cache",
            [](storage::EntityRepository& repo) { return repo.rebuild_search_cache(); },
            [](storage::EntityRepository& repo) { return repo.rebuild_search_cache(); })});
        if (rebuilt.is_err()) return Out::err(rebuilt.unwrap_err().with_context("Search cache rebuild"));
        report.cache_rebuilt = true;
        ++report.repairs[IssueCategory::CacheInconsistency];
    }

    auto after = monitor_.inspect(CheckDepth::Full);
    if (after.is_err()) return Out::err(after.unwrap_err());

    if (after.unwrap().has_critical()) {
        qCWarning(quireBackupLog) << "BackupService:" << after.unwrap().critical_count()
                                  << "critical issue(s) survived structural repair, restoring from backup";
        auto restored = restore_fallback(report);
        if (restored.is_err()) {
            qCCritical(quireBackupLog) << "BackupService: repair failed:" << restored.unwrap_err().message.c_str();
            last_repair_ = report;
            return Out::err(restored.unwrap_err());
        }
        after = monitor_.inspect(CheckDepth::Full);
        if (after.is_err()) return Out::err(after.unwrap_err());
    }

    report.issues_after = after.unwrap().issues;
    last_repair_ = report;
    qCInfo(quireBackupLog) << "BackupService: repair made" << report.total() << "fix(es)"
                           << (report.restored_from ? "with backup restore" : "");
    return Out::ok(std::move(report));
}

Res<BackupStats> BackupService::stats() const {
    auto backups = list_backups();
    if (backups.is_err()) return Res<BackupStats>::err(backups.unwrap_err());

    BackupStats stats;
    stats.count = backups.unwrap().size();
    for (const auto& backup : backups.unwrap()) {
        stats.total_bytes += backup.size_bytes;
    }
    if (!backups.unwrap().empty()) {
        stats.newest = backups.unwrap().front().created_at;
        stats.oldest = backups.unwrap().back().created_at;
    }
    stats.last_repair = last_repair_;
    return Res<BackupStats>::ok(std::move(stats));
}

} // namespace quire::consistency
