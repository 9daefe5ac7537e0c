#include "consistency/consistency_manager.hpp"
#include "consistency/owner_context.hpp"
#include "consistency/version.hpp"
#include "core/logging.hpp"
#include "storage/entity_repository.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace quire::consistency {

namespace {

constexpr const char* SWEEP_TIMER = "transaction-sweep";
constexpr const char* QUICK_CHECK_TIMER = "integrity-quick";
constexpr const char* FULL_CHECK_TIMER = "integrity-full";
constexpr const char* BACKUP_TIMER = "periodic-backup";

std::optional<Uuid> patched_entity(const ChangeRecord& change) {
    if (auto* m = std::get_if<changes::EntityModified>(&change.kind)) return m->entity_id;
    if (auto* a = std::get_if<changes::AnnotationChanged>(&change.kind)) return a->entity_id;
    if (auto* d = std::get_if<changes::DerivedAnalysisUpdated>(&change.kind)) return d->entity_id;
    return std::nullopt;
}

/**
 * Builds the delta for a run of changes against the live store. Records
 * touched by an earlier change in the run are read from the staged
 * result rather than the store.
 */
class ChangePlanner {
public:
    explicit ChangePlanner(storage::EntityRepository& repo) : repo_(repo) {}

    [[nodiscard]] Status add(const ChangeRecord& change);

    [[nodiscard]] Delta take() { return std::move(delta_); }

private:
    using Key = std::pair<RecordKind, Uuid>;

    [[nodiscard]] Res<std::optional<Record>> current(const RecordRef& ref);
    [[nodiscard]] Res<Record> require(const RecordRef& ref);
    void stage(DeltaOperation op);

    storage::EntityRepository& repo_;
    std::map<Key, std::optional<Record>> staged_;
    Delta delta_;
};

Res<std::optional<Record>> ChangePlanner::current(const RecordRef& ref) {
    auto it = staged_.find({ref.kind, ref.id});
    if (it != staged_.end()) {
        return Res<std::optional<Record>>::ok(it->second);
    }
    return repo_.get(ref);
}

Res<Record> ChangePlanner::require(const RecordRef& ref) {
    auto found = current(ref);
    if (found.is_err()) return Res<Record>::err(found.unwrap_err());
    if (!found.unwrap()) {
        return Res<Record>::err(Error::structural(std::string("No ") + record_kind_name(ref.kind) + " " +
                                                  ref.id.to_string(), ErrorCode::NotFound));
    }
    return Res<Record>::ok(std::move(*std::move(found).unwrap()));
}

void ChangePlanner::stage(DeltaOperation op) {
    const auto ref = target_of(op);
    std::optional<Record> after;
    if (auto* c = std::get_if<delta::Create>(&op)) after = c->record;
    if (auto* u = std::get_if<delta::Update>(&op)) after = u->after;
    if (auto* m = std::get_if<delta::Move>(&op)) after = Record{m->after};
    if (auto* g = std::get_if<delta::Merge>(&op)) after = Record{g->after};
    staged_[{ref.kind, ref.id}] = std::move(after);
    delta_.operations.push_back(std::move(op));
}

Status ChangePlanner::add(const ChangeRecord& change) {
    const auto at = change.timestamp;

    if (auto* created = std::get_if<changes::EntityCreated>(&change.kind)) {
        auto existing = current({RecordKind::Entity, created->entity.id});
        if (existing.is_err()) return Status::err(existing.unwrap_err());
        if (existing.unwrap()) {
            return Status::err(Error::structural("Entity " + created->entity.id.to_string() + " already exists",
                                                 ErrorCode::AlreadyExists));
        }
        stage(delta::Create{Record{created->entity}});
        return Status::ok();
    }

    if (auto* deleted = std::get_if<changes::EntityDeleted>(&change.kind)) {
        auto before = require({RecordKind::Entity, deleted->entity_id});
        if (before.is_err()) return Status::err(before.unwrap_err());
        stage(delta::Delete{std::move(before).unwrap()});
        return Status::ok();
    }

    if (auto entity_id = patched_entity(change)) {
        auto before = require({RecordKind::Entity, *entity_id});
        if (before.is_err()) return Status::err(before.unwrap_err());
        auto patch = patch_for(change);
        Entity after = patch->apply_to(std::get<Entity>(before.unwrap()), at);
        stage(delta::Update{std::move(before).unwrap(), Record{std::move(after)}});
        return Status::ok();
    }

    if (auto* added = std::get_if<changes::LinkAdded>(&change.kind)) {
        auto existing = current({RecordKind::Link, added->link.id});
        if (existing.is_err()) return Status::err(existing.unwrap_err());
        if (existing.unwrap()) {
            stage(delta::Move{std::get<Link>(*existing.unwrap()), added->link});
        } else {
            stage(delta::Create{Record{added->link}});
        }
        return Status::ok();
    }

    if (auto* removed = std::get_if<changes::LinkRemoved>(&change.kind)) {
        auto before = require({RecordKind::Link, removed->link.id});
        if (before.is_err()) return Status::err(before.unwrap_err());
        stage(delta::Delete{std::move(before).unwrap()});
        return Status::ok();
    }

    if (auto* import = std::get_if<changes::BulkImport>(&change.kind)) {
        for (const auto& entity : import->entities) {
            auto existing = current({RecordKind::Entity, entity.id});
            if (existing.is_err()) return Status::err(existing.unwrap_err());
            if (!existing.unwrap()) {
                stage(delta::Create{Record{entity}});
                continue;
            }
            const auto& before = std::get<Entity>(*existing.unwrap());
            stage(delta::Merge{before, merge_entities(before, entity, at), {entity.id}});
        }
        return Status::ok();
    }

    return Status::err(Error::structural(std::string("Unsupported change ") + kind_name(change.kind),
                                         ErrorCode::InvalidState));
}

} // anonymous namespace

TransactionManager::Options transaction_options(const ConsistencyConfig& config) {
    return {config.max_active_transactions, config.transaction_timeout};
}

ConflictResolver::Options resolver_options(const ConsistencyConfig& config) {
    return {config.simultaneous_edit_window, config.user_precedence_window,
            config.resolution_history_limit, config.recent_change_limit};
}

VersionHistory::Options history_options(const ConsistencyConfig& config) {
    return {config.max_versions, config.max_history_bytes, config.snapshot_interval, config.history_log_path};
}

IntegrityMonitor::Options monitor_options(const ConsistencyConfig& config) {
    return {config.max_tag_length};
}

BackupService::Options backup_options(const ConsistencyConfig& config) {
    return {config.backup_dir, config.backup_max_age, config.backup_max_count,
            config.bulk_import_backup_threshold, config.max_tag_length};
}

ConsistencyManager::ConsistencyManager(storage::EntityRepository& repo,
                                       TransactionManager& txns,
                                       ConflictResolver& resolver,
                                       VersionHistory& history,
                                       IntegrityMonitor& monitor,
                                       BackupService& backups,
                                       Notifier& notifier,
                                       ConsistencyConfig config)
    : repo_(repo)
    , txns_(txns)
    , resolver_(resolver)
    , history_(history)
    , monitor_(monitor)
    , backups_(backups)
    , notifier_(notifier)
    , config_(std::move(config)) {}

ConsistencyManager::~ConsistencyManager() {
    detach();
    if (opened_) {
        monitor_.set_repair_handler(nullptr);
    }
}

Status ConsistencyManager::open() {
    if (opened_) return Status::ok();

    if (!history_.is_initialized()) {
        auto baseline = history_.initialize();
        if (baseline.is_err()) {
            return Status::err(baseline.unwrap_err().with_context("Cannot record baseline version"));
        }
    }

    monitor_.set_repair_handler([this](const IntegrityCheckResult& found) -> Status {
        qCWarning(quireConsistencyLog) << "ConsistencyManager: repairing" << found.critical_count()
                                       << "critical issue(s)";
        auto report = backups_.detect_and_repair_corruption();
        if (report.is_err()) {
            return Status::err(report.unwrap_err());
        }
        return rebaseline("repair");
    });

    opened_ = true;
    qCInfo(quireConsistencyLog) << "ConsistencyManager: opened at version"
                                << history_.current_version_id()->to_string().c_str();
    return Status::ok();
}

Res<ConsistencyResult> ConsistencyManager::submit_change(const ChangeRecord& change) {
    using Out = Res<ConsistencyResult>;
    const auto started = std::chrono::steady_clock::now();
    ConsistencyResult result;
    ++metrics_.total_changes;

    auto fail = [&](Error error) {
        ++metrics_.failed;
        finish(result, started);
        qCWarning(quireConsistencyLog) << "ConsistencyManager: change" << change.id.to_string().c_str()
                                       << "failed:" << error.message.c_str();
        return Out::err(std::move(error));
    };

    if (!opened_) {
        return fail(Error::structural("Consistency manager is not open", ErrorCode::InvalidState));
    }

    auto& tracker = resolver_.tracker();
    tracker.track(change);

    auto detected = resolver_.detect_conflicts(change, history_.current_version_id());
    if (detected.is_err()) {
        return fail(detected.unwrap_err().with_context("Conflict detection failed"));
    }
    result.conflicts = std::move(detected).unwrap();
    metrics_.conflicts += result.conflicts.size();

    std::vector<ChangeRecord> to_apply;
    if (result.conflicts.empty()) {
        to_apply.push_back(change);
    } else {
        auto resolution = resolver_.resolve(result.conflicts);

        if (!resolution.success) {
            tracker.mark_rejected(change.id);
            auto error = unresolved_error(result.conflicts);
            const bool any_manual = std::any_of(result.conflicts.begin(), result.conflicts.end(),
                                                [](const auto& c) { return !c.auto_resolvable; });
            if (!any_manual) {
                error.message += ": " + resolution.detail;
            }
            result.resolution = std::move(resolution);
            return fail(std::move(error));
        }

        if (resolution.is_rejected(change.id)) {
            for (const auto& rejected : resolution.rejected) {
                tracker.mark_rejected(rejected.id);
            }
            ++metrics_.rejected;
            result.resolution = std::move(resolution);
            finish(result, started);
            qCWarning(quireConsistencyLog) << "ConsistencyManager: rejected" << describe(change).c_str();
            return Out::ok(std::move(result));
        }

        // Changes already tracked were applied when they were submitted
        for (const auto& accepted : resolution.accepted) {
            if (accepted.id == change.id || !tracker.find(accepted.id)) {
                to_apply.push_back(accepted);
            }
        }
        result.resolution = std::move(resolution);
    }

    ChangePlanner planner(repo_);
    for (const auto& pending : to_apply) {
        auto planned = planner.add(pending);
        if (planned.is_err()) {
            tracker.mark_rejected(change.id);
            return fail(planned.unwrap_err().with_context("Cannot apply " + describe(pending)));
        }
    }

    auto delta = compact(planner.take());
    std::optional<Uuid> version_id;
    if (!delta.operations.empty()) {
        // Taken once the change is known to apply, and before it lands
        maybe_backup(change);

        auto committed = txns_.run(plan_forward(delta));
        if (committed.is_err()) {
            tracker.mark_rejected(change.id);
            return fail(committed.unwrap_err().with_context("Commit failed for " + describe(change)));
        }

        std::set<Uuid> affected;
        for (const auto& applied : to_apply) {
            auto ids = affected_ids(applied);
            affected.insert(ids.begin(), ids.end());
        }
        std::string description = describe(change);
        if (to_apply.size() > 1) {
            description += " (+" + std::to_string(to_apply.size() - 1) + " related)";
        }

        auto recorded = history_.record(kind_name(change.kind), std::move(description), std::move(affected),
                                        std::move(delta));
        if (recorded.is_err()) {
            // The store moved without a version; restart history from here
            qCCritical(quireConsistencyLog) << "ConsistencyManager: versioning failed after commit:"
                                            << recorded.unwrap_err().message.c_str();
            auto rebased = rebaseline("versioning failure");
            if (rebased.is_err()) {
                return fail(Error::fatal("Store committed without a version and history could not be reset: " +
                                         rebased.unwrap_err().message));
            }
            return fail(recorded.unwrap_err().with_context("Change committed but not versioned"));
        }
        version_id = recorded.unwrap();
    }

    if (result.resolution) {
        for (const auto& rejected : result.resolution->rejected) {
            tracker.mark_rejected(rejected.id);
        }
    }
    for (const auto& applied : to_apply) {
        tracker.track(applied);
        tracker.mark_accepted(applied.id, version_id);
    }
    for (const auto& applied : to_apply) {
        notifier_.notify(applied, affected_ids(applied));
    }

    result.version_id = version_id;
    result.accepted = true;
    result.applied = std::move(to_apply);
    ++metrics_.accepted;
    finish(result, started);

    qCInfo(quireConsistencyLog) << "ConsistencyManager: accepted" << describe(change).c_str()
                                << "with" << result.conflicts.size() << "conflict(s) in"
                                << result.processing_time.count() << "ms";
    return Out::ok(std::move(result));
}

std::future<Res<ConsistencyResult>> ConsistencyManager::post_change(ChangeRecord change) {
    if (context_ && context_->is_running() && !context_->is_owner_thread()) {
        return context_->submit([this, change = std::move(change)] { return submit_change(change); });
    }
    std::promise<Res<ConsistencyResult>> ready;
    ready.set_value(submit_change(change));
    return ready.get_future();
}

Status ConsistencyManager::undo() {
    const auto from = history_.current_version_id();
    auto status = history_.undo(from);
    if (status.is_ok()) {
        announce(affected_between(from, history_.current_version_id()));
    }
    return status;
}

Status ConsistencyManager::redo() {
    const auto from = history_.current_version_id();
    auto status = history_.redo();
    if (status.is_ok()) {
        announce(affected_between(from, history_.current_version_id()));
    }
    return status;
}

Status ConsistencyManager::jump_to_version(const Uuid& version_id) {
    const auto from = history_.current_version_id();
    auto status = history_.jump_to_version(version_id);
    if (status.is_ok()) {
        announce(affected_between(from, version_id));
    }
    return status;
}

std::vector<HistoryEntry> ConsistencyManager::history(size_t limit) const {
    return history_.get_history(limit);
}

Res<BackupMetadata> ConsistencyManager::create_backup(BackupTrigger trigger) {
    return backups_.create_backup(trigger);
}

Status ConsistencyManager::restore_backup(const Uuid& backup_id) {
    auto restored = backups_.restore(backup_id);
    if (restored.is_err()) {
        return restored;
    }

    auto rebased = rebaseline("restore");
    if (rebased.is_err()) {
        return rebased;
    }

    auto state = repo_.export_state();
    if (state.is_ok()) {
        std::set<Uuid> ids;
        for (const auto& [id, entity] : state.unwrap().entities) ids.insert(id);
        announce(ids);
    }
    return Status::ok();
}

Res<RepairReport> ConsistencyManager::repair() {
    auto report = backups_.detect_and_repair_corruption();
    if (report.is_err()) {
        return report;
    }
    if (report.unwrap().total() > 0 || report.unwrap().restored_from) {
        auto rebased = rebaseline("repair");
        if (rebased.is_err()) {
            return Res<RepairReport>::err(rebased.unwrap_err());
        }
    }
    return report;
}

void ConsistencyManager::attach(OwnerContext& context) {
    detach();
    context_ = &context;
    notifier_.attach(&context);

    context.schedule_every(SWEEP_TIMER, config_.transaction_sweep_interval, [this] {
        auto expired = txns_.expire_overdue();
        if (expired > 0) {
            qCDebug(quireConsistencyLog) << "ConsistencyManager: swept" << expired << "transaction(s)";
        }
    });

    context.schedule_every(QUICK_CHECK_TIMER, config_.quick_check_interval, [this] {
        auto health = monitor_.run_scheduled_check();
        if (health.is_err()) {
            qCWarning(quireConsistencyLog) << "ConsistencyManager: scheduled check failed:"
                                           << health.unwrap_err().message.c_str();
        }
    });

    context.schedule_every(FULL_CHECK_TIMER, config_.full_check_interval, [this] {
        auto result = monitor_.perform_comprehensive_check();
        if (result.is_err()) {
            qCWarning(quireConsistencyLog) << "ConsistencyManager: comprehensive check failed:"
                                           << result.unwrap_err().message.c_str();
        }
    });

    if (!config_.backup_dir.empty()) {
        context.schedule_every(BACKUP_TIMER, config_.auto_backup_interval, [this] {
            auto backup = backups_.create_backup(BackupTrigger::Periodic);
            if (backup.is_err()) {
                qCWarning(quireConsistencyLog) << "ConsistencyManager: periodic backup failed:"
                                               << backup.unwrap_err().message.c_str();
            }
            auto pruned = backups_.apply_retention();
            if (pruned.is_err()) {
                qCWarning(quireConsistencyLog) << "ConsistencyManager: retention failed:"
                                               << pruned.unwrap_err().message.c_str();
            }
        });
    }
}

void ConsistencyManager::detach() {
    if (!context_) return;
    OwnerContext* context = context_;

    auto teardown = [this, context] {
        for (const char* name : {SWEEP_TIMER, QUICK_CHECK_TIMER, FULL_CHECK_TIMER, BACKUP_TIMER}) {
            context->cancel_timer(name);
        }
        notifier_.attach(nullptr);
        context_ = nullptr;
    };

    // Tear down on the worker so no timer tick or queued delivery is
    // running against this manager while it is unhooked.
    if (context->is_running() && !context->is_owner_thread()) {
        try {
            context->submit(teardown).get();
            return;
        } catch (const std::future_error& e) {
            qCDebug(quireConsistencyLog) << "ConsistencyManager: owner context stopped during detach:" << e.what();
        }
    }
    teardown();
}

Status ConsistencyManager::rebaseline(const char* reason) {
    resolver_.tracker().clear();
    auto baseline = history_.initialize();
    if (baseline.is_err()) {
        return Status::err(baseline.unwrap_err().with_context(std::string("Cannot reset history after ") + reason));
    }
    qCInfo(quireConsistencyLog) << "ConsistencyManager: history reset after" << reason;
    return Status::ok();
}

std::set<Uuid> ConsistencyManager::affected_between(const std::optional<Uuid>& from,
                                                    const std::optional<Uuid>& to) const {
    std::set<Uuid> out;
    if (!from || !to || *from == *to) return out;

    // Newest first, so the versions between the two are [newer, older)
    const auto entries = history_.get_history(history_.size());
    auto position = [&](const Uuid& id) {
        return std::find_if(entries.begin(), entries.end(), [&](const auto& e) { return e.id == id; });
    };
    auto a = position(*from);
    auto b = position(*to);
    if (a == entries.end() || b == entries.end()) return out;
    if (b < a) std::swap(a, b);
    for (auto it = a; it != b; ++it) {
        out.insert(it->affected.begin(), it->affected.end());
    }
    return out;
}

void ConsistencyManager::announce(const std::set<Uuid>& affected) {
    if (affected.empty()) return;
    for (auto category : {NotifyCategory::Media, NotifyCategory::RelationshipGraph,
                          NotifyCategory::AnnotationSearch, NotifyCategory::DerivedAnalysis}) {
        notifier_.notify(category, affected);
    }
}

void ConsistencyManager::maybe_backup(const ChangeRecord& change) {
    if (config_.backup_dir.empty() || !backups_.should_create_automatic_backup(change)) {
        return;
    }
    auto backup = backups_.create_backup(BackupTrigger::Automatic);
    if (backup.is_err()) {
        qCWarning(quireConsistencyLog) << "ConsistencyManager: automatic backup before"
                                       << kind_name(change.kind) << "failed:"
                                       << backup.unwrap_err().message.c_str();
        return;
    }
    ++metrics_.backups_triggered;
}

void ConsistencyManager::finish(ConsistencyResult& result, std::chrono::steady_clock::time_point started) {
    result.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    metrics_.total_processing_ms += result.processing_time.count();
}

} // namespace quire::consistency
