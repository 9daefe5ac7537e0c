#include "consistency/version_history.hpp"
#include "consistency/transaction_manager.hpp"
#include "core/file_io.hpp"
#include "core/logging.hpp"
#include "core/serialization.hpp"
#include "storage/entity_repository.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace quire::consistency {

namespace {

constexpr int kHistoryLogFormat = 1;

Error nothing_to(const char* action) {
    return Error::structural(std::string("Nothing to ") + action, ErrorCode::InvalidState);
}

QJsonObject entry_to_json(const HistoryEntry& entry) {
    QJsonArray affected;
    for (const auto& id : entry.affected) {
        affected.append(json::to_qstring(id.to_string()));
    }
    return QJsonObject{
        {"id", json::to_qstring(entry.id.to_string())},
        {"timestamp", static_cast<double>(entry.timestamp.millis())},
        {"kind", json::to_qstring(entry.change_kind)},
        {"description", json::to_qstring(entry.description)},
        {"affected", affected},
        {"checksum", json::to_qstring(entry.checksum)},
        {"snapshot", entry.is_snapshot},
        {"current", entry.is_current},
    };
}

Res<HistoryEntry> entry_from_json(const QJsonObject& obj) {
    auto id = Uuid::parse(json::to_std(obj.value("id").toString()));
    if (!id) {
        return Res<HistoryEntry>::err(Error::structural("History entry has no valid id", ErrorCode::Parse));
    }
    HistoryEntry entry;
    entry.id = *id;
    entry.timestamp = Timestamp(static_cast<int64_t>(obj.value("timestamp").toDouble()));
    entry.change_kind = json::to_std(obj.value("kind").toString());
    entry.description = json::to_std(obj.value("description").toString());
    for (const auto& value : obj.value("affected").toArray()) {
        if (auto affected = Uuid::parse(json::to_std(value.toString()))) {
            entry.affected.push_back(*affected);
        }
    }
    entry.checksum = json::to_std(obj.value("checksum").toString());
    entry.is_snapshot = obj.value("snapshot").toBool();
    entry.is_current = obj.value("current").toBool();
    return Res<HistoryEntry>::ok(std::move(entry));
}

} // anonymous namespace

VersionHistory::VersionHistory(storage::EntityRepository& repo, TransactionManager& txns, Options options)
    : repo_(repo), txns_(txns), options_(std::move(options)) {}

Res<Uuid> VersionHistory::initialize(Timestamp at) {
    auto state = repo_.export_state();
    if (state.is_err()) {
        return Res<Uuid>::err(state.unwrap_err().with_context("Cannot snapshot baseline"));
    }

    versions_.clear();
    total_bytes_ = 0;
    cursor_ = 0;
    sequence_ = 0;

    DataVersion baseline;
    baseline.id = Uuid::generate();
    baseline.timestamp = at;
    baseline.change_kind = "baseline";
    baseline.description = "Baseline";
    baseline.checksum = state_checksum(state.unwrap());
    baseline.payload = Snapshot{std::move(state).unwrap()};
    const auto id = baseline.id;
    push(std::move(baseline));
    persist_log_or_warn();

    qCInfo(quireHistoryLog) << "VersionHistory: baseline" << id.to_string().c_str();
    return Res<Uuid>::ok(id);
}

Res<Uuid> VersionHistory::record(std::string change_kind,
                                 std::string description,
                                 std::set<Uuid> affected,
                                 Delta delta,
                                 Timestamp at) {
    if (versions_.empty()) {
        return Res<Uuid>::err(Error::structural("Version history has no baseline", ErrorCode::InvalidState));
    }

    auto checksum = repo_.checksum();
    if (checksum.is_err()) {
        return Res<Uuid>::err(checksum.unwrap_err().with_context("Cannot checksum new version"));
    }

    DataVersion version;
    version.id = Uuid::generate();
    version.timestamp = at;
    version.change_kind = std::move(change_kind);
    version.description = std::move(description);
    version.affected = std::move(affected);
    version.checksum = std::move(checksum).unwrap();

    ++sequence_;
    if (options_.snapshot_interval > 0 && sequence_ % options_.snapshot_interval == 0) {
        auto state = repo_.export_state();
        if (state.is_err()) {
            return Res<Uuid>::err(state.unwrap_err().with_context("Cannot snapshot version"));
        }
        version.payload = Snapshot{std::move(state).unwrap()};
    } else {
        version.payload = std::move(delta);
    }

    // A new edit abandons the redo branch
    while (versions_.size() > cursor_ + 1) {
        total_bytes_ -= versions_.back().bytes;
        versions_.pop_back();
    }

    const auto id = version.id;
    push(std::move(version));
    cursor_ = versions_.size() - 1;
    ++metrics_.recorded;

    enforce_limits();
    persist_log_or_warn();
    return Res<Uuid>::ok(id);
}

Status VersionHistory::undo(std::optional<Uuid> from_version) {
    if (!can_undo()) {
        return Status::err(nothing_to("undo"));
    }
    if (from_version && *from_version != versions_[cursor_].version.id) {
        return Status::err(Error::structural("Undo requested from " + from_version->to_string() +
                                             " but the current version is " +
                                             versions_[cursor_].version.id.to_string(),
                                             ErrorCode::InvalidState));
    }

    const auto& current = versions_[cursor_].version;
    std::vector<Operation> plan;
    if (auto* delta = std::get_if<Delta>(&current.payload)) {
        plan = plan_reverse(*delta);
    } else {
        auto target = materialize(cursor_ - 1);
        auto live = repo_.export_state();
        if (target.is_err()) return Status::err(target.unwrap_err());
        if (live.is_err()) return Status::err(live.unwrap_err());
        plan = plan_replace(live.unwrap(), target.unwrap());
    }

    auto result = navigate(cursor_ - 1, std::move(plan), "undo");
    if (result.is_ok()) ++metrics_.undone;
    return result;
}

Status VersionHistory::redo() {
    if (!can_redo()) {
        return Status::err(nothing_to("redo"));
    }

    const auto& next = versions_[cursor_ + 1].version;
    std::vector<Operation> plan;
    if (auto* delta = std::get_if<Delta>(&next.payload)) {
        plan = plan_forward(*delta);
    } else {
        auto live = repo_.export_state();
        if (live.is_err()) return Status::err(live.unwrap_err());
        plan = plan_replace(live.unwrap(), std::get<Snapshot>(next.payload).state);
    }

    auto result = navigate(cursor_ + 1, std::move(plan), "redo");
    if (result.is_ok()) ++metrics_.redone;
    return result;
}

Status VersionHistory::jump_to_version(const Uuid& version_id) {
    auto index = index_of(version_id);
    if (!index) {
        return Status::err(Error::structural("Unknown version " + version_id.to_string(),
                                             ErrorCode::NotFound));
    }
    if (*index == cursor_) {
        return Status::ok();
    }

    auto target = materialize(*index);
    auto live = repo_.export_state();
    if (target.is_err()) return Status::err(target.unwrap_err());
    if (live.is_err()) return Status::err(live.unwrap_err());

    auto result = navigate(*index, plan_replace(live.unwrap(), target.unwrap()), "jump");
    if (result.is_ok()) ++metrics_.jumps;
    return result;
}

Status VersionHistory::navigate(size_t target, std::vector<Operation> plan, const char* action) {
    const size_t previous = cursor_;
    const std::string expected = versions_[target].version.checksum;

    plan.push_back(ops::custom(
        "verify checksum",
        [expected](storage::EntityRepository& repo) -> Status {
            auto actual = repo.checksum();
            if (actual.is_err()) return Status::err(actual.unwrap_err());
            if (actual.unwrap() != expected) {
                return Status::err(Error::structural("Store checksum " + actual.unwrap() +
                                                     " does not match version checksum " + expected,
                                                     ErrorCode::ChecksumMismatch));
            }
            return Status::ok();
        },
        [](storage::EntityRepository&) { return Status::ok(); },
        false));

    cursor_ = target;
    auto result = txns_.run(std::move(plan));
    if (result.is_err()) {
        cursor_ = previous;
        ++metrics_.failed_navigations;
        qCWarning(quireHistoryLog) << "VersionHistory:" << action << "failed:"
                                   << result.unwrap_err().message.c_str();
        return result;
    }

    qCDebug(quireHistoryLog) << "VersionHistory:" << action << "to"
                             << versions_[cursor_].version.id.to_string().c_str();
    persist_log_or_warn();
    return Status::ok();
}

std::optional<Uuid> VersionHistory::current_version_id() const {
    if (versions_.empty()) return std::nullopt;
    return versions_[cursor_].version.id;
}

const DataVersion* VersionHistory::find(const Uuid& version_id) const {
    auto index = index_of(version_id);
    return index ? &versions_[*index].version : nullptr;
}

std::optional<size_t> VersionHistory::index_of(const Uuid& version_id) const {
    for (size_t i = 0; i < versions_.size(); ++i) {
        if (versions_[i].version.id == version_id) return i;
    }
    return std::nullopt;
}

std::vector<HistoryEntry> VersionHistory::get_history(size_t limit) const {
    std::vector<HistoryEntry> out;
    for (size_t i = versions_.size(); i > 0 && out.size() < limit; --i) {
        out.push_back(entry_for(i - 1));
    }
    return out;
}

HistoryEntry VersionHistory::entry_for(size_t index) const {
    const auto& version = versions_[index].version;
    HistoryEntry entry;
    entry.id = version.id;
    entry.timestamp = version.timestamp;
    entry.change_kind = version.change_kind;
    entry.description = version.description;
    entry.affected.assign(version.affected.begin(), version.affected.end());
    entry.checksum = version.checksum;
    entry.is_snapshot = version.is_snapshot();
    entry.is_current = index == cursor_;
    return entry;
}

Res<StoreState> VersionHistory::materialize(size_t index) const {
    if (index >= versions_.size()) {
        return Res<StoreState>::err(Error::structural("Version index out of range", ErrorCode::NotFound));
    }

    size_t base = index;
    while (!versions_[base].version.is_snapshot()) {
        if (base == 0) {
            return Res<StoreState>::err(Error::fatal("Version history has no snapshot to replay from"));
        }
        --base;
    }

    StoreState state = std::get<Snapshot>(versions_[base].version.payload).state;
    for (size_t i = base + 1; i <= index; ++i) {
        apply_forward(std::get<Delta>(versions_[i].version.payload), state);
    }
    return Res<StoreState>::ok(std::move(state));
}

Res<StoreState> VersionHistory::state_at(const Uuid& version_id) const {
    auto index = index_of(version_id);
    if (!index) {
        return Res<StoreState>::err(Error::structural("Unknown version " + version_id.to_string(),
                                                      ErrorCode::NotFound));
    }
    return materialize(*index);
}

size_t VersionHistory::clear_history_before(Timestamp cutoff) {
    size_t dropped = 0;
    while (cursor_ > 0 && versions_.front().version.timestamp < cutoff) {
        if (!evict_oldest()) break;
        ++dropped;
    }
    if (dropped > 0) {
        qCInfo(quireHistoryLog) << "VersionHistory: cleared" << dropped << "versions";
        persist_log_or_warn();
    }
    return dropped;
}

void VersionHistory::push(DataVersion version) {
    Slot slot{std::move(version), 0};
    slot.bytes = payload_bytes(slot.version);
    total_bytes_ += slot.bytes;
    versions_.push_back(std::move(slot));
}

void VersionHistory::enforce_limits() {
    while (versions_.size() > options_.max_versions && versions_.size() > 1) {
        if (!evict_oldest()) return;
    }

    if (total_bytes_ <= options_.max_bytes) return;

    compact_deltas();
    // Byte pressure never costs the last undo step, and an eviction that
    // would not shrink the history is skipped.
    while (total_bytes_ > options_.max_bytes && cursor_ > 1) {
        if (!evict_oldest(true)) break;
    }
    if (total_bytes_ > options_.max_bytes) {
        qCWarning(quireHistoryLog) << "VersionHistory:" << total_bytes_
                                   << "bytes retained over the ceiling of" << options_.max_bytes;
    }
}

bool VersionHistory::evict_oldest(bool require_gain) {
    if (versions_.size() < 2 || cursor_ == 0) return false;

    // The next version becomes the new base, so it must carry a full state.
    auto& next = versions_[1];
    if (!next.version.is_snapshot()) {
        auto state = materialize(1);
        if (state.is_err()) {
            qCCritical(quireHistoryLog) << "VersionHistory: cannot rebase during eviction:"
                                        << state.unwrap_err().message.c_str();
            return false;
        }
        DataVersion rebased = next.version;
        rebased.payload = Snapshot{std::move(state).unwrap()};
        const size_t rebased_bytes = payload_bytes(rebased);
        if (require_gain && rebased_bytes >= next.bytes + versions_.front().bytes) {
            return false;
        }
        next.version = std::move(rebased);
        total_bytes_ -= next.bytes;
        next.bytes = rebased_bytes;
        total_bytes_ += next.bytes;
    }

    total_bytes_ -= versions_.front().bytes;
    versions_.pop_front();
    --cursor_;
    ++metrics_.evicted;
    return true;
}

void VersionHistory::compact_deltas() {
    for (auto& slot : versions_) {
        auto* delta = std::get_if<Delta>(&slot.version.payload);
        if (!delta) continue;

        Delta reduced = compact(*delta);
        if (reduced.operations.size() == delta->operations.size()) continue;

        *delta = std::move(reduced);
        total_bytes_ -= slot.bytes;
        slot.bytes = payload_bytes(slot.version);
        total_bytes_ += slot.bytes;
        ++metrics_.compacted;
    }
}

Status VersionHistory::persist_log() const {
    if (options_.log_path.empty()) {
        return Status::ok();
    }

    QJsonArray entries;
    for (size_t i = 0; i < versions_.size(); ++i) {
        entries.append(entry_to_json(entry_for(i)));
    }
    QJsonObject root{
        {"format", kHistoryLogFormat},
        {"replayable", false},
        {"versions", entries},
    };
    return write_file_atomic(options_.log_path, QJsonDocument(root).toJson(QJsonDocument::Indented));
}

void VersionHistory::persist_log_or_warn() const {
    auto result = persist_log();
    if (result.is_err()) {
        qCWarning(quireHistoryLog) << "VersionHistory: cannot write history log:"
                                   << result.unwrap_err().message.c_str();
    }
}

Res<std::vector<HistoryEntry>> VersionHistory::load_history_log(const std::string& path) {
    auto bytes = read_file_bytes(path);
    if (bytes.is_err()) {
        return Res<std::vector<HistoryEntry>>::err(bytes.unwrap_err());
    }
    auto root = json::parse_object(bytes.unwrap());
    if (root.is_err()) {
        return Res<std::vector<HistoryEntry>>::err(root.unwrap_err().with_context("History log " + path));
    }
    if (root.unwrap().value("format").toInt() != kHistoryLogFormat) {
        return Res<std::vector<HistoryEntry>>::err(
            Error::structural("Unsupported history log format in " + path, ErrorCode::Parse));
    }

    std::vector<HistoryEntry> entries;
    for (const auto& value : root.unwrap().value("versions").toArray()) {
        auto entry = entry_from_json(value.toObject());
        if (entry.is_err()) {
            return Res<std::vector<HistoryEntry>>::err(entry.unwrap_err());
        }
        entries.push_back(std::move(entry).unwrap());
    }
    return Res<std::vector<HistoryEntry>>::ok(std::move(entries));
}

} // namespace quire::consistency
