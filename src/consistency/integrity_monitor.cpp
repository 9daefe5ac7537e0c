#include "consistency/integrity_monitor.hpp"
#include "core/logging.hpp"
#include "storage/entity_repository.hpp"

#include <algorithm>

namespace quire::consistency {

const char* health_name(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Warning: return "warning";
        case HealthStatus::Critical: return "critical";
    }
    return "unknown";
}

size_t IntegrityCheckResult::count(IssueSeverity severity) const {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(), [&](const auto& i) {
        return i.severity == severity;
    }));
}

HealthStatus derive_health(const std::vector<IntegrityIssue>& issues) {
    auto has = [&](IssueSeverity severity) {
        return std::any_of(issues.begin(), issues.end(), [&](const auto& i) { return i.severity == severity; });
    };
    if (has(IssueSeverity::Critical)) return HealthStatus::Critical;
    if (has(IssueSeverity::Warning)) return HealthStatus::Warning;
    return HealthStatus::Healthy;
}

IntegrityMonitor::IntegrityMonitor(storage::EntityRepository& repo, Options options)
    : repo_(repo), options_(options), validators_(default_validators()) {}

void IntegrityMonitor::add_validator(std::unique_ptr<Validator> validator) {
    validators_.push_back(std::move(validator));
}

Res<IntegrityCheckResult> IntegrityMonitor::inspect(CheckDepth depth) {
    const auto started = std::chrono::steady_clock::now();

    auto state = repo_.export_state();
    if (state.is_err()) {
        return Res<IntegrityCheckResult>::err(state.unwrap_err().with_context("Integrity check"));
    }

    IntegrityCheckResult result;
    result.depth = depth;
    result.checked_at = Timestamp::now();
    const ValidationContext ctx{repo_, state.unwrap(), result.checked_at, depth, options_.max_tag_length};

    for (const auto& validator : validators_) {
        if (depth == CheckDepth::Quick && !validator->is_critical()) continue;

        auto issues = validator->validate(ctx);
        if (issues.is_err()) {
            return Res<IntegrityCheckResult>::err(
                issues.unwrap_err().with_context("Validator " + validator->name()));
        }
        result.validators_run.push_back(validator->name());
        for (auto& i : issues.unwrap()) {
            if (depth == CheckDepth::Quick && i.severity != IssueSeverity::Critical) continue;
            result.issues.push_back(std::move(i));
        }
    }

    if (depth == CheckDepth::Full) {
        auto correlated = cross_validate(result.issues);
        result.issues.insert(result.issues.end(), correlated.begin(), correlated.end());
        result.validators_run.push_back("cross-validation");
    }

    result.health = derive_health(result.issues);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return Res<IntegrityCheckResult>::ok(std::move(result));
}

Res<IntegrityCheckResult> IntegrityMonitor::perform_comprehensive_check() {
    auto result = inspect(CheckDepth::Full);
    if (result.is_err()) return result;

    const auto& checked = result.unwrap();
    ++checks_run_;
    last_result_ = checked;

    for (const auto& i : checked.issues) {
        if (i.severity == IssueSeverity::Critical) {
            qCWarning(quireIntegrityLog) << "IntegrityMonitor:" << issue_category_name(i.category)
                                         << i.description.c_str();
        } else if (i.severity == IssueSeverity::Warning) {
            qCInfo(quireIntegrityLog) << "IntegrityMonitor:" << issue_category_name(i.category)
                                      << i.description.c_str();
        }
    }
    qCInfo(quireIntegrityLog) << "IntegrityMonitor: comprehensive check" << health_name(checked.health)
                              << "with" << checked.issues.size() << "issue(s) in"
                              << checked.duration.count() << "ms";

    if (checked.has_critical()) {
        request_repair(checked);
    }
    return result;
}

Res<QuickCheckResult> IntegrityMonitor::perform_quick_check() {
    auto result = inspect(CheckDepth::Quick);
    if (result.is_err()) {
        return Res<QuickCheckResult>::err(result.unwrap_err());
    }
    ++checks_run_;

    QuickCheckResult quick;
    quick.critical_count = result.unwrap().critical_count();
    quick.healthy = quick.critical_count == 0;
    quick.duration = result.unwrap().duration;
    qCDebug(quireIntegrityLog) << "IntegrityMonitor: quick check" << quick.critical_count << "critical";
    return Res<QuickCheckResult>::ok(quick);
}

Res<IntegrityCheckResult> IntegrityMonitor::check_entities(const std::set<Uuid>& ids) {
    auto result = inspect(CheckDepth::Full);
    if (result.is_err()) return result;

    auto& checked = result.unwrap();
    checked.issues.erase(std::remove_if(checked.issues.begin(), checked.issues.end(), [&](const auto& i) {
        return std::none_of(i.affected.begin(), i.affected.end(), [&](const Uuid& id) {
            return ids.count(id) > 0;
        });
    }), checked.issues.end());
    checked.health = derive_health(checked.issues);
    return result;
}

Res<HealthStatus> IntegrityMonitor::run_scheduled_check() {
    if (!last_result_ || last_result_->health == HealthStatus::Critical) {
        auto full = perform_comprehensive_check();
        if (full.is_err()) return Res<HealthStatus>::err(full.unwrap_err());
        return Res<HealthStatus>::ok(full.unwrap().health);
    }

    auto quick = perform_quick_check();
    if (quick.is_err()) return Res<HealthStatus>::err(quick.unwrap_err());
    if (quick.unwrap().healthy) {
        return Res<HealthStatus>::ok(last_result_->health);
    }

    auto full = perform_comprehensive_check();
    if (full.is_err()) return Res<HealthStatus>::err(full.unwrap_err());
    return Res<HealthStatus>::ok(full.unwrap().health);
}

void IntegrityMonitor::request_repair(const IntegrityCheckResult& result) {
    if (!repair_handler_) {
        qCCritical(quireIntegrityLog) << "IntegrityMonitor:" << result.critical_count()
                                      << "critical issue(s) and no repair handler";
        return;
    }
    if (repairing_) return;

    repairing_ = true;
    ++repairs_requested_;
    auto repaired = repair_handler_(result);
    repairing_ = false;

    if (repaired.is_err()) {
        ++repairs_failed_;
        qCCritical(quireIntegrityLog) << "IntegrityMonitor: repair failed:"
                                      << repaired.unwrap_err().message.c_str();
        return;
    }
    qCInfo(quireIntegrityLog) << "IntegrityMonitor: repair completed";
}

HealthSummary IntegrityMonitor::health_summary() const {
    HealthSummary summary;
    summary.checks_run = checks_run_;
    summary.repairs_requested = repairs_requested_;
    summary.repairs_failed = repairs_failed_;
    if (last_result_) {
        summary.health = last_result_->health;
        summary.critical = last_result_->count(IssueSeverity::Critical);
        summary.warnings = last_result_->count(IssueSeverity::Warning);
        summary.info = last_result_->count(IssueSeverity::Info);
        summary.last_check = last_result_->checked_at;
    }
    return summary;
}

} // namespace quire::consistency
