#pragma once

#include "consistency/validators.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace quire::storage {
class EntityRepository;
}

namespace quire::consistency {

enum class HealthStatus {
    Healthy,
    Warning,
    Critical
};

[[nodiscard]] const char* health_name(HealthStatus status);

struct IntegrityCheckResult {
    std::vector<IntegrityIssue> issues;
    HealthStatus health{HealthStatus::Healthy};
    CheckDepth depth{CheckDepth::Full};
    std::vector<std::string> validators_run;
    std::chrono::milliseconds duration{0};
    Timestamp checked_at;

    [[nodiscard]] size_t count(IssueSeverity severity) const;
    [[nodiscard]] size_t critical_count() const { return count(IssueSeverity::Critical); }
    [[nodiscard]] bool has_critical() const { return critical_count() > 0; }
};

struct QuickCheckResult {
    bool healthy = true;
    size_t critical_count = 0;
    std::chrono::milliseconds duration{0};
};

struct HealthSummary {
    HealthStatus health{HealthStatus::Healthy};
    size_t critical = 0;
    size_t warnings = 0;
    size_t info = 0;
    std::optional<Timestamp> last_check;
    size_t checks_run = 0;
    size_t repairs_requested = 0;
    size_t repairs_failed = 0;
};

/**
 * Health from issue severities: any critical, else any warning, else healthy.
 */
[[nodiscard]] HealthStatus derive_health(const std::vector<IntegrityIssue>& issues);

/**
 * IntegrityMonitor - runs the validator battery and reports.
 *
 * It never writes to the store. Critical findings are handed to the
 * repair handler, which belongs to the backup service.
 */
class IntegrityMonitor {
public:
    using RepairHandler = std::function<Status(const IntegrityCheckResult&)>;

    struct Options {
        size_t max_tag_length = 50;
    };

    /**
     * Starts with the default battery: entity, relationship,
     * derived-data, cache and storage.
     */
    IntegrityMonitor(storage::EntityRepository& repo, Options options);

    void add_validator(std::unique_ptr<Validator> validator);

    void set_repair_handler(RepairHandler handler) { repair_handler_ = std::move(handler); }

    /**
     * Run validators without recording the result or requesting repair.
     * Used by the repair paths themselves.
     */
    [[nodiscard]] Res<IntegrityCheckResult> inspect(CheckDepth depth);

    /**
     * Every validator plus cross-validation. Requests repair on
     * critical findings.
     */
    [[nodiscard]] Res<IntegrityCheckResult> perform_comprehensive_check();

    /**
     * Critical validators, critical findings only.
     */
    [[nodiscard]] Res<QuickCheckResult> perform_quick_check();

    /**
     * Full validation reported for the given entities only.
     */
    [[nodiscard]] Res<IntegrityCheckResult> check_entities(const std::set<Uuid>& ids);

    /**
     * The timer entry point: a comprehensive check when none has run or
     * the last one was critical, otherwise a quick check that escalates
     * to a comprehensive one on a critical finding.
     */
    [[nodiscard]] Res<HealthStatus> run_scheduled_check();

    [[nodiscard]] const std::optional<IntegrityCheckResult>& last_result() const noexcept { return last_result_; }

    [[nodiscard]] HealthSummary health_summary() const;

private:
    void request_repair(const IntegrityCheckResult& result);

    storage::EntityRepository& repo_;
    Options options_;
    std::vector<std::unique_ptr<Validator>> validators_;
    RepairHandler repair_handler_;
    std::optional<IntegrityCheckResult> last_result_;
    bool repairing_ = false;
    size_t checks_run_ = 0;
    size_t repairs_requested_ = 0;
    size_t repairs_failed_ = 0;
};

} // namespace quire::consistency
