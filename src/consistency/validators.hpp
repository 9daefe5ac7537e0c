#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace quire::storage {
class EntityRepository;
}

namespace quire::consistency {

enum class IssueSeverity {
    Info,
    Warning,
    Critical
};

enum class IssueCategory {
    OrphanedData,
    MissingReference,
    DuplicateEntry,
    InvalidRelationship,
    SchemaViolation,
    DataCorruption,
    DerivedInconsistency,
    CacheInconsistency,
    CrossValidation
};

[[nodiscard]] const char* issue_severity_name(IssueSeverity severity);
[[nodiscard]] const char* issue_category_name(IssueCategory category);

/**
 * IntegrityIssue - one inconsistency found in the persisted store.
 */
struct IntegrityIssue {
    IssueSeverity severity{IssueSeverity::Info};
    IssueCategory category{IssueCategory::DataCorruption};
    std::string description;
    std::set<Uuid> affected;
    std::string validator;
};

enum class CheckDepth {
    // Critical findings of critical validators only
    Quick,
    Full
};

/**
 * Everything a validator may look at. `state` is exported once per check.
 */
struct ValidationContext {
    storage::EntityRepository& repo;
    const StoreState& state;
    Timestamp now;
    CheckDepth depth;
    size_t max_tag_length;
};

/**
 * Validator - one member of the integrity battery. Validators only read.
 */
class Validator {
public:
    virtual ~Validator() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * Critical validators run during quick checks.
     */
    [[nodiscard]] virtual bool is_critical() const = 0;

    [[nodiscard]] virtual Res<std::vector<IntegrityIssue>> validate(const ValidationContext& ctx) const = 0;
};

class EntityValidator : public Validator {
public:
    [[nodiscard]] std::string name() const override { return "entity"; }
    [[nodiscard]] bool is_critical() const override { return true; }
    [[nodiscard]] Res<std::vector<IntegrityIssue>> validate(const ValidationContext& ctx) const override;
};

class RelationshipValidator : public Validator {
public:
    [[nodiscard]] std::string name() const override { return "relationship"; }
    [[nodiscard]] bool is_critical() const override { return false; }
    [[nodiscard]] Res<std::vector<IntegrityIssue>> validate(const ValidationContext& ctx) const override;
};

class DerivedDataValidator : public Validator {
public:
    [[nodiscard]] std::string name() const override { return "derived-data"; }
    [[nodiscard]] bool is_critical() const override { return false; }
    [[nodiscard]] Res<std::vector<IntegrityIssue>> validate(const ValidationContext& ctx) const override;
};

/**
 * Compares the full-text search cache against entity content.
 */
class CacheValidator : public Validator {
public:
    [[nodiscard]] std::string name() const override { return "cache"; }
    [[nodiscard]] bool is_critical() const override { return false; }
    [[nodiscard]] Res<std::vector<IntegrityIssue>> validate(const ValidationContext& ctx) const override;
};

/**
 * SQLite page integrity and schema version.
 */
class StorageValidator : public Validator {
public:
    [[nodiscard]] std::string name() const override { return "storage"; }
    [[nodiscard]] bool is_critical() const override { return true; }
    [[nodiscard]] Res<std::vector<IntegrityIssue>> validate(const ValidationContext& ctx) const override;
};

[[nodiscard]] std::vector<std::unique_ptr<Validator>> default_validators();

/**
 * One warning per entity reported by two or more distinct validators.
 * Info issues are not correlated.
 */
[[nodiscard]] std::vector<IntegrityIssue> cross_validate(const std::vector<IntegrityIssue>& issues);

} // namespace quire::consistency
