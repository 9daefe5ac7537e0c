#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace quire::storage {
class EntityRepository;
}

namespace quire::consistency {

struct Operation;

/**
 * Insert a record that must not exist yet.
 */
struct InsertOp {
    Record record;
};

/**
 * Overwrite a record that must exist.
 */
struct UpdateOp {
    Record record;
};

struct DeleteOp {
    RecordRef ref;
};

struct BatchOp {
    std::vector<Operation> operations;
};

/**
 * Caller-defined step. `revert` must undo exactly what `apply` did.
 */
struct CustomOp {
    using Step = std::function<Result<void, Error>(storage::EntityRepository&)>;

    std::string label;
    Step apply;
    Step revert;
    bool mutates{true};
};

struct Operation {
    std::variant<InsertOp, UpdateOp, DeleteOp, BatchOp, CustomOp> op;
};

namespace ops {

[[nodiscard]] inline Operation insert(Record record) {
    return Operation{InsertOp{std::move(record)}};
}

[[nodiscard]] inline Operation update(Record record) {
    return Operation{UpdateOp{std::move(record)}};
}

[[nodiscard]] inline Operation remove(RecordRef ref) {
    return Operation{DeleteOp{ref}};
}

[[nodiscard]] inline Operation batch(std::vector<Operation> operations) {
    return Operation{BatchOp{std::move(operations)}};
}

[[nodiscard]] inline Operation custom(std::string label, CustomOp::Step apply, CustomOp::Step revert,
                                      bool mutates = true) {
    return Operation{CustomOp{std::move(label), std::move(apply), std::move(revert), mutates}};
}

} // namespace ops

[[nodiscard]] bool is_mutating(const Operation& operation);

[[nodiscard]] std::string describe(const Operation& operation);

} // namespace quire::consistency
