#include "consistency/operation.hpp"

#include <type_traits>

namespace quire::consistency {

bool is_mutating(const Operation& operation) {
    if (auto* custom = std::get_if<CustomOp>(&operation.op)) {
        return custom->mutates;
    }
    if (auto* batch = std::get_if<BatchOp>(&operation.op)) {
        for (const auto& child : batch->operations) {
            if (is_mutating(child)) return true;
        }
        return false;
    }
    return true;
}

std::string describe(const Operation& operation) {
    return std::visit([](const auto& op) -> std::string {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, InsertOp>) {
            auto ref = record_ref(op.record);
            return std::string("insert ") + record_kind_name(ref.kind) + " " + ref.id.to_string();
        } else if constexpr (std::is_same_v<T, UpdateOp>) {
            auto ref = record_ref(op.record);
            return std::string("update ") + record_kind_name(ref.kind) + " " + ref.id.to_string();
        } else if constexpr (std::is_same_v<T, DeleteOp>) {
            return std::string("delete ") + record_kind_name(op.ref.kind) + " " + op.ref.id.to_string();
        } else if constexpr (std::is_same_v<T, BatchOp>) {
            return "batch of " + std::to_string(op.operations.size());
        } else {
            return "custom " + op.label;
        }
    }, operation.op);
}

} // namespace quire::consistency
