#include "consistency/transaction_manager.hpp"
#include "core/logging.hpp"
#include "storage/entity_repository.hpp"

#include <algorithm>
#include <exception>
#include <type_traits>

namespace quire::consistency {

namespace {

Error invalid_state(const Transaction& txn, const char* action) {
    return Error::structural(std::string("Cannot ") + action + " transaction " +
                             txn.id().to_string() + " in state " + state_name(txn.state()),
                             ErrorCode::InvalidState);
}

} // anonymous namespace

const char* state_name(TransactionState state) {
    switch (state) {
        case TransactionState::Active: return "active";
        case TransactionState::Committing: return "committing";
        case TransactionState::Committed: return "committed";
        case TransactionState::RollingBack: return "rolling-back";
        case TransactionState::RolledBack: return "rolled-back";
        case TransactionState::Failed: return "failed";
    }
    return "unknown";
}

Transaction::Transaction(TransactionType type, Timestamp started_at, std::chrono::milliseconds timeout)
    : id_(Uuid::generate())
    , type_(type)
    , started_at_(started_at)
    , deadline_(started_at + timeout) {}

bool Transaction::is_finished() const noexcept {
    return state_ == TransactionState::Committed ||
           state_ == TransactionState::RolledBack ||
           state_ == TransactionState::Failed;
}

TransactionManager::TransactionManager(storage::EntityRepository& repo, Options options)
    : repo_(repo), options_(options) {}

void TransactionManager::prune() {
    active_.erase(std::remove_if(active_.begin(), active_.end(), [](const auto& weak) {
        auto txn = weak.lock();
        return !txn || txn->is_finished();
    }), active_.end());
}

size_t TransactionManager::active_count() {
    prune();
    return active_.size();
}

TransactionHandle TransactionManager::begin(
    TransactionType type,
    std::optional<std::chrono::milliseconds> timeout
) {
    auto txn = std::make_shared<Transaction>(type, Timestamp::now(),
                                             timeout.value_or(options_.default_timeout));
    ++metrics_.begun;

    if (active_count() >= options_.max_active) {
        txn->state_ = TransactionState::Failed;
        txn->failure_ = Error::transient(
            "Too many active transactions (limit " + std::to_string(options_.max_active) + ")",
            ErrorCode::CapacityExceeded);
        ++metrics_.rejected_at_capacity;
        ++metrics_.failed;
        qCWarning(quireTxnLog) << "TransactionManager: begin rejected, ceiling reached";
        return txn;
    }

    active_.push_back(txn);
    metrics_.peak_active = std::max(metrics_.peak_active, active_.size());
    qCDebug(quireTxnLog) << "TransactionManager: began" << txn->id().to_string().c_str();
    return txn;
}

Result<void, Error> TransactionManager::add_operation(const TransactionHandle& txn, Operation operation) {
    if (txn->state() != TransactionState::Active) {
        return Result<void, Error>::err(invalid_state(*txn, "add to"));
    }
    if (txn->type() == TransactionType::ReadOnly && is_mutating(operation)) {
        return Result<void, Error>::err(Error::structural(
            "Read-only transaction rejects " + describe(operation), ErrorCode::InvalidState));
    }
    txn->operations_.push_back(std::move(operation));
    return Result<void, Error>::ok();
}

// ============================================================================
// Execution
// ============================================================================

Result<void, Error> TransactionManager::execute(const Operation& operation, UndoLog& undo) {
    return std::visit([&](const auto& op) -> Result<void, Error> {
        using T = std::decay_t<decltype(op)>;

        if constexpr (std::is_same_v<T, InsertOp>) {
            auto result = repo_.insert(op.record);
            if (result.is_err()) return result;
            undo.push_back(ops::remove(record_ref(op.record)));
            return result;

        } else if constexpr (std::is_same_v<T, UpdateOp>) {
            auto before = repo_.get(record_ref(op.record));
            if (before.is_err()) return Result<void, Error>::err(before.unwrap_err());
            if (!before.unwrap()) {
                return Result<void, Error>::err(Error::structural(
                    "Cannot update missing " + describe(operation), ErrorCode::NotFound));
            }
            auto result = repo_.update(op.record);
            if (result.is_err()) return result;
            undo.push_back(ops::update(std::move(*before.unwrap())));
            return result;

        } else if constexpr (std::is_same_v<T, DeleteOp>) {
            auto before = repo_.get(op.ref);
            if (before.is_err()) return Result<void, Error>::err(before.unwrap_err());
            if (!before.unwrap()) {
                return Result<void, Error>::err(Error::structural(
                    "Cannot delete missing " + describe(operation), ErrorCode::NotFound));
            }
            auto result = repo_.remove(op.ref);
            if (result.is_err()) return result;
            undo.push_back(ops::insert(std::move(*before.unwrap())));
            return result;

        } else if constexpr (std::is_same_v<T, BatchOp>) {
            for (const auto& child : op.operations) {
                auto result = execute(child, undo);
                if (result.is_err()) return result;
            }
            return Result<void, Error>::ok();

        } else {
            if (!op.apply) {
                return Result<void, Error>::err(Error::structural(
                    "Custom operation '" + op.label + "' has no apply step", ErrorCode::InvalidState));
            }
            auto result = op.apply(repo_);
            if (result.is_err()) return result;
            undo.push_back(ops::custom(op.label + " (revert)", op.revert, op.apply, op.mutates));
            return result;
        }
    }, operation.op);
}

Result<void, Error> TransactionManager::execute_guarded(const Operation& operation, UndoLog& undo) {
    try {
        return execute(operation, undo);
    } catch (const std::exception& ex) {
        return Result<void, Error>::err(Error::structural(
            describe(operation) + " threw: " + ex.what(), ErrorCode::OperationFailed));
    }
}

Result<void, Error> TransactionManager::reverse(UndoLog& undo) {
    std::optional<Error> first_error;
    for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
        UndoLog ignored;
        auto result = execute_guarded(*it, ignored);
        if (result.is_err() && !first_error) {
            first_error = result.unwrap_err();
        }
    }
    undo.clear();
    if (first_error) {
        return Result<void, Error>::err(*first_error);
    }
    return Result<void, Error>::ok();
}

void TransactionManager::finish_failed(Transaction& txn, Error error, TransactionState final_state) {
    txn.state_ = final_state;
    txn.failure_ = std::move(error);
    if (final_state == TransactionState::Failed) {
        ++metrics_.failed;
    } else {
        ++metrics_.rolled_back;
    }
    if (txn.failure_->code == ErrorCode::Timeout) ++metrics_.timed_out;
    if (txn.failure_->code == ErrorCode::Cancelled && final_state == TransactionState::Failed) {
        ++metrics_.cancelled;
    }
}

// ============================================================================
// Commit / rollback
// ============================================================================

Result<void, Error> TransactionManager::commit(const TransactionHandle& txn) {
    if (txn->state() != TransactionState::Active) {
        if (txn->failure()) {
            return Result<void, Error>::err(*txn->failure());
        }
        return Result<void, Error>::err(invalid_state(*txn, "commit"));
    }

    const auto started = Timestamp::now();
    if (started > txn->deadline()) {
        auto error = Error::transient("Transaction " + txn->id().to_string() + " timed out",
                                      ErrorCode::Timeout);
        finish_failed(*txn, error, TransactionState::RolledBack);
        qCWarning(quireTxnLog) << "TransactionManager: commit after deadline, rolled back";
        return Result<void, Error>::err(error);
    }

    txn->state_ = TransactionState::Committing;
    auto& db = repo_.database();

    // A transaction committed while another SQL transaction is open (for
    // example from inside a custom step) nests as a savepoint.
    const bool nested = db.in_transaction();
    const std::string savepoint = "quire_txn_" + std::to_string(savepoint_depth_);
    auto opened = nested ? db.execute("SAVEPOINT " + savepoint + ";") : db.begin_transaction();
    if (opened.is_err()) {
        finish_failed(*txn, opened.unwrap_err(), TransactionState::Failed);
        return Result<void, Error>::err(opened.unwrap_err());
    }
    if (nested) ++savepoint_depth_;

    UndoLog undo;
    std::optional<Error> failure;
    size_t index = 0;
    for (const auto& operation : txn->operations()) {
        if (txn->cancel_requested()) {
            failure = Error::transient("Transaction cancelled before operation " +
                                       std::to_string(index), ErrorCode::Cancelled);
            break;
        }
        auto result = execute_guarded(operation, undo);
        if (result.is_err()) {
            failure = result.unwrap_err().with_context("Operation " + std::to_string(index));
            break;
        }
        ++index;
    }

    if (!failure) {
        auto closed = nested ? db.execute("RELEASE " + savepoint + ";") : db.commit();
        if (closed.is_ok()) {
            if (nested) --savepoint_depth_;
            txn->state_ = TransactionState::Committed;
            ++metrics_.committed;
            metrics_.total_commit_ms += (Timestamp::now() - started).count();
            prune();
            qCDebug(quireTxnLog) << "TransactionManager: committed" << txn->id().to_string().c_str()
                                 << "ops" << txn->operations().size();
            return Result<void, Error>::ok();
        }
        failure = closed.unwrap_err().with_context("Commit");
    }

    // Reverse in memory first; if SQLite already aborted the transaction
    // there is nothing left to reverse.
    txn->state_ = TransactionState::RollingBack;
    std::optional<Error> reversal_error;
    if (db.in_transaction()) {
        auto reversed = reverse(undo);
        if (reversed.is_err()) reversal_error = reversed.unwrap_err();
        auto rolled = nested
            ? db.execute("ROLLBACK TO " + savepoint + "; RELEASE " + savepoint + ";")
            : db.rollback();
        if (rolled.is_err() && !reversal_error) reversal_error = rolled.unwrap_err();
    }
    if (nested) --savepoint_depth_;

    auto error = *failure;
    if (reversal_error) {
        error = Error::fatal(failure->message + "; reversal failed: " + reversal_error->message);
        qCCritical(quireTxnLog) << "TransactionManager: reversal failed for"
                                << txn->id().to_string().c_str() << error.message.c_str();
    } else {
        qCWarning(quireTxnLog) << "TransactionManager: commit failed, reversed"
                               << txn->id().to_string().c_str() << failure->message.c_str();
    }
    finish_failed(*txn, error, TransactionState::Failed);
    prune();
    return Result<void, Error>::err(error);
}

Result<void, Error> TransactionManager::rollback(const TransactionHandle& txn) {
    if (txn->state() != TransactionState::Active) {
        return Result<void, Error>::err(invalid_state(*txn, "roll back"));
    }
    // Nothing has been applied before commit, so there is nothing to reverse.
    txn->state_ = TransactionState::RollingBack;
    finish_failed(*txn, Error::structural("Rolled back by caller", ErrorCode::Cancelled),
                  TransactionState::RolledBack);
    prune();
    qCDebug(quireTxnLog) << "TransactionManager: rolled back" << txn->id().to_string().c_str();
    return Result<void, Error>::ok();
}

Result<void, Error> TransactionManager::run(std::vector<Operation> operations, TransactionType type) {
    auto txn = begin(type);
    if (txn->state() == TransactionState::Failed) {
        return Result<void, Error>::err(*txn->failure());
    }
    for (auto& operation : operations) {
        auto added = add_operation(txn, std::move(operation));
        if (added.is_err()) {
            auto rolled = rollback(txn);
            if (rolled.is_err()) {
                return Result<void, Error>::err(added.unwrap_err().with_context(rolled.unwrap_err().message));
            }
            return added;
        }
    }
    return commit(txn);
}

size_t TransactionManager::expire_overdue(Timestamp now) {
    size_t expired = 0;
    for (const auto& weak : active_) {
        auto txn = weak.lock();
        if (!txn || txn->state() != TransactionState::Active) continue;
        if (now <= txn->deadline()) continue;

        txn->state_ = TransactionState::RollingBack;
        finish_failed(*txn, Error::transient("Transaction " + txn->id().to_string() + " timed out",
                                             ErrorCode::Timeout),
                      TransactionState::RolledBack);
        ++expired;
        qCWarning(quireTxnLog) << "TransactionManager: expired" << txn->id().to_string().c_str();
    }
    prune();
    return expired;
}

} // namespace quire::consistency
