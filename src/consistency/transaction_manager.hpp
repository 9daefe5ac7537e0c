#pragma once

#include "consistency/operation.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace quire::storage {
class EntityRepository;
}

namespace quire::consistency {

enum class TransactionType {
    ReadOnly,
    ReadWrite,
    WriteOnly
};

enum class TransactionState {
    Active,
    Committing,
    Committed,
    RollingBack,
    RolledBack,
    Failed
};

[[nodiscard]] const char* state_name(TransactionState state);

class TransactionManager;

/**
 * Transaction - an ordered list of operations applied atomically.
 *
 * Operations are only recorded until commit; nothing touches the store
 * before that. Owned by its creator through a TransactionHandle.
 */
class Transaction {
public:
    Transaction(TransactionType type, Timestamp started_at, std::chrono::milliseconds timeout);

    [[nodiscard]] const Uuid& id() const noexcept { return id_; }
    [[nodiscard]] TransactionType type() const noexcept { return type_; }
    [[nodiscard]] TransactionState state() const noexcept { return state_; }
    [[nodiscard]] Timestamp started_at() const noexcept { return started_at_; }
    [[nodiscard]] Timestamp deadline() const noexcept { return deadline_; }
    [[nodiscard]] const std::vector<Operation>& operations() const noexcept { return operations_; }

    /**
     * Why the transaction ended up failed or rolled back, if it did.
     */
    [[nodiscard]] const std::optional<Error>& failure() const noexcept { return failure_; }

    [[nodiscard]] bool is_finished() const noexcept;

    /**
     * Ask an in-flight commit to stop. Safe from any thread; the commit
     * notices before its next operation and reverses what it applied.
     */
    void request_cancel() noexcept { cancel_requested_.store(true); }

    [[nodiscard]] bool cancel_requested() const noexcept { return cancel_requested_.load(); }

private:
    friend class TransactionManager;

    Uuid id_;
    TransactionType type_;
    TransactionState state_{TransactionState::Active};
    Timestamp started_at_;
    Timestamp deadline_;
    std::vector<Operation> operations_;
    std::optional<Error> failure_;
    std::atomic<bool> cancel_requested_{false};
};

using TransactionHandle = std::shared_ptr<Transaction>;

struct TransactionMetrics {
    size_t begun = 0;
    size_t committed = 0;
    size_t rolled_back = 0;
    size_t failed = 0;
    size_t timed_out = 0;
    size_t cancelled = 0;
    size_t rejected_at_capacity = 0;
    size_t peak_active = 0;
    int64_t total_commit_ms = 0;

    [[nodiscard]] double average_commit_ms() const {
        return committed == 0 ? 0.0 : static_cast<double>(total_commit_ms) / static_cast<double>(committed);
    }
};

/**
 * TransactionManager - begins, commits and rolls back transactions
 * against the entity repository.
 *
 * A commit executes operations in order inside one SQLite transaction.
 * Each executed operation records its inverse; on failure the inverses
 * run in reverse order and the SQLite transaction is rolled back, so no
 * partial state survives.
 */
class TransactionManager {
public:
    struct Options {
        size_t max_active = 10;
        std::chrono::milliseconds default_timeout{std::chrono::seconds(30)};
    };

    TransactionManager(storage::EntityRepository& repo, Options options);

    /**
     * Begin a transaction. Above the concurrency ceiling this returns a
     * transaction already in the Failed state.
     */
    [[nodiscard]] TransactionHandle begin(
        TransactionType type = TransactionType::ReadWrite,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    [[nodiscard]] Result<void, Error> add_operation(const TransactionHandle& txn, Operation operation);

    [[nodiscard]] Result<void, Error> commit(const TransactionHandle& txn);

    [[nodiscard]] Result<void, Error> rollback(const TransactionHandle& txn);

    /**
     * Begin, add every operation, and commit.
     */
    [[nodiscard]] Result<void, Error> run(std::vector<Operation> operations,
                                          TransactionType type = TransactionType::ReadWrite);

    /**
     * Roll back every active transaction whose deadline has passed.
     * Returns how many were expired.
     */
    size_t expire_overdue(Timestamp now = Timestamp::now());

    [[nodiscard]] size_t active_count();

    [[nodiscard]] const TransactionMetrics& metrics() const noexcept { return metrics_; }

private:
    using UndoLog = std::vector<Operation>;

    [[nodiscard]] Result<void, Error> execute(const Operation& operation, UndoLog& undo);
    [[nodiscard]] Result<void, Error> execute_guarded(const Operation& operation, UndoLog& undo);
    [[nodiscard]] Result<void, Error> reverse(UndoLog& undo);
    void finish_failed(Transaction& txn, Error error, TransactionState final_state);
    void prune();

    storage::EntityRepository& repo_;
    Options options_;
    std::vector<std::weak_ptr<Transaction>> active_;
    TransactionMetrics metrics_;
    size_t savepoint_depth_ = 0;
};

} // namespace quire::consistency
