#include <catch2/catch_test_macros.hpp>
#include "consistency/transaction_manager.hpp"
#include "support/store_fixture.hpp"

#include <stdexcept>

using namespace quire;
using namespace quire::consistency;
using quire::testing::make_entity;
using quire::testing::make_link;

TEST_CASE("TransactionManager commits atomically", "[transaction]") {
    quire::testing::Store store;
    TransactionManager txns(store.repo, {});

    auto a = make_entity("A");
    auto b = make_entity("B");

    SECTION("Operations apply in order on commit") {
        auto txn = txns.begin();
        REQUIRE(txn->state() == TransactionState::Active);
        REQUIRE(txns.add_operation(txn, ops::insert(Record{a})).is_ok());
        REQUIRE(txns.add_operation(txn, ops::insert(Record{b})).is_ok());
        REQUIRE(txns.add_operation(txn, ops::insert(Record{make_link(a.id, b.id)})).is_ok());

        // Nothing is applied before commit
        REQUIRE(store.repo.count_entities().unwrap() == 0);

        REQUIRE(txns.commit(txn).is_ok());
        REQUIRE(txn->state() == TransactionState::Committed);
        REQUIRE(store.repo.count_entities().unwrap() == 2);
        REQUIRE(store.repo.links_of(a.id).unwrap().size() == 1);
        REQUIRE(txns.metrics().committed == 1);
    }

    SECTION("A failing operation reverses the ones before it") {
        REQUIRE(store.repo.insert_entity(a).is_ok());
        const auto before = store.repo.checksum().unwrap();

        auto renamed = a;
        renamed.title = "A renamed";
        auto result = txns.run({
            ops::insert(Record{b}),
            ops::update(Record{renamed}),
            ops::insert(Record{a}),  // duplicate id
        });

        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::AlreadyExists);
        REQUIRE(store.repo.checksum().unwrap() == before);
        REQUIRE(txns.metrics().failed == 1);
    }

    SECTION("Update and delete of missing records fail") {
        auto updated = txns.run({ops::update(Record{a})});
        REQUIRE(updated.unwrap_err().code == ErrorCode::NotFound);

        auto removed = txns.run({ops::remove(RecordRef{RecordKind::Entity, a.id})});
        REQUIRE(removed.unwrap_err().code == ErrorCode::NotFound);
    }

    SECTION("Batches nest and reverse as a unit") {
        auto result = txns.run({
            ops::batch({ops::insert(Record{a}), ops::insert(Record{b})}),
            ops::remove(RecordRef{RecordKind::Link, Uuid::generate()}),
        });
        REQUIRE(result.is_err());
        REQUIRE(store.repo.count_entities().unwrap() == 0);
    }
}

TEST_CASE("TransactionManager custom operations", "[transaction]") {
    quire::testing::Store store;
    TransactionManager txns(store.repo, {});
    auto a = make_entity("A");

    SECTION("A throwing step becomes an OperationFailed error and is reversed") {
        auto result = txns.run({
            ops::insert(Record{a}),
            ops::custom("explode",
                        [](storage::EntityRepository&) -> Status { throw std::runtime_error("boom"); },
                        [](storage::EntityRepository&) { return Status::ok(); }),
        });

        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::OperationFailed);
        REQUIRE(result.unwrap_err().message.find("boom") != std::string::npos);
        REQUIRE(store.repo.count_entities().unwrap() == 0);
    }

    SECTION("Applied custom steps are reverted through their revert step") {
        int applied = 0;
        int reverted = 0;
        auto result = txns.run({
            ops::custom("count",
                        [&](storage::EntityRepository&) { ++applied; return Status::ok(); },
                        [&](storage::EntityRepository&) { ++reverted; return Status::ok(); }),
            ops::custom("fail",
                        [](storage::EntityRepository&) {
                            return Status::err(Error{"step failed"});
                        },
                        [](storage::EntityRepository&) { return Status::ok(); }),
        });

        REQUIRE(result.is_err());
        REQUIRE(applied == 1);
        REQUIRE(reverted == 1);
    }

    SECTION("Read-only transactions refuse mutating operations") {
        auto txn = txns.begin(TransactionType::ReadOnly);
        auto added = txns.add_operation(txn, ops::insert(Record{a}));
        REQUIRE(added.is_err());
        REQUIRE(added.unwrap_err().code == ErrorCode::InvalidState);

        auto probe = ops::custom("probe",
                                 [](storage::EntityRepository& repo) {
                                     return repo.count_entities().is_ok() ? Status::ok()
                                                                          : Status::err(Error{"probe"});
                                 },
                                 [](storage::EntityRepository&) { return Status::ok(); },
                                 false);
        REQUIRE(txns.add_operation(txn, probe).is_ok());
        REQUIRE(txns.commit(txn).is_ok());
    }
}

TEST_CASE("TransactionManager concurrency ceiling", "[transaction]") {
    quire::testing::Store store;
    TransactionManager txns(store.repo, {.max_active = 10});

    std::vector<TransactionHandle> handles;
    for (int i = 0; i < 15; ++i) {
        handles.push_back(txns.begin());
    }

    for (size_t i = 0; i < 10; ++i) {
        REQUIRE(handles[i]->state() == TransactionState::Active);
    }
    for (size_t i = 10; i < 15; ++i) {
        REQUIRE(handles[i]->state() == TransactionState::Failed);
        REQUIRE(handles[i]->failure()->code == ErrorCode::CapacityExceeded);
        REQUIRE(handles[i]->failure()->is_transient());
    }
    REQUIRE(txns.active_count() == 10);
    REQUIRE(txns.metrics().rejected_at_capacity == 5);

    SECTION("Finishing a transaction frees a slot") {
        REQUIRE(txns.rollback(handles[0]).is_ok());
        REQUIRE(txns.begin()->state() == TransactionState::Active);
    }

    SECTION("Committing a failed transaction reports why it failed") {
        auto result = txns.commit(handles[12]);
        REQUIRE(result.unwrap_err().code == ErrorCode::CapacityExceeded);
    }
}

TEST_CASE("TransactionManager timeouts and cancellation", "[transaction]") {
    quire::testing::Store store;
    TransactionManager txns(store.repo, {});
    auto a = make_entity("A");

    SECTION("Commit after the deadline rolls back") {
        auto txn = txns.begin(TransactionType::ReadWrite, std::chrono::milliseconds(-1));
        REQUIRE(txns.add_operation(txn, ops::insert(Record{a})).is_ok());

        auto result = txns.commit(txn);
        REQUIRE(result.unwrap_err().code == ErrorCode::Timeout);
        REQUIRE(txn->state() == TransactionState::RolledBack);
        REQUIRE(store.repo.count_entities().unwrap() == 0);
        REQUIRE(txns.metrics().timed_out == 1);
    }

    SECTION("The sweep expires overdue transactions") {
        auto txn = txns.begin(TransactionType::ReadWrite, std::chrono::milliseconds(10));
        REQUIRE(txns.expire_overdue(txn->started_at()) == 0);
        REQUIRE(txns.expire_overdue(txn->deadline() + std::chrono::milliseconds(1)) == 1);
        REQUIRE(txn->state() == TransactionState::RolledBack);
        REQUIRE(txns.active_count() == 0);
    }

    SECTION("Cancellation mid-commit reverses applied operations") {
        auto b = make_entity("B");
        auto txn = txns.begin();
        Transaction* raw = txn.get();
        REQUIRE(txns.add_operation(txn, ops::insert(Record{a})).is_ok());
        REQUIRE(txns.add_operation(txn, ops::custom("cancel",
            [raw](storage::EntityRepository&) { raw->request_cancel(); return Status::ok(); },
            [](storage::EntityRepository&) { return Status::ok(); })).is_ok());
        REQUIRE(txns.add_operation(txn, ops::insert(Record{b})).is_ok());

        auto result = txns.commit(txn);
        REQUIRE(result.unwrap_err().code == ErrorCode::Cancelled);
        REQUIRE(txn->state() == TransactionState::Failed);
        REQUIRE(store.repo.count_entities().unwrap() == 0);
        REQUIRE(txns.metrics().cancelled == 1);
    }
}
