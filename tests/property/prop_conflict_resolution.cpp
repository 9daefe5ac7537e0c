#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "consistency/conflict_resolver.hpp"
#include "support/store_fixture.hpp"

#include <algorithm>

using namespace quire;
using namespace quire::consistency;
using quire::testing::at_seconds;

namespace {

ChangeRecord edit(const Uuid& id, Origin origin, int second) {
    EntityPatch patch;
    patch.title = "t" + std::to_string(second);
    return make_change(changes::EntityModified{id, patch}, origin, at_seconds(second));
}

DataConflict conflict_between(ConflictType type, std::vector<ChangeRecord> changes) {
    DataConflict conflict;
    conflict.id = Uuid::generate();
    conflict.type = type;
    conflict.changes = std::move(changes);
    return conflict;
}

} // anonymous namespace

namespace rc {

template<>
struct Arbitrary<Origin> {
    static Gen<Origin> arbitrary() {
        return gen::element(Origin::User, Origin::Derived);
    }
};

} // namespace rc

TEST_CASE("Property: user changes are never rejected in favour of derived ones", "[property][conflict]") {
    rc::check("user-vs-derived resolution accepts exactly the user changes",
        [](const std::vector<Origin>& origins) {
            RC_PRE(std::count(origins.begin(), origins.end(), Origin::User) > 0);
            RC_PRE(std::count(origins.begin(), origins.end(), Origin::Derived) > 0);

            const auto id = Uuid::generate();
            std::vector<ChangeRecord> changes;
            for (size_t i = 0; i < origins.size(); ++i) {
                changes.push_back(edit(id, origins[i], static_cast<int>(i)));
            }

            quire::testing::Store store;
            ConflictResolver resolver(store.repo, {});
            auto resolution = resolver.resolve({conflict_between(ConflictType::UserVsDerived, changes)});

            RC_ASSERT(resolution.success);
            for (const auto& change : changes) {
                if (change.origin == Origin::User) {
                    RC_ASSERT(resolution.is_accepted(change.id));
                } else {
                    RC_ASSERT(resolution.is_rejected(change.id));
                }
            }
        }
    );
}

TEST_CASE("Property: every resolved change lands in exactly one bucket", "[property][conflict]") {
    rc::check("accepted, rejected and superseded partition a simultaneous edit",
        [](const std::vector<Origin>& origins) {
            RC_PRE(origins.size() >= 2);

            const auto id = Uuid::generate();
            std::vector<ChangeRecord> changes;
            for (size_t i = 0; i < origins.size(); ++i) {
                changes.push_back(edit(id, origins[i], static_cast<int>(i % 3)));
            }

            quire::testing::Store store;
            ConflictResolver resolver(store.repo, {});
            auto resolution = resolver.resolve({conflict_between(ConflictType::SimultaneousEdit, changes)});

            RC_ASSERT(resolution.success);
            RC_ASSERT(!resolution.accepted.empty());
            for (const auto& change : changes) {
                const int buckets = int(resolution.is_accepted(change.id)) +
                                    int(resolution.is_rejected(change.id)) +
                                    int(resolution.is_superseded(change.id));
                RC_ASSERT(buckets == 1);
            }
        }
    );
}
