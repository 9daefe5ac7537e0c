#include <catch2/catch_test_macros.hpp>
#include "consistency/notifier.hpp"
#include "consistency/owner_context.hpp"
#include "support/store_fixture.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

using namespace quire;
using namespace quire::consistency;
using quire::testing::make_entity;
using quire::testing::make_link;

TEST_CASE("Change kinds map to interested collaborators", "[notifier]") {
    using C = NotifyCategory;
    auto a = make_entity("A");

    REQUIRE(categories_for(make_change(changes::EntityCreated{a})) ==
            std::set<C>{C::Media, C::AnnotationSearch, C::DerivedAnalysis});
    REQUIRE(categories_for(make_change(changes::EntityDeleted{a.id})) ==
            std::set<C>{C::Media, C::RelationshipGraph, C::AnnotationSearch});
    REQUIRE(categories_for(make_change(changes::LinkAdded{make_link(a.id, Uuid::generate())})) ==
            std::set<C>{C::RelationshipGraph});
    REQUIRE(categories_for(make_change(changes::AnnotationChanged{a.id, "note", std::nullopt})) ==
            std::set<C>{C::AnnotationSearch});
    REQUIRE(categories_for(make_change(changes::DerivedAnalysisUpdated{a.id, "summary", std::nullopt})) ==
            std::set<C>{C::AnnotationSearch, C::DerivedAnalysis});

    EntityPatch body;
    body.body = "new body";
    REQUIRE(categories_for(make_change(changes::EntityModified{a.id, body})) == std::set<C>{C::AnnotationSearch});

    EntityPatch payload;
    payload.payload = std::vector<uint8_t>{1, 2, 3};
    REQUIRE(categories_for(make_change(changes::EntityModified{a.id, payload})) == std::set<C>{C::Media});
}

TEST_CASE("Notifier delivers inline without a context", "[notifier]") {
    Notifier notifier;
    auto a = make_entity("A");

    std::vector<NotifyCategory> delivered;
    std::set<Uuid> last;
    auto record = [&](NotifyCategory category, const std::set<Uuid>& ids) {
        delivered.push_back(category);
        last = ids;
    };
    notifier.subscribe(NotifyCategory::Media, record);
    auto graph = notifier.subscribe(NotifyCategory::RelationshipGraph, record);

    auto started = notifier.notify(make_change(changes::EntityDeleted{a.id}), {a.id});
    REQUIRE(started == 2);
    REQUIRE(delivered.size() == 2);
    REQUIRE(last == std::set<Uuid>{a.id});

    notifier.unsubscribe(graph);
    delivered.clear();
    REQUIRE(notifier.notify(make_change(changes::EntityDeleted{a.id}), {a.id}) == 1);
    REQUIRE(delivered == std::vector<NotifyCategory>{NotifyCategory::Media});

    SECTION("A throwing subscriber does not stop the others") {
        notifier.subscribe(NotifyCategory::Media, [](NotifyCategory, const std::set<Uuid>&) {
            throw std::runtime_error("subscriber failure");
        });
        delivered.clear();
        REQUIRE(notifier.notify(NotifyCategory::Media, {a.id}) == 2);
        REQUIRE(delivered.size() == 1);
    }
}

TEST_CASE("Notifier posts deliveries to the owner context", "[notifier]") {
    OwnerContext ctx;
    ctx.start();
    Notifier notifier;
    notifier.attach(&ctx);

    std::mutex mu;
    bool on_owner = false;
    std::set<Uuid> received;
    notifier.subscribe(NotifyCategory::AnnotationSearch, [&](NotifyCategory, const std::set<Uuid>& ids) {
        std::lock_guard<std::mutex> lk(mu);
        on_owner = ctx.is_owner_thread();
        received = ids;
    });

    auto id = Uuid::generate();
    REQUIRE(notifier.notify(NotifyCategory::AnnotationSearch, {id}) == 1);
    // Anything posted afterwards runs after the delivery
    ctx.submit([] {}).get();

    {
        std::lock_guard<std::mutex> lk(mu);
        REQUIRE(on_owner);
        REQUIRE(received == std::set<Uuid>{id});
    }

    ctx.stop();
    notifier.attach(nullptr);
}
