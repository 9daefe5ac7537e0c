#include <catch2/catch_test_macros.hpp>
#include "core/change.hpp"
#include "support/store_fixture.hpp"

using namespace quire;
using quire::testing::at_seconds;
using quire::testing::make_entity;
using quire::testing::make_link;

TEST_CASE("Changes get their default origin", "[change]") {
    auto a = make_entity("A");

    REQUIRE(make_change(changes::EntityCreated{a}).origin == Origin::User);
    REQUIRE(make_change(changes::AnnotationChanged{a.id, "x", std::nullopt}).origin == Origin::User);
    REQUIRE(make_change(changes::DerivedAnalysisUpdated{a.id, "x", std::nullopt}).origin == Origin::Derived);
    REQUIRE(make_change(changes::BulkImport{{a}}).origin == Origin::Derived);

    auto explicit_origin = make_change(changes::EntityCreated{a}, Origin::Derived, at_seconds(3));
    REQUIRE(explicit_origin.origin == Origin::Derived);
    REQUIRE(explicit_origin.timestamp == at_seconds(3));
    REQUIRE(explicit_origin.id != make_change(changes::EntityCreated{a}).id);
}

TEST_CASE("Affected ids include link endpoints", "[change]") {
    auto a = make_entity("A");
    auto b = make_entity("B");
    auto link = make_link(a.id, b.id);

    REQUIRE(affected_ids(make_change(changes::LinkAdded{link})) == std::set<Uuid>{link.id, a.id, b.id});
    REQUIRE(affected_ids(make_change(changes::EntityDeleted{a.id})) == std::set<Uuid>{a.id});
    REQUIRE(affected_ids(make_change(changes::BulkImport{{a, b}})) == std::set<Uuid>{a.id, b.id});
}

TEST_CASE("Changes describe themselves", "[change]") {
    auto a = make_entity("Groceries");

    auto created = describe(make_change(changes::EntityCreated{a}));
    REQUIRE(created == "Created \"Groceries\" [user]");

    EntityPatch patch;
    patch.title = "t";
    patch.tags = std::vector<std::string>{"x"};
    auto modified = describe(make_change(changes::EntityModified{a.id, patch}));
    REQUIRE(modified == "Modified entity " + a.id.short_hex() + " (title, tags) [user]");

    REQUIRE(describe(make_change(changes::BulkImport{{a}})) == "Imported 1 entities [derived]");
    REQUIRE(std::string(kind_name(make_change(changes::LinkRemoved{make_link(a.id, a.id)}).kind)) ==
            "link-removed");
}

TEST_CASE("Field patches implied by changes", "[change]") {
    auto id = Uuid::generate();

    auto annotation = patch_for(make_change(changes::AnnotationChanged{id, std::nullopt, std::vector<std::string>{"a"}}));
    REQUIRE(annotation.has_value());
    REQUIRE(annotation->fields() == std::vector<std::string>{"tags"});

    auto derived = patch_for(make_change(changes::DerivedAnalysisUpdated{id, "summary", std::nullopt}, at_seconds(9)));
    REQUIRE(derived->analyzed_at == at_seconds(9));
    REQUIRE(derived->derived_text == std::string("summary"));

    REQUIRE_FALSE(patch_for(make_change(changes::EntityDeleted{id})).has_value());

    REQUIRE(is_deletion(make_change(changes::EntityDeleted{id})));
    REQUIRE_FALSE(is_deletion(make_change(changes::EntityCreated{make_entity("x")})));
}

TEST_CASE("Patches merge and apply", "[change]") {
    EntityPatch title;
    title.title = "New";
    EntityPatch stamped;
    stamped.derived_text = "d";
    stamped.analyzed_at = at_seconds(1);
    EntityPatch stamped_again;
    stamped_again.tags = std::vector<std::string>{"t"};
    stamped_again.analyzed_at = at_seconds(2);

    REQUIRE(title.disjoint_with(stamped));
    // analyzed_at alone does not make two analyses collide
    REQUIRE(stamped.disjoint_with(stamped_again));
    REQUIRE_FALSE(title.disjoint_with(title));

    auto merged = stamped.merged_with(stamped_again);
    REQUIRE(merged.analyzed_at == at_seconds(2));
    REQUIRE(merged.derived_text == std::string("d"));

    auto entity = title.apply_to(make_entity("Old"), at_seconds(5));
    REQUIRE(entity.title == "New");
    REQUIRE(entity.updated_at == at_seconds(5));
    REQUIRE(EntityPatch{}.empty());
}
