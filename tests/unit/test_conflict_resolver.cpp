#include <catch2/catch_test_macros.hpp>
#include "consistency/conflict_resolver.hpp"
#include "support/store_fixture.hpp"

#include <algorithm>

using namespace quire;
using namespace quire::consistency;
using quire::testing::at_seconds;
using quire::testing::make_entity;
using quire::testing::make_link;

namespace {

ChangeRecord edit_title(const Uuid& id, const std::string& title, Origin origin, Timestamp at) {
    EntityPatch patch;
    patch.title = title;
    return make_change(changes::EntityModified{id, patch}, origin, at);
}

ChangeRecord annotate(const Uuid& id, std::optional<std::string> text,
                      std::optional<std::vector<std::string>> tags, Timestamp at) {
    return make_change(changes::AnnotationChanged{id, std::move(text), std::move(tags)}, Origin::User, at);
}

DataConflict conflict_of(ConflictType type, std::vector<ChangeRecord> changes) {
    DataConflict conflict;
    conflict.id = Uuid::generate();
    conflict.type = type;
    conflict.changes = std::move(changes);
    return conflict;
}

} // anonymous namespace

TEST_CASE("Change confidence and mergeability", "[conflict]") {
    auto id = Uuid::generate();

    SECTION("Confidence defaults by origin") {
        auto user = edit_title(id, "u", Origin::User, at_seconds(0));
        auto derived = edit_title(id, "d", Origin::Derived, at_seconds(0));
        REQUIRE(confidence_of(user) == 0.95);
        REQUIRE(confidence_of(derived) == 0.75);
        derived.confidence = 0.99;
        REQUIRE(confidence_of(derived) == 0.99);
    }

    SECTION("Annotations of disjoint fields on one entity merge") {
        auto text = annotate(id, "note", std::nullopt, at_seconds(0));
        auto tags = annotate(id, std::nullopt, std::vector<std::string>{"work"}, at_seconds(1));
        REQUIRE(can_merge(text, tags));

        auto other_text = annotate(id, "other", std::nullopt, at_seconds(1));
        REQUIRE_FALSE(can_merge(text, other_text));

        auto elsewhere = annotate(Uuid::generate(), std::nullopt, std::vector<std::string>{"x"}, at_seconds(1));
        REQUIRE_FALSE(can_merge(text, elsewhere));

        REQUIRE_FALSE(can_merge(text, edit_title(id, "t", Origin::User, at_seconds(1))));
    }
}

TEST_CASE("Strategy selection by conflict type", "[conflict]") {
    auto id = Uuid::generate();
    auto user = edit_title(id, "u", Origin::User, at_seconds(0));
    auto user2 = edit_title(id, "u2", Origin::User, at_seconds(1));
    auto derived = edit_title(id, "d", Origin::Derived, at_seconds(1));

    REQUIRE(select_strategy(conflict_of(ConflictType::UserVsDerived, {user, derived})) ==
            ResolutionStrategy::UserPriority);
    REQUIRE(select_strategy(conflict_of(ConflictType::VersionMismatch, {user, user2})) ==
            ResolutionStrategy::Confidence);
    REQUIRE(select_strategy(conflict_of(ConflictType::IntegrityViolation, {user})) ==
            ResolutionStrategy::SemanticMerge);
    REQUIRE(select_strategy(conflict_of(ConflictType::SimultaneousEdit, {user, derived})) ==
            ResolutionStrategy::UserPriority);
    REQUIRE(select_strategy(conflict_of(ConflictType::SimultaneousEdit, {user, user2})) ==
            ResolutionStrategy::Timestamp);

    auto a = annotate(id, "a", std::nullopt, at_seconds(0));
    auto b = annotate(id, std::nullopt, std::vector<std::string>{"b"}, at_seconds(1));
    REQUIRE(select_strategy(conflict_of(ConflictType::SimultaneousEdit, {a, b})) ==
            ResolutionStrategy::ContentMerge);
}

TEST_CASE("Resolution strategies", "[conflict]") {
    auto id = Uuid::generate();

    SECTION("User priority keeps user changes") {
        auto user = edit_title(id, "mine", Origin::User, at_seconds(0));
        auto derived = edit_title(id, "machine", Origin::Derived, at_seconds(2));
        auto out = resolve(ResolutionStrategy::UserPriority, conflict_of(ConflictType::UserVsDerived, {user, derived}));

        REQUIRE(out.success);
        REQUIRE(out.accepted.size() == 1);
        REQUIRE(out.accepted[0].id == user.id);
        REQUIRE(out.rejected.size() == 1);
        REQUIRE(out.rejected[0].id == derived.id);
    }

    SECTION("Timestamp keeps the newest and breaks ties toward the incoming change") {
        auto older = edit_title(id, "old", Origin::User, at_seconds(0));
        auto newer = edit_title(id, "new", Origin::User, at_seconds(3));
        auto out = resolve(ResolutionStrategy::Timestamp, conflict_of(ConflictType::SimultaneousEdit, {newer, older}));
        REQUIRE(out.accepted[0].id == newer.id);

        auto tied = edit_title(id, "tied", Origin::User, at_seconds(3));
        out = resolve(ResolutionStrategy::Timestamp, conflict_of(ConflictType::SimultaneousEdit, {newer, tied}));
        REQUIRE(out.accepted[0].id == tied.id);
        REQUIRE(out.rejected[0].id == newer.id);
    }

    SECTION("Content merge folds disjoint annotations into one change") {
        auto text = annotate(id, "remember this", std::nullopt, at_seconds(0));
        auto tags = annotate(id, std::nullopt, std::vector<std::string>{"todo"}, at_seconds(2));
        auto out = resolve(ResolutionStrategy::ContentMerge, conflict_of(ConflictType::SimultaneousEdit, {text, tags}));

        REQUIRE(out.success);
        REQUIRE(out.superseded.size() == 2);
        REQUIRE(out.accepted.size() == 1);
        auto merged = patch_for(out.accepted[0]).value();
        REQUIRE(merged.annotation == std::string("remember this"));
        REQUIRE(merged.tags == std::vector<std::string>{"todo"});
        REQUIRE(out.accepted[0].timestamp == at_seconds(2));
    }

    SECTION("Content merge of overlapping fields falls back to newest") {
        auto first = annotate(id, "first", std::nullopt, at_seconds(0));
        auto second = annotate(id, "second", std::nullopt, at_seconds(1));
        auto out = resolve(ResolutionStrategy::ContentMerge, conflict_of(ConflictType::SimultaneousEdit, {first, second}));
        REQUIRE(out.accepted.size() == 1);
        REQUIRE(out.accepted[0].id == second.id);
        REQUIRE(out.superseded.empty());
    }

    SECTION("Confidence keeps the most confident change") {
        auto sure = edit_title(id, "sure", Origin::Derived, at_seconds(0));
        sure.confidence = 0.99;
        auto unsure = edit_title(id, "unsure", Origin::User, at_seconds(5));
        auto out = resolve(ResolutionStrategy::Confidence, conflict_of(ConflictType::VersionMismatch, {sure, unsure}));
        REQUIRE(out.accepted[0].id == sure.id);
    }

    SECTION("Semantic merge removes dangling links first") {
        auto a = make_entity("A");
        auto b = make_entity("B");
        auto link = make_link(a.id, b.id);
        auto remove = make_change(changes::EntityDeleted{a.id}, Origin::User, at_seconds(4));
        auto conflict = conflict_of(ConflictType::IntegrityViolation, {remove});
        conflict.dangling_links = {link};

        auto out = resolve(ResolutionStrategy::SemanticMerge, conflict);
        REQUIRE(out.success);
        REQUIRE(out.accepted.size() == 2);
        auto* unlinked = std::get_if<changes::LinkRemoved>(&out.accepted[0].kind);
        REQUIRE(unlinked != nullptr);
        REQUIRE(unlinked->link.id == link.id);
        REQUIRE(out.accepted[0].timestamp == at_seconds(4));
        REQUIRE(out.accepted[1].id == remove.id);
    }
}

TEST_CASE("ChangeTracker keeps a bounded window", "[conflict]") {
    ChangeTracker tracker(3);
    std::vector<ChangeRecord> tracked;
    for (int i = 0; i < 4; ++i) {
        tracked.push_back(edit_title(Uuid::generate(), "t", Origin::User, at_seconds(i)));
        tracker.track(tracked.back());
    }

    REQUIRE(tracker.size() == 3);
    REQUIRE(tracker.find(tracked[0].id) == nullptr);
    REQUIRE(tracker.accepted().empty());

    auto v1 = Uuid::generate();
    auto v2 = Uuid::generate();
    tracker.mark_accepted(tracked[1].id, v1);
    tracker.mark_accepted(tracked[2].id, v2);
    tracker.mark_rejected(tracked[3].id);

    REQUIRE(tracker.accepted().size() == 2);
    auto since = tracker.accepted_since(v1);
    REQUIRE(since.size() == 1);
    REQUIRE(since[0]->change.id == tracked[2].id);
    REQUIRE(tracker.accepted_since(Uuid::generate()).size() == 2);
    REQUIRE(tracker.find(tracked[3].id)->status == TrackStatus::Rejected);
}

TEST_CASE("ConflictResolver detects temporal conflicts", "[conflict]") {
    quire::testing::Store store;
    ConflictResolver resolver(store.repo, {});
    auto note = make_entity("Note");
    REQUIRE(store.repo.insert_entity(note).is_ok());

    auto accept = [&](const ChangeRecord& change) {
        resolver.tracker().track(change);
        resolver.tracker().mark_accepted(change.id, Uuid::generate());
    };

    SECTION("Edits within the window collide") {
        accept(edit_title(note.id, "one", Origin::User, at_seconds(0)));
        auto conflicts = resolver.detect_conflicts(edit_title(note.id, "two", Origin::User, at_seconds(4))).unwrap();

        REQUIRE(conflicts.size() == 1);
        REQUIRE(conflicts[0].type == ConflictType::SimultaneousEdit);
        REQUIRE(conflicts[0].severity == ConflictSeverity::High);
        REQUIRE(conflicts[0].auto_resolvable);
        REQUIRE(conflicts[0].changes.size() == 2);
        REQUIRE(conflicts[0].affected.count(note.id) == 1);
    }

    SECTION("Edits outside the window or on other entities do not") {
        accept(edit_title(note.id, "one", Origin::User, at_seconds(0)));
        REQUIRE(resolver.detect_conflicts(edit_title(note.id, "two", Origin::User, at_seconds(6))).unwrap().empty());
        REQUIRE(resolver.detect_conflicts(edit_title(Uuid::generate(), "x", Origin::User, at_seconds(1)))
                    .unwrap().empty());
    }

    SECTION("Pending and rejected changes are ignored") {
        auto pending = edit_title(note.id, "one", Origin::User, at_seconds(0));
        resolver.tracker().track(pending);
        REQUIRE(resolver.detect_conflicts(edit_title(note.id, "two", Origin::User, at_seconds(1))).unwrap().empty());
    }

    SECTION("Derived output after a user edit defers to it") {
        accept(edit_title(note.id, "mine", Origin::User, at_seconds(0)));
        auto derived = make_change(changes::DerivedAnalysisUpdated{note.id, "summary", std::nullopt},
                                   Origin::Derived, at_seconds(30));
        auto conflicts = resolver.detect_conflicts(derived).unwrap();

        REQUIRE(conflicts.size() == 1);
        REQUIRE(conflicts[0].type == ConflictType::UserVsDerived);
        REQUIRE(select_strategy(conflicts[0]) == ResolutionStrategy::UserPriority);

        auto later = make_change(changes::DerivedAnalysisUpdated{note.id, "summary", std::nullopt},
                                 Origin::Derived, at_seconds(61));
        REQUIRE(resolver.detect_conflicts(later).unwrap().empty());
    }

    SECTION("A change computed against an old version collides with newer edits") {
        auto base = Uuid::generate();
        auto first = edit_title(note.id, "one", Origin::User, at_seconds(0));
        resolver.tracker().track(first);
        resolver.tracker().mark_accepted(first.id, base);
        auto second = edit_title(note.id, "two", Origin::User, at_seconds(100));
        auto current = Uuid::generate();
        resolver.tracker().track(second);
        resolver.tracker().mark_accepted(second.id, current);

        auto stale = edit_title(note.id, "three", Origin::User, at_seconds(200));
        stale.base_version = base;
        auto conflicts = resolver.detect_conflicts(stale, current).unwrap();

        REQUIRE(conflicts.size() == 1);
        REQUIRE(conflicts[0].type == ConflictType::VersionMismatch);
        REQUIRE(conflicts[0].changes.front().id == second.id);

        stale.base_version = current;
        REQUIRE(resolver.detect_conflicts(stale, current).unwrap().empty());
    }
}

TEST_CASE("ConflictResolver detects integrity conflicts", "[conflict]") {
    quire::testing::Store store;
    ConflictResolver resolver(store.repo, {});

    auto a = make_entity("A");
    auto b = make_entity("B");
    auto c = make_entity("C");
    for (const auto& e : {a, b, c}) REQUIRE(store.repo.insert_entity(e).is_ok());
    auto ab = make_link(a.id, b.id);
    REQUIRE(store.repo.insert_link(ab).is_ok());

    SECTION("Deleting a linked entity names both endpoints") {
        auto conflicts = resolver.detect_conflicts(
            make_change(changes::EntityDeleted{a.id}, at_seconds(0))).unwrap();

        REQUIRE(conflicts.size() == 1);
        const auto& conflict = conflicts[0];
        REQUIRE(conflict.type == ConflictType::IntegrityViolation);
        REQUIRE(conflict.severity == ConflictSeverity::High);
        REQUIRE(conflict.auto_resolvable);
        REQUIRE(conflict.affected.count(a.id) == 1);
        REQUIRE(conflict.affected.count(b.id) == 1);
        REQUIRE(conflict.dangling_links.size() == 1);
        REQUIRE(conflict.dangling_links[0].id == ab.id);
    }

    SECTION("Deleting an unlinked entity is fine") {
        REQUIRE(resolver.detect_conflicts(make_change(changes::EntityDeleted{c.id}, at_seconds(0)))
                    .unwrap().empty());
    }

    SECTION("Self links, missing endpoints and cycles need a human") {
        auto self = resolver.detect_conflicts(
            make_change(changes::LinkAdded{make_link(a.id, a.id)}, at_seconds(0))).unwrap();
        REQUIRE(self.size() == 1);
        REQUIRE_FALSE(self[0].auto_resolvable);

        auto missing = resolver.detect_conflicts(
            make_change(changes::LinkAdded{make_link(a.id, Uuid::generate())}, at_seconds(0))).unwrap();
        REQUIRE(missing.size() == 1);
        REQUIRE(missing[0].severity == ConflictSeverity::High);
        REQUIRE_FALSE(missing[0].auto_resolvable);

        REQUIRE(store.repo.insert_link(make_link(b.id, c.id)).is_ok());
        auto cycle = resolver.detect_conflicts(
            make_change(changes::LinkAdded{make_link(c.id, a.id)}, at_seconds(0))).unwrap();
        REQUIRE(cycle.size() == 1);
        REQUIRE(cycle[0].reason.find("cycle") != std::string::npos);

        REQUIRE(resolver.detect_conflicts(
            make_change(changes::LinkAdded{make_link(a.id, c.id)}, at_seconds(0))).unwrap().empty());
    }
}

TEST_CASE("ConflictResolver aggregates resolutions", "[conflict]") {
    quire::testing::Store store;
    ConflictResolver resolver(store.repo, {.history_limit = 2});
    auto id = Uuid::generate();

    SECTION("User priority rejects the analyzer") {
        auto user = edit_title(id, "mine", Origin::User, at_seconds(0));
        auto derived = edit_title(id, "machine", Origin::Derived, at_seconds(2));
        auto resolution = resolver.resolve({conflict_of(ConflictType::SimultaneousEdit, {user, derived}),
                                            conflict_of(ConflictType::UserVsDerived, {user, derived})});

        REQUIRE(resolution.success);
        REQUIRE(resolution.is_accepted(user.id));
        REQUIRE(resolution.is_rejected(derived.id));
        REQUIRE_FALSE(resolution.is_accepted(derived.id));
        REQUIRE(resolver.stats().by_strategy.at(ResolutionStrategy::UserPriority) == 2);
    }

    SECTION("A rejection by any conflict wins") {
        auto older = edit_title(id, "old", Origin::User, at_seconds(0));
        auto newer = edit_title(id, "new", Origin::User, at_seconds(1));
        auto integrity = conflict_of(ConflictType::IntegrityViolation, {older});
        auto resolution = resolver.resolve({integrity, conflict_of(ConflictType::SimultaneousEdit, {older, newer})});

        REQUIRE(resolution.is_rejected(older.id));
        REQUIRE_FALSE(resolution.is_accepted(older.id));
        REQUIRE(resolution.is_accepted(newer.id));
    }

    SECTION("A conflict that is not auto-resolvable fails the whole set") {
        auto change = edit_title(id, "x", Origin::User, at_seconds(0));
        auto manual = conflict_of(ConflictType::IntegrityViolation, {change});
        manual.auto_resolvable = false;
        manual.reason = "Link points at its own source";

        auto resolution = resolver.resolve({manual});
        REQUIRE_FALSE(resolution.success);
        REQUIRE(resolution.manual_intervention_required);
        REQUIRE(resolution.accepted.empty());
        REQUIRE(resolution.detail.find("own source") != std::string::npos);

        auto error = unresolved_error({manual});
        REQUIRE(error.code == ErrorCode::ConflictUnresolved);
        REQUIRE(error.message.find(describe(change)) != std::string::npos);
        REQUIRE(error.message.find(change.timestamp.to_iso_string()) != std::string::npos);
    }

    SECTION("History is capped and stats accumulate") {
        auto change = edit_title(id, "x", Origin::User, at_seconds(0));
        for (int i = 0; i < 3; ++i) {
            (void)resolver.resolve({conflict_of(ConflictType::IntegrityViolation, {change})});
        }
        REQUIRE(resolver.history().size() == 2);
        REQUIRE(resolver.stats().resolutions == 3);
        REQUIRE(resolver.stats().success_rate() == 1.0);
        REQUIRE(resolver.stats().average_conflicts() == 1.0);
    }

    SECTION("Suggestions are ranked by confidence") {
        auto a = annotate(id, "a", std::nullopt, at_seconds(0));
        auto b = annotate(id, std::nullopt, std::vector<std::string>{"b"}, at_seconds(1));
        auto suggestions = resolver.suggest_resolutions(conflict_of(ConflictType::SimultaneousEdit, {a, b}));

        REQUIRE(suggestions.size() == 5);
        REQUIRE(suggestions[0].strategy == ResolutionStrategy::UserPriority);
        REQUIRE(suggestions[1].strategy == ResolutionStrategy::ContentMerge);
        REQUIRE(std::is_sorted(suggestions.begin(), suggestions.end(),
                               [](const auto& x, const auto& y) { return x.confidence > y.confidence; }));
    }
}
