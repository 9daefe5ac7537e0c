#pragma once

#include "core/change.hpp"
#include "core/types.hpp"

#include <functional>
#include <map>
#include <set>
#include <vector>

namespace quire::consistency {

class OwnerContext;

/**
 * Collaborators that cache data derived from entities.
 */
enum class NotifyCategory {
    Media,
    RelationshipGraph,
    AnnotationSearch,
    DerivedAnalysis
};

[[nodiscard]] const char* notify_category_name(NotifyCategory category);

/**
 * Categories interested in an accepted change.
 */
[[nodiscard]] std::set<NotifyCategory> categories_for(const ChangeRecord& change);

/**
 * Notifier - fire-and-forget invalidation fan-out after a commit.
 *
 * With an owner context attached, deliveries are posted to it so the
 * committing call never waits on a subscriber; otherwise they run inline.
 */
class Notifier {
public:
    using Subscriber = std::function<void(NotifyCategory, const std::set<Uuid>&)>;

    /**
     * Returns a token for unsubscribe().
     */
    size_t subscribe(NotifyCategory category, Subscriber subscriber);

    void unsubscribe(size_t token);

    void attach(OwnerContext* context) { context_ = context; }

    /**
     * Deliver `affected` to every subscriber of the categories the change
     * concerns. Returns the number of deliveries started.
     */
    size_t notify(const ChangeRecord& change, const std::set<Uuid>& affected);

    size_t notify(NotifyCategory category, const std::set<Uuid>& affected);

private:
    struct Entry {
        NotifyCategory category;
        Subscriber subscriber;
    };

    std::map<size_t, Entry> subscribers_;
    size_t next_token_ = 1;
    OwnerContext* context_ = nullptr;
};

} // namespace quire::consistency
