#include "consistency/notifier.hpp"
#include "consistency/owner_context.hpp"
#include "core/logging.hpp"

#include <exception>

namespace quire::consistency {

const char* notify_category_name(NotifyCategory category) {
    switch (category) {
        case NotifyCategory::Media: return "media";
        case NotifyCategory::RelationshipGraph: return "relationship-graph";
        case NotifyCategory::AnnotationSearch: return "annotation-search";
        case NotifyCategory::DerivedAnalysis: return "derived-analysis";
    }
    return "unknown";
}

std::set<NotifyCategory> categories_for(const ChangeRecord& change) {
    using C = NotifyCategory;
    if (std::holds_alternative<changes::EntityCreated>(change.kind)) {
        return {C::Media, C::AnnotationSearch, C::DerivedAnalysis};
    }
    if (std::holds_alternative<changes::EntityDeleted>(change.kind)) {
        return {C::Media, C::RelationshipGraph, C::AnnotationSearch};
    }
    if (auto* modified = std::get_if<changes::EntityModified>(&change.kind)) {
        std::set<C> out;
        const auto& p = modified->patch;
        if (p.payload || p.title) out.insert(C::Media);
        if (p.title || p.body || p.annotation || p.tags || p.derived_text) out.insert(C::AnnotationSearch);
        if (p.derived_text || p.analyzed_at) out.insert(C::DerivedAnalysis);
        return out;
    }
    if (std::holds_alternative<changes::LinkAdded>(change.kind) ||
        std::holds_alternative<changes::LinkRemoved>(change.kind)) {
        return {C::RelationshipGraph};
    }
    if (std::holds_alternative<changes::AnnotationChanged>(change.kind)) {
        return {C::AnnotationSearch};
    }
    if (std::holds_alternative<changes::DerivedAnalysisUpdated>(change.kind)) {
        return {C::AnnotationSearch, C::DerivedAnalysis};
    }
    return {C::Media, C::AnnotationSearch, C::DerivedAnalysis};
}

size_t Notifier::subscribe(NotifyCategory category, Subscriber subscriber) {
    const size_t token = next_token_++;
    subscribers_.emplace(token, Entry{category, std::move(subscriber)});
    return token;
}

void Notifier::unsubscribe(size_t token) {
    subscribers_.erase(token);
}

size_t Notifier::notify(const ChangeRecord& change, const std::set<Uuid>& affected) {
    size_t started = 0;
    for (auto category : categories_for(change)) {
        started += notify(category, affected);
    }
    return started;
}

size_t Notifier::notify(NotifyCategory category, const std::set<Uuid>& affected) {
    size_t started = 0;
    for (const auto& [token, entry] : subscribers_) {
        if (entry.category != category) continue;

        auto deliver = [subscriber = entry.subscriber, category, affected] {
            try {
                subscriber(category, affected);
            } catch (const std::exception& e) {
                qCWarning(quireConsistencyLog) << "Notifier:" << notify_category_name(category)
                                               << "subscriber threw:" << e.what();
            }
        };
        if (context_ && context_->post(deliver)) {
            ++started;
            continue;
        }
        deliver();
        ++started;
    }
    return started;
}

} // namespace quire::consistency
