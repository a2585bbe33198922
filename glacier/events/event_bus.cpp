#include "event_bus.hpp"

#include <raylib.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace glacier::events {

namespace {

struct DepthGuard {
    int& depth;
    explicit DepthGuard(int& d) : depth(d) { ++depth; }
    ~DepthGuard() { --depth; }
};

} // namespace

// ============================================================================
// Registration
// ============================================================================

HandlerId EventBus::add(EntityUid owner, EventCode code, Handler handler,
                        const void* identity, HandlerOrigin origin) {
    if (!handler) {
        return kInvalidHandlerId;
    }

    Subscription sub;
    sub.id = nextId_++;
    sub.code = code;
    sub.owner = owner;
    sub.identity = identity;
    sub.origin = origin;
    sub.handler = std::move(handler);

    subs_.push_back(std::move(sub));
    return subs_.back().id;
}

HandlerId EventBus::subscribe(EventCode code, Handler handler,
                              const void* identity, HandlerOrigin origin) {
    return add(kInvalidUid, code, std::move(handler), identity, origin);
}

HandlerId EventBus::subscribe_entity(EntityUid owner, EventCode code, Handler handler,
                                     const void* identity, HandlerOrigin origin) {
    if (owner == kInvalidUid) {
        TraceLog(LOG_WARNING, "[events] subscribe_entity: invalid owner for event 0x%X", code);
        return kInvalidHandlerId;
    }
    return add(owner, code, std::move(handler), identity, origin);
}

template <typename Pred>
std::size_t EventBus::remove_if(Pred pred) {
    std::size_t count = 0;
    for (auto& sub : subs_) {
        if (!sub.removed && pred(sub)) {
            sub.removed = true;
            ++count;
        }
    }

    if (count > 0) {
        needsCompact_ = true;
        if (dispatchDepth_ == 0) {
            compact();
        }
    }
    return count;
}

bool EventBus::unsubscribe(HandlerId id) {
    return remove_if([id](const Subscription& s) { return s.id == id; }) > 0;
}

bool EventBus::unsubscribe(EventCode code, const void* identity) {
    return remove_if([code, identity](const Subscription& s) {
        return s.owner == kInvalidUid && s.code == code && s.identity == identity;
    }) > 0;
}

bool EventBus::unsubscribe_entity(EntityUid owner, EventCode code, const void* identity) {
    return remove_if([owner, code, identity](const Subscription& s) {
        return s.owner == owner && s.code == code && s.identity == identity;
    }) > 0;
}

std::size_t EventBus::remove_owner(EntityUid owner) {
    if (owner == kInvalidUid) return 0;
    return remove_if([owner](const Subscription& s) { return s.owner == owner; });
}

std::size_t EventBus::remove_all_entity_handlers() {
    return remove_if([](const Subscription& s) { return s.owner != kInvalidUid; });
}

std::size_t EventBus::remove_origin(HandlerOrigin origin) {
    return remove_if([origin](const Subscription& s) { return s.origin == origin; });
}

void EventBus::compact() {
    subs_.erase(
        std::remove_if(subs_.begin(), subs_.end(),
            [](const Subscription& s) { return s.removed; }),
        subs_.end());
    needsCompact_ = false;
}

// ============================================================================
// Dispatch
// ============================================================================

void EventBus::notify_global(EventCode code, EventArg arg) {
    queue_.push_back(QueuedEvent{code, std::move(arg)});
}

std::size_t EventBus::remove_pending(const std::function<bool(const QueuedEvent&)>& pred) {
    const std::size_t before = queue_.size();
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(), pred), queue_.end());
    return before - queue_.size();
}

std::size_t EventBus::notify_entity(EntityUid owner, EventCode code, const EventArg& arg) {
    if (owner == kInvalidUid) return 0;
    return dispatch(owner, code, arg);
}

std::size_t EventBus::flush() {
    std::deque<QueuedEvent> batch;
    batch.swap(queue_);

    for (const auto& ev : batch) {
        dispatch(kInvalidUid, ev.code, ev.arg);
    }
    return batch.size();
}

std::size_t EventBus::dispatch(EntityUid owner, EventCode code, const EventArg& arg) {
    std::size_t invoked = 0;
    {
        DepthGuard guard(dispatchDepth_);

        // Handlers appended during dispatch land past `end` and are skipped.
        const std::size_t end = subs_.size();
        for (std::size_t i = 0; i < end; ++i) {
            if (subs_[i].removed || subs_[i].code != code || subs_[i].owner != owner) {
                continue;
            }
            // Copy: the handler may register more handlers and grow subs_.
            Subscription sub = subs_[i];
            invoke(sub, arg);
            ++invoked;
        }
    }

    if (dispatchDepth_ == 0 && needsCompact_) {
        compact();
    }
    return invoked;
}

void EventBus::invoke(const Subscription& sub, const EventArg& arg) {
    try {
        sub.handler(arg);
    } catch (const std::exception& e) {
        TraceLog(LOG_ERROR, "[events] handler %llu for event 0x%X threw: %s",
                 static_cast<unsigned long long>(sub.id), sub.code, e.what());
    }
}

// ============================================================================
// Introspection
// ============================================================================

std::size_t EventBus::handler_count() const {
    return static_cast<std::size_t>(std::count_if(subs_.begin(), subs_.end(),
        [](const Subscription& s) { return !s.removed; }));
}

std::size_t EventBus::handler_count(EventCode code, EntityUid owner) const {
    return static_cast<std::size_t>(std::count_if(subs_.begin(), subs_.end(),
        [code, owner](const Subscription& s) {
            return !s.removed && s.code == code && s.owner == owner;
        }));
}

} // namespace glacier::events
