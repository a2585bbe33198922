#pragma once

#include "glacier/core/types.hpp"

#include <any>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

namespace glacier::events {

// Opaque event payload. Engine events carry KeyEvent, script events carry
// whatever the script passed (see scripting::SceneApi).
using EventArg = std::any;

using Handler = std::function<void(const EventArg& arg)>;
using HandlerId = std::uint64_t;

static constexpr HandlerId kInvalidHandlerId = 0;

// Who installed a handler. Script handlers are dropped in bulk when the
// Lua state goes away.
enum class HandlerOrigin : std::uint8_t {
    Engine = 0,
    Script = 1,
};

struct Subscription {
    HandlerId id{kInvalidHandlerId};
    EventCode code{0};
    EntityUid owner{kInvalidUid};   // kInvalidUid = global handler
    const void* identity{nullptr};  // used by unregister-by-function
    HandlerOrigin origin{HandlerOrigin::Engine};
    Handler handler;
    bool removed{false};
};

struct QueuedEvent {
    EventCode code{0};
    EventArg arg;
};

// Event dispatcher keyed by integer event codes.
//
// - Global events are queued by notify_global() and delivered by flush(),
//   in FIFO order, to global handlers in registration order.
// - Entity events are delivered synchronously by notify_entity() to the
//   handlers owned by that entity.
// - Events raised while flushing are delivered on the next flush().
// - A handler removed during dispatch is not called afterwards; a handler
//   added during dispatch only sees later events.
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // --- Registration ---

    HandlerId subscribe(EventCode code, Handler handler,
                        const void* identity = nullptr,
                        HandlerOrigin origin = HandlerOrigin::Engine);

    HandlerId subscribe_entity(EntityUid owner, EventCode code, Handler handler,
                               const void* identity = nullptr,
                               HandlerOrigin origin = HandlerOrigin::Engine);

    bool unsubscribe(HandlerId id);

    // Removes every global handler for `code` registered with `identity`.
    bool unsubscribe(EventCode code, const void* identity);

    // Removes every handler of `owner` for `code` registered with `identity`.
    bool unsubscribe_entity(EntityUid owner, EventCode code, const void* identity);

    std::size_t remove_owner(EntityUid owner);
    std::size_t remove_all_entity_handlers();
    std::size_t remove_origin(HandlerOrigin origin);

    // --- Dispatch ---

    void notify_global(EventCode code, EventArg arg = {});

    // Returns the number of handlers invoked.
    std::size_t notify_entity(EntityUid owner, EventCode code, const EventArg& arg = {});

    // Delivers every event queued before the call. Returns the number of events delivered.
    std::size_t flush();

    // Drops queued events for which `pred` returns true. Returns the number dropped.
    std::size_t remove_pending(const std::function<bool(const QueuedEvent&)>& pred);

    // --- Introspection ---

    std::size_t pending() const { return queue_.size(); }
    std::size_t handler_count() const;
    std::size_t handler_count(EventCode code, EntityUid owner = kInvalidUid) const;

private:
    HandlerId add(EntityUid owner, EventCode code, Handler handler,
                  const void* identity, HandlerOrigin origin);

    template <typename Pred>
    std::size_t remove_if(Pred pred);

    std::size_t dispatch(EntityUid owner, EventCode code, const EventArg& arg);
    void invoke(const Subscription& sub, const EventArg& arg);
    void compact();

    std::vector<Subscription> subs_;
    std::deque<QueuedEvent> queue_;
    HandlerId nextId_{1};
    int dispatchDepth_{0};
    bool needsCompact_{false};
};

} // namespace glacier::events
