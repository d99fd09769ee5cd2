#pragma once

/// @file event_dispatcher.hpp
/// @brief Deferred, type-keyed event delivery between systems.
///
/// Events pushed during a tick are queued and delivered when Dispatch()
/// runs (SystemManager dispatches after every system).  Connecting and
/// disconnecting handlers is queued the same way, so a handler may
/// rewire itself or push follow-up events from inside a delivery.

#include <any>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace es::ecs {

/// Unique identifier of a connection within one dispatcher.
using ConnectionId = uint64_t;

/// Queue of pending events and handler (dis)connections.
///
/// Usage:
/// @code
///   EventDispatcher events;
///   auto conn = events.CreateConnection<Collision>(
///       [&](const Collision& c) { ++hits; });
///   conn.Connect();
///
///   events.Push(Collision{a, b});
///   events.Dispatch();   // connects, then delivers
///   conn.Disconnect();
/// @endcode
///
/// Single-threaded.  Dispatch() must not be called from a handler.
class EventDispatcher {
    struct State;

public:
    /// Binding of one handler to one event type.
    ///
    /// Created disconnected.  Connect()/Disconnect() are queued and take
    /// effect in order with events at the next Dispatch().  Both are
    /// no-ops once the dispatcher has been destroyed.
    class Connection {
    public:
        using Handler = std::function<void(const std::any&)>;

        Connection() = default;

        void Connect() const;
        void Disconnect() const;

        [[nodiscard]] ConnectionId Id() const noexcept { return id_; }

        /// True while the originating dispatcher is still alive.
        [[nodiscard]] bool IsBound() const noexcept { return !state_.expired(); }

    private:
        friend class EventDispatcher;

        Connection(std::weak_ptr<State> state, ConnectionId id,
                   std::type_index type, std::shared_ptr<Handler> handler)
            : state_(std::move(state)), id_(id), type_(type), handler_(std::move(handler)) {}

        std::weak_ptr<State> state_;
        ConnectionId id_ = 0;
        std::type_index type_ = std::type_index(typeid(void));
        std::shared_ptr<Handler> handler_;
    };

    EventDispatcher() : state_(std::make_shared<State>()) {}

    // Non-copyable, movable.  Queued operations and existing connections
    // follow the moved state; the moved-from dispatcher is left empty and
    // starts a fresh queue on its next use.
    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;
    EventDispatcher(EventDispatcher&&) noexcept = default;
    EventDispatcher& operator=(EventDispatcher&&) noexcept = default;

    /// Queue @p event for delivery at the next Dispatch().
    template <typename E>
    void Push(E event) {
        MutableState().pending.push_back([evt = std::move(event)](State& state) {
            state.Deliver(std::type_index(typeid(E)), std::any(evt));
        });
    }

    /// Create a disconnected binding of @p handler to events of type @p E.
    template <typename E, typename Handler>
    [[nodiscard]] Connection CreateConnection(Handler handler) {
        auto wrapped = std::make_shared<Connection::Handler>(
            [fn = std::function<void(const E&)>(std::move(handler))](const std::any& event) {
                fn(std::any_cast<const E&>(event));
            });
        auto& state = MutableState();
        return Connection(state_, state.nextId++, std::type_index(typeid(E)),
                          std::move(wrapped));
    }

    /// Apply every queued operation in FIFO order, including operations
    /// queued by handlers while draining.
    void Dispatch();

    /// Number of queued events and (dis)connections.
    [[nodiscard]] std::size_t PendingCount() const noexcept {
        return state_ ? state_->pending.size() : 0;
    }

    /// Number of handlers currently connected for @p E.
    template <typename E>
    [[nodiscard]] std::size_t HandlerCount() const {
        if (!state_) {
            return 0;
        }
        auto it = state_->handlers.find(std::type_index(typeid(E)));
        return it == state_->handlers.end() ? 0 : it->second.size();
    }

private:
    struct HandlerEntry {
        ConnectionId id = 0;
        std::shared_ptr<Connection::Handler> handler;
    };

    struct State {
        std::deque<std::function<void(State&)>> pending;
        std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers;
        ConnectionId nextId = 1;

        void Deliver(std::type_index type, const std::any& event);
        void Attach(std::type_index type, ConnectionId id,
                    std::shared_ptr<Connection::Handler> handler);
        void Detach(std::type_index type, ConnectionId id);
    };

    /// The shared state, recreated after this dispatcher was moved from.
    State& MutableState() {
        if (!state_) {
            state_ = std::make_shared<State>();
        }
        return *state_;
    }

    std::shared_ptr<State> state_;
};

} // namespace es::ecs
