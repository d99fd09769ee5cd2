/// @file event_dispatcher.cpp
/// @brief Deferred event queue draining and handler bookkeeping.

#include "es/ecs/event_dispatcher.hpp"

#include "es/foundation/ecs_logger.hpp"

#include <algorithm>
#include <string>

namespace es::ecs {

// ── Connection ───────────────────────────────────────────────────────

void EventDispatcher::Connection::Connect() const {
    auto state = state_.lock();
    if (!state) {
        return;
    }
    state->pending.push_back([id = id_, type = type_, handler = handler_](State& s) {
        s.Attach(type, id, handler);
    });
}

void EventDispatcher::Connection::Disconnect() const {
    auto state = state_.lock();
    if (!state) {
        return;
    }
    state->pending.push_back([id = id_, type = type_](State& s) { s.Detach(type, id); });
}

// ── Dispatcher ───────────────────────────────────────────────────────

void EventDispatcher::Dispatch() {
    if (!state_) {
        return;
    }
    // Handlers may move this dispatcher away; hold the state locally.
    auto state = state_;
    std::size_t processed = 0;
    while (!state->pending.empty()) {
        auto op = std::move(state->pending.front());
        state->pending.pop_front();
        op(*state);
        ++processed;
    }
    if (processed > 0) {
        ES_LOG(foundation::LogLevel::Trace, foundation::LogCategory::Event,
               "dispatched " + std::to_string(processed) + " queued operations");
    }
}

// ── State ────────────────────────────────────────────────────────────

void EventDispatcher::State::Deliver(std::type_index type, const std::any& event) {
    auto it = handlers.find(type);
    if (it == handlers.end()) {
        return;
    }
    // Snapshot: handlers only queue changes, but the list must stay
    // stable while it is walked.
    auto snapshot = it->second;
    for (const auto& entry : snapshot) {
        (*entry.handler)(event);
    }
}

void EventDispatcher::State::Attach(std::type_index type, ConnectionId id,
                                    std::shared_ptr<Connection::Handler> handler) {
    auto& entries = handlers[type];
    auto found = std::find_if(entries.begin(), entries.end(),
                              [id](const HandlerEntry& e) { return e.id == id; });
    if (found != entries.end()) {
        return;
    }
    entries.push_back(HandlerEntry{id, std::move(handler)});
}

void EventDispatcher::State::Detach(std::type_index type, ConnectionId id) {
    auto it = handlers.find(type);
    if (it == handlers.end()) {
        return;
    }
    auto& entries = it->second;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [id](const HandlerEntry& e) { return e.id == id; }),
                  entries.end());
    if (entries.empty()) {
        handlers.erase(it);
    }
}

} // namespace es::ecs
