// Repository: Storyline
// Component: Signal
// Purpose: Synchronous, ordered observer list with scoped connections.
//          Shared by the command channel and the media adapters.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_UTIL_SIGNAL_HPP_
#define STORYLINE_UTIL_SIGNAL_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <vector>

#include "storyline/util/Subscription.hpp"

namespace storyline::util {

// Signal<Args...> dispatches to its slots in connection order.
//
// Reentrancy:
// - A slot may disconnect itself or any other slot while Emit() is running;
//   disconnected slots that have not been reached yet are skipped.
// - Slots connected during Emit() are not invoked by that Emit().
// - The returned Subscription may outlive the Signal; resetting it afterwards
//   is a no-op.
//
// Not thread-safe: use from the control thread only.
template <typename... Args>
class Signal {
 public:
  using Slot = std::function<void(Args...)>;

  Signal() : registry_(std::make_shared<Registry>()) {}

  Signal(const Signal&) = delete;
  Signal& operator=(const Signal&) = delete;

  [[nodiscard]] Subscription Connect(Slot slot) {
    const uint64_t id = registry_->next_id++;
    registry_->slots.emplace(id, std::move(slot));
    std::weak_ptr<Registry> weak = registry_;
    return Subscription([weak, id]() {
      if (auto registry = weak.lock()) {
        registry->slots.erase(id);
      }
    });
  }

  void Emit(Args... args) const {
    // Hold the registry so a slot that destroys the owner does not pull the
    // slot map out from under this loop.
    std::shared_ptr<Registry> registry = registry_;
    std::vector<uint64_t> ids;
    ids.reserve(registry->slots.size());
    for (const auto& entry : registry->slots) {
      ids.push_back(entry.first);
    }
    for (uint64_t id : ids) {
      auto it = registry->slots.find(id);
      if (it == registry->slots.end()) continue;
      Slot slot = it->second;
      slot(args...);
    }
  }

  void DisconnectAll() { registry_->slots.clear(); }

  [[nodiscard]] std::size_t size() const { return registry_->slots.size(); }
  [[nodiscard]] bool empty() const { return registry_->slots.empty(); }

 private:
  struct Registry {
    std::map<uint64_t, Slot> slots;
    uint64_t next_id = 1;
  };

  std::shared_ptr<Registry> registry_;
};

}  // namespace storyline::util

#endif  // STORYLINE_UTIL_SIGNAL_HPP_
