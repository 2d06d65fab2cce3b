// Repository: Storyline
// Component: Subscription
// Copyright (c) 2025 Storyline

#include "storyline/util/Subscription.hpp"

#include <utility>

namespace storyline::util {

Subscription::Subscription(std::function<void()> unsubscribe)
    : unsubscribe_(std::move(unsubscribe)) {}

Subscription::~Subscription() {
  Reset();
}

Subscription::Subscription(Subscription&& other) noexcept
    : unsubscribe_(std::move(other.unsubscribe_)) {
  other.unsubscribe_ = nullptr;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Reset();
    unsubscribe_ = std::move(other.unsubscribe_);
    other.unsubscribe_ = nullptr;
  }
  return *this;
}

void Subscription::Reset() {
  if (!unsubscribe_) return;
  // Clear before invoking so a re-entrant Reset() from inside the callback
  // is a no-op.
  auto fn = std::move(unsubscribe_);
  unsubscribe_ = nullptr;
  fn();
}

}  // namespace storyline::util
