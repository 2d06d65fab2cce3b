// Repository: Storyline
// Component: Subscription
// Purpose: Move-only scoped registration handle. Destroying (or resetting)
//          the handle removes the listener it represents.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_UTIL_SUBSCRIPTION_HPP_
#define STORYLINE_UTIL_SUBSCRIPTION_HPP_

#include <functional>

namespace storyline::util {

class Subscription {
 public:
  Subscription() = default;
  explicit Subscription(std::function<void()> unsubscribe);
  ~Subscription();

  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  // Unsubscribes now. Idempotent.
  void Reset();

  [[nodiscard]] bool active() const { return static_cast<bool>(unsubscribe_); }

 private:
  std::function<void()> unsubscribe_;
};

}  // namespace storyline::util

#endif  // STORYLINE_UTIL_SUBSCRIPTION_HPP_
