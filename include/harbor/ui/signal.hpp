#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace harbor::ui {

class Signal;

class Subscription {
public:
  Subscription() = default;
  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;

  Subscription(Subscription &&other) noexcept
      : slots_{std::move(other.slots_)}, id_{std::exchange(other.id_, 0)} {}

  Subscription &operator=(Subscription &&other) noexcept {
    if (this == &other) {
      return *this;
    }
    reset();
    slots_ = std::move(other.slots_);
    id_ = std::exchange(other.id_, 0);
    return *this;
  }

  ~Subscription() { reset(); }

  bool active() const { return id_ != 0 && !slots_.expired(); }

  void reset();

private:
  friend class Signal;
  using SlotMap = std::unordered_map<std::uint64_t, std::function<void()>>;

  Subscription(std::weak_ptr<SlotMap> slots, std::uint64_t id)
      : slots_{std::move(slots)}, id_{id} {}

  std::weak_ptr<SlotMap> slots_{};
  std::uint64_t id_{};
};

// Single-threaded notification fan-out. A subscription outliving its signal
// is harmless; a signal outliving its subscriptions simply forgets them.
class Signal {
public:
  using Callback = std::function<void()>;

  Signal() = default;
  Signal(const Signal &) = delete;
  Signal &operator=(const Signal &) = delete;

  [[nodiscard]] Subscription subscribe(Callback cb) {
    const auto id = ++next_id_;
    slots_->emplace(id, std::move(cb));
    return Subscription{slots_, id};
  }

  std::size_t size() const { return slots_->size(); }

  void notify() {
    const auto slots = slots_;
    std::vector<std::pair<std::uint64_t, Callback>> callbacks;
    callbacks.reserve(slots->size());
    for (auto &kv : *slots) {
      callbacks.emplace_back(kv.first, kv.second);
    }
    for (auto &[id, cb] : callbacks) {
      // A callback may unsubscribe a later one.
      if (slots->find(id) == slots->end()) {
        continue;
      }
      if (cb) {
        cb();
      }
    }
  }

private:
  std::shared_ptr<Subscription::SlotMap> slots_{
      std::make_shared<Subscription::SlotMap>()};
  std::uint64_t next_id_{0};
};

inline void Subscription::reset() {
  if (id_ == 0) {
    return;
  }
  if (auto slots = slots_.lock()) {
    slots->erase(id_);
  }
  slots_.reset();
  id_ = 0;
}

} // namespace harbor::ui
