#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <utility>

namespace harbor::ui {

// UI-thread task queue. A "turn" runs every task that was queued before the
// turn started; anything posted while it runs waits for the next turn.
class RunLoop {
public:
  using Task = std::function<void()>;

  RunLoop() = default;
  RunLoop(const RunLoop &) = delete;
  RunLoop &operator=(const RunLoop &) = delete;

  static RunLoop &main() {
    static RunLoop loop;
    return loop;
  }

  void post(Task task) {
    if (task) {
      queue_.push_back(std::move(task));
    }
  }

  bool pending() const { return !queue_.empty(); }

  std::size_t pending_count() const { return queue_.size(); }

  std::size_t turns() const { return turns_; }

  std::size_t run_turn() {
    std::deque<Task> batch;
    batch.swap(queue_);
    ++turns_;
    for (auto &task : batch) {
      task();
    }
    return batch.size();
  }

  std::size_t run_until_idle(std::size_t max_turns = 64) {
    std::size_t n = 0;
    while (pending() && n < max_turns) {
      run_turn();
      ++n;
    }
    return n;
  }

private:
  std::deque<Task> queue_{};
  std::size_t turns_{0};
};

// Collapses every arm() within one turn into a single callback on the next
// turn. Destroying the task cancels a queued callback.
class CoalescedTask {
public:
  CoalescedTask(RunLoop &loop, std::function<void()> fn)
      : loop_{&loop}, state_{std::make_shared<State>()} {
    state_->fn = std::move(fn);
  }

  CoalescedTask(const CoalescedTask &) = delete;
  CoalescedTask &operator=(const CoalescedTask &) = delete;

  bool pending() const { return state_->pending; }

  std::size_t fire_count() const { return state_->fired; }

  void arm() {
    if (state_->pending) {
      return;
    }
    state_->pending = true;
    std::weak_ptr<State> weak = state_;
    loop_->post([weak]() {
      auto state = weak.lock();
      if (!state) {
        return;
      }
      state->pending = false;
      ++state->fired;
      if (state->fn) {
        state->fn();
      }
    });
  }

private:
  struct State {
    bool pending{false};
    std::size_t fired{0};
    std::function<void()> fn;
  };

  RunLoop *loop_{};
  std::shared_ptr<State> state_;
};

} // namespace harbor::ui
