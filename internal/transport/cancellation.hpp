#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace taskgate::transport {

namespace detail {

struct CancelState {
  std::atomic<bool>                                      cancelled{false};
  std::mutex                                             mutex;
  std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
  uint64_t                                               next_id = 1;

  // Returns 0 when the callback already ran because cancellation happened first.
  uint64_t Add(std::function<void()> cb) {
    {
      std::lock_guard lock(mutex);
      if (!cancelled.load(std::memory_order_relaxed)) {
        const uint64_t id = next_id++;
        callbacks.emplace_back(id, std::move(cb));
        return id;
      }
    }
    cb();
    return 0;
  }

  void Remove(uint64_t id) {
    std::lock_guard lock(mutex);
    std::erase_if(callbacks, [id](const auto& entry) { return entry.first == id; });
  }

  void Trigger() {
    std::vector<std::pair<uint64_t, std::function<void()>>> to_invoke;
    {
      std::lock_guard lock(mutex);
      if (cancelled.exchange(true, std::memory_order_acq_rel)) {
        return;
      }
      to_invoke.swap(callbacks);
    }
    // outside the lock: callbacks may re-enter the state
    for (auto& [id, cb] : to_invoke) {
      cb();
    }
  }
};

} // namespace detail

/*
  Cancellation signal shared by a CancelSource and any number of CancelTokens.

  A token registers callbacks with OnCancel(); the returned registration
  unregisters on destruction, so a finished call never observes a late cancel.
*/
class CancelRegistration {
 public:
  CancelRegistration() = default;
  CancelRegistration(CancelRegistration&& other) noexcept : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {
  }
  CancelRegistration& operator=(CancelRegistration&& other) noexcept {
    if (this != &other) {
      Reset();
      state_ = std::move(other.state_);
      id_    = std::exchange(other.id_, 0);
    }
    return *this;
  }
  ~CancelRegistration() {
    Reset();
  }

  CancelRegistration(const CancelRegistration&)            = delete;
  CancelRegistration& operator=(const CancelRegistration&) = delete;

  void Reset() {
    if (state_ && id_ != 0) {
      state_->Remove(id_);
    }
    id_ = 0;
    state_.reset();
  }

 private:
  friend class CancelToken;

  CancelRegistration(std::shared_ptr<detail::CancelState> state, uint64_t id) : state_(std::move(state)), id_(id) {
  }

  std::shared_ptr<detail::CancelState> state_;
  uint64_t                             id_ = 0;
};

class CancelToken {
 public:
  // never cancelled
  CancelToken() = default;

  bool IsCancelled() const noexcept {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  // Runs `callback` immediately when already cancelled.
  template <typename F>
  [[nodiscard]] CancelRegistration OnCancel(F&& callback) const {
    if (!state_) {
      return {};
    }
    return {state_, state_->Add(std::forward<F>(callback))};
  }

 private:
  friend class CancelSource;

  explicit CancelToken(std::shared_ptr<detail::CancelState> state) : state_(std::move(state)) {
  }

  std::shared_ptr<detail::CancelState> state_;
};

class CancelSource {
 public:
  CancelSource() : state_(std::make_shared<detail::CancelState>()) {
  }

  CancelToken Token() const {
    return CancelToken(state_);
  }

  void Cancel() {
    state_->Trigger();
  }

  bool IsCancelled() const noexcept {
    return state_->cancelled.load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<detail::CancelState> state_;
};

} // namespace taskgate::transport
