#pragma once

#include <atomic>

namespace chainweave::model {

/*
  Cooperative cancellation flag shared by a ChainRun, its snapshots and
  the plugins it invokes. Setting it never interrupts a running plugin.
*/
class CancellationToken {
 public:
  void Cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace chainweave::model
