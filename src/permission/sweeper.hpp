#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>

#include "permission/tracker.hpp"

namespace toolgate::permission {

// Periodically purges expired time grants from a tracker. Purely an optimization:
// check_and_reserve already ignores expired grants.
//
// The timer runs on the caller's io_context. Call stop() from the io_context's thread,
// or after the io_context has stopped running.
class GrantSweeper {
 public:
  GrantSweeper(asio::io_context &io_ctx, PermissionTracker &tracker, std::chrono::steady_clock::duration interval);
  ~GrantSweeper();

  GrantSweeper(const GrantSweeper &) = delete;
  GrantSweeper &operator=(const GrantSweeper &) = delete;

  // No-op if already running or the interval is not positive
  void start();
  void stop();

  bool running() const {
    return running_;
  }

  // Completed sweeps since start()
  size_t sweep_count() const {
    return sweeps_;
  }

 private:
  void arm();

  asio::steady_timer timer_;
  PermissionTracker &tracker_;
  std::chrono::steady_clock::duration interval_;
  std::atomic<bool> running_{false};
  std::atomic<size_t> sweeps_{0};
};

}  // namespace toolgate::permission
