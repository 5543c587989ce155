#include "permission/sweeper.hpp"

#include <spdlog/spdlog.h>

namespace toolgate::permission {

GrantSweeper::GrantSweeper(asio::io_context &io_ctx, PermissionTracker &tracker,
                           std::chrono::steady_clock::duration interval)
    : timer_(io_ctx), tracker_(tracker), interval_(interval) {}

GrantSweeper::~GrantSweeper() {
  stop();
}

void GrantSweeper::start() {
  if (interval_ <= std::chrono::steady_clock::duration::zero()) {
    spdlog::debug("[Tracker] Grant sweep disabled");
    return;
  }
  if (running_.exchange(true)) return;

  sweeps_ = 0;
  arm();
}

void GrantSweeper::stop() {
  if (!running_.exchange(false)) return;
  timer_.cancel();
}

void GrantSweeper::arm() {
  timer_.expires_after(interval_);
  timer_.async_wait([this](const asio::error_code &ec) {
    if (ec == asio::error::operation_aborted || !running_) {
      return;
    }
    if (ec) {
      spdlog::warn("[Tracker] Sweep timer error: {}", ec.message());
      running_ = false;
      return;
    }

    tracker_.cleanup_expired();
    ++sweeps_;
    arm();
  });
}

}  // namespace toolgate::permission
