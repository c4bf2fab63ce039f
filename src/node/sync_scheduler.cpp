#include "landledger/node/sync_scheduler.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace landledger::node {

  SyncScheduler::SyncScheduler(Phase resolve, Phase synchronize, std::chrono::milliseconds interval,
                               ErrorCallback on_error)
    : resolve_(std::move(resolve)),
      synchronize_(std::move(synchronize)),
      interval_(interval),
      on_error_(std::move(on_error)) {}

  SyncScheduler::SyncScheduler(ConsensusResolver& resolver, MempoolSynchronizer& synchronizer,
                               std::chrono::milliseconds interval, ErrorCallback on_error)
    : SyncScheduler([&resolver] { resolver.resolve(); },
                    [&synchronizer] { synchronizer.synchronize(); },
                    interval, std::move(on_error)) {}

  SyncScheduler::~SyncScheduler() {
    stop();
  }

  void SyncScheduler::start() {
    if (worker_.joinable()) return;
    {
      std::lock_guard<std::mutex> lock(wake_mutex_);
      stop_requested_ = false;
    }
    spdlog::info("sync scheduler started, interval {} ms", interval_.count());
    worker_ = std::thread([this] { loop(); });
  }

  void SyncScheduler::stop() {
    {
      std::lock_guard<std::mutex> lock(wake_mutex_);
      stop_requested_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
      spdlog::info("sync scheduler stopped after {} cycle(s)", cycles());
    }
  }

  void SyncScheduler::loop() {
    for (;;) {
      {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (stop_requested_) return;
      }
      run_cycle();

      std::unique_lock<std::mutex> lock(wake_mutex_);
      if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) return;
    }
  }

  void SyncScheduler::run_cycle() {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    run_phase("resolve", resolve_);
    run_phase("mempool", synchronize_);
    ++cycles_;
  }

  void SyncScheduler::run_phase(const char* name, const Phase& phase) {
    if (!phase) return;
    std::string failure;
    try {
      phase();
      return;
    } catch (const std::exception& e) {
      failure = e.what();
    } catch (...) {
      failure = "unknown exception";
    }

    spdlog::error("sync {} phase failed: {}", name, failure);
    if (on_error_) on_error_(name, failure);
  }
}
