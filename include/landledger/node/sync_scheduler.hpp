#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "landledger/node/consensus.hpp"
#include "landledger/node/mempool_sync.hpp"

namespace landledger::node {

  /**
   * Background worker that keeps a node converged with its peers. Each cycle
   * runs the resolve phase then the mempool phase; the interval is slept
   * between the end of one cycle and the start of the next. A phase that
   * throws is reported (spdlog + on_error) and the loop carries on.
   */
  class SyncScheduler {
    public:
      using Phase = std::function<void()>;
      using ErrorCallback = std::function<void(const std::string& phase, const std::string& message)>;

      SyncScheduler(Phase resolve, Phase synchronize, std::chrono::milliseconds interval,
                    ErrorCallback on_error = nullptr);
      SyncScheduler(ConsensusResolver& resolver, MempoolSynchronizer& synchronizer,
                    std::chrono::milliseconds interval, ErrorCallback on_error = nullptr);
      ~SyncScheduler();

      SyncScheduler(const SyncScheduler&) = delete;
      SyncScheduler& operator=(const SyncScheduler&) = delete;

      void start();
      // Wakes the worker if it is sleeping and joins it.
      void stop();

      // One cycle on the calling thread; never overlaps with the worker's.
      void run_cycle();

      uint64_t cycles() const { return cycles_.load(); }
      bool running() const { return worker_.joinable(); }

    private:
      void loop();
      void run_phase(const char* name, const Phase& phase);

      Phase resolve_;
      Phase synchronize_;
      std::chrono::milliseconds interval_;
      ErrorCallback on_error_;

      std::mutex cycle_mutex_;
      std::mutex wake_mutex_;
      std::condition_variable wake_;
      bool stop_requested_ = false;
      std::atomic<uint64_t> cycles_{0};
      std::thread worker_;
  };
}
