#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/core/engine_context.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/fragment_record.hpp"
#include "internal/util/time.hpp"

namespace fieldwake::sweep {

struct SweepResult {
  std::vector<db::model::FragmentKey> expired;
  uint32_t                            transfers_failed  = 0;
  uint32_t                            wakes_failed      = 0;
  uint32_t                            missing_requested = 0;
  db::PruneCounts                     pruned;
};

/*
  Background worker for transfer liveness and retention.

  Every sweep_interval it:
    - deletes fragments idle for longer than the fragment ttl, marks each
      affected receiving transfer and its in-flight wake failed with
      transfer_expired, and reports it once. Receiving transfers that never
      got a fragment expire on the same ttl, measured from their last update.
    - asks for the gaps of receiving transfers that have been quiet for
      recovery_delay, within the max_missing_requests budget. This covers a
      lost tail fragment, which never triggers a request on arrival.
    - prunes finished rows older than the retention window.
*/
class ChunkSweeper {
 public:
  explicit ChunkSweeper(core::EngineContext context);
  ~ChunkSweeper();

  void Start();
  void Stop();

  SweepResult SweepOnce(util::TimePoint now);

 private:
  void Run();
  bool ExpireTransfer(const db::model::FragmentKey& key, util::TimePoint now, bool& wake_failed);
  bool RecoverTransfer(const db::model::FragmentKey& key, util::TimePoint now);

  core::EngineContext ctx_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
};

} // namespace fieldwake::sweep
