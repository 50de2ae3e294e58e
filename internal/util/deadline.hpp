#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "internal/util/errors.hpp"

namespace fieldwake::util {

/*
  Runs fn on a helper thread and waits at most `timeout` for it.

  On timeout DeadlineExceeded is thrown and the result is abandoned; the
  helper thread is detached through the shared state, so fn must only touch
  state it owns or that outlives it (shared_ptr captures).
  Exceptions thrown by fn propagate unchanged.
*/
template <typename Fn>
auto CallWithTimeout(const std::string& what, std::chrono::milliseconds timeout, Fn&& fn) -> decltype(fn()) {
  using Result = decltype(fn());

  auto task   = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
  auto future = task->get_future();
  std::thread([task] { (*task)(); }).detach();

  if (future.wait_for(timeout) != std::future_status::ready) {
    throw DeadlineExceeded(what + " timed out after " + std::to_string(timeout.count()) + "ms");
  }
  return future.get();
}

} // namespace fieldwake::util
