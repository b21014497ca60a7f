#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <thread>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace capsule::util {

/*
  Bounded retry for transient storage failures.

  Only IOFailure is retried. Every other error (validation, not-found,
  corruption) propagates on the first attempt.
*/
template <typename Fn>
auto RetryOnIOFailure(std::uint32_t attempts, std::string_view operation, Fn&& fn) -> std::invoke_result_t<Fn> {
  const std::uint32_t max_attempts = std::max<std::uint32_t>(attempts, 1);
  auto                backoff      = std::chrono::milliseconds(5);

  for (std::uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const IOFailure& e) {
      if (attempt >= max_attempts) {
        throw;
      }
      CAPSULE_LOG_WARN("Retrying storage operation", {observability::StringField("operation", operation),
                                                      observability::IntField("attempt", attempt), observability::StringField("error", e.what())});
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }
}

} // namespace capsule::util
