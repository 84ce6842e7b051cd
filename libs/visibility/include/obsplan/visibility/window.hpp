/**
 * @file window.hpp
 * @brief Observability window value types and cooperative cancellation.
 * @author Watosn
 */
#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "obsplan/core/types.hpp"

namespace obsplan::visibility {

/**
 * @brief Maximal interval in which every active constraint holds for one target at one site.
 *
 * Invariant: `start_utc_s < end_utc_s`; windows of one target/site never overlap.
 */
struct ObservabilityWindow {
  std::string target_id{};
  std::string site_id{};
  double start_utc_s{};
  double end_utc_s{};
  double max_alt_deg{};
  double max_alt_utc_s{};
  double min_airmass{};

  [[nodiscard]] double duration_s() const { return end_utc_s - start_utc_s; }
  [[nodiscard]] bool contains(double utc_seconds) const { return utc_seconds >= start_utc_s && utc_seconds <= end_utc_s; }
};

/**
 * @brief Windows for one target at one site.
 *
 * `fallback_brackets` counts crossing brackets that did not converge and were densely sampled instead.
 */
struct WindowsResult {
  std::vector<ObservabilityWindow> windows{};
  std::size_t fallback_brackets{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Shared flag polled between target units of a batch.
 */
class CancellationToken final {
 public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
  [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace obsplan::visibility
