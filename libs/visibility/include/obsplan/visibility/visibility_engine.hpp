/**
 * @file visibility_engine.hpp
 * @brief Observability window computation for single targets, batches and multiple sites.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "obsplan/catalog/target.hpp"
#include "obsplan/constraints/constraint_set.hpp"
#include "obsplan/ephem/sky_state.hpp"
#include "obsplan/site/site.hpp"
#include "obsplan/visibility/window.hpp"

namespace obsplan::visibility {

/**
 * @brief Result for one target within a batch; failures are isolated per entry.
 */
struct BatchEntry {
  std::string target_id{};
  std::vector<ObservabilityWindow> windows{};
  std::size_t fallback_brackets{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Batch output in input target order.
 *
 * `status` is `Ok` unless the batch as a whole could not run (invalid site/time range) or was cancelled.
 */
struct BatchResult {
  std::string site_id{};
  std::vector<BatchEntry> entries{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief One batch per site, in input site order.
 */
struct MultiSiteResult {
  std::vector<BatchResult> sites{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Breakpoint/midpoint window engine.
 *
 * Boundary crossings of the active constraint set split the time range into intervals of
 * constant truth value; each interval is evaluated once at its midpoint and true intervals
 * are merged into windows.
 */
class VisibilityEngine final {
 public:
  struct Config {
    /// False gaps shorter than this between true intervals are coalesced.
    double min_gap_s{60.0};
    constraints::CrossingOptions crossing{};
    /// Dense sampling step inside crossing brackets that did not converge.
    double fallback_step_s{10.0};
    /// Coarse sampling step for the max-altitude search inside a window.
    double quality_step_s{300.0};
    /// Batch worker threads; 0 uses the hardware concurrency.
    std::size_t workers{0};
    ephem::SkyStateCache::Config cache{};
  };

  static std::unique_ptr<VisibilityEngine> Create(const Config& config);

  /**
   * @brief Windows of one target; builds its own sky cache.
   *
   * The target's own constraint set, when present, replaces `set`.
   */
  [[nodiscard]] WindowsResult compute_windows(const catalog::Target& target,
                                              const site::Site& site,
                                              const constraints::ConstraintSet& set,
                                              const core::TimeSpec& span) const;

  /**
   * @brief Windows of one target against a shared cache.
   *
   * `shared` holds precomputed crossings of the set's target-independent members.
   */
  [[nodiscard]] WindowsResult compute_windows(const catalog::Target& target,
                                              const constraints::ConstraintSet& set,
                                              const ephem::SkyStateCache& sky,
                                              const constraints::CrossingResult* shared = nullptr,
                                              const CancellationToken* cancel = nullptr) const;

  /**
   * @brief Windows of many targets sharing one sky cache, spread over worker threads.
   */
  [[nodiscard]] BatchResult compute_batch(const std::vector<catalog::Target>& targets,
                                          const site::Site& site,
                                          const constraints::ConstraintSet& set,
                                          const core::TimeSpec& span,
                                          const CancellationToken* cancel = nullptr) const;

  [[nodiscard]] MultiSiteResult compute_multi_site(const std::vector<catalog::Target>& targets,
                                                   const std::vector<site::Site>& sites,
                                                   const constraints::ConstraintSet& set,
                                                   const core::TimeSpec& span,
                                                   const CancellationToken* cancel = nullptr) const;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  explicit VisibilityEngine(const Config& config) : config_(config) {}

  void fill_quality(ObservabilityWindow& w, const catalog::Target& target, const ephem::SkyStateCache& sky) const;
  [[nodiscard]] std::size_t worker_count(std::size_t jobs) const;

  Config config_{};
};

/**
 * @brief Windows of one target with default engine settings.
 */
[[nodiscard]] WindowsResult compute_windows(const catalog::Target& target,
                                            const site::Site& site,
                                            const constraints::ConstraintSet& set,
                                            const core::TimeSpec& span);

}  // namespace obsplan::visibility
