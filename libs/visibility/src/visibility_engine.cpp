/**
 * @file visibility_engine.cpp
 * @brief Observability window engine implementation.
 * @author Watosn
 */

#include "obsplan/visibility/visibility_engine.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <future>
#include <optional>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "obsplan/core/time_utils.hpp"
#include "obsplan/core/transforms.hpp"

namespace obsplan::visibility {
namespace {

constexpr int kGoldenIterations = 40;
constexpr double kInvPhi = 0.6180339887498949;

double altitude_at(const catalog::Target& target, const ephem::SkyStateCache& sky, double t) {
  return constraints::target_state(target, sky.site(), sky.at(t)).altaz.alt_deg;
}

}  // namespace

std::unique_ptr<VisibilityEngine> VisibilityEngine::Create(const Config& config) {
  if (!(config.min_gap_s >= 0.0) || !(config.fallback_step_s > 0.0) || !(config.quality_step_s > 0.0)
      || !(config.crossing.tolerance_s > 0.0) || config.crossing.max_iterations <= 0
      || config.crossing.scan_step_s < 0.0 || !(config.crossing.max_scan_step_s > 0.0)) {
    return nullptr;
  }
  return std::unique_ptr<VisibilityEngine>(new VisibilityEngine(config));
}

WindowsResult VisibilityEngine::compute_windows(const catalog::Target& target,
                                                const site::Site& site,
                                                const constraints::ConstraintSet& set,
                                                const core::TimeSpec& span) const {
  WindowsResult out{};
  if (site::validate_site(site) != core::Status::Ok) {
    out.status = core::Status::InvalidSite;
    return out;
  }
  if (catalog::validate_target(target) != core::Status::Ok) {
    out.status = core::Status::InvalidTarget;
    return out;
  }
  core::Status st = core::Status::Ok;
  const auto sky = ephem::SkyStateCache::Create(site, span, config_.cache, &st);
  if (!sky) {
    out.status = st;
    return out;
  }
  return compute_windows(target, set, *sky);
}

WindowsResult VisibilityEngine::compute_windows(const catalog::Target& target,
                                                const constraints::ConstraintSet& set,
                                                const ephem::SkyStateCache& sky,
                                                const constraints::CrossingResult* shared,
                                                const CancellationToken* cancel) const {
  WindowsResult out{};
  if (catalog::validate_target(target) != core::Status::Ok) {
    out.status = core::Status::InvalidTarget;
    return out;
  }
  const constraints::ConstraintSet& active = target.constraints ? *target.constraints : set;
  if (target.constraints) {
    shared = nullptr;
  }
  const site::Site& site = sky.site();
  const core::TimeSpec& span = sky.span();
  const double t0 = span.start.utc_seconds;
  const double t1 = span.end.utc_seconds;

  const constraints::CrossingResult crossings = active.boundary_crossings(target, sky, span, config_.crossing, shared);
  std::vector<double> breaks{t0};
  for (const double t : crossings.times) {
    if (t > t0 && t < t1) {
      breaks.push_back(t);
    }
  }
  for (const auto& [a, b] : crossings.unresolved) {
    spdlog::warn("target '{}' at site '{}': crossing in [{}, {}] did not converge, sampling every {:.0f} s",
                 target.id, site.id, core::format_iso8601(a), core::format_iso8601(b), config_.fallback_step_s);
    ++out.fallback_brackets;
    for (double t = a; t <= b; t += config_.fallback_step_s) {
      if (t > t0 && t < t1) {
        breaks.push_back(t);
      }
    }
    if (b > t0 && b < t1) {
      breaks.push_back(b);
    }
  }
  breaks.push_back(t1);
  std::sort(breaks.begin(), breaks.end());
  breaks.erase(std::unique(breaks.begin(), breaks.end()), breaks.end());

  if (cancel != nullptr && cancel->cancelled()) {
    out.status = core::Status::Cancelled;
    return out;
  }

  std::vector<std::pair<double, double>> spans;
  for (std::size_t i = 0; i + 1 < breaks.size(); ++i) {
    const double a = breaks[i];
    const double b = breaks[i + 1];
    const ephem::SkySample sample = sky.at(0.5 * (a + b));
    const constraints::EvaluationContext ctx{
        .target = target, .site = site, .sky = sample, .state = constraints::target_state(target, site, sample)};
    if (!active.satisfied(ctx)) {
      continue;
    }
    if (!spans.empty()) {
      const double gap = a - spans.back().second;
      if (gap <= 0.0 || gap < config_.min_gap_s) {
        spans.back().second = b;
        continue;
      }
    }
    spans.emplace_back(a, b);
  }

  out.windows.reserve(spans.size());
  for (const auto& [a, b] : spans) {
    if (!(b > a)) {
      continue;
    }
    ObservabilityWindow w{.target_id = target.id, .site_id = site.id, .start_utc_s = a, .end_utc_s = b};
    fill_quality(w, target, sky);
    out.windows.push_back(std::move(w));
  }
  return out;
}

void VisibilityEngine::fill_quality(ObservabilityWindow& w, const catalog::Target& target, const ephem::SkyStateCache& sky) const {
  const double dur = w.duration_s();
  const auto n = std::max<std::size_t>(2U, static_cast<std::size_t>(std::ceil(dur / config_.quality_step_s)));
  const double h = dur / static_cast<double>(n);
  std::size_t best = 0;
  double best_alt = -90.0;
  for (std::size_t i = 0; i <= n; ++i) {
    const double t = (i == n) ? w.end_utc_s : w.start_utc_s + static_cast<double>(i) * h;
    const double alt = altitude_at(target, sky, t);
    if (i == 0 || alt > best_alt) {
      best = i;
      best_alt = alt;
    }
  }
  double best_t = (best == n) ? w.end_utc_s : w.start_utc_s + static_cast<double>(best) * h;

  // Golden-section refinement around the best sample.
  double a = std::max(w.start_utc_s, best_t - h);
  double b = std::min(w.end_utc_s, best_t + h);
  double c = b - kInvPhi * (b - a);
  double d = a + kInvPhi * (b - a);
  double fc = altitude_at(target, sky, c);
  double fd = altitude_at(target, sky, d);
  for (int i = 0; i < kGoldenIterations && (b - a) > config_.crossing.tolerance_s; ++i) {
    if (fc > fd) {
      b = d;
      d = c;
      fd = fc;
      c = b - kInvPhi * (b - a);
      fc = altitude_at(target, sky, c);
    } else {
      a = c;
      c = d;
      fc = fd;
      d = a + kInvPhi * (b - a);
      fd = altitude_at(target, sky, d);
    }
  }
  const double t_ref = 0.5 * (a + b);
  const double alt_ref = altitude_at(target, sky, t_ref);
  if (alt_ref > best_alt) {
    best_alt = alt_ref;
    best_t = t_ref;
  }
  w.max_alt_deg = best_alt;
  w.max_alt_utc_s = best_t;
  w.min_airmass = core::airmass(best_alt);
}

std::size_t VisibilityEngine::worker_count(std::size_t jobs) const {
  std::size_t n = config_.workers;
  if (n == 0) {
    n = std::max(1U, std::thread::hardware_concurrency());
  }
  return std::max<std::size_t>(1U, std::min(n, jobs));
}

BatchResult VisibilityEngine::compute_batch(const std::vector<catalog::Target>& targets,
                                            const site::Site& site,
                                            const constraints::ConstraintSet& set,
                                            const core::TimeSpec& span,
                                            const CancellationToken* cancel) const {
  BatchResult out{.site_id = site.id};
  core::Status st = core::Status::Ok;
  const auto sky = ephem::SkyStateCache::Create(site, span, config_.cache, &st);
  if (!sky) {
    spdlog::error("batch for site '{}' not run: {}", site.id, core::to_string(st));
    out.status = st;
    return out;
  }

  std::optional<constraints::CrossingResult> shared;
  if (set.has_target_independent()) {
    shared = set.target_independent_crossings(*sky, span, config_.crossing);
  }
  const constraints::CrossingResult* shared_ptr = shared ? &*shared : nullptr;

  out.entries.resize(targets.size());
  std::atomic<std::size_t> next{0};
  auto work = [&]() {
    for (std::size_t i = next.fetch_add(1); i < targets.size(); i = next.fetch_add(1)) {
      BatchEntry& e = out.entries[i];
      e.target_id = targets[i].id;
      if (cancel != nullptr && cancel->cancelled()) {
        e.status = core::Status::Cancelled;
        continue;
      }
      WindowsResult r = compute_windows(targets[i], set, *sky, shared_ptr, cancel);
      e.windows = std::move(r.windows);
      e.fallback_brackets = r.fallback_brackets;
      e.status = r.status;
    }
  };

  const std::size_t workers = worker_count(targets.size());
  if (workers <= 1) {
    work();
  } else {
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (std::size_t k = 0; k < workers; ++k) {
      futures.push_back(std::async(std::launch::async, work));
    }
    for (auto& f : futures) {
      f.get();
    }
  }

  if (cancel != nullptr && cancel->cancelled()) {
    out.status = core::Status::Cancelled;
  }
  const auto failed = std::count_if(out.entries.begin(), out.entries.end(),
                                    [](const BatchEntry& e) { return e.status != core::Status::Ok; });
  spdlog::debug("site '{}': {} targets on {} workers, {} not ok", site.id, targets.size(), workers, failed);
  return out;
}

MultiSiteResult VisibilityEngine::compute_multi_site(const std::vector<catalog::Target>& targets,
                                                     const std::vector<site::Site>& sites,
                                                     const constraints::ConstraintSet& set,
                                                     const core::TimeSpec& span,
                                                     const CancellationToken* cancel) const {
  MultiSiteResult out{};
  out.sites.reserve(sites.size());
  for (const auto& s : sites) {
    if (cancel != nullptr && cancel->cancelled()) {
      out.sites.push_back(BatchResult{.site_id = s.id, .status = core::Status::Cancelled});
      continue;
    }
    out.sites.push_back(compute_batch(targets, s, set, span, cancel));
  }
  if (cancel != nullptr && cancel->cancelled()) {
    out.status = core::Status::Cancelled;
  }
  return out;
}

WindowsResult compute_windows(const catalog::Target& target,
                              const site::Site& site,
                              const constraints::ConstraintSet& set,
                              const core::TimeSpec& span) {
  static const auto engine = VisibilityEngine::Create(VisibilityEngine::Config{});
  return engine->compute_windows(target, site, set, span);
}

}  // namespace obsplan::visibility
