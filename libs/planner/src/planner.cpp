/**
 * @file planner.cpp
 * @brief Ranking and booking implementation.
 * @author Watosn
 */

#include "obsplan/planner/planner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "obsplan/core/angles.hpp"
#include "obsplan/core/time_utils.hpp"

namespace obsplan::planner {
namespace {

using visibility::ObservabilityWindow;
using Booking = std::pair<double, double>;

struct Candidate {
  const catalog::Target* target{};
  std::vector<ObservabilityWindow> windows{};
  double score{};
  double earliest{};
};

bool ranks_before(const Candidate& a, const Candidate& b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  if (a.earliest != b.earliest) {
    return a.earliest < b.earliest;
  }
  return a.target->id < b.target->id;
}

double slot_length(const catalog::Target& target, const ObservabilityWindow& w, const PlanPolicy& policy) {
  if (target.exposure_s) {
    return *target.exposure_s;
  }
  return (policy.default_slot_s > 0.0) ? policy.default_slot_s : w.duration_s();
}

/**
 * @brief Earliest start in `w` for a slot of `len` seconds clear of `booked` (sorted, disjoint).
 */
std::optional<double> find_slot(const std::vector<Booking>& booked, const ObservabilityWindow& w, double len) {
  if (len > w.duration_s()) {
    return std::nullopt;
  }
  double s = w.start_utc_s;
  for (const auto& [a, b] : booked) {
    if (b <= s) {
      continue;
    }
    if (a >= s + len) {
      break;
    }
    s = b;
  }
  if (s + len > w.end_utc_s) {
    return std::nullopt;
  }
  return s;
}

void book(std::vector<Booking>& booked, double start, double end) {
  const Booking slot{start, end};
  booked.insert(std::upper_bound(booked.begin(), booked.end(), slot), slot);
}

}  // namespace

std::string_view to_string(Scoring scoring) {
  switch (scoring) {
    case Scoring::PriorityWeighted:
      return "priority";
    case Scoring::TotalVisibleTime:
      return "visible_time";
    case Scoring::MaxAltitude:
      return "max_altitude";
    case Scoring::EarliestWindow:
      return "earliest";
  }
  return "unknown";
}

std::optional<Scoring> parse_scoring(std::string_view text) {
  for (const Scoring s : {Scoring::PriorityWeighted, Scoring::TotalVisibleTime, Scoring::MaxAltitude, Scoring::EarliestWindow}) {
    if (text == to_string(s)) {
      return s;
    }
  }
  return std::nullopt;
}

std::string_view to_string(ConflictRule rule) {
  switch (rule) {
    case ConflictRule::SingleTelescope:
      return "single";
    case ConflictRule::AllowOverlap:
      return "overlap";
  }
  return "unknown";
}

std::optional<ConflictRule> parse_conflict_rule(std::string_view text) {
  for (const ConflictRule r : {ConflictRule::SingleTelescope, ConflictRule::AllowOverlap}) {
    if (text == to_string(r)) {
      return r;
    }
  }
  return std::nullopt;
}

double score(Scoring scoring, const catalog::Target& target, const std::vector<ObservabilityWindow>& windows) {
  switch (scoring) {
    case Scoring::PriorityWeighted:
      return target.priority;
    case Scoring::TotalVisibleTime: {
      double total = 0.0;
      for (const auto& w : windows) {
        total += w.duration_s();
      }
      return total / 3600.0;
    }
    case Scoring::MaxAltitude: {
      double best = -90.0;
      for (const auto& w : windows) {
        best = std::max(best, w.max_alt_deg);
      }
      return best;
    }
    case Scoring::EarliestWindow: {
      double earliest = std::numeric_limits<double>::infinity();
      for (const auto& w : windows) {
        earliest = std::min(earliest, w.start_utc_s);
      }
      return -earliest;
    }
  }
  return 0.0;
}

Plan rank(const std::vector<catalog::Target>& targets,
          const std::vector<ObservabilityWindow>& windows,
          const PlanPolicy& policy) {
  Plan plan{};
  if (!(policy.default_slot_s >= 0.0) || !std::isfinite(policy.pa_deg)
      || (policy.instrument && fov::validate_profile(*policy.instrument) != core::Status::Ok)) {
    plan.status = core::Status::InvalidInput;
    return plan;
  }

  std::map<std::string, std::vector<ObservabilityWindow>> by_target;
  for (const auto& w : windows) {
    by_target[w.target_id].push_back(w);
  }

  std::vector<Candidate> cands;
  std::vector<std::string> without_windows;
  std::set<std::string> seen;
  for (const auto& t : targets) {
    if (!seen.insert(t.id).second) {
      spdlog::warn("duplicate target '{}' ignored", t.id);
      continue;
    }
    if (catalog::validate_target(t) != core::Status::Ok) {
      spdlog::warn("invalid target '{}' not planned", t.id);
      without_windows.push_back(t.id);
      continue;
    }
    const auto it = by_target.find(t.id);
    if (it == by_target.end() || it->second.empty()) {
      without_windows.push_back(t.id);
      continue;
    }
    std::vector<ObservabilityWindow> ws = it->second;
    std::sort(ws.begin(), ws.end(), [](const ObservabilityWindow& a, const ObservabilityWindow& b) {
      return (a.start_utc_s != b.start_utc_s) ? a.start_utc_s < b.start_utc_s : a.site_id < b.site_id;
    });
    const double s = score(policy.scoring, t, ws);
    const double earliest = ws.front().start_utc_s;
    cands.push_back(Candidate{.target = &t, .windows = std::move(ws), .score = s, .earliest = earliest});
  }
  std::sort(cands.begin(), cands.end(), ranks_before);

  std::map<std::string, std::vector<Booking>> booked;
  std::set<std::string> done;
  for (std::size_t i = 0; i < cands.size(); ++i) {
    const Candidate& c = cands[i];
    if (done.count(c.target->id) != 0U) {
      continue;
    }
    bool placed = false;
    for (const auto& w : c.windows) {
      const double len = slot_length(*c.target, w, policy);
      std::optional<double> start;
      if (policy.conflict == ConflictRule::AllowOverlap) {
        if (len <= w.duration_s()) {
          start = w.start_utc_s;
        }
      } else {
        start = find_slot(booked[w.site_id], w, len);
      }
      if (!start) {
        continue;
      }
      if (policy.conflict == ConflictRule::SingleTelescope) {
        book(booked[w.site_id], *start, *start + len);
      }

      PlanEntry entry{.target_id = c.target->id,
                      .site_id = w.site_id,
                      .rank = i + 1,
                      .score = c.score,
                      .slot_start_utc_s = *start,
                      .slot_end_utc_s = *start + len,
                      .window = w,
                      .deferred = *start > c.earliest};
      done.insert(c.target->id);
      placed = true;

      if (policy.instrument) {
        const fov::Pointing pointing{.center = c.target->position, .pa_deg = policy.pa_deg};
        entry.pointing = pointing;
        const auto fp = fov::footprint_at(*policy.instrument, pointing);
        for (std::size_t j = i + 1; fp.status == core::Status::Ok && j < cands.size(); ++j) {
          const Candidate& other = cands[j];
          if (done.count(other.target->id) != 0U || !fov::contains(fp.footprint, other.target->position)) {
            continue;
          }
          const auto cover = std::find_if(other.windows.begin(), other.windows.end(), [&](const ObservabilityWindow& ow) {
            return ow.site_id == w.site_id && ow.start_utc_s <= entry.slot_start_utc_s && ow.end_utc_s >= entry.slot_end_utc_s;
          });
          if (cover == other.windows.end()) {
            continue;
          }
          plan.entries.push_back(PlanEntry{.target_id = other.target->id,
                                           .site_id = w.site_id,
                                           .rank = j + 1,
                                           .score = other.score,
                                           .slot_start_utc_s = entry.slot_start_utc_s,
                                           .slot_end_utc_s = entry.slot_end_utc_s,
                                           .window = *cover,
                                           .pointing = pointing,
                                           .co_observed_with = c.target->id,
                                           .deferred = entry.slot_start_utc_s > other.earliest});
          done.insert(other.target->id);
        }
      }
      plan.entries.push_back(std::move(entry));
      break;
    }
    if (!placed) {
      spdlog::debug("target '{}' has no free slot in {} windows", c.target->id, c.windows.size());
      plan.unscheduled.push_back(c.target->id);
    }
  }
  plan.unscheduled.insert(plan.unscheduled.end(), without_windows.begin(), without_windows.end());

  std::sort(plan.entries.begin(), plan.entries.end(), [](const PlanEntry& a, const PlanEntry& b) {
    return (a.slot_start_utc_s != b.slot_start_utc_s) ? a.slot_start_utc_s < b.slot_start_utc_s : a.rank < b.rank;
  });
  return plan;
}

std::string plan_to_csv(const Plan& plan) {
  std::string out = "rank,target_id,site_id,slot_start_utc,slot_end_utc,window_start_utc,window_end_utc,max_alt_deg,score,"
                    "pointing_ra,pointing_dec,pa_deg,co_observed_with\n";
  for (const auto& e : plan.entries) {
    std::string pointing = ",,";
    if (e.pointing) {
      pointing = fmt::format("{},{},{:.2f}", core::angles::format_ra(e.pointing->center.ra_deg),
                             core::angles::format_dec(e.pointing->center.dec_deg), e.pointing->pa_deg);
    }
    out += fmt::format("{},{},{},{},{},{},{},{:.4f},{:.6g},{},{}\n", e.rank, e.target_id, e.site_id,
                       core::format_iso8601(e.slot_start_utc_s), core::format_iso8601(e.slot_end_utc_s),
                       core::format_iso8601(e.window.start_utc_s), core::format_iso8601(e.window.end_utc_s),
                       e.window.max_alt_deg, e.score, pointing, e.co_observed_with);
  }
  return out;
}

}  // namespace obsplan::planner
