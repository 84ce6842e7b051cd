/**
 * @file constraints.hpp
 * @brief Concrete observability constraints.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "obsplan/constraints/constraint.hpp"

namespace obsplan::constraints {

/**
 * @brief Altitude floor and optional ceiling, optionally raised by the site horizon profile.
 *
 * Crossings come from closed-form hour-angle predictions refined by bisection; a horizon
 * profile falls back to the generic scan.
 */
class ElevationConstraint final : public IConstraint {
 public:
  struct Config {
    double min_alt_deg{15.0};
    double max_alt_deg{90.0};
    bool use_horizon{false};
  };

  /**
   * @brief Build the constraint; nullptr when the limits are not finite or `min_alt_deg > max_alt_deg`.
   */
  static std::unique_ptr<ElevationConstraint> Create(const Config& config);

  [[nodiscard]] ConstraintKind kind() const override { return ConstraintKind::Elevation; }
  [[nodiscard]] std::string name() const override;
  [[nodiscard]] double margin(const EvaluationContext& ctx) const override;
  [[nodiscard]] CrossingResult boundary_crossings(const catalog::Target& target,
                                                  const ephem::SkyStateCache& sky,
                                                  const core::TimeSpec& span,
                                                  const CrossingOptions& options) const override;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  explicit ElevationConstraint(const Config& config) : config_(config) {}
  Config config_{};
};

/**
 * @brief Allowed azimuth arc, measured clockwise (north through east) from `min_az_deg` to `max_az_deg`.
 *
 * `min_az_deg > max_az_deg` wraps through north.
 */
class AzimuthConstraint final : public IConstraint {
 public:
  struct Config {
    double min_az_deg{0.0};
    double max_az_deg{360.0};
  };

  static std::unique_ptr<AzimuthConstraint> Create(const Config& config);

  [[nodiscard]] ConstraintKind kind() const override { return ConstraintKind::Azimuth; }
  [[nodiscard]] std::string name() const override;
  [[nodiscard]] double margin(const EvaluationContext& ctx) const override;

 private:
  AzimuthConstraint(const Config& config, double width_deg) : config_(config), width_deg_(width_deg) {}
  Config config_{};
  double width_deg_{};
};

/**
 * @brief Maximum airmass, evaluated as the equivalent altitude floor.
 */
class AirmassConstraint final : public IConstraint {
 public:
  struct Config {
    double max_airmass{2.0};
  };

  static std::unique_ptr<AirmassConstraint> Create(const Config& config);

  [[nodiscard]] ConstraintKind kind() const override { return ConstraintKind::Airmass; }
  [[nodiscard]] std::string name() const override;
  [[nodiscard]] double margin(const EvaluationContext& ctx) const override;
  [[nodiscard]] CrossingResult boundary_crossings(const catalog::Target& target,
                                                  const ephem::SkyStateCache& sky,
                                                  const core::TimeSpec& span,
                                                  const CrossingOptions& options) const override;

  [[nodiscard]] double min_alt_deg() const { return min_alt_deg_; }

 private:
  AirmassConstraint(const Config& config, double min_alt_deg) : config_(config), min_alt_deg_(min_alt_deg) {}
  Config config_{};
  double min_alt_deg_{};
};

/**
 * @brief Minimum angular distance between target and topocentric Moon.
 */
class MoonSeparationConstraint final : public IConstraint {
 public:
  struct Config {
    double min_separation_deg{30.0};
  };

  static std::unique_ptr<MoonSeparationConstraint> Create(const Config& config);

  [[nodiscard]] ConstraintKind kind() const override { return ConstraintKind::MoonSeparation; }
  [[nodiscard]] std::string name() const override;
  [[nodiscard]] double margin(const EvaluationContext& ctx) const override;

 private:
  explicit MoonSeparationConstraint(const Config& config) : config_(config) {}
  Config config_{};
};

/**
 * @brief Maximum illuminated lunar fraction, enforced only while the Moon is above the horizon.
 */
class MoonIlluminationConstraint final : public IConstraint {
 public:
  struct Config {
    double max_fraction{0.5};
  };

  static std::unique_ptr<MoonIlluminationConstraint> Create(const Config& config);

  [[nodiscard]] ConstraintKind kind() const override { return ConstraintKind::MoonIllumination; }
  [[nodiscard]] std::string name() const override;
  [[nodiscard]] double margin(const EvaluationContext& ctx) const override;
  [[nodiscard]] bool target_independent() const override { return true; }

 private:
  explicit MoonIlluminationConstraint(const Config& config) : config_(config) {}
  Config config_{};
};

/**
 * @brief Named twilight definitions (Sun centre altitude in degrees).
 */
enum class Twilight : std::uint8_t { Sunset, Civil, Nautical, Astronomical };

[[nodiscard]] double twilight_altitude_deg(Twilight twilight);
[[nodiscard]] std::string_view to_string(Twilight twilight);
[[nodiscard]] std::optional<Twilight> parse_twilight(std::string_view text);

/**
 * @brief Sun must be at or below an altitude (darkness requirement).
 */
class SunAltitudeConstraint final : public IConstraint {
 public:
  struct Config {
    double max_sun_alt_deg{-12.0};
  };

  static std::unique_ptr<SunAltitudeConstraint> Create(const Config& config);
  static std::unique_ptr<SunAltitudeConstraint> ForTwilight(Twilight twilight) {
    return Create(Config{.max_sun_alt_deg = twilight_altitude_deg(twilight)});
  }

  [[nodiscard]] ConstraintKind kind() const override { return ConstraintKind::SunAltitude; }
  [[nodiscard]] std::string name() const override;
  [[nodiscard]] double margin(const EvaluationContext& ctx) const override;
  [[nodiscard]] bool target_independent() const override { return true; }

 private:
  explicit SunAltitudeConstraint(const Config& config) : config_(config) {}
  Config config_{};
};

/**
 * @brief Caller-supplied margin, e.g. instrument rotator or dome limits.
 */
class CustomConstraint final : public IConstraint {
 public:
  using Margin = std::function<double(const EvaluationContext&)>;

  struct Config {
    std::string name{"custom"};
    Margin margin{};
    bool target_independent{false};
  };

  /**
   * @brief nullptr when no margin function is given.
   */
  static std::unique_ptr<CustomConstraint> Create(Config config);

  [[nodiscard]] ConstraintKind kind() const override { return ConstraintKind::Custom; }
  [[nodiscard]] std::string name() const override { return config_.name; }
  [[nodiscard]] double margin(const EvaluationContext& ctx) const override { return config_.margin(ctx); }
  [[nodiscard]] bool target_independent() const override { return config_.target_independent; }

 private:
  explicit CustomConstraint(Config config) : config_(std::move(config)) {}
  Config config_{};
};

}  // namespace obsplan::constraints
