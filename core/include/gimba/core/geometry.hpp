#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gimba::core {

// Per-diameter input constants of an ISO metric bolt assembly. Millimeters.
struct BoltBaseDimensions {
  int nominal_diameter = 0;                  // D
  double pitch = 0.0;                        // P (DIN 13, DIN ISO 68-1)
  double wrench_size = 0.0;                  // s (DIN 931, DIN 933)
  double head_height = 0.0;                  // k, bolt head and nut
  double head_to_thread = 0.0;               // a, max distance head to thread (DIN 933)
  double washer_hole_diameter = 0.0;         // du1 (DIN 125)
  double washer_diameter = 0.0;              // du2 (DIN 125)
  double washer_thickness = 0.0;             // u (DIN 125)
  std::optional<double> clearance_fine{};    // dh1, H12 (EN 20273)
  std::optional<double> clearance_medium{};  // dh2, H13
  std::optional<double> clearance_coarse{};  // dh3, H14
  double default_grip_length = 0.0;          // dgl
  std::vector<double> customary_lengths{};   // cls, ascending
};

struct BoltDerivedDimensions {
  double pitch_diameter = 0.0;     // d2 = D - 3*sqrt(3)/8 * P
  double thread_height = 0.0;      // H = sqrt(3)/2 * P
  double circumference = 0.0;      // C = pi * D
  double helix_angle_deg = 0.0;    // beta = atan2(P, C)
  double min_thread_short = 0.0;   // b2, bolt lengths < 125
  double min_thread_medium = 0.0;  // b3, bolt lengths < 200
  double min_thread_long = 0.0;    // b4, bolt lengths >= 200
};

[[nodiscard]] BoltDerivedDimensions compute_derived_dimensions(const BoltBaseDimensions& base);

class BoltGeometry {
 public:
  // Throws std::invalid_argument for a non-positive diameter or pitch and for
  // an empty or non-ascending length list.
  explicit BoltGeometry(BoltBaseDimensions base);

  [[nodiscard]] const BoltBaseDimensions& base() const { return base_; }
  [[nodiscard]] const BoltDerivedDimensions& derived() const { return derived_; }

  [[nodiscard]] int nominal_diameter() const { return base_.nominal_diameter; }

  // "M12"
  [[nodiscard]] std::string label() const;
  [[nodiscard]] std::string describe() const;

 private:
  BoltBaseDimensions base_;
  BoltDerivedDimensions derived_;
};

// Thread-facing subset used for appearance edits.
struct ThreadGeometry {
  int nominal_diameter = 0;
  double pitch = 0.0;
  double circumference = 0.0;    // u = pi * D
  double helix_angle_deg = 0.0;  // atan2(P, u)

  [[nodiscard]] static ThreadGeometry FromPitch(int nominal_diameter, double pitch);
  [[nodiscard]] static ThreadGeometry FromBolt(const BoltGeometry& bolt);
  [[nodiscard]] std::string describe() const;
};

class GeometryTable {
 public:
  GeometryTable() = default;

  // Table of the ISO metric coarse-thread series M3..M64.
  [[nodiscard]] static GeometryTable MakeIsoMetric();
  // Built on first call, read-only for the rest of the process.
  [[nodiscard]] static const GeometryTable& IsoMetric();

  // Throws std::invalid_argument when the diameter is already registered.
  const BoltGeometry& Add(BoltBaseDimensions base);

  [[nodiscard]] std::size_t size() const { return bolts_.size(); }
  [[nodiscard]] bool empty() const { return bolts_.empty(); }

  [[nodiscard]] const std::vector<BoltGeometry>& bolt_geometries() const { return bolts_; }
  [[nodiscard]] std::vector<ThreadGeometry> thread_geometries() const;

  [[nodiscard]] const BoltGeometry* find(int nominal_diameter) const;
  // Throws std::out_of_range for an unregistered diameter.
  [[nodiscard]] const BoltGeometry& get(int nominal_diameter) const;

 private:
  std::vector<BoltGeometry> bolts_{};
  std::unordered_map<int, std::size_t> index_by_diameter_{};
};

}  // namespace gimba::core
