#include "gimba/core/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gimba/core/text_format.hpp"

namespace gimba::core {

namespace {

constexpr double kPi = 3.14159265358979323846;

struct IsoMetricRow {
  int d;
  double p, s, k, a, du1, du2, u, dh1, dh2, dh3, dgl;
  std::vector<double> cls;
};

// Sources: DIN 13 / DIN ISO 68-1 (P), DIN 931 / DIN 933 (s, k, a), DIN 125 (du1, du2, u),
// EN 20273 (dh1..dh3). Default grip lengths are own definitions.
std::vector<IsoMetricRow> iso_metric_rows() {
  // clang-format off
  return {
    //  D  P     s     k     a      du1   du2  u     dh1   dh2   dh3   dgl  cls
    {  3, 0.5 ,  5.5,  2  ,  1.5 ,  3.2,   7, 0.5,  3.2,  3.4,  3.6,  10, {3,4,5,6,8,10,12,16,18,20,22,25,30,35,40,50,60}},
    {  4, 0.7 ,  7  ,  2.8,  2.1 ,  4.3,   9, 0.8,  4.3,  4.5,  4.8,  20, {4,6,8,10,12,14,16,18,20,22,25,30,35,40,45,50,55,60,65,70,75,80}},
    {  5, 0.8 ,  8  ,  3.5,  2.4 ,  5.3,  10, 1  ,  5.3,  5.5,  5.8,  50, {6,8,10,12,14,16,18,20,22,25,30,35,40,45,50,55,60,65,70,80,90,100}},
    {  6, 1   , 10  ,  4  ,  3   ,  6.4,  12, 1.6,  6.4,  6.6,  7  ,  50, {6,8,10,12,14,16,18,20,22,25,28,30,35,40,45,50,55,60,65,70,75,80,85,90,100,110,120,130,140,150}},
    {  8, 1.25, 13  ,  5.5,  3.75,  8.4,  16, 1.6,  8.4,  9  , 10  ,  50, {8,10,12,14,16,18,20,22,25,30,35,40,45,50,55,60,65,70,75,80,85,90,95,100,110,120,130,140,150,160,170,180,190,200}},
    { 10, 1.5 , 17  ,  6.4,  4.5 , 10.5,  20, 2  , 10.5, 11  , 12  , 100, {10,12,16,18,20,22,25,28,30,35,40,45,50,55,60,65,70,75,80,85,90,100,110,120,130,140,150,160,170,180,190,200,220,240,280,300}},
    { 12, 1.75, 19  ,  8  ,  5.5 , 13  ,  24, 2.5, 13  , 13.5, 14.5, 100, {10,12,16,18,20,22,25,28,30,35,40,45,50,55,60,65,70,75,80,85,90,100,110,120,130,140,150,160,170,180,190,200,220,240,300}},
    { 14, 2   , 22  ,  9  ,  6   , 15  ,  28, 2.5, 15  , 15.5, 16.5, 100, {16,20,25,30,35,40,45,50,55,60,65,70,75,80,90,100,110,120,130,140,150,160,170,180,200,220}},
    { 16, 2   , 24  , 10  ,  6   , 17  ,  30, 3  , 17  , 17.5, 18.5, 150, {12,16,20,25,30,35,40,45,50,55,60,65,70,75,80,85,90,95,100,110,120,130,140,150,160,170,180,190,200,210,220,230,240,250,260,280,300,320,340,400,500}},
    { 18, 2.5 , 27  , 11.5,  7.5 , 19  ,  34, 3  , 19  , 20  , 21  , 150, {20,25,30,35,40,45,50,55,60,65,70,75,80,85,90,100,110,120,130,140,150,160,170,180,190,200}},
    { 20, 2.5 , 30  , 12.5,  7.5 , 21  ,  37, 3  , 21  , 22  , 24  , 150, {20,25,30,35,40,45,50,55,60,65,70,75,80,85,90,100,110,120,130,140,150,160,170,180,190,200,210,220,230,240,250,260,280,300,360}},
    { 22, 2.5 , 32  , 14  ,  7.5 , 23  ,  39, 3  , 23  , 24  , 26  , 150, {30,35,40,45,50,55,60,65,70,75,80,90,100,110,120,130,140,150,160,170,180,190,200}},
    { 24, 3   , 36  , 15  ,  9   , 25  ,  44, 4  , 25  , 26  , 28  , 150, {25,30,35,40,45,50,55,60,65,70,75,80,85,90,100,110,120,130,140,150,160,170,180,190,200,210,220,230,240,250,260,280,300,320,500}},
    { 27, 3   , 41  , 17  ,  9   , 28  ,  50, 4  , 28  , 30  , 32  , 150, {30,40,45,50,55,60,65,70,75,80,85,90,100,110,120,130,140,150,160,170,180,190,200,300}},
    { 30, 3.5 , 46  , 19  , 10.5 , 31  ,  56, 4  , 31  , 33  , 35  , 150, {35,40,45,50,55,60,65,70,75,80,85,90,100,110,120,130,140,150,160,170,180,190,200,210,220,230,240,250,260,280,300,320,340,360,380,400,500,600}},
    { 33, 3.5 , 50  , 21  , 10.5 , 34  ,  60, 5  , 34  , 36  , 39  , 150, {40,50,60,65,70,75,80,90,100,110,120,130,140,150,160,170,180,190,200,300}},
    { 36, 4   , 55  , 23  , 12   , 37  ,  66, 5  , 37  , 39  , 42  , 150, {40,45,50,55,60,65,70,75,80,85,90,100,110,120,130,140,150,160,170,180,190,200,220,260,280,300,320,340,400,600}},
    { 39, 4   , 60  , 25  , 12   , 40  ,  72, 6  , 40  , 43  , 45  , 150, {80,90,100,110,120,130,140,150,160,180,190,200}},
    { 42, 4.5 , 65  , 26  , 13.5 , 43  ,  78, 7  , 43  , 46  , 48  , 150, {50,55,60,70,75,80,85,90,100,110,120,130,140,150,160,170,180,190,200,220,250,260,300,360,400}},
    { 45, 4.5 , 70  , 28  , 13.5 , 46  ,  85, 7  , 47  , 49  , 52  , 150, {90,100,110,120,130,140,150}},
    { 48, 5   , 75  , 30  , 15   , 50  ,  92, 8  , 50  , 52  , 56  , 150, {60,70,80,90,100,110,120,130,140,150,160,170,180,190,200,420}},
    { 52, 5   , 80  , 33  , 15   , 54  ,  98, 8  , 54  , 57  , 61  , 180, {150,200}},
    { 56, 5.5 , 85  , 35  , 16.5 , 58  , 105, 9  , 58  , 62  , 66  , 180, {130,140,150,160,170,190,200,220,240,250,260,280,300,380}},
    { 64, 6   , 95  , 40  , 18   , 66  , 120, 9  , 66  , 70  , 74  , 250, {300}},
  };
  // clang-format on
}

}  // namespace

BoltDerivedDimensions compute_derived_dimensions(const BoltBaseDimensions& base) {
  const double d = static_cast<double>(base.nominal_diameter);
  const double sqrt3 = std::sqrt(3.0);

  BoltDerivedDimensions out{};
  out.pitch_diameter = d - 3.0 * sqrt3 / 8.0 * base.pitch;
  out.thread_height = sqrt3 / 2.0 * base.pitch;
  out.circumference = kPi * d;
  out.helix_angle_deg = std::atan2(base.pitch, out.circumference) * 180.0 / kPi;
  out.min_thread_short = 2.0 * d + 6.0;
  out.min_thread_medium = 2.0 * d + 12.0;
  out.min_thread_long = 2.0 * d + 25.0;
  return out;
}

BoltGeometry::BoltGeometry(BoltBaseDimensions base) : base_(std::move(base)) {
  if (base_.nominal_diameter <= 0) {
    throw std::invalid_argument("BoltGeometry: nominal diameter must be > 0");
  }
  if (base_.pitch <= 0.0) {
    throw std::invalid_argument("BoltGeometry: pitch must be > 0 for M" + std::to_string(base_.nominal_diameter));
  }
  if (base_.customary_lengths.empty()) {
    throw std::invalid_argument("BoltGeometry: no customary lengths for M" +
                                std::to_string(base_.nominal_diameter));
  }
  const auto& cls = base_.customary_lengths;
  if (std::adjacent_find(cls.begin(), cls.end(), [](double a, double b) { return a >= b; }) != cls.end()) {
    throw std::invalid_argument("BoltGeometry: customary lengths of M" + std::to_string(base_.nominal_diameter) +
                                " are not strictly ascending");
  }
  derived_ = compute_derived_dimensions(base_);
}

std::string BoltGeometry::label() const {
  return "M" + std::to_string(base_.nominal_diameter);
}

std::string BoltGeometry::describe() const {
  std::ostringstream oss;
  oss << "[BoltGeometry D=" << base_.nominal_diameter << ", P=" << format_number(base_.pitch)
      << ", C=" << format_number(derived_.circumference) << ", beta=" << format_number(derived_.helix_angle_deg)
      << "]";
  return oss.str();
}

ThreadGeometry ThreadGeometry::FromPitch(int nominal_diameter, double pitch) {
  ThreadGeometry thread{};
  thread.nominal_diameter = nominal_diameter;
  thread.pitch = pitch;
  thread.circumference = kPi * static_cast<double>(nominal_diameter);
  thread.helix_angle_deg = std::atan2(pitch, thread.circumference) * 180.0 / kPi;
  return thread;
}

ThreadGeometry ThreadGeometry::FromBolt(const BoltGeometry& bolt) {
  return FromPitch(bolt.nominal_diameter(), bolt.base().pitch);
}

std::string ThreadGeometry::describe() const {
  std::ostringstream oss;
  oss << "[ThreadGeometry D=" << nominal_diameter << ", P=" << format_number(pitch)
      << ", u=" << format_number(circumference) << ", beta=" << format_number(helix_angle_deg) << "]";
  return oss.str();
}

GeometryTable GeometryTable::MakeIsoMetric() {
  GeometryTable table;
  for (IsoMetricRow& row : iso_metric_rows()) {
    BoltBaseDimensions base{};
    base.nominal_diameter = row.d;
    base.pitch = row.p;
    base.wrench_size = row.s;
    base.head_height = row.k;
    base.head_to_thread = row.a;
    base.washer_hole_diameter = row.du1;
    base.washer_diameter = row.du2;
    base.washer_thickness = row.u;
    base.clearance_fine = row.dh1;
    base.clearance_medium = row.dh2;
    base.clearance_coarse = row.dh3;
    base.default_grip_length = row.dgl;
    base.customary_lengths = std::move(row.cls);
    table.Add(std::move(base));
  }
  return table;
}

const GeometryTable& GeometryTable::IsoMetric() {
  static const GeometryTable table = MakeIsoMetric();
  return table;
}

const BoltGeometry& GeometryTable::Add(BoltBaseDimensions base) {
  const int diameter = base.nominal_diameter;
  if (index_by_diameter_.contains(diameter)) {
    throw std::invalid_argument("GeometryTable: M" + std::to_string(diameter) + " is already registered");
  }
  bolts_.emplace_back(std::move(base));
  index_by_diameter_[diameter] = bolts_.size() - 1;
  return bolts_.back();
}

std::vector<ThreadGeometry> GeometryTable::thread_geometries() const {
  std::vector<ThreadGeometry> out;
  out.reserve(bolts_.size());
  for (const BoltGeometry& bolt : bolts_) {
    out.push_back(ThreadGeometry::FromBolt(bolt));
  }
  return out;
}

const BoltGeometry* GeometryTable::find(int nominal_diameter) const {
  auto it = index_by_diameter_.find(nominal_diameter);
  if (it == index_by_diameter_.end()) {
    return nullptr;
  }
  return &bolts_[it->second];
}

const BoltGeometry& GeometryTable::get(int nominal_diameter) const {
  const BoltGeometry* bolt = find(nominal_diameter);
  if (bolt == nullptr) {
    throw std::out_of_range("GeometryTable: no bolt geometry for M" + std::to_string(nominal_diameter));
  }
  return *bolt;
}

}  // namespace gimba::core
