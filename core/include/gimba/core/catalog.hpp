#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gimba/core/artifact_store.hpp"
#include "gimba/core/geometry.hpp"
#include "gimba/core/name_codec.hpp"
#include "gimba/core/pass_log.hpp"

namespace gimba::core {

struct CatalogOptions {
  // Plain material names, e.g. "Steel galvanized".
  std::vector<std::string> materials{"Steel galvanized"};
  // ',' or ';' (German locale importers).
  char delimiter = ',';
  NameCodec codec{};
};

struct BoltTypeRow {
  std::string name{};  // "M12 x 80 w/shank Steel galvanized"
  int nominal_diameter = 0;
  double length = 0.0;
  bool shank = false;
  std::string plain_material{};
  std::string thread_material{};
};

struct AssemblyTypeRow {
  std::string name{};  // "M12 w/shank Steel galvanized"
  int nominal_diameter = 0;
  double grip_length = 0.0;
  bool shank = false;
  std::string plain_material{};
  std::string thread_material{};
};

struct GripToLengthRow {
  int nominal_diameter = 0;
  int grip_length = 0;
  double bolt_length = 0.0;
};

struct DiameterBandRow {
  int diameter = 0;
  int nominal_diameter = 0;
};

// Shank rows exist only for lengths above this value.
inline constexpr double kShankMinLength = 50.0;
inline constexpr int kMaxGripLength = 600;

[[nodiscard]] std::vector<BoltTypeRow> EnumerateBoltTypes(const GeometryTable& table, const CatalogOptions& options);
[[nodiscard]] std::vector<AssemblyTypeRow> EnumerateAssemblyTypes(const GeometryTable& table,
                                                                  const CatalogOptions& options);

// Sampling step of the grip length axis: 2 below 23, 5 below 100, else 10.
[[nodiscard]] int grip_length_step(int grip_length);
// lmin = LG + 2k + 2u: grip plus nut and two washers.
[[nodiscard]] double minimum_bolt_length(const BoltGeometry& bolt, double grip_length);
// Smallest customary length strictly greater than minimum_bolt_length().
[[nodiscard]] std::optional<double> SelectBoltLength(const BoltGeometry& bolt, double grip_length);
[[nodiscard]] std::vector<GripToLengthRow> BuildGripToLengthRows(const GeometryTable& table);

// Nearest registered diameter; equal distances go to the lower neighbour.
[[nodiscard]] std::optional<int> NearestNominalDiameter(const GeometryTable& table, int diameter);
// One row per integer diameter from the smallest to the largest registered one.
[[nodiscard]] std::vector<DiameterBandRow> BuildDiameterBands(const GeometryTable& table);

[[nodiscard]] std::string RenderBoltTypeCatalog(const GeometryTable& table, const CatalogOptions& options);
[[nodiscard]] std::string RenderAssemblyTypeCatalog(const GeometryTable& table, const CatalogOptions& options);
[[nodiscard]] std::string RenderGripToLengthTable(const GeometryTable& table, const CatalogOptions& options);
[[nodiscard]] std::string RenderGeometryTable(const GeometryTable& table, const CatalogOptions& options);
[[nodiscard]] std::string RenderDiameterBandTable(const GeometryTable& table, const CatalogOptions& options);
[[nodiscard]] std::string RenderGeometryHtml(const GeometryTable& table, const CatalogOptions& options);

// Single write of fully rendered content.
FileWriteResult WriteGeneratedFile(TextFileSink& sink, const std::string& path, const std::string& content,
                                   bool overwrite);

enum class CatalogSchedule : std::uint8_t {
  kTypeCatalogs = 0,   // bolt and assembly type catalogs
  kLookupTables = 1,   // G2L, MGeo, D2D
  kGeometryHtml = 2,   // MGeo HTML dump
};

[[nodiscard]] std::string_view to_string(CatalogSchedule schedule);

inline constexpr std::string_view kBoltTypeCatalogFile = "Generic ISO Metric Bolt.txt";
inline constexpr std::string_view kAssemblyTypeCatalogFile = "Generic ISO Metric Bolt Assembly.txt";
inline constexpr std::string_view kGripToLengthFile = "GIMBA G2L.csv";
inline constexpr std::string_view kGeometryTableFile = "GIMBA MGeo.csv";
inline constexpr std::string_view kDiameterBandFile = "GIMBA D2D.csv";
inline constexpr std::string_view kGeometryHtmlFile = "GIMBA MGeo.html";

[[nodiscard]] std::vector<std::string_view> catalog_file_names(CatalogSchedule schedule);
[[nodiscard]] std::string join_output_path(const std::string& directory, std::string_view file_name);

struct CatalogFileStatus {
  CatalogSchedule schedule = CatalogSchedule::kTypeCatalogs;
  std::string file_name{};
  std::string path{};
  bool exists = false;
};

// Existence of every output file of every schedule, for the welcome summary.
[[nodiscard]] std::vector<CatalogFileStatus> PrecheckCatalogFiles(const TextFileSink& sink,
                                                                  const std::string& output_directory);

struct CatalogFileOutcome {
  std::string file_name{};
  std::string path{};
  FileWriteResult result{};
};

struct CatalogBatchReport {
  CatalogSchedule schedule = CatalogSchedule::kTypeCatalogs;
  std::vector<CatalogFileOutcome> files{};
  std::size_t created = 0;
  std::size_t overwritten = 0;
  std::size_t skipped = 0;
  std::size_t errors = 0;
  std::string title{};
  std::string instruction{};
  std::string content{};
  std::vector<std::string> details{};
  bool warning = false;
};

// Renders and writes every file of the schedule. A failing file is counted
// as an error; the remaining files are still attempted.
[[nodiscard]] CatalogBatchReport RunCatalogBatch(const GeometryTable& table, const CatalogOptions& options,
                                                 CatalogSchedule schedule, TextFileSink& sink,
                                                 const std::string& output_directory, bool overwrite,
                                                 PassLog& log);

}  // namespace gimba::core
