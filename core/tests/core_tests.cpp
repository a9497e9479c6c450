#include <algorithm>
#include <cmath>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "gimba/core/artifact_store.hpp"
#include "gimba/core/asset.hpp"
#include "gimba/core/catalog.hpp"
#include "gimba/core/file_sink.hpp"
#include "gimba/core/geometry.hpp"
#include "gimba/core/memory_store.hpp"
#include "gimba/core/name_codec.hpp"
#include "gimba/core/pass_log.hpp"
#include "gimba/core/reconciliation.hpp"
#include "gimba/core/settings.hpp"
#include "gimba/core/template_validator.hpp"
#include "gimba/core/text_format.hpp"

namespace {

using gimba::core::ArtifactRef;
using gimba::core::Asset;
using gimba::core::AssetKind;
using gimba::core::BoltBaseDimensions;
using gimba::core::BoltGeometry;
using gimba::core::CatalogOptions;
using gimba::core::CatalogSchedule;
using gimba::core::DerivedArtifactEdits;
using gimba::core::DiscoveryResult;
using gimba::core::EditResult;
using gimba::core::FileWriteOutcome;
using gimba::core::FileWriteResult;
using gimba::core::GeometryTable;
using gimba::core::MemoryMaterialStore;
using gimba::core::NameCodec;
using gimba::core::PassLog;
using gimba::core::PassMode;
using gimba::core::PassOutcome;
using gimba::core::PassReport;
using gimba::core::PromptAction;
using gimba::core::PromptChoice;
using gimba::core::PromptContext;
using gimba::core::ReconcileRequest;
using gimba::core::ReconciliationEngine;
using gimba::core::TemplateCheckCode;
using gimba::core::TemplateValidator;

struct TestCase {
  const char* name;
  const char* intent;
  std::function<bool(void)> run;
};

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

bool contains(const std::string& text, const std::string& fragment) {
  return text.find(fragment) != std::string::npos;
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::size_t begin = 0;
  while (begin < text.size()) {
    const std::size_t end = text.find('\n', begin);
    if (end == std::string::npos) {
      lines.push_back(text.substr(begin));
      break;
    }
    lines.push_back(text.substr(begin, end - begin));
    begin = end + 1;
  }
  return lines;
}

std::size_t count_occurrences(const std::string& text, const std::string& fragment) {
  std::size_t count = 0;
  for (std::size_t pos = text.find(fragment); pos != std::string::npos; pos = text.find(fragment, pos + 1)) {
    ++count;
  }
  return count;
}

std::vector<std::string> sorted_names(const std::vector<ArtifactRef>& refs) {
  std::vector<std::string> names;
  names.reserve(refs.size());
  for (const ArtifactRef& ref : refs) {
    names.push_back(ref.name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

// First n diameters of the ISO table.
GeometryTable make_partial_table(std::size_t n) {
  GeometryTable table;
  const auto& bolts = GeometryTable::IsoMetric().bolt_geometries();
  for (std::size_t i = 0; i < n && i < bolts.size(); ++i) {
    table.Add(bolts[i].base());
  }
  return table;
}

class MemoryTextFileSink final : public gimba::core::TextFileSink {
 public:
  [[nodiscard]] bool Exists(const std::string& path) const override { return files.contains(path); }

  FileWriteResult Write(const std::string& path, const std::string& content, bool overwrite) override {
    FileWriteResult result;
    ++write_calls;
    if (failing_paths.contains(path)) {
      result.error = "cannot open \"" + path + "\" for writing";
      return result;
    }
    const bool existed = Exists(path);
    if (existed && !overwrite) {
      result.outcome = FileWriteOutcome::kSkipped;
      return result;
    }
    files[path] = content;
    result.outcome = existed ? FileWriteOutcome::kOverwritten : FileWriteOutcome::kCreated;
    return result;
  }

  std::map<std::string, std::string> files{};
  std::set<std::string> failing_paths{};
  int write_calls = 0;
};

// Forwards to a memory store and fails selected calls.
class FaultInjectingStore final : public gimba::core::ArtifactStore {
 public:
  explicit FaultInjectingStore(MemoryMaterialStore& inner) : inner_(inner) {}

  [[nodiscard]] std::string document_name() const override { return inner_.document_name(); }

  [[nodiscard]] std::vector<ArtifactRef> Find(const std::regex& pattern) const override {
    if (fail_find) {
      throw std::runtime_error("document is not accessible");
    }
    return inner_.Find(pattern);
  }

  [[nodiscard]] std::optional<ArtifactRef> FindNamed(std::string_view name) const override {
    return inner_.FindNamed(name);
  }

  [[nodiscard]] const gimba::core::MaterialRecord* Load(const ArtifactRef& ref) const override {
    if (fail_load_names.contains(ref.name)) {
      throw std::runtime_error("appearance asset \"" + ref.name + "\" cannot be accessed");
    }
    return inner_.Load(ref);
  }

  EditResult<ArtifactRef> Create(const ArtifactRef& template_ref, const std::string& name,
                                 const DerivedArtifactEdits& edits) override {
    ++create_calls;
    if (create_calls == fail_create_call) {
      try {
        if (non_std_cause) {
          throw 42;
        }
        throw std::runtime_error("appearance asset duplicate rejected");
      } catch (...) {
        std::throw_with_nested(std::runtime_error("Create \"" + name + "\" failed"));
      }
    }
    if (fail_create_names.contains(name)) {
      EditResult<ArtifactRef> result;
      result.error = "injected create failure";
      return result;
    }
    return inner_.Create(template_ref, name, edits);
  }

  EditResult<bool> Delete(const ArtifactRef& ref) override {
    ++delete_calls;
    if (fail_delete_names.contains(ref.name)) {
      throw std::runtime_error("element \"" + ref.name + "\" is locked");
    }
    return inner_.Delete(ref);
  }

  int create_calls = 0;
  int delete_calls = 0;
  int fail_create_call = 0;  // 1-based, 0 disables
  bool non_std_cause = false;  // cause of the failing call is an int
  bool fail_find = false;
  std::set<std::string> fail_load_names{};
  std::set<std::string> fail_create_names{};
  std::set<std::string> fail_delete_names{};

 private:
  MemoryMaterialStore& inner_;
};

class ScriptedPrompt final : public gimba::core::InteractionPrompt {
 public:
  explicit ScriptedPrompt(PromptChoice choice) : choice_(choice) {}

  PromptChoice Choose(const PromptContext& context) override {
    contexts.push_back(context);
    return choice_;
  }

  std::vector<PromptContext> contexts{};

 private:
  PromptChoice choice_;
};

PassReport run_pass(MemoryMaterialStore& store, PassMode mode, bool overwrite, PassLog* log_out = nullptr) {
  const NameCodec codec;
  ReconciliationEngine engine(store, store, GeometryTable::IsoMetric(), codec);
  PassLog log;
  const DiscoveryResult discovery = engine.Discover(log);
  PassReport report = engine.Execute(discovery, ReconcileRequest{mode, overwrite}, log);
  if (log_out != nullptr) {
    *log_out = log;
  }
  return report;
}

// Intent: Derived dimensions follow the thread formulas for every table diameter.
bool test_derived_formulas_for_all_diameters() {
  const double pi = std::acos(-1.0);
  const double sqrt3 = std::sqrt(3.0);
  for (const BoltGeometry& bolt : GeometryTable::IsoMetric().bolt_geometries()) {
    const double d = bolt.nominal_diameter();
    const double p = bolt.base().pitch;
    const auto& v = bolt.derived();
    if (!almost_equal(v.pitch_diameter, d - 3.0 * sqrt3 / 8.0 * p) ||
        !almost_equal(v.thread_height, sqrt3 / 2.0 * p) ||
        !almost_equal(v.circumference, pi * d) ||
        !almost_equal(v.helix_angle_deg, std::atan2(p, pi * d) * 180.0 / pi)) {
      return false;
    }
    if (!(v.helix_angle_deg > 0.0 && v.helix_angle_deg < 90.0)) {
      return false;
    }
    if (!almost_equal(v.min_thread_short, 2.0 * d + 6.0) || !almost_equal(v.min_thread_medium, 2.0 * d + 12.0) ||
        !almost_equal(v.min_thread_long, 2.0 * d + 25.0)) {
      return false;
    }
  }
  return true;
}

// Intent: The ISO table holds the coarse-thread series in insertion order and is built once.
bool test_iso_table_series_and_identity() {
  const std::vector<int> expected = {3,  4,  5,  6,  8,  10, 12, 14, 16, 18, 20, 22,
                                     24, 27, 30, 33, 36, 39, 42, 45, 48, 52, 56, 64};
  const GeometryTable& table = GeometryTable::IsoMetric();
  if (table.size() != expected.size() || &table != &GeometryTable::IsoMetric()) {
    return false;
  }
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (table.bolt_geometries()[i].nominal_diameter() != expected[i]) {
      return false;
    }
  }

  const GeometryTable rebuilt = GeometryTable::MakeIsoMetric();
  const BoltGeometry& a = table.get(12);
  const BoltGeometry& b = rebuilt.get(12);
  return a.derived().helix_angle_deg == b.derived().helix_angle_deg && a.base().customary_lengths.size() == 35 &&
         a.base().default_grip_length == 100.0 && a.label() == "M12" && table.find(7) == nullptr;
}

// Intent: Registry misuse fails fast with standard exceptions.
bool test_geometry_table_rejects_misuse() {
  GeometryTable table;
  BoltBaseDimensions base = GeometryTable::IsoMetric().get(8).base();
  table.Add(base);

  bool duplicate_threw = false;
  try {
    table.Add(base);
  } catch (const std::invalid_argument&) {
    duplicate_threw = true;
  }

  bool unsorted_threw = false;
  BoltBaseDimensions unsorted = base;
  unsorted.nominal_diameter = 9;
  unsorted.customary_lengths = {10, 8, 12};
  try {
    table.Add(unsorted);
  } catch (const std::invalid_argument&) {
    unsorted_threw = true;
  }

  bool empty_threw = false;
  BoltBaseDimensions empty = base;
  empty.nominal_diameter = 11;
  empty.customary_lengths.clear();
  try {
    table.Add(empty);
  } catch (const std::invalid_argument&) {
    empty_threw = true;
  }

  bool unknown_threw = false;
  try {
    static_cast<void>(table.get(10));
  } catch (const std::out_of_range&) {
    unknown_threw = true;
  }

  return duplicate_threw && unsorted_threw && empty_threw && unknown_threw && table.size() == 1;
}

// Intent: The thread view carries D, P, circumference and helix angle of each bolt.
bool test_thread_geometries_mirror_bolts() {
  const GeometryTable& table = GeometryTable::IsoMetric();
  const auto threads = table.thread_geometries();
  if (threads.size() != table.size()) {
    return false;
  }
  for (std::size_t i = 0; i < threads.size(); ++i) {
    const BoltGeometry& bolt = table.bolt_geometries()[i];
    if (threads[i].nominal_diameter != bolt.nominal_diameter() || threads[i].pitch != bolt.base().pitch ||
        !almost_equal(threads[i].circumference, bolt.derived().circumference) ||
        !almost_equal(threads[i].helix_angle_deg, bolt.derived().helix_angle_deg)) {
      return false;
    }
  }
  return starts_with(threads.front().describe(), "[ThreadGeometry D=3, P=0.5");
}

// Intent: Template names round-trip their category, including categories containing " - ".
bool test_name_codec_round_trip() {
  const NameCodec codec;
  for (const std::string category : {"Steel galvanized", "Stainless steel A4-70", "X", "Brass - polished"}) {
    const std::optional<std::string> decoded = codec.DecodeCategory(codec.EncodeTemplate(category));
    if (!decoded.has_value() || *decoded != category) {
      return false;
    }
    const auto key = codec.DecodeDerived(codec.EncodeDerived(category, 27));
    if (!key.has_value() || key->category != category || key->nominal_diameter != 27) {
      return false;
    }
    if (codec.DecodePlain(codec.EncodePlain(category)) != std::optional<std::string>(category)) {
      return false;
    }
  }
  return codec.EncodeDerived("Steel galvanized", 12) == "GIMBA - Steel galvanized - M12 thread" &&
         codec.EncodeTemplate("Steel galvanized") == "GIMBA - Steel galvanized - Thread template" &&
         codec.EncodePlain("Steel galvanized") == "GIMBA - Steel galvanized" &&
         codec.DecodePlain("GIMBA - Steel galvanized") == std::optional<std::string>("Steel galvanized");
}

// Intent: Decoders accept full matches only.
bool test_name_codec_rejects_partial_matches() {
  const NameCodec codec;
  const NameCodec acme("ACME.v2");
  return !codec.DecodeCategory("GIMBA - Steel - Thread template copy").has_value() &&
         !codec.DecodeCategory("My GIMBA - Steel - Thread template").has_value() &&
         !codec.DecodeCategory("GIMBA - Steel - M12 thread").has_value() &&
         !codec.DecodeDerived("GIMBA - Steel - M12 threads").has_value() &&
         !codec.DecodeDerived("GIMBA - Steel - Mx thread").has_value() &&
         !codec.DecodePlain("GIMBA - Steel - Thread template").has_value() &&
         !codec.DecodePlain("GIMBA - Steel - M12 thread").has_value() &&
         acme.DecodeCategory("ACME.v2 - Steel - Thread template") == std::optional<std::string>("Steel") &&
         !acme.DecodeCategory("ACMEXv2 - Steel - Thread template").has_value();
}

// Intent: Bolt catalog emits shank rows only above 50 mm.
bool test_bolt_catalog_shank_rule() {
  const GeometryTable& table = GeometryTable::IsoMetric();
  const CatalogOptions options;
  const auto rows = gimba::core::EnumerateBoltTypes(table, options);

  std::size_t expected = 0;
  for (const BoltGeometry& bolt : table.bolt_geometries()) {
    for (const double length : bolt.base().customary_lengths) {
      expected += length > 50.0 ? 2 : 1;
    }
  }
  if (rows.size() != expected) {
    return false;
  }
  for (const auto& row : rows) {
    if (row.shank && !(row.length > 50.0)) {
      return false;
    }
  }

  const std::string text = gimba::core::RenderBoltTypeCatalog(table, options);
  const std::vector<std::string> lines = split_lines(text);
  return lines.size() == expected + 1 &&
         lines[0] ==
             ",Nominal Diameter##LENGTH##MILLIMETERS,Length##LENGTH##MILLIMETERS,Shank##OTHER##,"
             "Material##OTHER##,Thread Material##OTHER##" &&
         lines[1] == "M3 x 3 Steel galvanized,3,3,0,GIMBA - Steel galvanized,GIMBA - Steel galvanized - M3 thread" &&
         contains(text, "\nM12 x 80 w/shank Steel galvanized,12,80,1,GIMBA - Steel galvanized,"
                        "GIMBA - Steel galvanized - M12 thread\n") &&
         !contains(text, "M12 x 50 w/shank");
}

// Intent: Assembly row for M12 uses the default grip length and has a shank variant.
bool test_assembly_catalog_m12() {
  const GeometryTable& table = GeometryTable::IsoMetric();
  CatalogOptions options;
  options.materials = {"Steel galvanized", "Stainless steel"};
  const auto rows = gimba::core::EnumerateAssemblyTypes(table, options);

  int m12_rows = 0;
  int m12_shank_rows = 0;
  int m3_shank_rows = 0;
  for (const auto& row : rows) {
    if (row.nominal_diameter == 12) {
      ++m12_rows;
      if (row.grip_length != 100.0) {
        return false;
      }
      m12_shank_rows += row.shank ? 1 : 0;
    }
    if (row.nominal_diameter == 3 && row.shank) {
      ++m3_shank_rows;
    }
  }

  const std::string text = gimba::core::RenderAssemblyTypeCatalog(table, options);
  return m12_rows == 4 && m12_shank_rows == 2 && m3_shank_rows == 0 &&
         starts_with(text, ",Nominal Diameter##LENGTH##MILLIMETERS,Grip Length##LENGTH##MILLIMETERS,") &&
         contains(text, "\nM12 w/shank Steel galvanized,12,100,1,GIMBA - Steel galvanized,"
                        "GIMBA - Steel galvanized - M12 thread\n") &&
         contains(text, "\nM12 Stainless steel,12,100,0,GIMBA - Stainless steel,"
                        "GIMBA - Stainless steel - M12 thread\n");
}

// Intent: Grip-to-length lookup samples grips at 2/5/10 mm and picks the next longer customary length.
bool test_grip_to_length_lookup() {
  const GeometryTable& table = GeometryTable::IsoMetric();
  const BoltGeometry& m6 = table.get(6);
  if (!almost_equal(gimba::core::minimum_bolt_length(m6, 0.0), 11.2) ||
      gimba::core::SelectBoltLength(m6, 0.0) != std::optional<double>(12.0)) {
    return false;
  }
  // lmin = 8 + 11.2 = 19.2 -> 20
  if (gimba::core::SelectBoltLength(m6, 8.0) != std::optional<double>(20.0)) {
    return false;
  }
  // M3 at LG=16: lmin = 16 + 4 + 1 = 21, cls has 22
  if (gimba::core::SelectBoltLength(table.get(3), 16.0) != std::optional<double>(22.0)) {
    return false;
  }
  // lmin equal to a customary length is not enough: M3 at LG=15 gives 20 -> 22
  if (gimba::core::SelectBoltLength(table.get(3), 15.0) != std::optional<double>(22.0)) {
    return false;
  }

  for (const auto& row : gimba::core::BuildGripToLengthRows(table)) {
    if (row.grip_length % gimba::core::grip_length_step(row.grip_length) != 0) {
      return false;
    }
    if (row.nominal_diameter == 64 && row.grip_length > 200) {
      return false;
    }
  }

  const std::string text = gimba::core::RenderGripToLengthTable(table, CatalogOptions{});
  return starts_with(text, ",D##LENGTH##MILLIMETERS,LG##LENGTH##MILLIMETERS,l##LENGTH##MILLIMETERS\n") &&
         contains(text, "\nM6 x ]0[,6,0,12\n") && contains(text, "\nM6 x ]22[,6,22,35\n") &&
         !contains(text, "M6 x ]23[") && !contains(text, "M6 x ]24[") && contains(text, "M6 x ]25[") &&
         !contains(text, "M12 x ]105[") && contains(text, "\nM64 x ]200[,64,200,300\n");
}

// Intent: Diameter banding picks the nearest registered diameter; ties go to the lower one.
bool test_diameter_banding() {
  const GeometryTable& table = GeometryTable::IsoMetric();
  using gimba::core::NearestNominalDiameter;
  if (NearestNominalDiameter(table, 7) != std::optional<int>(6) ||
      NearestNominalDiameter(table, 3) != std::optional<int>(3) ||
      NearestNominalDiameter(table, 50) != std::optional<int>(48) ||
      NearestNominalDiameter(table, 51) != std::optional<int>(52) ||
      NearestNominalDiameter(table, 60) != std::optional<int>(56) ||
      NearestNominalDiameter(table, 61) != std::optional<int>(64) ||
      NearestNominalDiameter(table, 26) != std::optional<int>(27) ||
      NearestNominalDiameter(GeometryTable{}, 7).has_value()) {
    return false;
  }

  const auto rows = gimba::core::BuildDiameterBands(table);
  const std::string text = gimba::core::RenderDiameterBandTable(table, CatalogOptions{});
  return rows.size() == 62 && rows.front().diameter == 3 && rows.back().diameter == 64 &&
         starts_with(text, ",ND##LENGTH##MILLIMETERS,D##LENGTH##MILLIMETERS\nD=3,3,3\n") &&
         contains(text, "\nD=7,7,6\n") && contains(text, "\nD=9,9,8\n") && contains(text, "\nD=64,64,64\n");
}

// Intent: Parameter dump prints H and d2 with two decimals and the rest in shortest form.
bool test_geometry_parameter_dump() {
  const GeometryTable& table = GeometryTable::IsoMetric();
  const std::string text = gimba::core::RenderGeometryTable(table, CatalogOptions{});
  const std::vector<std::string> lines = split_lines(text);
  return lines.size() == table.size() + 1 &&
         lines[0] ==
             ",D##LENGTH##MILLIMETERS,P##LENGTH##MILLIMETERS,H##LENGTH##MILLIMETERS,d2##LENGTH##MILLIMETERS,"
             "s##LENGTH##MILLIMETERS,k##LENGTH##MILLIMETERS,a##LENGTH##MILLIMETERS,b2##LENGTH##MILLIMETERS,"
             "b3##LENGTH##MILLIMETERS,b4##LENGTH##MILLIMETERS,du1##LENGTH##MILLIMETERS,du2##LENGTH##MILLIMETERS,"
             "u##LENGTH##MILLIMETERS,dh1##LENGTH##MILLIMETERS,dh2##LENGTH##MILLIMETERS,dh3##LENGTH##MILLIMETERS" &&
         contains(text, "\nM12,12,1.75,1.52,10.86,19,8,5.5,30,36,49,13,24,2.5,13,13.5,14.5\n") &&
         contains(text, "\nM3,3,0.5,0.43,2.68,5.5,2,1.5,12,18,31,3.2,7,0.5,3.2,3.4,3.6\n");
}

// Intent: The ';' variant uses the delimiter in headers and rows alike.
bool test_semicolon_delimiter() {
  CatalogOptions options;
  options.delimiter = ';';
  const std::string text = gimba::core::RenderAssemblyTypeCatalog(GeometryTable::IsoMetric(), options);
  return starts_with(text, ";Nominal Diameter##LENGTH##MILLIMETERS;Grip Length##LENGTH##MILLIMETERS;") &&
         contains(text, "\nM12 w/shank Steel galvanized;12;100;1;GIMBA - Steel galvanized;") &&
         !contains(text, ",");
}

// Intent: HTML dump has one header row with matching tags and one row per geometry.
bool test_geometry_html_dump() {
  const std::string html = gimba::core::RenderGeometryHtml(GeometryTable::IsoMetric(), CatalogOptions{});
  const std::size_t header_end = html.find("</tr>");
  const std::string header = html.substr(0, header_end);
  return starts_with(html, "<table>\n  <tr>\n    <th>Name</th>\n") &&
         contains(header, "    <th>d<sub>2</sub></th>\n") && contains(header, "    <th>d<sub>h3</sub></th>\n") &&
         !contains(header, "</td>") && count_occurrences(html, "<tr>") == 25 &&
         contains(html, "    <td>M12</td>\n    <td>12</td>\n    <td>1.75</td>\n    <td>1.52</td>\n") &&
         html.size() >= 9 && html.substr(html.size() - 9) == "</table>\n";
}

// Intent: File writes report created, skipped and overwritten and never touch a skipped file.
bool test_generated_file_write_outcomes() {
  MemoryTextFileSink sink;
  const auto first = gimba::core::WriteGeneratedFile(sink, "out/a.csv", "one", false);
  const auto second = gimba::core::WriteGeneratedFile(sink, "out/a.csv", "two", false);
  const bool kept = sink.files["out/a.csv"] == "one";
  const auto third = gimba::core::WriteGeneratedFile(sink, "out/a.csv", "three", true);
  return first.outcome == FileWriteOutcome::kCreated && second.outcome == FileWriteOutcome::kSkipped && kept &&
         third.outcome == FileWriteOutcome::kOverwritten && sink.files["out/a.csv"] == "three";
}

// Intent: Catalog batch tallies per-file outcomes and still writes the other files after an IO failure.
bool test_catalog_batch_report() {
  const GeometryTable& table = GeometryTable::IsoMetric();
  MemoryTextFileSink sink;
  PassLog log;

  const auto created = gimba::core::RunCatalogBatch(table, CatalogOptions{}, CatalogSchedule::kLookupTables, sink,
                                                    "out", false, log);
  if (created.created != 3 || created.instruction != "3 files created." || created.warning ||
      created.title != "Operation Completed" || sink.files.size() != 3) {
    return false;
  }

  const auto skipped = gimba::core::RunCatalogBatch(table, CatalogOptions{}, CatalogSchedule::kLookupTables, sink,
                                                    "out", false, log);
  if (skipped.skipped != 3 || skipped.instruction != "All output files were present. Nothing to be done.") {
    return false;
  }

  MemoryTextFileSink failing;
  failing.failing_paths.insert(gimba::core::join_output_path("out", gimba::core::kBoltTypeCatalogFile));
  const auto errors = gimba::core::RunCatalogBatch(table, CatalogOptions{}, CatalogSchedule::kTypeCatalogs,
                                                   failing, "out", false, log);
  const std::vector<std::string> expected_details = {"* Generic ISO Metric Bolt.txt (ERROR)",
                                                     "* Generic ISO Metric Bolt Assembly.txt (created)"};
  return errors.errors == 1 && errors.created == 1 && errors.warning &&
         errors.title == "Operation Completed with Errors" &&
         errors.instruction == "1 file created. 1 error occurred." && errors.details == expected_details &&
         failing.write_calls == 2 && log.contains("cannot open");
}

// Intent: Pre-check reports every output file of every schedule.
bool test_catalog_precheck() {
  MemoryTextFileSink sink;
  sink.files[gimba::core::join_output_path("out", gimba::core::kGeometryHtmlFile)] = "<table></table>";
  const auto statuses = gimba::core::PrecheckCatalogFiles(sink, "out");
  std::size_t existing = 0;
  for (const auto& status : statuses) {
    existing += status.exists ? 1 : 0;
  }
  return statuses.size() == 6 && existing == 1 && statuses.back().file_name == "GIMBA MGeo.html" &&
         statuses.back().exists && statuses.back().schedule == CatalogSchedule::kGeometryHtml;
}

// Intent: Count messages fill count/"no" and the matching suffix.
bool test_count_messages() {
  using gimba::core::MakeCountMessage;
  using gimba::core::MakeCountOkMessage;
  return MakeCountMessage(0, "Found {0} thread geometr{1}", "ies", "y") == "Found no thread geometries" &&
         MakeCountMessage(1, "Found {0} thread geometr{1}", "ies", "y") == "Found 1 thread geometry" &&
         MakeCountMessage(24, "Found {0} thread geometr{1}", "ies", "y") == "Found 24 thread geometries" &&
         MakeCountOkMessage(2, false, "{0} file{1}") == "2 files --> NOT OK" &&
         MakeCountOkMessage(1, true, "{0} file{1}") == "1 file --> ok";
}

// Intent: A name mismatch is rejected even when the asset structure would pass.
bool test_validator_rejects_bad_name() {
  const NameCodec codec;
  const TemplateValidator validator(codec);
  gimba::core::MaterialRecord material{};
  material.id = 7;
  material.name = "Steel galvanized - Thread template";
  material.document_id = 1;
  material.appearance = gimba::core::MakeThreadTemplateAppearance(material.name);

  const auto check = validator.Validate(&material);
  return !check.ok() && check.code == TemplateCheckCode::kInvalidName && check.trace.size() == 3 &&
         contains(check.trace.back(), "-> FAILED") &&
         contains(check.reason, "GIMBA - <plain material name> - Thread template");
}

// Intent: Validator checks run in order and name the first failing one.
bool test_validator_check_order() {
  const NameCodec codec;
  const TemplateValidator validator(codec);
  const std::string name = codec.EncodeTemplate("Steel galvanized");

  if (validator.Validate(nullptr).code != TemplateCheckCode::kNullCandidate) {
    return false;
  }

  gimba::core::MaterialRecord detached{};
  detached.name = "not even a template";
  if (validator.Validate(&detached).code != TemplateCheckCode::kNoDocument) {
    return false;
  }

  gimba::core::MaterialRecord no_asset{};
  no_asset.name = name;
  no_asset.document_id = 1;
  if (validator.Validate(&no_asset).code != TemplateCheckCode::kNoAppearanceAsset) {
    return false;
  }

  gimba::core::MaterialRecord wrong_kind = no_asset;
  wrong_kind.appearance = gimba::core::MakeThreadTemplateAppearance(name);
  wrong_kind.appearance->kind = AssetKind::kOther;
  if (validator.Validate(&wrong_kind).code != TemplateCheckCode::kNoAppearanceAsset) {
    return false;
  }

  gimba::core::MaterialRecord wrong_schema = no_asset;
  wrong_schema.appearance = gimba::core::MakeThreadTemplateAppearance(name);
  wrong_schema.appearance->connected_asset("generic_bump_map")->set("BaseSchema", std::string("CheckerSchema"));
  const auto schema_check = validator.Validate(&wrong_schema);
  if (schema_check.code != TemplateCheckCode::kNoBumpGradientMap || schema_check.category != "Steel galvanized") {
    return false;
  }

  gimba::core::MaterialRecord metal = no_asset;
  metal.appearance = gimba::core::MakeThreadTemplateAppearance(name, true);
  const auto ok = validator.Validate(&metal);
  return ok.ok() && ok.category == "Steel galvanized" && ok.trace.size() == 5 &&
         contains(ok.trace.back(), "bump gradient map -> OK");
}

// Intent: Discovery on the demo document finds geometries and partitions templates.
bool test_discovery_on_demo_document() {
  MemoryMaterialStore store = gimba::core::MakeDemoStore();
  const NameCodec codec;
  ReconciliationEngine engine(store, store, GeometryTable::IsoMetric(), codec);
  PassLog log;
  const DiscoveryResult discovery = engine.Discover(log);
  return discovery.ready() && discovery.counters.geometries == 24 && discovery.counters.valid_templates == 2 &&
         discovery.counters.invalid_templates == 1 && discovery.counters.existing_artifacts == 0 &&
         discovery.invalid_templates.front().check.code == TemplateCheckCode::kNoBumpGradientMap &&
         log.contains("- PRE-CHECK OK") && log.contains("  - Found 24 thread geometries --> ok") &&
         log.contains("Check failed on template material \"GIMBA - Brass - Thread template\"");
}

// Intent: Without a valid template the pass stops before any mutation.
bool test_gate_blocks_without_valid_templates() {
  MemoryMaterialStore store;
  Asset broken = gimba::core::MakeThreadTemplateAppearance("broken");
  broken.properties.clear();
  if (!store.AddMaterial(NameCodec{}.EncodeTemplate("Steel"), broken).ok ||
      !store.AddMaterial("GIMBA - Steel - M12 thread").ok) {
    return false;
  }
  const std::size_t before = store.size();

  PassLog log;
  const PassReport report = run_pass(store, PassMode::kDelete, false, &log);
  return report.outcome == PassOutcome::kPreconditionFailed && report.warning && store.size() == before &&
         store.committed_transactions() == 0 && report.counters.invalid_templates == 1 &&
         report.counters.existing_artifacts == 1 && report.title == "Pre-Checks Failed" &&
         log.contains("- PRE-CHECK FAILED");
}

// Intent: Create pass generates every template x geometry pair with thread-specific edits.
bool test_create_pass_applies_edits() {
  MemoryMaterialStore store = gimba::core::MakeDemoStore();
  const PassReport report = run_pass(store, PassMode::kCreate, false);
  if (report.outcome != PassOutcome::kCompleted || report.counters.created != 48 ||
      report.instruction != "Created 48 thread materials." || store.committed_transactions() != 1 ||
      store.last_transaction_name() != "Create Thread Materials") {
    return false;
  }

  const auto ref = store.FindNamed("GIMBA - Steel galvanized - M12 thread");
  const auto template_ref = store.FindNamed("GIMBA - Steel galvanized - Thread template");
  if (!ref.has_value() || !template_ref.has_value()) {
    return false;
  }
  const auto* material = store.Load(*ref);
  const auto* source = store.Load(*template_ref);
  if (material == nullptr || source == nullptr || !material->appearance.has_value()) {
    return false;
  }

  const BoltGeometry& m12 = GeometryTable::IsoMetric().get(12);
  const auto bump = gimba::core::FindBumpGradientMap(*material->appearance);
  const auto source_bump = gimba::core::FindBumpGradientMap(*source->appearance);
  const std::string* keyword = material->appearance->find_string("keyword");
  return bump && source_bump && bump != source_bump &&
         almost_equal(bump->find_double("texture_RealWorldScaleX").value_or(0.0), 1.75 / 25.4) &&
         almost_equal(bump->find_double("texture_RealWorldScaleY").value_or(0.0),
                      m12.derived().circumference / 25.4) &&
         almost_equal(bump->find_double("texture_WAngle").value_or(0.0), 90.0 - m12.derived().helix_angle_deg) &&
         bump->find_bool("texture_ScaleLock") == std::optional<bool>(false) &&
         bump->find_bool("texture_URepeat") == std::optional<bool>(true) &&
         bump->find_bool("texture_VRepeat") == std::optional<bool>(true) &&
         source_bump->find_double("texture_RealWorldScaleX") == std::optional<double>(1.0) &&
         keyword != nullptr && *keyword == "GIMBA:thread:M12" &&
         material->description == "Generic ISO metric bolt assembly: Steel galvanized with M12 thread" &&
         material->manufacturer == "Matthias Wolff" && contains(material->comments, "M12 thread") &&
         material->document_id == store.document_id();
}

// Intent: Create without overwrite on a complete set skips templates x geometries artifacts.
bool test_create_without_overwrite_skips_all() {
  MemoryMaterialStore store = gimba::core::MakeDemoStore();
  run_pass(store, PassMode::kCreate, false);
  const std::size_t size_after_first = store.size();
  const PassReport second = run_pass(store, PassMode::kCreate, false);
  return second.outcome == PassOutcome::kNothingToDo && second.counters.skipped == 48 &&
         second.counters.skipped == second.counters.valid_templates * second.counters.geometries &&
         second.counters.created == 0 && second.counters.overwritten == 0 && !second.warning &&
         second.instruction == "All thread materials were already present. Did not create new materials." &&
         store.size() == size_after_first;
}

// Intent: Repeated create-with-overwrite passes converge on the same artifact set.
bool test_overwrite_passes_are_idempotent() {
  MemoryMaterialStore store = gimba::core::MakeDemoStore();
  const NameCodec codec;
  const PassReport first = run_pass(store, PassMode::kCreate, true);
  const auto names_after_first = sorted_names(store.Find(codec.derived_pattern()));
  const PassReport second = run_pass(store, PassMode::kCreate, true);
  const auto names_after_second = sorted_names(store.Find(codec.derived_pattern()));
  return first.counters.created == 48 && first.counters.overwritten == 0 && second.counters.created == 0 &&
         second.counters.overwritten == 48 && second.counters.overwrite_failed == 0 &&
         names_after_first == names_after_second && names_after_first.size() == 48 &&
         second.instruction == "Created 48 thread materials.";
}

// Intent: One failing create out of 20 pairs leaves 19 successes and one create failure.
bool test_single_store_failure_is_isolated() {
  MemoryMaterialStore inner = gimba::core::MakeDemoStore();
  FaultInjectingStore store(inner);
  store.fail_create_call = 5;
  const GeometryTable table = make_partial_table(10);
  const NameCodec codec;
  ReconciliationEngine engine(store, inner, table, codec);

  PassLog log;
  const DiscoveryResult discovery = engine.Discover(log);
  const PassReport report = engine.Execute(discovery, ReconcileRequest{PassMode::kCreate, false}, log);
  return discovery.counters.desired_artifacts() == 20 && report.counters.created == 19 &&
         report.counters.create_failed == 1 && store.create_calls == 20 && report.warning &&
         report.title == "Operation Completed with Errors" &&
         log.contains("  Failed to create \"GIMBA - Steel galvanized - M8 thread\"") &&
         log.contains("caused by: appearance asset duplicate rejected") && inner.committed_transactions() == 1;
}

// Intent: A create failure whose nested cause is not a std::exception stays isolated to its pair.
bool test_non_std_cause_is_isolated() {
  MemoryMaterialStore inner = gimba::core::MakeDemoStore();
  FaultInjectingStore store(inner);
  store.fail_create_call = 5;
  store.non_std_cause = true;
  const GeometryTable table = make_partial_table(10);
  const NameCodec codec;
  ReconciliationEngine engine(store, inner, table, codec);

  PassLog log;
  const PassReport report = engine.Execute(engine.Discover(log), ReconcileRequest{PassMode::kCreate, false}, log);
  return report.outcome == PassOutcome::kCompleted && report.counters.created == 19 &&
         report.counters.create_failed == 1 && store.create_calls == 20 &&
         log.contains("  Failed to create \"GIMBA - Steel galvanized - M8 thread\"") &&
         log.contains("caused by: unknown exception") && inner.committed_transactions() == 1 &&
         inner.rolled_back_transactions() == 0 && inner.size() == 5 + 19;
}

// Intent: A template that cannot be loaded is invalid; a failing search aborts discovery.
bool test_unreadable_store_during_discovery() {
  MemoryMaterialStore inner = gimba::core::MakeDemoStore();
  FaultInjectingStore store(inner);
  store.fail_load_names.insert("GIMBA - Stainless steel - Thread template");
  const GeometryTable table = make_partial_table(2);
  const NameCodec codec;
  ReconciliationEngine engine(store, inner, table, codec);

  PassLog log;
  const DiscoveryResult discovery = engine.Discover(log);
  const bool unreadable_listed =
      std::any_of(discovery.invalid_templates.begin(), discovery.invalid_templates.end(),
                  [](const gimba::core::TemplateCandidate& candidate) {
                    return candidate.check.code == TemplateCheckCode::kUnreadable &&
                           candidate.ref.name == "GIMBA - Stainless steel - Thread template";
                  });
  const PassReport report = engine.Execute(discovery, ReconcileRequest{PassMode::kCreate, false}, log);

  store.fail_find = true;
  bool search_failure_propagated = false;
  PassLog failed_log;
  try {
    static_cast<void>(engine.Discover(failed_log));
  } catch (const std::runtime_error& e) {
    search_failure_propagated = std::string(e.what()) == "document is not accessible";
  }
  return discovery.ready() && discovery.counters.valid_templates == 1 && discovery.counters.invalid_templates == 2 &&
         unreadable_listed && log.contains("Check failed on template material \"GIMBA - Stainless steel - Thread template\"") &&
         log.contains("cannot be accessed") && report.counters.created == 2 && search_failure_propagated &&
         inner.committed_transactions() == 1;
}

// Intent: A non-default prefix names, finds and deletes artifacts end to end.
bool test_custom_prefix_pass() {
  const NameCodec acme("ACME");
  MemoryMaterialStore store = gimba::core::MakeDemoStore(acme);
  const std::size_t base_size = store.size();
  ReconciliationEngine engine(store, store, GeometryTable::IsoMetric(), acme);

  PassLog log;
  const DiscoveryResult discovery = engine.Discover(log);
  const PassReport created = engine.Execute(discovery, ReconcileRequest{PassMode::kCreate, false}, log);
  const bool named = store.FindNamed("ACME - Steel galvanized - M12 thread").has_value() &&
                     !store.FindNamed("GIMBA - Steel galvanized - M12 thread").has_value();
  const PassReport deleted = engine.Execute(engine.Discover(log), ReconcileRequest{PassMode::kDelete, false}, log);

  // A default-prefix engine sees no templates in this document.
  MemoryMaterialStore other = gimba::core::MakeDemoStore(acme);
  const NameCodec default_codec;
  ReconciliationEngine mismatched(other, other, GeometryTable::IsoMetric(), default_codec);
  PassLog mismatched_log;
  const DiscoveryResult mismatched_discovery = mismatched.Discover(mismatched_log);

  return discovery.counters.valid_templates == 2 && discovery.counters.invalid_templates == 1 &&
         created.counters.created == 48 && named && deleted.counters.deleted == 48 &&
         deleted.counters.delete_failed == 0 && store.size() == base_size && !mismatched_discovery.ready() &&
         mismatched_discovery.counters.valid_templates == 0;
}

// Intent: A failed delete during overwrite counts once and skips the create for that pair.
bool test_overwrite_failed_delete_skips_create() {
  MemoryMaterialStore inner = gimba::core::MakeDemoStore();
  const GeometryTable table = make_partial_table(3);
  const NameCodec codec;
  {
    ReconciliationEngine seed(inner, inner, table, codec);
    PassLog log;
    seed.Execute(seed.Discover(log), ReconcileRequest{PassMode::kCreate, false}, log);
  }

  FaultInjectingStore store(inner);
  store.fail_delete_names.insert("GIMBA - Stainless steel - M4 thread");
  store.fail_create_names.insert("GIMBA - Steel galvanized - M5 thread");
  ReconciliationEngine engine(store, inner, table, codec);
  PassLog log;
  const PassReport report = engine.Execute(engine.Discover(log), ReconcileRequest{PassMode::kCreate, true}, log);
  return report.counters.overwritten == 4 && report.counters.overwrite_failed == 2 &&
         report.counters.created == 0 && store.delete_calls == 6 && store.create_calls == 5 &&
         inner.FindNamed("GIMBA - Stainless steel - M4 thread").has_value() &&
         !inner.FindNamed("GIMBA - Steel galvanized - M5 thread").has_value() &&
         contains(report.details.back(), "Failed to overwrite 2 materials");
}

// Intent: Delete pass removes only derived artifacts; the store refuses anything else.
bool test_delete_pass_removes_only_derived() {
  MemoryMaterialStore store = gimba::core::MakeDemoStore();
  const std::size_t base_size = store.size();
  run_pass(store, PassMode::kCreate, false);
  const PassReport report = run_pass(store, PassMode::kDelete, false);
  const auto template_ref = store.FindNamed("GIMBA - Steel galvanized - Thread template");
  if (!template_ref.has_value()) {
    return false;
  }
  const EditResult<bool> refused = store.Delete(*template_ref);
  const PassReport again = run_pass(store, PassMode::kDelete, false);
  return report.outcome == PassOutcome::kCompleted && report.counters.deleted == 48 &&
         report.instruction == "Deleted 48 thread materials." && store.size() == base_size && !refused.ok &&
         contains(refused.error, "not a thread material") && again.outcome == PassOutcome::kNothingToDo &&
         again.instruction == "No thread materials were found. Did not delete any materials." &&
         store.last_transaction_name() == "Delete Thread Materials";
}

// Intent: Run asks the prompt with welcome texts and honours cancel without touching the store.
bool test_run_with_prompt() {
  MemoryMaterialStore store = gimba::core::MakeDemoStore();
  const NameCodec codec;
  ReconciliationEngine engine(store, store, GeometryTable::IsoMetric(), codec);

  ScriptedPrompt cancel(PromptChoice{PromptAction::kCancel, false});
  PassLog log;
  const PassReport cancelled = engine.Run(cancel, log);
  if (cancelled.outcome != PassOutcome::kCancelled || cancel.contexts.size() != 1 ||
      store.committed_transactions() != 0 || !log.contains("- Cancelled by user")) {
    return false;
  }
  const PromptContext& welcome = cancel.contexts.front();
  if (welcome.title != "Good to Go..." || !starts_with(welcome.create_hint, "Will create 48 thread materials.") ||
      welcome.delete_available || welcome.overwrite_available ||
      welcome.details.at(1) != "* Found 24 thread geometries --> ok" ||
      welcome.details.at(4) != "* Found 1 invalid template material --> ignore" ||
      welcome.content != "Working document is: GIMBA.rfa\nSee details for results of pre-checks.") {
    return false;
  }

  ScriptedPrompt create(PromptChoice{PromptAction::kCreate, false});
  const PassReport created = engine.Run(create, log);
  ScriptedPrompt remove(PromptChoice{PromptAction::kDelete, false});
  const PassReport deleted = engine.Run(remove, log);
  const PromptContext& second_welcome = remove.contexts.front();
  return created.counters.created == 48 && deleted.counters.deleted == 48 && second_welcome.delete_available &&
         second_welcome.overwrite_label == "Overwrite existing thread materials" &&
         contains(second_welcome.delete_hint, "Will delete 48 existing thread materials.");
}

// Intent: A throwing transaction body rolls the memory store back and propagates.
bool test_transaction_rollback() {
  MemoryMaterialStore store = gimba::core::MakeDemoStore();
  const std::size_t before = store.size();
  bool propagated = false;
  bool added_inside = false;
  try {
    store.Run("Broken", [&store, &added_inside]() {
      added_inside = store.AddMaterial("GIMBA - Steel - M3 thread").ok;
      throw std::runtime_error("host aborted");
    });
  } catch (const std::runtime_error&) {
    propagated = true;
  }

  bool nested_rejected = false;
  store.Run("Outer", [&store, &nested_rejected]() {
    try {
      store.Run("Inner", []() {});
    } catch (const std::logic_error&) {
      nested_rejected = true;
    }
  });
  return propagated && added_inside && store.size() == before && store.rolled_back_transactions() == 1 && nested_rejected &&
         store.committed_transactions() == 1 && !store.in_transaction();
}

// Intent: Find keeps document order after deletes and ids are never reused.
bool test_store_keeps_document_order() {
  MemoryMaterialStore store;
  const NameCodec codec;
  std::vector<std::string> names;
  for (const int d : {3, 4, 5, 6}) {
    names.push_back(codec.EncodeDerived("Steel", d));
    if (!store.AddMaterial(names.back()).ok) {
      return false;
    }
  }
  const auto first = store.FindNamed(names[0]);
  if (!first.has_value() || !store.Delete(*first).ok) {
    return false;
  }
  const EditResult<gimba::core::ElementId> re_added = store.AddMaterial(names[0]);
  const EditResult<gimba::core::ElementId> duplicate = store.AddMaterial(names[1]);

  std::vector<std::string> found;
  for (const ArtifactRef& ref : store.Find(codec.derived_pattern())) {
    found.push_back(ref.name);
  }
  const std::vector<std::string> expected = {names[1], names[2], names[3], names[0]};
  const auto* re_added_record = store.materials().find(re_added.value);
  return found == expected && re_added.ok && re_added.value == 5 && !duplicate.ok &&
         store.materials().find(first->id) == nullptr && re_added_record != nullptr &&
         re_added_record->display_id == "MAT-000005";
}

// Intent: Settings parse known keys, keep defaults on bad values and serialize back.
bool test_tool_settings_parse_and_serialize() {
  const auto settings = gimba::core::ParseToolSettings(
      "# GIMBA\n"
      "output_directory=/tmp/gimba out\n"
      "materials=Steel galvanized | Stainless steel||\n"
      "delimiter=|\n"
      "overwrite_existing=true\n"
      "unknown_key=1\n"
      "broken line\n"
      "name_prefix=\n"
      "log_file=pass.log\n");
  if (settings.output_directory != "/tmp/gimba out" || settings.materials.size() != 2 ||
      settings.materials[1] != "Stainless steel" || settings.delimiter != ',' || !settings.overwrite_existing ||
      settings.name_prefix != "GIMBA" || settings.log_file != "pass.log") {
    return false;
  }

  gimba::core::ToolSettings german = settings;
  german.delimiter = ';';
  const auto round_trip = gimba::core::ParseToolSettings(gimba::core::SerializeToolSettings(german));
  MemoryTextFileSink sink;
  const FileWriteResult saved = gimba::core::SaveToolSettings(sink, "gimba.ini", german);
  return round_trip.delimiter == ';' && round_trip.materials == german.materials &&
         round_trip.output_directory == german.output_directory && round_trip.overwrite_existing && saved.ok() &&
         contains(sink.files["gimba.ini"], "materials=Steel galvanized|Stainless steel\n");
}

// Intent: Pass log frames a pass and exception descriptions unwind nested causes.
bool test_pass_log_and_exception_chain() {
  PassLog log;
  log.Begin("Thread Materials", "20260101-120000");
  log.Line("body");
  log.End();

  std::vector<std::string> described;
  try {
    try {
      throw std::runtime_error("file locked");
    } catch (const std::runtime_error&) {
      std::throw_with_nested(std::runtime_error("delete failed"));
    }
  } catch (const std::exception& e) {
    described = gimba::core::DescribeException(e);
  }

  const std::vector<std::string> expected_lines = {
      "-------------------------------------------------------------------------------",
      "Pass of Thread Materials, timestamp 20260101-120000", "body", "", "Pass complete"};
  return log.lines() == expected_lines && described.size() == 2 && described[0] == "delete failed" &&
         described[1] == "  caused by: file locked" && gimba::core::make_pass_timestamp({}).size() == 15 &&
         log.text().back() == '\n';
}

// Intent: Asset dump visits every property kind including nested assets and lists.
bool test_material_dump() {
  MemoryMaterialStore store = gimba::core::MakeDemoStore();
  const auto ref = store.FindNamed("GIMBA - Steel galvanized - Thread template");
  if (!ref.has_value()) {
    return false;
  }
  const auto lines = gimba::core::DumpMaterial(*store.Load(*ref));
  std::string text;
  for (const auto& line : lines) {
    text += line + "\n";
  }
  return starts_with(text, "Material MAT-000002 \"GIMBA - Steel galvanized - Thread template\"\n") &&
         contains(text, "- generic_bump_map (asset)\n") &&
         contains(text, "- BaseSchema (string) = \"GradientSchema\"\n") &&
         contains(text, "- texture_URepeat (boolean) = false\n") &&
         contains(text, "- generic_bump_amount (double) = 0.3\n") &&
         contains(text, "- texture_file (reference) -> E-009001 \"thread_gradient.png\"\n") &&
         contains(text, "- gradient_colors (list, 2 items)\n");
}

// Intent: Local sink creates, skips and overwrites real files.
bool test_local_file_sink() {
  const std::filesystem::path dir = std::filesystem::temp_directory_path() / "gimba_core_tests_sink";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  gimba::core::LocalTextFileSink sink;
  const std::string path = (dir / "nested" / "GIMBA D2D.csv").string();
  const auto created = sink.Write(path, "a\n", false);
  const auto skipped = sink.Write(path, "b\n", false);
  const auto overwritten = sink.Write(path, "c\n", true);
  const bool exists = sink.Exists(path);
  const auto size = std::filesystem::file_size(path, ec);

  std::filesystem::remove_all(dir, ec);
  return created.outcome == FileWriteOutcome::kCreated && skipped.outcome == FileWriteOutcome::kSkipped &&
         overwritten.outcome == FileWriteOutcome::kOverwritten && exists && size == 2 && !sink.Exists(path);
}

}  // namespace

int main() {
  const std::vector<TestCase> tests = {
      {"Geometry_DerivedFormulas", "Derived dimensions match formulas for all diameters", test_derived_formulas_for_all_diameters},
      {"Geometry_IsoSeries", "ISO table holds the coarse series and is built once", test_iso_table_series_and_identity},
      {"Geometry_RejectsMisuse", "Duplicate/unsorted/empty/unknown fail fast", test_geometry_table_rejects_misuse},
      {"Geometry_ThreadView", "Thread view mirrors bolt table", test_thread_geometries_mirror_bolts},
      {"NameCodec_RoundTrip", "Template and derived names round-trip", test_name_codec_round_trip},
      {"NameCodec_FullMatchOnly", "Partial matches are rejected", test_name_codec_rejects_partial_matches},
      {"Catalog_BoltShankRule", "Shank rows only above 50 mm", test_bolt_catalog_shank_rule},
      {"Catalog_AssemblyM12", "M12 assembly rows use grip 100 with shank", test_assembly_catalog_m12},
      {"Catalog_GripToLength", "G2L sampling and strict length selection", test_grip_to_length_lookup},
      {"Catalog_DiameterBanding", "Nearest diameter with lower tie-break", test_diameter_banding},
      {"Catalog_ParameterDump", "MGeo rows use F2 for H and d2", test_geometry_parameter_dump},
      {"Catalog_SemicolonDelimiter", "German delimiter applies everywhere", test_semicolon_delimiter},
      {"Catalog_HtmlDump", "HTML table has consistent tags", test_geometry_html_dump},
      {"Catalog_WriteOutcomes", "Created/skipped/overwritten outcomes", test_generated_file_write_outcomes},
      {"Catalog_BatchReport", "Batch tallies and isolates IO failures", test_catalog_batch_report},
      {"Catalog_Precheck", "Pre-check lists all output files", test_catalog_precheck},
      {"Text_CountMessages", "Count message placeholders and suffixes", test_count_messages},
      {"Validator_BadName", "Name mismatch always rejects", test_validator_rejects_bad_name},
      {"Validator_CheckOrder", "Checks run in order with specific codes", test_validator_check_order},
      {"Reconcile_DiscoverDemo", "Discovery partitions demo templates", test_discovery_on_demo_document},
      {"Reconcile_Gate", "Gate blocks before mutation", test_gate_blocks_without_valid_templates},
      {"Reconcile_CreateEdits", "Create applies thread edits to a deep copy", test_create_pass_applies_edits},
      {"Reconcile_SkipAll", "Skip count equals templates x geometries", test_create_without_overwrite_skips_all},
      {"Reconcile_OverwriteIdempotent", "Overwrite passes converge", test_overwrite_passes_are_idempotent},
      {"Reconcile_FailureIsolation", "One failure in 20 pairs leaves 19 successes", test_single_store_failure_is_isolated},
      {"Reconcile_NonStdCause", "Non-std nested cause is logged and isolated", test_non_std_cause_is_isolated},
      {"Reconcile_UnreadableStore", "Load failure invalidates a template; search failure propagates", test_unreadable_store_during_discovery},
      {"Reconcile_CustomPrefix", "Non-default prefix pass creates and deletes", test_custom_prefix_pass},
      {"Reconcile_OverwriteFailedDelete", "Failed delete blocks create and counts once", test_overwrite_failed_delete_skips_create},
      {"Reconcile_DeleteOnlyDerived", "Delete pass keeps templates and plain materials", test_delete_pass_removes_only_derived},
      {"Reconcile_RunWithPrompt", "Prompt drives mode and cancel", test_run_with_prompt},
      {"Store_TransactionRollback", "Throwing body rolls back and propagates", test_transaction_rollback},
      {"Store_DocumentOrder", "Deletes keep document order", test_store_keeps_document_order},
      {"Settings_ParseSerialize", "Tool settings parse and round-trip", test_tool_settings_parse_and_serialize},
      {"Log_PassFrameAndCauses", "Pass log framing and nested causes", test_pass_log_and_exception_chain},
      {"Asset_Dump", "Dump covers every property kind", test_material_dump},
      {"FileSink_Local", "Local sink create/skip/overwrite", test_local_file_sink},
  };

  bool all_passed = true;
  for (const TestCase& test : tests) {
    const bool passed = test.run();
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
    all_passed = all_passed && passed;
  }

  if (!all_passed) {
    std::cerr << "core tests failed\n";
    return 1;
  }

  std::cout << "core tests passed (" << tests.size() << " cases)\n";
  return 0;
}
