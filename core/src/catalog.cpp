#include "gimba/core/catalog.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "gimba/core/text_format.hpp"

namespace gimba::core {

namespace {

constexpr std::string_view kLengthTag = "##LENGTH##MILLIMETERS";
constexpr std::string_view kOtherTag = "##OTHER##";

// Header row: empty name column, then one tagged field per column.
std::string make_header(char delimiter, const std::vector<std::pair<std::string_view, std::string_view>>& fields) {
  std::string out;
  for (const auto& [name, tag] : fields) {
    out += delimiter;
    out += name;
    out += tag;
  }
  out += '\n';
  return out;
}

class RowWriter {
 public:
  explicit RowWriter(char delimiter) : delimiter_(delimiter) {}

  RowWriter& name(std::string_view value) {
    row_ += value;
    return *this;
  }

  RowWriter& field(std::string_view value) {
    row_ += delimiter_;
    row_ += value;
    return *this;
  }

  RowWriter& field(double value) { return field(format_number(value)); }

  RowWriter& field(int value) { return field(std::to_string(value)); }

  RowWriter& field(const std::optional<double>& value) {
    return field(value.has_value() ? format_number(*value) : std::string{});
  }

  RowWriter& fixed(double value) { return field(format_fixed(value, 2)); }

  void end(std::string& out) {
    out += row_;
    out += '\n';
    row_.clear();
  }

 private:
  char delimiter_;
  std::string row_{};
};

std::string html_cell(std::string_view tag, std::string_view value) {
  return "    <" + std::string(tag) + ">" + std::string(value) + "</" + std::string(tag) + ">\n";
}

std::string html_cell(const std::optional<double>& value) {
  return html_cell("td", value.has_value() ? format_number(*value) : std::string{});
}

std::vector<int> sorted_diameters(const GeometryTable& table) {
  std::vector<int> diameters;
  diameters.reserve(table.size());
  for (const BoltGeometry& bolt : table.bolt_geometries()) {
    diameters.push_back(bolt.nominal_diameter());
  }
  std::sort(diameters.begin(), diameters.end());
  return diameters;
}

std::string render_file(CatalogSchedule schedule, std::string_view file_name, const GeometryTable& table,
                        const CatalogOptions& options) {
  switch (schedule) {
    case CatalogSchedule::kTypeCatalogs:
      if (file_name == kBoltTypeCatalogFile) {
        return RenderBoltTypeCatalog(table, options);
      }
      return RenderAssemblyTypeCatalog(table, options);
    case CatalogSchedule::kLookupTables:
      if (file_name == kGripToLengthFile) {
        return RenderGripToLengthTable(table, options);
      }
      if (file_name == kGeometryTableFile) {
        return RenderGeometryTable(table, options);
      }
      return RenderDiameterBandTable(table, options);
    case CatalogSchedule::kGeometryHtml:
      return RenderGeometryHtml(table, options);
  }
  return {};
}

void finish_batch_report(CatalogBatchReport& report) {
  report.warning = report.errors > 0;
  report.title = report.warning ? "Operation Completed with Errors" : "Operation Completed";
  report.content = "See details and log file for further information.";
  if (report.created + report.overwritten + report.errors == 0 && report.skipped > 0) {
    report.instruction = "All output files were present. Nothing to be done.";
    report.content = "If you want to recreate the files, re-run the pass and check "
                     "\"Overwrite existing files\". " +
                     report.content;
    return;
  }

  std::string instruction;
  if (report.created > 0) {
    instruction += MakeCountMessage(report.created, "{0} file{1} created. ");
  }
  if (report.overwritten > 0) {
    instruction += MakeCountMessage(report.overwritten, "{0} file{1} overwritten. ");
  }
  if (report.skipped > 0) {
    instruction += MakeCountMessage(report.skipped, "{0} file{1} skipped. ");
  }
  if (report.errors > 0) {
    instruction += MakeCountMessage(report.errors, "{0} error{1} occurred. ");
  }
  while (!instruction.empty() && instruction.back() == ' ') {
    instruction.pop_back();
  }
  report.instruction = instruction;
}

}  // namespace

std::vector<BoltTypeRow> EnumerateBoltTypes(const GeometryTable& table, const CatalogOptions& options) {
  std::vector<BoltTypeRow> rows;
  for (const BoltGeometry& bolt : table.bolt_geometries()) {
    const int d = bolt.nominal_diameter();
    for (const double length : bolt.base().customary_lengths) {
      for (const bool shank : {false, true}) {
        if (shank && !(length > kShankMinLength)) {
          continue;
        }
        for (const std::string& material : options.materials) {
          BoltTypeRow row{};
          row.name = bolt.label() + " x " + format_number(length) + (shank ? " w/shank" : "") + " " + material;
          row.nominal_diameter = d;
          row.length = length;
          row.shank = shank;
          row.plain_material = options.codec.EncodePlain(material);
          row.thread_material = options.codec.EncodeDerived(material, d);
          rows.push_back(std::move(row));
        }
      }
    }
  }
  return rows;
}

std::vector<AssemblyTypeRow> EnumerateAssemblyTypes(const GeometryTable& table, const CatalogOptions& options) {
  std::vector<AssemblyTypeRow> rows;
  for (const BoltGeometry& bolt : table.bolt_geometries()) {
    const int d = bolt.nominal_diameter();
    const double grip = bolt.base().default_grip_length;
    for (const bool shank : {false, true}) {
      if (shank && !(grip > kShankMinLength)) {
        continue;
      }
      for (const std::string& material : options.materials) {
        AssemblyTypeRow row{};
        row.name = bolt.label() + (shank ? " w/shank" : "") + " " + material;
        row.nominal_diameter = d;
        row.grip_length = grip;
        row.shank = shank;
        row.plain_material = options.codec.EncodePlain(material);
        row.thread_material = options.codec.EncodeDerived(material, d);
        rows.push_back(std::move(row));
      }
    }
  }
  return rows;
}

int grip_length_step(int grip_length) {
  if (grip_length < 23) {
    return 2;
  }
  if (grip_length < 100) {
    return 5;
  }
  return 10;
}

double minimum_bolt_length(const BoltGeometry& bolt, double grip_length) {
  return grip_length + 2.0 * bolt.base().head_height + 2.0 * bolt.base().washer_thickness;
}

std::optional<double> SelectBoltLength(const BoltGeometry& bolt, double grip_length) {
  const double lmin = minimum_bolt_length(bolt, grip_length);
  for (const double length : bolt.base().customary_lengths) {
    if (length > lmin) {
      return length;
    }
  }
  return std::nullopt;
}

std::vector<GripToLengthRow> BuildGripToLengthRows(const GeometryTable& table) {
  std::vector<GripToLengthRow> rows;
  for (const BoltGeometry& bolt : table.bolt_geometries()) {
    for (int grip = 0; grip <= kMaxGripLength; ++grip) {
      if (grip % grip_length_step(grip) != 0) {
        continue;
      }
      const std::optional<double> length = SelectBoltLength(bolt, grip);
      if (!length.has_value()) {
        continue;
      }
      rows.push_back(GripToLengthRow{bolt.nominal_diameter(), grip, *length});
    }
  }
  return rows;
}

std::optional<int> NearestNominalDiameter(const GeometryTable& table, int diameter) {
  const std::vector<int> diameters = sorted_diameters(table);
  if (diameters.empty()) {
    return std::nullopt;
  }
  const auto upper_it = std::lower_bound(diameters.begin(), diameters.end(), diameter);
  if (upper_it == diameters.end()) {
    return diameters.back();
  }
  if (*upper_it == diameter || upper_it == diameters.begin()) {
    return *upper_it;
  }
  const int upper = *upper_it;
  const int lower = *(upper_it - 1);
  return (upper - diameter < diameter - lower) ? upper : lower;
}

std::vector<DiameterBandRow> BuildDiameterBands(const GeometryTable& table) {
  std::vector<DiameterBandRow> rows;
  const std::vector<int> diameters = sorted_diameters(table);
  if (diameters.empty()) {
    return rows;
  }
  for (int d = diameters.front(); d <= diameters.back(); ++d) {
    const std::optional<int> nearest = NearestNominalDiameter(table, d);
    if (nearest.has_value()) {
      rows.push_back(DiameterBandRow{d, *nearest});
    }
  }
  return rows;
}

std::string RenderBoltTypeCatalog(const GeometryTable& table, const CatalogOptions& options) {
  std::string out = make_header(options.delimiter, {{"Nominal Diameter", kLengthTag},
                                                    {"Length", kLengthTag},
                                                    {"Shank", kOtherTag},
                                                    {"Material", kOtherTag},
                                                    {"Thread Material", kOtherTag}});
  RowWriter writer(options.delimiter);
  for (const BoltTypeRow& row : EnumerateBoltTypes(table, options)) {
    writer.name(row.name)
        .field(row.nominal_diameter)
        .field(row.length)
        .field(row.shank ? 1 : 0)
        .field(row.plain_material)
        .field(row.thread_material)
        .end(out);
  }
  return out;
}

std::string RenderAssemblyTypeCatalog(const GeometryTable& table, const CatalogOptions& options) {
  std::string out = make_header(options.delimiter, {{"Nominal Diameter", kLengthTag},
                                                    {"Grip Length", kLengthTag},
                                                    {"Shank", kOtherTag},
                                                    {"Material", kOtherTag},
                                                    {"Thread Material", kOtherTag}});
  RowWriter writer(options.delimiter);
  for (const AssemblyTypeRow& row : EnumerateAssemblyTypes(table, options)) {
    writer.name(row.name)
        .field(row.nominal_diameter)
        .field(row.grip_length)
        .field(row.shank ? 1 : 0)
        .field(row.plain_material)
        .field(row.thread_material)
        .end(out);
  }
  return out;
}

std::string RenderGripToLengthTable(const GeometryTable& table, const CatalogOptions& options) {
  std::string out = make_header(options.delimiter, {{"D", kLengthTag}, {"LG", kLengthTag}, {"l", kLengthTag}});
  RowWriter writer(options.delimiter);
  for (const GripToLengthRow& row : BuildGripToLengthRows(table)) {
    // Row name is not read by the importer.
    writer.name("M" + std::to_string(row.nominal_diameter) + " x ]" + std::to_string(row.grip_length) + "[")
        .field(row.nominal_diameter)
        .field(row.grip_length)
        .field(row.bolt_length)
        .end(out);
  }
  return out;
}

std::string RenderGeometryTable(const GeometryTable& table, const CatalogOptions& options) {
  std::string out = make_header(options.delimiter, {{"D", kLengthTag},
                                                    {"P", kLengthTag},
                                                    {"H", kLengthTag},
                                                    {"d2", kLengthTag},
                                                    {"s", kLengthTag},
                                                    {"k", kLengthTag},
                                                    {"a", kLengthTag},
                                                    {"b2", kLengthTag},
                                                    {"b3", kLengthTag},
                                                    {"b4", kLengthTag},
                                                    {"du1", kLengthTag},
                                                    {"du2", kLengthTag},
                                                    {"u", kLengthTag},
                                                    {"dh1", kLengthTag},
                                                    {"dh2", kLengthTag},
                                                    {"dh3", kLengthTag}});
  RowWriter writer(options.delimiter);
  for (const BoltGeometry& bolt : table.bolt_geometries()) {
    const BoltBaseDimensions& b = bolt.base();
    const BoltDerivedDimensions& v = bolt.derived();
    writer.name(bolt.label())
        .field(b.nominal_diameter)
        .field(b.pitch)
        .fixed(v.thread_height)
        .fixed(v.pitch_diameter)
        .field(b.wrench_size)
        .field(b.head_height)
        .field(b.head_to_thread)
        .field(v.min_thread_short)
        .field(v.min_thread_medium)
        .field(v.min_thread_long)
        .field(b.washer_hole_diameter)
        .field(b.washer_diameter)
        .field(b.washer_thickness)
        .field(b.clearance_fine)
        .field(b.clearance_medium)
        .field(b.clearance_coarse)
        .end(out);
  }
  return out;
}

std::string RenderDiameterBandTable(const GeometryTable& table, const CatalogOptions& options) {
  std::string out = make_header(options.delimiter, {{"ND", kLengthTag}, {"D", kLengthTag}});
  RowWriter writer(options.delimiter);
  for (const DiameterBandRow& row : BuildDiameterBands(table)) {
    writer.name("D=" + std::to_string(row.diameter)).field(row.diameter).field(row.nominal_diameter).end(out);
  }
  return out;
}

std::string RenderGeometryHtml(const GeometryTable& table, const CatalogOptions& /*options*/) {
  std::string out = "<table>\n  <tr>\n";
  for (const std::string_view heading :
       {"Name", "D", "P", "H", "d<sub>2</sub>", "s", "k", "a", "b<sub>2</sub>", "b<sub>3</sub>", "b<sub>4</sub>",
        "d<sub>u1</sub>", "d<sub>u2</sub>", "u", "d<sub>h1</sub>", "d<sub>h2</sub>", "d<sub>h3</sub>"}) {
    out += html_cell("th", heading);
  }
  out += "  </tr>\n";

  for (const BoltGeometry& bolt : table.bolt_geometries()) {
    const BoltBaseDimensions& b = bolt.base();
    const BoltDerivedDimensions& v = bolt.derived();
    out += "  <tr>\n";
    out += html_cell("td", bolt.label());
    out += html_cell("td", std::to_string(b.nominal_diameter));
    out += html_cell("td", format_number(b.pitch));
    out += html_cell("td", format_fixed(v.thread_height, 2));
    out += html_cell("td", format_fixed(v.pitch_diameter, 2));
    out += html_cell("td", format_number(b.wrench_size));
    out += html_cell("td", format_number(b.head_height));
    out += html_cell("td", format_number(b.head_to_thread));
    out += html_cell("td", format_number(v.min_thread_short));
    out += html_cell("td", format_number(v.min_thread_medium));
    out += html_cell("td", format_number(v.min_thread_long));
    out += html_cell("td", format_number(b.washer_hole_diameter));
    out += html_cell("td", format_number(b.washer_diameter));
    out += html_cell("td", format_number(b.washer_thickness));
    out += html_cell(b.clearance_fine);
    out += html_cell(b.clearance_medium);
    out += html_cell(b.clearance_coarse);
    out += "  </tr>\n";
  }
  out += "</table>\n";
  return out;
}

FileWriteResult WriteGeneratedFile(TextFileSink& sink, const std::string& path, const std::string& content,
                                   bool overwrite) {
  return sink.Write(path, content, overwrite);
}

std::string_view to_string(CatalogSchedule schedule) {
  switch (schedule) {
    case CatalogSchedule::kTypeCatalogs:
      return "Create type catalog files";
    case CatalogSchedule::kLookupTables:
      return "Create lookup table files";
    case CatalogSchedule::kGeometryHtml:
      return "Dump geometry parameters to an HTML table";
  }
  return "unknown";
}

std::vector<std::string_view> catalog_file_names(CatalogSchedule schedule) {
  switch (schedule) {
    case CatalogSchedule::kTypeCatalogs:
      return {kBoltTypeCatalogFile, kAssemblyTypeCatalogFile};
    case CatalogSchedule::kLookupTables:
      return {kGripToLengthFile, kGeometryTableFile, kDiameterBandFile};
    case CatalogSchedule::kGeometryHtml:
      return {kGeometryHtmlFile};
  }
  return {};
}

std::string join_output_path(const std::string& directory, std::string_view file_name) {
  if (directory.empty()) {
    return std::string(file_name);
  }
  return (std::filesystem::path(directory) / std::filesystem::path(std::string(file_name))).string();
}

std::vector<CatalogFileStatus> PrecheckCatalogFiles(const TextFileSink& sink, const std::string& output_directory) {
  std::vector<CatalogFileStatus> statuses;
  for (const CatalogSchedule schedule :
       {CatalogSchedule::kTypeCatalogs, CatalogSchedule::kLookupTables, CatalogSchedule::kGeometryHtml}) {
    for (const std::string_view file_name : catalog_file_names(schedule)) {
      CatalogFileStatus status{};
      status.schedule = schedule;
      status.file_name = std::string(file_name);
      status.path = join_output_path(output_directory, file_name);
      status.exists = sink.Exists(status.path);
      statuses.push_back(std::move(status));
    }
  }
  return statuses;
}

CatalogBatchReport RunCatalogBatch(const GeometryTable& table, const CatalogOptions& options,
                                   CatalogSchedule schedule, TextFileSink& sink,
                                   const std::string& output_directory, bool overwrite, PassLog& log) {
  CatalogBatchReport report{};
  report.schedule = schedule;
  log.Line("- " + std::string(to_string(schedule)) + " operation selected");

  for (const std::string_view file_name : catalog_file_names(schedule)) {
    CatalogFileOutcome outcome{};
    outcome.file_name = std::string(file_name);
    outcome.path = join_output_path(output_directory, file_name);
    log.Line();
    log.Line(outcome.path);

    try {
      const std::string content = render_file(schedule, file_name, table, options);
      outcome.result = WriteGeneratedFile(sink, outcome.path, content, overwrite);
    } catch (const std::exception& e) {
      outcome.result.outcome = FileWriteOutcome::kFailed;
      outcome.result.error = e.what();
    }

    switch (outcome.result.outcome) {
      case FileWriteOutcome::kCreated:
        ++report.created;
        break;
      case FileWriteOutcome::kOverwritten:
        ++report.overwritten;
        break;
      case FileWriteOutcome::kSkipped:
        ++report.skipped;
        break;
      case FileWriteOutcome::kFailed:
        ++report.errors;
        break;
    }
    log.Line("- " + std::string(to_string(outcome.result.outcome)));
    if (!outcome.result.ok()) {
      log.Line("  " + outcome.result.error);
    }
    report.details.push_back("* " + outcome.file_name + " (" + std::string(to_string(outcome.result.outcome)) +
                             ")");
    report.files.push_back(std::move(outcome));
  }

  finish_batch_report(report);
  log.Line();
  log.Line("Wrap-up");
  log.Line("- " + report.instruction);
  return report;
}

}  // namespace gimba::core
