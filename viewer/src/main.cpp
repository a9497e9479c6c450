#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <exception>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

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
#include "imgui.h"
#include "raylib.h"
#include "rlImGui.h"

namespace {

using gimba::core::BoltGeometry;
using gimba::core::CatalogSchedule;
using gimba::core::GeometryTable;
using gimba::core::MemoryMaterialStore;
using gimba::core::NameCodec;
using gimba::core::ElementId;
using gimba::core::PassLog;
using gimba::core::PromptAction;
using gimba::core::PromptChoice;
using gimba::core::ReconciliationEngine;

constexpr float kTopbarHeight = 74.0f;
constexpr std::size_t kTextBufferSize = 512;

using TextBuffer = std::array<char, kTextBufferSize>;

struct WelcomeDialogState {
  bool open_requested = false;
  gimba::core::PromptContext context{};
  bool overwrite_existing = false;
};

struct ViewerUiState {
  gimba::core::ToolSettings settings{};
  TextBuffer output_directory{};
  TextBuffer materials{};
  int delimiter_index = 0;
  bool overwrite_files = false;

  int selected_diameter = 12;
  int grip_length = 100;
  int band_diameter = 7;
  ElementId selected_material_id = gimba::core::kInvalidElementId;

  WelcomeDialogState welcome{};
  std::optional<gimba::core::PassReport> last_pass_report{};
  std::optional<gimba::core::CatalogBatchReport> last_batch_report{};
  std::vector<gimba::core::CatalogFileStatus> file_statuses{};
  std::vector<std::string> pass_log{};
  std::string session_log{};

  std::vector<std::string> logs{};
  std::string last_error{};
  bool ui_show_workspace = true;
  float ui_workspace_width = 0.0f;
  float ui_log_height = 90.0f;
};

// Core objects the viewer works on. The material document is the in-memory
// demo document.
struct ViewerSession {
  const GeometryTable& table = GeometryTable::IsoMetric();
  NameCodec codec{};
  MemoryMaterialStore store = gimba::core::MakeDemoStore(codec);
  gimba::core::LocalTextFileSink sink{};
};

struct ViewerPersistentSettings {
  int window_width = 1280;
  int window_height = 760;
  bool ui_show_workspace = true;
  float ui_workspace_width = 520.0f;
  float ui_log_height = 90.0f;
};

constexpr const char* kViewerSettingsFile = "viewer_state.ini";

ViewerPersistentSettings LoadViewerPersistentSettings() {
  ViewerPersistentSettings settings{};
  std::ifstream ifs(kViewerSettingsFile);
  if (!ifs.is_open()) {
    return settings;
  }

  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) {
      continue;
    }
    const std::size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= line.size()) {
      continue;
    }
    const std::string key = line.substr(0, eq);
    const std::string value = line.substr(eq + 1);
    try {
      if (key == "window_width") {
        settings.window_width = std::max(800, std::stoi(value));
      } else if (key == "window_height") {
        settings.window_height = std::max(600, std::stoi(value));
      } else if (key == "ui_show_workspace") {
        settings.ui_show_workspace = gimba::core::parse_bool(value, settings.ui_show_workspace);
      } else if (key == "ui_workspace_width") {
        settings.ui_workspace_width = std::clamp(std::stof(value), 360.0f, 900.0f);
      } else if (key == "ui_log_height") {
        settings.ui_log_height = std::clamp(std::stof(value), 60.0f, 400.0f);
      }
    } catch (const std::exception&) {
      // Malformed number: keep the default.
      continue;
    }
  }
  return settings;
}

void SaveViewerPersistentSettings(const ViewerPersistentSettings& settings) {
  std::ofstream ofs(kViewerSettingsFile, std::ios::trunc);
  if (!ofs.is_open()) {
    return;
  }
  ofs << "window_width=" << settings.window_width << "\n";
  ofs << "window_height=" << settings.window_height << "\n";
  ofs << "ui_show_workspace=" << (settings.ui_show_workspace ? 1 : 0) << "\n";
  ofs << "ui_workspace_width=" << settings.ui_workspace_width << "\n";
  ofs << "ui_log_height=" << settings.ui_log_height << "\n";
}

void PushLog(ViewerUiState& ui_state, const std::string& line) {
  ui_state.logs.push_back(line);
  if (ui_state.logs.size() > 12) {
    ui_state.logs.erase(ui_state.logs.begin());
  }
}

void CopyToBuffer(TextBuffer& buffer, const std::string& value) {
  std::snprintf(buffer.data(), buffer.size(), "%s", value.c_str());
}

std::string JoinMaterials(const std::vector<std::string>& materials) {
  std::string out;
  for (std::size_t i = 0; i < materials.size(); ++i) {
    out += (i > 0 ? "|" : "") + materials[i];
  }
  return out;
}

void SyncBuffersFromSettings(ViewerUiState& ui_state) {
  CopyToBuffer(ui_state.output_directory, ui_state.settings.output_directory);
  CopyToBuffer(ui_state.materials, JoinMaterials(ui_state.settings.materials));
  ui_state.delimiter_index = ui_state.settings.delimiter == ';' ? 1 : 0;
  ui_state.overwrite_files = ui_state.settings.overwrite_existing;
}

void ApplyBuffersToSettings(ViewerUiState& ui_state) {
  const std::string directory(ui_state.output_directory.data());
  ui_state.settings.output_directory = directory.empty() ? "." : directory;
  std::vector<std::string> materials = gimba::core::ParseMaterialList(ui_state.materials.data());
  if (!materials.empty()) {
    ui_state.settings.materials = std::move(materials);
  }
  ui_state.settings.delimiter = ui_state.delimiter_index == 1 ? ';' : ',';
  ui_state.settings.overwrite_existing = ui_state.overwrite_files;
}

std::size_t CountThreadMaterials(const ViewerSession& session) {
  return session.store.Find(session.codec.derived_pattern()).size();
}

void RefreshFileStatuses(ViewerSession& session, ViewerUiState& ui_state) {
  ui_state.file_statuses = gimba::core::PrecheckCatalogFiles(session.sink, ui_state.settings.output_directory);
}

// Appends the pass to the session log and rewrites the log file.
void FinishPass(ViewerSession& session, ViewerUiState& ui_state, PassLog& log) {
  log.End();
  ui_state.pass_log = log.lines();
  ui_state.session_log += log.text();
  const gimba::core::FileWriteResult written =
      session.sink.Write(ui_state.settings.log_file, ui_state.session_log, true);
  if (!written.ok()) {
    PushLog(ui_state, "[error] log file: " + written.error);
  }
}

class DialogChoicePrompt final : public gimba::core::InteractionPrompt {
 public:
  explicit DialogChoicePrompt(PromptChoice choice) : choice_(choice) {}

  PromptChoice Choose(const gimba::core::PromptContext& /*context*/) override { return choice_; }

 private:
  PromptChoice choice_;
};

void OpenWelcomeDialog(ViewerSession& session, ViewerUiState& ui_state) {
  ReconciliationEngine engine(session.store, session.store, session.table, session.codec);
  PassLog scratch;
  const gimba::core::DiscoveryResult discovery = engine.Discover(scratch);
  ui_state.welcome.context = ReconciliationEngine::BuildPromptContext(discovery, session.store.document_name());
  ui_state.welcome.overwrite_existing = ui_state.settings.overwrite_existing;
  ui_state.welcome.open_requested = true;
}

void RunThreadMaterialsPass(ViewerSession& session, ViewerUiState& ui_state, PromptChoice choice) {
  PassLog log;
  log.Begin("Thread Materials", gimba::core::make_pass_timestamp(std::chrono::system_clock::now()));
  ReconciliationEngine engine(session.store, session.store, session.table, session.codec);
  DialogChoicePrompt prompt(choice);
  try {
    gimba::core::PassReport report = engine.Run(prompt, log);
    PushLog(ui_state, "[pass] " + report.title + ": " + report.instruction);
    ui_state.last_pass_report = std::move(report);
    ui_state.last_error.clear();
  } catch (const std::exception& e) {
    log.Line();
    log.Line("An unrecoverable error occurred executing the pass.");
    for (const std::string& line : gimba::core::DescribeException(e)) {
      log.Line("  " + line);
    }
    ui_state.last_pass_report.reset();
    ui_state.last_error = e.what();
    PushLog(ui_state, "[error] thread materials pass failed");
  }
  FinishPass(session, ui_state, log);
}

void RunCatalogPass(ViewerSession& session, ViewerUiState& ui_state, CatalogSchedule schedule) {
  ApplyBuffersToSettings(ui_state);
  PassLog log;
  log.Begin("Catalog Files", gimba::core::make_pass_timestamp(std::chrono::system_clock::now()));
  log.Line("Output directory: " + ui_state.settings.output_directory);

  gimba::core::CatalogOptions options{};
  options.materials = ui_state.settings.materials;
  options.delimiter = ui_state.settings.delimiter;
  options.codec = session.codec;
  try {
    gimba::core::CatalogBatchReport report =
        gimba::core::RunCatalogBatch(session.table, options, schedule, session.sink,
                                     ui_state.settings.output_directory, ui_state.overwrite_files, log);
    PushLog(ui_state, "[catalog] " + report.title + ": " + report.instruction);
    ui_state.last_batch_report = std::move(report);
    ui_state.last_error.clear();
  } catch (const std::exception& e) {
    log.Line();
    log.Line("An unrecoverable error occurred executing the pass.");
    for (const std::string& line : gimba::core::DescribeException(e)) {
      log.Line("  " + line);
    }
    ui_state.last_batch_report.reset();
    ui_state.last_error = e.what();
    PushLog(ui_state, "[error] catalog pass failed");
  }
  RefreshFileStatuses(session, ui_state);
  FinishPass(session, ui_state, log);
}

void DrawReportLines(const std::string& title, const std::string& instruction, const std::string& content,
                     const std::vector<std::string>& details, bool warning) {
  if (warning) {
    ImGui::TextColored(ImVec4(1.0f, 0.55f, 0.35f, 1.0f), "%s", title.c_str());
  } else {
    ImGui::TextUnformatted(title.c_str());
  }
  ImGui::TextWrapped("%s", instruction.c_str());
  if (!content.empty()) {
    ImGui::TextWrapped("%s", content.c_str());
  }
  for (const std::string& line : details) {
    ImGui::TextUnformatted(line.c_str());
  }
}

void DrawWelcomeDialog(ViewerSession& session, ViewerUiState& ui_state) {
  constexpr const char* kPopupId = "GIMBA Thread Materials";
  if (ui_state.welcome.open_requested) {
    ImGui::OpenPopup(kPopupId);
    ui_state.welcome.open_requested = false;
  }
  if (!ImGui::BeginPopupModal(kPopupId, nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
    return;
  }

  const gimba::core::PromptContext& context = ui_state.welcome.context;
  std::optional<PromptChoice> choice;
  ImGui::PushTextWrapPos(540.0f);
  ImGui::TextUnformatted(context.title.c_str());
  ImGui::Separator();
  ImGui::TextUnformatted(context.instruction.c_str());
  ImGui::TextUnformatted(context.content.c_str());
  ImGui::PopTextWrapPos();
  if (ImGui::CollapsingHeader("Details", ImGuiTreeNodeFlags_DefaultOpen)) {
    for (const std::string& line : context.details) {
      ImGui::TextUnformatted(line.c_str());
    }
  }
  ImGui::Separator();

  if (context.ready) {
    if (ImGui::Button(context.create_label.c_str())) {
      choice = PromptChoice{PromptAction::kCreate, ui_state.welcome.overwrite_existing};
    }
    if (ImGui::IsItemHovered()) {
      ImGui::SetTooltip("%s", context.create_hint.c_str());
    }
    if (context.delete_available) {
      ImGui::SameLine();
      if (ImGui::Button(context.delete_label.c_str())) {
        choice = PromptChoice{PromptAction::kDelete, false};
      }
      if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("%s", context.delete_hint.c_str());
      }
    }
    if (context.overwrite_available) {
      ImGui::Checkbox(context.overwrite_label.c_str(), &ui_state.welcome.overwrite_existing);
    }
  }
  if (ImGui::Button(context.ready ? "Cancel" : "Close")) {
    choice = PromptChoice{PromptAction::kCancel, false};
  }

  if (choice.has_value()) {
    ImGui::CloseCurrentPopup();
  }
  ImGui::EndPopup();

  if (choice.has_value()) {
    RunThreadMaterialsPass(session, ui_state, *choice);
  }
}

void DrawGeometryContent(const ViewerSession& session, ViewerUiState& ui_state) {
  using gimba::core::format_fixed;
  using gimba::core::format_number;

  ImGui::Text("ISO metric thread geometries: %d", static_cast<int>(session.table.size()));
  const ImGuiTableFlags flags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY |
                                ImGuiTableFlags_SizingFixedFit;
  if (ImGui::BeginTable("GeometryTable", 8, flags, ImVec2(0.0f, 260.0f))) {
    ImGui::TableSetupScrollFreeze(0, 1);
    for (const char* heading : {"Name", "P", "H", "d2", "C", "beta", "dgl", "Lengths"}) {
      ImGui::TableSetupColumn(heading);
    }
    ImGui::TableHeadersRow();
    for (const BoltGeometry& bolt : session.table.bolt_geometries()) {
      const auto& b = bolt.base();
      const auto& v = bolt.derived();
      ImGui::TableNextRow();
      ImGui::TableNextColumn();
      const bool selected = ui_state.selected_diameter == bolt.nominal_diameter();
      if (ImGui::Selectable(bolt.label().c_str(), selected, ImGuiSelectableFlags_SpanAllColumns)) {
        ui_state.selected_diameter = bolt.nominal_diameter();
      }
      ImGui::TableNextColumn();
      ImGui::TextUnformatted(format_number(b.pitch).c_str());
      ImGui::TableNextColumn();
      ImGui::TextUnformatted(format_fixed(v.thread_height, 2).c_str());
      ImGui::TableNextColumn();
      ImGui::TextUnformatted(format_fixed(v.pitch_diameter, 2).c_str());
      ImGui::TableNextColumn();
      ImGui::TextUnformatted(format_fixed(v.circumference, 2).c_str());
      ImGui::TableNextColumn();
      ImGui::TextUnformatted(format_fixed(v.helix_angle_deg, 3).c_str());
      ImGui::TableNextColumn();
      ImGui::TextUnformatted(format_number(b.default_grip_length).c_str());
      ImGui::TableNextColumn();
      ImGui::Text("%d", static_cast<int>(b.customary_lengths.size()));
    }
    ImGui::EndTable();
  }

  const BoltGeometry* bolt = session.table.find(ui_state.selected_diameter);
  if (bolt == nullptr) {
    return;
  }
  const auto& b = bolt->base();
  ImGui::Separator();
  ImGui::TextWrapped("%s", bolt->describe().c_str());
  ImGui::Text("s=%s  k=%s  a=%s  du1=%s  du2=%s  u=%s", format_number(b.wrench_size).c_str(),
              format_number(b.head_height).c_str(), format_number(b.head_to_thread).c_str(),
              format_number(b.washer_hole_diameter).c_str(), format_number(b.washer_diameter).c_str(),
              format_number(b.washer_thickness).c_str());

  std::string lengths;
  for (const double length : b.customary_lengths) {
    lengths += (lengths.empty() ? "" : ", ") + format_number(length);
  }
  ImGui::TextWrapped("Customary lengths: %s", lengths.c_str());

  ImGui::SetNextItemWidth(140.0f);
  ImGui::InputInt("Grip length LG [mm]", &ui_state.grip_length);
  ui_state.grip_length = std::clamp(ui_state.grip_length, 0, gimba::core::kMaxGripLength);
  const double lmin = gimba::core::minimum_bolt_length(*bolt, ui_state.grip_length);
  const std::optional<double> length = gimba::core::SelectBoltLength(*bolt, ui_state.grip_length);
  if (length.has_value()) {
    ImGui::Text("lmin=%s mm -> bolt length l=%s mm", format_number(lmin).c_str(), format_number(*length).c_str());
  } else {
    ImGui::TextColored(ImVec4(1.0f, 0.55f, 0.35f, 1.0f), "lmin=%s mm: no customary length is long enough",
                       format_number(lmin).c_str());
  }

  ImGui::SetNextItemWidth(140.0f);
  ImGui::InputInt("Diameter [mm]", &ui_state.band_diameter);
  ui_state.band_diameter = std::clamp(ui_state.band_diameter, 1, 200);
  const std::optional<int> nominal = gimba::core::NearestNominalDiameter(session.table, ui_state.band_diameter);
  if (nominal.has_value()) {
    ImGui::Text("Nearest nominal diameter: M%d", *nominal);
  }
}

void DrawThreadMaterialsContent(ViewerSession& session, ViewerUiState& ui_state) {
  ImGui::TextWrapped("Creates or deletes the \"%s - <material> - M<D> thread\" materials of document %s.",
                     session.codec.prefix().c_str(), session.store.document_name().c_str());
  if (ImGui::Button("Thread materials pass...")) {
    OpenWelcomeDialog(session, ui_state);
  }

  if (!ui_state.last_pass_report.has_value()) {
    return;
  }
  const gimba::core::PassReport& report = *ui_state.last_pass_report;
  ImGui::Separator();
  DrawReportLines(report.title, report.instruction, report.content, report.details, report.warning);
  const gimba::core::OutcomeCounters& c = report.counters;
  ImGui::Text("Outcome: %s  mode: %s", std::string(gimba::core::to_string(report.outcome)).c_str(),
              std::string(gimba::core::to_string(report.mode)).c_str());
  ImGui::Text("created=%d overwritten=%d skipped=%d deleted=%d", static_cast<int>(c.created),
              static_cast<int>(c.overwritten), static_cast<int>(c.skipped), static_cast<int>(c.deleted));
  ImGui::Text("failed: create=%d overwrite=%d delete=%d", static_cast<int>(c.create_failed),
              static_cast<int>(c.overwrite_failed), static_cast<int>(c.delete_failed));
}

void DrawCatalogContent(ViewerSession& session, ViewerUiState& ui_state) {
  ImGui::InputText("Output directory", ui_state.output_directory.data(), ui_state.output_directory.size());
  ImGui::InputText("Materials (|)", ui_state.materials.data(), ui_state.materials.size());
  ImGui::RadioButton("Delimiter ,", &ui_state.delimiter_index, 0);
  ImGui::SameLine();
  ImGui::RadioButton("Delimiter ;", &ui_state.delimiter_index, 1);
  ImGui::Checkbox("Overwrite existing files", &ui_state.overwrite_files);
  if (ImGui::Button("Save settings")) {
    ApplyBuffersToSettings(ui_state);
    const gimba::core::FileWriteResult saved =
        gimba::core::SaveToolSettings(session.sink, gimba::core::kToolSettingsFile, ui_state.settings);
    PushLog(ui_state, saved.ok() ? std::string("[info] settings saved to ") + gimba::core::kToolSettingsFile
                                 : "[error] " + saved.error);
  }
  ImGui::SameLine();
  if (ImGui::Button("Refresh file status")) {
    ApplyBuffersToSettings(ui_state);
    RefreshFileStatuses(session, ui_state);
  }
  ImGui::Separator();

  for (const CatalogSchedule schedule :
       {CatalogSchedule::kTypeCatalogs, CatalogSchedule::kLookupTables, CatalogSchedule::kGeometryHtml}) {
    const std::string label(gimba::core::to_string(schedule));
    if (ImGui::Button(label.c_str())) {
      RunCatalogPass(session, ui_state, schedule);
    }
  }

  ImGui::Separator();
  for (const gimba::core::CatalogFileStatus& status : ui_state.file_statuses) {
    ImGui::Text("%s %s", status.exists ? "[x]" : "[ ]", status.file_name.c_str());
    if (ImGui::IsItemHovered()) {
      ImGui::SetTooltip("%s", status.path.c_str());
    }
  }

  if (ui_state.last_batch_report.has_value()) {
    const gimba::core::CatalogBatchReport& report = *ui_state.last_batch_report;
    ImGui::Separator();
    DrawReportLines(report.title, report.instruction, report.content, report.details, report.warning);
  }
}

void DrawDocumentContent(ViewerSession& session, ViewerUiState& ui_state) {
  ImGui::Text("Document: %s  Materials: %d", session.store.document_name().c_str(),
              static_cast<int>(session.store.size()));
  ImGui::SameLine();
  if (ImGui::Button("Reset demo document")) {
    session.store = gimba::core::MakeDemoStore(session.codec);
    ui_state.selected_material_id = gimba::core::kInvalidElementId;
    PushLog(ui_state, "[info] demo document reset");
  }

  ImGui::BeginChild("MaterialList", ImVec2(0.0f, 180.0f), true);
  for (const gimba::core::MaterialRecord& material : session.store.materials().items()) {
    const std::string label = material.display_id + " " + material.name;
    if (ImGui::Selectable(label.c_str(), ui_state.selected_material_id == material.id)) {
      ui_state.selected_material_id = material.id;
    }
  }
  ImGui::EndChild();

  const gimba::core::MaterialRecord* material = session.store.materials().find(ui_state.selected_material_id);
  if (material == nullptr) {
    return;
  }
  if (const std::optional<std::string> category = session.codec.DecodePlain(material->name)) {
    ImGui::Text("Plain material of category \"%s\"", category->c_str());
  }
  if (session.codec.IsTemplateName(material->name)) {
    const gimba::core::TemplateValidator validator(session.codec);
    const gimba::core::TemplateCheck check = validator.Validate(material);
    ImGui::Text("Template check: %s", std::string(gimba::core::to_string(check.code)).c_str());
    for (const std::string& line : check.trace) {
      ImGui::TextUnformatted(line.c_str());
    }
  }
  ImGui::BeginChild("MaterialDump", ImVec2(0.0f, 0.0f), true, ImGuiWindowFlags_HorizontalScrollbar);
  for (const std::string& line : gimba::core::DumpMaterial(*material)) {
    ImGui::TextUnformatted(line.c_str());
  }
  ImGui::EndChild();
}

void DrawPassLogContent(const ViewerUiState& ui_state) {
  if (ui_state.pass_log.empty()) {
    ImGui::TextDisabled("No pass executed yet.");
    return;
  }
  ImGui::BeginChild("PassLog", ImVec2(0.0f, 0.0f), true, ImGuiWindowFlags_HorizontalScrollbar);
  for (const std::string& line : ui_state.pass_log) {
    ImGui::TextUnformatted(line.c_str());
  }
  ImGui::EndChild();
}

void DrawTopbarWindow(const ViewerSession& session, ViewerUiState& ui_state) {
  const float w = static_cast<float>(GetScreenWidth());
  ImGui::SetNextWindowPos(ImVec2(8.0f, 8.0f), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(std::max(320.0f, w - 16.0f), kTopbarHeight), ImGuiCond_Always);
  const ImGuiWindowFlags flags =
      ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize;
  if (!ImGui::Begin("Topbar", nullptr, flags)) {
    ImGui::End();
    return;
  }

  ImGui::TextUnformatted("GIMBA - Generic ISO Metric Bolt Assembly");
  ImGui::SameLine();
  ImGui::SetCursorPosX(std::max(ImGui::GetCursorPosX(), ImGui::GetWindowWidth() - 250.0f));
  ImGui::Checkbox("Show Workspace", &ui_state.ui_show_workspace);
  ImGui::SameLine();
  ImGui::SetNextItemWidth(100.0f);
  ImGui::SliderFloat("##WorkspaceWidth", &ui_state.ui_workspace_width, 360.0f, 900.0f, "W %.0f");
  ImGui::Separator();
  ImGui::Text("Geometries:%d  Materials:%d  Thread materials:%d  |  Selected: M%d",
              static_cast<int>(session.table.size()), static_cast<int>(session.store.size()),
              static_cast<int>(CountThreadMaterials(session)), ui_state.selected_diameter);
  ImGui::End();
}

void DrawWorkspaceWindow(ViewerSession& session, ViewerUiState& ui_state) {
  if (!ui_state.ui_show_workspace) {
    return;
  }
  const float screen_w = static_cast<float>(GetScreenWidth());
  const float screen_h = static_cast<float>(GetScreenHeight());
  const float margin = 8.0f;
  const float min_w = 360.0f;
  const float max_w = std::max(min_w, std::min(900.0f, screen_w - margin * 2.0f));
  if (ui_state.ui_workspace_width <= 1.0f) {
    ui_state.ui_workspace_width = std::clamp(screen_w * 0.42f, min_w, max_w);
  }
  ui_state.ui_workspace_width = std::clamp(ui_state.ui_workspace_width, min_w, max_w);
  const float workspace_w = ui_state.ui_workspace_width;
  const float x = std::max(margin, screen_w - workspace_w - margin);
  const float y = kTopbarHeight + margin + 8.0f;
  const float h = std::max(240.0f, screen_h - y - margin);

  ImGui::SetNextWindowPos(ImVec2(x, y), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(workspace_w, h), ImGuiCond_Always);
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize;
  if (!ImGui::Begin("Workspace", nullptr, flags)) {
    ImGui::End();
    return;
  }

  const float body_h = std::max(120.0f, ImGui::GetContentRegionAvail().y - ui_state.ui_log_height - 40.0f);
  ImGui::BeginChild("WorkspaceBody", ImVec2(0.0f, body_h), false);
  if (ImGui::BeginTabBar("WorkspaceTabs")) {
    if (ImGui::BeginTabItem("Geometry")) {
      DrawGeometryContent(session, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Thread Materials")) {
      DrawThreadMaterialsContent(session, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Catalogs")) {
      DrawCatalogContent(session, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Document")) {
      DrawDocumentContent(session, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Pass Log")) {
      DrawPassLogContent(ui_state);
      ImGui::EndTabItem();
    }
    ImGui::EndTabBar();
  }
  ImGui::EndChild();

  if (!ui_state.last_error.empty()) {
    ImGui::TextWrapped("Error: %s", ui_state.last_error.c_str());
  }
  ImGui::Separator();
  ImGui::BeginChild("LogArea", ImVec2(0.0f, ui_state.ui_log_height), true, ImGuiWindowFlags_HorizontalScrollbar);
  for (const std::string& line : ui_state.logs) {
    ImGui::TextWrapped("%s", line.c_str());
  }
  ImGui::EndChild();
  ImGui::End();
}

// Unrolled thread surface of the selected bolt: one circumference wide, the
// helix crossing it at beta and rising one pitch per turn.
void DrawThreadPreview(const ViewerSession& session, const ViewerUiState& ui_state) {
  const BoltGeometry* bolt = session.table.find(ui_state.selected_diameter);
  if (bolt == nullptr) {
    return;
  }
  const gimba::core::ThreadGeometry thread = gimba::core::ThreadGeometry::FromBolt(*bolt);

  const float workspace_w = ui_state.ui_show_workspace ? ui_state.ui_workspace_width + 16.0f : 0.0f;
  const float left = 24.0f;
  const float top = kTopbarHeight + 56.0f;
  const float area_w = std::max(160.0f, static_cast<float>(GetScreenWidth()) - workspace_w - left * 2.0f);
  const float area_h = std::max(120.0f, static_cast<float>(GetScreenHeight()) - top - 48.0f);

  const float px_per_mm = area_w / static_cast<float>(thread.circumference);
  const float pitch_px = std::max(2.0f, static_cast<float>(thread.pitch) * px_per_mm);
  const float surface_h = std::min(area_h, pitch_px * 24.0f);

  DrawText(TextFormat("%s  P=%s mm  C=%s mm  beta=%s deg  bump map rotation=%s deg", bolt->label().c_str(),
                      gimba::core::format_number(thread.pitch).c_str(),
                      gimba::core::format_fixed(thread.circumference, 2).c_str(),
                      gimba::core::format_fixed(thread.helix_angle_deg, 3).c_str(),
                      gimba::core::format_fixed(90.0 - thread.helix_angle_deg, 3).c_str()),
           static_cast<int>(left), static_cast<int>(top - 28.0f), 16, Color{210, 216, 224, 255});

  const Rectangle surface{left, top, area_w, surface_h};
  DrawRectangleRec(surface, Color{44, 52, 62, 255});
  BeginScissorMode(static_cast<int>(surface.x), static_cast<int>(surface.y), static_cast<int>(surface.width),
                   static_cast<int>(surface.height));
  for (float y = top; y <= top + surface_h + pitch_px; y += pitch_px) {
    DrawLineEx(Vector2{left, y}, Vector2{left + area_w, y - pitch_px}, 2.0f, Color{196, 170, 110, 255});
  }
  EndScissorMode();
  DrawRectangleLinesEx(surface, 1.0f, Color{120, 132, 148, 255});
  DrawText(TextFormat("u = pi * D = %s mm", gimba::core::format_fixed(thread.circumference, 2).c_str()),
           static_cast<int>(left), static_cast<int>(top + surface_h + 8.0f), 14, Color{160, 168, 180, 255});
}

}  // namespace

int main() {
  const ViewerPersistentSettings persisted = LoadViewerPersistentSettings();

  ViewerSession session;
  ViewerUiState ui_state;
  ui_state.settings = gimba::core::LoadToolSettings(gimba::core::kToolSettingsFile);
  SyncBuffersFromSettings(ui_state);
  ui_state.ui_show_workspace = persisted.ui_show_workspace;
  ui_state.ui_workspace_width = persisted.ui_workspace_width;
  ui_state.ui_log_height = persisted.ui_log_height;
  try {
    session.codec = NameCodec(ui_state.settings.name_prefix);
  } catch (const std::invalid_argument& e) {
    PushLog(ui_state, std::string("[error] name prefix: ") + e.what());
  }
  session.store = gimba::core::MakeDemoStore(session.codec);
  RefreshFileStatuses(session, ui_state);
  PushLog(ui_state, "[info] viewer started");
  PushLog(ui_state, "[info] demo document " + session.store.document_name() + " loaded");
  PushLog(ui_state, "[info] output directory " + ui_state.settings.output_directory);
  PushLog(ui_state, "[hint] Thread Materials tab runs the create/delete pass");

  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT | FLAG_VSYNC_HINT);
  InitWindow(persisted.window_width, persisted.window_height, "GIMBA viewer");
  SetExitKey(KEY_NULL);
  SetTargetFPS(60);

  rlImGuiSetup(true);
  ImGui::StyleColorsDark();
  {
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 3.0f;
    style.FrameRounding = 2.0f;
    style.GrabRounding = 2.0f;
    style.WindowBorderSize = 1.0f;
    style.FrameBorderSize = 0.0f;
  }
  while (!WindowShouldClose()) {
    BeginDrawing();
    ClearBackground(Color{26, 32, 39, 255});

    DrawThreadPreview(session, ui_state);

    rlImGuiBegin();
    DrawTopbarWindow(session, ui_state);
    DrawWorkspaceWindow(session, ui_state);
    DrawWelcomeDialog(session, ui_state);
    rlImGuiEnd();

    EndDrawing();
  }

  rlImGuiShutdown();
  {
    ViewerPersistentSettings out{};
    out.window_width = GetScreenWidth();
    out.window_height = GetScreenHeight();
    out.ui_show_workspace = ui_state.ui_show_workspace;
    out.ui_workspace_width = ui_state.ui_workspace_width;
    out.ui_log_height = ui_state.ui_log_height;
    SaveViewerPersistentSettings(out);
  }
  CloseWindow();
  return 0;
}
