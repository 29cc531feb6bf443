#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "imgui.h"
#include "raylib.h"
#include "rlImGui.h"
#include "marinedb/core/registry.hpp"

namespace {

using marinedb::core::CallDispatcher;
using marinedb::core::MarineSpecie;
using marinedb::core::MarineSpeciePayload;
using marinedb::core::ObjectId;
using marinedb::core::Operation;
using marinedb::core::Registry;
using marinedb::core::Taxonomy;
using marinedb::core::TaxonomyPayload;

constexpr std::size_t kFieldCapacity = 96;
using TextField = std::array<char, kFieldCapacity>;

struct TaxonomyForm {
  TextField kingdom{};
  TextField phylum{};
  TextField class_name{};
  TextField order{};
  TextField family{};
  TextField genus{};
  TextField species{};
};

struct MarineSpecieForm {
  int taxonomy_id = 0;
  TextField name{};
  TextField habitat{};
  TextField conservation_status{};
};

struct ViewerUiState;

// A call waiting for the next frame. Submit controls stay disabled until it ran.
struct PendingCall {
  Operation operation = Operation::kGetAllTaxonomy;
  std::function<void(CallDispatcher&, ViewerUiState&)> run;
};

struct ViewerUiState {
  ObjectId selected_taxonomy_id = marinedb::core::kInvalidObjectId;
  ObjectId selected_specie_id = marinedb::core::kInvalidObjectId;

  TaxonomyForm taxonomy_form{};
  MarineSpecieForm specie_form{};
  TextField status_filter{};
  bool status_filter_active = false;

  std::vector<Taxonomy> taxonomies{};
  std::vector<MarineSpecie> species{};
  bool refresh_requested = true;

  std::optional<PendingCall> pending_call{};

  std::string last_error;
  std::vector<std::string> logs;
  bool ui_show_workspace = true;
  float ui_workspace_width = 0.0f;
};

struct ViewerPersistentSettings {
  int window_width = 1100;
  int window_height = 720;
  bool ui_show_workspace = true;
  float ui_workspace_width = 520.0f;
  bool seed_demo_records = true;
};

constexpr const char* kViewerSettingsFile = "marinedb_viewer.ini";

bool parse_bool(std::string_view value, bool fallback) {
  if (value == "1" || value == "true" || value == "True") {
    return true;
  }
  if (value == "0" || value == "false" || value == "False") {
    return false;
  }
  return fallback;
}

ViewerPersistentSettings LoadViewerPersistentSettings() {
  ViewerPersistentSettings settings{};
  std::ifstream ifs(kViewerSettingsFile);
  if (!ifs.is_open()) {
    return settings;
  }

  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty() || line.front() == '#') {
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
        settings.window_width = std::max(640, std::stoi(value));
      } else if (key == "window_height") {
        settings.window_height = std::max(480, std::stoi(value));
      } else if (key == "ui_show_workspace") {
        settings.ui_show_workspace = parse_bool(value, settings.ui_show_workspace);
      } else if (key == "ui_workspace_width") {
        const float width = std::stof(value);
        if (std::isfinite(width)) {
          settings.ui_workspace_width = std::clamp(width, 360.0f, 900.0f);
        }
      } else if (key == "seed_demo_records") {
        settings.seed_demo_records = parse_bool(value, settings.seed_demo_records);
      }
    } catch (const std::logic_error&) {
      // Malformed number; keep the default for this key.
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
  ofs << "seed_demo_records=" << (settings.seed_demo_records ? 1 : 0) << "\n";
}

void PushLog(ViewerUiState& ui_state, const std::string& line) {
  ui_state.logs.push_back(line);
  if (ui_state.logs.size() > 12) {
    ui_state.logs.erase(ui_state.logs.begin());
  }
}

std::string ToString(const TextField& field) { return std::string(field.data()); }

void Assign(TextField& field, const std::string& value) {
  field.fill('\0');
  const std::size_t n = std::min(value.size(), field.size() - 1);
  std::copy_n(value.begin(), n, field.begin());
}

TaxonomyPayload ToPayload(const TaxonomyForm& form) {
  return {ToString(form.kingdom), ToString(form.phylum), ToString(form.class_name), ToString(form.order),
          ToString(form.family),  ToString(form.genus),  ToString(form.species)};
}

MarineSpeciePayload ToPayload(const MarineSpecieForm& form) {
  return {static_cast<ObjectId>(std::max(0, form.taxonomy_id)), ToString(form.name), ToString(form.habitat),
          ToString(form.conservation_status)};
}

void LoadForm(TaxonomyForm& form, const Taxonomy& taxonomy) {
  Assign(form.kingdom, taxonomy.kingdom);
  Assign(form.phylum, taxonomy.phylum);
  Assign(form.class_name, taxonomy.class_name);
  Assign(form.order, taxonomy.order);
  Assign(form.family, taxonomy.family);
  Assign(form.genus, taxonomy.genus);
  Assign(form.species, taxonomy.species);
}

void LoadForm(MarineSpecieForm& form, const MarineSpecie& specie) {
  // The form edits ids through an int widget; ids past INT_MAX saturate.
  form.taxonomy_id = static_cast<int>(
      std::min<ObjectId>(specie.taxonomy_id, static_cast<ObjectId>(std::numeric_limits<int>::max())));
  Assign(form.name, specie.name);
  Assign(form.habitat, specie.habitat);
  Assign(form.conservation_status, specie.conservation_status);
}

std::string TimestampText(const std::optional<marinedb::core::Timestamp>& ts) {
  return ts.has_value() ? std::to_string(*ts) : std::string("-");
}

void HandleResultError(ViewerUiState& ui_state, Operation operation, const marinedb::core::Error& error) {
  ui_state.last_error = marinedb::core::describe(error);
  PushLog(ui_state, "[err] " + std::string(marinedb::core::operation_name(operation)) + " " +
                        std::string(marinedb::core::error_kind_label(error)));
}

void LogOk(ViewerUiState& ui_state, Operation operation, const std::string& detail) {
  ui_state.last_error.clear();
  PushLog(ui_state, "[ok] " + std::string(marinedb::core::operation_name(operation)) + " " + detail);
}

void QueueCall(ViewerUiState& ui_state, Operation operation,
               std::function<void(CallDispatcher&, ViewerUiState&)> run) {
  if (ui_state.pending_call.has_value()) {
    return;
  }
  ui_state.pending_call = PendingCall{operation, std::move(run)};
}

// Runs the queued call, then re-reads the lists the call may have changed.
void RunPendingCall(CallDispatcher& calls, ViewerUiState& ui_state) {
  if (ui_state.pending_call.has_value()) {
    const PendingCall call = std::move(*ui_state.pending_call);
    ui_state.pending_call.reset();
    call.run(calls, ui_state);
    if (!marinedb::core::is_query(call.operation)) {
      ui_state.refresh_requested = true;
    }
  }

  if (!ui_state.refresh_requested) {
    return;
  }
  ui_state.refresh_requested = false;

  const auto all_taxonomy = calls.get_all_taxonomy();
  if (all_taxonomy.ok()) {
    ui_state.taxonomies = all_taxonomy.value();
  } else {
    HandleResultError(ui_state, Operation::kGetAllTaxonomy, all_taxonomy.error());
  }

  const std::string filter = ToString(ui_state.status_filter);
  const bool filtered = ui_state.status_filter_active && !filter.empty();
  const auto species = filtered ? calls.get_marinespecie_by_conservation_status(filter) : calls.get_all_marinespecie();
  if (species.ok()) {
    ui_state.species = species.value();
  } else {
    HandleResultError(ui_state,
                      filtered ? Operation::kGetMarineSpecieByConservationStatus : Operation::kGetAllMarineSpecie,
                      species.error());
  }

  std::sort(ui_state.taxonomies.begin(), ui_state.taxonomies.end(),
            [](const Taxonomy& a, const Taxonomy& b) { return a.id < b.id; });
  std::sort(ui_state.species.begin(), ui_state.species.end(),
            [](const MarineSpecie& a, const MarineSpecie& b) { return a.id < b.id; });
}

bool SubmitButton(const ViewerUiState& ui_state, const char* label) {
  ImGui::BeginDisabled(ui_state.pending_call.has_value());
  const bool pressed = ImGui::Button(label);
  ImGui::EndDisabled();
  return pressed;
}

void InputField(const char* label, TextField& field) { ImGui::InputText(label, field.data(), field.size()); }

void DrawTaxonomyForm(ViewerUiState& ui_state) {
  TaxonomyForm& form = ui_state.taxonomy_form;
  InputField("Kingdom", form.kingdom);
  InputField("Phylum", form.phylum);
  InputField("Class", form.class_name);
  InputField("Order", form.order);
  InputField("Family", form.family);
  InputField("Genus", form.genus);
  InputField("Species", form.species);
}

void DrawTaxonomyTab(ViewerUiState& ui_state) {
  if (ImGui::CollapsingHeader("Taxonomy records", ImGuiTreeNodeFlags_DefaultOpen)) {
    ImGui::BeginChild("TaxonomyList", ImVec2(0.0f, 160.0f), true);
    for (const Taxonomy& taxonomy : ui_state.taxonomies) {
      const std::string label =
          marinedb::core::display_id(taxonomy) + "  " + taxonomy.genus + " " + taxonomy.species;
      const bool is_selected = (ui_state.selected_taxonomy_id == taxonomy.id);
      if (ImGui::Selectable(label.c_str(), is_selected)) {
        ui_state.selected_taxonomy_id = taxonomy.id;
        LoadForm(ui_state.taxonomy_form, taxonomy);
      }
    }
    ImGui::EndChild();
  }

  ImGui::Separator();
  DrawTaxonomyForm(ui_state);

  if (SubmitButton(ui_state, "Add Taxonomy")) {
    const TaxonomyPayload payload = ToPayload(ui_state.taxonomy_form);
    QueueCall(ui_state, Operation::kAddTaxonomy, [payload](CallDispatcher& calls, ViewerUiState& ui) {
      const auto result = calls.add_taxonomy(payload);
      if (!result.ok()) {
        HandleResultError(ui, Operation::kAddTaxonomy, result.error());
        return;
      }
      ui.selected_taxonomy_id = result.value().id;
      LogOk(ui, Operation::kAddTaxonomy, "id=" + std::to_string(result.value().id));
    });
  }

  const ObjectId selected = ui_state.selected_taxonomy_id;
  if (selected == marinedb::core::kInvalidObjectId) {
    return;
  }
  ImGui::SameLine();
  if (SubmitButton(ui_state, "Update Selected")) {
    const TaxonomyPayload payload = ToPayload(ui_state.taxonomy_form);
    QueueCall(ui_state, Operation::kUpdateTaxonomy, [selected, payload](CallDispatcher& calls, ViewerUiState& ui) {
      const auto result = calls.update_taxonomy(selected, payload);
      if (!result.ok()) {
        HandleResultError(ui, Operation::kUpdateTaxonomy, result.error());
        return;
      }
      LogOk(ui, Operation::kUpdateTaxonomy, "id=" + std::to_string(selected));
    });
  }
  ImGui::SameLine();
  if (SubmitButton(ui_state, "Delete Selected")) {
    QueueCall(ui_state, Operation::kDeleteTaxonomy, [selected](CallDispatcher& calls, ViewerUiState& ui) {
      const auto result = calls.delete_taxonomy(selected);
      if (!result.ok()) {
        HandleResultError(ui, Operation::kDeleteTaxonomy, result.error());
        return;
      }
      ui.selected_taxonomy_id = marinedb::core::kInvalidObjectId;
      LogOk(ui, Operation::kDeleteTaxonomy, "id=" + std::to_string(selected));
    });
  }

  ImGui::Separator();
  const auto it = std::find_if(ui_state.taxonomies.begin(), ui_state.taxonomies.end(),
                               [selected](const Taxonomy& t) { return t.id == selected; });
  if (it == ui_state.taxonomies.end()) {
    ImGui::TextUnformatted("Selected taxonomy is gone");
    return;
  }
  ImGui::Text("%s  %s > %s > %s", marinedb::core::display_id(*it).c_str(), it->kingdom.c_str(), it->phylum.c_str(),
              it->class_name.c_str());
  ImGui::Text("created_at: %s  updated_at: %s", std::to_string(it->created_at).c_str(),
              TimestampText(it->updated_at).c_str());
}

void DrawSpecieForm(ViewerUiState& ui_state) {
  MarineSpecieForm& form = ui_state.specie_form;
  ImGui::InputInt("Taxonomy Id", &form.taxonomy_id);
  InputField("Name", form.name);
  InputField("Habitat", form.habitat);
  InputField("Conservation Status", form.conservation_status);
}

void DrawSpeciesTab(ViewerUiState& ui_state) {
  InputField("Status Filter", ui_state.status_filter);
  ImGui::SameLine();
  if (ImGui::Checkbox("Filter", &ui_state.status_filter_active)) {
    ui_state.refresh_requested = true;
  }
  if (ui_state.status_filter_active && SubmitButton(ui_state, "Apply Filter")) {
    const std::string status = ToString(ui_state.status_filter);
    QueueCall(ui_state, Operation::kGetMarineSpecieByConservationStatus,
              [status](CallDispatcher& calls, ViewerUiState& ui) {
                const auto result = calls.get_marinespecie_by_conservation_status(status);
                if (!result.ok()) {
                  HandleResultError(ui, Operation::kGetMarineSpecieByConservationStatus, result.error());
                  return;
                }
                ui.species = result.value();
                std::sort(ui.species.begin(), ui.species.end(),
                          [](const MarineSpecie& a, const MarineSpecie& b) { return a.id < b.id; });
                LogOk(ui, Operation::kGetMarineSpecieByConservationStatus,
                      "matches=" + std::to_string(ui.species.size()));
              });
  }

  if (ImGui::CollapsingHeader("Marine species records", ImGuiTreeNodeFlags_DefaultOpen)) {
    ImGui::BeginChild("SpecieList", ImVec2(0.0f, 160.0f), true);
    for (const MarineSpecie& specie : ui_state.species) {
      const std::string label = marinedb::core::display_id(specie) + "  " + specie.name + " [" +
                                specie.conservation_status + "]";
      const bool is_selected = (ui_state.selected_specie_id == specie.id);
      if (ImGui::Selectable(label.c_str(), is_selected)) {
        ui_state.selected_specie_id = specie.id;
        LoadForm(ui_state.specie_form, specie);
      }
    }
    ImGui::EndChild();
  }

  ImGui::Separator();
  DrawSpecieForm(ui_state);

  if (SubmitButton(ui_state, "Add Species")) {
    const MarineSpeciePayload payload = ToPayload(ui_state.specie_form);
    QueueCall(ui_state, Operation::kAddMarineSpecie, [payload](CallDispatcher& calls, ViewerUiState& ui) {
      const auto result = calls.add_marinespecie(payload);
      if (!result.ok()) {
        HandleResultError(ui, Operation::kAddMarineSpecie, result.error());
        return;
      }
      ui.selected_specie_id = result.value().id;
      LogOk(ui, Operation::kAddMarineSpecie, "id=" + std::to_string(result.value().id));
    });
  }

  const ObjectId selected = ui_state.selected_specie_id;
  if (selected == marinedb::core::kInvalidObjectId) {
    return;
  }
  ImGui::SameLine();
  if (SubmitButton(ui_state, "Update Selected")) {
    const MarineSpeciePayload payload = ToPayload(ui_state.specie_form);
    QueueCall(ui_state, Operation::kUpdateMarineSpecie, [selected, payload](CallDispatcher& calls, ViewerUiState& ui) {
      const auto result = calls.update_marinespecie(selected, payload);
      if (!result.ok()) {
        HandleResultError(ui, Operation::kUpdateMarineSpecie, result.error());
        return;
      }
      LogOk(ui, Operation::kUpdateMarineSpecie, "id=" + std::to_string(selected));
    });
  }
  ImGui::SameLine();
  if (SubmitButton(ui_state, "Delete Selected")) {
    QueueCall(ui_state, Operation::kDeleteMarineSpecie, [selected](CallDispatcher& calls, ViewerUiState& ui) {
      const auto result = calls.delete_marinespecie(selected);
      if (!result.ok()) {
        HandleResultError(ui, Operation::kDeleteMarineSpecie, result.error());
        return;
      }
      ui.selected_specie_id = marinedb::core::kInvalidObjectId;
      LogOk(ui, Operation::kDeleteMarineSpecie, "id=" + std::to_string(selected));
    });
  }
  ImGui::SameLine();
  if (SubmitButton(ui_state, "Reload")) {
    QueueCall(ui_state, Operation::kGetMarineSpecie, [selected](CallDispatcher& calls, ViewerUiState& ui) {
      const auto result = calls.get_marinespecie(selected);
      if (!result.ok()) {
        HandleResultError(ui, Operation::kGetMarineSpecie, result.error());
        return;
      }
      LoadForm(ui.specie_form, result.value());
      LogOk(ui, Operation::kGetMarineSpecie, "id=" + std::to_string(selected));
    });
  }

  ImGui::Separator();
  const auto it = std::find_if(ui_state.species.begin(), ui_state.species.end(),
                               [selected](const MarineSpecie& s) { return s.id == selected; });
  if (it == ui_state.species.end()) {
    ImGui::TextUnformatted("Selected species is not listed");
    return;
  }
  ImGui::Text("%s  %s, %s", marinedb::core::display_id(*it).c_str(), it->name.c_str(), it->habitat.c_str());
  ImGui::Text("taxonomy: %s", marinedb::core::make_display_id(marinedb::core::kTaxonomyDisplayPrefix,
                                                               it->taxonomy_id)
                                  .c_str());
  ImGui::Text("created_at: %s  updated_at: %s", std::to_string(it->created_at).c_str(),
              TimestampText(it->updated_at).c_str());
}

const char* SeverityLabel(marinedb::core::ValidationSeverity severity) {
  return severity == marinedb::core::ValidationSeverity::kError ? "error" : "warning";
}

void DrawDiagnosticsTab(const Registry& registry) {
  const auto validation = registry.Validate();
  ImGui::Text("Issues: %d  (%s)", static_cast<int>(validation.issues.size()),
              validation.has_errors() ? "has errors" : "no errors");
  ImGui::Separator();
  for (const auto& issue : validation.issues) {
    const std::string_view prefix = issue.record_kind == marinedb::core::RecordKind::kTaxonomy
                                        ? marinedb::core::kTaxonomyDisplayPrefix
                                        : marinedb::core::kMarineSpecieDisplayPrefix;
    ImGui::BulletText("[%s] %s %s: %s", SeverityLabel(issue.severity),
                      marinedb::core::make_display_id(prefix, issue.object_id).c_str(), issue.code.c_str(),
                      issue.message.c_str());
  }
}

void DrawTopbarWindow(const Registry& registry, ViewerUiState& ui_state) {
  const float w = static_cast<float>(GetScreenWidth());
  const float topbar_h = 74.0f;
  ImGui::SetNextWindowPos(ImVec2(8.0f, 8.0f), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(std::max(320.0f, w - 16.0f), topbar_h), ImGuiCond_Always);
  const ImGuiWindowFlags flags =
      ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize;
  if (!ImGui::Begin("Topbar", nullptr, flags)) {
    ImGui::End();
    return;
  }

  ImGui::Checkbox("Show Workspace", &ui_state.ui_show_workspace);
  ImGui::SameLine();
  ImGui::SetNextItemWidth(140.0f);
  ImGui::SliderFloat("##WorkspaceWidth", &ui_state.ui_workspace_width, 360.0f, 900.0f, "W %.0f");
  ImGui::Separator();
  ImGui::Text("Taxonomies:%d  Species:%d  Clock:%llu", static_cast<int>(registry.taxonomies().size()),
              static_cast<int>(registry.species().size()),
              static_cast<unsigned long long>(registry.clock().now()));
  if (ui_state.pending_call.has_value()) {
    ImGui::SameLine();
    ImGui::Text("|  Calling %s...", std::string(marinedb::core::operation_name(ui_state.pending_call->operation)).c_str());
  }
  ImGui::End();
}

void DrawLogWindow(const ViewerUiState& ui_state) {
  const float screen_h = static_cast<float>(GetScreenHeight());
  ImGui::SetNextWindowPos(ImVec2(8.0f, std::max(90.0f, screen_h - 230.0f)), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(420.0f, 220.0f), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Log")) {
    ImGui::End();
    return;
  }
  if (!ui_state.last_error.empty()) {
    ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.4f, 1.0f), "%s", ui_state.last_error.c_str());
    ImGui::Separator();
  }
  for (const std::string& line : ui_state.logs) {
    ImGui::TextUnformatted(line.c_str());
  }
  ImGui::End();
}

void DrawWorkspaceWindow(const Registry& registry, ViewerUiState& ui_state) {
  if (!ui_state.ui_show_workspace) {
    return;
  }
  const float screen_w = static_cast<float>(GetScreenWidth());
  const float screen_h = static_cast<float>(GetScreenHeight());
  const float topbar_h = 74.0f;
  const float margin = 8.0f;
  const float min_w = 360.0f;
  const float max_w = std::max(min_w, screen_w - margin * 2.0f);
  if (ui_state.ui_workspace_width <= 1.0f) {
    ui_state.ui_workspace_width = std::clamp(screen_w * 0.45f, min_w, std::min(900.0f, max_w));
  }
  ui_state.ui_workspace_width = std::clamp(ui_state.ui_workspace_width, min_w, std::min(900.0f, max_w));
  const float workspace_w = ui_state.ui_workspace_width;
  const float x = std::max(margin, screen_w - workspace_w - margin);
  const float y = topbar_h + margin + 8.0f;
  const float h = std::max(240.0f, screen_h - y - margin);

  ImGui::SetNextWindowPos(ImVec2(x, y), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(workspace_w, h), ImGuiCond_Always);
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize;
  if (!ImGui::Begin("Records", nullptr, flags)) {
    ImGui::End();
    return;
  }
  if (ImGui::BeginTabBar("RecordTabs")) {
    if (ImGui::BeginTabItem("Taxonomy")) {
      DrawTaxonomyTab(ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Marine Species")) {
      DrawSpeciesTab(ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Diagnostics")) {
      DrawDiagnosticsTab(registry);
      ImGui::EndTabItem();
    }
    ImGui::EndTabBar();
  }
  ImGui::End();
}

} // namespace

int main() {
  const ViewerPersistentSettings persisted = LoadViewerPersistentSettings();
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_VSYNC_HINT);
  InitWindow(persisted.window_width, persisted.window_height, "marinedb viewer");
  SetExitKey(KEY_NULL);
  SetTargetFPS(60);

  Registry registry;
  ViewerUiState ui_state;
  ui_state.ui_show_workspace = persisted.ui_show_workspace;
  ui_state.ui_workspace_width = persisted.ui_workspace_width;
  PushLog(ui_state, "[info] viewer started");
  if (persisted.seed_demo_records) {
    std::string seed_error;
    if (marinedb::core::SeedDemoRecords(registry, &seed_error)) {
      PushLog(ui_state, "[info] demo records loaded");
    } else {
      ui_state.last_error = seed_error;
      PushLog(ui_state, "[err] demo records failed");
    }
  }

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
    RunPendingCall(registry.dispatcher(), ui_state);

    BeginDrawing();
    ClearBackground(Color{18, 40, 56, 255});

    rlImGuiBegin();
    DrawTopbarWindow(registry, ui_state);
    DrawWorkspaceWindow(registry, ui_state);
    DrawLogWindow(ui_state);
    rlImGuiEnd();

    DrawFPS(10, GetScreenHeight() - 24);
    EndDrawing();
  }

  rlImGuiShutdown();
  {
    ViewerPersistentSettings out = persisted;
    out.window_width = GetScreenWidth();
    out.window_height = GetScreenHeight();
    out.ui_show_workspace = ui_state.ui_show_workspace;
    out.ui_workspace_width = ui_state.ui_workspace_width;
    SaveViewerPersistentSettings(out);
  }
  CloseWindow();
  return 0;
}
