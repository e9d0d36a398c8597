#include "options.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <magic_enum/magic_enum.hpp>
#include <toml++/toml.hpp>

namespace splittab {

namespace {

template <typename E>
void read_enum(const toml::table& section, const char* key, E& target) {
  auto node = section[key];
  if (!node) {
    return;
  }
  auto str = node.as_string();
  if (!str) {
    spdlog::error("Invalid {}: expected a string. Using default.", key);
    return;
  }
  auto value = magic_enum::enum_cast<E>(str->get());
  if (!value.has_value()) {
    spdlog::error("Invalid {} value ({}). Using default.", key, str->get());
    return;
  }
  target = *value;
}

void read_bool(const toml::table& section, const char* key, bool& target) {
  if (auto value = section[key].as_boolean()) {
    target = value->get();
  }
}

// Accepts integer or floating point TOML values
void read_number(const toml::table& section, const char* key, double& target) {
  if (auto value = section[key].as_floating_point()) {
    target = value->get();
  } else if (auto integer = section[key].as_integer()) {
    target = static_cast<double>(integer->get());
  }
}

void validate_non_negative(const char* key, double& value, double fallback) {
  if (value < 0.0) {
    spdlog::error("Invalid appearance.{} value ({}): must be non-negative. Using default.", key,
                  value);
    value = fallback;
  }
}

} // anonymous namespace

// ============================================================================
// Presets
// ============================================================================

Appearance default_appearance() {
  return Appearance{};
}

Appearance compact_appearance() {
  Appearance appearance;
  appearance.tab_bar_height = 28.0;
  appearance.tab_min_width = 100.0;
  appearance.tab_max_width = 160.0;
  return appearance;
}

Appearance spacious_appearance() {
  Appearance appearance;
  appearance.tab_bar_height = 38.0;
  appearance.tab_min_width = 160.0;
  appearance.tab_max_width = 280.0;
  appearance.tab_spacing = 2.0;
  return appearance;
}

Configuration default_configuration() {
  return Configuration{};
}

Configuration single_pane_configuration() {
  Configuration configuration;
  configuration.allow_splits = false;
  configuration.allow_close_last_pane = false;
  return configuration;
}

Configuration read_only_configuration() {
  Configuration configuration;
  configuration.allow_splits = false;
  configuration.allow_close_tabs = false;
  configuration.allow_tab_reordering = false;
  configuration.allow_cross_pane_tab_move = false;
  return configuration;
}

// ============================================================================
// TOML
// ============================================================================

WriteResult write_configuration_toml(const Configuration& configuration,
                                     const std::filesystem::path& filepath) {
  try {
    toml::table root;

    toml::table behavior;
    behavior.insert("allow_splits", configuration.allow_splits);
    behavior.insert("allow_close_tabs", configuration.allow_close_tabs);
    behavior.insert("allow_close_last_pane", configuration.allow_close_last_pane);
    behavior.insert("allow_tab_reordering", configuration.allow_tab_reordering);
    behavior.insert("allow_cross_pane_tab_move", configuration.allow_cross_pane_tab_move);
    behavior.insert("auto_close_empty_panes", configuration.auto_close_empty_panes);
    behavior.insert("new_tab_position",
                    std::string(magic_enum::enum_name(configuration.new_tab_position)));
    behavior.insert("content_view_lifecycle",
                    std::string(magic_enum::enum_name(configuration.content_view_lifecycle)));
    root.insert("behavior", behavior);

    const Appearance& a = configuration.appearance;
    toml::table appearance;
    appearance.insert("tab_bar_height", a.tab_bar_height);
    appearance.insert("tab_min_width", a.tab_min_width);
    appearance.insert("tab_max_width", a.tab_max_width);
    appearance.insert("tab_spacing", a.tab_spacing);
    appearance.insert("minimum_pane_width", a.minimum_pane_width);
    appearance.insert("minimum_pane_height", a.minimum_pane_height);
    appearance.insert("show_split_buttons", a.show_split_buttons);
    appearance.insert("animation_duration", a.animation_duration);
    appearance.insert("enable_animations", a.enable_animations);
    root.insert("appearance", appearance);

    std::ofstream file(filepath);
    if (!file) {
      return WriteResult{false, "Failed to open file for writing: " + filepath.string()};
    }
    file << root;
    return WriteResult{true, ""};
  } catch (const std::exception& e) {
    return WriteResult{false, std::string("Error writing TOML: ") + e.what()};
  }
}

ReadResult read_configuration_toml(const std::filesystem::path& filepath) {
  try {
    auto tbl = toml::parse_file(filepath.string());
    Configuration configuration;

    if (auto behavior = tbl["behavior"].as_table()) {
      read_bool(*behavior, "allow_splits", configuration.allow_splits);
      read_bool(*behavior, "allow_close_tabs", configuration.allow_close_tabs);
      read_bool(*behavior, "allow_close_last_pane", configuration.allow_close_last_pane);
      read_bool(*behavior, "allow_tab_reordering", configuration.allow_tab_reordering);
      read_bool(*behavior, "allow_cross_pane_tab_move", configuration.allow_cross_pane_tab_move);
      read_bool(*behavior, "auto_close_empty_panes", configuration.auto_close_empty_panes);
      read_enum(*behavior, "new_tab_position", configuration.new_tab_position);
      read_enum(*behavior, "content_view_lifecycle", configuration.content_view_lifecycle);
    }

    Appearance& a = configuration.appearance;
    if (auto appearance = tbl["appearance"].as_table()) {
      read_number(*appearance, "tab_bar_height", a.tab_bar_height);
      read_number(*appearance, "tab_min_width", a.tab_min_width);
      read_number(*appearance, "tab_max_width", a.tab_max_width);
      read_number(*appearance, "tab_spacing", a.tab_spacing);
      read_number(*appearance, "minimum_pane_width", a.minimum_pane_width);
      read_number(*appearance, "minimum_pane_height", a.minimum_pane_height);
      read_bool(*appearance, "show_split_buttons", a.show_split_buttons);
      read_number(*appearance, "animation_duration", a.animation_duration);
      read_bool(*appearance, "enable_animations", a.enable_animations);
    }

    // Validate appearance values - negative values not allowed
    validate_non_negative("tab_bar_height", a.tab_bar_height, kDefaultTabBarHeight);
    validate_non_negative("tab_min_width", a.tab_min_width, kDefaultTabMinWidth);
    validate_non_negative("tab_max_width", a.tab_max_width, kDefaultTabMaxWidth);
    validate_non_negative("tab_spacing", a.tab_spacing, 0.0);
    validate_non_negative("minimum_pane_width", a.minimum_pane_width, kDefaultMinimumPaneSize);
    validate_non_negative("minimum_pane_height", a.minimum_pane_height, kDefaultMinimumPaneSize);
    validate_non_negative("animation_duration", a.animation_duration, kDefaultAnimationDuration);

    if (a.tab_max_width < a.tab_min_width) {
      spdlog::error("Invalid appearance: tab_max_width ({}) below tab_min_width ({}). Using "
                    "defaults.",
                    a.tab_max_width, a.tab_min_width);
      a.tab_min_width = kDefaultTabMinWidth;
      a.tab_max_width = kDefaultTabMaxWidth;
    }

    return ReadResult{true, "", configuration};
  } catch (const toml::parse_error& e) {
    return ReadResult{false, std::string("TOML parse error: ") + e.what(), {}};
  } catch (const std::exception& e) {
    return ReadResult{false, std::string("Error reading TOML: ") + e.what(), {}};
  }
}

// ============================================================================
// ConfigurationProvider
// ============================================================================

ConfigurationProvider::ConfigurationProvider(std::optional<std::filesystem::path> path)
    : configPath(std::move(path)), configuration(default_configuration()), lastModified{} {
  if (configPath.has_value() && std::filesystem::exists(*configPath)) {
    auto result = read_configuration_toml(*configPath);
    if (result.success) {
      configuration = result.configuration;
      lastModified = std::filesystem::last_write_time(*configPath);
    } else {
      spdlog::error("Failed to load config: {}", result.error);
    }
  }
}

bool ConfigurationProvider::refresh() {
  if (!configPath.has_value()) {
    return false; // No file to monitor
  }
  if (!std::filesystem::exists(*configPath)) {
    return false; // File doesn't exist (yet)
  }

  auto currentModified = std::filesystem::last_write_time(*configPath);
  if (currentModified == lastModified) {
    return false;
  }

  auto result = read_configuration_toml(*configPath);
  if (result.success) {
    bool changed = !(result.configuration == configuration);
    configuration = result.configuration;
    lastModified = currentModified;
    spdlog::info("Config reloaded from: {}", configPath->string());
    return changed;
  }
  spdlog::error("Failed to reload config: {}", result.error);
  return false;
}

} // namespace splittab
