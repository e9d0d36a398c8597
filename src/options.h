#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace splittab {

// Where a new non-pinned tab is inserted
enum class NewTabPosition {
  Current, // After the selected tab
  End      // At the end of the unpinned run
};

// How hosts treat content of unselected tabs. Exposed for hosts only.
enum class ContentViewLifecycle { RecreateOnSwitch, KeepAllAlive };

// Default appearance values
constexpr double kDefaultTabBarHeight = 33.0;
constexpr double kDefaultTabMinWidth = 140.0;
constexpr double kDefaultTabMaxWidth = 220.0;
constexpr double kDefaultMinimumPaneSize = 100.0;
constexpr double kDefaultAnimationDuration = 0.15;

// Visual metrics handed to hosts. The engine itself never draws.
struct Appearance {
  double tab_bar_height = kDefaultTabBarHeight;
  double tab_min_width = kDefaultTabMinWidth;
  double tab_max_width = kDefaultTabMaxWidth;
  double tab_spacing = 0.0;
  double minimum_pane_width = kDefaultMinimumPaneSize;
  double minimum_pane_height = kDefaultMinimumPaneSize;
  bool show_split_buttons = true;
  double animation_duration = kDefaultAnimationDuration;
  bool enable_animations = true;

  bool operator==(const Appearance& other) const = default;
};

// Behavior policy of a controller
struct Configuration {
  bool allow_splits = true;
  bool allow_close_tabs = true;
  bool allow_close_last_pane = false;
  bool allow_tab_reordering = true;
  bool allow_cross_pane_tab_move = true;
  bool auto_close_empty_panes = true;
  ContentViewLifecycle content_view_lifecycle = ContentViewLifecycle::RecreateOnSwitch;
  NewTabPosition new_tab_position = NewTabPosition::Current;
  Appearance appearance;

  bool operator==(const Configuration& other) const = default;
};

// Presets
[[nodiscard]] Configuration default_configuration();
[[nodiscard]] Configuration single_pane_configuration();
[[nodiscard]] Configuration read_only_configuration();

[[nodiscard]] Appearance default_appearance();
[[nodiscard]] Appearance compact_appearance();
[[nodiscard]] Appearance spacious_appearance();

// Result type for TOML operations
struct WriteResult {
  bool success;
  std::string error; // Set if success == false
};

struct ReadResult {
  bool success;
  std::string error;           // Set if success == false
  Configuration configuration; // Valid if success == true
};

// Write a Configuration to a TOML file
WriteResult write_configuration_toml(const Configuration& configuration,
                                     const std::filesystem::path& filepath);

// Read a Configuration from a TOML file. Missing keys keep their defaults.
ReadResult read_configuration_toml(const std::filesystem::path& filepath);

// Provides a Configuration, optionally monitoring a config file for changes
class ConfigurationProvider {
public:
  std::optional<std::filesystem::path> configPath;
  Configuration configuration;
  std::filesystem::file_time_type lastModified;

  explicit ConfigurationProvider(std::optional<std::filesystem::path> configPath = std::nullopt);

  // Check for file changes and reload if necessary. Returns true if the configuration changed.
  bool refresh();
};

} // namespace splittab
