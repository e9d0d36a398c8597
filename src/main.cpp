#ifdef DOCTEST_CONFIG_DISABLE

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <magic_enum/magic_enum.hpp>
#include <memory>
#include <string>

#include "argument_parser.h"
#include "controller.h"
#include "event_queue.h"
#include "options.h"
#include "snapshot.h"
#include "version.h"

namespace {

std::filesystem::path get_default_config_path() {
  return std::filesystem::current_path() / "splittab.toml";
}

} // namespace

// Helper for std::visit with lambdas
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

using namespace splittab;

void apply_log_level(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    spdlog::set_level(spdlog::level::trace);
    break;
  case LogLevel::Debug:
    spdlog::set_level(spdlog::level::debug);
    break;
  case LogLevel::Info:
    spdlog::set_level(spdlog::level::info);
    break;
  case LogLevel::Warn:
    spdlog::set_level(spdlog::level::warn);
    break;
  case LogLevel::Err:
    spdlog::set_level(spdlog::level::err);
    break;
  case LogLevel::Off:
    spdlog::set_level(spdlog::level::off);
    break;
  }
}

// Logs every notification of the demo session
class LoggingDelegate : public Delegate {
public:
  void did_create_tab(const Tab& tab, PaneId pane) override {
    spdlog::info("created tab '{}' ({}) in {}", tab.title, tab.id.to_string(), pane.to_string());
  }
  void did_close_tab(TabId tab_id, PaneId pane) override {
    spdlog::info("closed {} in {}", tab_id.to_string(), pane.to_string());
  }
  void did_select_tab(const Tab& tab, PaneId pane) override {
    spdlog::info("selected '{}' in {}", tab.title, pane.to_string());
  }
  void did_move_tab(const Tab& tab, PaneId source, PaneId destination) override {
    spdlog::info("moved '{}' from {} to {}", tab.title, source.to_string(),
                 destination.to_string());
  }
  void did_split_pane(PaneId original, PaneId new_pane, Orientation orientation) override {
    spdlog::info("split {} -> {} ({})", original.to_string(), new_pane.to_string(),
                 magic_enum::enum_name(orientation));
  }
  void did_close_pane(PaneId pane) override {
    spdlog::info("closed {}", pane.to_string());
  }
  void did_focus_pane(PaneId pane) override {
    spdlog::info("focus -> {}", pane.to_string());
  }
  void did_change_geometry(const LayoutSnapshot& snapshot) override {
    spdlog::info("geometry changed: {} pane(s)", snapshot.panes.size());
  }
};

int run_demo(const DemoCommand& cmd, const Configuration& configuration) {
  ManualClock clock;
  auto queue = std::make_shared<EventQueue>(clock);
  Controller controller(configuration, queue);
  LoggingDelegate delegate;
  controller.set_delegate(&delegate);
  controller.set_container_frame(layout::Rect{0.0, 0.0, cmd.width, cmd.height});

  auto pump = [&](Duration elapsed) {
    clock.advance(elapsed);
    queue->run_due();
  };

  PaneId editor = controller.focused_pane_id();
  auto readme = controller.create_tab("README.md");
  controller.create_tab("main.cpp", std::string("doc.text"));
  controller.create_tab("Clipboard", std::nullopt, false, false, true);

  auto right = controller.split_pane(editor, Orientation::Horizontal);
  if (!right.has_value()) {
    spdlog::error("demo: split refused by configuration");
    return 1;
  }
  controller.create_tab("notes.txt", std::nullopt, true, true, false, right);
  pump(kStructureNotifyDelay);

  auto bottom = controller.split_pane(right, Orientation::Vertical);
  if (bottom.has_value() && readme.has_value()) {
    controller.move_tab(*readme, *bottom);
  }
  pump(kStructureNotifyDelay);

  controller.navigate_focus(Direction::Left);
  controller.select_next_tab();

  if (!controller.validate()) {
    spdlog::error("demo: layout invalid");
    return 1;
  }
  controller.debug_print();

  nlohmann::json output;
  output["tree"] = to_json(controller.tree_snapshot());
  output["layout"] = to_json(controller.layout_snapshot());
  std::cout << output.dump(2) << std::endl;
  return 0;
}

int main(int argc, char* argv[]) {
  // Flush spdlog on info-level messages to ensure immediate output
  spdlog::flush_on(spdlog::level::info);

  auto result = parse_args(argc, argv);
  if (!result.success) {
    spdlog::error("{}", result.error);
    return 1;
  }

  if (result.args.options.log_level) {
    apply_log_level(*result.args.options.log_level);
  }

  spdlog::debug("splittab v{}", get_version_string());

  // Determine config path to load
  std::filesystem::path config_path;
  bool config_explicitly_specified = false;

  if (result.args.options.config_path) {
    config_path = *result.args.options.config_path;
    config_explicitly_specified = true;
  } else {
    config_path = get_default_config_path();
  }

  if (config_explicitly_specified && !std::filesystem::exists(config_path)) {
    spdlog::error("Config file not found: {}", config_path.string());
    return 1;
  }

  std::optional<std::filesystem::path> provider_path;
  if (std::filesystem::exists(config_path)) {
    provider_path = config_path;
  }
  ConfigurationProvider provider(provider_path);

  if (!result.args.command) {
    print_usage();
    return 0;
  }

  return std::visit(
      overloaded{
          [](const HelpCommand&) {
            print_usage();
            return 0;
          },
          [](const VersionCommand&) {
            std::cout << "splittab v" << get_version_string() << std::endl;
            return 0;
          },
          [&](const DemoCommand& cmd) { return run_demo(cmd, provider.configuration); },
          [](const InitConfigCommand& cmd) {
            auto target_path =
                cmd.filepath ? std::filesystem::path(*cmd.filepath) : get_default_config_path();
            auto write_result = write_configuration_toml(default_configuration(), target_path);
            if (!write_result.success) {
              spdlog::error("Failed to write config: {}", write_result.error);
              return 1;
            }
            spdlog::info("Config written to: {}", target_path.string());
            return 0;
          },
          [](const CheckConfigCommand& cmd) {
            auto read_result = read_configuration_toml(cmd.filepath);
            if (!read_result.success) {
              spdlog::error("{}", read_result.error);
              return 1;
            }
            const auto& c = read_result.configuration;
            std::cout << std::boolalpha << "allow_splits = " << c.allow_splits << "\n"
                      << "allow_close_tabs = " << c.allow_close_tabs << "\n"
                      << "allow_close_last_pane = " << c.allow_close_last_pane << "\n"
                      << "allow_tab_reordering = " << c.allow_tab_reordering << "\n"
                      << "allow_cross_pane_tab_move = " << c.allow_cross_pane_tab_move << "\n"
                      << "auto_close_empty_panes = " << c.auto_close_empty_panes << "\n"
                      << "new_tab_position = " << magic_enum::enum_name(c.new_tab_position)
                      << "\n"
                      << "content_view_lifecycle = "
                      << magic_enum::enum_name(c.content_view_lifecycle) << "\n"
                      << "tab_bar_height = " << c.appearance.tab_bar_height << std::endl;
            return 0;
          },
      },
      *result.args.command);
}

#endif
