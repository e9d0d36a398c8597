#include "argument_parser.h"

#include <cmath>
#include <iostream>

namespace splittab {

namespace {

std::optional<LogLevel> parse_log_level(const std::string& level) {
  if (level == "trace") return LogLevel::Trace;
  if (level == "debug") return LogLevel::Debug;
  if (level == "info") return LogLevel::Info;
  if (level == "warn") return LogLevel::Warn;
  if (level == "err") return LogLevel::Err;
  if (level == "off") return LogLevel::Off;
  return std::nullopt;
}

// Whole-string, finite number, or nullopt
std::optional<double> parse_dimension(const std::string& text) {
  size_t consumed = 0;
  double value = 0.0;
  try {
    value = std::stod(text, &consumed);
  } catch (const std::exception&) {
    return std::nullopt;
  }
  if (consumed != text.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

ParseResult make_error(const std::string& error) {
  ParseResult result;
  result.success = false;
  result.error = error;
  return result;
}

ParseResult make_success(ParsedArgs args) {
  ParseResult result;
  result.success = true;
  result.args = std::move(args);
  return result;
}

} // namespace

ParseResult parse_args(int argc, const char* const argv[]) {
  ParsedArgs args;
  int i = 1;

  // Parse options first (--option value)
  while (i < argc) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.command = HelpCommand{};
      return make_success(args);
    }

    if (arg.rfind("--", 0) == 0) {
      std::string option_name = arg.substr(2);

      if (option_name == "logmode") {
        if (i + 1 >= argc) {
          return make_error("--logmode requires a value");
        }
        ++i;
        std::string value = argv[i];
        auto level = parse_log_level(value);
        if (!level) {
          return make_error("Invalid log level: " + value +
                            ". Valid values: trace, debug, info, warn, err, off");
        }
        args.options.log_level = level;
      } else if (option_name == "config") {
        if (i + 1 >= argc) {
          return make_error("--config requires a filepath");
        }
        ++i;
        args.options.config_path = argv[i];
      } else {
        return make_error("Unknown option: --" + option_name);
      }
      ++i;
      continue;
    }

    // Not an option, must be a command
    break;
  }

  if (i < argc) {
    std::string cmd = argv[i];
    ++i;

    if (cmd == "help") {
      args.command = HelpCommand{};
    } else if (cmd == "version") {
      args.command = VersionCommand{};
    } else if (cmd == "demo") {
      DemoCommand demo;
      int remaining = argc - i;
      if (remaining != 0 && remaining != 2) {
        return make_error("demo takes either no arguments or <width> <height>. Got " +
                          std::to_string(remaining) + " arguments.");
      }
      if (remaining == 2) {
        auto width = parse_dimension(argv[i]);
        auto height = parse_dimension(argv[i + 1]);
        if (!width || !height) {
          return make_error("Invalid number in demo arguments");
        }
        demo.width = *width;
        demo.height = *height;
        i += 2;
        if (demo.width <= 0.0 || demo.height <= 0.0) {
          return make_error("demo width and height must be positive");
        }
      }
      args.command = demo;
    } else if (cmd == "init-config") {
      InitConfigCommand init_cmd;
      if (i < argc && argv[i][0] != '-') {
        init_cmd.filepath = argv[i];
        ++i;
      }
      args.command = init_cmd;
    } else if (cmd == "check-config") {
      if (i >= argc) {
        return make_error("check-config requires a filepath");
      }
      args.command = CheckConfigCommand{argv[i]};
      ++i;
    } else {
      return make_error("Unknown command: " + cmd);
    }

    if (i < argc) {
      return make_error("Unexpected argument: " + std::string(argv[i]));
    }
  }

  return make_success(args);
}

void print_usage() {
  std::cout << "Usage: splittab [options] [command] [command-args]\n"
            << "\n"
            << "Options:\n"
            << "  --help, -h               Show this help message\n"
            << "  --logmode <level>        Set log level (trace, debug, info, warn, err, off)\n"
            << "  --config <filepath>      Load configuration from a TOML file\n"
            << "\n"
            << "Commands:\n"
            << "  help                     Show this help message\n"
            << "  version                  Print the version\n"
            << "  demo [width height]      Run a scripted split/tab session and print the\n"
            << "                           resulting tree and layout as JSON\n"
            << "                           (container defaults to 1200x800)\n"
            << "  init-config [filepath]   Create default configuration TOML file\n"
            << "                           (defaults to splittab.toml)\n"
            << "  check-config <filepath>  Parse a configuration file and report problems\n"
            << "\n"
            << "Examples:\n"
            << "  splittab --logmode debug demo\n"
            << "  splittab demo 1920 1080\n"
            << "  splittab init-config config.toml\n"
            << "  splittab --config config.toml demo\n";
}

} // namespace splittab
