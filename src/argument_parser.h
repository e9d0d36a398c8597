#pragma once

#include <optional>
#include <string>
#include <variant>

namespace splittab {

// ===== Command Structs =====
struct HelpCommand {}; // --help or -h

struct VersionCommand {};

// Scripted session that prints the resulting tree and layout as JSON
struct DemoCommand {
  double width = 1200.0;
  double height = 800.0;
};

struct InitConfigCommand {
  std::optional<std::string> filepath; // Empty = use default (splittab.toml in the working dir)
};

struct CheckConfigCommand {
  std::string filepath;
};

// Variant holding all possible commands
using Command =
    std::variant<HelpCommand, VersionCommand, DemoCommand, InitConfigCommand, CheckConfigCommand>;

// ===== CLI Options =====
enum class LogLevel { Trace, Debug, Info, Warn, Err, Off };

struct CliOptions {
  std::optional<LogLevel> log_level;      // --logmode <level>
  std::optional<std::string> config_path; // --config <filepath>
};

// ===== Parsed Arguments =====
struct ParsedArgs {
  CliOptions options;
  std::optional<Command> command; // nullopt if no command specified
};

// ===== Parser Result =====
struct ParseResult {
  bool success;
  std::string error; // Set if success == false
  ParsedArgs args;
};

// Parse command-line arguments
ParseResult parse_args(int argc, const char* const argv[]);

// Print usage information to stdout
void print_usage();

} // namespace splittab
