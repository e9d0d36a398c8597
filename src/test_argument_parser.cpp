#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include <variant>

#include "argument_parser.h"

using namespace splittab;

TEST_SUITE("parse_args") {
  TEST_CASE("no arguments yields no command") {
    const char* argv[] = {"splittab"};
    auto result = parse_args(1, argv);

    REQUIRE(result.success);
    CHECK_FALSE(result.args.command.has_value());
    CHECK_FALSE(result.args.options.log_level.has_value());
  }

  TEST_CASE("help flag wins over everything after it") {
    const char* argv[] = {"splittab", "-h", "demo", "bogus"};
    auto result = parse_args(4, argv);

    REQUIRE(result.success);
    REQUIRE(result.args.command.has_value());
    CHECK(std::holds_alternative<HelpCommand>(*result.args.command));
  }

  TEST_CASE("options before the command") {
    const char* argv[] = {"splittab", "--logmode", "debug", "--config", "a.toml", "version"};
    auto result = parse_args(6, argv);

    REQUIRE(result.success);
    CHECK(result.args.options.log_level == LogLevel::Debug);
    CHECK(result.args.options.config_path == std::string("a.toml"));
    REQUIRE(result.args.command.has_value());
    CHECK(std::holds_alternative<VersionCommand>(*result.args.command));
  }

  TEST_CASE("invalid options") {
    const char* bad_level[] = {"splittab", "--logmode", "loud"};
    CHECK_FALSE(parse_args(3, bad_level).success);

    const char* missing_value[] = {"splittab", "--config"};
    auto result = parse_args(2, missing_value);
    CHECK_FALSE(result.success);
    CHECK(result.error == "--config requires a filepath");

    const char* unknown[] = {"splittab", "--verbose"};
    CHECK(parse_args(2, unknown).error == "Unknown option: --verbose");
  }

  TEST_CASE("demo with and without a size") {
    const char* plain[] = {"splittab", "demo"};
    auto result = parse_args(2, plain);
    REQUIRE(result.success);
    auto* demo = std::get_if<DemoCommand>(&*result.args.command);
    REQUIRE(demo != nullptr);
    CHECK(demo->width == 1200.0);
    CHECK(demo->height == 800.0);

    const char* sized[] = {"splittab", "demo", "1920", "1080"};
    result = parse_args(4, sized);
    REQUIRE(result.success);
    demo = std::get_if<DemoCommand>(&*result.args.command);
    REQUIRE(demo != nullptr);
    CHECK(demo->width == 1920.0);
    CHECK(demo->height == 1080.0);
  }

  TEST_CASE("demo rejects bad sizes") {
    const char* one[] = {"splittab", "demo", "1920"};
    CHECK_FALSE(parse_args(3, one).success);

    const char* text[] = {"splittab", "demo", "wide", "tall"};
    CHECK_FALSE(parse_args(4, text).success);

    const char* negative[] = {"splittab", "demo", "-10", "10"};
    CHECK_FALSE(parse_args(4, negative).success);

    const char* not_a_number[] = {"splittab", "demo", "nan", "800"};
    auto result = parse_args(4, not_a_number);
    CHECK_FALSE(result.success);
    CHECK(result.error == "Invalid number in demo arguments");

    const char* infinite[] = {"splittab", "demo", "1200", "inf"};
    CHECK_FALSE(parse_args(4, infinite).success);

    const char* trailing[] = {"splittab", "demo", "12abc", "800"};
    CHECK_FALSE(parse_args(4, trailing).success);
  }

  TEST_CASE("config commands") {
    const char* init_default[] = {"splittab", "init-config"};
    auto result = parse_args(2, init_default);
    REQUIRE(result.success);
    auto* init = std::get_if<InitConfigCommand>(&*result.args.command);
    REQUIRE(init != nullptr);
    CHECK_FALSE(init->filepath.has_value());

    const char* init_path[] = {"splittab", "init-config", "out.toml"};
    result = parse_args(3, init_path);
    REQUIRE(result.success);
    init = std::get_if<InitConfigCommand>(&*result.args.command);
    REQUIRE(init != nullptr);
    CHECK(init->filepath == std::string("out.toml"));

    const char* check[] = {"splittab", "check-config", "in.toml"};
    result = parse_args(3, check);
    REQUIRE(result.success);
    auto* check_cmd = std::get_if<CheckConfigCommand>(&*result.args.command);
    REQUIRE(check_cmd != nullptr);
    CHECK(check_cmd->filepath == "in.toml");

    const char* check_missing[] = {"splittab", "check-config"};
    CHECK_FALSE(parse_args(2, check_missing).success);
  }

  TEST_CASE("unknown commands and trailing arguments") {
    const char* unknown[] = {"splittab", "launch"};
    CHECK(parse_args(2, unknown).error == "Unknown command: launch");

    const char* trailing[] = {"splittab", "version", "extra"};
    auto result = parse_args(3, trailing);
    CHECK_FALSE(result.success);
    CHECK(result.error == "Unexpected argument: extra");
  }
}

#endif // !DOCTEST_CONFIG_DISABLE
