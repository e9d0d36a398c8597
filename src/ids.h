#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>

namespace splittab {

// Next value of the process-wide identifier counter. Values start at 1 and are
// never handed out twice, whatever the identifier kind.
std::uint64_t next_raw_id();

// Opaque, value-equatable handle. Tag only separates the kinds at compile time.
template <typename Tag>
struct Id {
  std::uint64_t value = 0;

  [[nodiscard]] static Id generate() {
    return Id{next_raw_id()};
  }

  [[nodiscard]] std::string to_string() const {
    return std::string(Tag::prefix) + "-" + std::to_string(value);
  }

  // Parses the to_string() form. Returns nullopt for any other input.
  [[nodiscard]] static std::optional<Id> from_string(const std::string& text) {
    std::string prefix = std::string(Tag::prefix) + "-";
    if (text.size() <= prefix.size() || text.compare(0, prefix.size(), prefix) != 0) {
      return std::nullopt;
    }
    std::uint64_t parsed = 0;
    for (size_t i = prefix.size(); i < text.size(); ++i) {
      char c = text[i];
      if (c < '0' || c > '9') {
        return std::nullopt;
      }
      auto digit = static_cast<std::uint64_t>(c - '0');
      if (parsed > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
        return std::nullopt;
      }
      parsed = parsed * 10 + digit;
    }
    return Id{parsed};
  }

  bool operator==(const Id& other) const = default;
};

struct TabTag {
  static constexpr const char* prefix = "tab";
};
struct PaneTag {
  static constexpr const char* prefix = "pane";
};
struct SplitTag {
  static constexpr const char* prefix = "split";
};

using TabId = Id<TabTag>;
using PaneId = Id<PaneTag>;
using SplitId = Id<SplitTag>;

} // namespace splittab

template <typename Tag>
struct std::hash<splittab::Id<Tag>> {
  size_t operator()(const splittab::Id<Tag>& id) const noexcept {
    return std::hash<std::uint64_t>{}(id.value);
  }
};
