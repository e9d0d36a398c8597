#pragma once

#include <string>

namespace splittab {

struct Version {
  int major;
  int minor;
  int patch;
  const char* label; // Empty for releases
};

constexpr Version kVersion{0, 1, 0, "alpha"};

// "major.minor.patch" with "-label" appended for pre-releases
inline std::string get_version_string() {
  std::string text = std::to_string(kVersion.major) + "." + std::to_string(kVersion.minor) + "." +
                     std::to_string(kVersion.patch);
  if (kVersion.label[0] != '\0') {
    text += '-';
    text += kVersion.label;
  }
  return text;
}

} // namespace splittab
