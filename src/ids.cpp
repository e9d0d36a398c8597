#include "ids.h"

namespace splittab {

namespace {
std::uint64_t g_next_id = 1;
} // namespace

std::uint64_t next_raw_id() {
  return g_next_id++;
}

} // namespace splittab
