#include "ace/version.hpp"

#include <string>

namespace ace {
namespace version {

bool check_format_version(const std::string& format, uint64_t found, uint32_t supported,
                          std::string* error) {
  if (found == 0 || found <= supported) return true;
  if (error) {
    *error = format + " format version " + std::to_string(found) +
             " is newer than supported version " + std::to_string(supported);
  }
  return false;
}

}  // namespace version
}  // namespace ace
