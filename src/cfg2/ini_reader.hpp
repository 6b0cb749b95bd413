#pragma once

#include "config_node.hpp"
#include <filesystem>

namespace cfg2 {

// ROOT node with one SECTION child per [section], in file order. Repeated
// sections are merged by SimpleIni. Throws std::runtime_error when the file
// cannot be read or parsed.
[[nodiscard]] ConfigNode parseIniFile(const std::filesystem::path &filename);

} // namespace cfg2
