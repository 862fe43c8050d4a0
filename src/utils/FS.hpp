#pragma once

#include <filesystem>
#include <optional>

namespace gt::utils
{

// $XDG_DATA_HOME/gametime, ~/.local/share/gametime, or <exe dir>/data, the
// first one that can be created.
std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();

} // namespace gt::utils
