#pragma once

#include <filesystem>
#include <optional>

namespace structree::platform {

[[nodiscard]] bool stdout_is_tty();
[[nodiscard]] bool color_disabled_by_environment();
void enable_virtual_terminal_processing();

// Best-effort: any execute bit on POSIX, a known script/binary extension on Windows.
[[nodiscard]] bool has_executable_bit(const std::filesystem::path& path);

[[nodiscard]] std::optional<std::filesystem::path> user_config_dir();

} // namespace structree::platform
