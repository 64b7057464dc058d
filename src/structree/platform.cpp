#include "structree/platform.hpp"

#include "structree/string_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace structree::platform {

namespace {

std::optional<std::filesystem::path> env_path(const char* name) {
    if (const char* value = std::getenv(name)) {
        if (value[0] != '\0') {
            return std::filesystem::path(value);
        }
    }
    return std::nullopt;
}

} // namespace

bool stdout_is_tty() {
#ifdef _WIN32
    return ::_isatty(_fileno(stdout)) != 0;
#else
    return ::isatty(STDOUT_FILENO) != 0;
#endif
}

bool color_disabled_by_environment() {
    const char* value = std::getenv("NO_COLOR");
    return value != nullptr && value[0] != '\0';
}

void enable_virtual_terminal_processing() {
#ifdef _WIN32
    HANDLE handle = ::GetStdHandle(STD_OUTPUT_HANDLE);
    if (handle == INVALID_HANDLE_VALUE) {
        return;
    }
    DWORD mode = 0;
    if (!::GetConsoleMode(handle, &mode)) {
        return;
    }
    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    ::SetConsoleMode(handle, mode);
#endif
}

bool has_executable_bit(const std::filesystem::path& path) {
#ifdef _WIN32
    const auto ext = string_utils::to_lower(path.extension().string());
    return ext == ".exe" || ext == ".bat" || ext == ".cmd" || ext == ".sh" || ext == ".py" || ext == ".ps1";
#else
    struct ::stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    return (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
#endif
}

std::optional<std::filesystem::path> user_config_dir() {
    if (auto dir = env_path("STRUCTREE_CONFIG_DIR")) {
        return dir;
    }
#ifdef _WIN32
    if (auto appdata = env_path("APPDATA")) {
        return *appdata / "structree";
    }
#else
    if (auto xdg = env_path("XDG_CONFIG_HOME")) {
        return *xdg / "structree";
    }
    if (auto home = env_path("HOME")) {
        return *home / ".config" / "structree";
    }
#endif
    return std::nullopt;
}

} // namespace structree::platform
