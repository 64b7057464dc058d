#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace structree {

struct DirEntry {
    std::filesystem::path path;
    std::string name;
    std::filesystem::path link_target;
    std::uintmax_t size{0}; // regular files only
    bool is_directory{false}; // never true for a symlink
    bool is_symlink{false};
    bool is_regular{false};
    bool is_executable{false};
};

} // namespace structree
