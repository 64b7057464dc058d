#include "structree/fs_scanner.hpp"

#include "structree/logger.hpp"
#include "structree/platform.hpp"
#include "structree/string_utils.hpp"

#include <algorithm>

namespace structree {

FileSystemScanner::FileSystemScanner() = default;

std::vector<DirEntry> FileSystemScanner::scan(const std::filesystem::path& path, std::error_code& ec) const {
    std::vector<DirEntry> entries;
    ec.clear();
    std::filesystem::directory_iterator it(path, std::filesystem::directory_options::none, ec);
    for (; !ec && it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        std::error_code entry_ec;
        entries.push_back(make_entry(*it, entry_ec));
        if (entry_ec) {
            Logger::instance().debug("failed to inspect {}: {}", it->path().string(), entry_ec.message());
        }
    }
    return entries;
}

DirEntry FileSystemScanner::stat_path(const std::filesystem::path& path, std::error_code& ec) const {
    std::filesystem::directory_entry entry{path, ec};
    if (ec) {
        return {};
    }
    return make_entry(entry, ec);
}

DirEntry FileSystemScanner::make_entry(const std::filesystem::directory_entry& entry, std::error_code& ec) const {
    DirEntry out;
    out.path = entry.path();
    auto filename = entry.path().filename();
    out.name = filename.empty() ? entry.path().string() : filename.string();

    const auto status = entry.symlink_status(ec);
    if (ec) {
        return out;
    }
    out.is_symlink = std::filesystem::is_symlink(status);
    if (out.is_symlink) {
        out.link_target = std::filesystem::read_symlink(entry.path(), ec);
        if (ec) {
            ec.clear();
        }
        return out;
    }

    out.is_directory = std::filesystem::is_directory(status);
    out.is_regular = std::filesystem::is_regular_file(status);
    if (out.is_regular) {
        out.size = entry.file_size(ec);
        if (ec) {
            ec.clear();
            out.size = 0;
        }
        out.is_executable = platform::has_executable_bit(entry.path());
    }
    return out;
}

void sort_entries(std::vector<DirEntry>& entries) {
    std::sort(entries.begin(), entries.end(), [](const DirEntry& a, const DirEntry& b) {
        if (a.is_directory != b.is_directory) {
            return a.is_directory;
        }
        const auto lower_a = string_utils::to_lower(a.name);
        const auto lower_b = string_utils::to_lower(b.name);
        if (lower_a != lower_b) {
            return lower_a < lower_b;
        }
        return a.name < b.name;
    });
}

std::filesystem::path absolute_root(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    absolute = absolute.lexically_normal();
    if (!absolute.has_filename() && absolute.has_relative_path()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

} // namespace structree
