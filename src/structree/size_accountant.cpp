#include "structree/size_accountant.hpp"

#include "structree/logger.hpp"

#include <system_error>

namespace structree {

namespace {

void accumulate(const std::filesystem::path& dir, SubtreeStats& stats) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, std::filesystem::directory_options::skip_permission_denied, ec);
    for (; !ec && it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        std::error_code entry_ec;
        const auto status = it->symlink_status(entry_ec);
        if (entry_ec) {
            continue;
        }
        if (std::filesystem::is_directory(status)) {
            ++stats.directories;
            accumulate(it->path(), stats);
        } else if (std::filesystem::is_regular_file(status)) {
            ++stats.files;
            const auto size = it->file_size(entry_ec);
            if (!entry_ec) {
                stats.bytes += size;
            }
        }
    }
    if (ec) {
        Logger::instance().debug("size scan stopped at {}: {}", dir.string(), ec.message());
    }
}

} // namespace

SubtreeStats measure_subtree(const std::filesystem::path& root) {
    SubtreeStats stats;
    accumulate(root, stats);
    return stats;
}

std::uintmax_t subtree_bytes(const std::filesystem::path& root) {
    return measure_subtree(root).bytes;
}

std::uintmax_t count_files(const std::filesystem::path& root) {
    return measure_subtree(root).files;
}

} // namespace structree
