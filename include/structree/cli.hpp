#pragma once

#include "structree/config.hpp"

#include <map>
#include <optional>
#include <string>

namespace structree {

class Cli {
public:
    Cli();

    // Fills `config`. Returns an exit code when the program should stop
    // (help, version, or a parse error), otherwise nothing.
    [[nodiscard]] std::optional<int> parse(int argc, const char* const* argv, Config& config) const;

    // Git flags in precedence order: a later flag wins over an earlier one.
    struct GitFlags {
        bool history{false};
        bool tracked{false};
        bool untracked{false};
        bool staged{false};
        bool changed{false};
        bool root{false};
    };

    [[nodiscard]] static GitRelationship resolve_git_relationship(const GitFlags& flags) noexcept;

private:
    [[nodiscard]] static std::map<std::string, LogLevel> log_level_map();
};

} // namespace structree
