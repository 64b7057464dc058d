#pragma once

#include "structree/cli.hpp"
#include "structree/config.hpp"

#include <string>
#include <vector>

namespace structree {

class Theme;

class App {
public:
    App();
    int run(int argc, char** argv);

private:
    int run_tree(const RunOptions& options, const Theme& theme, const std::vector<std::string>& stored);
    int run_search(const RunOptions& options, const Theme& theme, const std::vector<std::string>& stored);
    int run_pattern_command(const RunOptions& options);

    Cli cli_;
};

} // namespace structree
