#pragma once

#include <CLI/CLI.hpp>

#include <memory>
#include <string>
#include <vector>

#include "dotsweep/config.h"

namespace dotsweep {

class Cli {
public:
    Cli();
    ~Cli();

    // Exits the process through CLI11 on --help, --version or a parse error.
    Config::Options parse(int argc, char** argv);
    std::string usage_markdown() const;

private:
    struct OptionDoc {
        std::string name;
        std::string description;
        std::string default_value;
    };

    template <typename OptionPtr>
    void document_option(const OptionPtr& option);

    void add_scan_options();
    void add_action_options();
    void add_output_options();

    std::unique_ptr<CLI::App> app_;
    Config::Options options_{};
    int timeout_seconds_ = 0;
    std::vector<OptionDoc> docs_;
};

} // namespace dotsweep

#include "dotsweep/cli.tpp"
