#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dotsweep {

// How an attribute removal is reported once the probe found the attribute.
enum class RemovalPolicy {
    Confirm,   // removed only if the removal call succeeded as well
    TrustProbe // removed as soon as the probe succeeded
};

class Config {
public:
    struct Options {
        std::filesystem::path root = ".";
        std::vector<std::string> extra_attributes;

        bool dry_run = false;
        bool exclude_vcs = false;
        bool recursive = true;
        bool summary = false;
        bool quiet = false;
        bool progress = true;
        bool color_enabled = true;
        bool dump_markdown = false;

        unsigned jobs = 0; // 0 selects the processor count
        int verbosity = 0;
        RemovalPolicy removal_policy = RemovalPolicy::Confirm;
        std::chrono::seconds task_timeout{0}; // zero waits forever

        std::filesystem::path csv_path;
        std::filesystem::path log_path;
    };

    static Config& instance();

    void set_options(Options options);
    const Options& options() const noexcept;

    void set_program_name(std::string_view name);
    std::string_view program_name() const noexcept;

private:
    Config() = default;

    Options options_{};
    std::string program_name_;
};

// Worker count after resolving the processor-count default; never zero.
unsigned effective_jobs(const Config::Options& options) noexcept;

} // namespace dotsweep
