#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "dotsweep/scheduler.h"

namespace dotsweep {

// Writes one row per outcome that removed something:
//   path,file,attrs,junk,dry_run
// with attribute names joined by ';'.
class CsvWriter : public RunObserver {
public:
    // Throws std::runtime_error if the file cannot be created.
    CsvWriter(const std::filesystem::path& path, bool dry_run);

    void on_start(std::size_t total) override;
    void on_outcome(const std::filesystem::path& path, const Outcome& outcome) override;
    void on_finish(const RunResult& result) override;

    static std::string escape(std::string_view field);

private:
    void check_stream();

    std::filesystem::path path_;
    std::ofstream out_;
    bool dry_run_;
    bool failed_ = false;
};

} // namespace dotsweep
