#pragma once

#include <cstddef>
#include <iosfwd>

#include "dotsweep/scheduler.h"

namespace dotsweep {

// Single-line completion bar redrawn in place with carriage returns.
class ProgressBar : public RunObserver {
public:
    ProgressBar(std::ostream& out, int terminal_width);

    void on_start(std::size_t total) override;
    void on_outcome(const std::filesystem::path& path, const Outcome& outcome) override;
    void on_finish(const RunResult& result) override;

private:
    void draw();

    std::ostream& out_;
    int width_;
    std::size_t total_ = 0;
    std::size_t done_ = 0;
    int last_permille_ = -1;
};

} // namespace dotsweep
