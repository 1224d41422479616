#include "dotsweep/progress.h"

#include <algorithm>
#include <ostream>
#include <string>

namespace dotsweep {

ProgressBar::ProgressBar(std::ostream& out, int terminal_width)
    : out_{out}, width_{std::clamp(terminal_width, 20, 400)} {}

void ProgressBar::on_start(std::size_t total) {
    total_ = total;
    done_ = 0;
    last_permille_ = -1;
    draw();
}

void ProgressBar::on_outcome(const std::filesystem::path&, const Outcome&) {
    ++done_;
    draw();
}

void ProgressBar::on_finish(const RunResult&) {
    out_ << '\n';
    out_.flush();
}

void ProgressBar::draw() {
    const int permille = total_ == 0 ? 1000 : static_cast<int>(done_ * 1000 / total_);
    if (permille == last_permille_ && done_ != total_) {
        return;
    }
    last_permille_ = permille;

    const std::string counter = " " + std::to_string(done_) + "/" + std::to_string(total_);
    const std::string percent = std::to_string(permille / 10) + "% ";
    const int bar_width = std::max(10, width_ - static_cast<int>(counter.size() + percent.size()) - 3);
    const int filled = bar_width * permille / 1000;

    out_ << '\r' << percent << '[' << std::string(static_cast<std::size_t>(filled), '#')
         << std::string(static_cast<std::size_t>(bar_width - filled), ' ') << ']' << counter;
    out_.flush();
}

} // namespace dotsweep
