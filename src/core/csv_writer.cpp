#include "dotsweep/csv_writer.h"

#include <stdexcept>

#include "dotsweep/logger.h"

namespace dotsweep {

namespace {
std::string_view flag(bool value) {
    return value ? "1" : "0";
}
} // namespace

CsvWriter::CsvWriter(const std::filesystem::path& path, bool dry_run)
    : path_{path}, out_{path, std::ios::out | std::ios::trunc}, dry_run_{dry_run} {
    if (!out_) {
        throw std::runtime_error("cannot open CSV output " + path.string());
    }
}

std::string CsvWriter::escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }
    std::string quoted = "\"";
    for (char ch : field) {
        if (ch == '"') {
            quoted += '"';
        }
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

void CsvWriter::on_start(std::size_t) {
    out_ << "path,file,attrs,junk,dry_run\n";
    check_stream();
}

void CsvWriter::on_outcome(const std::filesystem::path& path, const Outcome& outcome) {
    if (!outcome.any() || failed_) {
        return;
    }

    std::string attrs;
    for (const auto& name : outcome.attrs) {
        if (!attrs.empty()) {
            attrs += ';';
        }
        attrs += name;
    }

    out_ << escape(path.string()) << ',' << flag(outcome.file) << ',' << escape(attrs) << ','
         << flag(outcome.junk) << ',' << flag(dry_run_) << '\n';
    check_stream();
}

void CsvWriter::on_finish(const RunResult&) {
    out_.flush();
    check_stream();
}

void CsvWriter::check_stream() {
    if (!out_ && !failed_) {
        failed_ = true;
        Logger::instance().error("write to {} failed, CSV output is incomplete", path_.string());
    }
}

} // namespace dotsweep
