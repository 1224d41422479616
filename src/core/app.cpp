#include "dotsweep/app.h"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "dotsweep/cancellation.h"
#include "dotsweep/cli.h"
#include "dotsweep/collector.h"
#include "dotsweep/config.h"
#include "dotsweep/csv_writer.h"
#include "dotsweep/logger.h"
#include "dotsweep/perf.h"
#include "dotsweep/platform.h"
#include "dotsweep/progress.h"
#include "dotsweep/reporter.h"
#include "dotsweep/scheduler.h"
#include "dotsweep/xattr.h"

namespace dotsweep {

class App::Impl {
public:
    ~Impl() {
        if (log_file_) {
            Logger::instance().set_output(nullptr);
            Logger::instance().set_tag({});
        }
    }

    int run(int argc, char** argv) {
        Config::instance().set_program_name(program_name(argc, argv));
        Cli cli;
        auto options = cli.parse(argc, argv);
        if (!platform::stdout_supports_color()) {
            options.color_enabled = false;
        }
        Config::instance().set_options(options);

        if (options.dump_markdown) {
            std::cout << cli.usage_markdown();
            return 0;
        }

        try {
            return sweep(Config::instance().options());
        } catch (const std::exception& ex) {
            Logger::instance().error("{}", ex.what());
            return 1;
        }
    }

private:
    static std::string program_name(int argc, char** argv) {
        if (argc < 1 || argv == nullptr || argv[0] == nullptr) {
            return "dotsweep";
        }
        auto name = std::filesystem::path{argv[0]}.filename().string();
        return name.empty() ? std::string{"dotsweep"} : name;
    }

    int sweep(const Config::Options& options) {
        auto& log = Logger::instance();
        log.set_level(Logger::level_from_verbosity(options.verbosity));
        if (!options.log_path.empty()) {
            log_file_ = std::make_unique<std::ofstream>(options.log_path, std::ios::out | std::ios::app);
            if (!*log_file_) {
                throw std::runtime_error("cannot open log file " + options.log_path.string());
            }
            log.set_output(log_file_.get());
            log.set_tag(Config::instance().program_name());
        }

        std::error_code ec;
        if (!std::filesystem::is_directory(options.root, ec)) {
            throw std::runtime_error(options.root.string() + " is not a directory");
        }

        const auto os = platform::detect_os();
        auto backend = make_platform_backend(os);
        log.info("platform {}, attribute backend {}{}", platform::os_name(os), backend->name(),
                 options.dry_run ? ", dry run" : "");

        ObserverList observers;
        std::optional<CsvWriter> csv;
        if (!options.csv_path.empty()) {
            csv.emplace(options.csv_path, options.dry_run);
            observers.add(*csv);
        }
        std::optional<ProgressBar> progress;
        if (options.progress && !options.quiet && platform::stderr_is_terminal()) {
            progress.emplace(std::cerr, platform::terminal_width());
            observers.add(*progress);
        }

        CancellationToken token;
        InterruptGuard guard{token};

        std::vector<std::filesystem::path> files;
        {
            perf::ScopedTimer timer{"collect:" + options.root.string()};
            files = FileCollector{options}.collect();
        }

        Scheduler scheduler{options, backend, token};
        const RunResult result = scheduler.run(files, &observers);

        if (result.interrupted) {
            log.warn("interrupted after {} of {} files", result.report.processed(), result.total);
        }
        print_report(std::cout, result, options, options.color_enabled);
        return 0;
    }

    std::unique_ptr<std::ofstream> log_file_;
};

App::App()
    : impl_{std::make_unique<Impl>()} {}

App::~App() = default;

int App::run(int argc, char** argv) {
    return impl_->run(argc, argv);
}

} // namespace dotsweep
