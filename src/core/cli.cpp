#include "dotsweep/cli.h"

#include <chrono>
#include <cstdlib>
#include <sstream>

namespace dotsweep {

namespace {
constexpr std::string_view kDescription =
    "dotsweep: remove OS-generated junk files and Zone.Identifier markers from a directory tree";
}

Cli::Cli()
    : app_{std::make_unique<CLI::App>(std::string{kDescription})} {
    app_->set_version_flag("--version", "1.0.0");
    app_->footer(R"(Junk files are matched by name (.DS_Store, Thumbs.db, desktop.ini, ...) and by
pattern (._*, *.swp, *.swo, *.tmp, *.bak, *~, .nfs*). Files whose path contains
":Zone.Identifier" are removed, and the user.Zone.Identifier extended attribute
plus any --attr names are stripped using xattr (macOS) or getfattr/setfattr
(Linux).

Ctrl+C stops the run and reports what finished so far.)");

    auto* root = app_->add_option("path", options_.root, "Directory to clean");
    root->check(CLI::ExistingDirectory);
    document_option(root);

    add_scan_options();
    add_action_options();
    add_output_options();

    auto* dump = app_->add_flag("--dump-markdown", options_.dump_markdown,
                                "Print CLI options as markdown and exit");
    dump->configurable(false);
    document_option(dump);
}

Cli::~Cli() = default;

void Cli::add_scan_options() {
    auto scan = app_->add_option_group("Scan");

    auto* path = scan->add_option("-p,--path", options_.root, "Directory to clean (same as PATH)");
    path->check(CLI::ExistingDirectory);
    document_option(path);

    document_option(scan->add_flag("-r,--recursive,!--no-recursive", options_.recursive,
                                   "Descend into subdirectories"));

    document_option(scan->add_flag("-g,--exclude-git,--exclude-vcs", options_.exclude_vcs,
                                   "Skip .git, .hg, .svn, .bzr, CVS and _darcs directories"));

    auto* jobs = scan->add_option("-j,--jobs", options_.jobs, "Worker threads (default: processor count)");
    jobs->check(CLI::Range(1u, 1024u));
    document_option(jobs);

    auto* timeout = scan->add_option("--timeout", timeout_seconds_,
                                     "Stop waiting after this many seconds without progress (0: never)");
    timeout->check(CLI::Range(0, 86400));
    document_option(timeout);
}

void Cli::add_action_options() {
    auto actions = app_->add_option_group("Actions");

    document_option(actions->add_flag("-n,--dry-run", options_.dry_run, "Report what would be removed"));

    auto* attrs = actions->add_option("-a,--attr", options_.extra_attributes,
                                      "Additional extended attribute to remove (repeatable)");
    attrs->allow_extra_args(false);
    document_option(attrs);

    document_option(actions->add_flag_callback("--trust-probe",
                                               [&]() { options_.removal_policy = RemovalPolicy::TrustProbe; },
                                               "Count an attribute as removed once found, even if removal fails"));
}

void Cli::add_output_options() {
    auto output = app_->add_option_group("Output");

    document_option(output->add_flag("-s,--summary", options_.summary, "List every affected file"));

    document_option(output->add_flag("-q,--quiet,--csv-only", options_.quiet, "Print neither progress nor totals"));

    document_option(output->add_flag_callback("--no-progress", [&]() { options_.progress = false; },
                                              "Disable the progress bar"));

    document_option(output->add_flag_callback("--no-color", [&]() { options_.color_enabled = false; },
                                              "Disable ANSI colors"));

    document_option(output->add_option("--csv", options_.csv_path, "Write affected files to a CSV file"));

    document_option(output->add_option("--log-file", options_.log_path, "Write log messages to a file"));

    document_option(output->add_flag("-v,--verbose", options_.verbosity, "Increase log verbosity (repeatable)"));
}

Config::Options Cli::parse(int argc, char** argv) {
    options_ = Config::Options{};
    timeout_seconds_ = 0;
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& ex) {
        std::exit(app_->exit(ex));
    }
    options_.task_timeout = std::chrono::seconds{timeout_seconds_};
    return options_;
}

std::string Cli::usage_markdown() const {
    std::ostringstream out;
    out << "### Command line options\n\n";
    out << "| Option | Description | Default |\n";
    out << "| ------ | ----------- | ------- |\n";
    for (const auto& doc : docs_) {
        out << "| `" << doc.name << "` | " << doc.description << " | "
            << (doc.default_value.empty() ? "" : doc.default_value) << " |\n";
    }
    out << '\n';
    return out.str();
}

} // namespace dotsweep
