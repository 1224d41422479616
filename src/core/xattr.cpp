#include "dotsweep/xattr.h"

#include <array>
#include <cstdio>
#include <exception>
#include <system_error>
#include <utility>

#ifndef _WIN32
#include <sys/wait.h>
#endif

#include "dotsweep/logger.h"
#include "dotsweep/utility.h"

namespace dotsweep {

namespace {
#ifndef _WIN32
using popen_handle = std::unique_ptr<FILE, decltype(&pclose)>;
popen_handle make_pipe(const std::string& command) {
    return popen_handle(::popen(command.c_str(), "r"), pclose);
}
constexpr std::string_view kDiscardOutput = " >/dev/null 2>&1";
#else
using popen_handle = std::unique_ptr<FILE, decltype(&_pclose)>;
popen_handle make_pipe(const std::string& command) {
    return popen_handle(_popen(command.c_str(), "r"), _pclose);
}
constexpr std::string_view kDiscardOutput = " >NUL 2>&1";
#endif

void replace_all(std::string& text, std::string_view token, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}
} // namespace

bool run_silent(const std::string& command) {
    auto pipe = make_pipe(command + std::string{kDiscardOutput});
    if (!pipe) {
        Logger::instance().debug("failed to spawn '{}'", command);
        return false;
    }

    std::array<char, 256> buffer{};
    while (std::fread(buffer.data(), 1, buffer.size(), pipe.get()) > 0) {
    }

#ifndef _WIN32
    const int status = ::pclose(pipe.release());
    if (status == -1 || !WIFEXITED(status)) {
        return false;
    }
    return WEXITSTATUS(status) == 0;
#else
    return ::_pclose(pipe.release()) == 0;
#endif
}

ToolXattrBackend::ToolXattrBackend(std::string name, std::string probe_command, std::string remove_command)
    : name_{std::move(name)},
      probe_command_{std::move(probe_command)},
      remove_command_{std::move(remove_command)} {}

std::string_view ToolXattrBackend::name() const noexcept {
    return name_;
}

std::string ToolXattrBackend::expand(const std::string& command, const std::filesystem::path& path,
                                     std::string_view attribute) const {
    std::string result = command;
    replace_all(result, "{name}", shell_quote(attribute));
    replace_all(result, "{path}", shell_quote(path.string()));
    return result;
}

bool ToolXattrBackend::probe(const std::filesystem::path& path, std::string_view attribute) const {
    try {
        return run_silent(expand(probe_command_, path, attribute));
    } catch (const std::exception& ex) {
        Logger::instance().debug("{} probe of {} on {} failed: {}", name_, attribute, path.string(), ex.what());
        return false;
    }
}

bool ToolXattrBackend::remove(const std::filesystem::path& path, std::string_view attribute) const {
    try {
        return run_silent(expand(remove_command_, path, attribute));
    } catch (const std::exception& ex) {
        Logger::instance().debug("{} removal of {} on {} failed: {}", name_, attribute, path.string(), ex.what());
        return false;
    }
}

std::unique_ptr<XattrBackend> make_macos_backend() {
    return std::make_unique<ToolXattrBackend>("xattr", "xattr -p {name} {path}", "xattr -d {name} {path}");
}

std::unique_ptr<XattrBackend> make_linux_backend() {
    return std::make_unique<ToolXattrBackend>("attr", "getfattr --only-values -n {name} {path}",
                                              "setfattr -x {name} {path}");
}

std::shared_ptr<const XattrBackend> make_platform_backend(platform::OsFamily os) {
    switch (os) {
        case platform::OsFamily::MacOS:
            return make_macos_backend();
        case platform::OsFamily::Linux:
            return make_linux_backend();
        case platform::OsFamily::Other:
            break;
    }
    return std::make_shared<NullXattrBackend>();
}

bool remove_attribute(const XattrBackend& backend, const std::filesystem::path& path, std::string_view attribute,
                      bool dry_run, RemovalPolicy policy) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
    if (dry_run) {
        return true;
    }

    if (!backend.probe(path, attribute)) {
        return false;
    }
    const bool removed = backend.remove(path, attribute);
    if (!removed) {
        Logger::instance().info("{}: {} present but removal failed", path.string(), attribute);
    }
    return removed || policy == RemovalPolicy::TrustProbe;
}

} // namespace dotsweep
