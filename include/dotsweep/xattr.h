#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "dotsweep/config.h"
#include "dotsweep/platform.h"

namespace dotsweep {

// Probe/remove capability for one named extended attribute. Implementations
// are shared by every worker thread, so both calls must be safe to run
// concurrently. Failures of any kind report false.
class XattrBackend {
public:
    virtual ~XattrBackend() = default;

    virtual std::string_view name() const noexcept = 0;
    virtual bool probe(const std::filesystem::path& path, std::string_view attribute) const = 0;
    virtual bool remove(const std::filesystem::path& path, std::string_view attribute) const = 0;
};

// Drives an external attribute tool through /bin/sh. Each command template
// receives the quoted attribute name and path in place of {name} and {path}.
class ToolXattrBackend : public XattrBackend {
public:
    ToolXattrBackend(std::string name, std::string probe_command, std::string remove_command);

    std::string_view name() const noexcept override;
    bool probe(const std::filesystem::path& path, std::string_view attribute) const override;
    bool remove(const std::filesystem::path& path, std::string_view attribute) const override;

private:
    std::string expand(const std::string& command, const std::filesystem::path& path,
                       std::string_view attribute) const;

    std::string name_;
    std::string probe_command_;
    std::string remove_command_;
};

// `xattr -p` / `xattr -d`.
std::unique_ptr<XattrBackend> make_macos_backend();
// `getfattr` / `setfattr` from the attr package.
std::unique_ptr<XattrBackend> make_linux_backend();

class NullXattrBackend : public XattrBackend {
public:
    std::string_view name() const noexcept override { return "none"; }
    bool probe(const std::filesystem::path&, std::string_view) const override { return false; }
    bool remove(const std::filesystem::path&, std::string_view) const override { return false; }
};

std::shared_ptr<const XattrBackend> make_platform_backend(platform::OsFamily os);

bool remove_attribute(const XattrBackend& backend, const std::filesystem::path& path, std::string_view attribute,
                      bool dry_run, RemovalPolicy policy = RemovalPolicy::Confirm);

// Runs a shell command with its output discarded; true on exit status 0.
bool run_silent(const std::string& command);

} // namespace dotsweep
