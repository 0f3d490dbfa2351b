#pragma once

#include <filesystem>
#include <string>

namespace uc::runtime {
struct RunContext;
}

namespace uc::placement {

/// Writes update files into the package's distribution mirror
/// (<staging_dir>/<update_name>/<home_dir>).
class Stager {
public:
    explicit Stager(const runtime::RunContext& ctx);

    /// Copies <update_root>/<sourceRel> to <home_root>/<destRel>, creating
    /// parent directories as needed. Throws CopyError.
    void stage(const std::string& sourceRel, const std::string& destRel) const;

    [[nodiscard]] std::filesystem::path destinationFor(const std::string& destRel) const;

private:
    const runtime::RunContext& ctx_;
};

}
