#include "placement/Stager.hpp"
#include "runtime/RunContext.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>
#include <system_error>

using namespace uc::logging;
namespace fs = std::filesystem;

namespace uc::placement {

Stager::Stager(const runtime::RunContext& ctx) : ctx_(ctx) {}

fs::path Stager::destinationFor(const std::string& destRel) const {
    return ctx_.home_root / fs::path(destRel);
}

void Stager::stage(const std::string& sourceRel, const std::string& destRel) const {
    const auto source = ctx_.update_root / fs::path(sourceRel);
    const auto destination = destinationFor(destRel);

    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (ec) throw CopyError(fmt::format("Failed to create '{}': {}", destination.parent_path().string(), ec.message()));

    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) throw CopyError(fmt::format("Failed to copy '{}' to '{}': {}", source.string(), destination.string(), ec.message()));

    LogRegistry::placement()->debug("[Stager] {} -> {}", source.string(), destination.string());
}

}
