#pragma once

#include "controlhub/plugin/plugin_manifest.hpp"
#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <filesystem>
#include <string>

namespace scoreboard::controlhub {

struct PluginPackage {
    PluginManifest manifest;
    PackageFiles files;  // includes plugin.json
};

/**
 * @brief Resolves a plugin identifier to a package. Retrieval from remote
 * indexes lives behind this interface.
 */
class PackageSource {
public:
    virtual ~PackageSource() = default;

    // PACKAGE_NOT_FOUND when the identifier is unknown.
    virtual Result<PluginPackage> fetch(const std::string& id) = 0;
};

// Packages unpacked under <root>/<id>/.
class DirectoryPackageSource : public PackageSource {
public:
    explicit DirectoryPackageSource(std::filesystem::path root);

    Result<PluginPackage> fetch(const std::string& id) override;

    // Reads a package from an arbitrary directory containing plugin.json.
    static Result<PluginPackage> load_directory(const std::filesystem::path& directory);

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

}  // namespace scoreboard::controlhub
