#include "controlhub/plugin/plugin_package.hpp"
#include "controlhub/utils/file_io.hpp"
#include "controlhub/utils/logging.hpp"

namespace scoreboard::controlhub {

namespace fs = std::filesystem;

DECLARE_LOGGER("PackageSource");

DirectoryPackageSource::DirectoryPackageSource(fs::path root) : root_(std::move(root)) {}

Result<PluginPackage> DirectoryPackageSource::fetch(const std::string& id) {
    if (!PluginManifest::is_valid_id(id)) {
        return unexpected(MAKE_ERROR(PACKAGE_NOT_FOUND, "'" + id + "' is not a valid plugin identifier"));
    }

    const fs::path directory = root_ / id;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return unexpected(MAKE_ERROR(PACKAGE_NOT_FOUND, "No package for '" + id + "' in " + root_.string()));
    }

    PluginPackage package;
    ASSIGN_OR_RETURN(package, load_directory(directory));
    if (package.manifest.id() != id) {
        return unexpected(Error(ErrorCode::PLUGIN_BAD_MANIFEST,
            "Package directory '" + id + "' declares id '" + package.manifest.id() + "'").with_field("id"));
    }
    return package;
}

Result<PluginPackage> DirectoryPackageSource::load_directory(const fs::path& directory) {
    const fs::path manifest_path = directory / PluginManifest::kFileName;

    auto text = utils::read_file(manifest_path);
    if (!text) {
        if (text.error().code() == ErrorCode::CONFIG_FILE_NOT_FOUND) {
            return unexpected(MAKE_ERROR(PACKAGE_NOT_FOUND, "No plugin.json in " + directory.string()));
        }
        return unexpected(std::move(text).error());
    }

    PluginPackage package;
    ASSIGN_OR_RETURN(package.manifest, PluginManifest::parse(*text));

    std::error_code ec;
    fs::recursive_directory_iterator it(directory, ec), end;
    if (ec) {
        return unexpected(MAKE_ERROR(IO_READ_FAILED, "Cannot list " + directory.string() + ": " + ec.message()));
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return unexpected(MAKE_ERROR(IO_READ_FAILED,
                "Cannot list " + directory.string() + ": " + ec.message()));
        }
        if (it->is_symlink(ec)) {
            COMPONENT_LOG_WARN("Skipping symlink {} in package {}", it->path().string(), package.manifest.id());
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        const std::string relative = it->path().lexically_relative(directory).generic_string();
        std::string contents;
        ASSIGN_OR_RETURN(contents, utils::read_file(it->path()));
        package.files.emplace(relative, std::move(contents));
    }

    COMPONENT_LOG_DEBUG("Loaded package {} {} with {} files from {}", package.manifest.id(),
                        package.manifest.version().to_string(), package.files.size(), directory.string());
    return package;
}

}  // namespace scoreboard::controlhub
