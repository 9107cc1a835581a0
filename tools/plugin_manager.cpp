#include "controlhub/config/config_schema.hpp"
#include "controlhub/plugin/plugin_manifest.hpp"
#include "controlhub/plugin/plugin_package.hpp"
#include "controlhub/utils/logging.hpp"
#include <iostream>
#include <filesystem>

using namespace scoreboard::controlhub;

namespace {

void print_manifest(const PluginManifest& manifest, size_t file_count) {
    std::cout << "  Name: " << manifest.id() << "\n";
    std::cout << "  Version: " << manifest.version().to_string() << "\n";
    std::cout << "  Entry point: " << manifest.entry_point() << "\n";
    if (!manifest.description().empty()) {
        std::cout << "  Description: " << manifest.description() << "\n";
    }
    std::cout << "  Files: " << file_count << "\n";
    for (const auto& dependency : manifest.dependencies()) {
        std::cout << "  Depends on: " << dependency.id << " >= " << dependency.minimum.to_string() << "\n";
    }
    for (const auto& rule : manifest.config_rules()) {
        std::cout << "  Config key: " << rule.key << " (" << value_type_to_string(rule.type) << ")";
        if (rule.default_value) {
            std::cout << " default " << rule.default_value->dump();
        }
        std::cout << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << "Scoreboard Control Hub - Plugin Tool\n";
    std::cout << "Version " << CONTROLHUB_VERSION << "\n\n";

    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <command> <package-dir>\n\n";
        std::cout << "Commands:\n";
        std::cout << "  info <package-dir>      Show the package manifest\n";
        std::cout << "  validate <package-dir>  Check the package can be installed\n\n";
        std::cout << "Examples:\n";
        std::cout << "  " << argv[0] << " info plugin_packages/holiday_countdown\n";
        std::cout << "  " << argv[0] << " validate ./my_board\n";
        return 1;
    }

    const std::string command = argv[1];
    const std::filesystem::path package_dir = argv[2];

    auto package = DirectoryPackageSource::load_directory(package_dir);
    if (!package) {
        std::cerr << "  " << package.error().to_string() << "\n";
        return 1;
    }
    const PluginManifest& manifest = package->manifest;

    if (command == "info") {
        std::cout << "Plugin information for: " << package_dir.string() << "\n";
        print_manifest(manifest, package->files.size());
        return 0;
    }

    if (command == "validate") {
        std::cout << "Validating plugin: " << package_dir.string() << "\n";
        bool valid = true;
        if (package->files.find(manifest.entry_point()) == package->files.end()) {
            std::cout << "  Entry point '" << manifest.entry_point() << "' is not in the package\n";
            valid = false;
        }
        const ConfigSchema base = ConfigSchema::scoreboard_defaults();
        for (const auto& rule : manifest.config_rules()) {
            if (base.has_rule(rule.key)) {
                std::cout << "  Config key '" << rule.key << "' collides with a built-in key\n";
                valid = false;
            }
        }
        std::cout << "  Result: " << (valid ? "Valid" : "Invalid") << "\n";
        return valid ? 0 : 1;
    }

    std::cout << "Unknown command. Run without arguments for usage information.\n";
    return 1;
}
