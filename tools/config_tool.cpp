#include "controlhub/config/config_document.hpp"
#include "controlhub/config/config_schema.hpp"
#include "controlhub/plugin/plugin_registry.hpp"
#include "controlhub/utils/file_io.hpp"
#include "controlhub/utils/logging.hpp"
#include <filesystem>
#include <iostream>

using namespace scoreboard::controlhub;

int main(int argc, char* argv[]) {
    std::cout << "Scoreboard Control Hub - Configuration Tool\n";
    std::cout << "Version " << CONTROLHUB_VERSION << "\n\n";

    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <config-file> [plugin-root]\n";
        std::cout << "  config-file: Path to a JSON configuration document\n";
        std::cout << "  plugin-root: Directory holding installed plugin trees (default: none)\n\n";
        std::cout << "Examples:\n";
        std::cout << "  " << argv[0] << " config/.controlhub/config.json plugins\n";
        std::cout << "  " << argv[0] << " config/config.json.sample\n";
        return 1;
    }

    const std::filesystem::path config_path = argv[1];
    const std::filesystem::path plugin_root = argc > 2 ? std::filesystem::path(argv[2]) : std::filesystem::path();

    std::cout << "Loading configuration from: " << config_path.string() << "\n";
    auto text = utils::read_file(config_path);
    if (!text) {
        std::cerr << "  " << text.error().to_string() << "\n";
        return 1;
    }
    auto document = ConfigDocument::parse(text.value());
    if (!document) {
        std::cerr << "  " << document.error().to_string() << "\n";
        return 1;
    }

    auto registry = PluginRegistry::from_document(document.value(), plugin_root);
    if (!registry) {
        std::cerr << "  " << registry.error().to_string() << "\n";
        return 1;
    }

    const ConfigSchema base = ConfigSchema::scoreboard_defaults();
    const ConfigSchema schema = registry->effective_schema(base);
    std::cout << "  Version: " << document->version() << "\n";
    std::cout << "  Plugins: " << registry->list().size() << " recorded\n";
    std::cout << "  Rules:   " << schema.rules().size() << " (" << base.rules().size() << " built in)\n";

    const auto errors = schema.validate_all(document.value());
    if (errors.empty()) {
        std::cout << "  Result: Valid\n";
        return 0;
    }

    std::cout << "  Result: Invalid (" << errors.size() << " problem(s))\n";
    for (const auto& error : errors) {
        std::cout << "    " << (error.field().empty() ? std::string("<document>") : error.field())
                  << ": " << error.message() << "\n";
    }
    return 1;
}
