#include "controlhub/plugin/plugin_version.hpp"

#include <cctype>
#include <limits>

namespace scoreboard::controlhub {

Result<PluginVersion> PluginVersion::parse(const std::string& text) {
    auto bad = [&text](const std::string& reason) {
        return unexpected(MAKE_ERROR(INVALID_PARAMETER, "Invalid version '" + text + "': " + reason));
    };

    size_t pos = 0;
    if (!text.empty() && (text[0] == 'v' || text[0] == 'V')) {
        pos = 1;
    }
    if (pos >= text.size()) {
        return bad("empty");
    }

    u32 parts[3] = {0, 0, 0};
    int count = 0;
    while (true) {
        if (count == 3) {
            return bad("more than three components");
        }
        if (pos >= text.size() || !std::isdigit(static_cast<unsigned char>(text[pos]))) {
            return bad("expected a number");
        }
        u64 value = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            value = value * 10 + static_cast<u64>(text[pos] - '0');
            if (value > std::numeric_limits<u32>::max()) {
                return bad("component too large");
            }
            ++pos;
        }
        parts[count++] = static_cast<u32>(value);

        if (pos == text.size()) {
            break;
        }
        if (text[pos] != '.') {
            return bad("unexpected character");
        }
        ++pos;
    }

    PluginVersion version;
    version.major_version = parts[0];
    version.minor_version = parts[1];
    version.patch_version = parts[2];
    return version;
}

std::string PluginVersion::to_string() const {
    return std::to_string(major_version) + "." + std::to_string(minor_version) + "." +
           std::to_string(patch_version);
}

}  // namespace scoreboard::controlhub
