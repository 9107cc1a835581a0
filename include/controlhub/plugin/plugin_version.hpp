#pragma once

#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <string>

namespace scoreboard::controlhub {

/**
 * @brief MAJOR[.MINOR[.PATCH]] version with an optional leading 'v'.
 */
struct PluginVersion {
    u32 major_version = 0;
    u32 minor_version = 0;
    u32 patch_version = 0;

    static Result<PluginVersion> parse(const std::string& text);

    std::string to_string() const;

    // Same major and not older than `minimum`.
    bool satisfies(const PluginVersion& minimum) const {
        return major_version == minimum.major_version && !(*this < minimum);
    }

    bool operator==(const PluginVersion& other) const {
        return major_version == other.major_version && minor_version == other.minor_version &&
               patch_version == other.patch_version;
    }
    bool operator!=(const PluginVersion& other) const { return !(*this == other); }
    bool operator<(const PluginVersion& other) const {
        if (major_version != other.major_version) return major_version < other.major_version;
        if (minor_version != other.minor_version) return minor_version < other.minor_version;
        return patch_version < other.patch_version;
    }
};

}  // namespace scoreboard::controlhub
