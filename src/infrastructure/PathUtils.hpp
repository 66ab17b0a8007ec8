// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace dockbuild::infrastructure {

class PathUtils {
public:
    /** @brief Absolute, normalized form of a possibly relative directory. */
    static std::filesystem::path ResolveDirectory(const std::filesystem::path& dir);

    /** @brief True when candidate resolves to a path strictly inside base. */
    static bool IsWithin(const std::filesystem::path& base, const std::filesystem::path& candidate);

    /** @brief Random RFC 4122 version 4 UUID string, used for temp file names. */
    static std::string RandomUuid();
};

} // namespace dockbuild::infrastructure
