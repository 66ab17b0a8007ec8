#include "infrastructure/PathUtils.hpp"
#include <array>
#include <cstdio>
#include <random>

namespace dockbuild::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::ResolveDirectory(const fs::path& dir) {
    fs::path absolute = dir.is_absolute() ? dir : fs::current_path() / dir;
    fs::path normal = absolute.lexically_normal();
    // "a/b/" normalizes to "a/b/" with an empty filename; drop it so prefix checks compare components.
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

bool PathUtils::IsWithin(const fs::path& base, const fs::path& candidate) {
    fs::path normalBase = ResolveDirectory(base);
    fs::path absolute = candidate.is_absolute() ? candidate : fs::current_path() / candidate;
    fs::path normalCandidate = absolute.lexically_normal();

    auto baseIt = normalBase.begin();
    auto candIt = normalCandidate.begin();
    for (; baseIt != normalBase.end(); ++baseIt, ++candIt) {
        if (candIt == normalCandidate.end() || *baseIt != *candIt) {
            return false;
        }
    }
    // Equal to the base itself is not "inside".
    return candIt != normalCandidate.end() && !candIt->empty();
}

std::string PathUtils::RandomUuid() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> byteDist(0, 255);

    std::array<unsigned char, 16> bytes{};
    for (auto& b : bytes) {
        b = static_cast<unsigned char>(byteDist(engine));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80); // variant 1

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buf);
}

} // namespace dockbuild::infrastructure
