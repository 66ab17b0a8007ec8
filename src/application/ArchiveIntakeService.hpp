/**
 * @file ArchiveIntakeService.hpp
 * @brief Validates uploaded archives, stages them on disk and runs the build.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "application/BuildService.hpp"

namespace dockbuild::application {

/**
 * @struct UploadRequest
 * @brief A received upload, independent of the transport that delivered it.
 */
struct UploadRequest {
    std::string originalFilename;
    std::string content;      ///< Raw archive bytes.
    std::string projectType;  ///< As declared by the client.
};

/**
 * @struct IntakeResponse
 * @brief HTTP-style status code plus plain-text body.
 */
struct IntakeResponse {
    int status = 200;
    std::string body;
};

/**
 * @class ArchiveIntakeService
 * @brief Front door of the build engine.
 *
 * Writes each accepted upload to a uniquely named file confined to the
 * temp directory, builds it, and removes the file again whatever the
 * build outcome.
 */
class ArchiveIntakeService {
public:
    ArchiveIntakeService(std::shared_ptr<BuildService> buildService, const std::filesystem::path& tempDir);

    IntakeResponse handleUpload(const UploadRequest& request);

    /** @brief Absolute, normalized staging directory. */
    const std::filesystem::path& tempDir() const { return m_tempDir; }

private:
    /** @brief Returns an error response when the request must be rejected. */
    std::optional<IntakeResponse> validate(const UploadRequest& request) const;

    std::filesystem::path resolveTempFile(const std::string& filename) const;
    void writeTempFile(const std::filesystem::path& path, const std::string& content) const;
    void deleteTempFile(const std::filesystem::path& path) const;

    std::shared_ptr<BuildService> m_buildService;
    std::filesystem::path m_tempDir;
};

} // namespace dockbuild::application
