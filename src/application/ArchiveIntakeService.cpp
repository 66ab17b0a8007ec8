/**
 * @file ArchiveIntakeService.cpp
 * @brief Implementation of ArchiveIntakeService.
 */

#include "application/ArchiveIntakeService.hpp"
#include "domain/ProjectType.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace dockbuild::application {

namespace {

/** @brief Failure to stage the upload on disk. */
class StagingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool IsBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

bool HasZipExtension(const std::string& filename) {
    const std::string suffix = ".ZIP";
    std::string upper = ToUpper(filename);
    return upper.size() >= suffix.size() &&
           upper.compare(upper.size() - suffix.size(), suffix.size(), suffix) == 0;
}

IntakeResponse BadRequest(const std::string& body) {
    return IntakeResponse{400, body};
}

} // namespace

ArchiveIntakeService::ArchiveIntakeService(std::shared_ptr<BuildService> buildService, const fs::path& tempDir)
    : m_buildService(std::move(buildService)),
      m_tempDir(infrastructure::PathUtils::ResolveDirectory(tempDir)) {
    if (!m_buildService) {
        throw std::invalid_argument("ArchiveIntakeService requires a build service");
    }
    std::error_code ec;
    fs::create_directories(m_tempDir, ec);
    if (ec) {
        std::cerr << "[ArchiveIntake] Could not create temp build directory: " << m_tempDir
                  << " (" << ec.message() << ")" << std::endl;
    } else {
        std::cout << "[ArchiveIntake] Temporary build directory ensured at: " << m_tempDir << std::endl;
    }
}

std::optional<IntakeResponse> ArchiveIntakeService::validate(const UploadRequest& request) const {
    if (request.content.empty()) {
        return BadRequest("Error: File cannot be empty");
    }
    if (IsBlank(request.projectType)) {
        return BadRequest("Error: Project type must be specified");
    }
    if (!domain::ParseProjectType(request.projectType)) {
        return BadRequest("Error: Invalid project type. Allowed: [" + domain::AllowedProjectTypesList() + "]");
    }
    if (!HasZipExtension(request.originalFilename)) {
        return BadRequest("Error: Only .zip files are allowed (Original Filename: " + request.originalFilename + ")");
    }
    return std::nullopt;
}

IntakeResponse ArchiveIntakeService::handleUpload(const UploadRequest& request) {
    std::cout << "[ArchiveIntake] Received synchronous build request for type: " << request.projectType << std::endl;

    if (auto rejection = validate(request)) {
        std::cerr << "[ArchiveIntake] Rejected upload: " << rejection->body << std::endl;
        return *rejection;
    }

    auto projectType = domain::ParseProjectType(request.projectType);
    const std::string canonicalType = domain::ProjectTypeToString(*projectType);

    fs::path tempFile;
    IntakeResponse response;
    try {
        tempFile = resolveTempFile(infrastructure::PathUtils::RandomUuid() + ".zip");

        std::cout << "[ArchiveIntake] Saving temp file to: " << tempFile << std::endl;
        writeTempFile(tempFile, request.content);

        std::string buildResult = m_buildService->executeBuild(tempFile.string(), canonicalType);
        std::cout << "[ArchiveIntake] Synchronous build completed." << std::endl;
        response = IntakeResponse{200, buildResult};
    } catch (const StagingError& e) {
        std::cerr << "[ArchiveIntake] Failed to store or process uploaded file: " << e.what() << std::endl;
        response = IntakeResponse{500, std::string("Error saving/processing file: ") + e.what()};
    } catch (const std::exception& e) {
        std::cerr << "[ArchiveIntake] Unexpected error during synchronous build: " << e.what() << std::endl;
        response = IntakeResponse{500, std::string("Unexpected build error: ") + e.what()};
    }

    if (!tempFile.empty()) {
        deleteTempFile(tempFile);
    }
    return response;
}

fs::path ArchiveIntakeService::resolveTempFile(const std::string& filename) const {
    fs::path candidate = (m_tempDir / filename).lexically_normal();
    if (!infrastructure::PathUtils::IsWithin(m_tempDir, candidate)) {
        std::cerr << "[ArchiveIntake] Path traversal attempt detected! Base Dir: " << m_tempDir
                  << " Target File: " << candidate << std::endl;
        throw StagingError("Potential path traversal attempt");
    }
    return candidate;
}

void ArchiveIntakeService::writeTempFile(const fs::path& path, const std::string& content) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw StagingError("Could not open " + path.string() + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw StagingError("Could not write " + path.string());
    }
}

void ArchiveIntakeService::deleteTempFile(const fs::path& path) const {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[ArchiveIntake] Could not delete temporary file: " << path << " (" << ec.message() << ")" << std::endl;
    } else {
        std::cout << "[ArchiveIntake] Deleted temp file: " << path << std::endl;
    }
}

} // namespace dockbuild::application
