/**
 * @file TarArchive.hpp
 * @brief In-memory tar writer (libarchive) used to upload files into containers.
 */

#pragma once

#include <stdexcept>
#include <string>

struct archive;

namespace dockbuild::infrastructure {

/**
 * @class ArchiveError
 * @brief A libarchive call failed; carries libarchive's own error string.
 */
class ArchiveError : public std::runtime_error {
public:
    ArchiveError(const std::string& operation, archive* source);
};

/**
 * @class TarArchive
 * @brief Owns a libarchive writer that accumulates entries into a string.
 *
 * Entry names are relative ("app/", "app/code.zip"). Entries may not be
 * added after finish().
 */
class TarArchive {
public:
    TarArchive();
    ~TarArchive();

    TarArchive(const TarArchive&) = delete;
    TarArchive& operator=(const TarArchive&) = delete;

    void addDirectory(const std::string& name, unsigned int mode = 0755);
    void addFile(const std::string& name, const std::string& content, unsigned int mode = 0644);

    /** @brief Closes the writer and returns the complete archive bytes. */
    std::string finish();

private:
    void writeEntry(const std::string& name, unsigned int fileType, unsigned int mode, const std::string& content);
    void check(int status, const std::string& operation);

    archive* m_archive;
    std::string m_data;
    bool m_finished = false;
};

} // namespace dockbuild::infrastructure
