#include "infrastructure/TarArchive.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <chrono>
#include <memory>

namespace dockbuild::infrastructure {

namespace {

la_ssize_t AppendToString(struct archive*, void* clientData, const void* buffer, size_t length) {
    auto* out = static_cast<std::string*>(clientData);
    out->append(static_cast<const char*>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

struct EntryDeleter {
    void operator()(archive_entry* entry) const { archive_entry_free(entry); }
};

std::string ErrorText(archive* source) {
    const char* text = source ? archive_error_string(source) : nullptr;
    return text ? text : "unknown libarchive error";
}

} // namespace

ArchiveError::ArchiveError(const std::string& operation, archive* source)
    : std::runtime_error("Failed to " + operation + ": " + ErrorText(source)) {}

TarArchive::TarArchive()
    : m_archive(archive_write_new()) {
    if (!m_archive) {
        throw ArchiveError("allocate archive writer", nullptr);
    }
    try {
        check(archive_write_set_format_pax_restricted(m_archive), "select tar format");
        // No padding beyond the end-of-archive blocks.
        check(archive_write_set_bytes_in_last_block(m_archive, 1), "set last block size");
        check(archive_write_open(m_archive, &m_data, nullptr, AppendToString, nullptr), "open archive writer");
    } catch (...) {
        archive_write_free(m_archive);
        throw;
    }
}

TarArchive::~TarArchive() {
    archive_write_free(m_archive);
}

void TarArchive::addDirectory(const std::string& name, unsigned int mode) {
    std::string dirName = name;
    if (dirName.empty() || dirName.back() != '/') {
        dirName += '/';
    }
    writeEntry(dirName, AE_IFDIR, mode, std::string());
}

void TarArchive::addFile(const std::string& name, const std::string& content, unsigned int mode) {
    writeEntry(name, AE_IFREG, mode, content);
}

std::string TarArchive::finish() {
    if (!m_finished) {
        check(archive_write_close(m_archive), "close archive");
        m_finished = true;
    }
    return m_data;
}

void TarArchive::writeEntry(const std::string& name, unsigned int fileType, unsigned int mode, const std::string& content) {
    if (m_finished) {
        throw std::logic_error("Cannot add " + name + " to a finished archive");
    }
    if (name.empty() || name == "/") {
        throw std::invalid_argument("Tar entry name must not be empty");
    }

    std::unique_ptr<archive_entry, EntryDeleter> entry(archive_entry_new());
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_filetype(entry.get(), fileType);
    archive_entry_set_perm(entry.get(), mode & 07777);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(content.size()));
    archive_entry_set_mtime(entry.get(), static_cast<time_t>(now), 0);
    archive_entry_set_uid(entry.get(), 0);
    archive_entry_set_gid(entry.get(), 0);
    archive_entry_set_uname(entry.get(), "root");
    archive_entry_set_gname(entry.get(), "root");

    check(archive_write_header(m_archive, entry.get()), "write header for " + name);
    if (!content.empty()) {
        la_ssize_t written = archive_write_data(m_archive, content.data(), content.size());
        if (written < 0 || static_cast<std::size_t>(written) != content.size()) {
            throw ArchiveError("write data for " + name, m_archive);
        }
    }
}

void TarArchive::check(int status, const std::string& operation) {
    if (status != ARCHIVE_OK) {
        throw ArchiveError(operation, m_archive);
    }
}

} // namespace dockbuild::infrastructure
