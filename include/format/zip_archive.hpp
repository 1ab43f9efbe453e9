#pragma once

#include <optional>
#include <string>
#include <vector>

#include <miniz.h>

namespace docanon {

/**
 * @brief Read-only view of an in-memory ZIP package (DOCX, XLSX)
 *
 * Keeps its own copy of the bytes; miniz reads from that buffer.
 */
class ZipReader {
public:
    /**
     * @throws DocumentError if the bytes are not a ZIP archive
     */
    explicit ZipReader(std::string bytes);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * @brief Entry names in archive order
     */
    [[nodiscard]] const std::vector<std::string>& entries() const { return entries_; }

    [[nodiscard]] bool contains(const std::string& name) const;

    /**
     * @return decompressed entry, or nullopt if absent or unreadable
     */
    [[nodiscard]] std::optional<std::string> read(const std::string& name) const;

    [[nodiscard]] mz_zip_archive* handle() const { return &archive_; }

private:
    std::string storage_;
    mutable mz_zip_archive archive_;
    std::vector<std::string> entries_;
};

/**
 * @brief Builds a new ZIP package in memory
 */
class ZipWriter {
public:
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * @throws DocumentError on write failure
     */
    void add(const std::string& name, const std::string& data);

    /**
     * @brief Copy an entry from `source` without recompressing it
     * @throws DocumentError on failure
     */
    void copy_from(const ZipReader& source, const std::string& name);

    /**
     * @brief Finalize and return the archive bytes (the writer is closed afterwards)
     * @throws DocumentError on failure
     */
    [[nodiscard]] std::string finish();

private:
    mz_zip_archive archive_;
    bool open_ = false;
};

} // namespace docanon
