#include "format/zip_archive.hpp"
#include "core/error.hpp"

#include <cstring>
#include <format>

namespace docanon {

// ============================================================================
// ZipReader
// ============================================================================

ZipReader::ZipReader(std::string bytes)
    : storage_(std::move(bytes)) {
    std::memset(&archive_, 0, sizeof(archive_));
    if (!mz_zip_reader_init_mem(&archive_, storage_.data(), storage_.size(), 0)) {
        throw DocumentError(std::format("zip: {}",
            mz_zip_get_error_string(mz_zip_get_last_error(&archive_))));
    }

    const auto count = mz_zip_reader_get_num_files(&archive_);
    entries_.reserve(count);
    for (mz_uint i = 0; i < count; ++i) {
        mz_zip_archive_file_stat stat;
        if (!mz_zip_reader_file_stat(&archive_, i, &stat)) continue;
        entries_.emplace_back(stat.m_filename);
    }
}

ZipReader::~ZipReader() {
    mz_zip_reader_end(&archive_);
}

bool ZipReader::contains(const std::string& name) const {
    return mz_zip_reader_locate_file(&archive_, name.c_str(), nullptr, 0) >= 0;
}

std::optional<std::string> ZipReader::read(const std::string& name) const {
    const int index = mz_zip_reader_locate_file(&archive_, name.c_str(), nullptr, 0);
    if (index < 0) return std::nullopt;

    size_t size = 0;
    void* ptr = mz_zip_reader_extract_to_heap(&archive_, static_cast<mz_uint>(index), &size, 0);
    if (!ptr) return std::nullopt;

    std::string data(static_cast<const char*>(ptr), size);
    mz_free(ptr);
    return data;
}

// ============================================================================
// ZipWriter
// ============================================================================

ZipWriter::ZipWriter() {
    std::memset(&archive_, 0, sizeof(archive_));
    if (!mz_zip_writer_init_heap(&archive_, 0, 0)) {
        throw DocumentError("zip: could not initialize writer");
    }
    open_ = true;
}

ZipWriter::~ZipWriter() {
    if (open_) {
        mz_zip_writer_end(&archive_);
    }
}

void ZipWriter::add(const std::string& name, const std::string& data) {
    if (!mz_zip_writer_add_mem(&archive_, name.c_str(), data.data(), data.size(),
                               MZ_DEFAULT_COMPRESSION)) {
        throw DocumentError(std::format("zip: could not add '{}': {}", name,
            mz_zip_get_error_string(mz_zip_get_last_error(&archive_))));
    }
}

void ZipWriter::copy_from(const ZipReader& source, const std::string& name) {
    const int index = mz_zip_reader_locate_file(source.handle(), name.c_str(), nullptr, 0);
    if (index < 0 ||
        !mz_zip_writer_add_from_zip_reader(&archive_, source.handle(), static_cast<mz_uint>(index))) {
        throw DocumentError(std::format("zip: could not copy '{}'", name));
    }
}

std::string ZipWriter::finish() {
    void* buffer = nullptr;
    size_t size = 0;
    if (!mz_zip_writer_finalize_heap_archive(&archive_, &buffer, &size)) {
        throw DocumentError("zip: could not finalize archive");
    }
    std::string out(static_cast<const char*>(buffer), size);
    mz_free(buffer);
    mz_zip_writer_end(&archive_);
    open_ = false;
    return out;
}

} // namespace docanon
