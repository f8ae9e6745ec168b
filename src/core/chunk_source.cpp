/**
 * @file chunk_source.cpp
 * @brief Implementation of ranged byte sources
 */

#include <kcenon/resumable_upload/core/chunk_source.h>

#include <system_error>

namespace kcenon::resumable_upload {

auto chunk_source::check_range(uint64_t start, uint64_t end) const -> result<void> {
    if (start >= end || end > length()) {
        return unexpected(error{error_code::invalid_chunk_range,
            "invalid range [" + std::to_string(start) + ", " + std::to_string(end) +
            ") for length " + std::to_string(length())});
    }
    return {};
}

// file_chunk_source implementation

file_chunk_source::file_chunk_source(std::filesystem::path path,
                                     std::ifstream stream,
                                     uint64_t length)
    : path_(std::move(path)), stream_(std::move(stream)), length_(length) {}

auto file_chunk_source::open(const std::filesystem::path& path)
    -> result<std::unique_ptr<file_chunk_source>> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return unexpected(error{error_code::file_not_found,
            "File does not exist: " + path.string()});
    }

    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return unexpected(error{error_code::file_unreadable,
            "Not a regular file: " + path.string()});
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::file_unreadable,
            "Cannot determine file size: " + ec.message()});
    }

    if (size == 0) {
        return unexpected(error{error_code::file_empty, "File is empty"});
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        return unexpected(error{error_code::file_unreadable,
            "Failed to open file: " + path.string()});
    }

    return std::unique_ptr<file_chunk_source>(
        new file_chunk_source(path, std::move(stream), static_cast<uint64_t>(size)));
}

auto file_chunk_source::read(uint64_t start, uint64_t end) -> result<chunk_bytes> {
    auto range_check = check_range(start, end);
    if (!range_check) {
        return unexpected(range_check.error());
    }

    std::lock_guard lock(mutex_);

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(start));
    if (!stream_.good()) {
        return unexpected(error{error_code::file_read_error,
            "Failed to seek to offset " + std::to_string(start)});
    }

    chunk_bytes data(static_cast<std::size_t>(end - start));
    stream_.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (static_cast<std::size_t>(stream_.gcount()) != data.size()) {
        return unexpected(error{error_code::file_read_error,
            "Short read: expected " + std::to_string(data.size()) + " bytes, got " +
            std::to_string(stream_.gcount())});
    }

    return data;
}

// memory_chunk_source implementation

memory_chunk_source::memory_chunk_source(chunk_bytes data, std::string label)
    : data_(std::move(data)), label_(std::move(label)) {}

auto memory_chunk_source::read(uint64_t start, uint64_t end) -> result<chunk_bytes> {
    auto range_check = check_range(start, end);
    if (!range_check) {
        return unexpected(range_check.error());
    }

    auto first = data_.begin() + static_cast<std::ptrdiff_t>(start);
    auto last = data_.begin() + static_cast<std::ptrdiff_t>(end);
    return chunk_bytes(first, last);
}

}  // namespace kcenon::resumable_upload
