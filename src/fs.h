#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <functional>

namespace filepunch {

// File existence and size
bool file_exists(const std::string& path);
int64_t get_file_size(const std::string& path);

/**
 * Read a whole text file
 * @param path File path
 * @param content Output content
 * @return false if the file cannot be opened or read
 */
bool read_file_text(const std::string& path, std::string& content);

/**
 * Write a text file through a temporary file and rename, so readers never
 * observe a partially written file
 */
bool create_file(const std::string& path, const std::string& content);

bool delete_file(const std::string& path);

/**
 * Feed a file to a callback in chunks of at most chunk_size bytes.
 * The callback returns false to stop early.
 * @return false if the file cannot be read or the callback stopped
 */
bool read_file_in_chunks(const std::string& path, size_t chunk_size,
                         const std::function<bool(const uint8_t*, size_t)>& callback);

// Random access, used by the range transfer loop
bool read_file_chunk(const std::string& path, uint64_t offset, void* buffer, size_t size);

/**
 * Write at an offset, creating the file if it does not exist yet
 */
bool write_file_chunk(const std::string& path, uint64_t offset, const void* data, size_t size);

} // namespace filepunch
