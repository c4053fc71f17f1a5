#include "fs.h"
#include "logger.h"
#include <cstdio>
#include <cstring>
#include <vector>
#include <sys/stat.h>

#ifdef _WIN32
    #include <io.h>
    #define stat _stat
    #define access _access
    #define F_OK 0
    #define fseeko _fseeki64
#else
    #include <unistd.h>
    #include <errno.h>
#endif

#define LOG_FS_DEBUG(message) LOG_DEBUG("fs", message)
#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace filepunch {

bool file_exists(const std::string& path) {
    if (path.empty()) return false;
    return access(path.c_str(), F_OK) == 0;
}

int64_t get_file_size(const std::string& path) {
    struct stat st;
    if (path.empty() || stat(path.c_str(), &st) != 0) {
        return -1;
    }
    return static_cast<int64_t>(st.st_size);
}

bool read_file_text(const std::string& path, std::string& content) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        LOG_FS_DEBUG("Cannot open " << path);
        return false;
    }

    content.clear();
    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        content.append(buffer, n);
    }

    bool ok = ferror(file) == 0;
    fclose(file);
    if (!ok) {
        LOG_FS_ERROR("Failed to read " << path);
    }
    return ok;
}

bool create_file(const std::string& path, const std::string& content) {
    if (path.empty()) return false;

    const std::string temp_path = path + ".tmp";
    FILE* file = fopen(temp_path.c_str(), "wb");
    if (!file) {
        LOG_FS_ERROR("Failed to create file: " << temp_path);
        return false;
    }

    size_t written = fwrite(content.data(), 1, content.size(), file);
    bool ok = written == content.size() && fflush(file) == 0;
    fclose(file);

    if (!ok) {
        LOG_FS_ERROR("Failed to write complete content to file: " << temp_path);
        remove(temp_path.c_str());
        return false;
    }

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        LOG_FS_ERROR("Failed to move " << temp_path << " to " << path);
        remove(temp_path.c_str());
        return false;
    }

    return true;
}

bool delete_file(const std::string& path) {
    if (path.empty()) return false;
    return remove(path.c_str()) == 0;
}

bool read_file_in_chunks(const std::string& path, size_t chunk_size,
                         const std::function<bool(const uint8_t*, size_t)>& callback) {
    if (chunk_size == 0) return false;

    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        LOG_FS_ERROR("Cannot open " << path);
        return false;
    }

    std::vector<uint8_t> buffer(chunk_size);
    bool ok = true;
    size_t n = 0;
    while ((n = fread(buffer.data(), 1, buffer.size(), file)) > 0) {
        if (!callback(buffer.data(), n)) {
            ok = false;
            break;
        }
    }

    if (ferror(file) != 0) {
        LOG_FS_ERROR("Read error on " << path);
        ok = false;
    }

    fclose(file);
    return ok;
}

bool read_file_chunk(const std::string& path, uint64_t offset, void* buffer, size_t size) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        LOG_FS_ERROR("Cannot open " << path);
        return false;
    }

    bool ok = fseeko(file, offset, SEEK_SET) == 0 &&
              fread(buffer, 1, size, file) == size;
    if (!ok) {
        LOG_FS_ERROR("Short read of " << size << " bytes at " << offset << " in " << path);
    }

    fclose(file);
    return ok;
}

bool write_file_chunk(const std::string& path, uint64_t offset, const void* data, size_t size) {
    FILE* file = fopen(path.c_str(), "r+b");
    if (!file) {
        file = fopen(path.c_str(), "w+b");
    }
    if (!file) {
        LOG_FS_ERROR("Cannot open " << path << " for writing");
        return false;
    }

    bool ok = fseeko(file, offset, SEEK_SET) == 0 &&
              fwrite(data, 1, size, file) == size;
    if (!ok) {
        LOG_FS_ERROR("Short write of " << size << " bytes at " << offset << " in " << path);
    }

    if (fclose(file) != 0) {
        ok = false;
    }
    return ok;
}

} // namespace filepunch
