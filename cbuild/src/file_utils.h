#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <vector>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <zlib.h>

#include "string_utils.h"

namespace fs = std::filesystem;

/**
 * File system utilities for recorded pages and table directories.
 */
namespace profile_export {
namespace file_utils {

/**
 * Read a whole file into memory. Files ending in ".gz" are inflated
 * through zlib; anything else is read as-is.
 */
inline std::string read_file(const fs::path& path) {
    const std::string p = path.string();

    if (!string_utils::ends_with(p, ".gz")) {
        std::ifstream file(p, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Failed to open file: " + p);
        }
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    gzFile gz = gzopen(p.c_str(), "rb");
    if (!gz) {
        throw std::runtime_error("Failed to open gzipped file: " + p);
    }

    std::string content;
    std::vector<char> buffer(256 * 1024);
    while (true) {
        int bytes_read = gzread(gz, buffer.data(), static_cast<unsigned>(buffer.size()));
        if (bytes_read < 0) {
            int errnum = 0;
            std::string message = gzerror(gz, &errnum);
            gzclose(gz);
            throw std::runtime_error("Failed to inflate " + p + ": " + message);
        }
        if (bytes_read == 0) {
            break;
        }
        content.append(buffer.data(), static_cast<size_t>(bytes_read));
    }
    gzclose(gz);
    return content;
}

/**
 * Write `content` to `path` through a temporary sibling and rename it
 * into place, so readers never observe a half-written file.
 */
inline void write_file_atomic(const fs::path& path, const std::string& content) {
    fs::path tmp = path;
    tmp += ".inprogress";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to open file for writing: " + tmp.string());
        }
        out << content;
        if (!out) {
            throw std::runtime_error("Failed to write file: " + tmp.string());
        }
    }
    fs::rename(tmp, path);
}

/**
 * Locate the recorded response for `page_index`: page-N.json or page-N.json.gz.
 */
inline std::optional<fs::path> find_page_file(const fs::path& dir, int page_index) {
    const std::string stem = "page-" + std::to_string(page_index) + ".json";
    for (const char* suffix : {"", ".gz"}) {
        fs::path candidate = dir / (stem + suffix);
        if (fs::is_regular_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

/**
 * Sorted list of regular files in `dir` whose name ends with `extension`.
 */
inline std::vector<fs::path> list_files(const fs::path& dir, const std::string& extension) {
    std::vector<fs::path> files;
    if (!fs::exists(dir)) {
        return files;
    }
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() &&
            string_utils::ends_with(entry.path().filename().string(), extension)) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

/**
 * Create a directory and all parent directories if they don't exist.
 * Similar to `mkdir -p`.
 */
inline void create_directories(const fs::path& path) {
    fs::create_directories(path);
}

/**
 * Remove a directory and all its contents.
 * Similar to `rm -rf`.
 */
inline void remove_directory(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    // Ignore errors - directory might not exist
}

} // namespace file_utils
} // namespace profile_export
