#ifndef HQA_FILE_UTILS_HPP
#define HQA_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * Bounded reads, report writing and source discovery. All operations use
 * Result<T, Error> for error handling. Error contexts carry the file name
 * only, never the full path.
 */

#include "hqa/result.hpp"
#include "hqa/error.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <fstream>

namespace hqa::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads at most max_bytes bytes of a file.
     *
     * The caller checks the on-disk size first; this bound protects against
     * a file that grows between the check and the read.
     *
     * @param path Path to the file.
     * @param max_bytes Maximum number of bytes to read.
     * @return The bytes read or an error.
     */
    inline Result<std::string, Error> read_file_bounded(const fs::path& path, std::size_t max_bytes) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.filename().string())
            );
        }

        std::string content(max_bytes, '\0');
        file.read(content.data(), static_cast<std::streamsize>(max_bytes));

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.filename().string())
            );
        }

        content.resize(static_cast<std::size_t>(file.gcount()));
        return Result<std::string, Error>::success(std::move(content));
    }

    /**
     * Writes a string to a file, creating parent directories as needed.
     */
    inline Result<void, Error> write_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.filename().string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.filename().string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.filename().string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Recursively lists regular files under dir whose extension passes
     * accept, skipping any directory named in ignore_dirs.
     *
     * The result is sorted so that project runs are deterministic, and is
     * truncated to max_files entries.
     *
     * @param dir Directory to search.
     * @param ignore_dirs Directory names never descended into.
     * @param max_files Maximum number of paths returned.
     * @param accept Predicate over candidate file paths.
     * @return Sorted list of matching paths or an error.
     */
    template<typename Predicate>
    Result<std::vector<fs::path>, Error> list_source_files(
        const fs::path& dir,
        const std::vector<std::string>& ignore_dirs,
        const std::size_t max_files,
        Predicate&& accept
    ) {
        std::error_code ec;

        if (!fs::exists(dir, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::not_found("Directory not found", dir.filename().string())
            );
        }

        if (!fs::is_directory(dir, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::invalid_argument("Not a directory", dir.filename().string())
            );
        }

        std::vector<fs::path> result;
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::io_error("Failed to list directory", dir.filename().string())
            );
        }

        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            const auto& entry = *it;
            const std::string name = entry.path().filename().string();

            if (entry.is_directory(ec)) {
                if (std::ranges::find(ignore_dirs, name) != ignore_dirs.end()) {
                    it.disable_recursion_pending();
                }
                continue;
            }

            if (entry.is_regular_file(ec) && accept(entry.path())) {
                result.push_back(entry.path());
            }
        }

        if (ec) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::io_error("Failed to list directory", dir.filename().string())
            );
        }

        std::ranges::sort(result);
        if (result.size() > max_files) {
            result.resize(max_files);
        }

        return Result<std::vector<fs::path>, Error>::success(std::move(result));
    }

}  // namespace hqa::file_utils

#endif // HQA_FILE_UTILS_HPP
