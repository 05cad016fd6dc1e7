#include "pytestify/io/file_system.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace pytestify {

namespace fs = std::filesystem;

auto FileSystem::read_file(const std::string& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return content.str();
}

auto FileSystem::write_file_atomic(const std::string& path, const std::string& content) -> bool {
    // Write to temporary file first for atomic operation
    std::string temp_path = path + ".pytestify.tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }
        file << content;
        file.flush();
        if (file.fail()) {
            file.close();
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            return false;
        }
    } // File automatically closed here

    // Atomically replace original file
    std::error_code error;
    fs::rename(temp_path, path, error);
    if (error) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return false;
    }
    return true;
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code error;
    return fs::exists(path, error);
}

auto FileSystem::is_directory(const std::string& path) -> bool {
    std::error_code error;
    return fs::is_directory(path, error);
}

auto FileSystem::list_files(const std::string& directory) -> std::vector<std::string> {
    std::vector<std::string> files;
    std::error_code error;
    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied,
                                        error);
    for (fs::recursive_directory_iterator end; !error && it != end; it.increment(error)) {
        if (it->is_regular_file(error)) {
            files.push_back(it->path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

auto FileSystem::create_backup(const std::string& path, const std::string& backup_dir)
    -> std::optional<std::string> {
    auto target = backup_path_for(path, backup_dir);
    std::error_code error;
    fs::create_directories(fs::path(target).parent_path(), error);
    if (error) {
        return std::nullopt;
    }
    fs::copy_file(path, target, fs::copy_options::overwrite_existing, error);
    if (error) {
        return std::nullopt;
    }
    return target;
}

auto backup_path_for(const std::string& path, const std::string& backup_dir) -> std::string {
    // ".." components would escape the backup directory
    fs::path target(backup_dir);
    for (const auto& part : fs::path(path).lexically_normal().relative_path()) {
        if (part != ".." && part != ".") {
            target /= part;
        }
    }
    return target.string();
}

auto restore_backup(IFileSystem& file_system, const std::string& path,
                    const std::string& backup_dir) -> bool {
    auto content = file_system.read_file(backup_path_for(path, backup_dir));
    if (!content) {
        return false;
    }
    return file_system.write_file_atomic(path, *content);
}

} // namespace pytestify
