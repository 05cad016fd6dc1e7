#pragma once

#include "pytestify/interfaces.hpp"
#include <string>
#include <vector>

namespace pytestify {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> std::optional<std::string> override;
    auto write_file_atomic(const std::string& path, const std::string& content) -> bool override;
    auto file_exists(const std::string& path) -> bool override;
    auto is_directory(const std::string& path) -> bool override;
    auto list_files(const std::string& directory) -> std::vector<std::string> override;
    auto create_backup(const std::string& path, const std::string& backup_dir)
        -> std::optional<std::string> override;
};

// Where create_backup puts the copy of path: the relative layout is kept and
// absolute paths are re-rooted under backup_dir
auto backup_path_for(const std::string& path, const std::string& backup_dir) -> std::string;

// Copies the backup of path back over path
auto restore_backup(IFileSystem& file_system, const std::string& path,
                    const std::string& backup_dir) -> bool;

} // namespace pytestify
