#ifndef FILE_SCANNER_HPP
#define FILE_SCANNER_HPP

#include <filesystem>
#include <string>
#include <vector>
#include <optional>
#include "Types.hpp"

namespace fs = std::filesystem;

/**
 * @brief Lists the top-level entries of a directory.
 */
class FileScanner {
public:
    FileScanner() = default;

    std::vector<FileEntry>
        get_directory_entries(const std::string &directory_path,
                              FileScanOptions options) const;

    /**
     * @brief Every entry name in the directory (files, folders, hidden entries).
     *        Returns an empty list when the directory does not exist.
     */
    std::vector<std::string> list_names(const std::string& directory_path) const;

private:
    struct ScanContext;
    std::optional<FileEntry> build_entry(const fs::directory_entry& entry,
                                         const ScanContext& context) const;
    std::optional<FileType> classify_entry(const fs::directory_entry& entry,
                                           const ScanContext& context) const;
    bool is_file_hidden(const fs::path &path) const;
};

#endif
