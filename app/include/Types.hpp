#ifndef TYPES_HPP
#define TYPES_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class AuthorOrder {
    AsIs,
    FirstLast,
    LastFirst
};

inline std::string to_string(AuthorOrder order) {
    switch (order) {
        case AuthorOrder::AsIs: return "as-is";
        case AuthorOrder::FirstLast: return "firstlast";
        case AuthorOrder::LastFirst: return "lastfirst";
        default: return "unknown";
    }
}

/**
 * @brief Parses the author format names accepted in config files.
 * @return std::nullopt for anything outside the closed set.
 */
std::optional<AuthorOrder> author_order_from_string(std::string_view value);

enum class TitleCaseDomain {Title, Author};

/**
 * @brief Per-run switches for the filename pipeline. Immutable for a batch.
 */
struct NormalizationOptions {
    bool strip_diacritics{false};
    bool apply_title_case{true};
    AuthorOrder author_order{AuthorOrder::FirstLast};
};

/**
 * @brief Title and author strings as extracted from a document.
 */
struct RawMetadata {
    std::optional<std::string> title;
    std::vector<std::string> authors;
};

/**
 * @brief One planner input item.
 */
struct BookRecord {
    std::string source_id;
    std::string source_file_name;
    RawMetadata metadata;
};

struct ProposedName {
    std::string source_id;
    std::string stem;
    std::string extension;

    std::string file_name() const { return stem + extension; }
};

enum class FileType {File, Directory};

inline std::string to_string(FileType type) {
    switch (type) {
        case FileType::File: return "File";
        case FileType::Directory: return "Directory";
        default: return "Unknown";
    }
}

struct FileEntry {
    std::string full_path;
    std::string file_name;
    FileType type;
};

enum class FileScanOptions {
    None        = 0,
    Files       = 1 << 0,   // 0001
    Directories = 1 << 1,   // 0010
    HiddenFiles = 1 << 2    // 0100
};

inline bool has_flag(FileScanOptions value, FileScanOptions flag) {
    return (static_cast<int>(value) & static_cast<int>(flag)) != 0;
}

inline FileScanOptions operator|(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) | static_cast<int>(b));
}

inline FileScanOptions operator&(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) & static_cast<int>(b));
}

#endif
