#ifndef DIRECTORY_NAME_PROBE_HPP
#define DIRECTORY_NAME_PROBE_HPP

#include "CollisionResolver.hpp"
#include "FileScanner.hpp"

#include <string>

/**
 * @brief Existence probe backed by a snapshot of a destination directory.
 *
 * The directory is listed once on construction; lookups are case-insensitive.
 * A destination that does not exist yet contains nothing.
 */
class DirectoryNameProbe {
public:
    explicit DirectoryNameProbe(const std::string& directory,
                                const FileScanner& scanner = FileScanner());

    bool exists(const std::string& file_name) const;
    std::size_t size() const { return existing_.size(); }

    ExistingNamesProbe as_probe() const;

private:
    UsedNameSet existing_;
};

#endif
