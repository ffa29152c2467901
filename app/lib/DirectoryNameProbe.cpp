#include "DirectoryNameProbe.hpp"
#include "AppException.hpp"
#include "Logger.hpp"

#include <filesystem>


DirectoryNameProbe::DirectoryNameProbe(const std::string& directory, const FileScanner& scanner)
{
    try {
        for (const auto& name : scanner.list_names(directory)) {
            existing_.insert(name);
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_SCAN_FAILED, ex.what());
    }
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Destination '{}' holds {} existing name(s)", directory, existing_.size());
    }
}


bool DirectoryNameProbe::exists(const std::string& file_name) const
{
    return existing_.contains(file_name);
}


ExistingNamesProbe DirectoryNameProbe::as_probe() const
{
    return [snapshot = existing_](const std::string& file_name) {
        return snapshot.contains(file_name);
    };
}
