#include "CollisionResolver.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <tuple>


bool UsedNameSet::contains(const std::string& name) const
{
    return keys_.contains(Utils::fold_case(name));
}


bool UsedNameSet::insert(const std::string& name)
{
    return keys_.insert(Utils::fold_case(name)).second;
}


std::string CollisionResolver::resolve(const std::string& candidate,
                                       UsedNameSet& used_names,
                                       const ExistingNamesProbe& probe)
{
    if (!is_taken(candidate, used_names, probe)) {
        used_names.insert(candidate);
        return candidate;
    }

    const auto [base, extension] = split_extension(candidate);
    for (int index = 1; index <= kMaxAttempts; ++index) {
        std::string attempt = fmt::format("{} ({}){}", base, index, extension);
        if (!is_taken(attempt, used_names, probe)) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->debug("Name '{}' is taken; using '{}'", candidate, attempt);
            }
            used_names.insert(attempt);
            return attempt;
        }
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->error("Gave up finding a free name for '{}' after {} attempts", candidate, kMaxAttempts);
    }
    THROW_APP_ERROR(ErrorCodes::Code::NAME_COLLISION_EXHAUSTED, "Candidate: " + candidate);
}


void CollisionResolver::resolve_proposed(ProposedName& name,
                                         UsedNameSet& used_names,
                                         const ExistingNamesProbe& probe)
{
    const std::string resolved = resolve(name.file_name(), used_names, probe);
    if (resolved.ends_with(name.extension)) {
        name.stem = resolved.substr(0, resolved.size() - name.extension.size());
    } else {
        // Multi-dot extensions (".tar.gz") get the suffix before the last dot
        std::tie(name.stem, name.extension) = split_extension(resolved);
    }
}


void CollisionResolver::resolve_batch(std::vector<ProposedName>& names,
                                      UsedNameSet& used_names,
                                      const ExistingNamesProbe& probe)
{
    for (auto& name : names) {
        resolve_proposed(name, used_names, probe);
    }
}


std::pair<std::string, std::string> CollisionResolver::split_extension(const std::string& file_name)
{
    const auto dot = file_name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == file_name.size()) {
        return {file_name, std::string()};
    }
    return {file_name.substr(0, dot), file_name.substr(dot)};
}


bool CollisionResolver::is_taken(const std::string& name,
                                 const UsedNameSet& used_names,
                                 const ExistingNamesProbe& probe)
{
    return used_names.contains(name) || (probe && probe(name));
}
