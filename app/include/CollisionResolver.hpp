#ifndef COLLISION_RESOLVER_HPP
#define COLLISION_RESOLVER_HPP

#include "Types.hpp"

#include <functional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

/**
 * @brief Read-only "does this file name already exist in the destination?" query.
 *        An empty function means nothing exists.
 */
using ExistingNamesProbe = std::function<bool(const std::string&)>;

/**
 * @brief Case-insensitive set of file names reserved during one batch.
 */
class UsedNameSet {
public:
    bool contains(const std::string& name) const;
    bool insert(const std::string& name);

    std::size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }

private:
    std::unordered_set<std::string> keys_;
};

class CollisionResolver {
public:
    static constexpr int kMaxAttempts = 10000;

    /**
     * @brief Return the first of "name.ext", "name (1).ext", "name (2).ext", ...
     *        that is neither reserved nor reported by the probe, and reserve it.
     * @throws ErrorCodes::AppException NAME_COLLISION_EXHAUSTED when the probe
     *         rejects kMaxAttempts candidates in a row.
     */
    static std::string resolve(const std::string& candidate,
                               UsedNameSet& used_names,
                               const ExistingNamesProbe& probe);

    /**
     * @brief Resolve one proposed name in place; a suffix lands on its stem.
     */
    static void resolve_proposed(ProposedName& name,
                                 UsedNameSet& used_names,
                                 const ExistingNamesProbe& probe);

    /**
     * @brief Resolve every name in order; earlier entries keep the plain name.
     */
    static void resolve_batch(std::vector<ProposedName>& names,
                              UsedNameSet& used_names,
                              const ExistingNamesProbe& probe);

    /**
     * @brief "Book.epub" -> {"Book", ".epub"}; ".hidden" and "README" have no extension.
     */
    static std::pair<std::string, std::string> split_extension(const std::string& file_name);

private:
    static bool is_taken(const std::string& name,
                         const UsedNameSet& used_names,
                         const ExistingNamesProbe& probe);
};

#endif
