#ifndef LIBAPK_RESOLVER_H
#define LIBAPK_RESOLVER_H

#include <cstdint>
#include <string>

#include "arsc.hpp"

/**
 * @file resolver.hpp
 * @brief Picks the value of a resource that best fits a requested
 *        configuration, following references.
 */
namespace libapk {

/**
 * @struct ResolvedValue
 * @brief The value a resource id finally resolved to.
 */
struct ResolvedValue {
    uint32_t id = 0;  ///< id of the entry holding the final value
    const ConfigValue* source = nullptr;  ///< owned by the table
    TypedValue value;
    std::string text;  ///< string value, or the formatted typed value
    int hops = 0;      ///< references followed
};

/**
 * @class ResourceResolver
 * @brief Best-match selection over a ResourceTable.
 *
 * Candidates are the entries whose configuration matches() the request.
 * Among those, density is ranked first:
 * - concrete densities at or above the requested one, nearest first;
 * - then concrete densities below it, nearest first;
 * - then unqualified and nodpi entries;
 * - anydpi entries last.
 *
 * A request density of 0 is treated as mdpi (160). Remaining ties go to the
 * more specific configuration, then to the greater configuration in
 * Configuration::compare order (so v26 beats v21), then to the greater
 * value, and only then to the first declared entry.
 *
 * The resolver borrows the table; the table must outlive it.
 */
class ResourceResolver {
   public:
    static constexpr int kMaxReferenceDepth = 10;

    explicit ResourceResolver(const ResourceTable& table) : mTable(table) {}

    /**
     * @brief Best entry for @p id without following references.
     * @return nullptr if nothing is recorded for @p id or nothing matches
     */
    const ConfigValue* bestMatch(uint32_t id, const Configuration& request) const;

    /**
     * @brief Resolve @p id, following references.
     *
     * @throws ResourceNotFoundError if an id in the chain has no matching
     *         entry, is a null reference, or names a theme attribute
     * @throws ResourceCycleError if more than kMaxReferenceDepth references
     *         are followed
     */
    ResolvedValue resolve(uint32_t id, const Configuration& request) const;

    /**
     * @brief Resolve @p id to text.
     * @throws Same as resolve()
     */
    std::string resolveString(uint32_t id, const Configuration& request) const;

   private:
    const ResourceTable& mTable;
};

/// Shorthand for ResourceResolver(table).resolve(id, request).
ResolvedValue resolve(const ResourceTable& table, uint32_t id, const Configuration& request);

}  // namespace libapk

#endif  // LIBAPK_RESOLVER_H
