#ifndef REGISTER_CATALOG_H
#define REGISTER_CATALOG_H

#include "heat_pump_types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @class Catalog
 * @brief Immutable mapping from semantic key to register descriptor.
 *
 * Built once at start-up and shared read-only (through a
 * std::shared_ptr<const Catalog>) by the coordinator and its consumers.
 */
class Catalog {
public:
    using Entry = std::pair<std::string, RegisterDescriptor>;

    /**
     * @brief Builds and validates the catalog.
     * @param entries Key/descriptor pairs in any order.
     * @throw std::invalid_argument on duplicate keys, a word count that does not
     *        match the data type, a zero or non-finite scale, a non-finite offset
     *        or range bound, min > max, a switch wider than one register, or
     *        overlapping registers.
     */
    explicit Catalog(std::vector<Entry> entries);

    /**
     * @brief Gets the descriptor for a key.
     * @throw ModbusError with ErrorKind::UnknownKey if the key is absent.
     */
    const RegisterDescriptor& lookup(const std::string& key) const;

    /// @brief Non-throwing variant of lookup().
    std::optional<RegisterDescriptor> find(const std::string& key) const;

    bool contains(const std::string& key) const { return entries.count(key) != 0; }
    size_t size() const { return entries.size(); }

    /// @brief All entries, ordered by key.
    const std::map<std::string, RegisterDescriptor>& all() const { return entries; }

    /// @brief The built-in Heliotherm heat-pump register table.
    static std::shared_ptr<const Catalog> heliothermDefaults();

private:
    std::map<std::string, RegisterDescriptor> entries;
};

#endif // REGISTER_CATALOG_H
