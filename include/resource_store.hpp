#pragma once
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <vector>
#include "item.hpp"

namespace imitatus {

class ResourceStore {
public:
    virtual ~ResourceStore() = default;

    // Core interface methods. Lookups of an unknown id throw NotFoundError,
    // invalid fields throw ValidationError.
    virtual Item create(const ItemFields& fields) = 0;
    virtual Item get(std::uint64_t id) const = 0;
    virtual std::vector<Item> list() const = 0;
    virtual Item replace(std::uint64_t id, const ItemFields& fields) = 0;
    virtual Item patch(std::uint64_t id, const ItemFields& fields) = 0;
    virtual void remove(std::uint64_t id) = 0;
    virtual std::size_t size() const = 0;
};

// Volatile in-process store. A single reader/writer lock serializes
// mutations; ids come from a counter guarded by the same lock and are never
// reused.
class MemoryResourceStore : public ResourceStore {
public:
    MemoryResourceStore() = default;
    ~MemoryResourceStore() override = default;

    MemoryResourceStore(const MemoryResourceStore&) = delete;
    MemoryResourceStore& operator=(const MemoryResourceStore&) = delete;

    // ResourceStore interface implementation
    Item create(const ItemFields& fields) override;
    Item get(std::uint64_t id) const override;
    std::vector<Item> list() const override;
    Item replace(std::uint64_t id, const ItemFields& fields) override;
    Item patch(std::uint64_t id, const ItemFields& fields) override;
    void remove(std::uint64_t id) override;
    std::size_t size() const override;

    // Id that the next create() will assign
    std::uint64_t next_id() const;

private:
    Item& find_locked(std::uint64_t id);

    mutable std::shared_mutex mutex_;
    // Ids are assigned in increasing order, so key order is creation order.
    std::map<std::uint64_t, Item> items_;
    std::uint64_t next_id_ = 1;
};

} // namespace imitatus
