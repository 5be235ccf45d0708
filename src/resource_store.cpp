#include "resource_store.hpp"
#include "api_error.hpp"
#include "logging.hpp"
#include <mutex>

namespace imitatus {

Item& MemoryResourceStore::find_locked(std::uint64_t id) {
    auto it = items_.find(id);
    if (it == items_.end()) {
        throw NotFoundError("Item not found");
    }
    return it->second;
}

Item MemoryResourceStore::create(const ItemFields& fields) {
    fields.validate(FieldMode::Full);

    auto now = std::chrono::system_clock::now();
    Item item;
    item.name = *fields.name;
    item.description = fields.description;
    item.price = *fields.price;
    item.metadata = fields.metadata;
    item.created_at = now;
    item.updated_at = now;

    std::unique_lock lock(mutex_);
    item.id = next_id_++;
    items_.emplace(item.id, item);
    Logger::get().debug("Created item {} ({})", item.id, item.name);
    return item;
}

Item MemoryResourceStore::get(std::uint64_t id) const {
    std::shared_lock lock(mutex_);
    auto it = items_.find(id);
    if (it == items_.end()) {
        throw NotFoundError("Item not found");
    }
    return it->second;
}

std::vector<Item> MemoryResourceStore::list() const {
    std::shared_lock lock(mutex_);
    std::vector<Item> results;
    results.reserve(items_.size());
    for (const auto& [id, item] : items_) {
        results.push_back(item);
    }
    return results;
}

Item MemoryResourceStore::replace(std::uint64_t id, const ItemFields& fields) {
    fields.validate(FieldMode::Full);

    std::unique_lock lock(mutex_);
    Item& item = find_locked(id);
    item.name = *fields.name;
    item.description = fields.description;
    item.price = *fields.price;
    item.metadata = fields.metadata;
    item.updated_at = std::chrono::system_clock::now();
    Logger::get().debug("Replaced item {}", id);
    return item;
}

Item MemoryResourceStore::patch(std::uint64_t id, const ItemFields& fields) {
    fields.validate(FieldMode::Partial);

    std::unique_lock lock(mutex_);
    Item& item = find_locked(id);
    if (fields.name) item.name = *fields.name;
    if (fields.description) item.description = fields.description;
    if (fields.price) item.price = *fields.price;
    if (fields.metadata) item.metadata = fields.metadata;
    item.updated_at = std::chrono::system_clock::now();
    Logger::get().debug("Patched item {}", id);
    return item;
}

void MemoryResourceStore::remove(std::uint64_t id) {
    std::unique_lock lock(mutex_);
    if (items_.erase(id) == 0) {
        throw NotFoundError("Item not found");
    }
    Logger::get().debug("Deleted item {}", id);
}

std::size_t MemoryResourceStore::size() const {
    std::shared_lock lock(mutex_);
    return items_.size();
}

std::uint64_t MemoryResourceStore::next_id() const {
    std::shared_lock lock(mutex_);
    return next_id_;
}

} // namespace imitatus
