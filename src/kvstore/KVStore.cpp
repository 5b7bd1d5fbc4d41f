#include "kvstore/KVStore.hpp"
#include <algorithm>
#include <iterator>
#include <type_traits>

void KVStore::apply(const Modification& modification) {
    std::visit([this](const auto& mod) {
        using ModType = std::decay_t<decltype(mod)>;

        if constexpr (std::is_same_v<ModType, UpdateModification>) {
            kvMap_[mod.key] = mod.value;
        }
        else if constexpr (std::is_same_v<ModType, DeleteModification>) {
            kvMap_.erase(mod.key);
        }
        else {
            static_assert(sizeof(ModType) == 0, "Unhandled modification type in apply");
        }
    }, modification);
}

std::optional<std::string> KVStore::get(const std::string& key) const {
    auto it = kvMap_.find(key);

    if (it != kvMap_.end()) {
        return it->second;
    } else {
        return std::nullopt;
    }
}

std::vector<Modification> KVStore::page(size_t offset, size_t count) const {
    std::vector<Modification> entries;
    if (offset >= kvMap_.size() || count == 0) {
        return entries;
    }

    auto it = kvMap_.begin();
    std::advance(it, offset);

    entries.reserve(std::min(count, kvMap_.size() - offset));
    for (; it != kvMap_.end() && entries.size() < count; ++it) {
        entries.push_back(UpdateModification{it->first, it->second});
    }
    return entries;
}

size_t KVStore::size() const {
    return kvMap_.size();
}

void KVStore::forEach(const std::function<void(const std::string&, const std::string&)>& visitor) const {
    for (const auto& [key, value] : kvMap_) {
        visitor(key, value);
    }
}
