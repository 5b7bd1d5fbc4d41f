#ifndef KVSTORE_HPP
#define KVSTORE_HPP

#include "kvstore/Modification.hpp"

#include <map>
#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstddef>

// Ordered key/value map. Not synchronized: KVNode owns the only instance
// and serializes every access.
class KVStore {
  public:

    // Update inserts or overwrites, Delete removes the key if present.
    void apply(const Modification& modification);

    std::optional<std::string> get(const std::string& key) const;

    // Up to `count` entries starting at the `offset`-th key, as Updates.
    std::vector<Modification> page(size_t offset, size_t count) const;

    size_t size() const;

    void forEach(const std::function<void(const std::string&, const std::string&)>& visitor) const;

  private:
    std::map<std::string, std::string> kvMap_;
};


#endif // !KVSTORE_HPP
