#ifndef PROCGEO_BOOLEAN_POLYGON_CACHE_H
#define PROCGEO_BOOLEAN_POLYGON_CACHE_H

#include "procgeo/boolean/polygon_types.h"
#include "procgeo/core/hash_utils.h"

#include <cstddef>
#include <list>
#include <string>
#include <string_view>
#include <unordered_map>

namespace procgeo {

struct FnvStringHash {
    std::size_t operator()(std::string_view s) const noexcept {
        return static_cast<std::size_t>(hashString(kDigestOffset, s));
    }
};

// Memo of shape outlines keyed by shape fingerprint. With a non-zero capacity
// the least recently used entry is evicted on overflow. Entries never expire
// on their own: callers clear() after geometry edits the key cannot see.
class PolygonCache {
public:
    explicit PolygonCache(std::size_t capacity = 0) : capacity_(capacity) {}

    // Returns the cached outline and marks it most recently used, or nullptr.
    // The pointer is valid until the next insert() or clear().
    const MultiPolygon* find(const std::string& key);

    void insert(const std::string& key, MultiPolygon polygon);

    bool contains(const std::string& key) const { return entries_.count(key) != 0; }
    void clear() noexcept;
    std::size_t size() const noexcept { return entries_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }

private:
    using Recency = std::list<std::string>;

    struct Entry {
        MultiPolygon polygon;
        Recency::iterator position;
    };

    void evictOverflow();

    std::size_t capacity_;
    Recency recency_; // front = most recent
    std::unordered_map<std::string, Entry, FnvStringHash> entries_;
};

} // namespace procgeo

#endif // PROCGEO_BOOLEAN_POLYGON_CACHE_H
