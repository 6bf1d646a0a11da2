#include "procgeo/boolean/polygon_cache.h"
#include "procgeo/core/logging.h"

#include <utility>

namespace procgeo {

const MultiPolygon* PolygonCache::find(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    recency_.splice(recency_.begin(), recency_, it->second.position);
    return &it->second.polygon;
}

void PolygonCache::insert(const std::string& key, MultiPolygon polygon) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.polygon = std::move(polygon);
        recency_.splice(recency_.begin(), recency_, it->second.position);
        return;
    }
    recency_.push_front(key);
    entries_.emplace(key, Entry{std::move(polygon), recency_.begin()});
    evictOverflow();
}

void PolygonCache::clear() noexcept {
    entries_.clear();
    recency_.clear();
}

void PolygonCache::evictOverflow() {
    if (capacity_ == 0) return;
    while (entries_.size() > capacity_) {
        PROCGEO_LOG_DEBUG("polygon cache: evict %s", recency_.back().c_str());
        entries_.erase(recency_.back());
        recency_.pop_back();
    }
}

} // namespace procgeo
