#include "dedupCache.hpp"

DedupCache::DedupCache(size_t capacity) : capacity_(capacity) {
}

bool DedupCache::contains(const std::string& id) const {
    return seen_.count(id) != 0;
}

bool DedupCache::insert(const std::string& id) {
    if (!seen_.insert(id).second) {
        return false;
    }

    order_.push_back(id);

    while (order_.size() > capacity_) {
        seen_.erase(order_.front());
        order_.pop_front();
    }
    return true;
}

void DedupCache::clear() {
    order_.clear();
    seen_.clear();
}
