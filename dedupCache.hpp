#include <cstddef>
#include <deque>
#include <string>
#include <unordered_set>

#ifndef DEDUPCACHE_HPP
#define DEDUPCACHE_HPP

/*
 * Bounded FIFO set of clipboard item ids we have already seen.
 *
 * Insertion order is eviction order. Seeing an id again does not refresh it,
 * so this is a sliding window over first sightings, not an LRU.
 *
 *   insert(a) insert(b) insert(c)   order: a b c
 *   insert(d)  (capacity 3)         order: b c d    a is forgotten
 */
class DedupCache {

public:

    static constexpr size_t defaultCapacity = 512;

    explicit DedupCache(size_t capacity = defaultCapacity);

    bool contains(const std::string& id) const;

    // Returns false (and changes nothing) if the id was already present.
    bool insert(const std::string& id);

    size_t size() const {
        return order_.size();
    }

    size_t capacity() const {
        return capacity_;
    }

    void clear();

private:

    std::deque<std::string> order_;
    std::unordered_set<std::string> seen_;
    size_t capacity_;
};

#endif // DEDUPCACHE_HPP
