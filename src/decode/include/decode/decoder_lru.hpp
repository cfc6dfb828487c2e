#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>

namespace nla::decode {

// Capacity-bounded map that evicts the least recently accessed entry. Recency is a
// per-instance counter bumped on every lookup or insert. Not thread-safe; each decode
// worker owns one.
template<typename Key, typename Value>
class DecoderLru {
public:
    explicit DecoderLru(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // Returns the value for key, creating it with make() when absent. make() returns
    // std::optional<Value>; an empty optional leaves the map untouched and yields nullptr.
    template<typename MakeFn>
    Value* get_or_insert(const Key& key, MakeFn&& make) {
        if(Value* v = find(key)) return v;
        std::optional<Value> created = make();
        if(!created) return nullptr;
        while(entries_.size() >= capacity_) evict_oldest();
        auto [it, inserted] = entries_.emplace(key, Slot{std::move(*created), ++clock_});
        (void)inserted;
        return &it->second.value;
    }

    Value* find(const Key& key) {
        auto it = entries_.find(key);
        if(it == entries_.end()) return nullptr;
        it->second.last_access = ++clock_;
        return &it->second.value;
    }

    bool contains(const Key& key) const { return entries_.find(key) != entries_.end(); }
    bool erase(const Key& key) { return entries_.erase(key) > 0; }
    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    void clear() { entries_.clear(); }

private:
    struct Slot {
        Value value;
        uint64_t last_access = 0;
    };

    void evict_oldest() {
        auto victim = entries_.begin();
        for(auto it = entries_.begin(); it != entries_.end(); ++it) {
            if(it->second.last_access < victim->second.last_access) victim = it;
        }
        if(victim != entries_.end()) entries_.erase(victim);
    }

    size_t capacity_;
    uint64_t clock_ = 0;
    std::map<Key, Slot> entries_;
};

} // namespace nla::decode
