#pragma once

#include <cstddef>
#include <list>
#include <string>
#include <unordered_map>
#include <utility>

namespace kvcache {

// ── OrderedMap ───────────────────────────────────────────────────────────────
//
// String-keyed map that iterates in insertion order.
//
//   - insert_or_assign() on an existing key updates the value in place and
//     keeps the key's position.
//   - erase() followed by a new insert moves the key to the end.
//
// Entries live in a std::list; an unordered_map indexes them by key.  List
// iterators stay valid across moves of the container, so the defaulted move
// operations are correct; copies rebuild the index.
//
// NOT thread-safe.

template <typename T>
class OrderedMap {
public:
    using value_type     = std::pair<std::string, T>;
    using const_iterator = typename std::list<value_type>::const_iterator;

    OrderedMap() = default;

    OrderedMap(const OrderedMap& other)
        : entries_(other.entries_)
    {
        rebuild_index();
    }

    OrderedMap& operator=(const OrderedMap& other) {
        if (this != &other) {
            OrderedMap copy(other);
            swap(copy);
        }
        return *this;
    }

    OrderedMap(OrderedMap&&) noexcept            = default;
    OrderedMap& operator=(OrderedMap&&) noexcept = default;

    // Returns a pointer to the value for `key`, or nullptr if not present.
    [[nodiscard]] T* find(const std::string& key) {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &it->second->second;
    }

    [[nodiscard]] const T* find(const std::string& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &it->second->second;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return index_.find(key) != index_.end();
    }

    // Returns the value for `key`, appending a default-constructed one first
    // if the key is not present.
    T& get_or_create(const std::string& key) {
        if (auto* existing = find(key)) {
            return *existing;
        }
        entries_.emplace_back(key, T{});
        index_.emplace(key, std::prev(entries_.end()));
        return entries_.back().second;
    }

    // Inserts `key` at the end, or overwrites its value in place.
    void insert_or_assign(std::string key, T value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            return;
        }
        entries_.emplace_back(std::move(key), std::move(value));
        auto last = std::prev(entries_.end());
        index_.emplace(last->first, last);
    }

    // Removes `key`. Returns true if the key existed, false otherwise.
    bool erase(const std::string& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        entries_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void clear() {
        index_.clear();
        entries_.clear();
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    void swap(OrderedMap& other) noexcept {
        entries_.swap(other.entries_);
        index_.swap(other.index_);
    }

    // Equal when both hold the same keys, in the same order, with equal values.
    friend bool operator==(const OrderedMap& lhs, const OrderedMap& rhs) {
        return lhs.entries_ == rhs.entries_;
    }

private:
    void rebuild_index() {
        index_.clear();
        index_.reserve(entries_.size());
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            index_.emplace(it->first, it);
        }
    }

    std::list<value_type> entries_;
    std::unordered_map<std::string, typename std::list<value_type>::iterator> index_;
};

} // namespace kvcache
