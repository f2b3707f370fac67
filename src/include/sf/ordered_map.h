// sf::OrderedMap - insertion-ordered associative container
#pragma once

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sf {

// Keys keep the position of their first insertion. Assigning to an existing
// key replaces the value in its original slot.
template <typename Key, typename Value>
class OrderedMap {
  public:
    using key_type = Key;
    using mapped_type = Value;
    using value_type = std::pair<Key, Value>;
    using container_type = std::vector<value_type>;
    using const_iterator = typename container_type::const_iterator;

    OrderedMap() = default;
    OrderedMap(std::initializer_list<value_type> init) {
        for (auto const& p : init) insert_or_assign(p.first, p.second);
    }

    // Returns true when a new entry was appended.
    bool insert_or_assign(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second].second = std::move(value);
            return false;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, std::move(value));
        return true;
    }

    Value& operator[](const Key& key) {
        auto it = index_.find(key);
        if (it != index_.end()) return entries_[it->second].second;
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, Value{});
        return entries_.back().second;
    }

    const Value& at(const Key& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) throw std::out_of_range("key not found: " + std::string(key));
        return entries_[it->second].second;
    }
    Value& at(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) throw std::out_of_range("key not found: " + std::string(key));
        return entries_[it->second].second;
    }

    const_iterator find(const Key& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) return entries_.end();
        return entries_.begin() + static_cast<std::ptrdiff_t>(it->second);
    }

    bool contains(const Key& key) const noexcept { return index_.find(key) != index_.end(); }
    size_t count(const Key& key) const noexcept { return contains(key) ? 1 : 0; }
    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    std::vector<Key> keys() const {
        std::vector<Key> out;
        out.reserve(entries_.size());
        for (auto const& e : entries_) out.push_back(e.first);
        return out;
    }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    bool operator==(const OrderedMap& rhs) const { return entries_ == rhs.entries_; }
    bool operator!=(const OrderedMap& rhs) const { return !(*this == rhs); }

  private:
    std::unordered_map<Key, size_t> index_;
    container_type entries_;
};

}  // namespace sf
