//
//  Map where we can iterate through items in insertion-order.
//
//  Entries live in a single vector, so lookups are a linear scan over
//  the keys. Keys only need operator==.
//

#pragma once

#include <gsl/span>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

namespace ordmap {

template <typename K, typename V>
class OrderedMap {
  public:
    struct Entry {
        K key;
        V value;

        bool
        operator==(const Entry& other) const {
            return key == other.key && value == other.value;
        }
    };

    using key_type = K;
    using mapped_type = V;
    using value_type = Entry;
    using size_type = std::size_t;
    using const_iterator = typename std::vector<Entry>::const_iterator;
    using iterator = const_iterator;

    OrderedMap() = default;

    OrderedMap(const OrderedMap& other) = default;
    OrderedMap(OrderedMap&& other) = default;

    OrderedMap&
    operator=(const OrderedMap& other) = default;

    OrderedMap&
    operator=(OrderedMap&& other) = default;

    // Duplicate keys keep the position of the first occurrence and
    // the value of the last one.
    OrderedMap(std::initializer_list<std::pair<K, V>> kw_args) {
        entries_.reserve(kw_args.size());
        for (auto& [key, value] : kw_args) {
            insert(key, value);
        }
    }

    static OrderedMap
    with_capacity(size_type capacity) {
        OrderedMap map;
        map.entries_.reserve(capacity);
        return map;
    }

    static OrderedMap
    from_pairs(gsl::span<const std::pair<K, V>> pairs) {
        auto map = with_capacity(static_cast<size_type>(pairs.size()));
        for (const auto& [key, value] : pairs) {
            map.insert(key, value);
        }
        return map;
    }

    std::optional<std::reference_wrapper<const V>>
    get(const K& key) const {
        if (auto index = find(key); index) {
            return std::cref(entries_[*index].value);
        }
        return std::nullopt;
    }

    std::optional<std::reference_wrapper<V>>
    get(const K& key) {
        if (auto index = find(key); index) {
            return std::ref(entries_[*index].value);
        }
        return std::nullopt;
    }

    bool
    contains(const K& key) const {
        return find(key).has_value();
    }

    // Insert-or-update. An existing key keeps its position.
    void
    insert(K key, V value) {
        if (auto index = find(key); index) {
            entries_[*index].value = std::move(value);
            return;
        }
        entries_.push_back(Entry{std::move(key), std::move(value)});
    }

    size_type
    size() const {
        return entries_.size();
    }

    bool
    empty() const {
        return entries_.empty();
    }

    size_type
    capacity() const {
        return entries_.capacity();
    }

    void
    reserve(size_type capacity) {
        entries_.reserve(capacity);
    }

    const_iterator
    begin() const {
        return entries_.cbegin();
    }

    const_iterator
    end() const {
        return entries_.cend();
    }

    void
    for_each(const std::function<void(const K&, const V&)>& cb) const {
        for (const auto& entry : entries_) {
            cb(entry.key, entry.value);
        }
    }

    bool
    operator==(const OrderedMap& other) const {
        return entries_ == other.entries_;
    }

  private:
    std::optional<size_type>
    find(const K& key) const {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&key](const Entry& entry) { return entry.key == key; });
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return static_cast<size_type>(std::distance(entries_.begin(), it));
    }

    std::vector<Entry> entries_;
};

}  // namespace ordmap
