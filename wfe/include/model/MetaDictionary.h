// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-WFE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of WFE (Workflow Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE in the repository root

#pragma once

#include <cstddef>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace WFE {

/**
 * @brief Value stored in a MetaDictionary
 *
 * Ordered JSON keeps nested objects in the order they were written, which
 * matters for admin UIs that render meta verbatim.
 */
using MetaValue = nlohmann::ordered_json;

/**
 * @brief Ordered application metadata attached to a state or an event
 *
 * The engine never interprets the values. Insertion order is preserved for
 * enumeration; overwriting a key keeps its original position.
 *
 * @code
 * MetaDictionary meta{{"label", "Awaiting review"}, {"sla_hours", 48}};
 * meta.value<std::string>("label", "");   // "Awaiting review"
 * for (const auto &[key, value] : meta) { ... }
 * @endcode
 */
class MetaDictionary {
public:
    using Entry = std::pair<std::string, MetaValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    MetaDictionary() = default;
    MetaDictionary(std::initializer_list<Entry> entries);

    /**
     * @brief Build a dictionary from a JSON object, keeping its key order
     * @throws std::invalid_argument if value is neither an object nor null
     */
    static MetaDictionary fromJson(const MetaValue &value);

    /**
     * @brief Insert or overwrite a key
     */
    void set(const std::string &key, MetaValue value);

    /**
     * @brief Apply every entry of other in its order (later values win)
     */
    void merge(const MetaDictionary &other);

    bool contains(const std::string &key) const;

    /**
     * @brief Keyed lookup
     * @return Pointer to the value, nullptr if the key is absent
     */
    const MetaValue *find(const std::string &key) const;

    /**
     * @brief Keyed lookup that requires the key
     * @throws std::out_of_range if the key is absent
     */
    const MetaValue &at(const std::string &key) const;

    const MetaValue &operator[](const std::string &key) const {
        return at(key);
    }

    /**
     * @brief Attribute-style typed access
     * @throws std::out_of_range if the key is absent
     * @throws nlohmann::json::type_error if the value does not convert to T
     */
    template <typename T> T get(const std::string &key) const {
        return at(key).template get<T>();
    }

    /**
     * @brief Attribute-style typed access with a fallback for missing keys
     */
    template <typename T> T value(const std::string &key, const T &fallback) const {
        const MetaValue *found = find(key);
        if (!found || found->is_null()) {
            return fallback;
        }
        return found->template get<T>();
    }

    std::vector<std::string> keys() const;

    const_iterator begin() const {
        return entries_.begin();
    }

    const_iterator end() const {
        return entries_.end();
    }

    size_t size() const {
        return entries_.size();
    }

    bool empty() const {
        return entries_.empty();
    }

    MetaValue toJson() const;

    bool operator==(const MetaDictionary &other) const {
        return entries_ == other.entries_;
    }

private:
    std::vector<Entry> entries_;
};

}  // namespace WFE
