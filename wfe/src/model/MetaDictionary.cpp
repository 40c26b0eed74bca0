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

#include "model/MetaDictionary.h"
#include <stdexcept>

namespace WFE {

MetaDictionary::MetaDictionary(std::initializer_list<Entry> entries) {
    for (const auto &entry : entries) {
        set(entry.first, entry.second);
    }
}

MetaDictionary MetaDictionary::fromJson(const MetaValue &value) {
    if (value.is_null()) {
        return {};
    }
    if (!value.is_object()) {
        throw std::invalid_argument("Meta must be a JSON object, got " + std::string(value.type_name()));
    }

    MetaDictionary meta;
    for (const auto &item : value.items()) {
        meta.set(item.key(), item.value());
    }
    return meta;
}

void MetaDictionary::set(const std::string &key, MetaValue value) {
    for (auto &entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(key, std::move(value));
}

void MetaDictionary::merge(const MetaDictionary &other) {
    for (const auto &entry : other.entries_) {
        set(entry.first, entry.second);
    }
}

bool MetaDictionary::contains(const std::string &key) const {
    return find(key) != nullptr;
}

const MetaValue *MetaDictionary::find(const std::string &key) const {
    for (const auto &entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

const MetaValue &MetaDictionary::at(const std::string &key) const {
    const MetaValue *found = find(key);
    if (!found) {
        throw std::out_of_range("No meta entry named '" + key + "'");
    }
    return *found;
}

std::vector<std::string> MetaDictionary::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto &entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

MetaValue MetaDictionary::toJson() const {
    MetaValue object = MetaValue::object();
    for (const auto &entry : entries_) {
        object[entry.first] = entry.second;
    }
    return object;
}

}  // namespace WFE
