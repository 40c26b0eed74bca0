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

#include "builder/SpecificationRegistry.h"
#include "common/Logger.h"
#include <mutex>
#include <stdexcept>

namespace WFE {

SpecificationRegistry &SpecificationRegistry::getInstance() {
    static SpecificationRegistry instance;
    return instance;
}

std::shared_ptr<Specification> SpecificationRegistry::obtain(const std::string &name) {
    if (name.empty()) {
        throw std::invalid_argument("SpecificationRegistry: specification name cannot be empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto existing = specifications_.find(name);
    if (existing != specifications_.end()) {
        return existing->second;
    }

    auto specification = std::make_shared<Specification>(name);
    specifications_.emplace(name, specification);
    order_.push_back(name);

    LOG_DEBUG("SpecificationRegistry: Registered specification '{}'", name);
    return specification;
}

std::shared_ptr<Specification> SpecificationRegistry::declare(const Specification &patch) {
    auto specification = obtain(patch.getName());
    specification->merge(patch);
    return specification;
}

std::shared_ptr<Specification> SpecificationRegistry::find(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = specifications_.find(name);
    if (it == specifications_.end()) {
        return nullptr;
    }
    return it->second;
}

bool SpecificationRegistry::contains(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return specifications_.contains(name);
}

std::vector<std::string> SpecificationRegistry::getNames() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return order_;
}

size_t SpecificationRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return order_.size();
}

}  // namespace WFE
