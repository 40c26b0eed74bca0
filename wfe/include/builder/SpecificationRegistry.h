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

#include "model/Specification.h"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace WFE {

/**
 * @brief Name -> Specification map
 *
 * A specification is created the first time its name is declared and is
 * never removed; later declarations under the same name merge into it.
 * getInstance() is the process-wide registry used by default; separate
 * registries can be constructed for isolated setups such as tests.
 *
 * Lookups and registration are thread-safe. The specifications themselves
 * are not locked: declaring into a name while instances of it are firing
 * requires external synchronization.
 */
class SpecificationRegistry {
public:
    SpecificationRegistry() = default;

    SpecificationRegistry(const SpecificationRegistry &) = delete;
    SpecificationRegistry &operator=(const SpecificationRegistry &) = delete;
    SpecificationRegistry(SpecificationRegistry &&) = delete;
    SpecificationRegistry &operator=(SpecificationRegistry &&) = delete;

    /**
     * @brief Process-wide registry
     */
    static SpecificationRegistry &getInstance();

    /**
     * @brief Return the specification of the given name, creating it if needed
     * @throws std::invalid_argument if name is empty
     */
    std::shared_ptr<Specification> obtain(const std::string &name);

    /**
     * @brief Merge a staged graph into the specification of the same name
     *
     * Registers the name first if it is new.
     *
     * @param patch Staged graph; its name selects the target specification
     * @return The registered specification
     */
    std::shared_ptr<Specification> declare(const Specification &patch);

    /**
     * @brief Find a specification by name
     * @return Specification or nullptr if the name was never declared
     */
    std::shared_ptr<Specification> find(const std::string &name) const;

    bool contains(const std::string &name) const;

    /**
     * @brief Registered names in registration order
     */
    std::vector<std::string> getNames() const;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Specification>> specifications_;
    std::vector<std::string> order_;
};

}  // namespace WFE
