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

#include "builder/SpecificationRegistry.h"
#include "model/MetaDictionary.h"
#include "model/Specification.h"
#include <memory>
#include <string>
#include <vector>

namespace WFE {

class SpecBuilder;

/**
 * @brief Loads workflow structure from a JSON document
 *
 * Expected layout:
 * @code
 * {
 *   "name": "Article",
 *   "states": [
 *     {"name": "new", "meta": {"label": "New"},
 *      "events": [{"name": "submit", "transitions_to": "awaiting_review", "meta": {}}]},
 *     {"name": "awaiting_review"}
 *   ]
 * }
 * @endcode
 *
 * The document is replayed through a SpecBuilder, so loading into an
 * existing name merges additively. Actions and hooks have no JSON form;
 * attach them in code by declaring into the same name.
 */
class SpecificationJsonParser {
public:
    explicit SpecificationJsonParser(SpecificationRegistry &registry = SpecificationRegistry::getInstance());

    /**
     * @brief Parse a JSON file and register its specification
     * @param filename Path of the document
     * @return Registered specification, nullptr on error
     */
    std::shared_ptr<Specification> parseFile(const std::string &filename);

    /**
     * @brief Parse JSON text and register its specification
     * @param content Document text
     * @return Registered specification, nullptr on error
     */
    std::shared_ptr<Specification> parseContent(const std::string &content);

    bool hasErrors() const {
        return !errorMessages_.empty();
    }

    const std::vector<std::string> &getErrorMessages() const {
        return errorMessages_;
    }

private:
    std::shared_ptr<Specification> parseDocument(const MetaValue &document);
    bool parseState(const MetaValue &stateJson, size_t position, SpecBuilder &builder);
    bool parseEvent(const MetaValue &eventJson, const std::string &stateName, size_t position, SpecBuilder &builder);
    bool parseMeta(const MetaValue &owner, const std::string &where, MetaDictionary &meta);
    bool requireString(const MetaValue &owner, const char *key, const std::string &where, std::string &out);
    void addError(const std::string &message);

    SpecificationRegistry &registry_;
    std::vector<std::string> errorMessages_;
};

}  // namespace WFE
