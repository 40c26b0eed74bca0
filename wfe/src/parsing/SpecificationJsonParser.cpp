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

#include "parsing/SpecificationJsonParser.h"
#include "builder/SpecBuilder.h"
#include "common/Logger.h"
#include <format>
#include <fstream>
#include <sstream>

namespace WFE {

SpecificationJsonParser::SpecificationJsonParser(SpecificationRegistry &registry) : registry_(registry) {}

std::shared_ptr<Specification> SpecificationJsonParser::parseFile(const std::string &filename) {
    errorMessages_.clear();

    std::ifstream file(filename);
    if (!file.is_open()) {
        addError("Failed to open file: " + filename);
        return nullptr;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    LOG_DEBUG("SpecificationJsonParser: Loaded {} byte(s) from {}", buffer.str().size(), filename);
    return parseContent(buffer.str());
}

std::shared_ptr<Specification> SpecificationJsonParser::parseContent(const std::string &content) {
    errorMessages_.clear();

    MetaValue document;
    try {
        document = MetaValue::parse(content);
    } catch (const MetaValue::parse_error &e) {
        addError(std::string("Invalid JSON: ") + e.what());
        return nullptr;
    }

    return parseDocument(document);
}

std::shared_ptr<Specification> SpecificationJsonParser::parseDocument(const MetaValue &document) {
    if (!document.is_object()) {
        addError("Document root must be an object");
        return nullptr;
    }

    std::string name;
    if (!requireString(document, "name", "document", name)) {
        return nullptr;
    }

    auto states = document.find("states");
    if (states == document.end() || !states->is_array()) {
        addError(std::format("Specification '{}' needs a 'states' array", name));
        return nullptr;
    }

    // Statements are staged first; nothing reaches the registry unless the whole document is valid
    SpecBuilder builder(name, registry_);
    bool valid = true;
    for (size_t i = 0; i < states->size(); ++i) {
        valid = parseState((*states)[i], i, builder) && valid;
    }

    if (!valid) {
        LOG_WARN("SpecificationJsonParser: Rejected specification '{}' with {} error(s)", name,
                 errorMessages_.size());
        return nullptr;
    }

    auto specification = builder.build();
    LOG_INFO("SpecificationJsonParser: Loaded specification '{}' ({} state(s))", name,
             specification->getStateCount());
    return specification;
}

bool SpecificationJsonParser::parseState(const MetaValue &stateJson, size_t position, SpecBuilder &builder) {
    std::string where = std::format("states[{}]", position);
    if (!stateJson.is_object()) {
        addError(where + " must be an object");
        return false;
    }

    std::string stateName;
    if (!requireString(stateJson, "name", where, stateName)) {
        return false;
    }
    where = std::format("state '{}'", stateName);

    if (builder.getStaging().hasState(stateName)) {
        addError(std::format("{} is listed more than once", where));
        return false;
    }

    MetaDictionary meta;
    if (!parseMeta(stateJson, where, meta)) {
        return false;
    }
    builder.declareState(stateName);
    builder.declareMeta(stateName, meta);

    auto events = stateJson.find("events");
    if (events == stateJson.end()) {
        return true;
    }
    if (!events->is_array()) {
        addError(where + ": 'events' must be an array");
        return false;
    }

    bool ok = true;
    for (size_t i = 0; i < events->size(); ++i) {
        ok = parseEvent((*events)[i], stateName, i, builder) && ok;
    }
    return ok;
}

bool SpecificationJsonParser::parseEvent(const MetaValue &eventJson, const std::string &stateName, size_t position,
                                         SpecBuilder &builder) {
    std::string where = std::format("state '{}' events[{}]", stateName, position);
    if (!eventJson.is_object()) {
        addError(where + " must be an object");
        return false;
    }

    std::string eventName;
    std::string target;
    if (!requireString(eventJson, "name", where, eventName) ||
        !requireString(eventJson, "transitions_to", where, target)) {
        return false;
    }

    where = std::format("event '{}' of state '{}'", eventName, stateName);
    const StateDefinition *staged = builder.getStaging().findState(stateName);
    if (staged && staged->hasEvent(eventName)) {
        addError(where + " is listed more than once");
        return false;
    }

    MetaDictionary meta;
    if (!parseMeta(eventJson, where, meta)) {
        return false;
    }

    builder.declareEvent(stateName, eventName, target, nullptr, std::move(meta));
    return true;
}

bool SpecificationJsonParser::parseMeta(const MetaValue &owner, const std::string &where, MetaDictionary &meta) {
    auto found = owner.find("meta");
    if (found == owner.end()) {
        return true;
    }

    if (!found->is_object() && !found->is_null()) {
        addError(where + ": 'meta' must be an object");
        return false;
    }

    meta = MetaDictionary::fromJson(*found);
    return true;
}

bool SpecificationJsonParser::requireString(const MetaValue &owner, const char *key, const std::string &where,
                                            std::string &out) {
    auto found = owner.find(key);
    if (found == owner.end() || !found->is_string() || found->get<std::string>().empty()) {
        addError(std::format("{}: '{}' must be a non-empty string", where, key));
        return false;
    }

    out = found->get<std::string>();
    return true;
}

void SpecificationJsonParser::addError(const std::string &message) {
    LOG_ERROR("SpecificationJsonParser: {}", message);
    errorMessages_.push_back(message);
}

}  // namespace WFE
