#include "element_registry.h"
#include "../common/error_handler.h"
#include "../common/file_utils.h"
#include "../common/json_utils.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <algorithm>

namespace calcpilot {

namespace {
    void addAlias(std::vector<std::string>& aliases, const std::string& value) {
        std::string alias = utils::StringUtils::toLowerCase(utils::StringUtils::trim(value));
        if (!alias.empty() && std::find(aliases.begin(), aliases.end(), alias) == aliases.end()) {
            aliases.push_back(alias);
        }
    }

    std::optional<BoundingBox> parseBox(const nlohmann::json& node) {
        nlohmann::json bbox;
        if (utils::JsonUtils::getArrayField(node, "bbox", bbox)) {
            if (bbox.size() != 4) {
                return std::nullopt;
            }
            for (const auto& v : bbox) {
                if (!v.is_number()) {
                    return std::nullopt;
                }
            }
            int x1 = static_cast<int>(bbox[0].get<double>());
            int y1 = static_cast<int>(bbox[1].get<double>());
            int x2 = static_cast<int>(bbox[2].get<double>());
            int y2 = static_cast<int>(bbox[3].get<double>());
            if (x2 <= x1 || y2 <= y1) {
                return std::nullopt;
            }
            return BoundingBox{x1, y1, x2 - x1, y2 - y1};
        }

        nlohmann::json box;
        if (utils::JsonUtils::getObjectField(node, "bounding_box", box)) {
            if (!utils::JsonUtils::hasRequiredFields(box, {"left", "top", "width", "height"})) {
                return std::nullopt;
            }
            BoundingBox result{utils::JsonUtils::getIntField(box, "left"),
                               utils::JsonUtils::getIntField(box, "top"),
                               utils::JsonUtils::getIntField(box, "width"),
                               utils::JsonUtils::getIntField(box, "height")};
            if (result.width <= 0 || result.height <= 0) {
                return std::nullopt;
            }
            return result;
        }
        return std::nullopt;
    }
}

ElementRegistry::ElementRegistry(std::vector<ElementDescriptor> descriptors,
                                 const std::string& state,
                                 const Lexicon& lexicon)
    : m_descriptors(std::move(descriptors)), m_state(state), m_lexicon(lexicon) {}

std::shared_ptr<const ElementRegistry> ElementRegistry::loadFromFile(const std::string& path,
                                                                     const std::string& state) {
    SCOPED_TIMER("registry_load");

    if (!utils::FileUtils::fileExists(path)) {
        throw RegistryLoadError("Element registry file not found", path);
    }

    nlohmann::json document;
    if (!utils::FileUtils::loadJsonFromFile(path, document)) {
        throw RegistryLoadError("Element registry is not valid JSON", path);
    }
    return fromJson(document, state, path);
}

std::shared_ptr<const ElementRegistry> ElementRegistry::fromJson(const nlohmann::json& document,
                                                                 const std::string& state,
                                                                 const std::string& source) {
    nlohmann::json states;
    if (!utils::JsonUtils::getObjectField(document, "states", states)) {
        throw RegistryLoadError("Element registry has no \"states\" object", source);
    }

    nlohmann::json stateDoc;
    if (!utils::JsonUtils::getObjectField(states, state, stateDoc)) {
        throw RegistryLoadError("Element registry state not found", state, source);
    }

    nlohmann::json nodes;
    if (!utils::JsonUtils::getObjectField(stateDoc, "nodes", nodes)) {
        throw RegistryLoadError("Element registry state has no \"nodes\" object", state, source);
    }

    std::vector<ElementDescriptor> descriptors;
    size_t skipped = 0;
    for (const auto& [id, node] : nodes.items()) {
        auto descriptor = parseNode(id, node);
        if (!descriptor) {
            ++skipped;
            SLOG_WARNING().component("element_registry")
                .message("Skipping registry node without usable box or name")
                .context("id", id)
                .context("source", source);
            continue;
        }
        descriptors.push_back(std::move(*descriptor));
    }

    if (descriptors.empty()) {
        throw RegistryLoadError("Element registry state contains no usable elements", state, source);
    }

    SLOG_INFO().component("element_registry")
        .message("Element registry loaded")
        .context("source", source)
        .context("state", state)
        .context("elements", descriptors.size())
        .context("skipped", skipped);

    return std::make_shared<ElementRegistry>(std::move(descriptors), state);
}

std::optional<ElementDescriptor> ElementRegistry::parseNode(const std::string& id, const nlohmann::json& node) {
    if (!node.is_object()) {
        return std::nullopt;
    }

    auto box = parseBox(node);
    if (!box) {
        return std::nullopt;
    }

    std::string icon = utils::JsonUtils::getStringField(node, "g_icon_name");
    std::string brief = utils::JsonUtils::getStringField(node, "g_brief");

    ElementDescriptor descriptor;
    descriptor.id = id;
    descriptor.boundingBox = *box;
    descriptor.label = utils::StringUtils::trim(brief.empty() ? icon : brief);

    addAlias(descriptor.aliases, icon);
    addAlias(descriptor.aliases, brief);
    std::string lowerIcon = utils::StringUtils::toLowerCase(utils::StringUtils::trim(icon));
    if (utils::StringUtils::endsWith(lowerIcon, " button")) {
        addAlias(descriptor.aliases, lowerIcon.substr(0, lowerIcon.size() - 7));
    }

    if (descriptor.aliases.empty()) {
        return std::nullopt;
    }
    return descriptor;
}

const ElementDescriptor& ElementRegistry::resolve(const ButtonSymbol& symbol) const {
    auto exact = exactMatches(symbol);
    if (exact.size() == 1) {
        return m_descriptors[exact.front()];
    }
    if (exact.size() > 1) {
        throw ButtonNotFoundError("Button '" + symbol.name + "' matches several elements",
                                  candidateIds(exact), m_state);
    }

    auto byLabel = labelMatches(symbol);
    if (byLabel.size() == 1) {
        SLOG_DEBUG().component("element_registry")
            .message("Button resolved by label")
            .context("button", symbol.name)
            .context("id", m_descriptors[byLabel.front()].id);
        return m_descriptors[byLabel.front()];
    }
    if (byLabel.size() > 1) {
        throw ButtonNotFoundError("Button '" + symbol.name + "' matches several elements",
                                  candidateIds(byLabel), m_state);
    }

    throw ButtonNotFoundError("Button '" + symbol.name + "' not found in element registry",
                              symbolKindToString(symbol.kind), m_state);
}

const ElementDescriptor* ElementRegistry::findById(const std::string& id) const {
    for (const auto& descriptor : m_descriptors) {
        if (descriptor.id == id) {
            return &descriptor;
        }
    }
    return nullptr;
}

std::vector<size_t> ElementRegistry::exactMatches(const ButtonSymbol& symbol) const {
    std::vector<std::string> keys;
    addAlias(keys, symbol.name);
    if (const auto* synonyms = m_lexicon.synonymsFor(symbol)) {
        for (const auto& alias : synonyms->exactAliases) {
            addAlias(keys, alias);
        }
    }

    std::vector<size_t> matches;
    for (size_t i = 0; i < m_descriptors.size(); ++i) {
        const auto& aliases = m_descriptors[i].aliases;
        bool hit = std::any_of(keys.begin(), keys.end(), [&aliases](const std::string& key) {
            return std::find(aliases.begin(), aliases.end(), key) != aliases.end();
        });
        if (hit) {
            matches.push_back(i);
        }
    }
    return matches;
}

std::vector<size_t> ElementRegistry::labelMatches(const ButtonSymbol& symbol) const {
    std::vector<std::string> keywords;
    if (const auto* synonyms = m_lexicon.synonymsFor(symbol)) {
        for (const auto& keyword : synonyms->labelKeywords) {
            addAlias(keywords, keyword);
        }
    } else {
        addAlias(keywords, symbol.name);
    }

    std::vector<size_t> matches;
    for (size_t i = 0; i < m_descriptors.size(); ++i) {
        const auto& descriptor = m_descriptors[i];
        std::string label = utils::StringUtils::toLowerCase(descriptor.label);
        bool hit = std::any_of(keywords.begin(), keywords.end(), [&](const std::string& keyword) {
            if (label.find(keyword) != std::string::npos) {
                return true;
            }
            return std::any_of(descriptor.aliases.begin(), descriptor.aliases.end(),
                               [&keyword](const std::string& alias) {
                                   return alias.find(keyword) != std::string::npos;
                               });
        });
        if (hit) {
            matches.push_back(i);
        }
    }
    return matches;
}

std::string ElementRegistry::candidateIds(const std::vector<size_t>& indices) const {
    std::vector<std::string> ids;
    for (size_t index : indices) {
        ids.push_back(m_descriptors[index].id);
    }
    return utils::StringUtils::join(ids, ", ");
}

} // namespace calcpilot
