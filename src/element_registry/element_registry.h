#ifndef CALCPILOT_ELEMENT_REGISTRY_H
#define CALCPILOT_ELEMENT_REGISTRY_H

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "../common/types.h"
#include "../instruction_parser/lexicon.h"

namespace calcpilot {

/**
 * @brief Read-only index of the calculator's UI elements.
 *
 * Built once from the registry document produced by the element-detection
 * tooling and shared as std::shared_ptr<const ElementRegistry>.
 */
class ElementRegistry {
public:
    ElementRegistry(std::vector<ElementDescriptor> descriptors,
                    const std::string& state,
                    const Lexicon& lexicon = Lexicon::standard());

    /**
     * @brief Load one state of a registry document from disk
     * @param path Registry JSON file
     * @param state Key under "states" (usually "root")
     * @throws RegistryLoadError on a missing file, malformed JSON or missing state
     */
    static std::shared_ptr<const ElementRegistry> loadFromFile(const std::string& path,
                                                               const std::string& state = "root");

    /**
     * @brief Same as loadFromFile for an already parsed document
     * @param source Used in log and error messages only
     */
    static std::shared_ptr<const ElementRegistry> fromJson(const nlohmann::json& document,
                                                           const std::string& state,
                                                           const std::string& source = "<memory>");

    /**
     * @brief Find the element for a button symbol
     *
     * Exact alias match on the canonical name and its synonyms first, then
     * substring match of the label keywords. Zero or several candidates
     * throw ButtonNotFoundError.
     */
    const ElementDescriptor& resolve(const ButtonSymbol& symbol) const;

    const ElementDescriptor* findById(const std::string& id) const;

    size_t size() const { return m_descriptors.size(); }
    const std::vector<ElementDescriptor>& descriptors() const { return m_descriptors; }
    const std::string& state() const { return m_state; }

    // Parses one node, empty if it has no usable box or alias
    static std::optional<ElementDescriptor> parseNode(const std::string& id, const nlohmann::json& node);

private:
    std::vector<ElementDescriptor> m_descriptors;
    std::string m_state;
    const Lexicon& m_lexicon;

    std::vector<size_t> exactMatches(const ButtonSymbol& symbol) const;
    std::vector<size_t> labelMatches(const ButtonSymbol& symbol) const;
    std::string candidateIds(const std::vector<size_t>& indices) const;
};

} // namespace calcpilot

#endif // CALCPILOT_ELEMENT_REGISTRY_H
