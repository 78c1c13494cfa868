#pragma once

#include <arch_model/graph_model.hpp>
#include <arch_model/types.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arch_model {

// Element view over the nodes of one layer. The graph stays the owner;
// the layer only materializes and edits through it.
class Layer {
public:
    Layer(std::string name, GraphModel& graph);

    const std::string& name() const { return name_; }

    // Cached per graph version; rebuilt lazily after any graph mutation.
    const std::vector<Element>& elements() const;
    std::optional<Element> find_element(const std::string& id) const;
    std::size_t element_count() const { return elements().size(); }

    // Element id must carry this layer's prefix.
    void add_element(const Element& element);
    // Updates name/type/description, properties, references and
    // relationships in one step; facets absent from the patch are kept.
    void update_element(const std::string& id, const ElementPatch& patch);
    bool delete_element(const std::string& id);

    const nlohmann::json& metadata() const { return metadata_; }
    void set_metadata(nlohmann::json metadata) { metadata_ = std::move(metadata); }

    // Layer document: {"layer", "metadata", "elements": [node...]}.
    // Relationships live in the model-wide relationships document.
    nlohmann::json to_document() const;
    // Throws std::invalid_argument on a malformed document, DuplicateError
    // if an element already exists in the graph.
    std::size_t load_document(const nlohmann::json& doc);

private:
    std::string name_;
    GraphModel* graph_;
    nlohmann::json metadata_ = nlohmann::json::object();
    mutable std::vector<Element> cache_;
    mutable std::optional<std::uint64_t> cache_version_;
};

} // namespace arch_model
