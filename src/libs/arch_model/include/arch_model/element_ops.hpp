#pragma once

#include <arch_model/graph_view.hpp>
#include <arch_model/types.hpp>
#include <optional>
#include <string>

namespace arch_model {

// Element-level operations over any MutableGraph. Layer edits and change
// replay (preview and commit alike) all go through these.

std::optional<Element> read_element(const GraphView& graph, const std::string& id);

// Inserts the node and its outgoing relationships. Every relationship target
// is checked before anything is written.
void insert_element(MutableGraph& graph, const Element& element);

// Merges a patch into an existing element. When the patch carries
// relationships they replace the element's outgoing edges.
void merge_element(MutableGraph& graph, const std::string& id, const ElementPatch& patch);

// Removes the node; incident edges go with it.
bool erase_element(MutableGraph& graph, const std::string& id);

} // namespace arch_model
