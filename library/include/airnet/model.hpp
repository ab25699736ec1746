#ifndef airnet_model_hpp
#define airnet_model_hpp

#include <cstddef> // for std::size_t
#include <map>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "airnet/element.hpp"
#include "airnet/flow_result.hpp"
#include "airnet/link.hpp"
#include "airnet/name.hpp"
#include "airnet/node.hpp"
#include "airnet/record.hpp"
#include "airnet/utility.hpp"

namespace airnet {

/// @brief Airflow network of nodes joined by links through elements.
struct model
{
    std::string title;
    std::map<name, node> nodes;
    std::map<name, element> elements;
    std::vector<link> links;

    /// @brief Names of the variable nodes in index order.
    std::vector<name> variable_nodes;
};

/// @brief Makes a model from the given records.
/// @details Node and element records are processed before any link is
///   resolved so records may come in any order. Later nodes or elements
///   replace earlier ones of the same name. Variable nodes are indexed in
///   name order and properties are computed for every node.
/// @param[in] records Records to make the model from.
/// @param[out] diags Stream to write a line to for every replaced node or
///   element.
/// @throws unresolved_reference if a link names a node or element that
///   no record provides.
/// @throws missing_argument if an element record lacks a required field.
auto make_model(std::span<const record> records,
                std::ostream& diags = null_ostream()) -> model;

/// @brief Number of unknowns, i.e. of variable nodes.
auto size(const model& value) noexcept -> std::size_t;

/// @brief Recomputes the air properties of every node.
auto set_properties(model& value) noexcept -> void;

auto find_node(const model& value, const name& key) -> const node*;
auto find_node(model& value, const name& key) -> node*;
auto find_link(const model& value, const name& key) -> const link*;

/// @brief Pressure drop across the link's opening at its height (Pa).
/// @throws unresolved_reference if the link's nodes aren't in the model.
auto pressure_drop(const model& value, const link& l) -> double;

/// @brief Calculates the flow through the link at the given pressure drop.
/// @note Flows and derivatives are scaled by the link's multiplier.
/// @throws unresolved_reference if the link's nodes or element aren't in
///   the model.
auto calculate(const model& value, const link& l, double pdrop)
    -> flow_result;

/// @brief Calculates the flow through the link at its pressure drop.
auto calculate(const model& value, const link& l) -> flow_result;

/// @brief Initial slope of flow with respect to pressure drop for the link.
/// @throws unimplemented_law if the link's element has no initialization
///   coefficient.
auto linearize(const model& value, const link& l) -> double;

/// @brief Writes a human readable summary of the model.
auto summarize(std::ostream& os, const model& value) -> void;

}

#endif /* airnet_model_hpp */
