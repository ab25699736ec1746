#ifndef airnet_record_hpp
#define airnet_record_hpp

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "airnet/element.hpp"
#include "airnet/fan.hpp"
#include "airnet/name.hpp"
#include "airnet/node.hpp"

namespace airnet {

/// @brief Numeric fields of an element by field name.
using field_map = std::map<std::string, double, std::less<>>;

struct title_record
{
    std::string title;
};

struct node_record
{
    airnet::name name;

    /// @brief Type code: 'c' for fixed pressure, anything else for variable.
    char type{'v'};

    double ht{}; ///< m
    double temp{node::default_temperature}; ///< K
    std::optional<double> pres; ///< Pa
};

struct element_record
{
    airnet::name name;
    element_type type{element_type::plr};
    field_map fields;

    /// @brief Performance curve ranges for fans.
    std::vector<fan_point> points;
};

struct link_record
{
    airnet::name name;
    airnet::name node1;
    double ht1{};
    airnet::name node2;
    double ht2{};
    airnet::name element;
    std::optional<std::string> wind;
    double wpmod{};
};

/// @brief Parsed unit of a network description.
using record = std::variant<
    title_record,
    node_record,
    element_record,
    link_record
>;

/// @brief Accepted names of an element field.
struct field_alias
{
    std::string_view name;

    /// @brief Alternative name, or empty for none.
    std::string_view alias;

    /// @brief Value to use if the field is absent, or none if it's required.
    std::optional<double> fallback;
};

/// @brief Looks up the value of a field by any of its accepted names.
/// @throws missing_argument if absent under all names and without fallback.
auto get(const field_map& fields, const field_alias& field) -> double;

/// @brief Makes the element the given record describes.
/// @throws missing_argument if the record lacks a required field.
/// @throws std::invalid_argument if the record's values are invalid for
///   the type of element.
auto make_element(const element_record& r) -> element;

auto operator<<(std::ostream& os, const record& value) -> std::ostream&;

}

#endif /* airnet_record_hpp */
