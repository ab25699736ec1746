#include <charconv> // for std::from_chars
#include <cstddef> // for std::size_t
#include <iomanip> // for std::quoted
#include <optional>
#include <sstream> // for std::ostringstream
#include <string> // for std::getline
#include <string_view>
#include <system_error> // for std::errc

#include "airnet/constants.hpp"
#include "airnet/errors.hpp"
#include "airnet/reader.hpp"
#include "airnet/reserved.hpp"

namespace airnet {

namespace {

using tokens = std::vector<std::string>;

constexpr auto whitespace = std::string_view{" \t\n\v\f\r"};

auto trim(std::string_view s) -> std::string_view
{
    const auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1u);
}

auto tokenize(std::string_view s) -> tokens
{
    auto result = tokens{};
    auto pos = s.find_first_not_of(whitespace);
    while (pos != std::string_view::npos) {
        const auto end = s.find_first_of(whitespace, pos);
        result.emplace_back(s.substr(pos, end - pos));
        pos = s.find_first_not_of(whitespace, end);
    }
    return result;
}

class line_reader
{
public:
    explicit line_reader(std::istream& is): in(is) {}

    /// @brief Gets the next non-blank line with any comment removed.
    /// @return Empty if the input is exhausted or ended by an end of input
    ///   line.
    auto next() -> std::optional<std::string>
    {
        if (ended) {
            return {};
        }
        auto line = std::string{};
        while (std::getline(in, line)) {
            ++number;
            if (const auto pos = line.find(reserved::comment_prefix);
                pos != std::string::npos) {
                line.erase(pos);
            }
            const auto content = trim(line);
            if (content.empty()) {
                continue;
            }
            if (content.front() == reserved::end_of_input_prefix) {
                ended = true;
                return {};
            }
            return std::string{content};
        }
        return {};
    }

    /// @brief Gets the tokens of the next line which must exist.
    auto next_required(const std::string_view& what) -> tokens
    {
        const auto line = next();
        if (!line) {
            std::ostringstream os;
            os << "input ended before " << what;
            throw bad_network_input{number, os.str()};
        }
        return tokenize(*line);
    }

    [[nodiscard]] auto line_number() const noexcept -> std::size_t
    {
        return number;
    }

private:
    std::istream& in;
    std::size_t number{};
    bool ended{};
};

auto to_number(const std::string& token, std::size_t line) -> double
{
    auto value = 0.0;
    const auto first = token.data();
    const auto last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if ((ptr != last) || (ec != std::errc())) {
        std::ostringstream os;
        os << "line " << line << ": ";
        switch (ec) {
        case std::errc::result_out_of_range:
            os << std::quoted(token) << " out of range";
            break;
        default:
            os << std::quoted(token) << " not a number";
            break;
        }
        throw bad_network_input{line, os.str()};
    }
    return value;
}

auto to_count(const std::string& token, std::size_t line) -> std::size_t
{
    auto value = std::size_t{};
    const auto first = token.data();
    const auto last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if ((ptr != last) || (ec != std::errc())) {
        std::ostringstream os;
        os << "line " << line << ": " << std::quoted(token);
        os << " not a count";
        throw bad_network_input{line, os.str()};
    }
    return value;
}

auto require_fields(const tokens& data, std::size_t count,
                    const std::string_view& what, std::size_t line) -> void
{
    if (data.size() < count) {
        std::ostringstream os;
        os << "line " << line << ": " << what << " has " << data.size();
        os << " fields, needs at least " << count;
        throw bad_network_input{line, os.str()};
    }
}

/// @brief Names of the numeric fields of an element by input line.
/// @note The first line's fields follow the element's name and type.
struct element_layout
{
    element_type type;
    std::vector<std::vector<std::string_view>> lines;
};

/// @brief Field giving the number of fan performance curve lines.
constexpr auto range_count_field = std::string_view{"nr"};

auto find_layout(const std::string_view& type) -> const element_layout*
{
    static const auto layouts = std::vector<element_layout>{
        {element_type::plr, {{"init", "lam", "turb", "expt"}}},
        {element_type::dwc, {{"len", "dh", "area", "rgh"},
                             {"tdlc", "lflc", "ldlc", "init"}}},
        {element_type::qfr, {{"a", "b"}}},
        {element_type::dor, {{"init", "lam", "turb", "expt"},
                             {"dtmin", "ht", "wd", "cd"}}},
        {element_type::cfr, {{"flow"}}},
        {element_type::fan, {{"init", "lam", "turb", "expt"},
                             {"rdens", "fdf", "sop", "ltt",
                                 range_count_field, "mfl"}}},
        {element_type::cpf, {{"upo", "prmin", "ftyp"}}},
        {element_type::ckv, {{"dp0", "coeff"}}},
        {element_type::prv, {{"fpos", "cpos", "fneg", "cneg"}}},
    };
    const auto type_value = to_element_type(type);
    if (!type_value) {
        return nullptr;
    }
    for (auto&& layout: layouts) {
        if (layout.type == *type_value) {
            return &layout;
        }
    }
    return nullptr;
}

auto read_title(const std::string& line) -> title_record
{
    const auto content = std::string_view{line};
    const auto keyword = std::string_view{reserved::title_keyword};
    return title_record{std::string{trim(content.substr(keyword.size()))}};
}

auto read_node(const tokens& data, std::size_t line) -> node_record
{
    // node name type ht temp [pres]
    require_fields(data, 3u, "node", line);
    const auto& type = data[2];
    if (type != "v" && type != "c" && type != "a") {
        std::ostringstream os;
        os << "line " << line << ": node type " << std::quoted(type);
        os << " unrecognized, must be \"v\", \"c\", or \"a\"";
        throw bad_network_input{line, os.str()};
    }
    const auto variable = (type == "v");
    require_fields(data, variable? 5u: 6u, "node", line);
    auto result = node_record{};
    result.name = name{data[1]};
    result.type = type.front();
    result.ht = to_number(data[3], line);
    result.temp = to_number(data[4], line) + celsius_offset;
    if (data.size() > 5u) {
        result.pres = to_number(data[5], line);
    }
    return result;
}

auto read_element(const tokens& data, line_reader& reader) -> element_record
{
    // element name type fields... [continuation lines] [curve lines]
    const auto first_line = reader.line_number();
    require_fields(data, 3u, "element", first_line);
    const auto layout = find_layout(data[2]);
    if (!layout) {
        std::ostringstream os;
        os << "line " << first_line << ": element type ";
        os << std::quoted(data[2]) << " not recognized";
        throw bad_network_input{first_line, os.str()};
    }
    const auto what = std::string{"element "} + data[2];
    auto result = element_record{};
    result.name = name{data[1]};
    result.type = layout->type;
    auto range_count = std::size_t{};
    auto fields = data;
    auto offset = std::size_t{3};
    for (auto i = std::size_t{}; i < size(layout->lines); ++i) {
        if (i > 0u) {
            fields = reader.next_required(what + " continuation line");
            offset = 0u;
        }
        const auto& names = layout->lines[i];
        const auto line = reader.line_number();
        require_fields(fields, offset + size(names), what, line);
        for (auto j = std::size_t{}; j < size(names); ++j) {
            const auto& token = fields[offset + j];
            if (names[j] == range_count_field) {
                range_count = to_count(token, line);
                continue;
            }
            result.fields.emplace(std::string{names[j]},
                                  to_number(token, line));
        }
    }
    for (auto i = std::size_t{}; i < range_count; ++i) {
        const auto point = reader.next_required(what + " curve line");
        const auto line = reader.line_number();
        require_fields(point, 5u, what + " curve line", line);
        result.points.push_back(fan_point{
            to_number(point[0], line),
            to_number(point[1], line),
            to_number(point[2], line),
            to_number(point[3], line),
            to_number(point[4], line),
        });
    }
    return result;
}

auto read_link(const tokens& data, std::size_t line) -> link_record
{
    // link name node-1 ht-1 node-2 ht-2 element wind [wpmod]
    require_fields(data, 8u, "link", line);
    auto result = link_record{};
    result.name = name{data[1]};
    result.node1 = name{data[2]};
    result.ht1 = to_number(data[3], line);
    result.node2 = name{data[4]};
    result.ht2 = to_number(data[5], line);
    result.element = name{data[6]};
    if (data[7] != reserved::no_wind) {
        require_fields(data, 9u, "link with wind", line);
        result.wind = data[7];
        result.wpmod = to_number(data[8], line);
    }
    return result;
}

}

auto read_network(std::istream& is) -> std::vector<record>
{
    auto result = std::vector<record>{};
    auto reader = line_reader{is};
    auto have_title = false;
    while (const auto line = reader.next()) {
        const auto data = tokenize(*line);
        const auto& keyword = data.front();
        const auto number = reader.line_number();
        if (keyword == reserved::title_keyword) {
            if (have_title) {
                std::ostringstream os;
                os << "line " << number << ": found additional title";
                throw bad_network_input{number, os.str()};
            }
            have_title = true;
            result.emplace_back(read_title(*line));
        }
        else if (keyword == reserved::node_keyword) {
            result.emplace_back(read_node(data, number));
        }
        else if (keyword == reserved::element_keyword) {
            result.emplace_back(read_element(data, reader));
        }
        else if (keyword == reserved::link_keyword) {
            result.emplace_back(read_link(data, number));
        }
    }
    return result;
}

}
