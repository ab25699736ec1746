#include <sstream> // for std::ostringstream
#include <stdexcept> // for std::invalid_argument

#include "airnet/name.hpp"

namespace airnet {

namespace {

auto describe(char c) -> std::string
{
    switch (c) {
    case ' ': return "a space";
    case '\t': return "a tab";
    case '\n': return "a newline";
    case '\v': return "a vertical tab";
    case '\f': return "a form feed";
    case '\r': return "a carriage return";
    }
    return std::string{"'"} + c + "'";
}

}

bad_name::bad_name(char badc, std::size_t pos, const std::string& what_arg):
    std::invalid_argument(what_arg), position_(pos), badchar_(badc)
{
    // Intentionally empty.
}

auto bad_name::badchar() const noexcept -> char
{
    return badchar_;
}

auto bad_name::position() const noexcept -> std::size_t
{
    return position_;
}

auto name_checker::operator()(std::string v) const -> std::string
{
    if (v.empty()) {
        throw std::invalid_argument{"name may not be empty"};
    }
    const auto found = v.find_first_of(denied);
    if (found != std::string::npos) {
        std::ostringstream os;
        os << "name may not contain " << describe(v[found]);
        os << " (at offset " << found << ")";
        throw bad_name{v[found], found, os.str()};
    }
    return v;
}

}
