#ifndef airnet_reader_hpp
#define airnet_reader_hpp

#include <istream>
#include <vector>

#include "airnet/record.hpp"

namespace airnet {

/// @brief Reads the records of a network description.
/// @details Input is line oriented. Blank lines are skipped, a line whose
///   first non-blank character is <code>*</code> ends the input, text from a
///   <code>!</code> to the end of its line is a comment, and lines not
///   beginning with one of the keywords <code>title</code>,
///   <code>node</code>, <code>element</code> or <code>link</code> are
///   ignored. Node temperatures are read in degrees Celsius and returned in
///   kelvin.
/// @throws bad_network_input if the input is malformed. The exception gives
///   the one-based line number of the offending line.
auto read_network(std::istream& is) -> std::vector<record>;

}

#endif /* airnet_reader_hpp */
