#ifndef airnet_reserved_hpp
#define airnet_reserved_hpp

namespace airnet::reserved {

constexpr auto comment_prefix = '!';
constexpr auto end_of_input_prefix = '*';
constexpr auto no_wind = "null";

constexpr auto title_keyword = "title";
constexpr auto node_keyword = "node";
constexpr auto element_keyword = "element";
constexpr auto link_keyword = "link";

}

#endif /* airnet_reserved_hpp */
