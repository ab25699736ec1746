#include "airnet/utility.hpp"

namespace airnet {

namespace {

struct null_streambuf: std::streambuf
{
    auto overflow(int ch) -> int override
    {
        return traits_type::not_eof(ch);
    }
};

}

auto null_ostream() -> std::ostream&
{
    static auto buf = null_streambuf{};
    static auto os = std::ostream{&buf};
    return os;
}

}
