#ifndef SENGINE_DETAIL_CODEC_HPP
#define SENGINE_DETAIL_CODEC_HPP

#include <charconv>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <spdlog/fmt/fmt.h>

#include <sengine/detail/scalar.hpp>

namespace sengine
{
namespace detail
{

// Scalars travel to a key-value service as "<tag>:<body>", the tag being one
// of n, b, i, r, s so that 1, 1.0 and "1" stay distinct.
inline std::string encode(const Scalar& s)
{
    switch(s.kind())
    {
    case Kind::None: return "n:";
    case Kind::Boolean: return s.as_boolean() ? "b:1" : "b:0";
    case Kind::Integer: return fmt::format("i:{}", s.as_integer());
    case Kind::Real: return fmt::format("r:{}", s.as_real());
    case Kind::Text: return "s:" + s.as_text();
    }
    throw std::logic_error("unhandled scalar kind");
}

template <class Number>
Number parse_number(std::string_view raw, std::string_view body)
{
    Number value{};
    const auto* first = body.data();
    const auto* last = body.data() + body.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if(body.empty() || ec != std::errc{} || ptr != last)
    {
        throw std::invalid_argument(fmt::format("malformed number in stored value '{}'", raw));
    }
    return value;
}

inline Scalar decode(std::string_view raw)
{
    if(raw.size() < 2 || raw[1] != ':')
    {
        throw std::invalid_argument(fmt::format("stored value '{}' has no kind tag", raw));
    }
    const auto body = raw.substr(2);
    switch(raw[0])
    {
    case 'n':
        if(body.empty())
        {
            return Scalar{};
        }
        break;
    case 'b':
        if(body == "1" || body == "0")
        {
            return Scalar{body == "1"};
        }
        break;
    case 'i': return Scalar{parse_number<std::int64_t>(raw, body)};
    case 'r': return Scalar{parse_number<double>(raw, body)};
    case 's': return Scalar{std::string(body)};
    default: break;
    }
    throw std::invalid_argument(fmt::format("stored value '{}' is malformed", raw));
}

} // namespace detail
} // namespace sengine

#endif
