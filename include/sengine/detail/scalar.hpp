#ifndef SENGINE_DETAIL_SCALAR_HPP
#define SENGINE_DETAIL_SCALAR_HPP

#include <cmath>
#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <spdlog/fmt/fmt.h>

namespace sengine
{

enum class Kind
{
    None,
    Boolean,
    Integer,
    Real,
    Text
};

constexpr std::string_view kind_name(Kind k) noexcept
{
    switch(k)
    {
    case Kind::None: return "none";
    case Kind::Boolean: return "boolean";
    case Kind::Integer: return "integer";
    case Kind::Real: return "real";
    case Kind::Text: return "text";
    }
    return "unknown";
}

struct none_t
{
    explicit constexpr none_t(int) noexcept {}
};

// Absence of a state: "no state yet", the machine's entry point.
inline constexpr none_t none{0};

namespace detail
{

template <class C>
concept character = std::same_as<C, char> || std::same_as<C, wchar_t> || std::same_as<C, char8_t> ||
                    std::same_as<C, char16_t> || std::same_as<C, char32_t>;

} // namespace detail

// Value used for both states and machine identifiers. Only text, integer and
// real values are valid keys; a boolean is representable so that it can be
// rejected when it reaches the dispatcher or a store.
class Scalar
{
public:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    Scalar() noexcept = default;
    Scalar(none_t) noexcept {}
    Scalar(bool v) : value_(v) {}

    template <std::integral I>
        requires(!std::same_as<I, bool> && !detail::character<I>)
    Scalar(I v) : value_(narrow(v))
    {
    }

    // A character is neither a number nor a string; spell it as text.
    template <std::integral C>
        requires detail::character<C>
    Scalar(C) = delete;

    template <std::floating_point F>
    Scalar(F v) : value_(static_cast<double>(v))
    {
    }

    Scalar(const char* v) : value_(std::string(v)) {}
    Scalar(std::string_view v) : value_(std::string(v)) {}
    Scalar(std::string v) : value_(std::move(v)) {}

    Kind kind() const noexcept
    {
        return static_cast<Kind>(value_.index());
    }

    bool is_none() const noexcept
    {
        return kind() == Kind::None;
    }

    // True for the kinds accepted as states and identifiers. NaN is excluded
    // since it never compares equal to itself.
    bool is_key() const noexcept
    {
        switch(kind())
        {
        case Kind::Integer:
        case Kind::Text: return true;
        case Kind::Real: return !std::isnan(as_real());
        default: return false;
        }
    }

    bool as_boolean() const
    {
        return std::get<bool>(value_);
    }
    std::int64_t as_integer() const
    {
        return std::get<std::int64_t>(value_);
    }
    double as_real() const
    {
        return std::get<double>(value_);
    }
    const std::string& as_text() const
    {
        return std::get<std::string>(value_);
    }

    const Storage& storage() const noexcept
    {
        return value_;
    }

    friend bool operator==(const Scalar&, const Scalar&) = default;

private:
    template <std::integral I>
    static std::int64_t narrow(I v)
    {
        if(std::cmp_greater(v, std::numeric_limits<std::int64_t>::max()))
        {
            throw std::out_of_range(fmt::format("integer {} does not fit a 64-bit signed state", v));
        }
        return static_cast<std::int64_t>(v);
    }

    Storage value_{};
};

using State = Scalar;
using Uid = Scalar;

inline std::string to_string(const Scalar& s)
{
    switch(s.kind())
    {
    case Kind::None: return "none";
    case Kind::Boolean: return s.as_boolean() ? "true" : "false";
    case Kind::Integer: return fmt::format("{}", s.as_integer());
    case Kind::Real: return fmt::format("{}", s.as_real());
    case Kind::Text: return fmt::format("'{}'", s.as_text());
    }
    return {};
}

} // namespace sengine

template <>
struct std::hash<sengine::Scalar>
{
    std::size_t operator()(const sengine::Scalar& s) const noexcept
    {
        return std::hash<sengine::Scalar::Storage>{}(s.storage());
    }
};

template <>
struct fmt::formatter<sengine::Scalar> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const sengine::Scalar& s, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return fmt::formatter<std::string_view>::format(sengine::to_string(s), ctx);
    }
};

#endif
