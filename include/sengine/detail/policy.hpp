#ifndef SENGINE_DETAIL_POLICY_HPP
#define SENGINE_DETAIL_POLICY_HPP

#include <functional>
#include <string_view>

#include <sengine/detail/scalar.hpp>

namespace sengine
{
namespace detail
{

// Storage for handlers. `Handler<Inputs...>` is what a dispatcher keeps per state.
struct policy_copy
{
    static constexpr std::string_view name = "copy";

    template <typename Sig>
    using Callable = std::function<Sig>;

    template <typename... Inputs>
    using Handler = Callable<Scalar(Inputs...)>;
};

// Accepts handlers that own move-only resources; they are bound with bind().
struct policy_move
{
    static constexpr std::string_view name = "move";

    template <typename Sig>
    using Callable = std::move_only_function<Sig>;

    template <typename... Inputs>
    using Handler = Callable<Scalar(Inputs...)>;
};

} // namespace detail

namespace policy
{

using copy = detail::policy_copy;
using move = detail::policy_move;

} // namespace policy
} // namespace sengine

#endif
