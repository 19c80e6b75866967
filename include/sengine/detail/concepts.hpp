#ifndef SENGINE_DETAIL_CONCEPTS_HPP
#define SENGINE_DETAIL_CONCEPTS_HPP

#include <concepts>
#include <string_view>
#include <type_traits>

#include <sengine/detail/scalar.hpp>

namespace sengine
{

template <class F, class... Inputs>
concept HandlerFor =
    std::invocable<F&, Inputs...> &&
    std::convertible_to<std::invoke_result_t<F&, Inputs...>, Scalar>;

template <class T>
concept PolicyHasCallableTemplate = requires {
    typename T::template Callable<void()>;
    typename T::template Handler<>;
    { T::name } -> std::convertible_to<std::string_view>;
};

} // namespace sengine

#endif
