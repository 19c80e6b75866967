#pragma once

#include <sengine/detail/dispatcher_impl.hpp>
#include <sengine/detail/errors.hpp>
#include <sengine/detail/policy.hpp>
#include <sengine/detail/scalar.hpp>

namespace sengine
{

template <typename... Inputs>
using Dispatcher = DispatcherImpl<policy::copy, Inputs...>;

template <typename... Inputs>
using MoveDispatcher = DispatcherImpl<policy::move, Inputs...>;

} // namespace sengine
