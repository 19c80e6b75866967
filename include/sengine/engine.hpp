#pragma once

#include <concepts>
#include <memory>
#include <stdexcept>
#include <utility>

#include <sengine/core.hpp>
#include <sengine/store.hpp>

namespace sengine
{

// Dispatcher whose machines are addressed by identifier; the state of each
// machine lives in an owned StateStore between calls.
template <PolicyHasCallableTemplate CallablePolicy, typename... Inputs>
class ManagedEngineImpl
{
public:
    using Dispatcher_t = DispatcherImpl<CallablePolicy, Inputs...>;
    using Handler = typename Dispatcher_t::Handler;
    using Registrar = typename Dispatcher_t::Registrar;

    ManagedEngineImpl() : store_(std::make_unique<LocalStateStore>()) {}

    explicit ManagedEngineImpl(std::unique_ptr<StateStore> store) : store_(std::move(store))
    {
        if(!store_)
        {
            throw std::invalid_argument("managed engine requires a state store");
        }
    }

    Registrar state_handler(Scalar state, bool is_default = false)
    {
        return dispatcher_.state_handler(std::move(state), is_default);
    }

    Registrar default_handler(Scalar state)
    {
        return dispatcher_.default_handler(std::move(state));
    }

    void bind(Scalar state, Handler handler, bool is_default = false)
    {
        dispatcher_.bind(std::move(state), std::move(handler), is_default);
    }

    template <class... Args>
        requires std::invocable<Handler&, Args...>
    void execute(const Scalar& uid, Args&&... in)
    {
        require_identifier(uid);
        const auto current = store_->get(uid);
        persist(uid, dispatcher_.execute(current, std::forward<Args>(in)...));
    }

    // Runs from `seed` instead of the stored state. The seed is persisted
    // first, so a failing handler leaves the machine at the seed.
    template <class... Args>
        requires std::invocable<Handler&, Args...>
    void execute_from(const Scalar& uid, const Scalar& seed, Args&&... in)
    {
        require_identifier(uid);
        if(!seed.is_none() && !seed.is_key())
        {
            throw InvalidStateKind(seed);
        }
        persist(uid, seed);
        persist(uid, dispatcher_.execute(seed, std::forward<Args>(in)...));
    }

    Scalar state_of(const Scalar& uid) const
    {
        require_identifier(uid);
        return store_->get(uid);
    }

    void reset(const Scalar& uid)
    {
        require_identifier(uid);
        log::logger().debug("resetting machine {}", uid);
        store_->erase(uid);
    }

    const Scalar& current_state() const
    {
        return dispatcher_.current_state();
    }

    const Handler& current_handler() const
    {
        return dispatcher_.current_handler();
    }

    Dispatcher_t& dispatcher() noexcept
    {
        return dispatcher_;
    }
    const Dispatcher_t& dispatcher() const noexcept
    {
        return dispatcher_;
    }

    StateStore& store() noexcept
    {
        return *store_;
    }

private:
    void persist(const Scalar& uid, const Scalar& next)
    {
        if(dispatcher_.is_resting(next))
        {
            log::logger().debug("machine {} is at rest", uid);
            store_->erase(uid);
        }
        else
        {
            log::logger().debug("machine {} moved to {}", uid, next);
            store_->set(uid, next);
        }
    }

    Dispatcher_t dispatcher_{};
    std::unique_ptr<StateStore> store_;
};

template <typename... Inputs>
using ManagedEngine = ManagedEngineImpl<policy::copy, Inputs...>;

template <typename... Inputs>
using MoveManagedEngine = ManagedEngineImpl<policy::move, Inputs...>;

} // namespace sengine
