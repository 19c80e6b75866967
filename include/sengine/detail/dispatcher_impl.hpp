#ifndef SENGINE_DETAIL_DISPATCHER_IMPL_HPP
#define SENGINE_DETAIL_DISPATCHER_IMPL_HPP

#include <concepts>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include <sengine/detail/concepts.hpp>
#include <sengine/detail/context.hpp>
#include <sengine/detail/errors.hpp>
#include <sengine/detail/log.hpp>
#include <sengine/detail/policy.hpp>
#include <sengine/detail/scalar.hpp>

namespace sengine
{

template <PolicyHasCallableTemplate CallablePolicy, typename... Inputs>
class DispatcherImpl
{
public:
    using Handler = typename CallablePolicy::template Handler<Inputs...>;

    // Returned by state_handler(); applying it to a handler registers the
    // handler and hands it back unchanged.
    class Registrar
    {
        friend class DispatcherImpl;
        DispatcherImpl* owner_ = nullptr;
        Scalar state_{};
        bool is_default_ = false;

        Registrar(DispatcherImpl& owner, Scalar state, bool is_default)
            : owner_(&owner), state_(std::move(state)), is_default_(is_default) {}

    public:
        // Move-only handlers cannot be handed back; register those with bind().
        template <class F>
            requires HandlerFor<std::remove_cvref_t<F>, Inputs...> && std::constructible_from<Handler, F&>
        F operator()(F&& fn) const
        {
            owner_->bind(state_, Handler(fn), is_default_);
            return std::forward<F>(fn);
        }

        const Scalar& state() const noexcept
        {
            return state_;
        }
        bool is_default() const noexcept
        {
            return is_default_;
        }
    };

    DispatcherImpl() = default;

    Registrar state_handler(Scalar state, bool is_default = false)
    {
        return Registrar(*this, std::move(state), is_default);
    }

    Registrar default_handler(Scalar state)
    {
        return Registrar(*this, std::move(state), true);
    }

    void bind(Scalar state, Handler handler, bool is_default = false)
    {
        if(!state.is_key())
        {
            throw InvalidStateKind(std::move(state));
        }
        if(!handler)
        {
            throw std::invalid_argument("state handler must be callable");
        }

        if(is_default)
        {
            if(default_)
            {
                throw DefaultAlreadyRegistered(default_->state);
            }
            if(handlers_.contains(state))
            {
                throw StateAlreadyBound(std::move(state));
            }
            log::logger().debug("bound entry point handler for state {}", state);
            default_.emplace(DefaultEntry{std::move(state), std::move(handler)});
            return;
        }

        if(handlers_.contains(state) || (default_ && default_->state == state))
        {
            throw StateAlreadyBound(std::move(state));
        }
        log::logger().debug("bound handler for state {} ({} policy)", state, CallablePolicy::name);
        handlers_.emplace(std::move(state), std::move(handler));
    }

    // Runs the handler for `state` (the entry point for none or the default
    // key) and returns whatever it produced.
    template <class... Args>
        requires std::invocable<Handler&, Args...>
    Scalar execute(const Scalar& state, Args&&... in)
    {
        if(!state.is_none() && !state.is_key())
        {
            throw InvalidStateKind(state);
        }
        if(!default_)
        {
            throw NoDefaultRegistered{};
        }

        const Scalar* resolved = &default_->state;
        Handler* handler = &default_->handler;
        if(!is_resting(state))
        {
            auto it = handlers_.find(state);
            if(it == handlers_.end())
            {
                throw NoHandlerForState(state);
            }
            resolved = &it->first;
            handler = &it->second;
        }

        log::logger().debug("dispatching {} to handler of {}", state, *resolved);
        detail::ContextScope scope(this, *resolved, handler);
        return (*handler)(std::forward<Args>(in)...);
    }

    const Scalar& current_state() const
    {
        if(const auto* frame = detail::find_frame(this))
        {
            return *frame->state;
        }
        throw OutsideHandlerContext("current_state");
    }

    const Handler& current_handler() const
    {
        if(const auto* frame = detail::find_frame(this))
        {
            return *static_cast<const Handler*>(frame->handler);
        }
        throw OutsideHandlerContext("current_handler");
    }

    bool in_handler() const noexcept
    {
        return detail::find_frame(this) != nullptr;
    }

    bool has_default() const noexcept
    {
        return default_.has_value();
    }

    const Scalar& default_state() const
    {
        if(!default_)
        {
            throw NoDefaultRegistered{};
        }
        return default_->state;
    }

    // A resting state is one a managed machine does not need to persist.
    bool is_resting(const Scalar& state) const noexcept
    {
        return state.is_none() || (default_ && state == default_->state);
    }

    bool contains(const Scalar& state) const noexcept
    {
        return handlers_.contains(state) || (default_ && default_->state == state);
    }

    // Number of bound handlers, the entry point included.
    std::size_t size() const noexcept
    {
        return handlers_.size() + (default_ ? 1 : 0);
    }

private:
    struct DefaultEntry
    {
        Scalar state;
        Handler handler;
    };

    std::unordered_map<Scalar, Handler> handlers_;
    std::optional<DefaultEntry> default_{};
};

} // namespace sengine

#endif
