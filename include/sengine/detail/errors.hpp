#ifndef SENGINE_DETAIL_ERRORS_HPP
#define SENGINE_DETAIL_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include <sengine/detail/scalar.hpp>

namespace sengine
{

class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class InvalidStateKind : public Error
{
public:
    explicit InvalidStateKind(Scalar state)
        : Error(fmt::format("state {} is of kind {}: states must be text, integer or a real other than NaN, "
                            "and none is reserved for the entry point",
                            state, kind_name(state.kind()))),
          state_(std::move(state))
    {
    }

    const Scalar& state() const noexcept
    {
        return state_;
    }

private:
    Scalar state_;
};

class InvalidIdentifierKind : public Error
{
public:
    explicit InvalidIdentifierKind(Scalar identifier)
        : Error(fmt::format("identifier {} is of kind {}: identifiers must be text, integer or a real other than NaN",
                            identifier, kind_name(identifier.kind()))),
          identifier_(std::move(identifier))
    {
    }

    const Scalar& identifier() const noexcept
    {
        return identifier_;
    }

private:
    Scalar identifier_;
};

class DefaultAlreadyRegistered : public Error
{
public:
    explicit DefaultAlreadyRegistered(Scalar existing)
        : Error(fmt::format("an entry point handler is already registered for state {}", existing)),
          existing_(std::move(existing))
    {
    }

    const Scalar& state() const noexcept
    {
        return existing_;
    }

private:
    Scalar existing_;
};

class StateAlreadyBound : public Error
{
public:
    explicit StateAlreadyBound(Scalar state)
        : Error(fmt::format("state {} is already bound to a handler", state)),
          state_(std::move(state))
    {
    }

    const Scalar& state() const noexcept
    {
        return state_;
    }

private:
    Scalar state_;
};

class NoDefaultRegistered : public Error
{
public:
    NoDefaultRegistered()
        : Error("no entry point handler is registered; bind one with state_handler(state, true)")
    {
    }
};

class NoHandlerForState : public Error
{
public:
    explicit NoHandlerForState(Scalar state)
        : Error(fmt::format("state {} has no handler: handlers must only return states that are bound",
                            state)),
          state_(std::move(state))
    {
    }

    const Scalar& state() const noexcept
    {
        return state_;
    }

private:
    Scalar state_;
};

class OutsideHandlerContext : public Error
{
public:
    explicit OutsideHandlerContext(std::string accessor)
        : Error(fmt::format("{} is only available while a handler is executing", accessor)),
          accessor_(std::move(accessor))
    {
    }

    const std::string& accessor() const noexcept
    {
        return accessor_;
    }

private:
    std::string accessor_;
};

// Raised by remote stores for any transport, protocol or decoding failure.
// The underlying exception is kept in cause(); trace() flattens its nested chain.
class StoreUnavailable : public Error
{
public:
    StoreUnavailable(std::string operation, std::string key, std::string trace, std::exception_ptr cause)
        : Error(fmt::format("state store unavailable during {} {}: {}", operation, key, trace)),
          operation_(std::move(operation)),
          key_(std::move(key)),
          trace_(std::move(trace)),
          cause_(std::move(cause))
    {
    }

    const std::string& operation() const noexcept
    {
        return operation_;
    }
    const std::string& key() const noexcept
    {
        return key_;
    }
    const std::string& trace() const noexcept
    {
        return trace_;
    }
    const std::exception_ptr& cause() const noexcept
    {
        return cause_;
    }

private:
    std::string operation_;
    std::string key_;
    std::string trace_;
    std::exception_ptr cause_;
};

namespace detail
{

// "outer <- inner <- ..." for an exception and everything nested in it.
inline std::string describe(const std::exception& e)
{
    std::string out = e.what();
    try
    {
        std::rethrow_if_nested(e);
    } catch(const std::exception& inner)
    {
        out += " <- ";
        out += describe(inner);
    } catch(...)
    {
        out += " <- unknown exception";
    }
    return out;
}

} // namespace detail
} // namespace sengine

#endif
