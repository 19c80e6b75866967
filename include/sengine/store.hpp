#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <sengine/detail/codec.hpp>
#include <sengine/detail/errors.hpp>
#include <sengine/detail/log.hpp>
#include <sengine/detail/scalar.hpp>

namespace sengine
{

inline void require_identifier(const Scalar& uid)
{
    if(!uid.is_key())
    {
        throw InvalidIdentifierKind(uid);
    }
}

// Persistence for managed machines: identifier -> last known state.
class StateStore
{
public:
    virtual ~StateStore() = default;

    // Stored state of `uid`, or none when nothing is stored.
    virtual Scalar get(const Scalar& uid) = 0;
    virtual void set(const Scalar& uid, const Scalar& state) = 0;
    // No-op when nothing is stored for `uid`.
    virtual void erase(const Scalar& uid) = 0;
};

class LocalStateStore final : public StateStore
{
public:
    Scalar get(const Scalar& uid) override
    {
        if(auto it = states_.find(uid); it != states_.end())
        {
            return it->second;
        }
        return Scalar{};
    }

    void set(const Scalar& uid, const Scalar& state) override
    {
        require_identifier(uid);
        states_.insert_or_assign(uid, state);
    }

    void erase(const Scalar& uid) override
    {
        states_.erase(uid);
    }

    bool contains(const Scalar& uid) const noexcept
    {
        return states_.contains(uid);
    }
    std::size_t size() const noexcept
    {
        return states_.size();
    }
    void clear() noexcept
    {
        states_.clear();
    }

private:
    std::unordered_map<Scalar, Scalar> states_;
};

// Minimal contract of an external key-value service. Implementations report
// every failure by throwing.
class KeyValueClient
{
public:
    virtual ~KeyValueClient() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void del(const std::string& key) = 0;
};

class RemoteStateStore final : public StateStore
{
public:
    static constexpr std::string_view default_prefix = "sengine:";

    explicit RemoteStateStore(std::unique_ptr<KeyValueClient> client,
                              std::string key_prefix = std::string(default_prefix))
        : client_(std::move(client)), prefix_(std::move(key_prefix))
    {
        if(!client_)
        {
            throw std::invalid_argument("remote state store requires a key-value client");
        }
    }

    Scalar get(const Scalar& uid) override
    {
        if(!uid.is_key())
        {
            return Scalar{};
        }
        const auto key = key_for(uid);
        return guarded("GET", key, [&] {
            auto raw = client_->get(key);
            log::logger().debug("GET {} -> {}", key, raw ? *raw : std::string("nil"));
            return raw ? detail::decode(*raw) : Scalar{};
        });
    }

    void set(const Scalar& uid, const Scalar& state) override
    {
        require_identifier(uid);
        const auto key = key_for(uid);
        guarded("SET", key, [&] {
            client_->set(key, detail::encode(state));
            log::logger().debug("SET {} {}", key, state);
        });
    }

    void erase(const Scalar& uid) override
    {
        if(!uid.is_key())
        {
            return;
        }
        const auto key = key_for(uid);
        guarded("DEL", key, [&] {
            client_->del(key);
            log::logger().debug("DEL {}", key);
        });
    }

    std::string key_for(const Scalar& uid) const
    {
        return prefix_ + detail::encode(uid);
    }

    const std::string& key_prefix() const noexcept
    {
        return prefix_;
    }

    KeyValueClient& client() noexcept
    {
        return *client_;
    }

private:
    template <class Fn>
    static auto guarded(const char* operation, const std::string& key, Fn&& fn) -> decltype(fn())
    {
        try
        {
            return fn();
        } catch(const std::exception& e)
        {
            auto trace = detail::describe(e);
            log::logger().warn("{} {} failed: {}", operation, key, trace);
            throw StoreUnavailable(operation, key, std::move(trace), std::current_exception());
        }
    }

    std::unique_ptr<KeyValueClient> client_;
    std::string prefix_;
};

} // namespace sengine
