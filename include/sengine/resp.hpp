#pragma once

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <spdlog/fmt/fmt.h>

#include <sengine/detail/log.hpp>
#include <sengine/store.hpp>

namespace sengine
{

// Reply that does not follow RESP2, or one the issued command cannot produce.
class ProtocolError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// "-ERR ..." reply from the server.
class ReplyError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct Endpoint
{
    std::string host = "127.0.0.1";
    std::uint16_t port = 6379;
    std::string username;
    std::string password;
    int database = 0;

    // Accepts "host", "host:port", "[v6addr]:port" and
    // "redis://[[user]:password@]host[:port][/db]".
    static Endpoint parse(std::string_view url)
    {
        Endpoint ep;
        std::string_view rest = url;

        constexpr std::string_view scheme = "redis://";
        if(rest.starts_with(scheme))
        {
            rest.remove_prefix(scheme.size());
        }
        else if(rest.find("://") != std::string_view::npos)
        {
            throw std::invalid_argument(fmt::format("unsupported scheme in '{}'", url));
        }

        if(auto slash = rest.find('/'); slash != std::string_view::npos)
        {
            const auto db = rest.substr(slash + 1);
            rest = rest.substr(0, slash);
            if(!db.empty())
            {
                ep.database = static_cast<int>(parse_unsigned(url, db, 1 << 16));
            }
        }

        if(auto at = rest.rfind('@'); at != std::string_view::npos)
        {
            const auto credentials = rest.substr(0, at);
            rest = rest.substr(at + 1);
            if(auto colon = credentials.find(':'); colon != std::string_view::npos)
            {
                ep.username = std::string(credentials.substr(0, colon));
                ep.password = std::string(credentials.substr(colon + 1));
            }
            else
            {
                ep.password = std::string(credentials);
            }
        }

        std::optional<std::string_view> port;
        if(rest.starts_with('['))
        {
            const auto close = rest.find(']');
            if(close == std::string_view::npos)
            {
                throw std::invalid_argument(fmt::format("unterminated address in '{}'", url));
            }
            ep.host = std::string(rest.substr(1, close - 1));
            rest = rest.substr(close + 1);
            if(!rest.empty())
            {
                if(rest.front() != ':')
                {
                    throw std::invalid_argument(fmt::format("unexpected text after address in '{}'", url));
                }
                port = rest.substr(1);
            }
        }
        else if(auto colon = rest.rfind(':'); colon != std::string_view::npos)
        {
            ep.host = std::string(rest.substr(0, colon));
            port = rest.substr(colon + 1);
        }
        else
        {
            ep.host = std::string(rest);
        }

        if(ep.host.empty())
        {
            throw std::invalid_argument(fmt::format("no host in '{}'", url));
        }
        if(port)
        {
            const auto value = parse_unsigned(url, *port, 65535);
            if(value == 0)
            {
                throw std::invalid_argument(fmt::format("port out of range in '{}'", url));
            }
            ep.port = static_cast<std::uint16_t>(value);
        }
        return ep;
    }

    std::string address() const
    {
        if(host.find(':') != std::string::npos)
        {
            return fmt::format("[{}]:{}", host, port);
        }
        return fmt::format("{}:{}", host, port);
    }

private:
    static unsigned long parse_unsigned(std::string_view url, std::string_view text, unsigned long max)
    {
        unsigned long value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if(text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || value > max)
        {
            throw std::invalid_argument(fmt::format("invalid number '{}' in '{}'", text, url));
        }
        return value;
    }
};

struct RespOptions
{
    Endpoint endpoint{};
    std::chrono::milliseconds connect_timeout{1000};
    // Applies to every send and receive; zero blocks indefinitely.
    std::chrono::milliseconds io_timeout{1000};
};

// Blocking RESP2 client over one TCP connection. Not thread-safe.
class RespClient final : public KeyValueClient
{
public:
    explicit RespClient(RespOptions options = {}) : options_(std::move(options)) {}

    ~RespClient() override
    {
        close();
    }

    RespClient(const RespClient&) = delete;
    RespClient& operator=(const RespClient&) = delete;

    std::optional<std::string> get(const std::string& key) override
    {
        auto reply = command({"GET", key});
        if(reply.type == Reply::Type::Nil)
        {
            return std::nullopt;
        }
        if(reply.type != Reply::Type::Bulk)
        {
            throw ProtocolError("GET expects a bulk string reply");
        }
        return std::move(reply.text);
    }

    void set(const std::string& key, const std::string& value) override
    {
        expect_ok("SET", command({"SET", key, value}));
    }

    void del(const std::string& key) override
    {
        auto reply = command({"DEL", key});
        if(reply.type != Reply::Type::Integer)
        {
            throw ProtocolError("DEL expects an integer reply");
        }
    }

    bool connected() const noexcept
    {
        return fd_ >= 0;
    }

    void close() noexcept
    {
        if(fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
        buffer_.clear();
    }

    const RespOptions& options() const noexcept
    {
        return options_;
    }

private:
    struct Reply
    {
        enum class Type
        {
            Status,
            Integer,
            Bulk,
            Nil
        };

        Type type = Type::Nil;
        std::string text{};
        long long integer = 0;
    };

    Reply command(std::initializer_list<std::string_view> args)
    {
        ensure_connected();
        return roundtrip(args);
    }

    Reply roundtrip(std::initializer_list<std::string_view> args)
    {
        try
        {
            write_all(serialize(args));
            return read_reply();
        } catch(const ReplyError&)
        {
            throw;
        } catch(...)
        {
            // The stream position is unknown; start over on the next command.
            close();
            throw;
        }
    }

    static std::string serialize(std::initializer_list<std::string_view> args)
    {
        std::string out = fmt::format("*{}\r\n", args.size());
        for(auto arg : args)
        {
            out += fmt::format("${}\r\n", arg.size());
            out.append(arg);
            out += "\r\n";
        }
        return out;
    }

    void ensure_connected()
    {
        if(fd_ >= 0)
        {
            return;
        }
        const auto& ep = options_.endpoint;

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* found = nullptr;
        const auto service = std::to_string(ep.port);
        if(int rc = ::getaddrinfo(ep.host.c_str(), service.c_str(), &hints, &found); rc != 0)
        {
            throw std::runtime_error(fmt::format("resolve {}: {}", ep.address(), ::gai_strerror(rc)));
        }
        std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(found, &::freeaddrinfo);

        int last_error = EHOSTUNREACH;
        for(auto* ai = found; ai && fd_ < 0; ai = ai->ai_next)
        {
            fd_ = connect_one(*ai, last_error);
        }
        if(fd_ < 0)
        {
            throw std::system_error(last_error, std::generic_category(), fmt::format("connect {}", ep.address()));
        }
        log::logger().info("connected to key-value service at {}", ep.address());

        try
        {
            handshake();
        } catch(...)
        {
            close();
            throw;
        }
    }

    int connect_one(const addrinfo& ai, int& error) const
    {
        int fd = ::socket(ai.ai_family, ai.ai_socktype | SOCK_CLOEXEC, ai.ai_protocol);
        if(fd < 0)
        {
            error = errno;
            return -1;
        }

        const int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        if(::connect(fd, ai.ai_addr, ai.ai_addrlen) < 0)
        {
            if(errno != EINPROGRESS)
            {
                error = errno;
                ::close(fd);
                return -1;
            }
            pollfd pfd{fd, POLLOUT, 0};
            int ready = 0;
            do
            {
                ready = ::poll(&pfd, 1, static_cast<int>(options_.connect_timeout.count()));
            } while(ready < 0 && errno == EINTR);
            if(ready <= 0)
            {
                error = ready == 0 ? ETIMEDOUT : errno;
                ::close(fd);
                return -1;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if(so_error != 0)
            {
                error = so_error;
                ::close(fd);
                return -1;
            }
        }

        ::fcntl(fd, F_SETFL, flags);

        const auto ms = options_.io_timeout.count();
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(ms / 1000);
        tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        int one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        return fd;
    }

    void handshake()
    {
        const auto& ep = options_.endpoint;
        if(!ep.password.empty())
        {
            if(ep.username.empty())
            {
                expect_ok("AUTH", roundtrip({"AUTH", ep.password}));
            }
            else
            {
                expect_ok("AUTH", roundtrip({"AUTH", ep.username, ep.password}));
            }
        }
        if(ep.database != 0)
        {
            const auto db = std::to_string(ep.database);
            expect_ok("SELECT", roundtrip({"SELECT", db}));
        }
    }

    static void expect_ok(std::string_view command, const Reply& reply)
    {
        if(reply.type != Reply::Type::Status || reply.text != "OK")
        {
            throw ProtocolError(fmt::format("{} expects +OK", command));
        }
    }

    [[noreturn]] void throw_io_error(std::string_view operation) const
    {
        const int code = (errno == EAGAIN || errno == EWOULDBLOCK) ? ETIMEDOUT : errno;
        throw std::system_error(code, std::generic_category(),
                                fmt::format("{} {}", operation, options_.endpoint.address()));
    }

    void write_all(const std::string& data)
    {
        std::size_t sent = 0;
        while(sent < data.size())
        {
            const auto n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if(n < 0)
            {
                if(errno == EINTR)
                {
                    continue;
                }
                throw_io_error("send");
            }
            sent += static_cast<std::size_t>(n);
        }
    }

    void fill()
    {
        char chunk[4096];
        for(;;)
        {
            const auto n = ::recv(fd_, chunk, sizeof(chunk), 0);
            if(n > 0)
            {
                buffer_.append(chunk, static_cast<std::size_t>(n));
                return;
            }
            if(n == 0)
            {
                throw std::system_error(ECONNRESET, std::generic_category(),
                                        fmt::format("recv {}: connection closed by peer",
                                                    options_.endpoint.address()));
            }
            if(errno != EINTR)
            {
                throw_io_error("recv");
            }
        }
    }

    std::string read_line()
    {
        for(;;)
        {
            if(auto pos = buffer_.find("\r\n"); pos != std::string::npos)
            {
                std::string line = buffer_.substr(0, pos);
                buffer_.erase(0, pos + 2);
                return line;
            }
            fill();
        }
    }

    std::string read_exact(std::size_t n)
    {
        while(buffer_.size() < n + 2)
        {
            fill();
        }
        if(buffer_.compare(n, 2, "\r\n") != 0)
        {
            throw ProtocolError("bulk string is not terminated by CRLF");
        }
        std::string out = buffer_.substr(0, n);
        buffer_.erase(0, n + 2);
        return out;
    }

    static long long parse_integer(std::string_view text)
    {
        long long value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if(text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
        {
            throw ProtocolError(fmt::format("malformed integer '{}' in reply", text));
        }
        return value;
    }

    Reply read_reply()
    {
        const auto line = read_line();
        if(line.empty())
        {
            throw ProtocolError("empty reply line");
        }
        const std::string_view body = std::string_view(line).substr(1);
        switch(line.front())
        {
        case '+': return Reply{Reply::Type::Status, std::string(body)};
        case '-': throw ReplyError(std::string(body));
        case ':': return Reply{Reply::Type::Integer, {}, parse_integer(body)};
        case '$':
        {
            const auto len = parse_integer(body);
            if(len < 0)
            {
                return Reply{Reply::Type::Nil};
            }
            if(len > max_bulk_length)
            {
                throw ProtocolError(fmt::format("bulk reply of {} bytes exceeds the {} byte limit", len,
                                                max_bulk_length));
            }
            return Reply{Reply::Type::Bulk, read_exact(static_cast<std::size_t>(len))};
        }
        default: break;
        }
        throw ProtocolError(fmt::format("unsupported reply type '{}'", line.front()));
    }

    // Server-side proto-max-bulk-len default.
    static constexpr long long max_bulk_length = 512LL * 1024 * 1024;

    RespOptions options_;
    int fd_ = -1;
    std::string buffer_;
};

} // namespace sengine
