//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcphost/SSETransport.cpp
// Purpose: Streamable HTTP MCP client transport using Boost.Beast coroutines (HTTP and HTTPS)
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <mutex>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/JsonRpcMessageRouter.h"
#include "mcphost/PendingRequests.h"
#include "mcphost/SSETransport.hpp"
#include "mcphost/errors/Errors.h"

namespace mcphost {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
constexpr const char* kSessionHeader = "Mcp-Session-Id";
constexpr std::chrono::milliseconds kKillPollInterval{50};

template <typename StringView>
std::string toStdString(const StringView& sv) {
    return std::string(sv.data(), sv.size());
}
} // namespace

std::vector<std::string> ParseSseEvents(const std::string& body) {
    std::vector<std::string> events;
    std::string data;
    bool haveData = false;
    auto flush = [&]() {
        if (haveData) {
            events.push_back(data);
        }
        data.clear();
        haveData = false;
    };

    std::size_t pos = 0;
    while (pos <= body.size()) {
        std::size_t nl = body.find('\n', pos);
        std::string line = body.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            flush();
        } else if (line[0] != ':') {
            std::string field = line;
            std::string value;
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                field = line.substr(0, colon);
                value = line.substr(colon + 1);
                if (!value.empty() && value[0] == ' ') {
                    value.erase(0, 1);
                }
            }
            if (field == "data") {
                if (haveData) {
                    data.push_back('\n');
                }
                data += value;
                haveData = true;
            }
        }
        if (nl == std::string::npos) {
            break;
        }
        pos = nl + 1;
    }
    flush();
    return events;
}

class SSETransport::Impl {
public:
    //==========================================================================================================
    // HttpExchange
    // Purpose: What one POST produced: status, content type, body and any session id header.
    //==========================================================================================================
    struct HttpExchange {
        unsigned int status{0};
        std::string contentType;
        std::string body;
        std::string sessionId;
    };

    struct UrlParts {
        std::string scheme;
        std::string host;
        std::string port;
        std::string path;
    };

    SSETransport::Options opts;
    UrlParts url;

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx; // present when https
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;

    std::atomic<bool> killed{false};
    std::atomic<bool> reachable{true};
    std::atomic<int64_t> requestCounter{0};
    std::atomic<uint64_t> requestTimeoutMs;

    mutable std::mutex sessionMutex;
    std::string sessionId;

    std::mutex handlerMutex;
    ITransport::NotificationHandler notificationHandler;
    RouterHandlers routerHandlers;
    std::unique_ptr<IJsonRpcMessageRouter> router{MakeDefaultJsonRpcMessageRouter()};
    PendingRequests pending;

    explicit Impl(const SSETransport::Options& o)
        : opts(o), url(parseUrl(o.url)), requestTimeoutMs(ResolveRequestTimeoutMs(o.requestTimeoutMs)) {
        if (url.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
            const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
            try {
                if (userProvidedCA) {
                    if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                    if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
                } else {
                    sslCtx->set_default_verify_paths();
                }
            } catch (const boost::system::system_error& e) {
                throw McpException(ErrorKind::TransportError,
                                   fmt::format("HTTPS: failed to load trust store for '{}': {}", opts.url, e.what()));
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }

        routerHandlers.requestHandler = AnswerServerRequest;
        routerHandlers.notificationHandler = [this](const JSONRPCNotification& n) {
            ITransport::NotificationHandler h;
            {
                std::lock_guard<std::mutex> lk(handlerMutex);
                h = notificationHandler;
            }
            if (!h) {
                LOG_DEBUG("SSETransport: dropping notification '{}' (no handler)", n.method);
                return;
            }
            try {
                h(n);
            } catch (const std::exception& e) {
                LOG_ERROR("SSETransport: notification handler threw: {}", e.what());
            }
        };

        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("SSETransport: io thread terminated: {}", e.what());
            }
        });
    }

    ~Impl() {
        if (workGuard) {
            workGuard->reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    //==========================================================================================================
    // parseUrl
    // Purpose: Splits scheme://host[:port][/path]. Only http and https are accepted.
    // Throws:
    //   McpException(TransportError) on anything else.
    //==========================================================================================================
    static UrlParts parseUrl(const std::string& raw) {
        UrlParts parts;
        std::size_t schemeEnd = raw.find("://");
        if (schemeEnd == std::string::npos) {
            throw McpException(ErrorKind::TransportError, fmt::format("Invalid MCP server URL '{}': missing scheme", raw));
        }
        parts.scheme = raw.substr(0, schemeEnd);
        if (parts.scheme != "http" && parts.scheme != "https") {
            throw McpException(ErrorKind::TransportError,
                               fmt::format("Invalid MCP server URL '{}': unsupported scheme '{}'", raw, parts.scheme));
        }
        const std::size_t pos = schemeEnd + 3;

        std::size_t slash = raw.find('/', pos);
        std::string hostPort;
        if (slash == std::string::npos) {
            hostPort = raw.substr(pos);
            parts.path = "/";
        } else {
            hostPort = raw.substr(pos, slash - pos);
            parts.path = raw.substr(slash);
        }

        std::size_t colon = hostPort.rfind(':');
        if (colon == std::string::npos || hostPort.find(']', colon) != std::string::npos) {
            parts.host = hostPort;
            parts.port = parts.scheme == "https" ? "443" : "80";
        } else {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
        }
        if (parts.host.size() > 2 && parts.host.front() == '[' && parts.host.back() == ']') {
            parts.host = parts.host.substr(1, parts.host.size() - 2);
        }
        if (parts.host.empty() || parts.port.empty() ||
            parts.port.find_first_not_of("0123456789") != std::string::npos) {
            throw McpException(ErrorKind::TransportError, fmt::format("Invalid MCP server URL '{}'", raw));
        }
        return parts;
    }

    std::string currentSessionId() const {
        std::lock_guard<std::mutex> lk(sessionMutex);
        return sessionId;
    }

    http::request<http::string_body> buildRequest(const std::string& body) const {
        http::request<http::string_body> req{http::verb::post, url.path, 11};
        req.set(http::field::host, url.host);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json, text/event-stream");
        req.set(http::field::connection, "close");
        const std::string sid = currentSessionId();
        if (!sid.empty()) {
            req.set(kSessionHeader, sid);
        }
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    static HttpExchange toExchange(http::response<http::string_body>& res) {
        HttpExchange ex;
        ex.status = res.result_int();
        ex.contentType = toStdString(res[http::field::content_type]);
        ex.sessionId = toStdString(res[kSessionHeader]);
        ex.body = std::move(res.body());
        return ex;
    }

    // Coroutine: POST one JSON-RPC payload and collect the whole reply. Errors propagate to the completion handler.
    net::awaitable<HttpExchange> coExchange(const std::string body) {
        auto req = buildRequest(body);
        const auto readTimeout = std::chrono::milliseconds(requestTimeoutMs.load());

        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);

        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        if (url.scheme == "https") {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                LOG_WARN("SSETransport: failed to set SNI hostname '{}'", url.host);
            }
            (void)::SSL_set1_host(stream.native_handle(), url.host.c_str());
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            stream.next_layer().expires_after(readTimeout);
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.shutdown(ec);
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);

            stream.expires_after(readTimeout);
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        co_return toExchange(res);
    }

    void noteSession(const HttpExchange& ex) {
        if (ex.sessionId.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lk(sessionMutex);
        if (sessionId != ex.sessionId) {
            LOG_DEBUG("SSETransport: session id {}", ex.sessionId);
            sessionId = ex.sessionId;
        }
    }

    std::vector<std::string> splitBody(const HttpExchange& ex) const {
        if (ex.contentType.find("text/event-stream") != std::string::npos) {
            return ParseSseEvents(ex.body);
        }
        const auto first = ex.body.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return {};
        }
        if (ex.body[first] != '[') {
            return {ex.body};
        }
        // JSON-RPC batch
        std::vector<std::string> messages;
        try {
            JSONValue batch = ParseJSON(ex.body);
            if (batch.IsArray()) {
                for (const auto& item : std::get<JSONValue::Array>(batch.value)) {
                    if (item) {
                        messages.push_back(SerializeJSON(*item));
                    }
                }
            }
        } catch (const std::runtime_error& e) {
            LOG_DEBUG("SSETransport: ignoring unparseable batch body: {}", e.what());
        }
        return messages;
    }

    void dispatchBody(const HttpExchange& ex) {
        for (const auto& message : splitBody(ex)) {
            auto reply = router->route(message, routerHandlers, [this](JSONRPCResponse&& r) {
                (void)pending.Resolve(std::move(r));
            });
            if (reply.has_value()) {
                postDetached(reply.value());
            }
        }
    }

    // Fire-and-forget POST (answers to server-initiated requests)
    void postDetached(const std::string& payload) {
        net::co_spawn(ioc, coExchange(payload), [this](std::exception_ptr ep, HttpExchange ex) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    LOG_WARN("SSETransport: failed to answer server request: {}", e.what());
                }
                return;
            }
            noteSession(ex);
        });
    }

    void onExchangeDone(const std::string& key, const std::string& method, std::exception_ptr ep, HttpExchange ex) {
        if (ep) {
            reachable.store(false);
            std::string reason = "unknown error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                reason = e.what();
            }
            (void)pending.Fail(key, std::make_exception_ptr(McpException(
                ErrorKind::TransportError,
                fmt::format("SSE POST to '{}' for '{}' failed: {}", opts.url, method, reason))));
            return;
        }
        reachable.store(true);
        noteSession(ex);
        if (ex.status < 200 || ex.status >= 300) {
            (void)pending.Fail(key, std::make_exception_ptr(McpException(
                ErrorKind::TransportError,
                fmt::format("MCP SSE server returned HTTP {} for '{}': {}", ex.status, method, ex.body))));
            return;
        }
        dispatchBody(ex);
        // Still pending means the reply did not carry our response
        (void)pending.Fail(key, std::make_exception_ptr(McpException(
            ErrorKind::TransportError,
            fmt::format("MCP SSE reply for '{}' did not contain a JSON-RPC response", method))));
    }

    void joinIoThread() {
        if (!ioThread.joinable()) {
            return;
        }
        if (ioThread.get_id() == std::this_thread::get_id()) {
            ioThread.detach();
        } else {
            ioThread.join();
        }
    }
};

SSETransport::SSETransport(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {
    FUNC_SCOPE();
    LOG_INFO("SSETransport: endpoint {}://{}:{}{}", pImpl->url.scheme, pImpl->url.host, pImpl->url.port, pImpl->url.path);
}

SSETransport::~SSETransport() {
    FUNC_SCOPE();
    Kill();
}

JSONRPCResponse SSETransport::Request(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    if (pImpl->killed.load()) {
        throw McpException(ErrorKind::TransportClosed,
                           fmt::format("MCP transport for '{}' has been killed", pImpl->opts.url));
    }
    const int64_t id = ++pImpl->requestCounter;
    const std::string key = IdToKey(JSONRPCId{id});
    auto fut = pImpl->pending.Register(key);
    JSONRPCRequest request(id, method, std::move(params));
    LOG_DEBUG("SSETransport: -> {} (id {}) {}", method, key, pImpl->opts.url);

    Impl* impl = pImpl.get();
    net::co_spawn(impl->ioc, impl->coExchange(request.Serialize()),
        [impl, key, method](std::exception_ptr ep, Impl::HttpExchange ex) {
            impl->onExchangeDone(key, method, ep, std::move(ex));
        });
    return pImpl->pending.Await(key, fut, method, std::chrono::milliseconds(pImpl->requestTimeoutMs.load()));
}

void SSETransport::Notify(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    if (pImpl->killed.load()) {
        throw McpException(ErrorKind::TransportClosed,
                           fmt::format("MCP transport for '{}' has been killed", pImpl->opts.url));
    }
    JSONRPCNotification notification(method, std::move(params));
    LOG_DEBUG("SSETransport: -> {} (notification) {}", method, pImpl->opts.url);

    auto done = std::make_shared<std::promise<Impl::HttpExchange>>();
    auto fut = done->get_future();
    net::co_spawn(pImpl->ioc, pImpl->coExchange(notification.Serialize()),
        [done](std::exception_ptr ep, Impl::HttpExchange ex) {
            if (ep) {
                done->set_exception(ep);
            } else {
                done->set_value(std::move(ex));
            }
        });
    const auto timeout = std::chrono::milliseconds(pImpl->requestTimeoutMs.load());
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    // Kill() stops the io_context without completing this POST, so watch the flag while waiting
    while (fut.wait_for(kKillPollInterval) != std::future_status::ready) {
        if (pImpl->killed.load()) {
            throw McpException(ErrorKind::TransportClosed,
                               fmt::format("MCP transport for '{}' was killed", pImpl->opts.url));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw McpException(ErrorKind::Timeout,
                               fmt::format("MCP notification '{}' timed out after {}ms", method, timeout.count()));
        }
    }
    Impl::HttpExchange ex;
    try {
        ex = fut.get();
    } catch (const std::exception& e) {
        pImpl->reachable.store(false);
        throw McpException(ErrorKind::TransportError,
                           fmt::format("SSE POST notification to '{}' for '{}' failed: {}", pImpl->opts.url, method, e.what()));
    }
    pImpl->reachable.store(true);
    pImpl->noteSession(ex);
    if (ex.status < 200 || ex.status >= 300) {
        LOG_WARN("SSETransport: notification '{}' returned HTTP {}", method, ex.status);
    }
}

bool SSETransport::IsAlive() {
    FUNC_SCOPE();
    return !pImpl->killed.load() && pImpl->reachable.load();
}

void SSETransport::Kill() {
    FUNC_SCOPE();
    if (pImpl->killed.exchange(true)) {
        return;
    }
    LOG_INFO("SSETransport: closing {}", pImpl->opts.url);
    if (pImpl->workGuard) {
        pImpl->workGuard->reset();
        pImpl->workGuard.reset();
    }
    pImpl->ioc.stop();
    pImpl->joinIoThread();
    pImpl->reachable.store(false);
    pImpl->pending.FailAll(fmt::format("MCP transport for '{}' was killed", pImpl->opts.url));
}

void SSETransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->requestTimeoutMs.store(timeoutMs);
}

std::string SSETransport::GetSessionId() const {
    FUNC_SCOPE();
    return pImpl->currentSessionId();
}

void SSETransport::SetNotificationHandler(NotificationHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

const std::string& SSETransport::GetUrl() const {
    return pImpl->opts.url;
}

} // namespace mcphost
