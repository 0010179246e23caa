//
//  HttpTransport.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <iostream>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include "HttpTransport.hpp"
#include "Util.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

#define USER_AGENT "hashlookup/1.0"

const std::optional<ServiceUrl>
ParseServiceUrl(
    const std::string_view Url
)
{
    ServiceUrl result;
    std::string_view rest;
    const std::string lower = Util::ToLower(Url);

    if (lower.starts_with("https://"))
    {
        result.Tls = true;
        result.Port = "443";
        rest = Url.substr(8);
    }
    else if (lower.starts_with("http://"))
    {
        result.Tls = false;
        result.Port = "80";
        rest = Url.substr(7);
    }
    else
    {
        return std::nullopt;
    }

    const size_t slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos)
    {
        result.Path = std::string(rest.substr(slash));
    }

    while (!result.Path.empty() && result.Path.back() == '/')
    {
        result.Path.pop_back();
    }

    const size_t colon = authority.find(':');
    if (colon != std::string_view::npos)
    {
        result.Port = std::string(authority.substr(colon + 1));
        authority = authority.substr(0, colon);
        if (result.Port.empty())
        {
            return std::nullopt;
        }
    }

    if (authority.empty())
    {
        return std::nullopt;
    }

    result.Host = std::string(authority);
    return result;
}

// Runs the context until the pending operation has completed or the
// timeout has passed. On timeout the operation is cancelled and its
// handler drained before returning false.
template <typename Cancel>
static const bool
RunWithTimeout(
    asio::io_context& Context,
    const bool& Complete,
    const std::chrono::milliseconds Timeout,
    Cancel&& CancelOperation
)
{
    Context.restart();
    Context.run_for(Timeout);
    if (Complete)
    {
        return true;
    }
    CancelOperation();
    Context.restart();
    Context.run();
    return false;
}

// The stream timer bounds each operation, so the context always runs dry
static void
RunToCompletion(
    asio::io_context& Context
)
{
    Context.restart();
    Context.run();
}

template <typename Stream>
static std::optional<HttpResponse>
Exchange(
    asio::io_context& Context,
    Stream& Connection,
    http::request<http::string_body>& Request,
    const std::chrono::milliseconds Timeout
)
{
    beast::error_code ec;

    beast::get_lowest_layer(Connection).expires_after(Timeout);
    http::async_write(
        Connection,
        Request,
        [&](beast::error_code Error, size_t) { ec = Error; }
    );
    RunToCompletion(Context);
    if (ec)
    {
        std::cerr << "Error: sending request failed: " << ec.message() << std::endl;
        return std::nullopt;
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> response;

    beast::get_lowest_layer(Connection).expires_after(Timeout);
    http::async_read(
        Connection,
        buffer,
        response,
        [&](beast::error_code Error, size_t) { ec = Error; }
    );
    RunToCompletion(Context);
    if (ec)
    {
        std::cerr << "Error: reading response failed: " << ec.message() << std::endl;
        return std::nullopt;
    }

    return HttpResponse{ response.result_int(), std::move(response.body()) };
}

std::optional<HttpResponse>
HttpsTransport::Request(
    const bool IsPost,
    const std::string& Target,
    const std::string& Body,
    const std::string& ContentType
)
{
    asio::io_context context;
    beast::error_code ec;
    bool complete = false;

    http::request<http::string_body> request{
        IsPost ? http::verb::post : http::verb::get,
        m_Url.Path + Target,
        11
    };
    request.set(http::field::host, m_Url.Host);
    request.set(http::field::user_agent, USER_AGENT);
    if (IsPost)
    {
        request.set(http::field::content_type, ContentType);
        request.body() = Body;
        request.prepare_payload();
    }

    tcp::resolver resolver(context);
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(
        m_Url.Host,
        m_Url.Port,
        [&](beast::error_code Error, tcp::resolver::results_type Results) {
            ec = Error;
            endpoints = std::move(Results);
            complete = true;
        }
    );
    if (!RunWithTimeout(context, complete, m_Timeout, [&]() { resolver.cancel(); }))
    {
        std::cerr << "Error: timed out resolving " << m_Url.Host << std::endl;
        return std::nullopt;
    }
    if (ec)
    {
        std::cerr << "Error: unable to resolve " << m_Url.Host << ": " << ec.message() << std::endl;
        return std::nullopt;
    }

    if (!m_Url.Tls)
    {
        beast::tcp_stream stream(context);
        stream.expires_after(m_Timeout);
        stream.async_connect(
            endpoints,
            [&](beast::error_code Error, tcp::endpoint) { ec = Error; }
        );
        RunToCompletion(context);
        if (ec)
        {
            std::cerr << "Error: unable to connect to " << m_Url.Host << ": " << ec.message() << std::endl;
            return std::nullopt;
        }

        auto response = Exchange(context, stream, request, m_Timeout);
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    ssl::context tls(ssl::context::tls_client);
    tls.set_default_verify_paths(ec);
    if (ec)
    {
        std::cerr << "Warning: unable to load system certificates: " << ec.message() << std::endl;
    }
    tls.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(context, tls);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), m_Url.Host.c_str()))
    {
        std::cerr << "Error: unable to set SNI host name " << m_Url.Host << std::endl;
        return std::nullopt;
    }
    stream.set_verify_callback(ssl::host_name_verification(m_Url.Host));

    beast::get_lowest_layer(stream).expires_after(m_Timeout);
    beast::get_lowest_layer(stream).async_connect(
        endpoints,
        [&](beast::error_code Error, tcp::endpoint) { ec = Error; }
    );
    RunToCompletion(context);
    if (ec)
    {
        std::cerr << "Error: unable to connect to " << m_Url.Host << ": " << ec.message() << std::endl;
        return std::nullopt;
    }

    beast::get_lowest_layer(stream).expires_after(m_Timeout);
    stream.async_handshake(
        ssl::stream_base::client,
        [&](beast::error_code Error) { ec = Error; }
    );
    RunToCompletion(context);
    if (ec)
    {
        std::cerr << "Error: TLS handshake with " << m_Url.Host << " failed: " << ec.message() << std::endl;
        return std::nullopt;
    }

    auto response = Exchange(context, stream, request, m_Timeout);

    // Servers commonly drop the connection without a close_notify
    beast::get_lowest_layer(stream).expires_after(m_Timeout);
    stream.async_shutdown([](beast::error_code) {});
    RunToCompletion(context);

    return response;
}

std::optional<HttpResponse>
HttpsTransport::Get(
    const std::string& Target
)
{
    return Request(false, Target, "", "");
}

std::optional<HttpResponse>
HttpsTransport::Post(
    const std::string& Target,
    const std::string& Body,
    const std::string& ContentType
)
{
    return Request(true, Target, Body, ContentType);
}
