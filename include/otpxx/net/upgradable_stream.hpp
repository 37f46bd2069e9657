/*

upgradable_stream.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/net/tls_options.hpp>

namespace otpxx
{
namespace net
{

using otpxx::asio::any_io_executor;
using otpxx::asio::awaitable;
using otpxx::asio::tcp;
namespace ssl = otpxx::asio::ssl;

/**
Stable stream type that can be upgraded to TLS without changing the type.
**/
class upgradable_stream
{
public:
    using ssl_stream = ssl::stream<tcp::socket>;
    using executor_type = any_io_executor;
    using lowest_layer_type = std::remove_reference_t<decltype(std::declval<ssl_stream&>().lowest_layer())>;

    explicit upgradable_stream(executor_type executor)
        : stream_(tcp::socket(executor))
    {
    }

    executor_type get_executor()
    {
        return std::visit([](auto& stream) -> executor_type
        {
            return executor_type(stream.get_executor());
        }, stream_);
    }

    lowest_layer_type& lowest_layer()
    {
        return std::visit([](auto& stream) -> lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return std::holds_alternative<ssl_stream>(stream_);
    }

    template<typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_read_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    template<typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_write_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    /// Close the socket, ignoring errors. Used when a session is discarded.
    void close() noexcept
    {
        otpxx::asio::error_code ignored;
        lowest_layer().shutdown(tcp::socket::shutdown_both, ignored);
        lowest_layer().close(ignored);
    }

    /**
    Wrap the connected socket in TLS and run the client handshake.

    The context is expected to be configured already (see configure_context);
    per-connection policy (SNI, peer and host verification) is applied here.
    **/
    awaitable<result_void> start_tls(ssl::context& context, std::string sni, const tls_options& opt)
    {
        if (is_tls())
            co_return ok();

        auto socket = std::move(std::get<tcp::socket>(stream_));
        stream_.template emplace<ssl_stream>(std::move(socket), context);
        auto& tls_stream = std::get<ssl_stream>(stream_);

        if (!sni.empty())
            SSL_set_tlsext_host_name(tls_stream.native_handle(), sni.c_str());

        if (opt.verify == verify_mode::peer)
        {
            tls_stream.set_verify_mode(ssl::verify_peer);
            if (opt.verify_host)
            {
                if (sni.empty())
                    co_return fail_void(errc::tls_verify_failed,
                        "TLS hostname verification requires a host name.");
                ssl::host_name_verification verifier(sni);
                tls_stream.set_verify_callback(
                    [verifier, allow_self_signed = opt.allow_self_signed](bool preverified, ssl::verify_context& ctx) mutable
                    {
                        if (!relax_verify(preverified, ctx, allow_self_signed))
                            return false;
                        return verifier(true, ctx);
                    });
            }
            else
            {
                tls_stream.set_verify_callback(
                    [allow_self_signed = opt.allow_self_signed](bool preverified, ssl::verify_context& ctx)
                    {
                        return relax_verify(preverified, ctx, allow_self_signed);
                    });
            }
        }
        else
        {
            tls_stream.set_verify_mode(ssl::verify_none);
        }

        otpxx::asio::error_code ec;
        co_await tls_stream.async_handshake(ssl::stream_base::client,
            otpxx::asio::redirect_error(otpxx::asio::use_awaitable, ec));
        if (ec)
            co_return fail_void(errc::tls_handshake_failed, "TLS handshake failed.", ec.message(), ec);
        co_return ok();
    }

private:
    static bool relax_verify(bool preverified, ssl::verify_context& ctx, bool allow_self_signed) noexcept
    {
        if (preverified)
            return true;
        if (!allow_self_signed)
            return false;

        X509_STORE_CTX* store_ctx = ctx.native_handle();
        if (store_ctx == nullptr)
            return false;

        const int err = X509_STORE_CTX_get_error(store_ctx);
        return err == X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN
            || err == X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT;
    }

    std::variant<tcp::socket, ssl_stream> stream_;
};

} // namespace net
} // namespace otpxx
