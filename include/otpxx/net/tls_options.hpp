/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/net/tls_mode.hpp>

namespace otpxx::net
{

enum class verify_mode
{
    none,
    peer
};

struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    std::string cipher_list;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    std::vector<std::string> ca_paths;
    bool allow_self_signed = false;

    /// Accept any certificate. Meant for local test servers only.
    static tls_options insecure()
    {
        tls_options opt;
        opt.verify = verify_mode::none;
        opt.verify_host = false;
        opt.use_default_verify_paths = false;
        return opt;
    }
};

[[nodiscard]] inline std::string openssl_error_message()
{
    const unsigned long err = ERR_get_error();
    if (err == 0)
        return {};
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

/**
Apply trust store and protocol policy to an SSL context. Called once when the
context is built, before any session shares it.
**/
[[nodiscard]] inline result_void configure_context(otpxx::asio::ssl::context& ctx, const tls_options& options)
{
    otpxx::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail_void(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
    }

    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
            return fail_void(errc::tls_verify_failed, "TLS CA file could not be loaded.", file, ec);
    }

    for (const auto& path : options.ca_paths)
    {
        if (path.empty())
            continue;
        ctx.add_verify_path(path, ec);
        if (ec)
            return fail_void(errc::tls_verify_failed, "TLS CA path could not be added.", path, ec);
    }

    if (options.min_tls_version.has_value()
        && SSL_CTX_set_min_proto_version(ctx.native_handle(), *options.min_tls_version) != 1)
    {
        return fail_void(errc::tls_handshake_failed,
            "TLS min version configuration failed.", openssl_error_message());
    }

    if (!options.cipher_list.empty()
        && SSL_CTX_set_cipher_list(ctx.native_handle(), options.cipher_list.c_str()) != 1)
    {
        return fail_void(errc::tls_handshake_failed,
            "TLS cipher list configuration failed.", openssl_error_message());
    }
    return ok();
}

} // namespace otpxx::net
