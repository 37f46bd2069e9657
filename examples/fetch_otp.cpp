/*

fetch_otp.cpp
-------------

Waits for a one-time code or an account link sent to a mailbox and prints it.

    otpxx_fetch <recipient> <service|sender[,sender...]> [max-wait-seconds] [otp|reset|both]

The mailbox is read from OTPXX_IMAP_HOST (default imap.gmail.com),
OTPXX_IMAP_PORT (default 993), OTPXX_IMAP_USER and OTPXX_IMAP_PASSWORD.
Exits with 0 when a code or link is printed, 1 on timeout and 2 on error.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "example_util.hpp"
#include <otpxx/detail/log.hpp>
#include <otpxx/fetch/sender_presets.hpp>
#include <otpxx/otp_fetcher.hpp>


using otpxx::fetcher_config;
using otpxx::otp_fetcher;
using std::cerr;
using std::cout;
using std::endl;


namespace
{

otpxx::fetch_kind parse_kind(const std::string& arg)
{
    if (arg == "otp")
        return otpxx::fetch_kind::otp;
    if (arg == "reset")
        return otpxx::fetch_kind::reset_link;
    if (arg == "both")
        return otpxx::fetch_kind::both;
    throw std::invalid_argument("unknown fetch kind " + arg);
}

std::vector<std::string> parse_senders(const std::string& arg)
{
    auto preset = otpxx::senders_for_service(arg);
    if (!preset.empty())
        return preset;

    std::vector<std::string> senders;
    std::size_t start = 0;
    while (start <= arg.size())
    {
        const auto comma = arg.find(',', start);
        const auto end = comma == std::string::npos ? arg.size() : comma;
        if (end > start)
            senders.push_back(arg.substr(start, end - start));
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return senders;
}

fetcher_config make_config()
{
    const std::string host = env_or("OTPXX_IMAP_HOST", "imap.gmail.com");
    const std::string user = env_or("OTPXX_IMAP_USER", "");
    const std::string password = env_or("OTPXX_IMAP_PASSWORD", "");

    fetcher_config cfg = fetcher_config::gmail(user, password);
    if (host != "imap.gmail.com")
    {
        cfg.endpoint.host = host;
        cfg.folders = {"INBOX"};
    }
    cfg.endpoint.port = static_cast<unsigned short>(std::stoul(env_or("OTPXX_IMAP_PORT", "993")));
    return cfg;
}

} // namespace


int main(int argc, char* argv[])
{
    if (argc < 3)
    {
        cerr << "usage: " << argv[0] << " <recipient> <service|sender[,sender...]> [max-wait-seconds] [otp|reset|both]"
            << endl;
        return 2;
    }

    const std::string recipient = argv[1];
    const std::vector<std::string> senders = parse_senders(argv[2]);
    std::chrono::milliseconds max_wait{30000};
    otpxx::fetch_kind kind = otpxx::fetch_kind::otp;
    fetcher_config cfg;
    try
    {
        if (argc > 3)
            max_wait = std::chrono::seconds(std::stol(argv[3]));
        if (argc > 4)
            kind = parse_kind(argv[4]);
        cfg = make_config();
    }
    catch (const std::exception& exc)
    {
        cerr << "invalid argument: " << exc.what() << endl;
        return 2;
    }

    otpxx::log::logger::instance().set_level(otpxx::log::level::info);

    boost::asio::io_context io_ctx;
    int exit_code = 2;
    try
    {
        otp_fetcher fetcher(io_ctx.get_executor(), std::move(cfg));

        boost::asio::co_spawn(io_ctx,
            [&]() -> boost::asio::awaitable<void>
            {
                otpxx::fetch_request request;
                request.target_recipient = recipient;
                request.senders = senders;
                request.subjects = otpxx::subjects_for_service(argv[2], kind);
                request.kind = kind;
                request.max_wait = max_wait;
                auto outcome = co_await fetcher.fetch(std::move(request));
                if (!outcome)
                    print_error(outcome.error());
                else if (!outcome->has_value())
                {
                    cout << "Nothing received within " << max_wait.count() / 1000 << " s" << endl;
                    exit_code = 1;
                }
                else
                {
                    const auto& res = **outcome;
                    if (!res.otp.empty())
                        cout << "Code: " << res.otp << endl;
                    if (res.reset_link.has_value())
                        cout << "Link: " << *res.reset_link << endl;
                    cout << "Folder: " << res.folder << endl;
                    cout << "Subject: " << res.subject << endl;
                    cout << "Time: " << res.fetch_time.count() << " ms" << (res.cached ? " (cached)" : "") << endl;
                    exit_code = 0;
                }
                co_await fetcher.shutdown();
            },
            boost::asio::detached);

        io_ctx.run();
    }
    catch (const std::invalid_argument& exc)
    {
        cerr << "configuration error: " << exc.what() << endl;
        return 2;
    }
    return exit_code;
}
