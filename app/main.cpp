/*

main.cpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

mailmirrord: mirrors every configured source mailbox into its target.

*/


#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <curl/curl.h>

#include <mailmirror/config/settings.hpp>
#include <mailmirror/detail/async_event.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/metrics/exporter.hpp>
#include <mailmirror/net/tls_options.hpp>
#include <mailmirror/oauth2/curl_authorization_server.hpp>
#include <mailmirror/oauth2/mqtt_token_backend.hpp>
#include <mailmirror/oauth2/token_source.hpp>
#include <mailmirror/sync/account_engine.hpp>
#include <mailmirror/sync/connection_manager.hpp>


namespace asio = mailmirror::asio;
using mailmirror::sync::account;
using mailmirror::sync::account_engine;
using mailmirror::sync::connection_manager;


namespace
{

constexpr int EXIT_ACCOUNT_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CONFIG = 3;

struct command_line
{
    bool once = false;
    bool trace = false;
    std::optional<mailmirror::log::level> level;
    std::string config_path;
};

void print_usage(std::string_view program)
{
    std::cerr << "usage: " << program << " [--once] [--trace] [--log-level L] <config.json>\n";
}

std::optional<command_line> parse_command_line(int argc, char* argv[])
{
    command_line cmd;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--once")
            cmd.once = true;
        else if (arg == "--trace")
            cmd.trace = true;
        else if (arg == "--log-level" && i + 1 < argc)
        {
            cmd.level = mailmirror::log::level_from_string(argv[++i]);
            if (!cmd.level)
                return std::nullopt;
        }
        else if (!arg.empty() && arg.front() != '-' && cmd.config_path.empty())
            cmd.config_path = std::string(arg);
        else
            return std::nullopt;
    }
    if (cmd.config_path.empty())
        return std::nullopt;
    return cmd;
}

/// Everything one account owns for the lifetime of the process.
struct account_runtime
{
    std::unique_ptr<account> acct;
    std::unique_ptr<connection_manager> connector;
    std::unique_ptr<account_engine<connection_manager>> engine;
};

std::shared_ptr<mailmirror::oauth2::token_source> make_token_source(const mailmirror::sync::mail_store_credentials& store,
    const std::string& name, const mailmirror::config::settings& conf, asio::any_io_executor executor,
    asio::ssl::context& tls_ctx, mailmirror::oauth2::broker_locks& locks,
    const std::shared_ptr<mailmirror::oauth2::authorization_server>& server)
{
    if (store.auth != mailmirror::sync::auth_mode::oauth2 || !conf.broker)
        return nullptr;

    auto backend = std::make_shared<mailmirror::oauth2::mqtt_token_backend>(executor, *conf.broker,
        locks.get(*conf.broker), &tls_ctx, name);
    return std::make_shared<mailmirror::oauth2::token_source>(server, std::move(backend), conf.providers,
        store.provider, name);
}

/// Run one account to completion, then release it.
asio::awaitable<void> drive(account_runtime& runtime, bool once, std::stop_token stop)
{
    auto& engine = *runtime.engine;
    const auto& acct = *runtime.acct;
    MAILMIRROR_INFO("{}: {} --> {}", acct.prefix(), acct.source().store.server, acct.target().store.server);

    auto res = once ? co_await engine.once(stop) : co_await engine.run(stop);
    if (!res)
        MAILMIRROR_ERROR("{}: account stopped: {}", acct.name(), mailmirror::format_error(res.error()));

    auto closed = co_await engine.close();
    if (!closed)
        MAILMIRROR_WARN("{}: close failed: {}", acct.name(), mailmirror::format_error(closed.error()));
}

} // namespace


int main(int argc, char* argv[])
{
    const auto cmd = parse_command_line(argc, argv);
    if (!cmd)
    {
        print_usage(argc > 0 ? argv[0] : "mailmirrord");
        return EXIT_USAGE;
    }

    auto loaded = mailmirror::config::load_settings(cmd->config_path);
    if (!loaded)
    {
        MAILMIRROR_FATAL("{}", mailmirror::format_error(loaded.error()));
        return EXIT_CONFIG;
    }
    const mailmirror::config::settings conf = std::move(*loaded);

    auto& logger = mailmirror::log::logger::instance();
    logger.set_level(cmd->level.value_or(conf.log.level));
    logger.set_trace_enabled(cmd->trace || conf.log.trace);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    {
        MAILMIRROR_FATAL("cannot initialize libcurl");
        return EXIT_CONFIG;
    }

    asio::io_context io_ctx;
    asio::thread_pool http_pool(1);
    asio::ssl::context tls_ctx(asio::ssl::context::tls_client);
    if (auto trusted = mailmirror::net::prepare_client_context(tls_ctx, mailmirror::net::tls_options{}); !trusted)
    {
        MAILMIRROR_FATAL("{}", mailmirror::format_error(trusted.error()));
        curl_global_cleanup();
        return EXIT_CONFIG;
    }

    auto executor = io_ctx.get_executor();
    auto server = std::make_shared<mailmirror::oauth2::curl_authorization_server>(http_pool);
    mailmirror::oauth2::broker_locks locks(executor);

    std::vector<account_runtime> runtimes;
    runtimes.reserve(conf.accounts.size());
    for (const auto& entry : conf.accounts)
    {
        account_runtime runtime;
        runtime.acct = std::make_unique<account>(entry.name, entry.source, entry.target);
        auto source_tokens = make_token_source(entry.source.store, entry.name, conf, executor, tls_ctx, locks, server);
        auto target_tokens = make_token_source(entry.target.store, entry.name, conf, executor, tls_ctx, locks, server);
        runtime.connector = std::make_unique<connection_manager>(executor, *runtime.acct, tls_ctx,
            mailmirror::imap::options{}, std::move(source_tokens), std::move(target_tokens));
        runtime.engine = std::make_unique<account_engine<connection_manager>>(*runtime.acct, *runtime.connector);
        runtimes.push_back(std::move(runtime));
    }

    std::stop_source stop;
    asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
    signals.async_wait([&stop](const asio::error_code& ec, int signo)
    {
        if (ec)
            return;
        MAILMIRROR_INFO("signal {} received, shutting down", signo);
        stop.request_stop();
    });

    std::vector<const account*> observed;
    for (const auto& runtime : runtimes)
        observed.push_back(runtime.acct.get());

    std::stop_source metrics_stop;
    std::optional<mailmirror::metrics::exporter> exporter;
    if (conf.metrics_listen)
    {
        exporter.emplace(executor, observed);
        if (auto opened = exporter->open(*conf.metrics_listen); !opened)
        {
            MAILMIRROR_ERROR("metrics disabled: {}", mailmirror::format_error(opened.error()));
            exporter.reset();
        }
        else
        {
            asio::co_spawn(io_ctx, exporter->serve(metrics_stop.get_token()), asio::detached);
        }
    }

    mailmirror::detail::wait_group accounts_done(executor);
    for (auto& runtime : runtimes)
    {
        accounts_done.add();
        asio::co_spawn(io_ctx, [&, rt = &runtime]() -> asio::awaitable<void>
        {
            co_await drive(*rt, cmd->once, stop.get_token());
            accounts_done.done();
        }, asio::detached);
    }

    asio::co_spawn(io_ctx, [&]() -> asio::awaitable<void>
    {
        co_await accounts_done.wait();
        metrics_stop.request_stop();
        asio::error_code ignored;
        signals.cancel(ignored);
    }, asio::detached);

    io_ctx.run();
    http_pool.join();
    curl_global_cleanup();

    int code = 0;
    for (const auto& runtime : runtimes)
    {
        if (runtime.acct->last_error())
            code = EXIT_ACCOUNT_FAILED;
    }
    MAILMIRROR_INFO("mailmirrord exiting with status {}", code);
    return code;
}
