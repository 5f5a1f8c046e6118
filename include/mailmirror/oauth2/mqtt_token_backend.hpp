/*

mqtt_token_backend.hpp
----------------------

Token persistence on an MQTT broker (retained message per account) with a
Home Assistant event entity used to show the device code to the user.

*/

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

#include <json/json.h>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/async_mutex.hpp>
#include <mailmirror/detail/deadline.hpp>
#include <mailmirror/detail/json.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/mqtt/client.hpp>
#include <mailmirror/net/tls_options.hpp>
#include <mailmirror/oauth2/authorization_server.hpp>
#include <mailmirror/oauth2/token.hpp>
#include <mailmirror/oauth2/token_backend.hpp>

namespace mailmirror::oauth2
{

/// How long load_token() waits for the retained token after subscribing.
inline constexpr std::chrono::seconds RETAINED_WAIT{1};

struct broker_options
{
    std::string host;
    std::string port{"1883"};
    bool tls = false;
    mailmirror::net::tls_options tls_settings;
    std::string client_id;
    std::string username;
    std::string password;
};

/// Account name as used in topic levels: `@` and `.` become `-`.
[[nodiscard]] inline std::string account_key(std::string_view name)
{
    std::string key(name);
    for (char& ch : key)
    {
        if (ch == '@' || ch == '.')
            ch = '-';
    }
    return key;
}

[[nodiscard]] inline std::string token_topic(std::string_view client_id, std::string_view name)
{
    return "modernauth/" + std::string(client_id) + "/" + account_key(name) + "/token";
}

[[nodiscard]] inline std::string event_base_topic(std::string_view client_id, std::string_view name)
{
    return "homeassistant/event/" + std::string(client_id) + "/" + account_key(name);
}

/// Home Assistant MQTT discovery record for the authorization event entity.
[[nodiscard]] inline Json::Value make_event_config(std::string_view client_id, std::string_view name)
{
    Json::Value config(Json::objectValue);
    config["~"] = event_base_topic(client_id, name);
    config["name"] = std::string(name);

    Json::Value event_types(Json::arrayValue);
    event_types.append("auth");
    config["event_types"] = event_types;
    config["state_topic"] = "~/state";
    config["unique_id"] = std::string(client_id) + "-" + account_key(name);

    Json::Value device(Json::objectValue);
    Json::Value identifiers(Json::arrayValue);
    identifiers.append(std::string(client_id));
    device["identifiers"] = identifiers;
    device["name"] = std::string(name);
    config["device"] = device;
    return config;
}

[[nodiscard]] inline Json::Value make_event_state(const device_challenge& challenge)
{
    Json::Value state(Json::objectValue);
    state["event_type"] = "auth";
    state["link"] = challenge.verification_uri;
    state["code"] = challenge.user_code;
    return state;
}

/**
One async mutex per broker client identity. Every backend talking to the
broker as that client shares it, so only one connection with the client id
exists at a time.
**/
class broker_locks
{
public:
    explicit broker_locks(mailmirror::asio::any_io_executor executor)
        : executor_(std::move(executor))
    {
    }

    [[nodiscard]] std::shared_ptr<mailmirror::detail::async_mutex> get(const broker_options& broker)
    {
        const std::string key = broker.host + ":" + broker.port + "/" + broker.client_id;
        std::lock_guard<std::mutex> guard(mutex_);
        auto& slot = locks_[key];
        if (!slot)
            slot = std::make_shared<mailmirror::detail::async_mutex>(executor_);
        return slot;
    }

private:
    mailmirror::asio::any_io_executor executor_;
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<mailmirror::detail::async_mutex>> locks_;
};

class mqtt_token_backend : public token_backend
{
public:
    mqtt_token_backend(mailmirror::asio::any_io_executor executor, broker_options broker,
        std::shared_ptr<mailmirror::detail::async_mutex> lock, mailmirror::asio::ssl::context* tls_ctx,
        std::string name)
        : executor_(std::move(executor)),
          broker_(std::move(broker)),
          lock_(std::move(lock)),
          tls_ctx_(tls_ctx),
          name_(std::move(name))
    {
    }

    mailmirror::asio::awaitable<result<std::optional<token>>> load_token(std::stop_token stop) override
    {
        using value_t = std::optional<token>;
        auto guard = co_await lock_->lock();

        mqtt::client client(executor_);
        MAILMIRROR_TRY_CO_AWAIT(open(client));

        const std::string topic = token_topic(broker_.client_id, name_);
        auto subscribed = co_await client.subscribe(topic);
        if (!subscribed)
        {
            co_await close(client);
            co_return fail<value_t>(nest_error(errc::broker_failed, "token subscription failed",
                std::move(subscribed).error()));
        }

        auto [received, outcome] = co_await mailmirror::detail::with_deadline<mqtt::message>(
            client.receive(), RETAINED_WAIT, stop, [&client]
            {
                client.cancel();
            });
        co_await close(client);

        if (outcome != mailmirror::detail::deadline_outcome::completed)
        {
            MAILMIRROR_DEBUG("{}: no retained token on {}", name_, topic);
            co_return ok(value_t{});
        }
        if (!received)
            co_return fail<value_t>(nest_error(errc::broker_failed, "token receive failed",
                std::move(received).error()));
        if (received->payload.empty())
            co_return ok(value_t{});

        auto tok = token_from_json(received->payload);
        if (!tok)
            co_return fail<value_t>(nest_error(errc::auth_failed, "stored token is invalid",
                std::move(tok).error()));
        co_return ok(value_t{std::move(*tok)});
    }

    mailmirror::asio::awaitable<result_void> save_token(const token& tok) override
    {
        auto guard = co_await lock_->lock();

        mqtt::client client(executor_);
        MAILMIRROR_TRY_CO_AWAIT(open(client));

        auto published = co_await client.publish(token_topic(broker_.client_id, name_), to_json_string(tok), true);
        co_await close(client);
        if (!published)
            co_return fail<void>(nest_error(errc::broker_failed, "token publish failed",
                std::move(published).error()));
        co_return ok();
    }

    mailmirror::asio::awaitable<result_void> notify(const device_challenge& challenge) override
    {
        auto guard = co_await lock_->lock();

        MAILMIRROR_INFO("{}: authorization required, open {} and enter code {}",
            name_, challenge.verification_uri, challenge.user_code);

        mqtt::client client(executor_);
        MAILMIRROR_TRY_CO_AWAIT(open(client));

        const std::string base = event_base_topic(broker_.client_id, name_);
        auto published = co_await client.publish(base + "/config",
            mailmirror::detail::write_json(make_event_config(broker_.client_id, name_)), false);
        if (published)
        {
            published = co_await client.publish(base + "/state",
                mailmirror::detail::write_json(make_event_state(challenge)), false);
        }
        co_await close(client);
        if (!published)
            co_return fail<void>(nest_error(errc::broker_failed, "authorization event publish failed",
                std::move(published).error()));
        co_return ok();
    }

private:
    mailmirror::asio::awaitable<result_void> open(mqtt::client& client)
    {
        mqtt::connect_options opt;
        opt.client_id = broker_.client_id;
        opt.username = broker_.username;
        opt.password = broker_.password;

        auto connected = co_await client.connect(broker_.host, broker_.port,
            broker_.tls ? tls_ctx_ : nullptr, broker_.tls_settings, opt);
        if (!connected)
            co_return fail<void>(nest_error(errc::broker_failed, "broker connection failed",
                std::move(connected).error()));
        co_return ok();
    }

    mailmirror::asio::awaitable<void> close(mqtt::client& client)
    {
        auto res = co_await client.disconnect();
        if (!res)
            MAILMIRROR_WARN("{}: broker disconnect failed: {}", name_, format_error(res.error()));
    }

    mailmirror::asio::any_io_executor executor_;
    broker_options broker_;
    std::shared_ptr<mailmirror::detail::async_mutex> lock_;
    mailmirror::asio::ssl::context* tls_ctx_;
    std::string name_;
};

} // namespace mailmirror::oauth2
