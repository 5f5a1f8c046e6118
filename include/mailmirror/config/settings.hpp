/*

settings.hpp
------------

Daemon configuration loaded from a JSON document.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include <mailmirror/detail/json.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/oauth2/mqtt_token_backend.hpp>
#include <mailmirror/oauth2/provider.hpp>
#include <mailmirror/sync/account.hpp>

namespace mailmirror::config
{

struct log_settings
{
    log::level level = log::level::info;
    bool trace = false;
};

struct account_settings
{
    std::string name;
    sync::source_store source;
    sync::target_store target;

    [[nodiscard]] bool uses_oauth2() const noexcept
    {
        return source.store.auth == sync::auth_mode::oauth2 || target.store.auth == sync::auth_mode::oauth2;
    }
};

struct settings
{
    log_settings log;
    /// `host:port` of the metrics listener, absent when disabled.
    std::optional<std::string> metrics_listen;
    std::optional<oauth2::broker_options> broker;
    oauth2::provider_table providers = oauth2::default_providers();
    std::vector<account_settings> accounts;
};

namespace detail
{

/// Reports one offending key path.
[[nodiscard]] inline error_info invalid(const std::string& path, std::string_view problem)
{
    mailmirror::detail::error_detail detail;
    detail.add("key", path);
    return make_error(errc::config_invalid, "configuration key " + path + " " + std::string(problem), detail.str());
}

[[nodiscard]] inline result<std::string> required_string(const Json::Value& obj, const std::string& parent,
    const char* key)
{
    const std::string path = parent.empty() ? std::string(key) : parent + "." + key;
    if (!obj.isMember(key))
        return fail<std::string>(invalid(path, "is missing"));
    if (!obj[key].isString() || obj[key].asString().empty())
        return fail<std::string>(invalid(path, "must be a non-empty string"));
    return obj[key].asString();
}

[[nodiscard]] inline result<std::string> optional_string(const Json::Value& obj, const std::string& parent,
    const char* key, std::string fallback)
{
    if (!obj.isMember(key) || obj[key].isNull())
        return fallback;
    if (!obj[key].isString())
        return fail<std::string>(invalid(parent.empty() ? std::string(key) : parent + "." + key, "must be a string"));
    return obj[key].asString();
}

[[nodiscard]] inline result<bool> optional_bool(const Json::Value& obj, const std::string& parent,
    const char* key, bool fallback)
{
    if (!obj.isMember(key) || obj[key].isNull())
        return fallback;
    if (!obj[key].isBool())
        return fail<bool>(invalid(parent.empty() ? std::string(key) : parent + "." + key, "must be a boolean"));
    return obj[key].asBool();
}

[[nodiscard]] inline result<std::int64_t> optional_uint(const Json::Value& obj, const std::string& parent,
    const char* key, std::int64_t fallback)
{
    if (!obj.isMember(key) || obj[key].isNull())
        return fallback;
    const Json::Value& v = obj[key];
    if (!v.isIntegral() || !v.isInt64() || v.asInt64() < 0)
        return fail<std::int64_t>(invalid(parent.empty() ? std::string(key) : parent + "." + key,
            "must be a non-negative integer"));
    return v.asInt64();
}

[[nodiscard]] inline result<const Json::Value*> optional_object(const Json::Value& obj, const std::string& path,
    const char* key)
{
    if (!obj.isMember(key) || obj[key].isNull())
        return static_cast<const Json::Value*>(nullptr);
    if (!obj[key].isObject())
        return fail<const Json::Value*>(invalid(path.empty() ? std::string(key) : path + "." + key, "must be an object"));
    return &obj[key];
}

[[nodiscard]] inline result_void parse_log(const Json::Value& root, log_settings& out)
{
    const Json::Value* section = nullptr;
    MAILMIRROR_TRY(section, optional_object(root, "", "log"));
    if (section == nullptr)
        return ok();

    std::string name;
    MAILMIRROR_TRY(name, optional_string(*section, "log", "level", "info"));
    const auto lvl = log::level_from_string(name);
    if (!lvl)
        return fail<void>(invalid("log.level", "names an unknown level"));
    out.level = *lvl;

    MAILMIRROR_TRY(out.trace, optional_bool(*section, "log", "trace", false));
    return ok();
}

[[nodiscard]] inline result_void parse_metrics(const Json::Value& root, std::optional<std::string>& out)
{
    const Json::Value* section = nullptr;
    MAILMIRROR_TRY(section, optional_object(root, "", "metrics"));
    if (section == nullptr)
        return ok();

    std::string listen;
    MAILMIRROR_TRY(listen, optional_string(*section, "metrics", "listen", ""));
    if (!listen.empty())
        out = listen;
    return ok();
}

[[nodiscard]] inline result_void parse_broker(const Json::Value& root, std::optional<oauth2::broker_options>& out)
{
    const Json::Value* section = nullptr;
    MAILMIRROR_TRY(section, optional_object(root, "", "broker"));
    if (section == nullptr)
        return ok();

    oauth2::broker_options broker;
    MAILMIRROR_TRY(broker.host, required_string(*section, "broker", "host"));
    MAILMIRROR_TRY(broker.tls, optional_bool(*section, "broker", "tls", false));

    std::int64_t port = 0;
    MAILMIRROR_TRY(port, optional_uint(*section, "broker", "port", broker.tls ? 8883 : 1883));
    if (port == 0 || port > 65535)
        return fail<void>(invalid("broker.port", "is out of range"));
    broker.port = std::to_string(port);

    MAILMIRROR_TRY(broker.client_id, required_string(*section, "broker", "client_id"));
    MAILMIRROR_TRY(broker.username, optional_string(*section, "broker", "username", ""));
    MAILMIRROR_TRY(broker.password, optional_string(*section, "broker", "password", ""));
    out = std::move(broker);
    return ok();
}

[[nodiscard]] inline result_void parse_providers(const Json::Value& root, oauth2::provider_table& table)
{
    const Json::Value* section = nullptr;
    MAILMIRROR_TRY(section, optional_object(root, "", "providers"));
    if (section == nullptr)
        return ok();

    for (const auto& name : section->getMemberNames())
    {
        const std::string path = "providers." + name;
        const Json::Value& entry = (*section)[name];
        if (!entry.isObject())
            return fail<void>(invalid(path, "must be an object"));

        oauth2::provider p;
        const auto existing = table.find(name);
        if (existing != table.end())
            p = existing->second;
        p.name = name;

        MAILMIRROR_TRY(p.client_id, optional_string(entry, path, "client_id", p.client_id));
        MAILMIRROR_TRY(p.device_auth_url, optional_string(entry, path, "device_auth_url", p.device_auth_url));
        MAILMIRROR_TRY(p.token_url, optional_string(entry, path, "token_url", p.token_url));

        if (entry.isMember("scopes"))
        {
            const Json::Value& scopes = entry["scopes"];
            if (!scopes.isArray())
                return fail<void>(invalid(path + ".scopes", "must be an array of strings"));
            p.scopes.clear();
            for (const auto& scope : scopes)
            {
                if (!scope.isString())
                    return fail<void>(invalid(path + ".scopes", "must be an array of strings"));
                p.scopes.push_back(scope.asString());
            }
        }

        if (p.client_id.empty())
            return fail<void>(invalid(path + ".client_id", "is missing"));
        if (p.device_auth_url.empty())
            return fail<void>(invalid(path + ".device_auth_url", "is missing"));
        if (p.token_url.empty())
            return fail<void>(invalid(path + ".token_url", "is missing"));
        table[name] = std::move(p);
    }
    return ok();
}

[[nodiscard]] inline result_void parse_store(const Json::Value& obj, const std::string& path,
    const oauth2::provider_table& providers, sync::mail_store_credentials& out)
{
    MAILMIRROR_TRY(out.server, required_string(obj, path, "server"));
    MAILMIRROR_TRY(out.username, required_string(obj, path, "username"));
    MAILMIRROR_TRY(out.mailbox, optional_string(obj, path, "mailbox", "INBOX"));
    if (out.mailbox.empty())
        return fail<void>(invalid(path + ".mailbox", "must not be empty"));

    std::string auth;
    MAILMIRROR_TRY(auth, optional_string(obj, path, "auth", "password"));
    if (auth == "password")
    {
        out.auth = sync::auth_mode::password;
        MAILMIRROR_TRY(out.password, required_string(obj, path, "password"));
    }
    else if (auth == "oauth2")
    {
        out.auth = sync::auth_mode::oauth2;
        MAILMIRROR_TRY(out.provider, optional_string(obj, path, "provider", "microsoft"));
        if (providers.find(out.provider) == providers.end())
            return fail<void>(invalid(path + ".provider", "names an unknown provider"));
    }
    else
    {
        return fail<void>(invalid(path + ".auth", "must be \"password\" or \"oauth2\""));
    }
    return ok();
}

[[nodiscard]] inline result<account_settings> parse_account(const Json::Value& entry, const std::string& path,
    const oauth2::provider_table& providers)
{
    if (!entry.isObject())
        return fail<account_settings>(invalid(path, "must be an object"));

    account_settings acct;
    MAILMIRROR_TRY(acct.name, required_string(entry, path, "name"));

    for (const char* role : {"source", "target"})
    {
        const std::string role_path = path + "." + role;
        if (!entry.isMember(role) || !entry[role].isObject())
            return fail<account_settings>(invalid(role_path, "must be an object"));
    }

    const Json::Value& source = entry["source"];
    const Json::Value& target = entry["target"];
    if (auto checked = parse_store(source, path + ".source", providers, acct.source.store); !checked)
        return fail<account_settings>(std::move(checked).error());
    if (auto checked = parse_store(target, path + ".target", providers, acct.target.store); !checked)
        return fail<account_settings>(std::move(checked).error());

    std::int64_t fallback = 0;
    MAILMIRROR_TRY(fallback, optional_uint(source, path + ".source", "idle_fallback", 0));
    acct.source.idle_fallback = std::chrono::seconds{fallback};
    return acct;
}

} // namespace detail

/// Parse and validate a configuration document.
[[nodiscard]] inline result<settings> parse_settings(std::string_view text)
{
    Json::Value root;
    MAILMIRROR_TRY(root, mailmirror::detail::parse_json(text, errc::config_invalid));
    if (!root.isObject())
        return fail<settings>(detail::invalid("(root)", "must be an object"));

    settings out;
    {
        auto res = detail::parse_log(root, out.log);
        if (!res)
            return fail<settings>(std::move(res).error());
    }
    {
        auto res = detail::parse_metrics(root, out.metrics_listen);
        if (!res)
            return fail<settings>(std::move(res).error());
    }
    {
        auto res = detail::parse_broker(root, out.broker);
        if (!res)
            return fail<settings>(std::move(res).error());
    }
    {
        auto res = detail::parse_providers(root, out.providers);
        if (!res)
            return fail<settings>(std::move(res).error());
    }

    if (!root.isMember("accounts") || !root["accounts"].isArray() || root["accounts"].empty())
        return fail<settings>(detail::invalid("accounts", "must be a non-empty array"));

    // Account names must map to distinct broker topic keys.
    std::map<std::string, std::string> keys;
    const Json::Value& accounts = root["accounts"];
    for (Json::ArrayIndex i = 0; i < accounts.size(); ++i)
    {
        const std::string path = "accounts[" + std::to_string(i) + "]";
        auto acct = detail::parse_account(accounts[i], path, out.providers);
        if (!acct)
            return fail<settings>(std::move(acct).error());
        const auto [seen, inserted] = keys.emplace(mailmirror::oauth2::account_key(acct->name), acct->name);
        if (!inserted)
        {
            return fail<settings>(detail::invalid(path + ".name",
                "\"" + acct->name + "\" collides with account \"" + seen->second + "\""));
        }
        if (acct->uses_oauth2() && !out.broker)
            return fail<settings>(detail::invalid("broker", "is required by OAuth2 accounts"));
        out.accounts.push_back(std::move(*acct));
    }
    return out;
}

[[nodiscard]] inline result<settings> load_settings(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        mailmirror::detail::error_detail detail;
        detail.add("path", path);
        return fail<settings>(errc::config_invalid, "cannot open configuration file " + path, detail);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_settings(buffer.str());
}

} // namespace mailmirror::config
