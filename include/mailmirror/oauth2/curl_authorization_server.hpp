/*

curl_authorization_server.hpp
-----------------------------

Device authorization grant over HTTPS with libcurl. Requests block, so they run
on a thread pool and resume on the caller's executor.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>

#include <curl/curl.h>
#include <json/json.h>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/deadline.hpp>
#include <mailmirror/detail/json.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/offload.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/oauth2/authorization_server.hpp>
#include <mailmirror/oauth2/provider.hpp>
#include <mailmirror/oauth2/token.hpp>

namespace mailmirror::oauth2
{

using form_fields = std::vector<std::pair<std::string, std::string>>;

struct http_response
{
    long status = 0;
    std::string body;
};

namespace detail
{

inline constexpr const char* DEVICE_CODE_GRANT = "urn:ietf:params:oauth:grant-type:device_code";

inline std::string find_ca_bundle()
{
#ifdef __linux__
    static const char* const paths[] = {
        "/etc/ssl/certs/ca-certificates.crt",
        "/etc/pki/tls/certs/ca-bundle.crt",
        "/usr/share/ssl/certs/ca-bundle.crt",
        "/usr/local/share/certs/ca-root-nss.crt",
        "/etc/ssl/cert.pem",
        "/etc/ssl/ca-bundle.pem",
    };
    for (const char* path : paths)
    {
        struct stat buffer;
        if (::stat(path, &buffer) == 0)
            return path;
    }
#endif
    return {};
}

inline std::size_t append_to_string(void* contents, std::size_t length, std::size_t nmemb, void* userp)
{
    auto* buffer = static_cast<std::string*>(userp);
    const std::size_t real_size = length * nmemb;
    buffer->append(static_cast<const char*>(contents), real_size);
    return real_size;
}

struct curl_deleter
{
    void operator()(CURL* handle) const noexcept
    {
        curl_easy_cleanup(handle);
    }
};

struct slist_deleter
{
    void operator()(curl_slist* list) const noexcept
    {
        curl_slist_free_all(list);
    }
};

[[nodiscard]] inline std::string escape(CURL* handle, const std::string& value)
{
    char* escaped = curl_easy_escape(handle, value.c_str(), static_cast<int>(value.size()));
    if (escaped == nullptr)
        return {};
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

[[nodiscard]] inline std::string encode_form(CURL* handle, const form_fields& fields)
{
    std::string payload;
    for (const auto& [key, value] : fields)
    {
        if (!payload.empty())
            payload += '&';
        payload += escape(handle, key);
        payload += '=';
        payload += escape(handle, value);
    }
    return payload;
}

/// Blocking form POST; the body is returned whatever the HTTP status.
[[nodiscard]] inline result<http_response> post_form(const std::string& url, const form_fields& fields)
{
    std::unique_ptr<CURL, curl_deleter> handle(curl_easy_init());
    if (!handle)
        return fail<http_response>(errc::oauth2_http_failed, "curl_easy_init failed");

    CURL* curl = handle.get();
    const std::string payload = encode_form(curl, fields);

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/x-www-form-urlencoded");
    std::unique_ptr<curl_slist, slist_deleter> headers(raw_headers);

    http_response response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 20L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, static_cast<void*>(&response.body));

    const std::string ca_bundle = find_ca_bundle();
    if (!ca_bundle.empty())
        curl_easy_setopt(curl, CURLOPT_CAINFO, ca_bundle.c_str());

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK)
    {
        mailmirror::detail::error_detail detail;
        detail.add("url", url);
        detail.add_int("curl.code", static_cast<std::uint64_t>(rc));
        return fail<http_response>(errc::oauth2_http_failed,
            std::string("HTTP request failed: ") + curl_easy_strerror(rc), detail);
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

/// OAuth2 error response member, empty when the document carries none.
[[nodiscard]] inline std::string oauth_error_code(const Json::Value& doc)
{
    return mailmirror::detail::json_string(doc, "error");
}

[[nodiscard]] inline error_info oauth_error(errc code, std::string_view what, const Json::Value& doc, long status)
{
    mailmirror::detail::error_detail detail;
    detail.add_int("http.status", static_cast<std::uint64_t>(status));
    const std::string error = oauth_error_code(doc);
    if (!error.empty())
        detail.add("oauth2.error", error);
    const std::string description = mailmirror::detail::json_string(doc, "error_description");
    if (!description.empty())
        detail.add("oauth2.error_description", description);

    std::string message(what);
    if (!error.empty())
        message += " (" + error + ")";
    return make_error(code, std::move(message), detail.str());
}

[[nodiscard]] inline result<device_challenge> parse_device_challenge(const Json::Value& doc)
{
    device_challenge challenge;
    challenge.device_code = mailmirror::detail::json_string(doc, "device_code");
    challenge.user_code = mailmirror::detail::json_string(doc, "user_code");
    challenge.verification_uri = mailmirror::detail::json_string(doc, "verification_uri");
    if (challenge.verification_uri.empty())
        challenge.verification_uri = mailmirror::detail::json_string(doc, "verification_url");
    challenge.expires_in = std::chrono::seconds{mailmirror::detail::json_int(doc, "expires_in", 0)};
    challenge.interval = std::chrono::seconds{mailmirror::detail::json_int(doc, "interval", 0)};
    challenge.message = mailmirror::detail::json_string(doc, "message");

    if (challenge.device_code.empty() || challenge.user_code.empty() || challenge.verification_uri.empty())
        return fail<device_challenge>(oauth_error(errc::oauth2_invalid_response,
            "device authorization response is incomplete", doc, 0));
    return challenge;
}

/// Token endpoint success document; `expires_in` is relative to `now`.
[[nodiscard]] inline result<token> parse_token_response(const Json::Value& doc, clock_type::time_point now)
{
    token tok;
    tok.access_token = mailmirror::detail::json_string(doc, "access_token");
    tok.token_type = mailmirror::detail::json_string(doc, "token_type");
    tok.refresh_token = mailmirror::detail::json_string(doc, "refresh_token");
    const long long expires_in = mailmirror::detail::json_int(doc, "expires_in", 0);
    if (expires_in > 0)
        tok.expiry = now + std::chrono::seconds{expires_in};

    if (tok.access_token.empty())
        return fail<token>(oauth_error(errc::oauth2_invalid_response,
            "token response carries no access token", doc, 0));
    return tok;
}

} // namespace detail

class curl_authorization_server : public authorization_server
{
public:
    explicit curl_authorization_server(mailmirror::asio::thread_pool& pool)
        : pool_(pool)
    {
    }

    mailmirror::asio::awaitable<result<device_challenge>> device_auth(const provider& p) override
    {
        http_response response;
        form_fields fields{
            {"client_id", p.client_id},
            {"scope", scope_string(p)}};
        MAILMIRROR_CO_TRY_ASSIGN(response, co_await post(p.device_auth_url, std::move(fields)));

        Json::Value doc;
        MAILMIRROR_CO_TRY_ASSIGN(doc, mailmirror::detail::parse_json(response.body, errc::oauth2_invalid_response));
        if (!is_success(response.status) || !detail::oauth_error_code(doc).empty())
            co_return fail<device_challenge>(detail::oauth_error(errc::oauth2_http_failed,
                "device authorization request rejected", doc, response.status));
        co_return detail::parse_device_challenge(doc);
    }

    mailmirror::asio::awaitable<result<token>> device_access_token(const provider& p,
        const device_challenge& challenge, std::stop_token stop) override
    {
        auto interval = challenge.interval > std::chrono::seconds::zero() ? challenge.interval : DEFAULT_POLL_INTERVAL;
        const bool bounded = challenge.expires_in > std::chrono::seconds::zero();
        const auto expires_at = steady_clock::now() + challenge.expires_in;

        while (true)
        {
            if (!co_await mailmirror::detail::sleep_for(interval, stop))
                co_return fail<token>(errc::cancelled, "device authorization cancelled");

            http_response response;
            form_fields fields{
                {"grant_type", detail::DEVICE_CODE_GRANT},
                {"device_code", challenge.device_code},
                {"client_id", p.client_id}};
            MAILMIRROR_CO_TRY_ASSIGN(response, co_await post(p.token_url, std::move(fields)));

            Json::Value doc;
            MAILMIRROR_CO_TRY_ASSIGN(doc, mailmirror::detail::parse_json(response.body, errc::oauth2_invalid_response));

            const std::string error = detail::oauth_error_code(doc);
            if (error.empty() && is_success(response.status))
                co_return detail::parse_token_response(doc, clock_type::now());

            if (error == "authorization_pending")
            {
                MAILMIRROR_DEBUG("oauth2 {}: authorization pending", p.name);
            }
            else if (error == "slow_down")
            {
                interval += SLOW_DOWN_STEP;
                MAILMIRROR_DEBUG("oauth2 {}: slowing down, polling every {}s", p.name, interval.count());
            }
            else if (error == "access_denied")
            {
                co_return fail<token>(detail::oauth_error(errc::oauth2_access_denied,
                    "device authorization denied", doc, response.status));
            }
            else if (error == "expired_token")
            {
                co_return fail<token>(detail::oauth_error(errc::oauth2_expired_token,
                    "device code expired", doc, response.status));
            }
            else
            {
                co_return fail<token>(detail::oauth_error(errc::oauth2_http_failed,
                    "device token request rejected", doc, response.status));
            }

            if (bounded && steady_clock::now() >= expires_at)
                co_return fail<token>(errc::oauth2_expired_token, "device code expired");
        }
    }

    mailmirror::asio::awaitable<result<token>> refresh(const provider& p, const std::string& refresh_token) override
    {
        if (refresh_token.empty())
            co_return fail<token>(errc::oauth2_refresh_unavailable, "token expired and carries no refresh token");

        http_response response;
        form_fields fields{
            {"grant_type", "refresh_token"},
            {"refresh_token", refresh_token},
            {"client_id", p.client_id}};
        MAILMIRROR_CO_TRY_ASSIGN(response, co_await post(p.token_url, std::move(fields)));

        Json::Value doc;
        MAILMIRROR_CO_TRY_ASSIGN(doc, mailmirror::detail::parse_json(response.body, errc::oauth2_invalid_response));
        if (!is_success(response.status) || !detail::oauth_error_code(doc).empty())
            co_return fail<token>(detail::oauth_error(errc::oauth2_http_failed,
                "token refresh rejected", doc, response.status));
        co_return detail::parse_token_response(doc, clock_type::now());
    }

private:
    [[nodiscard]] static bool is_success(long status) noexcept
    {
        return status >= 200 && status < 300;
    }

    mailmirror::asio::awaitable<result<http_response>> post(std::string url, form_fields fields)
    {
        MAILMIRROR_DEBUG("oauth2 POST {}", url);
        co_return co_await mailmirror::detail::offload(pool_,
            [url = std::move(url), fields = std::move(fields)]
            {
                return detail::post_form(url, fields);
            },
            errc::oauth2_http_failed);
    }

    mailmirror::asio::thread_pool& pool_;
};

} // namespace mailmirror::oauth2
