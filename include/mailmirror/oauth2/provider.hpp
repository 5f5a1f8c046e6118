/*

provider.hpp
------------

OAuth2 provider endpoints used for the device authorization grant.

*/

#pragma once

#include <map>
#include <string>
#include <vector>

#include <mailmirror/detail/result.hpp>

namespace mailmirror::oauth2
{

struct provider
{
    std::string name;
    std::string client_id;
    std::vector<std::string> scopes;
    std::string device_auth_url;
    std::string token_url;
};

using provider_table = std::map<std::string, provider>;

[[nodiscard]] inline provider_table default_providers()
{
    provider_table table;
    table.emplace("microsoft", provider{
        "microsoft",
        "9e5f94bc-e8a4-4e73-b8be-63364c29d753",
        {"https://outlook.office.com/IMAP.AccessAsUser.All", "offline_access"},
        "https://login.microsoftonline.com/common/oauth2/v2.0/devicecode",
        "https://login.microsoftonline.com/common/oauth2/v2.0/token"});
    return table;
}

[[nodiscard]] inline result<provider> find_provider(const provider_table& table, const std::string& name)
{
    const auto it = table.find(name);
    if (it == table.end())
    {
        mailmirror::detail::error_detail detail;
        detail.add("provider", name);
        return fail<provider>(errc::oauth2_unknown_provider, "unknown OAuth2 provider", detail);
    }
    return it->second;
}

/// Scopes joined with single spaces, as sent in the `scope` form field.
[[nodiscard]] inline std::string scope_string(const provider& p)
{
    std::string out;
    for (const auto& scope : p.scopes)
    {
        if (!out.empty())
            out += ' ';
        out += scope;
    }
    return out;
}

} // namespace mailmirror::oauth2
