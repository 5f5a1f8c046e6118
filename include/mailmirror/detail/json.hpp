/*

json.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Thin jsoncpp wrappers returning result<> instead of throwing.

*/

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <json/json.h>

#include <mailmirror/detail/result.hpp>

namespace mailmirror::detail
{

[[nodiscard]] inline result<Json::Value> parse_json(std::string_view text, errc on_error = errc::codec_invalid_input)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
    {
        error_detail detail;
        detail.add("json.error", errors);
        return fail<Json::Value>(on_error, "invalid JSON document", detail);
    }
    return root;
}

/// Compact single-line rendering, suitable for MQTT payloads.
[[nodiscard]] inline std::string write_json(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

/// String member or empty when absent or of another type.
[[nodiscard]] inline std::string json_string(const Json::Value& obj, const char* key)
{
    if (!obj.isObject())
        return {};
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : std::string{};
}

/// Integer member or `fallback` when absent or not numeric.
[[nodiscard]] inline long long json_int(const Json::Value& obj, const char* key, long long fallback)
{
    if (!obj.isObject())
        return fallback;
    const Json::Value& v = obj[key];
    if (v.isInt64())
        return v.asInt64();
    if (v.isString())
    {
        try
        {
            return std::stoll(v.asString());
        }
        catch (const std::exception&)
        {
            return fallback;
        }
    }
    return fallback;
}

} // namespace mailmirror::detail
