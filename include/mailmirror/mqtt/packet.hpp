/*

packet.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

MQTT 3.1.1 control packets used by the token backend: CONNECT/CONNACK,
SUBSCRIBE/SUBACK (QoS 0), PUBLISH (QoS 0), PINGREQ/PINGRESP and DISCONNECT.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <string>
#include <string_view>
#include <vector>

#include <mailmirror/detail/result.hpp>

namespace mailmirror::mqtt
{

enum class packet_type : std::uint8_t
{
    connect = 1,
    connack = 2,
    publish = 3,
    puback = 4,
    subscribe = 8,
    suback = 9,
    unsubscribe = 10,
    unsuback = 11,
    pingreq = 12,
    pingresp = 13,
    disconnect = 14
};

/// Largest value the remaining length field can carry.
inline constexpr std::uint32_t MAX_REMAINING_LENGTH = 268435455;

struct connect_options
{
    std::string client_id;
    std::string username;
    std::string password;
    std::uint16_t keep_alive = 60;
    bool clean_session = true;
};

struct message
{
    std::string topic;
    std::string payload;
    bool retain = false;
};

struct connack
{
    bool session_present = false;
    std::uint8_t return_code = 0;
};

[[nodiscard]] constexpr std::string_view connack_reason(std::uint8_t code) noexcept
{
    switch (code)
    {
        case 0: return "accepted";
        case 1: return "unacceptable protocol version";
        case 2: return "identifier rejected";
        case 3: return "server unavailable";
        case 4: return "bad user name or password";
        case 5: return "not authorized";
    }
    return "unknown";
}

namespace detail
{

inline void put_u16(std::string& out, std::uint16_t value)
{
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>(value & 0xFF));
}

inline void put_string(std::string& out, std::string_view value)
{
    put_u16(out, static_cast<std::uint16_t>(value.size()));
    out.append(value.data(), value.size());
}

[[nodiscard]] inline std::uint16_t get_u16(std::string_view in, std::size_t pos) noexcept
{
    return static_cast<std::uint16_t>((static_cast<std::uint8_t>(in[pos]) << 8) | static_cast<std::uint8_t>(in[pos + 1]));
}

[[nodiscard]] inline result_void check_string_length(std::string_view value, const char* field)
{
    if (value.size() > 0xFFFF)
    {
        std::string message("MQTT ");
        message += field;
        message += " exceeds 65535 bytes";
        return fail<void>(errc::invalid_argument, std::move(message));
    }
    return ok();
}

} // namespace detail

/// Variable byte integer used by the fixed header.
[[nodiscard]] inline std::string encode_remaining_length(std::uint32_t length)
{
    std::string out;
    do
    {
        std::uint8_t byte = static_cast<std::uint8_t>(length % 128);
        length /= 128;
        if (length > 0)
            byte |= 0x80;
        out.push_back(static_cast<char>(byte));
    } while (length > 0);
    return out;
}

/**
Incremental decoder for the remaining length. feed() returns the decoded value
once the last byte arrived, nullopt while more bytes are needed, and an error
after a fifth continuation byte.
**/
class remaining_length_decoder
{
public:
    result<std::optional<std::uint32_t>> feed(std::uint8_t byte)
    {
        if (count_ == 4)
            return fail<std::optional<std::uint32_t>>(errc::mqtt_protocol_error, "malformed remaining length");
        value_ += static_cast<std::uint32_t>(byte & 0x7F) * multiplier_;
        multiplier_ *= 128;
        ++count_;
        if ((byte & 0x80) != 0)
        {
            if (count_ == 4)
                return fail<std::optional<std::uint32_t>>(errc::mqtt_protocol_error, "malformed remaining length");
            return std::optional<std::uint32_t>{};
        }
        return std::optional<std::uint32_t>(value_);
    }

private:
    std::uint32_t value_ = 0;
    std::uint32_t multiplier_ = 1;
    int count_ = 0;
};

[[nodiscard]] inline result<std::string> make_packet(std::uint8_t first_byte, std::string_view body)
{
    if (body.size() > MAX_REMAINING_LENGTH)
        return fail<std::string>(errc::invalid_argument, "MQTT packet too large");
    std::string out;
    out.reserve(body.size() + 5);
    out.push_back(static_cast<char>(first_byte));
    out += encode_remaining_length(static_cast<std::uint32_t>(body.size()));
    out.append(body.data(), body.size());
    return out;
}

[[nodiscard]] inline result<std::string> encode_connect(const connect_options& opt)
{
    const std::pair<std::string_view, const char*> fields[] = {
        {opt.client_id, "client id"}, {opt.username, "user name"}, {opt.password, "password"}};
    for (const auto& [value, field] : fields)
    {
        if (auto checked = detail::check_string_length(value, field); !checked)
            return fail<std::string>(std::move(checked).error());
    }
    std::string body;
    detail::put_string(body, "MQTT");
    body.push_back(0x04);

    std::uint8_t flags = 0;
    if (opt.clean_session)
        flags |= 0x02;
    if (!opt.username.empty())
        flags |= 0x80;
    if (!opt.password.empty())
        flags |= 0x40;
    body.push_back(static_cast<char>(flags));
    detail::put_u16(body, opt.keep_alive);

    detail::put_string(body, opt.client_id);
    if (!opt.username.empty())
        detail::put_string(body, opt.username);
    if (!opt.password.empty())
        detail::put_string(body, opt.password);

    return make_packet(static_cast<std::uint8_t>(packet_type::connect) << 4, body);
}

[[nodiscard]] inline result<std::string> encode_subscribe(std::uint16_t packet_id, std::string_view topic)
{
    if (topic.empty())
        return fail<std::string>(errc::invalid_argument, "MQTT topic must not be empty");
    std::string body;
    detail::put_u16(body, packet_id);
    detail::put_string(body, topic);
    body.push_back(0x00);
    return make_packet((static_cast<std::uint8_t>(packet_type::subscribe) << 4) | 0x02, body);
}

[[nodiscard]] inline result<std::string> encode_publish(std::string_view topic, std::string_view payload, bool retain)
{
    if (topic.empty())
        return fail<std::string>(errc::invalid_argument, "MQTT topic must not be empty");
    std::string body;
    detail::put_string(body, topic);
    body.append(payload.data(), payload.size());
    std::uint8_t first = static_cast<std::uint8_t>(packet_type::publish) << 4;
    if (retain)
        first |= 0x01;
    return make_packet(first, body);
}

[[nodiscard]] inline std::string encode_disconnect()
{
    return std::string{static_cast<char>(static_cast<std::uint8_t>(packet_type::disconnect) << 4), '\0'};
}

[[nodiscard]] inline result<connack> decode_connack(std::string_view body)
{
    if (body.size() != 2)
        return fail<connack>(errc::mqtt_protocol_error, "CONNACK must carry 2 bytes");
    connack out;
    out.session_present = (static_cast<std::uint8_t>(body[0]) & 0x01) != 0;
    out.return_code = static_cast<std::uint8_t>(body[1]);
    return out;
}

/// Granted QoS per topic filter; 0x80 marks a refused subscription.
[[nodiscard]] inline result<std::vector<std::uint8_t>> decode_suback(std::string_view body, std::uint16_t& packet_id)
{
    if (body.size() < 3)
        return fail<std::vector<std::uint8_t>>(errc::mqtt_protocol_error, "SUBACK too short");
    packet_id = detail::get_u16(body, 0);
    std::vector<std::uint8_t> codes;
    for (std::size_t i = 2; i < body.size(); ++i)
        codes.push_back(static_cast<std::uint8_t>(body[i]));
    return codes;
}

[[nodiscard]] inline result<message> decode_publish(std::uint8_t first_byte, std::string_view body)
{
    if (body.size() < 2)
        return fail<message>(errc::mqtt_protocol_error, "PUBLISH too short");
    const std::uint16_t topic_len = detail::get_u16(body, 0);
    if (body.size() < 2u + topic_len)
        return fail<message>(errc::mqtt_protocol_error, "PUBLISH topic exceeds packet");

    message out;
    out.topic.assign(body.substr(2, topic_len));
    out.retain = (first_byte & 0x01) != 0;
    std::size_t pos = 2u + topic_len;
    const std::uint8_t qos = (first_byte >> 1) & 0x03;
    if (qos > 0)
    {
        if (body.size() < pos + 2)
            return fail<message>(errc::mqtt_protocol_error, "PUBLISH packet id missing");
        pos += 2;
    }
    out.payload.assign(body.substr(pos));
    return out;
}

} // namespace mailmirror::mqtt
