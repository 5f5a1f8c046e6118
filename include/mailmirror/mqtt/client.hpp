/*

mqtt/client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/mqtt/packet.hpp>
#include <mailmirror/net/connect.hpp>
#include <mailmirror/net/dialog.hpp>
#include <mailmirror/net/upgradable_stream.hpp>

namespace mailmirror::mqtt
{

using mailmirror::asio::awaitable;
namespace ssl = mailmirror::asio::ssl;

/**
Minimal MQTT 3.1.1 client for short request/response exchanges: connect,
publish or subscribe, read what the broker delivers, disconnect. QoS 0 only.
**/
class client
{
public:
    using executor_type = mailmirror::asio::any_io_executor;
    using dialog_type = mailmirror::net::dialog<mailmirror::net::upgradable_stream>;

    explicit client(executor_type executor)
        : executor_(std::move(executor))
    {
    }

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    awaitable<result_void> connect(const std::string& host, const std::string& service,
        ssl::context* tls_ctx, const mailmirror::net::tls_options& tls, const connect_options& opt)
    {
        if (dialog_.has_value())
            co_return fail<void>(errc::mqtt_invalid_state, "MQTT connection is already established.");

        auto stream_res = co_await mailmirror::net::open_stream(executor_, host, service, tls_ctx, tls, "mqtt");
        if (!stream_res)
            co_return fail<void>(std::move(stream_res).error());
        dialog_.emplace(std::move(*stream_res));
        dialog_->set_trace_protocol("MQTT");

        std::string packet;
        MAILMIRROR_CO_TRY_ASSIGN(packet, encode_connect(opt));
        MAILMIRROR_TRY_CO_AWAIT(write_packet(packet, "CONNECT"));

        std::uint8_t first = 0;
        std::string body;
        MAILMIRROR_TRY_CO_AWAIT(read_packet(first, body));
        if ((first >> 4) != static_cast<std::uint8_t>(packet_type::connack))
            co_return protocol_error<void>("expected CONNACK", first);

        connack ack;
        MAILMIRROR_CO_TRY_ASSIGN(ack, decode_connack(body));
        if (ack.return_code != 0)
        {
            mailmirror::detail::error_detail detail;
            detail.add("proto", "mqtt");
            detail.add_int("connack.code", ack.return_code);
            detail.add("connack.reason", connack_reason(ack.return_code));
            co_return fail<void>(errc::mqtt_connack_refused,
                std::string("MQTT connection refused: ") + std::string(connack_reason(ack.return_code)), detail);
        }
        co_return ok();
    }

    /// Subscribe with QoS 0. Messages delivered before the SUBACK are kept for receive().
    awaitable<result_void> subscribe(std::string_view topic)
    {
        const std::uint16_t packet_id = next_packet_id();
        std::string packet;
        MAILMIRROR_CO_TRY_ASSIGN(packet, encode_subscribe(packet_id, topic));
        MAILMIRROR_TRY_CO_AWAIT(write_packet(packet, "SUBSCRIBE"));

        while (true)
        {
            std::uint8_t first = 0;
            std::string body;
            MAILMIRROR_TRY_CO_AWAIT(read_packet(first, body));
            const auto type = static_cast<packet_type>(first >> 4);
            if (type == packet_type::publish)
            {
                message msg;
                MAILMIRROR_CO_TRY_ASSIGN(msg, decode_publish(first, body));
                inbox_.push_back(std::move(msg));
                continue;
            }
            if (type != packet_type::suback)
                continue;

            std::uint16_t acked_id = 0;
            std::vector<std::uint8_t> codes;
            MAILMIRROR_CO_TRY_ASSIGN(codes, decode_suback(body, acked_id));
            if (acked_id != packet_id)
                continue;
            if (codes.empty() || codes.front() == 0x80)
            {
                mailmirror::detail::error_detail detail;
                detail.add("proto", "mqtt");
                detail.add("topic", topic);
                co_return fail<void>(errc::mqtt_subscribe_refused, "MQTT subscription refused", detail);
            }
            co_return ok();
        }
    }

    /// Next PUBLISH from the broker; control packets in between are skipped.
    awaitable<result<message>> receive()
    {
        if (!inbox_.empty())
        {
            message msg = std::move(inbox_.front());
            inbox_.pop_front();
            co_return ok(std::move(msg));
        }

        while (true)
        {
            std::uint8_t first = 0;
            std::string body;
            MAILMIRROR_TRY_CO_AWAIT(read_packet(first, body));
            if (static_cast<packet_type>(first >> 4) == packet_type::publish)
                co_return decode_publish(first, body);
        }
    }

    awaitable<result_void> publish(std::string_view topic, std::string_view payload, bool retain)
    {
        std::string packet;
        MAILMIRROR_CO_TRY_ASSIGN(packet, encode_publish(topic, payload, retain));
        co_return co_await write_packet(packet, "PUBLISH");
    }

    /// Send DISCONNECT and close the transport.
    awaitable<result_void> disconnect()
    {
        if (!dialog_.has_value())
            co_return ok();
        auto res = co_await write_packet(encode_disconnect(), "DISCONNECT");
        dialog_->stream().close();
        dialog_.reset();
        co_return res;
    }

    void cancel() noexcept
    {
        if (dialog_.has_value())
            dialog_->cancel();
    }

    [[nodiscard]] bool connected() const noexcept
    {
        return dialog_.has_value();
    }

private:
    std::uint16_t next_packet_id() noexcept
    {
        if (++packet_id_ == 0)
            packet_id_ = 1;
        return packet_id_;
    }

    template<typename T>
    static result<T> protocol_error(std::string_view what, std::uint8_t first)
    {
        mailmirror::detail::error_detail detail;
        detail.add("proto", "mqtt");
        detail.add_int("packet.type", static_cast<std::uint64_t>(first >> 4));
        return fail<T>(errc::mqtt_protocol_error, std::string("MQTT protocol error: ") + std::string(what), detail);
    }

    result<dialog_type*> dialog_ptr()
    {
        if (!dialog_.has_value())
            return fail<dialog_type*>(errc::mqtt_invalid_state, "MQTT connection is not established.");
        return &*dialog_;
    }

    awaitable<result_void> write_packet(const std::string& packet, std::string_view label)
    {
        dialog_type* dlg = nullptr;
        MAILMIRROR_CO_TRY_ASSIGN(dlg, dialog_ptr());
        MAILMIRROR_TRACE_SEND("MQTT", fmt::format("{} ({} bytes)", label, packet.size()));
        co_return co_await dlg->write_raw_r(mailmirror::asio::buffer(packet));
    }

    awaitable<result_void> read_packet(std::uint8_t& first, std::string& body)
    {
        dialog_type* dlg = nullptr;
        MAILMIRROR_CO_TRY_ASSIGN(dlg, dialog_ptr());

        std::string header;
        MAILMIRROR_CO_TRY_ASSIGN(header, co_await dlg->read_exactly_r(1));
        first = static_cast<std::uint8_t>(header[0]);

        remaining_length_decoder decoder;
        std::uint32_t length = 0;
        while (true)
        {
            std::string byte;
            MAILMIRROR_CO_TRY_ASSIGN(byte, co_await dlg->read_exactly_r(1));
            std::optional<std::uint32_t> decoded;
            MAILMIRROR_CO_TRY_ASSIGN(decoded, decoder.feed(static_cast<std::uint8_t>(byte[0])));
            if (decoded.has_value())
            {
                length = *decoded;
                break;
            }
        }

        MAILMIRROR_CO_TRY_ASSIGN(body, co_await dlg->read_exactly_r(length));
        MAILMIRROR_TRACE_RECV("MQTT", fmt::format("packet type={} ({} bytes)", first >> 4, length));
        co_return ok();
    }

    executor_type executor_;
    std::optional<dialog_type> dialog_;
    std::deque<message> inbox_;
    std::uint16_t packet_id_{0};
};

} // namespace mailmirror::mqtt
