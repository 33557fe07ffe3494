#include "tusc/http_transport.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <array>
#include <string_view>
#include <system_error>
#include <utility>

#include "tusc/error_codes.hpp"

namespace tusc::http
{

    namespace
    {

        constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

        [[noreturn]] void throw_network_error(const char *stage, const std::error_code &error)
        {
            throw TransferError(ErrorCode::ConnectionReset, std::string(stage) + ": " + error.message());
        }

        bool is_clean_eof(const std::error_code &error)
        {
            return error == asio::error::eof || error == asio::ssl::error::stream_truncated;
        }

    } // namespace

    AsioHttpTransport::AsioHttpTransport(std::string user_agent)
        : user_agent_(std::move(user_agent)),
          resolver_(io_context_),
          ssl_context_(asio::ssl::context::tls_client)
    {
        ssl_context_.set_default_verify_paths();
    }

    HttpResponse AsioHttpTransport::perform(const HttpRequest &request, std::chrono::milliseconds timeout)
    {
        deadline_ = std::chrono::steady_clock::now() + timeout;

        if (!request.url.secure())
        {
            asio::ip::tcp::socket socket(io_context_);
            connect(socket, request.url);
            return exchange(socket, socket, request);
        }

        asio::ssl::stream<asio::ip::tcp::socket> stream(io_context_, ssl_context_);
        auto &socket = stream.next_layer();
        connect(socket, request.url);

        if (SSL_set_tlsext_host_name(stream.native_handle(), request.url.host.c_str()) != 1)
        {
            throw TransferError(ErrorCode::ConnectionReset, "Failed to set TLS server name");
        }
        stream.set_verify_mode(asio::ssl::verify_peer);
        stream.set_verify_callback(asio::ssl::host_name_verification(request.url.host));

        std::error_code error;
        stream.async_handshake(asio::ssl::stream_base::client, [&](const std::error_code &ec)
                               { error = ec; });
        run_until_deadline(socket);
        if (error)
        {
            throw_network_error("tls handshake", error);
        }
        return exchange(stream, socket, request);
    }

    void AsioHttpTransport::connect(asio::ip::tcp::socket &socket, const Url &url)
    {
        asio::ip::tcp::resolver::results_type endpoints;
        std::error_code error;
        resolver_.async_resolve(url.host, std::to_string(url.port),
                               [&](const std::error_code &ec, asio::ip::tcp::resolver::results_type results)
                               {
                                   error = ec;
                                   endpoints = std::move(results);
                               });
        run_until_deadline(socket);
        if (error)
        {
            throw_network_error("resolve", error);
        }

        asio::async_connect(socket, endpoints, [&](const std::error_code &ec, const asio::ip::tcp::endpoint &)
                            { error = ec; });
        run_until_deadline(socket);
        if (error)
        {
            throw_network_error("connect", error);
        }
    }

    void AsioHttpTransport::run_until_deadline(asio::ip::tcp::socket &socket)
    {
        io_context_.restart();
        io_context_.run_until(deadline_);
        if (!io_context_.stopped())
        {
            // Cancels the pending lookup or socket operation, then drains its
            // handler.
            resolver_.cancel();
            std::error_code ignored;
            socket.close(ignored);
            io_context_.run();
            throw TransferError(ErrorCode::Timeout, "request deadline exceeded");
        }
    }

    template <typename Stream>
    HttpResponse AsioHttpTransport::exchange(Stream &stream, asio::ip::tcp::socket &socket, const HttpRequest &request)
    {
        const auto head = serialize_head(request, user_agent_);
        const std::array<asio::const_buffer, 2> buffers{
            asio::buffer(head),
            asio::buffer(request.body.data(), request.body.size()),
        };

        std::error_code error;
        asio::async_write(stream, buffers, [&](const std::error_code &ec, std::size_t)
                          { error = ec; });
        run_until_deadline(socket);
        if (error)
        {
            throw_network_error("send", error);
        }

        std::string data;
        std::size_t head_size = 0;
        asio::async_read_until(stream, asio::dynamic_buffer(data), kHeaderTerminator,
                               [&](const std::error_code &ec, std::size_t bytes)
                               {
                                   error = ec;
                                   head_size = bytes;
                               });
        run_until_deadline(socket);
        if (error)
        {
            throw_network_error("receive", error);
        }

        HttpResponse response;
        try
        {
            response = parse_response_head(std::string_view(data).substr(0, head_size));
        }
        catch (const std::runtime_error &ex)
        {
            throw TransferError(ErrorCode::ProtocolError, ex.what());
        }

        if (!response_has_body(request.method, response.status))
        {
            return response;
        }

        const auto length_header = response.header("Content-Length");
        if (length_header)
        {
            const auto length = parse_unsigned(*length_header);
            if (!length)
            {
                throw TransferError(ErrorCode::ProtocolError, "Invalid Content-Length: " + *length_header);
            }
            const auto total = head_size + static_cast<std::size_t>(*length);
            if (data.size() < total)
            {
                asio::async_read(stream, asio::dynamic_buffer(data), asio::transfer_exactly(total - data.size()),
                                 [&](const std::error_code &ec, std::size_t)
                                 { error = ec; });
                run_until_deadline(socket);
                if (error)
                {
                    throw_network_error("receive body", error);
                }
            }
            response.body = data.substr(head_size, static_cast<std::size_t>(*length));
            return response;
        }

        // No length: the server closes the connection after the body.
        asio::async_read(stream, asio::dynamic_buffer(data), asio::transfer_all(),
                         [&](const std::error_code &ec, std::size_t)
                         { error = ec; });
        run_until_deadline(socket);
        if (error && !is_clean_eof(error))
        {
            throw_network_error("receive body", error);
        }
        response.body = data.substr(head_size);
        return response;
    }

} // namespace tusc::http
