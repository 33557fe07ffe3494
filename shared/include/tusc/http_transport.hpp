/**
 * tusc - Blocking HTTP/1.1 exchange over asio with a per-request deadline.
 */
#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <chrono>
#include <string>

#include "tusc/http_message.hpp"

namespace tusc::http
{

    // One request, one response. Network failures surface as tusc::TransferError
    // with ErrorCode::Timeout or ErrorCode::ConnectionReset; any HTTP status,
    // including error statuses, is returned as a response.
    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        virtual HttpResponse perform(const HttpRequest &request, std::chrono::milliseconds timeout) = 0;
    };

    // A fresh connection per request (Connection: close). The calling thread is
    // blocked until the response is complete or the deadline passes.
    class AsioHttpTransport : public HttpTransport
    {
    public:
        explicit AsioHttpTransport(std::string user_agent);

        HttpResponse perform(const HttpRequest &request, std::chrono::milliseconds timeout) override;

    private:
        void connect(asio::ip::tcp::socket &socket, const Url &url);
        void run_until_deadline(asio::ip::tcp::socket &socket);

        template <typename Stream>
        HttpResponse exchange(Stream &stream, asio::ip::tcp::socket &socket, const HttpRequest &request);

        std::string user_agent_;
        asio::io_context io_context_;
        asio::ip::tcp::resolver resolver_;
        asio::ssl::context ssl_context_;
        std::chrono::steady_clock::time_point deadline_{};
    };

} // namespace tusc::http
