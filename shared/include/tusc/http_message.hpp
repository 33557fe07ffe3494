/**
 * tusc - HTTP/1.1 message model and codec used by the transport.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tusc::http
{

    struct CaseInsensitiveLess
    {
        bool operator()(const std::string &lhs, const std::string &rhs) const noexcept;
    };

    using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

    struct Url
    {
        std::string scheme;
        std::string host;
        std::uint16_t port{};
        std::string target{"/"};

        bool secure() const noexcept { return scheme == "https"; }
        std::string authority() const;
        std::string to_string() const;
    };

    std::optional<Url> parse_url(std::string_view text);

    // Resolves a Location header value against the URL the request was sent to.
    std::string resolve_reference(const Url &base, std::string_view reference);

    struct HttpRequest
    {
        std::string method;
        Url url;
        HeaderMap headers;
        // Non-owning; the caller keeps the payload alive for the exchange.
        std::span<const std::byte> body;
    };

    struct HttpResponse
    {
        int status{};
        std::string reason;
        HeaderMap headers;
        std::string body;

        std::optional<std::string> header(const std::string &name) const;
    };

    std::string serialize_head(const HttpRequest &request, std::string_view user_agent);

    // Parses the status line and header block (terminating blank line included).
    // Throws std::runtime_error when the block is malformed.
    HttpResponse parse_response_head(std::string_view head);

    bool response_has_body(std::string_view method, int status) noexcept;

    std::optional<std::uint64_t> parse_unsigned(std::string_view text) noexcept;

} // namespace tusc::http
