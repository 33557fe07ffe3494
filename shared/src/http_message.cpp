#include "tusc/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace tusc::http
{

    namespace
    {

        char lower(char ch)
        {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }

        std::string_view trim(std::string_view input)
        {
            const auto begin = input.find_first_not_of(" \t");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = input.find_last_not_of(" \t\r");
            return input.substr(begin, end - begin + 1);
        }

        bool starts_with_nocase(std::string_view text, std::string_view prefix)
        {
            return text.size() >= prefix.size() && iequals(text.substr(0, prefix.size()), prefix);
        }

        std::uint16_t default_port(const std::string &scheme)
        {
            return scheme == "https" ? 443 : 80;
        }

        bool body_expected(std::string_view method)
        {
            return method != "GET" && method != "HEAD" && method != "OPTIONS";
        }

    } // namespace

    bool CaseInsensitiveLess::operator()(const std::string &lhs, const std::string &rhs) const noexcept
    {
        return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                                            [](char a, char b)
                                            { return lower(a) < lower(b); });
    }

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept
    {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                          { return lower(a) == lower(b); });
    }

    std::string Url::authority() const
    {
        std::string result = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (port != default_port(scheme))
        {
            result += ':' + std::to_string(port);
        }
        return result;
    }

    std::string Url::to_string() const
    {
        return scheme + "://" + authority() + target;
    }

    std::optional<Url> parse_url(std::string_view text)
    {
        text = trim(text);
        const auto scheme_end = text.find("://");
        if (scheme_end == std::string_view::npos)
        {
            return std::nullopt;
        }
        Url url;
        for (const char ch : text.substr(0, scheme_end))
        {
            url.scheme.push_back(lower(ch));
        }
        if (url.scheme != "http" && url.scheme != "https")
        {
            return std::nullopt;
        }

        auto rest = text.substr(scheme_end + 3);
        const auto fragment = rest.find('#');
        if (fragment != std::string_view::npos)
        {
            rest = rest.substr(0, fragment);
        }
        const auto path_begin = rest.find_first_of("/?");
        auto authority = rest.substr(0, path_begin);
        if (path_begin != std::string_view::npos)
        {
            url.target = std::string(rest.substr(path_begin));
            if (url.target.front() == '?')
            {
                url.target.insert(url.target.begin(), '/');
            }
        }

        const auto at = authority.rfind('@');
        if (at != std::string_view::npos)
        {
            authority = authority.substr(at + 1);
        }

        std::string_view port_text;
        if (!authority.empty() && authority.front() == '[')
        {
            const auto close = authority.find(']');
            if (close == std::string_view::npos)
            {
                return std::nullopt;
            }
            url.host = std::string(authority.substr(1, close - 1));
            const auto after = authority.substr(close + 1);
            if (!after.empty())
            {
                if (after.front() != ':')
                {
                    return std::nullopt;
                }
                port_text = after.substr(1);
            }
        }
        else
        {
            const auto colon = authority.rfind(':');
            url.host = std::string(authority.substr(0, colon));
            if (colon != std::string_view::npos)
            {
                port_text = authority.substr(colon + 1);
            }
        }
        if (url.host.empty())
        {
            return std::nullopt;
        }

        url.port = default_port(url.scheme);
        if (!port_text.empty())
        {
            const auto port = parse_unsigned(port_text);
            if (!port || *port == 0 || *port > 65535)
            {
                return std::nullopt;
            }
            url.port = static_cast<std::uint16_t>(*port);
        }
        return url;
    }

    std::string resolve_reference(const Url &base, std::string_view reference)
    {
        reference = trim(reference);
        if (starts_with_nocase(reference, "http://") || starts_with_nocase(reference, "https://"))
        {
            return std::string(reference);
        }
        if (reference.starts_with("//"))
        {
            return base.scheme + ":" + std::string(reference);
        }
        const auto origin = base.scheme + "://" + base.authority();
        if (reference.starts_with("/"))
        {
            return origin + std::string(reference);
        }
        auto directory = base.target.substr(0, base.target.find('?'));
        directory = directory.substr(0, directory.rfind('/') + 1);
        if (directory.empty())
        {
            directory = "/";
        }
        return origin + directory + std::string(reference);
    }

    std::optional<std::string> HttpResponse::header(const std::string &name) const
    {
        const auto it = headers.find(name);
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string serialize_head(const HttpRequest &request, std::string_view user_agent)
    {
        std::string head;
        head.reserve(256);
        head.append(request.method).append(" ").append(request.url.target).append(" HTTP/1.1\r\n");
        head.append("Host: ").append(request.url.authority()).append("\r\n");
        head.append("User-Agent: ").append(user_agent).append("\r\n");
        for (const auto &[name, value] : request.headers)
        {
            if (iequals(name, "Host") || iequals(name, "Content-Length") || iequals(name, "Connection") ||
                iequals(name, "User-Agent"))
            {
                continue;
            }
            head.append(name).append(": ").append(value).append("\r\n");
        }
        if (!request.body.empty() || body_expected(request.method))
        {
            head.append("Content-Length: ").append(std::to_string(request.body.size())).append("\r\n");
        }
        head.append("Connection: close\r\n\r\n");
        return head;
    }

    HttpResponse parse_response_head(std::string_view head)
    {
        HttpResponse response;
        bool status_parsed = false;
        while (!head.empty())
        {
            const auto line_end = head.find('\n');
            auto line = head.substr(0, line_end);
            head = line_end == std::string_view::npos ? std::string_view{} : head.substr(line_end + 1);
            if (!line.empty() && line.back() == '\r')
            {
                line.remove_suffix(1);
            }

            if (!status_parsed)
            {
                if (!line.starts_with("HTTP/"))
                {
                    throw std::runtime_error("Malformed HTTP status line");
                }
                const auto first_space = line.find(' ');
                if (first_space == std::string_view::npos)
                {
                    throw std::runtime_error("Malformed HTTP status line");
                }
                const auto code_text = line.substr(first_space + 1, 3);
                const auto code = parse_unsigned(code_text);
                if (!code || code_text.size() != 3)
                {
                    throw std::runtime_error("Malformed HTTP status code");
                }
                response.status = static_cast<int>(*code);
                if (line.size() > first_space + 5)
                {
                    response.reason = std::string(trim(line.substr(first_space + 5)));
                }
                status_parsed = true;
                continue;
            }

            if (line.empty())
            {
                break;
            }
            const auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0)
            {
                throw std::runtime_error("Malformed HTTP header line");
            }
            const std::string name(trim(line.substr(0, colon)));
            const std::string value(trim(line.substr(colon + 1)));
            auto [it, inserted] = response.headers.emplace(name, value);
            if (!inserted)
            {
                it->second.append(", ").append(value);
            }
        }
        if (!status_parsed)
        {
            throw std::runtime_error("Empty HTTP response");
        }
        return response;
    }

    bool response_has_body(std::string_view method, int status) noexcept
    {
        if (method == "HEAD")
        {
            return false;
        }
        return !(status / 100 == 1 || status == 204 || status == 304);
    }

    std::optional<std::uint64_t> parse_unsigned(std::string_view text) noexcept
    {
        text = trim(text);
        if (text.empty())
        {
            return std::nullopt;
        }
        std::uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::nullopt;
        }
        return value;
    }

} // namespace tusc::http
