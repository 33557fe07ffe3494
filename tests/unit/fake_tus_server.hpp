#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tusc/error_codes.hpp"
#include "tusc/http_transport.hpp"

namespace tusc::testing
{

    struct RecordedRequest
    {
        std::string method;
        std::string target;
        http::HeaderMap headers;
        std::size_t body_size{};
    };

    struct PatchFault
    {
        int status{};
        // Thrown instead of answering, as the transport would on a network failure.
        std::optional<ErrorCode> transport_error;
        // Store the chunk before failing, as if only the acknowledgement was lost.
        bool apply{};
    };

    // In-process tus 1.0.0 server (core protocol plus creation) with
    // scriptable failures on PATCH attempts.
    class FakeTusServer : public http::HttpTransport
    {
    public:
        explicit FakeTusServer(std::string base_path = "/files/") : base_path_(std::move(base_path)) {}

        http::HttpResponse perform(const http::HttpRequest &request, std::chrono::milliseconds timeout) override
        {
            requests.push_back(RecordedRequest{request.method, request.url.target, request.headers, request.body.size()});
            last_timeout = timeout;

            const auto version = request.headers.find("Tus-Resumable");
            if (version == request.headers.end() || version->second != "1.0.0")
            {
                return respond(412);
            }
            if (request.method == "OPTIONS")
            {
                auto response = respond(204);
                response.headers["Tus-Version"] = "1.0.0";
                response.headers["Tus-Extension"] = "creation,termination";
                response.headers["Tus-Max-Size"] = "1073741824";
                return response;
            }
            if (request.method == "POST")
            {
                return create(request);
            }

            const auto upload = uploads_.find(request.url.target);
            if (upload == uploads_.end())
            {
                return respond(404);
            }
            if (request.method == "HEAD")
            {
                auto response = respond(200);
                response.headers["Upload-Offset"] = std::to_string(upload->second.data.size());
                response.headers["Upload-Length"] = std::to_string(upload->second.length);
                response.headers["Cache-Control"] = "no-store";
                return response;
            }
            if (request.method == "PATCH")
            {
                return patch(upload->second, request);
            }
            return respond(405);
        }

        std::size_t count(std::string_view method) const
        {
            std::size_t total = 0;
            for (const auto &request : requests)
            {
                total += request.method == method ? 1 : 0;
            }
            return total;
        }

        std::string data(const std::string &url) const
        {
            const auto parsed = http::parse_url(url);
            const auto it = parsed ? uploads_.find(parsed->target) : uploads_.end();
            return it == uploads_.end() ? std::string() : it->second.data;
        }

        std::optional<std::string> metadata(const std::string &url) const
        {
            const auto parsed = http::parse_url(url);
            const auto it = parsed ? uploads_.find(parsed->target) : uploads_.end();
            if (it == uploads_.end())
            {
                return std::nullopt;
            }
            return it->second.metadata;
        }

        std::size_t upload_count() const { return uploads_.size(); }

        std::map<unsigned, PatchFault> patch_faults;
        // Called with the number of chunks stored so far.
        std::function<void(unsigned)> on_chunk_stored;
        int create_status{201};
        bool send_location{true};
        std::vector<RecordedRequest> requests;
        std::chrono::milliseconds last_timeout{};

    private:
        struct Upload
        {
            std::uint64_t length{};
            std::string metadata;
            std::string data;
        };

        static http::HttpResponse respond(int status)
        {
            http::HttpResponse response;
            response.status = status;
            response.headers["Tus-Resumable"] = "1.0.0";
            return response;
        }

        http::HttpResponse create(const http::HttpRequest &request)
        {
            if (request.url.target != base_path_)
            {
                return respond(404);
            }
            const auto length_header = request.headers.find("Upload-Length");
            const auto length = length_header == request.headers.end() ? std::nullopt
                                                                        : http::parse_unsigned(length_header->second);
            if (!length || create_status != 201)
            {
                return respond(length ? create_status : 400);
            }
            const auto id = "u" + std::to_string(next_id_++);
            Upload upload;
            upload.length = *length;
            if (const auto metadata = request.headers.find("Upload-Metadata"); metadata != request.headers.end())
            {
                upload.metadata = metadata->second;
            }
            uploads_[base_path_ + id] = std::move(upload);

            auto response = respond(201);
            if (send_location)
            {
                response.headers["Location"] = base_path_ + id;
            }
            return response;
        }

        http::HttpResponse patch(Upload &upload, const http::HttpRequest &request)
        {
            ++patch_attempts_;
            const auto type = request.headers.find("Content-Type");
            if (type == request.headers.end() || type->second != "application/offset+octet-stream")
            {
                return respond(415);
            }
            const auto offset_header = request.headers.find("Upload-Offset");
            const auto offset = offset_header == request.headers.end() ? std::nullopt
                                                                        : http::parse_unsigned(offset_header->second);
            if (!offset)
            {
                return respond(400);
            }

            const auto fault = patch_faults.find(patch_attempts_);
            if (fault != patch_faults.end())
            {
                if (fault->second.apply && *offset == upload.data.size())
                {
                    store(upload, request);
                }
                if (fault->second.transport_error)
                {
                    throw TransferError(*fault->second.transport_error, "simulated network failure");
                }
                return respond(fault->second.status);
            }

            if (*offset != upload.data.size())
            {
                return respond(409);
            }
            if (upload.data.size() + request.body.size() > upload.length)
            {
                return respond(400);
            }
            store(upload, request);
            auto response = respond(204);
            response.headers["Upload-Offset"] = std::to_string(upload.data.size());
            return response;
        }

        void store(Upload &upload, const http::HttpRequest &request)
        {
            upload.data.append(reinterpret_cast<const char *>(request.body.data()), request.body.size());
            ++stored_chunks_;
            if (on_chunk_stored)
            {
                on_chunk_stored(stored_chunks_);
            }
        }

        std::string base_path_;
        std::map<std::string, Upload> uploads_;
        unsigned patch_attempts_{};
        unsigned stored_chunks_{};
        unsigned next_id_{1};
    };

} // namespace tusc::testing
