// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace voicetutor
{

/// @brief An outgoing HTTP POST.
struct HttpRequest
{
    std::string url;

    /// @brief Extra header lines, e.g. "Authorization: Bearer ...".
    std::vector<std::string> headers;

    std::string body;
    std::string contentType = "application/json";
    std::chrono::milliseconds timeout { 30000 };
};

/// @brief One field of a multipart/form-data body.
struct MultipartPart
{
    std::string name;
    std::string data;

    /// @brief Set for file fields.
    std::string filename;
    std::string contentType;
};

struct HttpResponse
{
    long status = 0;
    std::string body;
    std::string contentType;

    [[nodiscard]] auto ok() const -> bool { return status >= 200 && status < 300; }
};

/// @brief Receives body bytes as they arrive. Returning false aborts the transfer.
using ChunkCallback = std::function<bool(std::string_view chunk)>;

/// @brief Blocking HTTP transport shared by the cloud services.
///
/// Transport failures come back as NetworkError or TimeoutError; HTTP error
/// statuses are returned as responses and mapped by the caller.
class HttpClient
{
  public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual auto post(const HttpRequest& request) -> Result<HttpResponse> = 0;

    /// @brief Posts a multipart/form-data body; @c request.body and @c request.contentType are ignored.
    [[nodiscard]] virtual auto postMultipart(const HttpRequest& request, const std::vector<MultipartPart>& parts)
        -> Result<HttpResponse> = 0;

    /// @brief Posts and hands the body to @p onChunk incrementally. The returned response has an empty body.
    [[nodiscard]] virtual auto postStreaming(const HttpRequest& request, ChunkCallback onChunk)
        -> Result<HttpResponse> = 0;

    /// @brief Aborts every transfer currently in progress; they fail with Cancelled.
    virtual void abortAll() = 0;
};

/// @brief Maps a non-2xx status to an error.
[[nodiscard]] auto httpStatusError(const HttpResponse& response, std::string_view what) -> Error;

/// @brief HttpClient on top of libcurl's easy interface.
class CurlHttpClient final: public HttpClient
{
  public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    [[nodiscard]] auto post(const HttpRequest& request) -> Result<HttpResponse> override;
    [[nodiscard]] auto postMultipart(const HttpRequest& request, const std::vector<MultipartPart>& parts)
        -> Result<HttpResponse> override;
    [[nodiscard]] auto postStreaming(const HttpRequest& request, ChunkCallback onChunk)
        -> Result<HttpResponse> override;
    void abortAll() override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicetutor
