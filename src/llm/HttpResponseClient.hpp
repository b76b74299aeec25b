// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/ResponseProvider.hpp>
#include <net/HttpClient.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace voicetutor
{

struct HttpResponseClientConfig
{
    std::string url;
    std::string authToken;

    /// @brief Sent as the session context so the service can pick the course prompt.
    std::string courseId;

    /// @brief Request a server-sent event stream instead of one JSON object.
    bool streaming = false;

    std::chrono::milliseconds timeout { 30000 };
};

/// @brief Incrementally decodes a server-sent event stream of {"content": ...} objects.
///
/// Lines may be split across chunks arbitrarily. Events that are not JSON or
/// carry no content are skipped.
class SseDecoder
{
  public:
    /// @brief Feeds raw bytes and returns the content increments completed by them.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<std::string>;

    /// @brief Decodes a trailing line that was not newline-terminated.
    [[nodiscard]] auto finish() -> std::vector<std::string>;

    [[nodiscard]] auto done() const -> bool { return _done; }

  private:
    void decodeLine(std::string_view line, std::vector<std::string>& out);

    std::string _buffer;
    bool _done = false;
};

/// @brief Extracts the reply from a complete response body.
///
/// Accepts a JSON object {"message": ...} as well as a buffered SSE stream.
[[nodiscard]] auto parseResponseBody(std::string_view body) -> Result<std::string>;

/// @brief ResponseProvider talking to the tutoring backend over HTTP.
class HttpResponseClient final: public ResponseProvider
{
  public:
    HttpResponseClient(HttpResponseClientConfig config, HttpClient& http);

    [[nodiscard]] auto isStreaming() const -> bool override { return _config.streaming; }
    [[nodiscard]] auto request(const ResponseRequest& request, const ResponseDeltaCallback& onDelta)
        -> Result<std::string> override;
    void abort() override;

    /// @brief The JSON body sent for @p request.
    [[nodiscard]] auto buildBody(const ResponseRequest& request) const -> std::string;

  private:
    HttpResponseClientConfig _config;
    HttpClient& _http;
};

} // namespace voicetutor
