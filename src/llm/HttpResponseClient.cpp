// SPDX-License-Identifier: Apache-2.0
#include "HttpResponseClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/TextUtils.hpp>

#include <format>

namespace voicetutor
{

namespace
{

    constexpr auto DataPrefix = std::string_view { "data:" };

} // namespace

auto SseDecoder::feed(std::string_view chunk) -> std::vector<std::string>
{
    auto deltas = std::vector<std::string> {};
    _buffer += chunk;

    auto start = std::size_t { 0 };
    for (auto nl = _buffer.find('\n', start); nl != std::string::npos; nl = _buffer.find('\n', start))
    {
        decodeLine(std::string_view { _buffer }.substr(start, nl - start), deltas);
        start = nl + 1;
    }
    _buffer.erase(0, start);
    return deltas;
}

auto SseDecoder::finish() -> std::vector<std::string>
{
    auto deltas = std::vector<std::string> {};
    if (!_buffer.empty())
        decodeLine(_buffer, deltas);
    _buffer.clear();
    return deltas;
}

void SseDecoder::decodeLine(std::string_view line, std::vector<std::string>& out)
{
    line = text::trim(line);
    if (!line.starts_with(DataPrefix))
        return;

    auto const payload = text::trim(line.substr(DataPrefix.size()));
    if (payload == "[DONE]")
    {
        _done = true;
        return;
    }

    auto event = json::parse(payload);
    if (!event || !event->is_object())
    {
        log::trace("Skipping malformed stream event: {}", payload);
        return;
    }

    if (auto content = json::getStringOr(*event, "content", ""); !content.empty())
        out.push_back(std::move(content));
    if (json::getBoolOr(*event, "done", false))
        _done = true;
}

auto parseResponseBody(std::string_view body) -> Result<std::string>
{
    auto const trimmed = text::trim(body);

    if (trimmed.starts_with(DataPrefix))
    {
        auto decoder = SseDecoder {};
        auto message = std::string {};
        for (auto const& delta: decoder.feed(trimmed))
            message += delta;
        for (auto const& delta: decoder.finish())
            message += delta;
        return message;
    }

    auto parsed = json::parse(trimmed);
    if (!parsed)
        return makeError(ErrorCode::ProtocolError, std::format("Invalid response from server: {}", parsed.error().message));

    if (!parsed->is_object())
        return makeError(ErrorCode::ProtocolError, "Response is not a JSON object");

    if (parsed->contains("message"))
        return json::getString(*parsed, "message");
    if (parsed->contains("content"))
        return json::getString(*parsed, "content");

    return makeError(ErrorCode::ProtocolError, "Response carries no message");
}

HttpResponseClient::HttpResponseClient(HttpResponseClientConfig config, HttpClient& http):
    _config(std::move(config)), _http(http)
{
}

auto HttpResponseClient::buildBody(const ResponseRequest& request) const -> std::string
{
    auto body = nlohmann::json {
        { "content", request.content },
        { "messageType", "voice" },
        { "interrupted", request.interrupted },
        { "sessionContext", nlohmann::json::object() },
    };
    if (!_config.courseId.empty())
        body["sessionContext"]["courseId"] = _config.courseId;
    if (_config.streaming)
        body["stream"] = true;
    return body.dump();
}

auto HttpResponseClient::request(const ResponseRequest& request, const ResponseDeltaCallback& onDelta)
    -> Result<std::string>
{
    if (_config.url.empty())
        return makeError(ErrorCode::NotFoundError, "No response endpoint configured");

    auto httpRequest = HttpRequest { .url = _config.url, .body = buildBody(request), .timeout = _config.timeout };
    if (!_config.authToken.empty())
        httpRequest.headers.push_back(std::format("Authorization: Bearer {}", _config.authToken));

    if (!_config.streaming)
    {
        auto response = _http.post(httpRequest);
        if (!response)
            return std::unexpected(response.error());
        if (!response->ok())
            return std::unexpected(httpStatusError(*response, "Response request"));
        return parseResponseBody(response->body);
    }

    httpRequest.headers.emplace_back("Accept: text/event-stream");

    auto decoder = SseDecoder {};
    auto message = std::string {};
    auto raw = std::string {};
    auto deliver = [&](std::vector<std::string> deltas) -> bool {
        for (auto& delta: deltas)
        {
            message += delta;
            if (onDelta && !onDelta(delta))
                return false;
        }
        return true;
    };

    auto response = _http.postStreaming(httpRequest, [&](std::string_view chunk) {
        if (message.empty() && raw.size() < 64 * 1024)
            raw += chunk;
        return deliver(decoder.feed(chunk));
    });
    if (!response)
        return std::unexpected(response.error());

    if (!response->ok())
    {
        response->body = std::move(raw);
        return std::unexpected(httpStatusError(*response, "Response request"));
    }

    if (!deliver(decoder.finish()))
        return message;

    // The service may answer a streaming request with a single JSON object.
    if (message.empty() && !raw.empty())
    {
        auto parsed = parseResponseBody(raw);
        if (!parsed)
            return std::unexpected(parsed.error());
        if (!parsed->empty() && onDelta)
            (void) onDelta(*parsed);
        return parsed;
    }

    return message;
}

void HttpResponseClient::abort()
{
    _http.abortAll();
}

} // namespace voicetutor
