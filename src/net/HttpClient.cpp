// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <format>
#include <mutex>

namespace voicetutor
{

namespace
{

    std::once_flag curlInitFlag;

    void ensureCurlInitialized()
    {
        std::call_once(curlInitFlag, [] {
            if (auto const rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK)
                log::error("curl_global_init failed: {}", curl_easy_strerror(rc));
        });
    }

    struct CurlDeleter
    {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
        void operator()(curl_mime* mime) const { curl_mime_free(mime); }
    };

    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
    using HeaderList = std::unique_ptr<curl_slist, CurlDeleter>;
    using MimeHandle = std::unique_ptr<curl_mime, CurlDeleter>;

    /// @brief Per-transfer state shared with the curl callbacks.
    struct Transfer
    {
        const std::atomic<std::uint64_t>* epoch = nullptr;
        std::uint64_t startEpoch = 0;
        ChunkCallback onChunk;
        std::string body;
        bool stoppedByReceiver = false;
    };

    auto writeCallback(char* data, size_t size, size_t count, void* userData) -> size_t
    {
        auto& transfer = *static_cast<Transfer*>(userData);
        auto const length = size * count;

        if (!transfer.onChunk)
        {
            transfer.body.append(data, length);
            return length;
        }

        if (!transfer.onChunk(std::string_view { data, length }))
        {
            transfer.stoppedByReceiver = true;
            return 0;
        }
        return length;
    }

    auto progressCallback(void* userData, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int
    {
        auto const& transfer = *static_cast<Transfer*>(userData);
        return transfer.epoch->load(std::memory_order_acquire) != transfer.startEpoch ? 1 : 0;
    }

    auto appendHeader(HeaderList& list, const std::string& line) -> bool
    {
        auto* appended = curl_slist_append(list.get(), line.c_str());
        if (!appended)
            return false;
        (void) list.release();
        list.reset(appended);
        return true;
    }

} // namespace

auto httpStatusError(const HttpResponse& response, std::string_view what) -> Error
{
    auto const snippet = std::string_view { response.body }.substr(0, 200);
    auto const message = std::format("{} failed with HTTP {}: {}", what, response.status, snippet);

    switch (response.status)
    {
        case 401:
        case 403: return Error { ErrorCode::AuthError, message };
        case 408:
        case 504: return Error { ErrorCode::TimeoutError, message };
        default: return Error { ErrorCode::NetworkError, message };
    }
}

struct CurlHttpClient::Impl
{
    std::atomic<std::uint64_t> epoch { 0 };

    auto perform(const HttpRequest& request, const std::vector<MultipartPart>* parts, ChunkCallback onChunk)
        -> Result<HttpResponse>
    {
        auto handle = CurlHandle { curl_easy_init() };
        if (!handle)
            return makeError(ErrorCode::NetworkError, "Failed to initialize curl");
        auto* curl = handle.get();

        auto headers = HeaderList {};
        for (auto const& line: request.headers)
            if (!appendHeader(headers, line))
                return makeError(ErrorCode::NetworkError, "Failed to build request headers");

        auto mime = MimeHandle {};
        if (parts)
        {
            mime.reset(curl_mime_init(curl));
            for (auto const& part: *parts)
            {
                auto* field = curl_mime_addpart(mime.get());
                curl_mime_name(field, part.name.c_str());
                curl_mime_data(field, part.data.data(), part.data.size());
                if (!part.filename.empty())
                    curl_mime_filename(field, part.filename.c_str());
                if (!part.contentType.empty())
                    curl_mime_type(field, part.contentType.c_str());
            }
            curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime.get());
        }
        else
        {
            if (!request.contentType.empty()
                && !appendHeader(headers, std::format("Content-Type: {}", request.contentType)))
                return makeError(ErrorCode::NetworkError, "Failed to build request headers");
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }

        auto transfer = Transfer {
            .epoch = &epoch,
            .startEpoch = epoch.load(std::memory_order_acquire),
            .onChunk = std::move(onChunk),
        };

        auto const timeoutMs = static_cast<long>(request.timeout.count());
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min(timeoutMs, 10000L));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &transfer);

        log::trace("POST {} ({} bytes)", request.url, parts ? std::size_t { 0 } : request.body.size());
        auto const rc = curl_easy_perform(curl);

        if (rc == CURLE_ABORTED_BY_CALLBACK)
            return makeError(ErrorCode::Cancelled, std::format("Request to {} was aborted", request.url));
        if (rc == CURLE_WRITE_ERROR && transfer.stoppedByReceiver)
            return makeError(ErrorCode::Cancelled, std::format("Response from {} was abandoned", request.url));
        if (rc == CURLE_OPERATION_TIMEDOUT)
            return makeError(ErrorCode::TimeoutError,
                             std::format("Request to {} timed out after {} ms", request.url, timeoutMs));
        if (rc != CURLE_OK)
            return makeError(ErrorCode::NetworkError,
                             std::format("Request to {} failed: {}", request.url, curl_easy_strerror(rc)));

        auto response = HttpResponse { .body = std::move(transfer.body) };
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        char const* contentType = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &contentType) == CURLE_OK && contentType)
            response.contentType = contentType;

        log::trace("POST {} -> HTTP {}", request.url, response.status);
        return response;
    }
};

CurlHttpClient::CurlHttpClient(): _impl(std::make_unique<Impl>())
{
    ensureCurlInitialized();
}

CurlHttpClient::~CurlHttpClient() = default;

auto CurlHttpClient::post(const HttpRequest& request) -> Result<HttpResponse>
{
    return _impl->perform(request, nullptr, {});
}

auto CurlHttpClient::postMultipart(const HttpRequest& request, const std::vector<MultipartPart>& parts)
    -> Result<HttpResponse>
{
    return _impl->perform(request, &parts, {});
}

auto CurlHttpClient::postStreaming(const HttpRequest& request, ChunkCallback onChunk) -> Result<HttpResponse>
{
    if (!onChunk)
        return makeError(ErrorCode::InvalidArgument, "Streaming request without a chunk callback");
    return _impl->perform(request, nullptr, std::move(onChunk));
}

void CurlHttpClient::abortAll()
{
    _impl->epoch.fetch_add(1, std::memory_order_acq_rel);
}

} // namespace voicetutor
