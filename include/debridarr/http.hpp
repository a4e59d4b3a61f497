/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace debridarr {

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string error;       // transport error text, empty when a response arrived
    bool cancelled = false;  // sink asked to stop

    [[nodiscard]] bool transportOk() const noexcept { return error.empty() && !cancelled; }
    [[nodiscard]] bool success() const noexcept { return transportOk() && status >= 200 && status < 300; }
};

using HttpHeaders = std::vector<std::string>;
using FormFields = std::vector<std::pair<std::string, std::string>>;

// Receives response body chunks. Returning false aborts the transfer.
using ChunkSink = std::function<bool(const char* data, std::size_t size)>;

// Blocking libcurl wrapper. One easy handle per call, so a single instance
// may be shared across threads.
class HttpClient {
public:
    explicit HttpClient(std::chrono::milliseconds timeout = std::chrono::seconds(30));
    virtual ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    [[nodiscard]] virtual HttpResponse get(const std::string& url, const HttpHeaders& headers = {});
    [[nodiscard]] virtual HttpResponse postForm(const std::string& url, const FormFields& fields,
                                                const HttpHeaders& headers = {});
    [[nodiscard]] virtual HttpResponse post(const std::string& url, const std::string& body,
                                            const std::string& contentType, const HttpHeaders& headers = {});
    [[nodiscard]] virtual HttpResponse put(const std::string& url, const std::string& body,
                                           const HttpHeaders& headers = {});
    [[nodiscard]] virtual HttpResponse del(const std::string& url, const HttpHeaders& headers = {});

    // Streams a GET body through the sink. No total timeout; transfers that
    // stall below one byte per second for a minute are aborted. Bodies of
    // error responses (status >= 400) are not passed to the sink.
    [[nodiscard]] virtual HttpResponse stream(const std::string& url, const ChunkSink& sink,
                                              std::size_t bufferSize, const HttpHeaders& headers = {});

    [[nodiscard]] static std::string urlEncode(const std::string& value);

private:
    struct Request {
        std::string method;
        std::string url;
        std::string body;
        bool hasBody = false;
        HttpHeaders headers;
    };

    [[nodiscard]] HttpResponse perform(const Request& request);

    std::chrono::milliseconds timeout_;
    std::string userAgent_;
};

}
