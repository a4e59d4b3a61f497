/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/http.hpp"
#include "debridarr/logger.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <new>

namespace {

std::once_flag g_curl_init;

void ensureCurlInitialized() {
    std::call_once(g_curl_init, [] {
        CURLcode cc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (cc != CURLE_OK) {
            LOG_ERROR("curl_global_init failed: " + std::string(curl_easy_strerror(cc)));
        }
    });
}

struct EasyDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};
struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

HeaderList buildHeaders(const debridarr::HttpHeaders& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        curl_slist* next = curl_slist_append(list, h.c_str());
        if (next == nullptr) {
            curl_slist_free_all(list);
            throw std::bad_alloc();
        }
        list = next;
    }
    return HeaderList(list);
}

size_t collectBody(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

struct StreamContext {
    CURL* curl;
    const debridarr::ChunkSink* sink;
    bool stopped = false;
};

size_t streamBody(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    const size_t total = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        return total;
    }

    try {
        if (!(*ctx->sink)(data, total)) {
            ctx->stopped = true;
            return 0;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Chunk sink error: " + std::string(e.what()));
        ctx->stopped = true;
        return 0;
    }
    return total;
}

}

namespace debridarr {

HttpClient::HttpClient(std::chrono::milliseconds timeout)
    : timeout_(timeout), userAgent_(std::string("debridarr/1.0 ") + curl_version()) {
    ensureCurlInitialized();
}

HttpResponse HttpClient::get(const std::string& url, const HttpHeaders& headers) {
    return perform(Request{"GET", url, {}, false, headers});
}

HttpResponse HttpClient::postForm(const std::string& url, const FormFields& fields, const HttpHeaders& headers) {
    std::string body;
    for (const auto& [key, value] : fields) {
        if (!body.empty()) body += '&';
        body += urlEncode(key) + "=" + urlEncode(value);
    }
    return post(url, body, "application/x-www-form-urlencoded", headers);
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body,
                              const std::string& contentType, const HttpHeaders& headers) {
    HttpHeaders all = headers;
    all.push_back("Content-Type: " + contentType);
    return perform(Request{"POST", url, body, true, std::move(all)});
}

HttpResponse HttpClient::put(const std::string& url, const std::string& body, const HttpHeaders& headers) {
    HttpHeaders all = headers;
    all.push_back("Content-Type: application/octet-stream");
    return perform(Request{"PUT", url, body, true, std::move(all)});
}

HttpResponse HttpClient::del(const std::string& url, const HttpHeaders& headers) {
    return perform(Request{"DELETE", url, {}, false, headers});
}

HttpResponse HttpClient::perform(const Request& request) {
    HttpResponse response;

    EasyHandle curl(curl_easy_init());
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    HeaderList headers = buildHeaders(request.headers);

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collectBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    if (request.hasBody) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    CURLcode cc = curl_easy_perform(curl.get());
    if (cc != CURLE_OK) {
        response.error = curl_easy_strerror(cc);
        LOG_DEBUG(request.method + " " + request.url + " failed: " + response.error);
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    LOG_TRACE(request.method + " " + request.url + " -> " + std::to_string(response.status));
    return response;
}

HttpResponse HttpClient::stream(const std::string& url, const ChunkSink& sink,
                                std::size_t bufferSize, const HttpHeaders& headers) {
    HttpResponse response;

    EasyHandle curl(curl_easy_init());
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    HeaderList headerList = buildHeaders(headers);
    StreamContext ctx{curl.get(), &sink};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, 60L);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(bufferSize));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, streamBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    if (headerList) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    }

    CURLcode cc = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    if (ctx.stopped) {
        response.cancelled = true;
        return response;
    }
    if (cc != CURLE_OK) {
        response.error = curl_easy_strerror(cc);
        LOG_DEBUG("Stream " + url + " failed: " + response.error);
    }
    return response;
}

std::string HttpClient::urlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

}
