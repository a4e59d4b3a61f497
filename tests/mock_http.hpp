/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <gmock/gmock.h>

#include "debridarr/http.hpp"

namespace debridarr::test {

class MockHttpClient : public HttpClient {
public:
    MOCK_METHOD(HttpResponse, get, (const std::string& url, const HttpHeaders& headers), (override));
    MOCK_METHOD(HttpResponse, postForm,
                (const std::string& url, const FormFields& fields, const HttpHeaders& headers), (override));
    MOCK_METHOD(HttpResponse, post,
                (const std::string& url, const std::string& body, const std::string& contentType,
                 const HttpHeaders& headers), (override));
    MOCK_METHOD(HttpResponse, put,
                (const std::string& url, const std::string& body, const HttpHeaders& headers), (override));
    MOCK_METHOD(HttpResponse, del, (const std::string& url, const HttpHeaders& headers), (override));
    MOCK_METHOD(HttpResponse, stream,
                (const std::string& url, const ChunkSink& sink, std::size_t bufferSize,
                 const HttpHeaders& headers), (override));
};

inline HttpResponse reply(long status, std::string body = "") {
    HttpResponse response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

inline HttpResponse transportFailure(std::string error) {
    HttpResponse response;
    response.error = std::move(error);
    return response;
}

}
