#pragma once

#include "egress/http.hpp"

// libcurl easy-handle transport; one handle per request.
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::expected<HttpResponse, std::string> perform(const HttpRequest& request) override;
};
