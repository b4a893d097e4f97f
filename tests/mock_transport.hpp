#pragma once

#include "egress/http.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

// Records every request that reaches the network layer.
class MockTransport : public HttpTransport {
public:
    std::expected<HttpResponse, std::string> perform(const HttpRequest& request) override {
        std::lock_guard lock(m_);
        requests_.push_back(request);
        if (!fail_with.empty()) return std::unexpected(fail_with);
        return response;
    }

    size_t calls() {
        std::lock_guard lock(m_);
        return requests_.size();
    }

    HttpRequest last() {
        std::lock_guard lock(m_);
        return requests_.back();
    }

    std::vector<HttpRequest> all() {
        std::lock_guard lock(m_);
        return requests_;
    }

    HttpResponse response{200, R"({"text":"ok"})"};
    std::string fail_with;

private:
    std::mutex m_;
    std::vector<HttpRequest> requests_;
};
