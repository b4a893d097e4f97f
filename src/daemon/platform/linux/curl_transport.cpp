#include "platform/linux/curl_transport.hpp"

#include <curl/curl.h>
#include <memory>

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
    void operator()(curl_mime* m) const { curl_mime_free(m); }
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

} // namespace

CurlTransport::CurlTransport() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

std::expected<HttpResponse, std::string> CurlTransport::perform(const HttpRequest& request) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::unique_ptr<curl_mime, CurlDeleter> mime;
    if (!request.form.empty()) {
        mime.reset(curl_mime_init(curl.get()));
        for (const auto& field : request.form) {
            curl_mimepart* part = curl_mime_addpart(mime.get());
            curl_mime_name(part, field.name.c_str());
            curl_mime_data(part, field.data.data(), field.data.size());
            if (!field.filename.empty()) curl_mime_filename(part, field.filename.c_str());
            if (!field.content_type.empty()) curl_mime_type(part, field.content_type.c_str());
        }
        curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    } else if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    std::unique_ptr<curl_slist, CurlDeleter> headers;
    auto append_header = [&headers](const std::string& line) {
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (next) {
            headers.release();
            headers.reset(next);
        }
        return next != nullptr;
    };
    if (!request.content_type.empty() && request.form.empty()) {
        if (!append_header("Content-Type: " + request.content_type)) {
            return std::unexpected("out of memory building headers");
        }
    }
    for (const auto& [name, value] : request.headers) {
        if (!append_header(name + ": " + value)) {
            return std::unexpected("out of memory building headers");
        }
    }
    if (headers) curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    // Redirects could leave the authorized destination.
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
