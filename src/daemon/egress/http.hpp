#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

enum class EgressCategory { Transcription, ModelDownload, UpdateCheck };

const char* category_name(EgressCategory category);
std::optional<EgressCategory> parse_category(std::string_view name);

// One multipart/form-data part. filename/content_type empty for plain fields.
struct FormField {
    std::string name;
    std::string data;
    std::string filename;
    std::string content_type;
};

struct HttpRequest {
    std::string method = "POST";
    std::string url;
    EgressCategory category = EgressCategory::Transcription;

    std::vector<FormField> form; // sent as multipart when non-empty
    std::string body;
    std::string content_type;
    std::vector<std::pair<std::string, std::string>> headers;

    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds timeout{120};

    // Payload bytes the request would put on the wire.
    size_t byte_estimate() const {
        size_t n = body.size();
        for (const auto& f : form) n += f.name.size() + f.data.size() + f.filename.size();
        return n;
    }
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Raw network access. Only EgressGuard holds one; everything else goes
// through GuardedHttpClient.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual std::expected<HttpResponse, std::string> perform(const HttpRequest& request) = 0;
};
