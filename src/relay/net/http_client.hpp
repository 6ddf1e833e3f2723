#pragma once

#include <chrono>
#include <expected>
#include <map>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

struct MultipartField {
    std::string name;
    std::string data;
    // Set for file parts.
    std::string filename;
    std::string content_type;
};

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    // JSON body; ignored when multipart is non-empty.
    std::string body;
    std::vector<MultipartField> multipart;
    std::chrono::milliseconds timeout{6000};
};

struct HttpResponse {
    long status = 0;
    // Header names are lower-cased.
    std::map<std::string, std::string> headers;
    std::string body;

    std::string header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? std::string{} : it->second;
    }
};

enum class HttpFailure { Timeout, Network, Cancelled };

struct HttpError {
    HttpFailure kind = HttpFailure::Network;
    std::string message;
};

// Transport seam for the one-shot engines.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual std::expected<HttpResponse, HttpError>
        post(const HttpRequest& request, std::stop_token stop) = 0;
};
