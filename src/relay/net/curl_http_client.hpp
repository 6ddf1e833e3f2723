#pragma once

#include "curl_global.hpp"
#include "http_client.hpp"

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient() = default;

    std::expected<HttpResponse, HttpError>
        post(const HttpRequest& request, std::stop_token stop) override;

private:
    CurlGlobal global_;
};
