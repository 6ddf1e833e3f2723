#include "curl_http_client.hpp"

#include <algorithm>
#include <cctype>
#include <curl/curl.h>

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(buffer, size * nitems);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        std::string value = line.substr(colon + 1);
        auto start = value.find_first_not_of(" \t");
        auto end = value.find_last_not_of(" \t\r\n");
        value = start == std::string::npos ? "" : value.substr(start, end - start + 1);
        (*headers)[name] = value;
    }
    return size * nitems;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(clientp);
    return stop->stop_requested() ? 1 : 0;
}

} // namespace

std::expected<HttpResponse, HttpError>
CurlHttpClient::post(const HttpRequest& request, std::stop_token stop) {
    if (!global_.ok()) {
        return std::unexpected(HttpError{HttpFailure::Network, "libcurl not initialized"});
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(HttpError{HttpFailure::Network, "curl_easy_init failed"});
    }

    curl_slist* header_list = nullptr;
    for (const auto& [name, value] : request.headers) {
        header_list = curl_slist_append(header_list, (name + ": " + value).c_str());
    }

    curl_mime* mime = nullptr;
    if (!request.multipart.empty()) {
        mime = curl_mime_init(curl);
        for (const auto& field : request.multipart) {
            curl_mimepart* part = curl_mime_addpart(mime);
            curl_mime_name(part, field.name.c_str());
            curl_mime_data(part, field.data.data(), field.data.size());
            if (!field.filename.empty()) curl_mime_filename(part, field.filename.c_str());
            if (!field.content_type.empty()) curl_mime_type(part, field.content_type.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    } else {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    if (mime) curl_mime_free(mime);
    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    switch (res) {
        case CURLE_OK:
            return response;
        case CURLE_OPERATION_TIMEDOUT:
            return std::unexpected(HttpError{HttpFailure::Timeout, curl_easy_strerror(res)});
        case CURLE_ABORTED_BY_CALLBACK:
            return std::unexpected(HttpError{HttpFailure::Cancelled, "request cancelled"});
        default:
            return std::unexpected(HttpError{HttpFailure::Network,
                                             std::string("curl error: ") + curl_easy_strerror(res)});
    }
}
