#include "curl_global.hpp"

#include "../logging.hpp"

#include <curl/curl.h>
#include <mutex>

namespace {

std::mutex g_curl_mutex;
int g_curl_refcount = 0;

} // namespace

CurlGlobal::CurlGlobal() {
    std::lock_guard lock(g_curl_mutex);
    if (g_curl_refcount == 0) {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            logging::error("curl_global_init failed: {}", curl_easy_strerror(rc));
            return;
        }
    }
    ++g_curl_refcount;
    ok_ = true;
}

CurlGlobal::~CurlGlobal() {
    if (!ok_) return;
    std::lock_guard lock(g_curl_mutex);
    if (--g_curl_refcount == 0) {
        curl_global_cleanup();
    }
}
