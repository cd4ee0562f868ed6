// src/data/api_client.cpp
#include "gold_rotation/data/api_client.hpp"
#include <mutex>
#include "gold_rotation/core/logger.hpp"

namespace gold_rotation {

namespace {

const char* kUserAgent =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/120.0 Safari/537.36";

void ensure_curl_global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

ApiClient::ApiClient(std::string base_url, long timeout_seconds)
    : base_url_(std::move(base_url)), timeout_seconds_(timeout_seconds) {
    ensure_curl_global_init();
}

ApiClient::~ApiClient() = default;

size_t ApiClient::write_callback(void* contents, size_t size, size_t nmemb,
                                 std::string* user_data) {
    user_data->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

void ApiClient::add_header(const std::string& header) {
    headers_.push_back(header);
}

void ApiClient::clear_headers() {
    headers_.clear();
}

std::string ApiClient::build_url(CURL* curl, const std::string& endpoint,
                                 const std::map<std::string, std::string>& query) const {
    std::string url = base_url_ + endpoint;
    char separator = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : query) {
        char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        url += separator;
        url += key + "=" + (escaped ? std::string(escaped) : value);
        if (escaped) {
            curl_free(escaped);
        }
        separator = '&';
    }
    return url;
}

Result<std::string> ApiClient::get(const std::string& endpoint,
                                   const std::map<std::string, std::string>& query) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<std::string>(ErrorCode::CONNECTION_ERROR, "Failed to initialize CURL",
                                       "ApiClient");
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers_) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    std::string response;
    const std::string url = build_url(curl, endpoint, query);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, ApiClient::write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    DEBUG("GET " << url);
    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<std::string>(ErrorCode::TIMEOUT_ERROR,
                                       "Request timed out: " + url, "ApiClient");
    }
    if (res != CURLE_OK) {
        return make_error<std::string>(
            ErrorCode::CONNECTION_ERROR,
            "CURL error: " + std::string(curl_easy_strerror(res)) + " (" + url + ")",
            "ApiClient");
    }
    if (status >= 400) {
        return make_error<std::string>(
            ErrorCode::API_ERROR, "HTTP " + std::to_string(status) + " from " + url,
            "ApiClient");
    }
    return response;
}

}  // namespace gold_rotation
