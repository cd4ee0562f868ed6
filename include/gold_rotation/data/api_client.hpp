// include/gold_rotation/data/api_client.hpp
#pragma once

#include <curl/curl.h>
#include <map>
#include <string>
#include <vector>
#include "gold_rotation/core/error.hpp"

namespace gold_rotation {

/**
 * @brief Minimal libcurl HTTP client for the quote APIs
 *
 * Only GET is needed: every upstream call is an idempotent read.
 */
class ApiClient {
public:
    /**
     * @param base_url Scheme and host, e.g. "https://push2his.eastmoney.com"
     * @param timeout_seconds Per-request timeout (connect + transfer)
     */
    explicit ApiClient(std::string base_url, long timeout_seconds = 30);
    ~ApiClient();

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    /**
     * @brief Perform an HTTP GET request
     * @param endpoint Path relative to the base URL
     * @param query Query parameters, URL-encoded by the client
     * @return Response body, or CONNECTION_ERROR / TIMEOUT_ERROR for transport
     *         failures and API_ERROR for HTTP status >= 400
     */
    Result<std::string> get(const std::string& endpoint,
                            const std::map<std::string, std::string>& query = {});

    /**
     * @brief Add a header sent with every request, e.g. "Referer: ..."
     */
    void add_header(const std::string& header);

    void clear_headers();

    const std::string& base_url() const {
        return base_url_;
    }

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* user_data);

    std::string build_url(CURL* curl, const std::string& endpoint,
                          const std::map<std::string, std::string>& query) const;

    std::string base_url_;
    long timeout_seconds_;
    std::vector<std::string> headers_;
};

}  // namespace gold_rotation
