#pragma once

#include <curl/curl.h>
#include <string>
#include <stdexcept>
#include <utility>

struct HttpResponse {
    CURLcode result = CURLE_OK;
    long status = 0;
    std::string body;

    bool transport_ok() const { return result == CURLE_OK; }
    bool success() const { return transport_ok() && status >= 200 && status < 300; }
};

// One HTTP exchange with libcurl; the handle, header list and request body
// live exactly as long as the request.
class CurlRequest {
private:
    CURL* handle;
    curl_slist* headers;
    std::string payload;

    static size_t append_body(void* contents, size_t size, size_t nmemb, void* userp) {
        static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
        return size * nmemb;
    }

    HttpResponse perform() {
        HttpResponse response;
        if (headers) {
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers);
        }
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_body);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
        response.result = curl_easy_perform(handle);
        if (response.result == CURLE_OK) {
            curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
        }
        return response;
    }

public:
    explicit CurlRequest(const std::string& url) : handle(nullptr), headers(nullptr) {
        handle = curl_easy_init();
        if (!handle) {
            throw std::runtime_error("Failed to initialize CURL");
        }
        curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle, CURLOPT_USERAGENT, "autocommit/1.0");
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    }

    ~CurlRequest() {
        if (handle) {
            curl_easy_cleanup(handle);
        }
        if (headers) {
            curl_slist_free_all(headers);
        }
    }

    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    void add_header(const std::string& header) {
        headers = curl_slist_append(headers, header.c_str());
    }

    HttpResponse post_json(std::string body) {
        payload = std::move(body);
        add_header("content-type: application/json");
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, payload.c_str());
        return perform();
    }

    HttpResponse get() {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
        return perform();
    }
};
