#include "scoring/CurlHttpTransport.hpp"

#include <curl/curl.h>

#include <memory>

namespace scoring {

namespace {

struct EasyHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

size_t AppendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

void SetOption(CURLcode result, const char* option) {
    if (result != CURLE_OK) {
        throw HttpTransportException(static_cast<int>(result),
            std::string{"failed to set "} + option + ": " + curl_easy_strerror(result));
    }
}

} // namespace

HttpResponse CurlHttpTransport::Post(const HttpRequest& request) {
    // libcurl reads a zero timeout as no limit at all.
    if (request.timeout.count() <= 0) {
        throw HttpTransportException(static_cast<int>(CURLE_BAD_FUNCTION_ARGUMENT), "request timeout must be positive");
    }

    std::unique_ptr<CURL, EasyHandleDeleter> curl{curl_easy_init()};
    if (!curl) {
        throw HttpTransportException(0, "curl_easy_init failed");
    }

    curl_slist* rawHeaders = nullptr;
    for (const auto& header : request.headers) {
        const auto line = header.first + ": " + header.second;
        auto* appended = curl_slist_append(rawHeaders, line.c_str());
        if (appended == nullptr) {
            curl_slist_free_all(rawHeaders);
            throw HttpTransportException(0, "failed to build request headers");
        }
        rawHeaders = appended;
    }
    std::unique_ptr<curl_slist, HeaderListDeleter> headers{rawHeaders};

    HttpResponse response;
    const long timeoutMs = static_cast<long>(request.timeout.count());

    SetOption(curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str()), "CURLOPT_URL");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_POST, 1L), "CURLOPT_POST");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str()), "CURLOPT_POSTFIELDS");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size())),
        "CURLOPT_POSTFIELDSIZE");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get()), "CURLOPT_HTTPHEADER");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeoutMs), "CURLOPT_TIMEOUT_MS");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeoutMs), "CURLOPT_CONNECTTIMEOUT_MS");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L), "CURLOPT_NOSIGNAL");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendBody), "CURLOPT_WRITEFUNCTION");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body), "CURLOPT_WRITEDATA");

    const auto result = curl_easy_perform(curl.get());
    if (result != CURLE_OK) {
        throw HttpTransportException(static_cast<int>(result), curl_easy_strerror(result));
    }

    const auto info = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (info != CURLE_OK) {
        throw HttpTransportException(static_cast<int>(info), curl_easy_strerror(info));
    }

    return response;
}

CurlGlobalScope::CurlGlobalScope() {
    const auto result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (result != CURLE_OK) {
        throw HttpTransportException(static_cast<int>(result),
            std::string{"curl_global_init failed: "} + curl_easy_strerror(result));
    }
}

CurlGlobalScope::~CurlGlobalScope() { curl_global_cleanup(); }

} // namespace scoring
