#include "http_delivery_port.hpp"
#include "../errors.hpp"
#include "entry_codec.hpp"
#include "gzip.hpp"
#include <curl/curl.h>
#include <iostream>
#include <memory>
#include <mutex>

namespace {

constexpr size_t kMaxErrorBodyLength = 512;

// curl_global_init is not thread-safe, so the first port in the process
// initializes it under a lock and it is left in place until exit
std::mutex& curlInitMutex() {
    static std::mutex m;
    return m;
}

int& curlInitRefCount() {
    static int count = 0;
    return count;
}

void ensureCurlInitialized() {
    std::lock_guard<std::mutex> lock(curlInitMutex());
    if (curlInitRefCount()++ == 0) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
}

void releaseCurl() {
    std::lock_guard<std::mutex> lock(curlInitMutex());
    --curlInitRefCount();
}

// Nonzero return makes curl abort the transfer with CURLE_ABORTED_BY_CALLBACK
int progressCallback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                     curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* closed = static_cast<std::atomic<bool>*>(clientp);
    return closed->load() ? 1 : 0;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

ErrorKind classifyCurlCode(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
            return ErrorKind::Network;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorKind::Timeout;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return ErrorKind::Validation;
        case CURLE_ABORTED_BY_CALLBACK:
            return ErrorKind::Cancelled;
        default:
            return ErrorKind::Unknown;
    }
}

std::string truncateBody(const std::string& body) {
    if (body.size() <= kMaxErrorBodyLength) {
        return body;
    }
    return body.substr(0, kMaxErrorBodyLength) + "...";
}

} // namespace

HttpDeliveryPort::HttpDeliveryPort(const ClientConfig& config)
    : base_url_(config.server_url)
    , api_key_(config.api_key)
    , timeout_(config.timeout)
    , gzip_enabled_(config.compression == "gzip")
    , closed_(false) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    ensureCurlInitialized();
}

HttpDeliveryPort::~HttpDeliveryPort() {
    close();
    releaseCurl();
}

DeliveryReceipt HttpDeliveryPort::send(const std::string& serialized_entry) {
    HttpResponse response = perform(kIngestPath, &serialized_entry);
    if (response.status == 200 || response.status == 201) {
        return EntryCodec::parseReceipt(static_cast<int>(response.status), response.body);
    }

    int status = static_cast<int>(response.status);
    throw DeliveryError(classifyHttpStatus(status),
                        "HTTP " + std::to_string(status) + ": " + truncateBody(response.body),
                        status);
}

void HttpDeliveryPort::close() {
    closed_ = true;
}

std::string HttpDeliveryPort::health() {
    HttpResponse response = perform("/health", nullptr);
    if (response.status != 200) {
        int status = static_cast<int>(response.status);
        throw DeliveryError(classifyHttpStatus(status),
                            "Health check failed: HTTP " + std::to_string(status), status);
    }
    return response.body;
}

std::string HttpDeliveryPort::version() {
    HttpResponse response = perform("/version", nullptr);
    if (response.status != 200) {
        int status = static_cast<int>(response.status);
        throw DeliveryError(classifyHttpStatus(status),
                            "Version request failed: HTTP " + std::to_string(status), status);
    }
    return response.body;
}

HttpDeliveryPort::HttpResponse HttpDeliveryPort::perform(const std::string& path,
                                                         const std::string* post_body) {
    if (closed_) {
        throw DeliveryError(ErrorKind::Cancelled, "Delivery port is closed");
    }

    CurlPtr curl(curl_easy_init());
    if (!curl) {
        throw DeliveryError(ErrorKind::Unknown, "Failed to initialize libcurl handle");
    }

    std::string url = base_url_ + path;
    std::string auth_header = "Authorization: Bearer " + api_key_;

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, auth_header.c_str());
    raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
    raw_headers = curl_slist_append(raw_headers, "User-Agent: logflux-agent/1.0");

    std::string body;
    if (post_body) {
        raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
        if (gzip_enabled_) {
            if (!gzip::compress(*post_body, body)) {
                curl_slist_free_all(raw_headers);
                throw DeliveryError(ErrorKind::Validation, "Failed to gzip request body");
            }
            raw_headers = curl_slist_append(raw_headers, "Content-Encoding: gzip");
        } else {
            body = *post_body;
        }
    }
    SlistPtr headers(raw_headers);

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &closed_);
    if (post_body) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        ErrorKind kind = classifyCurlCode(res);
        if (kind == ErrorKind::Cancelled) {
            throw DeliveryError(kind, "Request to " + url + " cancelled: delivery port closed");
        }
        throw DeliveryError(kind, "Request to " + url + " failed: " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
