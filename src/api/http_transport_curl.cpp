/*
 * http_transport_curl.cpp
 *
 * Notes
 * - Minimal blocking GET over the libcurl easy API.
 * - Honors timeout, TLS verify/CA, proxy, redirects and a user agent.
 * - HTTP status codes are returned to the caller; only transport failures are errors.
 */

#include <ytarchive/api/youtube_api.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace ytarchive::api {

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, const HttpTransportConfig& cfg) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(cfg.timeout.count(), 30000)));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, cfg.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, cfg.insecure ? 0L : 2L);
    if (!cfg.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, cfg.caPath.c_str());
    }

    if (cfg.proxy && !cfg.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, cfg.proxy->c_str());
    }
    if (!cfg.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, cfg.userAgent.c_str());
    }

    // Worker threads never receive signals from curl's resolver.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
}

class CurlHttpTransport final : public IHttpTransport {
public:
    explicit CurlHttpTransport(HttpTransportConfig cfg) : cfg_(std::move(cfg)) {
        static std::once_flag once;
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }
    ~CurlHttpTransport() override = default;

    Result<HttpResponse> get(const std::string& url) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        HttpResponse resp;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
        configure_common(curl, cfg_);

        CURLcode rc = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
        curl_easy_cleanup(curl);

        if (rc != CURLE_OK) {
            spdlog::debug("HTTP GET failed: {}", curl_easy_strerror(rc));
            return makeCurlError(rc, "http get");
        }
        return resp;
    }

private:
    HttpTransportConfig cfg_;
};

std::unique_ptr<IHttpTransport> makeCurlHttpTransport(const HttpTransportConfig& cfg) {
    return std::make_unique<CurlHttpTransport>(cfg);
}

} // namespace ytarchive::api
