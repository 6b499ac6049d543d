#include "CurlTransport.h"

#include <curl/curl.h>
#include <memory>
#include <mutex>

#include "Errors.h"

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

static std::string escape(CURL* curl, const std::string& s) {
    char* out = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
    if (!out) throw TransportError("curl_easy_escape failed");
    std::string result(out);
    curl_free(out);
    return result;
}

void CurlTransport::globalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

void CurlTransport::globalCleanup() {
    curl_global_cleanup();
}

CurlTransport::CurlTransport(const Site& site, CurlOptions opts)
    : apiBase(site.apiBase),
      user(site.user),
      token(site.token),
      options(std::move(opts)) {
    globalInit();
}

void CurlTransport::cancel() {
    cancelled = true;
}

static int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* self = static_cast<const CurlTransport*>(clientp);
    // ненулевой возврат -> CURLE_ABORTED_BY_CALLBACK
    return self->isCancelled() ? 1 : 0;
}

std::string CurlTransport::buildUrl(const HttpRequest& req) const {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw TransportError("curl_easy_init() failed");

    std::string url = apiBase + req.path;
    char sep = '?';
    for (const auto& [key, value] : req.query) {
        url += sep;
        url += escape(curl.get(), key);
        url += '=';
        url += escape(curl.get(), value);
        sep = '&';
    }
    return url;
}

HttpResponse CurlTransport::send(const HttpRequest& req) {
    if (cancelled) throw TransportError("request cancelled");

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw TransportError("curl_easy_init() failed");

    const std::string url = buildUrl(req);
    HttpResponse resp;

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());

    // HTTP/2 через прокси ломается, форсим HTTP/1.1
    curl_easy_setopt(h, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

    curl_easy_setopt(h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(h, CURLOPT_USERNAME, user.c_str());
    curl_easy_setopt(h, CURLOPT_PASSWORD, token.c_str());
    curl_easy_setopt(h, CURLOPT_USERAGENT, options.userAgent.c_str());

    if (req.method == "POST") {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, 0L);
    } else if (req.method != "GET") {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, options.connectTimeoutSec);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, options.totalTimeoutSec);

    // libcurl без сигналов (несколько потоков)
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, this);

    CURLcode res = curl_easy_perform(h);
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw TransportError("request cancelled");
    }
    if (res != CURLE_OK) {
        throw TransportError(req.method + " " + req.path + ": " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}
