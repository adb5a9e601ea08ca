#include "net/curl_http_client.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <memory>

namespace cursorup {

namespace {

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void EnsureCurlGlobal() {
    static CurlGlobal global;
}

struct CurlEasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct CurlFreeDeleter {
    void operator()(char* p) const { curl_free(p); }
};

bool IsSuccessStatus(long code) { return code >= 200 && code < 300; }

Result BuildHeaderList(const std::map<std::string, std::string>& headers, CurlSlistPtr& out) {
    curl_slist* list = nullptr;
    for (const auto& [key, value] : headers) {
        const std::string line = key + ": " + value;
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) {
            curl_slist_free_all(list);
            return Result::Fail(ErrorKind::NetworkError, "curl_slist_append failed");
        }
        list = next;
    }
    out.reset(list);
    return Result::Ok();
}

size_t AppendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

struct DownloadState {
    IWriter* sink = nullptr;
    const DownloadProgressFn* on_progress = nullptr;
    Result write_result = Result::Ok();
    bool aborted_by_caller = false;
};

size_t WriteToSink(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<DownloadState*>(userdata);
    const size_t n = size * nmemb;
    auto res = state->sink->WriteAll(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(ptr), n));
    if (!res.is_ok()) {
        state->write_result = std::move(res);
        return 0;
    }
    return n;
}

int OnTransferInfo(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* state = static_cast<DownloadState*>(userdata);
    if (!state->on_progress || !*state->on_progress) return 0;
    const auto total = dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0;
    const auto done = dlnow > 0 ? static_cast<std::uint64_t>(dlnow) : 0;
    if (!(*state->on_progress)(done, total)) {
        state->aborted_by_caller = true;
        return 1;
    }
    return 0;
}

std::string DescribeCurlError(CURLcode code, const char* errbuf) {
    std::string msg = curl_easy_strerror(code);
    if (errbuf && errbuf[0] != '\0') {
        msg += " (";
        msg += errbuf;
        msg += ")";
    }
    return msg;
}

} // namespace

CurlHttpClient::CurlHttpClient() { EnsureCurlGlobal(); }

std::string CurlHttpClient::BuildUrl(const std::string& base,
                                     const std::vector<std::pair<std::string, std::string>>& query) {
    if (query.empty()) return base;
    EnsureCurlGlobal();

    CurlEasyPtr handle(curl_easy_init());
    std::string url = base;
    char sep = (base.find('?') == std::string::npos) ? '?' : '&';
    for (const auto& [key, value] : query) {
        std::unique_ptr<char, CurlFreeDeleter> k(
            curl_easy_escape(handle.get(), key.c_str(), static_cast<int>(key.size())));
        std::unique_ptr<char, CurlFreeDeleter> v(
            curl_easy_escape(handle.get(), value.c_str(), static_cast<int>(value.size())));
        url.push_back(sep);
        url += k ? k.get() : key;
        url.push_back('=');
        url += v ? v.get() : value;
        sep = '&';
    }
    return url;
}

Outcome<HttpResponse> CurlHttpClient::Get(const HttpRequest& req) {
    CurlEasyPtr handle(curl_easy_init());
    if (!handle) return Unexpected(ErrorKind::NetworkError, "curl_easy_init failed");

    CurlSlistPtr headers;
    if (auto hr = BuildHeaderList(req.headers, headers); !hr.is_ok()) return Unexpected(hr);

    const std::string url = BuildUrl(req.url, req.query);
    HttpResponse response;
    char errbuf[CURL_ERROR_SIZE]{};

    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(req.timeout_sec));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(req.connect_timeout_sec));
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &AppendToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);

    LogDebug("GET %s", url.c_str());
    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        return Unexpected(ErrorKind::NetworkError,
                          "request to " + url + " failed: " + DescribeCurlError(rc, errbuf));
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);
    char* effective = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        response.effective_url = effective;
    }

    // file:// and similar schemes report 0; treat as success.
    if (response.status_code != 0 && !IsSuccessStatus(response.status_code)) {
        return Unexpected(ErrorKind::NetworkError,
                          "HTTP " + std::to_string(response.status_code) + " from " + url);
    }
    return response;
}

Result CurlHttpClient::Download(const DownloadRequest& req,
                                IWriter& sink,
                                const DownloadProgressFn& on_progress) {
    CurlEasyPtr handle(curl_easy_init());
    if (!handle) return Result::Fail(ErrorKind::NetworkError, "curl_easy_init failed");

    CurlSlistPtr headers;
    if (auto hr = BuildHeaderList(req.headers, headers); !hr.is_ok()) return hr;

    DownloadState state;
    state.sink = &sink;
    state.on_progress = &on_progress;
    char errbuf[CURL_ERROR_SIZE]{};

    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(req.connect_timeout_sec));
    if (req.stall_timeout_sec > 0) {
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1024L);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, static_cast<long>(req.stall_timeout_sec));
    }
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &WriteToSink);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, &OnTransferInfo);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);

    const CURLcode rc = curl_easy_perform(h);
    if (rc == CURLE_OK) return Result::Ok();

    if (!state.write_result.is_ok()) return state.write_result;
    if (state.aborted_by_caller) {
        return Result::Fail(ErrorKind::Cancelled, "download of " + req.url + " was interrupted");
    }
    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    if (rc == CURLE_HTTP_RETURNED_ERROR && status != 0) {
        return Result::Fail(ErrorKind::NetworkError,
                            "HTTP " + std::to_string(status) + " from " + req.url);
    }
    return Result::Fail(ErrorKind::NetworkError,
                        "download of " + req.url + " failed: " + DescribeCurlError(rc, errbuf));
}

} // namespace cursorup
