#include "CurlHttpClient.h"
#include "../core/Cancellation.h"
#include "../core/Logging.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace daily_dash {

namespace {

std::once_flag g_curl_init;

struct Transfer {
    std::string body;
    std::size_t limit = 0;
    bool overflow = false;
    const CancellationToken* cancel = nullptr;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata){
    auto* t = static_cast<Transfer*>(userdata);
    size_t n = size * nmemb;
    if(t->body.size() + n > t->limit){
        t->overflow = true;
        return 0;
    }
    t->body.append(ptr, n);
    return n;
}

int progress_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t){
    auto* t = static_cast<Transfer*>(userdata);
    return (t->cancel && t->cancel->cancelled()) ? 1 : 0;
}

struct EasyDeleter { void operator()(CURL* c) const { if(c) curl_easy_cleanup(c); } };
struct SlistDeleter { void operator()(curl_slist* s) const { if(s) curl_slist_free_all(s); } };

Error transport_error(CURLcode rc, const std::string& url, const Transfer& t){
    std::string what = std::string(curl_easy_strerror(rc)) + " (" + url + ")";
    switch(rc){
        case CURLE_OPERATION_TIMEDOUT:
            return make_error(ErrorKind::Timeout, what);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PARTIAL_FILE:
            return make_error(ErrorKind::ConnectionError, what);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error(ErrorKind::Cancelled, "request cancelled (" + url + ")");
        case CURLE_WRITE_ERROR:
            if(t.overflow) return make_error(ErrorKind::HttpError, "response body exceeds limit (" + url + ")");
            return make_error(ErrorKind::ConnectionError, what);
        default:
            return make_error(ErrorKind::ConnectionError, what);
    }
}

}

CurlHttpClient::CurlHttpClient(std::string user_agent, std::size_t max_body_bytes)
    : user_agent_(std::move(user_agent)), max_body_bytes_(max_body_bytes) {
    std::call_once(g_curl_init, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<HttpResponse> CurlHttpClient::get(const HttpRequest& request, const CancellationToken& cancel){
    if(cancel.cancelled())
        return Result<HttpResponse>::failure(make_error(ErrorKind::Cancelled, "request cancelled (" + request.url + ")"));

    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if(!curl)
        return Result<HttpResponse>::failure(make_error(ErrorKind::Internal, "curl_easy_init failed"));

    Transfer t;
    t.limit = max_body_bytes_;
    t.cancel = &cancel;

    curl_slist* raw_headers = nullptr;
    for(const auto& h : request.headers)
        raw_headers = curl_slist_append(raw_headers, (h.first + ": " + h.second).c_str());
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    CURL* c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(c, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, &t);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    if(headers) curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());

    Logger::instance().trace("GET " + request.url);
    CURLcode rc = curl_easy_perform(c);
    if(rc != CURLE_OK) return Result<HttpResponse>::failure(transport_error(rc, request.url, t));

    long status = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
    if(auto err = status_error(static_cast<int>(status), request.url))
        return Result<HttpResponse>::failure(*err);

    HttpResponse resp;
    resp.status = static_cast<int>(status);
    resp.body = std::move(t.body);
    char* ctype = nullptr;
    if(curl_easy_getinfo(c, CURLINFO_CONTENT_TYPE, &ctype) == CURLE_OK && ctype) resp.content_type = ctype;
    return Result<HttpResponse>::success(std::move(resp));
}

}
