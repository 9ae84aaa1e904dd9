#include "foundry/transport.hpp"
#include "foundry/errors.hpp"
#include "foundry/sanitize.hpp"

#include <curl/curl.h>
#include <plog/Log.h>

#include <cstdlib>

namespace foundry {

// =============================================================================
// ResponseStream
// =============================================================================

const size_t ResponseStream::MAX_ERROR_BODY_BYTES;

std::string ResponseStream::read_all(size_t max_bytes) {
    std::string body;
    std::string chunk;
    while (body.size() < max_bytes && next_chunk(chunk)) {
        body += chunk;
        chunk.clear();
    }
    if (body.size() > max_bytes) {
        body.resize(max_bytes);
    }
    return body;
}

// =============================================================================
// libcurl helpers
// =============================================================================

/**
 * curl_global_init() once per process, before the first handle.
 */
static void ensure_curl_global() {
    struct CurlGlobal {
        CURLcode rc;
        CurlGlobal() : rc(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    };
    static CurlGlobal global;
    if (global.rc != CURLE_OK) {
        throw SdkDependencyError("libcurl", curl_easy_strerror(global.rc));
    }
}

/**
 * Map a libcurl failure to HttpError(0) with the library error as cause.
 */
static HttpError transport_error(CURLcode res) {
    std::exception_ptr cause =
        std::make_exception_ptr(SdkDependencyError("libcurl", curl_easy_strerror(res)));
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return HttpError(0, "Request timed out", "TIMEOUT", cause);
    }
    return HttpError(0, std::string("CURL error: ") + curl_easy_strerror(res),
                     "NETWORK_ERROR", cause);
}

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* buf = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buf->append(ptr, total);
    return total;
}

/**
 * Collects headers of the final response. A new status line (after a
 * 100 Continue or a redirect) starts a fresh header set.
 */
struct HeaderCollector {
    Headers headers;
    int code;
    bool complete;

    HeaderCollector() : code(0), complete(false) {}

    void on_line(const std::string& raw) {
        std::string line = raw;
        while (!line.empty() && (line[line.size() - 1] == '\n' || line[line.size() - 1] == '\r')) {
            line.erase(line.size() - 1);
        }
        if (line.compare(0, 5, "HTTP/") == 0) {
            headers.clear();
            complete = false;
            size_t sp = line.find(' ');
            code = (sp == std::string::npos) ? 0 : std::atoi(line.c_str() + sp + 1);
            return;
        }
        if (line.empty()) {
            /* interim 1xx responses are followed by the real one */
            complete = code >= 200;
            return;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) return;

        std::string value = line.substr(colon + 1);
        size_t b = value.find_first_not_of(" \t");
        value = (b == std::string::npos) ? std::string() : value.substr(b);
        headers[to_lower(line.substr(0, colon))] = value;
    }
};

static size_t curl_header_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    HeaderCollector* collector = static_cast<HeaderCollector*>(userdata);
    size_t total = size * nmemb;
    collector->on_line(std::string(ptr, total));
    return total;
}

/**
 * Owns the easy handle and header list of one request.
 */
struct EasyRequest {
    CURL* curl;
    struct curl_slist* header_list;
    std::string body;

    EasyRequest() : curl(NULL), header_list(NULL) {}

    ~EasyRequest() {
        if (header_list) curl_slist_free_all(header_list);
        if (curl) curl_easy_cleanup(curl);
    }

    void setup(const HttpRequest& request, HeaderCollector* collector) {
        ensure_curl_global();
        curl = curl_easy_init();
        if (!curl) {
            throw HttpError(0, "Failed to initialize CURL", "NETWORK_ERROR",
                            std::make_exception_ptr(SdkDependencyError("libcurl", "curl_easy_init failed")));
        }

        for (Headers::const_iterator it = request.headers.begin(); it != request.headers.end(); ++it) {
            std::string line = it->first + ": " + it->second;
            header_list = curl_slist_append(header_list, line.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, curl_header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, collector);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (request.method == "POST" || request.method == "PATCH" || request.method == "PUT") {
            body = request.body;
            if (request.method == "POST") {
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
            } else {
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            }
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        } else if (request.method == "DELETE") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
        } else {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }
    }

private:
    EasyRequest(const EasyRequest&);
    EasyRequest& operator=(const EasyRequest&);
};

/**
 * Owns a multi handle and detaches the easy handle before cleanup.
 */
struct MultiHandle {
    CURLM* multi;
    CURL* easy;

    MultiHandle() : multi(NULL), easy(NULL) {}

    ~MultiHandle() {
        if (multi) {
            if (easy) curl_multi_remove_handle(multi, easy);
            curl_multi_cleanup(multi);
        }
    }

private:
    MultiHandle(const MultiHandle&);
    MultiHandle& operator=(const MultiHandle&);
};

/** CURLOPT_LOW_SPEED_TIME has whole-second granularity; round up, at least 1. */
static long stall_timeout_secs(int timeout_ms) {
    long secs = (static_cast<long>(timeout_ms) + 999) / 1000;
    return secs < 1 ? 1 : secs;
}

// =============================================================================
// CurlResponseStream
// =============================================================================

class CurlResponseStream : public ResponseStream {
public:
    explicit CurlResponseStream(const HttpRequest& request)
        : finished_(false)
        , status_(0)
    {
        req_.setup(request, &collector_);
        curl_easy_setopt(req_.curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
        curl_easy_setopt(req_.curl, CURLOPT_WRITEDATA, &pending_);
        /* no total timeout on a long-lived stream, only on connecting */
        curl_easy_setopt(req_.curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout_ms));
        /* a stream that stays silent for timeout_ms fails with CURLE_OPERATION_TIMEDOUT */
        curl_easy_setopt(req_.curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(req_.curl, CURLOPT_LOW_SPEED_TIME, stall_timeout_secs(request.timeout_ms));

        multi_.multi = curl_multi_init();
        if (!multi_.multi) {
            throw HttpError(0, "Failed to initialize CURL multi handle", "NETWORK_ERROR",
                            std::make_exception_ptr(SdkDependencyError("libcurl", "curl_multi_init failed")));
        }
        curl_multi_add_handle(multi_.multi, req_.curl);
        multi_.easy = req_.curl;

        /* pump until the final response's headers are in */
        while (!collector_.complete && !finished_) {
            pump();
        }

        long code = 0;
        curl_easy_getinfo(req_.curl, CURLINFO_RESPONSE_CODE, &code);
        status_ = static_cast<int>(code);
    }

    int status() const { return status_; }

    const Headers& headers() const { return collector_.headers; }

    bool next_chunk(std::string& out) {
        while (pending_.empty() && !finished_) {
            pump();
        }
        if (pending_.empty()) {
            return false;
        }
        out.swap(pending_);
        pending_.clear();
        return true;
    }

private:
    CurlResponseStream(const CurlResponseStream&);
    CurlResponseStream& operator=(const CurlResponseStream&);

    /** One round of transfer work; throws HttpError(0) on failure. */
    void pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_.multi, &running);
        if (mc != CURLM_OK) {
            finished_ = true;
            throw HttpError(0, std::string("CURL multi error: ") + curl_multi_strerror(mc),
                            "NETWORK_ERROR",
                            std::make_exception_ptr(SdkDependencyError("libcurl", curl_multi_strerror(mc))));
        }

        if (running == 0) {
            finished_ = true;
            int queued = 0;
            CURLMsg* msg;
            while ((msg = curl_multi_info_read(multi_.multi, &queued)) != NULL) {
                if (msg->msg == CURLMSG_DONE && msg->data.result != CURLE_OK) {
                    PLOGW << "http:stream_failed error=" << curl_easy_strerror(msg->data.result);
                    throw transport_error(msg->data.result);
                }
            }
            return;
        }

        if (pending_.empty()) {
            curl_multi_poll(multi_.multi, NULL, 0, 1000, NULL);
        }
    }

    /* declaration order matters: multi_ must be destroyed before req_ */
    EasyRequest req_;
    HeaderCollector collector_;
    MultiHandle multi_;
    bool finished_;
    int status_;
    std::string pending_;
};

// =============================================================================
// CurlTransport
// =============================================================================

CurlTransport::CurlTransport() {
    ensure_curl_global();
}

HttpResponse CurlTransport::send(const HttpRequest& request) {
    HeaderCollector collector;
    EasyRequest req;
    req.setup(request, &collector);

    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));

    CURLcode res = curl_easy_perform(req.curl);
    if (res != CURLE_OK) {
        PLOGW << "http:transport_failed method=" << request.method
              << " url=" << sanitize(request.url) << " error=" << curl_easy_strerror(res);
        throw transport_error(res);
    }

    long http_code = 0;
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status = static_cast<int>(http_code);
    response.headers = collector.headers;
    return response;
}

std::unique_ptr<ResponseStream> CurlTransport::open_stream(const HttpRequest& request) {
    return std::unique_ptr<ResponseStream>(new CurlResponseStream(request));
}

} /* namespace foundry */
