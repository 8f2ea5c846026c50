#include "../include/worker_client.hpp"
#include <curl/curl.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

// Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
static int progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* token = static_cast<const CancellationToken*>(clientp);
    return (token && token->cancelled()) ? 1 : 0;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct HeaderList {
    struct curl_slist* list{nullptr};
    ~HeaderList() { if (list) curl_slist_free_all(list); }
};
}

std::string WorkerEndpoint::base_url() const {
    return "http://" + host + ":" + std::to_string(port);
}

AgentReply CurlWorkerTransport::ping(const WorkerEndpoint& ep, std::chrono::milliseconds timeout) {
    return perform(ep.base_url() + "/ping", nullptr, timeout, nullptr);
}

AgentReply CurlWorkerTransport::status(const WorkerEndpoint& ep, std::chrono::milliseconds timeout) {
    return perform(ep.base_url() + "/status", nullptr, timeout, nullptr);
}

AgentReply CurlWorkerTransport::exec(const WorkerEndpoint& ep, const std::string& cmd,
                                     std::chrono::milliseconds timeout,
                                     const CancellationToken* cancel) {
    std::string body = json({{"cmd", cmd}}).dump();
    return perform(ep.base_url() + "/exec", &body, timeout, cancel);
}

AgentReply CurlWorkerTransport::perform(const std::string& url, const std::string* post_body,
                                        std::chrono::milliseconds timeout,
                                        const CancellationToken* cancel) {
    AgentReply reply;
    try {
        CurlHandle c;
        HeaderList headers;
        std::string buf;
        curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, (long)timeout.count());
        curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
        if (post_body) {
            headers.list = curl_slist_append(headers.list, "Content-Type: application/json");
            curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
            curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, post_body->c_str());
            curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)post_body->size());
        }
        if (cancel) {
            curl_easy_setopt(c.h, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(c.h, CURLOPT_XFERINFOFUNCTION, progress_cb);
            curl_easy_setopt(c.h, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(cancel));
        }

        CURLcode code = curl_easy_perform(c.h);
        if (code != CURLE_OK) {
            reply.detail = curl_easy_strerror(code);
            if (code == CURLE_OPERATION_TIMEDOUT) reply.code = TransportCode::TimedOut;
            else if (code == CURLE_ABORTED_BY_CALLBACK) reply.code = TransportCode::Aborted;
            else reply.code = TransportCode::ConnectFailed;
            return reply;
        }
        curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &reply.http_status);

        auto parsed = json::parse(buf, nullptr, false);
        if (!parsed.is_discarded()) reply.body = std::move(parsed);

        if (reply.http_status < 200 || reply.http_status >= 300) {
            reply.code = TransportCode::HttpError;
            if (reply.body.is_object() && reply.body.contains("error") && reply.body["error"].is_string()) {
                reply.detail = reply.body["error"].get<std::string>();
            } else {
                reply.detail = "HTTP " + std::to_string(reply.http_status);
            }
            return reply;
        }
        if (!reply.body.is_object()) {
            reply.code = TransportCode::BadReply;
            reply.detail = "agent reply is not a JSON object";
            return reply;
        }
        reply.code = TransportCode::Ok;
    } catch (const std::exception& e) {
        reply.code = TransportCode::ConnectFailed;
        reply.detail = e.what();
    }
    return reply;
}
