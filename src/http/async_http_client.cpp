/**
 * curl multi socket interface on libuv
 *
 * curl tells us which sockets to watch (socketFunction) and when to call it
 * back (timerFunction). Each watched socket gets a heap SocketWatch whose
 * uv_poll_t is released in its close callback; the single timeout timer is
 * handled the same way so both can outlive the client during shutdown.
 */

#include "easel/http/async_http_client.h"
#include <iostream>
#include <queue>
#include <unordered_map>

#include <curl/curl.h>

namespace easel {
namespace http {

namespace {

struct Download {
    CURL* easy = nullptr;
    AsyncHttpCallback callback;
    HttpResponse response;
    size_t maxBytes = 0;
    bool tooLarge = false;
};

struct Finished {
    AsyncHttpCallback callback;
    HttpResponse response;
};

struct SocketWatch {
    uv_poll_t poll{};
    curl_socket_t fd = CURL_SOCKET_BAD;
    AsyncHttpClient::Impl* owner = nullptr;
};

struct CurlTimer {
    uv_timer_t timer{};
    AsyncHttpClient::Impl* owner = nullptr;
};

void closePoll(SocketWatch* watch) {
    uv_poll_stop(&watch->poll);
    uv_close(reinterpret_cast<uv_handle_t*>(&watch->poll), [](uv_handle_t* handle) {
        delete static_cast<SocketWatch*>(handle->data);
    });
}

HttpResponse failure(const std::string& url, std::string error) {
    HttpResponse response;
    response.url = url;
    response.error = std::move(error);
    return response;
}

} // namespace

struct AsyncHttpClient::Impl {
    async::EventLoop& loop;
    CURLM* multi = nullptr;
    CurlTimer* timer = nullptr;

    std::unordered_map<curl_socket_t, SocketWatch*> watches;
    std::unordered_map<CURL*, std::unique_ptr<Download>> downloads;
    std::queue<Finished> finished;
    bool drainScheduled = false;
    std::weak_ptr<Impl> self;

    explicit Impl(async::EventLoop& l) : loop(l) {}

    void socketAction(curl_socket_t fd, int flags) {
        int running = 0;
        curl_multi_socket_action(multi, fd, flags, &running);
        collectFinished();
    }

    void collectFinished() {
        CURLMsg* msg = nullptr;
        int pending = 0;
        while ((msg = curl_multi_info_read(multi, &pending))) {
            if (msg->msg != CURLMSG_DONE) continue;

            auto it = downloads.find(msg->easy_handle);
            if (it == downloads.end()) continue;
            Download& download = *it->second;
            finishDownload(download, msg->data.result);

            finished.push({std::move(download.callback), std::move(download.response)});
            curl_multi_remove_handle(multi, download.easy);
            curl_easy_cleanup(download.easy);
            downloads.erase(it);
        }
        if (!finished.empty()) {
            scheduleDrain();
        }
    }

    void finishDownload(Download& download, CURLcode result) {
        HttpResponse& response = download.response;
        if (download.tooLarge) {
            response.error = "Response larger than " + std::to_string(download.maxBytes) + " bytes";
            response.data.clear();
            return;
        }
        if (result != CURLE_OK) {
            response.error = curl_easy_strerror(result);
            response.data.clear();
            return;
        }

        long status = 0;
        curl_easy_getinfo(download.easy, CURLINFO_RESPONSE_CODE, &status);
        response.status = static_cast<int>(status);

        char* effectiveUrl = nullptr;
        if (curl_easy_getinfo(download.easy, CURLINFO_EFFECTIVE_URL, &effectiveUrl) == CURLE_OK && effectiveUrl) {
            response.url = effectiveUrl;
        }
        char* contentType = nullptr;
        if (curl_easy_getinfo(download.easy, CURLINFO_CONTENT_TYPE, &contentType) == CURLE_OK && contentType) {
            response.contentType = contentType;
        }

        response.ok = status >= 200 && status < 300;
        if (!response.ok) {
            response.error = "HTTP " + std::to_string(status);
        }
    }

    void queueFailure(AsyncHttpCallback callback, HttpResponse response) {
        finished.push({std::move(callback), std::move(response)});
        scheduleDrain();
    }

    void scheduleDrain() {
        if (drainScheduled) return;
        std::weak_ptr<Impl> weak = self;
        drainScheduled = loop.defer([weak]() {
            if (auto impl = weak.lock()) {
                impl->drainScheduled = false;
                impl->drain();
            }
        });
        if (!drainScheduled) {
            // No loop to defer on; nothing would ever deliver these
            drain();
        }
    }

    void drain() {
        while (!finished.empty()) {
            Finished next = std::move(finished.front());
            finished.pop();
            if (next.callback) {
                loop.dispatch([&next]() { next.callback(std::move(next.response)); });
            }
        }
    }

    // curl: start, change or stop watching a socket
    static int socketFunction(CURL*, curl_socket_t fd, int what, void* userp, void*) {
        auto* impl = static_cast<Impl*>(userp);
        uv_loop_t* uvLoop = impl->loop.handle();
        if (!uvLoop) return -1;

        auto it = impl->watches.find(fd);
        if (what == CURL_POLL_REMOVE) {
            if (it != impl->watches.end()) {
                closePoll(it->second);
                impl->watches.erase(it);
            }
            return 0;
        }

        int events = 0;
        if (what & CURL_POLL_IN) events |= UV_READABLE;
        if (what & CURL_POLL_OUT) events |= UV_WRITABLE;

        SocketWatch* watch = nullptr;
        if (it != impl->watches.end()) {
            watch = it->second;
        } else {
            watch = new SocketWatch();
            watch->fd = fd;
            watch->owner = impl;
            watch->poll.data = watch;
            int rc = uv_poll_init_socket(uvLoop, &watch->poll, fd);
            if (rc != 0) {
                std::cerr << "[AsyncHttp] Cannot watch socket: " << uv_strerror(rc) << std::endl;
                delete watch;
                return -1;
            }
            impl->watches[fd] = watch;
        }

        uv_poll_start(&watch->poll, events, [](uv_poll_t* handle, int status, int ready) {
            auto* w = static_cast<SocketWatch*>(handle->data);
            int flags = 0;
            if (ready & UV_READABLE) flags |= CURL_CSELECT_IN;
            if (ready & UV_WRITABLE) flags |= CURL_CSELECT_OUT;
            if (status < 0) flags |= CURL_CSELECT_ERR;
            w->owner->socketAction(w->fd, flags);
        });
        return 0;
    }

    // curl: call back after timeoutMs (-1 cancels)
    static int timerFunction(CURLM*, long timeoutMs, void* userp) {
        auto* impl = static_cast<Impl*>(userp);
        if (!impl->timer) return 0;

        if (timeoutMs < 0) {
            uv_timer_stop(&impl->timer->timer);
            return 0;
        }
        uv_timer_start(&impl->timer->timer, [](uv_timer_t* handle) {
            auto* t = static_cast<CurlTimer*>(handle->data);
            if (t->owner && t->owner->multi) {
                t->owner->socketAction(CURL_SOCKET_TIMEOUT, 0);
            }
        }, static_cast<uint64_t>(timeoutMs), 0);
        return 0;
    }

    static size_t writeFunction(char* chunk, size_t size, size_t count, void* userp) {
        auto* download = static_cast<Download*>(userp);
        size_t bytes = size * count;
        std::vector<uint8_t>& body = download->response.data;
        if (body.size() + bytes > download->maxBytes) {
            download->tooLarge = true;
            return 0;  // aborts the transfer
        }
        body.insert(body.end(), chunk, chunk + bytes);
        return bytes;
    }
};

AsyncHttpClient::AsyncHttpClient(async::EventLoop& loop) : impl_(std::make_shared<Impl>(loop)) {
    impl_->self = impl_;
}

AsyncHttpClient::~AsyncHttpClient() {
    shutdown();
}

bool AsyncHttpClient::init() {
    if (impl_->multi) return true;

    uv_loop_t* uvLoop = impl_->loop.handle();
    if (!uvLoop) {
        std::cerr << "[AsyncHttp] Event loop not initialized" << std::endl;
        return false;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    impl_->multi = curl_multi_init();
    if (!impl_->multi) {
        std::cerr << "[AsyncHttp] curl_multi_init failed" << std::endl;
        curl_global_cleanup();
        return false;
    }

    impl_->timer = new CurlTimer();
    impl_->timer->owner = impl_.get();
    impl_->timer->timer.data = impl_->timer;
    uv_timer_init(uvLoop, &impl_->timer->timer);

    curl_multi_setopt(impl_->multi, CURLMOPT_SOCKETFUNCTION, &Impl::socketFunction);
    curl_multi_setopt(impl_->multi, CURLMOPT_SOCKETDATA, impl_.get());
    curl_multi_setopt(impl_->multi, CURLMOPT_TIMERFUNCTION, &Impl::timerFunction);
    curl_multi_setopt(impl_->multi, CURLMOPT_TIMERDATA, impl_.get());
    return true;
}

void AsyncHttpClient::shutdown() {
    if (!impl_->multi) return;

    for (auto& entry : impl_->downloads) {
        Download& download = *entry.second;
        curl_multi_remove_handle(impl_->multi, download.easy);
        curl_easy_cleanup(download.easy);
        impl_->finished.push({std::move(download.callback),
                              failure(download.response.url, "Download cancelled")});
    }
    impl_->downloads.clear();
    impl_->drain();

    // Handles are closed through the loop while it is alive, freed directly otherwise
    bool loopAlive = impl_->loop.handle() != nullptr;
    for (auto& entry : impl_->watches) {
        if (loopAlive) {
            closePoll(entry.second);
        } else {
            delete entry.second;
        }
    }
    impl_->watches.clear();

    CurlTimer* timer = impl_->timer;
    impl_->timer = nullptr;
    timer->owner = nullptr;
    if (loopAlive) {
        uv_timer_stop(&timer->timer);
        uv_close(reinterpret_cast<uv_handle_t*>(&timer->timer), [](uv_handle_t* handle) {
            delete static_cast<CurlTimer*>(handle->data);
        });
    } else {
        delete timer;
    }

    curl_multi_cleanup(impl_->multi);
    impl_->multi = nullptr;
    curl_global_cleanup();
}

void AsyncHttpClient::get(const std::string& url, AsyncHttpCallback callback, const HttpOptions& options) {
    if (!init()) {
        impl_->queueFailure(std::move(callback), failure(url, "HTTP client not available"));
        return;
    }

    CURL* easy = curl_easy_init();
    if (!easy) {
        impl_->queueFailure(std::move(callback), failure(url, "curl_easy_init failed"));
        return;
    }

    auto download = std::make_unique<Download>();
    download->easy = easy;
    download->callback = std::move(callback);
    download->response.url = url;
    download->maxBytes = options.maxBytes;

    curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &Impl::writeFunction);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, download.get());
    curl_easy_setopt(easy, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(easy, CURLOPT_TIMEOUT, options.timeout > 0 ? options.timeout : 30L);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, options.connectTimeout > 0 ? options.connectTimeout : 10L);
    curl_easy_setopt(easy, CURLOPT_SSL_VERIFYPEER, options.verifySSL ? 1L : 0L);
    curl_easy_setopt(easy, CURLOPT_SSL_VERIFYHOST, options.verifySSL ? 2L : 0L);
    curl_easy_setopt(easy, CURLOPT_USERAGENT, "Easel/" EASEL_VERSION);

    CURLMcode rc = curl_multi_add_handle(impl_->multi, easy);
    if (rc != CURLM_OK) {
        curl_easy_cleanup(easy);
        impl_->queueFailure(std::move(download->callback), failure(url, curl_multi_strerror(rc)));
        return;
    }
    impl_->downloads[easy] = std::move(download);

    // Kick the transfer; curl registers its sockets and timer from here
    impl_->socketAction(CURL_SOCKET_TIMEOUT, 0);
}

int AsyncHttpClient::activeDownloadCount() const {
    return static_cast<int>(impl_->downloads.size());
}

} // namespace http
} // namespace easel
