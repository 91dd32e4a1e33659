#pragma once

/**
 * AsyncHttpClient - downloads for network asset URLs
 *
 * Runs GET transfers on a curl multi handle driven by the event loop: curl's
 * sockets are watched with uv_poll_t and its timeouts with one uv_timer_t.
 * Completed downloads are queued and their callbacks run from a deferred
 * loop task, never from inside a curl callback.
 *
 *   context.http().get("https://example.com/ball.png", [](HttpResponse response) {
 *       if (response.ok) {
 *           // response.data holds the body
 *       }
 *   });
 */

#include "easel/async/event_loop.h"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace easel {
namespace http {

struct HttpOptions {
    long timeout = 30;         // seconds, whole transfer
    long connectTimeout = 10;  // seconds
    bool verifySSL = true;
    size_t maxBytes = 64 * 1024 * 1024;  // larger bodies fail the download
};

struct HttpResponse {
    bool ok = false;           // 2xx and the whole body received
    int status = 0;
    std::string url;           // after redirects
    std::string contentType;
    std::string error;
    std::vector<uint8_t> data;
};

using AsyncHttpCallback = std::function<void(HttpResponse)>;

class AsyncHttpClient {
public:
    explicit AsyncHttpClient(async::EventLoop& loop);
    ~AsyncHttpClient();

    /**
     * Create the multi handle and its timer. The first get() calls this.
     */
    bool init();

    /**
     * Fail the downloads still in flight ("Download cancelled") and release
     * the libuv handles. Safe to call more than once.
     */
    void shutdown();

    /**
     * Start a download. The callback runs from a later loop iteration, also
     * when the transfer cannot be started (inline only if the loop was never
     * initialized).
     */
    void get(const std::string& url, AsyncHttpCallback callback, const HttpOptions& options = {});

    int activeDownloadCount() const;

    AsyncHttpClient(const AsyncHttpClient&) = delete;
    AsyncHttpClient& operator=(const AsyncHttpClient&) = delete;

    struct Impl;

private:
    // Shared so a deferred drain can tell the client is gone
    std::shared_ptr<Impl> impl_;
};

} // namespace http
} // namespace easel
