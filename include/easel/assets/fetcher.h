#pragma once

/**
 * Fetcher - bytes for a URL
 *
 * http:// and https:// go to the async HTTP client; file:// URLs and plain
 * paths go to the thread-pool file reader. Either way the callback runs
 * later on the loop thread.
 */

#include "easel/fs/async_file.h"
#include "easel/http/async_http_client.h"
#include <functional>
#include <string>
#include <vector>

namespace easel {
namespace assets {

using FetchCallback = std::function<void(std::vector<uint8_t> data, std::string error)>;

class Fetcher {
public:
    Fetcher(http::AsyncHttpClient& http, fs::AsyncFileReader& files, http::HttpOptions options = {});

    void fetch(const std::string& url, FetchCallback callback);

    static bool isNetworkUrl(const std::string& url);

    /**
     * Strips a file:// prefix; other strings are returned unchanged.
     */
    static std::string localPath(const std::string& url);

private:
    http::AsyncHttpClient& http_;
    fs::AsyncFileReader& files_;
    http::HttpOptions options_;
};

} // namespace assets
} // namespace easel
