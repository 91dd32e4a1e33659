#include "easel/assets/fetcher.h"
#include <algorithm>
#include <cctype>

namespace easel {
namespace assets {

namespace {

bool hasSchemePrefix(const std::string& url, const std::string& prefix) {
    if (url.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), url.begin(), [](char a, char b) {
        return a == std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace

Fetcher::Fetcher(http::AsyncHttpClient& http, fs::AsyncFileReader& files, http::HttpOptions options)
    : http_(http), files_(files), options_(std::move(options)) {}

bool Fetcher::isNetworkUrl(const std::string& url) {
    return hasSchemePrefix(url, "http://") || hasSchemePrefix(url, "https://");
}

std::string Fetcher::localPath(const std::string& url) {
    if (hasSchemePrefix(url, "file://")) {
        return url.substr(7);
    }
    return url;
}

void Fetcher::fetch(const std::string& url, FetchCallback callback) {
    if (isNetworkUrl(url)) {
        http_.get(url, [callback = std::move(callback)](http::HttpResponse response) {
            if (!response.ok) {
                std::string error = response.error.empty()
                    ? "HTTP " + std::to_string(response.status)
                    : response.error;
                callback({}, error);
                return;
            }
            callback(std::move(response.data), "");
        }, options_);
        return;
    }

    files_.readFile(localPath(url), std::move(callback));
}

} // namespace assets
} // namespace easel
