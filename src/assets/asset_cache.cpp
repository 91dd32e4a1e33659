#include "easel/assets/asset_cache.h"
#include <iostream>

namespace easel {
namespace assets {

AssetCache::AssetCache(Fetcher& fetcher, const RuntimeConfig& config)
    : fetcher_(fetcher), config_(config) {}

std::shared_ptr<ImageAsset> AssetCache::load(const std::string& url) {
    auto it = images_.find(url);
    if (it != images_.end() && it->second->state() != AssetState::Failed) {
        if (config_.debug) {
            std::cout << "[Assets] Cache hit: " << url << std::endl;
        }
        return it->second;
    }

    auto asset = std::make_shared<ImageAsset>(url);
    images_[url] = asset;

    std::weak_ptr<ImageAsset> weak = asset;
    bool debug = config_.debug;
    fetcher_.fetch(url, [weak, debug](std::vector<uint8_t> data, std::string error) {
        auto target = weak.lock();
        if (!target) {
            return;
        }
        if (!error.empty()) {
            target->failLoad(error);
            return;
        }
        if (target->completeLoad(data.data(), data.size()) && debug) {
            std::cout << "[Assets] Loaded " << target->url() << " (" << target->width()
                      << "x" << target->height() << ")" << std::endl;
        }
    });
    return asset;
}

} // namespace assets
} // namespace easel
