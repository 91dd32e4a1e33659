#pragma once

/**
 * AssetCache - image load requests keyed by URL
 *
 * load() hands back a Loading asset at once and fetches in the background.
 * Asking for the same URL again returns the same asset unless the earlier
 * attempt failed, in which case a fresh request is made.
 */

#include "easel/assets/fetcher.h"
#include "easel/assets/image_asset.h"
#include "easel/runtime/config.h"
#include <memory>
#include <string>
#include <unordered_map>

namespace easel {
namespace assets {

class AssetCache {
public:
    AssetCache(Fetcher& fetcher, const RuntimeConfig& config);

    /**
     * Never throws for a bad URL; failures show up as AssetState::Failed.
     */
    std::shared_ptr<ImageAsset> load(const std::string& url);

    size_t size() const { return images_.size(); }

private:
    Fetcher& fetcher_;
    const RuntimeConfig& config_;
    std::unordered_map<std::string, std::shared_ptr<ImageAsset>> images_;
};

} // namespace assets
} // namespace easel
