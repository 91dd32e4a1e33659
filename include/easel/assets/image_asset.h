#pragma once

/**
 * ImageAsset - one image load request and its decoded pixels
 *
 * Starts in Loading, moves exactly once to Ready or Failed. Width and height
 * read 0 until Ready. Prepared views (crop, scale, rotate) are cached per
 * asset, keyed by the full view description; an identical request returns the
 * same PreparedView object.
 */

#include "easel/canvas/geometry.h"
#include "include/core/SkImage.h"
#include "include/core/SkRefCnt.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace easel {
namespace assets {

enum class AssetState { Loading, Ready, Failed };

/**
 * A render-ready image: the requested region, scaled and rotated.
 */
struct PreparedView {
    sk_sp<SkImage> image;
    int width = 0;
    int height = 0;
};

struct ViewKey {
    canvas::Point sourceCenter;
    canvas::Size sourceSize;
    canvas::Size targetSize;
    double rotation = 0.0;

    bool operator==(const ViewKey& o) const {
        return sourceCenter == o.sourceCenter && sourceSize == o.sourceSize &&
               targetSize == o.targetSize && rotation == o.rotation;
    }
};

struct ViewKeyHash {
    size_t operator()(const ViewKey& key) const {
        size_t h = std::hash<int>()(key.sourceCenter.x);
        auto mix = [&h](size_t v) { h ^= v + 0x9e3779b9 + (h << 6) + (h >> 2); };
        mix(std::hash<int>()(key.sourceCenter.y));
        mix(std::hash<int>()(key.sourceSize.width));
        mix(std::hash<int>()(key.sourceSize.height));
        mix(std::hash<int>()(key.targetSize.width));
        mix(std::hash<int>()(key.targetSize.height));
        // -0.0 == 0.0, so both must hash alike
        mix(std::hash<double>()(key.rotation == 0.0 ? 0.0 : key.rotation));
        return h;
    }
};

class ImageAsset {
public:
    explicit ImageAsset(std::string url);

    const std::string& url() const { return url_; }
    AssetState state() const { return state_; }
    bool isReady() const { return state_ == AssetState::Ready; }
    int width() const { return isReady() ? width_ : 0; }
    int height() const { return isReady() ? height_ : 0; }
    const std::string& errorMessage() const { return error_; }

    /**
     * Decode fetched bytes. Loading -> Ready on success, Failed otherwise.
     * Ignored unless the asset is still Loading.
     * @return true if the asset is now Ready
     */
    bool completeLoad(const uint8_t* data, size_t size);

    /**
     * Loading -> Failed. Ignored unless the asset is still Loading.
     */
    void failLoad(const std::string& error);

    /**
     * The region of sourceSize centred on sourceCenter, scaled to targetSize
     * and rotated clockwise by rotation radians about its centre.
     * Returns nullptr while not Ready, for non-positive sizes, and when the
     * region reaches outside the image (in which case nothing is drawn).
     */
    std::shared_ptr<const PreparedView> prepareView(canvas::Point sourceCenter, canvas::Size sourceSize,
                                                    canvas::Size targetSize, double rotation) const;

    size_t cachedViewCount() const { return views_.size(); }

    sk_sp<SkImage> image() const { return image_; }

    ImageAsset(const ImageAsset&) = delete;
    ImageAsset& operator=(const ImageAsset&) = delete;

private:
    std::shared_ptr<const PreparedView> buildView(const ViewKey& key) const;

    std::string url_;
    AssetState state_ = AssetState::Loading;
    int width_ = 0;
    int height_ = 0;
    std::string error_;
    sk_sp<SkImage> image_;

    mutable std::unordered_map<ViewKey, std::shared_ptr<const PreparedView>, ViewKeyHash> views_;
};

} // namespace assets
} // namespace easel
