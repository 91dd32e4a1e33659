#include "easel/assets/image_asset.h"
#include <algorithm>
#include <cmath>
#include <iostream>

#include "include/core/SkCanvas.h"
#include "include/core/SkData.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkRect.h"
#include "include/core/SkSamplingOptions.h"
#include "include/core/SkSurface.h"

#include "stb_image.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace easel {
namespace assets {

ImageAsset::ImageAsset(std::string url) : url_(std::move(url)) {}

bool ImageAsset::completeLoad(const uint8_t* data, size_t size) {
    if (state_ != AssetState::Loading) {
        return isReady();
    }
    if (!data || size == 0) {
        failLoad("Empty image data");
        return false;
    }

    int w = 0, h = 0, channels = 0;
    stbi_uc* pixels = stbi_load_from_memory(data, static_cast<int>(size), &w, &h, &channels, 4);
    if (!pixels) {
        failLoad(std::string("Failed to decode image: ") + stbi_failure_reason());
        return false;
    }

    SkImageInfo info = SkImageInfo::Make(w, h, kRGBA_8888_SkColorType, kUnpremul_SkAlphaType);
    sk_sp<SkData> bytes = SkData::MakeWithCopy(pixels, static_cast<size_t>(w) * h * 4);
    stbi_image_free(pixels);

    image_ = SkImages::RasterFromData(info, std::move(bytes), static_cast<size_t>(w) * 4);
    if (!image_) {
        failLoad("Failed to create image from decoded pixels");
        return false;
    }

    width_ = w;
    height_ = h;
    state_ = AssetState::Ready;

    // The unscaled, unrotated view is the common case
    prepareView({w / 2, h / 2}, {w, h}, {w, h}, 0.0);
    return true;
}

void ImageAsset::failLoad(const std::string& error) {
    if (state_ != AssetState::Loading) {
        return;
    }
    state_ = AssetState::Failed;
    error_ = error;
    std::cerr << "[Assets] " << url_ << ": " << error << std::endl;
}

std::shared_ptr<const PreparedView> ImageAsset::prepareView(canvas::Point sourceCenter,
                                                            canvas::Size sourceSize,
                                                            canvas::Size targetSize,
                                                            double rotation) const {
    if (!isReady()) {
        return nullptr;
    }
    if (sourceSize.width <= 0 || sourceSize.height <= 0 ||
        targetSize.width <= 0 || targetSize.height <= 0) {
        return nullptr;
    }

    ViewKey key{sourceCenter, sourceSize, targetSize, rotation};
    auto it = views_.find(key);
    if (it != views_.end()) {
        return it->second;
    }

    auto view = buildView(key);
    if (view) {
        views_.emplace(key, view);
    }
    return view;
}

std::shared_ptr<const PreparedView> ImageAsset::buildView(const ViewKey& key) const {
    int left = key.sourceCenter.x - key.sourceSize.width / 2;
    int top = key.sourceCenter.y - key.sourceSize.height / 2;
    if (left < 0 || top < 0 ||
        left + key.sourceSize.width > width_ || top + key.sourceSize.height > height_) {
        return nullptr;
    }

    SkSamplingOptions sampling(SkFilterMode::kLinear);
    int tw = key.targetSize.width;
    int th = key.targetSize.height;

    sk_sp<SkImage> result;
    bool fullImage = left == 0 && top == 0 && key.sourceSize.width == width_ && key.sourceSize.height == height_;
    if (fullImage && tw == width_ && th == height_) {
        result = image_;
    } else {
        sk_sp<SkSurface> surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(tw, th));
        if (!surface) {
            std::cerr << "[Assets] Failed to allocate " << tw << "x" << th << " view" << std::endl;
            return nullptr;
        }
        SkRect src = SkRect::MakeXYWH(left, top, key.sourceSize.width, key.sourceSize.height);
        SkRect dst = SkRect::MakeWH(tw, th);
        surface->getCanvas()->clear(SK_ColorTRANSPARENT);
        surface->getCanvas()->drawImageRect(image_.get(), src, dst, sampling, nullptr,
                                            SkCanvas::kStrict_SrcRectConstraint);
        result = surface->makeImageSnapshot();
    }

    if (key.rotation != 0.0) {
        double c = std::fabs(std::cos(key.rotation));
        double s = std::fabs(std::sin(key.rotation));
        int rw = static_cast<int>(std::ceil(tw * c + th * s));
        int rh = static_cast<int>(std::ceil(tw * s + th * c));
        rw = std::max(rw, 1);
        rh = std::max(rh, 1);

        sk_sp<SkSurface> surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(rw, rh));
        if (!surface) {
            std::cerr << "[Assets] Failed to allocate rotated view" << std::endl;
            return nullptr;
        }
        SkCanvas* canvas = surface->getCanvas();
        canvas->clear(SK_ColorTRANSPARENT);
        canvas->translate(rw / 2.0f, rh / 2.0f);
        canvas->rotate(static_cast<SkScalar>(key.rotation * 180.0 / M_PI));
        canvas->drawImage(result.get(), -tw / 2.0f, -th / 2.0f, sampling, nullptr);
        result = surface->makeImageSnapshot();
    }

    if (!result) {
        return nullptr;
    }

    auto view = std::make_shared<PreparedView>();
    view->image = result;
    view->width = result->width();
    view->height = result->height();
    return view;
}

} // namespace assets
} // namespace easel
