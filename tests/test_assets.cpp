#include <doctest/doctest.h>

#include "easel/assets/image_asset.h"

#include "stb_image_write.h"

#include <string>
#include <vector>

using easel::assets::AssetState;
using easel::assets::ImageAsset;

namespace {

std::vector<uint8_t> encodePng(int width, int height) {
    std::vector<uint8_t> pixels(static_cast<size_t>(width) * height * 4);
    for (size_t i = 0; i < pixels.size(); i += 4) {
        pixels[i] = 200;
        pixels[i + 1] = 40;
        pixels[i + 2] = 40;
        pixels[i + 3] = 255;
    }
    std::vector<uint8_t> png;
    stbi_write_png_to_func([](void* context, void* data, int size) {
        auto* out = static_cast<std::vector<uint8_t>*>(context);
        auto* bytes = static_cast<uint8_t*>(data);
        out->insert(out->end(), bytes, bytes + size);
    }, &png, width, height, 4, pixels.data(), width * 4);
    return png;
}

void loadInto(ImageAsset& asset, int width, int height) {
    std::vector<uint8_t> png = encodePng(width, height);
    REQUIRE(asset.completeLoad(png.data(), png.size()));
}

} // namespace

TEST_CASE("an asset reports no size until it is ready") {
    ImageAsset asset("ball.png");
    CHECK(asset.state() == AssetState::Loading);
    CHECK_FALSE(asset.isReady());
    CHECK(asset.width() == 0);
    CHECK(asset.height() == 0);
    CHECK(asset.prepareView({5, 5}, {10, 10}, {10, 10}, 0.0) == nullptr);
    CHECK(asset.cachedViewCount() == 0);
}

TEST_CASE("decoding moves the asset to ready") {
    ImageAsset asset("ball.png");
    loadInto(asset, 20, 10);

    CHECK(asset.state() == AssetState::Ready);
    CHECK(asset.width() == 20);
    CHECK(asset.height() == 10);
    CHECK(asset.errorMessage().empty());
    // The full-size view is prepared up front
    CHECK(asset.cachedViewCount() == 1);
}

TEST_CASE("the state changes exactly once") {
    SUBCASE("ready stays ready") {
        ImageAsset asset("ball.png");
        loadInto(asset, 4, 4);
        asset.failLoad("late error");
        CHECK(asset.state() == AssetState::Ready);

        std::vector<uint8_t> other = encodePng(8, 8);
        CHECK(asset.completeLoad(other.data(), other.size()));
        CHECK(asset.width() == 4);
    }
    SUBCASE("failed stays failed") {
        ImageAsset asset("ball.png");
        asset.failLoad("404");
        CHECK(asset.state() == AssetState::Failed);
        CHECK(asset.errorMessage() == "404");

        std::vector<uint8_t> png = encodePng(4, 4);
        CHECK_FALSE(asset.completeLoad(png.data(), png.size()));
        CHECK(asset.state() == AssetState::Failed);
    }
}

TEST_CASE("bad bytes fail the asset") {
    ImageAsset empty("empty.png");
    CHECK_FALSE(empty.completeLoad(nullptr, 0));
    CHECK(empty.state() == AssetState::Failed);

    const uint8_t garbage[] = {'n', 'o', 'p', 'e'};
    ImageAsset broken("broken.png");
    CHECK_FALSE(broken.completeLoad(garbage, sizeof(garbage)));
    CHECK(broken.state() == AssetState::Failed);
    CHECK_FALSE(broken.errorMessage().empty());
}

TEST_CASE("identical view requests share one prepared view") {
    ImageAsset asset("ball.png");
    loadInto(asset, 32, 32);

    auto first = asset.prepareView({16, 16}, {16, 16}, {48, 24}, 0.5);
    REQUIRE(first != nullptr);
    size_t count = asset.cachedViewCount();

    auto second = asset.prepareView({16, 16}, {16, 16}, {48, 24}, 0.5);
    CHECK(second == first);
    CHECK(asset.cachedViewCount() == count);

    auto rotated = asset.prepareView({16, 16}, {16, 16}, {48, 24}, 0.6);
    REQUIRE(rotated != nullptr);
    CHECK(rotated != first);
    CHECK(asset.cachedViewCount() == count + 1);
}

TEST_CASE("views are scaled then rotated") {
    ImageAsset asset("ball.png");
    loadInto(asset, 32, 32);

    auto scaled = asset.prepareView({16, 16}, {32, 32}, {64, 16}, 0.0);
    REQUIRE(scaled != nullptr);
    CHECK(scaled->width == 64);
    CHECK(scaled->height == 16);

    // A quarter turn swaps the bounding box
    auto turned = asset.prepareView({16, 16}, {32, 32}, {64, 16}, 1.5707963267948966);
    REQUIRE(turned != nullptr);
    CHECK(turned->width >= 16);
    CHECK(turned->width <= 17);
    CHECK(turned->height >= 64);
    CHECK(turned->height <= 65);
}

TEST_CASE("a region outside the image yields nothing and is not cached") {
    ImageAsset asset("ball.png");
    loadInto(asset, 16, 16);
    size_t count = asset.cachedViewCount();

    CHECK(asset.prepareView({0, 0}, {16, 16}, {16, 16}, 0.0) == nullptr);
    CHECK(asset.prepareView({8, 8}, {18, 16}, {16, 16}, 0.0) == nullptr);
    CHECK(asset.prepareView({8, 8}, {0, 16}, {16, 16}, 0.0) == nullptr);
    CHECK(asset.prepareView({8, 8}, {16, 16}, {16, -1}, 0.0) == nullptr);
    CHECK(asset.cachedViewCount() == count);
}
