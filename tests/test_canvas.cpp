#include <doctest/doctest.h>

#include "easel/assets/image_asset.h"
#include "easel/canvas/canvas.h"
#include "easel/canvas/colour.h"
#include "easel/errors.h"

#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace easel::canvas;

TEST_CASE("coordinates are truncated to integers when recorded") {
    FrameBuffer buffer;
    Canvas canvas(buffer);

    canvas.drawPoint({10.7, 4.2}, "Red");
    canvas.drawPolyline({{1.9, 2.9}, {-0.5, 3.99}}, 2.8, "Blue");

    REQUIRE(buffer.size() == 2);
    const auto& point = std::get<PointPrimitive>(buffer[0]);
    CHECK(point.point == Point{10, 4});

    const auto& polyline = std::get<PolylinePrimitive>(buffer[1]);
    REQUIRE(polyline.points.size() == 2);
    CHECK(polyline.points[0] == Point{1, 2});
    CHECK(polyline.points[1] == Point{0, 3});
    CHECK(polyline.lineWidth == 2);
}

TEST_CASE("each draw call appends one primitive in call order") {
    FrameBuffer buffer;
    Canvas canvas(buffer);

    canvas.drawLine({0, 0}, {10, 10}, 1, "White");
    canvas.drawCircle({50, 50}, 20, 2, "Green", std::string("Purple"));
    canvas.drawText("Hi", {5, 20}, 12, "Red");
    canvas.drawPolygon({{0, 0}, {5, 0}, {5, 5}}, 1, "Blue");
    canvas.drawArc({30, 30}, 10, 0, 3.14159265358979323846 / 2, 1, "Orange");

    REQUIRE(canvas.size() == 5);
    CHECK(std::holds_alternative<LinePrimitive>(buffer[0]));
    CHECK(std::holds_alternative<CirclePrimitive>(buffer[1]));
    CHECK(std::holds_alternative<TextPrimitive>(buffer[2]));
    CHECK(std::holds_alternative<PolygonPrimitive>(buffer[3]));
    CHECK(std::holds_alternative<ArcPrimitive>(buffer[4]));

    const auto& circle = std::get<CirclePrimitive>(buffer[1]);
    REQUIRE(circle.fillColour.has_value());
    CHECK(*circle.fillColour == "Purple");

    const auto& arc = std::get<ArcPrimitive>(buffer[4]);
    CHECK(arc.startAngle == 0);
    CHECK(arc.sweepAngle == -1440);
}

TEST_CASE("line widths below one pixel are stored as a hairline") {
    FrameBuffer buffer;
    Canvas canvas(buffer);

    canvas.drawLine({0, 0}, {1, 1}, 0.4, "White");
    CHECK(std::get<LinePrimitive>(buffer[0]).lineWidth == 1);
}

TEST_CASE("text defaults to the serif face and stores an integer size") {
    FrameBuffer buffer;
    Canvas canvas(buffer);

    canvas.drawText("Score: 10", {0, 199}, 48.9, "Red");
    canvas.drawText("tiny", {0, 0}, 0.5, "Red", "monospace");

    const auto& text = std::get<TextPrimitive>(buffer[0]);
    CHECK(text.face == FontFace::Serif);
    CHECK(text.fontSize == 48);
    CHECK(text.point == Point{0, 199});

    const auto& tiny = std::get<TextPrimitive>(buffer[1]);
    CHECK(tiny.face == FontFace::Monospace);
    CHECK(tiny.fontSize == 1);
}

TEST_CASE("malformed arguments are rejected at record time") {
    FrameBuffer buffer;
    Canvas canvas(buffer);

    CHECK_THROWS_AS(canvas.drawPolyline({}, 1, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawPolygon({}, 1, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawLine({0, 0}, {1, 1}, 0, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawLine({0, 0}, {1, 1}, -2, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawCircle({0, 0}, -1, 1, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawPoint({0, 0}, "not-a-colour"), ColourParseError);
    CHECK_THROWS_AS(canvas.drawCircle({0, 0}, 5, 1, "Red", std::string("#12")), ColourParseError);
    CHECK_THROWS_AS(canvas.drawText("x", {0, 0}, 12, "Red", "cursive"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawText("x", {0, 0}, 0, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawText("two\nlines", {0, 0}, 12, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawImage(nullptr, {0, 0}, {1, 1}, {0, 0}, {1, 1}), easel::ArgumentError);

    // Nothing was recorded by the failed calls
    CHECK(buffer.empty());
}

TEST_CASE("coordinates that are not finite or overflow int are rejected") {
    FrameBuffer buffer;
    Canvas canvas(buffer);
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    CHECK_THROWS_AS(canvas.drawPoint({1e20, 0}, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawLine({0, 0}, {inf, 1}, 1, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawPolyline({{0, 0}, {nan, 1}}, 1, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawPolygon({{0, -inf}, {1, 1}}, 1, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawCircle({0, 0}, 1e20, 1, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawCircle({0, 0}, inf, 1, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawCircle({0, 0}, 5, inf, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawCircle({0, 0}, 5, nan, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawText("x", {0, 0}, inf, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawText("x", {nan, 0}, 12, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawArc({0, 0}, 5, 0, nan, 1, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawArc({0, 0}, 5, inf, 1, 1, "Red"), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawArc({0, 0}, 5, 0, 1e20, 1, "Red"), easel::ArgumentError);

    auto image = std::make_shared<easel::assets::ImageAsset>("missing.png");
    CHECK_THROWS_AS(canvas.drawImage(image, {0, 0}, {1, 1}, {0, 0}, {1e20, 1}), easel::ArgumentError);
    CHECK_THROWS_AS(canvas.drawImage(image, {0, 0}, {1, 1}, {0, 0}, {1, 1}, nan), easel::ArgumentError);

    CHECK(buffer.empty());

    // The largest values that still truncate into int are kept
    canvas.drawPoint({2147483647.5, -2147483648.5}, "Red");
    REQUIRE(buffer.size() == 1);
    CHECK(std::get<PointPrimitive>(buffer[0]).point ==
          Point{std::numeric_limits<int>::max(), std::numeric_limits<int>::min()});
}

TEST_CASE("a colour string is checked again after it failed once") {
    FrameBuffer buffer;
    Canvas canvas(buffer);

    CHECK_THROWS_AS(canvas.drawPoint({0, 0}, "not-a-colour"), ColourParseError);
    CHECK_THROWS_AS(canvas.drawPoint({0, 0}, "not-a-colour"), ColourParseError);
    canvas.drawPoint({0, 0}, "Teal");
    canvas.drawPoint({1, 1}, "Teal");
    CHECK(buffer.size() == 2);
}

TEST_CASE("an image that is still loading records nothing") {
    FrameBuffer buffer;
    Canvas canvas(buffer);

    auto image = std::make_shared<easel::assets::ImageAsset>("missing.png");
    canvas.drawImage(image, {5, 5}, {10, 10}, {50, 50}, {10, 10});
    CHECK(buffer.empty());

    image->failLoad("not found");
    canvas.drawImage(image, {5, 5}, {10, 10}, {50, 50}, {10, 10});
    CHECK(buffer.empty());
}

TEST_CASE("primitive equality is structural") {
    FrameBuffer a;
    FrameBuffer b;
    Canvas ca(a);
    Canvas cb(b);

    ca.drawPolygon({{0, 0}, {10, 0}, {10, 10}}, 2, "Green", std::string("Blue"));
    cb.drawPolygon({{0.2, 0.9}, {10.5, 0}, {10, 10.1}}, 2.5, "Green", std::string("Blue"));
    CHECK(a == b);

    b.clear();
    cb.drawPolygon({{0, 0}, {10, 0}, {10, 11}}, 2, "Green", std::string("Blue"));
    CHECK_FALSE(a == b);

    b.clear();
    cb.drawPolygon({{0, 0}, {10, 0}, {10, 10}}, 2, "Green");
    CHECK_FALSE(a == b);

    // Same geometry, different kind
    DrawPrimitive line = LinePrimitive{{0, 0}, {1, 1}, 1, "Red"};
    DrawPrimitive polyline = PolylinePrimitive{{{0, 0}, {1, 1}}, 1, "Red"};
    CHECK_FALSE(line == polyline);
}
