#include "easel/runtime/frame.h"
#include "easel/canvas/colour.h"
#include "easel/canvas/font.h"
#include "easel/errors.h"
#include "easel/runtime/runtime_context.h"
#include <algorithm>
#include <iostream>

namespace easel {

Frame::Frame(RuntimeContext& context, std::string title, int canvasWidth, int canvasHeight, int controlWidth)
    : context_(context)
    , title_(std::move(title))
    , canvasWidth_(canvasWidth)
    , canvasHeight_(canvasHeight)
    , controlWidth_(controlWidth)
    , window_(context.video(), *this)
    , surface_(context.loop(), *this, context.config().drawIntervalMs)
    , panel_(controlWidth, canvasHeight, [this](const std::string& text) { return panelTextWidth(text); })
{
    if (canvasWidth <= 0 || canvasHeight <= 0) {
        throw ArgumentError("Canvas size must be positive, got " + std::to_string(canvasWidth) + "x" +
                            std::to_string(canvasHeight));
    }
    if (controlWidth < 0) {
        throw ArgumentError("Control width must not be negative, got " + std::to_string(controlWidth));
    }

    // The panel is the secondary handler of every connection
    setKeydownHandler({});
    setKeyupHandler({});
    setMouseclickHandler({});
    setMousedragHandler({});

    panel_.setChangeHandler([this]() {
        if (!window_.isOpen()) return;
        paintPanel();
        window_.present();
    });
    panel_.setFocusHandler([this](bool focused) { window_.setTextInput(focused); });
}

Frame::~Frame() {
    close();
}

bool Frame::open() {
    if (window_.isOpen()) return true;

    int width = controlWidth_ + canvasWidth_ + 3 * kFrameMargin;
    int height = canvasHeight_ + 2 * kFrameMargin;
    if (!window_.create(title_, width, height)) {
        std::cerr << "[Window] Frame '" << title_ << "' has no window" << std::endl;
        return false;
    }

    window_.setChromeColour(255, 255, 255);
    if (controlWidth_ > 0) {
        panelLayer_ = window_.addLayer(kFrameMargin, kFrameMargin, controlWidth_, canvasHeight_);
    }
    canvasLayer_ = window_.addLayer(2 * kFrameMargin + controlWidth_, kFrameMargin, canvasWidth_, canvasHeight_);

    counted_ = true;
    context_.lifecycle().windowOpened(this);

    paintPanel();
    paintCanvas();
    window_.present();
    return true;
}

void Frame::close() {
    surface_.close();
    window_.destroy();
    if (counted_) {
        counted_ = false;
        context_.lifecycle().windowClosed(this);
    }
}

void Frame::setDrawHandler(canvas::DrawHandler handler) {
    surface_.setDrawHandler(std::move(handler));
}

void Frame::setKeydownHandler(input::KeyHandler handler) {
    router_.setKeydownHandler(std::move(handler), [this](int key) { panel_.onKeydown(key); });
}

void Frame::setKeyupHandler(input::KeyHandler handler) {
    router_.setKeyupHandler(std::move(handler), [this](int key) { panel_.onKeyup(key); });
}

void Frame::setMouseclickHandler(input::MouseHandler handler) {
    router_.setMouseclickHandler(std::move(handler), [this](canvas::Point p) { panel_.onMouseclick(p); });
}

void Frame::setMousedragHandler(input::MouseHandler handler) {
    router_.setMousedragHandler(std::move(handler), [this](canvas::Point p) { panel_.onMousedrag(p); });
}

Control Frame::addLabel(const std::string& text, std::optional<int> width) {
    return panel_.addLabel(text, width);
}

Control Frame::addButton(const std::string& text, ButtonHandler handler, std::optional<int> width) {
    return panel_.addButton(text, std::move(handler), width);
}

Control Frame::addInput(const std::string& text, InputHandler handler, int width) {
    return panel_.addInput(text, std::move(handler), width);
}

void Frame::setCanvasBackground(const std::string& colour) {
    surface_.setBackground(colour);
}

void Frame::start() {
    surface_.start();
    router_.start();
}

int Frame::getCanvasTextwidth(const std::string& text, double size, const std::string& face) {
    canvas::validateText(text);
    canvas::validateFontSize(size);
    canvas::FontFace parsed = canvas::parseFontFace(face);
    float pixels = static_cast<float>(std::max(1, static_cast<int>(size)));
    return context_.fonts().textWidth(text, pixels, parsed);
}

int Frame::panelTextWidth(const std::string& text) {
    return context_.fonts().textWidth(text, static_cast<float>(kControlFontSize), canvas::FontFace::SansSerif);
}

// ============================================================================
// Painting
// ============================================================================

void Frame::requestRepaint() {
    if (!window_.isOpen()) return;
    paintCanvas();
    window_.present();
}

void Frame::paintCanvas() {
    if (canvasLayer_ < 0) return;
    if (!canvasPainter_) {
        canvasPainter_ = std::make_unique<canvas::Painter>(canvasWidth_, canvasHeight_, context_.fonts());
    }
    canvasPainter_->paint(surface_.frameBuffer(), surface_.background());
    window_.updateLayer(canvasLayer_, canvasPainter_->pixels(), canvasPainter_->rowBytes());
}

void Frame::paintPanel() {
    if (panelLayer_ < 0) return;
    if (!panelPainter_) {
        panelPainter_ = std::make_unique<canvas::Painter>(controlWidth_, canvasHeight_, context_.fonts());
    }
    panelPainter_->paint(panel_.render(), "White");
    window_.updateLayer(panelLayer_, panelPainter_->pixels(), panelPainter_->rowBytes());
}

// ============================================================================
// Input
// ============================================================================

bool Frame::onCanvas(int x, int y) const {
    int left = 2 * kFrameMargin + controlWidth_;
    return x >= left && x < left + canvasWidth_ && y >= kFrameMargin && y < kFrameMargin + canvasHeight_;
}

canvas::Point Frame::toCanvas(int x, int y) const {
    int cx = std::clamp(x - (2 * kFrameMargin + controlWidth_), 0, canvasWidth_ - 1);
    int cy = std::clamp(y - kFrameMargin, 0, canvasHeight_ - 1);
    return {cx, cy};
}

void Frame::onKeyDown(int keyCode) {
    if (panel_.keyDown(keyCode)) return;
    router_.keyDown(keyCode);
}

void Frame::onKeyUp(int keyCode) {
    if (panel_.keyUp(keyCode)) return;
    router_.keyUp(keyCode);
}

void Frame::onTextInput(const std::string& text) {
    panel_.textInput(text);
}

void Frame::onMouseDown(int x, int y) {
    pressedOnCanvas_ = onCanvas(x, y);
    panel_.mouseDown({x - kFrameMargin, y - kFrameMargin});
}

void Frame::onMouseUp(int x, int y) {
    panel_.mouseUp({x - kFrameMargin, y - kFrameMargin});
    if (!pressedOnCanvas_) return;
    pressedOnCanvas_ = false;
    router_.mouseClick(toCanvas(x, y));
}

void Frame::onMouseMove(int x, int y, bool buttonHeld) {
    if (buttonHeld && pressedOnCanvas_) {
        router_.mouseDrag(toCanvas(x, y));
    }
}

void Frame::onCloseRequested() {
    if (context_.config().debug) {
        std::cout << "[Window] Close requested for '" << title_ << "'" << std::endl;
    }
    close();
}

void Frame::onExposed() {
    window_.present();
}

} // namespace easel
