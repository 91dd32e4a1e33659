#include "easel/runtime/control_panel.h"
#include "easel/canvas/canvas.h"
#include "easel/canvas/font.h"
#include "easel/errors.h"
#include "easel/input/keys.h"
#include <algorithm>

namespace easel {

namespace {

// Rough advance of the 12px sans-serif face, used when no font is at hand
constexpr int kEstimatedCharWidth = 7;

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

void checkedWidth(std::optional<int> width) {
    if (width && *width <= 0) {
        throw ArgumentError("Control width must be positive, got " + std::to_string(*width));
    }
}

canvas::Vec2 at(int x, int y) {
    return {static_cast<double>(x), static_cast<double>(y)};
}

std::vector<canvas::Vec2> box(int left, int top, int width, int height) {
    int right = left + std::max(1, width) - 1;
    int bottom = top + height - 1;
    return {at(left, top), at(right, top), at(right, bottom), at(left, bottom)};
}

} // namespace

// ============================================================================
// Control
// ============================================================================

std::string Control::getText() const {
    return panel_->item(index_).text;
}

void Control::setText(const std::string& text) {
    canvas::validateText(text);
    auto& item = panel_->item(index_);
    if (item.text == text) return;
    item.text = text;
    panel_->notify();
}

ControlKind Control::kind() const {
    return panel_->item(index_).kind;
}

// ============================================================================
// ControlPanel
// ============================================================================

ControlPanel::ControlPanel(int width, int height, TextMeasure measure)
    : width_(width), height_(height), measure_(std::move(measure)) {}

Control ControlPanel::addLabel(const std::string& text, std::optional<int> width) {
    canvas::validateText(text);
    checkedWidth(width);
    return add({ControlKind::Label, text, {}, width, {}, {}});
}

Control ControlPanel::addButton(const std::string& text, ButtonHandler handler, std::optional<int> width) {
    canvas::validateText(text);
    checkedWidth(width);
    return add({ControlKind::Button, text, {}, width, std::move(handler), {}});
}

Control ControlPanel::addInput(const std::string& text, InputHandler handler, int width) {
    canvas::validateText(text);
    checkedWidth(width);
    return add({ControlKind::Input, "", text, width, {}, std::move(handler)});
}

Control ControlPanel::add(Item item) {
    controls_.push_back(std::move(item));
    notify();
    return Control(*this, controls_.size() - 1);
}

ControlPanel::Item& ControlPanel::item(size_t index) {
    if (index >= controls_.size()) {
        throw ArgumentError("No control at index " + std::to_string(index));
    }
    return controls_[index];
}

const ControlPanel::Item& ControlPanel::item(size_t index) const {
    return const_cast<ControlPanel*>(this)->item(index);
}

int ControlPanel::measure(const std::string& text) const {
    if (measure_) return measure_(text);
    auto chars = std::count_if(text.begin(), text.end(), [](char c) { return !isContinuationByte(c); });
    return static_cast<int>(chars) * kEstimatedCharWidth;
}

int ControlPanel::itemWidth(const Item& item) const {
    if (item.width) return *item.width;
    if (item.kind == ControlKind::Button) {
        return measure(item.text) + 2 * kControlPadding;
    }
    return std::max(1, measure(item.text));
}

int ControlPanel::itemHeight(const Item& item) const {
    switch (item.kind) {
        case ControlKind::Label: return kLabelHeight;
        case ControlKind::Button: return kButtonHeight;
        case ControlKind::Input: return kLabelHeight + 1 + kInputFieldHeight;
    }
    return kLabelHeight;
}

std::optional<size_t> ControlPanel::hitTest(canvas::Point position) const {
    if (position.x < 0 || position.y < 0 || position.x >= width_ || position.y >= height_) {
        return std::nullopt;
    }
    int top = 0;
    for (size_t i = 0; i < controls_.size(); i++) {
        const Item& c = controls_[i];
        int height = itemHeight(c);
        // Only the field of an input takes clicks, not its caption
        int hitTop = c.kind == ControlKind::Input ? top + kLabelHeight + 1 : top;
        if (position.y >= hitTop && position.y < top + height && position.x < itemWidth(c)) {
            return i;
        }
        top += height + kControlSpacing;
    }
    return std::nullopt;
}

// ============================================================================
// Status lines
// ============================================================================

void ControlPanel::onKeydown(int keyCode) {
    setKeyStatus("Key: Down " + input::keyName(keyCode));
}

void ControlPanel::onKeyup(int keyCode) {
    setKeyStatus("Key: Up " + input::keyName(keyCode));
}

void ControlPanel::onMouseclick(canvas::Point position) {
    setMouseStatus("Mouse: Click " + std::to_string(position.x) + ", " + std::to_string(position.y));
}

void ControlPanel::onMousedrag(canvas::Point position) {
    setMouseStatus("Mouse: Move - " + std::to_string(position.x) + ", " + std::to_string(position.y));
}

void ControlPanel::setKeyStatus(std::string text) {
    if (text == keyStatus_) return;
    keyStatus_ = std::move(text);
    notify();
}

void ControlPanel::setMouseStatus(std::string text) {
    if (text == mouseStatus_) return;
    mouseStatus_ = std::move(text);
    notify();
}

void ControlPanel::notify() {
    if (changed_) changed_();
}

// ============================================================================
// Pointer and keyboard
// ============================================================================

void ControlPanel::mouseDown(canvas::Point position) {
    auto hit = hitTest(position);
    bool onInput = hit && controls_[*hit].kind == ControlKind::Input;
    setFocus(onInput ? hit : std::nullopt);

    if (hit && controls_[*hit].kind == ControlKind::Button) {
        pressed_ = hit;
        notify();
    }
}

void ControlPanel::mouseUp(canvas::Point position) {
    if (!pressed_) return;
    size_t index = *pressed_;
    pressed_.reset();
    notify();

    // The handler may add controls
    ButtonHandler handler = controls_[index].clicked;
    if (hitTest(position) == index && handler) {
        handler();
    }
}

void ControlPanel::setFocus(std::optional<size_t> index) {
    if (focused_ == index) return;
    bool had = focused_.has_value();
    focused_ = index;
    notify();
    if (focusChanged_ && had != focused_.has_value()) {
        focusChanged_(focused_.has_value());
    }
}

bool ControlPanel::keyDown(int keyCode) {
    if (!focused_) return false;

    if (keyCode == input::kBackspaceKeyCode) {
        std::string& text = controls_[*focused_].text;
        if (!text.empty()) {
            size_t end = text.size() - 1;
            while (end > 0 && isContinuationByte(text[end])) {
                end--;
            }
            text.erase(end);
            notify();
        }
    }
    return true;
}

bool ControlPanel::keyUp(int keyCode) {
    if (!focused_) return false;

    if (keyCode == input::kEnterKeyCode) {
        const Item& field = controls_[*focused_];
        std::string text = field.text;
        InputHandler handler = field.entered;
        setFocus(std::nullopt);
        if (handler) {
            handler(text);
        }
    }
    return true;
}

void ControlPanel::textInput(const std::string& text) {
    if (!focused_) return;

    std::string printable;
    for (char c : text) {
        auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x20 && byte != 0x7F) {
            printable.push_back(c);
        }
    }
    if (printable.empty()) return;
    controls_[*focused_].text += printable;
    notify();
}

// ============================================================================
// Rendering
// ============================================================================

canvas::FrameBuffer ControlPanel::render() const {
    canvas::FrameBuffer buffer;
    canvas::Canvas canvas(buffer);

    int top = 0;
    for (size_t i = 0; i < controls_.size(); i++) {
        const Item& c = controls_[i];
        int width = itemWidth(c);

        switch (c.kind) {
            case ControlKind::Label:
                if (!c.text.empty()) {
                    canvas.drawText(c.text, at(0, top + 13), kControlFontSize, "Black", "sans-serif");
                }
                break;

            case ControlKind::Button: {
                std::string fill = pressed_ == i ? "#cce4f7" : "#e1e1e1";
                canvas.drawPolygon(box(0, top, width, kButtonHeight), 1, "#adadad", fill);
                if (!c.text.empty()) {
                    int left = std::max(0, (width - measure(c.text)) / 2);
                    canvas.drawText(c.text, at(left, top + 16), kControlFontSize, "Black", "sans-serif");
                }
                break;
            }

            case ControlKind::Input: {
                if (!c.caption.empty()) {
                    canvas.drawText(c.caption, at(0, top + 13), kControlFontSize, "Black", "sans-serif");
                }
                int fieldTop = top + kLabelHeight + 1;
                bool focused = focused_ == i;
                canvas.drawPolygon(box(0, fieldTop, width, kInputFieldHeight), 1,
                                   focused ? "#0078d7" : "#7a7a7a", std::string("White"));
                if (!c.text.empty()) {
                    canvas.drawText(c.text, at(4, fieldTop + 16), kControlFontSize, "Black", "sans-serif");
                }
                if (focused) {
                    int caret = 4 + measure(c.text) + 1;
                    canvas.drawLine(at(caret, fieldTop + 4), at(caret, fieldTop + 19), 1, "Black");
                }
                break;
            }
        }
        top += itemHeight(c) + kControlSpacing;
    }

    // Rows sit at the bottom of the panel, key above mouse
    double right = std::max(1, width_ - 1);
    const std::string* lines[] = {&keyStatus_, &mouseStatus_};
    for (int row = 0; row < 2; row++) {
        double rowTop = height_ - (2 - row) * kStatusRowHeight;
        double bottom = rowTop + kStatusRowHeight - 1;
        canvas.drawPolygon({{0, rowTop}, {right, rowTop}, {right, bottom}, {0, bottom}}, 1, "Black");
        canvas.drawText(*lines[row], {4, bottom - 4}, kControlFontSize, "Black", "sans-serif");
    }
    return buffer;
}

} // namespace easel
