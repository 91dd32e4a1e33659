#pragma once

/**
 * ControlPanel - controls and status display beside the canvas
 *
 * Labels, buttons and text inputs added by the sketch are stacked from the
 * top of the panel in the order they were added. The most recent key and
 * mouse events are shown as two boxed lines at the bottom ("Key: Down A",
 * "Mouse: Click 10, 20"); the frame connects the panel as the secondary
 * handler of every input connection.
 *
 *   Control label = frame.addLabel("Score", 120);
 *   frame.addButton("Reset", []() { ... });
 *   frame.addInput("Name", [label](const std::string& text) mutable { label.setText(text); }, 200);
 *
 * Positions taken by the panel are relative to its top-left corner.
 */

#include "easel/canvas/draw_primitive.h"
#include "easel/canvas/geometry.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace easel {

constexpr int kDefaultControlWidth = 200;
constexpr int kStatusRowHeight = 17;
constexpr int kLabelHeight = 17;
constexpr int kButtonHeight = 24;
constexpr int kInputFieldHeight = 24;
constexpr int kControlSpacing = 6;
constexpr int kControlPadding = 8;
constexpr int kControlFontSize = 12;

enum class ControlKind { Label, Button, Input };

// Pixel width of text in the panel font
using TextMeasure = std::function<int(const std::string&)>;
using ButtonHandler = std::function<void()>;
using InputHandler = std::function<void(const std::string&)>;

class ControlPanel;

/**
 * Handle to one control. Reads and replaces the text of a label, the
 * caption of a button or the contents of an input field. Copies refer to
 * the same control; the panel must outlive them.
 */
class Control {
public:
    Control(ControlPanel& panel, size_t index) : panel_(&panel), index_(index) {}

    std::string getText() const;

    /**
     * @throws ArgumentError for text with control characters
     */
    void setText(const std::string& text);

    ControlKind kind() const;

private:
    ControlPanel* panel_;
    size_t index_;
};

class ControlPanel {
public:
    /**
     * Without a measure, text widths are estimated from the character count.
     */
    ControlPanel(int width, int height, TextMeasure measure = {});

    /**
     * A missing width fits the text. Widths must be positive.
     * @throws ArgumentError
     */
    Control addLabel(const std::string& text, std::optional<int> width = std::nullopt);
    Control addButton(const std::string& text, ButtonHandler handler, std::optional<int> width = std::nullopt);

    /**
     * The handler receives the field contents when Enter is released in it.
     * @throws ArgumentError
     */
    Control addInput(const std::string& text, InputHandler handler, int width);

    size_t controlCount() const { return controls_.size(); }

    // Secondary handlers of the frame's input connections
    void onKeydown(int keyCode);
    void onKeyup(int keyCode);
    void onMouseclick(canvas::Point position);
    void onMousedrag(canvas::Point position);

    const std::string& keyStatus() const { return keyStatus_; }
    const std::string& mouseStatus() const { return mouseStatus_; }

    /**
     * Press and release of the mouse button. A button fires when it is
     * released over the button it was pressed on. A press on an input
     * field focuses it; a press anywhere else removes the focus.
     */
    void mouseDown(canvas::Point position);
    void mouseUp(canvas::Point position);

    /**
     * True while an input field has the keyboard.
     */
    bool hasFocus() const { return focused_.has_value(); }

    /**
     * Keys for the focused input field. Return false, consuming nothing,
     * when no field has the focus.
     */
    bool keyDown(int keyCode);
    bool keyUp(int keyCode);

    /**
     * Append typed text to the focused input field.
     */
    void textInput(const std::string& text);

    /**
     * Called after anything shown on the panel changes.
     */
    void setChangeHandler(std::function<void()> handler) { changed_ = std::move(handler); }

    /**
     * Called with true when an input field takes the focus and false when
     * the last focus is dropped.
     */
    void setFocusHandler(std::function<void(bool)> handler) { focusChanged_ = std::move(handler); }

    /**
     * Record the panel contents.
     */
    canvas::FrameBuffer render() const;

    int width() const { return width_; }
    int height() const { return height_; }

private:
    friend class Control;

    struct Item {
        ControlKind kind;
        std::string text;       // label text, button caption or field contents
        std::string caption;    // inputs: the line above the field
        std::optional<int> width;
        ButtonHandler clicked;
        InputHandler entered;
    };

    Item& item(size_t index);
    const Item& item(size_t index) const;
    int itemWidth(const Item& item) const;
    int itemHeight(const Item& item) const;
    std::optional<size_t> hitTest(canvas::Point position) const;
    int measure(const std::string& text) const;

    Control add(Item item);
    void setFocus(std::optional<size_t> index);
    void setKeyStatus(std::string text);
    void setMouseStatus(std::string text);
    void notify();

    int width_;
    int height_;
    TextMeasure measure_;
    std::vector<Item> controls_;
    std::optional<size_t> pressed_;
    std::optional<size_t> focused_;
    std::string keyStatus_ = "Key: ";
    std::string mouseStatus_ = "Mouse: ";
    std::function<void()> changed_;
    std::function<void(bool)> focusChanged_;
};

} // namespace easel
