#pragma once

/**
 * Frame - a window holding a control panel and a drawing canvas
 *
 * The panel sits on the left, the canvas on the right. The canvas is fed by
 * a RenderSurface; each repaint it requests is rasterized with Skia and
 * uploaded to the window. Input on the window goes through an EventRouter
 * whose secondary handlers update the panel's status lines. Presses in the
 * panel go to its buttons and input fields; while a field has the focus it
 * takes the keyboard and key handlers are not called.
 *
 * An open frame keeps the program alive until its window is closed.
 */

#include "easel/canvas/painter.h"
#include "easel/canvas/render_surface.h"
#include "easel/input/event_router.h"
#include "easel/platform/window.h"
#include "easel/runtime/control_panel.h"
#include <memory>
#include <optional>
#include <string>

namespace easel {

class RuntimeContext;

constexpr int kFrameMargin = 8;

class Frame : public canvas::RepaintTarget, public platform::WindowListener {
public:
    Frame(RuntimeContext& context, std::string title, int canvasWidth, int canvasHeight,
          int controlWidth = kDefaultControlWidth);
    ~Frame() override;

    /**
     * Create and show the window. A frame whose window could not be created
     * still records draws but does not count as open.
     */
    bool open();

    /**
     * Stop drawing and destroy the window. Idempotent.
     */
    void close();
    bool isOpen() const { return window_.isOpen(); }

    void setDrawHandler(canvas::DrawHandler handler);
    void setKeydownHandler(input::KeyHandler handler);
    void setKeyupHandler(input::KeyHandler handler);
    void setMouseclickHandler(input::MouseHandler handler);
    void setMousedragHandler(input::MouseHandler handler);

    /**
     * Controls stacked at the top of the panel. A missing width fits the text.
     * @throws ArgumentError for a width that is not positive or text with
     *         control characters
     */
    Control addLabel(const std::string& text, std::optional<int> width = std::nullopt);
    Control addButton(const std::string& text, ButtonHandler handler, std::optional<int> width = std::nullopt);
    Control addInput(const std::string& text, InputHandler handler, int width);

    /**
     * @throws ColourParseError
     */
    void setCanvasBackground(const std::string& colour);

    /**
     * Begin drawing and event delivery.
     */
    void start();

    /**
     * Width in pixels of the text as drawCanvas would render it.
     * @throws ArgumentError for a bad face or size
     */
    int getCanvasTextwidth(const std::string& text, double size, const std::string& face = "serif");

    const std::string& title() const { return title_; }
    int canvasWidth() const { return canvasWidth_; }
    int canvasHeight() const { return canvasHeight_; }
    int controlWidth() const { return controlWidth_; }

    canvas::RenderSurface& surface() { return surface_; }
    input::EventRouter& events() { return router_; }
    ControlPanel& controlPanel() { return panel_; }

    // RepaintTarget
    void requestRepaint() override;

    // WindowListener
    void onKeyDown(int keyCode) override;
    void onKeyUp(int keyCode) override;
    void onMouseDown(int x, int y) override;
    void onMouseUp(int x, int y) override;
    void onMouseMove(int x, int y, bool buttonHeld) override;
    void onTextInput(const std::string& text) override;
    void onCloseRequested() override;
    void onExposed() override;

    Frame(const Frame&) = delete;
    Frame& operator=(const Frame&) = delete;

private:
    bool onCanvas(int x, int y) const;
    canvas::Point toCanvas(int x, int y) const;
    int panelTextWidth(const std::string& text);
    void paintCanvas();
    void paintPanel();

    RuntimeContext& context_;
    std::string title_;
    int canvasWidth_;
    int canvasHeight_;
    int controlWidth_;

    platform::Window window_;
    canvas::RenderSurface surface_;
    input::EventRouter router_;
    ControlPanel panel_;

    std::unique_ptr<canvas::Painter> canvasPainter_;
    std::unique_ptr<canvas::Painter> panelPainter_;
    int canvasLayer_ = -1;
    int panelLayer_ = -1;

    bool counted_ = false;
    bool pressedOnCanvas_ = false;
};

} // namespace easel
