#pragma once

/**
 * EventRouter - delivers input to the sketch's handlers
 *
 * Each event kind has one connection: a primary handler and an optional
 * secondary one (the frame uses it for its status display). Both receive the
 * same payload, primary first. Nothing is delivered before start().
 */

#include "easel/canvas/geometry.h"
#include <functional>

namespace easel {
namespace input {

using KeyHandler = std::function<void(int keyCode)>;
using MouseHandler = std::function<void(canvas::Point position)>;

class EventRouter {
public:
    void setKeydownHandler(KeyHandler handler, KeyHandler secondary = {});
    void setKeyupHandler(KeyHandler handler, KeyHandler secondary = {});
    void setMouseclickHandler(MouseHandler handler, MouseHandler secondary = {});
    void setMousedragHandler(MouseHandler handler, MouseHandler secondary = {});

    void start() { started_ = true; }
    bool isStarted() const { return started_; }

    void keyDown(int keyCode);
    void keyUp(int keyCode);
    void mouseClick(canvas::Point position);
    void mouseDrag(canvas::Point position);

private:
    template <typename Handler>
    struct Connection {
        Handler primary;
        Handler secondary;
    };

    template <typename Handler, typename Payload>
    void deliver(const Connection<Handler>& connection, const Payload& payload);

    Connection<KeyHandler> keydown_;
    Connection<KeyHandler> keyup_;
    Connection<MouseHandler> mouseclick_;
    Connection<MouseHandler> mousedrag_;
    bool started_ = false;
};

} // namespace input
} // namespace easel
