#include "easel/input/event_router.h"

namespace easel {
namespace input {

template <typename Handler, typename Payload>
void EventRouter::deliver(const Connection<Handler>& connection, const Payload& payload) {
    if (!started_) {
        return;
    }
    // Copies: a handler may replace its own connection
    Handler primary = connection.primary;
    Handler secondary = connection.secondary;
    if (primary) primary(payload);
    if (secondary) secondary(payload);
}

void EventRouter::setKeydownHandler(KeyHandler handler, KeyHandler secondary) {
    keydown_ = {std::move(handler), std::move(secondary)};
}

void EventRouter::setKeyupHandler(KeyHandler handler, KeyHandler secondary) {
    keyup_ = {std::move(handler), std::move(secondary)};
}

void EventRouter::setMouseclickHandler(MouseHandler handler, MouseHandler secondary) {
    mouseclick_ = {std::move(handler), std::move(secondary)};
}

void EventRouter::setMousedragHandler(MouseHandler handler, MouseHandler secondary) {
    mousedrag_ = {std::move(handler), std::move(secondary)};
}

void EventRouter::keyDown(int keyCode) {
    deliver(keydown_, keyCode);
}

void EventRouter::keyUp(int keyCode) {
    deliver(keyup_, keyCode);
}

void EventRouter::mouseClick(canvas::Point position) {
    deliver(mouseclick_, position);
}

void EventRouter::mouseDrag(canvas::Point position) {
    deliver(mousedrag_, position);
}

} // namespace input
} // namespace easel
