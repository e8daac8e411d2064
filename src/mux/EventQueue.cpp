#include "EventQueue.hpp"

namespace tabmux {
MuxEvent MuxEvent::input(const string& data) {
  MuxEvent event;
  event.type = MuxEventType::INPUT;
  event.data = data;
  return event;
}

MuxEvent MuxEvent::output(int tabIndex, const string& data) {
  MuxEvent event;
  event.type = MuxEventType::PROCESS_OUTPUT;
  event.tabIndex = tabIndex;
  event.data = data;
  return event;
}

MuxEvent MuxEvent::exit(int tabIndex, int exitStatus) {
  MuxEvent event;
  event.type = MuxEventType::PROCESS_EXIT;
  event.tabIndex = tabIndex;
  event.exitStatus = exitStatus;
  return event;
}

EventQueue::EventQueue() : stopped(false) {}

void EventQueue::setHandler(MuxEventType type, Handler handler) {
  handlers[type] = handler;
}

void EventQueue::setRedrawCallback(function<void()> callback) {
  redrawCallback = callback;
}

void EventQueue::post(const MuxEvent& event) {
  if (stopped) {
    VLOG(2) << "Dropping event posted after stop";
    return;
  }
  pending.push_back(event);
}

int EventQueue::dispatchPending() {
  int handled = 0;
  while (!stopped && !pending.empty()) {
    MuxEvent event = pending.front();
    pending.pop_front();
    auto it = handlers.find(event.type);
    if (it == handlers.end()) {
      STFATAL << "No handler for event type " << int(event.type);
    }
    bool redraw = it->second(event);
    handled++;
    if (redraw && !stopped && redrawCallback) {
      redrawCallback();
    }
  }
  return handled;
}

void EventQueue::stop() {
  stopped = true;
  pending.clear();
}
}  // namespace tabmux
