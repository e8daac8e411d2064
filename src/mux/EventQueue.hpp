#ifndef __TABMUX_EVENT_QUEUE_HPP__
#define __TABMUX_EVENT_QUEUE_HPP__

#include "Headers.hpp"

namespace tabmux {
enum class MuxEventType {
  /** @brief A raw chunk from the operator's terminal. */
  INPUT,
  /** @brief A chunk of output from a child. */
  PROCESS_OUTPUT,
  /** @brief A child was reaped. */
  PROCESS_EXIT,
};

struct MuxEvent {
  MuxEventType type;
  /** @brief Tab of the child for PROCESS_* events, 0 for INPUT. */
  int tabIndex = 0;
  string data;
  int exitStatus = 0;

  static MuxEvent input(const string& data);
  static MuxEvent output(int tabIndex, const string& data);
  static MuxEvent exit(int tabIndex, int exitStatus);
};

/**
 * @brief Single-threaded FIFO of session events with a dispatch table keyed
 * by event type.
 *
 * Events are handled strictly in the order they were posted.  A handler
 * returns true when the screen must be redrawn; the redraw callback then
 * runs once, before the next event is handled.
 */
class EventQueue {
 public:
  typedef function<bool(const MuxEvent&)> Handler;

  EventQueue();

  void setHandler(MuxEventType type, Handler handler);
  void setRedrawCallback(function<void()> callback);
  void post(const MuxEvent& event);

  /**
   * @brief Handles every queued event, including ones posted by handlers.
   * @return The number of events handled.
   */
  int dispatchPending();

  /** @brief Drops everything still queued and refuses further events. */
  void stop();

  inline bool isStopped() const { return stopped; }
  inline size_t size() const { return pending.size(); }
  inline bool empty() const { return pending.empty(); }

 protected:
  deque<MuxEvent> pending;
  map<MuxEventType, Handler> handlers;
  function<void()> redrawCallback;
  bool stopped;
};
}  // namespace tabmux

#endif  // __TABMUX_EVENT_QUEUE_HPP__
