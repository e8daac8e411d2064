#include "MuxSession.hpp"

#include "EmergencyHandler.hpp"
#include "FdUtils.hpp"
#include "InputDecoder.hpp"

namespace tabmux {
MuxSession::MuxSession(shared_ptr<Console> _console,
                       shared_ptr<ProcessSpawner> _spawner, int viewportHeight,
                       size_t retention)
    : console(_console),
      state(new MultiplexerState(viewportHeight, retention)),
      queue(new EventQueue()) {
  supervisor.reset(new ProcessSupervisor(state, _spawner));
  renderer.reset(new Renderer(console));

  queue->setHandler(MuxEventType::INPUT, [this](const MuxEvent& event) {
    return handleInput(event.data);
  });
  queue->setHandler(MuxEventType::PROCESS_OUTPUT,
                    [this](const MuxEvent& event) {
                      return supervisor->onOutput(event.tabIndex, event.data);
                    });
  queue->setHandler(MuxEventType::PROCESS_EXIT, [this](const MuxEvent& event) {
    return supervisor->onExit(event.tabIndex, event.exitStatus);
  });
  queue->setRedrawCallback([this]() { renderer->render(*state); });

  // The console goes back to cooked mode before the children are signalled
  supervisor->addPreExitHook([this]() { restoreConsole(); });
}

MuxSession::~MuxSession() { restoreConsole(); }

void MuxSession::start(const vector<CommandSpec>& commands) {
  try {
    supervisor->spawnAll(commands);
  } catch (const std::runtime_error& ex) {
    for (int tabIndex = 1; tabIndex < state->numTabs(); tabIndex++) {
      state->getProcessForTab(tabIndex).handle->sendSignal(SIGTERM);
    }
    throw;
  }
  console->setup();
  EmergencyHandler::install(console.get());
  supervisor->print("Initialized!\n");
  renderer->render(*state);
}

int MuxSession::run() {
  while (state->getStatus() == SessionStatus::ACTIVE) {
    pollOnce(POLL_TIMEOUT_MS);
    dispatchPending();
  }
  restoreConsole();
  LOG(INFO) << "Session ended with exit code " << state->getExitCode();
  return state->getExitCode();
}

void MuxSession::pollOnce(int timeoutMs) {
  fd_set rfd;
  timeval tv;
  FD_ZERO(&rfd);
  int maxFd = console->getInputFd();
  FD_SET(console->getInputFd(), &rfd);
  for (int tabIndex = 1; tabIndex < state->numTabs(); tabIndex++) {
    ProcessRecord& record = state->getProcessForTab(tabIndex);
    int fd = record.handle->getFd();
    if (record.status != ProcessStatus::EXITED && fd >= 0) {
      FD_SET(fd, &rfd);
      maxFd = max(maxFd, fd);
    }
  }
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(maxFd + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return;
    }
    FATAL_FAIL(rc);
  }

  if (rc > 0 && FD_ISSET(console->getInputFd(), &rfd)) {
    bool eof;
    string chunk = FdUtils::readAvailable(console->getInputFd(), &eof);
    if (eof) {
      throw std::runtime_error("stdin has closed abruptly.");
    }
    if (chunk.length()) {
      VLOG(3) << "STDIN -> " << chunk.length() << " bytes";
      queue->post(MuxEvent::input(chunk));
    }
  }

  for (int tabIndex = 1; tabIndex < state->numTabs(); tabIndex++) {
    ProcessRecord& record = state->getProcessForTab(tabIndex);
    if (record.status == ProcessStatus::EXITED) {
      continue;
    }
    int fd = record.handle->getFd();
    bool readable = rc > 0 && fd >= 0 && FD_ISSET(fd, &rfd);
    postProcessEvents(tabIndex, record, readable);
  }
}

void MuxSession::postProcessEvents(int tabIndex, ProcessRecord& record,
                                   bool readable) {
  if (readable) {
    string data = record.handle->readOutput();
    if (data.length()) {
      queue->post(MuxEvent::output(tabIndex, data));
    }
  }
  int exitStatus;
  if (record.handle->pollExit(&exitStatus)) {
    // Whatever is still in the pipe belongs before the exit notice
    while (record.handle->getFd() >= 0) {
      string data = record.handle->readOutput();
      if (data.empty()) {
        break;
      }
      queue->post(MuxEvent::output(tabIndex, data));
    }
    queue->post(MuxEvent::exit(tabIndex, exitStatus));
  }
}

void MuxSession::restoreConsole() {
  EmergencyHandler::uninstall();
  console->teardown();
}

bool MuxSession::handleInput(const string& chunk) {
  InputEventType type = InputDecoder::decode(chunk);
  VLOG(2) << "Input " << inputEventTypeToString(type) << " on tab "
          << state->getActiveTab();
  switch (type) {
    case InputEventType::INTERRUPT:
      if (state->getActiveTab() == 0) {
        supervisor->interruptMain();
        queue->stop();
        return false;
      }
      return supervisor->interruptChild(state->getActiveTab());
    case InputEventType::NAVIGATE_LEFT:
      return state->navigate(-1);
    case InputEventType::NAVIGATE_RIGHT:
      return state->navigate(1);
    case InputEventType::SCROLL_UP:
      return state->scroll(-1);
    case InputEventType::SCROLL_DOWN:
      return state->scroll(1);
    case InputEventType::RESTART_KEY:
      return supervisor->restart(state->getActiveTab());
    case InputEventType::UNRECOGNIZED:
      return false;
  }
  return false;
}
}  // namespace tabmux
