#include "Renderer.hpp"

namespace tabmux {
Renderer::Renderer(shared_ptr<Console> _console)
    : console(_console), frameCount(0) {}

string Renderer::renderTabBar(const MultiplexerState& state) {
  string tabs;
  for (int a = 0; a < state.numTabs(); a++) {
    string selected = (a == state.getActiveTab()) ? "[*]" : "[ ]";
    if (a > 0) {
      tabs += "|";
    }
    if (a == 0) {
      tabs += "main " + selected + " ";
    } else {
      tabs += " process " + to_string(a) + " " + selected + " ";
    }
  }
  return tabs;
}

string Renderer::renderFrame(const MultiplexerState& state) {
  string frame = CLEAR_SCREEN;
  frame += HEADER_LINE;
  frame += "\n";
  frame += renderTabBar(state) + "\n";
  frame += "\n";

  const HistoryBuffer& current = state.getActiveHistory();
  size_t begin = size_t(state.getCursor());
  size_t end = min(begin + size_t(state.getViewportHeight()), current.size());
  for (auto& it : current.slice(begin, end)) {
    frame += it;
  }
  return frame;
}

void Renderer::render(const MultiplexerState& state) {
  string frame = renderFrame(state);
  try {
    console->write(frame);
    frameCount++;
    VLOG(2) << "Drew frame " << frameCount << " (" << frame.length()
            << " bytes)";
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Dropped a frame: " << ex.what();
  }
}
}  // namespace tabmux
