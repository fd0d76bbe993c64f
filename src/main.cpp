#include "ncurses_terminal.hpp"
#include "renderer.hpp"
#include "editor.hpp"
#include <optional>
#include <filesystem>
#include <glog/logging.h>

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  // the screen belongs to ncurses; logs go to files unless asked otherwise
  FLAGS_logtostderr = false;
  FLAGS_stderrthreshold = google::GLOG_FATAL;

  std::optional<std::filesystem::path> path;
  if (argc >= 2) path = std::filesystem::path(argv[1]);
  LOG(INFO) << "glyph starting" << (path ? " file=" + path->string() : std::string());

  Editor ed(path);
  ed.load_rc();
  NcursesTerminal screen;
  Renderer renderer;
  Viewport vp;
  while (!ed.should_quit()) {
    renderer.render(screen, ed, vp);
    KeyEvent ev = screen.read_key();
    if (ev.key == Key::None) continue;
    ed.handle_key(ev);
  }
  LOG(INFO) << "glyph exiting";
  google::ShutdownGoogleLogging();
  return 0;
}
