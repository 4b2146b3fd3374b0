#include <iostream>
#include <string>

#include <harbor/ui/runtime.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "../examples/terminal_surface.hpp"

using namespace harbor::ui;
using namespace harbor::ui::examples;

int main() {
  spdlog::cfg::load_env_levels();

  const SizeF viewport{640.0f, 240.0f};
  auto &loop = RunLoop::main();
  auto window = Window::create(viewport);

  TerminalStore store;
  PortalRegistry registry{loop};
  SceneMount mount{window, registry, store.resolver()};

  WorkspaceState state;
  state.panes.push_back("shell-1");
  store.open("shell-1")->submit("echo hello from shell-1");

  auto dump_frame = [&](const char *label) {
    mount.render(workspace_view(state));
    loop.run_until_idle();
    auto *portal = registry.portal_for(*window);
    std::cout << "\n== " << label << " (entries="
              << (portal ? portal->entry_count() : 0)
              << " hosted=" << (portal ? portal->hosted_subview_count() : 0)
              << " turns=" << loop.turns() << ")\n";
    render_ascii(std::cout, compose_frame(mount.chrome_ops(), portal),
                 window->content_size(), 80, 20);
  };

  std::cout << "Initial tree:\n";
  dump_tree(std::cout, workspace_view(state));
  dump_frame("single pane");
  std::cout << "Layout:\n";
  dump_layout(std::cout, mount.layout());
  std::cout << "Chrome ops:\n";
  dump_render_ops(std::cout, mount.chrome_ops());

  state.panes.push_back("shell-2");
  store.open("shell-2")->submit("help");
  dump_frame("split right");

  state.panes.push_back("shell-3");
  store.open("shell-3")->submit("size");
  dump_frame("split again");

  state.vertical = false;
  dump_frame("stacked");

  state.panes.erase(state.panes.begin());
  dump_frame("closed shell-1");
  store.close("shell-1");

  window->begin_live_resize();
  window->set_content_size(SizeF{480.0f, 200.0f});
  window->end_live_resize();
  loop.run_until_idle();
  dump_frame("resized");

  state.sidebar_visible = false;
  mount.unmount_surface("shell-3");
  state.panes.pop_back();
  dump_frame("sidebar hidden, shell-3 unmounted");

  if (auto *hit = registry.view_at_window_point(*window, PointF{20.0f, 20.0f})) {
    std::cout << "hit at (20,20): " << hit->debug_name() << "\n";
  }

  window->close();
  std::cout << "portals after close: " << registry.portal_count() << "\n";
  return 0;
}
