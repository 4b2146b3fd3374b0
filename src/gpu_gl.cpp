#include <harbor/ui/runtime.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "../examples/terminal_surface.hpp"

#if !defined(_WIN32) && !defined(__linux__)
int main() { return 0; }
#else

#include <GLFW/glfw3.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#if defined(HARBOR_HAS_FREETYPE) && HARBOR_HAS_FREETYPE
#include <ft2build.h>
#include FT_FREETYPE_H
#endif

using namespace harbor::ui;
using namespace harbor::ui::examples;

static void gl_set_ortho(int w, int h) {
  glViewport(0, 0, w, h);
  glMatrixMode(GL_PROJECTION);
  glLoadIdentity();
  glOrtho(0.0, static_cast<double>(w), static_cast<double>(h), 0.0, -1.0, 1.0);
  glMatrixMode(GL_MODELVIEW);
  glLoadIdentity();
}

// One texture per (byte, pixel size). Terminal rows are plain ASCII, so
// each byte is its own glyph.
struct GLGlyph {
  GLuint texture{};
  int w{};
  int h{};
  int left{};
  int top{};
  int advance{};
};

static std::string find_monospace_font() {
  if (const char *env = std::getenv("HARBOR_FONT"); env && env[0] != '\0') {
    return env;
  }
  const char *candidates[] = {
      "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
      "/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf",
      "/usr/share/fonts/truetype/noto/NotoSansMono-Regular.ttf",
  };
  for (const char *p : candidates) {
    if (FILE *f = std::fopen(p, "rb")) {
      std::fclose(f);
      return p;
    }
  }
  return {};
}

class GlyphCache {
public:
  GlyphCache() = default;
  GlyphCache(const GlyphCache &) = delete;
  GlyphCache &operator=(const GlyphCache &) = delete;

  ~GlyphCache() {
    for (auto &kv : glyphs_) {
      if (kv.second.texture != 0) {
        glDeleteTextures(1, &kv.second.texture);
      }
    }
#if defined(HARBOR_HAS_FREETYPE) && HARBOR_HAS_FREETYPE
    if (face_) {
      FT_Done_Face(face_);
    }
    if (ft_) {
      FT_Done_FreeType(ft_);
    }
#endif
  }

  // Null when no font is available; the caller skips the glyph.
  const GLGlyph *glyph(unsigned char ch, int px) {
    const auto key = (static_cast<std::uint32_t>(px) << 8) | ch;
    if (const auto it = glyphs_.find(key); it != glyphs_.end()) {
      return &it->second;
    }
    GLGlyph g{};
    if (!rasterize(ch, px, g)) {
      return nullptr;
    }
    return &glyphs_.emplace(key, g).first->second;
  }

private:
  bool rasterize(unsigned char ch, int px, GLGlyph &out) {
#if !(defined(HARBOR_HAS_FREETYPE) && HARBOR_HAS_FREETYPE)
    (void)ch;
    (void)px;
    (void)out;
    return false;
#else
    if (!ensure_face() ||
        FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(px)) != 0 ||
        FT_Load_Char(face_, ch, FT_LOAD_RENDER) != 0) {
      return false;
    }
    const auto *slot = face_->glyph;
    out.w = static_cast<int>(slot->bitmap.width);
    out.h = static_cast<int>(slot->bitmap.rows);
    out.left = slot->bitmap_left;
    out.top = slot->bitmap_top;
    out.advance = static_cast<int>(slot->advance.x >> 6);
    if (out.w == 0 || out.h == 0) {
      // Spaces only advance.
      return true;
    }

    // Rows may be padded past the bitmap width.
    std::vector<std::uint8_t> pixels(static_cast<std::size_t>(out.w * out.h));
    for (int y = 0; y < out.h; ++y) {
      std::memcpy(pixels.data() + static_cast<std::size_t>(y * out.w),
                  slot->bitmap.buffer + static_cast<std::ptrdiff_t>(y) *
                                            slot->bitmap.pitch,
                  static_cast<std::size_t>(out.w));
    }

    glGenTextures(1, &out.texture);
    if (out.texture == 0) {
      return false;
    }
    glBindTexture(GL_TEXTURE_2D, out.texture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_ALPHA, out.w, out.h, 0, GL_ALPHA,
                 GL_UNSIGNED_BYTE, pixels.data());
    return true;
#endif
  }

#if defined(HARBOR_HAS_FREETYPE) && HARBOR_HAS_FREETYPE
  bool ensure_face() {
    if (face_) {
      return true;
    }
    if (font_missing_) {
      return false;
    }
    const auto path = find_monospace_font();
    if (path.empty() || (!ft_ && FT_Init_FreeType(&ft_) != 0) ||
        FT_New_Face(ft_, path.c_str(), 0, &face_) != 0) {
      spdlog::warn("gpu.font unavailable path='{}'", path);
      face_ = nullptr;
      font_missing_ = true;
      return false;
    }
    spdlog::debug("gpu.font path='{}'", path);
    return true;
  }

  FT_Library ft_{};
  FT_Face face_{};
  bool font_missing_{false};
#endif

  std::unordered_map<std::uint32_t, GLGlyph> glyphs_;
};

static void gl_quad(float x0, float y0, float x1, float y1, bool textured) {
  glBegin(GL_QUADS);
  if (textured) {
    glTexCoord2f(0.0f, 0.0f);
  }
  glVertex2f(x0, y0);
  if (textured) {
    glTexCoord2f(1.0f, 0.0f);
  }
  glVertex2f(x1, y0);
  if (textured) {
    glTexCoord2f(1.0f, 1.0f);
  }
  glVertex2f(x1, y1);
  if (textured) {
    glTexCoord2f(0.0f, 1.0f);
  }
  glVertex2f(x0, y1);
  glEnd();
}

struct GLRenderer final : Renderer {
  int vh{};
  GlyphCache *glyphs{};
  std::vector<RectF> clips;

  void push_clip(const PushClip &c) override {
    clips.push_back(clips.empty() ? c.rect : intersect_rect(c.rect, clips.back()));
    apply_scissor();
  }

  void pop_clip(const PopClip &) override {
    if (!clips.empty()) {
      clips.pop_back();
    }
    apply_scissor();
  }

  void draw_rect(const DrawRect &r) override {
    glDisable(GL_TEXTURE_2D);
    glColor4ub(r.fill.r, r.fill.g, r.fill.b, r.fill.a);
    gl_quad(r.rect.x, r.rect.y, r.rect.x + r.rect.w, r.rect.y + r.rect.h, false);
  }

  // Rows are left aligned on a baseline at 80% of the row height.
  void draw_text(const DrawText &t) override {
    if (!glyphs || t.text.empty()) {
      return;
    }
    const int px = std::max(1, static_cast<int>(std::lround(t.font_px)));
    const float baseline = t.rect.y + t.rect.h * 0.8f;
    float pen = t.rect.x + 2.0f;

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glEnable(GL_TEXTURE_2D);
    glTexEnvi(GL_TEXTURE_ENV, GL_TEXTURE_ENV_MODE, GL_MODULATE);
    glColor4ub(t.color.r, t.color.g, t.color.b, t.color.a);
    for (const char c : t.text) {
      const auto *g = glyphs->glyph(static_cast<unsigned char>(c), px);
      if (g == nullptr) {
        break;
      }
      if (g->texture != 0) {
        const float x0 = pen + static_cast<float>(g->left);
        const float y0 = baseline - static_cast<float>(g->top);
        glBindTexture(GL_TEXTURE_2D, g->texture);
        gl_quad(x0, y0, x0 + static_cast<float>(g->w),
                y0 + static_cast<float>(g->h), true);
      }
      pen += static_cast<float>(g->advance);
      if (pen >= t.rect.x + t.rect.w) {
        break;
      }
    }
    glDisable(GL_TEXTURE_2D);
  }

private:
  void apply_scissor() {
    if (clips.empty()) {
      glDisable(GL_SCISSOR_TEST);
      return;
    }
    const auto &r = clips.back();
    glEnable(GL_SCISSOR_TEST);
    // GL scissor boxes are bottom-left based.
    glScissor(static_cast<GLint>(std::floor(r.x)),
              static_cast<GLint>(std::floor(static_cast<float>(vh) - r.y - r.h)),
              static_cast<GLsizei>(std::max(0.0f, std::ceil(r.w))),
              static_cast<GLsizei>(std::max(0.0f, std::ceil(r.h))));
  }
};

struct InputCtx {
  Window *window{};
  PortalRegistry *registry{};
  TerminalStore *store{};
  WorkspaceState *state{};
  int next_pane{2};
};

static PointF framebuffer_point(GLFWwindow *win, double xpos, double ypos) {
  int ww = 0;
  int wh = 0;
  glfwGetWindowSize(win, &ww, &wh);
  int fbw = 0;
  int fbh = 0;
  glfwGetFramebufferSize(win, &fbw, &fbh);

  const double sx =
      ww > 0 ? static_cast<double>(fbw) / static_cast<double>(ww) : 1.0;
  const double sy =
      wh > 0 ? static_cast<double>(fbh) / static_cast<double>(wh) : 1.0;
  return PointF{static_cast<float>(xpos * sx), static_cast<float>(ypos * sy)};
}

static void cursor_pos_cb(GLFWwindow *win, double xpos, double ypos) {
  auto *ctx = static_cast<InputCtx *>(glfwGetWindowUserPointer(win));
  if (!ctx || !ctx->window) {
    return;
  }
  const bool dragging =
      glfwGetMouseButton(win, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS;
  auto pointer = ctx->window->pointer_context();
  pointer.event =
      dragging ? PointerEventKind::LeftMouseDragged : PointerEventKind::MouseMoved;
  ctx->window->set_pointer_context(std::move(pointer));

  if (auto *portal = ctx->registry->portal_for(*ctx->window)) {
    const auto p = framebuffer_point(win, xpos, ypos);
    portal->host().pointer_moved(portal->host().convert_from_window(p));
  }
}

static void mouse_button_cb(GLFWwindow *win, int button, int action, int mods) {
  (void)mods;
  if (button != GLFW_MOUSE_BUTTON_LEFT) {
    return;
  }

  auto *ctx = static_cast<InputCtx *>(glfwGetWindowUserPointer(win));
  if (!ctx || !ctx->window) {
    return;
  }

  double xpos = 0.0;
  double ypos = 0.0;
  glfwGetCursorPos(win, &xpos, &ypos);
  const auto p = framebuffer_point(win, xpos, ypos);

  auto pointer = ctx->window->pointer_context();
  pointer.event = action == GLFW_PRESS ? PointerEventKind::LeftMouseDown
                                       : PointerEventKind::LeftMouseUp;
  ctx->window->set_pointer_context(std::move(pointer));

  if (action != GLFW_PRESS) {
    return;
  }
  if (auto *hit = ctx->registry->view_at_window_point(*ctx->window, p)) {
    spdlog::info("click ({:.0f},{:.0f}) -> {}", p.x, p.y, hit->debug_name());
  }
}

static void key_cb(GLFWwindow *win, int key, int scancode, int action,
                   int mods) {
  (void)scancode;
  (void)mods;
  if (action != GLFW_PRESS) {
    return;
  }
  auto *ctx = static_cast<InputCtx *>(glfwGetWindowUserPointer(win));
  if (!ctx || !ctx->state || !ctx->store) {
    return;
  }
  auto &panes = ctx->state->panes;
  if (key == GLFW_KEY_S) {
    const auto name = "shell-" + std::to_string(ctx->next_pane++);
    ctx->store->open(name)->submit("echo " + name);
    panes.push_back(name);
  } else if (key == GLFW_KEY_W && panes.size() > 1) {
    const auto name = panes.back();
    panes.pop_back();
    ctx->store->close(name);
  } else if (key == GLFW_KEY_O) {
    ctx->state->vertical = !ctx->state->vertical;
  } else if (key == GLFW_KEY_B) {
    ctx->state->sidebar_visible = !ctx->state->sidebar_visible;
  }
}

int main() {
  spdlog::cfg::load_env_levels();

  if (!glfwInit()) {
    spdlog::error("glfwInit failed");
    return 1;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);

  GLFWwindow *win =
      glfwCreateWindow(960, 600, "harbor_gpu_demo (OpenGL)", nullptr, nullptr);
  if (!win) {
    spdlog::error("glfwCreateWindow failed");
    glfwTerminate();
    return 1;
  }

  glfwMakeContextCurrent(win);
  glfwSwapInterval(1);

  int fbw0 = 0;
  int fbh0 = 0;
  glfwGetFramebufferSize(win, &fbw0, &fbh0);
  float xscale = 1.0f;
  float yscale = 1.0f;
  glfwGetWindowContentScale(win, &xscale, &yscale);

  auto &loop = RunLoop::main();
  auto window = Window::create(
      SizeF{static_cast<float>(std::max(1, fbw0)),
            static_cast<float>(std::max(1, fbh0))},
      xscale);

  TerminalStore store;
  auto &registry = PortalRegistry::shared();
  SceneMount mount{window, registry, store.resolver()};

  WorkspaceState state;
  state.panes.push_back("shell-1");
  store.open("shell-1")->submit("help");

  InputCtx input;
  input.window = window.get();
  input.registry = &registry;
  input.store = &store;
  input.state = &state;
  glfwSetWindowUserPointer(win, &input);
  glfwSetCursorPosCallback(win, cursor_pos_cb);
  glfwSetMouseButtonCallback(win, mouse_button_cb);
  glfwSetKeyCallback(win, key_cb);

  {
    GlyphCache glyphs;

    int last_fbw = fbw0;
    int last_fbh = fbh0;

    while (!glfwWindowShouldClose(win)) {
      glfwPollEvents();

      int fbw = 0;
      int fbh = 0;
      glfwGetFramebufferSize(win, &fbw, &fbh);
      fbw = std::max(1, fbw);
      fbh = std::max(1, fbh);

      if (fbw != last_fbw || fbh != last_fbh) {
        window->begin_live_resize();
        window->set_content_size(
            SizeF{static_cast<float>(fbw), static_cast<float>(fbh)});
        window->end_live_resize();
        last_fbw = fbw;
        last_fbh = fbh;
      }

      mount.render(workspace_view(state));
      loop.run_until_idle();

      gl_set_ortho(fbw, fbh);
      glDisable(GL_DEPTH_TEST);
      glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
      glClear(GL_COLOR_BUFFER_BIT);

      GLRenderer renderer;
      renderer.vh = fbh;
      renderer.glyphs = &glyphs;
      render_with(renderer,
                  compose_frame(mount.chrome_ops(), registry.portal_for(*window)));
      glDisable(GL_SCISSOR_TEST);

      glfwSwapBuffers(win);
    }
  }

  window->close();
  glfwDestroyWindow(win);
  glfwTerminate();
  return 0;
}

#endif
