#pragma once

#include <harbor/ui/geometry.hpp>
#include <harbor/ui/signal.hpp>
#include <harbor/ui/view.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace harbor::ui {

enum class PointerEventKind : std::uint8_t {
  None,
  CursorUpdate,
  MouseMoved,
  LeftMouseDown,
  LeftMouseUp,
  LeftMouseDragged,
  RightMouseDragged,
  OtherMouseDragged,
  Periodic,
  ApplicationDefined,
};

// What the input layer is currently delivering. Hit testing consults it the
// way a native toolkit consults its "current event" and drag pasteboard.
struct PointerContext {
  PointerEventKind event{PointerEventKind::None};
  std::vector<std::string> drag_types;
};

class Window : public std::enable_shared_from_this<Window> {
  struct Passkey {};

public:
  Window(Passkey, SizeF content_size, float backing_scale)
      : id_{next_window_id().fetch_add(1, std::memory_order_relaxed)},
        backing_scale_{backing_scale},
        container_{std::make_shared<View>(
            RectF{0.0f, 0.0f, content_size.w, content_size.h})},
        content_view_{std::make_shared<View>(
            RectF{0.0f, 0.0f, content_size.w, content_size.h})} {
    container_->attached_window_ = this;
    container_->set_debug_name("container");
    content_view_->set_debug_name("content");
    content_view_->set_autoresizes(true);
    container_->add_subview(content_view_);
  }

  Window(const Window &) = delete;
  Window &operator=(const Window &) = delete;

  ~Window() { container_->attached_window_ = nullptr; }

  static std::shared_ptr<Window> create(SizeF content_size,
                                        float backing_scale = 1.0f) {
    return std::make_shared<Window>(Passkey{}, content_size, backing_scale);
  }

  WindowId id() const { return id_; }

  View &container() { return *container_; }
  const View &container() const { return *container_; }

  View &content_view() { return *content_view_; }
  const View &content_view() const { return *content_view_; }
  const View::Ptr &content_view_ptr() const { return content_view_; }

  View *chrome_overlay() const { return chrome_overlay_.get(); }

  // Chrome that must stay above everything else in the container (drop
  // targets, drag forwarding).
  void set_chrome_overlay(View::Ptr overlay) {
    if (chrome_overlay_) {
      chrome_overlay_->remove_from_superview();
    }
    chrome_overlay_ = std::move(overlay);
    if (chrome_overlay_) {
      chrome_overlay_->set_autoresizes(true);
      container_->add_subview(chrome_overlay_);
    }
  }

  float backing_scale_factor() const { return backing_scale_; }
  void set_backing_scale_factor(float scale) { backing_scale_ = scale; }

  SizeF content_size() const { return container_->frame().size(); }

  void set_content_size(SizeF size) {
    container_->set_frame(RectF{0.0f, 0.0f, size.w, size.h});
    did_resize_.notify();
  }

  bool in_live_resize() const { return in_live_resize_; }

  void begin_live_resize() { in_live_resize_ = true; }

  void end_live_resize() {
    if (!in_live_resize_) {
      return;
    }
    in_live_resize_ = false;
    did_end_live_resize_.notify();
  }

  bool closed() const { return closed_; }

  void close() {
    if (closed_) {
      return;
    }
    closed_ = true;
    will_close_.notify();
  }

  const PointerContext &pointer_context() const { return pointer_context_; }
  void set_pointer_context(PointerContext ctx) {
    pointer_context_ = std::move(ctx);
  }

  void notify_split_view_resized() { split_view_did_resize_.notify(); }

  Signal &did_resize() { return did_resize_; }
  Signal &did_end_live_resize() { return did_end_live_resize_; }
  Signal &split_view_did_resize() { return split_view_did_resize_; }
  Signal &will_close() { return will_close_; }

private:
  static std::atomic<WindowId> &next_window_id() {
    static std::atomic<WindowId> id{1};
    return id;
  }

  WindowId id_{};
  float backing_scale_{1.0f};
  bool in_live_resize_{false};
  bool closed_{false};
  PointerContext pointer_context_{};
  View::Ptr container_;
  View::Ptr content_view_;
  View::Ptr chrome_overlay_;
  Signal did_resize_;
  Signal did_end_live_resize_;
  Signal split_view_did_resize_;
  Signal will_close_;
};

} // namespace harbor::ui
