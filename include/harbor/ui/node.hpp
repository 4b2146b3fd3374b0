#pragma once

#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace harbor::ui {

using NodeId = std::uint64_t;

using PropValue = std::variant<std::string, std::int64_t, double, bool>;

using Props = std::unordered_map<std::string, PropValue>;

// Declarative description of one frame of UI. Every build gets fresh ids,
// so nothing downstream may rely on a node surviving a re-render.
struct ViewNode {
  NodeId id{};
  std::string key;
  std::string type;
  Props props;
  std::vector<ViewNode> children;
};

namespace detail {
inline std::atomic<NodeId> next_node_id{1};
} // namespace detail

class ViewBuilder {
public:
  explicit ViewBuilder(std::string type)
      : node_{allocate_id(), {}, std::move(type), {}, {}} {}

  ViewBuilder &key(std::string k) {
    node_.key = std::move(k);
    return *this;
  }

  ViewBuilder &prop(std::string key, std::string value) {
    node_.props.insert_or_assign(std::move(key), PropValue{std::move(value)});
    return *this;
  }

  ViewBuilder &prop(std::string key, const char *value) {
    return prop(std::move(key), std::string{value});
  }

  ViewBuilder &prop(std::string key, std::int64_t value) {
    node_.props.insert_or_assign(std::move(key), PropValue{value});
    return *this;
  }

  ViewBuilder &prop(std::string key, double value) {
    node_.props.insert_or_assign(std::move(key), PropValue{value});
    return *this;
  }

  ViewBuilder &prop(std::string key, bool value) {
    node_.props.insert_or_assign(std::move(key), PropValue{value});
    return *this;
  }

  template <typename Int,
            typename = std::enable_if_t<
                std::is_integral_v<std::remove_reference_t<Int>> &&
                !std::is_same_v<std::remove_reference_t<Int>, bool> &&
                !std::is_same_v<std::remove_reference_t<Int>, std::int64_t>>>
  ViewBuilder &prop(std::string key, Int value) {
    return prop(std::move(key), static_cast<std::int64_t>(value));
  }

  ViewBuilder &children(std::initializer_list<ViewNode> nodes) {
    node_.children.assign(nodes.begin(), nodes.end());
    return *this;
  }

  ViewBuilder &children(std::vector<ViewNode> nodes) {
    node_.children = std::move(nodes);
    return *this;
  }

  ViewNode build() const & { return node_; }

  ViewNode build() && { return std::move(node_); }

private:
  static NodeId allocate_id() {
    return detail::next_node_id.fetch_add(1, std::memory_order_relaxed);
  }

  ViewNode node_;
};

inline ViewBuilder view(std::string type) {
  return ViewBuilder{std::move(type)};
}

inline ViewNode Text(std::string value) {
  auto b = view("Text");
  b.prop("value", std::move(value));
  return std::move(b).build();
}

inline ViewNode Column(std::initializer_list<ViewNode> children) {
  auto b = view("Column");
  b.children(children);
  return std::move(b).build();
}

inline ViewNode Row(std::initializer_list<ViewNode> children) {
  auto b = view("Row");
  b.children(children);
  return std::move(b).build();
}

inline ViewNode ScrollView(std::initializer_list<ViewNode> children) {
  auto b = view("ScrollView");
  b.prop("clip", true);
  b.children(children);
  return std::move(b).build();
}

inline ViewNode Sidebar(float width, std::initializer_list<ViewNode> children) {
  auto b = view("Sidebar");
  b.prop("width", static_cast<double>(width));
  b.children(children);
  return std::move(b).build();
}

// Panes side by side when `vertical` (vertical dividers), stacked otherwise.
// A child's "weight" prop sets its share of the extent.
inline ViewNode Split(bool vertical, std::vector<ViewNode> panes) {
  auto b = view("Split");
  b.prop("vertical", vertical);
  b.children(std::move(panes));
  return std::move(b).build();
}

// Placeholder for an externally owned surface. The surface is looked up by
// `surface_key` when the tree is mounted.
inline ViewNode PortalAnchor(std::string surface_key, bool visible = true,
                             int z_priority = 0) {
  auto b = view("PortalAnchor");
  b.key(surface_key);
  b.prop("surface", std::move(surface_key));
  b.prop("visible", visible);
  b.prop("z", z_priority);
  return std::move(b).build();
}

inline void dump_tree(std::ostream &os, const ViewNode &node,
                      int indent_spaces = 0) {
  for (int i = 0; i < indent_spaces; ++i) {
    os.put(' ');
  }

  os << node.type << "#" << node.id;
  if (!node.key.empty()) {
    os << " key=" << node.key;
  }

  if (!node.props.empty()) {
    os << " {";
    bool first = true;
    for (const auto &kv : node.props) {
      if (!std::exchange(first, false)) {
        os << ", ";
      }
      os << kv.first << ": ";
      std::visit([&](const auto &v) { os << v; }, kv.second);
    }
    os << "}";
  }

  os << "\n";

  for (const auto &child : node.children) {
    dump_tree(os, child, indent_spaces + 2);
  }
}

} // namespace harbor::ui
