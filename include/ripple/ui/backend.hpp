#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ripple::ui {

using NodeHandle = std::uint64_t;

inline constexpr NodeHandle kNoNode = 0;

// The only surface the patcher touches. A backend owns its live nodes and
// hands out opaque handles to them.
struct Backend {
  using Listener = std::function<void()>;

  virtual ~Backend() = default;

  virtual NodeHandle create_element(const std::string &tag) = 0;
  virtual NodeHandle create_text(const std::string &content) = 0;

  virtual std::optional<std::string> get_attribute(NodeHandle node,
                                                   const std::string &name) = 0;
  virtual void set_attribute(NodeHandle node, const std::string &name,
                             const std::string &value) = 0;
  virtual void remove_attribute(NodeHandle node, const std::string &name) = 0;

  // At most one listener per event; adding replaces the previous one.
  virtual void add_listener(NodeHandle node, const std::string &event,
                            Listener listener) = 0;
  virtual void remove_listener(NodeHandle node, const std::string &event) = 0;

  virtual std::vector<NodeHandle> children(NodeHandle node) = 0;
  virtual void append_child(NodeHandle parent, NodeHandle child) = 0;
  virtual void replace_child(NodeHandle parent, NodeHandle old_child,
                             NodeHandle new_child) = 0;
  virtual void remove(NodeHandle node) = 0;
};

} // namespace ripple::ui
