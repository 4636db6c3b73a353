#pragma once

#include <ripple/ui/backend.hpp>
#include <ripple/ui/spec.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ripple::ui {

// Retained node tree kept in memory. Used headless (tests, console demo) and
// as the scene the GL demo draws from.
class MemoryBackend final : public Backend {
public:
  NodeHandle create_root(const std::string &tag) { return create_element(tag); }

  NodeHandle create_element(const std::string &tag) override {
    ++mutations_;
    const auto id = next_id_++;
    Node n;
    n.tag = tag;
    nodes_.emplace(id, std::move(n));
    return id;
  }

  NodeHandle create_text(const std::string &content) override {
    ++mutations_;
    const auto id = next_id_++;
    Node n;
    n.is_text = true;
    n.content = content;
    nodes_.emplace(id, std::move(n));
    return id;
  }

  std::optional<std::string> get_attribute(NodeHandle node,
                                           const std::string &name) override {
    const auto &n = element_at(node);
    const auto it = n.attributes.find(name);
    if (it == n.attributes.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void set_attribute(NodeHandle node, const std::string &name,
                     const std::string &value) override {
    ++mutations_;
    element_at(node).attributes.insert_or_assign(name, value);
  }

  void remove_attribute(NodeHandle node, const std::string &name) override {
    ++mutations_;
    element_at(node).attributes.erase(name);
  }

  void add_listener(NodeHandle node, const std::string &event,
                    Listener listener) override {
    ++mutations_;
    element_at(node).listeners.insert_or_assign(event, std::move(listener));
  }

  void remove_listener(NodeHandle node, const std::string &event) override {
    ++mutations_;
    element_at(node).listeners.erase(event);
  }

  std::vector<NodeHandle> children(NodeHandle node) override {
    return at(node).children;
  }

  void append_child(NodeHandle parent, NodeHandle child) override {
    ++mutations_;
    auto &p = element_at(parent);
    auto &c = detached_at(child);
    c.parent = parent;
    p.children.push_back(child);
  }

  void replace_child(NodeHandle parent, NodeHandle old_child,
                     NodeHandle new_child) override {
    ++mutations_;
    auto &p = element_at(parent);
    const auto it = std::find(p.children.begin(), p.children.end(), old_child);
    if (it == p.children.end()) {
      throw std::logic_error{"replace_child: node " +
                             std::to_string(old_child) + " is not a child of " +
                             std::to_string(parent)};
    }
    auto &c = detached_at(new_child);
    c.parent = parent;
    *it = new_child;
    erase_subtree(old_child);
  }

  void remove(NodeHandle node) override {
    ++mutations_;
    auto &n = at(node);
    if (n.parent != kNoNode) {
      auto &siblings = at(n.parent).children;
      siblings.erase(std::remove(siblings.begin(), siblings.end(), node),
                     siblings.end());
    }
    erase_subtree(node);
  }

  // Fires the listener bound for `event`, if any.
  bool dispatch(NodeHandle node, const std::string &event) {
    const auto &n = element_at(node);
    const auto it = n.listeners.find(event);
    if (it == n.listeners.end() || !it->second) {
      return false;
    }
    auto listener = it->second;
    listener();
    return true;
  }

  bool contains(NodeHandle node) const { return nodes_.contains(node); }

  bool is_text(NodeHandle node) const { return at(node).is_text; }

  const std::string &tag(NodeHandle node) const { return element_at(node).tag; }

  const std::string &text(NodeHandle node) const {
    const auto &n = at(node);
    if (!n.is_text) {
      throw std::logic_error{"node " + std::to_string(node) +
                             " is not a text node"};
    }
    return n.content;
  }

  NodeHandle parent(NodeHandle node) const { return at(node).parent; }

  const std::vector<NodeHandle> &child_list(NodeHandle node) const {
    return at(node).children;
  }

  const std::map<std::string, std::string> &
  attributes(NodeHandle node) const {
    return element_at(node).attributes;
  }

  std::vector<std::string> listener_events(NodeHandle node) const {
    std::vector<std::string> out;
    for (const auto &kv : element_at(node).listeners) {
      out.push_back(kv.first);
    }
    return out;
  }

  std::string text_content(NodeHandle node) const {
    const auto &n = at(node);
    if (n.is_text) {
      return n.content;
    }
    std::string out;
    for (const auto child : n.children) {
      out += text_content(child);
    }
    return out;
  }

  // Depth-first search for the first element whose `name` attribute equals
  // `value`.
  std::optional<NodeHandle> find_attribute(NodeHandle root,
                                           const std::string &name,
                                           const std::string &value) const {
    const auto &n = at(root);
    if (n.is_text) {
      return std::nullopt;
    }
    if (const auto it = n.attributes.find(name);
        it != n.attributes.end() && it->second == value) {
      return root;
    }
    for (const auto child : n.children) {
      if (auto found = find_attribute(child, name, value)) {
        return found;
      }
    }
    return std::nullopt;
  }

  std::size_t node_count() const { return nodes_.size(); }

  std::uint64_t mutation_count() const { return mutations_; }

  void dump(std::ostream &os, NodeHandle node, int indent_spaces = 0) const {
    for (int i = 0; i < indent_spaces; ++i) {
      os.put(' ');
    }
    const auto &n = at(node);
    if (n.is_text) {
      dump_quoted(os, n.content);
      os << "\n";
      return;
    }

    os << n.tag << "#" << node;
    if (!n.attributes.empty()) {
      os << " {";
      bool first = true;
      for (const auto &kv : n.attributes) {
        if (!std::exchange(first, false)) {
          os << ", ";
        }
        os << kv.first << ": " << kv.second;
      }
      os << "}";
    }
    for (const auto &kv : n.listeners) {
      os << " [" << kv.first << "]";
    }
    os << "\n";

    for (const auto child : n.children) {
      dump(os, child, indent_spaces + 2);
    }
  }

private:
  struct Node {
    bool is_text{};
    std::string tag;
    std::string content;
    std::map<std::string, std::string> attributes;
    std::map<std::string, Listener> listeners;
    std::vector<NodeHandle> children;
    NodeHandle parent{kNoNode};
  };

  Node &at(NodeHandle node) {
    const auto it = nodes_.find(node);
    if (it == nodes_.end()) {
      throw std::invalid_argument{"unknown node " + std::to_string(node)};
    }
    return it->second;
  }

  const Node &at(NodeHandle node) const {
    const auto it = nodes_.find(node);
    if (it == nodes_.end()) {
      throw std::invalid_argument{"unknown node " + std::to_string(node)};
    }
    return it->second;
  }

  Node &element_at(NodeHandle node) {
    auto &n = at(node);
    if (n.is_text) {
      throw std::logic_error{"node " + std::to_string(node) +
                             " is a text node"};
    }
    return n;
  }

  const Node &element_at(NodeHandle node) const {
    const auto &n = at(node);
    if (n.is_text) {
      throw std::logic_error{"node " + std::to_string(node) +
                             " is a text node"};
    }
    return n;
  }

  Node &detached_at(NodeHandle node) {
    auto &n = at(node);
    if (n.parent != kNoNode) {
      throw std::logic_error{"node " + std::to_string(node) +
                             " already has a parent"};
    }
    return n;
  }

  void erase_subtree(NodeHandle node) {
    const auto it = nodes_.find(node);
    if (it == nodes_.end()) {
      return;
    }
    const auto kids = std::move(it->second.children);
    nodes_.erase(it);
    for (const auto child : kids) {
      erase_subtree(child);
    }
  }

  std::unordered_map<NodeHandle, Node> nodes_;
  NodeHandle next_id_{1};
  std::uint64_t mutations_{};
};

} // namespace ripple::ui
