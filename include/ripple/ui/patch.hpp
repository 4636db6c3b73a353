#pragma once

#include <ripple/ui/backend.hpp>
#include <ripple/ui/edit_script.hpp>
#include <ripple/ui/spec.hpp>

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ripple::ui {

// Raised when an edit script no longer describes the live tree it is applied
// to. The previous spec and the live tree have diverged; nothing is retried.
class StructuralInvariantViolation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

using Enqueue = std::function<void(Message)>;

namespace detail {
template <typename> inline constexpr bool always_false_v = false;
} // namespace detail

inline void bind_listener(Backend &backend, const Enqueue &enqueue,
                          NodeHandle node, const std::string &event,
                          Message message) {
  backend.add_listener(node, event,
                       [enqueue, message = std::move(message)]() {
                         enqueue(message);
                       });
}

inline NodeHandle create_node(Backend &backend, const Enqueue &enqueue,
                              const SpecNode &spec) {
  if (const auto *t = spec.text()) {
    return backend.create_text(t->content);
  }
  const auto *el = spec.element();
  if (!el) {
    throw StructuralInvariantViolation{"cannot create a live node for Empty"};
  }

  const auto node = backend.create_element(el->tag);
  for (const auto &kv : el->attributes) {
    if (!event_name(kv.first)) {
      backend.set_attribute(node, kv.first, attribute_text(kv.second));
    }
  }
  for (auto &kv : event_listeners(el->attributes)) {
    bind_listener(backend, enqueue, node, kv.first, std::move(kv.second));
  }

  for (const auto &child : el->children) {
    if (child.is_empty()) {
      continue;
    }
    backend.append_child(node, create_node(backend, enqueue, child));
  }
  return node;
}

inline void apply_diff(Backend &backend, const Enqueue &enqueue,
                       NodeHandle parent,
                       const std::vector<EditScript> &scripts);

inline void apply_contents_edit(Backend &backend, const Enqueue &enqueue,
                                NodeHandle node, const ContentsEdit &edit) {
  for (const auto &kv : edit.remove_listeners) {
    backend.remove_listener(node, kv.first);
  }
  for (const auto &name : edit.remove_attr) {
    backend.remove_attribute(node, name);
  }
  for (const auto &kv : edit.set_attr) {
    backend.set_attribute(node, kv.first, kv.second);
  }
  for (const auto &kv : edit.add_listeners) {
    bind_listener(backend, enqueue, node, kv.first, kv.second);
  }
  apply_diff(backend, enqueue, node, edit.children);
}

// Walks the live children of `parent` in lockstep with `scripts`. The cursor
// does not advance over a Remove because the live list shrinks under it.
inline void apply_diff(Backend &backend, const Enqueue &enqueue,
                       NodeHandle parent,
                       const std::vector<EditScript> &scripts) {
  auto live = backend.children(parent);
  if (scripts.size() < live.size()) {
    throw StructuralInvariantViolation{
        "unmatched children lengths: " + std::to_string(scripts.size()) +
        " edits for " + std::to_string(live.size()) + " live children"};
  }

  auto require_live = [&](std::size_t cursor, const char *what) {
    if (cursor >= live.size()) {
      throw StructuralInvariantViolation{
          std::string{what} + " past the live children: " +
          std::to_string(cursor) + " " + std::to_string(live.size())};
    }
  };

  std::size_t cursor = 0;
  for (const auto &script : scripts) {
    if (script.kind.valueless_by_exception()) {
      throw StructuralInvariantViolation{"unexpected edit script variant"};
    }
    std::visit(
        [&](const auto &op) {
          using T = std::decay_t<decltype(op)>;
          if constexpr (std::is_same_v<T, Noop>) {
            require_live(cursor, "Noop");
            ++cursor;
          } else if constexpr (std::is_same_v<T, Remove>) {
            require_live(cursor, "Remove");
            backend.remove(live[cursor]);
            live.erase(live.begin() + static_cast<std::ptrdiff_t>(cursor));
          } else if constexpr (std::is_same_v<T, Create>) {
            if (cursor < live.size()) {
              throw StructuralInvariantViolation{
                  "adding in the middle of children: " +
                  std::to_string(cursor) + " " + std::to_string(live.size())};
            }
            const auto child = create_node(backend, enqueue, op.node);
            backend.append_child(parent, child);
            live.push_back(child);
            ++cursor;
          } else if constexpr (std::is_same_v<T, Replace>) {
            require_live(cursor, "Replace");
            const auto child = create_node(backend, enqueue, op.node);
            backend.replace_child(parent, live[cursor], child);
            live[cursor] = child;
            ++cursor;
          } else if constexpr (std::is_same_v<T, Modify>) {
            require_live(cursor, "Modify");
            apply_contents_edit(backend, enqueue, live[cursor], op.edit);
            ++cursor;
          } else {
            static_assert(detail::always_false_v<T>,
                          "unhandled edit script variant");
          }
        },
        script.kind);
  }
}

} // namespace ripple::ui
