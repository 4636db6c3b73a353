#pragma once

#include <ripple/ui/edit_script.hpp>
#include <ripple/ui/spec.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ripple::ui {

inline std::vector<const SpecNode *> without_empty(const SpecList &nodes) {
  std::vector<const SpecNode *> out;
  out.reserve(nodes.size());
  for (const auto &node : nodes) {
    if (!node.is_empty()) {
      out.push_back(&node);
    }
  }
  return out;
}

inline std::vector<EditScript> diff_list(const SpecList &prev,
                                         const SpecList &next);

inline void diff_attributes(const Attributes &prev, const Attributes &next,
                            ContentsEdit &out) {
  for (const auto &kv : prev) {
    if (event_name(kv.first) || next.contains(kv.first)) {
      continue;
    }
    out.remove_attr.push_back(kv.first);
  }
  for (const auto &kv : next) {
    if (event_name(kv.first)) {
      continue;
    }
    const auto it = prev.find(kv.first);
    if (it != prev.end() && it->second == kv.second) {
      continue;
    }
    out.set_attr.insert_or_assign(kv.first, attribute_text(kv.second));
  }

  // Listeners are compared per event, after aliased keys are resolved.
  const auto prev_events = event_listeners(prev);
  const auto next_events = event_listeners(next);
  for (const auto &kv : prev_events) {
    if (!next_events.contains(kv.first)) {
      out.remove_listeners.insert_or_assign(kv.first,
                                            std::optional<Message>{kv.second});
    }
  }
  for (const auto &kv : next_events) {
    const auto it = prev_events.find(kv.first);
    if (it != prev_events.end() && it->second == kv.second) {
      continue;
    }
    std::optional<Message> old;
    if (it != prev_events.end()) {
      old = it->second;
    }
    out.remove_listeners.insert_or_assign(kv.first, std::move(old));
    out.add_listeners.insert_or_assign(kv.first, kv.second);
  }
}

inline EditScript diff_node(const SpecNode &prev, const SpecNode &next) {
  const auto *prev_el = prev.element();
  const auto *next_el = next.element();
  if (!prev_el || !next_el) {
    if (prev.kind == next.kind) {
      return EditScript{Noop{}};
    }
    return EditScript{Replace{next}};
  }

  if (prev_el->tag != next_el->tag) {
    return EditScript{Replace{next}};
  }

  ContentsEdit edit;
  diff_attributes(prev_el->attributes, next_el->attributes, edit);
  edit.children = diff_list(prev_el->children, next_el->children);

  if (!edit.has_attribute_delta() && all_noop(edit.children)) {
    return EditScript{Noop{}};
  }
  return EditScript{Modify{std::move(edit)}};
}

// Children are matched by position only. An insertion or deletion that is
// not at the tail turns every later position into Replace/Create/Remove.
inline std::vector<EditScript> diff_list(const SpecList &prev,
                                         const SpecList &next) {
  const auto ls = without_empty(prev);
  const auto rs = without_empty(next);
  const auto len = std::max(ls.size(), rs.size());

  std::vector<EditScript> out;
  out.reserve(len);
  for (std::size_t i = 0; i < len; ++i) {
    if (i >= ls.size()) {
      out.push_back(EditScript{Create{*rs[i]}});
    } else if (i >= rs.size()) {
      out.push_back(EditScript{Remove{}});
    } else {
      out.push_back(diff_node(*ls[i], *rs[i]));
    }
  }
  return out;
}

} // namespace ripple::ui
