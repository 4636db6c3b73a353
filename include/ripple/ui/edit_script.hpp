#pragma once

#include <ripple/ui/spec.hpp>

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ripple::ui {

struct EditScript;

struct ContentsEdit {
  std::vector<std::string> remove_attr;
  std::map<std::string, std::string> set_attr;
  // nullopt when no listener was bound for the event before.
  std::map<std::string, std::optional<Message>> remove_listeners;
  std::map<std::string, Message> add_listeners;
  std::vector<EditScript> children;

  bool has_attribute_delta() const {
    return !remove_attr.empty() || !set_attr.empty() ||
           !remove_listeners.empty() || !add_listeners.empty();
  }
};

struct Noop {};

struct Replace {
  SpecNode node;
};

struct Remove {};

struct Create {
  SpecNode node;
};

struct Modify {
  ContentsEdit edit;
};

struct EditScript {
  using Kind = std::variant<Noop, Replace, Remove, Create, Modify>;

  Kind kind;
};

inline bool operator==(const Noop &, const Noop &) { return true; }

inline bool operator==(const Remove &, const Remove &) { return true; }

inline bool operator==(const Replace &a, const Replace &b) {
  return a.node == b.node;
}

inline bool operator==(const Create &a, const Create &b) {
  return a.node == b.node;
}

inline bool operator==(const ContentsEdit &a, const ContentsEdit &b);

inline bool operator==(const Modify &a, const Modify &b) {
  return a.edit == b.edit;
}

inline bool operator==(const EditScript &a, const EditScript &b) {
  return a.kind == b.kind;
}

inline bool operator==(const ContentsEdit &a, const ContentsEdit &b) {
  return a.remove_attr == b.remove_attr && a.set_attr == b.set_attr &&
         a.remove_listeners == b.remove_listeners &&
         a.add_listeners == b.add_listeners && a.children == b.children;
}

inline bool is_noop(const EditScript &script) {
  return std::holds_alternative<Noop>(script.kind);
}

inline bool all_noop(const std::vector<EditScript> &scripts) {
  return std::all_of(scripts.begin(), scripts.end(),
                     [](const EditScript &s) { return is_noop(s); });
}

inline const char *edit_kind_name(const EditScript &script) {
  switch (script.kind.index()) {
  case 0:
    return "Noop";
  case 1:
    return "Replace";
  case 2:
    return "Remove";
  case 3:
    return "Create";
  case 4:
    return "Modify";
  default:
    return "Invalid";
  }
}

inline void dump_edit_scripts(std::ostream &os,
                              const std::vector<EditScript> &scripts,
                              int indent_spaces = 0);

inline void dump_edit_script(std::ostream &os, const EditScript &script,
                             std::size_t index, int indent_spaces = 0) {
  for (int i = 0; i < indent_spaces; ++i) {
    os.put(' ');
  }
  os << "@" << index << " " << edit_kind_name(script);

  if (const auto *r = std::get_if<Replace>(&script.kind)) {
    os << "\n";
    dump_spec(os, r->node, indent_spaces + 2);
    return;
  }
  if (const auto *c = std::get_if<Create>(&script.kind)) {
    os << "\n";
    dump_spec(os, c->node, indent_spaces + 2);
    return;
  }
  const auto *m = std::get_if<Modify>(&script.kind);
  if (!m) {
    os << "\n";
    return;
  }

  const auto &edit = m->edit;
  for (const auto &name : edit.remove_attr) {
    os << " -" << name;
  }
  for (const auto &kv : edit.set_attr) {
    os << " " << kv.first << "=" << kv.second;
  }
  for (const auto &kv : edit.remove_listeners) {
    os << " -on" << kv.first;
  }
  for (const auto &kv : edit.add_listeners) {
    os << " +on" << kv.first << ":";
    dump_message(os, kv.second);
  }
  os << "\n";
  dump_edit_scripts(os, edit.children, indent_spaces + 2);
}

inline void dump_edit_scripts(std::ostream &os,
                              const std::vector<EditScript> &scripts,
                              int indent_spaces) {
  for (std::size_t i = 0; i < scripts.size(); ++i) {
    if (is_noop(scripts[i])) {
      continue;
    }
    dump_edit_script(os, scripts[i], i, indent_spaces);
  }
}

} // namespace ripple::ui
