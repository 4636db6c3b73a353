#pragma once

#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ripple::ui {

using PropValue = std::variant<std::string, std::int64_t, double, bool>;

// A message is what a listener hands to enqueue(). Listener rebinding is
// decided by comparing messages by value, so callers build them from stable
// data (a name plus a payload), never from per-render closures.
struct Message {
  std::string name;
  PropValue payload{};

  bool operator==(const Message &) const = default;
};

inline Message msg(std::string name) { return Message{std::move(name), {}}; }

inline Message msg(std::string name, std::string payload) {
  return Message{std::move(name), PropValue{std::move(payload)}};
}

inline Message msg(std::string name, const char *payload) {
  return msg(std::move(name), std::string{payload});
}

inline Message msg(std::string name, std::int64_t payload) {
  return Message{std::move(name), PropValue{payload}};
}

inline Message msg(std::string name, double payload) {
  return Message{std::move(name), PropValue{payload}};
}

inline Message msg(std::string name, bool payload) {
  return Message{std::move(name), PropValue{payload}};
}

template <typename Int,
          typename = std::enable_if_t<
              std::is_integral_v<std::remove_reference_t<Int>> &&
              !std::is_same_v<std::remove_reference_t<Int>, bool> &&
              !std::is_same_v<std::remove_reference_t<Int>, std::int64_t>>>
Message msg(std::string name, Int payload) {
  return msg(std::move(name), static_cast<std::int64_t>(payload));
}

using AttrValue = std::variant<std::string, Message>;

using Attributes = std::map<std::string, AttrValue>;

struct SpecNode;

using SpecList = std::vector<SpecNode>;

struct Element {
  std::string tag;
  Attributes attributes;
  SpecList children;
};

struct Text {
  std::string content;
};

struct Empty {};

struct SpecNode {
  using Kind = std::variant<Element, Text, Empty>;

  Kind kind;

  bool is_element() const { return std::holds_alternative<Element>(kind); }
  bool is_text() const { return std::holds_alternative<Text>(kind); }
  bool is_empty() const { return std::holds_alternative<Empty>(kind); }

  const Element *element() const { return std::get_if<Element>(&kind); }
  const Text *text() const { return std::get_if<Text>(&kind); }
};

inline bool operator==(const Text &a, const Text &b) {
  return a.content == b.content;
}

inline bool operator==(const Empty &, const Empty &) { return true; }

inline bool operator==(const Element &a, const Element &b);

inline bool operator==(const SpecNode &a, const SpecNode &b) {
  return a.kind == b.kind;
}

inline bool operator==(const Element &a, const Element &b) {
  return a.tag == b.tag && a.attributes == b.attributes &&
         a.children == b.children;
}

inline constexpr std::string_view kEventPrefix = "on";

// "onClick" -> "click". Keys without a name after the prefix are plain
// attributes.
inline std::optional<std::string> event_name(std::string_view key) {
  if (key.size() <= kEventPrefix.size() ||
      key.substr(0, kEventPrefix.size()) != kEventPrefix) {
    return std::nullopt;
  }
  std::string out{key.substr(kEventPrefix.size())};
  for (auto &ch : out) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return out;
}

inline Message message_of(const AttrValue &value) {
  if (const auto *m = std::get_if<Message>(&value)) {
    return *m;
  }
  return Message{std::get<std::string>(value), {}};
}

inline std::string attribute_text(const AttrValue &value) {
  if (const auto *s = std::get_if<std::string>(&value)) {
    return *s;
  }
  return std::get<Message>(value).name;
}

// One message per event. Several keys can name the same event ("onClick",
// "onclick"); the last one in key order wins.
inline std::map<std::string, Message> event_listeners(const Attributes &attrs) {
  std::map<std::string, Message> out;
  for (const auto &kv : attrs) {
    if (auto event = event_name(kv.first)) {
      out.insert_or_assign(std::move(*event), message_of(kv.second));
    }
  }
  return out;
}

inline SpecNode h(std::string tag, Attributes attributes = {},
                  SpecList children = {}) {
  return SpecNode{Element{std::move(tag), std::move(attributes),
                          std::move(children)}};
}

inline SpecNode text(std::string content) {
  return SpecNode{Text{std::move(content)}};
}

inline SpecNode empty() { return SpecNode{Empty{}}; }

class ElementBuilder {
public:
  explicit ElementBuilder(std::string tag) : node_{std::move(tag), {}, {}} {}

  ElementBuilder &attr(std::string name, std::string value) {
    node_.attributes.insert_or_assign(std::move(name),
                                      AttrValue{std::move(value)});
    return *this;
  }

  ElementBuilder &attr(std::string name, const char *value) {
    return attr(std::move(name), std::string{value});
  }

  template <typename Int,
            typename = std::enable_if_t<
                std::is_integral_v<std::remove_reference_t<Int>> &&
                !std::is_same_v<std::remove_reference_t<Int>, bool>>>
  ElementBuilder &attr(std::string name, Int value) {
    return attr(std::move(name), std::to_string(value));
  }

  ElementBuilder &on(std::string_view event, Message message) {
    std::string key{kEventPrefix};
    key.append(event);
    node_.attributes.insert_or_assign(std::move(key),
                                      AttrValue{std::move(message)});
    return *this;
  }

  ElementBuilder &child(SpecNode node) {
    node_.children.push_back(std::move(node));
    return *this;
  }

  ElementBuilder &children(std::initializer_list<SpecNode> nodes) {
    node_.children.insert(node_.children.end(), nodes.begin(), nodes.end());
    return *this;
  }

  template <typename F, typename = std::enable_if_t<
                            std::is_invocable_v<F &, SpecList &>>>
  ElementBuilder &children(F &&fn) {
    fn(node_.children);
    return *this;
  }

  SpecNode build() const & { return SpecNode{node_}; }

  SpecNode build() && { return SpecNode{std::move(node_)}; }

private:
  Element node_;
};

inline ElementBuilder element(std::string tag) {
  return ElementBuilder{std::move(tag)};
}

inline void dump_prop_value(std::ostream &os, const PropValue &value) {
  std::visit(
      [&](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          os << '"' << v << '"';
        } else if constexpr (std::is_same_v<T, bool>) {
          os << (v ? "true" : "false");
        } else {
          os << v;
        }
      },
      value);
}

inline void dump_message(std::ostream &os, const Message &m) {
  os << m.name << "(";
  dump_prop_value(os, m.payload);
  os << ")";
}

// Writes `text` in double quotes, escaping quotes, backslashes and control
// characters so each dumped node stays on one line.
inline void dump_quoted(std::ostream &os, std::string_view text) {
  os << '"';
  for (const char ch : text) {
    switch (ch) {
    case '"':
      os << "\\\"";
      break;
    case '\\':
      os << "\\\\";
      break;
    case '\n':
      os << "\\n";
      break;
    case '\t':
      os << "\\t";
      break;
    case '\r':
      os << "\\r";
      break;
    default:
      os << ch;
    }
  }
  os << '"';
}

inline void dump_spec(std::ostream &os, const SpecNode &node,
                      int indent_spaces = 0) {
  for (int i = 0; i < indent_spaces; ++i) {
    os.put(' ');
  }

  if (const auto *t = node.text()) {
    dump_quoted(os, t->content);
    os << "\n";
    return;
  }
  if (node.is_empty()) {
    os << "<empty>\n";
    return;
  }

  const auto &el = *node.element();
  os << el.tag;
  if (!el.attributes.empty()) {
    os << " {";
    bool first = true;
    for (const auto &kv : el.attributes) {
      if (!std::exchange(first, false)) {
        os << ", ";
      }
      os << kv.first << ": ";
      if (const auto *m = std::get_if<Message>(&kv.second)) {
        dump_message(os, *m);
      } else {
        os << std::get<std::string>(kv.second);
      }
    }
    os << "}";
  }
  os << "\n";

  for (const auto &child : el.children) {
    dump_spec(os, child, indent_spaces + 2);
  }
}

inline void dump_spec(std::ostream &os, const SpecList &nodes,
                      int indent_spaces = 0) {
  for (const auto &node : nodes) {
    dump_spec(os, node, indent_spaces);
  }
}

} // namespace ripple::ui
