#pragma once

#include <ripple/ui/runtime.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ripple::ui::examples {

struct TodoItem {
  std::int64_t id{};
  std::string title;
  bool done{};
};

struct TodoState {
  std::vector<TodoItem> items;
  std::int64_t next_id{1};
  std::string filter{"all"};
};

inline std::int64_t payload_int(const Message &m) {
  if (const auto *i = std::get_if<std::int64_t>(&m.payload)) {
    return *i;
  }
  return 0;
}

inline std::string payload_string(const Message &m) {
  if (const auto *s = std::get_if<std::string>(&m.payload)) {
    return *s;
  }
  return {};
}

// Messages:
//   add(title)  toggle(id)  remove(id)  clear_done  filter(all|open|done)
// clear_done does not touch the list itself; it enqueues one remove per
// finished item, so the removal lands on the following frame.
inline TodoState todo_update(TodoState s, const Message &m,
                             const Enqueue &enqueue) {
  if (m.name == "add") {
    auto title = payload_string(m);
    if (title.empty()) {
      return s;
    }
    s.items.push_back(TodoItem{s.next_id++, std::move(title), false});
  } else if (m.name == "toggle") {
    const auto id = payload_int(m);
    for (auto &item : s.items) {
      if (item.id == id) {
        item.done = !item.done;
      }
    }
  } else if (m.name == "remove") {
    const auto id = payload_int(m);
    s.items.erase(std::remove_if(s.items.begin(), s.items.end(),
                                 [&](const TodoItem &item) {
                                   return item.id == id;
                                 }),
                  s.items.end());
  } else if (m.name == "clear_done") {
    for (const auto &item : s.items) {
      if (item.done) {
        enqueue(msg("remove", item.id));
      }
    }
  } else if (m.name == "filter") {
    s.filter = payload_string(m);
  }
  return s;
}

inline bool todo_visible(const TodoState &s, const TodoItem &item) {
  if (s.filter == "open") {
    return !item.done;
  }
  if (s.filter == "done") {
    return item.done;
  }
  return true;
}

inline SpecNode todo_row(const TodoItem &item) {
  const auto id = std::to_string(item.id);
  return element("li")
      .attr("layout", "row")
      .attr("class", item.done ? "done" : "open")
      .children({
          element("span").child(text(item.title)).build(),
          element("button")
              .attr("data-action", "toggle-" + id)
              .on("click", msg("toggle", item.id))
              .child(text(item.done ? "undo" : "done"))
              .build(),
          element("button")
              .attr("data-action", "remove-" + id)
              .on("click", msg("remove", item.id))
              .child(text("x"))
              .build(),
      })
      .build();
}

inline SpecNode filter_button(const TodoState &s, const std::string &name) {
  auto b = element("button")
               .attr("data-action", "filter-" + name)
               .on("click", msg("filter", name))
               .child(text(name));
  if (s.filter == name) {
    b.attr("class", "selected");
  }
  return std::move(b).build();
}

inline SpecList todo_view(const TodoState &s) {
  const auto done = static_cast<std::size_t>(
      std::count_if(s.items.begin(), s.items.end(),
                    [](const TodoItem &item) { return item.done; }));
  const auto open = s.items.size() - done;

  return SpecList{
      element("h1").child(text("todos")).build(),
      element("ul")
          .children([&](SpecList &rows) {
            for (const auto &item : s.items) {
              rows.push_back(todo_visible(s, item) ? todo_row(item) : empty());
            }
          })
          .build(),
      element("footer")
          .attr("layout", "row")
          .children({
              text(std::to_string(open) + " open"),
              filter_button(s, "all"),
              filter_button(s, "open"),
              filter_button(s, "done"),
              done == 0 ? empty()
                        : element("button")
                              .attr("data-action", "clear-done")
                              .on("click", msg("clear_done"))
                              .child(text("clear done"))
                              .build(),
          })
          .build(),
  };
}

} // namespace ripple::ui::examples
