#include <catch2/catch.hpp>

#include <ripple/ui/memory_backend.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ripple::ui;

TEST_CASE("MemoryBackend tree operations", "[memory_backend]") {
  MemoryBackend b;
  const auto root = b.create_root("body");
  const auto a = b.create_element("div");
  const auto t = b.create_text("hello");
  b.append_child(root, a);
  b.append_child(a, t);

  SECTION("Append links parent and child") {
    REQUIRE(b.children(root) == std::vector<NodeHandle>{a});
    REQUIRE(b.parent(a) == root);
    REQUIRE(b.parent(root) == kNoNode);
    REQUIRE(b.text(t) == "hello");
    REQUIRE(b.text_content(root) == "hello");
  }

  SECTION("Replace swaps in place and erases the old subtree") {
    const auto fresh = b.create_element("p");
    b.replace_child(root, a, fresh);
    REQUIRE(b.child_list(root) == std::vector<NodeHandle>{fresh});
    REQUIRE(b.parent(fresh) == root);
    REQUIRE_FALSE(b.contains(a));
    REQUIRE_FALSE(b.contains(t));
  }

  SECTION("Remove detaches and erases the subtree") {
    const auto before = b.node_count();
    b.remove(a);
    REQUIRE(b.child_list(root).empty());
    REQUIRE(b.node_count() == before - 2);
  }

  SECTION("Attributes are ordered by name") {
    b.set_attribute(a, "z", "1");
    b.set_attribute(a, "b", "2");
    b.set_attribute(a, "z", "3");
    REQUIRE(b.get_attribute(a, "z") == std::optional<std::string>{"3"});
    b.remove_attribute(a, "b");
    REQUIRE_FALSE(b.get_attribute(a, "b").has_value());
    REQUIRE(b.attributes(a) == std::map<std::string, std::string>{{"z", "3"}});
  }
}

TEST_CASE("MemoryBackend rejects malformed operations", "[memory_backend]") {
  MemoryBackend b;
  const auto root = b.create_root("body");
  const auto t = b.create_text("x");

  REQUIRE_THROWS_AS(b.children(999), std::invalid_argument);
  REQUIRE_THROWS_AS(b.set_attribute(t, "id", "x"), std::logic_error);
  REQUIRE_THROWS_AS(b.append_child(t, b.create_text("y")), std::logic_error);

  b.append_child(root, t);
  const auto other = b.create_root("aside");
  REQUIRE_THROWS_AS(b.append_child(other, t), std::logic_error);
  REQUIRE_THROWS_AS(b.replace_child(other, t, b.create_text("z")),
                    std::logic_error);
  REQUIRE_THROWS_AS(b.text(root), std::logic_error);
}

TEST_CASE("MemoryBackend listeners", "[memory_backend]") {
  MemoryBackend b;
  const auto button = b.create_element("button");
  int clicks = 0;
  b.add_listener(button, "click", [&clicks] { ++clicks; });

  REQUIRE(b.dispatch(button, "click"));
  REQUIRE(clicks == 1);
  REQUIRE_FALSE(b.dispatch(button, "keyup"));

  SECTION("Rebinding replaces the handler") {
    b.add_listener(button, "click", [&clicks] { clicks += 10; });
    b.dispatch(button, "click");
    REQUIRE(clicks == 11);
  }

  SECTION("Removal unbinds") {
    b.remove_listener(button, "click");
    REQUIRE_FALSE(b.dispatch(button, "click"));
    REQUIRE(b.listener_events(button).empty());
  }
}

TEST_CASE("MemoryBackend lookup and dump", "[memory_backend]") {
  MemoryBackend b;
  const auto root = b.create_root("body");
  const auto ul = b.create_element("ul");
  const auto li = b.create_element("li");
  b.set_attribute(li, "data-action", "toggle-1");
  b.set_attribute(li, "class", "open");
  b.add_listener(li, "click", [] {});
  b.append_child(li, b.create_text("milk"));
  b.append_child(ul, li);
  b.append_child(root, ul);

  REQUIRE(b.find_attribute(root, "data-action", "toggle-1") ==
          std::optional<NodeHandle>{li});
  REQUIRE_FALSE(b.find_attribute(root, "data-action", "toggle-2").has_value());

  std::ostringstream os;
  b.dump(os, root);
  REQUIRE(os.str() == "body#" + std::to_string(root) + "\n" +
                          "  ul#" + std::to_string(ul) + "\n" +
                          "    li#" + std::to_string(li) +
                          " {class: open, data-action: toggle-1} [click]\n" +
                          "      \"milk\"\n");
}

TEST_CASE("MemoryBackend dump keeps one line per text node",
          "[memory_backend]") {
  MemoryBackend b;
  const auto root = b.create_root("p");
  b.append_child(root, b.create_text("two\nlines \"quoted\""));

  std::ostringstream os;
  b.dump(os, root);
  REQUIRE(os.str() == "p#" + std::to_string(root) + "\n" +
                          "  \"two\\nlines \\\"quoted\\\"\"\n");
}
