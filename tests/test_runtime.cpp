#include <catch2/catch.hpp>

#include "live_match.hpp"

#include <ripple/ui/memory_backend.hpp>
#include <ripple/ui/runtime.hpp>

#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ripple::ui;
using ripple::ui::test::live_matches;

namespace {

struct Counter {
  std::int64_t value{};
  std::vector<std::string> seen;
};

Counter counter_update(Counter s, const Message &m, const Enqueue &enqueue) {
  s.seen.push_back(m.name);
  if (m.name == "inc") {
    ++s.value;
  } else if (m.name == "double") {
    s.value *= 2;
  } else if (m.name == "inc_later") {
    enqueue(msg("inc"));
  } else if (m.name == "boom") {
    throw std::runtime_error{"boom"};
  }
  return s;
}

SpecList counter_view(const Counter &s) {
  return SpecList{
      element("p").child(text(std::to_string(s.value))).build(),
      element("button").on("click", msg("inc")).child(text("+")).build(),
  };
}

NodeHandle button_of(const MemoryBackend &b, NodeHandle root) {
  return b.child_list(root).at(1);
}

// Fires every listener once as it is bound, like a host that delivers a
// pending event during patching.
class EagerBackend final : public Backend {
public:
  NodeHandle create_element(const std::string &tag) override {
    return inner.create_element(tag);
  }
  NodeHandle create_text(const std::string &content) override {
    return inner.create_text(content);
  }
  std::optional<std::string> get_attribute(NodeHandle node,
                                           const std::string &name) override {
    return inner.get_attribute(node, name);
  }
  void set_attribute(NodeHandle node, const std::string &name,
                     const std::string &value) override {
    inner.set_attribute(node, name, value);
  }
  void remove_attribute(NodeHandle node, const std::string &name) override {
    inner.remove_attribute(node, name);
  }
  void add_listener(NodeHandle node, const std::string &event,
                    Listener listener) override {
    inner.add_listener(node, event, std::move(listener));
    inner.dispatch(node, event);
    ++fired;
  }
  void remove_listener(NodeHandle node, const std::string &event) override {
    inner.remove_listener(node, event);
  }
  std::vector<NodeHandle> children(NodeHandle node) override {
    return inner.children(node);
  }
  void append_child(NodeHandle parent, NodeHandle child) override {
    inner.append_child(parent, child);
  }
  void replace_child(NodeHandle parent, NodeHandle old_child,
                     NodeHandle new_child) override {
    inner.replace_child(parent, old_child, new_child);
  }
  void remove(NodeHandle node) override { inner.remove(node); }

  MemoryBackend inner;
  int fired{};
};

// The button's message carries the count, so every cycle rebinds it.
SpecList rebinding_view(const Counter &s) {
  return SpecList{
      element("p").child(text(std::to_string(s.value))).build(),
      element("button").on("click", msg("inc", s.value)).build(),
  };
}

} // namespace

TEST_CASE("mount renders the initial state", "[runtime]") {
  MemoryBackend b;
  const auto root = b.create_root("body");
  ManualPacer pacer;

  auto app = mount(b, root, Counter{}, counter_update, counter_view, pacer);

  REQUIRE(live_matches(b, root, counter_view(Counter{})));
  REQUIRE(app.spec() == counter_view(Counter{}));
  REQUIRE(app.cycles() == 0);
  REQUIRE(pacer.pending());
}

TEST_CASE("tick folds queued messages in order", "[runtime]") {
  MemoryBackend b;
  const auto root = b.create_root("body");
  ManualPacer pacer;
  auto app = mount(b, root, Counter{}, counter_update, counter_view, pacer);

  SECTION("An empty queue does nothing") {
    const auto mutations = b.mutation_count();
    const auto result = app.tick();
    REQUIRE_FALSE(result.drew);
    REQUIRE(result.messages == 0);
    REQUIRE(app.cycles() == 0);
    REQUIRE(b.mutation_count() == mutations);
  }

  SECTION("Two messages fold in one cycle, in arrival order") {
    app.enqueue(msg("inc"));
    app.enqueue(msg("double"));
    const auto result = app.tick();
    REQUIRE(result.drew);
    REQUIRE(result.messages == 2);
    REQUIRE(app.state().value == 2);
    REQUIRE(app.state().seen == std::vector<std::string>{"inc", "double"});
    REQUIRE(app.cycles() == 1);
    REQUIRE(b.text_content(root) == "2+");
  }

  SECTION("Order matters") {
    app.enqueue(msg("double"));
    app.enqueue(msg("inc"));
    app.tick();
    REQUIRE(app.state().value == 1);
  }

  SECTION("Messages enqueued by update wait for the next cycle") {
    app.enqueue(msg("inc_later"));
    app.tick();
    REQUIRE(app.state().value == 0);
    REQUIRE(app.pending_messages() == 1);
    app.tick();
    REQUIRE(app.state().value == 1);
    REQUIRE(app.cycles() == 2);
  }

  SECTION("Listener clicks are queued, not applied immediately") {
    REQUIRE(b.dispatch(button_of(b, root), "click"));
    REQUIRE(app.state().value == 0);
    REQUIRE(app.pending_messages() == 1);
    app.tick();
    REQUIRE(app.state().value == 1);
    REQUIRE(live_matches(b, root, app.spec()));
  }

  SECTION("The live tree follows every cycle") {
    for (int i = 0; i < 3; ++i) {
      app.enqueue(msg("inc"));
      app.tick();
      REQUIRE(live_matches(b, root, app.spec()));
    }
    REQUIRE(b.text_content(root) == "3+");
  }
}

TEST_CASE("The pacer drives the loop", "[runtime]") {
  MemoryBackend b;
  const auto root = b.create_root("body");
  ManualPacer pacer;
  auto app = mount(b, root, Counter{}, counter_update, counter_view, pacer);

  SECTION("Each frame re-arms the pacer") {
    REQUIRE(pacer.run_frame());
    REQUIRE(pacer.pending());
    app.enqueue(msg("inc"));
    REQUIRE(pacer.run_frame());
    REQUIRE(app.state().value == 1);
    REQUIRE(pacer.pending());
  }

  SECTION("The loop keeps running after the handle is gone") {
    auto enqueue = app.enqueuer();
    { auto dropped = std::move(app); }
    enqueue(msg("inc"));
    REQUIRE(pacer.run_frame());
    REQUIRE(pacer.pending());
    REQUIRE(b.text_content(root) == "1+");
  }

  SECTION("A throwing update propagates and stops the loop") {
    app.enqueue(msg("inc"));
    app.enqueue(msg("boom"));
    app.enqueue(msg("inc"));
    REQUIRE_THROWS_AS(pacer.run_frame(), std::runtime_error);
    REQUIRE_FALSE(pacer.pending());
    REQUIRE(app.state().value == 1);
    REQUIRE(app.pending_messages() == 0);
    REQUIRE(live_matches(b, root, counter_view(Counter{})));
  }
}

TEST_CASE("Enqueuer keeps working through the handle", "[runtime]") {
  MemoryBackend b;
  const auto root = b.create_root("body");
  ManualPacer pacer;
  auto app = mount(b, root, Counter{}, counter_update, counter_view, pacer);

  const auto enqueue = app.enqueuer();
  enqueue(msg("inc"));
  enqueue(msg("inc"));
  REQUIRE(app.pending_messages() == 2);
  pacer.run_frame();
  REQUIRE(app.state().value == 2);
}

TEST_CASE("Listeners fired during patching queue for the next cycle",
          "[runtime]") {
  EagerBackend b;
  const auto root = b.inner.create_root("body");
  ManualPacer pacer;
  auto app = mount(b, root, Counter{}, counter_update, rebinding_view, pacer);

  REQUIRE(b.fired == 1);
  REQUIRE(app.state().value == 0);
  REQUIRE(app.pending_messages() == 1);

  const auto first = app.tick();
  REQUIRE(first.messages == 1);
  REQUIRE(b.fired == 2);
  REQUIRE(app.state().value == 1);
  REQUIRE(app.pending_messages() == 1);

  const auto second = app.tick();
  REQUIRE(second.messages == 1);
  REQUIRE(app.state().value == 2);
  REQUIRE(app.pending_messages() == 1);
  REQUIRE(live_matches(b.inner, root, app.spec()));
}

TEST_CASE("Enqueueing after the mount is gone does nothing", "[runtime]") {
  MemoryBackend b;
  const auto root = b.create_root("body");
  Enqueue kept;
  {
    ManualPacer pacer;
    auto app = mount(b, root, Counter{}, counter_update, counter_view, pacer);
    kept = app.enqueuer();
  }

  REQUIRE(kept);
  REQUIRE_NOTHROW(kept(msg("inc")));
  REQUIRE(b.dispatch(button_of(b, root), "click"));
  REQUIRE(b.text_content(root) == "0+");
}

TEST_CASE("Independent mounts do not share state", "[runtime]") {
  MemoryBackend b;
  const auto left = b.create_root("left");
  const auto right = b.create_root("right");
  ManualPacer left_pacer;
  ManualPacer right_pacer;
  auto l = mount(b, left, Counter{}, counter_update, counter_view, left_pacer);
  auto r = mount(b, right, Counter{5, {}}, counter_update, counter_view,
                 right_pacer);

  b.dispatch(button_of(b, left), "click");
  left_pacer.run_frame();
  right_pacer.run_frame();

  REQUIRE(l.state().value == 1);
  REQUIRE(r.state().value == 5);
  REQUIRE(b.text_content(left) == "1+");
  REQUIRE(b.text_content(right) == "5+");
}

TEST_CASE("Trace output", "[runtime]") {
  MemoryBackend b;
  const auto root = b.create_root("body");
  ManualPacer pacer;
  std::ostringstream trace;
  MountOptions options;
  options.trace = &trace;
  options.trace_scripts = true;

  auto app =
      mount(b, root, Counter{}, counter_update, counter_view, pacer, options);
  trace.str("");

  app.enqueue(msg("inc"));
  app.tick();
  REQUIRE(trace.str() == "[ripple] cycle 1: 1 message(s)\n"
                         "  @0 Modify\n"
                         "    @0 Replace\n"
                         "      \"1\"\n");
}

TEST_CASE("FixedRatePacer runs a bounded number of frames", "[runtime]") {
  MemoryBackend b;
  const auto root = b.create_root("body");
  FixedRatePacer pacer{std::chrono::milliseconds{1}};
  auto app = mount(b, root, Counter{}, counter_update, counter_view, pacer);

  std::vector<std::size_t> frames;
  const auto ran = pacer.run(3, [&](std::size_t frame) {
    frames.push_back(frame);
    app.enqueue(msg("inc"));
  });

  REQUIRE(ran == 3);
  REQUIRE(frames == std::vector<std::size_t>{0, 1, 2});
  REQUIRE(app.state().value == 3);
  REQUIRE(b.text_content(root) == "3+");
}
