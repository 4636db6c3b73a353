#include <chrono>
#include <iostream>
#include <string>

#include <examples/demo_args.hpp>
#include <examples/todo_app.hpp>
#include <ripple/ui/memory_backend.hpp>
#include <ripple/ui/runtime.hpp>

using namespace ripple::ui;
using namespace ripple::ui::examples;

static bool click(MemoryBackend &backend, NodeHandle root,
                  const std::string &action) {
  const auto node = backend.find_attribute(root, "data-action", action);
  if (!node) {
    std::cout << "click " << action << ": no such button\n";
    return false;
  }
  std::cout << "click " << action << "\n";
  return backend.dispatch(*node, "click");
}

int main(int argc, char **argv) {
  const auto args = parse_demo_args(argc, argv, std::cerr);
  if (!args) {
    std::cerr << "usage: ripple_demo [frames] [--trace] [--interval MS]\n";
    return 1;
  }

  MemoryBackend backend;
  const auto root = backend.create_root("body");
  FixedRatePacer pacer{std::chrono::milliseconds{args->interval_ms}};

  MountOptions options;
  if (args->trace) {
    options.trace = &std::cout;
    options.trace_scripts = true;
  }

  auto app = mount(backend, root, TodoState{}, todo_update, todo_view, pacer,
                   options);

  std::cout << "Initial tree:\n";
  backend.dump(std::cout, root);

  // Handle-level messages stand in for typed input.
  app.enqueue(msg("add", "write the differ"));
  app.enqueue(msg("add", "write the patcher"));
  app.enqueue(msg("add", "wire the loop"));

  pacer.run(args->frames, [&](std::size_t frame) {
    switch (frame) {
    case 1:
      click(backend, root, "toggle-1");
      break;
    case 2:
      click(backend, root, "filter-open");
      break;
    case 3:
      click(backend, root, "filter-all");
      click(backend, root, "toggle-3");
      break;
    case 4:
      click(backend, root, "clear-done");
      break;
    default:
      break;
    }
  });

  std::cout << "Final tree after " << app.cycles() << " cycle(s):\n";
  backend.dump(std::cout, root);
  return 0;
}
