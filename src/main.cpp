#include <iostream>
#include <string>
#include <utility>

#include <arbor/ui/memory_surface.hpp>
#include <arbor/ui/runtime.hpp>

#include "todo_app.hpp"

using namespace arbor::ui;
using arbor::examples::Todo;
using arbor::examples::TodoList;

int main() {
  const auto options = RootOptions::from_env();
  apply_log_level(options);

  MemorySurface surface;
  Root root{surface, options};

  auto todos = root.store().create<TodoList>(TodoList{
      Todo{100, "write the diff", true},
      Todo{101, "wire the scheduler", false},
  });

  auto print = [&](const char *title, const FlushReport &r) {
    std::cout << "\n== " << title << " (rendered " << r.rendered << ", "
              << r.patch_count() << " patch(es))\n";
    for (const auto &applied : r.patches) {
      std::cout << applied.component_name << " at " << format_path(applied.at)
                << ":\n";
      dump_patches(std::cout, applied.patches);
    }
    for (const auto &e : r.errors) {
      std::cout << "error: " << e << "\n";
    }
    std::cout << "Tree:\n";
    if (const auto tree = root.tree()) {
      dump_tree(std::cout, *tree);
    }
    std::cout << "HTML: " << surface.to_html() << "\n";
  };

  print("mount", root.mount(arbor::examples::todo_app(todos)));

  root.dispatch_event({0}, "click", Event{"", {}, "ship it"});
  print("add", root.flush());

  root.dispatch_event({1, 0, 1}, "click");
  print("toggle first", root.flush());

  if (auto st = root.store().update(todos, [](TodoList &list) {
        std::swap(list.front(), list.back());
      });
      !st) {
    std::cerr << "update failed: " << *st.error() << "\n";
    return 1;
  }
  print("reverse", root.flush_until_idle());

  print("unmount", root.unmount());
  return 0;
}
