#pragma once

#include <arbor/ui/runtime.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace arbor::examples {

struct Todo {
  std::int64_t id{};
  std::string title;
  bool done{};
};

using TodoList = std::vector<Todo>;

inline std::shared_ptr<const ui::ComponentDef> todo_label() {
  static const auto def = ui::define_component(
      "TodoLabel", [](const ui::Props &props, ui::RenderContext &) {
        const auto done = ui::prop_as_bool(props, "done", false);
        return ui::element("span")
            .attr("class", done ? "done" : "open")
            .child(ui::text(ui::prop_as_string(props, "title")))
            .build();
      });
  return def;
}

inline std::shared_ptr<const ui::ComponentDef> todo_summary() {
  static const auto def = ui::define_component(
      "TodoSummary", [](const ui::Props &props, ui::RenderContext &) {
        const auto left = ui::prop_as_i64(props, "left", 0);
        return ui::element("p")
            .attr("class", "summary")
            .child(ui::text(std::to_string(left) +
                            (left == 1 ? " item left" : " items left")))
            .build();
      });
  return def;
}

// The list lives in a root-level signal so the host can seed and inspect
// it. Events: "click" on the add button at {0}, "click" on an item's
// toggle button at {1, i, 1}.
inline std::shared_ptr<const ui::ComponentDef>
todo_app(ui::Signal<TodoList> todos) {
  return ui::define_component(
      "TodoApp",
      [todos](const ui::Props &props, ui::RenderContext &ctx) {
        const auto items = ctx.read(todos);
        auto next_id = ctx.use_signal<std::int64_t>("next_id", 1);
        auto &store = ctx.store();

        const auto add = ctx.on("add", [todos, next_id, &store](const ui::Event &ev) {
          const auto id = store.peek(next_id);
          if (!store.write(next_id, id + 1)) {
            return;
          }
          auto title = ev.value.empty() ? "todo " + std::to_string(id) : ev.value;
          if (auto st = store.update(todos, [&](TodoList &list) {
                list.push_back(Todo{id, std::move(title), false});
              });
              !st) {
            ui::logger()->warn("add: {}", st.error()->message);
          }
        });

        std::int64_t left = 0;
        std::vector<ui::Node> rows;
        rows.reserve(items.size());
        for (const auto &item : items) {
          if (!item.done) {
            ++left;
          }
          const auto item_id = item.id;
          const auto toggle =
              ctx.on("toggle:" + std::to_string(item_id),
                     [todos, item_id, &store](const ui::Event &) {
                       const auto st = store.update(todos, [&](TodoList &list) {
                         for (auto &t : list) {
                           if (t.id == item_id) {
                             t.done = !t.done;
                           }
                         }
                       });
                       if (!st) {
                         ui::logger()->warn("toggle: {}", st.error()->message);
                       }
                     });
          rows.push_back(ui::element("li")
                             .key(std::to_string(item_id))
                             .children({
                                 ui::component(todo_label())
                                     .prop("title", item.title)
                                     .prop("done", item.done)
                                     .build(),
                                 ui::element("button")
                                     .on("click", toggle)
                                     .child(ui::text("toggle"))
                                     .build(),
                             })
                             .build());
        }

        return ui::element("div")
            .attr("class", ui::prop_as_string(props, "class", "todo-app"))
            .children({
                ui::element("button")
                    .on("click", add)
                    .child(ui::text("add"))
                    .build(),
                ui::element("ul").children(std::move(rows)).build(),
                ui::component(todo_summary()).prop("left", left).build(),
            })
            .build();
      },
      [](const ui::Error &e) {
        ui::logger()->error("TodoApp boundary: {}", e.message);
      });
}

} // namespace arbor::examples
