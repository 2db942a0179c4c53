#include <gtest/gtest.h>

#include <arbor/ui/memory_surface.hpp>
#include <arbor/ui/runtime.hpp>

#include "test_support.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace arbor::ui {
namespace {

using test::count_patches;
using test::FaultySurface;

using Items = std::vector<std::pair<std::string, std::string>>;

Node li(const std::string &key, const std::string &label) {
  return element("li").key(key).child(text(label)).build();
}

class RuntimeTest : public ::testing::Test {
protected:
  template <typename T> void write(Signal<T> s, T value) {
    ASSERT_TRUE(root_.store().write(s, std::move(value)).ok());
  }

  std::vector<std::string> log_;
  MemorySurface surface_;
  Root root_{surface_};
};

// =============================================================================
// Mount, update, unmount
// =============================================================================

TEST_F(RuntimeTest, AppendingAKeyedItemIsOneInsert) {
  auto items = root_.store().create<Items>(Items{{"1", "a"}});
  const auto list = define_component(
      "List", [items](const Props &, RenderContext &ctx) {
        return element("ul")
            .children([&](auto &c) {
              for (const auto &[key, label] : ctx.read(items)) {
                c.add(li(key, label));
              }
            })
            .build();
      });

  const auto mounted = root_.mount(list);
  ASSERT_TRUE(mounted.ok());
  ASSERT_EQ(mounted.patches.size(), 1u);
  EXPECT_EQ(mounted.patches[0].at, Path{});
  EXPECT_EQ(surface_.to_html(), "<ul><li>a</li></ul>");

  write(items, Items{{"1", "a"}, {"2", "b"}});
  EXPECT_EQ(root_.state(), SchedulerState::Pending);

  const auto r = root_.flush();
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.rendered, 1u);
  ASSERT_EQ(r.patches.size(), 1u);
  EXPECT_EQ(r.patches[0].at, Path{0});
  EXPECT_EQ(r.patches[0].component_name, "List");
  ASSERT_EQ(r.patches[0].patches.size(), 1u);
  EXPECT_EQ(r.patches[0].patches[0],
            (Patch{PatchInsertChild{Path{}, 1, li("2", "b")}}));
  EXPECT_EQ(surface_.to_html(), "<ul><li>a</li><li>b</li></ul>");
  EXPECT_EQ(root_.state(), SchedulerState::Idle);
}

TEST_F(RuntimeTest, FlushWithoutPendingWorkIsANoOp) {
  const auto def = define_component(
      "Static", [](const Props &, RenderContext &) { return text("x"); });
  ASSERT_TRUE(root_.mount(def).ok());
  surface_.reset_stats();

  const auto r = root_.flush();
  EXPECT_EQ(r.rendered, 0u);
  EXPECT_TRUE(r.patches.empty());
  EXPECT_EQ(surface_.stats().mutations(), 0u);
}

TEST_F(RuntimeTest, MountPassesPropsToTheRoot) {
  const auto def = define_component(
      "Greeting", [](const Props &props, RenderContext &) {
        return element("h1")
            .child(text("hello " + prop_as_string(props, "name")))
            .build();
      });
  ASSERT_TRUE(root_.mount(def, Props{{"name", std::string{"ada"}}}).ok());
  EXPECT_EQ(surface_.to_html(), "<h1>hello ada</h1>");
  ASSERT_TRUE(root_.tree().has_value());
  EXPECT_TRUE(structurally_equal(*root_.tree(), *surface_.snapshot()));
}

TEST_F(RuntimeTest, UnmountReleasesEverything) {
  const auto before = root_.store().live_count();
  const auto child = define_component(
      "Child", [](const Props &, RenderContext &ctx) {
        auto s = ctx.use_signal<int>("n", 1);
        return text(std::to_string(ctx.read(s)));
      });
  const auto parent = define_component(
      "Parent", [child](const Props &, RenderContext &ctx) {
        auto s = ctx.use_signal<int>("m", 2);
        return element("div")
            .children({text(std::to_string(ctx.read(s))),
                       component(child).build()})
            .build();
      });

  ASSERT_TRUE(root_.mount(parent).ok());
  EXPECT_EQ(root_.component_count(), 2u);
  EXPECT_EQ(root_.store().live_count(), before + 2);
  EXPECT_EQ(surface_.to_html(), "<div>21</div>");

  const auto r = root_.unmount();
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(root_.component_count(), 0u);
  EXPECT_EQ(root_.store().live_count(), before);
  EXPECT_EQ(surface_.root_count(), 0u);
  EXPECT_FALSE(root_.tree().has_value());
}

// =============================================================================
// Scheduling
// =============================================================================

TEST_F(RuntimeTest, LifecycleIsUpdatingOnlyWhileRendering) {
  auto v = root_.store().create<int>(0);
  std::vector<Lifecycle> seen;
  const auto def = define_component(
      "Watcher", [this, v, &seen](const Props &, RenderContext &ctx) {
        seen.push_back(root_.lifecycle(ctx.id()));
        return text(std::to_string(ctx.read(v)));
      });
  ASSERT_TRUE(root_.mount(def).ok());
  const auto id = root_.root_id();
  EXPECT_EQ(root_.lifecycle(id), Lifecycle::Mounted);

  write(v, 1);
  ASSERT_TRUE(root_.flush().ok());
  const std::vector<Lifecycle> expected{Lifecycle::Updating,
                                        Lifecycle::Updating};
  EXPECT_EQ(seen, expected);
  EXPECT_EQ(root_.lifecycle(id), Lifecycle::Mounted);

  ASSERT_TRUE(root_.unmount().ok());
  EXPECT_EQ(root_.lifecycle(id), Lifecycle::Unmounted);
}

TEST_F(RuntimeTest, ThreeWritesBeforeFlushRenderOnce) {
  auto a = root_.store().create<int>(0);
  auto b = root_.store().create<int>(0);
  auto c = root_.store().create<int>(0);
  int requests = 0;
  root_.set_flush_requested([&] { ++requests; });

  const auto def = define_component(
      "Sum", [a, b, c](const Props &, RenderContext &ctx) {
        return text(std::to_string(ctx.read(a) + ctx.read(b) + ctx.read(c)));
      });
  ASSERT_TRUE(root_.mount(def).ok());
  const auto id = root_.root_id();
  EXPECT_EQ(root_.render_count(id), 1u);

  write(a, 1);
  write(b, 2);
  write(c, 3);
  EXPECT_EQ(requests, 1);

  const auto r = root_.flush();
  EXPECT_EQ(r.rendered, 1u);
  EXPECT_EQ(root_.render_count(id), 2u);
  EXPECT_EQ(surface_.to_html(), "6");
}

class TreeRuntimeTest : public RuntimeTest {
protected:
  void SetUp() override {
    parent_signal_ = root_.store().create<int>(0);
    child_signal_ = root_.store().create<int>(0);
    show_ = root_.store().create<bool>(true);

    child_ = define_component(
        "Child", [this](const Props &props, RenderContext &ctx) {
          log_.push_back("child");
          return text(prop_as_string(props, "label") +
                      std::to_string(ctx.read(child_signal_)));
        });
    parent_ = define_component(
        "Parent", [this](const Props &, RenderContext &ctx) {
          log_.push_back("parent");
          const auto v = ctx.read(parent_signal_);
          std::vector<Node> children{text(std::to_string(v))};
          if (ctx.read(show_)) {
            children.push_back(
                component(child_).prop("label", v > 5 ? "big" : "n").build());
          }
          return element("div").children(std::move(children)).build();
        });

    ASSERT_TRUE(root_.mount(parent_).ok());
    log_.clear();
  }

  ComponentId child_id() const {
    const auto id = root_.find_component("Child");
    return id ? *id : ComponentId{};
  }

  Signal<int> parent_signal_;
  Signal<int> child_signal_;
  Signal<bool> show_;
  std::shared_ptr<const ComponentDef> child_;
  std::shared_ptr<const ComponentDef> parent_;
};

TEST_F(TreeRuntimeTest, ParentRendersBeforeChildAndChildOnlyOnce) {
  const auto child = child_id();
  ASSERT_TRUE(child.valid());

  write(child_signal_, 1);
  write(parent_signal_, 1);
  const auto r = root_.flush();

  const std::vector<std::string> expected{"parent", "child"};
  EXPECT_EQ(log_, expected);
  EXPECT_EQ(r.rendered, 2u);
  EXPECT_EQ(root_.render_count(child), 2u);
  EXPECT_EQ(surface_.to_html(), "<div>1n1</div>");
}

TEST_F(TreeRuntimeTest, ChildWithUnchangedPropsIsNotRerendered) {
  const auto child = child_id();
  write(parent_signal_, 2);
  const auto r = root_.flush();
  EXPECT_EQ(r.rendered, 1u);
  EXPECT_EQ(root_.render_count(child), 1u);
  EXPECT_EQ(surface_.to_html(), "<div>2n0</div>");
}

TEST_F(TreeRuntimeTest, ChangedPropsRerenderTheChild) {
  const auto child = child_id();
  write(parent_signal_, 9);
  const auto r = root_.flush();
  EXPECT_EQ(r.rendered, 2u);
  EXPECT_EQ(root_.render_count(child), 2u);
  EXPECT_EQ(child_id(), child);
  EXPECT_EQ(surface_.to_html(), "<div>9big0</div>");
}

TEST_F(TreeRuntimeTest, ChildOnlyUpdatePatchesAtItsOwnPath) {
  write(child_signal_, 4);
  const auto r = root_.flush();
  ASSERT_EQ(r.patches.size(), 1u);
  EXPECT_EQ(r.patches[0].component_name, "Child");
  EXPECT_EQ(r.patches[0].at, (Path{0, 1}));
  EXPECT_EQ(surface_.to_html(), "<div>0n4</div>");
}

TEST_F(TreeRuntimeTest, UnmountedBeforeItsTurnIsSkipped) {
  const auto child = child_id();
  write(child_signal_, 1);
  write(show_, false);
  const auto r = root_.flush();

  EXPECT_EQ(r.skipped, 1u);
  EXPECT_EQ(r.rendered, 1u);
  EXPECT_FALSE(root_.alive(child));
  EXPECT_EQ(root_.lifecycle(child), Lifecycle::Unmounted);
  const std::vector<std::string> expected{"parent"};
  EXPECT_EQ(log_, expected);
  EXPECT_EQ(surface_.to_html(), "<div>0</div>");
}

TEST_F(TreeRuntimeTest, RemountedChildIsAFreshInstance) {
  const auto first = child_id();
  write(show_, false);
  root_.flush();
  write(show_, true);
  root_.flush();
  const auto second = child_id();
  ASSERT_TRUE(second.valid());
  EXPECT_NE(first, second);
  EXPECT_EQ(root_.render_count(second), 1u);
}

TEST_F(RuntimeTest, WritesDuringRenderWaitForTheNextFlush) {
  auto s = root_.store().create<int>(0);
  const auto def = define_component(
      "Climb", [s](const Props &, RenderContext &ctx) {
        const auto v = ctx.read(s);
        if (v < 3) {
          EXPECT_TRUE(ctx.write(s, v + 1).ok());
        }
        return text(std::to_string(v));
      });

  ASSERT_TRUE(root_.mount(def).ok());
  EXPECT_EQ(root_.state(), SchedulerState::Pending);

  auto r = root_.flush();
  EXPECT_EQ(r.rendered, 1u);
  EXPECT_EQ(surface_.to_html(), "1");
  EXPECT_EQ(root_.state(), SchedulerState::Pending);

  r = root_.flush_until_idle();
  EXPECT_EQ(r.rendered, 2u);
  EXPECT_EQ(surface_.to_html(), "3");
  EXPECT_EQ(root_.state(), SchedulerState::Idle);
}

TEST(RuntimeOptionsTest, ConstructingARootLeavesTheLoggerLevelAlone) {
  logger()->set_level(spdlog::level::debug);
  MemorySurface surface;
  RootOptions opts;
  opts.log_level = spdlog::level::err;
  const Root root{surface, opts};
  EXPECT_EQ(logger()->level(), spdlog::level::debug);

  apply_log_level(RootOptions{});
  EXPECT_EQ(logger()->level(), spdlog::level::warn);
}

TEST(RuntimeOptionsTest, FlushUntilIdleIsBounded) {
  MemorySurface surface;
  RootOptions opts;
  opts.max_flush_passes = 3;
  Root root{surface, opts};

  auto s = root.store().create<int>(0);
  const auto def = define_component(
      "Runaway", [s](const Props &, RenderContext &ctx) {
        const auto v = ctx.read(s);
        EXPECT_TRUE(ctx.write(s, v + 1).ok());
        return text(std::to_string(v));
      });
  ASSERT_TRUE(root.mount(def).ok());

  const auto r = root.flush_until_idle();
  EXPECT_EQ(r.rendered, 3u);
  EXPECT_EQ(root.state(), SchedulerState::Pending);
  EXPECT_EQ(surface.to_html(), "3");
}

TEST_F(RuntimeTest, KeyedChildComponentsSurviveReordering) {
  auto order = root_.store().create<std::vector<std::string>>({"a", "b", "c"});
  std::map<std::string, int> renders;

  const auto row = define_component(
      "Row", [&renders](const Props &props, RenderContext &) {
        const auto label = prop_as_string(props, "label");
        ++renders[label];
        return text(label);
      });
  const auto list = define_component(
      "Rows", [order, row](const Props &, RenderContext &ctx) {
        return element("ul")
            .children([&](auto &c) {
              for (const auto &k : ctx.read(order)) {
                c.add(element("li")
                          .key(k)
                          .child(component(row).prop("label", k).build())
                          .build());
              }
            })
            .build();
      });
  ASSERT_TRUE(root_.mount(list).ok());
  EXPECT_EQ(root_.component_count(), 4u);

  write(order, std::vector<std::string>{"c", "b", "a"});
  const auto r = root_.flush();
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.patches.size(), 1u);
  EXPECT_EQ(count_patches<PatchMoveChild>(r.patches[0].patches), 2u);
  EXPECT_EQ(r.patches[0].patches.size(), 2u);
  EXPECT_EQ(root_.component_count(), 4u);
  for (const auto &kv : renders) {
    EXPECT_EQ(kv.second, 1) << kv.first;
  }
  EXPECT_EQ(surface_.to_html(), "<ul><li>c</li><li>b</li><li>a</li></ul>");
}

// =============================================================================
// Failures
// =============================================================================

class FailureTest : public RuntimeTest {
protected:
  void mount_pair(ErrorBoundary boundary) {
    a_ = root_.store().create<int>(0);
    b_ = root_.store().create<int>(0);
    const auto a = define_component(
        "A", [this](const Props &, RenderContext &ctx) {
          const auto v = ctx.read(a_);
          if (v == 1) {
            throw std::runtime_error("a broke");
          }
          return text("a" + std::to_string(v));
        });
    const auto b = define_component(
        "B", [this](const Props &, RenderContext &ctx) {
          return text("b" + std::to_string(ctx.read(b_)));
        });
    const auto parent = define_component(
        "Pair",
        [a, b](const Props &, RenderContext &) {
          return element("div")
              .children({component(a).build(), component(b).build()})
              .build();
        },
        std::move(boundary));
    ASSERT_TRUE(root_.mount(parent).ok());
  }

  Signal<int> a_;
  Signal<int> b_;
};

TEST_F(FailureTest, RenderPanicIsIsolatedToItsComponent) {
  mount_pair({});
  const auto a = root_.find_component("A");
  ASSERT_TRUE(a.has_value());

  write(a_, 1);
  write(b_, 1);
  const auto r = root_.flush();

  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::RenderPanic);
  EXPECT_EQ(r.errors[0].component, *a);
  EXPECT_NE(r.errors[0].message.find("a broke"), std::string::npos);
  EXPECT_EQ(r.rendered, 1u);
  EXPECT_EQ(root_.lifecycle(*a), Lifecycle::Mounted);
  EXPECT_EQ(surface_.to_html(), "<div>a0b1</div>");
  EXPECT_EQ(root_.state(), SchedulerState::Idle);
}

TEST_F(FailureTest, ErrorBoundaryReceivesSubtreeFailures) {
  std::vector<Error> caught;
  mount_pair([&caught](const Error &e) { caught.push_back(e); });

  write(a_, 1);
  const auto r = root_.flush();
  EXPECT_TRUE(r.ok());
  ASSERT_EQ(r.handled.size(), 1u);
  ASSERT_EQ(caught.size(), 1u);
  EXPECT_EQ(caught[0].kind, ErrorKind::RenderPanic);

  // The component recovers on its next successful render.
  write(a_, 2);
  const auto again = root_.flush();
  EXPECT_TRUE(again.ok());
  EXPECT_EQ(surface_.to_html(), "<div>a2b0</div>");
}

TEST_F(RuntimeTest, NonStandardThrowFromRenderIsARenderPanic) {
  auto v = root_.store().create<int>(0);
  const auto def = define_component(
      "Odd", [v](const Props &, RenderContext &ctx) {
        const auto n = ctx.read(v);
        if (n == 1) {
          throw 42;
        }
        return element("p").child(text(std::to_string(n))).build();
      });
  ASSERT_TRUE(root_.mount(def).ok());

  write(v, 1);
  const auto r = root_.flush();
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::RenderPanic);
  EXPECT_NE(r.errors[0].message.find("non-standard exception"),
            std::string::npos);
  EXPECT_EQ(root_.state(), SchedulerState::Idle);
  EXPECT_EQ(root_.lifecycle(root_.root_id()), Lifecycle::Mounted);

  write(v, 2);
  const auto again = root_.flush();
  EXPECT_TRUE(again.ok());
  EXPECT_EQ(again.rendered, 1u);
  EXPECT_EQ(surface_.to_html(), "<p>2</p>");
}

TEST_F(RuntimeTest, NonStandardThrowFromAnEffectIsARenderPanic) {
  const auto def = define_component(
      "Effectful", [](const Props &, RenderContext &ctx) {
        ctx.use_effect("boom", {}, []() -> EffectCleanup {
          throw std::string{"not an exception type"};
        });
        return text("x");
      });
  const auto r = root_.mount(def);
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::RenderPanic);
  EXPECT_EQ(surface_.to_html(), "x");
  EXPECT_EQ(root_.state(), SchedulerState::Idle);
}

TEST_F(RuntimeTest, ChildThatFailsToMountRendersNothing) {
  const auto bad = define_component(
      "Bad", [](const Props &, RenderContext &) -> Node {
        throw std::runtime_error("nope");
      });
  const auto parent = define_component(
      "Host", [bad](const Props &, RenderContext &) {
        return element("div")
            .children({text("x"), component(bad).build()})
            .build();
      });

  const auto r = root_.mount(parent);
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::RenderPanic);
  EXPECT_EQ(surface_.to_html(), "<div>x</div>");
}

TEST_F(RuntimeTest, WriteAfterUnmountIsReported) {
  auto show = root_.store().create<bool>(true);
  Signal<int> leaked;
  const auto child = define_component(
      "Holder", [&leaked](const Props &, RenderContext &ctx) {
        leaked = ctx.use_signal<int>("value", 7);
        return text(std::to_string(ctx.read(leaked)));
      });
  const auto parent = define_component(
      "Toggle", [show, child](const Props &, RenderContext &ctx) {
        if (!ctx.read(show)) {
          return element("div").build();
        }
        return element("div").child(component(child).build()).build();
      });
  ASSERT_TRUE(root_.mount(parent).ok());
  ASSERT_TRUE(root_.store().alive(leaked.id()));

  write(show, false);
  ASSERT_TRUE(root_.flush().ok());
  EXPECT_FALSE(root_.store().alive(leaked.id()));

  const auto st = root_.store().write(leaked, 8);
  ASSERT_FALSE(st.ok());
  EXPECT_EQ(st.error()->kind, ErrorKind::WriteAfterUnmount);

  const auto r = root_.flush();
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::WriteAfterUnmount);
  EXPECT_EQ(root_.state(), SchedulerState::Idle);

  write(show, true);
  EXPECT_TRUE(root_.flush().ok());
  EXPECT_EQ(surface_.to_html(), "<div>7</div>");
}

TEST(SurfaceFailureTest, FailedApplicationResyncsOnTheNextRender) {
  MemorySurface memory;
  FaultySurface faulty{memory};
  Root root{faulty};

  auto s = root.store().create<int>(0);
  const auto def = define_component(
      "Label", [s](const Props &, RenderContext &ctx) {
        return element("p").child(text(std::to_string(ctx.read(s)))).build();
      });
  ASSERT_TRUE(root.mount(def).ok());

  ASSERT_TRUE(root.store().write(s, 1).ok());
  faulty.fail_op("set_text");
  auto r = root.flush();
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::SurfaceApplicationFailure);
  EXPECT_EQ(memory.to_html(), "<p>0</p>");

  faulty.heal();
  ASSERT_TRUE(root.store().write(s, 2).ok());
  r = root.flush();
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.patches.size(), 1u);
  ASSERT_EQ(r.patches[0].patches.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<PatchReplaceNode>(r.patches[0].patches[0]));
  EXPECT_EQ(memory.to_html(), "<p>2</p>");

  ASSERT_TRUE(root.store().write(s, 3).ok());
  r = root.flush();
  ASSERT_EQ(r.patch_count(), 1u);
  EXPECT_TRUE(std::holds_alternative<PatchUpdateText>(r.patches[0].patches[0]));
}

TEST(SurfaceFailureTest, FailedReplaceKeepsTheOldNodeAndRecovers) {
  MemorySurface memory;
  FaultySurface faulty{memory};
  Root root{faulty};

  auto s = root.store().create<int>(0);
  const auto def = define_component(
      "Switch", [s](const Props &, RenderContext &ctx) {
        const auto v = ctx.read(s);
        return element(v == 0 ? "p" : "div")
            .child(text(std::to_string(v)))
            .build();
      });
  ASSERT_TRUE(root.mount(def).ok());

  ASSERT_TRUE(root.store().write(s, 1).ok());
  faulty.fail_op("insert_child");
  auto r = root.flush();
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::SurfaceApplicationFailure);
  EXPECT_EQ(memory.to_html(), "<p>0</p>");
  EXPECT_EQ(memory.detached_count(), 0u);

  faulty.heal();
  ASSERT_TRUE(root.store().write(s, 2).ok());
  r = root.flush();
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(memory.to_html(), "<div>2</div>");

  ASSERT_TRUE(root.store().write(s, 3).ok());
  r = root.flush();
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.patch_count(), 1u);
  EXPECT_TRUE(std::holds_alternative<PatchUpdateText>(r.patches[0].patches[0]));
  EXPECT_EQ(memory.to_html(), "<div>3</div>");
}

TEST(SurfaceFailureTest, RootThatFailedToMountIsInsertedOnItsNextRender) {
  MemorySurface memory;
  FaultySurface faulty{memory};
  Root root{faulty};

  auto s = root.store().create<int>(0);
  const auto def = define_component(
      "Late", [s](const Props &, RenderContext &ctx) {
        return element("p").child(text(std::to_string(ctx.read(s)))).build();
      });
  faulty.fail_op("insert_child");
  auto r = root.mount(def);
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(memory.root_count(), 0u);

  faulty.heal();
  ASSERT_TRUE(root.store().write(s, 1).ok());
  r = root.flush();
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.patch_count(), 1u);
  EXPECT_TRUE(std::holds_alternative<PatchInsertChild>(r.patches[0].patches[0]));
  EXPECT_EQ(memory.to_html(), "<p>1</p>");

  EXPECT_TRUE(root.unmount().ok());
  EXPECT_EQ(memory.root_count(), 0u);
}

TEST(SurfaceFailureTest, DirtyChildOfAnUnmountedTreeReinsertsTheRoot) {
  MemorySurface memory;
  FaultySurface faulty{memory};
  Root root{faulty};

  auto s = root.store().create<int>(0);
  const auto leaf = define_component(
      "Count", [s](const Props &, RenderContext &ctx) {
        return text(std::to_string(ctx.read(s)));
      });
  const auto shell = define_component(
      "Shell", [leaf](const Props &, RenderContext &) {
        return element("div").child(component(leaf).build()).build();
      });
  faulty.fail_op("insert_child");
  ASSERT_FALSE(root.mount(shell).ok());

  faulty.heal();
  ASSERT_TRUE(root.store().write(s, 4).ok());
  const auto r = root.flush();
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.patch_count(), 1u);
  EXPECT_TRUE(std::holds_alternative<PatchInsertChild>(r.patches[0].patches[0]));
  EXPECT_EQ(memory.to_html(), "<div>4</div>");
}

TEST(SurfaceFailureTest, UnmountSkipsARootThatNeverReachedTheSurface) {
  MemorySurface memory;
  FaultySurface faulty{memory};
  Root root{faulty};

  faulty.fail_op("insert_child");
  const auto def = define_component(
      "Never", [](const Props &, RenderContext &) { return text("n"); });
  ASSERT_FALSE(root.mount(def).ok());
  faulty.fail_op("remove_child");

  const auto r = root.unmount();
  EXPECT_TRUE(r.ok());
  EXPECT_EQ(root.component_count(), 0u);
}

TEST(SurfaceFailureTest, SurfaceFailuresAreLoggedOnce) {
  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32);
  logger()->sinks().push_back(sink);

  MemorySurface memory;
  FaultySurface faulty{memory};
  Root root{faulty};
  auto s = root.store().create<int>(0);
  const auto def = define_component(
      "Label", [s](const Props &, RenderContext &ctx) {
        return text(std::to_string(ctx.read(s)));
      });
  ASSERT_TRUE(root.mount(def).ok());
  ASSERT_TRUE(root.store().write(s, 1).ok());
  faulty.fail_op("set_text");
  const auto r = root.flush();
  logger()->sinks().pop_back();

  ASSERT_EQ(r.errors.size(), 1u);
  std::size_t logged = 0;
  for (const auto &msg : sink->last_raw()) {
    if (msg.level == spdlog::level::err) {
      ++logged;
    }
  }
  EXPECT_EQ(logged, 1u);
}

TEST_F(RuntimeTest, DuplicateKeysAreReportedAsWarnings) {
  auto n = root_.store().create<int>(0);
  const auto def = define_component(
      "Dupes", [n](const Props &, RenderContext &ctx) {
        const auto v = std::to_string(ctx.read(n));
        return element("ul").children({li("1", "a" + v), li("1", "b" + v)}).build();
      });
  ASSERT_TRUE(root_.mount(def).ok());
  write(n, 1);
  const auto r = root_.flush();
  EXPECT_TRUE(r.ok());
  ASSERT_FALSE(r.warnings.empty());
  EXPECT_EQ(r.warnings[0].kind, ErrorKind::DuplicateKey);
  EXPECT_EQ(surface_.to_html(), "<ul><li>a1</li><li>b1</li></ul>");
}

// =============================================================================
// Hooks and events
// =============================================================================

TEST_F(RuntimeTest, EffectsRunAfterRenderAndCleanUpFirst) {
  auto count = root_.store().create<std::int64_t>(0);
  auto other = root_.store().create<int>(0);
  const auto def = define_component(
      "Effects", [this, count, other](const Props &, RenderContext &ctx) {
        const auto c = ctx.read(count);
        (void)ctx.read(other);
        log_.push_back("render");
        ctx.use_effect("track", {PropValue{c}}, [this, c]() -> EffectCleanup {
          log_.push_back("run:" + std::to_string(c));
          return [this, c] { log_.push_back("cleanup:" + std::to_string(c)); };
        });
        return text(std::to_string(c));
      });

  ASSERT_TRUE(root_.mount(def).ok());
  std::vector<std::string> expected{"render", "run:0"};
  EXPECT_EQ(log_, expected);

  write(count, std::int64_t{1});
  root_.flush();
  expected = {"render", "run:0", "render", "cleanup:0", "run:1"};
  EXPECT_EQ(log_, expected);

  write(other, 1);
  root_.flush();
  expected.push_back("render");
  EXPECT_EQ(log_, expected);

  root_.unmount();
  expected.push_back("cleanup:1");
  EXPECT_EQ(log_, expected);
}

TEST_F(RuntimeTest, ComputedValuesDriveRenders) {
  auto base = root_.store().create<int>(2);
  const auto def = define_component(
      "Doubler", [base](const Props &, RenderContext &ctx) {
        auto twice = ctx.use_computed<int>(
            "twice", [base](Store &store) { return store.read(base) * 2; });
        return text(std::to_string(ctx.read(twice)));
      });
  ASSERT_TRUE(root_.mount(def).ok());
  EXPECT_EQ(surface_.to_html(), "4");

  write(base, 5);
  EXPECT_EQ(root_.state(), SchedulerState::Pending);
  root_.flush();
  EXPECT_EQ(surface_.to_html(), "10");
}

TEST_F(RuntimeTest, EventsBubbleToTheNearestHandler) {
  auto n = root_.store().create<int>(0);
  std::vector<Event> seen;
  const auto def = define_component(
      "Counter", [this, n, &seen](const Props &, RenderContext &ctx) {
        const auto inc = ctx.on("inc", [this, n, &seen](const Event &ev) {
          seen.push_back(ev);
          EXPECT_TRUE(root_.store().update(n, [](int &v) { ++v; }).ok());
        });
        return element("div")
            .children({element("button").on("click", inc).child(text("+")).build(),
                       text(std::to_string(ctx.read(n)))})
            .build();
      });
  ASSERT_TRUE(root_.mount(def).ok());

  EXPECT_TRUE(root_.dispatch_event({0, 0}, "click", Event{"", {}, "left"}));
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].name, "click");
  EXPECT_EQ(seen[0].target, (Path{0, 0}));
  EXPECT_EQ(seen[0].value, "left");

  const auto r = root_.flush();
  EXPECT_EQ(surface_.to_html(), "<div><button>+</button>1</div>");
  ASSERT_EQ(r.patches.size(), 1u);
  EXPECT_EQ(count_patches<PatchUpdateEvent>(r.patches[0].patches), 0u);

  EXPECT_FALSE(root_.dispatch_event({1}, "click"));
  EXPECT_FALSE(root_.dispatch_event({0}, "keydown"));
}

TEST_F(RuntimeTest, HandlerExceptionsAreReportedOnTheNextFlush) {
  const auto def = define_component(
      "Thrower", [](const Props &, RenderContext &ctx) {
        const auto h = ctx.on("go", [](const Event &) {
          throw std::runtime_error("handler broke");
        });
        return element("button").on("click", h).build();
      });
  ASSERT_TRUE(root_.mount(def).ok());
  EXPECT_TRUE(root_.dispatch_event({}, "click"));
  const auto r = root_.flush();
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::RenderPanic);
}

TEST_F(RuntimeTest, NonStandardThrowFromAHandlerIsReported) {
  const auto def = define_component(
      "Thrower", [](const Props &, RenderContext &ctx) {
        const auto h = ctx.on("go", [](const Event &) { throw 7; });
        return element("button").on("click", h).build();
      });
  ASSERT_TRUE(root_.mount(def).ok());
  EXPECT_TRUE(root_.dispatch_event({}, "click"));
  const auto r = root_.flush();
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::RenderPanic);
  EXPECT_NE(r.errors[0].message.find("non-standard exception"),
            std::string::npos);
}

// =============================================================================
// Context
// =============================================================================

TEST_F(RuntimeTest, DescendantsReadTheNearestProvidedValue) {
  auto theme = root_.store().create<std::string>("dark");
  const auto leaf = define_component(
      "Leaf", [](const Props &, RenderContext &ctx) {
        return text(ctx.use_context<std::string>("theme", "none"));
      });
  const auto panel = define_component(
      "Panel", [leaf](const Props &, RenderContext &) {
        return element("div").child(component(leaf).build()).build();
      });
  const auto contrast = define_component(
      "Contrast", [leaf](const Props &, RenderContext &ctx) {
        ctx.provide<std::string>("theme", "contrast");
        return element("section").child(component(leaf).build()).build();
      });
  const auto app = define_component(
      "App", [theme, panel, contrast](const Props &, RenderContext &ctx) {
        ctx.provide("theme", ctx.read(theme));
        return element("main")
            .children({component(panel).build(), component(contrast).build()})
            .build();
      });

  ASSERT_TRUE(root_.mount(app).ok());
  EXPECT_EQ(surface_.to_html(),
            "<main><div>dark</div><section>contrast</section></main>");
  const auto panel_id = root_.find_component("Panel");
  ASSERT_TRUE(panel_id.has_value());

  write(theme, std::string{"light"});
  const auto r = root_.flush_until_idle();
  EXPECT_TRUE(r.ok());
  EXPECT_EQ(surface_.to_html(),
            "<main><div>light</div><section>contrast</section></main>");
  EXPECT_EQ(root_.render_count(*panel_id), 1u);
  EXPECT_EQ(root_.state(), SchedulerState::Idle);
}

TEST_F(RuntimeTest, MissingContextFallsBack) {
  const auto leaf = define_component(
      "Leaf", [](const Props &, RenderContext &ctx) {
        return text(ctx.use_context<std::string>("theme", "none"));
      });
  ASSERT_TRUE(root_.mount(leaf).ok());
  EXPECT_EQ(surface_.to_html(), "none");
}

} // namespace
} // namespace arbor::ui
