#include <gtest/gtest.h>
#include "Fakes.h"
#include "ShortcutInterceptor.h"
#include "ViewRegistry.h"

namespace
{
KeyChord Chord(const std::string &key, bool ctrl = false, bool shift = false, bool alt = false, bool meta = false)
{
  KeyChord chord;
  chord.key = key;
  chord.ctrl = ctrl;
  chord.shift = shift;
  chord.alt = alt;
  chord.meta = meta;
  return chord;
}
} // namespace

class ShortcutInterceptorTest : public ::testing::Test
{
protected:
  ShortcutInterceptorTest()
  {
    diagnostics.set_sink(&diagnostic_sink);
    registry.Create("moodle", "https://moodle.example", ContentViewOptions(), nullptr, nullptr);
    shortcuts.Attach("moodle");
  }

  FakeContentView &view() { return *factory.view("moodle"); }

  RecordingSink sink;
  RecordingSink diagnostic_sink;
  Diagnostics diagnostics{Severity::Error};
  FakeViewFactory factory;
  ViewRegistry registry{factory};
  ShortcutInterceptor shortcuts{[this](const std::string &id) { return registry.content(id); }, sink, diagnostics};
};

TEST_F(ShortcutInterceptorTest, CtrlShiftUppercasePMatchesCommandPalette)
{
  EXPECT_TRUE(shortcuts.HandleKeyEvent("moodle", Chord("P", true, true)));
  ASSERT_EQ(sink.events.size(), 1u);
  EXPECT_EQ(sink.events[0].ToJSON(),
            R"({"type":"shortcut-forwarded","payload":{"action":"command-palette","viewId":"moodle"}})");
}

TEST_F(ShortcutInterceptorTest, ShiftMustMatchExactly)
{
  const ShortcutBinding *plain = shortcuts.Match(Chord("p", true));
  ASSERT_NE(plain, nullptr);
  EXPECT_EQ(plain->action, "print");

  EXPECT_EQ(shortcuts.Match(Chord("F5", false, true)), nullptr);
}

TEST_F(ShortcutInterceptorTest, MetaCountsAsCtrl)
{
  const ShortcutBinding *binding = shortcuts.Match(Chord("f", false, false, false, true));
  ASSERT_NE(binding, nullptr);
  EXPECT_EQ(binding->action, "find");
}

TEST_F(ShortcutInterceptorTest, F5ReloadsTheViewWithoutForwarding)
{
  EXPECT_TRUE(shortcuts.HandleKeyEvent("moodle", Chord("F5")));
  EXPECT_EQ(view().reload_count, 1);
  EXPECT_TRUE(sink.events.empty());
}

TEST_F(ShortcutInterceptorTest, BackAndForwardRespectHistory)
{
  EXPECT_TRUE(shortcuts.HandleKeyEvent("moodle", Chord("ArrowLeft", false, false, true)));
  EXPECT_EQ(view().back_count, 0);

  view().can_go_back = true;
  view().can_go_forward = true;
  shortcuts.HandleKeyEvent("moodle", Chord("ArrowLeft", false, false, true));
  shortcuts.HandleKeyEvent("moodle", Chord("ArrowRight", false, false, true));
  EXPECT_EQ(view().back_count, 1);
  EXPECT_EQ(view().forward_count, 1);
  EXPECT_TRUE(sink.events.empty());
}

TEST_F(ShortcutInterceptorTest, NumberShortcutsNavigateApps)
{
  EXPECT_TRUE(shortcuts.HandleKeyEvent("moodle", Chord("3", true)));
  ASSERT_EQ(sink.events.size(), 1u);
  EXPECT_EQ(sink.events[0].action, "nav-app-3");
}

TEST_F(ShortcutInterceptorTest, UnboundKeysPassThrough)
{
  EXPECT_FALSE(shortcuts.HandleKeyEvent("moodle", Chord("q", true)));
  EXPECT_FALSE(shortcuts.HandleKeyEvent("moodle", Chord("a")));
  EXPECT_TRUE(sink.events.empty());
}

TEST_F(ShortcutInterceptorTest, DetachedViewIsIgnored)
{
  shortcuts.Detach("moodle");
  EXPECT_FALSE(shortcuts.HandleKeyEvent("moodle", Chord("F5")));
  EXPECT_EQ(view().reload_count, 0);
}

TEST_F(ShortcutInterceptorTest, UnreachableHostIsReportedAndKeyStillConsumed)
{
  sink.reachable = false;
  EXPECT_TRUE(shortcuts.HandleKeyEvent("moodle", Chord("d", true)));
  auto reports = diagnostic_sink.Of(ShellEventType::DiagnosticLog);
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].log_type, "shortcut-undelivered");
  EXPECT_EQ(reports[0].data.at("action"), "toggle-secure-docs");
}

TEST_F(ShortcutInterceptorTest, ViewActionExceptionsAreContained)
{
  struct ReloadThrows : FakeContentView
  {
    using FakeContentView::FakeContentView;
    void Reload() override { throw std::runtime_error("crashed renderer"); }
  } broken(nullptr, "broken", ContentViewOptions(), nullptr);

  ShortcutInterceptor local([&](const std::string &) -> ContentView * { return &broken; }, sink, diagnostics);
  local.Attach("broken");
  EXPECT_TRUE(local.HandleKeyEvent("broken", Chord("r", true)));
}

TEST(ShortcutAccelerator, ParsesModifiersAndKeys)
{
  ShortcutBinding binding;
  ASSERT_TRUE(ShortcutInterceptor::ParseAccelerator("CmdOrCtrl+Shift+P", "command-palette", binding));
  EXPECT_EQ(binding.key, "p");
  EXPECT_TRUE(binding.ctrl_or_meta);
  EXPECT_TRUE(binding.shift);
  EXPECT_FALSE(binding.alt);

  ASSERT_TRUE(ShortcutInterceptor::ParseAccelerator("Ctrl++", "zoom-in", binding));
  EXPECT_EQ(binding.key, "+");
  EXPECT_TRUE(binding.ctrl_or_meta);

  ASSERT_TRUE(ShortcutInterceptor::ParseAccelerator("Alt+Left", "back", binding));
  EXPECT_EQ(binding.key, "arrowleft");
  EXPECT_TRUE(binding.alt);

  ASSERT_TRUE(ShortcutInterceptor::ParseAccelerator(" F11 ", "toggle-fullscreen", binding));
  EXPECT_EQ(binding.key, "f11");
  EXPECT_FALSE(binding.ctrl_or_meta);
}

TEST(ShortcutAccelerator, RejectsUnknownModifierAndEmptyInput)
{
  ShortcutBinding binding;
  EXPECT_FALSE(ShortcutInterceptor::ParseAccelerator("Hyper+K", "x", binding));
  EXPECT_FALSE(ShortcutInterceptor::ParseAccelerator("", "x", binding));
  EXPECT_FALSE(ShortcutInterceptor::ParseAccelerator("Ctrl+K", "", binding));
}

TEST(ShortcutAccelerator, MergeReplacesSameChord)
{
  std::vector<ShortcutBinding> table = ShortcutInterceptor::DefaultBindings();
  size_t size = table.size();

  ShortcutBinding binding;
  ASSERT_TRUE(ShortcutInterceptor::ParseAccelerator("Ctrl+P", "open-planner", binding));
  ShortcutInterceptor::MergeBinding(table, binding);
  EXPECT_EQ(table.size(), size);

  ASSERT_TRUE(ShortcutInterceptor::ParseAccelerator("Ctrl+Alt+K", "custom", binding));
  ShortcutInterceptor::MergeBinding(table, binding);
  EXPECT_EQ(table.size(), size + 1);

  RecordingSink sink;
  Diagnostics diagnostics(Severity::Error);
  ShortcutInterceptor shortcuts(nullptr, sink, diagnostics);
  shortcuts.set_bindings(table);
  EXPECT_EQ(shortcuts.Match(KeyChord{"p", true, false, false, false})->action, "open-planner");
}
