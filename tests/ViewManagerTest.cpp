#include <gtest/gtest.h>
#include "Fakes.h"
#include "ViewManager.h"
#include <memory>

using std::chrono::milliseconds;

namespace
{
LoadFailure Failure(int code, const std::string &description, const std::string &url, bool main_frame = true)
{
  LoadFailure failure;
  failure.code = code;
  failure.description = description;
  failure.url = url;
  failure.is_main_frame = main_frame;
  return failure;
}

KeyChord Chord(const std::string &key, bool ctrl, bool shift = false)
{
  KeyChord chord;
  chord.key = key;
  chord.ctrl = ctrl;
  chord.shift = shift;
  return chord;
}
} // namespace

class ViewManagerTest : public ::testing::Test
{
protected:
  ViewManagerTest() : config(ShellConfig::Defaults())
  {
    config.log_level = Severity::Error;
    Rebuild();
  }

  void Rebuild()
  {
    manager.reset();
    manager.reset(new ViewManager(window, factory, store, executor, runner, sink, config));
  }

  FakeContentView &view(const std::string &id) { return *factory.view(id); }

  std::vector<std::string> Types() const
  {
    std::vector<std::string> types;
    for (const auto &e : sink.events)
    {
      if (e.type != ShellEventType::DiagnosticLog)
        types.push_back(ShellEventName(e.type));
    }
    return types;
  }

  ManualClock clock;
  TaskRunner runner{clock.fn()};
  RecordingSink sink;
  FakeViewFactory factory;
  FakeHostWindow window;
  FakeCredentialStore store;
  InlineExecutor executor;
  ShellConfig config;
  std::unique_ptr<ViewManager> manager;
};

TEST_F(ViewManagerTest, CreateViewRegistersAndLoads)
{
  ViewManager::CreateResult result = manager->CreateView("Moodle", "https://moodle.example");
  EXPECT_TRUE(result.ok());
  EXPECT_TRUE(result.created);
  EXPECT_EQ(result.id, "moodle");
  EXPECT_EQ(view("moodle").loads, (std::vector<std::string>{"https://moodle.example"}));
  EXPECT_EQ(view("moodle").listener, manager.get());
  EXPECT_TRUE(view("moodle").options.isolated_script_context);
  EXPECT_FALSE(view("moodle").options.os_integration);
  EXPECT_EQ(view("moodle").options.storage_partition, "persist:main");
}

TEST_F(ViewManagerTest, CreateViewTwiceKeepsFirst)
{
  manager->CreateView("moodle", "https://a.example");
  ViewManager::CreateResult again = manager->CreateView("moodle", "https://b.example");
  EXPECT_TRUE(again.ok());
  EXPECT_FALSE(again.created);
  EXPECT_EQ(again.error, ViewError::AlreadyExists);
  EXPECT_EQ(factory.create_count, 1);
  EXPECT_EQ(manager->GetViewURL("moodle"), "https://a.example");
}

TEST_F(ViewManagerTest, CreateViewRequiresIdAndUrl)
{
  EXPECT_FALSE(manager->CreateView("", "https://a.example").ok());
  EXPECT_FALSE(manager->CreateView("a", "").ok());
  EXPECT_EQ(factory.create_count, 0);
}

TEST_F(ViewManagerTest, FactoryFailurePropagates)
{
  factory.throw_on_create = true;
  EXPECT_THROW(manager->CreateView("moodle", "https://a.example"), std::runtime_error);
  EXPECT_EQ(manager->GetStats().total_views, 0u);
}

TEST_F(ViewManagerTest, LoadLifecycleEmitsLoadingThenLoaded)
{
  manager->CreateView("wiki", "https://wiki.example");
  view("wiki").SimulateBeginLoading();
  view("wiki").SimulateFinishLoading("https://wiki.example/start");

  EXPECT_EQ(Types(), (std::vector<std::string>{"loading", "loading", "loaded"}));
  EXPECT_TRUE(sink.events[0].flag);
  EXPECT_FALSE(sink.events[1].flag);
  EXPECT_EQ(sink.events[2].ToJSON(),
            R"({"type":"loaded","payload":{"id":"wiki","url":"https://wiki.example/start"}})");
  const ViewRecord *record = manager->FindView("wiki");
  ASSERT_NE(record, nullptr);
  EXPECT_TRUE(record->state.is_loaded);
  EXPECT_EQ(record->state.last_url, "https://wiki.example/start");
}

TEST_F(ViewManagerTest, StartupFailuresAreSuppressed)
{
  manager->CreateView("wiki", "https://wiki.example");
  clock.Advance(runner, milliseconds(14999));
  manager->OnFailLoading("wiki", Failure(-105, "Name not resolved", "https://wiki.example"));
  EXPECT_EQ(sink.Count(ShellEventType::Error), 0u);

  clock.Advance(runner, milliseconds(1));
  manager->OnFailLoading("wiki", Failure(-105, "Name not resolved", "https://wiki.example"));
  auto errors = sink.Of(ShellEventType::Error);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].error_code, -105);
  EXPECT_EQ(errors[0].description, "Name not resolved");
  EXPECT_FALSE(manager->FindView("wiki")->state.is_loaded);
}

TEST_F(ViewManagerTest, ZeroGraceReportsImmediately)
{
  config.startup_grace = milliseconds(0);
  Rebuild();
  manager->CreateView("wiki", "https://wiki.example");
  manager->OnFailLoading("wiki", Failure(-2, "Failed", "https://wiki.example"));
  EXPECT_EQ(sink.Count(ShellEventType::Error), 1u);
}

TEST_F(ViewManagerTest, FailedLoadClearsLoadingState)
{
  config.startup_grace = milliseconds(0);
  Rebuild();
  manager->CreateView("wiki", "https://wiki.example");
  view("wiki").SimulateBeginLoading();
  manager->OnFailLoading("wiki", Failure(-105, "Name not resolved", "https://wiki.example"));

  auto loading = sink.Of(ShellEventType::Loading);
  ASSERT_EQ(loading.size(), 2u);
  EXPECT_TRUE(loading[0].flag);
  EXPECT_FALSE(loading.back().flag);
  EXPECT_EQ(loading.back().view_id, "wiki");
  EXPECT_EQ(Types(), (std::vector<std::string>{"loading", "loading", "error"}));
}

TEST_F(ViewManagerTest, SuppressedStartupFailureStillClearsLoadingState)
{
  manager->CreateView("wiki", "https://wiki.example");
  view("wiki").SimulateBeginLoading();
  manager->OnFailLoading("wiki", Failure(-105, "Name not resolved", "https://wiki.example"));

  EXPECT_EQ(sink.Count(ShellEventType::Error), 0u);
  auto loading = sink.Of(ShellEventType::Loading);
  ASSERT_EQ(loading.size(), 2u);
  EXPECT_FALSE(loading.back().flag);
}

TEST_F(ViewManagerTest, SubframeFailuresAreNeverReported)
{
  config.startup_grace = milliseconds(0);
  Rebuild();
  manager->CreateView("wiki", "https://wiki.example");
  manager->OnFailLoading("wiki", Failure(-3, "Aborted", "https://ads.example", false));
  EXPECT_EQ(sink.Count(ShellEventType::Error), 0u);
  EXPECT_EQ(sink.Count(ShellEventType::Loading), 0u);
}

TEST_F(ViewManagerTest, InitializeRestartsStartupGrace)
{
  clock.Advance(runner, milliseconds(20000));
  std::vector<StandardAppEntry> apps = {{"wiki", "https://wiki.example", "Wiki", true}};
  manager->InitializeStandardApps(apps);
  manager->OnFailLoading("wiki", Failure(-105, "Name not resolved", "https://wiki.example"));
  EXPECT_EQ(sink.Count(ShellEventType::Error), 0u);
}

TEST_F(ViewManagerTest, NavigationIsReported)
{
  manager->CreateView("wiki", "https://wiki.example");
  view("wiki").SimulateNavigate("https://wiki.example/page");
  auto navigated = sink.Of(ShellEventType::Navigated);
  ASSERT_EQ(navigated.size(), 1u);
  EXPECT_EQ(navigated[0].url, "https://wiki.example/page");
  EXPECT_EQ(manager->GetViewURL("wiki"), "https://wiki.example/page");
  EXPECT_EQ(manager->GetViewURL("ghost"), "");
}

TEST_F(ViewManagerTest, NavigateAndReloadUnknownViews)
{
  EXPECT_FALSE(manager->NavigateView("ghost", "https://x.example"));
  EXPECT_FALSE(manager->ReloadView("ghost"));

  manager->CreateView("wiki", "https://wiki.example");
  EXPECT_TRUE(manager->NavigateView("WIKI", "https://wiki.example/b"));
  EXPECT_TRUE(manager->ReloadView("wiki"));
  EXPECT_EQ(view("wiki").loads.back(), "https://wiki.example/b");
  EXPECT_EQ(view("wiki").reload_count, 1);
}

TEST_F(ViewManagerTest, ExecuteScriptReturnsResultOrError)
{
  EXPECT_EQ(manager->ExecuteScript("ghost", "1").error, ViewError::NotFound);

  manager->CreateView("wiki", "https://wiki.example");
  view("wiki").script_handler = [](const std::string &, std::string *result, std::string *) {
    *result = "42";
    return true;
  };
  ScriptResult result = manager->ExecuteScript("wiki", "6*7");
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.value, "42");
}

TEST_F(ViewManagerTest, NewWindowRequestsAreRouted)
{
  manager->CreateView("bbb", "https://bbb.example");
  manager->OnNewWindowRequested("bbb", "https://bbb.bbz-rd-eck.de/bigbluebutton/api/join?meetingID=1");
  manager->OnNewWindowRequested("bbb", "https://docs.example/file.pdf");
  manager->OnNewWindowRequested("ghost", "https://docs.example/other.pdf");

  auto external = sink.Of(ShellEventType::ExternalOpenRequested);
  ASSERT_EQ(external.size(), 1u);
  EXPECT_EQ(external[0].url, "https://bbb.bbz-rd-eck.de/bigbluebutton/api/join?meetingID=1");

  auto internal = sink.Of(ShellEventType::NewWindowRequested);
  ASSERT_EQ(internal.size(), 1u);
  EXPECT_EQ(internal[0].ToJSON(),
            R"({"type":"new-window-requested","payload":{"url":"https://docs.example/file.pdf","title":"AppDock"}})");
}

TEST_F(ViewManagerTest, ContextMenuNeedsSelection)
{
  manager->CreateView("wiki", "https://wiki.example");
  manager->OnContextMenu("wiki", "", 10, 20);
  manager->OnContextMenu("wiki", "Stundenplan", 10, 20);
  auto menus = sink.Of(ShellEventType::ContextMenu);
  ASSERT_EQ(menus.size(), 1u);
  EXPECT_EQ(menus[0].selection_text, "Stundenplan");
  EXPECT_EQ(menus[0].x, 10);
  EXPECT_EQ(menus[0].y, 20);
}

TEST_F(ViewManagerTest, KeyEventsReachShortcutInterceptor)
{
  manager->CreateView("moodle", "https://moodle.example");
  ContentViewListener *listener = view("moodle").listener;

  EXPECT_TRUE(listener->OnBeforeKeyEvent("moodle", Chord("P", true, true)));
  auto forwarded = sink.Of(ShellEventType::ShortcutForwarded);
  ASSERT_EQ(forwarded.size(), 1u);
  EXPECT_EQ(forwarded[0].action, "command-palette");
  EXPECT_EQ(forwarded[0].view_id, "moodle");

  EXPECT_FALSE(listener->OnBeforeKeyEvent("moodle", Chord("x", false)));
}

TEST_F(ViewManagerTest, ConfiguredShortcutsReplaceDefaults)
{
  ShortcutBinding binding;
  ASSERT_TRUE(ShortcutInterceptor::ParseAccelerator("Ctrl+D", "open-downloads", binding));
  ShortcutInterceptor::MergeBinding(config.shortcuts, binding);
  Rebuild();

  manager->CreateView("moodle", "https://moodle.example");
  EXPECT_TRUE(manager->OnBeforeKeyEvent("moodle", Chord("d", true)));
  EXPECT_EQ(sink.Of(ShellEventType::ShortcutForwarded).at(0).action, "open-downloads");
}

TEST_F(ViewManagerTest, ShowSwitchesAndHideClears)
{
  manager->CreateView("a", "https://a.example");
  manager->CreateView("b", "https://b.example");
  EXPECT_TRUE(manager->ShowView("a"));
  EXPECT_TRUE(manager->ShowView("b"));
  EXPECT_FALSE(manager->ShowView("ghost"));
  EXPECT_EQ(manager->active_view_id(), "b");
  EXPECT_EQ(window.children, (std::vector<std::string>{"b"}));

  manager->HideView();
  EXPECT_TRUE(window.children.empty());
  EXPECT_EQ(Types(), (std::vector<std::string>{"activated", "activated", "activated"}));
  EXPECT_EQ(sink.events.back().ToJSON(), R"({"type":"activated","payload":{"id":null}})");
}

TEST_F(ViewManagerTest, SidebarAndResizeUpdateActiveBounds)
{
  manager->CreateView("a", "https://a.example");
  manager->ShowView("a");
  manager->SetSidebarState(true);
  EXPECT_TRUE(manager->sidebar_open());
  EXPECT_EQ(view("a").bounds, (ViewBounds{0, 48, 750, 752}));

  window.window = {0, 0, 1000, 700};
  manager->OnWindowResized();
  manager->OnWindowResized();
  clock.Advance(runner, milliseconds(16));
  EXPECT_EQ(view("a").bounds, (ViewBounds{0, 48, 550, 652}));

  manager->SetOverlayState(true);
  EXPECT_TRUE(manager->overlay_open());
  EXPECT_EQ(view("a").bounds, (ViewBounds{0, 48, 550, 652}));
}

TEST_F(ViewManagerTest, LayoutStateReadsBack)
{
  EXPECT_FALSE(manager->sidebar_open());
  EXPECT_FALSE(manager->overlay_open());

  manager->SetSidebarState(true);
  manager->SetOverlayState(true);
  EXPECT_TRUE(manager->sidebar_open());
  EXPECT_TRUE(manager->overlay_open());

  manager->SetSidebarState(false);
  EXPECT_FALSE(manager->sidebar_open());
  EXPECT_TRUE(manager->overlay_open());
  manager->SetOverlayState(false);
  EXPECT_FALSE(manager->overlay_open());
}

TEST_F(ViewManagerTest, DestroyUnknownViewLeavesOthersUntouched)
{
  manager->CreateView("a", "https://a.example");
  manager->CreateView("b", "https://b.example");
  manager->CreateView("c", "https://c.example");
  ASSERT_TRUE(manager->ShowView("b"));
  size_t events_before = sink.events.size();

  EXPECT_FALSE(manager->DestroyView("ghost"));

  ManagerStats stats = manager->GetStats();
  EXPECT_EQ(stats.ids, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(stats.active_view_id, "b");
  EXPECT_TRUE(factory.destroyed.empty());
  EXPECT_EQ(window.children, (std::vector<std::string>{"b"}));
  EXPECT_EQ(sink.events.size(), events_before);
}

TEST_F(ViewManagerTest, ListedIdsTrackCreateAndDestroy)
{
  typedef std::vector<std::string> Ids;
  auto expect_ids = [this](const Ids &ids) {
    EXPECT_EQ(manager->GetStats().ids, ids);
    EXPECT_EQ(manager->GetStats().total_views, ids.size());
  };

  manager->CreateView("a", "https://a.example");
  manager->CreateView("b", "https://b.example");
  expect_ids(Ids{"a", "b"});

  EXPECT_TRUE(manager->DestroyView("a"));
  expect_ids(Ids{"b"});

  manager->CreateView("c", "https://c.example");
  expect_ids(Ids{"b", "c"});

  EXPECT_FALSE(manager->DestroyView("a"));
  expect_ids(Ids{"b", "c"});

  EXPECT_TRUE(manager->CreateView("a", "https://a.example/again").created);
  expect_ids(Ids{"a", "b", "c"});
  EXPECT_EQ(manager->GetViewURL("a"), "https://a.example/again");

  EXPECT_TRUE(manager->DestroyView("c"));
  EXPECT_TRUE(manager->DestroyView("b"));
  expect_ids(Ids{"a"});

  EXPECT_EQ(factory.destroyed, (Ids{"a", "c", "b"}));
}

TEST_F(ViewManagerTest, DestroyActiveViewDetachesWithoutEvent)
{
  manager->CreateView("a", "https://a.example");
  manager->ShowView("a");
  sink.events.clear();

  EXPECT_TRUE(manager->DestroyView("A"));
  EXPECT_TRUE(window.children.empty());
  EXPECT_TRUE(manager->active_view_id().empty());
  EXPECT_EQ(factory.destroyed, (std::vector<std::string>{"a"}));
  EXPECT_EQ(sink.Count(ShellEventType::Activated), 0u);
  EXPECT_FALSE(manager->DestroyView("a"));

  // A late focus task for the destroyed view is harmless
  EXPECT_NO_THROW(runner.RunPendingTasks());
}

TEST_F(ViewManagerTest, StandardAppsAreCreatedOnce)
{
  std::vector<StandardAppEntry> apps = {
      {"schulcloud", "https://app.schul.cloud", "schul.cloud", true},
      {"moodle", "https://portal.bbz-rd-eck.com", "Moodle", true},
      {"hidden", "https://hidden.example", "Hidden", false},
  };
  EXPECT_EQ(manager->InitializeStandardApps(apps), 2u);
  EXPECT_EQ(manager->InitializeStandardApps(apps), 0u);
  EXPECT_EQ(factory.create_count, 2);
  EXPECT_TRUE(manager->initialized());

  manager->CreateView("custom", "https://custom.example");
  ManagerStats stats = manager->GetStats();
  EXPECT_EQ(stats.total_views, 3u);
  EXPECT_EQ(stats.standard_app_count, 2u);
  EXPECT_EQ(stats.ToJSON(), R"({"totalViews":3,"standardAppCount":2,"activeViewId":null,"initialized":true,)"
                            R"("ids":["custom","moodle","schulcloud"]})");
  EXPECT_TRUE(view("moodle").options.is_standard_app);
  EXPECT_EQ(view("moodle").options.title, "Moodle");
}

TEST_F(ViewManagerTest, StandardAppFailureDoesNotStopOthers)
{
  std::vector<StandardAppEntry> apps = {
      {"moodle", "https://portal.bbz-rd-eck.com", "Moodle", true},
      {"wiki", "https://wiki.example", "Wiki", true},
  };
  factory.throw_on_create = true;
  EXPECT_EQ(manager->InitializeStandardApps(apps), 0u);
  EXPECT_EQ(factory.create_count, 2);

  size_t failures = 0;
  for (const auto &e : sink.Of(ShellEventType::DiagnosticLog))
  {
    if (e.log_type == "standard-app-failure")
      ++failures;
  }
  EXPECT_EQ(failures, 2u);
}

TEST_F(ViewManagerTest, CredentialsInjectedAfterLoad)
{
  store.secrets["email"] = "lehrer@bbz.example";
  manager->CreateView("moodle", "https://portal.bbz-rd-eck.com");
  view("moodle").SimulateFinishLoading("https://portal.bbz-rd-eck.com/login/index.php");
  runner.RunPendingTasks();

  ASSERT_EQ(view("moodle").messages.size(), 1u);
  EXPECT_EQ(view("moodle").messages[0].first, "inject-credentials");

  EXPECT_TRUE(manager->TriggerCredentialInjection("MOODLE", "office"));
  EXPECT_FALSE(manager->TriggerCredentialInjection("ghost", "office"));
  runner.RunPendingTasks();
  EXPECT_EQ(view("moodle").messages.size(), 2u);
}

TEST_F(ViewManagerTest, MessengerBadgeIsPolled)
{
  manager->CreateView("schulcloud", "https://app.schul.cloud");
  view("schulcloud").script_handler = [](const std::string &, std::string *result, std::string *) {
    *result = "https://app.schul.cloud/favicon-unread.png";
    return true;
  };
  view("schulcloud").SimulateFinishLoading("https://app.schul.cloud/");
  clock.Advance(runner, milliseconds(2000));

  auto badges = sink.Of(ShellEventType::BadgeUpdate);
  ASSERT_EQ(badges.size(), 1u);
  EXPECT_TRUE(badges[0].flag);

  manager->DestroyView("schulcloud");
  clock.Advance(runner, milliseconds(3000));
  EXPECT_EQ(runner.pending_count(), 0u);
}

TEST_F(ViewManagerTest, CallbacksForUnknownViewsAreIgnored)
{
  manager->OnBeginLoading("ghost");
  manager->OnFinishLoading("ghost", "https://x.example");
  manager->OnNavigate("ghost", "https://x.example");
  manager->OnContextMenu("ghost", "text", 1, 1);
  EXPECT_FALSE(manager->OnBeforeKeyEvent("ghost", Chord("F5", false)));
  EXPECT_TRUE(sink.events.empty());
}

TEST_F(ViewManagerTest, CleanupDestroysEverythingAndIsRepeatable)
{
  manager->InitializeStandardApps({{"moodle", "https://portal.bbz-rd-eck.com", "Moodle", true},
                                   {"schulcloud", "https://app.schul.cloud", "schul.cloud", true}});
  manager->ShowView("moodle");
  view("schulcloud").SimulateFinishLoading("https://app.schul.cloud/");
  runner.RunPendingTasks();
  EXPECT_EQ(runner.pending_count(), 1u);

  manager->Cleanup();
  EXPECT_EQ(manager->GetStats().total_views, 0u);
  EXPECT_FALSE(manager->initialized());
  EXPECT_TRUE(window.children.empty());
  EXPECT_EQ(factory.destroyed.size(), 2u);
  EXPECT_EQ(runner.pending_count(), 0u);

  manager->Cleanup();
  EXPECT_EQ(factory.destroyed.size(), 2u);

  EXPECT_EQ(manager->InitializeStandardApps({{"wiki", "https://wiki.example", "Wiki", true}}), 1u);
}

TEST_F(ViewManagerTest, UnreachableHostDoesNotBreakLifecycle)
{
  sink.reachable = false;
  manager->CreateView("wiki", "https://wiki.example");
  view("wiki").SimulateBeginLoading();
  view("wiki").SimulateFinishLoading("https://wiki.example");
  EXPECT_TRUE(manager->ShowView("wiki"));
  EXPECT_TRUE(manager->FindView("wiki")->state.is_loaded);
}
