#include "Shell.h"
#include <Ultralight/platform/Platform.h>
#include <Ultralight/platform/Config.h>
#include <Ultralight/Renderer.h>
#include <iostream>

Shell::Shell() : config_(ShellConfig::Defaults())
{
  config_.LoadFromDirectory("assets");
  config_.ApplyEnvironment();

  Settings settings;
  settings.developer_name = "AppDock";
  settings.app_name = "AppDock";
  Config config;
  config.scroll_timer_delay = 1.0 / 90.0;
  app_ = App::Create(settings, config);
  app_->set_listener(this);

  window_ = Window::Create(app_->main_monitor(), 1280, 800, false,
                           kWindowFlags_Titled | kWindowFlags_Resizable | kWindowFlags_Maximizable);
  window_->SetTitle("AppDock");

  ui_.reset(new ShellUI(window_, runner_, store_, executor_, config_));
  window_->set_listener(ui_.get());

  std::cout << "[Shell] " << config_.standard_apps.size() << " standard apps configured, log level "
            << SeverityName(config_.log_level) << std::endl;
}

Shell::~Shell()
{
  app_->set_listener(nullptr);
  window_->set_listener(nullptr);

  ui_.reset();
  executor_.Shutdown();

  window_ = nullptr;
  app_ = nullptr;
}

void Shell::Run()
{
  app_->Run();
}

void Shell::OnUpdate()
{
  runner_.RunPendingTasks();
}
