#pragma once
#include <AppCore/AppCore.h>
#include "BackgroundExecutor.h"
#include "CredentialStore.h"
#include "ShellConfig.h"
#include "ShellUI.h"
#include "TaskRunner.h"
#include <memory>

using namespace ultralight;

class Shell : public AppListener
{
public:
  Shell();
  virtual ~Shell();

  virtual void Run();

  // Inherited from AppListener, once per frame before painting
  virtual void OnUpdate() override;

protected:
  ShellConfig config_;
  RefPtr<App> app_;
  RefPtr<Window> window_;
  TaskRunner runner_;
  EnvCredentialStore store_;
  // Declared after runner_/store_: joined before they go away
  ThreadExecutor executor_;
  std::unique_ptr<ShellUI> ui_;
};
