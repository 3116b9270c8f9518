#include "ViewTypes.h"

const char *ViewErrorName(ViewError error)
{
  switch (error)
  {
  case ViewError::None:
    return "none";
  case ViewError::NotFound:
    return "not-found";
  case ViewError::AlreadyExists:
    return "already-exists";
  case ViewError::AttachFailure:
    return "attach-failure";
  case ViewError::DetachFailure:
    return "detach-failure";
  case ViewError::LoadFailure:
    return "load-failure";
  case ViewError::InjectionFailure:
    return "injection-failure";
  case ViewError::ProbeFailure:
    return "probe-failure";
  case ViewError::ScriptFailure:
    return "script-failure";
  }
  return "unknown";
}
