#pragma once

#include "settings/MixerSettings.h"

#include <QStringList>

namespace faderstui {

// Owns the terminal, the event monitor and the registry; rebuilds them
// in-process after a registry failure and re-executes the binary when the
// event stream itself is broken.
class Supervisor final
{
public:
  Supervisor(MixerSettings settings, QStringList arguments);

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  // Process exit code.
  int run();

private:
  [[noreturn]] void reexec();

  MixerSettings m_settings;
  QStringList m_arguments;
};

} // namespace faderstui
