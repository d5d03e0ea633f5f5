#include "tui/Supervisor.h"

#include "backend/EventChannel.h"
#include "backend/LogStore.h"
#include "backend/PulseDBusEndpoint.h"
#include "tui/TuiAppInternal.h"

#include <QByteArrayList>
#include <QCoreApplication>
#include <QThread>

#include <cstdio>
#include <cstdlib>
#include <utility>
#include <vector>

#include <curses.h>
#include <unistd.h>

namespace faderstui {

namespace {

const QString kEventConnection = QStringLiteral("faders-events");
const QString kControlConnection = QStringLiteral("faders-control");

void logSupervisor(LogStore::Level level, const QString& message)
{
  LogStore::log(level, QStringLiteral("Faders/Supervisor"), message);
}

struct TerminalSession final {
  TerminalSession()
  {
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    use_default_colors();
    refresh();
  }
  ~TerminalSession() { endwin(); }

  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;
};

enum class SessionEnd {
  Quit,
  Fatal,
  Reexec,
};

} // namespace

Supervisor::Supervisor(MixerSettings settings, QStringList arguments)
    : m_settings(std::move(settings))
    , m_arguments(std::move(arguments))
{
}

int Supervisor::run()
{
  SessionEnd end = SessionEnd::Quit;
  {
    TerminalSession terminal;

    TuiState state;
    state.adjustStep = MixerSettingsStore::adjustFraction(m_settings);
    state.encoding = m_settings.encoding;

    bool firstStart = true;
    for (;;) {
      EventChannel channel(kEventConnection);
      QString err;
      if (!channel.start(&err) || !channel.waitUntilListening(kHandshakeTimeoutMs, &err)) {
        logSupervisor(LogStore::Level::Error, QStringLiteral("Event monitor did not start: %1").arg(err));
        if (firstStart) {
          end = SessionEnd::Fatal;
          break;
        }
        channel.stop();
        QThread::msleep(kRebuildBackoffMs);
        continue;
      }

      PulseDBusEndpoint endpoint(kControlConnection);
      EntityRegistry registry(&endpoint, MixerSettingsStore::registryOptions(m_settings));

      bool rebuildRequested = false;
      registry.setFailureHook([&rebuildRequested]() { rebuildRequested = true; });

      if (!registry.refresh(false, &err)) {
        logSupervisor(LogStore::Level::Error, QStringLiteral("Initial refresh failed: %1").arg(err));
        if (firstStart) {
          end = SessionEnd::Fatal;
          break;
        }
        channel.stop();
        QThread::msleep(kRebuildBackoffMs);
        continue;
      }
      // later hard refreshes reconnect the monitor as well
      registry.setReacquireHook([&channel]() { channel.reacquire(); });
      firstStart = false;

      const LoopOutcome outcome = runTuiLoop(registry, channel, state, rebuildRequested);
      channel.stop();

      if (outcome == LoopOutcome::Quit) {
        end = SessionEnd::Quit;
        break;
      }
      if (outcome == LoopOutcome::ChannelDied) {
        end = SessionEnd::Fatal;
        break;
      }
      if (outcome == LoopOutcome::Reexec) {
        end = SessionEnd::Reexec;
        break;
      }

      logSupervisor(LogStore::Level::Warning, QStringLiteral("Rebuilding after an unrecoverable registry failure"));
      QThread::msleep(kRebuildBackoffMs);
    }
  }

  if (end == SessionEnd::Reexec) {
    reexec();
  }
  return end == SessionEnd::Quit ? 0 : 1;
}

void Supervisor::reexec()
{
  logSupervisor(LogStore::Level::Warning, QStringLiteral("Restarting the process"));

  QByteArrayList args;
  for (const auto& a : m_arguments) {
    args.push_back(a.toLocal8Bit());
  }
  std::vector<char*> argv;
  argv.reserve(static_cast<size_t>(args.size()) + 1);
  for (auto& a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);

  std::fflush(stdout);
  std::fflush(stderr);

  ::execv("/proc/self/exe", argv.data());

  const QByteArray fallback = QCoreApplication::applicationFilePath().toLocal8Bit();
  ::execv(fallback.constData(), argv.data());

  std::fprintf(stderr, "faders-tui: cannot re-execute: %s\n", fallback.constData());
  std::exit(1);
}

} // namespace faderstui
