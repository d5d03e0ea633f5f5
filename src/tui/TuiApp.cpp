#include "tui/TuiAppInternal.h"

#include "backend/EventChannel.h"
#include "backend/LogStore.h"

#include <QCoreApplication>
#include <QList>

#include <algorithm>

#include <curses.h>
#include <errno.h>
#include <poll.h>
#include <unistd.h>

namespace faderstui {

static WINDOW* createMixerWindow()
{
  int height = 0;
  int width = 0;
  getmaxyx(stdscr, height, width);

  const int rows = std::max(1, height - 2 * kWindowBorder);
  const int cols = std::max(1, width - 2 * kWindowBorder);
  WINDOW* win = newwin(rows, cols, kWindowBorder, kWindowBorder);
  if (win) {
    keypad(win, TRUE);
    nodelay(win, TRUE);
  }
  return win;
}

static void recreateWindow(WINDOW*& win)
{
  if (win) {
    delwin(win);
  }
  endwin();
  refresh();
  win = createMixerWindow();
}

// Blocks until a key or an event record is available. Signals (SIGWINCH)
// also wake it so the resize key can be picked up.
static void waitForInput(int pipeFd)
{
  pollfd fds[2]{};
  fds[0].fd = STDIN_FILENO;
  fds[0].events = POLLIN;
  fds[1].fd = pipeFd;
  fds[1].events = POLLIN;
  const int res = ::poll(fds, pipeFd >= 0 ? 2 : 1, -1);
  if (res < 0 && errno != EINTR) {
    LogStore::log(LogStore::Level::Warning, QStringLiteral("Faders/Tui"), QStringLiteral("poll failed: %1").arg(errno));
  }
}

static bool drainEvents(EntityRegistry& registry, EventPipe& pipe, LoopOutcome* outcome)
{
  QList<PendingEvent> events;
  QString err;
  const EventPipe::ReadStatus st = pipe.readEvents(&events, &err);
  for (const auto& ev : events) {
    registry.enqueue(ev);
  }

  switch (st) {
  case EventPipe::ReadStatus::Ok:
    return true;
  case EventPipe::ReadStatus::WriterClosed:
    LogStore::log(LogStore::Level::Error, QStringLiteral("Faders/Tui"), QStringLiteral("Event monitor closed its pipe"));
    *outcome = LoopOutcome::ChannelDied;
    return false;
  case EventPipe::ReadStatus::Malformed:
  case EventPipe::ReadStatus::Error:
    LogStore::log(LogStore::Level::Error, QStringLiteral("Faders/Tui"), QStringLiteral("Event stream broken: %1").arg(err));
    *outcome = LoopOutcome::Reexec;
    return false;
  }
  return true;
}

bool prepareIteration(EntityRegistry& registry, EventPipe& pipe, bool channelAlive, const bool& rebuildRequested, LoopOutcome* outcome)
{
  if (!channelAlive) {
    LogStore::log(LogStore::Level::Error, QStringLiteral("Faders/Tui"), QStringLiteral("Event monitor died unexpectedly"));
    *outcome = LoopOutcome::ChannelDied;
    return false;
  }

  if (!drainEvents(registry, pipe, outcome)) {
    return false;
  }
  registry.applyPendingEvents();

  if (!rebuildRequested && registry.isEmpty()) {
    QString err;
    if (!registry.refresh(false, &err)) {
      *outcome = LoopOutcome::Rebuild;
      return false;
    }
  }
  if (rebuildRequested) {
    *outcome = LoopOutcome::Rebuild;
    return false;
  }
  return true;
}

bool recordsWaiting(const EventPipe& pipe)
{
  return pipe.hasData(0);
}

LoopOutcome runTuiLoop(EntityRegistry& registry, EventChannel& channel, TuiState& state, const bool& rebuildRequested)
{
  WINDOW* win = createMixerWindow();
  if (!win) {
    LogStore::log(LogStore::Level::Error, QStringLiteral("Faders/Tui"), QStringLiteral("Cannot create the mixer window"));
    return LoopOutcome::Rebuild;
  }

  LoopOutcome outcome = LoopOutcome::Quit;
  state.running = true;
  if (state.highlight.isEmpty()) {
    state.highlight = registry.firstKey();
  }

  while (state.running) {
    QCoreApplication::processEvents();

    if (!prepareIteration(registry, channel.pipe(), channel.isAlive(), rebuildRequested, &outcome)) {
      break;
    }

    syncHighlight(registry, state);

    if (state.recreateWindow) {
      recreateWindow(win);
      state.recreateWindow = false;
      if (!win) {
        outcome = LoopOutcome::Rebuild;
        break;
      }
    }

    if (renderTuiFrame(win, registry, state) == FrameStatus::Aborted) {
      continue;
    }

    // new records take priority over input
    if (recordsWaiting(channel.pipe())) {
      continue;
    }

    waitForInput(channel.pipe().readFd());

    const int ch = wgetch(win);
    if (ch == ERR) {
      continue;
    }
    LogStore::log(LogStore::Level::Trace, QStringLiteral("Faders/Tui"), QStringLiteral("Key %1").arg(ch));
    handleTuiKey(ch, registry, state);
  }

  if (win) {
    delwin(win);
  }
  return outcome;
}

} // namespace faderstui
