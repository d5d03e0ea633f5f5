#include "tui/TuiAppInternal.h"

#include <curses.h>

namespace faderstui {

KeyAction keyActionFor(int ch)
{
  switch (ch) {
  case KEY_DOWN:
  case 'j':
  case 'n':
    return KeyAction::Next;
  case KEY_UP:
  case 'k':
  case 'p':
    return KeyAction::Prev;
  case KEY_LEFT:
  case 'h':
  case 'b':
    return KeyAction::VolumeDown;
  case KEY_RIGHT:
  case 'l':
  case 'f':
    return KeyAction::VolumeUp;
  case ' ':
  case 'm':
    return KeyAction::ToggleMute;
  case 'q':
    return KeyAction::Quit;
  case KEY_RESIZE:
  case '\f':
    return KeyAction::Resize;
  default:
    return KeyAction::None;
  }
}

static FrameStatus statusFor(RemoteResult res)
{
  return res == RemoteResult::Ok ? FrameStatus::Drawn : FrameStatus::Aborted;
}

static FrameStatus adjustVolume(EntityRegistry& registry, const QString& name, float delta)
{
  float current = 0.0f;
  const RemoteResult got = registry.volume(name, &current);
  if (got != RemoteResult::Ok) {
    return statusFor(got);
  }
  return statusFor(registry.setVolume(name, current + delta));
}

FrameStatus applyKeyAction(KeyAction action, EntityRegistry& registry, TuiState& state)
{
  switch (action) {
  case KeyAction::None:
    break;
  case KeyAction::Next:
    state.highlight = registry.nextKey(state.highlight);
    break;
  case KeyAction::Prev:
    state.highlight = registry.prevKey(state.highlight);
    break;
  case KeyAction::VolumeDown:
    return adjustVolume(registry, state.highlight, -state.adjustStep);
  case KeyAction::VolumeUp:
    return adjustVolume(registry, state.highlight, state.adjustStep);
  case KeyAction::ToggleMute: {
    bool muted = false;
    const RemoteResult got = registry.mute(state.highlight, &muted);
    if (got != RemoteResult::Ok) {
      return statusFor(got);
    }
    return statusFor(registry.setMute(state.highlight, !muted));
  }
  case KeyAction::Quit:
    state.running = false;
    break;
  case KeyAction::Resize:
    state.recreateWindow = true;
    break;
  }
  return FrameStatus::Drawn;
}

FrameStatus handleTuiKey(int ch, EntityRegistry& registry, TuiState& state)
{
  return applyKeyAction(keyActionFor(ch), registry, state);
}

void syncHighlight(const EntityRegistry& registry, TuiState& state)
{
  if (!registry.contains(state.highlight)) {
    state.highlight = registry.firstKey();
  }
}

} // namespace faderstui
