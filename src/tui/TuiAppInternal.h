#pragma once

#include "tui/TuiInternal.h"

#include "backend/EntityRegistry.h"

#include <QString>
#include <QVector>

class EventChannel;
class EventPipe;

// matches the typedef in <curses.h>
typedef struct _win_st WINDOW;

namespace faderstui {

struct TuiState final {
  QString highlight;
  float adjustStep = 0.05f;
  QString encoding = QStringLiteral("utf-8");

  bool running = true;
  bool recreateWindow = false;
};

enum class KeyAction {
  None,
  Next,
  Prev,
  VolumeDown,
  VolumeUp,
  ToggleMute,
  Quit,
  Resize,
};

enum class FrameStatus {
  Drawn,
  Aborted, // an entity vanished or a remote call gave up; redo the iteration
};

struct FrameRow final {
  QString name;
  bool highlighted = false;
  bool muted = false;
  float volume = 0.0f;
};

struct Frame final {
  RowLayout layout;
  int width = 0;
  QVector<FrameRow> rows;
};

enum class LoopOutcome {
  Quit,
  ChannelDied,
  Rebuild, // registry gave up; tear down and rebuild in-process
  Reexec,  // event stream is corrupt; restart the whole process
};

KeyAction keyActionFor(int ch);
FrameStatus applyKeyAction(KeyAction action, EntityRegistry& registry, TuiState& state);
FrameStatus handleTuiKey(int ch, EntityRegistry& registry, TuiState& state);

// Highlight falls back to the first entity when its entity is gone.
void syncHighlight(const EntityRegistry& registry, TuiState& state);

// Collects everything a frame shows. Only the bottom window row is left out.
FrameStatus buildFrame(EntityRegistry& registry, const TuiState& state, int rows, int width, Frame* out);
FrameStatus renderTuiFrame(WINDOW* win, EntityRegistry& registry, const TuiState& state);

// Drains the event pipe into the registry and refills an emptied registry.
// Returns false with the outcome set when the loop has to end.
bool prepareIteration(EntityRegistry& registry, EventPipe& pipe, bool channelAlive, const bool& rebuildRequested, LoopOutcome* outcome);
// Records that arrived while drawing are handled before the next key.
bool recordsWaiting(const EventPipe& pipe);

LoopOutcome runTuiLoop(EntityRegistry& registry, EventChannel& channel, TuiState& state, const bool& rebuildRequested);

} // namespace faderstui
