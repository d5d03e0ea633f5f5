#include "tui/TuiAppInternal.h"

#include <algorithm>

#include <curses.h>

namespace faderstui {

FrameStatus buildFrame(EntityRegistry& registry, const TuiState& state, int rows, int width, Frame* out)
{
  out->rows.clear();
  out->width = width;
  out->layout = computeRowLayout(width, registry.maxNameLength());
  if (width <= 1) {
    return FrameStatus::Drawn;
  }

  const bool needMute = showsMute(out->layout, width);
  const bool needVolume = showsBar(out->layout, width);

  const QStringList names = registry.names();
  for (const auto& name : names) {
    if (out->rows.size() >= rows - 1) {
      break;
    }

    FrameRow row;
    row.name = name;
    row.highlighted = (name == state.highlight);

    if (needMute && registry.mute(name, &row.muted) != RemoteResult::Ok) {
      return FrameStatus::Aborted;
    }
    if (needVolume && registry.volume(name, &row.volume) != RemoteResult::Ok) {
      return FrameStatus::Aborted;
    }
    out->rows.push_back(row);
  }
  return FrameStatus::Drawn;
}

static void drawRow(WINDOW* win, int y, const FrameRow& row, const Frame& frame, const QString& encoding)
{
  const int width = frame.width;
  const RowLayout& layout = frame.layout;

  const QByteArray name = encodeForTerminal(fitName(row.name, layout.nameWidth), encoding);
  if (row.highlighted) {
    wattron(win, A_REVERSE);
  }
  mvwaddnstr(win, y, 0, name.constData(), std::max(0, width));
  if (row.highlighted) {
    wattroff(win, A_REVERSE);
  }

  if (!showsMute(layout, width)) {
    return;
  }
  mvwaddstr(win, y, layout.nameWidth, muteIndicator(row.muted));

  if (showsBar(layout, width)) {
    const QByteArray bar = volumeBarText(row.volume, layout.barWidth).toLatin1();
    mvwaddnstr(win, y, layout.nameWidth + kMuteWidth, bar.constData(), std::max(0, width - layout.nameWidth - kMuteWidth));
  }
}

FrameStatus renderTuiFrame(WINDOW* win, EntityRegistry& registry, const TuiState& state)
{
  int height = 0;
  int width = 0;
  getmaxyx(win, height, width);

  Frame frame;
  if (buildFrame(registry, state, height, width, &frame) == FrameStatus::Aborted) {
    return FrameStatus::Aborted;
  }

  werase(win);
  for (int i = 0; i < frame.rows.size(); i++) {
    drawRow(win, i, frame.rows.at(i), frame, state.encoding);
  }
  wrefresh(win);
  return FrameStatus::Drawn;
}

} // namespace faderstui
