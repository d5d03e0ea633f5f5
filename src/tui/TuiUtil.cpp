#include "tui/TuiInternal.h"

#include <algorithm>
#include <cmath>

namespace faderstui {

float clampVolume(float v)
{
  if (!std::isfinite(v)) {
    return 0.0f;
  }
  return std::clamp(v, 0.0f, 1.0f);
}

RowLayout computeRowLayout(int width, int maxNameLength)
{
  const int fixed = kMuteWidth + barCapsWidth();

  RowLayout out;
  out.nameWidth = maxNameLength;
  out.barWidth = width - out.nameWidth - fixed;
  if (out.barWidth < kBarMinWidth) {
    out.nameWidth = std::max(kNameMinWidth, out.nameWidth + out.barWidth - kBarMinWidth);
    out.barWidth = width - out.nameWidth - fixed;
    if (out.barWidth <= 0) {
      out.nameWidth = width;
    }
    if (out.nameWidth < kNameMinWidth) {
      out.nameWidth = std::min(maxNameLength, width);
    }
  }
  return out;
}

bool showsMute(const RowLayout& layout, int width)
{
  return width > layout.nameWidth + kMuteWidth;
}

bool showsBar(const RowLayout& layout, int width)
{
  return showsMute(layout, width) && layout.barWidth > 0;
}

int barFillFor(float volume, int barWidth)
{
  if (barWidth <= 0) {
    return 0;
  }
  const int fill = static_cast<int>(std::lround(clampVolume(volume) * static_cast<float>(barWidth)));
  return std::clamp(fill, 0, barWidth);
}

} // namespace faderstui
