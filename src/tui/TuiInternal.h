#pragma once

#include <QByteArray>
#include <QString>

namespace faderstui {
inline constexpr int kWindowBorder = 1;
inline constexpr int kNameMinWidth = 10;
inline constexpr int kBarMinWidth = 10;
inline constexpr int kMuteWidth = 2;
inline constexpr char kBarFilled = '#';
inline constexpr char kBarTrack = '-';

inline constexpr int kHandshakeTimeoutMs = 10000;
inline constexpr int kRebuildBackoffMs = 1000;

struct RowLayout final {
  int nameWidth = 0;
  int barWidth = 0; // fill area only, without caps
};

// Name column shrinks (down to kNameMinWidth) before the bar drops under
// kBarMinWidth; with no room left the row degrades to the name alone.
RowLayout computeRowLayout(int width, int maxNameLength);
bool showsMute(const RowLayout& layout, int width);
bool showsBar(const RowLayout& layout, int width);

int barCapsWidth();
int barFillFor(float volume, int barWidth);
QString volumeBarText(float volume, int barWidth);
const char* muteIndicator(bool muted);

QString fitName(const QString& name, int width);
QByteArray encodeForTerminal(const QString& text, const QString& encoding);
float clampVolume(float v);
} // namespace faderstui
