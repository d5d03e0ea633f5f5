#include "tui/TuiInternal.h"

#include <QStringEncoder>

namespace faderstui {

namespace {
const QString kCapOpen = QStringLiteral(" [ ");
const QString kCapClose = QStringLiteral(" ]");
} // namespace

int barCapsWidth()
{
  return static_cast<int>(kCapOpen.size() + kCapClose.size());
}

QString volumeBarText(float volume, int barWidth)
{
  if (barWidth <= 0) {
    return QString();
  }
  const int fill = barFillFor(volume, barWidth);
  return kCapOpen + QString(fill, QLatin1Char(kBarFilled)) + QString(barWidth - fill, QLatin1Char(kBarTrack)) + kCapClose;
}

const char* muteIndicator(bool muted)
{
  return muted ? " M" : " -";
}

QString fitName(const QString& name, int width)
{
  if (width <= 0) {
    return QString();
  }
  return name.left(width);
}

QByteArray encodeForTerminal(const QString& text, const QString& encoding)
{
  QStringEncoder encoder(encoding.toLatin1().constData());
  if (!encoder.isValid()) {
    return text.toUtf8();
  }
  return encoder.encode(text);
}

} // namespace faderstui
