#pragma once

#include <QString>

namespace SettingsKeys {
inline QString adjustStep()
{
  return QStringLiteral("default/adjust-step");
}

inline QString maxLevel()
{
  return QStringLiteral("default/max-level");
}

inline QString useMediaName()
{
  return QStringLiteral("default/use-media-name");
}

inline QString encoding()
{
  return QStringLiteral("default/encoding");
}

inline QString verbose()
{
  return QStringLiteral("default/verbose");
}

inline QString debug()
{
  return QStringLiteral("default/debug");
}
} // namespace SettingsKeys
