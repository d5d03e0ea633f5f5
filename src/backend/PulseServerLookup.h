#pragma once

#include <QString>

// Locates the sound server's D-Bus protocol socket.
class PulseServerLookup final
{
public:
  static QString serviceUnknownError();

  // Empty on failure. With allowStart, a missing lookup service triggers one
  // "pulseaudio --start" and a single retry.
  static QString resolveAddress(bool allowStart, QString* error = nullptr);

private:
  static QString addressFromSessionBus(QString* errorName, QString* error);
  static bool startServer(QString* error);
};
