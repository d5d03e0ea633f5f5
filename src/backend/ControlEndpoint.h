#pragma once

#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <cstdint>

enum class EntityKind : int {
  Stream,
  Device,
};

// Raw property list of a remote object; values are undecoded bytes.
using PropertyList = QMap<QString, QByteArray>;

// Remote side of the mixer: one connection to the sound server's control bus,
// addressed per object path. Every call may fail when the connection is gone or
// the object went away; the error text is informational only.
class ControlEndpoint
{
public:
  virtual ~ControlEndpoint() = default;

  // Drops the current connection (if any) and connects again.
  virtual bool reconnect(QString* error = nullptr) = 0;

  virtual bool listPlaybackStreams(QStringList* paths, QString* error = nullptr) = 0;
  virtual bool listSinks(QStringList* paths, QString* error = nullptr) = 0;

  virtual bool properties(const QString& path, EntityKind kind, PropertyList* out, QString* error = nullptr) = 0;

  virtual bool volume(const QString& path, EntityKind kind, QVector<uint32_t>* levels, QString* error = nullptr) = 0;
  virtual bool setVolume(const QString& path, EntityKind kind, const QVector<uint32_t>& levels, QString* error = nullptr) = 0;

  virtual bool mute(const QString& path, EntityKind kind, bool* muted, QString* error = nullptr) = 0;
  virtual bool setMute(const QString& path, EntityKind kind, bool muted, QString* error = nullptr) = 0;
};
