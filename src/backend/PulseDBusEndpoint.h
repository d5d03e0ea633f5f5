#pragma once

#include "backend/ControlEndpoint.h"

#include <QDBusConnection>
#include <QString>
#include <QVariant>

// ControlEndpoint over the PulseAudio D-Bus protocol (peer-to-peer connection
// to the server's own socket, not the session bus).
class PulseDBusEndpoint final : public ControlEndpoint
{
public:
  explicit PulseDBusEndpoint(QString connectionName, bool allowServerStart = true);
  ~PulseDBusEndpoint() override;

  PulseDBusEndpoint(const PulseDBusEndpoint&) = delete;
  PulseDBusEndpoint& operator=(const PulseDBusEndpoint&) = delete;

  static QString coreObjectPath();
  static QString coreInterface();
  static QString interfaceFor(EntityKind kind);

  bool isConnected() const { return m_bus.isConnected(); }

  bool reconnect(QString* error = nullptr) override;

  bool listPlaybackStreams(QStringList* paths, QString* error = nullptr) override;
  bool listSinks(QStringList* paths, QString* error = nullptr) override;

  bool properties(const QString& path, EntityKind kind, PropertyList* out, QString* error = nullptr) override;

  bool volume(const QString& path, EntityKind kind, QVector<uint32_t>* levels, QString* error = nullptr) override;
  bool setVolume(const QString& path, EntityKind kind, const QVector<uint32_t>& levels, QString* error = nullptr) override;

  bool mute(const QString& path, EntityKind kind, bool* muted, QString* error = nullptr) override;
  bool setMute(const QString& path, EntityKind kind, bool muted, QString* error = nullptr) override;

private:
  void disconnect();

  bool getProperty(const QString& path, const QString& iface, const QString& name, QVariant* out, QString* error);
  bool setProperty(const QString& path, const QString& iface, const QString& name, const QVariant& value, QString* error);
  bool objectPaths(const QString& property, QStringList* paths, QString* error);

  QString m_connectionName;
  bool m_allowServerStart = true;
  bool m_everConnected = false;
  QDBusConnection m_bus;
};
