#pragma once

#include "backend/EventPipe.h"

#include <QDBusConnection>
#include <QDBusObjectPath>
#include <QObject>
#include <QString>
#include <QThread>

#include <atomic>

class QTimer;

// Lives on the EventChannel thread. Owns a dedicated peer connection to the
// sound server, subscribes to entity add/remove signals and forwards each one
// as a record on the pipe.
class EventMonitor final : public QObject
{
  Q_OBJECT

public:
  EventMonitor(QString connectionName, bool allowServerStart, EventPipe* pipe);
  ~EventMonitor() override;

  EventMonitor(const EventMonitor&) = delete;
  EventMonitor& operator=(const EventMonitor&) = delete;

public slots:
  void begin();
  void reacquire();

private slots:
  void onNewPlaybackStream(const QDBusObjectPath& path);
  void onPlaybackStreamRemoved(const QDBusObjectPath& path);
  void onNewSink(const QDBusObjectPath& path);
  void onSinkRemoved(const QDBusObjectPath& path);
  void checkHealth();

private:
  bool connectAndSubscribe(QString* error);
  bool listenFor(const QString& signal, QString* error);
  void dropConnection();
  void forward(PendingEvent::Op op, const QDBusObjectPath& path);
  void fail(const QString& message);

  QString m_connectionName;
  bool m_allowServerStart = true;
  EventPipe* m_pipe = nullptr;

  QDBusConnection m_bus;
  bool m_everConnected = false;
  bool m_subscribed = false;
  bool m_handshakeSent = false;

  QTimer* m_healthTimer = nullptr;
  qint64 m_nextAttemptMs = 0;
};

// Owner-side handle: starts the monitor thread and exposes the pipe's read end
// to the UI loop.
class EventChannel final : public QObject
{
  Q_OBJECT

public:
  explicit EventChannel(QString connectionName, bool allowServerStart = true, QObject* parent = nullptr);
  ~EventChannel() override;

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  bool start(QString* error = nullptr);
  // Blocks until the monitor wrote its handshake byte.
  bool waitUntilListening(int timeoutMs, QString* error = nullptr);
  bool isAlive() const;
  // Ask the monitor to drop and rebuild its subscription.
  void reacquire();
  void stop();

  EventPipe& pipe() { return m_pipe; }
  EventPipe::ReadStatus readEvents(QList<PendingEvent>* out, QString* error = nullptr) { return m_pipe.readEvents(out, error); }

private:
  QString m_connectionName;
  bool m_allowServerStart = true;

  EventPipe m_pipe;
  QThread m_thread;
  EventMonitor* m_monitor = nullptr;
};
