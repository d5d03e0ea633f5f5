#include "EventChannel.h"

#include "backend/LogStore.h"
#include "backend/PulseDBusEndpoint.h"
#include "backend/PulseServerLookup.h"

#include <QDBusError>
#include <QDBusMessage>
#include <QDateTime>
#include <QList>
#include <QTimer>

#include <utility>

namespace {

constexpr int kHealthIntervalMs = 1000;
constexpr int kReconnectBackoffMs = 1000;
constexpr int kCallTimeoutMs = 3000;
constexpr unsigned long kStopWaitMs = 2000;

void logEvents(LogStore::Level level, const QString& message)
{
  LogStore::log(level, QStringLiteral("Faders/Events"), message);
}

} // namespace

EventMonitor::EventMonitor(QString connectionName, bool allowServerStart, EventPipe* pipe)
    : m_connectionName(std::move(connectionName))
    , m_allowServerStart(allowServerStart)
    , m_pipe(pipe)
    , m_bus(m_connectionName)
{
}

EventMonitor::~EventMonitor()
{
  dropConnection();
}

void EventMonitor::begin()
{
  m_healthTimer = new QTimer(this);
  m_healthTimer->setInterval(kHealthIntervalMs);
  connect(m_healthTimer, &QTimer::timeout, this, &EventMonitor::checkHealth);
  m_healthTimer->start();

  checkHealth();
}

void EventMonitor::reacquire()
{
  logEvents(LogStore::Level::Debug, QStringLiteral("Reacquiring event subscription"));
  dropConnection();
  m_nextAttemptMs = 0;
  checkHealth();
}

void EventMonitor::checkHealth()
{
  if (m_subscribed && m_bus.isConnected()) {
    return;
  }

  const qint64 now = QDateTime::currentMSecsSinceEpoch();
  if (now < m_nextAttemptMs) {
    return;
  }

  if (m_subscribed) {
    logEvents(LogStore::Level::Warning, QStringLiteral("Event connection lost, reconnecting"));
  }
  dropConnection();

  QString err;
  if (!connectAndSubscribe(&err)) {
    logEvents(LogStore::Level::Warning, QStringLiteral("Event subscription failed: %1").arg(err));
    dropConnection();
    m_nextAttemptMs = now + kReconnectBackoffMs;
    return;
  }

  logEvents(LogStore::Level::Debug, QStringLiteral("Listening for entity changes"));
  if (!m_handshakeSent) {
    if (!m_pipe->writeHandshake(&err)) {
      fail(err);
      return;
    }
    m_handshakeSent = true;
  }
}

bool EventMonitor::connectAndSubscribe(QString* error)
{
  const QString address = PulseServerLookup::resolveAddress(m_allowServerStart, error);
  if (address.isEmpty()) {
    return false;
  }

  m_bus = QDBusConnection::connectToPeer(address, m_connectionName);
  m_everConnected = true;
  if (!m_bus.isConnected()) {
    if (error) {
      *error = QStringLiteral("cannot connect to %1: %2").arg(address, m_bus.lastError().message());
    }
    return false;
  }

  const QString iface = PulseDBusEndpoint::coreInterface();
  struct Subscription {
    const char* signal;
    const char* slot;
  };
  const Subscription subs[] = {
      {"NewPlaybackStream", SLOT(onNewPlaybackStream(QDBusObjectPath))},
      {"PlaybackStreamRemoved", SLOT(onPlaybackStreamRemoved(QDBusObjectPath))},
      {"NewSink", SLOT(onNewSink(QDBusObjectPath))},
      {"SinkRemoved", SLOT(onSinkRemoved(QDBusObjectPath))},
  };

  for (const auto& sub : subs) {
    const QString name = QString::fromLatin1(sub.signal);
    if (!m_bus.connect(QString(), QString(), iface, name, this, sub.slot)) {
      if (error) {
        *error = QStringLiteral("cannot connect to signal %1: %2").arg(name, m_bus.lastError().message());
      }
      return false;
    }
    if (!listenFor(QStringLiteral("%1.%2").arg(iface, name), error)) {
      return false;
    }
  }

  m_subscribed = true;
  return true;
}

bool EventMonitor::listenFor(const QString& signal, QString* error)
{
  QDBusMessage msg = QDBusMessage::createMethodCall(QString(),
                                                    PulseDBusEndpoint::coreObjectPath(),
                                                    PulseDBusEndpoint::coreInterface(),
                                                    QStringLiteral("ListenForSignal"));
  // an empty object list subscribes to every object
  msg << signal << QVariant::fromValue(QList<QDBusObjectPath>());

  const QDBusMessage reply = m_bus.call(msg, QDBus::Block, kCallTimeoutMs);
  if (reply.type() != QDBusMessage::ReplyMessage) {
    if (error) {
      *error = QStringLiteral("ListenForSignal %1: %2 (%3)").arg(signal, reply.errorMessage(), reply.errorName());
    }
    return false;
  }
  return true;
}

void EventMonitor::dropConnection()
{
  m_subscribed = false;
  if (m_everConnected) {
    QDBusConnection::disconnectFromPeer(m_connectionName);
    m_bus = QDBusConnection(m_connectionName);
    m_everConnected = false;
  }
}

void EventMonitor::forward(PendingEvent::Op op, const QDBusObjectPath& path)
{
  const PendingEvent ev{op, path.path()};
  logEvents(LogStore::Level::Trace, QStringLiteral("Event %1 %2").arg(QChar::fromLatin1(opCode(op)), ev.path));

  QString err;
  if (!m_pipe->writeEvent(ev, &err)) {
    fail(err);
  }
}

void EventMonitor::fail(const QString& message)
{
  logEvents(LogStore::Level::Error, QStringLiteral("Event pipe write failed: %1").arg(message));
  if (m_healthTimer) {
    m_healthTimer->stop();
  }
  dropConnection();
  // the reader sees end-of-stream once this end is gone
  m_pipe->closeWriteEnd();
  QThread::currentThread()->quit();
}

void EventMonitor::onNewPlaybackStream(const QDBusObjectPath& path)
{
  forward(PendingEvent::Op::StreamAdded, path);
}

void EventMonitor::onPlaybackStreamRemoved(const QDBusObjectPath& path)
{
  forward(PendingEvent::Op::StreamRemoved, path);
}

void EventMonitor::onNewSink(const QDBusObjectPath& path)
{
  forward(PendingEvent::Op::DeviceAdded, path);
}

void EventMonitor::onSinkRemoved(const QDBusObjectPath& path)
{
  forward(PendingEvent::Op::DeviceRemoved, path);
}

EventChannel::EventChannel(QString connectionName, bool allowServerStart, QObject* parent)
    : QObject(parent)
    , m_connectionName(std::move(connectionName))
    , m_allowServerStart(allowServerStart)
{
  m_thread.setObjectName(QStringLiteral("faders-events"));
}

EventChannel::~EventChannel()
{
  stop();
}

bool EventChannel::start(QString* error)
{
  stop();

  if (!m_pipe.open(error)) {
    return false;
  }

  m_monitor = new EventMonitor(m_connectionName, m_allowServerStart, &m_pipe);
  m_monitor->moveToThread(&m_thread);
  connect(&m_thread, &QThread::started, m_monitor, &EventMonitor::begin);
  connect(&m_thread, &QThread::finished, m_monitor, &QObject::deleteLater);

  m_thread.start();
  return true;
}

bool EventChannel::waitUntilListening(int timeoutMs, QString* error)
{
  if (!m_pipe.isOpen()) {
    if (error) {
      *error = QStringLiteral("event channel not started");
    }
    return false;
  }
  return m_pipe.waitForHandshake(timeoutMs, error);
}

bool EventChannel::isAlive() const
{
  return m_monitor && m_thread.isRunning();
}

void EventChannel::reacquire()
{
  if (!isAlive()) {
    return;
  }
  QMetaObject::invokeMethod(m_monitor, "reacquire", Qt::QueuedConnection);
}

void EventChannel::stop()
{
  // a monitor blocked on a full pipe now gets EPIPE
  m_pipe.closeReadEnd();
  if (m_thread.isRunning()) {
    m_thread.quit();
    if (!m_thread.wait(kStopWaitMs)) {
      logEvents(LogStore::Level::Warning, QStringLiteral("Event thread did not stop, terminating"));
      m_thread.terminate();
      m_thread.wait();
    }
  }
  m_monitor = nullptr;
  m_pipe.close();
}
