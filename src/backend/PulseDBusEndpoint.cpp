#include "PulseDBusEndpoint.h"

#include "backend/LogStore.h"
#include "backend/PulseServerLookup.h"

#include <QDBusArgument>
#include <QDBusError>
#include <QDBusMessage>
#include <QDBusMetaType>
#include <QDBusObjectPath>
#include <QDBusVariant>
#include <QList>

namespace {

constexpr int kCallTimeoutMs = 3000;

QString replyError(const QDBusMessage& reply)
{
  if (reply.type() == QDBusMessage::ErrorMessage) {
    return QStringLiteral("%1 (%2)").arg(reply.errorMessage(), reply.errorName());
  }
  return QStringLiteral("unexpected reply type %1").arg(static_cast<int>(reply.type()));
}

bool isArgument(const QVariant& v)
{
  return v.metaType() == QMetaType::fromType<QDBusArgument>();
}

} // namespace

PulseDBusEndpoint::PulseDBusEndpoint(QString connectionName, bool allowServerStart)
    : m_connectionName(std::move(connectionName))
    , m_allowServerStart(allowServerStart)
    , m_bus(m_connectionName)
{
  qDBusRegisterMetaType<QList<uint>>();
}

PulseDBusEndpoint::~PulseDBusEndpoint()
{
  disconnect();
}

QString PulseDBusEndpoint::coreObjectPath()
{
  return QStringLiteral("/org/pulseaudio/core1");
}

QString PulseDBusEndpoint::coreInterface()
{
  return QStringLiteral("org.PulseAudio.Core1");
}

QString PulseDBusEndpoint::interfaceFor(EntityKind kind)
{
  return kind == EntityKind::Stream ? QStringLiteral("org.PulseAudio.Core1.Stream") : QStringLiteral("org.PulseAudio.Core1.Device");
}

void PulseDBusEndpoint::disconnect()
{
  if (m_everConnected) {
    QDBusConnection::disconnectFromPeer(m_connectionName);
    m_bus = QDBusConnection(m_connectionName);
  }
}

bool PulseDBusEndpoint::reconnect(QString* error)
{
  disconnect();

  QString lookupErr;
  const QString address = PulseServerLookup::resolveAddress(m_allowServerStart, &lookupErr);
  if (address.isEmpty()) {
    if (error) {
      *error = lookupErr;
    }
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

  LogStore::log(LogStore::Level::Debug, QStringLiteral("Faders/Bus"), QStringLiteral("Connected to %1 (%2)").arg(address, m_connectionName));
  return true;
}

bool PulseDBusEndpoint::getProperty(const QString& path, const QString& iface, const QString& name, QVariant* out, QString* error)
{
  if (!m_bus.isConnected()) {
    if (error) {
      *error = QStringLiteral("not connected");
    }
    return false;
  }

  QDBusMessage msg = QDBusMessage::createMethodCall(QString(), path, QStringLiteral("org.freedesktop.DBus.Properties"), QStringLiteral("Get"));
  msg << iface << name;

  const QDBusMessage reply = m_bus.call(msg, QDBus::Block, kCallTimeoutMs);
  if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
    if (error) {
      *error = QStringLiteral("Get %1.%2 on %3: %4").arg(iface, name, path, replyError(reply));
    }
    return false;
  }

  *out = reply.arguments().first().value<QDBusVariant>().variant();
  return true;
}

bool PulseDBusEndpoint::setProperty(const QString& path, const QString& iface, const QString& name, const QVariant& value, QString* error)
{
  if (!m_bus.isConnected()) {
    if (error) {
      *error = QStringLiteral("not connected");
    }
    return false;
  }

  QDBusMessage msg = QDBusMessage::createMethodCall(QString(), path, QStringLiteral("org.freedesktop.DBus.Properties"), QStringLiteral("Set"));
  msg << iface << name << QVariant::fromValue(QDBusVariant(value));

  const QDBusMessage reply = m_bus.call(msg, QDBus::Block, kCallTimeoutMs);
  if (reply.type() != QDBusMessage::ReplyMessage) {
    if (error) {
      *error = QStringLiteral("Set %1.%2 on %3: %4").arg(iface, name, path, replyError(reply));
    }
    return false;
  }
  return true;
}

bool PulseDBusEndpoint::objectPaths(const QString& property, QStringList* paths, QString* error)
{
  QVariant value;
  if (!getProperty(coreObjectPath(), coreInterface(), property, &value, error)) {
    return false;
  }

  QStringList out;
  if (isArgument(value)) {
    const QDBusArgument arg = value.value<QDBusArgument>();
    arg.beginArray();
    while (!arg.atEnd()) {
      QDBusObjectPath p;
      arg >> p;
      out.push_back(p.path());
    }
    arg.endArray();
  } else if (value.canConvert<QList<QDBusObjectPath>>()) {
    for (const auto& p : value.value<QList<QDBusObjectPath>>()) {
      out.push_back(p.path());
    }
  } else {
    if (error) {
      *error = QStringLiteral("%1: unexpected value type %2").arg(property, QString::fromLatin1(value.typeName()));
    }
    return false;
  }

  *paths = out;
  return true;
}

bool PulseDBusEndpoint::listPlaybackStreams(QStringList* paths, QString* error)
{
  return objectPaths(QStringLiteral("PlaybackStreams"), paths, error);
}

bool PulseDBusEndpoint::listSinks(QStringList* paths, QString* error)
{
  return objectPaths(QStringLiteral("Sinks"), paths, error);
}

bool PulseDBusEndpoint::properties(const QString& path, EntityKind kind, PropertyList* out, QString* error)
{
  QVariant value;
  if (!getProperty(path, interfaceFor(kind), QStringLiteral("PropertyList"), &value, error)) {
    return false;
  }
  if (!isArgument(value)) {
    if (error) {
      *error = QStringLiteral("PropertyList on %1: unexpected value type %2").arg(path, QString::fromLatin1(value.typeName()));
    }
    return false;
  }

  PropertyList props;
  const QDBusArgument arg = value.value<QDBusArgument>();
  arg.beginMap();
  while (!arg.atEnd()) {
    QString key;
    QByteArray bytes;
    arg.beginMapEntry();
    arg >> key >> bytes;
    arg.endMapEntry();
    props.insert(key, bytes);
  }
  arg.endMap();

  *out = props;
  return true;
}

bool PulseDBusEndpoint::volume(const QString& path, EntityKind kind, QVector<uint32_t>* levels, QString* error)
{
  QVariant value;
  if (!getProperty(path, interfaceFor(kind), QStringLiteral("Volume"), &value, error)) {
    return false;
  }

  QVector<uint32_t> out;
  if (isArgument(value)) {
    const QDBusArgument arg = value.value<QDBusArgument>();
    arg.beginArray();
    while (!arg.atEnd()) {
      uint v = 0;
      arg >> v;
      out.push_back(v);
    }
    arg.endArray();
  } else if (value.canConvert<QList<uint>>()) {
    for (uint v : value.value<QList<uint>>()) {
      out.push_back(v);
    }
  } else {
    if (error) {
      *error = QStringLiteral("Volume on %1: unexpected value type %2").arg(path, QString::fromLatin1(value.typeName()));
    }
    return false;
  }

  *levels = out;
  return true;
}

bool PulseDBusEndpoint::setVolume(const QString& path, EntityKind kind, const QVector<uint32_t>& levels, QString* error)
{
  QList<uint> raw;
  raw.reserve(levels.size());
  for (uint32_t v : levels) {
    raw.push_back(v);
  }
  return setProperty(path, interfaceFor(kind), QStringLiteral("Volume"), QVariant::fromValue(raw), error);
}

bool PulseDBusEndpoint::mute(const QString& path, EntityKind kind, bool* muted, QString* error)
{
  QVariant value;
  if (!getProperty(path, interfaceFor(kind), QStringLiteral("Mute"), &value, error)) {
    return false;
  }
  if (value.metaType() != QMetaType::fromType<bool>()) {
    if (error) {
      *error = QStringLiteral("Mute on %1: unexpected value type %2").arg(path, QString::fromLatin1(value.typeName()));
    }
    return false;
  }
  *muted = value.toBool();
  return true;
}

bool PulseDBusEndpoint::setMute(const QString& path, EntityKind kind, bool muted, QString* error)
{
  return setProperty(path, interfaceFor(kind), QStringLiteral("Mute"), QVariant(muted), error);
}
