#include "PulseServerLookup.h"

#include "backend/LogStore.h"

#include <QDBusConnection>
#include <QDBusError>
#include <QDBusMessage>
#include <QDBusVariant>
#include <QProcess>
#include <QProcessEnvironment>
#include <QThread>

#include <unistd.h>

namespace {

constexpr int kLookupTimeoutMs = 3000;
constexpr int kServerStartTimeoutMs = 10000;
constexpr int kServerSettleSec = 1;

const char* kSystemSocketPath = "/run/pulse/dbus-socket";

} // namespace

QString PulseServerLookup::serviceUnknownError()
{
  return QStringLiteral("org.freedesktop.DBus.Error.ServiceUnknown");
}

QString PulseServerLookup::resolveAddress(bool allowStart, QString* error)
{
  const QString fromEnv = QProcessEnvironment::systemEnvironment().value(QStringLiteral("PULSE_DBUS_SERVER")).trimmed();
  if (!fromEnv.isEmpty()) {
    return fromEnv;
  }

  if (::access(kSystemSocketPath, R_OK | W_OK) == 0) {
    return QStringLiteral("unix:path=%1").arg(QString::fromLatin1(kSystemSocketPath));
  }

  QString errorName;
  QString address = addressFromSessionBus(&errorName, error);
  if (!address.isEmpty()) {
    LogStore::log(LogStore::Level::Debug, QStringLiteral("Faders/Bus"), QStringLiteral("Server address from session bus: %1").arg(address));
    return address;
  }

  if (!allowStart || errorName != serviceUnknownError()) {
    return QString();
  }

  if (!startServer(error)) {
    return QString();
  }
  LogStore::log(LogStore::Level::Debug, QStringLiteral("Faders/Bus"), QStringLiteral("Started new sound server instance"));

  // "--start" returns before the lookup service is registered
  QThread::sleep(kServerSettleSec);

  address = addressFromSessionBus(&errorName, error);
  return address;
}

QString PulseServerLookup::addressFromSessionBus(QString* errorName, QString* error)
{
  QDBusConnection session = QDBusConnection::sessionBus();
  if (!session.isConnected()) {
    if (errorName) {
      *errorName = session.lastError().name();
    }
    if (error) {
      *error = QStringLiteral("session bus unavailable: %1").arg(session.lastError().message());
    }
    return QString();
  }

  QDBusMessage msg = QDBusMessage::createMethodCall(QStringLiteral("org.PulseAudio1"),
                                                    QStringLiteral("/org/pulseaudio/server_lookup1"),
                                                    QStringLiteral("org.freedesktop.DBus.Properties"),
                                                    QStringLiteral("Get"));
  msg << QStringLiteral("org.PulseAudio.ServerLookup1") << QStringLiteral("Address");

  const QDBusMessage reply = session.call(msg, QDBus::Block, kLookupTimeoutMs);
  if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
    if (errorName) {
      *errorName = reply.errorName();
    }
    if (error) {
      *error = QStringLiteral("server lookup failed: %1 (%2)").arg(reply.errorMessage(), reply.errorName());
    }
    return QString();
  }

  const QString address = reply.arguments().first().value<QDBusVariant>().variant().toString();
  if (address.isEmpty() && error) {
    *error = QStringLiteral("server lookup returned an empty address");
  }
  return address;
}

bool PulseServerLookup::startServer(QString* error)
{
  QProcess proc;
  proc.setProcessChannelMode(QProcess::MergedChannels);
  proc.setStandardOutputFile(QProcess::nullDevice());
  proc.start(QStringLiteral("pulseaudio"), {QStringLiteral("--start"), QStringLiteral("--log-target=syslog")});
  if (!proc.waitForStarted(kServerStartTimeoutMs)) {
    if (error) {
      *error = QStringLiteral("failed to run pulseaudio: %1").arg(proc.errorString());
    }
    return false;
  }
  if (!proc.waitForFinished(kServerStartTimeoutMs)) {
    proc.kill();
    proc.waitForFinished();
    if (error) {
      *error = QStringLiteral("pulseaudio --start timed out");
    }
    return false;
  }
  if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
    if (error) {
      *error = QStringLiteral("pulseaudio --start exited with code %1").arg(proc.exitCode());
    }
    return false;
  }
  return true;
}
