#include "LogStore.h"

#include <QDateTime>
#include <QMetaObject>
#include <QThread>

#include <cstdio>

namespace {

LogStore* g_logStore = nullptr;

QtMessageHandler g_prevQtHandler = nullptr;

QString levelTag(LogStore::Level level)
{
  switch (level) {
    case LogStore::Level::Error:
      return QStringLiteral("E");
    case LogStore::Level::Warning:
      return QStringLiteral("W");
    case LogStore::Level::Info:
      return QStringLiteral("I");
    case LogStore::Level::Debug:
      return QStringLiteral("D");
    case LogStore::Level::Trace:
      return QStringLiteral("T");
  }
  return QStringLiteral("?");
}

void qtMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
  Q_UNUSED(context);

  LogStore* store = LogStore::instance();
  if (!store) {
    if (g_prevQtHandler) {
      g_prevQtHandler(type, context, message);
    }
    return;
  }

  LogStore::Level level = LogStore::Level::Info;
  switch (type) {
    case QtDebugMsg:
      level = LogStore::Level::Debug;
      break;
    case QtInfoMsg:
      level = LogStore::Level::Info;
      break;
    case QtWarningMsg:
      level = LogStore::Level::Warning;
      break;
    case QtCriticalMsg:
    case QtFatalMsg:
      level = LogStore::Level::Error;
      break;
  }
  store->append(level, QStringLiteral("Qt"), message);
}

} // namespace

LogStore::LogStore(QObject* parent)
    : QObject(parent)
{
  if (!g_logStore) {
    g_logStore = this;
  }
}

LogStore::~LogStore()
{
  if (g_logStore == this) {
    g_logStore = nullptr;
  }
  if (m_qtHandlerInstalled) {
    qInstallMessageHandler(g_prevQtHandler);
    g_prevQtHandler = nullptr;
  }
}

LogStore* LogStore::instance()
{
  return g_logStore;
}

void LogStore::log(Level level, const QString& source, const QString& message)
{
  if (LogStore* store = instance()) {
    store->append(level, source, message);
  }
}

void LogStore::installQtMessageHandler()
{
  if (m_qtHandlerInstalled) {
    return;
  }

  g_prevQtHandler = qInstallMessageHandler(&qtMessageHandler);
  m_qtHandlerInstalled = true;
}

void LogStore::append(Level level, QString source, QString message)
{
  if (static_cast<int>(level) > static_cast<int>(m_minimumLevel.load())) {
    return;
  }

  const QString ts = QDateTime::currentDateTime().toString(QStringLiteral("hh:mm:ss.zzz"));
  const QString line = QStringLiteral("%1 [%2] %3: %4").arg(ts, levelTag(level), source, message);

  if (m_forwardToStderr.load()) {
    const QByteArray local = line.toLocal8Bit();
    std::fprintf(stderr, "%s\n", local.constData());
  }

  if (QThread::currentThread() == thread()) {
    appendLine(line);
    return;
  }

  QMetaObject::invokeMethod(this, [this, line]() { appendLine(line); }, Qt::QueuedConnection);
}

QStringList LogStore::lines() const
{
  return m_lines;
}

void LogStore::clear()
{
  if (QThread::currentThread() != thread()) {
    QMetaObject::invokeMethod(this, [this]() { clear(); }, Qt::QueuedConnection);
    return;
  }
  m_lines.clear();
}

void LogStore::appendLine(QString line)
{
  m_lines.push_back(std::move(line));
  while (m_lines.size() > m_maxLines) {
    m_lines.pop_front();
  }
  emit lineAdded(m_lines.back());
}
