#pragma once

#include <QObject>
#include <QString>
#include <QStringList>

#include <atomic>

class LogStore final : public QObject
{
  Q_OBJECT

public:
  enum class Level {
    Error,
    Warning,
    Info,
    Debug,
    Trace,
  };

  explicit LogStore(QObject* parent = nullptr);
  ~LogStore() override;

  LogStore(const LogStore&) = delete;
  LogStore& operator=(const LogStore&) = delete;

  static LogStore* instance();

  // Appends through the process-wide store; a no-op when none exists.
  static void log(Level level, const QString& source, const QString& message);

  void installQtMessageHandler();

  // Lines are only written to stderr when this is set; the curses surface owns
  // the terminal otherwise.
  void setForwardToStderr(bool forward) { m_forwardToStderr.store(forward); }
  bool forwardsToStderr() const { return m_forwardToStderr.load(); }

  void setMinimumLevel(Level level) { m_minimumLevel.store(level); }
  Level minimumLevel() const { return m_minimumLevel.load(); }

  void append(Level level, QString source, QString message);
  QStringList lines() const;
  void clear();

signals:
  void lineAdded(QString line);

private:
  void appendLine(QString line);

  QStringList m_lines;
  int m_maxLines = 2000;

  std::atomic<bool> m_forwardToStderr{false};
  std::atomic<Level> m_minimumLevel{Level::Info};
  bool m_qtHandlerInstalled = false;
};
