#pragma once

#include "backend/PendingEvent.h"

#include <QByteArray>
#include <QList>
#include <QString>

// One-directional byte channel between the event monitor (writer) and the UI
// loop (reader). The read end is non-blocking; both ends are close-on-exec.
class EventPipe final
{
public:
  enum class ReadStatus {
    Ok,
    WriterClosed,
    Malformed,
    Error,
  };

  EventPipe() = default;
  ~EventPipe();

  EventPipe(const EventPipe&) = delete;
  EventPipe& operator=(const EventPipe&) = delete;

  bool open(QString* error = nullptr);
  void close();
  void closeReadEnd();
  void closeWriteEnd();

  bool isOpen() const { return m_fds[0] >= 0; }
  int readFd() const { return m_fds[0]; }
  int writeFd() const { return m_fds[1]; }

  bool writeHandshake(QString* error = nullptr);
  bool writeEvent(const PendingEvent& event, QString* error = nullptr);

  bool waitForHandshake(int timeoutMs, QString* error = nullptr);
  bool hasData(int timeoutMs = 0) const;
  ReadStatus readEvents(QList<PendingEvent>* out, QString* error = nullptr);

private:
  bool writeAll(const QByteArray& data, QString* error);

  int m_fds[2] = {-1, -1};
  QByteArray m_partial;
};
