#include "EventPipe.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>

namespace {

QString errnoText(const char* what)
{
  return QStringLiteral("%1: %2").arg(QString::fromLatin1(what), QString::fromLocal8Bit(strerror(errno)));
}

void closeFd(int& fd)
{
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

} // namespace

EventPipe::~EventPipe()
{
  close();
}

bool EventPipe::open(QString* error)
{
  close();

  if (::pipe2(m_fds, O_CLOEXEC) != 0) {
    if (error) {
      *error = errnoText("pipe2");
    }
    m_fds[0] = m_fds[1] = -1;
    return false;
  }

  const int flags = ::fcntl(m_fds[0], F_GETFL);
  if (flags < 0 || ::fcntl(m_fds[0], F_SETFL, flags | O_NONBLOCK) != 0) {
    if (error) {
      *error = errnoText("fcntl");
    }
    close();
    return false;
  }

  m_partial.clear();
  return true;
}

void EventPipe::close()
{
  closeFd(m_fds[0]);
  closeFd(m_fds[1]);
  m_partial.clear();
}

void EventPipe::closeReadEnd()
{
  closeFd(m_fds[0]);
  m_partial.clear();
}

void EventPipe::closeWriteEnd()
{
  closeFd(m_fds[1]);
}

bool EventPipe::writeHandshake(QString* error)
{
  return writeAll(QByteArray(1, '\n'), error);
}

bool EventPipe::writeEvent(const PendingEvent& event, QString* error)
{
  return writeAll(encodeEventRecord(event), error);
}

bool EventPipe::writeAll(const QByteArray& data, QString* error)
{
  if (m_fds[1] < 0) {
    if (error) {
      *error = QStringLiteral("event pipe is closed");
    }
    return false;
  }

  const char* p = data.constData();
  qsizetype left = data.size();
  while (left > 0) {
    const ssize_t n = ::write(m_fds[1], p, static_cast<size_t>(left));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (error) {
        *error = errnoText("write");
      }
      return false;
    }
    p += n;
    left -= n;
  }
  return true;
}

bool EventPipe::hasData(int timeoutMs) const
{
  if (m_fds[0] < 0) {
    return false;
  }

  pollfd pfd{};
  pfd.fd = m_fds[0];
  pfd.events = POLLIN;
  const int res = ::poll(&pfd, 1, timeoutMs);
  return res > 0 && (pfd.revents & (POLLIN | POLLHUP)) != 0;
}

bool EventPipe::waitForHandshake(int timeoutMs, QString* error)
{
  if (!hasData(timeoutMs)) {
    if (error) {
      *error = QStringLiteral("no handshake from event monitor within %1 ms").arg(timeoutMs);
    }
    return false;
  }

  char byte = 0;
  ssize_t n = 0;
  do {
    n = ::read(m_fds[0], &byte, 1);
  } while (n < 0 && errno == EINTR);

  if (n != 1) {
    if (error) {
      *error = (n == 0) ? QStringLiteral("event monitor closed the pipe") : errnoText("read");
    }
    return false;
  }
  if (byte != '\n') {
    if (error) {
      *error = QStringLiteral("unexpected handshake byte 0x%1").arg(static_cast<unsigned char>(byte), 2, 16, QLatin1Char('0'));
    }
    return false;
  }
  return true;
}

EventPipe::ReadStatus EventPipe::readEvents(QList<PendingEvent>* out, QString* error)
{
  if (m_fds[0] < 0) {
    if (error) {
      *error = QStringLiteral("event pipe is closed");
    }
    return ReadStatus::Error;
  }

  bool writerClosed = false;
  char buf[4096];
  for (;;) {
    const ssize_t n = ::read(m_fds[0], buf, sizeof(buf));
    if (n > 0) {
      m_partial.append(buf, static_cast<qsizetype>(n));
      continue;
    }
    if (n == 0) {
      writerClosed = true;
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      break;
    }
    if (error) {
      *error = errnoText("read");
    }
    return ReadStatus::Error;
  }

  qsizetype nl = -1;
  while ((nl = m_partial.indexOf('\n')) >= 0) {
    const QByteArray line = m_partial.left(nl);
    m_partial.remove(0, nl + 1);
    if (line.isEmpty()) {
      continue;
    }

    const auto ev = decodeEventRecord(line);
    if (!ev) {
      if (error) {
        *error = QStringLiteral("malformed event record: %1").arg(QString::fromUtf8(line));
      }
      return ReadStatus::Malformed;
    }
    if (out) {
      out->push_back(*ev);
    }
  }

  return writerClosed ? ReadStatus::WriterClosed : ReadStatus::Ok;
}
