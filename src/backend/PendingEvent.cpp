#include "PendingEvent.h"

char opCode(PendingEvent::Op op)
{
  switch (op) {
  case PendingEvent::Op::StreamAdded:
    return '+';
  case PendingEvent::Op::StreamRemoved:
    return '-';
  case PendingEvent::Op::DeviceAdded:
    return '^';
  case PendingEvent::Op::DeviceRemoved:
    return 'v';
  }
  return '?';
}

std::optional<PendingEvent::Op> opFromCode(char code)
{
  switch (code) {
  case '+':
    return PendingEvent::Op::StreamAdded;
  case '-':
    return PendingEvent::Op::StreamRemoved;
  case '^':
    return PendingEvent::Op::DeviceAdded;
  case 'v':
    return PendingEvent::Op::DeviceRemoved;
  default:
    break;
  }
  return std::nullopt;
}

QByteArray encodeEventRecord(const PendingEvent& event)
{
  QByteArray out;
  out.reserve(event.path.size() + 3);
  out.append(opCode(event.op));
  out.append(' ');
  out.append(event.path.toUtf8());
  out.append('\n');
  return out;
}

std::optional<PendingEvent> decodeEventRecord(const QByteArray& line)
{
  QByteArray body = line;
  if (body.endsWith('\n')) {
    body.chop(1);
  }

  if (body.size() < 3 || body.at(1) != ' ') {
    return std::nullopt;
  }

  const auto op = opFromCode(body.at(0));
  if (!op) {
    return std::nullopt;
  }

  const QString path = QString::fromUtf8(body.mid(2)).trimmed();
  if (path.isEmpty() || !path.startsWith(QLatin1Char('/'))) {
    return std::nullopt;
  }

  PendingEvent ev;
  ev.op = *op;
  ev.path = path;
  return ev;
}
