#pragma once

#include "backend/ControlEndpoint.h"

#include <QByteArray>
#include <QString>

#include <optional>

struct PendingEvent final {
  enum class Op : int {
    StreamAdded,
    StreamRemoved,
    DeviceAdded,
    DeviceRemoved,
  };

  Op op = Op::StreamAdded;
  QString path;

  bool isAddition() const { return op == Op::StreamAdded || op == Op::DeviceAdded; }
  EntityKind kind() const { return (op == Op::StreamAdded || op == Op::StreamRemoved) ? EntityKind::Stream : EntityKind::Device; }

  bool operator==(const PendingEvent& other) const { return op == other.op && path == other.path; }
};

char opCode(PendingEvent::Op op);
std::optional<PendingEvent::Op> opFromCode(char code);

// One record per line: "<op> <path>\n".
QByteArray encodeEventRecord(const PendingEvent& event);
std::optional<PendingEvent> decodeEventRecord(const QByteArray& line);
