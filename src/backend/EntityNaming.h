#pragma once

#include "backend/ControlEndpoint.h"

#include <QString>

struct NamingOptions final {
  bool useMediaName = false;
  QString encoding = QStringLiteral("utf-8");
};

// Monotonic "#n" suffix source. Wraps back to 0 at 2^30.
class UniqueNameCounter final
{
public:
  QString uniqueName(const QString& name);
  int peek() const { return m_next; }

private:
  int m_next = 0;
};

bool isPlaceholderMediaName(const QString& name);

// Strips NUL bytes, decodes with the given encoding and drops undecodable sequences.
QString decodePropertyText(const QByteArray& raw, const QString& encoding);

QString entityDisplayName(EntityKind kind, const PropertyList& props, const NamingOptions& options, UniqueNameCounter& counter);
