#include "EntityNaming.h"

#include <QStringDecoder>
#include <QStringList>

#include <initializer_list>

namespace {

constexpr int kCounterLimit = 1 << 30;

QString propText(const PropertyList& props, const char* key, const QString& encoding)
{
  return decodePropertyText(props.value(QString::fromLatin1(key)), encoding);
}

bool hasAll(const PropertyList& props, std::initializer_list<const char*> keys)
{
  for (const char* key : keys) {
    if (!props.contains(QString::fromLatin1(key))) {
      return false;
    }
  }
  return true;
}

QString streamExtension(const PropertyList& props, const QString& encoding)
{
  if (!hasAll(props, {"application.process.user", "application.process.host", "application.process.id"})) {
    return QString();
  }
  return QStringLiteral("(%1@%2:%3)")
      .arg(propText(props, "application.process.user", encoding),
           propText(props, "application.process.host", encoding),
           propText(props, "application.process.id", encoding));
}

QString deviceExtension(const PropertyList& props, const QString& encoding)
{
  if (!hasAll(props, {"device.profile.name", "alsa.driver_name"})) {
    return QString();
  }
  return QStringLiteral("(%1@%2)").arg(propText(props, "device.profile.name", encoding), propText(props, "alsa.driver_name", encoding));
}

QString withExtension(const QString& name, const QString& ext)
{
  return ext.isEmpty() ? name : QStringLiteral("%1 %2").arg(name, ext);
}

} // namespace

QString UniqueNameCounter::uniqueName(const QString& name)
{
  const int n = m_next;
  m_next = (m_next + 1 >= kCounterLimit) ? 0 : m_next + 1;
  return QStringLiteral("%1 #%2").arg(name).arg(n);
}

bool isPlaceholderMediaName(const QString& name)
{
  static const QStringList placeholders{QStringLiteral("audio stream"), QStringLiteral("AudioStream")};
  return placeholders.contains(name);
}

QString decodePropertyText(const QByteArray& raw, const QString& encoding)
{
  QByteArray bytes = raw;
  bytes.replace('\0', QByteArray());

  QStringDecoder decoder(encoding.toLatin1().constData(), QStringConverter::Flag::Stateless);
  QString text = decoder.isValid() ? QString(decoder(bytes)) : QString::fromUtf8(bytes);
  text.remove(QChar(QChar::ReplacementCharacter));
  return text;
}

QString entityDisplayName(EntityKind kind, const PropertyList& props, const NamingOptions& options, UniqueNameCounter& counter)
{
  const QString& enc = options.encoding;

  if (kind == EntityKind::Stream) {
    if (options.useMediaName && props.contains(QStringLiteral("media.name"))) {
      const QString media = propText(props, "media.name", enc);
      if (!isPlaceholderMediaName(media)) {
        return media;
      }
    }

    QString name;
    if (props.contains(QStringLiteral("application.name"))) {
      name = propText(props, "application.name", enc);
    } else if (props.contains(QStringLiteral("media.name"))) {
      // synthetic stream, media.name alone is rarely descriptive
      name = counter.uniqueName(propText(props, "media.name", enc));
    } else {
      name = counter.uniqueName(QStringLiteral("audio stream"));
    }
    return withExtension(name, streamExtension(props, enc));
  }

  QString name;
  if (props.contains(QStringLiteral("alsa.id"))) {
    name = propText(props, "alsa.id", enc);
  } else if (hasAll(props, {"device.api", "device.string"})) {
    name = QStringLiteral("%1.%2").arg(propText(props, "device.api", enc), propText(props, "device.string", enc));
  } else if (props.contains(QStringLiteral("device.description"))) {
    name = counter.uniqueName(propText(props, "device.description", enc));
  } else {
    name = counter.uniqueName(QStringLiteral("device"));
  }
  return withExtension(name, deviceExtension(props, enc));
}
