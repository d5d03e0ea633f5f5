#include "MixerSettings.h"

#include "settings/SettingsKeys.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QStringDecoder>

#include <algorithm>

namespace {

const QString kOptAdjustStep = QStringLiteral("adjust-step");
const QString kOptMaxLevel = QStringLiteral("max-level");
const QString kOptUseMediaName = QStringLiteral("use-media-name");
const QString kOptEncoding = QStringLiteral("encoding");
const QString kOptVerbose = QStringLiteral("verbose");
const QString kOptDebug = QStringLiteral("debug");
const QString kOptConfig = QStringLiteral("config");

void warn(QStringList* warnings, const QString& message)
{
  if (warnings) {
    warnings->push_back(message);
  }
}

bool parseBool(const QString& text, bool* out)
{
  const QString t = text.trimmed().toLower();
  if (t == QStringLiteral("true") || t == QStringLiteral("yes") || t == QStringLiteral("on") || t == QStringLiteral("1")) {
    *out = true;
    return true;
  }
  if (t == QStringLiteral("false") || t == QStringLiteral("no") || t == QStringLiteral("off") || t == QStringLiteral("0")) {
    *out = false;
    return true;
  }
  return false;
}

void readInt(QSettings& s, const QString& key, int* value, QStringList* warnings)
{
  if (!s.contains(key)) {
    return;
  }
  bool ok = false;
  const int v = s.value(key).toString().trimmed().toInt(&ok);
  if (!ok) {
    warn(warnings, QStringLiteral("%1: \"%2\" is not an integer, using %3").arg(key, s.value(key).toString()).arg(*value));
    return;
  }
  *value = v;
}

void readBool(QSettings& s, const QString& key, bool* value, QStringList* warnings)
{
  if (!s.contains(key)) {
    return;
  }
  const QVariant raw = s.value(key);
  if (raw.metaType() == QMetaType::fromType<bool>()) {
    *value = raw.toBool();
    return;
  }
  if (!parseBool(raw.toString(), value)) {
    warn(warnings, QStringLiteral("%1: \"%2\" is not a boolean, ignoring").arg(key, raw.toString()));
  }
}

} // namespace

namespace MixerSettingsStore {

MixerSettings defaults()
{
  return MixerSettings{};
}

QString defaultConfigPath()
{
  QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
  if (base.isEmpty()) {
    base = QDir::home().filePath(QStringLiteral(".config"));
  }
  return QDir(base).filePath(QStringLiteral("faders/faders.ini"));
}

MixerSettings load(QSettings& s, QStringList* warnings)
{
  MixerSettings out = defaults();

  readInt(s, SettingsKeys::adjustStep(), &out.adjustStep, warnings);
  readInt(s, SettingsKeys::maxLevel(), &out.maxLevel, warnings);
  readBool(s, SettingsKeys::useMediaName(), &out.useMediaName, warnings);
  if (s.contains(SettingsKeys::encoding())) {
    out.encoding = s.value(SettingsKeys::encoding()).toString().trimmed();
  }
  readBool(s, SettingsKeys::verbose(), &out.verbose, warnings);
  readBool(s, SettingsKeys::debug(), &out.debug, warnings);

  validate(&out, warnings);
  return out;
}

void addCommandLineOptions(QCommandLineParser& parser)
{
  parser.addOption(QCommandLineOption({QStringLiteral("a"), kOptAdjustStep}, QStringLiteral("Volume change per key press, in percent (0-100)."), QStringLiteral("step")));
  parser.addOption(QCommandLineOption({QStringLiteral("l"), kOptMaxLevel}, QStringLiteral("Raw volume level treated as 100%."), QStringLiteral("level")));
  parser.addOption(QCommandLineOption({QStringLiteral("n"), kOptUseMediaName}, QStringLiteral("Name streams after the media they play.")));
  parser.addOption(QCommandLineOption({QStringLiteral("e"), kOptEncoding}, QStringLiteral("Encoding of names reported by the server."), QStringLiteral("encoding")));
  parser.addOption(QCommandLineOption({QStringLiteral("v"), kOptVerbose}, QStringLiteral("Print log messages to stderr.")));
  parser.addOption(QCommandLineOption(kOptDebug, QStringLiteral("Print debug log messages to stderr.")));
  parser.addOption(QCommandLineOption({QStringLiteral("c"), kOptConfig}, QStringLiteral("Read settings from this INI file."), QStringLiteral("path")));
}

QString configPathFromCommandLine(const QCommandLineParser& parser)
{
  if (parser.isSet(kOptConfig)) {
    return parser.value(kOptConfig);
  }
  return defaultConfigPath();
}

void applyCommandLine(const QCommandLineParser& parser, MixerSettings* settings, QStringList* warnings)
{
  if (parser.isSet(kOptAdjustStep)) {
    bool ok = false;
    const int v = parser.value(kOptAdjustStep).toInt(&ok);
    if (ok) {
      settings->adjustStep = v;
    } else {
      warn(warnings, QStringLiteral("--adjust-step: \"%1\" is not an integer").arg(parser.value(kOptAdjustStep)));
    }
  }
  if (parser.isSet(kOptMaxLevel)) {
    bool ok = false;
    const int v = parser.value(kOptMaxLevel).toInt(&ok);
    if (ok) {
      settings->maxLevel = v;
    } else {
      warn(warnings, QStringLiteral("--max-level: \"%1\" is not an integer").arg(parser.value(kOptMaxLevel)));
    }
  }
  if (parser.isSet(kOptUseMediaName)) {
    settings->useMediaName = true;
  }
  if (parser.isSet(kOptEncoding)) {
    settings->encoding = parser.value(kOptEncoding).trimmed();
  }
  if (parser.isSet(kOptVerbose)) {
    settings->verbose = true;
  }
  if (parser.isSet(kOptDebug)) {
    settings->debug = true;
  }

  validate(settings, warnings);
}

void validate(MixerSettings* settings, QStringList* warnings)
{
  const MixerSettings d = defaults();

  const int step = std::clamp(settings->adjustStep, 0, 100);
  if (step != settings->adjustStep) {
    warn(warnings, QStringLiteral("adjust-step %1 out of range, using %2").arg(settings->adjustStep).arg(step));
    settings->adjustStep = step;
  }

  if (settings->maxLevel < 1) {
    warn(warnings, QStringLiteral("max-level %1 must be positive, using %2").arg(settings->maxLevel).arg(d.maxLevel));
    settings->maxLevel = d.maxLevel;
  }

  if (!isKnownEncoding(settings->encoding)) {
    warn(warnings, QStringLiteral("unknown encoding \"%1\", using %2").arg(settings->encoding, d.encoding));
    settings->encoding = d.encoding;
  }
}

bool isKnownEncoding(const QString& encoding)
{
  if (encoding.isEmpty()) {
    return false;
  }
  const QByteArray name = encoding.toLatin1();
  return QStringConverter::encodingForName(name.constData()).has_value();
}

float adjustFraction(const MixerSettings& settings)
{
  return static_cast<float>(settings.adjustStep) / 100.0f;
}

RegistryOptions registryOptions(const MixerSettings& settings)
{
  RegistryOptions out;
  out.maxLevel = settings.maxLevel;
  out.naming.useMediaName = settings.useMediaName;
  out.naming.encoding = settings.encoding;
  return out;
}

} // namespace MixerSettingsStore
