#pragma once

#include "backend/EntityRegistry.h"

#include <QString>
#include <QStringList>

class QCommandLineParser;
class QSettings;

struct MixerSettings final {
  int adjustStep = 5;     // percent per key press, 0..100
  int maxLevel = 65536;   // raw volume that counts as 100%
  bool useMediaName = false;
  QString encoding = QStringLiteral("utf-8");
  bool verbose = false;
  bool debug = false;
};

namespace MixerSettingsStore {
MixerSettings defaults();

QString defaultConfigPath();

// Values that fail to parse keep their default; each one adds a warning.
MixerSettings load(QSettings& s, QStringList* warnings = nullptr);

void addCommandLineOptions(QCommandLineParser& parser);
QString configPathFromCommandLine(const QCommandLineParser& parser);
// Options given on the command line override what the file said.
void applyCommandLine(const QCommandLineParser& parser, MixerSettings* settings, QStringList* warnings = nullptr);

// Clamps and falls back in place.
void validate(MixerSettings* settings, QStringList* warnings = nullptr);

bool isKnownEncoding(const QString& encoding);

float adjustFraction(const MixerSettings& settings);
RegistryOptions registryOptions(const MixerSettings& settings);
} // namespace MixerSettingsStore
