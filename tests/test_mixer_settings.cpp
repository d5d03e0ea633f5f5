#include <QTest>

#include "settings/MixerSettings.h"
#include "settings/SettingsKeys.h"

#include <QCommandLineParser>
#include <QFile>
#include <QSettings>
#include <QTemporaryDir>

class TestMixerSettings : public QObject
{
  Q_OBJECT

private:
  static QString writeIni(const QTemporaryDir& dir, const QByteArray& content)
  {
    const QString path = dir.filePath(QStringLiteral("faders.ini"));
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
      return QString();
    }
    f.write(content);
    return path;
  }

private slots:
  void defaultsMatchDocumentedValues()
  {
    const MixerSettings d = MixerSettingsStore::defaults();
    QCOMPARE(d.adjustStep, 5);
    QCOMPARE(d.maxLevel, 65536);
    QCOMPARE(d.useMediaName, false);
    QCOMPARE(d.encoding, QStringLiteral("utf-8"));
    QCOMPARE(d.verbose, false);
    QCOMPARE(d.debug, false);
    QVERIFY(MixerSettingsStore::defaultConfigPath().endsWith(QStringLiteral("faders/faders.ini")));
  }

  void loadsDefaultGroup()
  {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeIni(dir, "[default]\nadjust-step=10\nmax-level=100\nuse-media-name=yes\nencoding=latin1\nverbose=true\n");
    QVERIFY(!path.isEmpty());

    QSettings s(path, QSettings::IniFormat);
    QStringList warnings;
    const MixerSettings m = MixerSettingsStore::load(s, &warnings);
    QVERIFY2(warnings.isEmpty(), qPrintable(warnings.join(QLatin1Char('\n'))));
    QCOMPARE(m.adjustStep, 10);
    QCOMPARE(m.maxLevel, 100);
    QCOMPARE(m.useMediaName, true);
    QCOMPARE(m.encoding, QStringLiteral("latin1"));
    QCOMPARE(m.verbose, true);
    QCOMPARE(m.debug, false);
  }

  void invalidValuesFallBack()
  {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeIni(dir, "[default]\nadjust-step=150\nmax-level=0\nencoding=no-such-charset\ndebug=maybe\n");

    QSettings s(path, QSettings::IniFormat);
    QStringList warnings;
    const MixerSettings m = MixerSettingsStore::load(s, &warnings);
    QCOMPARE(m.adjustStep, 100);
    QCOMPARE(m.maxLevel, 65536);
    QCOMPARE(m.encoding, QStringLiteral("utf-8"));
    QCOMPARE(m.debug, false);
    QCOMPARE(warnings.size(), 4);
  }

  void unparsableNumberKeepsDefault()
  {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeIni(dir, "[default]\nadjust-step=lots\n");

    QSettings s(path, QSettings::IniFormat);
    QStringList warnings;
    QCOMPARE(MixerSettingsStore::load(s, &warnings).adjustStep, 5);
    QCOMPARE(warnings.size(), 1);
  }

  void commandLineOverridesFile()
  {
    QCommandLineParser parser;
    MixerSettingsStore::addCommandLineOptions(parser);
    QVERIFY(parser.parse({QStringLiteral("faders-tui"),
                          QStringLiteral("-a"),
                          QStringLiteral("-3"),
                          QStringLiteral("--max-level"),
                          QStringLiteral("1000"),
                          QStringLiteral("-n"),
                          QStringLiteral("--debug"),
                          QStringLiteral("-c"),
                          QStringLiteral("/tmp/other.ini")}));

    MixerSettings m = MixerSettingsStore::defaults();
    m.adjustStep = 20;
    QStringList warnings;
    MixerSettingsStore::applyCommandLine(parser, &m, &warnings);

    QCOMPARE(m.adjustStep, 0);
    QCOMPARE(m.maxLevel, 1000);
    QCOMPARE(m.useMediaName, true);
    QCOMPARE(m.debug, true);
    QCOMPARE(m.verbose, false);
    QCOMPARE(warnings.size(), 1);
    QCOMPARE(MixerSettingsStore::configPathFromCommandLine(parser), QStringLiteral("/tmp/other.ini"));
  }

  void registryOptionsCarryNaming()
  {
    MixerSettings m;
    m.maxLevel = 1000;
    m.useMediaName = true;
    m.encoding = QStringLiteral("latin1");
    m.adjustStep = 25;

    const RegistryOptions o = MixerSettingsStore::registryOptions(m);
    QCOMPARE(o.maxLevel, 1000);
    QCOMPARE(o.cacheTtlMs, 2000);
    QCOMPARE(o.naming.useMediaName, true);
    QCOMPARE(o.naming.encoding, QStringLiteral("latin1"));
    QCOMPARE(MixerSettingsStore::adjustFraction(m), 0.25f);
  }

  void keysLiveInDefaultGroup()
  {
    QVERIFY(SettingsKeys::adjustStep().startsWith(QStringLiteral("default/")));
    QVERIFY(SettingsKeys::encoding().startsWith(QStringLiteral("default/")));
  }
};

QTEST_GUILESS_MAIN(TestMixerSettings)
#include "test_mixer_settings.moc"
