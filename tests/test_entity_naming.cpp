#include <QTest>

#include "backend/EntityNaming.h"

#include <initializer_list>
#include <utility>

class TestEntityNaming : public QObject
{
  Q_OBJECT

private:
  static PropertyList props(std::initializer_list<std::pair<const char*, QByteArray>> entries)
  {
    PropertyList out;
    for (const auto& [key, value] : entries) {
      out.insert(QString::fromLatin1(key), value);
    }
    return out;
  }

private slots:
  void counterSuffixesAndAdvances()
  {
    UniqueNameCounter counter;
    QCOMPARE(counter.uniqueName(QStringLiteral("x")), QStringLiteral("x #0"));
    QCOMPARE(counter.uniqueName(QStringLiteral("y")), QStringLiteral("y #1"));
    QCOMPARE(counter.peek(), 2);
  }

  void streamPrefersApplicationName()
  {
    UniqueNameCounter counter;
    const auto p = props({{"application.name", "Firefox"}, {"media.name", "Some Video"}});
    QCOMPARE(entityDisplayName(EntityKind::Stream, p, NamingOptions{}, counter), QStringLiteral("Firefox"));
    QCOMPARE(counter.peek(), 0);
  }

  void streamWithoutApplicationIsSynthetic()
  {
    UniqueNameCounter counter;
    const auto p = props({{"media.name", "Beep"}});
    QCOMPARE(entityDisplayName(EntityKind::Stream, p, NamingOptions{}, counter), QStringLiteral("Beep #0"));
    QCOMPARE(entityDisplayName(EntityKind::Stream, PropertyList{}, NamingOptions{}, counter), QStringLiteral("audio stream #1"));
  }

  void streamExtensionNeedsAllProcessProperties()
  {
    UniqueNameCounter counter;
    auto p = props({{"application.name", "mpv"},
                    {"application.process.user", "alice"},
                    {"application.process.host", "box"},
                    {"application.process.id", "4242"}});
    QCOMPARE(entityDisplayName(EntityKind::Stream, p, NamingOptions{}, counter), QStringLiteral("mpv (alice@box:4242)"));

    p.remove(QStringLiteral("application.process.host"));
    QCOMPARE(entityDisplayName(EntityKind::Stream, p, NamingOptions{}, counter), QStringLiteral("mpv"));
  }

  void mediaNameModeSkipsPlaceholders()
  {
    UniqueNameCounter counter;
    NamingOptions opts;
    opts.useMediaName = true;

    const auto real = props({{"application.name", "mpv"}, {"media.name", "song.flac"}});
    QCOMPARE(entityDisplayName(EntityKind::Stream, real, opts, counter), QStringLiteral("song.flac"));

    const auto placeholder = props({{"application.name", "mpv"}, {"media.name", "AudioStream"}});
    QCOMPARE(entityDisplayName(EntityKind::Stream, placeholder, opts, counter), QStringLiteral("mpv"));
    QVERIFY(isPlaceholderMediaName(QStringLiteral("audio stream")));
    QVERIFY(!isPlaceholderMediaName(QStringLiteral("Audio Stream")));
  }

  void devicePolicy()
  {
    UniqueNameCounter counter;
    QCOMPARE(entityDisplayName(EntityKind::Device, props({{"alsa.id", "PCH"}, {"device.api", "alsa"}}), NamingOptions{}, counter),
             QStringLiteral("PCH"));
    QCOMPARE(entityDisplayName(EntityKind::Device, props({{"device.api", "bluez"}, {"device.string", "00:11"}}), NamingOptions{}, counter),
             QStringLiteral("bluez.00:11"));
    QCOMPARE(entityDisplayName(EntityKind::Device, props({{"device.description", "Headset"}}), NamingOptions{}, counter),
             QStringLiteral("Headset #0"));
    QCOMPARE(entityDisplayName(EntityKind::Device, PropertyList{}, NamingOptions{}, counter), QStringLiteral("device #1"));

    const auto withExt = props({{"alsa.id", "PCH"}, {"device.profile.name", "analog-stereo"}, {"alsa.driver_name", "snd_hda_intel"}});
    QCOMPARE(entityDisplayName(EntityKind::Device, withExt, NamingOptions{}, counter), QStringLiteral("PCH (analog-stereo@snd_hda_intel)"));
  }

  void decodingDropsNulsAndBadBytes()
  {
    QCOMPARE(decodePropertyText(QByteArray("Firefox\0", 8), QStringLiteral("utf-8")), QStringLiteral("Firefox"));
    QCOMPARE(decodePropertyText(QByteArray("a\xff" "b"), QStringLiteral("utf-8")), QStringLiteral("ab"));
    QCOMPARE(decodePropertyText(QByteArray("caf\xe9"), QStringLiteral("latin1")), QStringLiteral("café"));
  }
};

QTEST_GUILESS_MAIN(TestEntityNaming)
#include "test_entity_naming.moc"
