#include <QTest>

#include "FakeControlEndpoint.h"
#include "tui/TuiAppInternal.h"

#include <curses.h>

using namespace faderstui;

class TestTuiActions : public QObject
{
  Q_OBJECT

private slots:
  void keyMap()
  {
    for (int ch : {KEY_DOWN, int('j'), int('n')}) {
      QVERIFY(keyActionFor(ch) == KeyAction::Next);
    }
    for (int ch : {KEY_UP, int('k'), int('p')}) {
      QVERIFY(keyActionFor(ch) == KeyAction::Prev);
    }
    for (int ch : {KEY_LEFT, int('h'), int('b')}) {
      QVERIFY(keyActionFor(ch) == KeyAction::VolumeDown);
    }
    for (int ch : {KEY_RIGHT, int('l'), int('f')}) {
      QVERIFY(keyActionFor(ch) == KeyAction::VolumeUp);
    }
    QVERIFY(keyActionFor(' ') == KeyAction::ToggleMute);
    QVERIFY(keyActionFor('m') == KeyAction::ToggleMute);
    QVERIFY(keyActionFor('q') == KeyAction::Quit);
    QVERIFY(keyActionFor(KEY_RESIZE) == KeyAction::Resize);
    QVERIFY(keyActionFor('\f') == KeyAction::Resize);
    QVERIFY(keyActionFor('Q') == KeyAction::None);
  }

  void selectionMovesAndWraps()
  {
    FakeControlEndpoint fake;
    fake.addDevice(QStringLiteral("/d1"), QStringLiteral("Speakers"));
    fake.addStream(QStringLiteral("/s1"), QStringLiteral("App"));

    EntityRegistry reg(&fake);
    QVERIFY(reg.refresh(false));

    TuiState state;
    syncHighlight(reg, state);
    QCOMPARE(state.highlight, QStringLiteral("Speakers"));

    QCOMPARE(handleTuiKey('j', reg, state), FrameStatus::Drawn);
    QCOMPARE(state.highlight, QStringLiteral("App"));
    handleTuiKey(KEY_DOWN, reg, state);
    QCOMPARE(state.highlight, QStringLiteral("Speakers"));
    handleTuiKey('k', reg, state);
    QCOMPARE(state.highlight, QStringLiteral("App"));
  }

  void volumeStepsAreClamped()
  {
    FakeControlEndpoint fake;
    fake.addStream(QStringLiteral("/s1"), QStringLiteral("App"), {32768, 32768});

    EntityRegistry reg(&fake);
    QVERIFY(reg.refresh(false));

    TuiState state;
    state.highlight = QStringLiteral("App");
    state.adjustStep = 0.25f;

    QCOMPARE(handleTuiKey('l', reg, state), FrameStatus::Drawn);
    QCOMPARE(fake.lastSetVolume, (QVector<uint32_t>{49152, 49152}));

    handleTuiKey(KEY_RIGHT, reg, state);
    handleTuiKey('f', reg, state);
    QCOMPARE(fake.lastSetVolume, (QVector<uint32_t>{65536, 65536}));

    for (int i = 0; i < 6; i++) {
      handleTuiKey('h', reg, state);
    }
    QCOMPARE(fake.lastSetVolume, (QVector<uint32_t>{0, 0}));
  }

  void muteToggles()
  {
    FakeControlEndpoint fake;
    fake.addStream(QStringLiteral("/s1"), QStringLiteral("App"));

    EntityRegistry reg(&fake);
    QVERIFY(reg.refresh(false));

    TuiState state;
    state.highlight = QStringLiteral("App");
    handleTuiKey(' ', reg, state);
    QVERIFY(fake.objects.value(QStringLiteral("/s1")).muted);
    handleTuiKey('m', reg, state);
    QVERIFY(!fake.objects.value(QStringLiteral("/s1")).muted);
  }

  void vanishedHighlightAbortsAndResyncs()
  {
    FakeControlEndpoint fake;
    fake.addDevice(QStringLiteral("/d1"), QStringLiteral("Speakers"));
    fake.addStream(QStringLiteral("/s1"), QStringLiteral("App"));

    EntityRegistry reg(&fake);
    QVERIFY(reg.refresh(false));

    TuiState state;
    state.highlight = QStringLiteral("App");
    QVERIFY(reg.remove(QStringLiteral("/s1")));

    QCOMPARE(handleTuiKey('l', reg, state), FrameStatus::Aborted);
    QCOMPARE(fake.volumeSets, 0);

    syncHighlight(reg, state);
    QCOMPARE(state.highlight, QStringLiteral("Speakers"));
  }

  void quitAndRedraw()
  {
    FakeControlEndpoint fake;
    EntityRegistry reg(&fake);

    TuiState state;
    handleTuiKey('\f', reg, state);
    QVERIFY(state.recreateWindow);
    QVERIFY(state.running);
    handleTuiKey('q', reg, state);
    QVERIFY(!state.running);
  }
};

QTEST_GUILESS_MAIN(TestTuiActions)
#include "test_tui_actions.moc"
