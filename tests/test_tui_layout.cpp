#include <QTest>

#include "FakeControlEndpoint.h"
#include "tui/TuiAppInternal.h"

using namespace faderstui;

class TestTuiLayout : public QObject
{
  Q_OBJECT

private slots:
  void wideWindowKeepsNaturalNameWidth()
  {
    const RowLayout l = computeRowLayout(80, 20);
    QCOMPARE(l.nameWidth, 20);
    QCOMPARE(l.barWidth, 53);
    QVERIFY(showsMute(l, 80));
    QVERIFY(showsBar(l, 80));
  }

  void nameShrinksToKeepMinimumBar()
  {
    const RowLayout l = computeRowLayout(30, 20);
    QCOMPARE(l.nameWidth, 13);
    QCOMPARE(l.barWidth, 10);
  }

  void nameStopsAtMinimumWidth()
  {
    const RowLayout l = computeRowLayout(20, 20);
    QCOMPARE(l.nameWidth, 10);
    QCOMPARE(l.barWidth, 3);
    QVERIFY(showsBar(l, 20));
  }

  void narrowWindowDegradesToNames()
  {
    const RowLayout l = computeRowLayout(15, 20);
    QCOMPARE(l.nameWidth, 15);
    QVERIFY(!showsMute(l, 15));
    QVERIFY(!showsBar(l, 15));

    const RowLayout tiny = computeRowLayout(8, 20);
    QCOMPARE(tiny.nameWidth, 8);
  }

  void shortNamesInTinyWindowStillShowMute()
  {
    const RowLayout l = computeRowLayout(8, 5);
    QCOMPARE(l.nameWidth, 5);
    QVERIFY(showsMute(l, 8));
    QVERIFY(!showsBar(l, 8));
  }

  void barTextIsRoundedFill()
  {
    QCOMPARE(barCapsWidth(), 5);
    QCOMPARE(barFillFor(0.5f, 10), 5);
    QCOMPARE(barFillFor(0.26f, 10), 3);
    QCOMPARE(barFillFor(0.04f, 10), 0);
    QCOMPARE(barFillFor(3.0f, 10), 10);
    QCOMPARE(volumeBarText(0.5f, 4), QStringLiteral(" [ ##-- ]"));
    QCOMPARE(volumeBarText(1.0f, 0), QString());
    QCOMPARE(QString::fromLatin1(muteIndicator(true)), QStringLiteral(" M"));
    QCOMPARE(QString::fromLatin1(muteIndicator(false)), QStringLiteral(" -"));
  }

  void namesAreCutToColumn()
  {
    QCOMPARE(fitName(QStringLiteral("Speakers"), 4), QStringLiteral("Spea"));
    QCOMPARE(fitName(QStringLiteral("Speakers"), 0), QString());
    QCOMPARE(encodeForTerminal(QStringLiteral("café"), QStringLiteral("latin1")), QByteArray("caf\xe9"));
    QCOMPARE(encodeForTerminal(QStringLiteral("café"), QStringLiteral("bogus")), QStringLiteral("café").toUtf8());
  }

  void frameSkipsBottomRow()
  {
    FakeControlEndpoint fake;
    fake.addDevice(QStringLiteral("/d1"), QStringLiteral("Speakers"), {65536, 65536});
    fake.objects[QStringLiteral("/d1")].muted = true;
    fake.addStream(QStringLiteral("/s1"), QStringLiteral("App"), {0, 0});

    EntityRegistry reg(&fake);
    QVERIFY(reg.refresh(false));

    TuiState state;
    state.highlight = QStringLiteral("App");

    Frame frame;
    QCOMPARE(buildFrame(reg, state, 10, 40, &frame), FrameStatus::Drawn);
    QCOMPARE(frame.rows.size(), 2);
    QCOMPARE(frame.layout.nameWidth, 8);
    QCOMPARE(frame.layout.barWidth, 25);
    QCOMPARE(frame.rows.at(0).name, QStringLiteral("Speakers"));
    QVERIFY(frame.rows.at(0).muted);
    QCOMPARE(frame.rows.at(0).volume, 1.0f);
    QVERIFY(!frame.rows.at(0).highlighted);
    QVERIFY(frame.rows.at(1).highlighted);
    QCOMPARE(frame.rows.at(1).volume, 0.0f);

    QCOMPARE(buildFrame(reg, state, 2, 40, &frame), FrameStatus::Drawn);
    QCOMPARE(frame.rows.size(), 1);

    QCOMPARE(buildFrame(reg, state, 10, 1, &frame), FrameStatus::Drawn);
    QVERIFY(frame.rows.isEmpty());
  }

  void frameAbortsWhenRemoteGivesUp()
  {
    FakeControlEndpoint fake;
    fake.addStream(QStringLiteral("/s1"), QStringLiteral("App"));

    EntityRegistry reg(&fake);
    bool failed = false;
    reg.setFailureHook([&failed]() { failed = true; });
    QVERIFY(reg.refresh(false));

    fake.failNext = 100;
    fake.failReconnect = true;

    TuiState state;
    Frame frame;
    QCOMPARE(buildFrame(reg, state, 10, 40, &frame), FrameStatus::Aborted);
    QVERIFY(failed);
  }
};

QTEST_GUILESS_MAIN(TestTuiLayout)
#include "test_tui_layout.moc"
