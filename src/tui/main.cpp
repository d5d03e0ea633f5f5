#include "backend/LogStore.h"
#include "settings/MixerSettings.h"
#include "tui/Supervisor.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QSettings>

#include <clocale>
#include <csignal>

#include <fcntl.h>
#include <unistd.h>

namespace {

const char* kKeyHelp =
    "Terminal mixer for sound server streams and output devices.\n"
    "\n"
    "Keys:\n"
    "  Up/k/p  Down/j/n     select stream or device\n"
    "  Left/h/b  Right/l/f  volume down/up by the adjust step\n"
    "  Space/m              toggle mute\n"
    "  Ctrl-L               redraw\n"
    "  q                    quit";

void silenceStderr()
{
  const int fd = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    return;
  }
  ::dup2(fd, STDERR_FILENO);
  ::close(fd);
}

} // namespace

int main(int argc, char** argv)
{
  setlocale(LC_ALL, "");
  // a closed event pipe must surface as a write error, not kill the process
  std::signal(SIGPIPE, SIG_IGN);

  int exitCode = 0;
  {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("faders"));
    QCoreApplication::setOrganizationName(QStringLiteral("faders"));
    QCoreApplication::setApplicationVersion(QStringLiteral(FADERS_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QString::fromLatin1(kKeyHelp));
    parser.addHelpOption();
    parser.addVersionOption();
    MixerSettingsStore::addCommandLineOptions(parser);
    parser.process(app);

    LogStore logs;
    logs.installQtMessageHandler();

    QStringList warnings;
    const QString configPath = MixerSettingsStore::configPathFromCommandLine(parser);
    MixerSettings settings = MixerSettingsStore::defaults();
    if (QFileInfo::exists(configPath)) {
      QSettings file(configPath, QSettings::IniFormat);
      if (file.status() != QSettings::NoError) {
        warnings.push_back(QStringLiteral("%1: cannot parse config file, using defaults").arg(configPath));
      } else {
        settings = MixerSettingsStore::load(file, &warnings);
      }
    }
    MixerSettingsStore::applyCommandLine(parser, &settings, &warnings);

    logs.setForwardToStderr(settings.verbose || settings.debug);
    logs.setMinimumLevel(settings.debug ? LogStore::Level::Debug : LogStore::Level::Info);
    if (!logs.forwardsToStderr()) {
      silenceStderr();
    }

    for (const auto& w : warnings) {
      LogStore::log(LogStore::Level::Warning, QStringLiteral("Faders/Settings"), w);
    }
    LogStore::log(LogStore::Level::Debug,
                  QStringLiteral("Faders/Settings"),
                  QStringLiteral("adjust-step=%1 max-level=%2 use-media-name=%3 encoding=%4")
                      .arg(settings.adjustStep)
                      .arg(settings.maxLevel)
                      .arg(settings.useMediaName ? QStringLiteral("true") : QStringLiteral("false"), settings.encoding));

    faderstui::Supervisor supervisor(settings, app.arguments());
    exitCode = supervisor.run();
    LogStore::log(LogStore::Level::Debug, QStringLiteral("Faders/Supervisor"), QStringLiteral("Finished"));
  }

  return exitCode;
}
