#include <QApplication>
#include <QTextStream>

#include "MainApplication.h"
#include "cli/CLIHandler.h"
#include "logging/LogManager.h"
#include "version.h"

using CommandWatch::CLI::CLIHandler;
using CommandWatch::CLI::CLIResult;

static void setApplicationMetadata()
{
    QCoreApplication::setApplicationName(COMMANDWATCH_APP_NAME);
    QCoreApplication::setOrganizationName(COMMANDWATCH_APP_NAME);
    QCoreApplication::setOrganizationDomain(COMMANDWATCH_APP_BUNDLE_ID);
    QCoreApplication::setApplicationVersion(COMMANDWATCH_VERSION);
}

static void printResult(const CLIResult &result)
{
    if (result.message.isEmpty()) {
        return;
    }
    QTextStream stream(result.isSuccess() ? stdout : stderr);
    stream << result.message;
    if (!result.message.endsWith(QLatin1Char('\n'))) {
        stream << Qt::endl;
    }
}

int main(int argc, char *argv[])
{
    QStringList arguments;
    arguments.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        arguments << QString::fromLocal8Bit(argv[i]);
    }

    CLIHandler handler;
    if (CLIHandler::hasArguments(arguments) && !handler.requiresGUI(arguments)) {
        QCoreApplication app(argc, argv);
        setApplicationMetadata();

        const CLIResult result = handler.process(arguments);
        printResult(result);
        return result.exitCode();
    }

    QApplication app(argc, argv);

    // Critical: Don't quit when last window closes (we're a tray app)
    app.setQuitOnLastWindowClosed(false);
    setApplicationMetadata();

    CommandWatch::CLI::LaunchOptions options;
    bool autoStart = false;
    if (CLIHandler::hasArguments(arguments)) {
        const CLIResult result = handler.process(arguments);
        if (!result.launchGui) {
            printResult(result);
            return result.exitCode();
        }
        options = result.launch;
        autoStart = true;
    }

    if (!LogManager::install()) {
        qWarning("main: Continuing with console logging only");
    }

    MainApplication mainApp;
    mainApp.initialize(options, autoStart);

    const int exitCode = app.exec();
    LogManager::uninstall();
    return exitCode;
}
