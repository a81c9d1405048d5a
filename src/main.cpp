#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QTextStream>
#include "EditSession.h"
#include "core/Logger.h"
#include "core/Settings.h"
#include "core/TaskManager.h"
#include "core/Version.h"
#include "scripting/EditCommands.h"
#include "scripting/ScriptRunner.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Quasar");
    QCoreApplication::setApplicationName("Quasar");
    QCoreApplication::setApplicationVersion(Quasar::getVersion());

    QCommandLineParser parser;
    parser.setApplicationDescription("Runs a Quasar operation script on an image.");
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption("config", "Read settings from the INI file <file>.", "file");
    const QCommandLineOption logDirOption("log-dir", "Write the application log into <dir>.", "dir");
    const QCommandLineOption commandsOption("commands", "List the script commands and exit.");
    const QCommandLineOption verboseOption("verbose", "Echo informational log messages to stderr.");
    parser.addOption(configOption);
    parser.addOption(logDirOption);
    parser.addOption(commandsOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument("script", "Operation script to run.");
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    QTextStream err(stderr);
    const bool listCommands = parser.isSet(commandsOption);
    if (!listCommands && positional.size() != 1) {
        err << "Expected exactly one script file\n" << parser.helpText();
        return 2;
    }

    // --- Settings ---
    const QString configPath = parser.value(configOption);
    int invalidCount = 0;
    Settings settings = Settings::load(configPath, &invalidCount);
    if (parser.isSet(logDirOption)) {
        settings.logDirectory = parser.value(logDirOption);
    }

    Logger::init(settings.resolvedLogDirectory(), settings.maxLogFiles);
    Logger::setConsoleLevel(parser.isSet(verboseOption) ? Logger::Info : Logger::Fatal);

    if (invalidCount > 0) {
        QString errorMsg;
        if (!settings.save(configPath, &errorMsg)) {
            Logger::warning(QString("Could not rewrite settings: %1").arg(errorMsg), "Settings");
        }
    }

    int exitCode = 0;
    try {
        settings.apply();
        Threading::TaskManager::instance().init();

        // --- Script ---
        EditSession session(settings);
        Scripting::ScriptRunner runner;
        Scripting::EditCommands commands(session, runner);
        commands.registerCommands();

        QTextStream out(stdout);
        if (listCommands) {
            for (const QString& usage : runner.usages()) out << usage << Qt::endl;
            Logger::shutdown();
            return 0;
        }

        QObject::connect(&runner, &Scripting::ScriptRunner::logMessage,
                         [&out, &err](const QString& message, const QString& level) {
                             if (level == "error") err << message << Qt::endl;
                             else out << message << Qt::endl;
                         });

        const QString scriptPath = positional.first();
        runner.setVariable("script_dir", QFileInfo(scriptPath).absolutePath());

        const Scripting::ScriptResult result = runner.executeFile(scriptPath);
        if (result != Scripting::ScriptResult::OK) {
            exitCode = 1;
        }

        Threading::TaskManager::instance().waitForAll();
    } catch (const std::exception& e) {
        Logger::critical(QString("Fatal error: %1").arg(e.what()), "Main");
        err << "Fatal error: " << e.what() << Qt::endl;
        exitCode = 1;
    }

    Logger::shutdown();
    return exitCode;
}
