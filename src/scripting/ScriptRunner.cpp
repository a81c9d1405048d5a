#include "ScriptRunner.h"
#include "../core/Logger.h"
#include "../core/ThreadState.h"
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>

namespace Scripting {

ScriptRunner::ScriptRunner(QObject* parent)
    : QObject(parent)
{
}

//=============================================================================
// COMMANDS
//=============================================================================

void ScriptRunner::registerCommand(const CommandDef& def) {
    m_commands.insert(def.name.toLower(), def);
}

void ScriptRunner::registerCommands(const QVector<CommandDef>& defs) {
    for (const CommandDef& def : defs) registerCommand(def);
}

const CommandDef* ScriptRunner::command(const QString& name) const {
    const auto it = m_commands.constFind(name.toLower());
    return it == m_commands.constEnd() ? nullptr : &it.value();
}

QStringList ScriptRunner::usages() const {
    QStringList lines;
    for (const CommandDef& def : m_commands) lines.append(def.usage);
    return lines;
}

//=============================================================================
// EXECUTION
//=============================================================================

ScriptResult ScriptRunner::executeFile(const QString& path) {
    ScriptParser parser;
    for (auto it = m_variables.cbegin(); it != m_variables.cend(); ++it) parser.setVariable(it.key(), it.value());
    const bool parsed = parser.parseFile(path);
    if (parsed) Logger::info(QString("Running script %1").arg(path), "Script");
    return parseAndRun(parser, parsed);
}

ScriptResult ScriptRunner::executeString(const QString& content) {
    ScriptParser parser;
    for (auto it = m_variables.cbegin(); it != m_variables.cend(); ++it) parser.setVariable(it.key(), it.value());
    return parseAndRun(parser, parser.parseString(content));
}

ScriptResult ScriptRunner::parseAndRun(ScriptParser& parser, bool parsed) {
    resetCancel();
    m_executed = 0;
    if (!parsed) {
        const QString first = parser.errors().value(0, "Parse error");
        setError(first, 0);
        return first.startsWith("Cannot open file") ? ScriptResult::FileError : ScriptResult::SyntaxError;
    }
    return executeCommands(parser.commands());
}

ScriptResult ScriptRunner::executeCommands(const QVector<ScriptCommand>& commands) {
    m_executed = 0;
    m_lastError.clear();
    m_lastErrorLine = 0;

    QElapsedTimer scriptTimer;
    scriptTimer.start();

    for (const ScriptCommand& cmd : commands) {
        if (m_cancelled) {
            setError("Script cancelled", cmd.lineNumber);
            return ScriptResult::Cancelled;
        }

        QElapsedTimer commandTimer;
        commandTimer.start();
        if (!executeCommand(cmd)) {
            return ScriptResult::CommandError;
        }
        ++m_executed;
        Logger::debug(QString("%1 (line %2): %3 ms").arg(cmd.name).arg(cmd.lineNumber).arg(commandTimer.elapsed()),
                      "Script");
    }

    Logger::info(QString("Script completed: %1 command(s) in %2 s")
                     .arg(m_executed).arg(scriptTimer.elapsed() / 1000.0, 0, 'f', 2), "Script");
    return ScriptResult::OK;
}

bool ScriptRunner::executeCommand(const ScriptCommand& cmd) {
    m_lastError.clear();

    const CommandDef* def = command(cmd.name);
    if (!def) {
        setError(QString("Unknown command: %1").arg(cmd.name), cmd.lineNumber);
        return false;
    }
    if (!checkArgumentCount(*def, cmd)) {
        return false;
    }

    bool success = false;
    try {
        success = def->handler(cmd);

        // Deliver queued task signals before the next command
        QCoreApplication::processEvents(QEventLoop::ExcludeUserInputEvents);
    } catch (const std::exception& e) {
        setError(QString("%1: %2").arg(cmd.name, QString::fromUtf8(e.what())), cmd.lineNumber);
        return false;
    }

    if (!success && m_lastError.isEmpty()) {
        setError(QString("Command failed: %1").arg(cmd.name), cmd.lineNumber);
    }
    return success;
}

bool ScriptRunner::checkArgumentCount(const CommandDef& def, const ScriptCommand& cmd) {
    const int argc = cmd.args.size();
    QString problem;
    if (argc < def.minArgs) {
        problem = QString("Too few arguments for %1: expected at least %2, got %3").arg(cmd.name).arg(def.minArgs).arg(argc);
    } else if (def.maxArgs >= 0 && argc > def.maxArgs) {
        problem = QString("Too many arguments for %1: expected at most %2, got %3").arg(cmd.name).arg(def.maxArgs).arg(argc);
    }
    if (problem.isEmpty()) return true;

    setError(QString("%1 (usage: %2)").arg(problem, def.usage), cmd.lineNumber);
    return false;
}

void ScriptRunner::setVariable(const QString& name, const QString& value) {
    m_variables[name] = value;
}

//=============================================================================
// CANCELLATION, OUTPUT AND ERRORS
//=============================================================================

void ScriptRunner::requestCancel() {
    m_cancelled = true;
    Threading::ThreadState::requestCancel();
}

void ScriptRunner::resetCancel() {
    m_cancelled = false;
    Threading::ThreadState::reset();
}

void ScriptRunner::print(const QString& message) {
    Logger::info(message, "Script");
    emit logMessage(message, "output");
}

void ScriptRunner::setError(const QString& message, int lineNumber) {
    m_lastError = message;
    m_lastErrorLine = lineNumber;

    const QString logMsg = lineNumber > 0 ? QString("Line %1: %2").arg(lineNumber).arg(message) : message;
    Logger::error(logMsg, "Script");
    emit logMessage(logMsg, "error");
}

} // namespace Scripting
