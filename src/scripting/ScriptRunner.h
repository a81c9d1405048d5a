#ifndef SCRIPT_RUNNER_H
#define SCRIPT_RUNNER_H

#include "ScriptTypes.h"
#include "ScriptParser.h"
#include <QObject>
#include <QMap>
#include <atomic>

namespace Scripting {

/**
 * @brief Executes parsed scripts against a table of registered commands.
 *
 * Command names are case-insensitive. Execution stops at the first command
 * that fails (returns false or throws); lastError() and lastErrorLine() then
 * describe it. requestCancel() stops the script before its next command and
 * raises ThreadState so the running tool job stops too.
 */
class ScriptRunner : public QObject {
    Q_OBJECT

public:
    explicit ScriptRunner(QObject* parent = nullptr);

    // --- Commands ---
    void registerCommand(const CommandDef& def);
    void registerCommands(const QVector<CommandDef>& defs);
    const CommandDef* command(const QString& name) const;

    /// Usage line of every registered command, sorted by name.
    QStringList usages() const;

    // --- Execution ---
    ScriptResult executeFile(const QString& path);
    ScriptResult executeString(const QString& content);
    ScriptResult executeCommands(const QVector<ScriptCommand>& commands);

    /// Commands completed by the last execute call.
    int executedCount() const { return m_executed; }

    /// Predefined variables, visible to scripts as ${name}
    void setVariable(const QString& name, const QString& value);
    QString variable(const QString& name) const { return m_variables.value(name); }

    // --- Cancellation ---
    void requestCancel();
    bool isCancelled() const { return m_cancelled.load(); }
    void resetCancel();

    // --- Output and errors ---
    void setError(const QString& message, int lineNumber);
    QString lastError() const { return m_lastError; }
    int lastErrorLine() const { return m_lastErrorLine; }

    /// Report command output (statistics, logs) to listeners and the log file.
    void print(const QString& message);

signals:
    /// level is "output" or "error"
    void logMessage(const QString& message, const QString& level);

private:
    ScriptResult parseAndRun(ScriptParser& parser, bool parsed);
    bool executeCommand(const ScriptCommand& cmd);
    bool checkArgumentCount(const CommandDef& def, const ScriptCommand& cmd);

    QMap<QString, CommandDef> m_commands;
    QMap<QString, QString> m_variables;
    QString m_lastError;
    int m_lastErrorLine = 0;
    int m_executed = 0;
    std::atomic<bool> m_cancelled{false};
};

} // namespace Scripting

#endif // SCRIPT_RUNNER_H
