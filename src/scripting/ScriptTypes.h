#ifndef SCRIPT_TYPES_H
#define SCRIPT_TYPES_H

#include <QMap>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

namespace Scripting {

/**
 * @brief A parsed script line: "name arg... -key=value -flag"
 *
 * The typed accessors throw Quasar::InvalidArgumentError naming the command
 * when a value does not convert, so a bad number fails the line it is on.
 */
struct ScriptCommand {
    QString name;                      // lower case
    QStringList args;
    QMap<QString, QString> options;    // "-key=value"; a bare "-flag" maps to ""
    int lineNumber = 0;                // first line of a continued command

    bool hasOption(const QString& key) const { return options.contains(key); }
    QString option(const QString& key, const QString& fallback = QString()) const { return options.value(key, fallback); }

    std::optional<double> optionDouble(const QString& key) const;
    std::optional<int> optionInt(const QString& key) const;

    /// Absent is false; "-flag", "-flag=true|yes|1" are true, "-flag=false|no|0" false.
    bool optionBool(const QString& key) const;

    double argDouble(int index) const;
    int argInt(int index) const;
};

enum class ScriptResult {
    OK = 0,
    SyntaxError,    // parser rejected the script, nothing ran
    CommandError,   // a command failed or threw; later lines were skipped
    FileError,      // script file could not be read
    Cancelled
};

/// Returns false on failure (after ScriptRunner::setError), or throws Quasar::Error.
using CommandHandler = std::function<bool(const ScriptCommand&)>;

struct CommandDef {
    QString name;
    int minArgs = 0;
    int maxArgs = -1;   // no upper bound
    QString usage;
    CommandHandler handler;

    CommandDef() = default;
    CommandDef(const QString& name_, int minArgs_, int maxArgs_, const QString& usage_, CommandHandler handler_)
        : name(name_), minArgs(minArgs_), maxArgs(maxArgs_), usage(usage_), handler(std::move(handler_)) {}
};

} // namespace Scripting

#endif // SCRIPT_TYPES_H
