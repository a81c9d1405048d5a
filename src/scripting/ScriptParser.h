#ifndef SCRIPT_PARSER_H
#define SCRIPT_PARSER_H

#include "ScriptTypes.h"
#include <QVector>

namespace Scripting {

/**
 * @brief Turns an operation script into ScriptCommands.
 *
 * One command per line. '#' starts a comment outside quotes, a trailing '\'
 * joins the next line, and "set name value" defines a variable that later
 * lines reference as ${name}. A bare '$' is left alone so editor command
 * templates can carry their placeholder. Quoted tokens and negative numbers
 * are always positional, never options.
 *
 * Parsing continues after an error so that errors() lists every bad line.
 */
class ScriptParser {
public:
    /// False when the file cannot be read ("Cannot open file: ...") or has errors.
    bool parseFile(const QString& path);

    /// sourceName prefixes error messages ("source:line: message").
    bool parseString(const QString& content, const QString& sourceName = "script");

    const QVector<ScriptCommand>& commands() const { return m_commands; }
    const QStringList& errors() const { return m_errors; }

    /// Forget commands and errors but keep variables.
    void clear();

    void setVariable(const QString& name, const QString& value) { m_variables[name] = value; }
    const QMap<QString, QString>& variables() const { return m_variables; }

private:
    void parseLine(const QString& line, int lineNumber, const QString& sourceName);
    bool substituteVariables(const QString& text, QString& result, QString& missing) const;

    struct Token {
        QString text;
        bool quoted = false;
    };
    static QVector<Token> tokenize(const QString& line, bool* unterminated);
    static ScriptCommand makeCommand(const QVector<Token>& tokens, int lineNumber);

    QVector<ScriptCommand> m_commands;
    QMap<QString, QString> m_variables;
    QStringList m_errors;
};

} // namespace Scripting

#endif // SCRIPT_PARSER_H
