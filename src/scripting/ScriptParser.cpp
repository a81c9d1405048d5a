#include "ScriptParser.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include <QFile>
#include <QTextStream>
#include <QRegularExpression>

namespace Scripting {

//=============================================================================
// COMMAND ACCESSORS
//=============================================================================

static double toNumber(const QString& text, const QString& what, const ScriptCommand& cmd) {
    bool ok = false;
    const double v = text.toDouble(&ok);
    if (!ok) {
        throw Quasar::InvalidArgumentError(QString("%1: %2 must be a number, got '%3'")
                                               .arg(cmd.name, what, text));
    }
    return v;
}

std::optional<double> ScriptCommand::optionDouble(const QString& key) const {
    if (!options.contains(key)) return std::nullopt;
    return toNumber(options.value(key), QString("option -%1").arg(key), *this);
}

double ScriptCommand::argDouble(int index) const {
    if (index < 0 || index >= args.size()) {
        throw Quasar::InvalidArgumentError(QString("%1: missing argument #%2").arg(name).arg(index + 1));
    }
    return toNumber(args[index], QString("argument #%1").arg(index + 1), *this);
}

std::optional<int> ScriptCommand::optionInt(const QString& key) const {
    const std::optional<double> v = optionDouble(key);
    if (!v) return std::nullopt;
    if (*v != static_cast<double>(static_cast<int>(*v))) {
        throw Quasar::InvalidArgumentError(QString("%1: option -%2 must be an integer, got '%3'")
                                               .arg(name, key, options.value(key)));
    }
    return static_cast<int>(*v);
}

bool ScriptCommand::optionBool(const QString& key) const {
    if (!options.contains(key)) return false;
    const QString value = options.value(key).toLower();
    if (value.isEmpty() || value == "true" || value == "yes" || value == "1") return true;
    if (value == "false" || value == "no" || value == "0") return false;
    throw Quasar::InvalidArgumentError(QString("%1: option -%2 expects true or false, got '%3'")
                                           .arg(name, key, options.value(key)));
}

int ScriptCommand::argInt(int index) const {
    const double v = argDouble(index);
    if (v != static_cast<double>(static_cast<int>(v))) {
        throw Quasar::InvalidArgumentError(QString("%1: argument #%2 must be an integer, got '%3'")
                                               .arg(name).arg(index + 1).arg(args[index]));
    }
    return static_cast<int>(v);
}

//=============================================================================
// PARSING
//=============================================================================

bool ScriptParser::parseFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        clear();
        m_errors.append(QString("Cannot open file: %1").arg(path));
        return false;
    }

    QTextStream in(&file);
    const QString content = in.readAll();
    file.close();

    return parseString(content, path);
}

bool ScriptParser::parseString(const QString& content, const QString& sourceName) {
    clear();

    const QStringList lines = content.split('\n');
    QString pending;
    int pendingStart = 0;
    int lineNumber = 0;

    for (const QString& rawLine : lines) {
        lineNumber++;
        QString line = rawLine.trimmed();

        // A continued command keeps the number of its first line
        if (!pending.isEmpty()) {
            line = pending + " " + line;
            pending.clear();
        } else {
            pendingStart = lineNumber;
        }

        if (line.endsWith('\\')) {
            pending = line.left(line.length() - 1).trimmed();
            if (pending.isEmpty()) pending = " ";
            continue;
        }

        parseLine(line, pendingStart, sourceName);
    }

    if (!pending.isEmpty()) {
        m_errors.append(QString("%1:%2: Unexpected end of file in continued line")
                            .arg(sourceName).arg(pendingStart));
    }

    Logger::debug(QString("Parsed %1 command(s) from %2").arg(m_commands.size()).arg(sourceName), "Script");
    return m_errors.isEmpty();
}

void ScriptParser::clear() {
    m_commands.clear();
    m_errors.clear();
}

//=============================================================================
// LINE PARSING
//=============================================================================

void ScriptParser::parseLine(const QString& line, int lineNumber, const QString& sourceName) {
    if (line.isEmpty() || line.startsWith('#')) return;

    auto error = [&](const QString& message) {
        m_errors.append(QString("%1:%2: %3").arg(sourceName).arg(lineNumber).arg(message));
    };

    bool unterminated = false;
    QVector<Token> tokens = tokenize(line, &unterminated);
    if (unterminated) {
        error("Unterminated quote");
        return;
    }
    if (tokens.isEmpty()) return;

    for (Token& token : tokens) {
        QString substituted, missing;
        if (!substituteVariables(token.text, substituted, missing)) {
            error(QString("Undefined variable '%1'").arg(missing));
            return;
        }
        token.text = substituted;
    }

    // Variable assignment: set name value...
    if (tokens[0].text.compare("set", Qt::CaseInsensitive) == 0) {
        static const QRegularExpression namePattern("^[A-Za-z_][A-Za-z0-9_]*$");
        if (tokens.size() < 3 || !namePattern.match(tokens[1].text).hasMatch()) {
            error("Usage: set name value");
            return;
        }
        QStringList value;
        for (int i = 2; i < tokens.size(); ++i) value.append(tokens[i].text);
        m_variables[tokens[1].text] = value.join(' ');
        return;
    }

    m_commands.append(makeCommand(tokens, lineNumber));
}

bool ScriptParser::substituteVariables(const QString& text, QString& result, QString& missing) const {
    static const QRegularExpression bracePattern("\\$\\{([^}]*)\\}");

    result.clear();
    int last = 0;
    QRegularExpressionMatchIterator it = bracePattern.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const QString varName = match.captured(1).trimmed();
        if (!m_variables.contains(varName)) {
            missing = varName;
            return false;
        }
        result += text.mid(last, match.capturedStart(0) - last);
        result += m_variables.value(varName);
        last = match.capturedEnd(0);
    }
    result += text.mid(last);
    return true;
}

//=============================================================================
// TOKENS
//=============================================================================

QVector<ScriptParser::Token> ScriptParser::tokenize(const QString& line, bool* unterminated) {
    QVector<Token> tokens;
    Token current;
    QChar quoteChar;   // null outside quotes

    auto flush = [&] {
        // "" still yields an empty argument
        if (!current.text.isEmpty() || current.quoted) tokens.append(current);
        current = Token();
    };

    for (int i = 0; i < line.length(); ++i) {
        const QChar c = line[i];
        if (!quoteChar.isNull()) {
            if (c == quoteChar) {
                quoteChar = QChar();
            } else if (c == '\\' && i + 1 < line.length()) {
                const QChar next = line[++i];
                current.text += next == 'n' ? QChar('\n') : next == 't' ? QChar('\t') : next;
            } else {
                current.text += c;
            }
        } else if (c == '"' || c == '\'') {
            quoteChar = c;
            current.quoted = true;
        } else if (c.isSpace()) {
            flush();
        } else if (c == '#') {
            break;
        } else {
            current.text += c;
        }
    }

    *unterminated = !quoteChar.isNull();
    flush();
    return tokens;
}

ScriptCommand ScriptParser::makeCommand(const QVector<Token>& tokens, int lineNumber) {
    static const QRegularExpression numberPattern("^-[0-9.]");

    ScriptCommand cmd;
    cmd.name = tokens[0].text.toLower();
    cmd.lineNumber = lineNumber;

    for (int i = 1; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        const bool isOption = !token.quoted && token.text.length() > 1 && token.text.startsWith('-')
                              && !numberPattern.match(token.text).hasMatch();
        if (!isOption) {
            cmd.args.append(token.text);
            continue;
        }
        const QString opt = token.text.mid(token.text.startsWith("--") ? 2 : 1);
        const int eq = opt.indexOf('=');
        if (eq > 0) cmd.options[opt.left(eq).toLower()] = opt.mid(eq + 1);
        else cmd.options[opt.toLower()] = QString();
    }
    return cmd;
}

} // namespace Scripting
