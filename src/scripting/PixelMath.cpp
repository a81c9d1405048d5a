#include "PixelMath.h"
#include "../algos/ColorModel.h"
#include "../algos/StretchFunctions.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include <QStack>
#include <algorithm>
#include <cmath>

namespace Scripting {

namespace {

const QStringList kFunctions = {
    "value", "luma", "luminance", "lightness",
    "blend", "mts", "ghs", "scale",
    "min", "max", "clip", "abs", "sqrt", "exp", "log", "pow", "where", "ones_like", "zeros_like"
};

int precedence(const QString& op, bool unary) {
    if (unary) return 4;
    if (op == "**") return 5;
    if (op == "*" || op == "/") return 3;
    if (op == "+" || op == "-") return 2;
    return 1; // Comparisons
}

bool rightAssociative(const QString& op, bool unary) {
    return unary || op == "**";
}

[[noreturn]] void fail(const QString& message) {
    throw Quasar::ExpressionError(message);
}

QString kindName(int kind) {
    switch (kind) {
        case 0: return "scalar";
        case 1: return "plane";
        default: return "image";
    }
}

} // namespace

void PixelMath::setVariable(const QString& name, const ImageBuffer* image) {
    if (!m_variables.contains(name)) m_order.append(name);
    m_variables[name] = image;
}

void PixelMath::setImages(const std::vector<const ImageBuffer*>& images) {
    for (size_t i = 0; i < images.size(); ++i) {
        setVariable(QString("IMG%1").arg(i + 1), images[i]);
    }
}

QStringList PixelMath::functionNames() {
    return kFunctions;
}

bool PixelMath::evaluate(const QString& expression, ImageBuffer& output) {
    m_lastError.clear();
    try {
        auto tokens = tokenize(expression);
        if (tokens.empty()) fail("Empty expression");

        auto rpn = shuntingYard(tokens);
        Operand result = executeRPN(rpn);

        if (result.kind == Operand::Scalar) {
            fail("The expression evaluates to a scalar, expected an RGB image");
        }
        if (result.kind == Operand::Plane) {
            fail("The expression evaluates to a single plane, expected an RGB image");
        }

        const ImageBuffer* session = m_order.isEmpty() ? nullptr : m_variables.value(m_order.front());
        if (session && (result.width != session->width() || result.height != session->height())) {
            fail(QString("The result is %1x%2, expected %3x%4")
                     .arg(result.width).arg(result.height).arg(session->width()).arg(session->height()));
        }

        const long long n = static_cast<long long>(result.data.size());
        bool finite = true;
        #pragma omp parallel for reduction(&&:finite)
        for (long long i = 0; i < n; ++i) {
            finite = finite && std::isfinite(result.data[i]);
        }
        if (!finite) fail("The result contains NaN or infinite values");

        QVariantMap meta;
        meta.insert("description", "Image");
        meta.insert("pixelmath", expression);
        output = ImageBuffer(result.width, result.height, std::move(result.data), meta);
    } catch (const Quasar::Error& e) {
        m_lastError = e.message();
        Logger::warning(QString("PixelMath '%1' failed: %2").arg(expression, m_lastError), "PixelMath");
        return false;
    } catch (const std::exception& e) {
        m_lastError = QString::fromUtf8(e.what());
        Logger::warning(QString("PixelMath '%1' failed: %2").arg(expression, m_lastError), "PixelMath");
        return false;
    }

    Logger::info(QString("PixelMath evaluated: %1").arg(expression), "PixelMath");
    return true;
}

// Tokenizer
std::vector<PixelMath::Token> PixelMath::tokenize(const QString& expr) const {
    std::vector<Token> tokens;
    int pos = 0;
    const int len = expr.length();

    auto operandExpected = [&tokens]() {
        if (tokens.empty()) return true;
        const Token& last = tokens.back();
        return last.type == Token::Operator || last.type == Token::LParen || last.type == Token::Comma;
    };

    while (pos < len) {
        const QChar c = expr[pos];

        if (c.isSpace()) {
            pos++;
            continue;
        }

        if (c.isDigit() || (c == '.' && pos + 1 < len && expr[pos + 1].isDigit())) {
            const int start = pos;
            while (pos < len && (expr[pos].isDigit() || expr[pos] == '.')) pos++;
            if (pos < len && (expr[pos] == 'e' || expr[pos] == 'E')) {
                int p = pos + 1;
                if (p < len && (expr[p] == '+' || expr[p] == '-')) p++;
                if (p < len && expr[p].isDigit()) {
                    pos = p;
                    while (pos < len && expr[pos].isDigit()) pos++;
                }
            }
            const QString numStr = expr.mid(start, pos - start);
            bool ok = false;
            Token t; t.type = Token::Number; t.value = numStr; t.numValue = numStr.toDouble(&ok);
            if (!ok) fail(QString("Invalid number '%1'").arg(numStr));
            tokens.push_back(t);
        }
        else if (c.isLetter() || c == '_') {
            auto readName = [&]() {
                const int start = pos;
                while (pos < len && (expr[pos].isLetterOrNumber() || expr[pos] == '_')) pos++;
                return expr.mid(start, pos - start);
            };
            QString name = readName();
            bool qualified = false;
            if (name == "np" && pos + 1 < len && expr[pos] == '.' && (expr[pos + 1].isLetter() || expr[pos + 1] == '_')) {
                pos++;
                name = readName();
                qualified = true;
            }

            int next = pos;
            while (next < len && expr[next].isSpace()) next++;
            const bool call = next < len && expr[next] == '(';

            Token t;
            t.value = name;
            if (call) {
                if (!kFunctions.contains(name)) {
                    fail(QString("name '%1' is not defined").arg(qualified ? "np." + name : name));
                }
                t.type = Token::Function;
            } else {
                if (qualified || !m_variables.contains(name)) {
                    fail(QString("name '%1' is not defined").arg(qualified ? "np." + name : name));
                }
                t.type = Token::Variable;
            }
            tokens.push_back(t);
        }
        else {
            Token t; t.type = Token::Operator;
            const QString two = expr.mid(pos, 2);
            if (two == "**" || two == "<=" || two == ">=" || two == "==" || two == "!=") {
                t.value = two;
                pos += 2;
            } else {
                t.value = QString(c);
                pos++;
                if (c == '(') t.type = Token::LParen;
                else if (c == ')') t.type = Token::RParen;
                else if (c == ',') t.type = Token::Comma;
                else if (c == '+' || c == '-') t.unary = operandExpected();
                else if (c != '*' && c != '/' && c != '<' && c != '>') {
                    fail(QString("Invalid character '%1'").arg(c));
                }
            }
            tokens.push_back(t);
        }
    }
    return tokens;
}

// Shunting Yard
std::vector<PixelMath::Token> PixelMath::shuntingYard(const std::vector<Token>& tokens) const {
    std::vector<Token> outputQueue;
    QStack<Token> operatorStack;
    std::vector<int> argCounts;   // One per open function call

    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];

        if (token.type == Token::Number || token.type == Token::Variable) {
            outputQueue.push_back(token);
        }
        else if (token.type == Token::Function) {
            operatorStack.push(token);
        }
        else if (token.type == Token::Comma) {
            while (!operatorStack.empty() && operatorStack.top().type != Token::LParen) {
                outputQueue.push_back(operatorStack.pop());
            }
            if (operatorStack.empty() || operatorStack.top().arity == 0) {
                fail("Unexpected ','");
            }
            argCounts.back()++;
        }
        else if (token.type == Token::Operator) {
            if (!token.unary) {
                while (!operatorStack.empty() && operatorStack.top().type == Token::Operator) {
                    const Token& top = operatorStack.top();
                    const int pt = precedence(top.value, top.unary);
                    const int pc = precedence(token.value, false);
                    if (pt > pc || (pt == pc && !rightAssociative(token.value, false))) {
                        outputQueue.push_back(operatorStack.pop());
                    } else {
                        break;
                    }
                }
            }
            operatorStack.push(token);
        }
        else if (token.type == Token::LParen) {
            Token paren = token;
            // arity on a parenthesis marks a function call
            if (!operatorStack.empty() && operatorStack.top().type == Token::Function) {
                paren.arity = 1;
                const bool empty = i + 1 < tokens.size() && tokens[i + 1].type == Token::RParen;
                argCounts.push_back(empty ? 0 : 1);
            }
            operatorStack.push(paren);
        }
        else if (token.type == Token::RParen) {
            while (!operatorStack.empty() && operatorStack.top().type != Token::LParen) {
                outputQueue.push_back(operatorStack.pop());
            }
            if (operatorStack.empty()) fail("Unbalanced parentheses");
            const Token paren = operatorStack.pop();
            if (paren.arity) {
                Token fn = operatorStack.pop();
                fn.arity = argCounts.back();
                argCounts.pop_back();
                outputQueue.push_back(fn);
            }
        }
    }

    while (!operatorStack.empty()) {
        const Token t = operatorStack.pop();
        if (t.type == Token::LParen || t.type == Token::Function) fail("Unbalanced parentheses");
        outputQueue.push_back(t);
    }

    return outputQueue;
}

PixelMath::Operand PixelMath::variable(const QString& name) const {
    const ImageBuffer* img = m_variables.value(name, nullptr);
    if (!img || !img->isValid()) fail(QString("Image '%1' is empty").arg(name));
    Operand op;
    op.kind = Operand::Image;
    op.width = img->width();
    op.height = img->height();
    op.data = img->data();
    return op;
}

// Execution
PixelMath::Operand PixelMath::executeRPN(const std::vector<Token>& rpn) const {
    std::vector<Operand> stack;
    stack.reserve(rpn.size());

    for (const auto& token : rpn) {
        if (token.type == Token::Number) {
            Operand op; op.scalar = token.numValue;
            stack.push_back(std::move(op));
        }
        else if (token.type == Token::Variable) {
            stack.push_back(variable(token.value));
        }
        else {
            const size_t n = token.type == Token::Function ? static_cast<size_t>(token.arity)
                                                           : (token.unary ? 1 : 2);
            if (stack.size() < n) fail("Syntax error");
            std::vector<Operand> args(std::make_move_iterator(stack.end() - n), std::make_move_iterator(stack.end()));
            stack.resize(stack.size() - n);
            stack.push_back(token.type == Token::Function ? applyFunction(token.value, args)
                                                          : applyOperator(token, args));
        }
    }

    if (stack.size() != 1) fail("Syntax error");
    return std::move(stack.back());
}

// ----------------------------------------------------------------------------
// Broadcasting kernels
// ----------------------------------------------------------------------------

PixelMath::Operand PixelMath::resultShape(const std::vector<const Operand*>& args) {
    Operand shape;
    for (const Operand* a : args) {
        if (a->kind == Operand::Scalar) continue;
        if (shape.kind != Operand::Scalar && (a->width != shape.width || a->height != shape.height)) {
            fail(QString("Operands have different sizes (%1x%2 and %3x%4)")
                     .arg(shape.width).arg(shape.height).arg(a->width).arg(a->height));
        }
        shape.width = a->width;
        shape.height = a->height;
        shape.kind = std::max(shape.kind, a->kind);
    }
    if (shape.kind != Operand::Scalar) {
        const size_t n = static_cast<size_t>(shape.width) * shape.height;
        shape.data.resize(shape.kind == Operand::Image ? n * ImageBuffer::kChannels : n);
    }
    return shape;
}

namespace {

// Element i of 'a' broadcast to a result of 'total' samples
inline double at(const std::vector<float>& data, double scalar, bool isScalar, size_t planeSize, long long i) {
    if (isScalar) return scalar;
    if (data.size() == planeSize) return data[static_cast<size_t>(i) % planeSize];
    return data[i];
}

} // namespace

template <typename F>
PixelMath::Operand PixelMath::map1(const Operand& a, F f) {
    Operand r = resultShape({&a});
    if (r.kind == Operand::Scalar) {
        r.scalar = f(a.scalar);
        return r;
    }
    const long long n = static_cast<long long>(r.data.size());
    #pragma omp parallel for
    for (long long i = 0; i < n; ++i) {
        r.data[i] = static_cast<float>(f(a.data[i]));
    }
    return r;
}

template <typename F>
PixelMath::Operand PixelMath::map2(const Operand& a, const Operand& b, F f) {
    Operand r = resultShape({&a, &b});
    if (r.kind == Operand::Scalar) {
        r.scalar = f(a.scalar, b.scalar);
        return r;
    }
    const size_t planeSize = static_cast<size_t>(r.width) * r.height;
    const bool sa = a.kind == Operand::Scalar, sb = b.kind == Operand::Scalar;
    const long long n = static_cast<long long>(r.data.size());
    #pragma omp parallel for
    for (long long i = 0; i < n; ++i) {
        r.data[i] = static_cast<float>(f(at(a.data, a.scalar, sa, planeSize, i),
                                         at(b.data, b.scalar, sb, planeSize, i)));
    }
    return r;
}

template <typename F>
PixelMath::Operand PixelMath::map3(const Operand& a, const Operand& b, const Operand& c, F f) {
    Operand r = resultShape({&a, &b, &c});
    if (r.kind == Operand::Scalar) {
        r.scalar = f(a.scalar, b.scalar, c.scalar);
        return r;
    }
    const size_t planeSize = static_cast<size_t>(r.width) * r.height;
    const bool sa = a.kind == Operand::Scalar, sb = b.kind == Operand::Scalar, sc = c.kind == Operand::Scalar;
    const long long n = static_cast<long long>(r.data.size());
    #pragma omp parallel for
    for (long long i = 0; i < n; ++i) {
        r.data[i] = static_cast<float>(f(at(a.data, a.scalar, sa, planeSize, i),
                                         at(b.data, b.scalar, sb, planeSize, i),
                                         at(c.data, c.scalar, sc, planeSize, i)));
    }
    return r;
}

// ----------------------------------------------------------------------------
// Operators and functions
// ----------------------------------------------------------------------------

PixelMath::Operand PixelMath::applyOperator(const Token& op, std::vector<Operand>& args) {
    const QString& o = op.value;
    if (op.unary) {
        if (o == "+") return std::move(args[0]);
        return map1(args[0], [](double x) { return -x; });
    }

    const Operand& a = args[0];
    const Operand& b = args[1];
    if (o == "+") return map2(a, b, [](double x, double y) { return x + y; });
    if (o == "-") return map2(a, b, [](double x, double y) { return x - y; });
    if (o == "*") return map2(a, b, [](double x, double y) { return x * y; });
    if (o == "/") {
        if (b.kind == Operand::Scalar && b.scalar == 0.0) fail("Division by zero");
        return map2(a, b, [](double x, double y) { return x / y; });
    }
    if (o == "**") return map2(a, b, [](double x, double y) { return std::pow(x, y); });
    if (o == "<")  return map2(a, b, [](double x, double y) { return x < y ? 1.0 : 0.0; });
    if (o == "<=") return map2(a, b, [](double x, double y) { return x <= y ? 1.0 : 0.0; });
    if (o == ">")  return map2(a, b, [](double x, double y) { return x > y ? 1.0 : 0.0; });
    if (o == ">=") return map2(a, b, [](double x, double y) { return x >= y ? 1.0 : 0.0; });
    if (o == "==") return map2(a, b, [](double x, double y) { return x == y ? 1.0 : 0.0; });
    if (o == "!=") return map2(a, b, [](double x, double y) { return x != y ? 1.0 : 0.0; });
    fail(QString("Unknown operator '%1'").arg(o));
}

PixelMath::Operand PixelMath::applyFunction(const QString& name, std::vector<Operand>& args) {
    const int n = static_cast<int>(args.size());
    auto requireArgs = [&](int lo, int hi) {
        if (n < lo || n > hi) {
            fail(lo == hi ? QString("%1() takes %2 argument(s), got %3").arg(name).arg(lo).arg(n)
                          : QString("%1() takes %2 to %3 arguments, got %4").arg(name).arg(lo).arg(hi).arg(n));
        }
    };
    auto scalarArg = [&](int i, const char* what) {
        if (args[i].kind != Operand::Scalar) {
            fail(QString("%1(): %2 must be a scalar, got a %3").arg(name, what, kindName(args[i].kind)));
        }
        return args[i].scalar;
    };
    auto midtone = [&](int i) {
        const double m = scalarArg(i, "midtone");
        if (!(m > 0.0 && m < 1.0)) fail(QString("%1(): midtone must be in (0, 1), got %2").arg(name).arg(m));
        return m;
    };

    if (name == "value" || name == "luma" || name == "luminance" || name == "lightness") {
        requireArgs(1, 2);
        if (args[0].kind != Operand::Image) {
            fail(QString("%1() expects an RGB image, got a %2").arg(name, kindName(args[0].kind)));
        }
        const double m = n > 1 ? midtone(1) : 0.5;
        Operand r;
        r.kind = Operand::Plane;
        r.width = args[0].width;
        r.height = args[0].height;
        if (name == "value") r.data = ColorModel::hsvValue(args[0].data);
        else if (name == "luma") r.data = ColorModel::luma(args[0].data);
        else if (name == "luminance") r.data = ColorModel::linearToSrgb(ColorModel::srgbLuminance(args[0].data));
        else {
            r.data = ColorModel::srgbLightness(args[0].data);
            for (float& v : r.data) v /= 100.0f;
        }
        if (m == 0.5) return r;
        return map1(r, [m](double x) { return Stretch::MidtoneStretch::mtf(x, m); });
    }
    if (name == "blend") {
        requireArgs(3, 3);
        return map3(args[0], args[1], args[2], [](double a, double b, double mix) { return (1.0 - mix) * a + mix * b; });
    }
    if (name == "mts") {
        requireArgs(2, 2);
        const double m = midtone(1);
        return map1(args[0], [m](double x) { return Stretch::MidtoneStretch::mtf(x, m); });
    }
    if (name == "ghs") {
        requireArgs(4, 6);
        const double lnD1 = scalarArg(1, "log(D+1)");
        const double B = scalarArg(2, "B");
        const double SYP = scalarArg(3, "SYP");
        const double SPP = n > 4 ? scalarArg(4, "SPP") : 0.0;
        const double HPP = n > 5 ? scalarArg(5, "HPP") : 1.0;
        try {
            const Stretch::HyperbolicStretch fn(lnD1, B, SYP, SPP, HPP);
            return map1(args[0], [&fn](double x) { return fn.apply(static_cast<float>(x)); });
        } catch (const Quasar::InvalidArgumentError& e) {
            fail(QString("ghs(): %1").arg(e.message()));
        }
    }
    if (name == "scale") {
        requireArgs(3, 3);
        if (args[0].kind != Operand::Image) fail(QString("scale() expects an RGB image, got a %1").arg(kindName(args[0].kind)));
        if (args[1].kind == Operand::Image || args[2].kind == Operand::Image) {
            fail("scale(): source and target must be planes or scalars");
        }
        const double tol = ColorModel::IMGTOL;
        return map3(args[0], args[1], args[2], [tol](double x, double s, double t) {
            return std::abs(s) < tol ? 0.0 : x * t / s;
        });
    }
    if (name == "min" || name == "max") {
        requireArgs(1, 2);
        const bool isMin = name == "min";
        if (n == 2) {
            return map2(args[0], args[1], [isMin](double a, double b) { return isMin ? std::min(a, b) : std::max(a, b); });
        }
        Operand r;
        if (args[0].kind == Operand::Scalar) { r.scalar = args[0].scalar; return r; }
        const auto& d = args[0].data;
        r.scalar = isMin ? *std::min_element(d.begin(), d.end()) : *std::max_element(d.begin(), d.end());
        return r;
    }
    if (name == "clip") {
        requireArgs(3, 3);
        return map3(args[0], args[1], args[2], [](double x, double lo, double hi) { return std::min(std::max(x, lo), hi); });
    }
    if (name == "abs") { requireArgs(1, 1); return map1(args[0], [](double x) { return std::abs(x); }); }
    if (name == "sqrt") { requireArgs(1, 1); return map1(args[0], [](double x) { return std::sqrt(x); }); }
    if (name == "exp") { requireArgs(1, 1); return map1(args[0], [](double x) { return std::exp(x); }); }
    if (name == "log") { requireArgs(1, 1); return map1(args[0], [](double x) { return std::log(x); }); }
    if (name == "pow") {
        requireArgs(2, 2);
        return map2(args[0], args[1], [](double a, double b) { return std::pow(a, b); });
    }
    if (name == "where") {
        requireArgs(3, 3);
        return map3(args[0], args[1], args[2], [](double c, double a, double b) { return c != 0.0 ? a : b; });
    }
    if (name == "ones_like" || name == "zeros_like") {
        requireArgs(1, 1);
        const double fill = name == "ones_like" ? 1.0 : 0.0;
        return map1(args[0], [fill](double) { return fill; });
    }
    fail(QString("name '%1' is not defined").arg(name));
}

} // namespace Scripting
