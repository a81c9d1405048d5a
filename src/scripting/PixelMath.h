#ifndef PIXELMATH_H
#define PIXELMATH_H

#include "../ImageBuffer.h"
#include <QMap>
#include <QString>
#include <QStringList>
#include <vector>

namespace Scripting {

/**
 * @brief PixelMath engine
 *
 * Evaluates an arithmetic expression over bound images and returns a new
 * image. Only the names listed below are visible; anything else fails with
 * "name 'x' is not defined". There is no access to files, processes or
 * modules.
 *
 * - Operands: numbers, bound images (IMG1..IMGn or custom names)
 * - Operators: + - * / ** (right associative), unary - +, comparisons < <= > >= == !=
 * - Channels: value(img[,m]), luma(img[,m]), luminance(img[,m]), lightness(img[,m])
 * - Tools: blend(a,b,mix), mts(x,m), ghs(x,lnD1,B,SYP[,SPP[,HPP]]), scale(img,source,target)
 * - Arrays: min, max, clip, abs, sqrt, exp, log, pow, where, ones_like, zeros_like
 *
 * An "np." prefix is accepted and resolves into the same table.
 * Scalars combine with anything; a plane combines with an image per channel.
 */
class PixelMath {
public:
    PixelMath() = default;

    /// Bind a name to an image. The image must outlive evaluate().
    void setVariable(const QString& name, const ImageBuffer* image);

    /// Bind IMG1..IMGn in order, replacing any previous binding of those names.
    void setImages(const std::vector<const ImageBuffer*>& images);

    void clearVariables() { m_variables.clear(); m_order.clear(); }

    /**
     * @brief Evaluate expression
     *
     * The result must be a finite 3-channel image of the size of the first
     * bound image. On failure 'output' is left untouched and lastError() is set.
     */
    bool evaluate(const QString& expression, ImageBuffer& output);

    QString lastError() const { return m_lastError; }

    /// Names of the built-in functions.
    static QStringList functionNames();

private:
    struct Token {
        enum Type { Number, Variable, Operator, Function, LParen, RParen, Comma };
        Type type;
        QString value;
        double numValue = 0.0;
        int arity = 0;       // Functions: argument count once parsed
        bool unary = false;  // Operators: prefix - or +
    };

    struct Operand {
        enum Kind { Scalar, Plane, Image };
        Kind kind = Scalar;
        double scalar = 0.0;
        int width = 0;
        int height = 0;
        std::vector<float> data;

        size_t size() const { return data.size(); }
    };

    std::vector<Token> tokenize(const QString& expr) const;
    std::vector<Token> shuntingYard(const std::vector<Token>& tokens) const;
    Operand executeRPN(const std::vector<Token>& rpn) const;

    Operand variable(const QString& name) const;
    static Operand applyOperator(const Token& op, std::vector<Operand>& args);
    static Operand applyFunction(const QString& name, std::vector<Operand>& args);

    // Element-wise kernels with broadcasting
    static Operand resultShape(const std::vector<const Operand*>& args);
    template <typename F> static Operand map1(const Operand& a, F f);
    template <typename F> static Operand map2(const Operand& a, const Operand& b, F f);
    template <typename F> static Operand map3(const Operand& a, const Operand& b, const Operand& c, F f);

    QMap<QString, const ImageBuffer*> m_variables;
    QStringList m_order;
    QString m_lastError;
};

} // namespace Scripting

#endif // PIXELMATH_H
