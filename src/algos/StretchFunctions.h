#ifndef STRETCHFUNCTIONS_H
#define STRETCHFUNCTIONS_H

#include "GHSAlgo.h"
#include <QString>
#include <memory>
#include <vector>

namespace Stretch {

/**
 * @brief Parametric tone curve mapping input levels in [0, 1] to output levels.
 *
 * Parameters are validated at construction and frozen afterwards, so a
 * function object can be shared between threads and stored in operation logs.
 * Outputs may transiently leave [0, 1]; callers clip when needed.
 */
class StretchFunction {
public:
    virtual ~StretchFunction() = default;

    virtual float apply(float t) const = 0;

    /// Apply in place to a whole plane (OpenMP).
    void apply(std::vector<float>& levels) const;

    /// True when the parameters reduce the curve to f(t) = t on [0, 1].
    virtual bool isIdentity() const = 0;

    /// Operation name used in history labels (e.g. "ArcsinhStretch").
    virtual QString operationName() const = 0;

    /// Label entry for one channel key, e.g. "R : (shadow = 0.10000, stretch = 5.0)".
    virtual QString describe(const QString& key) const = 0;

    /// Canonical, full-precision key of the function and its parameters.
    QString cacheKey() const;

    virtual std::unique_ptr<StretchFunction> clone() const = 0;

protected:
    virtual QString name() const = 0;
    virtual std::vector<double> parameters() const = 0;
};

class BlackpointStretch : public StretchFunction {
public:
    explicit BlackpointStretch(double shadow);

    float apply(float t) const override;
    using StretchFunction::apply;
    bool isIdentity() const override { return m_shadow == 0.0; }
    QString operationName() const override { return "BlackPoint"; }
    QString describe(const QString& key) const override;
    std::unique_ptr<StretchFunction> clone() const override;

    double shadow() const { return m_shadow; }

protected:
    QString name() const override { return "blackpoint"; }
    std::vector<double> parameters() const override { return { m_shadow }; }

private:
    double m_shadow;
};

class MidtoneStretch : public StretchFunction {
public:
    explicit MidtoneStretch(double midtone, double shadow = 0.0, double highlight = 1.0,
                            double low = 0.0, double high = 1.0);

    float apply(float t) const override;
    using StretchFunction::apply;
    bool isIdentity() const override;
    QString operationName() const override { return "MTStretch"; }
    QString describe(const QString& key) const override;
    std::unique_ptr<StretchFunction> clone() const override;

    /// Bare midtone transfer function on x in [0, 1].
    static double mtf(double x, double midtone);

protected:
    QString name() const override { return "midtone"; }
    std::vector<double> parameters() const override {
        return { m_midtone, m_shadow, m_highlight, m_low, m_high };
    }

private:
    double m_midtone, m_shadow, m_highlight, m_low, m_high;
};

class ArcsinhStretch : public StretchFunction {
public:
    ArcsinhStretch(double shadow, double stretch);

    float apply(float t) const override;
    using StretchFunction::apply;
    bool isIdentity() const override { return m_shadow == 0.0 && m_stretch == 0.0; }
    QString operationName() const override { return "ArcsinhStretch"; }
    QString describe(const QString& key) const override;
    std::unique_ptr<StretchFunction> clone() const override;

protected:
    QString name() const override { return "arcsinh"; }
    std::vector<double> parameters() const override { return { m_shadow, m_stretch }; }

private:
    double m_shadow, m_stretch;
    double m_norm;
};

/// Generalized hyperbolic stretch; coefficients come from GHSAlgo.
class HyperbolicStretch : public StretchFunction {
public:
    HyperbolicStretch(double logD1, double B, double SYP, double SPP = 0.0, double HPP = 1.0,
                      bool inverse = false);

    float apply(float t) const override;
    using StretchFunction::apply;
    bool isIdentity() const override { return m_coeffs.regime == GHSAlgo::REGIME_IDENTITY; }
    QString operationName() const override;
    QString describe(const QString& key) const override;
    std::unique_ptr<StretchFunction> clone() const override;

    const GHSAlgo::GHSParams& params() const { return m_params; }

protected:
    QString name() const override { return "ghs"; }
    std::vector<double> parameters() const override;

private:
    GHSAlgo::GHSParams m_params;
    GHSAlgo::GHSComputeParams m_coeffs;
};

class GammaStretch : public StretchFunction {
public:
    explicit GammaStretch(double gamma);

    float apply(float t) const override;
    using StretchFunction::apply;
    bool isIdentity() const override { return m_gamma == 1.0; }
    QString operationName() const override { return "GammaStretch"; }
    QString describe(const QString& key) const override;
    std::unique_ptr<StretchFunction> clone() const override;

protected:
    QString name() const override { return "gamma"; }
    std::vector<double> parameters() const override { return { m_gamma }; }

private:
    double m_gamma;
};

} // namespace Stretch

#endif // STRETCHFUNCTIONS_H
