#include "StretchFunctions.h"
#include "../core/Errors.h"
#include <QStringList>
#include <algorithm>
#include <cmath>

namespace Stretch {

// ----------------------------------------------------------------------------
// StretchFunction
// ----------------------------------------------------------------------------

void StretchFunction::apply(std::vector<float>& levels) const {
    #pragma omp parallel for
    for (long long i = 0; i < (long long)levels.size(); ++i) {
        levels[i] = apply(levels[i]);
    }
}

QString StretchFunction::cacheKey() const {
    QStringList parts;
    for (double p : parameters()) {
        parts << QString::number(p, 'g', 17);
    }
    return QString("%1(%2)").arg(name(), parts.join(','));
}

// ----------------------------------------------------------------------------
// Blackpoint
// ----------------------------------------------------------------------------

BlackpointStretch::BlackpointStretch(double shadow)
    : m_shadow(shadow)
{
    if (!(shadow >= 0.0 && shadow < 1.0)) {
        throw Quasar::InvalidArgumentError(
            QString("Blackpoint shadow must be in [0, 1), got %1").arg(shadow));
    }
}

float BlackpointStretch::apply(float t) const {
    return static_cast<float>(std::max(0.0, (t - m_shadow) / (1.0 - m_shadow)));
}

QString BlackpointStretch::describe(const QString& key) const {
    return QString::asprintf("%s = %.5f", qPrintable(key), m_shadow);
}

std::unique_ptr<StretchFunction> BlackpointStretch::clone() const {
    return std::make_unique<BlackpointStretch>(*this);
}

// ----------------------------------------------------------------------------
// Midtone
// ----------------------------------------------------------------------------

MidtoneStretch::MidtoneStretch(double midtone, double shadow, double highlight, double low, double high)
    : m_midtone(midtone), m_shadow(shadow), m_highlight(highlight), m_low(low), m_high(high)
{
    if (!(midtone > 0.0 && midtone < 1.0)) {
        throw Quasar::InvalidArgumentError(
            QString("Midtone must be in (0, 1), got %1").arg(midtone));
    }
    if (!(shadow >= 0.0 && shadow < highlight && highlight <= 1.0)) {
        throw Quasar::InvalidArgumentError(
            QString("Midtone stretch needs 0 <= shadow < highlight <= 1, got shadow = %1, highlight = %2")
                .arg(shadow).arg(highlight));
    }
    if (!(low < high)) {
        throw Quasar::InvalidArgumentError(
            QString("Midtone stretch needs low < high, got low = %1, high = %2").arg(low).arg(high));
    }
}

double MidtoneStretch::mtf(double x, double midtone) {
    if (std::abs(midtone - 0.5) < 1e-12) return x;
    return (midtone - 1.0) * x / ((2.0 * midtone - 1.0) * x - midtone);
}

float MidtoneStretch::apply(float t) const {
    const double x = std::clamp((t - m_shadow) / (m_highlight - m_shadow), 0.0, 1.0);
    const double y = mtf(x, m_midtone);
    return static_cast<float>((y - m_low) / (m_high - m_low));
}

bool MidtoneStretch::isIdentity() const {
    return m_shadow == 0.0 && m_midtone == 0.5 && m_highlight == 1.0 && m_low == 0.0 && m_high == 1.0;
}

QString MidtoneStretch::describe(const QString& key) const {
    return QString::asprintf("%s : (shadow = %.5f, midtone = %.5f, highlight = %.5f, low = %.3f, high = %.3f)",
                             qPrintable(key), m_shadow, m_midtone, m_highlight, m_low, m_high);
}

std::unique_ptr<StretchFunction> MidtoneStretch::clone() const {
    return std::make_unique<MidtoneStretch>(*this);
}

// ----------------------------------------------------------------------------
// Arcsinh
// ----------------------------------------------------------------------------

ArcsinhStretch::ArcsinhStretch(double shadow, double stretch)
    : m_shadow(shadow), m_stretch(stretch), m_norm(1.0)
{
    if (!(shadow >= 0.0 && shadow < 1.0)) {
        throw Quasar::InvalidArgumentError(
            QString("Arcsinh shadow must be in [0, 1), got %1").arg(shadow));
    }
    if (!(stretch >= 0.0)) {
        throw Quasar::InvalidArgumentError(
            QString("Arcsinh stretch must be >= 0, got %1").arg(stretch));
    }
    if (std::abs(m_stretch) >= 1e-6) {
        m_norm = std::asinh(m_stretch * (1.0 - m_shadow));
    }
}

float ArcsinhStretch::apply(float t) const {
    const double x = std::max(0.0, t - m_shadow);
    // Small stretch factors degenerate to the plain blackpoint remap
    if (std::abs(m_stretch) < 1e-6) return static_cast<float>(x / (1.0 - m_shadow));
    return static_cast<float>(std::asinh(m_stretch * x) / m_norm);
}

QString ArcsinhStretch::describe(const QString& key) const {
    return QString::asprintf("%s : (shadow = %.5f, stretch = %.1f)", qPrintable(key), m_shadow, m_stretch);
}

std::unique_ptr<StretchFunction> ArcsinhStretch::clone() const {
    return std::make_unique<ArcsinhStretch>(*this);
}

// ----------------------------------------------------------------------------
// Generalized hyperbolic
// ----------------------------------------------------------------------------

HyperbolicStretch::HyperbolicStretch(double logD1, double B, double SYP, double SPP, double HPP, bool inverse)
{
    if (!(logD1 >= 0.0)) {
        throw Quasar::InvalidArgumentError(
            QString("GHS log(D+1) must be >= 0, got %1").arg(logD1));
    }
    if (!(SPP >= 0.0 && SPP <= SYP && SYP <= HPP && HPP <= 1.0)) {
        throw Quasar::InvalidArgumentError(
            QString("GHS needs 0 <= SPP <= SYP <= HPP <= 1, got SPP = %1, SYP = %2, HPP = %3")
                .arg(SPP).arg(SYP).arg(HPP));
    }
    m_params.logD1 = logD1;
    m_params.B = B;
    m_params.SYP = SYP;
    m_params.SPP = SPP;
    m_params.HPP = HPP;
    m_params.inverse = inverse;
    GHSAlgo::setup(m_coeffs, m_params);
}

float HyperbolicStretch::apply(float t) const {
    return static_cast<float>(GHSAlgo::compute(t, m_params, m_coeffs));
}

QString HyperbolicStretch::operationName() const {
    return m_params.inverse ? "InverseGHStretch" : "GHStretch";
}

QString HyperbolicStretch::describe(const QString& key) const {
    return QString::asprintf("%s : (log(D+1) = %.3f, B = %.3f, SYP = %.5f, SPP = %.5f, HPP = %.5f)",
                             qPrintable(key), m_params.logD1, m_params.B,
                             m_params.SYP, m_params.SPP, m_params.HPP);
}

std::vector<double> HyperbolicStretch::parameters() const {
    return { m_params.logD1, m_params.B, m_params.SYP, m_params.SPP, m_params.HPP,
             m_params.inverse ? 1.0 : 0.0 };
}

std::unique_ptr<StretchFunction> HyperbolicStretch::clone() const {
    return std::make_unique<HyperbolicStretch>(*this);
}

// ----------------------------------------------------------------------------
// Gamma
// ----------------------------------------------------------------------------

GammaStretch::GammaStretch(double gamma)
    : m_gamma(gamma)
{
    if (!(gamma > 0.0)) {
        throw Quasar::InvalidArgumentError(QString("Gamma must be > 0, got %1").arg(gamma));
    }
}

float GammaStretch::apply(float t) const {
    return static_cast<float>(std::pow(std::max(0.0f, t), m_gamma));
}

QString GammaStretch::describe(const QString& key) const {
    return QString::asprintf("%s : (gamma = %.3f)", qPrintable(key), m_gamma);
}

std::unique_ptr<StretchFunction> GammaStretch::clone() const {
    return std::make_unique<GammaStretch>(*this);
}

} // namespace Stretch
