#include "GHSAlgo.h"
#include <cfloat>
#include <cmath>
#include <algorithm>

namespace GHSAlgo {

    namespace {
        // Transfer of the two curved pieces for the active regime
        inline double curve(Regime r, double u, double e) {
            switch (r) {
                case REGIME_EXPONENTIAL: return std::exp(u);
                case REGIME_LOGARITHMIC: return std::log(u);
                default:                 return std::pow(u, e);
            }
        }

        inline double curveInverse(Regime r, double v, double e) {
            switch (r) {
                case REGIME_EXPONENTIAL: return std::log(std::max(v, DBL_MIN));
                case REGIME_LOGARITHMIC: return std::exp(v);
                default:                 return std::pow(std::max(v, 0.0), 1.0 / e);
            }
        }

        // NaN falls to the lower end of the interval
        inline double bounded(double x, double lo, double hi) {
            if (std::isnan(x)) return lo;
            return std::clamp(x, lo, hi);
        }
    }

    void setup(GHSComputeParams& c, const GHSParams& params) {
        c = GHSComputeParams();
        const double D = std::expm1(params.logD1);
        if (std::abs(D) < REGIME_EPS) {
            c.regime = REGIME_IDENTITY;
            return;
        }

        double B = params.B;
        const double SP = params.SYP;
        const double LP = params.SPP;
        const double HP = params.HPP;
        double qlp, q0, qwp, q1, q;

        if (std::abs(B) < REGIME_EPS) {
            c.regime = REGIME_EXPONENTIAL;
            qlp = std::exp(-D * (SP - LP));
            q0 = qlp - D * LP * std::exp(-D * (SP - LP));
            qwp = 2.0 - std::exp(-D * (HP - SP));
            q1 = qwp + D * (1.0 - HP) * std::exp(-D * (HP - SP));
            q = 1.0 / (q1 - q0);
            c.b1 = D * std::exp(-D * (SP - LP)) * q;
            c.a2 = -q0 * q;
            c.b2 = q;
            c.c2 = -D * SP;
            c.d2 = D;
            c.a3 = (2.0 - q0) * q;
            c.b3 = -q;
            c.c3 = D * SP;
            c.d3 = -D;
            c.a4 = (qwp - q0 - D * HP * std::exp(-D * (HP - SP))) * q;
            c.b4 = D * std::exp(-D * (HP - SP)) * q;
        } else if (std::abs(B + 1.0) < REGIME_EPS) {
            c.regime = REGIME_LOGARITHMIC;
            qlp = -std::log1p(D * (SP - LP));
            q0 = qlp - D * LP / (1.0 + D * (SP - LP));
            qwp = std::log1p(D * (HP - SP));
            q1 = qwp + D * (1.0 - HP) / (1.0 + D * (HP - SP));
            q = 1.0 / (q1 - q0);
            c.b1 = D / (1.0 + D * (SP - LP)) * q;
            c.a2 = -q0 * q;
            c.b2 = -q;
            c.c2 = 1.0 + D * SP;
            c.d2 = -D;
            c.a3 = -q0 * q;
            c.b3 = q;
            c.c3 = 1.0 - D * SP;
            c.d3 = D;
            c.a4 = (qwp - q0 - D * HP / (1.0 + D * (HP - SP))) * q;
            c.b4 = q * D / (1.0 + D * (HP - SP));
        } else if (B < 0.0) {
            c.regime = REGIME_POWER;
            B = -B;
            qlp = (1.0 - std::pow(1.0 + D * B * (SP - LP), (B - 1.0) / B)) / (B - 1.0);
            q0 = qlp - D * LP * std::pow(1.0 + D * B * (SP - LP), -1.0 / B);
            qwp = (std::pow(1.0 + D * B * (HP - SP), (B - 1.0) / B) - 1.0) / (B - 1.0);
            q1 = qwp + D * (1.0 - HP) * std::pow(1.0 + D * B * (HP - SP), -1.0 / B);
            q = 1.0 / (q1 - q0);
            c.b1 = D * std::pow(1.0 + D * B * (SP - LP), -1.0 / B) * q;
            c.a2 = (1.0 / (B - 1.0) - q0) * q;
            c.b2 = -q / (B - 1.0);
            c.c2 = 1.0 + D * B * SP;
            c.d2 = -D * B;
            c.e2 = (B - 1.0) / B;
            c.a3 = (-1.0 / (B - 1.0) - q0) * q;
            c.b3 = q / (B - 1.0);
            c.c3 = 1.0 - D * B * SP;
            c.d3 = D * B;
            c.e3 = (B - 1.0) / B;
            c.a4 = (qwp - q0 - D * HP * std::pow(1.0 + D * B * (HP - SP), -1.0 / B)) * q;
            c.b4 = D * std::pow(1.0 + D * B * (HP - SP), -1.0 / B) * q;
        } else {
            c.regime = REGIME_POWER;
            qlp = std::pow(1.0 + D * B * (SP - LP), -1.0 / B);
            q0 = qlp - D * LP * std::pow(1.0 + D * B * (SP - LP), -(1.0 + B) / B);
            qwp = 2.0 - std::pow(1.0 + D * B * (HP - SP), -1.0 / B);
            q1 = qwp + D * (1.0 - HP) * std::pow(1.0 + D * B * (HP - SP), -(1.0 + B) / B);
            q = 1.0 / (q1 - q0);
            c.b1 = D * std::pow(1.0 + D * B * (SP - LP), -(1.0 + B) / B) * q;
            c.a2 = -q0 * q;
            c.b2 = q;
            c.c2 = 1.0 + D * B * SP;
            c.d2 = -D * B;
            c.e2 = -1.0 / B;
            c.a3 = (2.0 - q0) * q;
            c.b3 = -q;
            c.c3 = 1.0 - D * B * SP;
            c.d3 = D * B;
            c.e3 = -1.0 / B;
            c.a4 = (qwp - q0 - D * HP * std::pow(1.0 + D * B * (HP - SP), -(B + 1.0) / B)) * q;
            c.b4 = D * std::pow(1.0 + D * B * (HP - SP), -(B + 1.0) / B) * q;
        }

        // Images of the breakpoints, used to pick the piece when inverting
        c.SPT = bounded(c.b1 * LP, 0.0, 1.0);
        c.SYT = bounded(c.a2 + c.b2 * curve(c.regime, c.c2 + c.d2 * SP, c.e2), c.SPT, 1.0);
        c.HPT = bounded(c.a4 + c.b4 * HP, c.SYT, 1.0);
    }

    double compute(double in, const GHSParams& params, const GHSComputeParams& c) {
        if (c.regime == REGIME_IDENTITY) {
            return in;
        }

        if (!params.inverse) {
            if (in < params.SPP) return bounded(c.b1 * in, 0.0, c.SPT);
            if (in < params.SYP) return bounded(c.a2 + c.b2 * curve(c.regime, c.c2 + c.d2 * in, c.e2), c.SPT, c.SYT);
            if (in < params.HPP) return bounded(c.a3 + c.b3 * curve(c.regime, c.c3 + c.d3 * in, c.e3), c.SYT, c.HPT);
            return bounded(c.a4 + c.b4 * in, c.HPT, 1.0);
        }

        if (in < c.SPT) {
            if (c.b1 < SLOPE_EPS) return params.SPP;
            return bounded(in / c.b1, 0.0, params.SPP);
        }
        if (in < c.SYT) {
            return bounded((curveInverse(c.regime, (in - c.a2) / c.b2, c.e2) - c.c2) / c.d2, params.SPP, params.SYP);
        }
        if (in < c.HPT) {
            return bounded((curveInverse(c.regime, (in - c.a3) / c.b3, c.e3) - c.c3) / c.d3, params.SYP, params.HPP);
        }
        if (c.b4 < SLOPE_EPS) return params.HPP;
        return bounded((in - c.a4) / c.b4, params.HPP, 1.0);
    }
}
