#ifndef GHSALGO_H
#define GHSALGO_H

namespace GHSAlgo {

    // Regimes are selected with a tolerance on B; exact comparisons blow up
    // near the singular exponents.
    constexpr double REGIME_EPS = 1.e-6;

    // Linear pieces flatter than this are treated as constant when inverting
    constexpr double SLOPE_EPS = 1.e-12;

    enum Regime {
        REGIME_IDENTITY = 0,
        REGIME_EXPONENTIAL = 1,   // B ~ 0
        REGIME_LOGARITHMIC = 2,   // B ~ -1
        REGIME_POWER = 3
    };

    struct GHSParams {
        double logD1 = 0.0;   // log(D+1), D = stretch factor
        double B = 0.0;       // local stretch intensity
        double SYP = 0.0;     // symmetry point
        double SPP = 0.0;     // shadow protection point
        double HPP = 1.0;     // highlight protection point
        bool inverse = false;
    };

    struct GHSComputeParams {
        Regime regime = REGIME_IDENTITY;
        double b1 = 0.0;                       // levels < SPP
        double a2 = 0.0, b2 = 0.0, c2 = 0.0, d2 = 0.0, e2 = 0.0; // SPP <= levels < SYP
        double a3 = 0.0, b3 = 0.0, c3 = 0.0, d3 = 0.0, e3 = 0.0; // SYP <= levels < HPP
        double a4 = 0.0, b4 = 0.0;             // levels >= HPP
        double SPT = 0.0, SYT = 0.0, HPT = 0.0; // breakpoints on the output side (inverse)
    };

    void setup(GHSComputeParams& c, const GHSParams& params);

    // Each piece is bounded to its own interval in both directions, so the
    // result is finite, in [0, 1] and non-decreasing even where coefficients
    // underflow at large D.
    double compute(double in, const GHSParams& params, const GHSComputeParams& c);

}

#endif // GHSALGO_H
