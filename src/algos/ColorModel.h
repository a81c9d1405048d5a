#ifndef COLORMODEL_H
#define COLORMODEL_H

#include <QtGlobal>
#include <vector>

/**
 * @brief Colorimetric conversions on planar RGB data.
 *
 * RGB arrays are plane-major: 3 consecutive planes of npix samples
 * (R plane, then G, then B). Single-channel results are one plane of npix
 * samples. HSV arrays are pixel-interleaved (h, s, v per pixel).
 *
 * Everything here is stateless except the luma weights, which are a single
 * process-wide cell guarded by a read/write lock.
 */
namespace ColorModel {

    /// Tolerance used for zero, saturation and range tests on float images.
    constexpr float IMGTOL = 1.e-6f;

    struct LumaWeights {
        double red = 0.3;
        double green = 0.6;
        double blue = 0.1;
    };

    /// Current luma weights; always a complete triple.
    LumaWeights lumaWeights();

    /**
     * @brief Replace the luma weights.
     * Weights are stored as given. Throws Quasar::InvalidArgumentError if any
     * weight is negative or their sum is zero. Bumps lumaGeneration().
     */
    void setLumaWeights(double red, double green, double blue);

    /// Incremented on every weight change; cached luma planes compare against it.
    quint64 lumaGeneration();

    // Scalar transfer functions
    float srgbToLinear(float x);
    float linearToSrgb(float x);
    float lightnessFromLuminance(float y);

    // Channel extractors (input: planar RGB of 3*npix samples)
    std::vector<float> hsvValue(const std::vector<float>& rgb);
    std::vector<float> hsvSaturation(const std::vector<float>& rgb);
    std::vector<float> luma(const std::vector<float>& rgb);

    // Color space conversions (planar in, planar out)
    std::vector<float> srgbToLrgb(const std::vector<float>& srgb);
    std::vector<float> lrgbToSrgb(const std::vector<float>& lrgb);

    std::vector<float> lrgbLuminance(const std::vector<float>& lrgb);
    std::vector<float> lrgbLightness(const std::vector<float>& lrgb);
    std::vector<float> srgbLuminance(const std::vector<float>& srgb);
    std::vector<float> srgbLightness(const std::vector<float>& srgb);

    // Single plane sRGB <-> linear (clips to [0, 1] first)
    std::vector<float> srgbToLinear(const std::vector<float>& plane);
    std::vector<float> linearToSrgb(const std::vector<float>& plane);

    /// Planar RGB -> interleaved HSV (hue in [0, 1)).
    std::vector<float> rgbToHsv(const std::vector<float>& rgb);
    /// Interleaved HSV -> planar RGB.
    std::vector<float> hsvToRgb(const std::vector<float>& hsv);

}

#endif // COLORMODEL_H
