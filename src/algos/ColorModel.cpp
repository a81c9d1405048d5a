#include "ColorModel.h"
#include "../core/Errors.h"
#include <QReadWriteLock>
#include <QString>
#include <algorithm>
#include <atomic>
#include <cmath>

namespace ColorModel {

namespace {
    QReadWriteLock s_lumaLock;
    LumaWeights s_luma;
    std::atomic<quint64> s_lumaGeneration{1};

    inline size_t planeSize(const std::vector<float>& rgb) { return rgb.size() / 3; }
}

// ----------------------------------------------------------------------------
// Luma weights
// ----------------------------------------------------------------------------

LumaWeights lumaWeights() {
    QReadLocker locker(&s_lumaLock);
    return s_luma;
}

void setLumaWeights(double red, double green, double blue) {
    const double sum = red + green + blue;
    if (red < 0.0 || green < 0.0 || blue < 0.0 || !(sum > 0.0)) {
        throw Quasar::InvalidArgumentError(
            QString("Invalid luma weights (%1, %2, %3): weights must be >= 0 with a positive sum")
                .arg(red).arg(green).arg(blue));
    }
    {
        QWriteLocker locker(&s_lumaLock);
        s_luma.red = red;
        s_luma.green = green;
        s_luma.blue = blue;
    }
    s_lumaGeneration.fetch_add(1, std::memory_order_acq_rel);
}

quint64 lumaGeneration() {
    return s_lumaGeneration.load(std::memory_order_acquire);
}

// ----------------------------------------------------------------------------
// Scalar transfer functions
// ----------------------------------------------------------------------------

float srgbToLinear(float x) {
    x = std::clamp(x, 0.0f, 1.0f);
    if (x > 0.04045f) return std::pow((x + 0.055f) / 1.055f, 2.4f);
    return x / 12.92f;
}

float linearToSrgb(float x) {
    x = std::clamp(x, 0.0f, 1.0f);
    if (x > 0.0031308f) return 1.055f * std::pow(x, 1.0f / 2.4f) - 0.055f;
    return 12.92f * x;
}

float lightnessFromLuminance(float y) {
    if (y > 0.008856f) return 116.0f * std::cbrt(y) - 16.0f;
    return 903.3f * y;
}

// ----------------------------------------------------------------------------
// Channel extractors
// ----------------------------------------------------------------------------

std::vector<float> hsvValue(const std::vector<float>& rgb) {
    const size_t n = planeSize(rgb);
    std::vector<float> out(n);
    const float* r = rgb.data();
    const float* g = r + n;
    const float* b = g + n;

    #pragma omp parallel for
    for (long long i = 0; i < (long long)n; ++i) {
        out[i] = std::max(r[i], std::max(g[i], b[i]));
    }
    return out;
}

std::vector<float> hsvSaturation(const std::vector<float>& rgb) {
    const size_t n = planeSize(rgb);
    std::vector<float> out(n);
    const float* r = rgb.data();
    const float* g = r + n;
    const float* b = g + n;

    #pragma omp parallel for
    for (long long i = 0; i < (long long)n; ++i) {
        const float mx = std::max(IMGTOL, std::max(r[i], std::max(g[i], b[i])));
        const float mn = std::min(r[i], std::min(g[i], b[i]));
        out[i] = 1.0f - mn / mx;
    }
    return out;
}

std::vector<float> luma(const std::vector<float>& rgb) {
    const LumaWeights w = lumaWeights();
    const float wr = static_cast<float>(w.red);
    const float wg = static_cast<float>(w.green);
    const float wb = static_cast<float>(w.blue);

    const size_t n = planeSize(rgb);
    std::vector<float> out(n);
    const float* r = rgb.data();
    const float* g = r + n;
    const float* b = g + n;

    #pragma omp parallel for
    for (long long i = 0; i < (long long)n; ++i) {
        out[i] = wr * r[i] + wg * g[i] + wb * b[i];
    }
    return out;
}

// ----------------------------------------------------------------------------
// Color spaces
// ----------------------------------------------------------------------------

std::vector<float> srgbToLinear(const std::vector<float>& plane) {
    std::vector<float> out(plane.size());
    #pragma omp parallel for
    for (long long i = 0; i < (long long)plane.size(); ++i) {
        out[i] = srgbToLinear(plane[i]);
    }
    return out;
}

std::vector<float> linearToSrgb(const std::vector<float>& plane) {
    std::vector<float> out(plane.size());
    #pragma omp parallel for
    for (long long i = 0; i < (long long)plane.size(); ++i) {
        out[i] = linearToSrgb(plane[i]);
    }
    return out;
}

// Conversions are elementwise, so planar RGB goes through the plane helpers unchanged
std::vector<float> srgbToLrgb(const std::vector<float>& srgb) {
    return srgbToLinear(srgb);
}

std::vector<float> lrgbToSrgb(const std::vector<float>& lrgb) {
    return linearToSrgb(lrgb);
}

std::vector<float> lrgbLuminance(const std::vector<float>& lrgb) {
    const size_t n = planeSize(lrgb);
    std::vector<float> out(n);
    const float* r = lrgb.data();
    const float* g = r + n;
    const float* b = g + n;

    #pragma omp parallel for
    for (long long i = 0; i < (long long)n; ++i) {
        out[i] = 0.2126f * r[i] + 0.7152f * g[i] + 0.0722f * b[i];
    }
    return out;
}

std::vector<float> lrgbLightness(const std::vector<float>& lrgb) {
    std::vector<float> y = lrgbLuminance(lrgb);
    #pragma omp parallel for
    for (long long i = 0; i < (long long)y.size(); ++i) {
        y[i] = lightnessFromLuminance(y[i]);
    }
    return y;
}

std::vector<float> srgbLuminance(const std::vector<float>& srgb) {
    return lrgbLuminance(srgbToLrgb(srgb));
}

std::vector<float> srgbLightness(const std::vector<float>& srgb) {
    return lrgbLightness(srgbToLrgb(srgb));
}

// ----------------------------------------------------------------------------
// HSV
// ----------------------------------------------------------------------------

std::vector<float> rgbToHsv(const std::vector<float>& rgb) {
    const size_t n = planeSize(rgb);
    std::vector<float> hsv(3 * n);
    const float* r = rgb.data();
    const float* g = r + n;
    const float* b = g + n;

    #pragma omp parallel for
    for (long long i = 0; i < (long long)n; ++i) {
        const float mx = std::max(r[i], std::max(g[i], b[i]));
        const float mn = std::min(r[i], std::min(g[i], b[i]));
        const float delta = mx - mn;

        float h = 0.0f;
        float s = (mx > 0.0f) ? delta / mx : 0.0f;
        if (delta > 0.0f) {
            if (r[i] == mx)      h = (g[i] - b[i]) / delta;
            else if (g[i] == mx) h = 2.0f + (b[i] - r[i]) / delta;
            else                 h = 4.0f + (r[i] - g[i]) / delta;
            h /= 6.0f;
            h -= std::floor(h);
            if (h >= 1.0f) h = 0.0f;
        }
        hsv[3 * i + 0] = h;
        hsv[3 * i + 1] = s;
        hsv[3 * i + 2] = mx;
    }
    return hsv;
}

std::vector<float> hsvToRgb(const std::vector<float>& hsv) {
    const size_t n = hsv.size() / 3;
    std::vector<float> rgb(3 * n);
    float* r = rgb.data();
    float* g = r + n;
    float* b = g + n;

    #pragma omp parallel for
    for (long long i = 0; i < (long long)n; ++i) {
        const float h = hsv[3 * i + 0];
        const float s = hsv[3 * i + 1];
        const float v = hsv[3 * i + 2];

        const float h6 = (h - std::floor(h)) * 6.0f;
        const int sector = static_cast<int>(h6) % 6;
        const float f = h6 - std::floor(h6);
        const float p = v * (1.0f - s);
        const float q = v * (1.0f - s * f);
        const float t = v * (1.0f - s * (1.0f - f));

        switch (sector) {
            case 0:  r[i] = v; g[i] = t; b[i] = p; break;
            case 1:  r[i] = q; g[i] = v; b[i] = p; break;
            case 2:  r[i] = p; g[i] = v; b[i] = t; break;
            case 3:  r[i] = p; g[i] = q; b[i] = v; break;
            case 4:  r[i] = t; g[i] = p; b[i] = v; break;
            default: r[i] = v; g[i] = p; b[i] = q; break;
        }
    }
    return rgb;
}

}
