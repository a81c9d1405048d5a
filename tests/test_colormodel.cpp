#include "algos/ColorModel.h"
#include "core/Errors.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <vector>

using Catch::Approx;

namespace {

// Planar RGB sweeping [0, 1] on each plane with different phases
std::vector<float> sweep(size_t npix) {
    std::vector<float> rgb(3 * npix);
    for (size_t i = 0; i < npix; ++i) {
        const float t = static_cast<float>(i) / (npix - 1);
        rgb[i] = t;
        rgb[npix + i] = 1.0f - t;
        rgb[2 * npix + i] = 0.5f * t + 0.25f;
    }
    return rgb;
}

struct LumaRestore {
    ~LumaRestore() { ColorModel::setLumaWeights(0.3, 0.6, 0.1); }
};

} // namespace

TEST_CASE("srgb_to_lrgb_and_back_is_identity_on_unit_range") {
    const std::vector<float> srgb = sweep(257);
    const std::vector<float> back = ColorModel::lrgbToSrgb(ColorModel::srgbToLrgb(srgb));
    REQUIRE(back.size() == srgb.size());
    for (size_t i = 0; i < srgb.size(); ++i) {
        REQUIRE(back[i] == Approx(srgb[i]).margin(1e-5));
    }

    const std::vector<float> lrgb = sweep(129);
    const std::vector<float> forth = ColorModel::srgbToLrgb(ColorModel::lrgbToSrgb(lrgb));
    for (size_t i = 0; i < lrgb.size(); ++i) {
        REQUIRE(forth[i] == Approx(lrgb[i]).margin(1e-5));
    }
}

TEST_CASE("transfer_functions_fix_black_and_white") {
    CHECK(ColorModel::srgbToLinear(0.0f) == Approx(0.0f));
    CHECK(ColorModel::srgbToLinear(1.0f) == Approx(1.0f));
    CHECK(ColorModel::linearToSrgb(1.0f) == Approx(1.0f));
    CHECK(ColorModel::lightnessFromLuminance(1.0f) == Approx(100.0f).margin(1e-3));
    CHECK(ColorModel::lightnessFromLuminance(0.0f) == Approx(0.0f).margin(1e-6));
}

TEST_CASE("hsv_value_is_the_max_of_rgb") {
    const std::vector<float> rgb = { 0.1f, 0.9f, 0.3f, 0.2f, 0.5f, 0.8f };  // 2 pixels
    const std::vector<float> v = ColorModel::hsvValue(rgb);
    REQUIRE(v.size() == 2);
    CHECK(v[0] == Approx(0.5f));
    CHECK(v[1] == Approx(0.9f));
}

TEST_CASE("luma_weights_are_stored_as_given_and_validated") {
    LumaRestore restore;

    ColorModel::setLumaWeights(2.0, 1.0, 1.0);
    const ColorModel::LumaWeights w = ColorModel::lumaWeights();
    CHECK(w.red == 2.0);
    CHECK(w.green == 1.0);
    CHECK(w.blue == 1.0);

    const std::vector<float> rgb = { 1.0f, 0.0f, 0.0f };
    CHECK(ColorModel::luma(rgb)[0] == Approx(2.0f));

    CHECK_THROWS_AS(ColorModel::setLumaWeights(-0.1, 0.6, 0.5), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(ColorModel::setLumaWeights(0.0, 0.0, 0.0), Quasar::InvalidArgumentError);

    // A rejected update leaves the weights alone
    CHECK(ColorModel::lumaWeights().red == 2.0);
}

TEST_CASE("luma_generation_increases_on_every_weight_change") {
    LumaRestore restore;
    const quint64 before = ColorModel::lumaGeneration();
    ColorModel::setLumaWeights(0.2, 0.7, 0.1);
    ColorModel::setLumaWeights(0.2, 0.7, 0.1);
    CHECK(ColorModel::lumaGeneration() == before + 2);
}

TEST_CASE("luminance_uses_fixed_bt709_weights") {
    LumaRestore restore;
    ColorModel::setLumaWeights(1.0, 1.0, 1.0);

    // Pixels: pure red, pure green, white
    const std::vector<float> lrgb = { 1.0f, 0.0f, 1.0f, 0.0f, 1.0f, 1.0f, 0.0f, 0.0f, 1.0f };
    const std::vector<float> y = ColorModel::lrgbLuminance(lrgb);
    REQUIRE(y.size() == 3);
    CHECK(y[0] == Approx(0.2126f));
    CHECK(y[1] == Approx(0.7152f));
    CHECK(y[2] == Approx(1.0f));

    const std::vector<float> lstar = ColorModel::lrgbLightness(lrgb);
    CHECK(lstar[2] == Approx(100.0f).margin(1e-3));
    CHECK(lstar[0] == Approx(116.0f * std::cbrt(0.2126f) - 16.0f).margin(1e-3));

    // White and black are fixed points of the sRGB transfer
    const std::vector<float> srgb = { 0.0f, 1.0f, 0.0f, 1.0f, 0.0f, 1.0f };
    const std::vector<float> sy = ColorModel::srgbLuminance(srgb);
    CHECK(sy[0] == Approx(0.0f).margin(1e-6));
    CHECK(sy[1] == Approx(1.0f));
    CHECK(ColorModel::srgbLightness(srgb)[1] == Approx(100.0f).margin(1e-3));
}

TEST_CASE("saturation_is_finite_on_black_pixels") {
    const std::vector<float> rgb = { 0.0f, 0.8f, 0.0f, 0.4f, 0.0f, 0.8f };  // black, magenta
    const std::vector<float> s = ColorModel::hsvSaturation(rgb);
    REQUIRE(s.size() == 2);
    CHECK(std::isfinite(s[0]));
    CHECK(s[1] == Approx(0.5f));
}

TEST_CASE("hsv_conversion_moves_the_channel_axis_and_inverts") {
    const std::vector<float> rgb = sweep(65);
    const std::vector<float> hsv = ColorModel::rgbToHsv(rgb);
    REQUIRE(hsv.size() == rgb.size());

    // Interleaved: the value of pixel i sits at 3*i + 2
    const std::vector<float> v = ColorModel::hsvValue(rgb);
    for (size_t i = 0; i < v.size(); ++i) {
        REQUIRE(hsv[3 * i + 2] == Approx(v[i]));
        REQUIRE(hsv[3 * i] >= 0.0f);
        REQUIRE(hsv[3 * i] < 1.0f);
    }

    const std::vector<float> back = ColorModel::hsvToRgb(hsv);
    for (size_t i = 0; i < rgb.size(); ++i) {
        REQUIRE(back[i] == Approx(rgb[i]).margin(1e-5));
    }
}
