#include "ImageBuffer.h"
#include "TestImages.h"
#include "algos/ColorModel.h"
#include "core/Errors.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <utility>
#include <vector>

using Catch::Approx;

TEST_CASE("constructor_rejects_mismatched_planes") {
    CHECK_THROWS_AS(ImageBuffer(2, 2, std::vector<float>(11, 0.0f)), Quasar::InvalidArgumentError);
    CHECK_FALSE(ImageBuffer().isValid());
    CHECK(ImageBuffer(3, 2).pixelCount() == 6);
}

TEST_CASE("set_planes_replaces_geometry_or_throws") {
    ImageBuffer img(2, 2);
    const quint64 before = img.revision();
    img.setPlanes(3, 1, std::vector<float>(9, 0.5f));
    CHECK(img.width() == 3);
    CHECK(img.height() == 1);
    CHECK(img.revision() > before);

    CHECK_THROWS_AS(img.setPlanes(2, 2, std::vector<float>(9, 0.0f)), Quasar::InvalidArgumentError);
    CHECK(img.width() == 3);
}

TEST_CASE("gray_scale_luma_on_uniform_gray_is_unchanged") {
    ImageBuffer img = TestImages::constant(4, 4, 0.5f, 0.5f, 0.5f);
    REQUIRE(img.isGrayScale());

    img.grayScale(ChannelSelector::parse("L"));
    for (float v : img.data()) CHECK(v == Approx(0.5f).margin(1e-6));
    CHECK(img.isGrayScale());
}

TEST_CASE("gray_scale_makes_planes_identical") {
    ImageBuffer img = TestImages::gradient(6, 5);
    REQUIRE_FALSE(img.isGrayScale());
    for (const char* key : { "V", "L", "Y" }) {
        const ImageBuffer g = img.grayScaled(ChannelSelector::parse(key));
        CHECK(g.isGrayScale());
    }
    CHECK_THROWS_AS(img.grayScaled(ChannelSelector::parse("RG")), Quasar::InvalidArgumentError);
}

TEST_CASE("resolve_gives_scalar_channel_or_plane_indices") {
    const ImageBuffer img = TestImages::gradient(5, 4);

    const ImageBuffer::ResolvedChannels value = img.resolve(ChannelSelector::parse("V"));
    REQUIRE(value.scalar.has_value());
    CHECK(value.planes.empty());
    const std::vector<float> expected = img.value();
    REQUIRE(value.scalar->size() == expected.size());
    for (size_t i = 0; i < expected.size(); ++i) CHECK((*value.scalar)[i] == Approx(expected[i]));

    const ImageBuffer::ResolvedChannels planes = img.resolve(ChannelSelector::parse("RB"));
    CHECK_FALSE(planes.scalar.has_value());
    CHECK(planes.planes == std::vector<int>{ 0, 2 });
}

TEST_CASE("statistics_exclude_zero_and_out_of_range_pixels") {
    // 3x3 plane: 2 zeros, 1 negative, 2 above 1, 4 inside
    const std::vector<float> plane = { 0.0f, 0.0f, -0.3f, 1.5f, 2.0f, 0.1f, 0.4f, 0.2f, 0.9f };
    const ImageBuffer img = TestImages::gray(3, 3, plane);

    const auto stats = img.statistics();
    REQUIRE(stats.contains("R"));
    const ImageBuffer::ChannelStats& r = stats["R"];
    CHECK(r.npixels == 9);
    CHECK(r.zerocount == 3);
    CHECK(r.outcount == 2);
    CHECK(r.minimum == Approx(-0.3f));
    CHECK(r.maximum == Approx(2.0f));
    // median of the in-range values 0.1, 0.2, 0.4, 0.9
    REQUIRE(r.median.has_value());
    CHECK(*r.median == Approx(0.3f));
    REQUIRE(r.percentiles.has_value());
    CHECK((*r.percentiles)[0] == Approx(0.175f));
    CHECK((*r.percentiles)[2] == Approx(0.525f));

    CHECK(stats.keys() == QStringList({ "B", "G", "L", "R", "V" }));
}

TEST_CASE("statistics_have_no_median_without_inside_pixels") {
    const ImageBuffer img = ImageBuffer::blackImage(4, 4);
    const auto stats = img.statistics();
    CHECK_FALSE(stats["V"].median.has_value());
    CHECK(stats["V"].zerocount == 16);
}

TEST_CASE("hot_pixel_at_centre_of_black_image_is_removed") {
    std::vector<float> plane(25, 0.0f);
    plane[12] = 1.0f;
    ImageBuffer img = TestImages::gray(5, 5, plane);

    img.removeHotPixels(2.0);
    for (float v : img.data()) CHECK(v == 0.0f);

    CHECK_THROWS_AS(img.removeHotPixels(0.0), Quasar::InvalidArgumentError);
}

TEST_CASE("hot_pixel_removal_uses_in_image_neighbours_at_edges") {
    // Corner pixel with 3 neighbours at 0.1
    std::vector<float> plane(9, 0.1f);
    plane[0] = 0.9f;
    ImageBuffer img = TestImages::gray(3, 3, plane);
    img.removeHotPixels(2.0, ChannelSelector::parse("RGB"));
    CHECK(img.planeData(0)[0] == Approx(0.1f));
    CHECK(img.planeData(0)[4] == Approx(0.1f));
}

TEST_CASE("color_balance_scales_planes_and_validates_factors") {
    ImageBuffer img = TestImages::constant(3, 3, 0.4f, 0.5f, 0.6f);

    const ImageBuffer zeroRed = img.colorBalanced(0.0, 1.0, 1.0);
    for (size_t i = 0; i < 9; ++i) {
        CHECK(zeroRed.planeData(0)[i] == 0.0f);
        CHECK(zeroRed.planeData(1)[i] == 0.5f);
        CHECK(zeroRed.planeData(2)[i] == 0.6f);
    }

    const std::vector<float> before = img.data();
    CHECK_THROWS_AS(img.colorBalance(-1.0, 1.0, 1.0), Quasar::InvalidArgumentError);
    CHECK(img.data() == before);
}

TEST_CASE("clip_shadows_highlights_is_zero_safe") {
    std::vector<float> planes = { 0.0f, 0.2f, 0.6f, 1.0f,
                                  0.0f, 0.1f, 0.3f, 0.5f,
                                  0.0f, 0.0f, 0.2f, 0.9f };
    ImageBuffer img(2, 2, planes);
    img.clipShadowsHighlights(0.2, 0.8);

    for (float v : img.data()) CHECK(std::isfinite(v));
    for (int c = 0; c < 3; ++c) {
        CHECK(img.planeData(c)[0] == 0.0f);
        CHECK(img.planeData(c)[1] == 0.0f);  // V = 0.2 maps to 0
    }
    CHECK(img.value()[2] == Approx(2.0f / 3.0f).margin(1e-5));

    CHECK_THROWS_AS(img.clipShadowsHighlights(0.5, 0.5), Quasar::InvalidArgumentError);
}

TEST_CASE("protect_highlights_rescales_saturated_pixels") {
    ImageBuffer img = TestImages::constant(1, 1, 2.0f, 1.0f, 0.5f);
    img.protectHighlights();
    CHECK(img.planeData(0)[0] == Approx(1.0f));
    CHECK(img.planeData(1)[0] == Approx(0.5f));
    CHECK(img.planeData(2)[0] == Approx(0.25f));
}

TEST_CASE("returning_variants_leave_the_source_untouched") {
    const ImageBuffer src = TestImages::gray(2, 2, { 0.25f, 0.5f, 0.5f, 1.0f });
    const ChannelSelector rgb = ChannelSelector::parse("RGB");

    const ImageBuffer gamma = src.gammaCorrected(2.0, rgb);
    CHECK(gamma.planeData(0)[0] == Approx(0.0625f));
    CHECK(gamma.planeData(2)[3] == Approx(1.0f));

    const ImageBuffer midtone = src.midtoneCorrected(0.5, rgb);
    for (size_t i = 0; i < midtone.data().size(); ++i) CHECK(midtone.data()[i] == Approx(src.data()[i]));

    const ImageBuffer ranged = src.withDynamicRange(std::make_pair(0.25, 1.0), { 0.0, 1.0 }, rgb);
    CHECK(ranged.planeData(1)[0] == Approx(0.0f).margin(1e-6));
    CHECK(ranged.planeData(1)[1] == Approx(1.0f / 3.0f));
    CHECK(ranged.planeData(1)[3] == Approx(1.0f));
    CHECK_THROWS_AS(src.withDynamicRange(std::make_pair(0.5, 0.5)), Quasar::InvalidArgumentError);

    const ImageBuffer hot = TestImages::constant(1, 1, 2.0f, 1.0f, 0.5f);
    const ImageBuffer protectedImg = hot.protectedHighlights();
    CHECK(protectedImg.planeData(0)[0] == Approx(1.0f));
    CHECK(hot.planeData(0)[0] == Approx(2.0f));

    CHECK(src.planeData(0)[0] == Approx(0.25f));
    CHECK(src.planeData(0)[3] == Approx(1.0f));
}

TEST_CASE("negative_inverts_and_clips") {
    ImageBuffer img = TestImages::constant(2, 2, 0.25f, 1.5f, -0.5f);
    img.negative();
    CHECK(img.planeData(0)[0] == Approx(0.75f));
    CHECK(img.planeData(1)[0] == 0.0f);
    CHECK(img.planeData(2)[0] == 1.0f);
}

TEST_CASE("sharpen_leaves_flat_interior_unchanged") {
    const ImageBuffer img = TestImages::constant(5, 5, 0.3f, 0.3f, 0.3f);
    const ImageBuffer out = img.sharpened();
    CHECK(out.planeData(0)[12] == Approx(0.3f));
}

TEST_CASE("geometry_validates_and_clamps") {
    const ImageBuffer img = TestImages::gradient(20, 10);

    const ImageBuffer half = img.rescaled(0.5, ImageBuffer::Resample_Area);
    CHECK(half.width() == 10);
    CHECK(half.height() == 5);

    CHECK_THROWS_AS(img.resized(0, 10), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(img.resized(40000, 10), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(img.rescaled(-1.0), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(img.rescaled(17.0), Quasar::InvalidArgumentError);

    // Crop bounds are clamped to the image
    const ImageBuffer c = img.cropped(-5, 4, 8, 50);
    CHECK(c.width() == 4);
    CHECK(c.height() == 2);
    CHECK(c.planeData(0)[0] == img.planeData(0)[8 * 20]);
    CHECK_THROWS_AS(img.cropped(5, 5, 0, 10), Quasar::InvalidArgumentError);

    CHECK(ImageBuffer::resampleFromString("Bicubic") == ImageBuffer::Resample_Bicubic);
    CHECK_THROWS_AS(ImageBuffer::resampleFromString("sinc"), Quasar::InvalidArgumentError);
}

TEST_CASE("copies_are_independent") {
    ImageBuffer a = TestImages::constant(2, 2, 0.1f, 0.2f, 0.3f);
    const ImageBuffer b(a);
    a.negative();
    CHECK(b.planeData(0)[0] == Approx(0.1f));
    CHECK(a.planeData(0)[0] == Approx(0.9f));
}

TEST_CASE("luma_cache_follows_pixels_and_weights") {
    struct Restore { ~Restore() { ColorModel::setLumaWeights(0.3, 0.6, 0.1); } } restore;
    ColorModel::setLumaWeights(0.3, 0.6, 0.1);

    ImageBuffer img = TestImages::constant(2, 2, 1.0f, 0.0f, 0.0f);
    CHECK(img.luma()[0] == Approx(0.3f));
    CHECK(img.luma()[0] == Approx(0.3f));
    CHECK(img.lumaCache().computeCount() == 1);

    ColorModel::setLumaWeights(0.5, 0.25, 0.25);
    CHECK(img.luma()[0] == Approx(0.5f));
    CHECK(img.lumaCache().computeCount() == 2);

    img.colorBalance(0.5, 1.0, 1.0);
    CHECK(img.luma()[0] == Approx(0.25f));
    CHECK(img.lumaCache().computeCount() == 3);
}

TEST_CASE("histograms_cover_every_pixel") {
    const ImageBuffer img = TestImages::gradient(8, 8);
    const ImageBuffer::Histograms h = img.histograms(64);
    REQUIRE(h.counts.size() == 5);
    CHECK(h.edges.size() == h.counts[0].size() + 1);
    for (const auto& row : h.counts) {
        int total = 0;
        for (int n : row) total += n;
        CHECK(total == 64);
    }
    CHECK_THROWS_AS(img.histograms(0), Quasar::InvalidArgumentError);
}
