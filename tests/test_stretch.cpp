#include "ImageBuffer.h"
#include "TestImages.h"
#include "algos/StretchFunctions.h"
#include "algos/StretchLUT.h"
#include "algos/StretchOperator.h"
#include "core/Errors.h"

#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

using Catch::Approx;
using namespace Stretch;

namespace {

std::vector<float> grid(int n = 101) {
    std::vector<float> t(n);
    for (int i = 0; i < n; ++i) t[i] = static_cast<float>(i) / (n - 1);
    return t;
}

std::vector<std::unique_ptr<StretchFunction>> sampleFunctions() {
    std::vector<std::unique_ptr<StretchFunction>> fns;
    fns.push_back(std::make_unique<BlackpointStretch>(0.2));
    fns.push_back(std::make_unique<MidtoneStretch>(0.1));
    fns.push_back(std::make_unique<MidtoneStretch>(0.8, 0.05, 0.9, 0.0, 1.0));
    fns.push_back(std::make_unique<ArcsinhStretch>(0.0, 10.0));
    fns.push_back(std::make_unique<ArcsinhStretch>(0.1, 500.0));
    fns.push_back(std::make_unique<GammaStretch>(0.4));
    fns.push_back(std::make_unique<GammaStretch>(2.2));
    for (double b : { -1.0, -0.5, 0.0, 0.5, 3.0 }) {
        fns.push_back(std::make_unique<HyperbolicStretch>(2.0, b, 0.2));
        fns.push_back(std::make_unique<HyperbolicStretch>(1.5, b, 0.3, 0.1, 0.9));
        fns.push_back(std::make_unique<HyperbolicStretch>(1.5, b, 0.3, 0.1, 0.9, true));
    }
    return fns;
}

} // namespace

TEST_CASE("stretch_functions_are_identity_at_degenerate_parameters") {
    const BlackpointStretch blackpoint(0.0);
    const MidtoneStretch midtone(0.5);
    const ArcsinhStretch arcsinh(0.0, 0.0);
    const HyperbolicStretch ghs(0.0, 1.0, 0.25);
    const GammaStretch gamma(1.0);

    for (const StretchFunction* fn : std::vector<const StretchFunction*>{ &blackpoint, &midtone, &arcsinh, &ghs, &gamma }) {
        INFO(fn->operationName().toStdString());
        CHECK(fn->isIdentity());
        for (float t : grid()) {
            CHECK(fn->apply(t) == Approx(t).margin(1e-6));
        }
    }
}

TEST_CASE("stretch_functions_are_monotone_on_unit_range") {
    const std::vector<float> t = grid(1001);
    for (const auto& fn : sampleFunctions()) {
        INFO(fn->describe("K").toStdString());
        float previous = fn->apply(t.front());
        for (size_t i = 1; i < t.size(); ++i) {
            const float y = fn->apply(t[i]);
            REQUIRE(std::isfinite(y));
            REQUIRE(y >= previous - 1e-6f);
            previous = y;
        }
    }
}

TEST_CASE("stretch_functions_map_black_and_white") {
    CHECK(BlackpointStretch(0.2).apply(0.2f) == Approx(0.0f).margin(1e-7));
    CHECK(BlackpointStretch(0.2).apply(1.0f) == Approx(1.0f));
    CHECK(MidtoneStretch(0.1).apply(0.1f) == Approx(0.5f));
    CHECK(ArcsinhStretch(0.1, 50.0).apply(1.0f) == Approx(1.0f));
    CHECK(HyperbolicStretch(2.0, 0.5, 0.2).apply(0.0f) == Approx(0.0f).margin(1e-6));
    CHECK(HyperbolicStretch(2.0, 0.5, 0.2).apply(1.0f) == Approx(1.0f).margin(1e-6));
}

TEST_CASE("ghs_inverse_undoes_the_forward_stretch") {
    const HyperbolicStretch forward(1.5, 0.5, 0.3, 0.1, 0.9);
    const HyperbolicStretch inverse(1.5, 0.5, 0.3, 0.1, 0.9, true);
    for (float t : grid(51)) {
        CHECK(inverse.apply(forward.apply(t)) == Approx(t).margin(1e-4));
    }
}

TEST_CASE("ghs_stays_finite_in_range_and_monotone_at_strong_stretches") {
    struct Points { double syp, spp, hpp; };
    const double logD1 = GENERATE(0.5, 2.0, 5.0, 7.0, 10.0);
    const double b = GENERATE(-5.0, -1.0, -1e-6, 0.0, 1e-6, 5.0);
    const Points p = GENERATE(Points{ 0.0, 0.0, 1.0 }, Points{ 1.0, 0.0, 1.0 }, Points{ 1.0, 1.0, 1.0 },
                              Points{ 0.3, 0.3, 0.3 }, Points{ 0.25, 0.1, 0.9 });
    const bool inverse = GENERATE(false, true);

    const HyperbolicStretch fn(logD1, b, p.syp, p.spp, p.hpp, inverse);
    INFO(fn.describe(inverse ? "inverse" : "forward").toStdString());

    const std::vector<float> t = grid(1025);
    float previous = 0.0f;
    for (size_t i = 0; i < t.size(); ++i) {
        const float y = fn.apply(t[i]);
        INFO("t = " << t[i]);
        REQUIRE(std::isfinite(y));
        REQUIRE(y >= 0.0f);
        REQUIRE(y <= 1.0f);
        if (i > 0) REQUIRE(y >= previous - 1e-6f);
        previous = y;
    }

    const StretchLUT lut(fn, 4096);
    previous = 0.0f;
    for (size_t i = 0; i < t.size(); ++i) {
        const float y = lut.lookup(t[i]);
        INFO("t = " << t[i]);
        REQUIRE(std::isfinite(y));
        REQUIRE(y >= -1e-6f);
        REQUIRE(y <= 1.0f + 1e-6f);
        if (i > 0) REQUIRE(y >= previous - 1e-6f);
        previous = y;
    }
}

TEST_CASE("ghs_inverse_handles_flat_and_singular_pieces") {
    // exp(-D) underflows the top slope to zero
    CHECK(std::isfinite(HyperbolicStretch(7.0, 0.0, 0.0, 0.0, 1.0, true).apply(1.0f)));
    CHECK(std::isfinite(HyperbolicStretch(10.0, 0.0, 0.0, 0.0, 1.0, true).apply(1.0f)));

    // Exponent of about -5e5 just outside the logarithmic tolerance
    const HyperbolicStretch steep(5.0, -2e-6, 1.0, 0.0, 1.0, true);
    const float low = steep.apply(0.0f);
    const float high = steep.apply(0.5f);
    REQUIRE(std::isfinite(low));
    REQUIRE(std::isfinite(high));
    CHECK(low >= 0.0f);
    CHECK(low <= high);
    CHECK(high <= 1.0f);
}

TEST_CASE("stretch_constructors_reject_invalid_parameters") {
    CHECK_THROWS_AS(BlackpointStretch(1.0), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(BlackpointStretch(-0.1), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(MidtoneStretch(0.0), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(MidtoneStretch(0.5, 0.6, 0.4), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(MidtoneStretch(0.5, 0.0, 1.0, 0.5, 0.5), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(ArcsinhStretch(0.0, -1.0), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(HyperbolicStretch(-1.0, 0.0, 0.5), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(HyperbolicStretch(1.0, 0.0, 0.2, 0.5, 0.9), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(GammaStretch(0.0), Quasar::InvalidArgumentError);
}

TEST_CASE("lut_matches_direct_evaluation") {
    const ArcsinhStretch fn(0.05, 100.0);
    const StretchLUT lut(fn, 65536);
    for (float t : grid(997)) {
        CHECK(lut.lookup(t) == Approx(fn.apply(t)).margin(1e-3));
    }
    // Inputs are clipped
    CHECK(lut.lookup(-0.5f) == Approx(fn.apply(0.0f)).margin(1e-6));
    CHECK(lut.lookup(2.0f) == Approx(fn.apply(1.0f)).margin(1e-6));

    const ImageBuffer img = TestImages::gradient(16, 16);
    const ImageBuffer direct = img.generalizedStretched(fn, ChannelSelector::parse("RGB"));
    const ImageBuffer tabulated = img.generalizedStretchedLookup(fn, ChannelSelector::parse("RGB"), 65536);
    for (size_t i = 0; i < direct.data().size(); ++i) {
        REQUIRE(tabulated.data()[i] == Approx(direct.data()[i]).margin(1e-3));
    }
}

TEST_CASE("lut_cache_builds_each_table_once") {
    StretchLUTCache& cache = StretchLUTCache::instance();
    const int savedCapacity = cache.capacity();
    cache.clear();

    const GammaStretch a(0.5);
    const GammaStretch sameAsA(0.5);
    const GammaStretch b(0.7);

    auto first = cache.get(a, 1024);
    auto second = cache.get(sameAsA, 1024);
    CHECK(first == second);
    CHECK(cache.buildCount() == 1);

    cache.get(b, 1024);
    cache.get(a, 2048);
    CHECK(cache.buildCount() == 3);

    cache.setCapacity(1);
    CHECK(cache.size() == 1);
    cache.get(a, 1024);
    CHECK(cache.buildCount() == 4);

    cache.setCapacity(savedCapacity);
    cache.clear();
}

TEST_CASE("generalized_stretch_keeps_zero_pixels_at_zero_on_scalar_channels") {
    // Pixel 0 is black, pixel 1 has a zero channel but non-zero value
    std::vector<float> planes = { 0.0f, 0.5f, 0.2f, 0.0f,
                                  0.0f, 0.0f, 0.4f, 0.9f,
                                  0.0f, 0.3f, 0.6f, 1.0f };
    const ImageBuffer img(2, 2, planes);

    for (const char* key : { "V", "L" }) {
        for (const auto& fn : sampleFunctions()) {
            const ImageBuffer out = img.generalizedStretched(*fn, ChannelSelector::parse(key));
            INFO(key << " " << fn->describe("K").toStdString());
            for (int c = 0; c < 3; ++c) {
                REQUIRE(out.planeData(c)[0] == 0.0f);
                for (size_t i = 0; i < 4; ++i) REQUIRE(std::isfinite(out.planeData(c)[i]));
            }
        }
    }
}

TEST_CASE("blackpoint_on_value_sends_the_shadow_level_to_zero") {
    // V of pixel 0 is exactly 0.2; the brightest V is 1
    std::vector<float> planes = { 0.2f, 1.0f, 0.6f, 0.5f,
                                  0.1f, 0.8f, 0.3f, 0.5f,
                                  0.0f, 0.2f, 0.1f, 0.5f };
    ImageBuffer img(2, 2, planes);
    const std::vector<float> before = img.value();

    img.generalizedStretch(BlackpointStretch(0.2), ChannelSelector::parse("V"));
    const std::vector<float> after = img.value();

    CHECK(after[0] == Approx(0.0f).margin(1e-6));
    CHECK(*std::max_element(after.begin(), after.end()) == Approx(*std::max_element(before.begin(), before.end())));
}

TEST_CASE("stretch_operator_skips_identity_and_builds_labels") {
    ImageBuffer img = TestImages::gradient(8, 8);
    const quint64 revision = img.revision();

    const StretchOperator identity = StretchOperator::uniform(ArcsinhStretch(0.0, 0.0));
    CHECK_FALSE(identity.apply(img));
    CHECK(img.revision() == revision);

    const StretchOperator op = StretchOperator::uniform(ArcsinhStretch(0.0, 10.0), QString(), true);
    CHECK(op.keys() == QStringList({ "R", "G", "B" }));
    CHECK(op.label() == "ArcsinhStretch(R : (shadow = 0.00000, stretch = 10.0), "
                        "G : (shadow = 0.00000, stretch = 10.0), "
                        "B : (shadow = 0.00000, stretch = 10.0), protect highlights)");
    CHECK(op.apply(img));
    CHECK_FALSE(img.isOutOfRange());

    StretchOperator bad;
    CHECK_THROWS_AS(bad.setFunction("RG", GammaStretch(2.0)), Quasar::InvalidArgumentError);
}

TEST_CASE("stretch_operator_clips_out_of_range_planes_even_with_identity") {
    ImageBuffer img = TestImages::constant(2, 2, 1.5f, 0.5f, -0.2f);
    REQUIRE(img.isOutOfRange());
    const StretchOperator op = StretchOperator::uniform(GammaStretch(1.0));
    CHECK(op.apply(img));
    CHECK(img.planeData(0)[0] == 1.0f);
    CHECK(img.planeData(1)[0] == Approx(0.5f));
    CHECK(img.planeData(2)[0] == 0.0f);
}
