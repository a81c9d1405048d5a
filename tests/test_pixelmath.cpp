#include "ImageBuffer.h"
#include "TestImages.h"
#include "scripting/PixelMath.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using Catch::Approx;
using Scripting::PixelMath;

namespace {

    // Evaluates with IMG1 = (0.2, 0.4, 0.6) and IMG2 = white
    struct Fixture {
        ImageBuffer img1 = TestImages::constant(2, 2, 0.2f, 0.4f, 0.6f);
        ImageBuffer img2 = ImageBuffer::whiteImage(2, 2);
        PixelMath engine;

        Fixture() { engine.setImages({ &img1, &img2 }); }

        std::vector<float> pixel(const QString& expression) {
            ImageBuffer out;
            INFO(expression.toStdString());
            REQUIRE(engine.evaluate(expression, out));
            return { out.planeData(0)[0], out.planeData(1)[0], out.planeData(2)[0] };
        }
    };
}

TEST_CASE("blend_mixes_two_images") {
    Fixture f;
    const std::vector<float> p = f.pixel("blend(IMG1, IMG2, 0.5)");
    CHECK(p[0] == Approx(0.6f));
    CHECK(p[1] == Approx(0.7f));
    CHECK(p[2] == Approx(0.8f));
}

TEST_CASE("operators_follow_usual_precedence") {
    Fixture f;
    CHECK(f.pixel("IMG1 + 2 * IMG1")[0] == Approx(0.6f));
    CHECK(f.pixel("-IMG1 ** 2")[0] == Approx(-0.04f));
    CHECK(f.pixel("2 ** 1 ** 3 * IMG1")[0] == Approx(0.4f));
    CHECK(f.pixel("(IMG1 + IMG2) / 2")[2] == Approx(0.8f));
}

TEST_CASE("planes_broadcast_over_images") {
    Fixture f;
    const std::vector<float> p = f.pixel("IMG1 * value(IMG1)");
    CHECK(p[0] == Approx(0.12f));
    CHECK(p[1] == Approx(0.24f));
    CHECK(p[2] == Approx(0.36f));
}

TEST_CASE("array_functions_accept_np_qualifier") {
    Fixture f;
    const std::vector<float> clipped = f.pixel("np.clip(IMG1, 0.3, 0.5)");
    CHECK(clipped[0] == Approx(0.3f));
    CHECK(clipped[1] == Approx(0.4f));
    CHECK(clipped[2] == Approx(0.5f));

    const std::vector<float> mask = f.pixel("where(IMG1 > 0.3, IMG2, 0)");
    CHECK(mask[0] == 0.0f);
    CHECK(mask[1] == 1.0f);
    CHECK(mask[2] == 1.0f);

    CHECK(f.pixel("mts(IMG1, 0.5)")[1] == Approx(0.4f));
    CHECK(f.pixel("ones_like(IMG1)")[0] == 1.0f);
}

TEST_CASE("result_carries_expression_metadata") {
    Fixture f;
    ImageBuffer out;
    REQUIRE(f.engine.evaluate("IMG2 - IMG1", out));
    CHECK(out.description() == "Image");
    CHECK(out.meta("pixelmath").toString() == "IMG2 - IMG1");
    CHECK(out.width() == 2);
}

TEST_CASE("unknown_names_are_rejected") {
    Fixture f;
    ImageBuffer out = ImageBuffer::grayImage(1, 1, 0.25f);

    CHECK_FALSE(f.engine.evaluate("system(IMG1)", out));
    CHECK(f.engine.lastError().contains("system"));
    CHECK(f.engine.lastError().contains("not defined"));
    CHECK(out.width() == 1);
    CHECK(out.planeData(0)[0] == 0.25f);

    CHECK_FALSE(f.engine.evaluate("os.remove(IMG1)", out));
    CHECK(f.engine.lastError() == "name 'os' is not defined");

    CHECK_FALSE(f.engine.evaluate("IMG3 + 1", out));
    CHECK(f.engine.lastError() == "name 'IMG3' is not defined");

    CHECK_FALSE(f.engine.evaluate("np.IMG1", out));
    CHECK(out.width() == 1);
}

TEST_CASE("non_image_or_non_finite_results_fail") {
    Fixture f;
    ImageBuffer out;
    CHECK_FALSE(f.engine.evaluate("1 + 2", out));
    CHECK_FALSE(f.engine.evaluate("value(IMG1)", out));
    CHECK_FALSE(f.engine.evaluate("IMG1 / 0", out));
    CHECK_FALSE(f.engine.evaluate("log(IMG1 - 1)", out));
    CHECK_FALSE(f.engine.evaluate("", out));
    CHECK_FALSE(f.engine.evaluate("(IMG1 + 1", out));
    CHECK_FALSE(f.engine.evaluate("mts(IMG1, 1.5)", out));
    CHECK_FALSE(f.engine.lastError().isEmpty());
    CHECK_FALSE(out.isValid());
}

TEST_CASE("operands_must_share_a_size") {
    ImageBuffer small = ImageBuffer::grayImage(2, 2, 0.5f);
    ImageBuffer large = ImageBuffer::grayImage(3, 3, 0.5f);
    PixelMath engine;
    engine.setImages({ &small, &large });

    ImageBuffer out;
    CHECK_FALSE(engine.evaluate("IMG1 + IMG2", out));
    CHECK(engine.lastError().contains("different sizes"));
}
