#include "ImageBuffer.h"
#include "TestImages.h"
#include "io/FitsIO.h"
#include "io/ImageIO.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <opencv2/opencv.hpp>

#include <cmath>

using Catch::Approx;

TEST_CASE("png16_round_trip_within_quantization") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("gradient.png");

    const ImageBuffer original = TestImages::gradient(8, 6);
    QString errorMsg;
    REQUIRE(ImageIO::save(path, original, 16, true, &errorMsg));

    ImageBuffer loaded;
    REQUIRE(ImageIO::load(path, loaded, &errorMsg));
    REQUIRE(loaded.width() == 8);
    REQUIRE(loaded.height() == 6);
    CHECK(loaded.meta("colordepth").toInt() == 16);
    CHECK(loaded.meta("channels").toInt() == 3);
    CHECK(loaded.description() == "Original");
    CHECK(loaded.meta("filename").toString() == QFileInfo(path).absoluteFilePath());

    for (size_t i = 0; i < original.data().size(); ++i) {
        CHECK(std::abs(loaded.data()[i] - original.data()[i]) <= 1.0f / 65535.0f);
    }
}

TEST_CASE("gray_image_is_written_with_one_channel") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("gray.png");

    const ImageBuffer gray = ImageBuffer::grayImage(5, 5, 0.5f);
    REQUIRE(ImageIO::save(path, gray, 8, true));

    ImageBuffer loaded;
    REQUIRE(ImageIO::load(path, loaded));
    CHECK(loaded.meta("channels").toInt() == 1);
    CHECK(loaded.meta("colordepth").toInt() == 8);
    CHECK(loaded.isGrayScale());
    CHECK(loaded.planeData(2)[0] == Approx(128.0f / 255.0f));

    REQUIRE(ImageIO::save(path, gray, 8, false));
    REQUIRE(ImageIO::load(path, loaded));
    CHECK(loaded.meta("channels").toInt() == 3);
}

TEST_CASE("rgba_is_premultiplied_on_load") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("rgba.png");

    // BGRA: blue 0, green 255, red 255, alpha 51
    cv::Mat rgba(2, 2, CV_8UC4, cv::Scalar(0, 255, 255, 51));
    REQUIRE(cv::imwrite(path.toStdString(), rgba));

    ImageBuffer loaded;
    REQUIRE(ImageIO::load(path, loaded));
    CHECK(loaded.meta("channels").toInt() == 4);
    CHECK(loaded.planeData(0)[0] == Approx(0.2f));
    CHECK(loaded.planeData(1)[0] == Approx(0.2f));
    CHECK(loaded.planeData(2)[0] == 0.0f);
}

TEST_CASE("fits_round_trip_keeps_float_values") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("image.fits");

    ImageBuffer original = TestImages::gradient(7, 4);
    original.planeData(0)[3] = 1.5f;   // out-of-range data is kept as is
    original.planeData(2)[5] = -0.25f;

    QString errorMsg;
    REQUIRE(ImageIO::save(path, original, 32, true, &errorMsg));

    ImageBuffer loaded;
    REQUIRE(ImageIO::load(path, loaded, &errorMsg));
    CHECK(loaded.meta("colordepth").toInt() == 32);
    CHECK(loaded.meta("channels").toInt() == 3);
    CHECK(loaded.data() == original.data());

    FitsIO::Planes planes;
    REQUIRE(FitsIO::read(path, planes, &errorMsg));
    CHECK(planes.width == 7);
    CHECK(planes.height == 4);
    CHECK(planes.channels == 3);
}

TEST_CASE("save_rejects_bad_depth_and_extension") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const ImageBuffer img = TestImages::gradient(3, 3);

    QString errorMsg;
    CHECK_FALSE(ImageIO::save(dir.filePath("a.png"), img, 32, true, &errorMsg));
    CHECK(errorMsg.contains("8 or 16"));

    CHECK_FALSE(ImageIO::save(dir.filePath("a.bmp"), img, 8, true, &errorMsg));
    CHECK(errorMsg.contains("bmp"));

    CHECK_FALSE(ImageIO::save(dir.filePath("a.png"), ImageBuffer(), 8, true, &errorMsg));

    CHECK(ImageIO::isSupportedForSave("x.FIT"));
    CHECK(ImageIO::isSupportedForSave("x.tiff"));
    CHECK_FALSE(ImageIO::isSupportedForSave("x.jpg"));
    CHECK(FitsIO::isFitsExtension("fts"));
}

TEST_CASE("load_reports_missing_and_undecodable_files") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    ImageBuffer buffer = ImageBuffer::grayImage(1, 1, 0.3f);
    QString errorMsg;
    CHECK_FALSE(ImageIO::load(dir.filePath("missing.png"), buffer, &errorMsg));
    CHECK_FALSE(errorMsg.isEmpty());

    QFile junk(dir.filePath("junk.png"));
    REQUIRE(junk.open(QIODevice::WriteOnly));
    junk.write("not an image");
    junk.close();
    errorMsg.clear();
    CHECK_FALSE(ImageIO::load(junk.fileName(), buffer, &errorMsg));
    CHECK_FALSE(errorMsg.isEmpty());
    CHECK(buffer.planeData(0)[0] == Approx(0.3f));
}
