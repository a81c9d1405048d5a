#include "algos/ColorModel.h"
#include "algos/StretchLUT.h"
#include "core/Settings.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <QFile>
#include <QTemporaryDir>

using Catch::Approx;

namespace {

    void writeIni(const QString& path, const QByteArray& content) {
        QFile file(path);
        REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Text));
        file.write(content);
    }
}

TEST_CASE("missing_file_gives_defaults") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    int invalid = -1;
    const Settings s = Settings::load(dir.filePath("absent.ini"), &invalid);
    CHECK(invalid == 0);
    CHECK(s.lumaWeights[0] == 0.3);
    CHECK(s.defaultDepth == 8);
    CHECK(s.singleChannelGray);
    CHECK(s.lutSize == 131072);
    CHECK(s.editorExportDepth == 16);
    CHECK(s.maxLogFiles == 5);
    CHECK(s.editorCommand.isEmpty());
}

TEST_CASE("invalid_entries_fall_back_and_are_counted") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("quasar.ini");
    writeIni(path,
             "[color]\n"
             "luma_weights=1, 1, -1\n"
             "[io]\n"
             "default_depth=12\n"
             "single_channel_gray=maybe\n"
             "[stretch]\n"
             "lut_size=65536\n"
             "lut_cache_entries=0\n"
             "[editor]\n"
             "command=gimp\n"
             "[log]\n"
             "max_files=3\n");

    int invalid = 0;
    const Settings s = Settings::load(path, &invalid);
    CHECK(invalid == 4);
    CHECK(s.lumaWeights[1] == 0.6);
    CHECK(s.defaultDepth == 8);
    CHECK(s.singleChannelGray);
    CHECK(s.lutSize == 65536);
    CHECK(s.lutCacheEntries == 8);
    CHECK(s.editorCommand == "gimp");
    CHECK(s.maxLogFiles == 3);
}

TEST_CASE("saved_settings_reload_identically") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("quasar.ini");

    Settings s;
    s.lumaWeights = { 0.25, 0.5, 0.25 };
    s.defaultDepth = 16;
    s.singleChannelGray = false;
    s.editorCommand = "gimp -n";
    s.logDirectory = dir.filePath("logs");

    QString errorMsg;
    REQUIRE(s.save(path, &errorMsg));

    int invalid = -1;
    const Settings r = Settings::load(path, &invalid);
    CHECK(invalid == 0);
    CHECK(r.lumaWeights[0] == Approx(0.25));
    CHECK(r.lumaWeights[1] == Approx(0.5));
    CHECK(r.defaultDepth == 16);
    CHECK_FALSE(r.singleChannelGray);
    CHECK(r.editorCommand == "gimp -n");
    CHECK(r.resolvedLogDirectory() == dir.filePath("logs"));
}

TEST_CASE("apply_pushes_weights_and_cache_size") {
    struct Restore {
        ~Restore() {
            ColorModel::setLumaWeights(0.3, 0.6, 0.1);
            StretchLUTCache::instance().setCapacity(8);
        }
    } restore;

    Settings s;
    s.lumaWeights = { 2.0, 1.0, 1.0 };
    s.lutCacheEntries = 3;
    s.apply();

    const ColorModel::LumaWeights w = ColorModel::lumaWeights();
    CHECK(w.red == Approx(2.0));
    CHECK(w.green == Approx(1.0));
    CHECK(StretchLUTCache::instance().capacity() == 3);
}
