#include "EditSession.h"
#include "TestImages.h"
#include "algos/ColorModel.h"
#include "core/Errors.h"
#include "io/ImageIO.h"
#include "scripting/EditCommands.h"
#include "scripting/ScriptParser.h"
#include "scripting/ScriptRunner.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <QFile>
#include <QTemporaryDir>

using Catch::Approx;
using namespace Scripting;

// ----------------------------------------------------------------------------
// Parser
// ----------------------------------------------------------------------------

TEST_CASE("parser_joins_continued_lines") {
    ScriptParser parser;
    REQUIRE(parser.parseString("load m31.png \\\n    -x=1\n\nnegative\n"));
    REQUIRE(parser.commands().size() == 2);

    const ScriptCommand& load = parser.commands()[0];
    CHECK(load.name == "load");
    CHECK(load.args == QStringList({ "m31.png" }));
    CHECK(load.option("x") == "1");
    CHECK(load.lineNumber == 1);
    CHECK(parser.commands()[1].lineNumber == 4);

    CHECK_FALSE(parser.parseString("negative\nload m31.png \\"));
    CHECK(parser.errors().first() == "script:2: Unexpected end of file in continued line");
}

TEST_CASE("parser_substitutes_variables") {
    ScriptParser parser;
    parser.setVariable("dir", "/data");
    REQUIRE(parser.parseString("set target ${dir}/out\nsave ${target}/m31.fits\nedit \"gimp $\""));
    REQUIRE(parser.commands().size() == 2);
    CHECK(parser.commands()[0].args.first() == "/data/out/m31.fits");
    CHECK(parser.commands()[1].args.first() == "gimp $");
    CHECK(parser.variables().value("target") == "/data/out");

    CHECK_FALSE(parser.parseString("negative\nload ${nope}.png"));
    CHECK(parser.errors().first() == "script:2: Undefined variable 'nope'");

    CHECK_FALSE(parser.parseString("set 1abc value", "init.qs"));
    CHECK(parser.errors().first() == "init.qs:1: Usage: set name value");
}

TEST_CASE("parser_skips_comments") {
    ScriptParser parser;
    REQUIRE(parser.parseString("# header\n   # indented\nnegative # trailing\nload 'a#b.png'"));
    REQUIRE(parser.commands().size() == 2);
    CHECK(parser.commands()[0].args.isEmpty());
    CHECK(parser.commands()[1].args.first() == "a#b.png");
}

TEST_CASE("parser_splits_options_from_arguments") {
    ScriptParser parser;
    REQUIRE(parser.parseString("MIDTONE 0.2 -Shadow=0.1 --protect\nbalance -1 0.5 -.5\n"
                               "pixelmath \"-IMG1 + 1\" 0 'a b' \"\""));
    REQUIRE(parser.commands().size() == 3);

    const ScriptCommand& midtone = parser.commands()[0];
    CHECK(midtone.name == "midtone");
    CHECK(midtone.args == QStringList({ "0.2" }));
    CHECK(midtone.optionDouble("shadow") == 0.1);
    CHECK(midtone.optionBool("protect"));
    CHECK_FALSE(midtone.optionDouble("highlight").has_value());

    CHECK(parser.commands()[1].args == QStringList({ "-1", "0.5", "-.5" }));
    CHECK(parser.commands()[2].args == QStringList({ "-IMG1 + 1", "0", "a b", "" }));
}

TEST_CASE("parser_reports_unterminated_quote") {
    ScriptParser parser;
    CHECK_FALSE(parser.parseString("load \"m31.png"));
    CHECK(parser.errors().first() == "script:1: Unterminated quote");
}

TEST_CASE("command_accessors_validate_numbers") {
    ScriptCommand cmd;
    cmd.name = "crop";
    cmd.args = QStringList({ "10", "2.5", "abc" });
    cmd.options["depth"] = "sixteen";

    CHECK(cmd.argInt(0) == 10);
    CHECK_THROWS_AS(cmd.argInt(1), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(cmd.argDouble(2), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(cmd.argDouble(3), Quasar::InvalidArgumentError);
    CHECK_THROWS_AS(cmd.optionDouble("depth"), Quasar::InvalidArgumentError);

    cmd.options["depth"] = "16";
    CHECK(cmd.optionInt("depth") == 16);
    cmd.options["depth"] = "16.5";
    CHECK_THROWS_AS(cmd.optionInt("depth"), Quasar::InvalidArgumentError);

    cmd.options["protect"] = "no";
    CHECK_FALSE(cmd.optionBool("protect"));
    cmd.options["protect"] = "maybe";
    CHECK_THROWS_AS(cmd.optionBool("protect"), Quasar::InvalidArgumentError);
    CHECK_FALSE(cmd.optionBool("inverse"));
}

// ----------------------------------------------------------------------------
// Runner with the editing commands
// ----------------------------------------------------------------------------

namespace {

    struct ScriptFixture {
        QTemporaryDir dir;
        EditSession session;
        ScriptRunner runner;
        EditCommands commands { session, runner };
        QStringList output;

        ScriptFixture() {
            REQUIRE(dir.isValid());
            REQUIRE(ImageIO::save(dir.filePath("m31.png"), TestImages::gradient(8, 8), 16, true));
            commands.registerCommands();
            runner.setVariable("dir", dir.path());
            QObject::connect(&runner, &ScriptRunner::logMessage, [this](const QString& message, const QString& level) {
                if (level == "output") output << message;
            });
        }
    };
}

TEST_CASE("script_edits_undoes_and_saves") {
    ScriptFixture f;
    const ScriptResult result = f.runner.executeString(
        "load ${dir}/m31.png\n"
        "balance 0.5 1 1\n"
        "undo\n"
        "negative\n"
        "save -depth=16\n"
        "log\n");
    INFO(f.runner.lastError().toStdString());
    REQUIRE(result == ScriptResult::OK);

    CHECK(f.session.history().operationCount() == 1);
    CHECK(f.output.contains("Cancelled ColorBalance(R = 0.50, G = 1.00, B = 1.00)"));
    CHECK(f.output.contains("Negative()"));

    CHECK(QFile::exists(f.dir.filePath("m31-post.png")));
    QFile log(f.dir.filePath("m31-post.log"));
    REQUIRE(log.open(QIODevice::ReadOnly | QIODevice::Text));
    const QString text = QString::fromUtf8(log.readAll());
    CHECK(text.contains("Negative()"));
    CHECK_FALSE(text.contains("ColorBalance"));
}

TEST_CASE("script_stretches_and_combines_history_images") {
    ScriptFixture f;
    const ScriptResult result = f.runner.executeString(
        "load ${dir}/m31.png\n"
        "gamma 1\n"
        "arcsinh 0 10 -channels=RGB\n"
        "pixelmath \"blend(IMG1, IMG2, 0.5)\" 0 1\n"
        "stats\n");
    INFO(f.runner.lastError().toStdString());
    REQUIRE(result == ScriptResult::OK);

    const std::vector<ImageHistory::Operation>& ops = f.session.history().operations();
    REQUIRE(ops.size() == 2);
    CHECK(ops[0].label.startsWith("ArcsinhStretch(R : "));
    CHECK(ops[1].label == "PixelMath(IMG = blend(IMG1, IMG2, 0.5))");

    int statLines = 0;
    for (const QString& line : f.output) {
        if (line.contains("zeros") && line.contains("out-of-range")) ++statLines;
    }
    CHECK(statLines == 5);
}

TEST_CASE("luma_command_keeps_the_weights_as_typed") {
    struct Restore { ~Restore() { ColorModel::setLumaWeights(0.3, 0.6, 0.1); } } restore;
    ScriptFixture f;
    const ScriptResult result = f.runner.executeString("luma 0.2 0.7 0.2\n");
    INFO(f.runner.lastError().toStdString());
    REQUIRE(result == ScriptResult::OK);

    CHECK(f.output.contains("Luma weights: 0.2000, 0.7000, 0.2000"));
    CHECK(ColorModel::lumaWeights().blue == Approx(0.2));
    CHECK(f.session.settings().lumaWeights[2] == Approx(0.2));
}

TEST_CASE("unknown_command_stops_at_its_line") {
    ScriptFixture f;
    const ScriptResult result = f.runner.executeString("load ${dir}/m31.png\n\nfrobnicate 1\nnegative\n");
    CHECK(result == ScriptResult::CommandError);
    CHECK(f.runner.lastErrorLine() == 3);
    CHECK(f.runner.lastError() == "Unknown command: frobnicate");
    CHECK(f.session.history().operationCount() == 0);
}

TEST_CASE("command_errors_leave_history_untouched") {
    ScriptFixture f;
    REQUIRE(f.runner.executeString("load ${dir}/m31.png") == ScriptResult::OK);

    CHECK(f.runner.executeString("balance -1 1 1") == ScriptResult::CommandError);
    CHECK(f.runner.lastError().startsWith("balance: "));
    CHECK(f.runner.lastError().contains(">= 0"));

    CHECK(f.runner.executeString("crop 1 2") == ScriptResult::CommandError);
    CHECK(f.runner.lastError().contains("Too few arguments"));

    CHECK(f.runner.executeString("pixelmath \"system(IMG1)\"") == ScriptResult::CommandError);
    CHECK(f.runner.lastError().contains("name 'system' is not defined"));

    CHECK(f.runner.executeString("gray RG") == ScriptResult::CommandError);

    CHECK(f.session.history().operationCount() == 0);
}

TEST_CASE("runner_reports_syntax_and_file_errors") {
    ScriptFixture f;
    CHECK(f.runner.executeString("load \"m31.png") == ScriptResult::SyntaxError);
    CHECK(f.runner.executeFile(f.dir.filePath("missing.qs")) == ScriptResult::FileError);
    CHECK(f.runner.lastError().startsWith("Cannot open file"));
}

TEST_CASE("cancelled_runner_stops_before_next_command") {
    ScriptFixture f;
    ScriptParser parser;
    parser.setVariable("dir", f.dir.path());
    REQUIRE(parser.parseString("load ${dir}/m31.png\nnegative"));

    f.runner.requestCancel();
    CHECK(f.runner.executeCommands(parser.commands()) == ScriptResult::Cancelled);
    CHECK_FALSE(f.session.hasImage());
    f.runner.resetCancel();

    CHECK(f.runner.executeCommands(parser.commands()) == ScriptResult::OK);
    CHECK(f.session.history().operationCount() == 1);
}

TEST_CASE("runner_lists_usage_and_counts_executed_commands") {
    ScriptFixture f;
    const QStringList usages = f.runner.usages();
    CHECK(usages.contains("load <filename>"));
    CHECK(usages.contains("undo"));
    REQUIRE(f.runner.command("LOAD") != nullptr);
    CHECK(f.runner.command("frobnicate") == nullptr);

    CHECK(f.runner.executeString("load ${dir}/m31.png\nnegative\ncrop 1 2\n") == ScriptResult::CommandError);
    CHECK(f.runner.executedCount() == 2);
    CHECK(f.runner.lastError().contains("usage: crop <xmin> <xmax> <ymin> <ymax>"));
}
