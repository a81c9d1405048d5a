#include "EditCommands.h"
#include "../EditSession.h"
#include "../algos/ColorModel.h"
#include "../algos/StretchFunctions.h"
#include "../core/Errors.h"
#include <QStringList>

namespace Scripting {

EditCommands::EditCommands(EditSession& session, ScriptRunner& runner)
    : m_session(session)
    , m_runner(runner)
{
}

void EditCommands::registerCommands() {
    auto bind = [this](bool (EditCommands::*handler)(const ScriptCommand&)) {
        return [this, handler](const ScriptCommand& cmd) { return (this->*handler)(cmd); };
    };

    const QVector<CommandDef> commands = {
        // Files
        CommandDef("load", 1, 1, "load <filename>", bind(&EditCommands::cmdLoad)),
        CommandDef("save", 0, 1, "save [filename] [-depth=8|16|32]", bind(&EditCommands::cmdSave)),
        CommandDef("luma", 3, 3, "luma <red> <green> <blue>", bind(&EditCommands::cmdLuma)),

        // Stretches
        CommandDef("blackpoint", 1, 1, "blackpoint <shadow> [-channels=R,G,B,L] [-protect]",
                   bind(&EditCommands::cmdBlackpoint)),
        CommandDef("midtone", 1, 1,
                   "midtone <midtone> [-shadow=] [-highlight=] [-low=] [-high=] [-channels=] [-protect]",
                   bind(&EditCommands::cmdMidtone)),
        CommandDef("arcsinh", 2, 2, "arcsinh <shadow> <stretch> [-channels=] [-protect]",
                   bind(&EditCommands::cmdArcsinh)),
        CommandDef("ghs", 3, 5, "ghs <lnD1> <b> <SYP> [SPP [HPP]] [-inverse] [-channels=] [-protect]",
                   bind(&EditCommands::cmdGhs)),
        CommandDef("gamma", 1, 1, "gamma <gamma> [-channels=] [-protect]", bind(&EditCommands::cmdGamma)),

        // Histogram and color
        CommandDef("clip", 0, 0, "clip [-shadow=] [-highlight=] [-channels=V]", bind(&EditCommands::cmdClip)),
        CommandDef("balance", 3, 3, "balance <red> <green> <blue>", bind(&EditCommands::cmdBalance)),
        CommandDef("gray", 0, 1, "gray [V|L|Y]", bind(&EditCommands::cmdGray)),
        CommandDef("negative", 0, 0, "negative", bind(&EditCommands::cmdNegative)),
        CommandDef("sharpen", 0, 0, "sharpen", bind(&EditCommands::cmdSharpen)),
        CommandDef("hotpixels", 0, 1, "hotpixels [ratio] [-channels=L]", bind(&EditCommands::cmdHotPixels)),

        // Geometry
        CommandDef("resize", 2, 2, "resize <width> <height> [-method=lanczos]", bind(&EditCommands::cmdResize)),
        CommandDef("rescale", 1, 1, "rescale <factor> [-method=lanczos]", bind(&EditCommands::cmdRescale)),
        CommandDef("crop", 4, 4, "crop <xmin> <xmax> <ymin> <ymax>", bind(&EditCommands::cmdCrop)),
        CommandDef("unframe", 0, 0, "unframe [-restore]", bind(&EditCommands::cmdUnframe)),

        // Expressions and external tools
        CommandDef("pixelmath", 1, -1, "pixelmath <expression> [operation...]", bind(&EditCommands::cmdPixelMath)),
        CommandDef("edit", 0, 1, "edit [command]", bind(&EditCommands::cmdEdit)),

        // History
        CommandDef("undo", 0, 0, "undo", bind(&EditCommands::cmdUndo)),
        CommandDef("stats", 0, 0, "stats", bind(&EditCommands::cmdStats)),
        CommandDef("log", 0, 0, "log", bind(&EditCommands::cmdLog)),
    };

    m_runner.registerCommands(commands);
}

bool EditCommands::fail(const ScriptCommand& cmd, const QString& message) {
    m_runner.setError(QString("%1: %2").arg(cmd.name, message), cmd.lineNumber);
    return false;
}

//=============================================================================
// FILES
//=============================================================================

bool EditCommands::cmdLoad(const ScriptCommand& cmd) {
    QString errorMsg;
    if (!m_session.loadFile(cmd.args[0], &errorMsg)) {
        return fail(cmd, errorMsg);
    }
    m_runner.print(QString("Loaded %1 (%2x%3)")
                       .arg(m_session.filename())
                       .arg(m_session.image().width())
                       .arg(m_session.image().height()));
    return true;
}

bool EditCommands::cmdSave(const ScriptCommand& cmd) {
    const int depth = cmd.optionInt("depth").value_or(0);
    QString errorMsg;
    if (!m_session.saveFile(cmd.args.value(0), depth, &errorMsg)) {
        return fail(cmd, errorMsg);
    }
    m_runner.print(QString("Saved %1").arg(m_session.savename()));
    return true;
}

bool EditCommands::cmdLuma(const ScriptCommand& cmd) {
    const double red = cmd.argDouble(0);
    const double green = cmd.argDouble(1);
    const double blue = cmd.argDouble(2);
    ColorModel::setLumaWeights(red, green, blue);

    // Keep the session's copy in step so later saves and labels agree
    const ColorModel::LumaWeights w = ColorModel::lumaWeights();
    Settings settings = m_session.settings();
    settings.lumaWeights = { w.red, w.green, w.blue };
    m_session.setSettings(settings);

    m_runner.print(QString::asprintf("Luma weights: %.4f, %.4f, %.4f", w.red, w.green, w.blue));
    return true;
}

//=============================================================================
// STRETCHES
//=============================================================================

StretchOperator EditCommands::stretchOperator(const ScriptCommand& cmd, const Stretch::StretchFunction& fn) {
    StretchOperator op;
    const QStringList keys = cmd.option("channels", "R,G,B").split(',', Qt::SkipEmptyParts);
    if (keys.isEmpty()) {
        throw Quasar::InvalidArgumentError("-channels needs at least one channel key");
    }
    for (const QString& key : keys) {
        const ChannelSelector selector = ChannelSelector::parse(key.trimmed());
        if (selector.isScalar()) {
            op.setFunction(selector.toString(), fn);
        } else {
            // "RGB" is shorthand for one entry per plane
            static const char* planeKeys[] = { "R", "G", "B" };
            for (int plane : selector.planeIndices()) op.setFunction(planeKeys[plane], fn);
        }
    }
    op.setProtectHighlights(cmd.optionBool("protect"));
    return op;
}

bool EditCommands::runStretch(const ScriptCommand& cmd, const Stretch::StretchFunction& fn) {
    const StretchOperator op = stretchOperator(cmd, fn);
    if (m_session.stretch(op)) {
        m_runner.print(op.label());
    }
    return true;
}

bool EditCommands::cmdBlackpoint(const ScriptCommand& cmd) {
    return runStretch(cmd, Stretch::BlackpointStretch(cmd.argDouble(0)));
}

bool EditCommands::cmdMidtone(const ScriptCommand& cmd) {
    const Stretch::MidtoneStretch fn(cmd.argDouble(0),
                                     cmd.optionDouble("shadow").value_or(0.0),
                                     cmd.optionDouble("highlight").value_or(1.0),
                                     cmd.optionDouble("low").value_or(0.0),
                                     cmd.optionDouble("high").value_or(1.0));
    return runStretch(cmd, fn);
}

bool EditCommands::cmdArcsinh(const ScriptCommand& cmd) {
    return runStretch(cmd, Stretch::ArcsinhStretch(cmd.argDouble(0), cmd.argDouble(1)));
}

bool EditCommands::cmdGhs(const ScriptCommand& cmd) {
    const double spp = cmd.args.size() > 3 ? cmd.argDouble(3) : 0.0;
    const double hpp = cmd.args.size() > 4 ? cmd.argDouble(4) : 1.0;
    const Stretch::HyperbolicStretch fn(cmd.argDouble(0), cmd.argDouble(1), cmd.argDouble(2),
                                        spp, hpp, cmd.optionBool("inverse"));
    return runStretch(cmd, fn);
}

bool EditCommands::cmdGamma(const ScriptCommand& cmd) {
    return runStretch(cmd, Stretch::GammaStretch(cmd.argDouble(0)));
}

//=============================================================================
// HISTOGRAM AND COLOR
//=============================================================================

bool EditCommands::cmdClip(const ScriptCommand& cmd) {
    const ChannelSelector channels = ChannelSelector::parse(cmd.option("channels", "V"));
    m_session.clipShadowsHighlights(cmd.optionDouble("shadow"), cmd.optionDouble("highlight"), channels);
    return true;
}

bool EditCommands::cmdBalance(const ScriptCommand& cmd) {
    m_session.colorBalance(cmd.argDouble(0), cmd.argDouble(1), cmd.argDouble(2));
    return true;
}

bool EditCommands::cmdGray(const ScriptCommand& cmd) {
    m_session.grayScale(ChannelSelector::parse(cmd.args.value(0, "L")));
    return true;
}

bool EditCommands::cmdNegative(const ScriptCommand&) {
    m_session.negative();
    return true;
}

bool EditCommands::cmdSharpen(const ScriptCommand&) {
    m_session.sharpen();
    return true;
}

bool EditCommands::cmdHotPixels(const ScriptCommand& cmd) {
    const double ratio = cmd.args.isEmpty() ? 2.0 : cmd.argDouble(0);
    m_session.removeHotPixels(ratio, ChannelSelector::parse(cmd.option("channels", "L")));
    return true;
}

//=============================================================================
// GEOMETRY
//=============================================================================

bool EditCommands::cmdResize(const ScriptCommand& cmd) {
    const ImageBuffer::Resample method = ImageBuffer::resampleFromString(cmd.option("method", "lanczos"));
    m_session.resize(cmd.argInt(0), cmd.argInt(1), method);
    return true;
}

bool EditCommands::cmdRescale(const ScriptCommand& cmd) {
    const ImageBuffer::Resample method = ImageBuffer::resampleFromString(cmd.option("method", "lanczos"));
    m_session.rescale(cmd.argDouble(0), method);
    return true;
}

bool EditCommands::cmdCrop(const ScriptCommand& cmd) {
    m_session.crop(cmd.argInt(0), cmd.argInt(1), cmd.argInt(2), cmd.argInt(3));
    return true;
}

bool EditCommands::cmdUnframe(const ScriptCommand& cmd) {
    if (cmd.optionBool("restore")) m_session.restoreFrame();
    else m_session.removeFrame();
    return true;
}

//=============================================================================
// EXPRESSIONS AND EXTERNAL TOOLS
//=============================================================================

bool EditCommands::cmdPixelMath(const ScriptCommand& cmd) {
    std::vector<int> indices;
    for (int i = 1; i < cmd.args.size(); ++i) indices.push_back(cmd.argInt(i));

    QString errorMsg;
    if (!m_session.pixelMath(cmd.args[0], indices, &errorMsg)) {
        return fail(cmd, errorMsg);
    }
    return true;
}

bool EditCommands::cmdEdit(const ScriptCommand& cmd) {
    QString errorMsg;
    if (!m_session.externalEdit(cmd.args.value(0), &errorMsg) && !errorMsg.isEmpty()) {
        return fail(cmd, errorMsg);
    }
    return true;
}

//=============================================================================
// HISTORY
//=============================================================================

bool EditCommands::cmdUndo(const ScriptCommand& cmd) {
    if (!m_session.hasImage()) {
        return fail(cmd, "No image loaded");
    }
    const std::optional<ImageHistory::Operation> op = m_session.cancelLastOperation();
    if (op) m_runner.print(QString("Cancelled %1").arg(op->label));
    return true;
}

bool EditCommands::cmdStats(const ScriptCommand&) {
    for (const QString& line : m_session.statisticsReport()) {
        m_runner.print(line);
    }
    return true;
}

bool EditCommands::cmdLog(const ScriptCommand& cmd) {
    if (!m_session.hasImage()) {
        return fail(cmd, "No image loaded");
    }
    for (const QString& line : m_session.history().logs().split('\n', Qt::SkipEmptyParts)) {
        m_runner.print(line);
    }
    return true;
}

} // namespace Scripting
