#ifndef EDIT_COMMANDS_H
#define EDIT_COMMANDS_H

#include "ScriptTypes.h"
#include "ScriptRunner.h"
#include "../algos/StretchOperator.h"
#include <QString>

class EditSession;

namespace Scripting {

/**
 * @brief Script commands that drive an EditSession
 *
 * - load/save: file operations
 * - luma: set the luma weights
 * - blackpoint, midtone, arcsinh, ghs, gamma: stretches (-channels=R,G,B,L -protect)
 * - clip, balance, gray, negative, sharpen, hotpixels: histogram and color tools
 * - resize, rescale, crop, unframe: geometry
 * - pixelmath, edit: expressions and the external editor
 * - undo, stats, log: history and reports
 *
 * Tools that find nothing to do succeed without adding an operation.
 */
class EditCommands {
public:
    EditCommands(EditSession& session, ScriptRunner& runner);

    /// Register every command with the runner
    void registerCommands();

private:
    bool cmdLoad(const ScriptCommand& cmd);
    bool cmdSave(const ScriptCommand& cmd);
    bool cmdLuma(const ScriptCommand& cmd);

    bool cmdBlackpoint(const ScriptCommand& cmd);
    bool cmdMidtone(const ScriptCommand& cmd);
    bool cmdArcsinh(const ScriptCommand& cmd);
    bool cmdGhs(const ScriptCommand& cmd);
    bool cmdGamma(const ScriptCommand& cmd);

    bool cmdClip(const ScriptCommand& cmd);
    bool cmdBalance(const ScriptCommand& cmd);
    bool cmdGray(const ScriptCommand& cmd);
    bool cmdNegative(const ScriptCommand& cmd);
    bool cmdSharpen(const ScriptCommand& cmd);
    bool cmdHotPixels(const ScriptCommand& cmd);

    bool cmdResize(const ScriptCommand& cmd);
    bool cmdRescale(const ScriptCommand& cmd);
    bool cmdCrop(const ScriptCommand& cmd);
    bool cmdUnframe(const ScriptCommand& cmd);

    bool cmdPixelMath(const ScriptCommand& cmd);
    bool cmdEdit(const ScriptCommand& cmd);

    bool cmdUndo(const ScriptCommand& cmd);
    bool cmdStats(const ScriptCommand& cmd);
    bool cmdLog(const ScriptCommand& cmd);

    /// Build the per-key operator from -channels (default "R,G,B") and -protect.
    static StretchOperator stretchOperator(const ScriptCommand& cmd, const Stretch::StretchFunction& fn);

    bool runStretch(const ScriptCommand& cmd, const Stretch::StretchFunction& fn);
    bool fail(const ScriptCommand& cmd, const QString& message);

    EditSession& m_session;
    ScriptRunner& m_runner;
};

} // namespace Scripting

#endif // EDIT_COMMANDS_H
