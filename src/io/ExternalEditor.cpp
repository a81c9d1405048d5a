#include "ExternalEditor.h"
#include "ImageIO.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include <QDateTime>
#include <QFileInfo>
#include <QProcess>
#include <QTemporaryDir>

namespace {

QString shellQuote(const QString& path) {
#if defined(Q_OS_WIN)
    return "\"" + path + "\"";
#else
    QString quoted = path;
    quoted.replace("'", "'\\''");
    return "'" + quoted + "'";
#endif
}

} // namespace

QString ExternalEditor::editorName(const QString& commandTemplate) {
    const QString first = commandTemplate.trimmed().section(' ', 0, 0);
    return QFileInfo(first).fileName();
}

QString ExternalEditor::expandCommand(const QString& commandTemplate, const QString& filePath) {
    QString cmd = commandTemplate;
    cmd.replace("$", shellQuote(filePath));
    return cmd;
}

Result<ExternalEditor::Outcome> ExternalEditor::run(const ImageBuffer& image, const QString& commandTemplate,
                                                    int depth, int timeoutMs) {
    using R = Result<Outcome>;
    if (commandTemplate.trimmed().isEmpty()) {
        return R::failure(Quasar::ExternalProcessError("No editor command configured"));
    }

    QTemporaryDir tempDir;
    if (!tempDir.isValid()) {
        return R::failure(Quasar::IOError("Cannot create a temporary directory"));
    }
    const QString tmpFile = tempDir.filePath("quasar-edit.tiff");

    QString err;
    if (!ImageIO::save(tmpFile, image, depth, false, &err)) return R::failure(err);
    const QFileInfo before(tmpFile);
    const QDateTime exportedAt = before.lastModified();
    const qint64 exportedSize = before.size();

    Outcome outcome;
    outcome.editor = editorName(commandTemplate);
    const QString cmd = expandCommand(commandTemplate, tmpFile);
    Logger::info(QString("Editing with %1: %2").arg(outcome.editor, cmd), "Editor");

    QProcess process;
#if defined(Q_OS_WIN)
    process.start("cmd.exe", {"/C", cmd});
#else
    process.start("/bin/sh", {"-c", cmd});
#endif
    if (!process.waitForStarted()) {
        return R::failure(Quasar::ExternalProcessError(
            formatError("Cannot start editor", outcome.editor, process.errorString())));
    }
    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished();
        return R::failure(Quasar::ExternalProcessError(
            formatError("Editor did not finish", outcome.editor, process.errorString())));
    }
    if (process.exitStatus() != QProcess::NormalExit) {
        return R::failure(Quasar::ExternalProcessError(
            formatError("Editor crashed", outcome.editor, process.errorString())));
    }
    if (process.exitCode() != 0) {
        Logger::warning(QString("%1 exited with code %2").arg(outcome.editor).arg(process.exitCode()), "Editor");
    }

    const QFileInfo after(tmpFile);
    if (!after.exists()) {
        return R::failure(Quasar::IOError(formatError("Edited file is missing", tmpFile, QString())));
    }
    if (after.lastModified() == exportedAt && after.size() == exportedSize) {
        reportInfo("External edit", QString("The image has not been modified by %1").arg(outcome.editor));
        return R(outcome);
    }

    ImageBuffer edited;
    if (!ImageIO::load(tmpFile, edited, &err)) return R::failure(err);
    if (edited.width() != image.width() || edited.height() != image.height()) {
        return R::failure(Quasar::InvalidArgumentError(
            QString("The image returned by %1 is %2x%3, expected %4x%5")
                .arg(outcome.editor).arg(edited.width()).arg(edited.height())
                .arg(image.width()).arg(image.height())));
    }

    QVariantMap meta = image.metadata();
    meta.insert("description", "Image");
    meta.insert("colordepth", edited.meta("colordepth"));
    edited.setMetadata(meta);

    outcome.kind = Outcome::Edited;
    outcome.image = std::move(edited);
    Logger::info(QString("The file has been modified by %1, reloaded").arg(outcome.editor), "Editor");
    return R(std::move(outcome));
}
