#ifndef EXTERNALEDITOR_H
#define EXTERNALEDITOR_H

#include "../ImageBuffer.h"
#include "../core/ErrorHandling.h"
#include <QString>

/**
 * @brief Round-trip of the current image through an external program.
 *
 * The image is exported as a TIFF in a temporary directory, the command is
 * run with every "$" replaced by the quoted file path, and the file is
 * reloaded if the program modified it.
 */
class ExternalEditor {
public:
    struct Outcome {
        enum Kind { Edited, Unchanged };
        Kind kind = Unchanged;
        ImageBuffer image;      // Valid when kind == Edited
        QString editor;         // Program name, for labels
    };

    /**
     * @brief Run the editor synchronously.
     * Failure to export, start, or reload yields an error Result; an untouched
     * file yields Outcome::Unchanged.
     */
    static Result<Outcome> run(const ImageBuffer& image, const QString& commandTemplate, int depth = 16,
                               int timeoutMs = -1);

    /// First word of the command template.
    static QString editorName(const QString& commandTemplate);

    /// Template with every "$" replaced by the shell-quoted path.
    static QString expandCommand(const QString& commandTemplate, const QString& filePath);
};

#endif // EXTERNALEDITOR_H
