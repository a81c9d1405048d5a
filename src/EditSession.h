#ifndef EDITSESSION_H
#define EDITSESSION_H

#include "ImageBuffer.h"
#include "ImageHistory.h"
#include "core/Settings.h"
#include "core/ToolSession.h"
#include <QString>
#include <optional>
#include <vector>

class StretchOperator;

/**
 * @brief One open image with its operation history.
 *
 * Every tool computes from the current image through a ToolSession and, if
 * the result differs, pushes it onto the history with a canonical label.
 * Tools return false when there was nothing to do. Invalid arguments throw
 * Quasar::InvalidArgumentError and leave the history untouched.
 */
class EditSession {
public:
    explicit EditSession(const Settings& settings = Settings());

    const Settings& settings() const { return m_settings; }
    void setSettings(const Settings& settings) { m_settings = settings; }

    // Files
    bool loadFile(const QString& path, QString* errorMsg = nullptr);

    /// Save the current image and the operation log; depth <= 0 uses io/default_depth.
    bool saveFile(const QString& path = QString(), int depth = 0, QString* errorMsg = nullptr);

    bool hasImage() const { return m_history.hasOriginal(); }
    const QString& filename() const { return m_filename; }
    const QString& savename() const { return m_savename; }

    const ImageBuffer& image() const;
    ImageHistory::Snapshot frame() const { return m_history.currentFrame(); }
    const ImageHistory& history() const { return m_history; }

    // History
    void applyOperation(const QString& label, const ImageBuffer& image, const ImageBuffer* frame = nullptr);
    std::optional<ImageHistory::Operation> cancelLastOperation();

    /**
     * @brief Run 'job' on the current image and push its result under 'label'.
     * @return false if the job reports no change (returns an invalid image).
     */
    bool runTool(const QString& label, const ToolSession::Job& job);

    // Tools
    bool sharpen();
    bool grayScale(const ChannelSelector& selector);
    bool negative();
    bool colorBalance(double red, double green, double blue);
    bool removeHotPixels(double ratio, const ChannelSelector& channels);
    bool clipShadowsHighlights(std::optional<double> shadow, std::optional<double> highlight,
                               const ChannelSelector& channels);
    bool resize(int width, int height, ImageBuffer::Resample resample = ImageBuffer::Resample_Lanczos);
    bool rescale(double scale, ImageBuffer::Resample resample = ImageBuffer::Resample_Lanczos);
    bool crop(int xmin, int xmax, int ymin, int ymax);
    bool stretch(const StretchOperator& op);
    bool removeFrame();
    bool restoreFrame();

    /**
     * @brief Evaluate a PixelMath expression.
     * IMGn is bound to history image indices[n-1] (0 = original, k = result of operation k);
     * with no indices IMG1 is the current image.
     */
    bool pixelMath(const QString& expression, const std::vector<int>& indices, QString* errorMsg = nullptr);

    /// Round-trip through the configured external editor.
    bool externalEdit(const QString& commandTemplate = QString(), QString* errorMsg = nullptr);

    /// "Red : min = ..., max = ..., med = ..., n (p%) zeros, m (q%) out-of-range" lines for R, G, B, V and L.
    QStringList statisticsReport() const;

private:
    void requireImage() const;
    int operationImageIndex(int operation) const;

    Settings m_settings;
    ImageHistory m_history;
    QString m_filename;
    QString m_savename;
};

#endif // EDITSESSION_H
