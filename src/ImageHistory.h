#ifndef IMAGEHISTORY_H
#define IMAGEHISTORY_H

#include <QString>
#include <memory>
#include <optional>
#include <vector>

class ImageBuffer;

/**
 * @brief Operation history over immutable image snapshots
 *
 * Two stacks are kept in step. The images stack interleaves frames and
 * images: [original, frame0, original, frame1, image1, frame2, image2, ...].
 * Frame slots may be empty (no frame) and may repeat the previous pointer
 * when an operation leaves the frame unchanged. Each entry of the operations
 * stack refers to its image and frame slots.
 *
 * Popping an operation truncates the images stack below its frame slot.
 * There is no redo.
 */
class ImageHistory {
public:
    using Snapshot = std::shared_ptr<const ImageBuffer>;

    struct Operation {
        QString label;
        Snapshot image;
        Snapshot frame;
        int imageIndex = -1;
        int frameIndex = -1;
    };

    ImageHistory() = default;

    /// Start over from a deep copy of 'original' (and of 'frame' if given).
    void reset(const ImageBuffer& original, const ImageBuffer* frame = nullptr);
    void clear();

    bool hasOriginal() const { return !m_images.empty(); }

    /**
     * @brief Record an operation; the image and frame are deep-copied.
     * Without a frame, the current frame pointer is repeated.
     * Throws Quasar::InvalidArgumentError if no original is loaded or the image is invalid.
     */
    void pushOperation(const QString& label, const ImageBuffer& image, const ImageBuffer* frame = nullptr);

    /// Remove the last operation; nullopt when only the original remains.
    std::optional<Operation> popOperation();

    int operationCount() const { return static_cast<int>(m_operations.size()); }
    int imageCount() const { return static_cast<int>(m_images.size()); }

    Snapshot original() const;
    Snapshot current() const;
    Snapshot currentFrame() const;
    Snapshot imageAt(int index) const;
    const std::vector<Operation>& operations() const { return m_operations; }

    /// "Quasar v<version>" followed by one label per line.
    QString logs() const;

    /// Write logs() next to 'imagePath' with a .log extension.
    bool saveLog(const QString& imagePath, QString* errorMsg = nullptr) const;

    static QString logPathFor(const QString& imagePath);

private:
    std::vector<Snapshot> m_images;
    std::vector<Operation> m_operations;
};

#endif // IMAGEHISTORY_H
