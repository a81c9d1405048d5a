#ifndef IMAGEIO_H
#define IMAGEIO_H

#include <QString>

class ImageBuffer;

/**
 * @brief Image file loading and saving.
 *
 * FITS goes through CFITSIO, everything else through OpenCV. Loaded images
 * are always RGB: gray is replicated and RGBA is premultiplied by alpha.
 */
class ImageIO {
public:
    /**
     * @brief Load an image as RGB planes normalized to [0, 1].
     * Metadata receives colordepth, channels, filename and description "Original".
     */
    static bool load(const QString& filePath, ImageBuffer& buffer, QString* errorMsg = nullptr);

    /**
     * @brief Save an image.
     * PNG and TIFF take depth 8 or 16; FITS is always 32-bit float.
     * With singleChannelGray, gray-scale images are written with one channel.
     */
    static bool save(const QString& filePath, const ImageBuffer& buffer, int depth = 8,
                     bool singleChannelGray = true, QString* errorMsg = nullptr);

    static bool isSupportedForSave(const QString& filePath);
};

#endif // IMAGEIO_H
