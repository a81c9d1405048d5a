#ifndef FITSIO_H
#define FITSIO_H

#include <QString>
#include <vector>

/**
 * @brief FITS primary-HDU reader and writer (CFITSIO).
 *
 * Pixels are exchanged as planar float rows, top row first. FITS stores the
 * bottom row first, so both directions flip vertically.
 */
class FitsIO {
public:
    struct Planes {
        int width = 0;
        int height = 0;
        int channels = 0;
        int colordepth = 0;          // 8, 16, 32 or 64
        std::vector<float> data;     // channels planes, normalized to [0, 1] for integer data
    };

    static bool read(const QString& filePath, Planes& out, QString* errorMsg = nullptr);

    /// Write 1 or 3 planes as 32-bit float (BITPIX -32), overwriting any existing file.
    static bool write(const QString& filePath, const Planes& in, QString* errorMsg = nullptr);

    static bool isFitsExtension(const QString& suffix);
};

#endif // FITSIO_H
