#include "FitsIO.h"
#include "../core/ErrorHandling.h"
#include "../core/Logger.h"
#include <fitsio.h>
#include <QDir>
#include <QFileInfo>
#include <algorithm>

namespace {

QString fitsStatus(int status) {
    char statusStr[FLEN_STATUS];
    fits_get_errstatus(status, statusStr);
    return QString("CFITSIO error %1: %2").arg(status).arg(statusStr);
}

void flipRows(float* plane, int width, int height) {
    for (int y = 0; y < height / 2; ++y) {
        std::swap_ranges(plane + static_cast<size_t>(y) * width,
                         plane + static_cast<size_t>(y + 1) * width,
                         plane + static_cast<size_t>(height - 1 - y) * width);
    }
}

} // namespace

bool FitsIO::isFitsExtension(const QString& suffix) {
    const QString s = suffix.toLower();
    return s == "fit" || s == "fits" || s == "fts";
}

bool FitsIO::read(const QString& filePath, Planes& out, QString* errorMsg) {
    if (!validateFileExists(filePath, errorMsg)) return false;

    const QString nativePath = QDir::toNativeSeparators(QFileInfo(filePath).absoluteFilePath());
    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_open_file(&fptr, nativePath.toUtf8().constData(), READONLY, &status)) {
        if (errorMsg) *errorMsg = formatError("Cannot open FITS file", filePath, fitsStatus(status));
        return false;
    }
    ScopeGuard closer([&fptr] { int s = 0; fits_close_file(fptr, &s); });

    int bitpix = 0, naxis = 0;
    long naxes[3] = {1, 1, 1};
    if (fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status)) {
        if (errorMsg) *errorMsg = formatError("Cannot read FITS image parameters", filePath, fitsStatus(status));
        return false;
    }
    if (naxis < 2 || naxis > 3) {
        if (errorMsg) *errorMsg = formatError("Unsupported FITS layout", filePath, QString("NAXIS = %1").arg(naxis));
        return false;
    }

    double divisor = 1.0;
    switch (bitpix) {
        case BYTE_IMG:   out.colordepth = 8;  divisor = 255.0; break;
        case SHORT_IMG:  out.colordepth = 16; divisor = 65535.0; break;
        case FLOAT_IMG:  out.colordepth = 32; break;
        case DOUBLE_IMG: out.colordepth = 64; break;
        default:
            if (errorMsg) *errorMsg = formatError("Unsupported FITS bit depth", filePath, QString("BITPIX = %1").arg(bitpix));
            return false;
    }

    out.width = static_cast<int>(naxes[0]);
    out.height = static_cast<int>(naxes[1]);
    out.channels = naxis == 3 ? static_cast<int>(naxes[2]) : 1;
    const long long planeSize = static_cast<long long>(out.width) * out.height;
    out.data.assign(static_cast<size_t>(planeSize) * out.channels, 0.0f);

    float nulval = 0.0f;
    int anynul = 0;
    for (int c = 0; c < out.channels; ++c) {
        long firstpix[3] = {1, 1, c + 1};
        float* plane = out.data.data() + c * planeSize;
        if (fits_read_pix(fptr, TFLOAT, firstpix, planeSize, &nulval, plane, &anynul, &status)) {
            if (errorMsg) *errorMsg = formatError(QString("Cannot read FITS plane %1").arg(c), filePath, fitsStatus(status));
            return false;
        }
        flipRows(plane, out.width, out.height);
    }

    if (divisor != 1.0) {
        const float inv = static_cast<float>(1.0 / divisor);
        const long long n = static_cast<long long>(out.data.size());
        #pragma omp parallel for
        for (long long i = 0; i < n; ++i) out.data[i] *= inv;
    }

    Logger::debug(QString("FITS %1: %2x%3x%4, BITPIX %5").arg(filePath).arg(out.width).arg(out.height)
                      .arg(out.channels).arg(bitpix), "IO");
    return true;
}

bool FitsIO::write(const QString& filePath, const Planes& in, QString* errorMsg) {
    if (in.channels != 1 && in.channels != 3) {
        if (errorMsg) *errorMsg = formatError("Cannot write FITS file", filePath, QString("%1 channels").arg(in.channels));
        return false;
    }

    // "!" asks CFITSIO to overwrite
    const QString outName = "!" + QDir::toNativeSeparators(QFileInfo(filePath).absoluteFilePath());
    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_create_file(&fptr, outName.toUtf8().constData(), &status)) {
        if (errorMsg) *errorMsg = formatError("Cannot create FITS file", filePath, fitsStatus(status));
        return false;
    }
    ScopeGuard closer([&fptr] { int s = 0; fits_close_file(fptr, &s); });

    long naxes[3] = { static_cast<long>(in.width), static_cast<long>(in.height), static_cast<long>(in.channels) };
    const int naxis = in.channels > 1 ? 3 : 2;
    if (fits_create_img(fptr, FLOAT_IMG, naxis, naxes, &status)) {
        if (errorMsg) *errorMsg = formatError("Cannot create FITS image", filePath, fitsStatus(status));
        return false;
    }

    std::vector<float> planar(in.data);
    const long long planeSize = static_cast<long long>(in.width) * in.height;
    for (int c = 0; c < in.channels; ++c) flipRows(planar.data() + c * planeSize, in.width, in.height);

    if (fits_write_img(fptr, TFLOAT, 1, static_cast<LONGLONG>(planar.size()), planar.data(), &status)) {
        if (errorMsg) *errorMsg = formatError("Cannot write FITS data", filePath, fitsStatus(status));
        return false;
    }

    closer.dismiss();
    if (fits_close_file(fptr, &status)) {
        if (errorMsg) *errorMsg = formatError("Cannot close FITS file", filePath, fitsStatus(status));
        return false;
    }
    return true;
}
