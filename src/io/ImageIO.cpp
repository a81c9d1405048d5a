#include "ImageIO.h"
#include "FitsIO.h"
#include "../ImageBuffer.h"
#include "../core/ErrorHandling.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include <opencv2/opencv.hpp>
#include <QFileInfo>
#include <algorithm>
#include <cmath>

namespace {

// Decoded planes to RGB, throwing on layouts the buffer cannot hold
std::vector<float> toRgbPlanes(const FitsIO::Planes& in) {
    const size_t n = static_cast<size_t>(in.width) * in.height;
    std::vector<float> rgb(n * ImageBuffer::kChannels);
    switch (in.channels) {
        case 1:
            for (int c = 0; c < ImageBuffer::kChannels; ++c) {
                std::copy(in.data.begin(), in.data.begin() + n, rgb.begin() + c * n);
            }
            break;
        case 3:
            std::copy(in.data.begin(), in.data.begin() + 3 * n, rgb.begin());
            break;
        case 4: {
            const float* alpha = in.data.data() + 3 * n;
            for (int c = 0; c < ImageBuffer::kChannels; ++c) {
                const float* src = in.data.data() + c * n;
                float* dst = rgb.data() + c * n;
                #pragma omp parallel for
                for (long long i = 0; i < static_cast<long long>(n); ++i) dst[i] = src[i] * alpha[i];
            }
            break;
        }
        default:
            throw Quasar::UnsupportedFormatError(
                QString("Images with %1 channels are not supported (expected 1, 3 or 4)").arg(in.channels));
    }
    return rgb;
}

void decodeWithOpenCV(const QString& filePath, FitsIO::Planes& out) {
    cv::Mat img = cv::imread(filePath.toStdString(), cv::IMREAD_UNCHANGED);
    if (img.empty()) {
        throw Quasar::IOError(formatError("Cannot decode image", filePath, QString()));
    }

    double scale = 1.0;
    switch (img.depth()) {
        case CV_8U:  scale = 1.0 / 255.0;   out.colordepth = 8;  break;
        case CV_16U: scale = 1.0 / 65535.0; out.colordepth = 16; break;
        case CV_32F: out.colordepth = 32; break;
        case CV_64F: out.colordepth = 64; break;
        default:
            throw Quasar::UnsupportedFormatError(
                formatError("Unsupported sample type", filePath, QString("OpenCV depth %1").arg(img.depth())));
    }

    out.width = img.cols;
    out.height = img.rows;
    out.channels = img.channels();

    cv::Mat floatMat;
    img.convertTo(floatMat, CV_32FC(out.channels), scale);

    // OpenCV is BGR(A) interleaved; planes here are RGB(A)
    std::vector<cv::Mat> split;
    cv::split(floatMat, split);
    if (out.channels >= 3) std::swap(split[0], split[2]);

    const size_t n = static_cast<size_t>(out.width) * out.height;
    out.data.resize(n * out.channels);
    for (int c = 0; c < out.channels; ++c) {
        cv::Mat plane = split[c].isContinuous() ? split[c] : split[c].clone();
        std::copy(plane.ptr<float>(0), plane.ptr<float>(0) + n, out.data.begin() + c * n);
    }
}

void loadImpl(const QString& filePath, ImageBuffer& buffer) {
    QString err;
    if (!validateFileExists(filePath, &err)) throw Quasar::IOError(err);

    FitsIO::Planes decoded;
    const QFileInfo info(filePath);
    if (FitsIO::isFitsExtension(info.suffix())) {
        if (!FitsIO::read(filePath, decoded, &err)) throw Quasar::IOError(err);
    } else {
        decodeWithOpenCV(filePath, decoded);
    }

    std::vector<float> rgb = toRgbPlanes(decoded);

    QVariantMap meta;
    meta.insert("description", "Original");
    meta.insert("tag", "Original");
    meta.insert("deletable", false);
    meta.insert("colordepth", decoded.colordepth);
    meta.insert("channels", decoded.channels);
    meta.insert("filename", info.absoluteFilePath());

    buffer = ImageBuffer(decoded.width, decoded.height, std::move(rgb), meta);

    Logger::info(QString("Loaded %1 (%2x%3, %4 channel(s), %5 bits)")
                     .arg(filePath).arg(decoded.width).arg(decoded.height)
                     .arg(decoded.channels).arg(decoded.colordepth), "IO");
    static const char* names[] = {"Red", "Green", "Blue"};
    const ImageBuffer& loaded = buffer;
    for (int c = 0; c < ImageBuffer::kChannels; ++c) {
        const float* p = loaded.planeData(c);
        const auto mm = std::minmax_element(p, p + loaded.pixelCount());
        Logger::info(QString("%1 channel: min = %2, max = %3").arg(names[c]).arg(*mm.first, 0, 'f', 5).arg(*mm.second, 0, 'f', 5), "IO");
    }
}

template <typename T>
cv::Mat quantize(const ImageBuffer& buffer, int planes, double maxValue, int cvType) {
    const int w = buffer.width(), h = buffer.height();
    std::vector<cv::Mat> channels;
    // BGR order for OpenCV
    for (int k = planes - 1; k >= 0; --k) {
        cv::Mat m(h, w, cvType);
        const float* src = buffer.planeData(planes == 1 ? 0 : k);
        T* dst = m.ptr<T>(0);
        const long long n = static_cast<long long>(w) * h;
        #pragma omp parallel for
        for (long long i = 0; i < n; ++i) {
            const double v = std::min(std::max(static_cast<double>(src[i]), 0.0), 1.0);
            dst[i] = static_cast<T>(std::lround(v * maxValue));
        }
        channels.push_back(m);
    }
    cv::Mat out;
    cv::merge(channels, out);
    return out;
}

void saveImpl(const QString& filePath, const ImageBuffer& buffer, int depth, bool singleChannelGray) {
    if (!buffer.isValid()) throw Quasar::InvalidArgumentError("Cannot save an empty image");

    const QString suffix = QFileInfo(filePath).suffix().toLower();
    const bool gray = singleChannelGray && buffer.isGrayScale();
    const int planes = gray ? 1 : ImageBuffer::kChannels;

    if (FitsIO::isFitsExtension(suffix)) {
        FitsIO::Planes out;
        out.width = buffer.width();
        out.height = buffer.height();
        out.channels = planes;
        out.colordepth = 32;
        out.data.assign(buffer.data().begin(), buffer.data().begin() + buffer.pixelCount() * planes);
        QString err;
        if (!FitsIO::write(filePath, out, &err)) throw Quasar::IOError(err);
    }
    else if (suffix == "png" || suffix == "tif" || suffix == "tiff") {
        if (depth != 8 && depth != 16) {
            throw Quasar::InvalidArgumentError(QString("Color depth must be 8 or 16 bits for %1 files, got %2")
                                                   .arg(suffix.toUpper()).arg(depth));
        }
        cv::Mat mat = depth == 8 ? quantize<uchar>(buffer, planes, 255.0, CV_8UC1)
                                 : quantize<ushort>(buffer, planes, 65535.0, CV_16UC1);
        bool written = false;
        try {
            written = cv::imwrite(filePath.toStdString(), mat);
        } catch (const cv::Exception& e) {
            throw Quasar::IOError(formatError("Cannot write image", filePath, QString::fromStdString(e.msg)));
        }
        if (!written) throw Quasar::IOError(formatError("Cannot write image", filePath, QString()));
    }
    else {
        throw Quasar::InvalidArgumentError(QString("Cannot save files with extension '%1'").arg(suffix));
    }

    Logger::info(QString("Saved %1 (%2 channel(s), %3 bits)")
                     .arg(filePath).arg(planes).arg(FitsIO::isFitsExtension(suffix) ? 32 : depth), "IO");
}

} // namespace

bool ImageIO::load(const QString& filePath, ImageBuffer& buffer, QString* errorMsg) {
    try {
        loadImpl(filePath, buffer);
    } catch (const Quasar::Error& e) {
        if (errorMsg) *errorMsg = e.message();
        Logger::error(e.message(), "IO");
        return false;
    } catch (const cv::Exception& e) {
        if (errorMsg) *errorMsg = formatError("Cannot decode image", filePath, QString::fromStdString(e.msg));
        Logger::error(QString::fromStdString(e.msg), "IO");
        return false;
    }
    return true;
}

bool ImageIO::save(const QString& filePath, const ImageBuffer& buffer, int depth, bool singleChannelGray, QString* errorMsg) {
    try {
        saveImpl(filePath, buffer, depth, singleChannelGray);
    } catch (const Quasar::Error& e) {
        if (errorMsg) *errorMsg = e.message();
        Logger::error(e.message(), "IO");
        return false;
    }
    return true;
}

bool ImageIO::isSupportedForSave(const QString& filePath) {
    const QString suffix = QFileInfo(filePath).suffix().toLower();
    return FitsIO::isFitsExtension(suffix) || suffix == "png" || suffix == "tif" || suffix == "tiff";
}
