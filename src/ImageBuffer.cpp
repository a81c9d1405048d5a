#include "ImageBuffer.h"
#include "algos/ColorModel.h"
#include "algos/StretchFunctions.h"
#include "algos/StretchLUT.h"
#include "core/Errors.h"
#include <QMutexLocker>
#include <QtConcurrent/QtConcurrentMap>
#include <algorithm>
#include <cmath>
#include <limits>
#include <opencv2/opencv.hpp>

using ColorModel::IMGTOL;

namespace {

    // Linear interpolation between the two nearest order statistics
    float percentileOfSorted(const std::vector<float>& sorted, double pct) {
        const double pos = pct / 100.0 * (sorted.size() - 1);
        const size_t lo = static_cast<size_t>(std::floor(pos));
        const size_t hi = std::min(lo + 1, sorted.size() - 1);
        const double frac = pos - lo;
        return static_cast<float>(sorted[lo] + (sorted[hi] - sorted[lo]) * frac);
    }

    // Mean of the 8 neighbours with zero padding, divided by the number of in-image neighbours
    std::vector<float> neighbourMean(const float* src, int w, int h) {
        std::vector<float> out(static_cast<size_t>(w) * h);
        #pragma omp parallel for
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                double sum = 0.0;
                int n = 0;
                for (int dy = -1; dy <= 1; ++dy) {
                    const int yy = y + dy;
                    if (yy < 0 || yy >= h) continue;
                    for (int dx = -1; dx <= 1; ++dx) {
                        const int xx = x + dx;
                        if ((dx == 0 && dy == 0) || xx < 0 || xx >= w) continue;
                        sum += src[static_cast<size_t>(yy) * w + xx];
                        ++n;
                    }
                }
                const size_t idx = static_cast<size_t>(y) * w + x;
                out[idx] = n > 0 ? static_cast<float>(sum / n) : src[idx];
            }
        }
        return out;
    }

    int toCvInterpolation(ImageBuffer::Resample r) {
        switch (r) {
            case ImageBuffer::Resample_Nearest:  return cv::INTER_NEAREST;
            case ImageBuffer::Resample_Bilinear: return cv::INTER_LINEAR;
            case ImageBuffer::Resample_Bicubic:  return cv::INTER_CUBIC;
            case ImageBuffer::Resample_Area:     return cv::INTER_AREA;
            case ImageBuffer::Resample_Lanczos:
            default:                             return cv::INTER_LANCZOS4;
        }
    }

    void clipUnit(std::vector<float>& v) {
        #pragma omp parallel for
        for (long long i = 0; i < (long long)v.size(); ++i) {
            v[i] = std::clamp(v[i], 0.0f, 1.0f);
        }
    }
}

// ============================================================================
// LumaCache
// ============================================================================

std::vector<float> LumaCache::get(const std::vector<float>& rgb, quint64 revision) const {
    QMutexLocker lock(&m_mutex);
    const quint64 generation = ColorModel::lumaGeneration();
    if (!m_valid || m_generation != generation || m_revision != revision) {
        m_plane = ColorModel::luma(rgb);
        m_generation = generation;
        m_revision = revision;
        m_valid = true;
        ++m_computes;
    }
    return m_plane;
}

void LumaCache::invalidate() {
    QMutexLocker lock(&m_mutex);
    m_valid = false;
    m_plane.clear();
}

int LumaCache::computeCount() const {
    QMutexLocker lock(&m_mutex);
    return m_computes;
}

// ============================================================================
// Construction
// ============================================================================

ImageBuffer::ImageBuffer() {}
ImageBuffer::~ImageBuffer() {}

ImageBuffer::ImageBuffer(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw Quasar::InvalidArgumentError(QString("Invalid image size %1x%2").arg(width).arg(height));
    }
    m_width = width;
    m_height = height;
    m_data.assign(kChannels * pixelCount(), 0.0f);
}

ImageBuffer::ImageBuffer(int width, int height, std::vector<float> planes, const QVariantMap& meta)
    : m_meta(meta)
{
    setPlanes(width, height, std::move(planes));
}

ImageBuffer::ImageBuffer(const ImageBuffer& other)
    : m_width(other.m_width)
    , m_height(other.m_height)
    , m_data(other.m_data)
    , m_meta(other.m_meta)
    , m_revision(other.m_revision)
{
}

ImageBuffer& ImageBuffer::operator=(const ImageBuffer& other) {
    if (this != &other) {
        m_width = other.m_width;
        m_height = other.m_height;
        m_data = other.m_data;
        m_meta = other.m_meta;
        touch();
    }
    return *this;
}

ImageBuffer::ImageBuffer(ImageBuffer&& other) noexcept
    : m_width(other.m_width)
    , m_height(other.m_height)
    , m_data(std::move(other.m_data))
    , m_meta(std::move(other.m_meta))
    , m_revision(other.m_revision)
{
    other.m_width = 0;
    other.m_height = 0;
}

ImageBuffer& ImageBuffer::operator=(ImageBuffer&& other) noexcept {
    if (this != &other) {
        m_width = other.m_width;
        m_height = other.m_height;
        m_data = std::move(other.m_data);
        m_meta = std::move(other.m_meta);
        other.m_width = 0;
        other.m_height = 0;
        ++m_revision;
        m_lumaCache.invalidate();
    }
    return *this;
}

ImageBuffer ImageBuffer::blackImage(int width, int height, const QVariantMap& meta) {
    return grayImage(width, height, 0.0f, meta);
}

ImageBuffer ImageBuffer::whiteImage(int width, int height, const QVariantMap& meta) {
    return grayImage(width, height, 1.0f, meta);
}

ImageBuffer ImageBuffer::grayImage(int width, int height, float level, const QVariantMap& meta) {
    ImageBuffer img(width, height);
    std::fill(img.m_data.begin(), img.m_data.end(), level);
    img.m_meta = meta;
    return img;
}

void ImageBuffer::touch() {
    ++m_revision;
}

void ImageBuffer::setPlanes(int width, int height, std::vector<float> planes) {
    if (width <= 0 || height <= 0 || planes.size() != static_cast<size_t>(kChannels) * width * height) {
        throw Quasar::InvalidArgumentError(
            QString("Planes of %1 samples do not match a %2x%3 RGB image")
                .arg(planes.size()).arg(width).arg(height));
    }
    m_width = width;
    m_height = height;
    m_data = std::move(planes);
    touch();
}

void ImageBuffer::setPlane(int c, const std::vector<float>& plane) {
    if (c < 0 || c >= kChannels || plane.size() != pixelCount()) {
        throw Quasar::InvalidArgumentError(QString("Invalid plane %1 of %2 samples").arg(c).arg(plane.size()));
    }
    std::copy(plane.begin(), plane.end(), m_data.begin() + static_cast<size_t>(c) * pixelCount());
    touch();
}

std::vector<float> ImageBuffer::plane(int c) const {
    const float* p = planeData(c);
    return std::vector<float>(p, p + pixelCount());
}

void ImageBuffer::requireSameSize(const ImageBuffer& other, const char* what) const {
    if (other.m_width != m_width || other.m_height != m_height) {
        throw Quasar::InvalidArgumentError(
            QString("%1 is %2x%3 but the image is %4x%5")
                .arg(what).arg(other.m_width).arg(other.m_height).arg(m_width).arg(m_height));
    }
}

// ============================================================================
// Inquiries & channels
// ============================================================================

bool ImageBuffer::isGrayScale() const {
    if (!isValid()) return false;
    const size_t n = pixelCount();
    const float* r = planeData(0);
    const float* g = planeData(1);
    const float* b = planeData(2);
    for (size_t i = 0; i < n; ++i) {
        if (std::abs(g[i] - r[i]) >= IMGTOL || std::abs(b[i] - r[i]) >= IMGTOL) return false;
    }
    return true;
}

bool ImageBuffer::isOutOfRange() const {
    for (float v : m_data) {
        if (v < -IMGTOL || v > 1.0f + IMGTOL) return true;
    }
    return false;
}

std::vector<float> ImageBuffer::value() const { return ColorModel::hsvValue(m_data); }
std::vector<float> ImageBuffer::saturation() const { return ColorModel::hsvSaturation(m_data); }
std::vector<float> ImageBuffer::luma() const { return m_lumaCache.get(m_data, m_revision); }

std::vector<float> ImageBuffer::luminance() const {
    return ColorModel::linearToSrgb(ColorModel::srgbLuminance(m_data));
}

std::vector<float> ImageBuffer::lightness() const {
    return ColorModel::srgbLightness(m_data);
}

std::vector<float> ImageBuffer::channel(const ChannelSelector& selector) const {
    switch (selector.kind()) {
        case ChannelSelector::Value:     return value();
        case ChannelSelector::Luma:      return luma();
        case ChannelSelector::Luminance: return luminance();
        case ChannelSelector::Lightness: {
            std::vector<float> l = lightness();
            for (float& v : l) v /= 100.0f;
            return l;
        }
        case ChannelSelector::Planes:
            break;
    }
    throw Quasar::InvalidArgumentError(
        QString("Channel selector '%1' is not a scalar channel").arg(selector.toString()));
}

ImageBuffer::ResolvedChannels ImageBuffer::resolve(const ChannelSelector& selector) const {
    ResolvedChannels rc;
    if (selector.isScalar()) rc.scalar = channel(selector);
    else rc.planes = selector.planeIndices();
    return rc;
}

// ============================================================================
// Statistics & histograms
// ============================================================================

QMap<QString, ImageBuffer::ChannelStats> ImageBuffer::statistics() const {
    QMap<QString, ChannelStats> stats;
    if (!isValid()) return stats;

    const std::pair<const char*, const char*> keys[] = {
        {"R", "Red"}, {"G", "Green"}, {"B", "Blue"}, {"V", "Value"}, {"L", "Luma"}
    };

    // Channels are derived up front; the per-channel sorts then run in parallel
    struct Job {
        std::vector<float> data;
        ChannelStats stats;
    };
    std::vector<Job> jobs(5);
    for (int k = 0; k < 5; ++k) {
        if (k < 3) jobs[k].data = plane(k);
        else if (k == 3) jobs[k].data = value();
        else jobs[k].data = luma();
        jobs[k].stats.name = keys[k].second;
    }

    const int width = m_width;
    const int height = m_height;
    const long long npixels = static_cast<long long>(pixelCount());

    QtConcurrent::blockingMap(jobs, [=](Job& job) {
        const std::vector<float>& ch = job.data;
        ChannelStats& s = job.stats;
        s.width = width;
        s.height = height;
        s.npixels = npixels;

        auto mm = std::minmax_element(ch.begin(), ch.end());
        s.minimum = *mm.first;
        s.maximum = *mm.second;

        std::vector<float> inside;
        inside.reserve(ch.size());
        for (float v : ch) {
            if (v < IMGTOL) ++s.zerocount;
            else if (v > 1.0f + IMGTOL) ++s.outcount;
            if (v >= IMGTOL && v <= 1.0f - IMGTOL) inside.push_back(v);
        }
        if (!inside.empty()) {
            std::sort(inside.begin(), inside.end());
            std::array<float, 3> pr = {
                percentileOfSorted(inside, 25.0),
                percentileOfSorted(inside, 50.0),
                percentileOfSorted(inside, 75.0)
            };
            s.percentiles = pr;
            s.median = pr[1];
        }
    });

    for (int k = 0; k < 5; ++k) stats.insert(keys[k].first, jobs[k].stats);
    return stats;
}

ImageBuffer::Histograms ImageBuffer::histograms(int nbins) const {
    if (nbins <= 0) {
        throw Quasar::InvalidArgumentError(QString("Number of bins must be > 0, got %1").arg(nbins));
    }
    Histograms h;
    if (!isValid()) return h;

    auto mm = std::minmax_element(m_data.begin(), m_data.end());
    const double lo = std::min(0.0, static_cast<double>(*mm.first));
    const double hi = std::max(1.0, static_cast<double>(*mm.second));
    const int nb = std::max(1, static_cast<int>(std::lround(nbins * (hi - lo))));

    h.edges.resize(nb + 1);
    for (int i = 0; i <= nb; ++i) h.edges[i] = lo + (hi - lo) * i / nb;

    const std::vector<float> rows[] = { plane(0), plane(1), plane(2), value(), luma() };
    h.counts.assign(5, std::vector<int>(nb, 0));
    for (int r = 0; r < 5; ++r) {
        for (float v : rows[r]) {
            int bin = static_cast<int>((v - lo) / (hi - lo) * nb);
            bin = std::clamp(bin, 0, nb - 1);  // last bin is closed
            ++h.counts[r][bin];
        }
    }
    return h;
}

// ============================================================================
// Normalization
// ============================================================================

void ImageBuffer::scalePixels(const std::vector<float>& source, const std::vector<float>& target) {
    const size_t n = pixelCount();
    if (source.size() != n || target.size() != n) {
        throw Quasar::InvalidArgumentError("Source and target channels must match the image size");
    }
    float* r = planeData(0);
    float* g = planeData(1);
    float* b = planeData(2);

    #pragma omp parallel for
    for (long long i = 0; i < (long long)n; ++i) {
        if (std::abs(source[i]) < IMGTOL) {
            r[i] = g[i] = b[i] = 0.0f;
        } else {
            const float ratio = target[i] / source[i];
            r[i] *= ratio;
            g[i] *= ratio;
            b[i] *= ratio;
        }
    }
}

void ImageBuffer::protectHighlights(const MetaOverride& meta) {
    const size_t n = pixelCount();
    float* r = planeData(0);
    float* g = planeData(1);
    float* b = planeData(2);

    #pragma omp parallel for
    for (long long i = 0; i < (long long)n; ++i) {
        const float mx = std::max(1.0f, std::max(r[i], std::max(g[i], b[i])));
        r[i] /= mx;
        g[i] /= mx;
        b[i] /= mx;
    }
    applyMeta(meta);
}

ImageBuffer ImageBuffer::protectedHighlights(const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.protectHighlights(meta);
    return out;
}

// ============================================================================
// Histogram transformations
// ============================================================================

void ImageBuffer::transformPlanes(const ChannelSelector& channels, const std::function<void(std::vector<float>&)>& op) {
    for (int c : channels.planeIndices()) {
        std::vector<float> p = plane(c);
        op(p);
        setPlane(c, p);
    }
}

void ImageBuffer::stretchWith(const ChannelSelector& channels, const std::function<void(std::vector<float>&)>& op) {
    const ResolvedChannels rc = resolve(channels);
    if (rc.scalar) {
        std::vector<float> stretched(*rc.scalar);
        clipUnit(stretched);
        op(stretched);
        scalePixels(*rc.scalar, stretched);
    } else {
        transformPlanes(channels, [&op](std::vector<float>& p) {
            clipUnit(p);
            op(p);
        });
    }
}

void ImageBuffer::remapChannels(const ChannelSelector& channels, const std::function<void(std::vector<float>&)>& remap) {
    const ResolvedChannels rc = resolve(channels);
    if (rc.scalar) {
        std::vector<float> target(*rc.scalar);
        remap(target);
        scalePixels(*rc.scalar, target);
        return;
    }
    // Remap every plane first so that a failure leaves the image untouched
    std::vector<std::vector<float>> planes;
    for (int c : rc.planes) {
        planes.push_back(plane(c));
        remap(planes.back());
    }
    for (size_t k = 0; k < rc.planes.size(); ++k) setPlane(rc.planes[k], planes[k]);
}

void ImageBuffer::clipShadowsHighlights(std::optional<double> shadow, std::optional<double> highlight,
                                        const ChannelSelector& channels, const MetaOverride& meta) {
    if (shadow && highlight && *highlight <= *shadow) {
        throw Quasar::InvalidArgumentError(
            QString("Highlight (%1) must be > shadow (%2)").arg(*highlight).arg(*shadow));
    }

    // Resolve bounds for one channel, then remap [shadow, highlight] -> [0, 1]
    auto remap = [&](std::vector<float>& ch) {
        auto mm = std::minmax_element(ch.begin(), ch.end());
        const double lo = shadow ? *shadow : std::max(static_cast<double>(*mm.first), 0.0);
        const double hi = highlight ? *highlight : static_cast<double>(*mm.second);
        if (hi <= lo) {
            throw Quasar::InvalidArgumentError(QString("Highlight (%1) must be > shadow (%2)").arg(hi).arg(lo));
        }
        #pragma omp parallel for
        for (long long i = 0; i < (long long)ch.size(); ++i) {
            const double v = std::clamp(static_cast<double>(ch[i]), lo, hi);
            ch[i] = static_cast<float>((v - lo) / (hi - lo));
        }
    };

    remapChannels(channels, remap);
    applyMeta(meta);
}

ImageBuffer ImageBuffer::clippedShadowsHighlights(std::optional<double> shadow, std::optional<double> highlight,
                                                  const ChannelSelector& channels, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.clipShadowsHighlights(shadow, highlight, channels, meta);
    return out;
}

void ImageBuffer::setDynamicRange(std::optional<std::pair<double, double>> from, std::pair<double, double> to,
                                  const ChannelSelector& channels, const MetaOverride& meta) {
    if (from && from->second <= from->first) {
        throw Quasar::InvalidArgumentError(
            QString("Invalid source range [%1, %2]").arg(from->first).arg(from->second));
    }
    if (to.second <= to.first) {
        throw Quasar::InvalidArgumentError(
            QString("Invalid target range [%1, %2]").arg(to.first).arg(to.second));
    }

    auto remap = [&](std::vector<float>& ch) {
        std::pair<double, double> fr;
        if (from) {
            fr = *from;
        } else {
            auto mm = std::minmax_element(ch.begin(), ch.end());
            fr = { *mm.first, *mm.second };
            if (fr.second <= fr.first) {
                throw Quasar::InvalidArgumentError("Cannot remap a constant channel");
            }
        }
        #pragma omp parallel for
        for (long long i = 0; i < (long long)ch.size(); ++i) {
            const double t = (std::clamp(static_cast<double>(ch[i]), fr.first, fr.second) - fr.first) / (fr.second - fr.first);
            ch[i] = static_cast<float>(std::max(0.0, to.first + t * (to.second - to.first)));
        }
    };

    remapChannels(channels, remap);
    applyMeta(meta);
}

ImageBuffer ImageBuffer::withDynamicRange(std::optional<std::pair<double, double>> from, std::pair<double, double> to,
                                          const ChannelSelector& channels, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.setDynamicRange(from, to, channels, meta);
    return out;
}

void ImageBuffer::gammaCorrection(double gamma, const ChannelSelector& channels, const MetaOverride& meta) {
    generalizedStretch(Stretch::GammaStretch(gamma), channels, meta);
}

ImageBuffer ImageBuffer::gammaCorrected(double gamma, const ChannelSelector& channels, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.gammaCorrection(gamma, channels, meta);
    return out;
}

void ImageBuffer::midtoneCorrection(double midtone, const ChannelSelector& channels, const MetaOverride& meta) {
    generalizedStretch(Stretch::MidtoneStretch(midtone), channels, meta);
}

ImageBuffer ImageBuffer::midtoneCorrected(double midtone, const ChannelSelector& channels, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.midtoneCorrection(midtone, channels, meta);
    return out;
}

void ImageBuffer::generalizedStretch(const Stretch::StretchFunction& fn, const ChannelSelector& channels,
                                     const MetaOverride& meta) {
    stretchWith(channels, [&fn](std::vector<float>& levels) { fn.apply(levels); });
    applyMeta(meta);
}

ImageBuffer ImageBuffer::generalizedStretched(const Stretch::StretchFunction& fn, const ChannelSelector& channels,
                                              const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.generalizedStretch(fn, channels, meta);
    return out;
}

void ImageBuffer::generalizedStretchLookup(const Stretch::StretchFunction& fn, const ChannelSelector& channels,
                                           int nlut, const MetaOverride& meta) {
    std::shared_ptr<const StretchLUT> lut = StretchLUTCache::instance().get(fn, nlut);
    stretchWith(channels, [&lut](std::vector<float>& levels) { lut->apply(levels); });
    applyMeta(meta);
}

ImageBuffer ImageBuffer::generalizedStretchedLookup(const Stretch::StretchFunction& fn, const ChannelSelector& channels,
                                                    int nlut, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.generalizedStretchLookup(fn, channels, nlut, meta);
    return out;
}

// ============================================================================
// Color transformations
// ============================================================================

void ImageBuffer::colorBalance(double red, double green, double blue, const MetaOverride& meta) {
    if (red < 0.0 || green < 0.0 || blue < 0.0) {
        throw Quasar::InvalidArgumentError(
            QString("Color balance factors must be >= 0, got (%1, %2, %3)").arg(red).arg(green).arg(blue));
    }
    const double factors[kChannels] = { red, green, blue };
    const size_t n = pixelCount();
    for (int c = 0; c < kChannels; ++c) {
        if (factors[c] == 1.0) continue;
        float* p = planeData(c);
        const float f = static_cast<float>(factors[c]);
        #pragma omp parallel for
        for (long long i = 0; i < (long long)n; ++i) {
            p[i] *= f;
        }
    }
    applyMeta(meta);
}

ImageBuffer ImageBuffer::colorBalanced(double red, double green, double blue, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.colorBalance(red, green, blue, meta);
    return out;
}

void ImageBuffer::negative(const MetaOverride& meta) {
    std::vector<float>& d = data();
    #pragma omp parallel for
    for (long long i = 0; i < (long long)d.size(); ++i) {
        d[i] = std::clamp(1.0f - d[i], 0.0f, 1.0f);
    }
    applyMeta(meta);
}

ImageBuffer ImageBuffer::negated(const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.negative(meta);
    return out;
}

void ImageBuffer::grayScale(const ChannelSelector& selector, const MetaOverride& meta) {
    const ChannelSelector::Kind k = selector.kind();
    if (k != ChannelSelector::Value && k != ChannelSelector::Luma && k != ChannelSelector::Luminance) {
        throw Quasar::InvalidArgumentError(
            QString("Gray scale conversion needs V, L or Y, got '%1'").arg(selector.toString()));
    }
    const std::vector<float> gray = channel(selector);
    for (int c = 0; c < kChannels; ++c) setPlane(c, gray);
    applyMeta(meta);
}

ImageBuffer ImageBuffer::grayScaled(const ChannelSelector& selector, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.grayScale(selector, meta);
    return out;
}

// ============================================================================
// Enhancement
// ============================================================================

void ImageBuffer::sharpen(const MetaOverride& meta) {
    const int w = m_width;
    const int h = m_height;
    for (int c = 0; c < kChannels; ++c) {
        const std::vector<float> src = plane(c);
        std::vector<float> dst(src.size());
        #pragma omp parallel for
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                double acc = 0.0;
                for (int dy = -1; dy <= 1; ++dy) {
                    const int yy = y + dy;
                    if (yy < 0 || yy >= h) continue;
                    for (int dx = -1; dx <= 1; ++dx) {
                        const int xx = x + dx;
                        if (xx < 0 || xx >= w) continue;
                        const float k = (dx == 0 && dy == 0) ? 9.0f : -1.0f;
                        acc += k * src[static_cast<size_t>(yy) * w + xx];
                    }
                }
                dst[static_cast<size_t>(y) * w + x] = static_cast<float>(acc);
            }
        }
        setPlane(c, dst);
    }
    applyMeta(meta);
}

ImageBuffer ImageBuffer::sharpened(const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.sharpen(meta);
    return out;
}

void ImageBuffer::removeHotPixels(double ratio, const ChannelSelector& channels, const MetaOverride& meta) {
    if (ratio <= 0.0) {
        throw Quasar::InvalidArgumentError(QString("Hot pixel ratio must be > 0, got %1").arg(ratio));
    }
    const float fr = static_cast<float>(ratio);
    const size_t n = pixelCount();

    const ResolvedChannels rc = resolve(channels);
    if (rc.scalar) {
        const std::vector<float>& ch = *rc.scalar;
        const std::vector<float> chAvg = neighbourMean(ch.data(), m_width, m_height);
        std::vector<char> hot(n);
        for (size_t i = 0; i < n; ++i) hot[i] = ch[i] > fr * chAvg[i];

        for (int c = 0; c < kChannels; ++c) {
            const std::vector<float> avg = neighbourMean(planeData(c), m_width, m_height);
            float* p = planeData(c);
            #pragma omp parallel for
            for (long long i = 0; i < (long long)n; ++i) {
                if (hot[i]) p[i] = avg[i];
            }
        }
    } else {
        for (int c : rc.planes) {
            const std::vector<float> avg = neighbourMean(planeData(c), m_width, m_height);
            float* p = planeData(c);
            #pragma omp parallel for
            for (long long i = 0; i < (long long)n; ++i) {
                if (p[i] > fr * avg[i]) p[i] = avg[i];
            }
        }
    }
    applyMeta(meta);
}

ImageBuffer ImageBuffer::hotPixelsRemoved(double ratio, const ChannelSelector& channels, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.removeHotPixels(ratio, channels, meta);
    return out;
}

// ============================================================================
// Geometric Ops
// ============================================================================

void ImageBuffer::resize(int width, int height, Resample resample, const MetaOverride& meta) {
    if (width < 1 || width > 32768 || height < 1 || height > 32768) {
        throw Quasar::InvalidArgumentError(
            QString("Width and height must be in [1, 32768] pixels, got %1x%2").arg(width).arg(height));
    }
    if (static_cast<long long>(width) * height > (1LL << 26)) {
        throw Quasar::InvalidArgumentError(
            QString("Cannot resize to more than 64 Mpixels (%1x%2)").arg(width).arg(height));
    }

    const size_t newCount = static_cast<size_t>(width) * height;
    std::vector<float> out(kChannels * newCount);
    const int interp = toCvInterpolation(resample);
    for (int c = 0; c < kChannels; ++c) {
        cv::Mat src(m_height, m_width, CV_32FC1, const_cast<float*>(planeData(c)));
        cv::Mat dst(height, width, CV_32FC1, out.data() + c * newCount);
        cv::resize(src, dst, cv::Size(width, height), 0, 0, interp);
    }
    setPlanes(width, height, std::move(out));
    applyMeta(meta);
}

ImageBuffer ImageBuffer::resized(int width, int height, Resample resample, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.resize(width, height, resample, meta);
    return out;
}

void ImageBuffer::rescale(double scale, Resample resample, const MetaOverride& meta) {
    if (scale <= 0.0 || scale > 16.0) {
        throw Quasar::InvalidArgumentError(QString("Scale must be > 0 and <= 16, got %1").arg(scale));
    }
    resize(static_cast<int>(std::lround(scale * m_width)), static_cast<int>(std::lround(scale * m_height)),
           resample, meta);
}

ImageBuffer ImageBuffer::rescaled(double scale, Resample resample, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.rescale(scale, resample, meta);
    return out;
}

void ImageBuffer::crop(int xmin, int xmax, int ymin, int ymax, const MetaOverride& meta) {
    xmin = std::max(xmin, 0);
    xmax = std::min(xmax, m_width);
    ymin = std::max(ymin, 0);
    ymax = std::min(ymax, m_height);
    if (xmax <= xmin) throw Quasar::InvalidArgumentError(QString("Empty crop: xmax (%1) <= xmin (%2)").arg(xmax).arg(xmin));
    if (ymax <= ymin) throw Quasar::InvalidArgumentError(QString("Empty crop: ymax (%1) <= ymin (%2)").arg(ymax).arg(ymin));

    const int w = xmax - xmin;
    const int h = ymax - ymin;
    std::vector<float> out(static_cast<size_t>(kChannels) * w * h);
    for (int c = 0; c < kChannels; ++c) {
        const float* src = planeData(c);
        float* dst = out.data() + static_cast<size_t>(c) * w * h;
        for (int y = 0; y < h; ++y) {
            const float* row = src + static_cast<size_t>(ymin + y) * m_width + xmin;
            std::copy(row, row + w, dst + static_cast<size_t>(y) * w);
        }
    }
    setPlanes(w, h, std::move(out));
    applyMeta(meta);
}

ImageBuffer ImageBuffer::cropped(int xmin, int xmax, int ymin, int ymax, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.crop(xmin, xmax, ymin, ymax, meta);
    return out;
}

ImageBuffer::Resample ImageBuffer::resampleFromString(const QString& name) {
    const QString key = name.trimmed().toLower();
    if (key == "nearest") return Resample_Nearest;
    if (key == "bilinear") return Resample_Bilinear;
    if (key == "bicubic") return Resample_Bicubic;
    if (key == "lanczos") return Resample_Lanczos;
    if (key == "area") return Resample_Area;
    throw Quasar::InvalidArgumentError(QString("Unknown resampling method '%1'").arg(name));
}

// ============================================================================
// Device frames
// ============================================================================

std::optional<FrameProfile> ImageBuffer::checkFrame() const {
    if (!isValid()) return std::nullopt;
    return FrameProfiles::instance().match(m_width, m_height);
}

ImageBuffer ImageBuffer::getFrame() const {
    const std::optional<FrameProfile> profile = checkFrame();
    if (!profile) {
        throw Quasar::UnsupportedFormatError(
            QString("No known device frame for a %1x%2 image").arg(m_width).arg(m_height));
    }

    const double cx = (m_width - 1) / 2.0;
    const double cy = (m_height - 1) / 2.0;
    const double r2 = profile->cropRadius * profile->cropRadius;
    const float threshold = static_cast<float>(profile->threshold);
    const std::vector<float> v = value();
    const size_t n = pixelCount();

    std::vector<float> frame(kChannels * n, 0.0f);
    #pragma omp parallel for
    for (int y = 0; y < m_height; ++y) {
        const double dy = y - cy;
        for (int x = 0; x < m_width; ++x) {
            const double dx = x - cx;
            const size_t i = static_cast<size_t>(y) * m_width + x;
            if (dx * dx + dy * dy > r2 && v[i] >= threshold) {
                for (int c = 0; c < kChannels; ++c) frame[c * n + i] = m_data[c * n + i];
            }
        }
    }

    QVariantMap meta;
    meta.insert("description", "Frame");
    meta.insert("frametype", profile->type);
    return ImageBuffer(m_width, m_height, std::move(frame), meta);
}

void ImageBuffer::removeFrame(const ImageBuffer& frame, const MetaOverride& meta) {
    requireSameSize(frame, "Frame");
    const std::vector<float> fv = frame.value();
    const size_t n = pixelCount();
    std::vector<float>& d = data();
    #pragma omp parallel for
    for (long long i = 0; i < (long long)n; ++i) {
        if (fv[i] > 0.0f) {
            for (int c = 0; c < kChannels; ++c) d[c * n + i] = 0.0f;
        }
    }
    applyMeta(meta);
}

ImageBuffer ImageBuffer::frameRemoved(const ImageBuffer& frame, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.removeFrame(frame, meta);
    return out;
}

void ImageBuffer::addFrame(const ImageBuffer& frame, const MetaOverride& meta) {
    requireSameSize(frame, "Frame");
    const std::vector<float> fv = frame.value();
    const std::vector<float>& fd = frame.data();
    const size_t n = pixelCount();
    std::vector<float>& d = data();
    #pragma omp parallel for
    for (long long i = 0; i < (long long)n; ++i) {
        if (fv[i] > 0.0f) {
            for (int c = 0; c < kChannels; ++c) d[c * n + i] = fd[c * n + i];
        }
    }
    applyMeta(meta);
}

ImageBuffer ImageBuffer::frameAdded(const ImageBuffer& frame, const MetaOverride& meta) const {
    ImageBuffer out(*this);
    out.addFrame(frame, meta);
    return out;
}
