#ifndef IMAGEBUFFER_H
#define IMAGEBUFFER_H

#include <vector>
#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <QMap>
#include <QMutex>
#include <QSize>
#include <QString>
#include <QVariant>
#include "algos/ChannelSelector.h"
#include "algos/FrameProfiles.h"

namespace Stretch { class StretchFunction; }

/**
 * @brief Luma plane cached together with the weights generation and buffer revision it was computed for.
 *
 * Copies start empty: a cache is never shared between buffers.
 */
class LumaCache {
public:
    LumaCache() = default;
    LumaCache(const LumaCache&) {}
    LumaCache& operator=(const LumaCache&) { invalidate(); return *this; }

    std::vector<float> get(const std::vector<float>& rgb, quint64 revision) const;
    void invalidate();

    // Number of times the plane was actually computed
    int computeCount() const;

private:
    mutable QMutex m_mutex;
    mutable std::vector<float> m_plane;
    mutable quint64 m_generation = 0;
    mutable quint64 m_revision = 0;
    mutable bool m_valid = false;
    mutable int m_computes = 0;
};

/**
 * @brief RGB image with float planes and free-form metadata.
 *
 * Storage is planar: R plane, then G, then B, each width*height samples in
 * row-major order. Values are nominally in [0, 1] but are not clamped at rest;
 * out-of-range data is a valid state.
 *
 * Every transform exists as a mutating member and as a const "...ed" member
 * returning a new buffer. Both accept an optional replacement metadata map.
 * Invalid arguments throw Quasar::InvalidArgumentError before any pixel changes.
 */
class ImageBuffer {
public:
    static constexpr int kChannels = 3;

    enum Resample { Resample_Nearest, Resample_Bilinear, Resample_Bicubic, Resample_Lanczos, Resample_Area };

    struct ChannelStats {
        QString name;
        int width = 0;
        int height = 0;
        long long npixels = 0;
        float minimum = 0.0f;
        float maximum = 0.0f;
        std::optional<std::array<float, 3>> percentiles;  // 25th, 50th, 75th (pixels in ]0, 1[ only)
        std::optional<float> median;
        long long zerocount = 0;  // pixels < IMGTOL
        long long outcount = 0;   // pixels > 1 + IMGTOL
    };

    struct Histograms {
        std::vector<double> edges;              // nbins + 1 edges
        std::vector<std::vector<int>> counts;   // R, G, B, V, L
    };

    using MetaOverride = std::optional<QVariantMap>;

    ImageBuffer();
    ImageBuffer(int width, int height);
    ImageBuffer(int width, int height, std::vector<float> planes, const QVariantMap& meta = QVariantMap());
    ~ImageBuffer();

    // Custom copy to handle non-copyable lock
    ImageBuffer(const ImageBuffer& other);
    ImageBuffer& operator=(const ImageBuffer& other);

    ImageBuffer(ImageBuffer&& other) noexcept;
    ImageBuffer& operator=(ImageBuffer&& other) noexcept;

    static ImageBuffer blackImage(int width, int height, const QVariantMap& meta = QVariantMap());
    static ImageBuffer whiteImage(int width, int height, const QVariantMap& meta = QVariantMap());
    static ImageBuffer grayImage(int width, int height, float level, const QVariantMap& meta = QVariantMap());

    // Raw Access
    const std::vector<float>& data() const { return m_data; }
    std::vector<float>& data() { touch(); return m_data; }
    const float* planeData(int c) const { return m_data.data() + static_cast<size_t>(c) * pixelCount(); }
    float* planeData(int c) { touch(); return m_data.data() + static_cast<size_t>(c) * pixelCount(); }
    std::vector<float> plane(int c) const;

    void setPlanes(int width, int height, std::vector<float> planes);
    void setPlane(int c, const std::vector<float>& plane);

    int width() const { return m_width; }
    int height() const { return m_height; }
    QSize size() const { return QSize(m_width, m_height); }
    size_t pixelCount() const { return static_cast<size_t>(m_width) * m_height; }
    bool isValid() const { return !m_data.empty() && m_width > 0 && m_height > 0; }

    bool isGrayScale() const;
    bool isOutOfRange() const;

    // Bumped by every mutation; caches compare against it
    quint64 revision() const { return m_revision; }

    // Metadata
    const QVariantMap& metadata() const { return m_meta; }
    QVariantMap& metadata() { return m_meta; }
    void setMetadata(const QVariantMap& meta) { m_meta = meta; }
    QVariant meta(const QString& key, const QVariant& defaultValue = QVariant()) const { return m_meta.value(key, defaultValue); }
    void setMeta(const QString& key, const QVariant& value) { m_meta.insert(key, value); }
    QString description() const { return m_meta.value("description").toString(); }

    // Channels, computed from the current planes
    std::vector<float> value() const;
    std::vector<float> saturation() const;
    std::vector<float> luma() const;
    std::vector<float> luminance() const;   // sRGB-encoded luminance
    std::vector<float> lightness() const;   // CIE L* in [0, 100]
    std::vector<float> channel(const ChannelSelector& selector) const;  // lightness scaled to [0, 1]

    // What a selector addresses on this image: the computed scalar channel, or the selected plane indices
    struct ResolvedChannels {
        std::optional<std::vector<float>> scalar;
        std::vector<int> planes;
    };
    ResolvedChannels resolve(const ChannelSelector& selector) const;

    const LumaCache& lumaCache() const { return m_lumaCache; }

    // Statistics for channels R, G, B, V and L
    QMap<QString, ChannelStats> statistics() const;
    Histograms histograms(int nbins = 256) const;

    // Normalization
    void scalePixels(const std::vector<float>& source, const std::vector<float>& target);
    void protectHighlights(const MetaOverride& meta = std::nullopt);
    ImageBuffer protectedHighlights(const MetaOverride& meta = std::nullopt) const;

    // Histogram transformations
    void clipShadowsHighlights(std::optional<double> shadow = std::nullopt, std::optional<double> highlight = std::nullopt,
                               const ChannelSelector& channels = ChannelSelector(ChannelSelector::Value),
                               const MetaOverride& meta = std::nullopt);
    ImageBuffer clippedShadowsHighlights(std::optional<double> shadow = std::nullopt, std::optional<double> highlight = std::nullopt,
                                         const ChannelSelector& channels = ChannelSelector(ChannelSelector::Value),
                                         const MetaOverride& meta = std::nullopt) const;

    void setDynamicRange(std::optional<std::pair<double, double>> from, std::pair<double, double> to = {0.0, 1.0},
                         const ChannelSelector& channels = ChannelSelector(), const MetaOverride& meta = std::nullopt);
    ImageBuffer withDynamicRange(std::optional<std::pair<double, double>> from, std::pair<double, double> to = {0.0, 1.0},
                                 const ChannelSelector& channels = ChannelSelector(), const MetaOverride& meta = std::nullopt) const;

    void gammaCorrection(double gamma, const ChannelSelector& channels = ChannelSelector(), const MetaOverride& meta = std::nullopt);
    ImageBuffer gammaCorrected(double gamma, const ChannelSelector& channels = ChannelSelector(), const MetaOverride& meta = std::nullopt) const;

    void midtoneCorrection(double midtone, const ChannelSelector& channels = ChannelSelector(), const MetaOverride& meta = std::nullopt);
    ImageBuffer midtoneCorrected(double midtone, const ChannelSelector& channels = ChannelSelector(), const MetaOverride& meta = std::nullopt) const;

    void generalizedStretch(const Stretch::StretchFunction& fn, const ChannelSelector& channels = ChannelSelector(),
                            const MetaOverride& meta = std::nullopt);
    ImageBuffer generalizedStretched(const Stretch::StretchFunction& fn, const ChannelSelector& channels = ChannelSelector(),
                                     const MetaOverride& meta = std::nullopt) const;

    void generalizedStretchLookup(const Stretch::StretchFunction& fn, const ChannelSelector& channels = ChannelSelector(),
                                  int nlut = 131072, const MetaOverride& meta = std::nullopt);
    ImageBuffer generalizedStretchedLookup(const Stretch::StretchFunction& fn, const ChannelSelector& channels = ChannelSelector(),
                                           int nlut = 131072, const MetaOverride& meta = std::nullopt) const;

    // Color transformations
    void colorBalance(double red, double green, double blue, const MetaOverride& meta = std::nullopt);
    ImageBuffer colorBalanced(double red, double green, double blue, const MetaOverride& meta = std::nullopt) const;

    void negative(const MetaOverride& meta = std::nullopt);
    ImageBuffer negated(const MetaOverride& meta = std::nullopt) const;

    void grayScale(const ChannelSelector& selector = ChannelSelector(), const MetaOverride& meta = std::nullopt);
    ImageBuffer grayScaled(const ChannelSelector& selector = ChannelSelector(), const MetaOverride& meta = std::nullopt) const;

    // Enhancement
    void sharpen(const MetaOverride& meta = std::nullopt);
    ImageBuffer sharpened(const MetaOverride& meta = std::nullopt) const;

    void removeHotPixels(double ratio = 2.0, const ChannelSelector& channels = ChannelSelector(), const MetaOverride& meta = std::nullopt);
    ImageBuffer hotPixelsRemoved(double ratio = 2.0, const ChannelSelector& channels = ChannelSelector(), const MetaOverride& meta = std::nullopt) const;

    // Geometric Ops
    void resize(int width, int height, Resample resample = Resample_Lanczos, const MetaOverride& meta = std::nullopt);
    ImageBuffer resized(int width, int height, Resample resample = Resample_Lanczos, const MetaOverride& meta = std::nullopt) const;

    void rescale(double scale, Resample resample = Resample_Lanczos, const MetaOverride& meta = std::nullopt);
    ImageBuffer rescaled(double scale, Resample resample = Resample_Lanczos, const MetaOverride& meta = std::nullopt) const;

    void crop(int xmin, int xmax, int ymin, int ymax, const MetaOverride& meta = std::nullopt);
    ImageBuffer cropped(int xmin, int xmax, int ymin, int ymax, const MetaOverride& meta = std::nullopt) const;

    // Device frames
    std::optional<FrameProfile> checkFrame() const;
    ImageBuffer getFrame() const;
    void removeFrame(const ImageBuffer& frame, const MetaOverride& meta = std::nullopt);
    ImageBuffer frameRemoved(const ImageBuffer& frame, const MetaOverride& meta = std::nullopt) const;
    void addFrame(const ImageBuffer& frame, const MetaOverride& meta = std::nullopt);
    ImageBuffer frameAdded(const ImageBuffer& frame, const MetaOverride& meta = std::nullopt) const;

    static Resample resampleFromString(const QString& name);

private:
    void touch();
    void applyMeta(const MetaOverride& meta) { if (meta) m_meta = *meta; }
    void requireSameSize(const ImageBuffer& other, const char* what) const;
    void transformPlanes(const ChannelSelector& channels, const std::function<void(std::vector<float>&)>& op);
    void stretchWith(const ChannelSelector& channels, const std::function<void(std::vector<float>&)>& op);
    void remapChannels(const ChannelSelector& channels, const std::function<void(std::vector<float>&)>& remap);

    int m_width = 0;
    int m_height = 0;
    std::vector<float> m_data; // Planar 32-bit float
    QVariantMap m_meta;
    quint64 m_revision = 0;
    LumaCache m_lumaCache;

    // Thread Safety: Read-Write lock for concurrent access
};

#endif // IMAGEBUFFER_H
