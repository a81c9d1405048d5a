#ifndef CHANNELSELECTOR_H
#define CHANNELSELECTOR_H

#include <QString>
#include <vector>

/**
 * @brief Which channel(s) of an RGB image a transform acts on.
 *
 * Scalar kinds (Value, Luma, Luminance, Lightness) are computed from the
 * three planes and redistributed onto RGB after the transform. The Planes
 * kind selects any non-empty subset of {R, G, B}, each processed on its own.
 *
 * Canonical spellings: "V", "L" (luma), "Y" (luminance), "L*" (lightness)
 * and any combination of "R", "G", "B".
 */
class ChannelSelector {
public:
    enum Kind { Value, Luma, Luminance, Lightness, Planes };

    enum PlaneBit {
        RedBit   = 1 << 0,
        GreenBit = 1 << 1,
        BlueBit  = 1 << 2,
        AllPlanes = RedBit | GreenBit | BlueBit
    };

    /// Luma by default.
    ChannelSelector() = default;

    /// Scalar selector. Use fromPlanes() for plane subsets.
    explicit ChannelSelector(Kind kind);

    static ChannelSelector fromPlanes(int planeMask);

    /**
     * @brief Parse a selector string; throws Quasar::InvalidArgumentError.
     */
    static ChannelSelector parse(const QString& text);

    Kind kind() const { return m_kind; }
    int planeMask() const { return m_planes; }
    bool isScalar() const { return m_kind != Planes; }
    bool includes(int plane) const { return m_kind == Planes && (m_planes & (1 << plane)); }

    /// Selected plane indices (0 = R, 1 = G, 2 = B); empty for scalar kinds.
    std::vector<int> planeIndices() const;

    QString toString() const;

    /// Spelling used in operation labels; luma carries its weights, e.g. "L(0.30, 0.60, 0.10)".
    QString label() const;

    bool operator==(const ChannelSelector& other) const {
        return m_kind == other.m_kind && m_planes == other.m_planes;
    }
    bool operator!=(const ChannelSelector& other) const { return !(*this == other); }

private:
    Kind m_kind = Luma;
    int m_planes = 0;
};

#endif // CHANNELSELECTOR_H
