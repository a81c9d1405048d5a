#include "ChannelSelector.h"
#include "ColorModel.h"
#include "../core/Errors.h"

ChannelSelector::ChannelSelector(Kind kind)
    : m_kind(kind)
    , m_planes(kind == Planes ? AllPlanes : 0)
{
}

ChannelSelector ChannelSelector::fromPlanes(int planeMask) {
    if (planeMask <= 0 || (planeMask & ~AllPlanes)) {
        throw Quasar::InvalidArgumentError(QString("Invalid plane mask %1").arg(planeMask));
    }
    ChannelSelector sel(Planes);
    sel.m_planes = planeMask;
    return sel;
}

ChannelSelector ChannelSelector::parse(const QString& text) {
    const QString key = text.trimmed();
    if (key == "V") return ChannelSelector(Value);
    if (key == "L") return ChannelSelector(Luma);
    if (key == "Y") return ChannelSelector(Luminance);
    if (key == "L*") return ChannelSelector(Lightness);

    int mask = 0;
    for (const QChar c : key) {
        int bit = 0;
        switch (c.toUpper().toLatin1()) {
            case 'R': bit = RedBit; break;
            case 'G': bit = GreenBit; break;
            case 'B': bit = BlueBit; break;
            default: break;
        }
        if (bit == 0 || (mask & bit)) {
            throw Quasar::InvalidArgumentError(QString("Invalid channel selector '%1'").arg(text));
        }
        mask |= bit;
    }
    if (mask == 0) {
        throw Quasar::InvalidArgumentError(QString("Invalid channel selector '%1'").arg(text));
    }
    return fromPlanes(mask);
}

std::vector<int> ChannelSelector::planeIndices() const {
    std::vector<int> indices;
    if (m_kind != Planes) return indices;
    for (int c = 0; c < 3; ++c) {
        if (m_planes & (1 << c)) indices.push_back(c);
    }
    return indices;
}

QString ChannelSelector::toString() const {
    switch (m_kind) {
        case Value:     return "V";
        case Luma:      return "L";
        case Luminance: return "Y";
        case Lightness: return "L*";
        case Planes:    break;
    }
    QString s;
    if (m_planes & RedBit) s += 'R';
    if (m_planes & GreenBit) s += 'G';
    if (m_planes & BlueBit) s += 'B';
    return s;
}

QString ChannelSelector::label() const {
    if (m_kind != Luma) return toString();
    const ColorModel::LumaWeights w = ColorModel::lumaWeights();
    return QString::asprintf("L(%.2f, %.2f, %.2f)", w.red, w.green, w.blue);
}
