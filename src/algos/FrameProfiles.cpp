#include "FrameProfiles.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include <QMutexLocker>

FrameProfiles& FrameProfiles::instance() {
    static FrameProfiles registry;
    return registry;
}

FrameProfiles::FrameProfiles() {
    m_profiles.push_back({"eQuinox 1", 2240, 2240, 996.0, 24.0 / 255.0});
    m_profiles.push_back({"eQuinox 1 (Planets)", 1120, 1120, 498.0, 24.0 / 255.0});
}

std::optional<FrameProfile> FrameProfiles::match(int width, int height) const {
    QMutexLocker lock(&m_mutex);
    if (!m_warned) {
        Logger::warning("Frame detection is based on image size only", "Frame");
        m_warned = true;
    }
    for (const FrameProfile& p : m_profiles) {
        if (p.width == width && p.height == height) return p;
    }
    return std::nullopt;
}

void FrameProfiles::registerProfile(const FrameProfile& profile) {
    if (profile.width <= 0 || profile.height <= 0 || !(profile.cropRadius > 0.0)
        || !(profile.threshold > 0.0 && profile.threshold <= 1.0)) {
        throw Quasar::InvalidArgumentError(
            QString("Invalid frame profile '%1' (%2x%3, crop radius %4, threshold %5)")
                .arg(profile.type).arg(profile.width).arg(profile.height)
                .arg(profile.cropRadius).arg(profile.threshold));
    }
    QMutexLocker lock(&m_mutex);
    m_profiles.push_back(profile);
    Logger::info(QString("Registered frame profile '%1' (%2x%3)")
                     .arg(profile.type).arg(profile.width).arg(profile.height), "Frame");
}

std::vector<FrameProfile> FrameProfiles::profiles() const {
    QMutexLocker lock(&m_mutex);
    return m_profiles;
}
