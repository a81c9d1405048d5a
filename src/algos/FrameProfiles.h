#ifndef FRAMEPROFILES_H
#define FRAMEPROFILES_H

#include <QMutex>
#include <QString>
#include <optional>
#include <vector>

/**
 * @brief Geometry of the circular frame some smart telescopes burn into their images.
 *
 * Detection is by exact image dimensions. Pixels farther than cropRadius
 * from the image centre whose HSV value reaches threshold belong to the frame.
 */
struct FrameProfile {
    QString type;
    int width = 0;
    int height = 0;
    double cropRadius = 0.0;  // radius used for cropping inside the frame
    double threshold = 0.0;   // minimum value of frame pixels

    bool operator==(const FrameProfile& other) const {
        return type == other.type && width == other.width && height == other.height;
    }
};

class FrameProfiles {
public:
    static FrameProfiles& instance();

    /// First profile whose dimensions are exactly width x height.
    std::optional<FrameProfile> match(int width, int height) const;

    /// Append a profile; throws Quasar::InvalidArgumentError on bad geometry or a threshold outside ]0, 1].
    void registerProfile(const FrameProfile& profile);

    std::vector<FrameProfile> profiles() const;

private:
    FrameProfiles();
    FrameProfiles(const FrameProfiles&) = delete;
    FrameProfiles& operator=(const FrameProfiles&) = delete;

    mutable QMutex m_mutex;
    std::vector<FrameProfile> m_profiles;
    mutable bool m_warned = false;
};

#endif // FRAMEPROFILES_H
