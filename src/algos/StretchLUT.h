#ifndef STRETCHLUT_H
#define STRETCHLUT_H

#include "StretchFunctions.h"
#include <QMutex>
#include <QString>
#include <list>
#include <memory>
#include <vector>

/**
 * @brief Tabulated stretch function with linear interpolation.
 *
 * Samples the function on n evenly spaced levels of [0, 1] and stores the
 * slopes of each segment. Inputs are clipped to [0, 1].
 */
class StretchLUT {
public:
    static constexpr int kDefaultSize = 131072;

    StretchLUT(const Stretch::StretchFunction& fn, int n = kDefaultSize);

    float lookup(float t) const;
    void apply(std::vector<float>& levels) const;

    int size() const { return m_size; }
    const QString& key() const { return m_key; }

private:
    int m_size;
    QString m_key;
    std::vector<float> m_y;
    std::vector<float> m_slope;
};

/**
 * @brief Process-wide LRU cache of look-up tables keyed by function and size.
 */
class StretchLUTCache {
public:
    static StretchLUTCache& instance();

    std::shared_ptr<const StretchLUT> get(const Stretch::StretchFunction& fn, int n = StretchLUT::kDefaultSize);

    void setCapacity(int entries);
    int capacity() const;
    int size() const;
    void clear();

    // Number of tables actually built since the last clear()
    int buildCount() const;

private:
    StretchLUTCache() = default;
    StretchLUTCache(const StretchLUTCache&) = delete;
    StretchLUTCache& operator=(const StretchLUTCache&) = delete;

    struct Entry {
        QString key;
        std::shared_ptr<const StretchLUT> lut;
    };

    mutable QMutex m_mutex;
    std::list<Entry> m_entries; // most recently used first
    int m_capacity = 8;
    int m_builds = 0;
};

#endif // STRETCHLUT_H
