#include "StretchLUT.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include <QMutexLocker>
#include <algorithm>

StretchLUT::StretchLUT(const Stretch::StretchFunction& fn, int n)
    : m_size(n)
{
    if (n < 2) {
        throw Quasar::InvalidArgumentError(QString("Look-up table needs at least 2 entries, got %1").arg(n));
    }
    m_key = QString("%1#%2").arg(fn.cacheKey()).arg(n);

    const double step = 1.0 / (n - 1);
    m_y.resize(n);
    #pragma omp parallel for
    for (int i = 0; i < n; ++i) {
        m_y[i] = fn.apply(static_cast<float>(i * step));
    }

    m_slope.resize(n - 1);
    for (int i = 0; i < n - 1; ++i) {
        m_slope[i] = static_cast<float>((m_y[i + 1] - m_y[i]) / step);
    }
}

float StretchLUT::lookup(float t) const {
    const double x = std::clamp(static_cast<double>(t), 0.0, 1.0);
    const double pos = x * (m_size - 1);
    const int i = std::min(static_cast<int>(pos), m_size - 2);
    const double dx = x - static_cast<double>(i) / (m_size - 1);
    return static_cast<float>(m_y[i] + m_slope[i] * dx);
}

void StretchLUT::apply(std::vector<float>& levels) const {
    #pragma omp parallel for
    for (long long i = 0; i < (long long)levels.size(); ++i) {
        levels[i] = lookup(levels[i]);
    }
}

// ----------------------------------------------------------------------------
// StretchLUTCache
// ----------------------------------------------------------------------------

StretchLUTCache& StretchLUTCache::instance() {
    static StretchLUTCache cache;
    return cache;
}

std::shared_ptr<const StretchLUT> StretchLUTCache::get(const Stretch::StretchFunction& fn, int n) {
    const QString key = QString("%1#%2").arg(fn.cacheKey()).arg(n);

    QMutexLocker lock(&m_mutex);
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (it->key == key) {
            m_entries.splice(m_entries.begin(), m_entries, it);
            return m_entries.front().lut;
        }
    }

    auto lut = std::make_shared<const StretchLUT>(fn, n);
    ++m_builds;
    Logger::debug(QString("Built look-up table %1").arg(key), "Stretch");

    m_entries.push_front({key, lut});
    while ((int)m_entries.size() > m_capacity) {
        m_entries.pop_back();
    }
    return lut;
}

void StretchLUTCache::setCapacity(int entries) {
    if (entries < 1) {
        throw Quasar::InvalidArgumentError(QString("Look-up table cache needs at least 1 entry, got %1").arg(entries));
    }
    QMutexLocker lock(&m_mutex);
    m_capacity = entries;
    while ((int)m_entries.size() > m_capacity) {
        m_entries.pop_back();
    }
}

int StretchLUTCache::capacity() const {
    QMutexLocker lock(&m_mutex);
    return m_capacity;
}

int StretchLUTCache::size() const {
    QMutexLocker lock(&m_mutex);
    return static_cast<int>(m_entries.size());
}

void StretchLUTCache::clear() {
    QMutexLocker lock(&m_mutex);
    m_entries.clear();
    m_builds = 0;
}

int StretchLUTCache::buildCount() const {
    QMutexLocker lock(&m_mutex);
    return m_builds;
}
