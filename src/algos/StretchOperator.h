#ifndef STRETCHOPERATOR_H
#define STRETCHOPERATOR_H

#include "ChannelSelector.h"
#include "StretchFunctions.h"
#include <QString>
#include <QStringList>
#include <memory>
#include <vector>

class ImageBuffer;

/**
 * @brief Tool-level stretch: one function per channel key plus highlight protection.
 *
 * Keys are applied in insertion order. R, G and B entries act on a single
 * plane, a scalar key ("V", "L", "Y", "L*") acts on the derived channel and
 * redistributes onto RGB.
 */
class StretchOperator {
public:
    StretchOperator() = default;
    StretchOperator(const StretchOperator& other);
    StretchOperator& operator=(const StretchOperator& other);
    StretchOperator(StretchOperator&&) = default;
    StretchOperator& operator=(StretchOperator&&) = default;

    /// Add (or replace) the function for 'key'. Throws on an invalid key.
    void setFunction(const QString& key, const Stretch::StretchFunction& fn);
    void setProtectHighlights(bool enabled) { m_protectHighlights = enabled; }
    bool protectHighlights() const { return m_protectHighlights; }

    /// Same function on R, G and B, then the scalar key if given.
    static StretchOperator uniform(const Stretch::StretchFunction& fn, const QString& scalarKey = QString(),
                                   bool protectHighlights = false);

    bool isEmpty() const { return m_entries.empty(); }
    QStringList keys() const;

    /**
     * @brief Apply to 'image' in place.
     * @return true if any function was applied.
     *
     * Identity functions are skipped, except on R, G and B when the image is
     * out of range: the [0, 1] clip is itself a change there.
     */
    bool apply(ImageBuffer& image, bool useLookup = false, int nlut = 131072) const;

    /// Canonical history label, e.g. "ArcsinhStretch(R : (shadow = 0.00000, stretch = 10.0), protect highlights)".
    QString label() const;

private:
    struct Entry {
        QString key;
        ChannelSelector selector;
        std::unique_ptr<Stretch::StretchFunction> fn;
    };

    std::vector<Entry> m_entries;
    bool m_protectHighlights = false;
};

#endif // STRETCHOPERATOR_H
