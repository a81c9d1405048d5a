#include "StretchOperator.h"
#include "../ImageBuffer.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include <QStringList>

StretchOperator::StretchOperator(const StretchOperator& other)
    : m_protectHighlights(other.m_protectHighlights) {
    for (const Entry& e : other.m_entries) {
        m_entries.push_back({e.key, e.selector, e.fn->clone()});
    }
}

StretchOperator& StretchOperator::operator=(const StretchOperator& other) {
    if (this != &other) {
        StretchOperator tmp(other);
        *this = std::move(tmp);
    }
    return *this;
}

void StretchOperator::setFunction(const QString& key, const Stretch::StretchFunction& fn) {
    ChannelSelector selector = ChannelSelector::parse(key);
    if (!selector.isScalar() && selector.planeIndices().size() != 1) {
        throw Quasar::InvalidArgumentError(QString("Stretch key must be a single plane or a scalar channel, got '%1'").arg(key));
    }
    const QString canonical = selector.toString();
    for (Entry& e : m_entries) {
        if (e.key == canonical) {
            e.fn = fn.clone();
            return;
        }
    }
    m_entries.push_back({canonical, selector, fn.clone()});
}

StretchOperator StretchOperator::uniform(const Stretch::StretchFunction& fn, const QString& scalarKey, bool protectHighlights) {
    StretchOperator op;
    op.setFunction("R", fn);
    op.setFunction("G", fn);
    op.setFunction("B", fn);
    if (!scalarKey.isEmpty()) op.setFunction(scalarKey, fn);
    op.setProtectHighlights(protectHighlights);
    return op;
}

QStringList StretchOperator::keys() const {
    QStringList list;
    for (const Entry& e : m_entries) list << e.key;
    return list;
}

bool StretchOperator::apply(ImageBuffer& image, bool useLookup, int nlut) const {
    const bool outOfRange = image.isOutOfRange();
    bool transformed = false;

    for (const Entry& e : m_entries) {
        const bool clipMatters = outOfRange && !e.selector.isScalar();
        if (!clipMatters && e.fn->isIdentity()) continue;
        transformed = true;
        if (useLookup) image.generalizedStretchLookup(*e.fn, e.selector, nlut);
        else image.generalizedStretch(*e.fn, e.selector);
    }

    if (transformed && m_protectHighlights) image.protectHighlights();

    if (!transformed) {
        Logger::debug("Stretch parameters are identity, nothing to do", "Stretch");
    }
    return transformed;
}

QString StretchOperator::label() const {
    QString name = m_entries.empty() ? QString("Stretch") : m_entries.front().fn->operationName();
    QStringList parts;
    for (const Entry& e : m_entries) {
        parts << e.fn->describe(e.selector.label());
    }
    if (m_protectHighlights) parts << "protect highlights";
    return QString("%1(%2)").arg(name, parts.join(", "));
}
