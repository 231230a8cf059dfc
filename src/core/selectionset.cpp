#include "core/selectionset.h"

SelectionSet::SelectionSet(QObject* parent)
    : QObject(parent)
{
}

void SelectionSet::assign(const FeatureIds& primary, const FeatureIds& highlighted)
{
    const FeatureIds reconciled = highlighted & primary;
    const bool primaryDiffers = primary != m_primary;
    const bool highlightDiffers = reconciled != m_highlighted;

    m_primary = primary;
    m_highlighted = reconciled;

    if (primaryDiffers) emit primaryChanged(m_primary);
    if (highlightDiffers) emit highlightChanged(m_highlighted);
}

void SelectionSet::setPrimary(const FeatureIds& ids)
{
    assign(ids, m_highlighted);
}

void SelectionSet::setHighlighted(const FeatureIds& ids)
{
    assign(m_primary, ids);
}

void SelectionSet::toggle(FeatureId fid)
{
    if (!m_primary.contains(fid)) return;
    FeatureIds next = m_highlighted;
    if (next.contains(fid)) {
        next.remove(fid);
    } else {
        next.insert(fid);
    }
    assign(m_primary, next);
}

void SelectionSet::clearHighlights()
{
    assign(m_primary, FeatureIds());
}

void SelectionSet::highlightAll()
{
    assign(m_primary, m_primary);
}

void SelectionSet::invert()
{
    assign(m_primary, m_primary - m_highlighted);
}

bool SelectionSet::narrowToHighlighted()
{
    if (m_highlighted.isEmpty()) return false;
    assign(m_highlighted, FeatureIds());
    return true;
}

void SelectionSet::removeFeatures(const FeatureIds& ids)
{
    assign(m_primary - ids, m_highlighted - ids);
}

FeatureIds SelectionSet::targets() const
{
    return m_highlighted.isEmpty() ? m_primary : m_highlighted;
}

QString SelectionSet::targetDescription() const
{
    if (!m_highlighted.isEmpty()) {
        return QString("%1 highlighted (yellow)").arg(m_highlighted.size());
    }
    return QString("%1 selected (cyan)").arg(m_primary.size());
}
