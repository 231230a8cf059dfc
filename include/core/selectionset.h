#ifndef SELECTIONSET_H
#define SELECTIONSET_H

#include <QObject>
#include <QString>
#include "core/featuretypes.h"

/**
 * @brief SelectionSet - two-tier feature selection
 *
 * The primary set mirrors the host layer selection. The highlighted set is a
 * user-chosen subset of it that scopes operations. Every mutator keeps
 * highlighted a subset of primary.
 */
class SelectionSet : public QObject {
    Q_OBJECT
public:
    explicit SelectionSet(QObject* parent = nullptr);

    const FeatureIds& primary() const { return m_primary; }
    const FeatureIds& highlighted() const { return m_highlighted; }

    bool hasPrimary() const { return !m_primary.isEmpty(); }
    bool hasHighlights() const { return !m_highlighted.isEmpty(); }
    bool isHighlighted(FeatureId fid) const { return m_highlighted.contains(fid); }
    bool contains(FeatureId fid) const { return m_primary.contains(fid); }

    // Replaces the primary set, keeps only the highlights still inside it
    void setPrimary(const FeatureIds& ids);
    // Ids outside the primary set are dropped
    void setHighlighted(const FeatureIds& ids);

    void toggle(FeatureId fid);
    void clearHighlights();
    void highlightAll();
    void invert();

    // Highlighted becomes the new primary; false when nothing is highlighted
    bool narrowToHighlighted();

    // Features removed from the layer leave both sets
    void removeFeatures(const FeatureIds& ids);

    // Highlighted when non-empty, otherwise the whole primary set
    FeatureIds targets() const;
    QString targetDescription() const;

    // Primary features that are not highlighted
    FeatureIds unhighlighted() const { return m_primary - m_highlighted; }

signals:
    void primaryChanged(const FeatureIds& primary);
    void highlightChanged(const FeatureIds& highlighted);

private:
    void assign(const FeatureIds& primary, const FeatureIds& highlighted);

    FeatureIds m_primary;
    FeatureIds m_highlighted;
};

#endif // SELECTIONSET_H
