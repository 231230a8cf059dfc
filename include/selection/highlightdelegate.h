#ifndef HIGHLIGHTDELEGATE_H
#define HIGHLIGHTDELEGATE_H

#include <QStyledItemDelegate>
#include <QColor>

class SelectionSet;

// Item data roles used by the selection table
enum SelectionTableRole {
    FieldNameRole = Qt::UserRole,
    FeatureIdRole = Qt::UserRole + 1
};

/**
 * @brief HighlightDelegate - paints selection table rows by highlight state
 *
 * Qt's own selection paint is suppressed. Rows of highlighted features are
 * filled with the highlight colour, all other rows with the primary colour.
 * The feature id is read from the item, so painting follows the feature
 * when the table is sorted.
 */
class HighlightDelegate : public QStyledItemDelegate {
    Q_OBJECT
public:
    explicit HighlightDelegate(const SelectionSet* selection, QObject* parent = nullptr);

    void setColors(const QColor& primary, const QColor& highlight);
    QColor primaryColor() const { return m_primaryColor; }
    QColor highlightColor() const { return m_highlightColor; }

    // Fill colour for a row of the given feature; invalid when the index has no id
    QColor backgroundFor(const QModelIndex& index) const;

    void paint(QPainter* painter, const QStyleOptionViewItem& option,
               const QModelIndex& index) const override;

private:
    const SelectionSet* m_selection;
    QColor m_primaryColor;
    QColor m_highlightColor;
};

#endif // HIGHLIGHTDELEGATE_H
