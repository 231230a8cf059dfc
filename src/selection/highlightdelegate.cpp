#include "selection/highlightdelegate.h"
#include "core/selectionset.h"
#include "appsettings.h"

#include <QPainter>
#include <QStyle>

HighlightDelegate::HighlightDelegate(const SelectionSet* selection, QObject* parent)
    : QStyledItemDelegate(parent)
    , m_selection(selection)
    , m_primaryColor(AppSettings::primarySelectionColor())
    , m_highlightColor(AppSettings::highlightColor())
{
}

void HighlightDelegate::setColors(const QColor& primary, const QColor& highlight)
{
    m_primaryColor = primary;
    m_highlightColor = highlight;
}

QColor HighlightDelegate::backgroundFor(const QModelIndex& index) const
{
    const QVariant data = index.data(FeatureIdRole);
    if (!data.isValid() || !m_selection) return QColor();

    const FeatureId fid = data.toLongLong();
    if (m_selection->isHighlighted(fid)) return m_highlightColor;
    if (m_selection->contains(fid)) return m_primaryColor;
    return QColor();
}

void HighlightDelegate::paint(QPainter* painter, const QStyleOptionViewItem& option,
                              const QModelIndex& index) const
{
    QStyleOptionViewItem opt(option);
    opt.state &= ~QStyle::State_Selected;

    const QColor background = backgroundFor(index);
    if (background.isValid()) {
        painter->save();
        painter->fillRect(opt.rect, background);
        painter->restore();
        // Dark text on the light fills regardless of palette
        opt.palette.setColor(QPalette::Text, Qt::black);
    }

    QStyledItemDelegate::paint(painter, opt, index);
}
