#include "app/messagebar.h"

#include <QHBoxLayout>
#include <QLabel>
#include <QTimer>
#include <QToolButton>
#include <QDebug>

MessageBar::MessageBar(QWidget *parent)
    : QFrame(parent)
{
    setFrameShape(QFrame::StyledPanel);
    setAutoFillBackground(true);

    QHBoxLayout* layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 4, 4, 4);

    m_label = new QLabel(this);
    m_label->setTextFormat(Qt::RichText);
    m_label->setWordWrap(true);
    layout->addWidget(m_label, 1);

    m_closeButton = new QToolButton(this);
    m_closeButton->setText("x");
    m_closeButton->setAutoRaise(true);
    m_closeButton->setToolTip("Dismiss");
    layout->addWidget(m_closeButton);
    connect(m_closeButton, &QToolButton::clicked, this, &MessageBar::clearMessage);

    m_timer = new QTimer(this);
    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &MessageBar::clearMessage);

    hide();
}

QString MessageBar::levelName(Level level)
{
    switch (level) {
        case Info:     return "Info";
        case Success:  return "Success";
        case Warning:  return "Warning";
        case Critical: return "Critical";
    }
    return QString();
}

void MessageBar::pushMessage(const QString& title, const QString& text, Level level, int durationSecs)
{
    m_title = title;
    m_text = text;
    m_level = level;

    if (level == Warning || level == Critical) {
        qWarning().noquote() << QString("[%1] %2: %3").arg(levelName(level), title, text);
    } else {
        qDebug().noquote() << QString("[%1] %2: %3").arg(levelName(level), title, text);
    }

    QString background;
    switch (level) {
        case Info:     background = "#e3f2fd"; break;
        case Success:  background = "#e8f5e9"; break;
        case Warning:  background = "#fff8e1"; break;
        case Critical: background = "#ffebee"; break;
    }
    setStyleSheet(QString("MessageBar { background-color: %1; }").arg(background));
    m_label->setText(QString("<b>%1</b>  %2").arg(title.toHtmlEscaped(), text.toHtmlEscaped()));
    show();

    // Errors stay until dismissed
    if (durationSecs < 0) durationSecs = (level == Critical) ? 0 : 5;
    if (durationSecs > 0) {
        m_timer->start(durationSecs * 1000);
    } else {
        m_timer->stop();
    }

    emit messagePushed(level, title, text);
}

void MessageBar::pushInfo(const QString& title, const QString& text)
{
    pushMessage(title, text, Info);
}

void MessageBar::pushSuccess(const QString& title, const QString& text)
{
    pushMessage(title, text, Success);
}

void MessageBar::pushWarning(const QString& title, const QString& text)
{
    pushMessage(title, text, Warning);
}

void MessageBar::pushCritical(const QString& title, const QString& text)
{
    pushMessage(title, text, Critical);
}

void MessageBar::clearMessage()
{
    m_timer->stop();
    m_label->clear();
    hide();
}
