#ifndef MESSAGEBAR_H
#define MESSAGEBAR_H

#include <QFrame>
#include <QString>

class QLabel;
class QTimer;
class QToolButton;

/**
 * @brief MessageBar - transient feedback strip shown above the map
 *
 * Every message is also logged, warnings and errors through qWarning().
 */
class MessageBar : public QFrame {
    Q_OBJECT

public:
    enum Level {
        Info,
        Success,
        Warning,
        Critical
    };

    explicit MessageBar(QWidget *parent = nullptr);

    void pushMessage(const QString& title, const QString& text, Level level, int durationSecs = -1);
    void pushInfo(const QString& title, const QString& text);
    void pushSuccess(const QString& title, const QString& text);
    void pushWarning(const QString& title, const QString& text);
    void pushCritical(const QString& title, const QString& text);

    void clearMessage();

    QString currentTitle() const { return m_title; }
    QString currentText() const { return m_text; }
    Level currentLevel() const { return m_level; }

    static QString levelName(Level level);

signals:
    void messagePushed(int level, const QString& title, const QString& text);

private:
    QLabel* m_label{nullptr};
    QToolButton* m_closeButton{nullptr};
    QTimer* m_timer{nullptr};
    QString m_title;
    QString m_text;
    Level m_level{Info};
};

#endif // MESSAGEBAR_H
