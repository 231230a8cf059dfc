#include "appsettings.h"
#include <QSettings>
#include <QString>
#include <QStringList>

namespace {
QString recentKey() { return QStringLiteral("files/recent"); }
}

bool AppSettings::darkMode()
{
    QSettings s;
    return s.value("ui/darkMode", false).toBool();
}

void AppSettings::setDarkMode(bool enabled)
{
    QSettings s;
    s.setValue("ui/darkMode", enabled);
}

QColor AppSettings::canvasBackgroundColor()
{
    QSettings s;
    QColor c(s.value("display/backgroundColor", "#ffffff").toString());
    return c.isValid() ? c : QColor(Qt::white);
}

QColor AppSettings::primarySelectionColor()
{
    QSettings s;
    QColor c(s.value("selection/primaryColor", "#00ffff").toString());
    return c.isValid() ? c : QColor(0, 255, 255);
}

QColor AppSettings::highlightColor()
{
    QSettings s;
    QColor c(s.value("selection/highlightColor", "#ffff00").toString());
    return c.isValid() ? c : QColor(255, 255, 0);
}

QColor AppSettings::canvasSelectionColor()
{
    QSettings s;
    QColor c(s.value("display/selectionColor", "#0096ff").toString());
    return c.isValid() ? c : QColor(0, 150, 255);
}

int AppSettings::tableRowHeight()
{
    QSettings s;
    return qBound(12, s.value("selection/rowHeight", 22).toInt(), 80);
}

int AppSettings::previewFeatureLimit()
{
    QSettings s;
    return qMax(1, s.value("calculator/previewLimit", 100).toInt());
}

int AppSettings::sampleValueCount()
{
    QSettings s;
    return qMax(1, s.value("calculator/sampleCount", 10).toInt());
}

int AppSettings::uniqueValueLimit()
{
    QSettings s;
    return qMax(1, s.value("calculator/uniqueLimit", 100).toInt());
}

bool AppSettings::confirmDelete()
{
    QSettings s;
    return s.value("selection/confirmDelete", true).toBool();
}

void AppSettings::setConfirmDelete(bool on)
{
    QSettings s;
    s.setValue("selection/confirmDelete", on);
}

int AppSettings::selectionDockArea()
{
    QSettings s;
    return s.value("selection/dockArea", static_cast<int>(Qt::BottomDockWidgetArea)).toInt();
}

QString AppSettings::lastVectorFile()
{
    QSettings s;
    return s.value("files/lastVector").toString();
}

void AppSettings::setLastVectorFile(const QString& path)
{
    QSettings s;
    s.setValue("files/lastVector", path);
}

QStringList AppSettings::recentFiles()
{
    QSettings s;
    return s.value(recentKey()).toStringList();
}

void AppSettings::addRecentFile(const QString& path, int maxCount)
{
    if (path.trimmed().isEmpty()) return;
    QSettings s;
    QStringList list = s.value(recentKey()).toStringList();
    list.removeAll(path);
    list.prepend(path);
    while (list.size() > maxCount) list.removeLast();
    s.setValue(recentKey(), list);
}

void AppSettings::clearRecentFiles()
{
    QSettings s;
    s.remove(recentKey());
}
