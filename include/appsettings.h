#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QString>
#include <QStringList>
#include <QColor>

class AppSettings {
public:
    // Theme
    static bool darkMode();
    static void setDarkMode(bool enabled);
    static QColor canvasBackgroundColor();

    // Selection table colours (rows and map overlays)
    static QColor primarySelectionColor();      // cyan
    static QColor highlightColor();             // yellow
    static QColor canvasSelectionColor();

    // Table
    static int tableRowHeight();

    // Field calculator / filter limits
    static int previewFeatureLimit();           // features offered in the preview navigator
    static int sampleValueCount();
    static int uniqueValueLimit();

    // Behaviour
    static bool confirmDelete();
    static void setConfirmDelete(bool on);
    static int selectionDockArea();             // Qt::DockWidgetArea

    // Files
    static QString lastVectorFile();
    static void setLastVectorFile(const QString& path);
    static QStringList recentFiles();
    static void addRecentFile(const QString& path, int maxCount = 10);
    static void clearRecentFiles();
};

#endif // APPSETTINGS_H
