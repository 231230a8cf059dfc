#include <QApplication>
#include <QGuiApplication>
#include <QMessageBox>
#include <QDir>
#include <QFileInfo>
#include <QDebug>
#include "app/mainwindow.h"
#include "gdal/gdalreader.h"
#include "gdal/geosbridge.h"
#include "appsettings.h"

int main(int argc, char *argv[])
{
    // Ensure GDAL/PROJ data paths are available when bundled next to the executable
    {
        const QByteArray gdalEnv = qgetenv("GDAL_DATA");
        const QByteArray projEnv = qgetenv("PROJ_LIB");
        const QString appDir = QFileInfo(QString::fromLocal8Bit(argv[0])).absolutePath();
        const QStringList gdalCandidates = {
            appDir + "/gdal-data",
            appDir + "/gdal/share/gdal"
        };
        const QStringList projCandidates = {
            appDir + "/proj-data",
            appDir + "/gdal/share/proj"
        };
        if (gdalEnv.isEmpty()) {
            for (const QString& p : gdalCandidates) { if (QDir(p).exists()) { qputenv("GDAL_DATA", p.toUtf8()); break; } }
        }
        if (projEnv.isEmpty()) {
            for (const QString& p : projCandidates) { if (QDir(p).exists()) { qputenv("PROJ_LIB", p.toUtf8()); break; } }
        }
    }

    QApplication app(argc, argv);
    app.setApplicationName("SubSelect");
    app.setOrganizationName("SubSelect");

    MainWindow::applyTheme(AppSettings::darkMode());

    GdalReader::initialize();
    GeosBridge::initialize();

    int result = 0;
    try {
        MainWindow window;
        window.show();

        const QStringList args = app.arguments();
        for (int i = 1; i < args.size(); ++i) {
            if (!window.loadVectorFile(args.at(i))) {
                qWarning() << "Could not open" << args.at(i);
            }
        }

        result = app.exec();
    } catch (const std::exception& e) {
        QMessageBox::critical(nullptr, "Fatal Error",
            QString("Application crashed: %1").arg(e.what()));
        result = 1;
    }

    GeosBridge::cleanup();
    GdalReader::cleanup();
    return result;
}
