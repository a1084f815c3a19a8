#include <QApplication>
#include <QDir>
#include <QStandardPaths>
#include "MainWindow.h"
#include "AppConstants.h"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    MainWindow window;
    QDir configDir(QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation));
    window.loadSettings(configDir.filePath(AppConstants::ConfigFileName));
    window.show();

    if (argc > 1) {
        QMetaObject::invokeMethod(&window, "onMediaSelected", Qt::QueuedConnection,
                                  Q_ARG(QString, QString::fromLocal8Bit(argv[1])));
    }

    return app.exec();
}
