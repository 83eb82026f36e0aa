#include <QApplication>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QString>

#include "version.h"

#include "coffeechat/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("CoffeeChat"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("coffeechat.app"));
    QCoreApplication::setApplicationName(QStringLiteral("Coffee Chat Helper"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kCoffeeChatVersion));

    // QT_LOGGING_RULES overrides this, e.g. "coffeechat.*.debug=true".
    QLoggingCategory::setFilterRules(QStringLiteral("coffeechat.*.debug=false"));

    QApplication app(argc, argv);

    coffeechat::ui::MainWindow mainWindow;
    mainWindow.setWindowTitle(QObject::tr("Coffee Chat Helper %1").arg(QString::fromLatin1(kCoffeeChatVersion)));
    mainWindow.resize(1100, 680);
    mainWindow.show();

    return app.exec();
}
