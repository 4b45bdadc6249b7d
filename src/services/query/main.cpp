#include "query_service.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("recollect-query"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QString error;
    auto settings = rc::SettingsManager::load(&error);
    if (!settings) {
        LOG_ERROR(rcCore, "Invalid settings: %s", qUtf8Printable(error));
        return 1;
    }

    auto search = rc::SearchService::create(*settings, &error);
    if (!search) {
        LOG_ERROR(rcCore, "Cannot start query service: %s", qUtf8Printable(error));
        return 1;
    }

    rc::QueryService service(std::move(search), settings->queryThreads, settings->queueLimit);
    return service.run();
}
