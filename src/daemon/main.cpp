// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "../core/logging.h"
#include <QGuiApplication>
#include <QCommandLineParser>
#include <KAboutData>
#include <KLocalizedString>
#include <KDBusService>
#include <signal.h>

using namespace PlasmaBaskets;

static Daemon* g_daemon = nullptr;

void signalHandler(int /*signal*/)
{
    if (g_daemon) {
        g_daemon->stop();
    }
    QCoreApplication::quit();
}

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);

    // Baskets come and go; the daemon must outlive its last window
    app.setQuitOnLastWindowClosed(false);

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("plasmabasketsd");

    KAboutData aboutData(QStringLiteral("plasmabasketsd"), i18n("PlasmaBaskets Daemon"), QStringLiteral("1.0.0"),
                         i18n("Floating drag-and-drop shelves for KDE Plasma"), KAboutLicense::GPL_V3,
                         i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setDesktopFileName(QStringLiteral("org.plasmabaskets.daemon"));

    KAboutData::setApplicationData(aboutData);

    // Command line options
    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption replaceOption(QStringList{QStringLiteral("r"), QStringLiteral("replace")},
                                     i18n("Replace existing daemon instance"));
    parser.addOption(replaceOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Ensure single instance
    KDBusService::StartupOptions options = KDBusService::Unique;
    if (parser.isSet(replaceOption)) {
        options |= KDBusService::Replace;
    }

    KDBusService service(options);

    // Set up signal handling for clean shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    Daemon daemon;
    g_daemon = &daemon;

    if (!daemon.init()) {
        qCCritical(PlasmaBaskets::lcDaemon) << "Failed to initialize daemon";
        return 1;
    }

    qCInfo(PlasmaBaskets::lcDaemon) << "Started successfully";
    daemon.start();

    QObject::connect(&service, &KDBusService::activateRequested, &daemon, []() {
        qCDebug(PlasmaBaskets::lcDaemon) << "Already running - activation request ignored";
    });

    int result = app.exec();

    daemon.stop();
    g_daemon = nullptr;

    return result;
}
