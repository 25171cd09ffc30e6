#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QTextStream>
#include <QTimer>
#include <QUrl>

#include "models/uploadqueue.h"
#include "services/errorhandler.h"
#include "services/idlesleepguard.h"
#include "services/librarystore.h"
#include "services/networkhttptransport.h"
#include "services/networkmonitor.h"
#include "services/streamapiclient.h"
#include "services/uploadstore.h"
#include "utils/logging.h"
#include "version.h"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

void printLibraries(const LibraryStore &libraries)
{
    out() << "Libraries:\n";
    if (libraries.count() == 0) {
        out() << "  (none)\n";
    }
    const QString selected = libraries.lastSelected();
    for (const LibraryConfig &library : libraries.libraries()) {
        out() << (library.id == selected ? "* " : "  ")
              << library.id << "  " << library.name
              << "  library " << library.libraryId
              << (libraries.hasApiKey(library.id) ? "" : "  (no API key)") << "\n";
    }
}

void printQueue(const QList<UploadItem> &items)
{
    out() << "Uploads:\n";
    if (items.isEmpty()) {
        out() << "  (none)\n";
    }
    for (const UploadItem &item : items) {
        out() << "  " << QString("%1").arg(uploadStatusLabel(item.status), -9)
              << QString("%1%").arg(qRound(item.progress * 100), 4)
              << "  " << item.displayTitle();
        if (!item.errorMessage.isEmpty()) {
            out() << "  - " << item.errorMessage;
        }
        out() << "\n";
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("streamlift");
    app.setApplicationVersion(STREAMLIFT_VERSION);
    app.setOrganizationName("streamlift");
    app.setOrganizationDomain("example.com");

    qRegisterMetaType<ErrorCategory>();
    qRegisterMetaType<HttpResponse>();

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Resumable uploads to a video streaming library");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("files", "Video files to upload.", "[files...]");

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    QCommandLineOption libraryOption(
        "library", "Target library configuration id (defaults to the last used).", "configId");
    QCommandLineOption addLibraryOption(
        "add-library", "Store a new library configuration and exit.");
    QCommandLineOption nameOption("name", "Display name for --add-library.", "name");
    QCommandLineOption libraryIdOption("library-id", "Remote library id for --add-library.", "id");
    QCommandLineOption apiKeyOption("api-key", "Stream API key for the library.", "key");
    QCommandLineOption listOption("list", "Print libraries and the upload queue, then exit.");
    QCommandLineOption syncOption("sync", "Reconcile the upload history with the remote library.");
    QCommandLineOption noAutoResumeOption(
        "no-auto-resume", "Do not resume interrupted uploads at start-up.");

    parser.addOptions({verboseOption, libraryOption, addLibraryOption, nameOption,
                       libraryIdOption, apiKeyOption, listOption, syncOption,
                       noAutoResumeOption});
    parser.process(app);

    streamlift::verboseLogging = parser.isSet(verboseOption);
    if (streamlift::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    LibraryStore libraries;

    if (parser.isSet(addLibraryOption)) {
        const QString configId = libraries.addLibrary(parser.value(nameOption),
                                                      parser.value(libraryIdOption),
                                                      parser.value(apiKeyOption));
        if (configId.isEmpty()) {
            qCritical() << "--add-library needs --name and --library-id";
            return 1;
        }
        libraries.setLastSelected(configId);
        out() << configId << "\n";
        return 0;
    }

    UploadStore store;

    if (parser.isSet(listOption)) {
        printLibraries(libraries);
        printQueue(store.load());
        return 0;
    }

    ErrorHandler errors;
    NetworkHttpTransport transport;
    StreamApiClient api(&transport);
    api.setBaseUrl(libraries.apiEndpoint());

    IdleSleepGuard sleepGuard;
    sleepGuard.setEnabled(libraries.keepAwake());
    QObject::connect(&libraries, &LibraryStore::keepAwakeChanged,
                     &sleepGuard, &IdleSleepGuard::setEnabled);

    UploadQueue queue;
    queue.setHttpTransport(&transport);
    queue.setVideoService(&api);
    queue.setLibraryStore(&libraries);
    queue.setUploadStore(&store);
    queue.setSleepGuard(&sleepGuard);
    queue.setTusEndpoint(QUrl(libraries.tusEndpoint()));
    queue.setAutoResume(libraries.autoResume() && !parser.isSet(noAutoResumeOption));

    NetworkMonitor monitor;
    QObject::connect(&monitor, &NetworkMonitor::connectivityChanged,
                     &queue, &UploadQueue::onConnectivityChanged);
    QObject::connect(&monitor, &NetworkMonitor::connectivityChanged,
                     &errors, &ErrorHandler::handleConnectivityChanged);
    if (!monitor.isConnected()) {
        queue.onConnectivityChanged(false);
    }

    QObject::connect(&errors, &ErrorHandler::statusMessage, [](const QString &message, int) {
        qInfo().noquote() << message;
    });
    QObject::connect(&queue, &UploadQueue::statusMessage, [](const QString &message, int) {
        qInfo().noquote() << message;
    });

    QObject::connect(&queue, &UploadQueue::uploadFailed,
                     &errors, &ErrorHandler::handleUploadFailed);
    QObject::connect(&queue, &UploadQueue::uploadStarted, [&queue](const QString &id) {
        qInfo().noquote() << "Uploading" << queue.item(id).fileName();
    });
    QObject::connect(&queue, &UploadQueue::itemChanged, [&queue](const QString &id) {
        const UploadItem item = queue.item(id);
        if (item.status == UploadStatus::Uploading) {
            LOG_VERBOSE().noquote() << item.fileName()
                                    << QString("%1%").arg(item.progress * 100, 0, 'f', 1)
                                    << QString("%1 MB/s").arg(item.speedMBps, 0, 'f', 2)
                                    << "ETA" << item.etaFormatted();
        }
    });
    QObject::connect(&queue, &UploadQueue::videoReady, [](const QString &, const QString &title) {
        qInfo().noquote() << "Ready:" << title;
    });

    QString configId = parser.value(libraryOption);
    if (configId.isEmpty()) {
        configId = libraries.lastSelected();
    }

    const QStringList files = parser.positionalArguments();
    const bool wantSync = parser.isSet(syncOption);
    if ((!files.isEmpty() || wantSync) && !libraries.contains(configId)) {
        qCritical() << "No library selected; use --library <configId> or --add-library";
        return 1;
    }
    // Keychain-less platforms forget keys between runs
    if (parser.isSet(apiKeyOption) && !libraries.setApiKey(configId, parser.value(apiKeyOption))) {
        qWarning() << "Could not store the API key for library" << configId;
    }

    bool syncRunning = false;
    auto maybeQuit = [&]() {
        if (syncRunning || queue.hasActiveOrPending()) {
            return;
        }
        printQueue(queue.items());
        if (errors.failureCount() > 0) {
            qWarning().noquote() << errors.failureSummary();
        }
        app.exit(errors.failureCount() > 0 ? 1 : 0);
    };
    auto scheduleQuitCheck = [&]() {
        QTimer::singleShot(0, &app, maybeQuit);
    };

    QObject::connect(&queue, &UploadQueue::allUploadsFinished, &app, scheduleQuitCheck);
    QObject::connect(&queue, &UploadQueue::itemRemoved, &app, scheduleQuitCheck);
    QObject::connect(&queue, &UploadQueue::librarySynced,
                     [&](const QString &, bool ok) {
                         syncRunning = false;
                         if (!ok) {
                             errors.handleOperationFailed("syncLibrary",
                                                          QObject::tr("Could not read the remote library"));
                         }
                         scheduleQuitCheck();
                     });
    QObject::connect(&queue, &UploadQueue::uploadPaused,
                     [&](const QString &, const QString &reason) {
                         // Without a reachability backend nothing would ever resume the queue
                         if (!monitor.hasBackend() && queue.uploadingCount() == 0) {
                             qWarning().noquote() << "Upload paused:" << reason
                                                  << "- run again to resume";
                             app.exit(2);
                         }
                     });

    queue.load();

    if (!files.isEmpty()) {
        QStringList paths;
        for (const QString &file : files) {
            paths.append(QFileInfo(file).absoluteFilePath());
        }
        libraries.setLastSelected(configId);
        queue.enqueue(paths, configId);
    }

    if (wantSync) {
        syncRunning = true;
        queue.syncLibrary(configId);
    }

    scheduleQuitCheck();
    return app.exec();
}
