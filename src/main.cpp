#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTextStream>

#include "app/commands.hpp"
#include "app/logging.hpp"
#include "storage/sqlite_store.hpp"
#include "sync/memory_remote.hpp"
#include "sync/sync_coordinator.hpp"
#include "sync/sync_settings.hpp"

namespace {

QString resolve_database_path() {
    const auto overridePath = qEnvironmentVariable("DOCSYNC_DB_PATH");
    if (!overridePath.isEmpty()) {
        QFileInfo info(overridePath);
        QDir dir(info.absolutePath());
        if (!dir.exists()) {
            dir.mkpath(".");
        }
        return info.absoluteFilePath();
    }

    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir(dataPath);
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    return dataPath + "/docsync.db";
}

int fail(const docsync::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return docsync::app::exit_code_for(error);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("docsync");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("docsync");
    app.setOrganizationDomain("docsync.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Offline administration of a docsync document store"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets DOCSYNC_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (status, list, recovery)."));
    parser.addOption(jsonOption);

    const QCommandLineOption stateOption(
        QStringList{QStringLiteral("state")},
        QStringLiteral("Only list documents in this sync state (e.g. pending_upload)."),
        QStringLiteral("state"));
    parser.addOption(stateOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets DOCSYNC_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("One of: %1.")
                                     .arg(docsync::app::command_names().join(QStringLiteral(", "))));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("DOCSYNC_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("DOCSYNC_DEBUG_SYNC", "1");
    }

    docsync::app::install_file_logging();
    if (docsync::app::sync_debug_requested()) {
        docsync::app::enable_sync_debug_logging();
        qInfo() << "docsync: sync debug enabled, logging to" << docsync::app::default_log_file_path();
    }

    auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(2);
    }
    const auto command = positional.takeFirst();

    docsync::app::CommandOptions options;
    options.json = parser.isSet(jsonOption);
    options.arguments = positional;
    if (parser.isSet(stateOption)) {
        const auto text = parser.value(stateOption).toStdString();
        options.state = docsync::parse_sync_state(text);
        if (!options.state) {
            return fail(docsync::Error::validation("Unknown sync state '" + text + "'"));
        }
    }

    const auto dbPath = resolve_database_path();
    auto opened = docsync::storage::SqliteLocalStore::open(dbPath.toStdString());
    if (opened.is_err()) {
        qCritical() << "docsync: cannot open" << dbPath;
        return fail(opened.unwrap_err());
    }
    auto store = std::move(opened).unwrap();

    // There is no remote client in the CLI: the coordinator is never
    // started, so these placeholders are never called.
    docsync::sync::MemoryRemoteService remote;
    docsync::sync::MemoryBlobStore blobs;
    docsync::sync::StaticAuthProvider auth{std::string{}};
    docsync::sync::SyncCoordinator coordinator(*store, remote, blobs, auth, nullptr,
                                               docsync::sync::SyncSettings::load());

    const auto result = docsync::app::run_command(command, *store, coordinator, options);
    if (result.is_err()) {
        return fail(result.unwrap_err());
    }

    QTextStream(stdout) << result.unwrap();
    return 0;
}
