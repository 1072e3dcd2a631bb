#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QEventLoop>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTextStream>

#include <media_compat_platform/mcp_compat_pipeline.h>
#include <media_compat_platform/mcp_engine_cache.h>
#include <media_compat_platform/mcp_probe.h>

#include "core/config/session_config.h"
#include "core/persistence/preferences_store.h"
#include "core/persistence/progress_store.h"
#include "core/session/folder_session.h"
#include "core/storage/local_storage_provider.h"
#include "core/storage/permission_gate.h"

Q_LOGGING_CATEGORY(folderplayMain, "folderplay.main")

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

QString formatSeconds(double seconds)
{
    const int total = int(seconds);
    return QString("%1:%2").arg(total / 60).arg(total % 60, 2, 10, QLatin1Char('0'));
}

mcp::PipelineConfig pipelineConfigFor(const SessionConfig& config)
{
    mcp::PipelineConfig pipelineConfig;
    pipelineConfig.engine_enabled = config.transcodingEnabled;
    pipelineConfig.work_directory = config.workDirectory.toStdString();
    return pipelineConfig;
}

int runScan(const SessionConfig& config, PreferencesStore& preferences, const QString& folderArg)
{
    QString folder = folderArg;
    if (folder.isEmpty()) {
        folder = preferences.rememberedFolder();
        if (folder.isEmpty()) {
            err() << "No folder given and none remembered\n";
            return 2;
        }
        out() << "Using remembered folder " << folder << "\n";
    }

    LocalStorageProvider storage;
    LocalPermissionGate permissions;
    FolderSession session(config, storage, permissions);
    session.setPreferencesStore(&preferences);

    QObject::connect(&session, &FolderSession::issueRaised, [](SessionIssue issue, const QString& detail) {
        err() << "warning: " << sessionIssueToString(issue) << ": " << detail << "\n";
    });

    QEventLoop loop;
    QObject::connect(&session, &FolderSession::catalogReady, &loop, &QEventLoop::quit);
    if (!session.open(LocalStorageProvider::refForPath(folder))) {
        return 1;
    }
    loop.exec();

    const Catalog& catalog = session.playback().catalog();
    for (const MediaItem& item : catalog) {
        out() << (item.kind() == MediaItem::Video ? "[video] " : "[audio] ") << item.relativePath() << "\n";
        for (const SubtitleRef& subtitle : item.subtitles()) {
            out() << "        + " << subtitle.relativePath << "\n";
        }
    }
    out() << catalog.size() << " item(s)";
    if (session.lastScan().degraded) {
        out() << ", scan degraded (" << session.lastScan().failedDirectories.size() << " unreadable)";
    }
    out() << "\n";

    if (session.resume().isPending()) {
        const ResumeOffer& offer = session.resume().currentOffer();
        out() << "Resume available: " << offer.lastFile << " at " << formatSeconds(offer.position) << "\n";
        session.resume().resolve(ResumeChoice::Dismiss);
    }

    session.close();
    return 0;
}

int runState(const SessionConfig& config, const QString& folder)
{
    LocalStorageProvider storage;
    ProgressStore store(storage, LocalStorageProvider::refForPath(folder), config.stateFileName);
    ProgressReadResult result = store.read();

    switch (result.outcome) {
    case ProgressReadOutcome::Found:
        out() << result.record->toJson();
        return 0;
    case ProgressReadOutcome::Absent:
        out() << "No saved progress\n";
        return 0;
    case ProgressReadOutcome::Invalid:
        out() << "Saved progress is unreadable and will be ignored\n";
        return 0;
    case ProgressReadOutcome::PermissionDenied:
    case ProgressReadOutcome::IoError:
        err() << "Cannot read progress: " << result.message << "\n";
        return 1;
    }
    return 1;
}

int runProbe(const SessionConfig& config, const QString& file)
{
    auto report = mcp::ProbeFile(QFileInfo(file).absoluteFilePath().toStdString());
    if (report.is_error()) {
        err() << "Probe failed: " << QString::fromStdString(report.error().message) << "\n";
        return 1;
    }

    const mcp::ProbeReport& probe = report.value();
    out() << "container: " << QString::fromStdString(probe.container)
          << ", duration: " << formatSeconds(probe.duration_us / 1e6) << "\n";
    for (const mcp::StreamDescriptor& stream : probe.streams) {
        out() << "  #" << stream.index << " " << mcp::stream_kind_to_string(stream.kind)
              << " " << QString::fromStdString(stream.codec_name);
        if (!stream.profile_name.empty()) {
            out() << " (" << QString::fromStdString(stream.profile_name) << ")";
        }
        if (stream.kind == mcp::StreamKind::Video) {
            out() << " " << stream.width << "x" << stream.height;
            if (stream.attached_picture) out() << " [cover art]";
        } else if (stream.kind == mcp::StreamKind::Audio) {
            out() << " " << stream.channels << "ch " << stream.sample_rate << "Hz";
        }
        out() << "\n";
    }

    const mcp::TranscodePlan plan = mcp::BuildTranscodePlan(probe, pipelineConfigFor(config).policy);
    out() << "plan: video " << (plan.video_stream >= 0 ? mcp::stream_action_to_string(plan.video_action) : "none")
          << ", audio " << (plan.audio_stream >= 0 ? mcp::stream_action_to_string(plan.audio_action) : "none")
          << (plan.needs_transcode() ? " -> transcode" : " -> plays natively") << "\n";
    return 0;
}

int runPrepare(const SessionConfig& config, const QString& file, const QString& keepPath)
{
    const QFileInfo info(file);
    if (!info.exists()) {
        err() << "No such file: " << file << "\n";
        return 1;
    }

    mcp::CompatibilityPipeline pipeline(pipelineConfigFor(config), mcp::EngineCache::Process());

    mcp::MediaSource source;
    source.path = info.absoluteFilePath().toStdString();
    source.name = info.fileName().toStdString();

    int lastShown = -1;
    mcp::PlayableMedia media = pipeline.EnsurePlayable(source, [&lastShown](int percent) {
        if (percent / 10 != lastShown / 10 || percent == 100) {
            lastShown = percent;
            err() << "transcoding " << percent << "%\n";
            err().flush();
        }
    });

    out() << "outcome: " << mcp::pipeline_outcome_to_string(media.outcome) << "\n";
    if (!media.detail.empty()) {
        out() << "detail: " << QString::fromStdString(media.detail) << "\n";
    }
    out() << "playable: " << QString::fromStdString(media.path) << "\n";

    if (media.was_transcoded && !keepPath.isEmpty()) {
        // The artifact deletes its file on exit; keep a copy where asked
        QFile::remove(keepPath);
        if (!QFile::copy(QString::fromStdString(media.path), keepPath)) {
            err() << "Cannot copy result to " << keepPath << "\n";
            return 1;
        }
        out() << "kept: " << keepPath << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("folderplay");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("folderplay");

    QCommandLineParser parser;
    parser.setApplicationDescription("Folder media sessions: catalog, progress and playback preparation");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "scan | state | probe | prepare | forget");
    parser.addPositionalArgument("path", "Folder (scan, state) or file (probe, prepare)", "[path]");

    QCommandLineOption verboseOption({"v", "verbose"}, "Enable debug logging.");
    QCommandLineOption noTranscodeOption("no-transcode", "Never re-encode; always play the original file.");
    QCommandLineOption workDirOption("work-dir", "Directory for transcoding scratch files.", "dir");
    QCommandLineOption prefsOption("preferences", "Preferences database path.", "file");
    QCommandLineOption keepOption("keep", "prepare: copy the transcoded file to <file>.", "file");
    parser.addOptions({ verboseOption, noTranscodeOption, workDirOption, prefsOption, keepOption });

    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet(verboseOption) ? "folderplay.*=true"
                                                                 : "folderplay.*.debug=false");

    SessionConfig config = SessionConfig::fromEnvironment();
    if (parser.isSet(noTranscodeOption)) {
        config.transcodingEnabled = false;
    }
    if (parser.isSet(workDirOption)) {
        config.workDirectory = parser.value(workDirOption);
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(2);
    }
    const QString command = args.at(0);
    const QString path = args.size() > 1 ? args.at(1) : QString();

    PreferencesStore preferences(parser.value(prefsOption));

    qCDebug(folderplayMain, "command=%s path=%s", qPrintable(command), qPrintable(path));

    if (command == "scan") {
        return runScan(config, preferences, path);
    }
    if (command == "forget") {
        return preferences.clearRememberedFolder() ? 0 : 1;
    }
    if (path.isEmpty()) {
        err() << command << " needs a path\n";
        return 2;
    }
    if (command == "state") {
        return runState(config, path);
    }
    if (command == "probe") {
        return runProbe(config, path);
    }
    if (command == "prepare") {
        return runPrepare(config, path, parser.value(keepOption));
    }

    err() << "Unknown command: " << command << "\n";
    return 2;
}
