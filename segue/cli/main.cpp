#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <QTextStream>

#include "segue/config/SegueSettings.h"
#include "segue/harmonic/CamelotKey.h"
#include "segue/model/Track.h"
#include "segue/model/TrackMetadata.h"
#include "segue/policy/PolicyManager.h"
#include "segue/sequence/PlaylistSequencer.h"

using namespace segue;

static bool readFile(const QString& path, QByteArray& out) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning().noquote() << "segue_cli: cannot open" << path << "-" << f.errorString();
        return false;
    }
    out = f.readAll();
    return true;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Segue");
    QCoreApplication::setApplicationName("segue_cli");

    QCommandLineParser parser;
    parser.setApplicationDescription("Builds a harmonically and contextually sequenced playlist.");
    parser.addHelpOption();

    const QCommandLineOption tracksOpt("tracks", "JSON array of tracks.", "file");
    const QCommandLineOption metadataOpt("metadata", "JSON object: track id -> metadata.", "file");
    const QCommandLineOption lengthOpt("length", "Target playlist length.", "n");
    const QCommandLineOption startOpt("start", "Start track id.", "id");
    const QCommandLineOption activityOpt("activity", "Activity context (party, workout, chill...).", "name");
    const QCommandLineOption timeOpt("time-of-day", "Time context (morning, evening...).", "name");
    const QCommandLineOption energyOpt("energy", "Energy context (warm_up, peak_time, cool_down).", "name");
    const QCommandLineOption policyOpt("policy", "Policy id to score the result with.", "id");
    const QCommandLineOption explainOpt("explain", "Include the generation explanation.");
    parser.addOptions({tracksOpt, metadataOpt, lengthOpt, startOpt, activityOpt, timeOpt, energyOpt, policyOpt, explainOpt});
    parser.process(app);

    QSettings settings;
    const config::SegueSettings cfg = config::loadSegueSettings(settings, "segue");

    if (!parser.isSet(tracksOpt)) {
        qWarning("segue_cli: --tracks is required");
        parser.showHelp(2);
    }

    QByteArray bytes;
    if (!readFile(parser.value(tracksOpt), bytes)) return 1;
    QString err;
    const model::TrackList tracks = model::tracksFromJson(bytes, &err);
    if (!err.isEmpty()) {
        qWarning().noquote() << "segue_cli:" << err;
        return 1;
    }

    model::MetadataMap metadata;
    if (parser.isSet(metadataOpt)) {
        if (!readFile(parser.value(metadataOpt), bytes)) return 1;
        metadata = model::metadataFromJson(bytes, &err);
        if (!err.isEmpty()) {
            qWarning().noquote() << "segue_cli:" << err;
            return 1;
        }
    }

    sequence::GenerationRequest req;
    req.tracks = tracks;
    req.metadata = metadata;
    req.targetLength = cfg.defaultLength;
    req.minCompatibility = cfg.minCompatibility;
    if (parser.isSet(lengthOpt)) {
        bool ok = false;
        req.targetLength = parser.value(lengthOpt).toInt(&ok);
        if (!ok || req.targetLength <= 0) {
            qWarning().noquote() << "segue_cli: invalid --length" << parser.value(lengthOpt);
            return 2;
        }
    }
    req.startTrackId = parser.value(startOpt);
    req.activity = parser.value(activityOpt);
    req.timeOfDay = parser.value(timeOpt);
    req.energyPreference = parser.value(energyOpt);

    sequence::PlaylistSequencer sequencer(harmonic::HarmonicScorer(cfg.mixMode, cfg.tolerances));
    sequencer.setWeights(cfg.sequencerWeights);
    const sequence::GenerationResult result = sequencer.generate(req);

    QJsonObject out = result.toJson();
    QJsonArray playlist;
    for (const auto& t : result.playlist) {
        QJsonObject entry = t.toJson();
        const QString keyName = harmonic::CamelotKey::parse(t.key).musicalName();
        if (!keyName.isEmpty()) entry.insert("key_name", keyName);
        playlist.push_back(entry);
    }
    out.insert("playlist", playlist);
    if (parser.isSet(explainOpt)) out.insert("explanation", sequencer.explain(result));

    const QString policyId = parser.isSet(policyOpt) ? parser.value(policyOpt) : cfg.policyId;
    if (!policyId.isEmpty()) {
        policy::PolicyManager policies(cfg.policyConfigDir);
        model::ContextData ctx;
        if (!req.timeOfDay.isEmpty()) ctx.insert("time_of_day", req.timeOfDay);
        if (!req.activity.isEmpty()) ctx.insert("activity", req.activity);

        QVector<policy::PolicyApplicationResult> scores;
        if (!policies.applyPolicy(policyId, result.playlist, metadata, &ctx, scores, &err)) {
            qWarning().noquote() << "segue_cli:" << err;
            return 1;
        }
        QJsonArray arr;
        for (const auto& s : scores) arr.push_back(s.toJson());
        out.insert("policy_scores", arr);
    }

    QTextStream(stdout) << QJsonDocument(out).toJson(QJsonDocument::Indented);
    return result.isEmpty() && !tracks.isEmpty() ? 1 : 0;
}
