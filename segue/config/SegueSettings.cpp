#include "segue/config/SegueSettings.h"

#include <QDebug>
#include <QSettings>

#include <algorithm>

namespace segue::config {
namespace {

static int clampInt(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }
static double clampD(double v, double lo, double hi) { return std::max(lo, std::min(hi, v)); }

static int readInt(QSettings& s, const QString& k, int def) { return s.value(k, def).toInt(); }
static double readD(QSettings& s, const QString& k, double def) { return s.value(k, def).toDouble(); }
static QString readS(QSettings& s, const QString& k, const QString& def) { return s.value(k, def).toString(); }

static double readWeight(QSettings& s, const QString& k, double def) { return clampD(readD(s, k, def), 0.0, 1.0); }

} // namespace

SegueSettings defaultSegueSettings() {
    return SegueSettings{};
}

SegueSettings loadSegueSettings(QSettings& settings, const QString& prefix) {
    SegueSettings s = defaultSegueSettings();
    const QString base = prefix;

    s.version = readInt(settings, base + "/version", s.version);

    bool ok = false;
    const QString mode = readS(settings, base + "/mixMode", harmonic::mixModeToString(s.mixMode));
    s.mixMode = harmonic::mixModeFromString(mode, &ok);
    if (!ok) qWarning().noquote() << "SegueSettings: unknown mix mode" << mode << "- using intelligent";

    s.tolerances.bpm = clampD(readD(settings, base + "/bpmTolerance", s.tolerances.bpm), 0.5, 40.0);
    s.tolerances.energy = clampD(readD(settings, base + "/energyTolerance", s.tolerances.energy), 0.5, 9.0);

    auto& ow = s.orchestratorWeights;
    ow.harmonic = readWeight(settings, base + "/orchestrator/harmonic", ow.harmonic);
    ow.stylistic = readWeight(settings, base + "/orchestrator/stylistic", ow.stylistic);
    ow.structural = readWeight(settings, base + "/orchestrator/structural", ow.structural);
    ow.transition = readWeight(settings, base + "/orchestrator/transition", ow.transition);
    ow.temporal = readWeight(settings, base + "/orchestrator/temporal", ow.temporal);

    s.policyId = readS(settings, base + "/policyId", s.policyId).trimmed();
    s.policyBlend = readWeight(settings, base + "/policyBlend", s.policyBlend);

    auto& sw = s.sequencerWeights;
    sw.harmonic = readWeight(settings, base + "/sequencer/harmonic", sw.harmonic);
    sw.stylistic = readWeight(settings, base + "/sequencer/stylistic", sw.stylistic);
    sw.context = readWeight(settings, base + "/sequencer/context", sw.context);
    sw.energy = readWeight(settings, base + "/sequencer/energy", sw.energy);
    sw.variety = readWeight(settings, base + "/sequencer/variety", sw.variety);

    s.minCompatibility = readWeight(settings, base + "/minCompatibility", s.minCompatibility);
    s.defaultLength = clampInt(readInt(settings, base + "/defaultLength", s.defaultLength), 1, 500);

    s.policyConfigDir = readS(settings, base + "/policyConfigDir", s.policyConfigDir);
    return s;
}

void saveSegueSettings(QSettings& settings, const QString& prefix, const SegueSettings& s) {
    const QString base = prefix;

    settings.setValue(base + "/version", s.version);
    settings.setValue(base + "/mixMode", harmonic::mixModeToString(s.mixMode));
    settings.setValue(base + "/bpmTolerance", s.tolerances.bpm);
    settings.setValue(base + "/energyTolerance", s.tolerances.energy);

    const auto& ow = s.orchestratorWeights;
    settings.setValue(base + "/orchestrator/harmonic", ow.harmonic);
    settings.setValue(base + "/orchestrator/stylistic", ow.stylistic);
    settings.setValue(base + "/orchestrator/structural", ow.structural);
    settings.setValue(base + "/orchestrator/transition", ow.transition);
    settings.setValue(base + "/orchestrator/temporal", ow.temporal);

    settings.setValue(base + "/policyId", s.policyId);
    settings.setValue(base + "/policyBlend", s.policyBlend);

    const auto& sw = s.sequencerWeights;
    settings.setValue(base + "/sequencer/harmonic", sw.harmonic);
    settings.setValue(base + "/sequencer/stylistic", sw.stylistic);
    settings.setValue(base + "/sequencer/context", sw.context);
    settings.setValue(base + "/sequencer/energy", sw.energy);
    settings.setValue(base + "/sequencer/variety", sw.variety);

    settings.setValue(base + "/minCompatibility", s.minCompatibility);
    settings.setValue(base + "/defaultLength", s.defaultLength);
    settings.setValue(base + "/policyConfigDir", s.policyConfigDir);
}

} // namespace segue::config
