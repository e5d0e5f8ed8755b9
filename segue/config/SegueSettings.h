#pragma once

#include <QString>

#include "segue/engine/CompatibilityOrchestrator.h"
#include "segue/harmonic/HarmonicScorer.h"
#include "segue/sequence/PlaylistSequencer.h"

class QSettings;

namespace segue::config {

// Persisted tuning knobs for the scoring core and the sequencer.
struct SegueSettings {
    int version = 1;

    harmonic::MixMode mixMode = harmonic::MixMode::Intelligent;
    harmonic::HarmonicTolerances tolerances;

    engine::OrchestratorWeights orchestratorWeights;
    QString policyId;          // empty = no policy fold-in
    double policyBlend = 0.2;

    sequence::SequencerWeights sequencerWeights;
    double minCompatibility = 0.3;
    int defaultLength = 10;

    QString policyConfigDir;   // empty = built-in policies only
};

SegueSettings defaultSegueSettings();

// Out-of-range values are clamped; unknown mix modes fall back to Intelligent.
SegueSettings loadSegueSettings(QSettings& settings, const QString& prefix);
void saveSegueSettings(QSettings& settings, const QString& prefix, const SegueSettings& s);

} // namespace segue::config
