#pragma once

#include <QString>

#include "segue/model/TrackMetadata.h"

namespace segue::style {

// Stylistic descriptor bundle for one track. Built transiently from enrichment metadata.
// Labels are lower-cased/trimmed; empty means unknown. Percent fields are 0..1, < 0 = unknown.
struct StyleProfile {
    QString subgenre;
    QString mood;
    QString era;
    QString language;
    QString timeOfDay;
    QString activity;
    QString season;

    double danceability = -1.0;
    double crowdAppeal = -1.0;
    double mixFriendliness = -1.0;

    bool hasDanceability() const { return danceability >= 0.0; }
    bool hasCrowdAppeal() const { return crowdAppeal >= 0.0; }
    bool hasMixFriendliness() const { return mixFriendliness >= 0.0; }

    bool isEmpty() const;

    static StyleProfile fromMetadata(const model::TrackMetadata& md);
};

} // namespace segue::style
