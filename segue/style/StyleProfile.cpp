#include "segue/style/StyleProfile.h"

#include "segue/util/ValueNormalize.h"

namespace segue::style {

bool StyleProfile::isEmpty() const {
    return subgenre.isEmpty() && mood.isEmpty() && era.isEmpty() && language.isEmpty()
        && timeOfDay.isEmpty() && activity.isEmpty() && season.isEmpty()
        && !hasDanceability() && !hasCrowdAppeal() && !hasMixFriendliness();
}

StyleProfile StyleProfile::fromMetadata(const model::TrackMetadata& md) {
    StyleProfile p;
    if (md.isEmpty()) return p;

    p.subgenre = util::normalizeLabel(md.value("subgenre"));
    p.mood = util::normalizeLabel(md.value("mood"));
    p.era = util::normalizeLabel(md.value("era"));
    p.language = util::normalizeLabel(md.value("language"));
    p.timeOfDay = util::normalizeLabel(md.value("time_of_day"));
    p.activity = util::normalizeLabel(md.value("activity"));
    p.season = util::normalizeLabel(md.value("season"));

    double v = 0.0;
    if (util::normalizePercent(md.value("danceability"), v)) p.danceability = v;
    if (util::normalizePercent(md.value("crowd_appeal"), v)) p.crowdAppeal = v;
    if (util::normalizePercent(md.value("mix_friendly"), v)) p.mixFriendliness = v;
    return p;
}

} // namespace segue::style
