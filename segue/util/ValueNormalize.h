#pragma once

#include <QString>
#include <QVariant>

namespace segue::util {

// Lower-cased, trimmed label. Returns an empty string for missing values and "-".
QString normalizeLabel(const QVariant& v);

// Percent-like value -> 0..1.
// Accepts 0..1 numbers, 0..100 numbers, numeric strings and "85%".
// Zero, empty, "-" and unparsable strings are treated as "not rated" (returns false).
bool normalizePercent(const QVariant& v, double& out01);

// True for QVariants holding an int/float type, or a string that parses as a number
// (a trailing '%' is accepted and divides by 100).
bool isNumeric(const QVariant& v);

// Numeric conversion matching isNumeric(). Returns false when not convertible.
bool toNumber(const QVariant& v, double& out);

// Display form used in diagnostic messages.
QString displayValue(const QVariant& v);

} // namespace segue::util
