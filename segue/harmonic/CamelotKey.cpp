#include "segue/harmonic/CamelotKey.h"

#include <QtGlobal>

namespace segue::harmonic {
namespace {

struct WheelName {
    const char* minor;
    const char* major;
};

// Index 0 is wheel position 1.
static constexpr WheelName kWheelNames[12] = {
    {"Ab minor", "B major"},  {"Eb minor", "F# major"}, {"Bb minor", "Db major"},
    {"F minor", "Ab major"},  {"C minor", "Eb major"},  {"G minor", "Bb major"},
    {"D minor", "F major"},   {"A minor", "C major"},   {"E minor", "G major"},
    {"B minor", "D major"},   {"F# minor", "A major"},  {"C# minor", "E major"},
};

static int wrapWheel(int n) {
    n = (n - 1) % 12;
    if (n < 0) n += 12;
    return n + 1;
}

} // namespace

CamelotKey CamelotKey::parse(const QString& text) {
    CamelotKey k;
    const QString s = text.trimmed().toUpper();
    if (s.size() < 2 || s.size() > 3) return k;
    const QChar letter = s.back();
    if (letter != 'A' && letter != 'B') return k;
    bool ok = false;
    const int number = s.left(s.size() - 1).toInt(&ok);
    if (!ok || number < 1 || number > 12) return k;
    k.number = number;
    k.letter = letter;
    return k;
}

QStringList CamelotKey::compatibleKeys() const {
    if (!isValid()) return {};
    const QString self = toString();
    const QChar other = (letter == 'A') ? QChar('B') : QChar('A');
    return {
        self,
        QString::number(wrapWheel(number - 1)) + letter,
        QString::number(wrapWheel(number + 1)) + letter,
        QString::number(number) + other,
    };
}

QString CamelotKey::musicalName() const {
    if (!isValid()) return QString();
    const auto& n = kWheelNames[number - 1];
    return QString::fromLatin1(letter == 'A' ? n.minor : n.major);
}

int wheelDistance(int n1, int n2) {
    const int d = qAbs(n1 - n2);
    return qMin(d, 12 - d);
}

QStringList compatibleKeys(const QString& key) {
    return CamelotKey::parse(key).compatibleKeys();
}

} // namespace segue::harmonic
