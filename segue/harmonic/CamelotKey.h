#pragma once

#include <QString>
#include <QStringList>

namespace segue::harmonic {

// Camelot wheel position: number 1..12, letter 'A' (minor) or 'B' (major).
struct CamelotKey {
    int number = 0;
    QChar letter;

    bool isValid() const { return number >= 1 && number <= 12 && (letter == 'A' || letter == 'B'); }
    QString toString() const { return isValid() ? QString::number(number) + letter : QString(); }

    // Accepts "8A", " 8a ", "12B". Returns an invalid key for anything else.
    static CamelotKey parse(const QString& text);

    // Same key, both wheel neighbours (same letter) and the relative key.
    // Exactly 4 entries for a valid key, empty otherwise.
    QStringList compatibleKeys() const;

    // Musical name, e.g. "8A" -> "A minor". Empty for invalid keys.
    QString musicalName() const;
};

// Shortest distance around the 12-position wheel (0..6).
int wheelDistance(int n1, int n2);

QStringList compatibleKeys(const QString& key);

} // namespace segue::harmonic
