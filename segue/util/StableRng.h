#pragma once

#include <QByteArray>
#include <QVector>
#include <QtGlobal>

#include <utility>

namespace segue::util {

// Deterministic generator for the few places the sequencer needs variation
// (flat-curve jitter, multi-candidate pool shuffles).
// Same seed -> same sequence on every platform; never use QRandomGenerator here.
// SplitMix64 seeding + xoroshiro128+.
class StableRng final {
public:
    StableRng() = default;
    explicit StableRng(quint64 seed) { reseed(seed); }

    // FNV-1a 32-bit; use namespaced strings ("sequence|shuffle|<run>").
    static quint32 seedFromString(const QByteArray& bytes) {
        quint32 h = 2166136261u;
        for (unsigned char c : bytes) {
            h ^= quint32(c);
            h *= 16777619u;
        }
        return h;
    }

    void reseed(quint64 s) {
        quint64 x = (s == 0ull) ? 0x9E3779B97F4A7C15ull : s;
        m_s0 = splitmix64(x);
        m_s1 = splitmix64(x);
        if (m_s0 == 0ull && m_s1 == 0ull) m_s1 = 0xD1342543DE82EF95ull;
    }

    quint64 nextU64() {
        const quint64 s0 = m_s0;
        quint64 s1 = m_s1;
        const quint64 result = s0 + s1;
        s1 ^= s0;
        m_s0 = rotl(s0, 55) ^ s1 ^ (s1 << 14);
        m_s1 = rotl(s1, 36);
        return result;
    }

    // Uniform in [0,1) from the top 53 bits.
    double nextDouble01() {
        return double(nextU64() >> 11) * (1.0 / double(1ull << 53));
    }

    // Uniform in [lo, hi).
    double uniform(double lo, double hi) { return lo + (hi - lo) * nextDouble01(); }

    quint32 nextU32() { return quint32(nextU64() >> 32); }

    // Uniform integer in [0, upperExclusive). Rejection sampling, no modulo bias.
    quint32 bounded(quint32 upperExclusive) {
        if (upperExclusive <= 1u) return 0u;
        const quint32 threshold = quint32(0x1'0000'0000ull % upperExclusive);
        for (;;) {
            const quint32 r = nextU32();
            if (r >= threshold) return r % upperExclusive;
        }
    }

    // Fisher-Yates.
    template <typename T>
    void shuffle(QVector<T>& v) {
        for (int i = v.size() - 1; i > 0; --i) {
            const int j = int(bounded(quint32(i + 1)));
            if (j != i) std::swap(v[i], v[j]);
        }
    }

private:
    static quint64 rotl(quint64 x, int k) { return (x << k) | (x >> (64 - k)); }

    static quint64 splitmix64(quint64& x) {
        x += 0x9E3779B97F4A7C15ull;
        quint64 z = x;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
        return z ^ (z >> 31);
    }

    quint64 m_s0 = 0x1234567890ABCDEFull;
    quint64 m_s1 = 0x0FEDCBA098765432ull;
};

} // namespace segue::util
