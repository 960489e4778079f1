#include "falloff_curve.h"
#include "../sph_common.h"

#include <algorithm>
#include <cmath>

FalloffCurve::FalloffCurve(std::vector<Key> keys) : m_keys(std::move(keys)) {
    std::sort(m_keys.begin(), m_keys.end(),
              [](const Key& a, const Key& b) { return a.time < b.time; });
}

FalloffCurve FalloffCurve::constant(float t0, float t1, float value) {
    return FalloffCurve({ Key{ t0, value, 0.0f, 0.0f }, Key{ t1, value, 0.0f, 0.0f } });
}

FalloffCurve FalloffCurve::linear(float t0, float v0, float t1, float v1) {
    const float span = t1 - t0;
    const float slope = (std::fabs(span) > 1e-12f) ? (v1 - v0) / span : 0.0f;
    return FalloffCurve({ Key{ t0, v0, 0.0f, slope }, Key{ t1, v1, slope, 0.0f } });
}

FalloffCurve FalloffCurve::easeInOut(float t0, float v0, float t1, float v1) {
    return FalloffCurve({ Key{ t0, v0, 0.0f, 0.0f }, Key{ t1, v1, 0.0f, 0.0f } });
}

float FalloffCurve::evaluate(float t) const {
    if (m_keys.empty()) return 1.0f;
    if (m_keys.size() == 1 || t <= m_keys.front().time) return m_keys.front().value;
    if (t >= m_keys.back().time) return m_keys.back().value;

    size_t seg = 0;
    while (seg + 1 < m_keys.size() && t > m_keys[seg + 1].time) ++seg;

    const Key& a = m_keys[seg];
    const Key& b = m_keys[seg + 1];
    const float span = b.time - a.time;
    if (!(span > 0.0f)) return b.value;

    const float s  = (t - a.time) / span;
    const float s2 = s * s;
    const float s3 = s2 * s;

    const float h00 = 2.0f * s3 - 3.0f * s2 + 1.0f;
    const float h10 = s3 - 2.0f * s2 + s;
    const float h01 = -2.0f * s3 + 3.0f * s2;
    const float h11 = s3 - s2;

    return h00 * a.value + h10 * (a.outTangent * span) + h01 * b.value + h11 * (b.inTangent * span);
}

std::array<float, FalloffCurve::kSampleCount> FalloffCurve::sample() const {
    std::array<float, kSampleCount> out;
    for (int k = 0; k < kSampleCount; ++k) {
        out[(size_t)k] = m_keys.empty() ? 1.0f : evaluate((float)k / (float)(kSampleCount - 1));
    }
    return out;
}

bool FalloffCurve::operator==(const FalloffCurve& o) const {
    if (m_keys.size() != o.m_keys.size()) return false;
    for (size_t i = 0; i < m_keys.size(); ++i) {
        const Key& a = m_keys[i];
        const Key& b = o.m_keys[i];
        if (a.time != b.time || a.value != b.value ||
            a.inTangent != b.inTangent || a.outTangent != b.outTangent) return false;
    }
    return true;
}

float sampleFalloff(const float samples0[4], const float samples1[4], float t) {
    const float x = sph_internal::clamp01(t) * 7.0f;
    const int i0 = sph_internal::clampi((int)std::floor(x), 0, 6);
    const float frac = x - (float)i0;

    auto at = [&](int i) { return i < 4 ? samples0[i] : samples1[i - 4]; };
    const float a = at(i0);
    const float b = at(i0 + 1);
    return a + (b - a) * frac;
}
