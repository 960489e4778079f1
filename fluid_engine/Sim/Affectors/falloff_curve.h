#pragma once

#include <array>
#include <vector>

// Keyframed curve mapping normalised distance (0 = centre, 1 = edge) to a force
// multiplier. Segments are cubic Hermite between keys; outside the key range the
// curve holds the first/last value.
class FalloffCurve {
public:
    struct Key {
        float time = 0.0f;
        float value = 0.0f;
        float inTangent = 0.0f;
        float outTangent = 0.0f;
    };

    static constexpr int kSampleCount = 8;

    FalloffCurve() = default;
    explicit FalloffCurve(std::vector<Key> keys);

    static FalloffCurve constant(float t0, float t1, float value);
    static FalloffCurve linear(float t0, float v0, float t1, float v1);
    static FalloffCurve easeInOut(float t0, float v0, float t1, float v1);

    float evaluate(float t) const;

    // Samples at t = k/7, k = 0..7. An empty curve samples as all ones.
    std::array<float, kSampleCount> sample() const;

    bool empty() const { return m_keys.empty(); }
    const std::vector<Key>& keys() const { return m_keys; }

    bool operator==(const FalloffCurve& o) const;
    bool operator!=(const FalloffCurve& o) const { return !(*this == o); }

private:
    std::vector<Key> m_keys; // sorted by time
};

// Kernel-side lookup over the 8 packed samples (linear interpolation).
float sampleFalloff(const float samples0[4], const float samples1[4], float t);
