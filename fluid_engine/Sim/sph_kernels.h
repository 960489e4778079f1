#pragma once

#include <cmath>

#include "sph_common.h"

// Smoothing kernels. Normalisation constants depend only on the smoothing
// radius h; FluidSim recomputes them when h changes.
struct KernelConstants {
    float radius        = 0.0f;
    float spikyPow2     = 0.0f; // 15 / (2 pi h^5)
    float spikyPow3     = 0.0f; // 15 / (pi h^6)
    float spikyPow2Grad = 0.0f; // 15 / (pi h^5)
    float spikyPow3Grad = 0.0f; // 45 / (pi h^6)
    float poly6         = 0.0f; // 315 / (64 pi h^9)

    static KernelConstants forRadius(float h) {
        using sph_internal::kPi;
        KernelConstants k;
        k.radius        = h;
        k.spikyPow2     = 15.0f / (2.0f * kPi * std::pow(h, 5.0f));
        k.spikyPow3     = 15.0f / (kPi * std::pow(h, 6.0f));
        k.spikyPow2Grad = 15.0f / (kPi * std::pow(h, 5.0f));
        k.spikyPow3Grad = 45.0f / (kPi * std::pow(h, 6.0f));
        k.poly6         = 315.0f / (64.0f * kPi * std::pow(h, 9.0f));
        return k;
    }
};

namespace sph_kernels {

inline float smoothingPoly6(float dst, const KernelConstants& k) {
    if (dst >= k.radius) return 0.0f;
    const float v = k.radius * k.radius - dst * dst;
    return v * v * v * k.poly6;
}

inline float spikyPow3(float dst, const KernelConstants& k) {
    if (dst >= k.radius) return 0.0f;
    const float v = k.radius - dst;
    return v * v * v * k.spikyPow3;
}

inline float spikyPow2(float dst, const KernelConstants& k) {
    if (dst >= k.radius) return 0.0f;
    const float v = k.radius - dst;
    return v * v * k.spikyPow2;
}

inline float derivativeSpikyPow3(float dst, const KernelConstants& k) {
    if (dst > k.radius) return 0.0f;
    const float v = k.radius - dst;
    return -v * v * k.spikyPow3Grad;
}

inline float derivativeSpikyPow2(float dst, const KernelConstants& k) {
    if (dst > k.radius) return 0.0f;
    const float v = k.radius - dst;
    return -v * k.spikyPow2Grad;
}

inline float densityKernel(float dst, const KernelConstants& k)     { return spikyPow2(dst, k); }
inline float nearDensityKernel(float dst, const KernelConstants& k) { return spikyPow3(dst, k); }
inline float densityDerivative(float dst, const KernelConstants& k)     { return derivativeSpikyPow2(dst, k); }
inline float nearDensityDerivative(float dst, const KernelConstants& k) { return derivativeSpikyPow3(dst, k); }
inline float viscosityKernel(float dst, const KernelConstants& k)   { return smoothingPoly6(dst, k); }

} // namespace sph_kernels
