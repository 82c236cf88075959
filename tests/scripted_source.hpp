#pragma once
#include "SpawnPolicy.hpp"
#include <cstddef>
#include <memory>
#include <vector>

// Uniform source that always returns the current value of *u.
inline SpawnPolicy::UniformSource followSource(const std::shared_ptr<double>& u) {
    return [u]() { return *u; };
}

inline SpawnPolicy::UniformSource constantSource(double v) {
    return [v]() { return v; };
}

// Cycles through `values`.
inline SpawnPolicy::UniformSource sequenceSource(std::vector<double> values) {
    auto idx = std::make_shared<std::size_t>(0);
    return [values, idx]() {
        double v = values[*idx % values.size()];
        ++*idx;
        return v;
    };
}
