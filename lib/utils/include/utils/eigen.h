#pragma once

#include <utils/types.h>

namespace utils {
// Fraction of the pixels of a raster that hold a non-zero value
template<typename Derived>
f64 percent_non_zero(Eigen::MatrixBase<Derived> const& matrix)
{
    if (matrix.size() == 0) {
        return 0.0;
    }
    return static_cast<f64>((matrix.array() != typename Derived::Scalar(0)).count()) / static_cast<f64>(matrix.size());
}

// Same statistic, counted only over the pixels where `mask` is set
template<typename Derived, typename MaskDerived>
f64 percent_non_zero(Eigen::MatrixBase<Derived> const& matrix, Eigen::MatrixBase<MaskDerived> const& mask)
{
    auto inside = mask.array() != typename MaskDerived::Scalar(0);
    auto area = inside.count();
    if (area == 0) {
        return 0.0;
    }
    auto covered = (inside && (matrix.array() != typename Derived::Scalar(0))).count();
    return static_cast<f64>(covered) / static_cast<f64>(area);
}
}
