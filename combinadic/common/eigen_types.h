#pragma once

/// @file
/// This file contains abbreviated definitions for certain specializations of
/// Eigen::Matrix that are commonly used in combinadic.

#include <Eigen/Core>

namespace combinadic {

/// A column vector of any size, templated on scalar type.
template <typename Scalar>
using VectorX = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;

/// A read-only view of a contiguous run of entries within a VectorX.
template <typename Scalar>
using ConstVectorXBlock = Eigen::VectorBlock<const VectorX<Scalar>>;

}  // namespace combinadic
