// Copyright (c) 2026 The linbayes authors
// SPDX-License-Identifier: MIT
//
// This file is part of linbayes.
// See the LICENSE file in the project root for full license information.

#ifndef LINBAYES_DESIGN_MATRIX_HPP
#define LINBAYES_DESIGN_MATRIX_HPP
#pragma once

#include <vector>
#include <Eigen/Dense>

namespace linbayes {

    // Number of basis functions: bias and identity
    inline constexpr Eigen::Index kNumWeights = 2;

    // Phi = [1, x], one row per input
    [[nodiscard]] inline Eigen::MatrixXd BuildDesignMatrix(const std::vector<double>& x_values) {
        const auto n = static_cast<Eigen::Index>(x_values.size());
        Eigen::MatrixXd phi(n, kNumWeights);
        phi.col(0).setOnes();
        phi.col(1) = Eigen::Map<const Eigen::VectorXd>(x_values.data(), n);
        return phi;
    }

    namespace detail {

        [[nodiscard]] inline Eigen::Map<const Eigen::VectorXd> AsVector(const std::vector<double>& values) {
            return {values.data(), static_cast<Eigen::Index>(values.size())};
        }

    };

};
#endif // LINBAYES_DESIGN_MATRIX_HPP
