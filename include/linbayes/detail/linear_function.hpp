// Copyright (c) 2026 The linbayes authors
// SPDX-License-Identifier: MIT
//
// This file is part of linbayes.
// See the LICENSE file in the project root for full license information.

#ifndef LINBAYES_LINEAR_FUNCTION_HPP
#define LINBAYES_LINEAR_FUNCTION_HPP
#pragma once

#include <cstddef>
#include <random>
#include <stdexcept>
#include <vector>

namespace linbayes {

    // Ground truth t = a0 + a1*x + N(0, noise_std^2) for generating observation batches
    class LinearFunction {
    public:
        LinearFunction(const double a0, const double a1, const double noise_std)
            : a0_(a0), a1_(a1), noise_std_(noise_std) {
            if (!(noise_std >= 0.0)) {
                throw std::invalid_argument("noise standard deviation must be non-negative");
            }
        }

        [[nodiscard]] double Mean(const double x) const { return a0_ + a1_ * x; }

        template <typename RNG>
        double operator()(const double x, RNG& rng) const {
            if (noise_std_ == 0.0) {
                return Mean(x);
            }
            std::normal_distribution<double> noise(0.0, noise_std_);
            return Mean(x) + noise(rng);
        }

        template <typename RNG>
        std::vector<double> Sample(const std::vector<double>& x_values, RNG& rng) const {
            std::vector<double> result;
            result.reserve(x_values.size());
            for (const double x : x_values) {
                result.push_back((*this)(x, rng));
            }
            return result;
        }

        [[nodiscard]] double intercept() const { return a0_; }
        [[nodiscard]] double slope() const { return a1_; }
        [[nodiscard]] double noise_std() const { return noise_std_; }

    private:
        double a0_;
        double a1_;
        double noise_std_;
    };

    // n inputs drawn uniformly from [lo, hi)
    template <typename RNG>
    [[nodiscard]] std::vector<double> UniformInputs(const std::size_t n, const double lo, const double hi, RNG& rng) {
        std::uniform_real_distribution<double> distribution(lo, hi);
        std::vector<double> result(n);
        for (auto& x : result) {
            x = distribution(rng);
        }
        return result;
    }

};
#endif // LINBAYES_LINEAR_FUNCTION_HPP
