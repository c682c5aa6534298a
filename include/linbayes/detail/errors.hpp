// Copyright (c) 2026 The linbayes authors
// SPDX-License-Identifier: MIT
//
// This file is part of linbayes.
// See the LICENSE file in the project root for full license information.

#ifndef LINBAYES_ERRORS_HPP
#define LINBAYES_ERRORS_HPP
#pragma once

#include <stdexcept>
#include <string>

namespace linbayes {

    // Base of every error raised by the updater. A failed call never
    // leaves a partially modified posterior behind.
    class LinBayesError : public std::runtime_error {
    public:
        explicit LinBayesError(const std::string& what) : std::runtime_error(what) {}
    };

    // x/t length mismatch, or a prior that is not a 2-vector / 2x2 matrix
    class InvalidDimensions : public LinBayesError {
    public:
        explicit InvalidDimensions(const std::string& what) : LinBayesError(what) {}
    };

    class NonPositiveNoisePrecision : public LinBayesError {
    public:
        explicit NonPositiveNoisePrecision(const std::string& what) : LinBayesError(what) {}
    };

    class NonPositiveDefiniteCovariance : public LinBayesError {
    public:
        explicit NonPositiveDefiniteCovariance(const std::string& what) : LinBayesError(what) {}
    };

    // Posterior precision could not be inverted within the configured tolerance
    class SingularMatrix : public LinBayesError {
    public:
        explicit SingularMatrix(const std::string& what) : LinBayesError(what) {}
    };

};
#endif // LINBAYES_ERRORS_HPP
