// Copyright (c) 2026 The linbayes authors
// SPDX-License-Identifier: MIT
//
// This file is part of linbayes.
// See the LICENSE file in the project root for full license information.

#ifndef LINBAYES_HPP
#define LINBAYES_HPP
#pragma once

#include "linbayes/detail/errors.hpp"
#include "linbayes/detail/design_matrix.hpp"
#include "linbayes/detail/linear_bayes.hpp"
#include "linbayes/detail/evidence_opt.hpp"
#include "linbayes/detail/linear_function.hpp"

#endif // LINBAYES_HPP
