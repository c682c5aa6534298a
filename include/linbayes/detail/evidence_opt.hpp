// Copyright (c) 2026 The linbayes authors
// SPDX-License-Identifier: MIT
//
// This file is part of linbayes.
// See the LICENSE file in the project root for full license information.

#ifndef LINBAYES_EVIDENCE_OPT_HPP
#define LINBAYES_EVIDENCE_OPT_HPP
#pragma once

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include <LBFGSpp/LBFGSB.h>
#include "design_matrix.hpp"
#include "errors.hpp"

namespace linbayes {

    struct Hyperparameters {
        double alpha;
        double beta;
    };

    struct EvidenceParameters {
        double epsilon = 1e-5;
        int max_iterations = 100;
        double initial_log_alpha = 0.0;
        double initial_log_beta = 0.0;
        // alpha in [exp(-10), exp(10)]
        double min_log_alpha = -10.0;
        double max_log_alpha = 10.0;
        // beta in [exp(-10), exp(15)]
        double min_log_beta = -10.0;
        double max_log_beta = 15.0;
    };

    namespace detail {

        // Negative log evidence of the data under w ~ N(0, alpha^-1 I), t | w ~ N(Phi w, beta^-1),
        // as a function of (log alpha, log beta).
        class EvidenceObjective {
        public:
            EvidenceObjective(const Eigen::MatrixXd& phi, const Eigen::VectorXd& t)
                : gram(phi.transpose() * phi), phi_t(phi.transpose() * t),
                t_sq(t.squaredNorm()), n(static_cast<double>(phi.rows())) {}

            double operator()(const Eigen::VectorXd& params, Eigen::VectorXd& grad) const {
                // Exponentiate to enforce strict positivity
                const double alpha = std::exp(params[0]);
                const double beta = std::exp(params[1]);

                // A = alpha I + beta Phi^T Phi
                const Eigen::Matrix2d A = alpha * Eigen::Matrix2d::Identity() + beta * gram;
                const Eigen::LLT<Eigen::Matrix2d> llt(A);
                if (llt.info() == Eigen::NumericalIssue) {
                    // push the optimizer away
                    grad.setZero(params.size());
                    return std::numeric_limits<double>::infinity();
                }

                double sq_err, m_sq;
                const double log_ev = log_evidence(llt, alpha, beta, sq_err, m_sq);

                const Eigen::Matrix2d A_inv = llt.solve(Eigen::Matrix2d::Identity());

                // m_N minimizes E, so only the explicit alpha/beta terms contribute
                const double d_alpha = M / (2.0 * alpha) - 0.5 * m_sq - 0.5 * A_inv.trace();
                const double d_beta = n / (2.0 * beta) - 0.5 * sq_err - 0.5 * (A_inv * gram).trace();

                // Chain rule through the log parameterisation, negated for minimisation
                grad[0] = -alpha * d_alpha;
                grad[1] = -beta * d_beta;

                return -log_ev;
            }

            [[nodiscard]] double LogEvidence(const double alpha, const double beta) const {
                const Eigen::LLT<Eigen::Matrix2d> llt(alpha * Eigen::Matrix2d::Identity() + beta * gram);
                if (llt.info() == Eigen::NumericalIssue) {
                    throw SingularMatrix("evidence precision matrix is not positive definite");
                }
                double sq_err, m_sq;
                return log_evidence(llt, alpha, beta, sq_err, m_sq);
            }

        private:
            double log_evidence(const Eigen::LLT<Eigen::Matrix2d>& llt, const double alpha, const double beta,
                                double& sq_err, double& m_sq) const {
                // m_N = beta A^-1 Phi^T t
                const Eigen::Vector2d m = beta * llt.solve(phi_t);

                // ||t - Phi m||^2 from the sufficient statistics
                sq_err = std::max(0.0, t_sq - 2.0 * m.dot(phi_t) + m.dot(gram * m));
                m_sq = m.squaredNorm();
                const double E = 0.5 * beta * sq_err + 0.5 * alpha * m_sq;

                double log_det = 0.0;
                for (Eigen::Index i = 0; i < kNumWeights; ++i) {
                    log_det += 2.0 * std::log(llt.matrixL()(i, i));
                }

                const double constant = 0.5 * n * std::log(6.283185307179586476925286766559); // 0.5*n*log(2*pi)
                return 0.5 * M * std::log(alpha) + 0.5 * n * std::log(beta) - E - 0.5 * log_det - constant;
            }

            static constexpr double M = static_cast<double>(kNumWeights);

            Eigen::Matrix2d gram;
            Eigen::Vector2d phi_t;
            double t_sq;
            double n;
        };

        // Forwards to the objective and remembers the lowest finite value it was asked for,
        // so an aborted line search still leaves a usable point.
        template <typename Objective>
        class BestPointTracker {
        public:
            explicit BestPointTracker(const Objective& objective) : objective_(objective) {}

            double operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad) {
                const double fx = objective_(x, grad);
                if (std::isfinite(fx) && fx < best_fx_) {
                    best_fx_ = fx;
                    best_x_ = x;
                }
                return fx;
            }

            [[nodiscard]] bool has_best() const { return best_x_.size() > 0; }
            [[nodiscard]] double best_value() const { return best_fx_; }
            [[nodiscard]] const Eigen::VectorXd& best_point() const { return best_x_; }

        private:
            const Objective& objective_;
            double best_fx_ = std::numeric_limits<double>::infinity();
            Eigen::VectorXd best_x_;
        };

        inline void check_batch(const std::vector<double>& x_values, const std::vector<double>& t_values) {
            if (x_values.size() != t_values.size()) {
                throw InvalidDimensions("x and t lengths differ: " + std::to_string(x_values.size())
                    + " vs " + std::to_string(t_values.size()));
            }
            if (x_values.empty()) {
                throw std::invalid_argument("evidence needs at least one observation");
            }
        }

    };

    // log p(t | alpha, beta) for the isotropic zero-mean prior
    [[nodiscard]] inline double LogEvidence(const std::vector<double>& x_values, const std::vector<double>& t_values,
                                            const double alpha, const double beta) {
        detail::check_batch(x_values, t_values);
        if (!(alpha > 0.0) || !(beta > 0.0)) {
            throw std::invalid_argument("alpha and beta must be positive");
        }
        const detail::EvidenceObjective obj(BuildDesignMatrix(x_values), detail::AsVector(t_values));
        return obj.LogEvidence(alpha, beta);
    }

    // Type-II maximum likelihood of (alpha, beta)
    [[nodiscard]] inline Hyperparameters ComputeOptimalHyperparameters(const std::vector<double>& x_values,
                                                                       const std::vector<double>& t_values,
                                                                       const EvidenceParameters& params = {}) {
        detail::check_batch(x_values, t_values);

        LBFGSpp::LBFGSBParam<double> param_opt;
        param_opt.epsilon = params.epsilon;
        param_opt.max_iterations = params.max_iterations;

        LBFGSpp::LBFGSBSolver<double> solver(param_opt);
        const detail::EvidenceObjective obj(BuildDesignMatrix(x_values), detail::AsVector(t_values));
        detail::BestPointTracker<detail::EvidenceObjective> tracker(obj);

        Eigen::VectorXd param(2);
        param << params.initial_log_alpha, params.initial_log_beta;

        Eigen::VectorXd lb(2);
        lb << params.min_log_alpha, params.min_log_beta;

        Eigen::VectorXd ub(2);
        ub << params.max_log_alpha, params.max_log_beta;

        try {
            double nlev;
            solver.minimize(tracker, param, nlev, lb, ub);
        }
        catch (const std::exception& e) {
            std::cerr << "EVIDENCE OPT: " << e.what() << std::endl;
            if (tracker.has_best()) {
                param = tracker.best_point();
            }
        }

        return {std::exp(param[0]), std::exp(param[1])};
    }

};
#endif // LINBAYES_EVIDENCE_OPT_HPP
