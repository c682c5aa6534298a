// Copyright (c) 2026 The linbayes authors
// SPDX-License-Identifier: MIT
//
// This file is part of linbayes.
// See the LICENSE file in the project root for full license information.

#ifndef LINBAYES_LINEAR_BAYES_HPP
#define LINBAYES_LINEAR_BAYES_HPP
#pragma once

#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "design_matrix.hpp"
#include "errors.hpp"

namespace linbayes {

    struct UpdaterParameters {
        // Reciprocal condition estimate below which the posterior precision counts as singular
        double rcond_tolerance = 1e-12;
        // 0 seeds the sampler from std::random_device
        unsigned int seed = 0;
    };

    /** Gaussian posterior over the weights of t = w0 + w1*x under known noise precision beta.
     *
     * Every Update() re-derives the posterior from the original prior and the batch passed
     * to that call. Updates from separate calls do not accumulate; pass the full dataset, or
     * chain explicitly with FromPosterior().
     */
    class LinearBayes {
    public:
        LinearBayes(const Eigen::VectorXd& prior_mean,
                    const Eigen::MatrixXd& prior_covariance,
                    const double noise_precision,
                    const UpdaterParameters& parameters = {})
        : params_(parameters),
            generator_(parameters.seed != 0 ? parameters.seed : std::random_device{}()),
            beta_(noise_precision)
        {
            if (prior_mean.size() != kNumWeights) {
                throw InvalidDimensions("prior mean must have 2 elements, got " + std::to_string(prior_mean.size()));
            }
            if (prior_covariance.rows() != kNumWeights || prior_covariance.cols() != kNumWeights) {
                throw InvalidDimensions("prior covariance must be 2x2, got "
                    + std::to_string(prior_covariance.rows()) + "x" + std::to_string(prior_covariance.cols()));
            }
            if (!prior_mean.allFinite()) {
                throw std::invalid_argument("prior mean must be finite");
            }
            if (!(noise_precision > 0.0)) {
                throw NonPositiveNoisePrecision("noise precision must be positive, got " + std::to_string(noise_precision));
            }
            if (!prior_covariance.allFinite() || !prior_covariance.isApprox(prior_covariance.transpose())) {
                throw NonPositiveDefiniteCovariance("prior covariance is not symmetric");
            }

            // Cholesky decomp doubles as the positive-definiteness check
            const Eigen::LLT<Eigen::Matrix2d> llt(prior_covariance);
            if (llt.info() != Eigen::Success) {
                throw NonPositiveDefiniteCovariance("prior covariance is not positive definite");
            }

            prior_mean_ = prior_mean;
            prior_cov_ = prior_covariance;
            prior_precision_ = llt.solve(Eigen::Matrix2d::Identity());
            prior_precision_mean_ = prior_precision_ * prior_mean_;

            posterior_mean_ = prior_mean_;
            posterior_cov_ = prior_cov_;
        }

        // Prior N(0, alpha^-1 I)
        [[nodiscard]] static LinearBayes Isotropic(const double alpha, const double beta, const UpdaterParameters& parameters = {}) {
            if (!(alpha > 0.0)) {
                throw NonPositiveDefiniteCovariance("prior precision alpha must be positive, got " + std::to_string(alpha));
            }
            return {Eigen::Vector2d::Zero(), Eigen::Matrix2d::Identity() / alpha, beta, parameters};
        }

        // New updater whose prior is the current posterior of `other`. Its sampler is
        // seeded from the parent's generator, so the two draw independent streams.
        [[nodiscard]] static LinearBayes FromPosterior(const LinearBayes& other) {
            UpdaterParameters child_params = other.params_;
            child_params.seed = 0;
            while (child_params.seed == 0) {
                child_params.seed = static_cast<unsigned int>(other.generator_());
            }
            return {other.posterior_mean_, other.posterior_cov_, other.beta_, child_params};
        }

        void Update(const std::vector<double>& x_values, const std::vector<double>& t_values) {
            if (x_values.size() != t_values.size()) {
                throw InvalidDimensions("x and t lengths differ: " + std::to_string(x_values.size())
                    + " vs " + std::to_string(t_values.size()));
            }
            if (x_values.empty()) {
                return;
            }

            const Eigen::MatrixXd phi = BuildDesignMatrix(x_values);

            // S_N^-1 = S_0^-1 + beta * Phi^T Phi
            Eigen::Matrix2d precision = prior_precision_;
            precision.noalias() += beta_ * (phi.transpose() * phi);

            const Eigen::LLT<Eigen::Matrix2d> llt(precision);
            if (llt.info() != Eigen::Success || !(llt.rcond() >= params_.rcond_tolerance)) {
                throw SingularMatrix("posterior precision is singular to tolerance "
                    + std::to_string(params_.rcond_tolerance));
            }

            const Eigen::Matrix2d inverse = llt.solve(Eigen::Matrix2d::Identity());
            const Eigen::Matrix2d covariance = 0.5 * (inverse + inverse.transpose());

            // m_N = S_N (S_0^-1 m_0 + beta * Phi^T t)
            Eigen::Vector2d rhs = prior_precision_mean_;
            rhs.noalias() += beta_ * (phi.transpose() * detail::AsVector(t_values));
            const Eigen::Vector2d mean = covariance * rhs;

            if (!mean.allFinite() || !covariance.allFinite()) {
                throw SingularMatrix("posterior is not finite");
            }

            posterior_mean_ = mean;
            posterior_cov_ = covariance;
            updated_ = true;
        }

        // Back to the fresh state
        void Reset() {
            posterior_mean_ = prior_mean_;
            posterior_cov_ = prior_cov_;
            updated_ = false;
        }

        [[nodiscard]] std::vector<double> PredictiveMean(const std::vector<double>& x_values) const {
            Eigen::VectorXd mean, variance;
            predictive_moments(x_values, mean, variance);
            return std::vector<double>(mean.data(), mean.data() + mean.size());
        }

        // 1/beta + phi(x)^T S_N phi(x)
        [[nodiscard]] std::vector<double> PredictiveVariance(const std::vector<double>& x_values) const {
            Eigen::VectorXd mean, variance;
            predictive_moments(x_values, mean, variance);
            return std::vector<double>(variance.data(), variance.data() + variance.size());
        }

        // Predictive mean plus num_stdevs predictive standard deviations; negative gives the lower bound
        [[nodiscard]] std::vector<double> PredictionBound(const std::vector<double>& x_values, const double num_stdevs) const {
            Eigen::VectorXd mean, variance;
            predictive_moments(x_values, mean, variance);

            std::vector<double> result;
            result.reserve(x_values.size());
            for (Eigen::Index i = 0; i < mean.size(); i++) {
                result.push_back(mean(i) + num_stdevs * std::sqrt(variance(i)));
            }
            return result;
        }

        // Draws from N(m_N, S_N), one sample per column
        [[nodiscard]] Eigen::Matrix2Xd SamplePosteriorWeights(const std::size_t count) {
            if (count == 0) {
                throw std::invalid_argument("sample count must be positive");
            }

            const Eigen::Matrix2d L = posterior_cholesky().matrixL();
            Eigen::Matrix2Xd z(kNumWeights, static_cast<Eigen::Index>(count));
            double* data_ptr = z.data();
            for (Eigen::Index i = 0; i < z.size(); ++i) {
                data_ptr[i] = std_normal_(generator_);
            }

            Eigen::Matrix2Xd samples = L * z;
            samples.colwise() += posterior_mean_;
            return samples;
        }

        // One draw per x from the predictive distribution
        [[nodiscard]] std::vector<double> GenerateObservation(const std::vector<double>& x_values) {
            Eigen::VectorXd mean, variance;
            predictive_moments(x_values, mean, variance);

            std::vector<double> result;
            result.reserve(x_values.size());
            for (Eigen::Index i = 0; i < mean.size(); i++) {
                result.push_back(mean(i) + std::sqrt(variance(i)) * std_normal_(generator_));
            }
            return result;
        }

        [[nodiscard]] double LogPosteriorDensity(const Eigen::VectorXd& weights) const {
            if (weights.size() != kNumWeights) {
                throw InvalidDimensions("weight vector must have 2 elements, got " + std::to_string(weights.size()));
            }

            const Eigen::LLT<Eigen::Matrix2d> llt = posterior_cholesky();
            const Eigen::Vector2d y = llt.matrixL().solve(weights - posterior_mean_);

            // Log Det 2 * sum(log(diag(L)))
            double log_det = 0.0;
            for (Eigen::Index i = 0; i < kNumWeights; ++i) {
                log_det += 2.0 * std::log(llt.matrixL()(i, i));
            }

            const double constant = static_cast<double>(kNumWeights) * 0.5 * std::log(6.283185307179586476925286766559);
            return -0.5 * y.squaredNorm() - 0.5 * log_det - constant;
        }

        [[nodiscard]] double PosteriorDensity(const Eigen::VectorXd& weights) const {
            return std::exp(LogPosteriorDensity(weights));
        }

        [[nodiscard]] const Eigen::Vector2d& prior_mean() const { return prior_mean_; }
        [[nodiscard]] const Eigen::Matrix2d& prior_covariance() const { return prior_cov_; }
        [[nodiscard]] double noise_precision() const { return beta_; }
        [[nodiscard]] const Eigen::Vector2d& posterior_mean() const { return posterior_mean_; }
        [[nodiscard]] const Eigen::Matrix2d& posterior_covariance() const { return posterior_cov_; }
        [[nodiscard]] bool is_updated() const { return updated_; }
        [[nodiscard]] const UpdaterParameters& parameters() const { return params_; }

    private:

        void predictive_moments(const std::vector<double>& x_values, Eigen::VectorXd& mean, Eigen::VectorXd& variance) const {
            const Eigen::MatrixXd phi = BuildDesignMatrix(x_values);
            mean.noalias() = phi * posterior_mean_;
            variance = (phi * posterior_cov_).cwiseProduct(phi).rowwise().sum();
            variance.array() += 1.0 / beta_;

            if (variance.size() > 0 && variance.minCoeff() < 0.0) {
                throw std::logic_error("negative predictive variance");
            }
        }

        [[nodiscard]] Eigen::LLT<Eigen::Matrix2d> posterior_cholesky() const {
            Eigen::LLT<Eigen::Matrix2d> llt(posterior_cov_);
            if (llt.info() != Eigen::Success) {
                throw std::logic_error("posterior covariance lost positive definiteness");
            }
            return llt;
        }

        UpdaterParameters params_;
        mutable std::mt19937 generator_;
        std::normal_distribution<double> std_normal_{0.0, 1.0};
        double beta_;

        Eigen::Vector2d prior_mean_;
        Eigen::Matrix2d prior_cov_;
        Eigen::Matrix2d prior_precision_;
        Eigen::Vector2d prior_precision_mean_;

        Eigen::Vector2d posterior_mean_;
        Eigen::Matrix2d posterior_cov_;
        bool updated_ = false;
    };

};
#endif // LINBAYES_LINEAR_BAYES_HPP
