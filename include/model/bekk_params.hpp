/**
 * @file bekk_params.hpp
 * @brief Parameter set of a BEKK(1,1) multivariate volatility model
 *
 * Mathematical Background:
 * The BEKK(1,1) conditional covariance recursion is
 *
 *     H_t = C C^T + A e_{t-1} e_{t-1}^T A^T + B H_{t-1} B^T
 *
 * where:
 * - A, B are N x N coefficient matrices
 * - C is lower triangular (N x N)
 * - e_t is the innovation vector at time t
 *
 * Vectorizing the recursion gives
 *
 *     vec(H_t) = vec(C C^T) + (A (x) A) vec(e e^T) + (B (x) B) vec(H_{t-1})
 *
 * so the process is covariance stationary when the spectral radius of
 * (A (x) A + B (x) B) is below one. The unconditional variance then solves
 *
 *     vec(H) = (I - A (x) A - B (x) B)^{-1} vec(C C^T)
 *
 * Variance Targeting:
 * Fixing H to a pre-estimated target S determines the intercept,
 *
 *     C C^T = S - A S A^T - B S B^T
 *
 * which removes C from the set of free parameters.
 *
 * References:
 * - Engle and Kroner (1995), "Multivariate Simultaneous Generalized ARCH"
 */

#pragma once

#include "model/model_types.hpp"
#include "model/parameter_set.hpp"
#include <Eigen/Dense>
#include <optional>

namespace bekk
{
    namespace model
    {

        /**
         * @class BEKKParams
         * @brief A, B and C matrices of a BEKK(1,1) model
         *
         * Instances are created through the named constructors and are
         * immutable afterwards.
         *
         * Usage Example:
         * @code
         * // Diagonal parameters with variance targeting
         * Eigen::MatrixXd a = 0.3 * Eigen::MatrixXd::Identity(2, 2);
         * Eigen::MatrixXd b = 0.9 * Eigen::MatrixXd::Identity(2, 2);
         * auto params = BEKKParams::from_target(a, b, target);
         *
         * // Pack the free parameters for an optimizer
         * Eigen::VectorXd theta = params.get_theta(Restriction::DIAGONAL, true, false);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class BEKKParams : public ParameterSet
        {
        public:
            ~BEKKParams() override = default;

            /**
             * @brief Create from explicit matrices
             * @param amat ARCH coefficient matrix (N x N)
             * @param bmat GARCH coefficient matrix (N x N)
             * @param cmat Intercept factor (N x N, lower triangular)
             * @throws std::invalid_argument if shapes are inconsistent
             *
             * The upper triangle of cmat is discarded.
             */
            static BEKKParams from_abc(const Eigen::MatrixXd &amat,
                                       const Eigen::MatrixXd &bmat,
                                       const Eigen::MatrixXd &cmat);

            /**
             * @brief Create from A, B and a variance target
             * @param amat ARCH coefficient matrix (N x N)
             * @param bmat GARCH coefficient matrix (N x N)
             * @param target Unconditional variance target (N x N)
             * @throws std::invalid_argument if shapes are inconsistent
             * @throws std::runtime_error if the implied intercept
             *         S - A S A^T - B S B^T is not positive definite
             */
            static BEKKParams from_target(const Eigen::MatrixXd &amat,
                                          const Eigen::MatrixXd &bmat,
                                          const Eigen::MatrixXd &target);

            /**
             * @brief Unpack parameters from a free-parameter vector
             * @param theta Vector produced by get_theta
             * @param nstocks Number of assets N
             * @param restriction Restriction on A and B
             * @param use_target Whether C is derived from target
             * @param cfree Whether C is a free lower triangular matrix
             * @param target Variance target (required when use_target is true)
             * @throws std::invalid_argument if theta has the wrong length or
             *         the target is missing under variance targeting
             * @throws std::runtime_error if targeting fails (see from_target)
             */
            static BEKKParams from_theta(const Eigen::VectorXd &theta,
                                         int nstocks,
                                         Restriction restriction,
                                         bool use_target,
                                         bool cfree,
                                         const Eigen::MatrixXd &target = Eigen::MatrixXd());

            /**
             * @brief Pack the free parameters into a vector
             * @param restriction Restriction on A and B
             * @param use_target Whether C is derived from target (then omitted)
             * @param cfree Whether C is a free lower triangular matrix
             * @return Parameter vector
             *
             * Layout:
             * - FULL: vec(A), vec(B) (column-major)
             * - DIAGONAL: diag(A), diag(B)
             * - SCALAR: A(0,0), B(0,0)
             *
             * Unless use_target is set, C follows: its lower triangle
             * (column-major) when cfree is set, its diagonal otherwise.
             * cfree has no effect under variance targeting.
             */
            Eigen::VectorXd get_theta(Restriction restriction,
                                      bool use_target,
                                      bool cfree) const;

            /**
             * @brief Number of free parameters for a specification
             * @throws std::invalid_argument if nstocks is not positive
             */
            static int num_params(int nstocks, Restriction restriction,
                                  bool use_target, bool cfree);

            /**
             * @brief Spectral radius of A (x) A + B (x) B
             * @return Stationarity measure, the process is stationary when < 1
             */
            double constraint() const;

            /**
             * @brief Unconditional variance implied by the parameters
             * @return N x N symmetric matrix
             * @throws std::runtime_error if I - A (x) A - B (x) B is singular
             */
            Eigen::MatrixXd find_stationary_var() const;

            /**
             * @brief Degree to which the unconditional variance is invalid
             * @return Sum of negative eigenvalue magnitudes of the unconditional
             *         variance, or 1.0 if it cannot be computed
             */
            double uvar_bad() const;

            /**
             * @brief Penalty for constraint violations
             * @return max(0, constraint() - 1) + uvar_bad()
             */
            double penalty() const override;

            /**
             * @brief Text block listing A, B and C
             */
            std::string to_string() const override;

            /**
             * @brief Get parameterization name
             * @return "BEKKParams"
             */
            std::string get_name() const override;

            int nstocks() const { return static_cast<int>(amat_.rows()); }
            const Eigen::MatrixXd &amat() const { return amat_; }
            const Eigen::MatrixXd &bmat() const { return bmat_; }
            const Eigen::MatrixXd &cmat() const { return cmat_; }

        private:
            BEKKParams(Eigen::MatrixXd amat, Eigen::MatrixXd bmat, Eigen::MatrixXd cmat);

            /**
             * @brief Check that A and B are square with matching size
             * @throws std::invalid_argument if validation fails
             */
            static void validate_ab(const Eigen::MatrixXd &amat, const Eigen::MatrixXd &bmat);

            /**
             * @brief A (x) A + B (x) B
             */
            Eigen::MatrixXd transition_matrix() const;

            /**
             * @brief Solve for the unconditional variance
             * @return Symmetrized variance, or nullopt if the system is singular
             */
            std::optional<Eigen::MatrixXd> solve_stationary_var() const;

            Eigen::MatrixXd amat_; ///< ARCH coefficients
            Eigen::MatrixXd bmat_; ///< GARCH coefficients
            Eigen::MatrixXd cmat_; ///< Lower triangular intercept factor
        };

    } // namespace model
} // namespace bekk
