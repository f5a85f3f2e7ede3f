/**
 * @file bekk_results.hpp
 * @brief Results of a BEKK estimation and derived portfolio diagnostics
 *
 * Holds everything an estimation run produces (innovations, filtered
 * conditional covariances, the variance target, parameter sets and the
 * optimizer's final state) and derives portfolio-level diagnostics from
 * them.
 *
 * Portfolio Diagnostics:
 * For weights w_t (one row per observation) and filtered covariances H_t:
 *
 *     rvar_t = sum_i e_{t,i} * w_{t,i}         (realized proxy, not squared)
 *     evar_t = w_t^T H_t w_t                    (model-implied variance)
 *     mvar   = mean_t evar_t
 *     loss_t = rvar_t / evar_t - 1
 *
 * Minimum variance weights solve H_t x = 1 and normalize w_t = x / sum(x).
 *
 * Thread Safety: Instances are immutable after construction. All methods
 * are const and safe for concurrent use.
 */

#ifndef BEKK_RESULTS_BEKK_RESULTS_HPP
#define BEKK_RESULTS_BEKK_RESULTS_HPP

#include "estimation/estimation_settings.hpp"
#include "estimation/optimizer_output.hpp"
#include "model/model_types.hpp"
#include "model/parameter_set.hpp"
#include "results/weight_kind.hpp"
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace bekk
{
    namespace results
    {

        /**
         * @struct ResultsData
         * @brief Raw output of an estimation run
         *
         * Every field may be left empty to hold partial results. Nothing is
         * validated when the data is stored; operations that need a missing
         * field throw std::logic_error when called.
         */
        struct ResultsData
        {
            std::optional<Eigen::MatrixXd> innov;              ///< Innovations (T x N)
            std::optional<std::vector<Eigen::MatrixXd>> hvar;  ///< Filtered covariances, T matrices of N x N
            std::optional<Eigen::MatrixXd> var_target;         ///< Variance target (N x N)

            std::optional<model::ModelType> model_type;        ///< Model family
            std::optional<model::Restriction> restriction;     ///< Restriction on A and B
            std::optional<bool> use_target;                    ///< Variance targeting flag
            std::optional<bool> cfree;                         ///< Free C matrix flag
            std::optional<std::string> method;                 ///< Optimization method name
            std::optional<double> time_delta;                  ///< Optimization time in seconds
            std::optional<WeightKind> weights;                 ///< Weighting scheme chosen for the run

            std::shared_ptr<const model::ParameterSet> param_start; ///< Starting parameters
            std::shared_ptr<const model::ParameterSet> param_final; ///< Estimated parameters
            std::optional<estimation::OptimizerOutput> opt_out;     ///< Optimizer final state

            /**
             * @brief Copy the model specification from run settings
             * @param settings Settings the estimation ran with
             *
             * Fills model_type, restriction, use_target, cfree, method and weights.
             */
            void apply(const estimation::EstimationSettings &settings);
        };

        /**
         * @class BEKKResults
         * @brief Read-only view of estimation output with portfolio diagnostics
         *
         * Usage Example:
         * @code
         * ResultsData data;
         * data.innov = innov;
         * data.hvar = hvar;
         * data.apply(settings);
         * BEKKResults results(std::move(data));
         *
         * Eigen::VectorXd loss = results.loss_var_ratio(WeightKind::MINVAR);
         * double mean_var = results.portf_mvar("equal");
         * std::cout << results;
         * @endcode
         */
        class BEKKResults
        {
        public:
            /**
             * @brief Construct from estimation output
             * @param data Output fields, stored as given
             */
            explicit BEKKResults(ResultsData data);

            ~BEKKResults() = default;

            /**
             * @brief Weighting scheme the run was configured with
             * @return data().weights, or EQUAL when unset
             *
             * Pass it to the diagnostics to follow the run settings:
             * results.portf_mvar(results.configured_weights()).
             */
            WeightKind configured_weights() const;

            /**
             * @brief Portfolio weights per observation
             * @param kind Weighting scheme
             * @return Weights (T x N)
             * @throws std::logic_error if innovations (or, for MINVAR, the
             *         filtered covariances) are missing
             * @throws std::invalid_argument if a covariance matrix is singular
             *         or has the wrong shape
             */
            Eigen::MatrixXd weights(WeightKind kind = WeightKind::EQUAL) const;

            /**
             * @brief Portfolio weights for a scheme given by name
             * @throws std::invalid_argument if kind is not "equal" or "minvar"
             */
            Eigen::MatrixXd weights(const std::string &kind) const;

            /**
             * @brief Equal weights 1/N (T x N)
             */
            Eigen::MatrixXd weights_equal() const;

            /**
             * @brief Minimum variance weights (T x N)
             *
             * Solves H_t x = 1 with a full pivoting LU so that a singular
             * H_t is reported instead of producing non-finite weights. Only
             * an exactly zero pivot counts as singular, so badly scaled but
             * positive definite matrices are solved.
             */
            Eigen::MatrixXd weights_minvar() const;

            /**
             * @brief Realized portfolio variance proxy
             * @param kind Weighting scheme
             * @return Vector of length T with sum_i e_{t,i} w_{t,i}
             * @throws std::invalid_argument if weights and innovations differ in shape
             */
            Eigen::VectorXd portf_rvar(WeightKind kind = WeightKind::EQUAL) const;
            Eigen::VectorXd portf_rvar(const std::string &kind) const;

            /**
             * @brief Model-implied portfolio variance
             * @param kind Weighting scheme
             * @return Vector of length T with w_t^T H_t w_t
             * @throws std::logic_error if filtered covariances are missing
             */
            Eigen::VectorXd portf_evar(WeightKind kind = WeightKind::EQUAL) const;
            Eigen::VectorXd portf_evar(const std::string &kind) const;

            /**
             * @brief Mean model-implied portfolio variance over all observations
             */
            double portf_mvar(WeightKind kind = WeightKind::EQUAL) const;
            double portf_mvar(const std::string &kind) const;

            /**
             * @brief Ratio of realized to predicted variance minus one
             * @return Vector of length T, rvar_t / evar_t - 1
             *
             * @note A zero evar_t yields inf or NaN per IEEE division.
             */
            Eigen::VectorXd loss_var_ratio(WeightKind kind = WeightKind::EQUAL) const;
            Eigen::VectorXd loss_var_ratio(const std::string &kind) const;

            /**
             * @brief Check dimensional consistency of stored arrays
             * @throws std::invalid_argument describing the first mismatch
             *
             * Checks that the number of filtered covariances matches the
             * number of innovation rows and that every matrix is N x N.
             * Missing fields are skipped.
             */
            void validate() const;

            /**
             * @brief Number of observations T
             * @throws std::logic_error if innovations are missing
             */
            int nobs() const;

            /**
             * @brief Number of assets N
             * @throws std::logic_error if innovations are missing
             */
            int nstocks() const;

            /**
             * @brief Text report of the estimation
             * @throws std::logic_error if model type, restriction, optimizer
             *         output, optimization time or final parameters are missing
             */
            std::string to_string() const;

            /**
             * @brief Print the text report to standard output
             */
            void print_summary() const;

            const ResultsData &data() const { return data_; }

        private:
            const Eigen::MatrixXd &require_innov() const;
            const std::vector<Eigen::MatrixXd> &require_hvar() const;

            ResultsData data_;
        };

        std::ostream &operator<<(std::ostream &os, const BEKKResults &results);

    } // namespace results
} // namespace bekk

#endif // BEKK_RESULTS_BEKK_RESULTS_HPP
