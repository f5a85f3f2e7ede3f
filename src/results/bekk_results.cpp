/**
 * @file bekk_results.cpp
 * @brief Implementation of BEKK estimation results
 */

#include "results/bekk_results.hpp"
#include "model/matrix_format.hpp"
#include "results/time_format.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace bekk
{
    namespace results
    {
        namespace
        {
            std::string flag_to_string(const std::optional<bool> &flag)
            {
                if (!flag)
                {
                    return "None";
                }
                return *flag ? "True" : "False";
            }

            std::string format_fixed(double value, int precision)
            {
                std::ostringstream out;
                out << std::fixed << std::setprecision(precision) << value;
                return out.str();
            }
        } // namespace

        // ============================================================================
        // ResultsData Implementation
        // ============================================================================

        void ResultsData::apply(const estimation::EstimationSettings &settings)
        {
            model_type = settings.model_type;
            restriction = settings.restriction;
            use_target = settings.use_target;
            cfree = settings.cfree;
            method = settings.method;
            weights = settings.weights;
        }

        // ============================================================================
        // BEKKResults Implementation
        // ============================================================================

        BEKKResults::BEKKResults(ResultsData data)
            : data_(std::move(data))
        {
        }

        const Eigen::MatrixXd &BEKKResults::require_innov() const
        {
            if (!data_.innov)
            {
                throw std::logic_error("Results do not contain innovations");
            }
            return *data_.innov;
        }

        const std::vector<Eigen::MatrixXd> &BEKKResults::require_hvar() const
        {
            if (!data_.hvar)
            {
                throw std::logic_error("Results do not contain filtered variance matrices");
            }
            return *data_.hvar;
        }

        int BEKKResults::nobs() const
        {
            return static_cast<int>(require_innov().rows());
        }

        int BEKKResults::nstocks() const
        {
            return static_cast<int>(require_innov().cols());
        }

        // ---------------------------------------------------------------
        // Weights
        // ---------------------------------------------------------------

        WeightKind BEKKResults::configured_weights() const
        {
            return data_.weights.value_or(WeightKind::EQUAL);
        }

        Eigen::MatrixXd BEKKResults::weights(WeightKind kind) const
        {
            switch (kind)
            {
            case WeightKind::EQUAL:
                return weights_equal();
            case WeightKind::MINVAR:
                return weights_minvar();
            }
            throw std::invalid_argument("Weight choice is not supported!");
        }

        Eigen::MatrixXd BEKKResults::weights(const std::string &kind) const
        {
            return weights(parse_weight_kind(kind));
        }

        Eigen::MatrixXd BEKKResults::weights_equal() const
        {
            const Eigen::MatrixXd &innov = require_innov();
            return Eigen::MatrixXd::Ones(innov.rows(), innov.cols()) / static_cast<double>(innov.cols());
        }

        Eigen::MatrixXd BEKKResults::weights_minvar() const
        {
            const Eigen::Index n = require_innov().cols();
            const std::vector<Eigen::MatrixXd> &hvar = require_hvar();
            const Eigen::VectorXd ones = Eigen::VectorXd::Ones(n);

            Eigen::MatrixXd out(static_cast<Eigen::Index>(hvar.size()), n);

            for (size_t t = 0; t < hvar.size(); ++t)
            {
                const Eigen::MatrixXd &hvari = hvar[t];
                if (hvari.rows() != n || hvari.cols() != n)
                {
                    throw std::invalid_argument(
                        "Variance matrix at observation " + std::to_string(t) + " is " +
                        std::to_string(hvari.rows()) + "x" + std::to_string(hvari.cols()) +
                        ", expected " + std::to_string(n) + "x" + std::to_string(n));
                }

                Eigen::FullPivLU<Eigen::MatrixXd> lu(hvari);
                // Only an exactly zero pivot makes H_t singular
                lu.setThreshold(0.0);
                if (!lu.isInvertible())
                {
                    throw std::invalid_argument(
                        "Singular variance matrix at observation " + std::to_string(t));
                }

                Eigen::VectorXd inv_hvar = lu.solve(ones);
                out.row(static_cast<Eigen::Index>(t)) = (inv_hvar / inv_hvar.sum()).transpose();
            }

            return out;
        }

        // ---------------------------------------------------------------
        // Portfolio variance
        // ---------------------------------------------------------------

        Eigen::VectorXd BEKKResults::portf_rvar(WeightKind kind) const
        {
            const Eigen::MatrixXd &innov = require_innov();
            Eigen::MatrixXd w = weights(kind);

            if (w.rows() != innov.rows() || w.cols() != innov.cols())
            {
                throw std::invalid_argument(
                    "Weights (" + std::to_string(w.rows()) + "x" + std::to_string(w.cols()) +
                    ") do not match innovations (" + std::to_string(innov.rows()) + "x" +
                    std::to_string(innov.cols()) + ")");
            }

            return (innov.array() * w.array()).rowwise().sum().matrix();
        }

        Eigen::VectorXd BEKKResults::portf_rvar(const std::string &kind) const
        {
            return portf_rvar(parse_weight_kind(kind));
        }

        Eigen::VectorXd BEKKResults::portf_evar(WeightKind kind) const
        {
            const std::vector<Eigen::MatrixXd> &hvar = require_hvar();
            Eigen::MatrixXd w = weights(kind);

            if (w.rows() != static_cast<Eigen::Index>(hvar.size()))
            {
                throw std::invalid_argument(
                    "Weights have " + std::to_string(w.rows()) + " rows but there are " +
                    std::to_string(hvar.size()) + " variance matrices");
            }

            Eigen::VectorXd evar(w.rows());
            for (Eigen::Index t = 0; t < w.rows(); ++t)
            {
                const Eigen::MatrixXd &hvari = hvar[static_cast<size_t>(t)];
                if (hvari.rows() != w.cols() || hvari.cols() != w.cols())
                {
                    throw std::invalid_argument(
                        "Variance matrix at observation " + std::to_string(t) +
                        " does not match the number of assets (" + std::to_string(w.cols()) + ")");
                }

                Eigen::VectorXd wt = w.row(t).transpose();
                evar(t) = wt.dot(hvari * wt);
            }

            return evar;
        }

        Eigen::VectorXd BEKKResults::portf_evar(const std::string &kind) const
        {
            return portf_evar(parse_weight_kind(kind));
        }

        double BEKKResults::portf_mvar(WeightKind kind) const
        {
            return portf_evar(kind).mean();
        }

        double BEKKResults::portf_mvar(const std::string &kind) const
        {
            return portf_mvar(parse_weight_kind(kind));
        }

        Eigen::VectorXd BEKKResults::loss_var_ratio(WeightKind kind) const
        {
            Eigen::VectorXd rvar = portf_rvar(kind);
            Eigen::VectorXd evar = portf_evar(kind);
            return (rvar.array() / evar.array() - 1.0).matrix();
        }

        Eigen::VectorXd BEKKResults::loss_var_ratio(const std::string &kind) const
        {
            return loss_var_ratio(parse_weight_kind(kind));
        }

        // ---------------------------------------------------------------
        // Validation
        // ---------------------------------------------------------------

        void BEKKResults::validate() const
        {
            Eigen::Index n = -1;

            if (data_.innov)
            {
                n = data_.innov->cols();
            }
            else if (data_.var_target)
            {
                n = data_.var_target->rows();
            }
            else if (data_.hvar && !data_.hvar->empty())
            {
                n = data_.hvar->front().rows();
            }

            if (data_.var_target &&
                (data_.var_target->rows() != n || data_.var_target->cols() != n))
            {
                throw std::invalid_argument(
                    "Variance target is " + std::to_string(data_.var_target->rows()) + "x" +
                    std::to_string(data_.var_target->cols()) + ", expected " +
                    std::to_string(n) + "x" + std::to_string(n));
            }

            if (data_.hvar)
            {
                const std::vector<Eigen::MatrixXd> &hvar = *data_.hvar;

                if (data_.innov && static_cast<Eigen::Index>(hvar.size()) != data_.innov->rows())
                {
                    throw std::invalid_argument(
                        "Number of variance matrices (" + std::to_string(hvar.size()) +
                        ") does not match number of observations (" +
                        std::to_string(data_.innov->rows()) + ")");
                }

                for (size_t t = 0; t < hvar.size(); ++t)
                {
                    if (hvar[t].rows() != n || hvar[t].cols() != n)
                    {
                        throw std::invalid_argument(
                            "Variance matrix at observation " + std::to_string(t) + " is " +
                            std::to_string(hvar[t].rows()) + "x" + std::to_string(hvar[t].cols()) +
                            ", expected " + std::to_string(n) + "x" + std::to_string(n));
                    }
                }
            }
        }

        // ---------------------------------------------------------------
        // Reporting
        // ---------------------------------------------------------------

        std::string BEKKResults::to_string() const
        {
            if (!data_.model_type)
            {
                throw std::logic_error("Cannot render results: model type is missing");
            }
            if (!data_.restriction)
            {
                throw std::logic_error("Cannot render results: restriction is missing");
            }
            if (!data_.opt_out)
            {
                throw std::logic_error("Cannot render results: optimizer output is missing");
            }
            if (!data_.time_delta)
            {
                throw std::logic_error("Cannot render results: optimization time is missing");
            }
            if (!data_.param_final)
            {
                throw std::logic_error("Cannot render results: final parameters are missing");
            }

            const estimation::OptimizerOutput &opt_out = *data_.opt_out;
            const int width = 60;

            std::string show = std::string(width, '=');
            show += "\nModel: " + model::to_string(*data_.model_type);
            show += "\nRestriction: " + model::to_string(*data_.restriction);
            show += "\nUse target: " + flag_to_string(data_.use_target);
            show += "\nMatrix C is free: " + flag_to_string(data_.cfree);
            show += "\nNumber of parameters: " + std::to_string(opt_out.num_params());
            show += "\nIterations = " + (opt_out.nit ? std::to_string(*opt_out.nit) : std::string("NA"));
            show += "\nOptimization method = " + data_.method.value_or("None");
            show += "\nOptimization time = " + format_time(*data_.time_delta);
            show += "\n\nFinal parameters:";
            show += data_.param_final->to_string();
            show += "\nVariance target:\n";
            show += (data_.var_target ? model::format_matrix(*data_.var_target) : std::string("None")) + "\n";
            show += "\nFinal log-likelihood (with penalty) = " + format_fixed(-opt_out.fun, 2) + "\n";
            show += "Final log-likelihood = " +
                    format_fixed(-opt_out.fun + data_.param_final->penalty(), 2) + "\n";
            show += std::string(width, '=');
            return show;
        }

        void BEKKResults::print_summary() const
        {
            std::cout << to_string() << std::endl;
        }

        std::ostream &operator<<(std::ostream &os, const BEKKResults &results)
        {
            return os << results.to_string();
        }

    } // namespace results
} // namespace bekk
