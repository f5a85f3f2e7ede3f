/**
 * @file test_bekk_results.cpp
 * @brief Unit tests for BEKKResults portfolio diagnostics and reporting
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "model/bekk_params.hpp"
#include "results/bekk_results.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <iostream>
#include <memory>
#include <sstream>

using namespace bekk;
using namespace bekk::results;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace
{
    // Parameter set with a known penalty for log-likelihood checks
    class FixedPenaltyParams : public model::ParameterSet
    {
    public:
        explicit FixedPenaltyParams(double penalty) : penalty_(penalty) {}

        double penalty() const override { return penalty_; }
        std::string to_string() const override { return "\nfixed\n"; }
        std::string get_name() const override { return "FixedPenaltyParams"; }

    private:
        double penalty_;
    };

    // N=2, T=1 with H a scalar multiple of the identity
    ResultsData make_two_asset_data()
    {
        ResultsData data;

        Eigen::MatrixXd innov(1, 2);
        innov << 1.0, 2.0;
        data.innov = innov;

        Eigen::MatrixXd h(2, 2);
        h << 2.0, 0.0,
            0.0, 2.0;
        data.hvar = std::vector<Eigen::MatrixXd>{h};

        return data;
    }

    // N=3, T=4 with correlated covariance matrices
    ResultsData make_three_asset_data()
    {
        ResultsData data;

        Eigen::MatrixXd innov(4, 3);
        innov << 0.5, -1.2, 0.3,
            -0.7, 0.4, 1.1,
            1.3, 0.9, -0.2,
            -0.1, -0.6, 0.8;
        data.innov = innov;

        std::vector<Eigen::MatrixXd> hvar;
        for (int t = 0; t < 4; ++t)
        {
            double scale = 1.0 + 0.25 * t;
            Eigen::MatrixXd h(3, 3);
            h << 1.0, 0.3, 0.1,
                0.3, 2.0, -0.4,
                0.1, -0.4, 1.5;
            h *= scale;
            h(0, 0) += 0.1 * t;
            hvar.push_back(h);
        }
        data.hvar = hvar;

        return data;
    }

    // Fully populated results for report rendering
    ResultsData make_report_data()
    {
        ResultsData data = make_two_asset_data();

        Eigen::MatrixXd target(2, 2);
        target << 1.5, 0.2,
            0.2, 1.0;
        data.var_target = target;

        data.model_type = model::ModelType::STANDARD;
        data.restriction = model::Restriction::FULL;
        data.use_target = true;
        data.cfree = false;
        data.method = "SLSQP";
        data.time_delta = 90.0;

        Eigen::MatrixXd a = 0.3 * Eigen::MatrixXd::Identity(2, 2);
        Eigen::MatrixXd b = 0.9 * Eigen::MatrixXd::Identity(2, 2);
        Eigen::MatrixXd c = Eigen::MatrixXd::Identity(2, 2);
        auto params = std::make_shared<model::BEKKParams>(model::BEKKParams::from_abc(a, b, c));
        data.param_start = params;
        data.param_final = params;

        estimation::OptimizerOutput opt_out;
        opt_out.x = Eigen::VectorXd::Zero(4);
        opt_out.fun = -123.456;
        opt_out.success = true;
        opt_out.message = "Optimization terminated successfully";
        opt_out.nit = 12;
        data.opt_out = opt_out;

        return data;
    }
} // namespace

TEST_CASE("BEKKResults two asset scenario", "[BEKKResults]")
{
    BEKKResults results(make_two_asset_data());

    SECTION("Dimensions")
    {
        REQUIRE(results.nobs() == 1);
        REQUIRE(results.nstocks() == 2);
    }

    SECTION("Equal weights")
    {
        Eigen::MatrixXd w = results.weights(WeightKind::EQUAL);
        REQUIRE(w.rows() == 1);
        REQUIRE(w.cols() == 2);
        REQUIRE(w(0, 0) == 0.5);
        REQUIRE(w(0, 1) == 0.5);
    }

    SECTION("Minimum variance weights equal equal weights for scaled identity")
    {
        Eigen::MatrixXd w = results.weights(WeightKind::MINVAR);
        REQUIRE_THAT(w(0, 0), WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(w(0, 1), WithinAbs(0.5, 1e-12));
    }

    SECTION("Realized variance proxy")
    {
        Eigen::VectorXd rvar = results.portf_rvar("equal");
        REQUIRE(rvar.size() == 1);
        REQUIRE_THAT(rvar(0), WithinAbs(1.5, 1e-12));
    }

    SECTION("Predicted variance")
    {
        Eigen::VectorXd evar = results.portf_evar("equal");
        REQUIRE(evar.size() == 1);
        REQUIRE_THAT(evar(0), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(results.portf_mvar("equal"), WithinAbs(1.0, 1e-12));
    }

    SECTION("Loss ratio")
    {
        Eigen::VectorXd loss = results.loss_var_ratio("equal");
        REQUIRE(loss.size() == 1);
        REQUIRE_THAT(loss(0), WithinAbs(0.5, 1e-12));
    }

    SECTION("Default weighting scheme is equal")
    {
        REQUIRE((results.weights() == results.weights_equal()));
        REQUIRE_THAT(results.portf_mvar(), WithinAbs(1.0, 1e-12));
    }
}

TEST_CASE("BEKKResults weight properties", "[BEKKResults][Weights]")
{
    BEKKResults results(make_three_asset_data());

    SECTION("Equal weights are 1/N everywhere")
    {
        Eigen::MatrixXd w = results.weights_equal();
        REQUIRE(w.rows() == 4);
        REQUIRE(w.cols() == 3);
        for (int t = 0; t < w.rows(); ++t)
        {
            for (int i = 0; i < w.cols(); ++i)
            {
                REQUIRE(w(t, i) == 1.0 / 3.0);
            }
        }
    }

    SECTION("Minimum variance rows sum to one")
    {
        Eigen::MatrixXd w = results.weights("minvar");
        REQUIRE(w.rows() == 4);
        REQUIRE(w.cols() == 3);
        for (int t = 0; t < w.rows(); ++t)
        {
            REQUIRE_THAT(w.row(t).sum(), WithinAbs(1.0, 1e-12));
        }
    }

    SECTION("Minimum variance weights do not exceed equal weight variance")
    {
        Eigen::VectorXd evar_min = results.portf_evar(WeightKind::MINVAR);
        Eigen::VectorXd evar_eq = results.portf_evar(WeightKind::EQUAL);
        for (int t = 0; t < evar_min.size(); ++t)
        {
            REQUIRE(evar_min(t) <= evar_eq(t) + 1e-12);
        }
    }

    SECTION("Kind names are case-insensitive")
    {
        REQUIRE(results.weights("MinVar").isApprox(results.weights(WeightKind::MINVAR)));
        REQUIRE((results.weights(" EQUAL ") == results.weights(WeightKind::EQUAL)));
    }
}

TEST_CASE("BEKKResults minimum variance with correlated assets", "[BEKKResults][Weights]")
{
    ResultsData data;
    Eigen::MatrixXd innov(1, 2);
    innov << 0.3, -0.6;
    data.innov = innov;

    Eigen::MatrixXd h(2, 2);
    h << 2.0, 1.0,
        1.0, 3.0;
    data.hvar = std::vector<Eigen::MatrixXd>{h};

    BEKKResults results(std::move(data));

    // H^{-1} 1 = (2, 1) / 5
    Eigen::MatrixXd w = results.weights_minvar();
    REQUIRE_THAT(w(0, 0), WithinAbs(2.0 / 3.0, 1e-12));
    REQUIRE_THAT(w(0, 1), WithinAbs(1.0 / 3.0, 1e-12));

    // Minimum variance equals 1 / (1^T H^{-1} 1)
    REQUIRE_THAT(results.portf_evar(WeightKind::MINVAR)(0), WithinAbs(5.0 / 3.0, 1e-12));
    REQUIRE_THAT(results.portf_rvar(WeightKind::MINVAR)(0), WithinAbs(0.0, 1e-12));
}

TEST_CASE("BEKKResults aggregate identities", "[BEKKResults]")
{
    BEKKResults results(make_three_asset_data());

    for (WeightKind kind : {WeightKind::EQUAL, WeightKind::MINVAR})
    {
        DYNAMIC_SECTION("Kind " << to_string(kind))
        {
            Eigen::VectorXd rvar = results.portf_rvar(kind);
            Eigen::VectorXd evar = results.portf_evar(kind);
            Eigen::VectorXd loss = results.loss_var_ratio(kind);

            REQUIRE(rvar.size() == 4);
            REQUIRE(evar.size() == 4);
            REQUIRE(loss.size() == 4);

            REQUIRE_THAT(results.portf_mvar(kind), WithinAbs(evar.mean(), 1e-14));

            for (int t = 0; t < loss.size(); ++t)
            {
                REQUIRE_THAT(loss(t), WithinAbs(rvar(t) / evar(t) - 1.0, 1e-14));
            }
        }
    }

    SECTION("Realized proxy is a weighted sum, not a square")
    {
        Eigen::VectorXd rvar = results.portf_rvar(WeightKind::EQUAL);
        // First row: (0.5 - 1.2 + 0.3) / 3
        REQUIRE_THAT(rvar(0), WithinAbs(-0.4 / 3.0, 1e-12));
        REQUIRE(rvar(0) < 0.0);
    }

    SECTION("Predicted variance is the quadratic form")
    {
        Eigen::MatrixXd w = results.weights(WeightKind::MINVAR);
        Eigen::VectorXd evar = results.portf_evar(WeightKind::MINVAR);
        const std::vector<Eigen::MatrixXd> &hvar = *results.data().hvar;
        for (int t = 0; t < evar.size(); ++t)
        {
            const Eigen::MatrixXd &h = hvar[static_cast<size_t>(t)];
            double expected = 0.0;
            for (int i = 0; i < h.rows(); ++i)
            {
                for (int j = 0; j < h.cols(); ++j)
                {
                    expected += w(t, i) * h(i, j) * w(t, j);
                }
            }
            REQUIRE_THAT(evar(t), WithinAbs(expected, 1e-12));
        }
    }
}

TEST_CASE("BEKKResults error handling", "[BEKKResults]")
{
    SECTION("Unsupported weight kind")
    {
        BEKKResults results(make_two_asset_data());
        REQUIRE_THROWS_AS(results.weights("bogus"), std::invalid_argument);
        REQUIRE_THROWS_AS(results.portf_rvar("bogus"), std::invalid_argument);
        REQUIRE_THROWS_AS(results.portf_evar("bogus"), std::invalid_argument);
        REQUIRE_THROWS_AS(results.portf_mvar("bogus"), std::invalid_argument);
        REQUIRE_THROWS_AS(results.loss_var_ratio("bogus"), std::invalid_argument);
    }

    SECTION("Singular covariance in minimum variance weights")
    {
        ResultsData data = make_two_asset_data();
        Eigen::MatrixXd h(2, 2);
        h << 1.0, 1.0,
            1.0, 1.0;
        data.hvar = std::vector<Eigen::MatrixXd>{h};
        BEKKResults results(std::move(data));

        REQUIRE_THROWS_AS(results.weights(WeightKind::MINVAR), std::invalid_argument);
        REQUIRE_THROWS_AS(results.loss_var_ratio(WeightKind::MINVAR), std::invalid_argument);
        REQUIRE_NOTHROW(results.weights(WeightKind::EQUAL));
    }

    SECTION("Badly scaled positive definite covariance is not singular")
    {
        ResultsData data;
        Eigen::MatrixXd innov(1, 2);
        innov << 1.0, 1.0;
        data.innov = innov;
        Eigen::MatrixXd h = Eigen::Vector2d(1e8, 1e-8).asDiagonal();
        data.hvar = std::vector<Eigen::MatrixXd>{h};
        BEKKResults results(std::move(data));

        Eigen::MatrixXd w;
        REQUIRE_NOTHROW(w = results.weights(WeightKind::MINVAR));
        REQUIRE(w.rows() == 1);
        REQUIRE(w.cols() == 2);
        REQUIRE_THAT(w(0, 0), WithinAbs(1e-16 / (1.0 + 1e-16), 1e-20));
        REQUIRE_THAT(w(0, 1), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(w.row(0).sum(), WithinAbs(1.0, 1e-12));
    }

    SECTION("Missing innovations")
    {
        ResultsData data = make_two_asset_data();
        data.innov.reset();
        BEKKResults results(std::move(data));

        REQUIRE_THROWS_AS(results.weights_equal(), std::logic_error);
        REQUIRE_THROWS_AS(results.nobs(), std::logic_error);
    }

    SECTION("Missing variance matrices")
    {
        ResultsData data = make_two_asset_data();
        data.hvar.reset();
        BEKKResults results(std::move(data));

        REQUIRE_NOTHROW(results.portf_rvar(WeightKind::EQUAL));
        REQUIRE_THROWS_AS(results.portf_evar(WeightKind::EQUAL), std::logic_error);
        REQUIRE_THROWS_AS(results.weights_minvar(), std::logic_error);
    }

    SECTION("Zero predicted variance follows IEEE division")
    {
        ResultsData data = make_two_asset_data();
        data.hvar = std::vector<Eigen::MatrixXd>{Eigen::MatrixXd::Zero(2, 2)};
        BEKKResults results(std::move(data));

        Eigen::VectorXd loss = results.loss_var_ratio(WeightKind::EQUAL);
        REQUIRE(std::isinf(loss(0)));
    }
}

TEST_CASE("BEKKResults validation", "[BEKKResults]")
{
    SECTION("Consistent data")
    {
        ResultsData data = make_report_data();
        BEKKResults results(std::move(data));
        REQUIRE_NOTHROW(results.validate());
    }

    SECTION("Partial data is accepted")
    {
        BEKKResults results(ResultsData{});
        REQUIRE_NOTHROW(results.validate());
    }

    SECTION("Observation count mismatch")
    {
        ResultsData data = make_two_asset_data();
        data.hvar->push_back(Eigen::MatrixXd::Identity(2, 2));
        BEKKResults results(std::move(data));
        REQUIRE_THROWS_AS(results.validate(), std::invalid_argument);
    }

    SECTION("Asset count mismatch in variance target")
    {
        ResultsData data = make_two_asset_data();
        data.var_target = Eigen::MatrixXd::Identity(3, 3);
        BEKKResults results(std::move(data));
        REQUIRE_THROWS_AS(results.validate(), std::invalid_argument);
    }

    SECTION("Asset count mismatch in variance matrices")
    {
        ResultsData data = make_two_asset_data();
        data.hvar = std::vector<Eigen::MatrixXd>{Eigen::MatrixXd::Identity(3, 3)};
        BEKKResults results(std::move(data));
        REQUIRE_THROWS_AS(results.validate(), std::invalid_argument);
        REQUIRE_THROWS_AS(results.weights_minvar(), std::invalid_argument);
    }
}

TEST_CASE("BEKKResults report rendering", "[BEKKResults][Report]")
{
    SECTION("Full report layout")
    {
        BEKKResults results(make_report_data());

        const std::string expected =
            "============================================================\n"
            "Model: standard\n"
            "Restriction: full\n"
            "Use target: True\n"
            "Matrix C is free: False\n"
            "Number of parameters: 4\n"
            "Iterations = 12\n"
            "Optimization method = SLSQP\n"
            "Optimization time = 1.5 min\n"
            "\n"
            "Final parameters:\n"
            "A =\n"
            "[[0.3   0]\n"
            " [  0 0.3]]\n"
            "B =\n"
            "[[0.9   0]\n"
            " [  0 0.9]]\n"
            "C =\n"
            "[[1 0]\n"
            " [0 1]]\n"
            "\n"
            "Variance target:\n"
            "[[1.5 0.2]\n"
            " [0.2   1]]\n"
            "\n"
            "Final log-likelihood (with penalty) = 123.46\n"
            "Final log-likelihood = 123.46\n"
            "============================================================";

        REQUIRE(results.to_string() == expected);

        std::ostringstream os;
        os << results;
        REQUIRE(os.str() == expected);
    }

    SECTION("Missing iteration count renders NA")
    {
        ResultsData data = make_report_data();
        data.opt_out->nit.reset();
        BEKKResults results(std::move(data));

        std::string report;
        REQUIRE_NOTHROW(report = results.to_string());
        REQUIRE_THAT(report, ContainsSubstring("\nIterations = NA\n"));
    }

    SECTION("Summary goes to standard output")
    {
        BEKKResults results(make_report_data());

        std::ostringstream captured;
        std::streambuf *old_buf = std::cout.rdbuf(captured.rdbuf());
        results.print_summary();
        std::cout.rdbuf(old_buf);

        REQUIRE(captured.str() == results.to_string() + "\n");
    }

    SECTION("Penalty is added back to the log-likelihood")
    {
        ResultsData data = make_report_data();
        data.param_final = std::make_shared<FixedPenaltyParams>(10.0);
        BEKKResults results(std::move(data));

        std::string report = results.to_string();
        REQUIRE_THAT(report, ContainsSubstring("Final log-likelihood (with penalty) = 123.46\n"));
        REQUIRE_THAT(report, ContainsSubstring("Final log-likelihood = 133.46\n"));
        REQUIRE_THAT(report, ContainsSubstring("Final parameters:\nfixed\n"));
    }

    SECTION("Absent optional fields render None")
    {
        ResultsData data = make_report_data();
        data.use_target.reset();
        data.cfree.reset();
        data.method.reset();
        data.var_target.reset();
        BEKKResults results(std::move(data));

        std::string report = results.to_string();
        REQUIRE_THAT(report, ContainsSubstring("Use target: None\n"));
        REQUIRE_THAT(report, ContainsSubstring("Matrix C is free: None\n"));
        REQUIRE_THAT(report, ContainsSubstring("Optimization method = None\n"));
        REQUIRE_THAT(report, ContainsSubstring("Variance target:\nNone\n"));
    }

    SECTION("Missing required fields fail rendering")
    {
        ResultsData no_model = make_report_data();
        no_model.model_type.reset();
        REQUIRE_THROWS_AS(BEKKResults(no_model).to_string(), std::logic_error);

        ResultsData no_opt = make_report_data();
        no_opt.opt_out.reset();
        REQUIRE_THROWS_AS(BEKKResults(no_opt).to_string(), std::logic_error);

        ResultsData no_params = make_report_data();
        no_params.param_final.reset();
        REQUIRE_THROWS_AS(BEKKResults(no_params).to_string(), std::logic_error);

        ResultsData no_time = make_report_data();
        no_time.time_delta.reset();
        REQUIRE_THROWS_AS(BEKKResults(no_time).to_string(), std::logic_error);
    }
}

TEST_CASE("ResultsData applies run settings", "[BEKKResults]")
{
    estimation::EstimationSettings settings;
    settings.model_type = model::ModelType::SPATIAL;
    settings.restriction = model::Restriction::SCALAR;
    settings.use_target = false;
    settings.cfree = true;
    settings.method = "L-BFGS-B";
    settings.weights = WeightKind::MINVAR;

    ResultsData data;
    data.apply(settings);

    REQUIRE(data.model_type == model::ModelType::SPATIAL);
    REQUIRE(data.restriction == model::Restriction::SCALAR);
    REQUIRE(data.use_target == false);
    REQUIRE(data.cfree == true);
    REQUIRE(data.method == std::string("L-BFGS-B"));
    REQUIRE(data.weights == WeightKind::MINVAR);
}

TEST_CASE("BEKKResults configured weighting scheme", "[BEKKResults][Weights]")
{
    SECTION("Unset scheme falls back to equal weights")
    {
        BEKKResults results(make_three_asset_data());
        REQUIRE(results.configured_weights() == WeightKind::EQUAL);
    }

    SECTION("Scheme from run settings drives the diagnostics")
    {
        estimation::EstimationSettings settings;
        settings.weights = WeightKind::MINVAR;

        ResultsData data = make_three_asset_data();
        data.apply(settings);
        BEKKResults results(std::move(data));

        REQUIRE(results.configured_weights() == WeightKind::MINVAR);
        REQUIRE(results.weights(results.configured_weights()).isApprox(results.weights_minvar()));
        REQUIRE_THAT(results.portf_mvar(results.configured_weights()),
                     WithinAbs(results.portf_mvar(WeightKind::MINVAR), 1e-14));
        REQUIRE(results.portf_mvar(results.configured_weights()) < results.portf_mvar(WeightKind::EQUAL));
    }
}
