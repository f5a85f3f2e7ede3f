/**
 * @file bekk_params.cpp
 * @brief Implementation of BEKK(1,1) parameter set
 */

#include "model/bekk_params.hpp"
#include "model/matrix_format.hpp"
#include <unsupported/Eigen/KroneckerProduct>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace bekk
{
    namespace model
    {
        namespace
        {
            int ab_params(int nstocks, Restriction restriction)
            {
                switch (restriction)
                {
                case Restriction::FULL:
                    return 2 * nstocks * nstocks;
                case Restriction::DIAGONAL:
                    return 2 * nstocks;
                case Restriction::SCALAR:
                    return 2;
                }
                throw std::invalid_argument("Unmapped restriction value");
            }
        } // namespace

        BEKKParams::BEKKParams(Eigen::MatrixXd amat, Eigen::MatrixXd bmat, Eigen::MatrixXd cmat)
            : amat_(std::move(amat)), bmat_(std::move(bmat)), cmat_(std::move(cmat))
        {
        }

        void BEKKParams::validate_ab(const Eigen::MatrixXd &amat, const Eigen::MatrixXd &bmat)
        {
            if (amat.rows() == 0 || amat.rows() != amat.cols())
            {
                throw std::invalid_argument(
                    "Matrix A must be square and non-empty, got " +
                    std::to_string(amat.rows()) + "x" + std::to_string(amat.cols()));
            }

            if (bmat.rows() != amat.rows() || bmat.cols() != amat.cols())
            {
                throw std::invalid_argument(
                    "Matrix B (" + std::to_string(bmat.rows()) + "x" + std::to_string(bmat.cols()) +
                    ") does not match A (" + std::to_string(amat.rows()) + "x" +
                    std::to_string(amat.cols()) + ")");
            }

            if (!amat.allFinite() || !bmat.allFinite())
            {
                throw std::invalid_argument("Matrices A and B must not contain NaN or Inf values");
            }
        }

        BEKKParams BEKKParams::from_abc(const Eigen::MatrixXd &amat,
                                        const Eigen::MatrixXd &bmat,
                                        const Eigen::MatrixXd &cmat)
        {
            validate_ab(amat, bmat);

            if (cmat.rows() != amat.rows() || cmat.cols() != amat.cols())
            {
                throw std::invalid_argument(
                    "Matrix C (" + std::to_string(cmat.rows()) + "x" + std::to_string(cmat.cols()) +
                    ") does not match A (" + std::to_string(amat.rows()) + "x" +
                    std::to_string(amat.cols()) + ")");
            }

            Eigen::MatrixXd lower = cmat.triangularView<Eigen::Lower>();
            return BEKKParams(amat, bmat, lower);
        }

        BEKKParams BEKKParams::from_target(const Eigen::MatrixXd &amat,
                                           const Eigen::MatrixXd &bmat,
                                           const Eigen::MatrixXd &target)
        {
            validate_ab(amat, bmat);

            if (target.rows() != amat.rows() || target.cols() != amat.cols())
            {
                throw std::invalid_argument(
                    "Variance target (" + std::to_string(target.rows()) + "x" +
                    std::to_string(target.cols()) + ") does not match A (" +
                    std::to_string(amat.rows()) + "x" + std::to_string(amat.cols()) + ")");
            }

            // CC^T = S - A S A^T - B S B^T
            Eigen::MatrixXd ccmat = target - amat * target * amat.transpose() - bmat * target * bmat.transpose();
            ccmat = 0.5 * (ccmat + ccmat.transpose());

            Eigen::LLT<Eigen::MatrixXd> llt(ccmat);
            if (llt.info() != Eigen::Success)
            {
                throw std::runtime_error(
                    "Variance target implies an intercept that is not positive definite");
            }

            Eigen::MatrixXd cmat = llt.matrixL();
            return BEKKParams(amat, bmat, cmat);
        }

        int BEKKParams::num_params(int nstocks, Restriction restriction, bool use_target, bool cfree)
        {
            if (nstocks <= 0)
            {
                throw std::invalid_argument(
                    "Number of stocks must be positive, got: " + std::to_string(nstocks));
            }

            int count = ab_params(nstocks, restriction);
            if (!use_target)
            {
                count += cfree ? nstocks * (nstocks + 1) / 2 : nstocks;
            }
            return count;
        }

        Eigen::VectorXd BEKKParams::get_theta(Restriction restriction, bool use_target, bool cfree) const
        {
            const int n = nstocks();
            Eigen::VectorXd theta(num_params(n, restriction, use_target, cfree));
            Eigen::Index pos = 0;

            switch (restriction)
            {
            case Restriction::FULL:
                theta.segment(pos, n * n) = Eigen::Map<const Eigen::VectorXd>(amat_.data(), n * n);
                pos += n * n;
                theta.segment(pos, n * n) = Eigen::Map<const Eigen::VectorXd>(bmat_.data(), n * n);
                pos += n * n;
                break;
            case Restriction::DIAGONAL:
                theta.segment(pos, n) = amat_.diagonal();
                pos += n;
                theta.segment(pos, n) = bmat_.diagonal();
                pos += n;
                break;
            case Restriction::SCALAR:
                theta(pos++) = amat_(0, 0);
                theta(pos++) = bmat_(0, 0);
                break;
            }

            if (!use_target)
            {
                if (cfree)
                {
                    // Lower triangle, column by column
                    for (int j = 0; j < n; ++j)
                    {
                        for (int i = j; i < n; ++i)
                        {
                            theta(pos++) = cmat_(i, j);
                        }
                    }
                }
                else
                {
                    theta.segment(pos, n) = cmat_.diagonal();
                    pos += n;
                }
            }

            return theta;
        }

        BEKKParams BEKKParams::from_theta(const Eigen::VectorXd &theta,
                                          int nstocks,
                                          Restriction restriction,
                                          bool use_target,
                                          bool cfree,
                                          const Eigen::MatrixXd &target)
        {
            const int n = nstocks;
            const int expected = num_params(n, restriction, use_target, cfree);

            if (theta.size() != expected)
            {
                throw std::invalid_argument(
                    "Parameter vector has " + std::to_string(theta.size()) +
                    " elements, expected " + std::to_string(expected) +
                    " for restriction '" + model::to_string(restriction) + "'");
            }

            Eigen::MatrixXd amat;
            Eigen::MatrixXd bmat;
            Eigen::Index pos = 0;

            switch (restriction)
            {
            case Restriction::FULL:
                amat = Eigen::Map<const Eigen::MatrixXd>(theta.data(), n, n);
                pos += n * n;
                bmat = Eigen::Map<const Eigen::MatrixXd>(theta.data() + pos, n, n);
                pos += n * n;
                break;
            case Restriction::DIAGONAL:
                amat = theta.segment(pos, n).asDiagonal();
                pos += n;
                bmat = theta.segment(pos, n).asDiagonal();
                pos += n;
                break;
            case Restriction::SCALAR:
                amat = theta(pos++) * Eigen::MatrixXd::Identity(n, n);
                bmat = theta(pos++) * Eigen::MatrixXd::Identity(n, n);
                break;
            }

            if (use_target)
            {
                if (target.rows() != n || target.cols() != n)
                {
                    throw std::invalid_argument(
                        "Variance targeting requires a " + std::to_string(n) + "x" +
                        std::to_string(n) + " target");
                }
                return from_target(amat, bmat, target);
            }

            Eigen::MatrixXd cmat = Eigen::MatrixXd::Zero(n, n);
            if (cfree)
            {
                for (int j = 0; j < n; ++j)
                {
                    for (int i = j; i < n; ++i)
                    {
                        cmat(i, j) = theta(pos++);
                    }
                }
            }
            else
            {
                cmat.diagonal() = theta.segment(pos, n);
            }

            return from_abc(amat, bmat, cmat);
        }

        Eigen::MatrixXd BEKKParams::transition_matrix() const
        {
            Eigen::MatrixXd kron_a = Eigen::kroneckerProduct(amat_, amat_);
            Eigen::MatrixXd kron_b = Eigen::kroneckerProduct(bmat_, bmat_);
            return kron_a + kron_b;
        }

        double BEKKParams::constraint() const
        {
            Eigen::EigenSolver<Eigen::MatrixXd> solver(transition_matrix(), false);
            return solver.eigenvalues().cwiseAbs().maxCoeff();
        }

        std::optional<Eigen::MatrixXd> BEKKParams::solve_stationary_var() const
        {
            const Eigen::Index n = amat_.rows();
            const Eigen::Index n2 = n * n;

            Eigen::MatrixXd system = Eigen::MatrixXd::Identity(n2, n2) - transition_matrix();
            Eigen::FullPivLU<Eigen::MatrixXd> lu(system);
            if (!lu.isInvertible())
            {
                return std::nullopt;
            }

            Eigen::MatrixXd ccmat = cmat_ * cmat_.transpose();
            Eigen::VectorXd vec_cc = Eigen::Map<const Eigen::VectorXd>(ccmat.data(), n2);
            Eigen::VectorXd vec_h = lu.solve(vec_cc);

            Eigen::MatrixXd hvar = Eigen::Map<const Eigen::MatrixXd>(vec_h.data(), n, n);
            return Eigen::MatrixXd(0.5 * (hvar + hvar.transpose()));
        }

        Eigen::MatrixXd BEKKParams::find_stationary_var() const
        {
            std::optional<Eigen::MatrixXd> hvar = solve_stationary_var();
            if (!hvar)
            {
                throw std::runtime_error(
                    "Unconditional variance is undefined: I - A(x)A - B(x)B is singular");
            }
            return *hvar;
        }

        double BEKKParams::uvar_bad() const
        {
            std::optional<Eigen::MatrixXd> hvar = solve_stationary_var();
            if (!hvar || !hvar->allFinite())
            {
                return 1.0;
            }

            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(*hvar, Eigen::EigenvaluesOnly);
            double bad = 0.0;
            for (Eigen::Index i = 0; i < solver.eigenvalues().size(); ++i)
            {
                bad += std::max(0.0, -solver.eigenvalues()(i));
            }
            return bad;
        }

        double BEKKParams::penalty() const
        {
            return std::max(0.0, constraint() - 1.0) + uvar_bad();
        }

        std::string BEKKParams::to_string() const
        {
            std::string show;
            show += "\nA =\n" + format_matrix(amat_);
            show += "\nB =\n" + format_matrix(bmat_);
            show += "\nC =\n" + format_matrix(cmat_) + "\n";
            return show;
        }

        std::string BEKKParams::get_name() const
        {
            return "BEKKParams";
        }

    } // namespace model
} // namespace bekk
