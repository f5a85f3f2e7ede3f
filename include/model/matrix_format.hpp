/**
 * @file matrix_format.hpp
 * @brief Bracketed text layout for matrices in result reports
 *
 * Produces the nested-bracket layout used throughout the reports:
 *
 * @code
 * [[2.5 0.1]
 *  [0.1   1]]
 * @endcode
 *
 * Elements are printed with 8 significant digits and right-aligned to a
 * common column width.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace bekk
{
    namespace model
    {

        /**
         * @brief Render a matrix in bracketed row layout
         * @param matrix Matrix to render (may be empty)
         * @return Multi-line string without trailing newline
         */
        std::string format_matrix(const Eigen::MatrixXd &matrix);

    } // namespace model
} // namespace bekk
