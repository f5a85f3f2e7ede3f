/**
 * @file matrix_format.cpp
 * @brief Implementation of bracketed matrix rendering
 */

#include "model/matrix_format.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace bekk
{
    namespace model
    {

        std::string format_matrix(const Eigen::MatrixXd &matrix)
        {
            if (matrix.size() == 0)
            {
                return "[]";
            }

            const Eigen::Index rows = matrix.rows();
            const Eigen::Index cols = matrix.cols();

            // Render every element first to find the common column width
            std::vector<std::string> cells;
            cells.reserve(static_cast<size_t>(matrix.size()));
            size_t width = 0;

            for (Eigen::Index i = 0; i < rows; ++i)
            {
                for (Eigen::Index j = 0; j < cols; ++j)
                {
                    std::ostringstream cell;
                    cell << std::setprecision(8) << matrix(i, j);
                    cells.push_back(cell.str());
                    width = std::max(width, cells.back().size());
                }
            }

            std::ostringstream out;
            out << "[";
            for (Eigen::Index i = 0; i < rows; ++i)
            {
                if (i > 0)
                {
                    out << "\n ";
                }
                out << "[";
                for (Eigen::Index j = 0; j < cols; ++j)
                {
                    if (j > 0)
                    {
                        out << " ";
                    }
                    out << std::setw(static_cast<int>(width))
                        << cells[static_cast<size_t>(i * cols + j)];
                }
                out << "]";
            }
            out << "]";

            return out.str();
        }

    } // namespace model
} // namespace bekk
