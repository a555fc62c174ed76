#pragma once

#include <Eigen/Dense>
#include <cereal/cereal.hpp>
#include <cstdint>
#include <string>

namespace cereal {

// Dense Eigen matrices are stored as (rows, cols) followed by the raw coefficients
// in the matrix's own storage order.
template <class Archive, typename Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
void save(Archive& archive, const Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>& matrix) {
    std::int64_t rows = matrix.rows();
    std::int64_t cols = matrix.cols();
    archive(rows, cols);
    archive(binary_data(matrix.data(), static_cast<std::size_t>(matrix.size()) * sizeof(Scalar)));
}

template <class Archive, typename Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
void load(Archive& archive, Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>& matrix) {
    std::int64_t rows = 0;
    std::int64_t cols = 0;
    archive(rows, cols);
    if (rows < 0 || cols < 0) {
        throw Exception("Eigen matrix with negative dimensions " + std::to_string(rows) + " x " +
                        std::to_string(cols));
    }

    matrix.resize(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    archive(binary_data(matrix.data(), static_cast<std::size_t>(matrix.size()) * sizeof(Scalar)));
}

} // namespace cereal
