#pragma once
#include <Eigen/Dense>
#include <cstddef>

namespace flue::core {

template<typename Scalar = double, int Size = Eigen::Dynamic>
using FixedMathVector = Eigen::Vector<Scalar, Size>;

// Row-major view over sweep data: one row per operating point
template<typename Scalar = double>
class Matrix{
private:
    Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> data_;

public:
    Matrix() = default;
    Matrix(std::size_t rows, std::size_t cols) : data_(rows, cols) {}

    [[nodiscard]] auto rows() const noexcept -> std::size_t {return data_.rows();}
    [[nodiscard]] auto cols() const noexcept -> std::size_t {return data_.cols();}

    auto operator()(std::size_t i, std::size_t j) -> Scalar& {return data_(i,j);}
    [[nodiscard]] auto operator()(std::size_t i, std::size_t j) const -> const Scalar& {return data_(i,j);}

    [[nodiscard]] auto data() const noexcept -> const Scalar* {return data_.data();}
    void fill(Scalar value) { data_.setConstant(value); }
};
}
