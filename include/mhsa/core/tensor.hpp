#pragma once

#include "mhsa/core/eigen_serialization.hpp"
#include "mhsa/core/errors.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include <cereal/types/vector.hpp>
#include <cereal/archives/binary.hpp>

namespace mhsa {

// Row-major so that a flat index over the storage is the C-order index of the tensor.
using Storage = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

inline std::string shape_to_string(const std::vector<size_t>& shape) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        out << shape[i];
        if (i + 1 < shape.size()) out << ", ";
    }
    out << "]";
    return out.str();
}

inline size_t shape_numel(const std::vector<size_t>& shape) {
    size_t total = 1;
    for (auto dim : shape) total *= dim;
    return total;
}

// Dense float tensor of any rank. The last dimension maps to the columns of the
// backing Eigen matrix and all leading dimensions are folded into its rows, so a
// [batch, seq_len, features] tensor is a (batch * seq_len) x features matrix.
class Tensor {
public:
    Tensor() : data_(Storage(1, 0)), shape_({0}) {}

    explicit Tensor(const std::vector<size_t>& shape) : shape_(shape) {
        data_ = Storage::Zero(rows_for(shape_), cols_for(shape_));
    }

    Tensor(const std::vector<size_t>& shape, const std::vector<float>& values) : shape_(shape) {
        if (values.size() != shape_numel(shape)) {
            throw ShapeMismatch("Tensor of shape " + shape_to_string(shape) + " needs " +
                                std::to_string(shape_numel(shape)) + " values, got " +
                                std::to_string(values.size()));
        }
        data_ = Eigen::Map<const Storage>(values.data(), rows_for(shape_), cols_for(shape_));
    }

    // Copies `data` (any row/col split) into a tensor of the given shape.
    static Tensor from_storage(const Storage& data, const std::vector<size_t>& shape) {
        if (static_cast<size_t>(data.size()) != shape_numel(shape)) {
            throw ShapeMismatch("Storage with " + std::to_string(data.size()) +
                                " elements cannot back a tensor of shape " + shape_to_string(shape));
        }
        Tensor result;
        result.shape_ = shape;
        result.data_ = Eigen::Map<const Storage>(data.data(), rows_for(shape), cols_for(shape));
        return result;
    }

    // Accessors
    const std::vector<size_t>& shape() const { return shape_; }
    Storage& data() { return data_; }
    const Storage& data() const { return data_; }
    float* raw() { return data_.data(); }
    const float* raw() const { return data_.data(); }

    size_t size() const { return static_cast<size_t>(data_.size()); }
    bool empty() const { return size() == 0; }
    size_t ndim() const { return shape_.size(); }
    size_t dim(size_t axis) const {
        return (axis < shape_.size()) ? shape_[axis] : 1;
    }

    // Element access
    float& operator()(size_t i) { return data_.data()[i]; }
    float operator()(size_t i) const { return data_.data()[i]; }

    float& operator()(size_t i, size_t j) { return data_.data()[offset({i, j})]; }
    float operator()(size_t i, size_t j) const { return data_.data()[offset({i, j})]; }

    float& operator()(size_t i, size_t j, size_t k) { return data_.data()[offset({i, j, k})]; }
    float operator()(size_t i, size_t j, size_t k) const { return data_.data()[offset({i, j, k})]; }

    float& operator()(size_t i, size_t j, size_t k, size_t l) { return data_.data()[offset({i, j, k, l})]; }
    float operator()(size_t i, size_t j, size_t k, size_t l) const { return data_.data()[offset({i, j, k, l})]; }

    Tensor reshape(const std::vector<size_t>& new_shape) const {
        if (shape_numel(new_shape) != size()) {
            throw ShapeMismatch("Cannot reshape " + shape_to_string(shape_) + " into " +
                                shape_to_string(new_shape));
        }
        return from_storage(data_, new_shape);
    }

    // General axis permutation: result.shape()[i] == shape()[axes[i]].
    Tensor permute(const std::vector<size_t>& axes) const {
        const size_t rank = shape_.size();
        if (axes.size() != rank) {
            throw ShapeMismatch("Permutation of rank " + std::to_string(axes.size()) +
                                " applied to tensor of shape " + shape_to_string(shape_));
        }
        std::vector<bool> seen(rank, false);
        for (auto axis : axes) {
            if (axis >= rank || seen[axis]) {
                throw ShapeMismatch("Invalid permutation " + shape_to_string(axes) +
                                    " for tensor of shape " + shape_to_string(shape_));
            }
            seen[axis] = true;
        }

        std::vector<size_t> strides = strides_for(shape_);
        std::vector<size_t> out_shape(rank);
        std::vector<size_t> src_strides(rank);
        for (size_t i = 0; i < rank; ++i) {
            out_shape[i] = shape_[axes[i]];
            src_strides[i] = strides[axes[i]];
        }

        Tensor result(out_shape);
        const float* src = raw();
        float* dst = result.raw();

        std::vector<size_t> index(rank, 0);
        size_t src_offset = 0;
        for (size_t flat = 0; flat < result.size(); ++flat) {
            dst[flat] = src[src_offset];
            // Advance the output multi-index like an odometer, tracking the source offset.
            for (size_t d = rank; d-- > 0;) {
                if (++index[d] < out_shape[d]) {
                    src_offset += src_strides[d];
                    break;
                }
                src_offset -= (out_shape[d] - 1) * src_strides[d];
                index[d] = 0;
            }
        }
        return result;
    }

    // Sub-tensor at position `index` of the first axis.
    Tensor select(size_t index) const {
        if (shape_.size() < 2 || index >= shape_[0]) {
            throw ShapeMismatch("Cannot select index " + std::to_string(index) +
                                " from tensor of shape " + shape_to_string(shape_));
        }
        std::vector<size_t> sub_shape(shape_.begin() + 1, shape_.end());
        const size_t count = shape_numel(sub_shape);
        Storage block = Eigen::Map<const Storage>(raw() + index * count,
                                                  rows_for(sub_shape), cols_for(sub_shape));
        return from_storage(block, sub_shape);
    }

    // Softmax over the last axis. The per-row max is subtracted before
    // exponentiation so large logits do not overflow.
    Tensor softmax() const {
        if (empty()) {
            return *this;
        }
        Eigen::VectorXf row_max = data_.rowwise().maxCoeff();
        Storage exp_values = (data_.colwise() - row_max).array().exp().matrix();
        Eigen::VectorXf row_sum = exp_values.rowwise().sum();
        exp_values.array().colwise() /= row_sum.array();
        return from_storage(exp_values, shape_);
    }

    // Initialization
    static Tensor zeros(const std::vector<size_t>& shape) {
        return Tensor(shape);
    }

    static Tensor ones(const std::vector<size_t>& shape) {
        Tensor result(shape);
        result.data_.setOnes();
        return result;
    }

    static Tensor randn(const std::vector<size_t>& shape, float mean, float stddev, std::mt19937& gen) {
        Tensor result(shape);
        std::normal_distribution<float> dist(mean, stddev);
        result.data_ = Storage::NullaryExpr(
            result.data_.rows(), result.data_.cols(),
            [&]() { return dist(gen); }
        );
        return result;
    }

    static Tensor uniform(const std::vector<size_t>& shape, float low, float high, std::mt19937& gen) {
        Tensor result(shape);
        std::uniform_real_distribution<float> dist(low, high);
        result.data_ = Storage::NullaryExpr(
            result.data_.rows(), result.data_.cols(),
            [&]() { return dist(gen); }
        );
        return result;
    }

    static Tensor xavier(const std::vector<size_t>& shape, std::mt19937& gen) {
        if (shape.size() < 2) {
            throw ShapeMismatch("Xavier initialization requires at least 2 dimensions");
        }
        float stddev = std::sqrt(2.0f / static_cast<float>(shape[0] + shape[1]));
        return randn(shape, 0.0f, stddev, gen);
    }

    // Comparison helpers
    static float max_abs_diff(const Tensor& a, const Tensor& b) {
        if (a.shape_ != b.shape_) {
            throw ShapeMismatch("Cannot compare tensors of shape " + shape_to_string(a.shape_) +
                                " and " + shape_to_string(b.shape_));
        }
        if (a.empty()) {
            return 0.0f;
        }
        return (a.data_ - b.data_).cwiseAbs().maxCoeff();
    }

    static bool allclose(const Tensor& a, const Tensor& b, float tolerance = 1e-5f) {
        return a.shape_ == b.shape_ && max_abs_diff(a, b) <= tolerance;
    }

    // Cereal serialization
    template <class Archive>
    void save(Archive& archive) const {
        archive(cereal::make_nvp("shape", shape_), cereal::make_nvp("data", data_));
    }

    template <class Archive>
    void load(Archive& archive) {
        std::vector<size_t> shape;
        Storage data;
        archive(cereal::make_nvp("shape", shape), cereal::make_nvp("data", data));
        *this = from_storage(data, shape);
    }

private:
    static Eigen::Index cols_for(const std::vector<size_t>& shape) {
        return shape.empty() ? 1 : static_cast<Eigen::Index>(shape.back());
    }

    static Eigen::Index rows_for(const std::vector<size_t>& shape) {
        size_t rows = 1;
        for (size_t i = 0; i + 1 < shape.size(); ++i) rows *= shape[i];
        return static_cast<Eigen::Index>(rows);
    }

    static std::vector<size_t> strides_for(const std::vector<size_t>& shape) {
        std::vector<size_t> strides(shape.size(), 1);
        for (size_t d = shape.size(); d-- > 1;) {
            strides[d - 1] = strides[d] * shape[d];
        }
        return strides;
    }

    size_t offset(std::initializer_list<size_t> index) const {
        if (index.size() != shape_.size()) {
            throw ShapeMismatch(std::to_string(index.size()) + "D access on tensor of shape " +
                                shape_to_string(shape_));
        }
        size_t flat = 0;
        size_t axis = 0;
        for (auto i : index) {
            flat = flat * shape_[axis] + i;
            ++axis;
        }
        return flat;
    }

    Storage data_;
    std::vector<size_t> shape_;
};

} // namespace mhsa
