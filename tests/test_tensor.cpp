#include "mhsa/core/tensor.hpp"
#include "test_check.hpp"
#include <cereal/archives/binary.hpp>
#include <cmath>
#include <iostream>
#include <random>
#include <sstream>
#include <vector>

using mhsa::Tensor;
using mhsa::ShapeMismatch;

int main() {
    std::cout << "Testing Tensor functionality..." << std::endl;
    mhsa_test::Checker checker;

    try {
        // Test 1
        std::cout << "\n=== Test 1: Construction and C-order indexing ===" << std::endl;
        std::vector<float> values(24);
        for (size_t i = 0; i < values.size(); ++i) values[i] = static_cast<float>(i);
        Tensor t({2, 3, 4}, values);

        checker.check(t.size() == 24 && t.ndim() == 3, "size and rank");
        checker.check(t.data().rows() == 6 && t.data().cols() == 4, "leading dims fold into rows");
        checker.check(t(1, 2, 3) == 23.0f && t(0, 1, 2) == 6.0f, "3D index is row-major");
        checker.check(t.dim(5) == 1, "missing axis reports 1");

        Tensor empty;
        checker.check(empty.empty() && empty.size() == 0, "default tensor is empty");

        checker.expect_throw<ShapeMismatch>([&]() { Tensor bad({2, 2}, {1.0f, 2.0f, 3.0f}); },
                                            "value count must match shape");
        checker.expect_throw<ShapeMismatch>([&]() { (void)t(0, 0); }, "2D access on 3D tensor");
        checker.expect_throw<ShapeMismatch>([&]() { (void)t(0, 0, 0, 0); }, "4D access on 3D tensor");

        // Test 2
        std::cout << "\n=== Test 2: Reshape ===" << std::endl;
        Tensor r = t.reshape({4, 3, 2});
        checker.check(r.shape() == std::vector<size_t>({4, 3, 2}), "reshaped shape");
        bool same_order = true;
        for (size_t i = 0; i < r.size(); ++i) same_order = same_order && (r(i) == t(i));
        checker.check(same_order, "reshape keeps element order");
        checker.check(r(3, 2, 1) == 23.0f, "reshaped index");
        checker.expect_throw<ShapeMismatch>([&]() { (void)t.reshape({5, 5}); },
                                            "reshape to different element count");

        // Test 3
        std::cout << "\n=== Test 3: Permute ===" << std::endl;
        Tensor m({2, 3}, {1, 2, 3, 4, 5, 6});
        Tensor mt = m.permute({1, 0});
        checker.check(mt.shape() == std::vector<size_t>({3, 2}), "2D transpose shape");
        checker.check(mt(0, 1) == 4.0f && mt(2, 0) == 3.0f, "2D transpose values");

        std::vector<float> v4(2 * 3 * 4 * 5);
        for (size_t i = 0; i < v4.size(); ++i) v4[i] = static_cast<float>(i);
        Tensor x4({2, 3, 4, 5}, v4);
        Tensor p4 = x4.permute({0, 2, 1, 3});
        bool permuted = p4.shape() == std::vector<size_t>({2, 4, 3, 5});
        for (size_t a = 0; a < 2; ++a)
            for (size_t b = 0; b < 3; ++b)
                for (size_t c = 0; c < 4; ++c)
                    for (size_t d = 0; d < 5; ++d)
                        permuted = permuted && (p4(a, c, b, d) == x4(a, b, c, d));
        checker.check(permuted, "4D permute {0, 2, 1, 3}");

        Tensor back = p4.permute({0, 2, 1, 3});
        checker.check(Tensor::max_abs_diff(back, x4) == 0.0f, "permute is its own inverse here");

        checker.expect_throw<ShapeMismatch>([&]() { (void)x4.permute({0, 1, 2}); }, "permutation rank");
        checker.expect_throw<ShapeMismatch>([&]() { (void)x4.permute({0, 1, 1, 3}); }, "repeated axis");

        // Test 4
        std::cout << "\n=== Test 4: Select ===" << std::endl;
        Tensor s = t.select(1);
        checker.check(s.shape() == std::vector<size_t>({3, 4}), "select drops first axis");
        checker.check(s(0, 0) == 12.0f && s(2, 3) == 23.0f, "select values");
        checker.expect_throw<ShapeMismatch>([&]() { (void)t.select(2); }, "select out of range");

        // Test 5
        std::cout << "\n=== Test 5: Softmax over last axis ===" << std::endl;
        Tensor logits({2, 3}, {0.0f, 1.0f, 2.0f, 1000.0f, 1001.0f, 1002.0f});
        Tensor probs = logits.softmax();
        bool finite = true;
        for (size_t i = 0; i < probs.size(); ++i) finite = finite && std::isfinite(probs(i));
        checker.check(finite, "large logits stay finite");
        checker.check(std::abs(probs(0, 0) + probs(0, 1) + probs(0, 2) - 1.0f) < 1e-6f, "row 0 sums to 1");
        checker.check(std::abs(probs(1, 0) + probs(1, 1) + probs(1, 2) - 1.0f) < 1e-6f, "row 1 sums to 1");
        checker.check(std::abs(probs(0, 2) - probs(1, 2)) < 1e-6f, "softmax is shift invariant");
        float expected = std::exp(2.0f) / (1.0f + std::exp(1.0f) + std::exp(2.0f));
        checker.check(std::abs(probs(0, 2) - expected) < 1e-6f, "softmax value");

        // Test 6
        std::cout << "\n=== Test 6: Initialization ===" << std::endl;
        std::mt19937 gen(7);
        Tensor u = Tensor::uniform({64, 32}, -0.5f, 0.5f, gen);
        checker.check(u.data().maxCoeff() <= 0.5f && u.data().minCoeff() >= -0.5f, "uniform bounds");
        std::mt19937 gen_a(11);
        std::mt19937 gen_b(11);
        checker.check(Tensor::allclose(Tensor::xavier({8, 8}, gen_a), Tensor::xavier({8, 8}, gen_b), 0.0f),
                      "same seed gives same init");
        checker.check(Tensor::ones({3, 2}).data().sum() == 6.0f, "ones");

        // Test 7
        std::cout << "\n=== Test 7: Cereal serialization ===" << std::endl;
        std::stringstream stream;
        {
            cereal::BinaryOutputArchive archive(stream);
            archive(t);
        }
        Tensor loaded;
        {
            cereal::BinaryInputArchive archive(stream);
            archive(loaded);
        }
        checker.check(loaded.shape() == t.shape(), "shape restored");
        checker.check(Tensor::max_abs_diff(loaded, t) == 0.0f, "data restored");

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return checker.finish("Tensor");
}
