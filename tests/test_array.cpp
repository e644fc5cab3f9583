#include <gtest/gtest.h>

#include <cmath>
#include <sstream>

#include "recipegrad/array.h"

static std::vector<float> values(const Array& a) {
    return a.to_vector();
}

TEST(Shapes, NumelAndBroadcast) {
    EXPECT_EQ(numel({}), 1u);
    EXPECT_EQ(numel({2, 3, 4}), 24u);
    EXPECT_EQ(numel({2, 0}), 0u);

    EXPECT_EQ(broadcast_shapes({4, 1}, {3}), (std::vector<size_t>{4, 3}));
    EXPECT_EQ(broadcast_shapes({}, {2, 2}), (std::vector<size_t>{2, 2}));
    EXPECT_EQ(broadcast_shapes({2, 1, 4}, {3, 1}), (std::vector<size_t>{2, 3, 4}));
    EXPECT_THROW(broadcast_shapes({2, 3}, {4}), std::invalid_argument);
}

TEST(Shapes, RavelAndUnravel) {
    std::vector<size_t> shape = {2, 3, 4};
    for (size_t i = 0; i < numel(shape); ++i) {
        EXPECT_EQ(ravel_index(unravel_index(i, shape), shape), i);
    }
    /* leading coordinates and size-1 axes are ignored */
    EXPECT_EQ(ravel_index({1, 2, 3}, {1, 4}), 3u);
}

TEST(ArrayBasics, ConstructionAndAliasing) {
    Array a({1.0f, 2.0f, 3.0f, 4.0f}, {2, 2});
    EXPECT_EQ(a.ndim(), 2u);
    EXPECT_EQ(a.size(), 4u);
    EXPECT_THROW(Array({1.0f, 2.0f}, {3}), std::invalid_argument);

    Array alias = a;
    alias[0] = 10.0f;
    EXPECT_FLOAT_EQ(a[0], 10.0f);
    EXPECT_TRUE(alias.shares_buffer(a));

    Array independent = a.copy();
    independent[1] = -1.0f;
    EXPECT_FLOAT_EQ(a[1], 2.0f);
    EXPECT_FALSE(independent.shares_buffer(a));
}

TEST(ArrayBasics, ZeroDimensional) {
    Array s = Array::scalar(2.5f);
    EXPECT_EQ(s.ndim(), 0u);
    EXPECT_EQ(s.size(), 1u);
    EXPECT_FLOAT_EQ(s.item(), 2.5f);

    EXPECT_THROW(Array::ones({2}).item(), std::runtime_error);
    EXPECT_FLOAT_EQ(Array::full({1, 1}, 3.0f).item(), 3.0f);
}

TEST(ArrayBasics, FillAndAccumulate) {
    Array a = Array::zeros({3});
    a.add_(Array({1.0f, 2.0f, 3.0f}));
    a.add_(Array({1.0f, 1.0f, 1.0f}));
    EXPECT_EQ(values(a), (std::vector<float>{2.0f, 3.0f, 4.0f}));
    EXPECT_THROW(a.add_(Array::ones({1, 3})), std::invalid_argument);

    a.fill(0.0f);
    EXPECT_EQ(values(a), (std::vector<float>{0.0f, 0.0f, 0.0f}));
}

TEST(ArrayBasics, Printing) {
    std::ostringstream os;
    os << Array({1.0f, 2.0f, 3.0f, 4.0f}, {2, 2});
    EXPECT_EQ(os.str(), "Array([[1, 2], [3, 4]], shape=[2, 2])");

    std::ostringstream scalar;
    scalar << Array::scalar(5.0f);
    EXPECT_EQ(scalar.str(), "Array(5, shape=[])");
}

TEST(Elementwise, BroadcastingArithmetic) {
    Array a({1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f}, {2, 3});
    Array row({10.0f, 20.0f, 30.0f});
    Array column({2.0f, 4.0f}, {2, 1});

    EXPECT_EQ(values(add(a, row)), (std::vector<float>{11, 22, 33, 14, 25, 36}));
    EXPECT_EQ(values(subtract(a, row)), (std::vector<float>{-9, -18, -27, -6, -15, -24}));
    EXPECT_EQ(values(multiply(a, column)), (std::vector<float>{2, 4, 6, 16, 20, 24}));
    EXPECT_EQ(values(divide(a, column)), (std::vector<float>{0.5f, 1.0f, 1.5f, 1.0f, 1.25f, 1.5f}));
    EXPECT_EQ(add(a, Array::scalar(1.0f)).shape(), a.shape());
    EXPECT_THROW(add(a, Array::ones({2})), std::invalid_argument);
}

TEST(Elementwise, DivisionByZeroIsIEEE) {
    Array q = divide(Array({1.0f, -1.0f, 0.0f}), Array::zeros({3}));
    EXPECT_TRUE(std::isinf(q[0]) && q[0] > 0);
    EXPECT_TRUE(std::isinf(q[1]) && q[1] < 0);
    EXPECT_TRUE(std::isnan(q[2]));
}

TEST(Elementwise, UnaryFunctions) {
    Array a({0.0f, 1.0f});
    EXPECT_EQ(values(negative(a)), (std::vector<float>{-0.0f, -1.0f}));
    EXPECT_NEAR(exp(a)[1], std::exp(1.0f), 1e-6f);
    EXPECT_NEAR(log(Array({1.0f, std::exp(2.0f)}))[1], 2.0f, 1e-6f);
    EXPECT_EQ(values(maximum(Array({1.0f, 5.0f}), Array({3.0f, 2.0f}))), (std::vector<float>{3.0f, 5.0f}));
}

TEST(Reduction, SumAxisAndKeepdims) {
    Array a({1, 2, 3, 4, 5, 6}, {2, 3});

    Array total = sum(a);
    EXPECT_EQ(total.ndim(), 0u);
    EXPECT_FLOAT_EQ(total.item(), 21.0f);

    Array kept = sum(a, std::nullopt, true);
    EXPECT_EQ(kept.shape(), (std::vector<size_t>{1, 1}));

    Array columns = sum(a, 0);
    EXPECT_EQ(columns.shape(), (std::vector<size_t>{3}));
    EXPECT_EQ(values(columns), (std::vector<float>{5, 7, 9}));

    Array rows = sum(a, -1, true);
    EXPECT_EQ(rows.shape(), (std::vector<size_t>{2, 1}));
    EXPECT_EQ(values(rows), (std::vector<float>{6, 15}));

    EXPECT_THROW(sum(a, 2), std::out_of_range);
    EXPECT_THROW(sum(a, -3), std::out_of_range);
}

TEST(Matmul, TwoDimensional) {
    Array a({1, 2, 3, 4, 5, 6}, {2, 3});
    Array b({7, 8, 9, 10, 11, 12}, {3, 2});
    Array c = matmul(a, b);
    EXPECT_EQ(c.shape(), (std::vector<size_t>{2, 2}));
    EXPECT_EQ(values(c), (std::vector<float>{58, 64, 139, 154}));
}

TEST(Matmul, BroadcastsBatchAxes) {
    Array a({1, 0, 0, 1, 2, 0, 0, 2}, {2, 2, 2});
    Array b({1, 2, 3, 4}, {2, 2});
    Array c = matmul(a, b);
    EXPECT_EQ(c.shape(), (std::vector<size_t>{2, 2, 2}));
    EXPECT_EQ(values(c), (std::vector<float>{1, 2, 3, 4, 2, 4, 6, 8}));
}

TEST(Matmul, RejectsBadShapes) {
    EXPECT_THROW(matmul(Array::ones({3}), Array::ones({3, 1})), std::invalid_argument);
    EXPECT_THROW(matmul(Array::ones({2, 3}), Array::ones({2, 3})), std::invalid_argument);
    EXPECT_THROW(matmul(Array::ones({2, 2, 3}), Array::ones({3, 3, 1})), std::invalid_argument);
}

TEST(Layout, PermuteReshapeBroadcast) {
    Array a({1, 2, 3, 4, 5, 6}, {2, 3});

    Array t = swap_last_axes(a);
    EXPECT_EQ(t.shape(), (std::vector<size_t>{3, 2}));
    EXPECT_EQ(values(t), (std::vector<float>{1, 4, 2, 5, 3, 6}));
    EXPECT_EQ(values(permute(a, {1, 0})), values(t));
    EXPECT_THROW(permute(a, {0, 0}), std::invalid_argument);

    Array r = reshape(a, {3, 2});
    EXPECT_EQ(values(r), values(a));
    EXPECT_FALSE(r.shares_buffer(a));
    EXPECT_THROW(reshape(a, {4}), std::invalid_argument);

    Array b = broadcast_to(Array({1, 2}, {2, 1}), {2, 3});
    EXPECT_EQ(values(b), (std::vector<float>{1, 1, 1, 2, 2, 2}));
    EXPECT_THROW(broadcast_to(a, {3, 3}), std::invalid_argument);

    EXPECT_EQ(expand_dims(a, 1).shape(), (std::vector<size_t>{2, 1, 3}));
    EXPECT_THROW(expand_dims(a, 3), std::out_of_range);
}

TEST(Indexing, IntegerTupleAndArray) {
    Array a({1, 2, 3, 4, 5, 6}, {3, 2});

    Array row = take(a, Index(-1));
    EXPECT_EQ(row.shape(), (std::vector<size_t>{2}));
    EXPECT_EQ(values(row), (std::vector<float>{5, 6}));

    Array element = take(a, Index(std::vector<long>{1, 0}));
    EXPECT_EQ(element.ndim(), 0u);
    EXPECT_FLOAT_EQ(element.item(), 3.0f);

    Array gathered = take(a, Index(Array({2, 0, 2})));
    EXPECT_EQ(gathered.shape(), (std::vector<size_t>{3, 2}));
    EXPECT_EQ(values(gathered), (std::vector<float>{5, 6, 1, 2, 5, 6}));

    EXPECT_THROW(take(a, Index(3)), std::out_of_range);
    EXPECT_THROW(take(a, Index(std::vector<long>{0, 0, 0})), std::out_of_range);
    EXPECT_THROW(take(a, Index(Array({0.5f}))), std::invalid_argument);
    EXPECT_THROW(take(a, Index(Array({1e20f}))), std::out_of_range);
    EXPECT_THROW(take(a, Index(Array({-1e20f}))), std::out_of_range);
    EXPECT_THROW(take(Array::scalar(1.0f), Index(0)), std::invalid_argument);
}

TEST(Indexing, IndexAddAccumulates) {
    Array target = Array::zeros({3, 2});
    index_add(target, Index(Array({0, 0, 2})), Array::ones({3, 2}));
    EXPECT_EQ(values(target), (std::vector<float>{2, 2, 0, 0, 1, 1}));

    EXPECT_THROW(index_add(target, Index(1), Array::ones({3})), std::invalid_argument);
}
