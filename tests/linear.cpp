#include <gtest/gtest.h>

#include <cmath>

#include "recipegrad/modules.h"

TEST(GeneratorTest, SameSeedSameParameters) {
    Generator gen_a(7);
    Generator gen_b(7);
    Linear a(4, 3, gen_a);
    Linear b(4, 3, gen_b);

    EXPECT_EQ(a.weight.array().to_vector(), b.weight.array().to_vector());
    EXPECT_EQ(a.bias.array().to_vector(), b.bias.array().to_vector());

    Generator gen_c(8);
    Linear c(4, 3, gen_c);
    EXPECT_NE(a.weight.array().to_vector(), c.weight.array().to_vector());
}

TEST(GeneratorTest, ReseedRestartsTheSequence) {
    Generator gen(3);
    Tensor first = Tensor::randn({5}, gen);
    gen.seed(3);
    Tensor second = Tensor::randn({5}, gen);
    EXPECT_EQ(first.array().to_vector(), second.array().to_vector());
}

TEST(Initialization, ShapesAndBounds) {
    Generator gen(0);

    Tensor u = Tensor::uniform({2, 3}, -0.5f, 0.25f, gen);
    EXPECT_EQ(u.shape(), (std::vector<size_t>{2, 3}));
    for (float v : u.array().to_vector()) {
        EXPECT_GE(v, -0.5f);
        EXPECT_LE(v, 0.25f);
    }

    Tensor bias = Tensor::bias_uniform(16, 5, gen, true);
    EXPECT_EQ(bias.shape(), (std::vector<size_t>{5}));
    EXPECT_TRUE(bias.requires_grad());
    for (float v : bias.array().to_vector()) {
        EXPECT_LE(std::fabs(v), 0.25f);
    }

    Tensor weight = Tensor::randn_he(16, 5, gen, false);
    EXPECT_EQ(weight.shape(), (std::vector<size_t>{16, 5}));
    EXPECT_FALSE(weight.requires_grad());
}

TEST(LinearLayer, ForwardComputesAffineMap) {
    Generator gen(1);
    Linear layer(2, 2, gen);
    layer.weight.array() = Array({1.0f, 2.0f, 3.0f, 4.0f}, {2, 2});
    layer.bias.array() = Array({0.5f, -0.5f}, {2});

    Tensor x({1.0, 1.0, 0.0, 2.0}, {2, 2});
    Tensor y = layer.forward(x);

    EXPECT_EQ(y.shape(), (std::vector<size_t>{2, 2}));
    std::vector<float> expected = {4.5f, 5.5f, 6.5f, 7.5f};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(y.array()[i], expected[i], 1e-6f);
    }
}

TEST(LinearLayer, BackwardReachesParameters) {
    Generator gen(2);
    Linear layer(3, 2, gen);
    Tensor x({1.0, 2.0, 3.0, -1.0, 0.0, 1.0}, {2, 3});

    layer.forward(x).sum().backward();

    /* d/dW sum(xW + b) = x^T 1, d/db = batch size */
    std::vector<float> expected_weight = {0.0f, 0.0f, 2.0f, 2.0f, 4.0f, 4.0f};
    for (size_t i = 0; i < expected_weight.size(); ++i) {
        EXPECT_NEAR(layer.weight.grad()[i], expected_weight[i], 1e-6f);
    }
    EXPECT_NEAR(layer.bias.grad()[0], 2.0f, 1e-6f);
    EXPECT_NEAR(layer.bias.grad()[1], 2.0f, 1e-6f);
}

TEST(LinearLayer, EvalAndTrainToggleTracking) {
    Generator gen(3);
    Linear layer(2, 2, gen);
    Tensor x({1.0, 2.0}, {1, 2});
    std::vector<float> before = layer.forward(x).array().to_vector();

    layer.eval();
    EXPECT_FALSE(layer.weight.requires_grad());
    EXPECT_FALSE(layer.bias.requires_grad());
    EXPECT_EQ(layer.forward(x).array().to_vector(), before);

    layer.train();
    EXPECT_TRUE(layer.weight.requires_grad());
    EXPECT_TRUE(layer.bias.requires_grad());
}

TEST(MLPModel, RejectsSingleSize) {
    Generator gen(0);
    EXPECT_THROW(MLP({4}, gen), std::invalid_argument);
}

TEST(MLPModel, ForwardShape) {
    Generator gen(4);
    MLP model({5, 8, 3}, gen);
    EXPECT_EQ(model.layers.size(), 2u);
    EXPECT_EQ(model.parameters().size(), 4u);

    Tensor x = Tensor::randn({6, 5}, gen);
    EXPECT_EQ(model.forward(x).shape(), (std::vector<size_t>{6, 3}));
}

TEST(ReLULayer, ZeroesNegatives) {
    Tensor x({-1.0, 0.0, 2.0}, true);
    Tensor y = ReLU().forward(x);
    EXPECT_EQ(y.array().to_vector(), (std::vector<float>{0.0f, 0.0f, 2.0f}));

    y.sum().backward();
    EXPECT_EQ(x.grad().to_vector(), (std::vector<float>{0.0f, 1.0f, 1.0f}));
}

TEST(CrossEntropy, UniformLogits) {
    Tensor logits = Tensor::from_array(Array::zeros({2, 4}), true);
    Tensor labels({1, 3}, std::vector<size_t>{2});

    Tensor loss = CrossEntropyLoss(logits, labels);
    EXPECT_EQ(loss.ndim(), 0u);
    EXPECT_NEAR(loss.item(), std::log(4.0f), 1e-5f);

    /* gradient is (softmax - onehot) / N */
    loss.backward();
    std::vector<float> expected = {0.125f, -0.375f, 0.125f, 0.125f, 0.125f, 0.125f, 0.125f, -0.375f};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(logits.grad()[i], expected[i], 1e-5f);
    }
}

TEST(CrossEntropy, LargeLogitsStayFinite) {
    Tensor logits({1000.0, 0.0, -1000.0}, {1, 3}, true);
    Tensor labels({0}, {1});
    Tensor loss = CrossEntropyLoss(logits, labels);
    EXPECT_TRUE(std::isfinite(loss.item()));
    EXPECT_NEAR(loss.item(), 0.0f, 1e-5f);
}

TEST(CrossEntropy, RejectsBadInput) {
    Tensor logits = Tensor::from_array(Array::zeros({2, 3}), true);
    EXPECT_THROW(CrossEntropyLoss(logits, Tensor({0, 1, 2}, std::vector<size_t>{3})), std::invalid_argument);
    EXPECT_THROW(CrossEntropyLoss(logits, Tensor({0, 3}, std::vector<size_t>{2})), std::invalid_argument);
    EXPECT_THROW(CrossEntropyLoss(logits, Tensor({0, 0.5}, std::vector<size_t>{2})), std::invalid_argument);
}

TEST(CrossEntropy, LogSoftmaxRejectsEmptyLastDimension) {
    Tensor logits = Tensor::from_array(Array::zeros({2, 0}), true);
    EXPECT_THROW(log_softmax(logits), std::invalid_argument);
}

TEST(SGDOptimizer, StepAndZeroGrad) {
    Tensor w({1.0, -2.0}, true);
    SGD optimizer({w}, 0.5f);

    (w * w).sum().backward();
    optimizer.step();
    EXPECT_EQ(w.array().to_vector(), (std::vector<float>{0.0f, 0.0f}));

    optimizer.zero_grad();
    EXPECT_EQ(w.grad().to_vector(), (std::vector<float>{0.0f, 0.0f}));

    optimizer.set_lr(0.1f);
    EXPECT_FLOAT_EQ(optimizer.lr(), 0.1f);
}

/* as a first simple test train a model that always predicts 0 */
TEST(Training, LinearRegressionToZero) {
    Generator gen(5);
    Linear linear1(5, 5, gen);
    Linear linear2(5, 1, gen);

    std::vector<Tensor> params = linear1.parameters();
    for (const auto& p : linear2.parameters()) {
        params.push_back(p);
    }
    SGD optimizer(params, 0.01f);

    Tensor x = Tensor::randn({8, 5}, gen);
    float initial_loss = 0.0f;
    float final_loss = 0.0f;

    for (int i = 0; i < 200; i++) {
        /* forward pass */
        Tensor y = linear2.forward(linear1.forward(x));
        Tensor loss = (y * y).mean();
        if (i == 0) {
            initial_loss = loss.item();
        }
        final_loss = loss.item();

        /* backward pass */
        loss.backward();
        optimizer.step();
        optimizer.zero_grad();
    }

    EXPECT_LT(final_loss, initial_loss);
}

TEST(Training, MLPSeparatesTwoClusters) {
    Generator gen(6);
    MLP model({2, 8, 2}, gen);
    SGD optimizer(model.parameters(), 0.2f);

    /* class 0 around (-1, -1), class 1 around (1, 1) */
    std::vector<float> points;
    std::vector<float> labels;
    for (int i = 0; i < 16; ++i) {
        float label = static_cast<float>(i % 2);
        float center = label == 0.0f ? -1.0f : 1.0f;
        Tensor noise = Tensor::uniform({2}, -0.3f, 0.3f, gen);
        points.push_back(center + noise.array()[0]);
        points.push_back(center + noise.array()[1]);
        labels.push_back(label);
    }
    Tensor x(points, {16, 2});
    Tensor y(labels, std::vector<size_t>{16});

    float first = 0.0f;
    float last = 0.0f;
    for (int epoch = 0; epoch < 100; ++epoch) {
        Tensor loss = CrossEntropyLoss(model.forward(x), y);
        if (epoch == 0) {
            first = loss.item();
        }
        last = loss.item();
        loss.backward();
        optimizer.step();
        optimizer.zero_grad();
    }

    EXPECT_LT(last, first);
    EXPECT_LT(last, 0.5f * first);
}
