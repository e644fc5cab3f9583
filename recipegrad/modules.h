#ifndef RECIPEGRAD_MODULES_H
#define RECIPEGRAD_MODULES_H

#include "recipegrad.h"

/**
 * @brief Applies the ReLU (Rectified Linear Unit) activation function element-wise.
 *
 * Computed as `maximum(x, 0)`, so at `x == 0` the gradient is passed through.
 */
inline Tensor relu(const Tensor& x) {
    return x.maximum(0.0f);
}

/**
 * @brief Log-softmax along the last dimension.
 *
 * The row maximum is subtracted as a constant before exponentiating.
 */
Tensor log_softmax(const Tensor& logits);

/**
 * @brief One-hot encodes class indices into a trailing dimension of size `num_classes`.
 *
 * @throws std::invalid_argument If a label is negative, non-integral or not below `num_classes`.
 */
Array onehot_encode(const Array& labels, size_t num_classes);

/**
 * @brief Computes the Cross Entropy Loss between predicted logits and true labels.
 *
 * The formula for cross-entropy loss is:
 * \f[
 * L = - \frac{1}{N} \sum_{i=1}^{N} \sum_{j=1}^{C} y_{ij} \log(\text{softmax}(x_{ij}))
 * \f]
 *
 * @param y_pred Tensor of shape `(batch_size, num_classes)`, representing model logits.
 * @param y_true Tensor of shape `(batch_size)`, containing ground truth class indices.
 * @return Tensor The 0-dimensional mean loss.
 *
 * @example
 * @code
 * Tensor logits = Tensor({2.0, 1.0, 0.1, 0.5, 0.7, 0.2}, {2, 3}, true);
 * Tensor labels = Tensor({0, 2}, {2});
 * Tensor loss = CrossEntropyLoss(logits, labels);
 * @endcode
 */
Tensor CrossEntropyLoss(const Tensor& y_pred, const Tensor& y_true);

/**
 * @brief Fully connected linear layer.
 *
 * The layer performs the following computation:
 * \f[
 * y = x W + b
 * \f]
 * where:
 * - \f$x\f$ is the input tensor of shape `(batch_size, in_features)`.
 * - \f$W\f$ is the weight matrix of shape `(in_features, out_features)`.
 * - \f$b\f$ is the bias vector of shape `(out_features)`.
 *
 * The weight is initialized using **He initialization**, and the bias follows PyTorch's
 * default uniform initialization.
 */
class Linear {
public:
    Tensor weight;
    Tensor bias;

    /**
     * @brief Constructs a linear layer with the given input and output dimensions.
     *
     * @param in_features Number of input features (fan-in).
     * @param out_features Number of output features (fan-out).
     * @param generator Random engine used for the initial parameters.
     *
     * @example
     * @code
     * Generator gen(7);
     * Linear layer(128, 64, gen); // 128 input and 64 output features
     * @endcode
     */
    Linear(size_t in_features, size_t out_features, Generator& generator)
        : weight(Tensor::randn_he(in_features, out_features, generator, true)),
          bias(Tensor::bias_uniform(in_features, out_features, generator, true)) {}

    Tensor forward(const Tensor& x) const {
        return x.matmul(weight) + bias;
    }

    std::vector<Tensor> parameters() const {
        return {weight, bias};
    }

    /**
     * @brief Sets the layer to evaluation mode, disabling gradient tracking for its parameters.
     */
    void eval() {
        weight.eval();
        bias.eval();
    }

    /**
     * @brief Sets the layer to training mode.
     */
    void train() {
        weight.train();
        bias.train();
    }
};

/**
 * @brief ReLU activation as a layer.
 */
class ReLU {
public:
    Tensor forward(const Tensor& x) const {
        return relu(x);
    }
};

/**
 * @brief Multi-layer perceptron classifier.
 *
 * A stack of `Linear` layers with a `ReLU` between consecutive layers. The
 * last layer produces raw logits, to be fed into `CrossEntropyLoss`.
 */
class MLP {
public:
    /**
     * @param sizes Layer widths, from input features to number of classes.
     * @param generator Random engine used for the initial parameters.
     * @throws std::invalid_argument If fewer than two sizes are given.
     *
     * @example
     * @code
     * Generator gen(0);
     * MLP model({784, 128, 10}, gen);
     * Tensor logits = model.forward(x); // (batch_size, 10)
     * @endcode
     */
    MLP(const std::vector<size_t>& sizes, Generator& generator) {
        if (sizes.size() < 2) {
            throw std::invalid_argument("MLP needs at least an input and an output size.");
        }
        for (size_t i = 0; i + 1 < sizes.size(); ++i) {
            layers.emplace_back(sizes[i], sizes[i + 1], generator);
        }
    }

    Tensor forward(const Tensor& x) const {
        Tensor h = x;
        for (size_t i = 0; i < layers.size(); ++i) {
            h = layers[i].forward(h);
            if (i + 1 < layers.size()) {
                h = activation.forward(h);
            }
        }
        return h;
    }

    std::vector<Tensor> parameters() const {
        std::vector<Tensor> params;
        for (const auto& layer : layers) {
            for (const auto& p : layer.parameters()) {
                params.push_back(p);
            }
        }
        return params;
    }

    void eval() {
        for (auto& layer : layers) {
            layer.eval();
        }
    }

    void train() {
        for (auto& layer : layers) {
            layer.train();
        }
    }

    std::vector<Linear> layers;

private:
    ReLU activation;
};

/**
 * @brief Plain gradient descent.
 *
 * `step()` updates every parameter in place, `array -= lr * grad`.
 */
class SGD {
public:
    SGD(const std::vector<Tensor>& parameters, float lr) : parameters_(parameters), lr_(lr) {}

    void step() {
        for (auto& p : parameters_) {
            Array& data = p.array();
            const Array& grad = p.grad();
            for (size_t i = 0; i < data.size(); ++i) {
                data[i] -= lr_ * grad[i];
            }
        }
    }

    void zero_grad() {
        for (auto& p : parameters_) {
            p.zero_grad();
        }
    }

    float lr() const { return lr_; }
    void set_lr(float lr) { lr_ = lr; }

private:
    std::vector<Tensor> parameters_;
    float lr_;
};

#endif // RECIPEGRAD_MODULES_H
