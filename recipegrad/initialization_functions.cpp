#include "recipegrad.h"

#include <cmath>

/**
 * @brief Creates a tensor with elements sampled from a uniform distribution U(low, high).
 *
 * @param shape The desired shape of the tensor.
 * @param low Lower bound of the distribution.
 * @param high Upper bound of the distribution.
 * @param generator Random engine the samples are drawn from.
 * @param requires_grad If `true`, enables gradient computation for this tensor.
 *
 * @example
 * @code
 * Generator gen(0);
 * Tensor t = Tensor::uniform({3, 3}, -1.0f, 1.0f, gen, true);
 * @endcode
 */
Tensor Tensor::uniform(const std::vector<size_t>& shape, float low, float high,
                       Generator& generator, bool requires_grad) {
    /* allocate memory for tensor */
    size_t total_elems = ::numel(shape);
    std::vector<float> data(total_elems);

    std::uniform_real_distribution<float> distribution(low, high);
    for (size_t i = 0; i < total_elems; i++) {
        data[i] = distribution(generator.engine());
    }

    return Tensor(data, shape, requires_grad);
}

Tensor Tensor::randn(const std::vector<size_t>& shape, Generator& generator, bool requires_grad) {
    size_t total_elems = ::numel(shape);
    std::vector<float> data(total_elems);

    std::normal_distribution<float> distribution(0.0f, 1.0f);
    for (size_t i = 0; i < total_elems; i++) {
        data[i] = distribution(generator.engine());
    }

    return Tensor(data, shape, requires_grad);
}

/**
 * @brief Creates a tensor using He initialization.
 *
 * He initialization is designed for layers with ReLU activations to improve weight scaling.
 *
 * @param in_features Number of input features (fan-in).
 * @param out_features Number of output features.
 * @param generator Random engine the samples are drawn from.
 * @param requires_grad If `true`, enables gradient computation for this tensor.
 * @return Tensor A tensor of shape `(in_features, out_features)`.
 */
Tensor Tensor::randn_he(size_t in_features, size_t out_features, Generator& generator, bool requires_grad) {
    float stddev = std::sqrt(2.0f / static_cast<float>(in_features));
    std::normal_distribution<float> distribution(0.0f, stddev);

    std::vector<float> data(in_features * out_features);
    for (auto& value : data) {
        value = distribution(generator.engine());
    }

    return Tensor(data, {in_features, out_features}, requires_grad);
}

/**
 * @brief Creates a bias tensor with uniform initialization following PyTorch's convention.
 *
 * @param in_features Number of input features (fan-in), sets the bound.
 * @param out_features Number of bias entries.
 * @param generator Random engine the samples are drawn from.
 * @param requires_grad If `true`, enables gradient computation for this tensor.
 * @return Tensor A tensor of shape `(out_features,)`.
 */
Tensor Tensor::bias_uniform(size_t in_features, size_t out_features, Generator& generator, bool requires_grad) {
    float bound = 1.0f / std::sqrt(static_cast<float>(in_features));
    return uniform({out_features}, -bound, bound, generator, requires_grad);
}
