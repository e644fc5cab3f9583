#include "modules.h"

#include <algorithm>
#include <cmath>
#include <limits>

Tensor log_softmax(const Tensor& logits) {
    const auto shape = logits.shape();
    if (shape.empty()) {
        throw std::invalid_argument("log_softmax needs at least one dimension.");
    }
    int last = static_cast<int>(shape.size()) - 1;

    /* maximum over the last dimension, kept as a constant */
    size_t width = shape.back();
    if (width == 0) {
        throw std::invalid_argument("log_softmax needs a non-empty last dimension.");
    }
    size_t rows = logits.numel() / width;
    std::vector<size_t> kept_shape = shape;
    kept_shape.back() = 1;
    Array row_max = Array::full(kept_shape, -std::numeric_limits<float>::infinity());
    const Array& values = logits.array();
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < width; ++c) {
            row_max[r] = std::max(row_max[r], values[r * width + c]);
        }
    }

    Tensor shifted = logits - Tensor::from_array(row_max);
    Tensor log_sum_exp = shifted.exp().sum(last, true).log();
    return shifted - log_sum_exp;
}

Array onehot_encode(const Array& labels, size_t num_classes) {
    std::vector<size_t> result_shape = labels.shape();
    result_shape.push_back(num_classes);
    Array result = Array::zeros(result_shape);

    /* iterate over labels and expand in the trailing dimension */
    for (size_t i = 0; i < labels.size(); ++i) {
        float label = labels[i];
        if (label < 0.0f || std::floor(label) != label || label >= static_cast<float>(num_classes)) {
            throw std::invalid_argument("Value out of bounds for one-hot encoding");
        }
        result[i * num_classes + static_cast<size_t>(label)] = 1.0f;
    }
    return result;
}

Tensor CrossEntropyLoss(const Tensor& y_pred, const Tensor& y_true) {
    const auto shape = y_pred.shape();
    if (shape.size() != 2 || y_true.shape() != std::vector<size_t>{shape[0]}) {
        print_shapes(shape, y_true.shape());
        throw std::invalid_argument("CrossEntropyLoss expects logits (batch_size, num_classes) and labels (batch_size).");
    }

    Tensor targets = Tensor::from_array(onehot_encode(y_true.array(), shape[1]));
    Tensor nll = -(log_softmax(y_pred) * targets).sum();
    return nll / static_cast<float>(shape[0]);
}
