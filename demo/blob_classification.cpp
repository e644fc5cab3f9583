#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <unordered_map>
#include <vector>

#include "recipegrad/modules.h"

/* synthetic dataset: one gaussian blob per class, centers on a circle */
struct Dataset {
    std::vector<float> features;
    std::vector<float> labels;
    size_t num_samples = 0;
};

Dataset make_blobs(size_t samples_per_class, size_t num_classes, float spread, Generator& gen) {
    Dataset dataset;
    const float pi = 3.14159265f;
    for (size_t c = 0; c < num_classes; c++) {
        float angle = 2.0f * pi * static_cast<float>(c) / static_cast<float>(num_classes);
        Tensor noise = Tensor::randn({samples_per_class, 2}, gen);
        for (size_t i = 0; i < samples_per_class; i++) {
            dataset.features.push_back(2.0f * std::cos(angle) + spread * noise.array()[2 * i]);
            dataset.features.push_back(2.0f * std::sin(angle) + spread * noise.array()[2 * i + 1]);
            dataset.labels.push_back(static_cast<float>(c));
        }
    }
    dataset.num_samples = samples_per_class * num_classes;
    return dataset;
}

void train(MLP& model, const Dataset& data, size_t num_epochs, size_t batch_size, float lr, Generator& gen) {
    model.train();
    SGD optimizer(model.parameters(), lr);

    std::vector<size_t> order(data.num_samples);
    std::iota(order.begin(), order.end(), 0);

    for (size_t epoch = 0; epoch < num_epochs; epoch++) {
        std::shuffle(order.begin(), order.end(), gen.engine());
        std::vector<float> losses;

        for (size_t start = 0; start < data.num_samples; start += batch_size) {
            size_t real_batch_size = std::min(batch_size, data.num_samples - start);
            std::vector<float> batch_features;
            std::vector<float> batch_labels;
            for (size_t i = start; i < start + real_batch_size; i++) {
                batch_features.push_back(data.features[2 * order[i]]);
                batch_features.push_back(data.features[2 * order[i] + 1]);
                batch_labels.push_back(data.labels[order[i]]);
            }

            Tensor x(batch_features, {real_batch_size, 2});
            Tensor y(batch_labels, {real_batch_size});

            Tensor loss = CrossEntropyLoss(model.forward(x), y);
            loss.backward();
            optimizer.step();
            optimizer.zero_grad();
            losses.push_back(loss.item());
        }

        float avg_loss = std::accumulate(losses.begin(), losses.end(), 0.0f) / losses.size();
        if (epoch % 10 == 0 || epoch + 1 == num_epochs) {
            std::cout << "Epoch [" << (epoch + 1) << "/" << num_epochs << "] "
                      << "Loss: " << avg_loss << std::endl;
        }
    }
}

void test(MLP& model, const Dataset& data, size_t num_classes) {
    model.eval();

    Tensor x(data.features, {data.num_samples, 2});
    Tensor y_pred = model.forward(x);
    const Array& logits = y_pred.array();

    size_t total_correct = 0;
    std::unordered_map<size_t, size_t> correct_per_class;
    std::unordered_map<size_t, size_t> total_per_class;

    /* the predicted class is the largest logit of each row */
    for (size_t i = 0; i < data.num_samples; i++) {
        const float* row = logits.data() + i * num_classes;
        size_t predicted_class = std::max_element(row, row + num_classes) - row;
        size_t true_class = static_cast<size_t>(data.labels[i]);

        if (predicted_class == true_class) {
            total_correct++;
            correct_per_class[true_class]++;
        }
        total_per_class[true_class]++;
    }

    std::cout << "Test accuracy: " << 100.0f * total_correct / data.num_samples << "%" << std::endl;
    for (size_t c = 0; c < num_classes; c++) {
        std::cout << "  class " << c << ": " << correct_per_class[c] << "/" << total_per_class[c] << std::endl;
    }
}

int main() {
    const size_t num_classes = 3;
    const size_t num_epochs = 50;
    const size_t batch_size = 16;
    const float lr = 0.1f;

    Generator gen(42);

    try {
        Dataset train_data = make_blobs(100, num_classes, 0.5f, gen);
        Dataset test_data = make_blobs(30, num_classes, 0.5f, gen);

        MLP model({2, 16, 16, num_classes}, gen);
        train(model, train_data, num_epochs, batch_size, lr, gen);
        test(model, test_data, num_classes);
    } catch (const std::exception& e) {
        std::cerr << "Training failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
