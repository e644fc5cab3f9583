/*
This tutorial demonstrates how to use the autograd engine step by step.
We will explore scalar operations, multi-dimensional tensors, and backpropagation.
*/

#include "recipegrad/recipegrad.h"
#include <iostream>

int main() {
    Generator gen(42);

    std::cout << "=== Scalar Operations ===\n";
    // Step 1: Simple scalar operations
    // Define two scalar tensors with values 3.0 and 4.0
    Tensor a = Tensor({3.0}, true);
    Tensor b = Tensor({4.0}, true);

    // Perform multiplication and addition: c = a * b + 2
    Tensor c = a * b + 2.0f;
    std::cout << "c = a * b + 2 -> " << c << "\n";
    c.backward();
    std::cout << "dc/da: " << a.grad() << ", dc/db: " << b.grad() << "\n";

    std::cout << "=== Creating Multi-Dimensional Tensors ===\n";
    // Step 2: Creating multi-dimensional tensors
    // Define a 2x3 tensor with explicit values
    Tensor d = Tensor({1, 2, 3, 4, 5, 6}, {2, 3}, true);

    // Create a random 2x3 tensor with autograd enabled
    Tensor e = Tensor::randn({2, 3}, gen, true);
    std::cout << "Tensor d: " << d << "\n";
    std::cout << "Random tensor e: " << e << "\n";

    std::cout << "=== Sum and Mean Operations ===\n";
    // Step 3: Demonstrating sum and mean operations
    Tensor f = d.sum();
    Tensor g = e.mean(1);
    std::cout << "Sum of d: " << f << "\n";
    std::cout << "Row means of e: " << g << "\n";

    std::cout << "=== Backpropagation ===\n";
    // Step 4: Multiply element-wise and reduce to a 0-dimensional tensor
    Tensor h = (d * e).sum();
    h.backward();

    // d receives the values of e and vice versa
    std::cout << "Gradient of d: " << d.grad() << "\n";
    std::cout << "Gradient of e: " << e.grad() << "\n";

    std::cout << "=== Shared Subexpressions ===\n";
    // Step 5: A tensor used along two paths receives the sum of both contributions
    Tensor p = Tensor({1.0, 2.0, 3.0}, true);
    Tensor q = Tensor({4.0, 5.0, 6.0}, true);
    Tensor loss = (p + q).sum() + (p * q).sum();
    loss.backward();
    std::cout << "Gradient of p (1 + q): " << p.grad() << "\n";
    std::cout << "Gradient of q (1 + p): " << q.grad() << "\n";

    std::cout << "=== Matrix Multiplication ===\n";
    // Step 6: Batched matrix multiplication broadcasts the leading axes
    Tensor m1 = Tensor::randn({2, 3, 4}, gen, true);
    Tensor m2 = Tensor::randn({4, 2}, gen, true);
    Tensor product = m1.matmul(m2);
    std::cout << "Product shape: ";
    print_shape(product.shape());
    product.exp().mean().backward();
    std::cout << "Gradient of m2: " << m2.grad() << "\n";

    std::cout << "=== Broadcasting Capabilities ===\n";
    // Step 7: small is expanded to match the shape of large
    Tensor small = Tensor({3.0}, true);
    Tensor large = Tensor::randn({2, 3}, gen, true);
    Tensor broadcasted = small * large;
    std::cout << "Broadcasted multiplication: " << broadcasted << "\n";

    // The gradient of small sums over every broadcast position
    broadcasted.sum().backward();
    std::cout << "Gradient of small: " << small.grad() << "\n";

    std::cout << "=== Indexing ===\n";
    // Step 8: Repeated indices accumulate in the gradient
    Tensor x = Tensor({0.0, 0.0, 0.0}, true);
    Tensor picked = x[Array({0.0f, 0.0f, 1.0f})];
    picked.sum().backward();
    std::cout << "Gradient of x: " << x.grad() << "\n";

    return 0;
}
