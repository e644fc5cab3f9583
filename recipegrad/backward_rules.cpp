#include "recipegrad.h"

#include <array>

Array unbroadcast(const Array& grad, const std::vector<size_t>& original_shape) {
    const auto& grad_shape = grad.shape();
    if (grad_shape.size() < original_shape.size()) {
        print_shapes(grad_shape, original_shape);
        throw std::invalid_argument("Gradient has fewer dimensions than the operand it is reduced to.");
    }

    Array reduced = grad;

    /* 1) sum over the leading axes that broadcasting prepended */
    size_t extra = grad_shape.size() - original_shape.size();
    for (size_t i = 0; i < extra; ++i) {
        reduced = sum(reduced, 0, false);
    }

    /* 2) sum, keeping dimensions, where the operand had size 1 */
    for (size_t i = 0; i < original_shape.size(); ++i) {
        if (original_shape[i] == 1 && reduced.shape()[i] != 1) {
            reduced = sum(reduced, static_cast<int>(i), true);
        }
    }

    if (reduced.shape() != original_shape) {
        print_shapes(grad_shape, original_shape);
        throw std::invalid_argument("Gradient shape was not broadcast from the operand shape.");
    }
    return reduced;
}

namespace {

/* Routes `grad_out` through an elementwise mask that compares the two broadcast operands. */
template <typename Compare>
Array masked_grad(const Array& grad_out, const Array& a, const Array& b, Compare pick) {
    const auto& out_shape = grad_out.shape();
    Array routed = Array::zeros(out_shape);
    for (size_t i = 0; i < routed.size(); ++i) {
        std::vector<size_t> multi_index = unravel_index(i, out_shape);
        if (pick(a[ravel_index(multi_index, a.shape())], b[ravel_index(multi_index, b.shape())])) {
            routed[i] = grad_out[i];
        }
    }
    return routed;
}

/* d/da (a + b) = 1 */
Array add_grad_a(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    return unbroadcast(grad_out, args[0].shape());
}

Array add_grad_b(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    return unbroadcast(grad_out, args[1].shape());
}

/* d/da (a * b) = b */
Array multiply_grad_a(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    return unbroadcast(multiply(grad_out, args[1]), args[0].shape());
}

Array multiply_grad_b(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    return unbroadcast(multiply(grad_out, args[0]), args[1].shape());
}

/* d/da (a / b) = 1 / b */
Array divide_grad_a(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    return unbroadcast(divide(grad_out, args[1]), args[0].shape());
}

/* d/db (a / b) = -a / b^2 */
Array divide_grad_b(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    const Array& a = args[0];
    const Array& b = args[1];
    Array local = negative(divide(a, multiply(b, b)));
    return unbroadcast(multiply(grad_out, local), b.shape());
}

Array negative_grad(const Array& grad_out, const Array&, const std::vector<Array>&, const Kwargs&) {
    return negative(grad_out);
}

/* ties go to the first operand */
Array maximum_grad_a(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    Array routed = masked_grad(grad_out, args[0], args[1], [](float a, float b) { return a >= b; });
    return unbroadcast(routed, args[0].shape());
}

Array maximum_grad_b(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    Array routed = masked_grad(grad_out, args[0], args[1], [](float a, float b) { return a < b; });
    return unbroadcast(routed, args[1].shape());
}

/* d/dx exp(x) = exp(x), which is the forward output */
Array exp_grad(const Array& grad_out, const Array& out, const std::vector<Array>&, const Kwargs&) {
    return multiply(grad_out, out);
}

Array log_grad(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    return divide(grad_out, args[0]);
}

/* dL/dA = dL/dC * B^T */
Array matmul_grad_a(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    return unbroadcast(matmul(grad_out, swap_last_axes(args[1])), args[0].shape());
}

/* dL/dB = A^T * dL/dC */
Array matmul_grad_b(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    return unbroadcast(matmul(swap_last_axes(args[0]), grad_out), args[1].shape());
}

/*
 * Re-expands the reduced axes before broadcasting back to the input shape:
 * - keepdims: the reduced axes are still present with size 1;
 * - axis without keepdims: the axis was removed and is re-inserted;
 * - no axis without keepdims: the gradient is 0-dimensional.
 */
Array sum_grad(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs& kwargs) {
    const auto& input_shape = args[0].shape();
    Array expanded = grad_out;
    if (kwargs.axis && !kwargs.keepdims) {
        int ndim = static_cast<int>(input_shape.size());
        int axis = *kwargs.axis < 0 ? *kwargs.axis + ndim : *kwargs.axis;
        expanded = expand_dims(grad_out, static_cast<size_t>(axis));
    }
    return broadcast_to(expanded, input_shape);
}

/* scatter-add into zeros, repeated indices accumulate */
Array index_grad(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs& kwargs) {
    Array grad = Array::zeros(args[0].shape());
    index_add(grad, kwargs.index, grad_out);
    return grad;
}

Array reshape_grad(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    return reshape(grad_out, args[0].shape());
}

Array expand_grad(const Array& grad_out, const Array&, const std::vector<Array>& args, const Kwargs&) {
    return unbroadcast(grad_out, args[0].shape());
}

Array permute_grad(const Array& grad_out, const Array&, const std::vector<Array>&, const Kwargs& kwargs) {
    std::vector<size_t> inverse(kwargs.axes.size());
    for (size_t i = 0; i < kwargs.axes.size(); ++i) {
        inverse[kwargs.axes[i]] = i;
    }
    return permute(grad_out, inverse);
}

constexpr size_t MAX_SLOTS = 2;

/* rows follow the order of `Op`, columns are parent slots */
const std::array<std::array<BackwardRule, MAX_SLOTS>, NUM_OPS> BACKWARD_RULES = {{
    {{add_grad_a, add_grad_b}},             // Add
    {{multiply_grad_a, multiply_grad_b}},   // Multiply
    {{divide_grad_a, divide_grad_b}},       // Divide
    {{negative_grad, nullptr}},             // Negative
    {{maximum_grad_a, maximum_grad_b}},     // Maximum
    {{exp_grad, nullptr}},                  // Exp
    {{log_grad, nullptr}},                  // Log
    {{matmul_grad_a, matmul_grad_b}},       // Matmul
    {{sum_grad, nullptr}},                  // Sum
    {{index_grad, nullptr}},                // Index
    {{reshape_grad, nullptr}},              // Reshape
    {{expand_grad, nullptr}},               // Expand
    {{permute_grad, nullptr}},              // Permute
}};

} // namespace

BackwardRule find_backward_rule(Op op, size_t slot) {
    size_t row = static_cast<size_t>(op);
    if (row >= NUM_OPS || slot >= MAX_SLOTS) {
        return nullptr;
    }
    return BACKWARD_RULES[row][slot];
}
