#include "recipegrad.h"

TensorFn make_op(Op op, ForwardFn forward) {
    return [op, forward](const std::vector<Operand>& operands, const Kwargs& kwargs) {
        auto recipe = std::make_shared<Recipe>();
        recipe->operation = op;
        recipe->kwargs = kwargs;

        /* snapshot every operand, remember which positions were tensors */
        recipe->args.reserve(operands.size());
        for (size_t i = 0; i < operands.size(); ++i) {
            recipe->args.push_back(operands[i].array().copy());
            if (operands[i].is_tensor()) {
                recipe->parents.emplace(i, operands[i].tensor());
            }
        }

        Array result = forward(recipe->args, recipe->kwargs);
        return Tensor(result, std::shared_ptr<const Recipe>(std::move(recipe)));
    };
}

namespace {

/* forward functions, one per `Op` */

Array forward_add(const std::vector<Array>& args, const Kwargs&) {
    return add(args[0], args[1]);
}

Array forward_multiply(const std::vector<Array>& args, const Kwargs&) {
    return multiply(args[0], args[1]);
}

Array forward_divide(const std::vector<Array>& args, const Kwargs&) {
    return divide(args[0], args[1]);
}

Array forward_negative(const std::vector<Array>& args, const Kwargs&) {
    return negative(args[0]);
}

Array forward_maximum(const std::vector<Array>& args, const Kwargs&) {
    return maximum(args[0], args[1]);
}

Array forward_exp(const std::vector<Array>& args, const Kwargs&) {
    return exp(args[0]);
}

Array forward_log(const std::vector<Array>& args, const Kwargs&) {
    return log(args[0]);
}

Array forward_matmul(const std::vector<Array>& args, const Kwargs&) {
    return matmul(args[0], args[1]);
}

Array forward_sum(const std::vector<Array>& args, const Kwargs& kwargs) {
    return sum(args[0], kwargs.axis, kwargs.keepdims);
}

Array forward_index(const std::vector<Array>& args, const Kwargs& kwargs) {
    return take(args[0], kwargs.index);
}

Array forward_reshape(const std::vector<Array>& args, const Kwargs& kwargs) {
    return reshape(args[0], kwargs.shape);
}

Array forward_expand(const std::vector<Array>& args, const Kwargs& kwargs) {
    return broadcast_to(args[0], kwargs.shape);
}

Array forward_permute(const std::vector<Array>& args, const Kwargs& kwargs) {
    return permute(args[0], kwargs.axes);
}

const TensorFn& add_op() {
    static const TensorFn fn = make_op(Op::Add, forward_add);
    return fn;
}

const TensorFn& multiply_op() {
    static const TensorFn fn = make_op(Op::Multiply, forward_multiply);
    return fn;
}

const TensorFn& divide_op() {
    static const TensorFn fn = make_op(Op::Divide, forward_divide);
    return fn;
}

const TensorFn& negative_op() {
    static const TensorFn fn = make_op(Op::Negative, forward_negative);
    return fn;
}

const TensorFn& maximum_op() {
    static const TensorFn fn = make_op(Op::Maximum, forward_maximum);
    return fn;
}

const TensorFn& index_op() {
    static const TensorFn fn = make_op(Op::Index, forward_index);
    return fn;
}

Tensor index_with(const Tensor& x, const Index& index) {
    Kwargs kwargs;
    kwargs.index = index;
    return index_op()({x}, kwargs);
}

} // namespace

Tensor Tensor::operator+(const Tensor& other) const {
    return add_op()({*this, other}, {});
}

Tensor Tensor::operator+(const float other) const {
    return add_op()({*this, other}, {});
}

Tensor Tensor::operator-(const Tensor& other) const {
    return *this + (-other);
}

Tensor Tensor::operator-(const float other) const {
    return add_op()({*this, -other}, {});
}

Tensor Tensor::operator-() const {
    return negative_op()({*this}, {});
}

Tensor Tensor::operator*(const Tensor& other) const {
    return multiply_op()({*this, other}, {});
}

Tensor Tensor::operator*(const float other) const {
    return multiply_op()({*this, other}, {});
}

Tensor Tensor::operator/(const Tensor& other) const {
    return divide_op()({*this, other}, {});
}

Tensor Tensor::operator/(const float other) const {
    return divide_op()({*this, other}, {});
}

Tensor operator+(const float a, const Tensor& b) {
    return add_op()({a, b}, {});
}

Tensor operator-(const float a, const Tensor& b) {
    return a + (-b);
}

Tensor operator*(const float a, const Tensor& b) {
    return multiply_op()({a, b}, {});
}

Tensor operator/(const float a, const Tensor& b) {
    return divide_op()({a, b}, {});
}

Tensor Tensor::maximum(const Tensor& other) const {
    return maximum_op()({*this, other}, {});
}

Tensor Tensor::maximum(const float other) const {
    return maximum_op()({*this, other}, {});
}

Tensor Tensor::exp() const {
    static const TensorFn fn = make_op(Op::Exp, forward_exp);
    return fn({*this}, {});
}

Tensor Tensor::log() const {
    static const TensorFn fn = make_op(Op::Log, forward_log);
    return fn({*this}, {});
}

Tensor Tensor::matmul(const Tensor& other) const {
    static const TensorFn fn = make_op(Op::Matmul, forward_matmul);
    return fn({*this, other}, {});
}

Tensor Tensor::sum(std::optional<int> axis, bool keepdims) const {
    static const TensorFn fn = make_op(Op::Sum, forward_sum);
    Kwargs kwargs;
    kwargs.axis = axis;
    kwargs.keepdims = keepdims;
    return fn({*this}, kwargs);
}

Tensor Tensor::mean(std::optional<int> axis, bool keepdims) const {
    Tensor total = sum(axis, keepdims);

    /* sum already rejected an out-of-range axis */
    size_t count = numel();
    if (axis) {
        int ndim = static_cast<int>(this->ndim());
        count = shape()[*axis < 0 ? *axis + ndim : *axis];
    }
    return total / static_cast<float>(count);
}

Tensor Tensor::operator[](long i) const {
    return index_with(*this, Index(i));
}

Tensor Tensor::operator[](const std::vector<long>& tuple) const {
    return index_with(*this, Index(tuple));
}

Tensor Tensor::operator[](const Array& indices) const {
    return index_with(*this, Index(indices.copy()));
}

Tensor Tensor::operator[](const Tensor& indices) const {
    return (*this)[indices.array()];
}

Tensor Tensor::reshape(const std::vector<size_t>& shape) const {
    static const TensorFn fn = make_op(Op::Reshape, forward_reshape);
    Kwargs kwargs;
    kwargs.shape = shape;
    return fn({*this}, kwargs);
}

Tensor Tensor::expand(const std::vector<size_t>& shape) const {
    static const TensorFn fn = make_op(Op::Expand, forward_expand);
    Kwargs kwargs;
    kwargs.shape = shape;
    return fn({*this}, kwargs);
}

Tensor Tensor::permute(const std::vector<size_t>& axes) const {
    static const TensorFn fn = make_op(Op::Permute, forward_permute);
    Kwargs kwargs;
    kwargs.axes = axes;
    return fn({*this}, kwargs);
}

Tensor Tensor::transpose() const {
    std::vector<size_t> axes(ndim());
    for (size_t i = 0; i < axes.size(); ++i) {
        axes[i] = axes.size() - 1 - i;
    }
    return permute(axes);
}

Tensor maximum(const Tensor& a, const Tensor& b) {
    return a.maximum(b);
}

Tensor exp(const Tensor& x) {
    return x.exp();
}

Tensor log(const Tensor& x) {
    return x.log();
}

Tensor matmul(const Tensor& a, const Tensor& b) {
    return a.matmul(b);
}

Tensor sum(const Tensor& x, std::optional<int> axis, bool keepdims) {
    return x.sum(axis, keepdims);
}
