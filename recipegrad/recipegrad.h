#ifndef RECIPEGRAD_H
#define RECIPEGRAD_H

#include <atomic>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <vector>

#include "array.h"

/**
 * @brief Global atomic counter for assigning unique tensor IDs.
 *
 * Each new tensor gets a unique ID; the ID is the tensor's identity in the
 * computation graph.
 */
extern std::atomic<std::uint64_t> id_counter;

/**
 * @brief Generates a unique ID for a new tensor.
 *
 * @return size_t A unique tensor ID.
 * @throws std::runtime_error If the ID counter overflows.
 */
size_t get_id();

/**
 * @brief Differentiable operation kinds.
 *
 * Every recorded operation is tagged with one of these; the tag selects the
 * backward rules during backpropagation.
 */
enum class Op {
    Add,
    Multiply,
    Divide,
    Negative,
    Maximum,
    Exp,
    Log,
    Matmul,
    Sum,
    Index,
    Reshape,
    Expand,
    Permute,
};

/* number of entries in `Op` */
constexpr size_t NUM_OPS = static_cast<size_t>(Op::Permute) + 1;

const char* op_name(Op op);

/* number of positional operands an operation's backward rules read */
size_t op_arity(Op op);

/**
 * @brief Named configuration operands of an operation.
 *
 * Fields an operation does not use keep their defaults.
 */
struct Kwargs {
    std::optional<int> axis;     ///< Sum: reduced axis, every axis if empty.
    bool keepdims = false;       ///< Sum: keep reduced axes with size 1.
    std::vector<size_t> shape;   ///< Reshape/Expand: target shape.
    std::vector<size_t> axes;    ///< Permute: axis order.
    Index index;                 ///< Index: what to read.
};

/**
 * @brief Seedable random number generator used for parameter initialization.
 *
 * Initializers take the generator explicitly, so two runs with the same seed
 * produce the same parameters regardless of what else drew random numbers.
 */
class Generator {
public:
    explicit Generator(std::uint32_t seed = 42) : engine_(seed) {}

    void seed(std::uint32_t seed) { engine_.seed(seed); }
    std::mt19937& engine() { return engine_; }

private:
    std::mt19937 engine_;
};

class TensorData;
struct Recipe;

/**
 * @brief Represents a multi-dimensional tensor with automatic differentiation support.
 *
 * `Tensor` is a handle to `TensorData`. Copying a handle never creates a new
 * graph node; two handles denote the same node iff they share `TensorData`.
 */
class Tensor {
public:
    /**
     * @brief Shared pointer to the underlying tensor data.
     */
    std::shared_ptr<TensorData> ptr;

    /**
     * @brief Constructs a 1D leaf tensor with inferred shape.
     *
     * @example
     * @code
     * Tensor t({1.0, 2.0, 3.0}, true); // 1D tensor with 3 elements, requires gradient
     * @endcode
     */
    Tensor(const std::vector<float>& data, bool requires_grad = false);

    /**
     * @brief Constructs a leaf tensor with an explicit shape.
     *
     * @throws std::invalid_argument If the number of elements in `data` does not match `shape`.
     *
     * @example
     * @code
     * Tensor t({1.0, 2.0, 3.0, 4.0}, {2, 2}, true); // 2x2 tensor, requires gradient
     * @endcode
     */
    Tensor(const std::vector<float>& data, const std::vector<size_t>& shape, bool requires_grad = false);

    /**
     * @brief Constructs an internal node produced by an operation.
     *
     * The tensor requires gradients and carries `recipe`.
     */
    Tensor(const Array& array, std::shared_ptr<const Recipe> recipe);

    Tensor(std::shared_ptr<TensorData> ptr) : ptr(ptr) {}

    /**
     * @brief Default constructor initializing an empty handle.
     */
    Tensor() : ptr(nullptr) {}

    /* accessors */

    Array& array();
    const Array& array() const;

    /**
     * @brief Gradient accumulated by backpropagation, shaped like `array()`.
     */
    const Array& grad() const;

    std::vector<size_t> shape() const;
    size_t ndim() const;
    size_t numel() const;

    /**
     * @brief Length of the first dimension.
     *
     * @throws std::invalid_argument If the tensor is 0-dimensional.
     */
    size_t len() const;

    /**
     * @brief Value of a one-element tensor.
     *
     * @throws std::runtime_error If the tensor holds more or fewer than one element.
     */
    float item() const;

    /**
     * @brief Truth value of a one-element tensor.
     *
     * @throws std::runtime_error If the tensor holds more or fewer than one element.
     */
    explicit operator bool() const;

    size_t id() const;
    bool requires_grad() const;

    /**
     * @brief Recipe this tensor was produced by, or `nullptr` for user-constructed tensors.
     */
    const Recipe* recipe() const;

    /**
     * @brief Whether backpropagation stops at this tensor.
     *
     * A tensor is a leaf if it does not require gradients, was not produced by
     * an operation, or its recipe has no tensor parents.
     */
    bool is_leaf() const;

    /* backward functions */

    /**
     * @brief Backpropagates from this tensor with a seed gradient of ones.
     */
    void backward();

    /**
     * @brief Backpropagates from this tensor with an explicit seed gradient.
     *
     * @throws std::invalid_argument If `seed` is not shaped like this tensor.
     */
    void backward(const Array& seed);

    /**
     * @brief Resets the gradient of the tensor to zero.
     *
     * Gradients accumulate across backward passes until reset.
     */
    void zero_grad();

    /**
     * @brief Disables gradient tracking, making the tensor a leaf.
     */
    void eval();

    /**
     * @brief Enables gradient tracking.
     */
    void train();

    /* operators */

    /**
     * @brief Element-wise addition of two tensors with broadcasting support.
     *
     * @throws std::invalid_argument If the tensors cannot be broadcasted.
     *
     * @example
     * @code
     * Tensor a({1, 2, 3}, {3}, true);   // Shape: (3,)
     * Tensor b({5}, {1}, false);        // Shape: (1,)
     * Tensor c = a + b;                 // Shape: (3,), values: {6, 7, 8}
     * @endcode
     */
    Tensor operator+(const Tensor& other) const;
    Tensor operator+(const float other) const;

    /**
     * @brief Element-wise subtraction, computed as `this + (-other)`.
     */
    Tensor operator-(const Tensor& other) const;
    Tensor operator-(const float other) const;

    Tensor operator-() const;

    Tensor operator*(const Tensor& other) const;
    Tensor operator*(const float other) const;

    /**
     * @brief Element-wise true division with broadcasting support.
     *
     * Division by zero follows IEEE float semantics.
     */
    Tensor operator/(const Tensor& other) const;
    Tensor operator/(const float other) const;

    /**
     * @brief Element-wise maximum; where both operands are equal the gradient flows to `this`.
     */
    Tensor maximum(const Tensor& other) const;
    Tensor maximum(const float other) const;

    Tensor exp() const;
    Tensor log() const;

    /**
     * @brief Batched matrix multiplication, see `matmul(const Array&, const Array&)`.
     */
    Tensor matmul(const Tensor& other) const;

    /**
     * @brief Sum reduction.
     *
     * @param axis Axis to reduce, every axis if empty; negative values count from the end.
     * @param keepdims Keep the reduced axes with size 1.
     * @throws std::out_of_range If `axis` does not name an axis of the tensor.
     *
     * @example
     * @code
     * Tensor t({1.0, 2.0, 3.0, 4.0}, {2, 2}, true);
     * Tensor s = t.sum(0);           // Shape: (2,), values: {4.0, 6.0}
     * Tensor k = t.sum(1, true);     // Shape: (2, 1), values: {3.0, 7.0}
     * Tensor total = t.sum();        // Shape: (), value: 10.0
     * @endcode
     */
    Tensor sum(std::optional<int> axis = std::nullopt, bool keepdims = false) const;

    /**
     * @brief Mean over `axis` (every element if empty), computed as a sum divided by the count.
     */
    Tensor mean(std::optional<int> axis = std::nullopt, bool keepdims = false) const;

    /* indexed reads */
    Tensor operator[](long i) const;
    Tensor operator[](const std::vector<long>& tuple) const;
    Tensor operator[](const Array& indices) const;

    /**
     * @brief Gathers along the first axis using the values of `indices`.
     *
     * The index tensor is read as a plain array and does not join the graph.
     */
    Tensor operator[](const Tensor& indices) const;

    Tensor reshape(const std::vector<size_t>& shape) const;

    /**
     * @brief Broadcasts the tensor to `shape`.
     */
    Tensor expand(const std::vector<size_t>& shape) const;

    Tensor permute(const std::vector<size_t>& axes) const;

    /**
     * @brief Reverses the order of all axes.
     */
    Tensor transpose() const;

    /**
     * @brief Constructs a leaf tensor around an existing array.
     *
     * The tensor shares the array's buffer: writes through either are visible
     * to both. Pass `array.copy()` for an independent tensor.
     *
     * @example
     * @code
     * Array w = Array::ones({3, 3});
     * Tensor a = Tensor::from_array(w, true);
     * Tensor b = Tensor::from_array(a.array(), true); // distinct nodes sharing one buffer
     * @endcode
     */
    static Tensor from_array(const Array& array, bool requires_grad = false);

    /* initialization functions: */

    /**
     * @brief Creates a tensor with elements sampled from U(low, high).
     */
    static Tensor uniform(const std::vector<size_t>& shape, float low, float high,
                          Generator& generator, bool requires_grad = false);

    /**
     * @brief Creates a tensor with elements sampled from a standard normal distribution.
     */
    static Tensor randn(const std::vector<size_t>& shape, Generator& generator, bool requires_grad = false);

    /**
     * @brief Creates a `(in_features, out_features)` weight using He initialization.
     *
     * Elements are drawn from a normal distribution with standard deviation
     * \f$\sqrt{\frac{2}{\text{in_features}}}\f$.
     */
    static Tensor randn_he(size_t in_features, size_t out_features, Generator& generator, bool requires_grad);

    /**
     * @brief Creates a bias vector with PyTorch's default uniform initialization.
     *
     * Values are sampled from \f$[-b, b]\f$ with \f$b = \frac{1}{\sqrt{\text{in_features}}}\f$.
     */
    static Tensor bias_uniform(size_t in_features, size_t out_features, Generator& generator, bool requires_grad);

    friend std::ostream& operator<<(std::ostream& os, const Tensor& tensor);
};

Tensor operator+(const float a, const Tensor& b);
Tensor operator-(const float a, const Tensor& b);
Tensor operator*(const float a, const Tensor& b);
Tensor operator/(const float a, const Tensor& b);

Tensor maximum(const Tensor& a, const Tensor& b);
Tensor exp(const Tensor& x);
Tensor log(const Tensor& x);
Tensor matmul(const Tensor& a, const Tensor& b);
Tensor sum(const Tensor& x, std::optional<int> axis = std::nullopt, bool keepdims = false);

/**
 * @brief Provenance of a tensor produced by an operation.
 *
 * A recipe is created once, never modified and attached to exactly one tensor.
 */
struct Recipe {
    /**
     * @brief Operation that produced the tensor; only used to select backward rules.
     */
    Op operation;

    /**
     * @brief Positional operands as passed to the forward function.
     *
     * Tensor operands are replaced by a deep copy of their array, so in-place
     * writes to a parent after the recipe was created do not reach it.
     */
    std::vector<Array> args;

    Kwargs kwargs;

    /**
     * @brief Tensor operands keyed by their position in `args`.
     *
     * Plain operands occupy no entry.
     */
    std::map<size_t, Tensor> parents;
};

/**
 * @brief Internal representation of tensor data.
 *
 * Holds the value, the gradient buffer and the provenance of one graph node.
 * The gradient is allocated with the array, zero-filled and only ever
 * modified in place.
 */
class TensorData {
public:
    size_t id;                              ///< Unique identifier, the node's identity.
    Array array;                            ///< Tensor values, possibly shared with other tensors.
    Array grad;                             ///< Accumulated gradient, owned by this node.
    bool requires_grad;                     ///< Whether operations record provenance through this node.
    std::shared_ptr<const Recipe> recipe;   ///< How `array` was produced, null for user-constructed tensors.

    TensorData(const Array& array, bool requires_grad, std::shared_ptr<const Recipe> recipe = nullptr)
        : id(get_id()),
          array(array),
          grad(Array::zeros(array.shape())),
          requires_grad(requires_grad),
          recipe(std::move(recipe)) {}
};

/* Operation wrapper: */

/**
 * @brief Positional operand of an operation: a tensor or a plain value.
 */
class Operand {
public:
    Operand(const Tensor& tensor) : tensor_(tensor), array_(tensor.array()) {}
    Operand(const Array& array) : array_(array) {}
    Operand(float value) : array_(Array::scalar(value)) {}

    bool is_tensor() const { return tensor_.ptr != nullptr; }
    const Tensor& tensor() const { return tensor_; }
    const Array& array() const { return array_; }

private:
    Tensor tensor_;
    Array array_;
};

/**
 * @brief Array-level implementation of an operation.
 */
using ForwardFn = Array (*)(const std::vector<Array>& args, const Kwargs& kwargs);

/**
 * @brief Tensor-level operation produced by `make_op`.
 */
using TensorFn = std::function<Tensor(const std::vector<Operand>& operands, const Kwargs& kwargs)>;

/**
 * @brief Turns an array function into a differentiable tensor function.
 *
 * The returned function:
 * 1. **Unwraps operands:** every tensor operand is replaced by a snapshot of its array.
 * 2. **Runs the forward:** calls `forward` on the snapshots and `kwargs`.
 * 3. **Records provenance:** wraps the result in a new tensor that requires
 *    gradients and carries a recipe tagged with `op`, the snapshots, `kwargs`
 *    and the tensor operands keyed by position.
 *
 * @example
 * @code
 * static const TensorFn exp_op = make_op(Op::Exp, forward_exp);
 * Tensor y = exp_op({x}, {});
 * @endcode
 */
TensorFn make_op(Op op, ForwardFn forward);

/* Backward rule registry: */

/**
 * @brief Computes one parent's gradient contribution.
 *
 * @param grad_out Gradient accumulated at the node that used the operation.
 * @param out Value of that node.
 * @param args Recorded positional operands.
 * @param kwargs Recorded named operands.
 * @return Array Contribution shaped exactly like the parent at the rule's slot.
 */
using BackwardRule = Array (*)(const Array& grad_out, const Array& out,
                               const std::vector<Array>& args, const Kwargs& kwargs);

/**
 * @brief Looks up the backward rule for `(op, slot)`.
 *
 * @return BackwardRule The rule, or `nullptr` if the operation has no rule for this slot.
 */
BackwardRule find_backward_rule(Op op, size_t slot);

/**
 * @brief Reduces a gradient shaped like a broadcasted result back to `original_shape`.
 *
 * 1. Sums over the leading axes broadcasting prepended.
 * 2. Sums, keeping dimensions, over every axis where `original_shape` has
 *    size 1 and the gradient does not.
 *
 * @throws std::invalid_argument If `grad` could not have been broadcast from `original_shape`.
 */
Array unbroadcast(const Array& grad, const std::vector<size_t>& original_shape);

/* Graph traversal: */

/**
 * @brief Orders every tensor reachable from `root` so that each comes after all of its parents.
 */
std::vector<Tensor> topological_sort(const Tensor& root);

/**
 * @brief Backpropagates from `root`.
 *
 * Sets the gradient of `root` to `seed` (ones if empty) and accumulates the
 * contribution of every node into the gradients of its parents, outputs first.
 *
 * @throws std::invalid_argument If `seed` is not shaped like `root`.
 * @throws std::logic_error If a recipe names a slot without a backward rule,
 *         or a rule returns a gradient not shaped like its parent.
 */
void backward(const Tensor& root, const std::optional<Array>& seed = std::nullopt);

#endif // RECIPEGRAD_H
