#ifndef RECIPEGRAD_ARRAY_H
#define RECIPEGRAD_ARRAY_H

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

/* Utility functions: */

/**
 * @brief Computes the total number of elements in a given shape.
 *
 * The empty shape describes a 0-dimensional array and has one element.
 */
size_t numel(const std::vector<size_t>& shape);

/**
 * @brief Computes the broadcasted shape for two shapes.
 *
 * Follows **NumPy broadcasting rules**: shapes are aligned from the right and
 * two dimensions are compatible if they are equal or one of them is `1`.
 *
 * @throws std::invalid_argument If the shapes cannot be broadcast together.
 */
std::vector<size_t> broadcast_shapes(const std::vector<size_t>& shape1, const std::vector<size_t>& shape2);

/**
 * @brief Converts a multi-dimensional index into a single linear index.
 *
 * Assumes **row-major ordering**. `multi_index` may have more entries than
 * `shape`; the leading entries are ignored and every dimension of size `1`
 * is read at index `0`, so a coordinate of a broadcasted result maps onto
 * the operand it was broadcast from.
 */
size_t ravel_index(const std::vector<size_t>& multi_index, const std::vector<size_t>& shape);

/**
 * @brief Converts a linear index into a multi-dimensional index (row-major).
 */
std::vector<size_t> unravel_index(size_t idx, const std::vector<size_t>& shape);

/**
 * @brief Prints a shape to standard output.
 */
void print_shape(const std::vector<size_t>& shape);

/**
 * @brief Prints two shapes side by side, used before throwing on a shape mismatch.
 */
void print_shapes(const std::vector<size_t>& shape1, const std::vector<size_t>& shape2);

/**
 * @brief Dense row-major `float` array.
 *
 * An `Array` is a shape plus a shared buffer. Copying an `Array` aliases the
 * buffer, the same way two NumPy views share memory; `copy()` produces an
 * independent array. Aliasing is entirely up to the caller.
 *
 * The empty shape `{}` is a 0-dimensional array holding exactly one element.
 */
class Array {
public:
    /**
     * @brief Constructs a 0-dimensional array holding `0.0f`.
     */
    Array();

    /**
     * @brief Constructs a 1D array with shape inferred from `data.size()`.
     */
    explicit Array(const std::vector<float>& data);

    /**
     * @brief Constructs an array with an explicit shape.
     *
     * @throws std::invalid_argument If the number of elements in `data` does not match `shape`.
     */
    Array(const std::vector<float>& data, const std::vector<size_t>& shape);

    static Array scalar(float value);
    static Array zeros(const std::vector<size_t>& shape);
    static Array ones(const std::vector<size_t>& shape);
    static Array full(const std::vector<size_t>& shape, float value);

    const std::vector<size_t>& shape() const { return shape_; }
    size_t ndim() const { return shape_.size(); }
    size_t size() const { return buffer_->size(); }

    float* data() { return buffer_->data(); }
    const float* data() const { return buffer_->data(); }

    float& operator[](size_t i) { return (*buffer_)[i]; }
    const float& operator[](size_t i) const { return (*buffer_)[i]; }

    /**
     * @brief Returns a copy of the elements in row-major order.
     */
    std::vector<float> to_vector() const;

    /**
     * @brief Returns the single element of a one-element array.
     *
     * @throws std::runtime_error If the array does not hold exactly one element.
     */
    float item() const;

    /**
     * @brief Deep copy with its own buffer.
     */
    Array copy() const;

    /**
     * @brief Whether both arrays read and write the same buffer.
     */
    bool shares_buffer(const Array& other) const { return buffer_ == other.buffer_; }

    /**
     * @brief Fills every element with `value` in place.
     */
    void fill(float value);

    /**
     * @brief In-place elementwise accumulation `this += other`.
     *
     * @throws std::invalid_argument If the shapes differ.
     */
    void add_(const Array& other);

    friend std::ostream& operator<<(std::ostream& os, const Array& array);

private:
    std::shared_ptr<std::vector<float>> buffer_;
    std::vector<size_t> shape_;

    void print_recursive(std::ostream& os, size_t dim, size_t offset, size_t stride) const;
};

/**
 * @brief Index applied by an indexed read.
 *
 * Three forms are supported:
 * - a single integer, selecting one entry along the first axis;
 * - a tuple of integers, selecting along the leading axes one integer each;
 * - an integer-valued array, gathering entries along the first axis.
 *
 * Negative integers count from the end of their axis.
 */
class Index {
public:
    enum class Kind { None, Integer, Tuple, IntegerArray };

    Index() = default;
    Index(long i);
    Index(const std::vector<long>& tuple);
    Index(const Array& indices);

    Kind kind() const { return kind_; }
    const std::vector<long>& integers() const { return integers_; }
    const Array& indices() const { return indices_; }

private:
    Kind kind_ = Kind::None;
    std::vector<long> integers_;
    Array indices_;
};

/* Elementwise operations, all broadcasting: */

Array add(const Array& a, const Array& b);
Array subtract(const Array& a, const Array& b);
Array multiply(const Array& a, const Array& b);
Array divide(const Array& a, const Array& b);

/**
 * @brief Elementwise maximum; for equal elements the value of `a` is taken.
 */
Array maximum(const Array& a, const Array& b);

Array negative(const Array& a);
Array exp(const Array& a);
Array log(const Array& a);

/**
 * @brief Sum reduction.
 *
 * Without an axis every element is summed. With `keepdims` the reduced axes
 * stay in the result with size `1`, otherwise they are removed, so a full
 * reduction without `keepdims` yields a 0-dimensional array.
 *
 * @param axis Axis to reduce; negative values count from the end.
 * @throws std::out_of_range If `axis` does not name an axis of `a`.
 */
Array sum(const Array& a, std::optional<int> axis = std::nullopt, bool keepdims = false);

/**
 * @brief Batched matrix multiplication with broadcasting support.
 *
 * `a` has shape `[..., m, n]` and `b` has shape `[..., n, p]`; the leading
 * batch axes broadcast against each other and the result has shape
 * `[..., m, p]`.
 *
 * @throws std::invalid_argument If either operand has fewer than two
 *         dimensions, the inner dimensions differ or the batch axes do not broadcast.
 */
Array matmul(const Array& a, const Array& b);

/**
 * @brief Swaps the two trailing axes of an array with at least two dimensions.
 */
Array swap_last_axes(const Array& a);

/**
 * @brief Reorders axes so that result axis `i` is input axis `axes[i]`.
 *
 * @throws std::invalid_argument If `axes` is not a permutation of the array's axes.
 */
Array permute(const Array& a, const std::vector<size_t>& axes);

/**
 * @brief Returns a copy of `a` with a new shape holding the same number of elements.
 *
 * @throws std::invalid_argument If the element counts differ.
 */
Array reshape(const Array& a, const std::vector<size_t>& shape);

/**
 * @brief Broadcasts `a` to `shape`, materializing the repeated elements.
 *
 * @throws std::invalid_argument If `a` cannot be broadcast to exactly `shape`.
 */
Array broadcast_to(const Array& a, const std::vector<size_t>& shape);

/**
 * @brief Inserts an axis of size `1` at position `axis`.
 */
Array expand_dims(const Array& a, size_t axis);

/**
 * @brief Indexed read, see `Index` for the supported forms.
 *
 * @throws std::out_of_range If an index is out of range or there are more
 *         integers than axes.
 * @throws std::invalid_argument If `a` is 0-dimensional or an array index holds non-integral values.
 */
Array take(const Array& a, const Index& index);

/**
 * @brief Scatter-add of `values` into `target` at `index`.
 *
 * Repeated indices accumulate rather than overwrite, so `values` is summed
 * into every position it was read from by `take(target, index)`.
 *
 * @throws std::invalid_argument If `values` does not have the shape `take` would produce.
 */
void index_add(Array& target, const Index& index, const Array& values);

#endif // RECIPEGRAD_ARRAY_H
