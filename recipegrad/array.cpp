#include "array.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <string>

size_t numel(const std::vector<size_t>& shape) {
    size_t product = 1;
    for (auto s : shape) {
        product *= s;
    }
    return product;
}

std::vector<size_t> broadcast_shapes(const std::vector<size_t>& shape1, const std::vector<size_t>& shape2) {
    /* number of dimensions in the broadcasted shape */
    size_t max_dims = std::max(shape1.size(), shape2.size());

    std::vector<size_t> result(max_dims, 1);

    for (size_t i = 0; i < max_dims; ++i) {
        /* align from the right, missing dimensions act as 1 */
        size_t dim1 = i < shape1.size() ? shape1[shape1.size() - 1 - i] : 1;
        size_t dim2 = i < shape2.size() ? shape2[shape2.size() - 1 - i] : 1;

        if (dim1 != dim2 && dim1 != 1 && dim2 != 1) {
            print_shapes(shape1, shape2);
            throw std::invalid_argument("Shapes cannot be broadcast together.");
        }

        result[max_dims - 1 - i] = dim1 == 1 ? dim2 : dim1;
    }

    return result;
}

size_t ravel_index(const std::vector<size_t>& multi_index, const std::vector<size_t>& shape) {
    size_t linear_index = 0;
    size_t stride = 1;

    /* align dimensions: shape may be smaller than multi_index */
    size_t offset = multi_index.size() - shape.size();

    for (size_t i = shape.size(); i-- > 0;) {
        size_t dim_size = shape[i];

        /* if broadcasting occurs along this dimension, always use index 0 */
        size_t index_component = (dim_size == 1) ? 0 : multi_index[i + offset];

        linear_index += index_component * stride;
        stride *= dim_size;
    }

    return linear_index;
}

std::vector<size_t> unravel_index(size_t idx, const std::vector<size_t>& shape) {
    std::vector<size_t> coords(shape.size());
    for (size_t i = shape.size(); i-- > 0;) {
        coords[i] = idx % shape[i];
        idx /= shape[i];
    }
    return coords;
}

void print_shape(const std::vector<size_t>& shape) {
    for (size_t s : shape) {
        std::cout << s << " ";
    }
    std::cout << std::endl;
}

void print_shapes(const std::vector<size_t>& shape1, const std::vector<size_t>& shape2) {
    std::cout << "shape ";
    for (auto s : shape1) {
        std::cout << s << " ";
    }
    std::cout << " vs. shape ";
    for (auto s : shape2) {
        std::cout << s << " ";
    }
    std::cout << std::endl;
}

Array::Array() : buffer_(std::make_shared<std::vector<float>>(1, 0.0f)) {}

Array::Array(const std::vector<float>& data)
    : buffer_(std::make_shared<std::vector<float>>(data)), shape_({data.size()}) {}

Array::Array(const std::vector<float>& data, const std::vector<size_t>& shape)
    : buffer_(std::make_shared<std::vector<float>>(data)), shape_(shape) {
    /* check if shape matches */
    if (numel(shape) != data.size()) {
        throw std::invalid_argument("Data size does not match shape.");
    }
}

Array Array::scalar(float value) {
    return Array({value}, {});
}

Array Array::zeros(const std::vector<size_t>& shape) {
    return full(shape, 0.0f);
}

Array Array::ones(const std::vector<size_t>& shape) {
    return full(shape, 1.0f);
}

Array Array::full(const std::vector<size_t>& shape, float value) {
    return Array(std::vector<float>(numel(shape), value), shape);
}

std::vector<float> Array::to_vector() const {
    return *buffer_;
}

float Array::item() const {
    if (buffer_->size() != 1) {
        throw std::runtime_error("item() is only defined for arrays with exactly one element, got " +
                                 std::to_string(buffer_->size()) + ".");
    }
    return (*buffer_)[0];
}

Array Array::copy() const {
    return Array(*buffer_, shape_);
}

void Array::fill(float value) {
    std::fill(buffer_->begin(), buffer_->end(), value);
}

void Array::add_(const Array& other) {
    if (other.shape_ != shape_) {
        print_shapes(shape_, other.shape_);
        throw std::invalid_argument("In-place accumulation requires identical shapes.");
    }
    for (size_t i = 0; i < buffer_->size(); ++i) {
        (*buffer_)[i] += (*other.buffer_)[i];
    }
}

/**
 * @brief Recursively prints array data, one bracket level per dimension.
 */
void Array::print_recursive(std::ostream& os, size_t dim, size_t offset, size_t stride) const {
    os << "[";
    for (size_t i = 0; i < shape_[dim]; ++i) {
        if (dim == shape_.size() - 1) {
            os << (*buffer_)[offset + i];
        } else {
            print_recursive(os, dim + 1, offset + i * stride, stride / shape_[dim + 1]);
        }
        if (i + 1 < shape_[dim]) {
            os << ", ";
        }
    }
    os << "]";
}

std::ostream& operator<<(std::ostream& os, const Array& array) {
    os << "Array(";
    if (array.shape_.empty()) {
        os << (*array.buffer_)[0];
    } else if (numel(array.shape_) == 0) {
        os << "[]";
    } else {
        array.print_recursive(os, 0, 0, numel(array.shape_) / array.shape_[0]);
    }
    os << ", shape=[";
    for (size_t i = 0; i < array.shape_.size(); ++i) {
        os << array.shape_[i] << (i + 1 < array.shape_.size() ? ", " : "");
    }
    os << "])";
    return os;
}

Index::Index(long i) : kind_(Kind::Integer), integers_({i}) {}

Index::Index(const std::vector<long>& tuple) : kind_(Kind::Tuple), integers_(tuple) {}

Index::Index(const Array& indices) : kind_(Kind::IntegerArray), indices_(indices) {}

namespace {

Array broadcast_binary(const Array& a, const Array& b, const std::function<float(float, float)>& fn) {
    std::vector<size_t> result_shape = broadcast_shapes(a.shape(), b.shape());

    size_t result_size = numel(result_shape);
    std::vector<float> result_data(result_size);

    /* iterate over result data, mapping each coordinate back onto both operands */
    for (size_t i = 0; i < result_size; ++i) {
        std::vector<size_t> multi_index = unravel_index(i, result_shape);
        size_t index_a = ravel_index(multi_index, a.shape());
        size_t index_b = ravel_index(multi_index, b.shape());
        result_data[i] = fn(a[index_a], b[index_b]);
    }

    return Array(result_data, result_shape);
}

Array map_unary(const Array& a, const std::function<float(float)>& fn) {
    std::vector<float> result_data(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        result_data[i] = fn(a[i]);
    }
    return Array(result_data, a.shape());
}

size_t normalize_axis(long axis, size_t ndim) {
    long n = static_cast<long>(ndim);
    if (axis < -n || axis >= n) {
        throw std::out_of_range("Axis " + std::to_string(axis) + " is out of range for an array with " +
                                std::to_string(ndim) + " dimensions.");
    }
    return static_cast<size_t>(axis < 0 ? axis + n : axis);
}

size_t normalize_position(long i, size_t extent) {
    long n = static_cast<long>(extent);
    if (i < -n || i >= n) {
        throw std::out_of_range("Index " + std::to_string(i) + " is out of range for an axis of size " +
                                std::to_string(extent) + ".");
    }
    return static_cast<size_t>(i < 0 ? i + n : i);
}

/*
 * Resolves an index into the flat offsets of the selected sub-arrays.
 * Every selection is a contiguous block of `block` elements starting at an
 * offset, and `result_shape` is the shape `take` produces.
 */
void resolve_index(const Array& a, const Index& index,
                   std::vector<size_t>& offsets, size_t& block, std::vector<size_t>& result_shape) {
    const auto& shape = a.shape();
    if (shape.empty()) {
        throw std::invalid_argument("A 0-dimensional array cannot be indexed.");
    }

    switch (index.kind()) {
        case Index::Kind::Integer:
        case Index::Kind::Tuple: {
            const auto& ints = index.integers();
            if (ints.size() > shape.size()) {
                throw std::out_of_range("Too many indices: " + std::to_string(ints.size()) +
                                        " given for an array with " + std::to_string(shape.size()) + " dimensions.");
            }
            result_shape.assign(shape.begin() + ints.size(), shape.end());
            block = numel(result_shape);

            /* row-major offset of the selected block */
            size_t offset = 0;
            for (size_t d = 0; d < ints.size(); ++d) {
                offset = offset * shape[d] + normalize_position(ints[d], shape[d]);
            }
            offset *= block;
            offsets.assign(1, offset);
            break;
        }
        case Index::Kind::IntegerArray: {
            const Array& indices = index.indices();
            result_shape = indices.shape();
            result_shape.insert(result_shape.end(), shape.begin() + 1, shape.end());
            block = numel(shape) / shape[0];

            offsets.resize(indices.size());
            for (size_t i = 0; i < indices.size(); ++i) {
                float value = indices[i];
                if (std::floor(value) != value) {
                    throw std::invalid_argument("Array indices must hold integral values, got " +
                                                std::to_string(value) + ".");
                }
                float extent = static_cast<float>(shape[0]);
                if (value < -extent || value >= extent) {
                    throw std::out_of_range("Index " + std::to_string(value) + " is out of range for an axis of size " +
                                            std::to_string(shape[0]) + ".");
                }
                offsets[i] = normalize_position(static_cast<long>(value), shape[0]) * block;
            }
            break;
        }
        case Index::Kind::None:
            throw std::invalid_argument("Indexed read without an index.");
    }
}

} // namespace

Array add(const Array& a, const Array& b) {
    return broadcast_binary(a, b, [](float x, float y) { return x + y; });
}

Array subtract(const Array& a, const Array& b) {
    return broadcast_binary(a, b, [](float x, float y) { return x - y; });
}

Array multiply(const Array& a, const Array& b) {
    return broadcast_binary(a, b, [](float x, float y) { return x * y; });
}

Array divide(const Array& a, const Array& b) {
    return broadcast_binary(a, b, [](float x, float y) { return x / y; });
}

Array maximum(const Array& a, const Array& b) {
    return broadcast_binary(a, b, [](float x, float y) { return x >= y ? x : y; });
}

Array negative(const Array& a) {
    return map_unary(a, [](float x) { return -x; });
}

Array exp(const Array& a) {
    return map_unary(a, [](float x) { return std::exp(x); });
}

Array log(const Array& a) {
    return map_unary(a, [](float x) { return std::log(x); });
}

Array sum(const Array& a, std::optional<int> axis, bool keepdims) {
    const auto& this_shape = a.shape();

    if (!axis) {
        float total = 0.0f;
        for (size_t i = 0; i < a.size(); ++i) {
            total += a[i];
        }
        std::vector<size_t> new_shape;
        if (keepdims) {
            new_shape.assign(this_shape.size(), 1);
        }
        return Array({total}, new_shape);
    }

    size_t dim = normalize_axis(*axis, this_shape.size());

    /* compute new shape after reduction, keeping the axis as size 1 */
    std::vector<size_t> kept_shape = this_shape;
    kept_shape[dim] = 1;

    size_t result_size = numel(kept_shape);
    std::vector<float> result_data(result_size, 0.0f);

    /* every input element lands on the output coordinate with `dim` collapsed */
    for (size_t i = 0; i < a.size(); ++i) {
        std::vector<size_t> coords = unravel_index(i, this_shape);
        result_data[ravel_index(coords, kept_shape)] += a[i];
    }

    if (keepdims) {
        return Array(result_data, kept_shape);
    }
    std::vector<size_t> new_shape = this_shape;
    new_shape.erase(new_shape.begin() + dim);
    return Array(result_data, new_shape);
}

Array swap_last_axes(const Array& a) {
    if (a.ndim() < 2) {
        throw std::invalid_argument("swap_last_axes requires at least two dimensions.");
    }
    std::vector<size_t> axes(a.ndim());
    for (size_t i = 0; i < axes.size(); ++i) {
        axes[i] = i;
    }
    std::swap(axes[axes.size() - 1], axes[axes.size() - 2]);
    return permute(a, axes);
}

Array permute(const Array& a, const std::vector<size_t>& axes) {
    const auto& this_shape = a.shape();

    /* check that axes is a permutation */
    std::vector<bool> seen(this_shape.size(), false);
    if (axes.size() != this_shape.size()) {
        throw std::invalid_argument("permute expects one entry per dimension.");
    }
    for (auto ax : axes) {
        if (ax >= this_shape.size() || seen[ax]) {
            throw std::invalid_argument("permute expects a permutation of the array's axes.");
        }
        seen[ax] = true;
    }

    std::vector<size_t> new_shape(axes.size());
    for (size_t i = 0; i < axes.size(); ++i) {
        new_shape[i] = this_shape[axes[i]];
    }

    std::vector<float> result_data(a.size());
    std::vector<size_t> source_coords(this_shape.size());
    for (size_t i = 0; i < result_data.size(); ++i) {
        std::vector<size_t> coords = unravel_index(i, new_shape);
        for (size_t d = 0; d < axes.size(); ++d) {
            source_coords[axes[d]] = coords[d];
        }
        result_data[i] = a[ravel_index(source_coords, this_shape)];
    }

    return Array(result_data, new_shape);
}

Array reshape(const Array& a, const std::vector<size_t>& shape) {
    if (numel(shape) != a.size()) {
        print_shapes(a.shape(), shape);
        throw std::invalid_argument("reshape cannot change the number of elements.");
    }
    return Array(a.to_vector(), shape);
}

Array broadcast_to(const Array& a, const std::vector<size_t>& shape) {
    if (broadcast_shapes(a.shape(), shape) != shape) {
        print_shapes(a.shape(), shape);
        throw std::invalid_argument("Array cannot be broadcast to the requested shape.");
    }

    std::vector<float> result_data(numel(shape));
    for (size_t i = 0; i < result_data.size(); ++i) {
        result_data[i] = a[ravel_index(unravel_index(i, shape), a.shape())];
    }
    return Array(result_data, shape);
}

Array expand_dims(const Array& a, size_t axis) {
    if (axis > a.ndim()) {
        throw std::out_of_range("expand_dims axis " + std::to_string(axis) + " is out of range.");
    }
    std::vector<size_t> new_shape = a.shape();
    new_shape.insert(new_shape.begin() + axis, 1);
    return Array(a.to_vector(), new_shape);
}

Array take(const Array& a, const Index& index) {
    std::vector<size_t> offsets;
    size_t block = 0;
    std::vector<size_t> result_shape;
    resolve_index(a, index, offsets, block, result_shape);

    std::vector<float> result_data(offsets.size() * block);
    for (size_t i = 0; i < offsets.size(); ++i) {
        std::copy(a.data() + offsets[i], a.data() + offsets[i] + block, result_data.begin() + i * block);
    }
    return Array(result_data, result_shape);
}

void index_add(Array& target, const Index& index, const Array& values) {
    std::vector<size_t> offsets;
    size_t block = 0;
    std::vector<size_t> result_shape;
    resolve_index(target, index, offsets, block, result_shape);

    if (values.shape() != result_shape) {
        print_shapes(values.shape(), result_shape);
        throw std::invalid_argument("index_add values do not match the indexed shape.");
    }

    /* accumulate, so repeated offsets receive the sum of their contributions */
    for (size_t i = 0; i < offsets.size(); ++i) {
        for (size_t j = 0; j < block; ++j) {
            target[offsets[i] + j] += values[i * block + j];
        }
    }
}
