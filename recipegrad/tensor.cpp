#include "recipegrad.h"

#include <sstream>
#include <string>

/**
 * @brief Global atomic counter for assigning unique tensor IDs.
 */
std::atomic<std::uint64_t> id_counter{1};

size_t get_id() {
    size_t counter = id_counter++;
    if (counter == 0) {
        throw std::runtime_error("Tensor ID counter overflow");
    }
    return counter;
}

const char* op_name(Op op) {
    switch (op) {
        case Op::Add: return "add";
        case Op::Multiply: return "multiply";
        case Op::Divide: return "divide";
        case Op::Negative: return "negative";
        case Op::Maximum: return "maximum";
        case Op::Exp: return "exp";
        case Op::Log: return "log";
        case Op::Matmul: return "matmul";
        case Op::Sum: return "sum";
        case Op::Index: return "index";
        case Op::Reshape: return "reshape";
        case Op::Expand: return "expand";
        case Op::Permute: return "permute";
    }
    return "unknown";
}

size_t op_arity(Op op) {
    switch (op) {
        case Op::Add:
        case Op::Multiply:
        case Op::Divide:
        case Op::Maximum:
        case Op::Matmul:
            return 2;
        case Op::Negative:
        case Op::Exp:
        case Op::Log:
        case Op::Sum:
        case Op::Index:
        case Op::Reshape:
        case Op::Expand:
        case Op::Permute:
            return 1;
    }
    return 0;
}

Tensor::Tensor(const std::vector<float>& data, bool requires_grad) {
    this->ptr = std::make_shared<TensorData>(Array(data), requires_grad);
}

Tensor::Tensor(const std::vector<float>& data, const std::vector<size_t>& shape, bool requires_grad) {
    this->ptr = std::make_shared<TensorData>(Array(data, shape), requires_grad);
}

Tensor::Tensor(const Array& array, std::shared_ptr<const Recipe> recipe) {
    this->ptr = std::make_shared<TensorData>(array, true, std::move(recipe));
}

Tensor Tensor::from_array(const Array& array, bool requires_grad) {
    return Tensor(std::make_shared<TensorData>(array, requires_grad));
}

Array& Tensor::array() {
    return ptr->array;
}

const Array& Tensor::array() const {
    return ptr->array;
}

const Array& Tensor::grad() const {
    return ptr->grad;
}

std::vector<size_t> Tensor::shape() const {
    if (this->ptr == nullptr) {
        return {};
    }
    return ptr->array.shape();
}

size_t Tensor::ndim() const {
    return ptr->array.ndim();
}

size_t Tensor::numel() const {
    return ptr->array.size();
}

size_t Tensor::len() const {
    if (ptr->array.ndim() == 0) {
        throw std::invalid_argument("len() of a 0-dimensional tensor");
    }
    return ptr->array.shape()[0];
}

float Tensor::item() const {
    return ptr->array.item();
}

Tensor::operator bool() const {
    if (ptr->array.size() != 1) {
        throw std::runtime_error("The truth value of a tensor with " + std::to_string(ptr->array.size()) +
                                 " elements is ambiguous.");
    }
    return ptr->array[0] != 0.0f;
}

size_t Tensor::id() const {
    return ptr->id;
}

bool Tensor::requires_grad() const {
    return ptr->requires_grad;
}

const Recipe* Tensor::recipe() const {
    return ptr->recipe.get();
}

bool Tensor::is_leaf() const {
    return !ptr->requires_grad || !ptr->recipe || ptr->recipe->parents.empty();
}

void Tensor::backward() {
    ::backward(*this);
}

void Tensor::backward(const Array& seed) {
    ::backward(*this, seed);
}

void Tensor::zero_grad() {
    ptr->grad.fill(0.0f);
}

void Tensor::eval() {
    ptr->requires_grad = false;
}

void Tensor::train() {
    ptr->requires_grad = true;
}

/**
 * @brief Prints the tensor in a format similar to PyTorch:
 * ```
 * Tensor([[1, 2], [3, 4]], shape=[2, 2], requires_grad=1)
 * ```
 */
std::ostream& operator<<(std::ostream& os, const Tensor& tensor) {
    if (tensor.ptr == nullptr) {
        return os << "Tensor(null)";
    }
    std::ostringstream array_text;
    array_text << tensor.array();

    /* reuse the array printout without its "Array(" prefix and ")" suffix */
    std::string body = array_text.str();
    body = body.substr(6, body.size() - 7);

    os << "Tensor(" << body << ", requires_grad=" << tensor.requires_grad() << ")";
    return os;
}
