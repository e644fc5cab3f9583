#include "../unit_tests.h"

void multidim_test(const std::string& test_name,
                   const std::vector<size_t>& shape1,
                   const std::vector<size_t>& shape2,
                   const std::function<Tensor(Tensor, Tensor)>& cpp_op,
                   const std::function<torch::Tensor(torch::Tensor, torch::Tensor)>& torch_op) {

    Tensor a_cpp = Tensor::randn(shape1, test_generator(), true);
    /* second operand is a divisor in several tests, keep it away from zero */
    Tensor b_cpp = Tensor::uniform(shape2, 0.5f, 2.0f, test_generator(), true);

    Tensor c_cpp = cpp_op(a_cpp, b_cpp);
    c_cpp.backward();

    auto a_torch = to_torch(a_cpp);
    auto b_torch = to_torch(b_cpp);

    auto c_torch = torch_op(a_torch, b_torch);
    c_torch.backward();

    ASSERT_TRUE(compare_tensors(c_cpp.array(), c_torch, test_name + " Result"));
    ASSERT_TRUE(compare_tensors(a_cpp.grad(), a_torch.grad(), test_name + " Gradient (a)"));
    ASSERT_TRUE(compare_tensors(b_cpp.grad(), b_torch.grad(), test_name + " Gradient (b)"));
}

void multidim_test(const std::string& test_name,
                   const std::vector<size_t>& shape1,
                   const std::vector<size_t>& shape2,
                   const std::vector<size_t>& shape3,
                   const std::function<Tensor(Tensor, Tensor, Tensor)>& cpp_op,
                   const std::function<torch::Tensor(torch::Tensor, torch::Tensor, torch::Tensor)>& torch_op) {

    Tensor a_cpp = Tensor::randn(shape1, test_generator(), true);
    Tensor b_cpp = Tensor::randn(shape2, test_generator(), true);
    Tensor c_cpp = Tensor::randn(shape3, test_generator(), true);

    Tensor d_cpp = cpp_op(a_cpp, b_cpp, c_cpp);
    d_cpp.backward();

    auto a_torch = to_torch(a_cpp);
    auto b_torch = to_torch(b_cpp);
    auto c_torch = to_torch(c_cpp);

    auto d_torch = torch_op(a_torch, b_torch, c_torch);
    d_torch.backward();

    ASSERT_TRUE(compare_tensors(d_cpp.array(), d_torch, test_name + " Result"));
    ASSERT_TRUE(compare_tensors(a_cpp.grad(), a_torch.grad(), test_name + " Gradient (a)"));
    ASSERT_TRUE(compare_tensors(b_cpp.grad(), b_torch.grad(), test_name + " Gradient (b)"));
    ASSERT_TRUE(compare_tensors(c_cpp.grad(), c_torch.grad(), test_name + " Gradient (c)"));
}
