#include "../unit_tests.h"

void scalar_test(const std::string& test_name,
                 const std::function<Tensor(Tensor, Tensor)>& cpp_op,
                 const std::function<torch::Tensor(torch::Tensor, torch::Tensor)>& torch_op) {

    /* 0-dimensional operands, b kept away from zero for division */
    Tensor a_cpp = Tensor::uniform({}, -2.0f, 2.0f, test_generator(), true);
    Tensor b_cpp = Tensor::uniform({}, 0.5f, 2.0f, test_generator(), true);

    Tensor c_cpp = cpp_op(a_cpp, b_cpp);
    c_cpp.backward();

    auto a_torch = to_torch(a_cpp);
    auto b_torch = to_torch(b_cpp);

    auto c_torch = torch_op(a_torch, b_torch);
    c_torch.backward();

    ASSERT_TRUE(compare_scalars(c_cpp.item(), c_torch.item<float>(), test_name + " Result"));
    ASSERT_TRUE(compare_scalars(a_cpp.grad().item(), a_torch.grad().item<float>(), test_name + " Gradient (a)"));
    ASSERT_TRUE(compare_scalars(b_cpp.grad().item(), b_torch.grad().item<float>(), test_name + " Gradient (b)"));
}
