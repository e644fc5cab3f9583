#include "../unit_tests.h"

void reduction_test(const std::string& test_name,
                    const std::vector<size_t>& shape,
                    const std::function<Tensor(Tensor)>& cpp_op,
                    const std::function<torch::Tensor(torch::Tensor)>& torch_op,
                    float low,
                    float high) {

    Tensor a_cpp = Tensor::uniform(shape, low, high, test_generator(), true);
    Tensor c_cpp = cpp_op(a_cpp);
    c_cpp.backward();

    auto a_torch = to_torch(a_cpp);
    auto c_torch = torch_op(a_torch);
    c_torch.backward();

    /* compare_tensors needed here because we need to compare gradients as well */
    ASSERT_TRUE(compare_tensors(c_cpp.array(), c_torch, test_name + " Result"));
    ASSERT_TRUE(compare_tensors(a_cpp.grad(), a_torch.grad(), test_name + " Gradient (a)"));
}
