#include "recipegrad.h"

#include <queue>
#include <string>
#include <unordered_map>

/**
 * @brief Constructs a topologically sorted view of the computation graph.
 *
 * The function follows these steps:
 * 1. **Graph Traversal:** A depth-first walk from `root` through the recipe
 *    parents records, for every reachable node, how many parents it still
 *    waits for and which children each parent feeds. Leaves wait for nothing
 *    and the walk does not continue past them.
 * 2. **Topological Sorting:** A worklist seeded with the nodes that wait for
 *    no parent is drained; each drained node is appended to the order and
 *    releases its children, which join the worklist once every parent has
 *    been appended.
 *
 * Nodes are keyed by their ID, so tensors with equal values remain distinct nodes.
 * A tensor used twice by the same operation (`a * a`) counts as two parents of
 * its child and releases it twice.
 *
 * @param root The tensor to start from.
 * @return std::vector<Tensor> Every reachable tensor, each after all of its parents.
 */
std::vector<Tensor> topological_sort(const Tensor& root) {

    /* 1. gather the graph by traversing from root up to all parents */
    std::unordered_map<size_t, std::vector<Tensor>> children;  // parent ID -> children, one entry per slot
    std::unordered_map<size_t, size_t> remaining_parents;      // node ID -> parents not yet ordered
    std::vector<Tensor> all_nodes;

    std::vector<Tensor> to_visit = {root};
    while (!to_visit.empty()) {
        Tensor curr = to_visit.back();
        to_visit.pop_back();

        if (remaining_parents.count(curr.id())) {
            continue;
        }
        all_nodes.push_back(curr);

        if (curr.is_leaf()) {
            remaining_parents[curr.id()] = 0;
            continue;
        }

        const auto& parents = curr.recipe()->parents;
        remaining_parents[curr.id()] = parents.size();
        for (const auto& entry : parents) {
            children[entry.second.id()].push_back(curr);
            to_visit.push_back(entry.second);
        }
    }

    /* 2. initialize a worklist with all nodes that wait for no parent */
    std::queue<Tensor> ready;
    for (const auto& node : all_nodes) {
        if (remaining_parents[node.id()] == 0) {
            ready.push(node);
        }
    }

    /* 3. pop from 'ready' and release the children of every ordered node */
    std::vector<Tensor> order;
    order.reserve(all_nodes.size());
    while (!ready.empty()) {
        Tensor curr = ready.front();
        ready.pop();
        order.push_back(curr);

        auto it = children.find(curr.id());
        if (it == children.end()) {
            continue;
        }
        for (const auto& child : it->second) {
            if (--remaining_parents[child.id()] == 0) {
                ready.push(child);
            }
        }
    }

    if (order.size() != all_nodes.size()) {
        throw std::logic_error("Computation graph contains a cycle.");
    }
    return order;
}

/**
 * @brief Computes gradients for every ancestor of `root` using backpropagation.
 *
 * 1. **Graph Construction:** Calls `topological_sort()` on `root`.
 * 2. **Gradient Initialization:** Sets the gradient of `root` to `seed`, or to
 *    ones when no seed is given.
 * 3. **Gradient Propagation:** Walks the order from outputs to leaves. For
 *    every non-leaf node and every parent slot of its recipe, the backward
 *    rule of `(operation, slot)` computes the parent's contribution. Reverse
 *    topological order guarantees a node has received all of its contributions
 *    before it propagates its own.
 * 4. **Accumulation:** The gradients of this pass are added to the stored
 *    gradient of every node other than `root`.
 *
 * Propagation only reads the gradients of the current pass, so a node whose
 * stored gradient holds earlier passes does not count them again.
 *
 * @example
 * @code
 * Tensor loss = (a * b).sum();
 * backward(loss); // a.grad() now holds b, b.grad() holds a
 * @endcode
 */
void backward(const Tensor& root, const std::optional<Array>& seed) {
    std::vector<Tensor> order = topological_sort(root);

    Array& root_grad = root.ptr->grad;
    if (seed) {
        if (seed->shape() != root_grad.shape()) {
            print_shapes(seed->shape(), root_grad.shape());
            throw std::invalid_argument("Seed gradient must be shaped like the tensor it is applied to.");
        }
        for (size_t i = 0; i < root_grad.size(); ++i) {
            root_grad[i] = (*seed)[i];
        }
    } else {
        root_grad.fill(1.0f);
    }

    /* gradients of this pass only, keyed by node ID */
    std::unordered_map<size_t, Array> pass_grads;
    pass_grads.emplace(root.id(), root_grad.copy());
    for (const auto& node : order) {
        pass_grads.emplace(node.id(), Array::zeros(node.shape()));
    }

    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const Tensor& node = *it;
        if (node.is_leaf()) {
            continue;
        }

        const Recipe& recipe = *node.recipe();
        const Array& grad_out = pass_grads.at(node.id());
        for (const auto& [slot, parent] : recipe.parents) {
            BackwardRule rule = find_backward_rule(recipe.operation, slot);
            if (rule == nullptr) {
                throw std::logic_error(std::string("No backward rule for operand ") + std::to_string(slot) +
                                       " of " + op_name(recipe.operation) + ".");
            }
            if (recipe.args.size() != op_arity(recipe.operation)) {
                throw std::logic_error(std::string("Recipe of ") + op_name(recipe.operation) + " holds " +
                                       std::to_string(recipe.args.size()) + " operands, its backward rules read " +
                                       std::to_string(op_arity(recipe.operation)) + ".");
            }

            Array contribution = rule(grad_out, node.array(), recipe.args, recipe.kwargs);
            if (contribution.shape() != parent.shape()) {
                print_shapes(contribution.shape(), parent.shape());
                throw std::logic_error(std::string("Backward rule of ") + op_name(recipe.operation) +
                                       " produced a gradient not shaped like its operand.");
            }
            pass_grads.at(parent.id()).add_(contribution);
        }
    }

    for (const auto& node : order) {
        if (node.id() != root.id()) {
            node.ptr->grad.add_(pass_grads.at(node.id()));
        }
    }
}
