#include "array.h"

#include <algorithm>

/* Edge length of the square tiles used by the matmul kernel. */
constexpr size_t TILE_SIZE = 32;

/**
 * @brief Performs batched tiled matrix multiplication.
 *
 * Computes C = A * B for every batch using a tiled approach to improve cache
 * efficiency. A, B and C are stored in row-major order and C must be
 * zero-initialized, since every tile accumulates into it.
 *
 * @param A Pointer to the first element of A.
 * @param B Pointer to the first element of B.
 * @param C Pointer to the first element of C.
 * @param m Number of rows in A.
 * @param n Shared dimension between A and B.
 * @param p Number of columns in B.
 * @param A_offsets Starting offsets of A for each batch.
 * @param B_offsets Starting offsets of B for each batch.
 * @param C_offsets Starting offsets of C for each batch.
 */
static void matmul_tiled(const float* A, const float* B, float* C,
                         size_t m, size_t n, size_t p,
                         const std::vector<size_t>& A_offsets,
                         const std::vector<size_t>& B_offsets,
                         const std::vector<size_t>& C_offsets) {

    for (size_t b = 0; b < C_offsets.size(); ++b) {
        const float* A_ptr = A + A_offsets[b];
        const float* B_ptr = B + B_offsets[b];
        float* C_ptr = C + C_offsets[b];

        for (size_t i = 0; i < m; i += TILE_SIZE) {
            size_t i_end = std::min(i + TILE_SIZE, m);

            for (size_t j = 0; j < p; j += TILE_SIZE) {
                size_t j_end = std::min(j + TILE_SIZE, p);

                for (size_t k = 0; k < n; k += TILE_SIZE) {
                    size_t k_end = std::min(k + TILE_SIZE, n);

                    /* compute small tiles */
                    for (size_t ii = i; ii < i_end; ++ii) {
                        float* C_row = C_ptr + ii * p;        // C[ii, *]
                        const float* A_row = A_ptr + ii * n;  // A[ii, *]

                        for (size_t jj = j; jj < j_end; ++jj) {
                            float sum = 0.0f;
                            for (size_t kk = k; kk < k_end; ++kk) {
                                sum += A_row[kk] * B_ptr[kk * p + jj];  // A[ii, kk] * B[kk, jj]
                            }
                            C_row[jj] += sum;
                        }
                    }
                }
            }
        }
    }
}

Array matmul(const Array& a, const Array& b) {
    const auto& a_shape = a.shape();
    const auto& b_shape = b.shape();

    if (a_shape.size() < 2 || b_shape.size() < 2) {
        print_shapes(a_shape, b_shape);
        throw std::invalid_argument("matmul requires operands with at least two dimensions.");
    }

    size_t m = a_shape[a_shape.size() - 2];
    size_t n = a_shape[a_shape.size() - 1];
    size_t x = b_shape[b_shape.size() - 2];
    size_t p = b_shape[b_shape.size() - 1];

    if (n != x) {
        print_shapes(a_shape, b_shape);
        throw std::invalid_argument("Inner dimensions of matmul operands must agree.");
    }

    /* broadcast the batch dimensions */
    std::vector<size_t> a_batch(a_shape.begin(), a_shape.end() - 2);
    std::vector<size_t> b_batch(b_shape.begin(), b_shape.end() - 2);
    std::vector<size_t> batch_shape = broadcast_shapes(a_batch, b_batch);

    std::vector<size_t> result_shape = batch_shape;
    result_shape.push_back(m);
    result_shape.push_back(p);

    /* starting offset of every matrix in the batch */
    size_t batch_size = numel(batch_shape);
    std::vector<size_t> A_offsets(batch_size), B_offsets(batch_size), C_offsets(batch_size);
    for (size_t i = 0; i < batch_size; ++i) {
        std::vector<size_t> batch_index = unravel_index(i, batch_shape);
        A_offsets[i] = ravel_index(batch_index, a_batch) * m * n;
        B_offsets[i] = ravel_index(batch_index, b_batch) * n * p;
        C_offsets[i] = i * m * p;
    }

    Array result = Array::zeros(result_shape);
    matmul_tiled(a.data(), b.data(), result.data(), m, n, p, A_offsets, B_offsets, C_offsets);
    return result;
}
