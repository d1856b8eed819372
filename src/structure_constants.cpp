#include "structure_constants.h"

#include <cmath>
#include <iostream>

#include "status.h"

int ComputeStructureConstants(const Basis &basis, StructureTensors *tensors) {
    if (basis.size() != static_cast<size_t>(kGenerators)) {
        std::cerr << "ComputeStructureConstants: expected " << kGenerators
                  << " generators, got " << basis.size() << "\n";
        return kInvalidArgument;
    }

    const int M = kGenerators;
    size_t total_elements = M * M * M;
    std::vector<double> f_tensor(total_elements, 0.0);
    std::vector<double> d_tensor(total_elements, 0.0);

    // 1 / 4i
    const MKL_Complex16 inv_four_i = {0.0, -0.25};

    for (int m = 0; m < M; ++m) {
        for (int n = 0; n < M; ++n) {
            Operator commutator = Commutator(basis[m], basis[n]);
            Operator anticommutator = AntiCommutator(basis[m], basis[n]);
            for (int s = 0; s < M; ++s) {
                size_t index = TensorIndex(m, n, s);

                // мнимая часть после деления на 4i - численный шум, отбрасываем
                f_tensor[index] = (TraceOfProduct(commutator, basis[s]) * inv_four_i).real;
                d_tensor[index] = TraceOfProduct(anticommutator, basis[s]).real / 4.;
            }
        }
    }

    for (int m = 0; m < M; ++m) {
        for (int n = m + 1; n < M; ++n) {
            for (int s = 0; s < M; ++s) {
                size_t mn = TensorIndex(m, n, s);
                size_t nm = TensorIndex(n, m, s);
                double sym = 0.5 * (d_tensor[mn] + d_tensor[nm]);
                d_tensor[mn] = sym;
                d_tensor[nm] = sym;
            }
        }
    }

    tensors->f = std::move(f_tensor);
    tensors->d = std::move(d_tensor);
    return kOk;
}

SparseTensor SparseEntries(const std::vector<double> &tensor, double eps) {
    SparseTensor arr;
    const int M = kGenerators;
    for (int i = 0; i < M; ++i) {
        for (int j = 0; j < M; ++j) {
            for (int k = 0; k < M; ++k) {
                double value = tensor[TensorIndex(i, j, k)];
                if (std::abs(value) > eps) {
                    arr.emplace_back(std::tuple(i, j, k), value);
                }
            }
        }
    }
    return arr;
}
