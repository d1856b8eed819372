#pragma once

#include <tuple>
#include <utility>
#include <vector>

#include "gell_mann.h"

// линейный индекс элемента тензора 8x8x8
inline size_t TensorIndex(int i, int j, int k) {
    return static_cast<size_t>(i) * kGenerators * kGenerators + j * kGenerators + k;
}

// f_ijk и d_ijk одного конкретного базиса
struct StructureTensors {
    std::vector<double> f;
    std::vector<double> d;

    double F(int i, int j, int k) const { return f[TensorIndex(i, j, k)]; }
    double D(int i, int j, int k) const { return d[TensorIndex(i, j, k)]; }
};

using SparseTensor = std::vector<std::pair<std::tuple<int, int, int>, double>>;

// f_ijk = Re(Tr([M_i, M_j] M_k) / 4i),  d_ijk = Re(Tr({M_i, M_j} M_k)) / 4,
// после чего d симметризуется по (i, j).
// Для базиса не из kGenerators матриц возвращает kInvalidArgument, tensors не трогает.
int ComputeStructureConstants(const Basis &basis, StructureTensors *tensors);

// ненулевые (|value| > eps) элементы в лексикографическом порядке (i, j, k)
SparseTensor SparseEntries(const std::vector<double> &tensor, double eps);
