#pragma once

#include <vector>

#include "matrix_ops.h"

// число генераторов su(3)
constexpr int kGenerators = kDim * kDim - 1;

// индекс генератора lambda4, вокруг которого вращается базис
constexpr int kRotationGenerator = 3;

// упорядоченный набор из kGenerators эрмитовых бесследовых матриц
using Basis = std::vector<Operator>;

// Матрицы Гелл-Манна lambda1..lambda8 в стандартном порядке:
// (lambda1, lambda2, lambda3) действуют на состояния {0,1},
// (lambda4, lambda5) на {0,2}, (lambda6, lambda7) на {1,2},
// lambda8 = diag(1, 1, -2) / sqrt(3). Tr(lambda_i lambda_j) = 2 delta_ij.
Basis StandardBasis();

// U(delta) = exp(i delta lambda4)
int RotationUnitary(double delta, Operator *u);

// базис U(delta) lambda_i U(delta)^dagger
int RotatedBasis(double delta, Basis *rotated);

// c_i = Tr(op * M_i) / 2, для эрмитового op все c_i вещественны
std::vector<MKL_Complex16> DecomposeInBasis(const Operator &op, const Basis &basis);

// коэффициент при единичной матрице: Tr(op) / kDim
MKL_Complex16 IdentityComponent(const Operator &op);
