#pragma once

#include <array>

#include "matrix_ops.h"

// число точек дискретного фазового пространства Z_3 x Z_3
constexpr int kPhaseSpacePoints = kDim * kDim;

// W(p, q) хранится по индексу p * kDim + q
using WignerDistribution = std::array<double, kPhaseSpacePoints>;

// omega = exp(2 pi i / 3)
MKL_Complex16 Omega();

// Z = diag(1, omega, omega^2)
const Operator &ClockZ();

// X e_i = e_{i+1 mod 3}
const Operator &ShiftX();

// четность: меняет местами базисные состояния 1 и 2
const Operator &Parity();

// D(p, q) = omega^{pq} Z^p X^q, p, q из {0, 1, 2}; иначе kOutOfRange
int Displacement(int p, int q, Operator *d);

// A(p, q) = D(p, q) Pi D(p, q)^dagger; иначе kOutOfRange
int PhasePoint(int p, int q, Operator *a);

// W(p, q) = Re Tr(rho A(p, q)) / 3. Возвращает kInvalidArgument для неэрмитовой rho.
int WignerFunction(const Operator &rho, WignerDistribution *w);

// rho = sum_{p,q} W(p, q) A(p, q)
Operator ReconstructFromWigner(const WignerDistribution &w);
