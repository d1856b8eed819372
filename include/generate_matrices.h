#pragma once

#include "matrix_ops.h"

// Случайная матрица плотности rho = A A^H / Tr(A A^H), A - гауссова комплексная
// матрица (VSL, MT19937, seed). Возвращает kRngFailure, если поток не создан.
int GenerateDensity(int seed, Operator *rho);

// Случайная эрмитова бесследовая матрица (для проверки разложения по базису)
int GenerateTracelessHamiltonian(int seed, Operator *hamiltonian);
