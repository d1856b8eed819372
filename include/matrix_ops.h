#pragma once

#include <array>
#include <iostream>
#include <string>

#include "mkl.h"
#include "mkl_complex16.h"

// размерность пространства кутрита
constexpr int kDim = 3;

// матрица kDim x kDim, хранится построчно (row-major), как и везде с cblas
using Operator = std::array<MKL_Complex16, kDim * kDim>;

Operator Identity();
Operator Zero();

// c = a * b
Operator Multiply(const Operator &a, const Operator &b);

// c = a * b^dagger
Operator MultiplyDagger(const Operator &a, const Operator &b);

Operator Dagger(const Operator &a);

// u * m * u^dagger
Operator ConjugateBy(const Operator &u, const Operator &m);

MKL_Complex16 Trace(const Operator &a);

// Tr(a * b) без построения произведения
MKL_Complex16 TraceOfProduct(const Operator &a, const Operator &b);

// a^n, n >= 0, a^0 = I
Operator Power(const Operator &a, unsigned int n);

// [a, b] = ab - ba
Operator Commutator(const Operator &a, const Operator &b);

// {a, b} = ab + ba
Operator AntiCommutator(const Operator &a, const Operator &b);

Operator Scale(const Operator &a, MKL_Complex16 factor);
Operator Add(const Operator &a, const Operator &b);
Operator Subtract(const Operator &a, const Operator &b);

// u = exp(i * delta * h) для эрмитовой h через спектральное разложение (zheev).
// Возвращает kInvalidArgument, если h не эрмитова в пределах 1e-12,
// и kLapackFailure, если zheev не сошелся.
int ExpIHermitian(const Operator &h, double delta, Operator *u);

// max |a_ij - conj(a_ji)|
double HermiticityDeviation(const Operator &a);

// max |a_ij - b_ij|; если worst_index != nullptr, туда пишется линейный индекс
// элемента с наибольшим отклонением
double MaxAbsDifference(const Operator &a, const Operator &b, int *worst_index = nullptr);

// Наилучшее (по методу наименьших квадратов) число c в a ~ c * reference:
// c = Tr(reference^dagger a) / Tr(reference^dagger reference).
// В residual пишется max |a - c * reference|.
MKL_Complex16 BestPhaseFit(const Operator &reference, const Operator &a, double *residual);

void PrintOperator(const Operator &m, const std::string &name = "M", std::ostream &os = std::cout);
