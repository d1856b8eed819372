#include "generate_matrices.h"

#include <iostream>

#include "status.h"

namespace {

// Генерация случайной комплексной матрицы A (row-major): 2 * kDim * kDim
// нормальных чисел с mean=0, sigma=1 методом Бокса-Мюллера
int GenerateRandomComplexMatrix(int seed, Operator *a) {
    VSLStreamStatePtr stream;
    if (vslNewStream(&stream, VSL_BRNG_MT19937, seed) != VSL_STATUS_OK) {
        std::cerr << "Failed to create VSL stream\n";
        return kRngFailure;
    }

    int n = kDim * kDim;
    double *buffer = (double *)mkl_malloc(2 * n * sizeof(double), 64);
    if (buffer == NULL) {
        std::cerr << "Failed to allocate RNG buffer\n";
        vslDeleteStream(&stream);
        return kRngFailure;
    }

    int status = vdRngGaussian(VSL_RNG_METHOD_GAUSSIAN_BOXMULLER, stream, 2 * n, buffer, 0., 1.);
    if (status == VSL_STATUS_OK) {
        for (int i = 0; i < n; ++i) {
            (*a)[i] = {buffer[2 * i], buffer[2 * i + 1]};
        }
    } else {
        std::cerr << "vdRngGaussian failed, status = " << status << "\n";
    }

    mkl_free(buffer);
    vslDeleteStream(&stream);
    return status == VSL_STATUS_OK ? kOk : kRngFailure;
}

}  // namespace

int GenerateDensity(int seed, Operator *rho) {
    Operator a;
    int status = GenerateRandomComplexMatrix(seed, &a);
    if (status != kOk) {
        return status;
    }

    // M = A * A^H, диагональ вещественная и неотрицательная
    Operator m = MultiplyDagger(a, a);
    double trace = Trace(m).real;
    if (trace <= 0.0) {
        std::cerr << "Trace non-positive or zero (trace = " << trace << ").\n";
        return kInvalidArgument;
    }

    *rho = Scale(m, {1. / trace, 0.0});
    return kOk;
}

int GenerateTracelessHamiltonian(int seed, Operator *hamiltonian) {
    Operator h;
    int status = GenerateRandomComplexMatrix(seed, &h);
    if (status != kOk) {
        return status;
    }

    double tr = 0.;
    for (int i = 0; i < kDim; i++) {
        // диагональ должна быть вещественной
        h[i * kDim + i].imag = 0.0;
        tr += h[i * kDim + i].real;

        for (int j = i + 1; j < kDim; j++) {
            MKL_Complex16 a = h[i * kDim + j];
            MKL_Complex16 b = h[j * kDim + i];

            // новое значение для верхнего элемента, нижний - сопряженный
            MKL_Complex16 newval;
            newval.real = 0.5 * (a.real + b.real);
            newval.imag = 0.5 * (a.imag - b.imag);

            h[i * kDim + j] = newval;
            h[j * kDim + i] = Conjugate(newval);
        }
    }

    // след убираем с последнего диагонального элемента
    h[kDim * kDim - 1].real -= tr;

    *hamiltonian = h;
    return kOk;
}
