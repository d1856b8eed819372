#include "phase_space.h"

#include <cmath>

#include "status.h"

namespace {

bool InZ3(int index) {
    return index >= 0 && index < kDim;
}

Operator MakeClock() {
    Operator z = Zero();
    for (int j = 0; j < kDim; ++j) {
        z[j * kDim + j] = ExpI(2. * M_PI * j / kDim);
    }
    return z;
}

Operator MakeShift() {
    Operator x = Zero();
    for (int j = 0; j < kDim; ++j) {
        // столбец j -> строка j+1
        x[((j + 1) % kDim) * kDim + j] = {1.0, 0.0};
    }
    return x;
}

Operator MakeParity() {
    Operator pi = Zero();
    pi[0] = {1.0, 0.0};
    pi[1 * kDim + 2] = {1.0, 0.0};
    pi[2 * kDim + 1] = {1.0, 0.0};
    return pi;
}

// без проверки индексов, p и q уже в Z_3
Operator MakeDisplacement(int p, int q) {
    // omega^{pq}, показатель берем по модулю 3
    MKL_Complex16 phase = ExpI(2. * M_PI * ((p * q) % kDim) / kDim);
    return Scale(Multiply(Power(ClockZ(), p), Power(ShiftX(), q)), phase);
}

Operator MakePhasePoint(int p, int q) {
    return ConjugateBy(MakeDisplacement(p, q), Parity());
}

}  // namespace

MKL_Complex16 Omega() {
    return ExpI(2. * M_PI / kDim);
}

const Operator &ClockZ() {
    static const Operator z = MakeClock();
    return z;
}

const Operator &ShiftX() {
    static const Operator x = MakeShift();
    return x;
}

const Operator &Parity() {
    static const Operator pi = MakeParity();
    return pi;
}

int Displacement(int p, int q, Operator *d) {
    if (!InZ3(p) || !InZ3(q)) {
        std::cerr << "Displacement: index (" << p << ", " << q << ") is outside Z_" << kDim
                  << "\n";
        return kOutOfRange;
    }

    *d = MakeDisplacement(p, q);
    return kOk;
}

int PhasePoint(int p, int q, Operator *a) {
    if (!InZ3(p) || !InZ3(q)) {
        std::cerr << "PhasePoint: index (" << p << ", " << q << ") is outside Z_" << kDim << "\n";
        return kOutOfRange;
    }
    *a = MakePhasePoint(p, q);
    return kOk;
}

int WignerFunction(const Operator &rho, WignerDistribution *w) {
    double deviation = HermiticityDeviation(rho);
    if (deviation > 1e-10) {
        std::cerr << "WignerFunction: rho is not hermitian (deviation = " << deviation << ")\n";
        return kInvalidArgument;
    }

    for (int p = 0; p < kDim; ++p) {
        for (int q = 0; q < kDim; ++q) {
            (*w)[p * kDim + q] = TraceOfProduct(rho, MakePhasePoint(p, q)).real / kDim;
        }
    }
    return kOk;
}

Operator ReconstructFromWigner(const WignerDistribution &w) {
    Operator rho = Zero();
    for (int p = 0; p < kDim; ++p) {
        for (int q = 0; q < kDim; ++q) {
            rho = Add(rho, Scale(MakePhasePoint(p, q), {w[p * kDim + q], 0.0}));
        }
    }
    return rho;
}
