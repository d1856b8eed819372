#include "gell_mann.h"

#include <cmath>
#include <utility>

#include "status.h"

namespace {

// симметричная внедиагональная матрица с единицами в (j,k) и (k,j)
Operator SymmetricGenerator(int j, int k) {
    Operator m = Zero();
    m[j * kDim + k] = {1.0, 0.0};
    m[k * kDim + j] = {1.0, 0.0};
    return m;
}

// антисимметричная: -i в (j,k), i в (k,j)
Operator AntisymmetricGenerator(int j, int k) {
    Operator m = Zero();
    m[j * kDim + k] = {0.0, -1.0};
    m[k * kDim + j] = {0.0, 1.0};
    return m;
}

}  // namespace

Basis StandardBasis() {
    Basis basis;
    basis.reserve(kGenerators);

    basis.push_back(SymmetricGenerator(0, 1));
    basis.push_back(AntisymmetricGenerator(0, 1));

    Operator lambda3 = Zero();
    lambda3[0] = {1.0, 0.0};
    lambda3[kDim + 1] = {-1.0, 0.0};
    basis.push_back(lambda3);

    basis.push_back(SymmetricGenerator(0, 2));
    basis.push_back(AntisymmetricGenerator(0, 2));
    basis.push_back(SymmetricGenerator(1, 2));
    basis.push_back(AntisymmetricGenerator(1, 2));

    Operator lambda8 = Zero();
    double norm = 1. / sqrt(3.);
    lambda8[0] = {norm, 0.0};
    lambda8[kDim + 1] = {norm, 0.0};
    lambda8[2 * kDim + 2] = {-2. * norm, 0.0};
    basis.push_back(lambda8);

    return basis;
}

int RotationUnitary(double delta, Operator *u) {
    Basis basis = StandardBasis();
    return ExpIHermitian(basis[kRotationGenerator], delta, u);
}

int RotatedBasis(double delta, Basis *rotated) {
    Operator u;
    int status = RotationUnitary(delta, &u);
    if (status != kOk) {
        return status;
    }

    Basis result;
    result.reserve(kGenerators);
    for (const Operator &m : StandardBasis()) {
        result.push_back(ConjugateBy(u, m));
    }
    *rotated = std::move(result);
    return kOk;
}

std::vector<MKL_Complex16> DecomposeInBasis(const Operator &op, const Basis &basis) {
    std::vector<MKL_Complex16> coeff;
    coeff.reserve(basis.size());
    for (const Operator &m : basis) {
        coeff.push_back(TraceOfProduct(op, m) / 2.);
    }
    return coeff;
}

MKL_Complex16 IdentityComponent(const Operator &op) {
    return Trace(op) / static_cast<double>(kDim);
}
