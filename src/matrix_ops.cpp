#include "matrix_ops.h"

#include <algorithm>
#include <iomanip>

#include "status.h"

Operator Identity() {
    Operator result = Zero();
    for (int i = 0; i < kDim; ++i) {
        result[i * kDim + i] = {1.0, 0.0};
    }
    return result;
}

Operator Zero() {
    Operator result;
    result.fill({0.0, 0.0});
    return result;
}

Operator Multiply(const Operator &a, const Operator &b) {
    Operator result;
    MKL_Complex16 alpha = {1.0, 0.0}, beta = {0.0, 0.0};
    cblas_zgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans,
                kDim, kDim, kDim,
                &alpha,
                a.data(), kDim,
                b.data(), kDim,
                &beta,
                result.data(), kDim);
    return result;
}

Operator MultiplyDagger(const Operator &a, const Operator &b) {
    Operator result;
    MKL_Complex16 alpha = {1.0, 0.0}, beta = {0.0, 0.0};
    // B = b^H -> CblasConjTrans, как при построении A * A^H
    cblas_zgemm(CblasRowMajor, CblasNoTrans, CblasConjTrans,
                kDim, kDim, kDim,
                &alpha,
                a.data(), kDim,
                b.data(), kDim,
                &beta,
                result.data(), kDim);
    return result;
}

Operator Dagger(const Operator &a) {
    Operator result;
    for (int i = 0; i < kDim; ++i) {
        for (int j = 0; j < kDim; ++j) {
            result[j * kDim + i] = Conjugate(a[i * kDim + j]);
        }
    }
    return result;
}

Operator ConjugateBy(const Operator &u, const Operator &m) {
    return MultiplyDagger(Multiply(u, m), u);
}

MKL_Complex16 Trace(const Operator &a) {
    MKL_Complex16 tr = {0.0, 0.0};
    for (int i = 0; i < kDim; ++i) {
        int diag_idx = i * kDim + i;
        tr.real += a[diag_idx].real;
        tr.imag += a[diag_idx].imag;
    }
    return tr;
}

MKL_Complex16 TraceOfProduct(const Operator &a, const Operator &b) {
    MKL_Complex16 tr = {0.0, 0.0};
    for (int i = 0; i < kDim; ++i) {
        for (int k = 0; k < kDim; ++k) {
            tr += a[i * kDim + k] * b[k * kDim + i];
        }
    }
    return tr;
}

Operator Power(const Operator &a, unsigned int n) {
    Operator result = Identity();
    for (unsigned int i = 0; i < n; ++i) {
        result = Multiply(result, a);
    }
    return result;
}

Operator Commutator(const Operator &a, const Operator &b) {
    Operator result;
    MKL_Complex16 alpha = {1.0, 0.0}, beta = {0.0, 0.0};
    cblas_zgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans, kDim, kDim, kDim, &alpha, a.data(),
                kDim, b.data(), kDim, &beta, result.data(), kDim);
    // result = -b*a + result
    alpha = {-1.0, 0.0};
    beta = {1.0, 0.0};
    cblas_zgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans, kDim, kDim, kDim, &alpha, b.data(),
                kDim, a.data(), kDim, &beta, result.data(), kDim);
    return result;
}

Operator AntiCommutator(const Operator &a, const Operator &b) {
    Operator result;
    MKL_Complex16 alpha = {1.0, 0.0}, beta = {0.0, 0.0};
    cblas_zgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans, kDim, kDim, kDim, &alpha, a.data(),
                kDim, b.data(), kDim, &beta, result.data(), kDim);
    beta = {1.0, 0.0};
    cblas_zgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans, kDim, kDim, kDim, &alpha, b.data(),
                kDim, a.data(), kDim, &beta, result.data(), kDim);
    return result;
}

Operator Scale(const Operator &a, MKL_Complex16 factor) {
    Operator result;
    for (int i = 0; i < kDim * kDim; ++i) {
        result[i] = a[i] * factor;
    }
    return result;
}

Operator Add(const Operator &a, const Operator &b) {
    Operator result;
    for (int i = 0; i < kDim * kDim; ++i) {
        result[i] = a[i] + b[i];
    }
    return result;
}

Operator Subtract(const Operator &a, const Operator &b) {
    Operator result;
    for (int i = 0; i < kDim * kDim; ++i) {
        result[i] = a[i] - b[i];
    }
    return result;
}

int ExpIHermitian(const Operator &h, double delta, Operator *u) {
    double deviation = HermiticityDeviation(h);
    if (deviation > 1e-12) {
        std::cerr << "ExpIHermitian: generator is not hermitian (deviation = " << deviation
                  << ")\n";
        return kInvalidArgument;
    }

    // zheev перезаписывает матрицу собственными векторами (по столбцам)
    Operator v = h;
    double w[kDim];
    lapack_int info = LAPACKE_zheev(LAPACK_ROW_MAJOR, 'V', 'U', kDim, v.data(), kDim, w);
    if (info != 0) {
        std::cerr << "ExpIHermitian: zheev failed, info = " << info << "\n";
        return kLapackFailure;
    }

    // exp(i delta h) = V diag(e^{i delta w}) V^H
    Operator scaled;
    for (int i = 0; i < kDim; ++i) {
        for (int j = 0; j < kDim; ++j) {
            scaled[i * kDim + j] = v[i * kDim + j] * ExpI(delta * w[j]);
        }
    }
    *u = MultiplyDagger(scaled, v);
    return kOk;
}

double HermiticityDeviation(const Operator &a) {
    double result = 0.0;
    for (int i = 0; i < kDim; ++i) {
        for (int j = 0; j < kDim; ++j) {
            const MKL_Complex16 &x = a[i * kDim + j];
            const MKL_Complex16 &y = a[j * kDim + i];  // должно быть conj(x)
            result = std::max(Abs(x - Conjugate(y)), result);
        }
    }
    return result;
}

double MaxAbsDifference(const Operator &a, const Operator &b, int *worst_index) {
    double result = 0.0;
    int worst = 0;
    for (int i = 0; i < kDim * kDim; ++i) {
        double diff = Abs(a[i] - b[i]);
        if (diff > result) {
            result = diff;
            worst = i;
        }
    }
    if (worst_index != nullptr) {
        *worst_index = worst;
    }
    return result;
}

MKL_Complex16 BestPhaseFit(const Operator &reference, const Operator &a, double *residual) {
    MKL_Complex16 overlap = {0.0, 0.0};
    double norm = 0.0;
    for (int i = 0; i < kDim * kDim; ++i) {
        overlap += Conjugate(reference[i]) * a[i];
        norm += reference[i].real * reference[i].real + reference[i].imag * reference[i].imag;
    }

    MKL_Complex16 c = {0.0, 0.0};
    if (norm > 0.0) {
        c = overlap / norm;
    }
    if (residual != nullptr) {
        *residual = MaxAbsDifference(a, Scale(reference, c));
    }
    return c;
}

void PrintOperator(const Operator &m, const std::string &name, std::ostream &os) {
    os << name << " (" << kDim << "x" << kDim << "):\n";
    std::ios_base::fmtflags flags = os.flags();
    os << std::fixed << std::setprecision(6);
    for (int i = 0; i < kDim; ++i) {
        for (int j = 0; j < kDim; ++j) {
            const MKL_Complex16 &c = m[i * kDim + j];
            os << "(" << std::setw(9) << c.real << "," << std::setw(9) << c.imag << ") ";
        }
        os << "\n";
    }
    os.flags(flags);
}
