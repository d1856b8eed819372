#pragma once

#include <cmath>

#include "mkl.h"


inline MKL_Complex16 MakeComplex(double re, double im) {
    MKL_Complex16 z;
    z.real = re;
    z.imag = im;
    return z;
}

inline MKL_Complex16 Conjugate(MKL_Complex16 number) {
    number.imag = -number.imag;
    return number;
}

inline double Abs(const MKL_Complex16 &a) {
    return std::hypot(a.real, a.imag);
}

// e^{i phi}
inline MKL_Complex16 ExpI(double phi) {
    return MakeComplex(std::cos(phi), std::sin(phi));
}

inline MKL_Complex16 operator*(const MKL_Complex16 &a, const MKL_Complex16 &b) {
    MKL_Complex16 result;
    result.real = a.real * b.real - a.imag * b.imag;
    result.imag = a.real * b.imag + a.imag * b.real;
    return result;
}

inline MKL_Complex16 operator+(const MKL_Complex16 &a, const MKL_Complex16 &b) {
    return MakeComplex(a.real + b.real, a.imag + b.imag);
}

inline MKL_Complex16 operator-(const MKL_Complex16 &a, const MKL_Complex16 &b) {
    return MakeComplex(a.real - b.real, a.imag - b.imag);
}

inline MKL_Complex16 &operator+=(MKL_Complex16 &a, const MKL_Complex16 &b) {
    a.real += b.real;
    a.imag += b.imag;
    return a;
}

inline MKL_Complex16 operator/(const MKL_Complex16 &a, double b) {
    return MakeComplex(a.real / b, a.imag / b);
}
