#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>

#include "gell_mann.h"
#include "status.h"

namespace {

void RequireValidBasis(const Basis &basis) {
    REQUIRE(basis.size() == static_cast<size_t>(kGenerators));
    for (int i = 0; i < kGenerators; ++i) {
        REQUIRE(HermiticityDeviation(basis[i]) < 1e-12);
        REQUIRE(Abs(Trace(basis[i])) < 1e-12);
        for (int j = 0; j < kGenerators; ++j) {
            MKL_Complex16 tr = TraceOfProduct(basis[i], basis[j]);
            REQUIRE(tr.real == Approx(i == j ? 2.0 : 0.0).margin(1e-12));
            REQUIRE(tr.imag == Approx(0.0).margin(1e-12));
        }
    }
}

}  // namespace

TEST_CASE("Standard Gell-Mann basis", "[gell_mann]") {
    Basis basis = StandardBasis();

    SECTION("Hermitian, traceless, trace-orthonormal") {
        RequireValidBasis(basis);
    }

    SECTION("Closed-form entries") {
        REQUIRE(basis[0][0 * kDim + 1].real == 1.0);
        REQUIRE(basis[1][0 * kDim + 1].imag == -1.0);
        REQUIRE(basis[1][1 * kDim + 0].imag == 1.0);
        REQUIRE(basis[2][1 * kDim + 1].real == -1.0);
        REQUIRE(basis[3][0 * kDim + 2].real == 1.0);
        REQUIRE(basis[4][2 * kDim + 0].imag == 1.0);
        REQUIRE(basis[5][1 * kDim + 2].real == 1.0);
        REQUIRE(basis[6][1 * kDim + 2].imag == -1.0);
        REQUIRE(basis[7][0].real == Approx(1. / sqrt(3.)));
        REQUIRE(basis[7][2 * kDim + 2].real == Approx(-2. / sqrt(3.)));
    }

    SECTION("Deterministic") {
        Basis again = StandardBasis();
        for (int i = 0; i < kGenerators; ++i) {
            REQUIRE(MaxAbsDifference(basis[i], again[i]) == 0.0);
        }
    }
}

TEST_CASE("Rotated bases", "[gell_mann]") {
    Basis standard = StandardBasis();

    SECTION("delta = 0 reproduces the standard basis") {
        Basis rotated;
        REQUIRE(RotatedBasis(0.0, &rotated) == kOk);
        for (int i = 0; i < kGenerators; ++i) {
            REQUIRE(MaxAbsDifference(rotated[i], standard[i]) < 1e-12);
        }
    }

    SECTION("Every angle gives a valid basis") {
        for (double delta : {M_PI / 12, M_PI / 6, M_PI / 4, M_PI / 2, 2.5}) {
            Basis rotated;
            REQUIRE(RotatedBasis(delta, &rotated) == kOk);
            RequireValidBasis(rotated);
        }
    }

    SECTION("delta = pi/4 changes the basis but keeps lambda4") {
        Basis rotated;
        REQUIRE(RotatedBasis(M_PI / 4, &rotated) == kOk);

        double largest = 0.0;
        for (int i = 0; i < kGenerators; ++i) {
            largest = std::max(largest, MaxAbsDifference(rotated[i], standard[i]));
        }
        REQUIRE(largest > 1e-9);
        REQUIRE(MaxAbsDifference(rotated[kRotationGenerator], standard[kRotationGenerator]) < 1e-12);
    }

    SECTION("Rotation unitary is unitary") {
        Operator u;
        REQUIRE(RotationUnitary(M_PI / 6, &u) == kOk);
        REQUIRE(MaxAbsDifference(MultiplyDagger(u, u), Identity()) < 1e-12);
    }
}

TEST_CASE("Decomposition in a basis", "[gell_mann]") {
    Basis standard = StandardBasis();

    SECTION("Generators decompose into unit vectors") {
        for (int k = 0; k < kGenerators; ++k) {
            std::vector<MKL_Complex16> coeff = DecomposeInBasis(standard[k], standard);
            REQUIRE(coeff.size() == static_cast<size_t>(kGenerators));
            for (int i = 0; i < kGenerators; ++i) {
                REQUIRE(coeff[i].real == Approx(i == k ? 1.0 : 0.0).margin(1e-14));
                REQUIRE(coeff[i].imag == Approx(0.0).margin(1e-14));
            }
        }
    }

    SECTION("Identity component") {
        MKL_Complex16 c = IdentityComponent(Identity());
        REQUIRE(c.real == Approx(1.0));
        REQUIRE(Abs(IdentityComponent(standard[7])) < 1e-14);
    }

    SECTION("Rotated lambda3 in the standard basis") {
        double delta = M_PI / 4;
        Basis rotated;
        REQUIRE(RotatedBasis(delta, &rotated) == kOk);

        std::vector<MKL_Complex16> coeff = DecomposeInBasis(rotated[2], standard);
        // Tr(U lambda3 U^dagger lambda3) / 2 = (cos^2 delta + 1) / 2
        REQUIRE(coeff[2].real == Approx((cos(delta) * cos(delta) + 1.) / 2.));
        for (const MKL_Complex16 &c : coeff) {
            REQUIRE(c.imag == Approx(0.0).margin(1e-12));
        }

        // reconstruction
        Operator sum = Zero();
        for (int i = 0; i < kGenerators; ++i) {
            sum = Add(sum, Scale(standard[i], coeff[i]));
        }
        REQUIRE(MaxAbsDifference(sum, rotated[2]) < 1e-12);
    }
}
