#include <catch2/catch.hpp>

#include <sstream>

#include "gell_mann.h"
#include "property_checks.h"
#include "status.h"
#include "structure_constants.h"

TEST_CASE("Full verification passes with the default configuration", "[verifier]") {
    VerifierConfig config;
    VerificationReport report;
    std::ostringstream log;

    REQUIRE(RunAllChecks(config, &report, log));
    REQUIRE(report.AllPassed());
    REQUIRE(report.violations.empty());
    REQUIRE(report.checks.size() > config.deltas.size());
    for (const CheckSummary &summary : report.checks) {
        REQUIRE(summary.evaluated > 0);
        REQUIRE(summary.failed == 0);
    }
    REQUIRE(log.str().find("Phase space") != std::string::npos);
}

TEST_CASE("Violations are collected without stopping", "[verifier]") {
    const double tol = 1e-9;

    SECTION("Broken basis reports every bad generator") {
        Basis basis = StandardBasis();
        basis[1] = Scale(basis[1], MakeComplex(2.0, 0.0));
        basis[6][0] = MakeComplex(0.0, 1.0);

        VerificationReport report;
        REQUIRE_FALSE(CheckBasis(basis, "broken", tol, &report));
        REQUIRE(report.checks.size() == 1);
        REQUIRE(report.checks[0].failed == static_cast<int>(report.violations.size()));

        bool norm_reported = false;
        bool hermiticity_reported = false;
        for (const Violation &v : report.violations) {
            if (v.location == "Tr(M[1] M[1])") {
                norm_reported = true;
                REQUIRE(v.observed.real == Approx(8.0));
                REQUIRE(v.expected.real == Approx(2.0));
            }
            if (v.location == "hermiticity of M[6]") {
                hermiticity_reported = true;
            }
        }
        REQUIRE(norm_reported);
        REQUIRE(hermiticity_reported);
    }

    SECTION("Wrong number of generators") {
        Basis basis = StandardBasis();
        basis.resize(5);
        VerificationReport report;
        REQUIRE_FALSE(CheckBasis(basis, "short", tol, &report));
        REQUIRE(report.violations.size() == 1);
        REQUIRE(report.violations[0].observed.real == 5.0);
        REQUIRE(report.violations[0].expected.real == 8.0);
    }

    SECTION("Perturbed structure constants") {
        StructureTensors reference;
        REQUIRE(ComputeStructureConstants(StandardBasis(), &reference) == kOk);
        StructureTensors perturbed = reference;
        perturbed.d[TensorIndex(2, 2, 7)] += 1e-6;

        VerificationReport report;
        REQUIRE_FALSE(CheckStructureInvariance(reference, perturbed, 0.5, tol, &report));
        REQUIRE(report.violations.size() == 1);
        REQUIRE(report.violations[0].location == "d[2,2,7]");
        REQUIRE(report.violations[0].observed.real ==
                Approx(reference.D(2, 2, 7) + 1e-6).epsilon(1e-12));

        VerificationReport literals;
        REQUIRE_FALSE(CheckRegressionValues(perturbed, tol, &literals));
        REQUIRE(literals.violations.size() == 1);
        REQUIRE(literals.violations[0].location == "d[2,2,7]");
    }

    SECTION("Truncated tensors are reported, not read") {
        StructureTensors empty;
        VerificationReport report;
        REQUIRE_FALSE(CheckJacobiIdentity(empty, tol, &report));
        REQUIRE(report.violations.size() == 2);
    }

    SECTION("Invariant phase point is reported as undetectable") {
        VerificationReport report;
        REQUIRE_FALSE(CheckPhasePointRotation(M_PI / 4, {{0, 1}, {1, 1}}, tol, &report));
        // статус построения и невязка для каждой точки, плюс статус U
        REQUIRE(report.checks[0].evaluated == 5);
        REQUIRE(report.violations.size() == 1);
        REQUIRE(report.violations[0].location.find("A(0,1)") != std::string::npos);
    }

    SECTION("Invalid probe point is reported with its status") {
        VerificationReport report;
        REQUIRE_FALSE(CheckPhasePointRotation(M_PI / 4, {{3, 0}, {2, 2}}, tol, &report));
        REQUIRE(report.violations.size() == 1);
        REQUIRE(report.violations[0].observed.real == kOutOfRange);
        REQUIRE(report.checks[0].evaluated == 4);
    }
}

TEST_CASE("Individual checks on valid input", "[verifier]") {
    const double tol = 1e-9;
    StructureTensors tensors;
    REQUIRE(ComputeStructureConstants(StandardBasis(), &tensors) == kOk);

    VerificationReport report;
    REQUIRE(CheckRegressionValues(tensors, tol, &report));
    REQUIRE(CheckTensorSymmetry(tensors, tol, &report));
    REQUIRE(CheckJacobiIdentity(tensors, tol, &report));
    REQUIRE(CheckCasimirContractions(tensors, tol, &report));
    REQUIRE(CheckRotationDetectable(0.0, tol, &report));
    REQUIRE(CheckRotationDetectable(M_PI / 4, tol, &report));
    REQUIRE(CheckWeylRelations(tol, &report));
    REQUIRE(CheckDisplacements(tol, &report));
    REQUIRE(CheckPhasePoints(tol, &report));
    REQUIRE(CheckPhasePointRotation(0.0, {}, tol, &report));
    REQUIRE(CheckWignerFunction(11, tol, &report));
    REQUIRE(CheckDecompositionCompleteness(StandardBasis(), "standard", 11, tol, &report));
    REQUIRE(report.AllPassed());
}

TEST_CASE("Report printing", "[verifier]") {
    VerificationReport report;
    Basis basis = StandardBasis();
    basis[0] = Zero();
    CheckBasis(basis, "zeroed", 1e-9, &report);

    std::ostringstream os;
    PrintReport(report, os);
    std::string text = os.str();
    REQUIRE(text.find("[FAIL] basis zeroed") != std::string::npos);
    REQUIRE(text.find("Tr(M[0] M[0])") != std::string::npos);
    REQUIRE(text.find("violation(s)") != std::string::npos);
}
