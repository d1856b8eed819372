#include "property_checks.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

#include "generate_matrices.h"
#include "phase_space.h"
#include "status.h"

using namespace std::chrono;

namespace {

template <typename... Args>
std::string Where(const Args &...args) {
    std::ostringstream os;
    os << std::setprecision(6);
    (os << ... << args);
    return os.str();
}

std::string EntryName(int linear_index) {
    return Where("(", linear_index / kDim, ",", linear_index % kDim, ")");
}

MKL_Complex16 Real(double value) {
    return MakeComplex(value, 0.0);
}

// Накапливает результаты одной проверки в отчете
class CheckRecorder {
public:
    CheckRecorder(const std::string &name, VerificationReport *report)
        : report_(report), index_(report->checks.size()) {
        CheckSummary summary;
        summary.name = name;
        report_->checks.push_back(summary);
    }

    bool Expect(bool ok, const std::string &location, MKL_Complex16 observed,
                MKL_Complex16 expected) {
        CheckSummary &summary = report_->checks[index_];
        ++summary.evaluated;
        if (!ok) {
            ++summary.failed;
            report_->violations.push_back({summary.name, location, observed, expected});
        }
        return ok;
    }

    bool ExpectNear(MKL_Complex16 observed, MKL_Complex16 expected, double tolerance,
                    const std::string &location) {
        return Expect(Abs(observed - expected) <= tolerance, location, observed, expected);
    }

    bool ExpectNear(double observed, double expected, double tolerance,
                    const std::string &location) {
        return ExpectNear(Real(observed), Real(expected), tolerance, location);
    }

    // сравнение матриц, в отчет попадает худший элемент
    bool ExpectOperator(const Operator &observed, const Operator &expected, double tolerance,
                        const std::string &location) {
        int worst = 0;
        double diff = MaxAbsDifference(observed, expected, &worst);
        return Expect(diff <= tolerance, location + " entry " + EntryName(worst), observed[worst],
                      expected[worst]);
    }

    bool ExpectStatus(int status, const std::string &location) {
        return Expect(status == kOk, location + ": " + StatusName(status), Real(status),
                      Real(kOk));
    }

    bool Passed() const { return report_->checks[index_].failed == 0; }

private:
    VerificationReport *report_;
    size_t index_;
};

bool ExpectTensorShape(const StructureTensors &tensors, CheckRecorder *check) {
    size_t expected = TensorIndex(kGenerators, 0, 0);
    bool ok = check->Expect(tensors.f.size() == expected, "f tensor size", Real(tensors.f.size()),
                            Real(expected));
    ok = check->Expect(tensors.d.size() == expected, "d tensor size", Real(tensors.d.size()),
                       Real(expected)) &&
         ok;
    return ok;
}

double Seconds(high_resolution_clock::time_point start) {
    return duration_cast<duration<double>>(high_resolution_clock::now() - start).count();
}

}  // namespace

bool CheckBasis(const Basis &basis, const std::string &label, double tolerance,
                VerificationReport *report) {
    CheckRecorder check("basis " + label, report);
    if (!check.Expect(basis.size() == static_cast<size_t>(kGenerators), "number of generators",
                      Real(basis.size()), Real(kGenerators))) {
        return false;
    }

    for (int i = 0; i < kGenerators; ++i) {
        check.ExpectNear(HermiticityDeviation(basis[i]), 0.0, tolerance,
                         Where("hermiticity of M[", i, "]"));
        check.ExpectNear(Trace(basis[i]), Real(0.0), tolerance, Where("trace of M[", i, "]"));
    }

    for (int i = 0; i < kGenerators; ++i) {
        for (int j = 0; j < kGenerators; ++j) {
            check.ExpectNear(TraceOfProduct(basis[i], basis[j]), Real(i == j ? 2.0 : 0.0),
                             tolerance, Where("Tr(M[", i, "] M[", j, "])"));
        }
    }
    return check.Passed();
}

bool CheckRegressionValues(const StructureTensors &tensors, double tolerance,
                           VerificationReport *report) {
    CheckRecorder check("structure constant literals", report);
    if (!ExpectTensorShape(tensors, &check)) {
        return false;
    }

    check.ExpectNear(tensors.F(0, 1, 2), 1.0, tolerance, "f[0,1,2]");
    check.ExpectNear(tensors.F(3, 4, 2), 0.5, tolerance, "f[3,4,2]");
    check.ExpectNear(tensors.F(3, 4, 7), sqrt(3.) / 2., tolerance, "f[3,4,7]");
    check.ExpectNear(tensors.D(0, 0, 7), 1. / sqrt(3.), tolerance, "d[0,0,7]");
    check.ExpectNear(tensors.D(2, 2, 7), 1. / sqrt(3.), tolerance, "d[2,2,7]");
    return check.Passed();
}

bool CheckTensorSymmetry(const StructureTensors &tensors, double tolerance,
                         VerificationReport *report) {
    CheckRecorder check("structure constant symmetry", report);
    if (!ExpectTensorShape(tensors, &check)) {
        return false;
    }

    for (int i = 0; i < kGenerators; ++i) {
        for (int j = 0; j < kGenerators; ++j) {
            for (int k = 0; k < kGenerators; ++k) {
                check.ExpectNear(tensors.F(j, i, k), -tensors.F(i, j, k), tolerance,
                                 Where("f[", j, ",", i, ",", k, "] = -f[", i, ",", j, ",", k, "]"));
                check.ExpectNear(tensors.F(i, k, j), -tensors.F(i, j, k), tolerance,
                                 Where("f[", i, ",", k, ",", j, "] = -f[", i, ",", j, ",", k, "]"));
                check.ExpectNear(tensors.D(j, i, k), tensors.D(i, j, k), tolerance,
                                 Where("d[", j, ",", i, ",", k, "] = d[", i, ",", j, ",", k, "]"));
                check.ExpectNear(tensors.D(i, k, j), tensors.D(i, j, k), tolerance,
                                 Where("d[", i, ",", k, ",", j, "] = d[", i, ",", j, ",", k, "]"));
            }
        }
    }
    return check.Passed();
}

bool CheckStructureInvariance(const StructureTensors &reference, const StructureTensors &rotated,
                              double delta, double tolerance, VerificationReport *report) {
    CheckRecorder check(Where("structure constants invariant, delta=", delta), report);
    if (!ExpectTensorShape(reference, &check) || !ExpectTensorShape(rotated, &check)) {
        return false;
    }

    for (int i = 0; i < kGenerators; ++i) {
        for (int j = 0; j < kGenerators; ++j) {
            for (int k = 0; k < kGenerators; ++k) {
                check.ExpectNear(rotated.F(i, j, k), reference.F(i, j, k), tolerance,
                                 Where("f[", i, ",", j, ",", k, "]"));
                check.ExpectNear(rotated.D(i, j, k), reference.D(i, j, k), tolerance,
                                 Where("d[", i, ",", j, ",", k, "]"));
            }
        }
    }
    return check.Passed();
}

bool CheckRotationDetectable(double delta, double tolerance, VerificationReport *report) {
    CheckRecorder check(Where("rotation detectable, delta=", delta), report);

    Basis standard = StandardBasis();
    Basis rotated;
    if (!check.ExpectStatus(RotatedBasis(delta, &rotated), "RotatedBasis")) {
        return false;
    }

    bool trivial = std::abs(delta) <= tolerance;

    if (trivial) {
        for (int i = 0; i < kGenerators; ++i) {
            check.ExpectOperator(rotated[i], standard[i], tolerance, Where("M[", i, "]"));
        }
    } else {
        double largest = 0.0;
        int which = 0;
        for (int i = 0; i < kGenerators; ++i) {
            double diff = MaxAbsDifference(rotated[i], standard[i]);
            if (diff > largest) {
                largest = diff;
                which = i;
            }
        }
        check.Expect(largest > tolerance,
                     Where("largest generator change (M[", which, "]) must exceed tolerance"),
                     Real(largest), Real(tolerance));
    }

    // повернутая lambda3 в стандартном базисе; при delta = 0 это e_2
    const int probe = 2;
    std::vector<MKL_Complex16> coeff = DecomposeInBasis(rotated[probe], standard);
    double change = 0.0;
    int which = 0;
    for (int k = 0; k < kGenerators; ++k) {
        MKL_Complex16 expected = Real(k == probe ? 1.0 : 0.0);
        if (trivial) {
            check.ExpectNear(coeff[k], expected, tolerance, Where("coefficient c[", k, "]"));
        }
        double diff = Abs(coeff[k] - expected);
        if (diff > change) {
            change = diff;
            which = k;
        }
    }
    if (!trivial) {
        check.Expect(change > tolerance,
                     Where("largest coefficient change (c[", which, "]) must exceed tolerance"),
                     Real(change), Real(tolerance));
    }
    return check.Passed();
}

bool CheckWeylRelations(double tolerance, VerificationReport *report) {
    CheckRecorder check("Weyl relations", report);

    const Operator &x = ShiftX();
    const Operator &z = ClockZ();
    check.ExpectOperator(Power(x, 3), Identity(), tolerance, "X^3 = I");
    check.ExpectOperator(Power(z, 3), Identity(), tolerance, "Z^3 = I");
    check.ExpectOperator(Multiply(z, x), Scale(Multiply(x, z), Omega()), tolerance,
                         "ZX = omega XZ");
    MKL_Complex16 omega = Omega();
    check.ExpectNear(omega * omega * omega, Real(1.0), tolerance, "omega^3 = 1");
    return check.Passed();
}

bool CheckDisplacements(double tolerance, VerificationReport *report) {
    CheckRecorder check("displacement operators", report);

    std::vector<Operator> d(kPhaseSpacePoints);
    for (int p = 0; p < kDim; ++p) {
        for (int q = 0; q < kDim; ++q) {
            if (!check.ExpectStatus(Displacement(p, q, &d[p * kDim + q]),
                                    Where("D(", p, ",", q, ")"))) {
                return false;
            }
        }
    }

    check.ExpectOperator(d[0], Identity(), tolerance, "D(0,0) = I");

    for (int p = 0; p < kDim; ++p) {
        for (int q = 0; q < kDim; ++q) {
            check.ExpectOperator(MultiplyDagger(d[p * kDim + q], d[p * kDim + q]), Identity(),
                                 tolerance, Where("D(", p, ",", q, ") D(", p, ",", q, ")^dagger"));
        }
    }

    MKL_Complex16 omega = Omega();
    Operator d11 = Zero();
    d11[0 * kDim + 2] = omega;
    d11[1 * kDim + 0] = omega * omega;
    d11[2 * kDim + 1] = Real(1.0);
    check.ExpectOperator(d[1 * kDim + 1], d11, tolerance, "D(1,1) literal");

    // Tr(D^dagger D') = 3 delta и замкнутость D D' ~ D(p+p', q+q')
    for (int a = 0; a < kPhaseSpacePoints; ++a) {
        for (int b = 0; b < kPhaseSpacePoints; ++b) {
            int p1 = a / kDim, q1 = a % kDim, p2 = b / kDim, q2 = b % kDim;
            check.ExpectNear(Trace(Multiply(Dagger(d[a]), d[b])), Real(a == b ? kDim : 0.0),
                             tolerance,
                             Where("Tr(D(", p1, ",", q1, ")^dagger D(", p2, ",", q2, "))"));

            int sum = ((p1 + p2) % kDim) * kDim + (q1 + q2) % kDim;
            double residual = 0.0;
            MKL_Complex16 phase = BestPhaseFit(d[sum], Multiply(d[a], d[b]), &residual);
            check.Expect(residual <= tolerance && std::abs(Abs(phase) - 1.0) <= tolerance,
                         Where("D(", p1, ",", q1, ") D(", p2, ",", q2, ") ~ phase * D(",
                               (p1 + p2) % kDim, ",", (q1 + q2) % kDim, "), residual ", residual),
                         phase, Real(1.0));
        }
    }
    return check.Passed();
}

bool CheckPhasePoints(double tolerance, VerificationReport *report) {
    CheckRecorder check("phase-point operators", report);

    std::vector<Operator> a(kPhaseSpacePoints);
    for (int p = 0; p < kDim; ++p) {
        for (int q = 0; q < kDim; ++q) {
            if (!check.ExpectStatus(PhasePoint(p, q, &a[p * kDim + q]),
                                    Where("A(", p, ",", q, ")"))) {
                return false;
            }
        }
    }

    Operator sum = Zero();
    for (int i = 0; i < kPhaseSpacePoints; ++i) {
        int p = i / kDim, q = i % kDim;
        check.ExpectNear(HermiticityDeviation(a[i]), 0.0, tolerance,
                         Where("hermiticity of A(", p, ",", q, ")"));
        check.ExpectNear(Trace(a[i]), Real(1.0), tolerance, Where("trace of A(", p, ",", q, ")"));
        sum = Add(sum, a[i]);
    }

    for (int i = 0; i < kPhaseSpacePoints; ++i) {
        for (int j = 0; j < kPhaseSpacePoints; ++j) {
            check.ExpectNear(TraceOfProduct(a[i], a[j]), Real(i == j ? kDim : 0.0), tolerance,
                             Where("Tr(A(", i / kDim, ",", i % kDim, ") A(", j / kDim, ",",
                                   j % kDim, "))"));
        }
    }

    check.ExpectOperator(sum, Scale(Identity(), Real(kDim)), tolerance, "sum A(p,q) = 3 I");

    Operator parity = Zero();
    parity[0] = Real(1.0);
    parity[1 * kDim + 2] = Real(1.0);
    parity[2 * kDim + 1] = Real(1.0);
    check.ExpectOperator(a[0], parity, tolerance, "A(0,0) literal");
    return check.Passed();
}

bool CheckPhasePointRotation(double delta, const std::vector<std::pair<int, int>> &probe_points,
                             double tolerance, VerificationReport *report) {
    CheckRecorder check(Where("phase points under rotation, delta=", delta), report);

    Operator u;
    if (!check.ExpectStatus(RotationUnitary(delta, &u), "RotationUnitary")) {
        return false;
    }

    if (std::abs(delta) <= tolerance) {
        for (int p = 0; p < kDim; ++p) {
            for (int q = 0; q < kDim; ++q) {
                Operator a;
                if (!check.ExpectStatus(PhasePoint(p, q, &a), Where("A(", p, ",", q, ")"))) {
                    continue;
                }
                check.ExpectOperator(ConjugateBy(u, a), a, tolerance,
                                     Where("U A(", p, ",", q, ") U^dagger = A(", p, ",", q, ")"));
            }
        }
        return check.Passed();
    }

    for (const auto &[p, q] : probe_points) {
        Operator a;
        if (!check.ExpectStatus(PhasePoint(p, q, &a), Where("A(", p, ",", q, ")"))) {
            continue;
        }
        double residual = 0.0;
        MKL_Complex16 c = BestPhaseFit(a, ConjugateBy(u, a), &residual);
        check.Expect(residual > tolerance,
                     Where("U A(", p, ",", q, ") U^dagger must not equal c A(", p, ",", q,
                           "), best c = (", c.real, ",", c.imag, ")"),
                     Real(residual), Real(tolerance));
    }
    return check.Passed();
}

bool CheckJacobiIdentity(const StructureTensors &tensors, double tolerance,
                         VerificationReport *report) {
    CheckRecorder check("Jacobi identity", report);
    if (!ExpectTensorShape(tensors, &check)) {
        return false;
    }

    const int M = kGenerators;
    for (int i = 0; i < M; ++i) {
        for (int j = 0; j < M; ++j) {
            for (int k = 0; k < M; ++k) {
                for (int l = 0; l < M; ++l) {
                    double sum = 0.0;
                    for (int m = 0; m < M; ++m) {
                        sum += tensors.F(i, j, m) * tensors.F(m, k, l) +
                               tensors.F(j, k, m) * tensors.F(m, i, l) +
                               tensors.F(k, i, m) * tensors.F(m, j, l);
                    }
                    check.ExpectNear(sum, 0.0, tolerance,
                                     Where("i=", i, " j=", j, " k=", k, " l=", l));
                }
            }
        }
    }
    return check.Passed();
}

bool CheckCasimirContractions(const StructureTensors &tensors, double tolerance,
                              VerificationReport *report) {
    CheckRecorder check("Casimir contractions", report);
    if (!ExpectTensorShape(tensors, &check)) {
        return false;
    }

    // N и (N^2 - 4) / N для su(N)
    const double f_norm = kDim;
    const double d_norm = (kDim * kDim - 4.) / kDim;
    for (int i = 0; i < kGenerators; ++i) {
        for (int j = 0; j < kGenerators; ++j) {
            double ff = 0.0, dd = 0.0;
            for (int k = 0; k < kGenerators; ++k) {
                for (int l = 0; l < kGenerators; ++l) {
                    ff += tensors.F(i, k, l) * tensors.F(j, k, l);
                    dd += tensors.D(i, k, l) * tensors.D(j, k, l);
                }
            }
            check.ExpectNear(ff, i == j ? f_norm : 0.0, tolerance,
                             Where("sum f[", i, ",k,l] f[", j, ",k,l]"));
            check.ExpectNear(dd, i == j ? d_norm : 0.0, tolerance,
                             Where("sum d[", i, ",k,l] d[", j, ",k,l]"));
        }
    }
    return check.Passed();
}

bool CheckDecompositionCompleteness(const Basis &basis, const std::string &label, int seed,
                                    double tolerance, VerificationReport *report) {
    CheckRecorder check(Where("decomposition in basis ", label, ", seed=", seed), report);

    Operator h;
    if (!check.ExpectStatus(GenerateTracelessHamiltonian(seed, &h),
                            "GenerateTracelessHamiltonian")) {
        return false;
    }

    std::vector<MKL_Complex16> coeff = DecomposeInBasis(h, basis);
    Operator reconstructed = Scale(Identity(), IdentityComponent(h));
    for (size_t i = 0; i < basis.size(); ++i) {
        check.ExpectNear(coeff[i].imag, 0.0, tolerance, Where("Im c[", i, "]"));
        reconstructed = Add(reconstructed, Scale(basis[i], coeff[i]));
    }
    check.ExpectOperator(reconstructed, h, tolerance, "sum c_i M_i = H");
    return check.Passed();
}

bool CheckWignerFunction(int seed, double tolerance, VerificationReport *report) {
    CheckRecorder check(Where("Wigner function, seed=", seed), report);

    Operator rho;
    if (!check.ExpectStatus(GenerateDensity(seed, &rho), "GenerateDensity")) {
        return false;
    }

    WignerDistribution w;
    if (!check.ExpectStatus(WignerFunction(rho, &w), "WignerFunction")) {
        return false;
    }

    double total = 0.0;
    for (int p = 0; p < kDim; ++p) {
        for (int q = 0; q < kDim; ++q) {
            Operator a;
            if (!check.ExpectStatus(PhasePoint(p, q, &a), Where("A(", p, ",", q, ")"))) {
                continue;
            }
            check.ExpectNear(TraceOfProduct(rho, a).imag / kDim, 0.0, tolerance,
                             Where("Im W(", p, ",", q, ")"));
            total += w[p * kDim + q];
        }
    }
    check.ExpectNear(total, 1.0, tolerance, "sum W(p,q)");
    check.ExpectOperator(ReconstructFromWigner(w), rho, tolerance, "sum W(p,q) A(p,q) = rho");
    return check.Passed();
}

bool RunAllChecks(const VerifierConfig &config, VerificationReport *report, std::ostream &log) {
    const double tol = config.tolerance;
    auto start = high_resolution_clock::now();

    Basis standard = StandardBasis();
    CheckBasis(standard, "standard", tol, report);

    StructureTensors reference;
    int status = ComputeStructureConstants(standard, &reference);
    if (status == kOk) {
        CheckRegressionValues(reference, tol, report);
        CheckTensorSymmetry(reference, tol, report);
        CheckJacobiIdentity(reference, tol, report);
        CheckCasimirContractions(reference, tol, report);
    } else {
        CheckRecorder check("structure constants of standard basis", report);
        check.ExpectStatus(status, "ComputeStructureConstants");
    }
    for (int seed : config.density_seeds) {
        CheckDecompositionCompleteness(standard, "standard", seed, tol, report);
    }

    log << "Standard basis, f, d: " << Seconds(start) << " s\n";
    start = high_resolution_clock::now();

    for (double delta : config.deltas) {
        std::string label = Where("delta=", delta);
        Basis rotated;
        status = RotatedBasis(delta, &rotated);
        if (status != kOk) {
            CheckRecorder check("rotated " + label, report);
            check.ExpectStatus(status, "RotatedBasis");
            continue;
        }

        CheckBasis(rotated, label, tol, report);

        StructureTensors tensors;
        status = ComputeStructureConstants(rotated, &tensors);
        if (status == kOk && !reference.f.empty()) {
            CheckStructureInvariance(reference, tensors, delta, tol, report);
        } else if (status != kOk) {
            CheckRecorder check("structure constants " + label, report);
            check.ExpectStatus(status, "ComputeStructureConstants");
        }

        CheckRotationDetectable(delta, tol, report);
        if (!config.density_seeds.empty()) {
            CheckDecompositionCompleteness(rotated, label, config.density_seeds.front(), tol,
                                           report);
        }
    }

    log << "Rotated bases: " << Seconds(start) << " s\n";
    start = high_resolution_clock::now();

    CheckWeylRelations(tol, report);
    CheckDisplacements(tol, report);
    CheckPhasePoints(tol, report);

    std::vector<double> rotation_angles = config.deltas;
    if (std::find(rotation_angles.begin(), rotation_angles.end(), config.probe_delta) ==
        rotation_angles.end()) {
        rotation_angles.push_back(config.probe_delta);
    }
    for (double delta : rotation_angles) {
        CheckPhasePointRotation(delta, config.probe_points, tol, report);
    }

    for (int seed : config.density_seeds) {
        CheckWignerFunction(seed, tol, report);
    }

    log << "Phase space: " << Seconds(start) << " s\n";
    return report->AllPassed();
}

void PrintReport(const VerificationReport &report, std::ostream &os) {
    std::ios_base::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();

    for (const CheckSummary &summary : report.checks) {
        if (summary.failed == 0) {
            os << "[ OK ] " << summary.name << " (" << summary.evaluated << ")\n";
        } else {
            os << "[FAIL] " << summary.name << " (" << summary.failed << " of "
               << summary.evaluated << ")\n";
        }
    }

    os << std::scientific << std::setprecision(12);
    for (const Violation &v : report.violations) {
        os << v.check << " | " << v.location << " | observed (" << v.observed.real << ","
           << v.observed.imag << ") expected (" << v.expected.real << "," << v.expected.imag
           << ")\n";
    }
    os.flags(flags);
    os.precision(precision);

    if (report.AllPassed()) {
        os << "All " << report.checks.size() << " checks passed\n";
    } else {
        os << report.violations.size() << " violation(s) in " << report.checks.size()
           << " checks\n";
    }
}
