#pragma once

#include <cmath>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "gell_mann.h"
#include "matrix_ops.h"
#include "structure_constants.h"

// одно нарушение: где именно и какие значения получены / ожидались
struct Violation {
    std::string check;
    std::string location;
    MKL_Complex16 observed;
    MKL_Complex16 expected;
};

struct CheckSummary {
    std::string name;
    int evaluated = 0;
    int failed = 0;
};

// Проверки не останавливаются на первой ошибке: все нарушения копятся здесь.
struct VerificationReport {
    std::vector<CheckSummary> checks;
    std::vector<Violation> violations;

    bool AllPassed() const { return violations.empty(); }
};

struct VerifierConfig {
    double tolerance = 1e-9;
    std::vector<double> deltas = {0.0, M_PI / 12, M_PI / 6, M_PI / 4, M_PI / 3, M_PI / 2};
    // угол, при котором точки фазового пространства обязаны "почувствовать" вращение
    double probe_delta = M_PI / 4;
    std::vector<std::pair<int, int>> probe_points = {{0, 0}, {1, 0}, {1, 1}, {2, 2}};
    std::vector<int> density_seeds = {2, 3, 5};
};

// эрмитовость, нулевой след, Tr(M_i M_j) = 2 delta_ij
bool CheckBasis(const Basis &basis, const std::string &label, double tolerance,
                VerificationReport *report);

// f_123 = 1, f_453 = 1/2, f_458 = sqrt(3)/2, d_118 = d_338 = 1/sqrt(3)
bool CheckRegressionValues(const StructureTensors &tensors, double tolerance,
                           VerificationReport *report);

// f антисимметричен, d симметричен по первой паре индексов
bool CheckTensorSymmetry(const StructureTensors &tensors, double tolerance,
                         VerificationReport *report);

bool CheckStructureInvariance(const StructureTensors &reference, const StructureTensors &rotated,
                              double delta, double tolerance, VerificationReport *report);

// delta = 0 воспроизводит стандартный базис; delta != 0 меняет хотя бы один
// генератор и коэффициенты повернутой lambda3 в стандартном базисе
bool CheckRotationDetectable(double delta, double tolerance, VerificationReport *report);

// X^3 = I, Z^3 = I, ZX = omega XZ
bool CheckWeylRelations(double tolerance, VerificationReport *report);

// D(0,0) = I, унитарность, D(1,1), ортогональность Tr(D^dagger D')
bool CheckDisplacements(double tolerance, VerificationReport *report);

// эрмитовость, Tr A = 1, Tr(A A') = 3 delta, sum A = 3 I, A(0,0) = Pi
bool CheckPhasePoints(double tolerance, VerificationReport *report);

// при delta = 0 все A(p,q) инвариантны, иначе точки из probe_points не
// переходят в c * A(p,q) ни при каком c
bool CheckPhasePointRotation(double delta, const std::vector<std::pair<int, int>> &probe_points,
                             double tolerance, VerificationReport *report);

// sum_m (f_ijm f_mkl + f_jkm f_mil + f_kim f_mjl) = 0
bool CheckJacobiIdentity(const StructureTensors &tensors, double tolerance,
                         VerificationReport *report);

// sum_kl f_ikl f_jkl = 3 delta_ij,  sum_kl d_ikl d_jkl = 5/3 delta_ij
bool CheckCasimirContractions(const StructureTensors &tensors, double tolerance,
                              VerificationReport *report);

// случайная эрмитова бесследовая H = sum_i c_i M_i
bool CheckDecompositionCompleteness(const Basis &basis, const std::string &label, int seed,
                                    double tolerance, VerificationReport *report);

// W вещественна, sum W = 1, rho восстанавливается по W
bool CheckWignerFunction(int seed, double tolerance, VerificationReport *report);

// Прогоняет все проверки, печатает время этапов в log. true, если нарушений нет.
bool RunAllChecks(const VerifierConfig &config, VerificationReport *report,
                  std::ostream &log = std::cout);

void PrintReport(const VerificationReport &report, std::ostream &os = std::cout);
