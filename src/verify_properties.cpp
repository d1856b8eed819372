#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <tuple>

#include "gell_mann.h"
#include "phase_space.h"
#include "property_checks.h"
#include "status.h"
#include "structure_constants.h"

namespace {

void PrintUsage(const char *program) {
    std::cerr << "Usage: " << program << " [--tol EPS] [--delta RAD]... [--seed N]... [--print]\n"
              << "  --tol EPS    tolerance of every numerical check (default 1e-9)\n"
              << "  --delta RAD  rotation angle, repeatable; replaces the default list\n"
              << "  --seed N     seed of a random density matrix, repeatable\n"
              << "  --print      print bases, structure constants and phase-space operators\n";
}

bool ParseDouble(const char *text, double *value) {
    char *end = nullptr;
    *value = std::strtod(text, &end);
    return end != text && *end == '\0';
}

bool ParseInt(const char *text, int *value) {
    char *end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (end == text || *end != '\0') {
        return false;
    }
    *value = static_cast<int>(parsed);
    return true;
}

void PrintSparse(const SparseTensor &tensor, const char *name) {
    std::cout << name << " (nonzero entries):\n";
    for (const auto &[idx, value] : tensor) {
        std::cout << "  " << name << "[" << std::get<0>(idx) << "," << std::get<1>(idx) << ","
                  << std::get<2>(idx) << "] = " << std::setprecision(12) << value << "\n";
    }
}

int PrintTables(const VerifierConfig &config) {
    Basis standard = StandardBasis();
    for (int i = 0; i < kGenerators; ++i) {
        PrintOperator(standard[i], "lambda" + std::to_string(i + 1));
    }

    StructureTensors tensors;
    int status = ComputeStructureConstants(standard, &tensors);
    if (status != kOk) {
        return status;
    }
    PrintSparse(SparseEntries(tensors.f, config.tolerance), "f");
    PrintSparse(SparseEntries(tensors.d, config.tolerance), "d");

    Basis rotated;
    status = RotatedBasis(config.probe_delta, &rotated);
    if (status != kOk) {
        return status;
    }
    std::cout << "Rotated basis, delta = " << config.probe_delta << "\n";
    for (int i = 0; i < kGenerators; ++i) {
        PrintOperator(rotated[i], "M" + std::to_string(i + 1));
    }

    for (int p = 0; p < kDim; ++p) {
        for (int q = 0; q < kDim; ++q) {
            Operator d, a;
            status = Displacement(p, q, &d);
            if (status == kOk) {
                status = PhasePoint(p, q, &a);
            }
            if (status != kOk) {
                return status;
            }
            std::string point = "(" + std::to_string(p) + "," + std::to_string(q) + ")";
            PrintOperator(d, "D" + point);
            PrintOperator(a, "A" + point);
        }
    }
    return kOk;
}

}  // namespace

int main(int argc, char *argv[]) {
    VerifierConfig config;
    bool print_tables = false;
    bool custom_deltas = false;
    bool custom_seeds = false;

    for (int i = 1; i < argc; ++i) {
        const char *arg = argv[i];
        bool has_value = i + 1 < argc;
        if (std::strcmp(arg, "--help") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else if (std::strcmp(arg, "--print") == 0) {
            print_tables = true;
        } else if (std::strcmp(arg, "--tol") == 0 && has_value) {
            double tol;
            if (!ParseDouble(argv[++i], &tol) || tol <= 0.0) {
                std::cerr << "Invalid tolerance: " << argv[i] << "\n";
                PrintUsage(argv[0]);
                return 2;
            }
            config.tolerance = tol;
        } else if (std::strcmp(arg, "--delta") == 0 && has_value) {
            double delta;
            if (!ParseDouble(argv[++i], &delta)) {
                std::cerr << "Invalid rotation angle: " << argv[i] << "\n";
                PrintUsage(argv[0]);
                return 2;
            }
            if (!custom_deltas) {
                config.deltas.clear();
                custom_deltas = true;
            }
            config.deltas.push_back(delta);
        } else if (std::strcmp(arg, "--seed") == 0 && has_value) {
            int seed;
            if (!ParseInt(argv[++i], &seed)) {
                std::cerr << "Invalid seed: " << argv[i] << "\n";
                PrintUsage(argv[0]);
                return 2;
            }
            if (!custom_seeds) {
                config.density_seeds.clear();
                custom_seeds = true;
            }
            config.density_seeds.push_back(seed);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    if (print_tables) {
        int status = PrintTables(config);
        if (status != kOk) {
            std::cerr << "Failed to build tables: " << StatusName(status) << "\n";
            return 1;
        }
    }

    std::cout << "Tolerance: " << config.tolerance << ", rotation angles:";
    for (double delta : config.deltas) {
        std::cout << " " << delta;
    }
    std::cout << "\n";

    VerificationReport report;
    bool passed = RunAllChecks(config, &report);
    PrintReport(report);

    return passed ? 0 : 1;
}
