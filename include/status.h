#pragma once

// Коды возврата для всех функций, которые могут завершиться с ошибкой.
// Результат таких функций передается через выходной параметр.
enum StatusCode {
    kOk = 0,
    kInvalidArgument = 1,  // базис не из 8 матриц, отрицательная степень, неэрмитов генератор
    kOutOfRange = 2,       // индекс фазового пространства вне Z_3
    kLapackFailure = 3,
    kRngFailure = 4
};

const char* StatusName(int status);
