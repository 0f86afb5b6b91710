#include "../include/csv_row.hpp"
#include <cstdio>

std::string formatCsvRow(const CalibratedVector& values) {
    std::string row;
    char field[32];
    for (size_t i = 0; i < values.size(); i++) {
        snprintf(field, sizeof(field), "%.3f", values[i]);
        if (i) row += ',';
        row += field;
    }
    return row;
}

std::string formatCsvRow(const SampleVector& values) {
    std::string row;
    char field[16];
    for (size_t i = 0; i < values.size(); i++) {
        snprintf(field, sizeof(field), "%ld", (long)values[i]);
        if (i) row += ',';
        row += field;
    }
    return row;
}
