#ifndef ANALYZER_CLI_H
#define ANALYZER_CLI_H

#include <iosfwd>
#include <string>
#include "complexity_estimator.h"

// Códigos de salida del CLI
const int EXIT_ANALYSIS_OK = 0;
const int EXIT_PARSE_ERROR = 1;
const int EXIT_SERIALIZATION_ERROR = 2;

// Analiza el código y escribe el JSON del reporte en out.
// Solo escribe en err cuando la serialización falla.
int runAnalysis(const std::string& source, ComplexityEstimator& estimator, std::ostream& out, std::ostream& err);

std::string readAll(std::istream& in);

#endif
