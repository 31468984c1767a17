#ifndef COMPLEXITY_ESTIMATOR_H
#define COMPLEXITY_ESTIMATOR_H

#include <atomic>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "complexity_classifier.h"
#include "function_extractor.h"
#include "heuristic_classifier.h"
#include "signal_collector.h"

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

// Intenta un clasificador primario y, ante cualquier fallo, usa el de respaldo
class FallbackClassifier : public ComplexityClassifier {
private:
    ComplexityClassifier& primary;
    ComplexityClassifier& fallback;
    const std::atomic<bool>* cancelled;   // Si se levanta, no se consulta más al primario
    bool verbose;

public:
    FallbackClassifier(ComplexityClassifier& primary,
                       ComplexityClassifier& fallback,
                       const std::atomic<bool>* cancelled = nullptr,
                       bool verbose = false);

    ClassifyResult classify(const FunctionUnit& unit, const SignalProfile& signals) override;
};

// Un elemento del reporte
struct FunctionReport {
    std::string name;
    ComplexityVerdict verdict;

    ordered_json toJson() const;  // {function, big_o, space_complexity, loops, recursion}
};

// Resultado de analizar un archivo completo
struct EstimationReport {
    bool ok = true;
    std::string errorKind;        // "ParseError" cuando ok == false
    std::string errorMessage;
    int errorLine = 0;
    int errorColumn = 0;
    std::vector<FunctionReport> functions;  // Mismo orden que la extracción

    ordered_json toJson() const;       // Arreglo de funciones (dump() lanza json::type_error con UTF-8 inválido)
    ordered_json errorJson() const;    // {error, message, line, column}
};

// Orquesta extracción -> señales -> clasificación para cada función
class ComplexityEstimator {
private:
    FunctionExtractor extractor;
    SignalCollector collector;
    HeuristicClassifier heuristic;
    ComplexityClassifier* remote;         // Opcional; no es dueño
    const std::atomic<bool>* cancelled;   // Opcional; no es dueño
    bool verbose;

public:
    explicit ComplexityEstimator(ComplexityClassifier* remote = nullptr,
                                 const std::atomic<bool>* cancelled = nullptr,
                                 bool verbose = false);

    EstimationReport estimate(const std::string& source);
};

#endif
