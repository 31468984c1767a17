#include "complexity_estimator.h"
#include <iostream>

FallbackClassifier::FallbackClassifier(ComplexityClassifier& primary,
                                       ComplexityClassifier& fallback,
                                       const std::atomic<bool>* cancelled,
                                       bool verbose)
    : primary(primary), fallback(fallback), cancelled(cancelled), verbose(verbose) {
}

ClassifyResult FallbackClassifier::classify(const FunctionUnit& unit, const SignalProfile& signals) {
    if (!cancelled || !cancelled->load()) {
        ClassifyResult result = primary.classify(unit, signals);
        if (result.ok) {
            return result;
        }
        if (verbose) {
            std::cerr << "[bigo] " << unit.name << ": " << toString(result.failure)
                      << " (" << result.message << "), usando heurística" << std::endl;
        }
    }
    return fallback.classify(unit, signals);
}

ordered_json FunctionReport::toJson() const {
    return {
        {"function", name},
        {"big_o", toLabel(verdict.timeClass)},
        {"space_complexity", toLabel(verdict.spaceClass)},
        {"loops", verdict.loopCount},
        {"recursion", verdict.recursionCount}
    };
}

ordered_json EstimationReport::toJson() const {
    ordered_json result = ordered_json::array();
    for (const auto& function : functions) {
        result.push_back(function.toJson());
    }
    return result;
}

ordered_json EstimationReport::errorJson() const {
    return {
        {"error", errorKind},
        {"message", errorMessage},
        {"line", errorLine},
        {"column", errorColumn}
    };
}

ComplexityEstimator::ComplexityEstimator(ComplexityClassifier* remote,
                                         const std::atomic<bool>* cancelled,
                                         bool verbose)
    : remote(remote), cancelled(cancelled), verbose(verbose) {
}

EstimationReport ComplexityEstimator::estimate(const std::string& source) {
    EstimationReport report;

    // PASO 1: Extraer funciones; un error de sintaxis detiene todo
    ExtractionResult extraction;
    try {
        extraction = extractor.extract(source);
    } catch (const ParseError& e) {
        report.ok = false;
        report.errorKind = "ParseError";
        report.errorMessage = e.what();
        report.errorLine = e.line();
        report.errorColumn = e.column();
        return report;
    }

    // PASO 2: Remoto con respaldo heurístico, o solo heurística
    FallbackClassifier withFallback(remote ? *remote : heuristic, heuristic, cancelled, verbose);
    ComplexityClassifier& classifier = remote ? static_cast<ComplexityClassifier&>(withFallback)
                                              : static_cast<ComplexityClassifier&>(heuristic);

    // PASO 3: Un veredicto por función, en orden de extracción
    for (const auto& unit : extraction.functions) {
        SignalProfile signals = collector.collect(unit);
        ClassifyResult result = classifier.classify(unit, signals);

        FunctionReport entry;
        entry.name = unit.name;
        entry.verdict = result.ok ? result.verdict : heuristic.evaluate(signals);
        report.functions.push_back(entry);
    }

    return report;
}
