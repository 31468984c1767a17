#ifndef COMPLEXITY_CLASSIFIER_H
#define COMPLEXITY_CLASSIFIER_H

#include <string>
#include "complexity_class.h"
#include "function_extractor.h"
#include "signal_collector.h"

// Veredicto de complejidad para una función
struct ComplexityVerdict {
    ComplexityClass timeClass = ComplexityClass::Unknown;
    ComplexityClass spaceClass = ComplexityClass::Unknown;
    VerdictSource source = VerdictSource::Heuristic;
    int loopCount = 0;      // Copiado de maxLoopDepth
    int recursionCount = 0; // Copiado de recursiveCallCount
};

// Motivo por el que un clasificador no entregó veredicto
enum class ClassifyFailure {
    None,
    RemoteUnavailable,  // Sin credencial, sin red o error de la API
    RemoteTimeout,      // No respondió dentro del timeout
    RemoteMalformed     // Respondió algo que no se puede interpretar
};

std::string toString(ClassifyFailure failure);

// Resultado tipado: ningún clasificador lanza excepciones hacia afuera
struct ClassifyResult {
    bool ok = false;
    ComplexityVerdict verdict;
    ClassifyFailure failure = ClassifyFailure::None;
    std::string message;

    static ClassifyResult success(const ComplexityVerdict& verdict);
    static ClassifyResult fail(ClassifyFailure failure, const std::string& message);
};

// Capacidad "clasificar una función"; la implementan el heurístico y el remoto
class ComplexityClassifier {
public:
    virtual ~ComplexityClassifier() = default;
    virtual ClassifyResult classify(const FunctionUnit& unit, const SignalProfile& signals) = 0;
};

#endif
