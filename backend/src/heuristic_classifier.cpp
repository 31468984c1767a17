#include "heuristic_classifier.h"
#include <algorithm>

std::string toString(ClassifyFailure failure) {
    switch (failure) {
        case ClassifyFailure::None:              return "None";
        case ClassifyFailure::RemoteUnavailable: return "RemoteUnavailable";
        case ClassifyFailure::RemoteTimeout:     return "RemoteTimeout";
        case ClassifyFailure::RemoteMalformed:   return "RemoteMalformed";
    }
    return "None";
}

ClassifyResult ClassifyResult::success(const ComplexityVerdict& verdict) {
    ClassifyResult result;
    result.ok = true;
    result.verdict = verdict;
    return result;
}

ClassifyResult ClassifyResult::fail(ClassifyFailure failure, const std::string& message) {
    ClassifyResult result;
    result.ok = false;
    result.failure = failure;
    result.message = message;
    return result;
}

ClassifyResult HeuristicClassifier::classify(const FunctionUnit&, const SignalProfile& signals) {
    return ClassifyResult::success(evaluate(signals));
}

ComplexityVerdict HeuristicClassifier::evaluate(const SignalProfile& signals) const {
    ComplexityVerdict verdict;
    verdict.source = VerdictSource::Heuristic;
    verdict.loopCount = signals.maxLoopDepth;
    verdict.recursionCount = signals.recursiveCallCount;

    if (!isConsistent(signals)) {
        verdict.timeClass = ComplexityClass::Unknown;
        verdict.spaceClass = ComplexityClass::Unknown;
        return verdict;
    }

    verdict.timeClass = timeClassFor(signals);
    verdict.spaceClass = spaceClassFor(signals);
    return verdict;
}

// Un perfil armado a mano puede contradecirse (ej: crecimiento en loop sin loops)
bool HeuristicClassifier::isConsistent(const SignalProfile& signals) const {
    if (signals.maxLoopDepth < 0 || signals.recursiveCallCount < 0 ||
        signals.recursiveCallLoopDepth < 0 || signals.growthLoopDepth < 0) {
        return false;
    }
    if (signals.allocatesGrowingContainer && signals.maxLoopDepth == 0) {
        return false;
    }
    if (signals.growthLoopDepth > 0 && !signals.allocatesGrowingContainer) {
        return false;
    }
    if (signals.growthLoopDepth > signals.maxLoopDepth ||
        signals.recursiveCallLoopDepth > signals.maxLoopDepth) {
        return false;
    }
    if (signals.recursiveCallLoopDepth > 0 && signals.recursiveCallCount == 0) {
        return false;
    }
    return true;
}

ComplexityClass HeuristicClassifier::timeClassFor(const SignalProfile& signals) const {
    // Dos o más autollamadas: árbol de llamadas que se ramifica
    if (signals.recursiveCallCount >= 2) {
        return ComplexityClass::Exponential;
    }

    // Una autollamada aporta un factor n sobre los loops que la rodean;
    // un loop hermano de la llamada no se multiplica con ella
    if (signals.recursiveCallCount == 1) {
        return polynomialClass(std::max(1 + signals.recursiveCallLoopDepth, signals.maxLoopDepth));
    }

    // Sin recursión: el grado es la profundidad de loops (4 o más -> unknown)
    return polynomialClass(signals.maxLoopDepth);
}

ComplexityClass HeuristicClassifier::spaceClassFor(const SignalProfile& signals) const {
    int growthDepth = signals.growthLoopDepth;
    if (signals.allocatesGrowingContainer && growthDepth == 0) {
        growthDepth = 1;
    }

    if (growthDepth >= 2) {
        return ComplexityClass::Quadratic;
    }
    if (growthDepth == 1 || signals.recursiveCallCount > 0) {
        return ComplexityClass::Linear; // Contenedor o pila de llamadas lineal
    }
    return ComplexityClass::Constant;
}
