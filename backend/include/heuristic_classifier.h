#ifndef HEURISTIC_CLASSIFIER_H
#define HEURISTIC_CLASSIFIER_H

#include "complexity_classifier.h"

// Clasificador determinista basado en reglas sobre el SignalProfile.
// Nunca falla: ante señales contradictorias responde unknown.
class HeuristicClassifier : public ComplexityClassifier {
public:
    ClassifyResult classify(const FunctionUnit& unit, const SignalProfile& signals) override;

    ComplexityVerdict evaluate(const SignalProfile& signals) const;

private:
    bool isConsistent(const SignalProfile& signals) const;
    ComplexityClass timeClassFor(const SignalProfile& signals) const;
    ComplexityClass spaceClassFor(const SignalProfile& signals) const;
};

#endif
