#ifndef SIGNAL_COLLECTOR_H
#define SIGNAL_COLLECTOR_H

#include <set>
#include <string>
#include "function_extractor.h"

// Señales estructurales de una función
struct SignalProfile {
    int maxLoopDepth = 0;                   // Máximo anidamiento de loops
    int recursiveCallCount = 0;             // Llamadas a sí misma dentro del cuerpo
    bool allocatesGrowingContainer = false; // Construye un contenedor incrementalmente dentro de un loop
    bool hasEarlyTermination = false;       // break/return condicional dentro de un loop (informativo)
    int recursiveCallLoopDepth = 0;         // Profundidad de loop más alta que encierra una autollamada
    int growthLoopDepth = 0;                // Profundidad de loop más alta donde crece un contenedor

    // Operaciones conocidas (informativas; la tabla heurística no las usa)
    bool hasBuiltinSort = false;            // sorted(...) o x.sort(...)
    bool hasBinarySearchPattern = false;    // while con mid = .. // 2 y lo/hi = mid +/- 1
    bool hasDividingLoop = false;           // while que divide su variable: n //= 2, n >>= 1
};

// Recorre el cuerpo de una función una sola vez y calcula su SignalProfile
class SignalCollector {
public:
    SignalProfile collect(const FunctionUnit& unit) const;

private:
    // Estado del recorrido; la profundidad de loops viaja como parámetro
    struct TraversalContext {
        const FunctionUnit& unit;
        SignalProfile& profile;
        int shadowedScopes = 0;             // > 0 dentro de un ámbito que redefine el nombre de la función
        std::set<std::string> mappingNames; // Variables ligadas a dict/defaultdict/Counter

        TraversalContext(const FunctionUnit& unit, SignalProfile& profile)
            : unit(unit), profile(profile) {}
    };

    void visit(const SyntaxNode& node, int loopDepth, bool guarded, TraversalContext& context) const;
    void visitChildren(const SyntaxNode& node, size_t from, int loopDepth, bool guarded, TraversalContext& context) const;
    void visitScope(const SyntaxNode& node, int loopDepth, TraversalContext& context) const;

    bool isSelfCall(const SyntaxNode& call, const TraversalContext& context) const;  // Autollamada directa o self.metodo()
    bool shadowsName(const SyntaxNode& scope, const TraversalContext& context) const; // El ámbito anidado redefine el nombre
    bool isGrowthCall(const SyntaxNode& call) const;                                // append/add/extend/...
    bool isMappingConstructor(const SyntaxNode& value) const;                       // {} / dict() / defaultdict() / Counter()
    void recordGrowth(int loopDepth, TraversalContext& context) const;
    bool isBinarySearchLoop(const SyntaxNode& loop) const;
    bool isDividingLoop(const SyntaxNode& loop) const;
};

#endif
