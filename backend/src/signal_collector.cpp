#include "signal_collector.h"
#include <algorithm>

namespace {

// Métodos que agregan elementos a un contenedor existente
const std::set<std::string>& growthMethods() {
    static const std::set<std::string> methods = {
        "append", "extend", "add", "insert", "appendleft", "extendleft",
        "update", "setdefault", "push", "put", "heappush"
    };
    return methods;
}

const std::set<std::string>& mappingConstructors() {
    static const std::set<std::string> names = {
        "dict", "defaultdict", "Counter", "OrderedDict"
    };
    return names;
}

bool isNamed(const SyntaxNode* node, const std::set<std::string>& names) {
    return node && node->kind == NodeKind::Name && names.count(node->name) > 0;
}

// Operación binaria cuyo operando izquierdo es "mid"
bool isMidOffset(const SyntaxNode& value, const std::string& op) {
    return value.kind == NodeKind::Other && value.name == op && !value.children.empty() &&
           isNamed(value.children[0].get(), {"mid"});
}

bool containsFloorDivision(const SyntaxNode& node) {
    if (node.kind == NodeKind::Other && (node.name == "//" || node.name == ">>")) {
        return true;
    }
    for (const auto& child : node.children) {
        if (containsFloorDivision(*child)) {
            return true;
        }
    }
    return false;
}

// Sentencias de un bloque, entrando a las ramas de los if
void flattenStatements(const SyntaxNode& block, std::vector<const SyntaxNode*>& out) {
    for (const auto& statement : block.children) {
        if (statement->kind == NodeKind::Conditional) {
            for (size_t i = 1; i < statement->children.size(); ++i) {
                flattenStatements(*statement->children[i], out);
            }
        } else {
            out.push_back(statement.get());
        }
    }
}

bool isContainerValue(const SyntaxNode& value) {
    if (value.kind == NodeKind::Comprehension) {
        return value.name != "generator";
    }
    return value.kind == NodeKind::Display && value.name != "tuple";
}

} // namespace

SignalProfile SignalCollector::collect(const FunctionUnit& unit) const {
    SignalProfile profile;
    if (!unit.body) {
        return profile;
    }
    TraversalContext context(unit, profile);
    visit(*unit.body, 0, false, context);
    profile.allocatesGrowingContainer = profile.growthLoopDepth > 0;
    return profile;
}

void SignalCollector::visitChildren(const SyntaxNode& node, size_t from, int loopDepth, bool guarded,
                                    TraversalContext& context) const {
    for (size_t i = from; i < node.children.size(); ++i) {
        visit(*node.children[i], loopDepth, guarded, context);
    }
}

// guarded = estamos dentro de un condicional que a su vez está dentro del loop actual
void SignalCollector::visit(const SyntaxNode& node, int loopDepth, bool guarded, TraversalContext& context) const {
    SignalProfile& profile = context.profile;

    switch (node.kind) {
        case NodeKind::Loop: {
            int depth = loopDepth + 1;
            profile.maxLoopDepth = std::max(profile.maxLoopDepth, depth);
            if (node.name == "while" && isBinarySearchLoop(node)) {
                profile.hasBinarySearchPattern = true;
            }
            if (node.name == "while" && isDividingLoop(node)) {
                profile.hasDividingLoop = true;
            }
            // Encabezado y cuerpo se evalúan en cada iteración; el else solo una vez
            if (node.children.size() > 0) {
                visit(*node.children[0], depth, false, context);
            }
            if (node.children.size() > 1) {
                visit(*node.children[1], depth, false, context);
            }
            if (node.children.size() > 2) {
                visitChildren(node, 2, loopDepth, guarded, context);
            }
            return;
        }

        case NodeKind::Conditional: {
            if (!node.children.empty()) {
                visit(*node.children[0], loopDepth, guarded, context);
            }
            visitChildren(node, 1, loopDepth, guarded || loopDepth > 0, context);
            return;
        }

        case NodeKind::Exit: {
            if ((node.name == "break" || node.name == "return") && guarded && loopDepth > 0) {
                profile.hasEarlyTermination = true;
            }
            visitChildren(node, 0, loopDepth, guarded, context);
            return;
        }

        case NodeKind::Call: {
            if (isSelfCall(node, context)) {
                ++profile.recursiveCallCount;
                profile.recursiveCallLoopDepth = std::max(profile.recursiveCallLoopDepth, loopDepth);
            }
            if ((!node.isAttributeCall && node.name == "sorted") || (node.isAttributeCall && node.name == "sort")) {
                profile.hasBuiltinSort = true;
            }
            if (loopDepth > 0 && isGrowthCall(node)) {
                recordGrowth(loopDepth, context);
            }
            visitChildren(node, 0, loopDepth, guarded, context);
            return;
        }

        case NodeKind::Function:
        case NodeKind::Lambda:
        case NodeKind::Class:
            visitScope(node, loopDepth, context);
            return;

        case NodeKind::ContainerStore: {
            if (loopDepth > 0 && context.mappingNames.count(node.name) > 0) {
                recordGrowth(loopDepth, context);
            }
            visitChildren(node, 0, loopDepth, guarded, context);
            return;
        }

        case NodeKind::AugmentedStore: {
            if (loopDepth > 0 && node.children.size() == 2) {
                const SyntaxNode& target = *node.children[0];
                const SyntaxNode& value = *node.children[1];
                bool extendsContainer = (node.name == "+=" || node.name == "|=") && isContainerValue(value);
                bool bumpsMapping = target.kind == NodeKind::Subscript && !target.children.empty() &&
                                    target.children[0]->kind == NodeKind::Name &&
                                    context.mappingNames.count(target.children[0]->name) > 0;
                if (extendsContainer || bumpsMapping) {
                    recordGrowth(loopDepth, context);
                }
            }
            visitChildren(node, 0, loopDepth, guarded, context);
            return;
        }

        case NodeKind::Other: {
            // Asignación: los nombres ligados a un dict vacío/constructor se recuerdan
            // para reconocer luego d[k] = v como crecimiento
            if (node.name == "=" && node.children.size() >= 2) {
                const SyntaxNode& value = *node.children.back();
                bool hasValue = !(value.kind == NodeKind::Other && value.name == "annotation");
                if (hasValue && isMappingConstructor(value)) {
                    for (size_t i = 0; i + 1 < node.children.size(); ++i) {
                        if (node.children[i]->kind == NodeKind::Name) {
                            context.mappingNames.insert(node.children[i]->name);
                        }
                    }
                }
            }
            visitChildren(node, 0, loopDepth, guarded, context);
            return;
        }

        default:
            visitChildren(node, 0, loopDepth, guarded, context);
            return;
    }
}

// Funciones, lambdas y clases anidadas: el encabezado pertenece al ámbito exterior;
// el cuerpo se recorre igual, pero sin contar recursión si redefine el nombre.
void SignalCollector::visitScope(const SyntaxNode& node, int loopDepth, TraversalContext& context) const {
    if (!node.children.empty()) {
        visit(*node.children[0], loopDepth, false, context);
    }
    bool shadowed = shadowsName(node, context);
    if (shadowed) {
        ++context.shadowedScopes;
    }
    visitChildren(node, 1, loopDepth, false, context);
    if (shadowed) {
        --context.shadowedScopes;
    }
}

bool SignalCollector::isSelfCall(const SyntaxNode& call, const TraversalContext& context) const {
    if (context.shadowedScopes > 0) {
        return false;
    }
    const FunctionUnit& unit = context.unit;
    if (call.name != unit.simpleName) {
        return false;
    }
    if (!call.isAttributeCall) {
        // Dentro de un método, f() no se refiere al propio método
        return unit.className.empty();
    }
    if (unit.className.empty()) {
        return false;
    }
    return call.receiver == "self" || call.receiver == "cls" || call.receiver == unit.className;
}

bool SignalCollector::shadowsName(const SyntaxNode& scope, const TraversalContext& context) const {
    const std::string& target = context.unit.simpleName;
    if ((scope.kind == NodeKind::Function || scope.kind == NodeKind::Class) && scope.name == target) {
        return true;
    }
    return std::find(scope.parameters.begin(), scope.parameters.end(), target) != scope.parameters.end();
}

bool SignalCollector::isGrowthCall(const SyntaxNode& call) const {
    return call.isAttributeCall && growthMethods().count(call.name) > 0;
}

bool SignalCollector::isMappingConstructor(const SyntaxNode& value) const {
    if (value.kind == NodeKind::Display) {
        return value.name == "dict";
    }
    if (value.kind == NodeKind::Comprehension) {
        return value.name == "dict";
    }
    if (value.kind == NodeKind::Call) {
        return mappingConstructors().count(value.name) > 0;
    }
    return false;
}

void SignalCollector::recordGrowth(int loopDepth, TraversalContext& context) const {
    context.profile.growthLoopDepth = std::max(context.profile.growthLoopDepth, loopDepth);
}

// while lo <= hi: mid = (lo + hi) // 2; lo = mid + 1 / hi = mid - 1
bool SignalCollector::isBinarySearchLoop(const SyntaxNode& loop) const {
    if (loop.children.size() < 2) {
        return false;
    }
    std::vector<const SyntaxNode*> statements;
    flattenStatements(*loop.children[1], statements);

    bool hasMid = false;
    bool movesBound = false;
    for (const SyntaxNode* statement : statements) {
        if (statement->kind != NodeKind::Other || statement->name != "=" || statement->children.size() < 2) {
            continue;
        }
        const SyntaxNode& value = *statement->children.back();
        for (size_t i = 0; i + 1 < statement->children.size(); ++i) {
            const SyntaxNode* target = statement->children[i].get();
            if (isNamed(target, {"mid"}) && containsFloorDivision(value)) {
                hasMid = true;
            } else if (isNamed(target, {"l", "lo", "left", "low"}) && isMidOffset(value, "+")) {
                movesBound = true;
            } else if (isNamed(target, {"r", "hi", "right", "high"}) && isMidOffset(value, "-")) {
                movesBound = true;
            }
        }
    }
    return hasMid && movesBound;
}

// while n > 1: n //= 2  (o n = n // 2, n >>= 1)
bool SignalCollector::isDividingLoop(const SyntaxNode& loop) const {
    if (loop.children.size() < 2) {
        return false;
    }
    for (const auto& statement : loop.children[1]->children) {
        if (statement->kind == NodeKind::AugmentedStore &&
            (statement->name == "//=" || statement->name == "/=" || statement->name == ">>=")) {
            return true;
        }
        if (statement->kind == NodeKind::Other && statement->name == "=" && statement->children.size() == 2) {
            const SyntaxNode& target = *statement->children[0];
            const SyntaxNode& value = *statement->children[1];
            if (target.kind == NodeKind::Name &&
                value.kind == NodeKind::Other && (value.name == "//" || value.name == ">>") &&
                isNamed(value.children.empty() ? nullptr : value.children[0].get(), {target.name})) {
                return true;
            }
        }
    }
    return false;
}
