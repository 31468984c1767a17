#ifndef SYNTAX_TREE_H
#define SYNTAX_TREE_H

#include <memory>
#include <string>
#include <vector>

// Tipos de nodo del árbol sintáctico.
// Solo se distinguen las construcciones que importan para estimar complejidad;
// todo lo demás se agrupa como Other.
enum class NodeKind {
    Module,
    Function,        // def / async def
    Lambda,
    Class,
    Loop,            // for / async for / while
    Conditional,     // if / elif / else, case de match
    Call,
    Block,           // Secuencia de sentencias
    Comprehension,   // [x for ...], {k: v for ...}, (x for ...)
    Display,         // Literal de lista, set, dict o tupla
    Name,
    Attribute,
    Subscript,
    ContainerStore,  // Asignación a subíndice: d[k] = v
    AugmentedStore,  // x += ..., x |= ...
    Exit,            // break / continue / return / raise
    Other
};

struct SyntaxNode {
    NodeKind kind = NodeKind::Other;
    std::string name;                    // Function/Class/Name/Attribute: identificador; Call: función llamada; Exit: palabra clave; AugmentedStore: operador
    std::string receiver;                // Call sobre atributo: objeto receptor simple (ej: "self")
    bool isAttributeCall = false;        // Call de la forma obj.metodo(...)
    std::vector<std::string> parameters; // Function/Lambda: nombres de parámetros
    int line = 0;
    int endLine = 0;
    size_t startOffset = 0;
    size_t endOffset = 0;
    std::vector<std::unique_ptr<SyntaxNode>> children;

    SyntaxNode() = default;
    SyntaxNode(NodeKind kind, int line) : kind(kind), line(line), endLine(line) {}

    // Agrega un hijo (ignora nullptr) y retorna el puntero crudo
    SyntaxNode* add(std::unique_ptr<SyntaxNode> child) {
        if (!child) {
            return nullptr;
        }
        children.push_back(std::move(child));
        return children.back().get();
    }
};

// Layout fijo de hijos:
//   Loop:        [0] encabezado (Other), [1] cuerpo (Block), [2] else opcional (Block)
//   Conditional: [0] condición (Other), [1] rama verdadera (Block), [2] rama falsa opcional (Block)
//   Function:    [0] encabezado: decoradores, defaults, anotaciones (Other), [1] cuerpo (Block)
//   Class:       [0] encabezado: decoradores, bases (Other), [1] cuerpo (Block)
//   Lambda:      [0] defaults (Other), [1] cuerpo (expresión)
//   AugmentedStore: [0] destino, [1] valor

#endif
