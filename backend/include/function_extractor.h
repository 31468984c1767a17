#ifndef FUNCTION_EXTRACTOR_H
#define FUNCTION_EXTRACTOR_H

#include <memory>
#include <string>
#include <vector>
#include "python_lexer.h"
#include "syntax_tree.h"

// Una función detectada en el código fuente
struct FunctionUnit {
    std::string name;                    // Nombre calificado: "outer.inner", "Clase.metodo"
    std::string simpleName;              // Nombre declarado en el def
    std::string className;               // Clase que contiene directamente al método (vacío si no es método)
    std::vector<std::string> parameters; // Parámetros del def
    const SyntaxNode* body = nullptr;    // Cuerpo (Block); pertenece al árbol de ExtractionResult
    int startLine = 0;
    int endLine = 0;
    std::string sourceText;              // Texto fuente del def completo
};

// Resultado de la extracción: el árbol es dueño de los nodos a los que apuntan las funciones
struct ExtractionResult {
    std::unique_ptr<SyntaxNode> module;
    std::vector<FunctionUnit> functions; // Orden de documento: exteriores antes que anidadas
};

// Parser descendente recursivo de Python
class PythonParser {
private:
    const std::string& source;
    std::vector<Token> tokens;
    size_t current = 0;
    size_t lastReal = 0;         // Último token con texto consumido (para rangos de nodos)
    int nestingDepth = 0;        // Profundidad actual de expresiones y bloques anidados

    // Marca un nivel de anidamiento mientras vive; lanza ParseError si se pasa del límite
    class NestingGuard {
    public:
        NestingGuard(PythonParser& parser);
        ~NestingGuard();

    private:
        PythonParser& parser;
    };

public:
    explicit PythonParser(const std::string& source);

    std::unique_ptr<SyntaxNode> parseModule();                 // Parsea el archivo completo; lanza ParseError
    std::unique_ptr<SyntaxNode> parseExpressionFragment();     // Parsea una expresión aislada (ej: dentro de un f-string)

private:
    // Acceso a tokens
    const Token& peek(size_t ahead = 0) const;
    const Token& previous() const;
    const Token& advance();
    bool checkOp(const std::string& op, size_t ahead = 0) const;
    bool checkKeyword(const std::string& word, size_t ahead = 0) const;
    bool matchOp(const std::string& op);
    bool matchKeyword(const std::string& word);
    const Token& expectOp(const std::string& op, const std::string& context);
    const Token& expectKeyword(const std::string& word, const std::string& context);
    std::string expectName(const std::string& context);
    ParseError errorAt(const Token& token, const std::string& message) const;
    void finish(SyntaxNode& node) const;                       // Cierra el rango del nodo en el último token consumido
    // Verifica que el nodo sea un destino válido de asignación, for o del
    void checkTarget(const SyntaxNode& target, const std::string& verb, bool allowSequence, bool allowStarred) const;

    // Sentencias
    void parseStatement(SyntaxNode& block);
    void parseSimpleStatements(SyntaxNode& block);
    std::unique_ptr<SyntaxNode> parseSmallStatement();
    std::unique_ptr<SyntaxNode> parseExpressionStatement();
    std::unique_ptr<SyntaxNode> parseSuite();
    std::unique_ptr<SyntaxNode> parseDecorated();
    std::unique_ptr<SyntaxNode> parseFunctionDef(std::unique_ptr<SyntaxNode> decorators, const Token& start);
    std::unique_ptr<SyntaxNode> parseClassDef(std::unique_ptr<SyntaxNode> decorators, const Token& start);
    std::unique_ptr<SyntaxNode> parseIf();
    std::unique_ptr<SyntaxNode> parseWhile();
    std::unique_ptr<SyntaxNode> parseFor();
    std::unique_ptr<SyntaxNode> parseTry();
    std::unique_ptr<SyntaxNode> parseWith();
    std::unique_ptr<SyntaxNode> parseMatch();
    std::unique_ptr<SyntaxNode> parseImport();
    void parseParameters(SyntaxNode& function, SyntaxNode& header, const std::string& closer);
    void skipTypeParameters();
    bool looksLikeMatchStatement() const;
    bool hasParenthesizedWithItems() const;

    // Expresiones
    std::unique_ptr<SyntaxNode> parseTestListStarExpr();
    std::unique_ptr<SyntaxNode> parseExprList();
    std::unique_ptr<SyntaxNode> parseYieldOrTestList();
    std::unique_ptr<SyntaxNode> parseNamedExpr();
    std::unique_ptr<SyntaxNode> parseTest();
    std::unique_ptr<SyntaxNode> parseLambda(bool allowConditional);
    std::unique_ptr<SyntaxNode> parseOrTest();
    std::unique_ptr<SyntaxNode> parseAndTest();
    std::unique_ptr<SyntaxNode> parseNotTest();
    std::unique_ptr<SyntaxNode> parseComparison();
    std::unique_ptr<SyntaxNode> parseBinary(int level);
    std::unique_ptr<SyntaxNode> parseFactor();
    std::unique_ptr<SyntaxNode> parsePower();
    std::unique_ptr<SyntaxNode> parsePrimary();
    std::unique_ptr<SyntaxNode> parseAtom();
    std::unique_ptr<SyntaxNode> parseStarOrNamed();
    std::unique_ptr<SyntaxNode> parseBracketed(const std::string& closer);
    std::unique_ptr<SyntaxNode> parseBraced();
    std::unique_ptr<SyntaxNode> parseComprehensionTail(std::unique_ptr<SyntaxNode> element, int line);
    std::unique_ptr<SyntaxNode> parseCall(std::unique_ptr<SyntaxNode> callee);
    std::unique_ptr<SyntaxNode> parseSubscript(std::unique_ptr<SyntaxNode> object);
    std::unique_ptr<SyntaxNode> parseStrings();
    void parseFStringExpressions(const Token& token, SyntaxNode& into);
    bool startsExpression() const;
};

// Extrae las funciones del código fuente en orden de documento.
// Lanza ParseError si el código no es sintácticamente válido.
class FunctionExtractor {
public:
    ExtractionResult extract(const std::string& source) const;

private:
    void collect(const SyntaxNode& block,
                 const std::string& scopePrefix,
                 const std::string& className,
                 const std::string& source,
                 std::vector<FunctionUnit>& out,
                 bool& sawDefinition) const;
};

#endif
