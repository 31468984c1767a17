#ifndef PYTHON_LEXER_H
#define PYTHON_LEXER_H

#include <stdexcept>
#include <string>
#include <vector>

// Error de sintaxis en el código fuente (fatal para toda la petición)
class ParseError : public std::runtime_error {
private:
    int errorLine;
    int errorColumn;

public:
    ParseError(const std::string& message, int line, int column);

    int line() const { return errorLine; }
    int column() const { return errorColumn; }
};

enum class TokenKind {
    Name,       // Identificadores y palabras clave
    Number,
    String,
    Op,         // Operadores y delimitadores
    Newline,    // Fin de línea lógica
    Indent,
    Dedent,
    EndOfFile
};

struct Token {
    TokenKind kind = TokenKind::EndOfFile;
    std::string text;       // Texto exacto del token (vacío para Newline/Indent/Dedent)
    int line = 0;           // 1-based
    int column = 0;         // 1-based
    size_t offset = 0;      // Posición en bytes dentro del código fuente
};

// Tokenizador de Python: genera NEWLINE/INDENT/DEDENT como el tokenizador oficial
class PythonLexer {
private:
    const std::string& source;
    size_t pos = 0;
    int line = 1;
    int column = 1;
    bool atLineStart = true;
    std::vector<int> indentStack;       // Niveles de indentación abiertos
    std::vector<Token> openBrackets;    // Paréntesis/corchetes/llaves sin cerrar
    std::vector<Token> tokens;

public:
    explicit PythonLexer(const std::string& source);

    std::vector<Token> tokenize(); // Tokeniza todo el código; lanza ParseError

private:
    char peek(size_t ahead = 0) const;
    void advance(size_t count = 1);
    void emit(TokenKind kind, const std::string& text, int tokLine, int tokColumn, size_t tokOffset);

    bool handleIndentation();       // Procesa el inicio de línea; false si la línea es vacía/comentario
    void lexName();
    void lexNumber();
    void lexString(size_t startOffset, int startLine, int startColumn);
    void lexOperator();
    bool isStringPrefix(const std::string& word) const;
};

#endif
