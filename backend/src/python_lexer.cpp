#include "python_lexer.h"
#include <cctype>

namespace {

bool isNameStart(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool isNameChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Operadores ordenados por longitud (coincidencia más larga primero)
const char* const kThreeCharOps[] = {"**=", "//=", ">>=", "<<=", "..."};
const char* const kTwoCharOps[] = {
    "->", ":=", "**", "//", ">>", "<<", "<=", ">=", "==", "!=",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@="
};
const std::string kSingleCharOps = "+-*/%@&|^~<>()[]{},:.;=";

// Límites de anidamiento (los mismos del tokenizador de CPython)
const size_t kMaxBracketDepth = 200;
const size_t kMaxIndentDepth = 100;

char closerFor(char opener) {
    switch (opener) {
        case '(': return ')';
        case '[': return ']';
        default:  return '}';
    }
}

} // namespace

ParseError::ParseError(const std::string& message, int line, int column)
    : std::runtime_error(message), errorLine(line), errorColumn(column) {
}

PythonLexer::PythonLexer(const std::string& source) : source(source) {
}

char PythonLexer::peek(size_t ahead) const {
    size_t index = pos + ahead;
    return index < source.size() ? source[index] : '\0';
}

void PythonLexer::advance(size_t count) {
    for (size_t i = 0; i < count && pos < source.size(); ++i) {
        char c = source[pos];
        ++pos;
        if (c == '\n' || (c == '\r' && peek() != '\n')) {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
}

void PythonLexer::emit(TokenKind kind, const std::string& text, int tokLine, int tokColumn, size_t tokOffset) {
    Token token;
    token.kind = kind;
    token.text = text;
    token.line = tokLine;
    token.column = tokColumn;
    token.offset = tokOffset;
    tokens.push_back(token);
}

bool PythonLexer::isStringPrefix(const std::string& word) const {
    std::string lower;
    for (char c : word) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower == "r" || lower == "u" || lower == "b" || lower == "f" ||
           lower == "br" || lower == "rb" || lower == "fr" || lower == "rf";
}

// Procesa la indentación al inicio de una línea física.
// Las líneas vacías o de solo comentario no afectan la indentación.
bool PythonLexer::handleIndentation() {
    int width = 0;
    while (pos < source.size()) {
        char c = peek();
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (c == '\f') {
            width = 0;
        } else {
            break;
        }
        advance();
    }

    char c = peek();
    if (pos >= source.size()) {
        atLineStart = false;
        return false;
    }
    if (c == '#' || c == '\n' || c == '\r') {
        while (pos < source.size() && peek() != '\n' && peek() != '\r') {
            advance();
        }
        if (pos >= source.size()) {
            atLineStart = false;
            return false;
        }
        advance(peek() == '\r' && peek(1) == '\n' ? 2 : 1);
        return false;
    }

    atLineStart = false;
    if (width > indentStack.back()) {
        if (indentStack.size() > kMaxIndentDepth) {
            throw ParseError("demasiados niveles de indentación", line, column);
        }
        indentStack.push_back(width);
        emit(TokenKind::Indent, "", line, column, pos);
        return true;
    }
    while (width < indentStack.back()) {
        indentStack.pop_back();
        emit(TokenKind::Dedent, "", line, column, pos);
    }
    if (width != indentStack.back()) {
        throw ParseError("la desindentación no coincide con ningún nivel exterior", line, column);
    }
    return true;
}

void PythonLexer::lexName() {
    size_t start = pos;
    int startLine = line;
    int startColumn = column;
    while (pos < source.size() && isNameChar(peek())) {
        advance();
    }
    std::string word = source.substr(start, pos - start);
    if ((peek() == '"' || peek() == '\'') && isStringPrefix(word)) {
        lexString(start, startLine, startColumn);
        return;
    }
    emit(TokenKind::Name, word, startLine, startColumn, start);
}

void PythonLexer::lexNumber() {
    size_t start = pos;
    int startColumn = column;

    if (peek() == '0' && std::string("xXoObB").find(peek(1)) != std::string::npos && peek(1) != '\0') {
        advance(2);
        while (pos < source.size() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
            advance();
        }
    } else {
        while (isDigit(peek()) || peek() == '_') {
            advance();
        }
        if (peek() == '.') {
            advance();
            while (isDigit(peek()) || peek() == '_') {
                advance();
            }
        }
        if ((peek() == 'e' || peek() == 'E') &&
            (isDigit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && isDigit(peek(2))))) {
            advance(2);
            while (isDigit(peek()) || peek() == '_') {
                advance();
            }
        }
        if (peek() == 'j' || peek() == 'J') {
            advance();
        }
    }
    emit(TokenKind::Number, source.substr(start, pos - start), line, startColumn, start);
}

// Consume un literal de cadena (simple o triple) que empieza en la posición actual.
// startOffset incluye el prefijo (r, b, f...) si existe.
void PythonLexer::lexString(size_t startOffset, int startLine, int startColumn) {
    char quote = peek();
    bool triple = peek(1) == quote && peek(2) == quote;
    advance(triple ? 3 : 1);

    while (true) {
        if (pos >= source.size()) {
            throw ParseError(triple ? "cadena de triple comilla sin terminar"
                                    : "cadena sin terminar", startLine, startColumn);
        }
        char c = peek();
        if (c == '\\') {
            advance(peek(1) == '\r' && peek(2) == '\n' ? 3 : 2);
            continue;
        }
        if (!triple && (c == '\n' || c == '\r')) {
            throw ParseError("cadena sin terminar", startLine, startColumn);
        }
        if (c == quote) {
            if (!triple) {
                advance();
                break;
            }
            if (peek(1) == quote && peek(2) == quote) {
                advance(3);
                break;
            }
        }
        advance();
    }
    emit(TokenKind::String, source.substr(startOffset, pos - startOffset), startLine, startColumn, startOffset);
}

void PythonLexer::lexOperator() {
    size_t start = pos;
    int startColumn = column;

    for (const char* op : kThreeCharOps) {
        if (source.compare(pos, 3, op) == 0) {
            advance(3);
            emit(TokenKind::Op, op, line, startColumn, start);
            return;
        }
    }
    for (const char* op : kTwoCharOps) {
        if (source.compare(pos, 2, op) == 0) {
            advance(2);
            emit(TokenKind::Op, op, line, startColumn, start);
            return;
        }
    }

    char c = peek();
    if (kSingleCharOps.find(c) == std::string::npos) {
        throw ParseError(std::string("carácter inválido '") + c + "'", line, column);
    }

    if (c == '(' || c == '[' || c == '{') {
        Token opener;
        opener.kind = TokenKind::Op;
        opener.text = std::string(1, c);
        opener.line = line;
        opener.column = column;
        opener.offset = pos;
        if (openBrackets.size() >= kMaxBracketDepth) {
            throw ParseError("demasiados paréntesis anidados", line, column);
        }
        openBrackets.push_back(opener);
    } else if (c == ')' || c == ']' || c == '}') {
        if (openBrackets.empty()) {
            throw ParseError(std::string("'") + c + "' sin apertura correspondiente", line, column);
        }
        char expected = closerFor(openBrackets.back().text[0]);
        if (c != expected) {
            throw ParseError(std::string("'") + c + "' no corresponde con '" +
                             openBrackets.back().text + "'", line, column);
        }
        openBrackets.pop_back();
    }

    advance();
    emit(TokenKind::Op, std::string(1, c), line, startColumn, start);
}

std::vector<Token> PythonLexer::tokenize() {
    tokens.clear();
    indentStack.assign(1, 0);
    openBrackets.clear();

    while (true) {
        if (atLineStart && openBrackets.empty()) {
            if (!handleIndentation()) {
                continue;
            }
        }
        if (pos >= source.size()) {
            break;
        }

        char c = peek();
        if (c == ' ' || c == '\t' || c == '\f') {
            advance();
            continue;
        }
        if (c == '#') {
            while (pos < source.size() && peek() != '\n' && peek() != '\r') {
                advance();
            }
            continue;
        }
        if (c == '\\') {
            if (peek(1) == '\n' || peek(1) == '\r') {
                advance(peek(1) == '\r' && peek(2) == '\n' ? 3 : 2);
                continue;
            }
            throw ParseError("carácter inesperado después de la continuación de línea", line, column);
        }
        if (c == '\n' || c == '\r') {
            if (openBrackets.empty() && !tokens.empty() && tokens.back().kind != TokenKind::Newline) {
                emit(TokenKind::Newline, "", line, column, pos);
            }
            advance(c == '\r' && peek(1) == '\n' ? 2 : 1);
            if (openBrackets.empty()) {
                atLineStart = true;
            }
            continue;
        }
        if (isNameStart(c)) {
            lexName();
            continue;
        }
        if (isDigit(c) || (c == '.' && isDigit(peek(1)))) {
            lexNumber();
            continue;
        }
        if (c == '"' || c == '\'') {
            lexString(pos, line, column);
            continue;
        }
        lexOperator();
    }

    if (!openBrackets.empty()) {
        const Token& opener = openBrackets.back();
        throw ParseError("'" + opener.text + "' nunca se cerró", opener.line, opener.column);
    }
    if (!tokens.empty() && tokens.back().kind != TokenKind::Newline) {
        emit(TokenKind::Newline, "", line, column, pos);
    }
    while (indentStack.size() > 1) {
        indentStack.pop_back();
        emit(TokenKind::Dedent, "", line, column, pos);
    }
    emit(TokenKind::EndOfFile, "", line, column, pos);
    return tokens;
}
