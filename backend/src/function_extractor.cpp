#include "function_extractor.h"
#include <set>
#include <utility>

namespace {

// Máximo de expresiones/bloques anidados antes de rechazar el código
const int kMaxNestingDepth = 1000;

// Palabras reservadas que nunca pueden ser un átomo de expresión
const std::set<std::string>& reservedWords() {
    static const std::set<std::string> words = {
        "and", "as", "assert", "async", "await", "break", "class", "continue",
        "def", "del", "elif", "else", "except", "finally", "for", "from",
        "global", "if", "import", "in", "is", "lambda", "nonlocal", "not",
        "or", "pass", "raise", "return", "try", "while", "with", "yield"
    };
    return words;
}

const std::set<std::string>& augmentedOps() {
    static const std::set<std::string> ops = {
        "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**="
    };
    return ops;
}

const std::set<std::string>& comparisonOps() {
    static const std::set<std::string> ops = {"<", ">", "==", ">=", "<=", "!="};
    return ops;
}

// Operadores binarios por nivel de precedencia (de menor a mayor)
const std::vector<std::set<std::string>>& binaryLevels() {
    static const std::vector<std::set<std::string>> levels = {
        {"|"},
        {"^"},
        {"&"},
        {"<<", ">>"},
        {"+", "-"},
        {"*", "/", "//", "%", "@"}
    };
    return levels;
}

std::unique_ptr<SyntaxNode> makeNode(NodeKind kind, const Token& token, const std::string& name = "") {
    auto node = std::make_unique<SyntaxNode>(kind, token.line);
    node->name = name;
    node->startOffset = token.offset;
    node->endOffset = token.offset + token.text.size();
    return node;
}

// Los destinos d[k] de una asignación se marcan como ContainerStore
std::unique_ptr<SyntaxNode> wrapTarget(std::unique_ptr<SyntaxNode> target) {
    if (target->kind == NodeKind::Subscript) {
        auto store = std::make_unique<SyntaxNode>(NodeKind::ContainerStore, target->line);
        const SyntaxNode* object = target->children.empty() ? nullptr : target->children[0].get();
        if (object && object->kind == NodeKind::Name) {
            store->name = object->name;
        }
        store->startOffset = target->startOffset;
        store->endOffset = target->endOffset;
        store->add(std::move(target));
        return store;
    }
    if (target->kind == NodeKind::Display && target->name == "tuple") {
        for (auto& child : target->children) {
            child = wrapTarget(std::move(child));
        }
    }
    return target;
}

} // namespace

PythonParser::PythonParser(const std::string& source) : source(source) {
    PythonLexer lexer(source);
    tokens = lexer.tokenize();
}

PythonParser::NestingGuard::NestingGuard(PythonParser& parser) : parser(parser) {
    if (parser.nestingDepth >= kMaxNestingDepth) {
        throw parser.errorAt(parser.peek(), "demasiados niveles de anidamiento");
    }
    ++parser.nestingDepth;
}

PythonParser::NestingGuard::~NestingGuard() {
    --parser.nestingDepth;
}

// ========== ACCESO A TOKENS ==========

const Token& PythonParser::peek(size_t ahead) const {
    size_t index = current + ahead;
    if (index >= tokens.size()) {
        return tokens.back();
    }
    return tokens[index];
}

const Token& PythonParser::previous() const {
    return tokens[current == 0 ? 0 : current - 1];
}

const Token& PythonParser::advance() {
    if (tokens[current].kind != TokenKind::EndOfFile) {
        TokenKind kind = tokens[current].kind;
        if (kind != TokenKind::Newline && kind != TokenKind::Indent && kind != TokenKind::Dedent) {
            lastReal = current;
        }
        ++current;
    }
    return previous();
}

bool PythonParser::checkOp(const std::string& op, size_t ahead) const {
    const Token& token = peek(ahead);
    return token.kind == TokenKind::Op && token.text == op;
}

bool PythonParser::checkKeyword(const std::string& word, size_t ahead) const {
    const Token& token = peek(ahead);
    return token.kind == TokenKind::Name && token.text == word;
}

bool PythonParser::matchOp(const std::string& op) {
    if (checkOp(op)) {
        advance();
        return true;
    }
    return false;
}

bool PythonParser::matchKeyword(const std::string& word) {
    if (checkKeyword(word)) {
        advance();
        return true;
    }
    return false;
}

const Token& PythonParser::expectOp(const std::string& op, const std::string& context) {
    if (!checkOp(op)) {
        throw errorAt(peek(), "se esperaba '" + op + "' " + context);
    }
    return advance();
}

const Token& PythonParser::expectKeyword(const std::string& word, const std::string& context) {
    if (!checkKeyword(word)) {
        throw errorAt(peek(), "se esperaba '" + word + "' " + context);
    }
    return advance();
}

std::string PythonParser::expectName(const std::string& context) {
    const Token& token = peek();
    if (token.kind != TokenKind::Name || reservedWords().count(token.text) > 0) {
        throw errorAt(token, "se esperaba un identificador " + context);
    }
    advance();
    return token.text;
}

ParseError PythonParser::errorAt(const Token& token, const std::string& message) const {
    if (token.kind == TokenKind::EndOfFile) {
        return ParseError("fin de archivo inesperado: " + message, token.line, token.column);
    }
    return ParseError(message, token.line, token.column);
}

void PythonParser::finish(SyntaxNode& node) const {
    const Token& last = tokens[lastReal];
    node.endLine = last.line;
    node.endOffset = last.offset + last.text.size();
}

void PythonParser::checkTarget(const SyntaxNode& target, const std::string& verb,
                               bool allowSequence, bool allowStarred) const {
    switch (target.kind) {
        case NodeKind::Name:
        case NodeKind::Attribute:
        case NodeKind::Subscript:
            return;
        case NodeKind::Display:
            if (allowSequence && (target.name == "tuple" || target.name == "list")) {
                for (const auto& child : target.children) {
                    checkTarget(*child, verb, true, verb != "borrar");
                }
                return;
            }
            break;
        case NodeKind::Other:
            // *resto solo como elemento de una tupla o lista
            if (target.name == "*" && allowStarred && target.children.size() == 1) {
                checkTarget(*target.children[0], verb, true, true);
                return;
            }
            break;
        default:
            break;
    }

    std::string what = "una expresión";
    if (target.kind == NodeKind::Call) {
        what = "una llamada a función";
    } else if (target.kind == NodeKind::Other && (target.name == "number" || target.name == "string" || target.name == "...")) {
        what = "un literal";
    } else if (target.kind == NodeKind::Comprehension) {
        what = "una comprensión";
    } else if (target.kind == NodeKind::Display) {
        if (target.name == "dict") {
            what = "un diccionario";
        } else if (target.name == "set") {
            what = "un conjunto";
        } else {
            what = target.name == "list" ? "una lista" : "una tupla";
        }
    } else if (target.kind == NodeKind::Lambda) {
        what = "una lambda";
    }

    // Columna a partir del offset del nodo
    size_t offset = target.startOffset < source.size() ? target.startOffset : source.size();
    size_t lineStart = source.rfind('\n', offset == 0 ? 0 : offset - 1);
    int column = static_cast<int>(lineStart == std::string::npos || offset == 0 ? offset + 1 : offset - lineStart);
    throw ParseError("no se puede " + verb + " " + what, target.line, column);
}

bool PythonParser::startsExpression() const {
    const Token& token = peek();
    switch (token.kind) {
        case TokenKind::Number:
        case TokenKind::String:
            return true;
        case TokenKind::Name:
            return reservedWords().count(token.text) == 0 ||
                   token.text == "lambda" || token.text == "not" ||
                   token.text == "await" || token.text == "yield";
        case TokenKind::Op:
            return token.text == "(" || token.text == "[" || token.text == "{" ||
                   token.text == "-" || token.text == "+" || token.text == "~" ||
                   token.text == "*" || token.text == "...";
        default:
            return false;
    }
}

// ========== MÓDULO Y SENTENCIAS ==========

std::unique_ptr<SyntaxNode> PythonParser::parseModule() {
    auto module = makeNode(NodeKind::Module, peek());
    module->line = 1;
    module->startOffset = 0;
    while (peek().kind != TokenKind::EndOfFile) {
        if (peek().kind == TokenKind::Newline) {
            advance();
            continue;
        }
        if (peek().kind == TokenKind::Dedent) {
            throw errorAt(peek(), "desindentación inesperada");
        }
        parseStatement(*module);
    }
    finish(*module);
    return module;
}

std::unique_ptr<SyntaxNode> PythonParser::parseExpressionFragment() {
    auto expression = parseTestListStarExpr();
    if (peek().kind == TokenKind::Newline) {
        advance();
    }
    if (peek().kind != TokenKind::EndOfFile) {
        throw errorAt(peek(), "expresión inválida");
    }
    return expression;
}

void PythonParser::parseStatement(SyntaxNode& block) {
    const Token& token = peek();
    if (token.kind == TokenKind::Indent) {
        throw errorAt(token, "indentación inesperada");
    }
    if (checkOp("@")) {
        block.add(parseDecorated());
        return;
    }
    if (token.kind == TokenKind::Name) {
        if (token.text == "def") {
            block.add(parseFunctionDef(nullptr, token));
            return;
        }
        if (token.text == "class") {
            block.add(parseClassDef(nullptr, token));
            return;
        }
        if (token.text == "if") {
            block.add(parseIf());
            return;
        }
        if (token.text == "while") {
            block.add(parseWhile());
            return;
        }
        if (token.text == "for") {
            block.add(parseFor());
            return;
        }
        if (token.text == "try") {
            block.add(parseTry());
            return;
        }
        if (token.text == "with") {
            block.add(parseWith());
            return;
        }
        if (token.text == "async") {
            const Token& start = advance();
            if (checkKeyword("def")) {
                block.add(parseFunctionDef(nullptr, start));
            } else if (checkKeyword("for")) {
                block.add(parseFor());
            } else if (checkKeyword("with")) {
                block.add(parseWith());
            } else {
                throw errorAt(peek(), "se esperaba 'def', 'for' o 'with' después de 'async'");
            }
            return;
        }
        if (token.text == "match" && looksLikeMatchStatement()) {
            block.add(parseMatch());
            return;
        }
    }
    parseSimpleStatements(block);
}

void PythonParser::parseSimpleStatements(SyntaxNode& block) {
    block.add(parseSmallStatement());
    while (matchOp(";")) {
        if (peek().kind == TokenKind::Newline || peek().kind == TokenKind::EndOfFile) {
            break;
        }
        block.add(parseSmallStatement());
    }
    if (peek().kind == TokenKind::Newline) {
        advance();
    } else if (peek().kind != TokenKind::EndOfFile) {
        throw errorAt(peek(), "sintaxis inválida");
    }
}

std::unique_ptr<SyntaxNode> PythonParser::parseSmallStatement() {
    const Token& token = peek();
    if (token.kind == TokenKind::Name) {
        if (token.text == "pass") {
            advance();
            return makeNode(NodeKind::Other, token, "pass");
        }
        if (token.text == "break" || token.text == "continue") {
            advance();
            return makeNode(NodeKind::Exit, token, token.text);
        }
        if (token.text == "return") {
            advance();
            auto node = makeNode(NodeKind::Exit, token, "return");
            if (startsExpression()) {
                node->add(parseTestListStarExpr());
            }
            finish(*node);
            return node;
        }
        if (token.text == "raise") {
            advance();
            auto node = makeNode(NodeKind::Exit, token, "raise");
            if (startsExpression()) {
                node->add(parseTest());
                if (matchKeyword("from")) {
                    node->add(parseTest());
                }
            }
            finish(*node);
            return node;
        }
        if (token.text == "global" || token.text == "nonlocal") {
            advance();
            auto node = makeNode(NodeKind::Other, token, token.text);
            expectName("después de '" + token.text + "'");
            while (matchOp(",")) {
                expectName("en la lista de nombres");
            }
            return node;
        }
        if (token.text == "del") {
            advance();
            auto node = makeNode(NodeKind::Other, token, "del");
            auto targets = parseExprList();
            checkTarget(*targets, "borrar", true, false);
            node->add(std::move(targets));
            return node;
        }
        if (token.text == "assert") {
            advance();
            auto node = makeNode(NodeKind::Other, token, "assert");
            node->add(parseTest());
            if (matchOp(",")) {
                node->add(parseTest());
            }
            return node;
        }
        if (token.text == "import" || token.text == "from") {
            return parseImport();
        }
        // Alias de tipo (3.12): type X = ...
        if (token.text == "type" && peek(1).kind == TokenKind::Name &&
            (checkOp("=", 2) || checkOp("[", 2))) {
            auto node = makeNode(NodeKind::Other, token, "type");
            while (peek().kind != TokenKind::Newline && peek().kind != TokenKind::EndOfFile && !checkOp(";")) {
                advance();
            }
            return node;
        }
    }
    return parseExpressionStatement();
}

std::unique_ptr<SyntaxNode> PythonParser::parseExpressionStatement() {
    const Token& start = peek();
    auto first = parseYieldOrTestList();

    // Asignación anotada: x: int = valor
    if (matchOp(":")) {
        auto node = makeNode(NodeKind::Other, start, "=");
        auto annotation = makeNode(NodeKind::Other, peek(), "annotation");
        annotation->add(parseTest());
        checkTarget(*first, "anotar", false, false);
        node->add(wrapTarget(std::move(first)));
        node->add(std::move(annotation));
        if (matchOp("=")) {
            node->add(parseYieldOrTestList());
        }
        finish(*node);
        return node;
    }

    // Asignación aumentada: x += valor
    if (peek().kind == TokenKind::Op && augmentedOps().count(peek().text) > 0) {
        checkTarget(*first, "asignar con '" + peek().text + "' a", false, false);
        const Token& op = advance();
        auto node = makeNode(NodeKind::AugmentedStore, start, op.text);
        node->add(std::move(first));
        node->add(parseYieldOrTestList());
        finish(*node);
        return node;
    }

    // Asignación (posiblemente encadenada): a = b = valor
    if (checkOp("=")) {
        std::vector<std::unique_ptr<SyntaxNode>> parts;
        parts.push_back(std::move(first));
        while (matchOp("=")) {
            parts.push_back(parseYieldOrTestList());
        }
        auto node = makeNode(NodeKind::Other, start, "=");
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            checkTarget(*parts[i], "asignar a", true, false);
            node->add(wrapTarget(std::move(parts[i])));
        }
        node->add(std::move(parts.back()));
        finish(*node);
        return node;
    }

    return first;
}

// Bloque de sentencias después de ':' (indentado o en la misma línea)
std::unique_ptr<SyntaxNode> PythonParser::parseSuite() {
    NestingGuard guard(*this);
    auto block = makeNode(NodeKind::Block, peek());
    if (peek().kind == TokenKind::Newline) {
        advance();
        if (peek().kind != TokenKind::Indent) {
            throw errorAt(peek(), "se esperaba un bloque indentado");
        }
        advance();
        block->line = peek().line;
        block->startOffset = peek().offset;
        while (peek().kind != TokenKind::Dedent && peek().kind != TokenKind::EndOfFile) {
            if (peek().kind == TokenKind::Newline) {
                advance();
                continue;
            }
            parseStatement(*block);
        }
        if (peek().kind == TokenKind::Dedent) {
            advance();
        }
    } else if (peek().kind == TokenKind::EndOfFile) {
        throw errorAt(peek(), "se esperaba un bloque después de ':'");
    } else {
        parseSimpleStatements(*block);
    }
    finish(*block);
    return block;
}

std::unique_ptr<SyntaxNode> PythonParser::parseDecorated() {
    const Token& start = peek();
    auto header = makeNode(NodeKind::Other, start, "header");
    while (matchOp("@")) {
        header->add(parseNamedExpr());
        if (peek().kind != TokenKind::Newline) {
            throw errorAt(peek(), "se esperaba fin de línea después del decorador");
        }
        advance();
    }
    if (checkKeyword("def")) {
        return parseFunctionDef(std::move(header), start);
    }
    if (checkKeyword("async") && checkKeyword("def", 1)) {
        advance();
        return parseFunctionDef(std::move(header), start);
    }
    if (checkKeyword("class")) {
        return parseClassDef(std::move(header), start);
    }
    throw errorAt(peek(), "se esperaba 'def' o 'class' después del decorador");
}

std::unique_ptr<SyntaxNode> PythonParser::parseFunctionDef(std::unique_ptr<SyntaxNode> decorators, const Token& start) {
    auto function = makeNode(NodeKind::Function, start);
    expectKeyword("def", "al inicio de la función");
    function->name = expectName("después de 'def'");
    if (checkOp("[")) {
        skipTypeParameters();
    }

    auto header = decorators ? std::move(decorators) : makeNode(NodeKind::Other, start, "header");
    expectOp("(", "después del nombre de la función");
    parseParameters(*function, *header, ")");
    expectOp(")", "al cerrar los parámetros");
    if (matchOp("->")) {
        header->add(parseTest());
    }
    expectOp(":", "al final de la firma de la función");

    function->add(std::move(header));
    function->add(parseSuite());
    finish(*function);
    return function;
}

void PythonParser::parseParameters(SyntaxNode& function, SyntaxNode& header, const std::string& closer) {
    bool annotations = closer == ")";
    while (!checkOp(closer)) {
        if (matchOp("/")) {
            // Separador de parámetros solo posicionales
        } else if (matchOp("*") || matchOp("**")) {
            if (peek().kind == TokenKind::Name) {
                function.parameters.push_back(expectName("en los parámetros"));
                if (annotations && matchOp(":")) {
                    header.add(parseTest());
                }
            }
        } else {
            function.parameters.push_back(expectName("en los parámetros"));
            if (annotations && matchOp(":")) {
                header.add(parseTest());
            }
            if (matchOp("=")) {
                header.add(parseTest());
            }
        }
        if (!matchOp(",")) {
            break;
        }
    }
}

void PythonParser::skipTypeParameters() {
    int depth = 0;
    do {
        if (checkOp("[")) {
            ++depth;
        } else if (checkOp("]")) {
            --depth;
        }
        advance();
    } while (depth > 0 && peek().kind != TokenKind::EndOfFile);
}

std::unique_ptr<SyntaxNode> PythonParser::parseClassDef(std::unique_ptr<SyntaxNode> decorators, const Token& start) {
    auto cls = makeNode(NodeKind::Class, start);
    expectKeyword("class", "al inicio de la clase");
    cls->name = expectName("después de 'class'");
    if (checkOp("[")) {
        skipTypeParameters();
    }

    auto header = decorators ? std::move(decorators) : makeNode(NodeKind::Other, start, "header");
    if (matchOp("(")) {
        while (!checkOp(")")) {
            if (matchOp("**") || matchOp("*")) {
                header->add(parseTest());
            } else if (peek().kind == TokenKind::Name && checkOp("=", 1)) {
                advance();
                advance();
                header->add(parseTest());
            } else {
                header->add(parseTest());
            }
            if (!matchOp(",")) {
                break;
            }
        }
        expectOp(")", "al cerrar las bases de la clase");
    }
    expectOp(":", "al final de la declaración de clase");

    cls->add(std::move(header));
    cls->add(parseSuite());
    finish(*cls);
    return cls;
}

std::unique_ptr<SyntaxNode> PythonParser::parseIf() {
    const Token& keyword = advance(); // 'if' o 'elif'
    auto node = makeNode(NodeKind::Conditional, keyword);
    auto condition = makeNode(NodeKind::Other, peek(), "condition");
    condition->add(parseNamedExpr());
    node->add(std::move(condition));
    expectOp(":", "después de la condición");
    node->add(parseSuite());

    if (checkKeyword("elif")) {
        auto elseBlock = makeNode(NodeKind::Block, peek());
        elseBlock->add(parseIf());
        finish(*elseBlock);
        node->add(std::move(elseBlock));
    } else if (matchKeyword("else")) {
        expectOp(":", "después de 'else'");
        node->add(parseSuite());
    }
    finish(*node);
    return node;
}

std::unique_ptr<SyntaxNode> PythonParser::parseWhile() {
    const Token& keyword = advance();
    auto loop = makeNode(NodeKind::Loop, keyword, "while");
    auto header = makeNode(NodeKind::Other, peek(), "header");
    header->add(parseNamedExpr());
    loop->add(std::move(header));
    expectOp(":", "después de la condición del while");
    loop->add(parseSuite());
    if (matchKeyword("else")) {
        expectOp(":", "después de 'else'");
        loop->add(parseSuite());
    }
    finish(*loop);
    return loop;
}

std::unique_ptr<SyntaxNode> PythonParser::parseFor() {
    const Token& keyword = advance();
    auto loop = makeNode(NodeKind::Loop, keyword, "for");
    auto header = makeNode(NodeKind::Other, peek(), "header");
    auto targets = parseExprList();
    checkTarget(*targets, "asignar a", true, false);
    header->add(std::move(targets));
    expectKeyword("in", "en el for");
    header->add(parseTestListStarExpr());
    loop->add(std::move(header));
    expectOp(":", "después del encabezado del for");
    loop->add(parseSuite());
    if (matchKeyword("else")) {
        expectOp(":", "después de 'else'");
        loop->add(parseSuite());
    }
    finish(*loop);
    return loop;
}

std::unique_ptr<SyntaxNode> PythonParser::parseTry() {
    const Token& keyword = advance();
    auto node = makeNode(NodeKind::Other, keyword, "try");
    expectOp(":", "después de 'try'");
    node->add(parseSuite());

    bool hasHandlers = false;
    bool hasFinally = false;
    while (checkKeyword("except")) {
        auto clause = makeNode(NodeKind::Other, advance(), "except");
        matchOp("*");
        if (!checkOp(":")) {
            clause->add(parseTest());
            if (matchKeyword("as")) {
                expectName("después de 'as'");
            }
        }
        expectOp(":", "después de 'except'");
        clause->add(parseSuite());
        node->add(std::move(clause));
        hasHandlers = true;
    }
    if (hasHandlers && matchKeyword("else")) {
        expectOp(":", "después de 'else'");
        node->add(parseSuite());
    }
    if (matchKeyword("finally")) {
        expectOp(":", "después de 'finally'");
        node->add(parseSuite());
        hasFinally = true;
    }
    if (!hasHandlers && !hasFinally) {
        throw errorAt(peek(), "se esperaba 'except' o 'finally'");
    }
    finish(*node);
    return node;
}

// with (a as b, c as d): ... requiere distinguir los paréntesis de los items
// de una expresión entre paréntesis.
bool PythonParser::hasParenthesizedWithItems() const {
    if (!checkOp("(")) {
        return false;
    }
    int depth = 0;
    bool sawAs = false;
    for (size_t i = current; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        if (token.kind == TokenKind::Op && (token.text == "(" || token.text == "[" || token.text == "{")) {
            ++depth;
        } else if (token.kind == TokenKind::Op && (token.text == ")" || token.text == "]" || token.text == "}")) {
            --depth;
            if (depth == 0) {
                return sawAs && i + 1 < tokens.size() &&
                       tokens[i + 1].kind == TokenKind::Op && tokens[i + 1].text == ":";
            }
        } else if (depth == 1 && token.kind == TokenKind::Name && token.text == "as") {
            sawAs = true;
        }
    }
    return false;
}

std::unique_ptr<SyntaxNode> PythonParser::parseWith() {
    const Token& keyword = advance();
    auto node = makeNode(NodeKind::Other, keyword, "with");
    bool parenthesized = hasParenthesizedWithItems();
    if (parenthesized) {
        advance();
    }
    while (true) {
        if (parenthesized && checkOp(")")) {
            break;
        }
        node->add(parseTest());
        if (matchKeyword("as")) {
            node->add(parseBinary(0));
        }
        if (!matchOp(",")) {
            break;
        }
    }
    if (parenthesized) {
        expectOp(")", "al cerrar los items del with");
    }
    expectOp(":", "después de 'with'");
    node->add(parseSuite());
    finish(*node);
    return node;
}

// 'match' es palabra clave suave: solo es sentencia si la línea termina en ':' y abre bloque
bool PythonParser::looksLikeMatchStatement() const {
    const Token& next = peek(1);
    if (next.kind == TokenKind::Newline || next.kind == TokenKind::EndOfFile) {
        return false;
    }
    if (next.kind == TokenKind::Op && next.text != "(" && next.text != "[" && next.text != "{" &&
        next.text != "-" && next.text != "*") {
        return false;
    }
    for (size_t i = current + 1; i + 1 < tokens.size(); ++i) {
        if (tokens[i].kind == TokenKind::Newline) {
            const Token& last = tokens[i - 1];
            return last.kind == TokenKind::Op && last.text == ":" &&
                   tokens[i + 1].kind == TokenKind::Indent;
        }
    }
    return false;
}

std::unique_ptr<SyntaxNode> PythonParser::parseMatch() {
    const Token& keyword = advance();
    auto node = makeNode(NodeKind::Other, keyword, "match");
    node->add(parseTestListStarExpr());
    expectOp(":", "después del sujeto de match");
    if (peek().kind != TokenKind::Newline) {
        throw errorAt(peek(), "se esperaba fin de línea después de 'match'");
    }
    advance();
    if (peek().kind != TokenKind::Indent) {
        throw errorAt(peek(), "se esperaba un bloque indentado");
    }
    advance();

    while (checkKeyword("case")) {
        auto branch = makeNode(NodeKind::Conditional, advance(), "case");
        auto header = makeNode(NodeKind::Other, peek(), "condition");

        // El patrón se omite; solo la guarda 'if' se analiza como expresión
        int depth = 0;
        while (depth > 0 || (!checkOp(":") && !checkKeyword("if"))) {
            const Token& token = peek();
            if (token.kind == TokenKind::Newline || token.kind == TokenKind::EndOfFile) {
                throw errorAt(token, "patrón de case incompleto");
            }
            if (token.kind == TokenKind::Op && (token.text == "(" || token.text == "[" || token.text == "{")) {
                ++depth;
            } else if (token.kind == TokenKind::Op && (token.text == ")" || token.text == "]" || token.text == "}")) {
                --depth;
            }
            advance();
        }
        if (matchKeyword("if")) {
            header->add(parseNamedExpr());
        }
        expectOp(":", "después del patrón de case");
        branch->add(std::move(header));
        branch->add(parseSuite());
        finish(*branch);
        node->add(std::move(branch));
    }
    if (peek().kind != TokenKind::Dedent) {
        throw errorAt(peek(), "se esperaba 'case'");
    }
    advance();
    finish(*node);
    return node;
}

std::unique_ptr<SyntaxNode> PythonParser::parseImport() {
    const Token& keyword = advance();
    auto node = makeNode(NodeKind::Other, keyword, keyword.text);

    auto dottedName = [this]() {
        expectName("en el nombre del módulo");
        while (matchOp(".")) {
            expectName("después de '.'");
        }
    };

    if (keyword.text == "import") {
        do {
            dottedName();
            if (matchKeyword("as")) {
                expectName("después de 'as'");
            }
        } while (matchOp(","));
        return node;
    }

    // from ... import ...
    bool relative = false;
    while (checkOp(".") || checkOp("...")) {
        advance();
        relative = true;
    }
    if (!checkKeyword("import")) {
        dottedName();
    } else if (!relative) {
        throw errorAt(peek(), "se esperaba el nombre del módulo");
    }
    expectKeyword("import", "en la sentencia from");
    if (matchOp("*")) {
        return node;
    }
    bool parenthesized = matchOp("(");
    do {
        if (parenthesized && checkOp(")")) {
            break;
        }
        expectName("en la lista de importación");
        if (matchKeyword("as")) {
            expectName("después de 'as'");
        }
    } while (matchOp(","));
    if (parenthesized) {
        expectOp(")", "al cerrar la lista de importación");
    }
    return node;
}

// ========== EXPRESIONES ==========

std::unique_ptr<SyntaxNode> PythonParser::parseTestListStarExpr() {
    const Token& start = peek();
    auto first = parseStarOrNamed();
    if (!checkOp(",")) {
        return first;
    }
    auto tuple = makeNode(NodeKind::Display, start, "tuple");
    tuple->add(std::move(first));
    while (matchOp(",")) {
        if (!startsExpression()) {
            break;
        }
        tuple->add(parseStarOrNamed());
    }
    finish(*tuple);
    return tuple;
}

std::unique_ptr<SyntaxNode> PythonParser::parseExprList() {
    const Token& start = peek();
    auto parseItem = [this]() -> std::unique_ptr<SyntaxNode> {
        if (checkOp("*")) {
            auto star = makeNode(NodeKind::Other, advance(), "*");
            star->add(parseBinary(0));
            return star;
        }
        return parseBinary(0);
    };
    auto first = parseItem();
    if (!checkOp(",")) {
        return first;
    }
    auto tuple = makeNode(NodeKind::Display, start, "tuple");
    tuple->add(std::move(first));
    while (matchOp(",")) {
        if (!startsExpression()) {
            break;
        }
        tuple->add(parseItem());
    }
    finish(*tuple);
    return tuple;
}

std::unique_ptr<SyntaxNode> PythonParser::parseYieldOrTestList() {
    if (checkKeyword("yield")) {
        auto node = makeNode(NodeKind::Other, advance(), "yield");
        if (matchKeyword("from")) {
            node->add(parseTest());
        } else if (startsExpression()) {
            node->add(parseTestListStarExpr());
        }
        finish(*node);
        return node;
    }
    return parseTestListStarExpr();
}

std::unique_ptr<SyntaxNode> PythonParser::parseStarOrNamed() {
    if (checkOp("*")) {
        auto star = makeNode(NodeKind::Other, advance(), "*");
        star->add(parseBinary(0));
        finish(*star);
        return star;
    }
    return parseNamedExpr();
}

std::unique_ptr<SyntaxNode> PythonParser::parseNamedExpr() {
    if (peek().kind == TokenKind::Name && checkOp(":=", 1)) {
        const Token& target = peek();
        auto node = makeNode(NodeKind::Other, target, ":=");
        node->add(makeNode(NodeKind::Name, target, expectName("antes de ':='")));
        advance();
        node->add(parseTest());
        finish(*node);
        return node;
    }
    return parseTest();
}

std::unique_ptr<SyntaxNode> PythonParser::parseTest() {
    NestingGuard guard(*this);
    if (checkKeyword("lambda")) {
        return parseLambda(true);
    }
    const Token& start = peek();
    auto body = parseOrTest();
    if (checkKeyword("if")) {
        advance();
        auto node = makeNode(NodeKind::Other, start, "ifexp");
        node->add(std::move(body));
        node->add(parseOrTest());
        expectKeyword("else", "en la expresión condicional");
        node->add(parseTest());
        finish(*node);
        return node;
    }
    return body;
}

std::unique_ptr<SyntaxNode> PythonParser::parseLambda(bool allowConditional) {
    const Token& keyword = advance();
    auto lambda = makeNode(NodeKind::Lambda, keyword, "<lambda>");
    auto header = makeNode(NodeKind::Other, keyword, "header");
    parseParameters(*lambda, *header, ":");
    expectOp(":", "en la lambda");
    lambda->add(std::move(header));
    lambda->add(allowConditional ? parseTest() : parseOrTest());
    finish(*lambda);
    return lambda;
}

std::unique_ptr<SyntaxNode> PythonParser::parseOrTest() {
    const Token& start = peek();
    auto left = parseAndTest();
    if (!checkKeyword("or")) {
        return left;
    }
    auto node = makeNode(NodeKind::Other, start, "or");
    node->add(std::move(left));
    while (matchKeyword("or")) {
        node->add(parseAndTest());
    }
    finish(*node);
    return node;
}

std::unique_ptr<SyntaxNode> PythonParser::parseAndTest() {
    const Token& start = peek();
    auto left = parseNotTest();
    if (!checkKeyword("and")) {
        return left;
    }
    auto node = makeNode(NodeKind::Other, start, "and");
    node->add(std::move(left));
    while (matchKeyword("and")) {
        node->add(parseNotTest());
    }
    finish(*node);
    return node;
}

std::unique_ptr<SyntaxNode> PythonParser::parseNotTest() {
    NestingGuard guard(*this);
    if (checkKeyword("not")) {
        auto node = makeNode(NodeKind::Other, advance(), "not");
        node->add(parseNotTest());
        finish(*node);
        return node;
    }
    return parseComparison();
}

std::unique_ptr<SyntaxNode> PythonParser::parseComparison() {
    const Token& start = peek();
    auto left = parseBinary(0);
    std::unique_ptr<SyntaxNode> node;
    while (true) {
        bool matched = false;
        if (peek().kind == TokenKind::Op && comparisonOps().count(peek().text) > 0) {
            advance();
            matched = true;
        } else if (checkKeyword("in")) {
            advance();
            matched = true;
        } else if (checkKeyword("not") && checkKeyword("in", 1)) {
            advance();
            advance();
            matched = true;
        } else if (checkKeyword("is")) {
            advance();
            matchKeyword("not");
            matched = true;
        }
        if (!matched) {
            break;
        }
        if (!node) {
            node = makeNode(NodeKind::Other, start, "compare");
            node->add(std::move(left));
        }
        node->add(parseBinary(0));
    }
    if (!node) {
        return left;
    }
    finish(*node);
    return node;
}

std::unique_ptr<SyntaxNode> PythonParser::parseBinary(int level) {
    const auto& levels = binaryLevels();
    if (level >= static_cast<int>(levels.size())) {
        return parseFactor();
    }
    const Token& start = peek();
    auto left = parseBinary(level + 1);
    while (peek().kind == TokenKind::Op && levels[level].count(peek().text) > 0) {
        const Token& op = advance();
        auto node = makeNode(NodeKind::Other, start, op.text);
        node->add(std::move(left));
        node->add(parseBinary(level + 1));
        finish(*node);
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<SyntaxNode> PythonParser::parseFactor() {
    NestingGuard guard(*this);
    if (checkOp("+") || checkOp("-") || checkOp("~")) {
        const Token& op = advance();
        auto node = makeNode(NodeKind::Other, op, op.text);
        node->add(parseFactor());
        finish(*node);
        return node;
    }
    return parsePower();
}

std::unique_ptr<SyntaxNode> PythonParser::parsePower() {
    const Token& start = peek();
    std::unique_ptr<SyntaxNode> base;
    if (checkKeyword("await")) {
        base = makeNode(NodeKind::Other, advance(), "await");
        base->add(parsePrimary());
        finish(*base);
    } else {
        base = parsePrimary();
    }
    if (matchOp("**")) {
        auto node = makeNode(NodeKind::Other, start, "**");
        node->add(std::move(base));
        node->add(parseFactor());
        finish(*node);
        return node;
    }
    return base;
}

std::unique_ptr<SyntaxNode> PythonParser::parsePrimary() {
    auto expression = parseAtom();
    while (true) {
        if (checkOp("(")) {
            expression = parseCall(std::move(expression));
        } else if (checkOp("[")) {
            expression = parseSubscript(std::move(expression));
        } else if (checkOp(".")) {
            advance();
            const Token& attr = peek();
            auto node = makeNode(NodeKind::Attribute, attr, expectName("después de '.'"));
            node->line = expression->line;
            node->startOffset = expression->startOffset;
            node->add(std::move(expression));
            finish(*node);
            expression = std::move(node);
        } else {
            break;
        }
    }
    return expression;
}

std::unique_ptr<SyntaxNode> PythonParser::parseAtom() {
    const Token& token = peek();
    switch (token.kind) {
        case TokenKind::Name:
            if (reservedWords().count(token.text) > 0) {
                throw errorAt(token, "sintaxis inválida cerca de '" + token.text + "'");
            }
            advance();
            return makeNode(NodeKind::Name, token, token.text);
        case TokenKind::Number:
            advance();
            return makeNode(NodeKind::Other, token, "number");
        case TokenKind::String:
            return parseStrings();
        case TokenKind::Op:
            if (token.text == "(") {
                return parseBracketed(")");
            }
            if (token.text == "[") {
                return parseBracketed("]");
            }
            if (token.text == "{") {
                return parseBraced();
            }
            if (token.text == "...") {
                advance();
                return makeNode(NodeKind::Other, token, "...");
            }
            throw errorAt(token, "sintaxis inválida cerca de '" + token.text + "'");
        case TokenKind::Indent:
            throw errorAt(token, "indentación inesperada");
        default:
            throw errorAt(token, "se esperaba una expresión");
    }
}

// ( ... ) o [ ... ]: tupla, lista, expresión agrupada o comprensión
std::unique_ptr<SyntaxNode> PythonParser::parseBracketed(const std::string& closer) {
    const Token& open = advance();
    bool isParen = closer == ")";
    auto display = makeNode(NodeKind::Display, open, isParen ? "tuple" : "list");
    if (matchOp(closer)) {
        finish(*display);
        return display;
    }
    if (isParen && checkKeyword("yield")) {
        auto inner = parseYieldOrTestList();
        expectOp(")", "al cerrar el paréntesis");
        return inner;
    }

    auto first = parseStarOrNamed();
    if (checkKeyword("for") || (checkKeyword("async") && checkKeyword("for", 1))) {
        auto comprehension = parseComprehensionTail(std::move(first), open.line);
        comprehension->name = isParen ? "generator" : "list";
        comprehension->startOffset = open.offset;
        expectOp(closer, "al cerrar la comprensión");
        finish(*comprehension);
        return comprehension;
    }
    if (isParen && !checkOp(",")) {
        expectOp(")", "al cerrar el paréntesis");
        return first;
    }

    display->add(std::move(first));
    while (matchOp(",")) {
        if (checkOp(closer)) {
            break;
        }
        display->add(parseStarOrNamed());
    }
    expectOp(closer, isParen ? "al cerrar la tupla" : "al cerrar la lista");
    finish(*display);
    return display;
}

// { ... }: dict, set o sus comprensiones
std::unique_ptr<SyntaxNode> PythonParser::parseBraced() {
    const Token& open = advance();
    auto display = makeNode(NodeKind::Display, open, "dict");
    if (matchOp("}")) {
        finish(*display);
        return display;
    }

    bool isDict = false;
    auto entry = makeNode(NodeKind::Other, peek(), "entry");
    if (matchOp("**")) {
        entry->add(parseBinary(0));
        isDict = true;
    } else {
        entry->add(parseStarOrNamed());
        if (matchOp(":")) {
            entry->add(parseTest());
            isDict = true;
        }
    }

    if (checkKeyword("for") || (checkKeyword("async") && checkKeyword("for", 1))) {
        auto comprehension = parseComprehensionTail(std::move(entry), open.line);
        comprehension->name = isDict ? "dict" : "set";
        comprehension->startOffset = open.offset;
        expectOp("}", "al cerrar la comprensión");
        finish(*comprehension);
        return comprehension;
    }

    display->name = isDict ? "dict" : "set";
    display->add(std::move(entry));
    while (matchOp(",")) {
        if (checkOp("}")) {
            break;
        }
        if (isDict) {
            if (matchOp("**")) {
                display->add(parseBinary(0));
            } else {
                display->add(parseTest());
                expectOp(":", "en el diccionario");
                display->add(parseTest());
            }
        } else {
            display->add(parseStarOrNamed());
        }
    }
    expectOp("}", isDict ? "al cerrar el diccionario" : "al cerrar el conjunto");
    finish(*display);
    return display;
}

std::unique_ptr<SyntaxNode> PythonParser::parseComprehensionTail(std::unique_ptr<SyntaxNode> element, int line) {
    auto comprehension = std::make_unique<SyntaxNode>(NodeKind::Comprehension, line);
    comprehension->add(std::move(element));
    while (checkKeyword("for") || (checkKeyword("async") && checkKeyword("for", 1))) {
        matchKeyword("async");
        expectKeyword("for", "en la comprensión");
        auto targets = parseExprList();
        checkTarget(*targets, "asignar a", true, false);
        comprehension->add(std::move(targets));
        expectKeyword("in", "en la comprensión");
        comprehension->add(parseOrTest());
        while (checkKeyword("if")) {
            advance();
            comprehension->add(parseOrTest());
        }
    }
    return comprehension;
}

std::unique_ptr<SyntaxNode> PythonParser::parseCall(std::unique_ptr<SyntaxNode> callee) {
    const Token& open = advance();
    auto call = std::make_unique<SyntaxNode>(NodeKind::Call, callee->line);
    call->startOffset = callee->startOffset;
    if (callee->kind == NodeKind::Name) {
        call->name = callee->name;
    } else if (callee->kind == NodeKind::Attribute) {
        call->name = callee->name;
        call->isAttributeCall = true;
        const SyntaxNode* object = callee->children.empty() ? nullptr : callee->children[0].get();
        if (object && object->kind == NodeKind::Name) {
            call->receiver = object->name;
        }
    }
    call->add(std::move(callee));

    while (!checkOp(")")) {
        if (matchOp("**") || matchOp("*")) {
            call->add(parseTest());
        } else if (peek().kind == TokenKind::Name && checkOp("=", 1)) {
            advance();
            advance();
            call->add(parseTest());
        } else {
            auto argument = parseNamedExpr();
            if (checkKeyword("for") || (checkKeyword("async") && checkKeyword("for", 1))) {
                argument = parseComprehensionTail(std::move(argument), open.line);
                argument->name = "generator";
            }
            call->add(std::move(argument));
        }
        if (!matchOp(",")) {
            break;
        }
    }
    expectOp(")", "al cerrar los argumentos");
    finish(*call);
    return call;
}

std::unique_ptr<SyntaxNode> PythonParser::parseSubscript(std::unique_ptr<SyntaxNode> object) {
    advance();
    auto node = std::make_unique<SyntaxNode>(NodeKind::Subscript, object->line);
    node->startOffset = object->startOffset;
    node->add(std::move(object));

    while (!checkOp("]")) {
        if (checkOp("*")) {
            node->add(parseStarOrNamed());
        } else {
            if (!checkOp(":")) {
                node->add(parseNamedExpr());
            }
            if (matchOp(":")) {
                if (!checkOp(":") && !checkOp(",") && !checkOp("]")) {
                    node->add(parseTest());
                }
                if (matchOp(":") && !checkOp(",") && !checkOp("]")) {
                    node->add(parseTest());
                }
            }
        }
        if (!matchOp(",")) {
            break;
        }
    }
    expectOp("]", "al cerrar el subíndice");
    finish(*node);
    return node;
}

std::unique_ptr<SyntaxNode> PythonParser::parseStrings() {
    auto node = makeNode(NodeKind::Other, peek(), "string");
    while (peek().kind == TokenKind::String) {
        const Token& token = advance();
        parseFStringExpressions(token, *node);
    }
    finish(*node);
    return node;
}

// Extrae y parsea las expresiones {…} de un f-string para no perder llamadas
void PythonParser::parseFStringExpressions(const Token& token, SyntaxNode& into) {
    const std::string& text = token.text;
    size_t quotePos = text.find_first_of("'\"");
    if (quotePos == std::string::npos) {
        return;
    }
    std::string prefix = text.substr(0, quotePos);
    if (prefix.find('f') == std::string::npos && prefix.find('F') == std::string::npos) {
        return;
    }
    char quote = text[quotePos];
    size_t quoteLength = (text.size() >= quotePos + 6 &&
                          text[quotePos + 1] == quote && text[quotePos + 2] == quote) ? 3 : 1;
    size_t bodyStart = quotePos + quoteLength;
    size_t bodyEnd = text.size() - quoteLength;
    if (bodyEnd < bodyStart) {
        return;
    }

    size_t i = bodyStart;
    while (i < bodyEnd) {
        char c = text[i];
        if ((c == '{' || c == '}') && i + 1 < bodyEnd && text[i + 1] == c) {
            i += 2;
            continue;
        }
        if (c != '{') {
            ++i;
            continue;
        }

        // PASO 1: Delimitar la expresión hasta '}', '!' o ':' en profundidad 0
        size_t exprStart = i + 1;
        size_t j = exprStart;
        int depth = 0;
        char inQuote = '\0';
        while (j < bodyEnd) {
            char d = text[j];
            if (inQuote != '\0') {
                if (d == inQuote) {
                    inQuote = '\0';
                }
            } else if (d == '\'' || d == '"') {
                inQuote = d;
            } else if (d == '(' || d == '[' || d == '{') {
                ++depth;
            } else if (d == ')' || d == ']' || d == '}') {
                if (depth == 0) {
                    break;
                }
                --depth;
            } else if (depth == 0 && (d == ':' || (d == '!' && j + 1 < bodyEnd && text[j + 1] != '='))) {
                break;
            }
            ++j;
        }
        std::string expression = text.substr(exprStart, j - exprStart);
        while (!expression.empty() && (expression.back() == '=' || expression.back() == ' ')) {
            // Forma auto-documentada: f"{x=}"
            if (expression.back() == '=' && expression.size() > 1 &&
                std::string("=!<>").find(expression[expression.size() - 2]) != std::string::npos) {
                break;
            }
            expression.pop_back();
        }

        // PASO 2: Parsear la expresión en un parser aislado
        if (expression.find_first_not_of(" \t") == std::string::npos) {
            throw errorAt(token, "expresión vacía en f-string");
        }
        std::string fragment = "(" + expression + ")";
        try {
            PythonParser fragmentParser(fragment);
            into.add(fragmentParser.parseExpressionFragment());
        } catch (const ParseError& e) {
            throw ParseError(std::string("f-string: ") + e.what(), token.line, token.column);
        }

        // PASO 3: Saltar especificador de formato (puede tener {…} anidados)
        int braces = 1;
        while (j < bodyEnd && braces > 0) {
            if (text[j] == '{') {
                ++braces;
            } else if (text[j] == '}') {
                --braces;
            }
            ++j;
        }
        i = j;
    }
}

// ========== EXTRACCIÓN DE FUNCIONES ==========

ExtractionResult FunctionExtractor::extract(const std::string& source) const {
    ExtractionResult result;
    PythonParser parser(source);
    result.module = parser.parseModule();

    bool sawDefinition = false;
    collect(*result.module, "", "", source, result.functions, sawDefinition);

    // Script sin funciones ni clases: se analiza el módulo como "<main>"
    if (!sawDefinition) {
        FunctionUnit unit;
        unit.name = "<main>";
        unit.simpleName = "<main>";
        unit.body = result.module.get();
        unit.startLine = 1;
        unit.endLine = result.module->endLine;
        unit.sourceText = source;
        result.functions.push_back(unit);
    }
    return result;
}

void FunctionExtractor::collect(const SyntaxNode& node,
                                const std::string& scopePrefix,
                                const std::string& className,
                                const std::string& source,
                                std::vector<FunctionUnit>& out,
                                bool& sawDefinition) const {
    for (const auto& child : node.children) {
        if (child->kind == NodeKind::Function && child->children.size() >= 2) {
            sawDefinition = true;
            FunctionUnit unit;
            unit.name = scopePrefix + child->name;
            unit.simpleName = child->name;
            unit.className = className;
            unit.parameters = child->parameters;
            unit.body = child->children[1].get();
            unit.startLine = child->line;
            unit.endLine = child->endLine;
            if (child->endOffset > child->startOffset && child->endOffset <= source.size()) {
                unit.sourceText = source.substr(child->startOffset, child->endOffset - child->startOffset);
            }
            out.push_back(unit);

            // Las funciones anidadas se reportan después de la exterior
            collect(*child, unit.name + ".", "", source, out, sawDefinition);
        } else if (child->kind == NodeKind::Class && child->children.size() >= 2) {
            sawDefinition = true;
            collect(*child, scopePrefix + child->name + ".", child->name, source, out, sawDefinition);
        } else {
            collect(*child, scopePrefix, className, source, out, sawDefinition);
        }
    }
}
