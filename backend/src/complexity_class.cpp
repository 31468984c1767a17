#include "complexity_class.h"
#include <cctype>
#include <unordered_map>

namespace {

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

// Variantes aceptadas del contenido de O(...) ya normalizado (sin espacios, minúsculas)
const std::unordered_map<std::string, ComplexityClass>& innerForms() {
    static const std::unordered_map<std::string, ComplexityClass> forms = {
        {"1", ComplexityClass::Constant},
        {"logn", ComplexityClass::Logarithmic},
        {"log(n)", ComplexityClass::Logarithmic},
        {"lgn", ComplexityClass::Logarithmic},
        {"log2n", ComplexityClass::Logarithmic},
        {"log_2n", ComplexityClass::Logarithmic},
        {"log2(n)", ComplexityClass::Logarithmic},
        {"sqrtn", ComplexityClass::SquareRoot},
        {"sqrt(n)", ComplexityClass::SquareRoot},
        {"n^0.5", ComplexityClass::SquareRoot},
        {"n^(1/2)", ComplexityClass::SquareRoot},
        {"n^1/2", ComplexityClass::SquareRoot},
        {"n", ComplexityClass::Linear},
        {"n^1", ComplexityClass::Linear},
        {"nlogn", ComplexityClass::Linearithmic},
        {"nlog(n)", ComplexityClass::Linearithmic},
        {"nlgn", ComplexityClass::Linearithmic},
        {"nlog2n", ComplexityClass::Linearithmic},
        {"n^2", ComplexityClass::Quadratic},
        {"n^3", ComplexityClass::Cubic},
        {"2^n", ComplexityClass::Exponential},
        {"2^(n)", ComplexityClass::Exponential},
        {"n!", ComplexityClass::Factorial},
        {"(n)!", ComplexityClass::Factorial}
    };
    return forms;
}

} // namespace

std::string toLabel(ComplexityClass value) {
    switch (value) {
        case ComplexityClass::Constant:     return "O(1)";
        case ComplexityClass::Logarithmic:  return "O(log n)";
        case ComplexityClass::SquareRoot:   return "O(sqrt n)";
        case ComplexityClass::Linear:       return "O(n)";
        case ComplexityClass::Linearithmic: return "O(n log n)";
        case ComplexityClass::Quadratic:    return "O(n^2)";
        case ComplexityClass::Cubic:        return "O(n^3)";
        case ComplexityClass::Exponential:  return "O(2^n)";
        case ComplexityClass::Factorial:    return "O(n!)";
        case ComplexityClass::Unknown:      break;
    }
    return "unknown";
}

std::string toLabel(VerdictSource source) {
    return source == VerdictSource::Remote ? "remote" : "heuristic";
}

// Convierte una etiqueta libre (ej: respuesta del LLM) a la clase cerrada.
// Retorna false si el texto no corresponde a ninguna clase conocida.
bool parseComplexityLabel(const std::string& text, ComplexityClass& out) {
    std::string normalized = text;

    // PASO 1: Unicode habitual en respuestas de modelos
    replaceAll(normalized, "\xC2\xB2", "^2");          // ²
    replaceAll(normalized, "\xC2\xB3", "^3");          // ³
    replaceAll(normalized, "\xE2\x88\x9A", "sqrt");    // √
    replaceAll(normalized, "\xC2\xB7", "*");           // ·
    replaceAll(normalized, "\xE2\x8B\x85", "*");       // ⋅
    replaceAll(normalized, "\xE2\x88\x97", "*");       // ∗

    // PASO 2: Quitar espacios, pasar a minúsculas
    std::string compact;
    compact.reserve(normalized.size());
    for (char c : normalized) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    // Puntuación final típica: "O(n)." o "`O(n)`"
    while (!compact.empty() && (compact.back() == '.' || compact.back() == '`' || compact.back() == '"')) {
        compact.pop_back();
    }
    while (!compact.empty() && (compact.front() == '`' || compact.front() == '"')) {
        compact.erase(0, 1);
    }

    if (compact == "unknown") {
        out = ComplexityClass::Unknown;
        return true;
    }

    // PASO 3: Debe tener la forma o(...)
    if (compact.size() < 4 || compact[0] != 'o' || compact[1] != '(' || compact.back() != ')') {
        return false;
    }
    std::string inner = compact.substr(2, compact.size() - 3);
    replaceAll(inner, "**", "^");
    replaceAll(inner, "*", "");

    const auto& forms = innerForms();
    auto it = forms.find(inner);
    if (it == forms.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool isValidSpaceClass(ComplexityClass value) {
    return value == ComplexityClass::Unknown ||
           growthRank(value) <= growthRank(ComplexityClass::Quadratic);
}

ComplexityClass polynomialClass(int degree) {
    switch (degree) {
        case 0: return ComplexityClass::Constant;
        case 1: return ComplexityClass::Linear;
        case 2: return ComplexityClass::Quadratic;
        case 3: return ComplexityClass::Cubic;
        default: return ComplexityClass::Unknown;
    }
}

int growthRank(ComplexityClass value) {
    if (value == ComplexityClass::Unknown) {
        return -1;
    }
    return static_cast<int>(value);
}
