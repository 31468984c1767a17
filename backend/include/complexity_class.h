#ifndef COMPLEXITY_CLASS_H
#define COMPLEXITY_CLASS_H

#include <string>

// Clases de complejidad admitidas, ordenadas de menor a mayor crecimiento.
// Unknown queda fuera del orden y se reporta como "unknown".
enum class ComplexityClass {
    Constant,       // O(1)
    Logarithmic,    // O(log n)
    SquareRoot,     // O(sqrt n)
    Linear,         // O(n)
    Linearithmic,   // O(n log n)
    Quadratic,      // O(n^2)
    Cubic,          // O(n^3)
    Exponential,    // O(2^n)
    Factorial,      // O(n!)
    Unknown
};

// Origen del veredicto
enum class VerdictSource {
    Heuristic,
    Remote
};

std::string toLabel(ComplexityClass value);                           // Etiqueta canónica, ej: "O(n^2)"
std::string toLabel(VerdictSource source);                            // "heuristic" o "remote"
bool parseComplexityLabel(const std::string& text, ComplexityClass& out); // Normaliza texto externo al conjunto cerrado
bool isValidSpaceClass(ComplexityClass value);                        // Espacio: solo hasta O(n^2) o unknown
ComplexityClass polynomialClass(int degree);                          // 0 -> O(1), 1 -> O(n), ... 3 -> O(n^3), resto -> Unknown
int growthRank(ComplexityClass value);                                // Posición en el orden; Unknown = -1

#endif
