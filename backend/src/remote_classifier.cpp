#include "remote_classifier.h"
#include <utility>

namespace {

const size_t MAX_PROMPT_SOURCE = 1500;

// Corta sin partir una secuencia UTF-8 de varios bytes
std::string truncateUtf8(const std::string& text, size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace

RemoteClassifier::RemoteClassifier(RemoteTransport transport)
    : transport(std::move(transport)) {
}

RemoteClassifier::RemoteClassifier(OpenAIClient& client) {
    if (client.isConfigured()) {
        transport = [&client](const std::string& systemPrompt, const std::string& userPrompt) {
            return client.chatCompletion(systemPrompt, userPrompt);
        };
    }
}

std::string RemoteClassifier::systemPrompt() {
    return "Eres un experto en análisis de algoritmos y complejidad computacional. "
           "Respondes únicamente con un objeto JSON, sin texto adicional.";
}

std::string RemoteClassifier::buildPrompt(const FunctionUnit& unit) {
    std::string code = truncateUtf8(unit.sourceText, MAX_PROMPT_SOURCE);
    if (code.size() < unit.sourceText.size()) {
        code += "\n# ... (código truncado)";
    }

    return "Analiza la complejidad asintótica de esta función Python (" + unit.name + "):\n\n"
           "```python\n" + code + "\n```\n\n"
           "Responde SOLO con JSON de la forma "
           "{\"time_complexity\": \"...\", \"space_complexity\": \"...\"}.\n"
           "Usa exactamente una de estas etiquetas: O(1), O(log n), O(sqrt n), O(n), O(n log n), "
           "O(n^2), O(n^3), O(2^n), O(n!), unknown. "
           "Para space_complexity no uses nada mayor que O(n^2).";
}

std::string RemoteClassifier::stripCodeFences(const std::string& content) {
    std::string text = trim(content);
    if (text.compare(0, 3, "```") != 0) {
        return text;
    }
    // Saltar la línea de apertura (``` o ```json)
    size_t firstNewline = text.find('\n');
    if (firstNewline == std::string::npos) {
        return "";
    }
    text = text.substr(firstNewline + 1);
    size_t closing = text.rfind("```");
    if (closing != std::string::npos) {
        text = text.substr(0, closing);
    }
    return trim(text);
}

ClassifyResult RemoteClassifier::parseReply(const std::string& body, const SignalProfile& signals) {
    // PASO 1: Parsear la envoltura de la API
    json response = json::parse(body, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return ClassifyResult::fail(ClassifyFailure::RemoteMalformed, "respuesta no es JSON");
    }

    // PASO 2: Error reportado por la API (credencial inválida, cuota, rate limit)
    if (response.contains("error")) {
        std::string errorMsg = "error de la API";
        const json& error = response["error"];
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            errorMsg = error["message"].get<std::string>();
        } else if (error.is_string()) {
            errorMsg = error.get<std::string>();
        }
        return ClassifyResult::fail(ClassifyFailure::RemoteUnavailable, errorMsg);
    }

    // PASO 3: Extraer choices[0].message.content
    if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
        return ClassifyResult::fail(ClassifyFailure::RemoteMalformed, "respuesta sin choices");
    }
    const json& choice = response["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object() ||
        !choice["message"].contains("content") || !choice["message"]["content"].is_string()) {
        return ClassifyResult::fail(ClassifyFailure::RemoteMalformed, "respuesta sin contenido");
    }
    std::string content = stripCodeFences(choice["message"]["content"].get<std::string>());

    // PASO 4: El contenido debe ser el objeto JSON pedido
    json verdictJson = json::parse(content, nullptr, false);
    if (verdictJson.is_discarded() || !verdictJson.is_object()) {
        return ClassifyResult::fail(ClassifyFailure::RemoteMalformed, "contenido no es un objeto JSON: " + content.substr(0, 80));
    }
    if (!verdictJson.contains("time_complexity") || !verdictJson["time_complexity"].is_string()) {
        return ClassifyResult::fail(ClassifyFailure::RemoteMalformed, "falta time_complexity");
    }

    // PASO 5: Validar etiquetas contra el conjunto cerrado
    ComplexityVerdict verdict;
    verdict.source = VerdictSource::Remote;
    verdict.loopCount = signals.maxLoopDepth;
    verdict.recursionCount = signals.recursiveCallCount;

    std::string timeLabel = verdictJson["time_complexity"].get<std::string>();
    if (!parseComplexityLabel(timeLabel, verdict.timeClass)) {
        return ClassifyResult::fail(ClassifyFailure::RemoteMalformed, "etiqueta de tiempo fuera del conjunto: " + timeLabel);
    }

    verdict.spaceClass = ComplexityClass::Constant;
    if (verdictJson.contains("space_complexity") && !verdictJson["space_complexity"].is_null()) {
        if (!verdictJson["space_complexity"].is_string()) {
            return ClassifyResult::fail(ClassifyFailure::RemoteMalformed, "space_complexity no es texto");
        }
        std::string spaceLabel = verdictJson["space_complexity"].get<std::string>();
        if (!parseComplexityLabel(spaceLabel, verdict.spaceClass) || !isValidSpaceClass(verdict.spaceClass)) {
            return ClassifyResult::fail(ClassifyFailure::RemoteMalformed, "etiqueta de espacio inválida: " + spaceLabel);
        }
    }

    return ClassifyResult::success(verdict);
}

ClassifyResult RemoteClassifier::classify(const FunctionUnit& unit, const SignalProfile& signals) {
    if (!transport) {
        return ClassifyResult::fail(ClassifyFailure::RemoteUnavailable, "OPENAI_API_KEY no configurado");
    }

    TransportReply reply = transport(systemPrompt(), buildPrompt(unit));

    switch (reply.status) {
        case TransportStatus::Timeout:
            return ClassifyResult::fail(ClassifyFailure::RemoteTimeout, reply.error);
        case TransportStatus::Unavailable:
            return ClassifyResult::fail(ClassifyFailure::RemoteUnavailable, reply.error);
        case TransportStatus::Ok:
            break;
    }

    return parseReply(reply.body, signals);
}
