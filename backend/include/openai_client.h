#ifndef OPENAI_CLIENT_H
#define OPENAI_CLIENT_H

#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Resultado del transporte HTTP (sin interpretar el contenido)
enum class TransportStatus {
    Ok,
    Unavailable,    // curl no se pudo ejecutar, DNS, conexión rechazada, respuesta vacía
    Timeout         // Se superó --max-time
};

struct TransportReply {
    TransportStatus status = TransportStatus::Unavailable;
    std::string body;       // Cuerpo de la respuesta (solo si status == Ok)
    std::string error;      // Descripción del fallo
};

// Cliente mínimo de chat completions compatible con OpenAI
class OpenAIClient {
private:
    std::string apiKey;
    std::string model;
    std::string endpoint;
    int timeoutSeconds;

public:
    OpenAIClient(const std::string& key,
                 const std::string& model,
                 const std::string& endpoint,
                 int timeoutSeconds);

    bool isConfigured() const;          // Hay una API key que no es un placeholder
    const std::string& getModel() const;

    // Un solo round trip; nunca lanza excepciones
    TransportReply chatCompletion(const std::string& systemPrompt, const std::string& userPrompt);

    static TransportStatus statusForExitCode(int curlExitCode);  // 0 -> Ok, 28 -> Timeout, resto -> Unavailable

private:
    TransportReply makeRequest(const json& requestBody);
};

#endif
