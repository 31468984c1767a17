#ifndef REMOTE_CLASSIFIER_H
#define REMOTE_CLASSIFIER_H

#include <functional>
#include <string>
#include "complexity_classifier.h"
#include "openai_client.h"

// Transporte inyectable: recibe (system prompt, user prompt) y devuelve la respuesta cruda
using RemoteTransport = std::function<TransportReply(const std::string&, const std::string&)>;

// Clasificador que consulta un servicio de chat completions.
// Cada fallo se devuelve como ClassifyResult tipado; no reintenta.
class RemoteClassifier : public ComplexityClassifier {
private:
    RemoteTransport transport;

public:
    explicit RemoteClassifier(RemoteTransport transport);
    explicit RemoteClassifier(OpenAIClient& client);   // El cliente debe vivir más que el clasificador

    ClassifyResult classify(const FunctionUnit& unit, const SignalProfile& signals) override;

    static std::string systemPrompt();
    static std::string buildPrompt(const FunctionUnit& unit);
    // Interpreta el cuerpo de una respuesta de chat completions
    static ClassifyResult parseReply(const std::string& body, const SignalProfile& signals);
    // Quita ```json ... ``` alrededor del contenido
    static std::string stripCodeFences(const std::string& content);
};

#endif
