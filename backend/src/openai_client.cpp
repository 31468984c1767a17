#include "openai_client.h"
#include <atomic>
#include <cstdio>
#include <fstream>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Contador para que requests concurrentes (modo --serve) no compartan archivo temporal
std::atomic<unsigned long> requestCounter{0};

// Envuelve un argumento en comillas simples para el shell
std::string quoteShellArg(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace

OpenAIClient::OpenAIClient(const std::string& key,
                           const std::string& model,
                           const std::string& endpoint,
                           int timeoutSeconds)
    : apiKey(key), model(model), endpoint(endpoint), timeoutSeconds(timeoutSeconds) {
}

bool OpenAIClient::isConfigured() const {
    if (apiKey.empty() || endpoint.empty()) {
        return false;
    }
    // Placeholder copiado de .env.example
    return apiKey.find("xxxxx") == std::string::npos;
}

const std::string& OpenAIClient::getModel() const {
    return model;
}

TransportStatus OpenAIClient::statusForExitCode(int curlExitCode) {
    if (curlExitCode == 0) {
        return TransportStatus::Ok;
    }
    if (curlExitCode == 28) {
        return TransportStatus::Timeout;
    }
    return TransportStatus::Unavailable;
}

// Hace request HTTP al endpoint de chat completions
TransportReply OpenAIClient::makeRequest(const json& requestBody) {
    TransportReply reply;

    // PASO 1: Crear archivo temporal con el request
    std::string requestFile = "/tmp/bigo_request_" + std::to_string(getpid()) + "_" +
                              std::to_string(requestCounter.fetch_add(1)) + ".json";
    std::ofstream file(requestFile);
    if (!file.is_open()) {
        reply.error = "No se pudo crear el archivo temporal " + requestFile;
        return reply;
    }
    // UTF-8 inválido en el código se reemplaza en vez de lanzar type_error
    file << requestBody.dump(-1, ' ', false, json::error_handler_t::replace);
    file.close();

    // PASO 2: Construir comando curl (el timeout acota toda la operación)
    std::string seconds = std::to_string(timeoutSeconds);
    std::string curlCmd = "curl --max-time " + seconds + " --connect-timeout " + seconds + " -s -S " +
        quoteShellArg(endpoint) + " "
        "-H 'Content-Type: application/json' "
        "-H " + quoteShellArg("Authorization: Bearer " + apiKey) + " "
        "-d @" + quoteShellArg(requestFile) + " 2>&1";

    // PASO 3: Ejecutar curl
    FILE* pipe = popen(curlCmd.c_str(), "r");
    if (!pipe) {
        std::remove(requestFile.c_str());
        reply.error = "No se pudo ejecutar curl. Verifica que curl esté instalado.";
        return reply;
    }

    // PASO 4: Capturar output
    std::string output;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }
    int status = pclose(pipe);

    // PASO 5: Limpiar archivo temporal
    std::remove(requestFile.c_str());

    // PASO 6: Analizar resultado
    int exitCode = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    reply.status = statusForExitCode(exitCode);

    if (reply.status == TransportStatus::Timeout) {
        reply.error = "Timeout: el servicio no respondió en " + seconds + "s";
        return reply;
    }
    if (reply.status == TransportStatus::Unavailable) {
        if (output.find("Could not resolve host") != std::string::npos) {
            reply.error = "No se pudo resolver el servidor del servicio remoto";
        } else if (output.find("Connection refused") != std::string::npos) {
            reply.error = "Conexión rechazada por el servicio remoto";
        } else {
            reply.error = "Error de conexión (curl " + std::to_string(exitCode) + "): " + output.substr(0, 100);
        }
        return reply;
    }

    // Validar response no vacío
    if (output.empty()) {
        reply.status = TransportStatus::Unavailable;
        reply.error = "Respuesta vacía del servicio remoto";
        return reply;
    }

    reply.body = output;
    return reply;
}

TransportReply OpenAIClient::chatCompletion(const std::string& systemPrompt, const std::string& userPrompt) {
    if (!isConfigured()) {
        TransportReply reply;
        reply.status = TransportStatus::Unavailable;
        reply.error = "OPENAI_API_KEY no configurado";
        return reply;
    }

    json requestBody = {
        {"model", model},
        {"messages", json::array({
            {
                {"role", "system"},
                {"content", systemPrompt}
            },
            {
                {"role", "user"},
                {"content", userPrompt}
            }
        })},
        {"temperature", 0},   // Respuesta lo más determinista posible
        {"max_tokens", 60}    // Solo un objeto JSON corto
    };

    return makeRequest(requestBody);
}
