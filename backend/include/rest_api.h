#ifndef REST_API_H
#define REST_API_H

#include <string>
#include <nlohmann/json.hpp>
#include "env_config.h"

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

// Tamaño máximo aceptado para el campo "code"
const size_t MAX_CODE_BYTES = 200 * 1024;

// Servidor REST API del backend
class RestAPI {
private:
    int port;               // Puerto del servidor (default: 8080)
    EnvConfig config;       // API key, modelo, timeout

public:
    RestAPI(int port, const EnvConfig& config); // Constructor del REST API
    void start(); // Inicia el servidor REST API (bloquea)

    // Lógica de los endpoints, separada del transporte HTTP
    ordered_json analyze(const std::string& requestBody, int& status);
    json health() const;
};

#endif
