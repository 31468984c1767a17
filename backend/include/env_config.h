#ifndef ENV_CONFIG_H
#define ENV_CONFIG_H

#include <string>
#include <vector>

// Configuración del proceso: variables de entorno y, si faltan, archivo .env
struct EnvConfig {
    std::string apiKey;                                                  // OPENAI_API_KEY
    std::string model = "gpt-3.5-turbo";                                 // OPENAI_MODEL
    std::string endpoint = "https://api.openai.com/v1/chat/completions"; // OPENAI_BASE_URL
    int remoteTimeoutSeconds = 5;                                        // BIGO_REMOTE_TIMEOUT (1..60)
    bool verbose = false;                                                // BIGO_VERBOSE
    int port = 8080;                                                     // BIGO_PORT

    static EnvConfig load();
    static EnvConfig load(const std::vector<std::string>& envPaths);

    // Busca la clave en el entorno y luego en el primer .env que exista
    static std::string loadEnvVariable(const std::string& key, const std::vector<std::string>& envPaths);
    // Valor de la clave en un archivo .env concreto ("" si no está)
    static std::string readEnvFile(const std::string& path, const std::string& key);
    static std::vector<std::string> defaultEnvPaths();
    // Puerto TCP en texto (1..65535); false si no es un número válido
    static bool parsePort(const std::string& text, int& port);

    bool hasRemote() const;
};

#endif
