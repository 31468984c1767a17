#include "env_config.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

// Entero dentro de [minValue, maxValue]; fuera de rango o mal formado usa el default
int parseBoundedInt(const std::string& key, const std::string& text, int fallback, int minValue, int maxValue) {
    if (text.empty()) {
        return fallback;
    }
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used == text.size() && value >= minValue && value <= maxValue) {
            return value;
        }
    } catch (const std::exception&) {
        // stoi rechaza el texto; cae al aviso de abajo
    }
    std::cerr << "Advertencia: " << key << "=" << text << " inválido, usando " << fallback << std::endl;
    return fallback;
}

} // namespace

std::vector<std::string> EnvConfig::defaultEnvPaths() {
    // Buscar .env en múltiples ubicaciones posibles
    return {
        ".env",                 // Directorio actual
        "../.env",              // Un nivel arriba
        "../../.env",           // Dos niveles arriba
        "../../backend/.env"    // En backend/
    };
}

std::string EnvConfig::readEnvFile(const std::string& path, const std::string& key) {
    std::ifstream envFile(path);
    if (!envFile.is_open()) {
        return "";
    }

    std::string line;
    while (std::getline(envFile, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos || trim(line.substr(0, pos)) != key) {
            continue;
        }

        std::string value = trim(line.substr(pos + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        return value;
    }
    return "";
}

std::string EnvConfig::loadEnvVariable(const std::string& key, const std::vector<std::string>& envPaths) {
    const char* fromEnvironment = std::getenv(key.c_str());
    if (fromEnvironment && *fromEnvironment) {
        return fromEnvironment;
    }

    // Solo el primer .env que se pueda abrir
    for (const auto& path : envPaths) {
        std::ifstream probe(path);
        if (probe.is_open()) {
            return readEnvFile(path, key);
        }
    }
    return "";
}

EnvConfig EnvConfig::load() {
    return load(defaultEnvPaths());
}

EnvConfig EnvConfig::load(const std::vector<std::string>& envPaths) {
    EnvConfig config;

    config.apiKey = loadEnvVariable("OPENAI_API_KEY", envPaths);

    std::string model = loadEnvVariable("OPENAI_MODEL", envPaths);
    if (!model.empty()) {
        config.model = model;
    }

    std::string endpoint = loadEnvVariable("OPENAI_BASE_URL", envPaths);
    if (!endpoint.empty()) {
        config.endpoint = endpoint;
    }

    config.remoteTimeoutSeconds = parseBoundedInt("BIGO_REMOTE_TIMEOUT",
                                                  loadEnvVariable("BIGO_REMOTE_TIMEOUT", envPaths),
                                                  config.remoteTimeoutSeconds, 1, 60);
    config.port = parseBoundedInt("BIGO_PORT", loadEnvVariable("BIGO_PORT", envPaths), config.port, 1, 65535);

    std::string verbose = loadEnvVariable("BIGO_VERBOSE", envPaths);
    config.verbose = verbose == "1" || verbose == "true";

    return config;
}

bool EnvConfig::parsePort(const std::string& text, int& port) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used == text.size() && value >= 1 && value <= 65535) {
            port = value;
            return true;
        }
    } catch (const std::exception&) {
        // Texto no numérico o fuera del rango de int
    }
    return false;
}

bool EnvConfig::hasRemote() const {
    return !apiKey.empty() && apiKey.find("xxxxx") == std::string::npos;
}
