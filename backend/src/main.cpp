#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include "analyzer_cli.h"
#include "env_config.h"
#include "openai_client.h"
#include "remote_classifier.h"
#include "rest_api.h"

namespace {

std::atomic<bool> cancelRequested{false};

void onSignal(int) {
    cancelRequested.store(true);
}

void printUsage() {
    std::cout << "Uso: bigo_tracker                 lee código Python de stdin y escribe JSON en stdout\n"
                 "     bigo_tracker --serve [port]  inicia el backend REST (/api/analyze, /api/health)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        EnvConfig config = EnvConfig::load();

        if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0)) {
            printUsage();
            return 0;
        }

        // Modo servidor
        if (argc > 1 && std::strcmp(argv[1], "--serve") == 0) {
            int port = config.port;
            if (argc > 2 && !EnvConfig::parsePort(argv[2], port)) {
                std::cerr << "Puerto inválido: " << argv[2] << " (se espera 1..65535)" << std::endl;
                return 64;
            }
            RestAPI api(port, config);
            api.start();
            return 0;
        }

        if (argc > 1) {
            std::cerr << "Argumento desconocido: " << argv[1] << std::endl;
            printUsage();
            return 64;
        }

        // Modo CLI: una interrupción hace que las funciones restantes usen solo la heurística
        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        std::string source = readAll(std::cin);

        OpenAIClient client(config.apiKey, config.model, config.endpoint, config.remoteTimeoutSeconds);
        RemoteClassifier remote(client);
        ComplexityEstimator estimator(config.hasRemote() ? &remote : nullptr, &cancelRequested, config.verbose);

        return runAnalysis(source, estimator, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
