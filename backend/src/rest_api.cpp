#include "rest_api.h"
#include <httplib.h>
#include <iostream>
#include "complexity_estimator.h"
#include "openai_client.h"
#include "remote_classifier.h"

namespace {

ordered_json errorResponse(const std::string& kind, const std::string& message) {
    return {
        {"success", false},
        {"error", kind},
        {"message", message}
    };
}

void sendJson(httplib::Response& res, const std::string& body, int status) {
    res.status = status;
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_content(body, "application/json");
}

} // namespace

RestAPI::RestAPI(int port, const EnvConfig& config) : port(port), config(config) {
}

json RestAPI::health() const {
    return {
        {"status", "ok"},
        {"remote", config.hasRemote()},
        {"model", config.model}
    };
}

ordered_json RestAPI::analyze(const std::string& requestBody, int& status) {
    // PASO 1: Validar el request
    json body = json::parse(requestBody, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        status = 400;
        return errorResponse("BadRequest", "El body debe ser un objeto JSON");
    }
    if (!body.contains("code") || !body["code"].is_string()) {
        status = 400;
        return errorResponse("BadRequest", "Falta el campo 'code' (string)");
    }
    std::string code = body["code"].get<std::string>();
    if (code.empty()) {
        status = 400;
        return errorResponse("BadRequest", "El campo 'code' está vacío");
    }
    if (code.size() > MAX_CODE_BYTES) {
        status = 400;
        return errorResponse("BadRequest", "El código excede el máximo de " + std::to_string(MAX_CODE_BYTES) + " bytes");
    }

    // PASO 2: Analizar (todo el estado vive solo durante este request)
    OpenAIClient client(config.apiKey, config.model, config.endpoint, config.remoteTimeoutSeconds);
    RemoteClassifier remote(client);
    ComplexityEstimator estimator(config.hasRemote() ? &remote : nullptr, nullptr, config.verbose);
    EstimationReport report = estimator.estimate(code);

    // PASO 3: Armar respuesta
    if (!report.ok) {
        status = 400;
        ordered_json error = errorResponse(report.errorKind, report.errorMessage);
        error["line"] = report.errorLine;
        error["column"] = report.errorColumn;
        return error;
    }

    status = 200;
    return {
        {"success", true},
        {"functions", report.toJson()}
    };
}

void RestAPI::start() {
    httplib::Server svr;

    if (!config.hasRemote()) {
        std::cerr << "Advertencia: OPENAI_API_KEY no configurado, solo heurística" << std::endl;
    }

    // Endpoint: POST /api/analyze - Estimar complejidad de un archivo Python
    svr.Post("/api/analyze", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            int status = 200;
            ordered_json response = analyze(req.body, status);
            sendJson(res, response.dump(), status);
        } catch (const json::type_error& e) {
            std::cerr << "SerializationError: " << e.what() << std::endl;
            ordered_json error = errorResponse("SerializationError", e.what());
            sendJson(res, error.dump(-1, ' ', false, json::error_handler_t::replace), 500);
        } catch (const std::exception& e) {
            std::cerr << "Error en /api/analyze: " << e.what() << std::endl;
            sendJson(res, errorResponse("InternalError", e.what()).dump(-1, ' ', false, json::error_handler_t::replace), 500);
        }
    });

    // Endpoint: OPTIONS (para CORS preflight)
    svr.Options("/api/.*", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    // Health check
    svr.Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
        sendJson(res, health().dump(), 200);
    });

    // Manejo de errores global
    svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        json error = {
            {"error", "Error interno del servidor"},
            {"status", res.status}
        };
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_content(error.dump(), "application/json");
    });

    std::cout << "Big-O Tracker backend iniciando en puerto " << port << std::endl;
    std::cout << "http://localhost:" << port << std::endl;
    std::cout << "Health check: http://localhost:" << port << "/api/health" << std::endl;

    if (!svr.listen("localhost", port)) {
        throw std::runtime_error("No se pudo escuchar en el puerto " + std::to_string(port));
    }
}
