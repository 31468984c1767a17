#include "analyzer_cli.h"
#include <iostream>
#include <sstream>

std::string readAll(std::istream& in) {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

int runAnalysis(const std::string& source, ComplexityEstimator& estimator, std::ostream& out, std::ostream& err) {
    EstimationReport report = estimator.estimate(source);

    // Se serializa completo antes de escribir, para no dejar JSON a medias en stdout
    std::string text;
    try {
        text = report.ok ? report.toJson().dump() : report.errorJson().dump();
    } catch (const json::type_error& e) {
        err << "SerializationError: " << e.what() << std::endl;
        return EXIT_SERIALIZATION_ERROR;
    }

    out << text << std::endl;
    return report.ok ? EXIT_ANALYSIS_OK : EXIT_PARSE_ERROR;
}
