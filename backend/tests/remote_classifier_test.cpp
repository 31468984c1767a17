#include <gtest/gtest.h>
#include <string>
#include "openai_client.h"
#include "remote_classifier.h"

// ========================================================================
// Helpers
// ========================================================================

// Respuesta de chat completions con el contenido dado
static std::string chatReply(const std::string& content) {
    json reply = {
        {"id", "chatcmpl-test"},
        {"choices", json::array({
            {
                {"index", 0},
                {"message", {{"role", "assistant"}, {"content", content}}}
            }
        })}
    };
    return reply.dump();
}

static RemoteTransport replying(const std::string& body) {
    return [body](const std::string&, const std::string&) {
        TransportReply reply;
        reply.status = TransportStatus::Ok;
        reply.body = body;
        return reply;
    };
}

static RemoteTransport failing(TransportStatus status, const std::string& error) {
    return [status, error](const std::string&, const std::string&) {
        TransportReply reply;
        reply.status = status;
        reply.error = error;
        return reply;
    };
}

class RemoteClassifierTest : public ::testing::Test {
protected:
    FunctionUnit unit;
    SignalProfile signals;

    void SetUp() override {
        unit.name = "foo";
        unit.simpleName = "foo";
        unit.sourceText = "def foo(n):\n    for i in range(n):\n        print(i)";
        signals.maxLoopDepth = 1;
        signals.recursiveCallCount = 0;
    }
};

// ========================================================================
// Respuestas válidas
// ========================================================================

TEST_F(RemoteClassifierTest, AcceptsPlainJsonContent) {
    RemoteClassifier classifier(replying(chatReply(
        "{\"time_complexity\": \"O(n)\", \"space_complexity\": \"O(1)\"}")));
    ClassifyResult result = classifier.classify(unit, signals);

    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.verdict.timeClass, ComplexityClass::Linear);
    EXPECT_EQ(result.verdict.spaceClass, ComplexityClass::Constant);
    EXPECT_EQ(result.verdict.source, VerdictSource::Remote);
    EXPECT_EQ(result.verdict.loopCount, 1);
    EXPECT_EQ(result.verdict.recursionCount, 0);
}

TEST_F(RemoteClassifierTest, StripsMarkdownFencesAndNormalizesLabels) {
    RemoteClassifier classifier(replying(chatReply(
        "```json\n{\"time_complexity\": \"O(N\xC2\xB2)\", \"space_complexity\": \"O(n)\"}\n```")));
    ClassifyResult result = classifier.classify(unit, signals);

    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.verdict.timeClass, ComplexityClass::Quadratic);
    EXPECT_EQ(result.verdict.spaceClass, ComplexityClass::Linear);
}

TEST_F(RemoteClassifierTest, MissingSpaceDefaultsToConstant) {
    ClassifyResult result = RemoteClassifier::parseReply(
        chatReply("{\"time_complexity\": \"O(log n)\"}"), signals);
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.verdict.timeClass, ComplexityClass::Logarithmic);
    EXPECT_EQ(result.verdict.spaceClass, ComplexityClass::Constant);
}

TEST_F(RemoteClassifierTest, StripCodeFences) {
    EXPECT_EQ(RemoteClassifier::stripCodeFences("```json\n{\"a\": 1}\n```"), "{\"a\": 1}");
    EXPECT_EQ(RemoteClassifier::stripCodeFences("```\n{}\n```\n"), "{}");
    EXPECT_EQ(RemoteClassifier::stripCodeFences("  {\"a\": 1}  "), "{\"a\": 1}");
}

// ========================================================================
// Fallos tipados
// ========================================================================

TEST_F(RemoteClassifierTest, LabelOutsideClosedSetIsMalformed) {
    RemoteClassifier classifier(replying(chatReply(
        "{\"time_complexity\": \"O(n^4)\", \"space_complexity\": \"O(1)\"}")));
    ClassifyResult result = classifier.classify(unit, signals);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, ClassifyFailure::RemoteMalformed);
}

TEST_F(RemoteClassifierTest, SpaceAboveQuadraticIsMalformed) {
    ClassifyResult result = RemoteClassifier::parseReply(
        chatReply("{\"time_complexity\": \"O(2^n)\", \"space_complexity\": \"O(2^n)\"}"), signals);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, ClassifyFailure::RemoteMalformed);
}

TEST_F(RemoteClassifierTest, ProseInsteadOfJsonIsMalformed) {
    ClassifyResult result = RemoteClassifier::parseReply(
        chatReply("La complejidad es O(n) porque recorre la lista una vez."), signals);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, ClassifyFailure::RemoteMalformed);
}

TEST_F(RemoteClassifierTest, BrokenEnvelopeIsMalformed) {
    const std::string bodies[] = {
        "<html>502 Bad Gateway</html>",
        "{\"choices\": []}",
        "{\"choices\": [{\"message\": {\"content\": 42}}]}",
        "[]"
    };
    for (const std::string& body : bodies) {
        ClassifyResult result = RemoteClassifier::parseReply(body, signals);
        EXPECT_FALSE(result.ok) << body;
        EXPECT_EQ(result.failure, ClassifyFailure::RemoteMalformed) << body;
    }
}

TEST_F(RemoteClassifierTest, ApiErrorIsUnavailable) {
    ClassifyResult result = RemoteClassifier::parseReply(
        "{\"error\": {\"message\": \"Incorrect API key provided\", \"type\": \"invalid_request_error\"}}", signals);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, ClassifyFailure::RemoteUnavailable);
    EXPECT_EQ(result.message, "Incorrect API key provided");
}

TEST_F(RemoteClassifierTest, TransportFailuresMapToTypedResults) {
    RemoteClassifier slow(failing(TransportStatus::Timeout, "Timeout"));
    ClassifyResult timeout = slow.classify(unit, signals);
    EXPECT_FALSE(timeout.ok);
    EXPECT_EQ(timeout.failure, ClassifyFailure::RemoteTimeout);

    RemoteClassifier offline(failing(TransportStatus::Unavailable, "Could not resolve host"));
    ClassifyResult unavailable = offline.classify(unit, signals);
    EXPECT_FALSE(unavailable.ok);
    EXPECT_EQ(unavailable.failure, ClassifyFailure::RemoteUnavailable);
    EXPECT_EQ(unavailable.message, "Could not resolve host");
}

TEST_F(RemoteClassifierTest, NoTransportMeansUnavailable) {
    RemoteClassifier classifier{RemoteTransport()};
    ClassifyResult result = classifier.classify(unit, signals);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, ClassifyFailure::RemoteUnavailable);
}

// ========================================================================
// Prompt
// ========================================================================

TEST_F(RemoteClassifierTest, PromptCarriesFunctionAndLabelSet) {
    std::string captured;
    RemoteClassifier classifier([&captured](const std::string&, const std::string& prompt) {
        captured = prompt;
        TransportReply reply;
        reply.status = TransportStatus::Timeout;
        return reply;
    });
    classifier.classify(unit, signals);

    EXPECT_NE(captured.find("def foo(n):"), std::string::npos);
    EXPECT_NE(captured.find("(foo)"), std::string::npos);
    EXPECT_NE(captured.find("time_complexity"), std::string::npos);
    EXPECT_NE(captured.find("O(n log n)"), std::string::npos);
}

TEST_F(RemoteClassifierTest, LongSourceIsTruncatedOnCharacterBoundary) {
    unit.sourceText = "def foo():\n    s = '" + std::string(1490, 'a') + "\xC3\xB1\xC3\xB1\xC3\xB1'";
    std::string prompt = RemoteClassifier::buildPrompt(unit);

    EXPECT_NE(prompt.find("(código truncado)"), std::string::npos);
    EXPECT_EQ(prompt.find(std::string(1490, 'a') + "\xC3\xB1\xC3\xB1\xC3\xB1"), std::string::npos);

    // El prompt debe seguir siendo UTF-8 válido para serializarse
    json body = {{"content", prompt}};
    EXPECT_NO_THROW(body.dump());
}

// ========================================================================
// Cliente HTTP
// ========================================================================

TEST(OpenAIClientTest, CurlExitCodes) {
    EXPECT_EQ(OpenAIClient::statusForExitCode(0), TransportStatus::Ok);
    EXPECT_EQ(OpenAIClient::statusForExitCode(28), TransportStatus::Timeout);
    EXPECT_EQ(OpenAIClient::statusForExitCode(6), TransportStatus::Unavailable);
    EXPECT_EQ(OpenAIClient::statusForExitCode(7), TransportStatus::Unavailable);
    EXPECT_EQ(OpenAIClient::statusForExitCode(-1), TransportStatus::Unavailable);
}

TEST(OpenAIClientTest, MissingOrPlaceholderKeyIsNotConfigured) {
    OpenAIClient empty("", "gpt-3.5-turbo", "https://api.openai.com/v1/chat/completions", 5);
    EXPECT_FALSE(empty.isConfigured());

    OpenAIClient placeholder("sk-xxxxxxxxxxxxxxxx", "gpt-3.5-turbo", "https://api.openai.com/v1/chat/completions", 5);
    EXPECT_FALSE(placeholder.isConfigured());

    OpenAIClient real("sk-test-1234567890abcdef", "gpt-4o-mini", "https://api.openai.com/v1/chat/completions", 5);
    EXPECT_TRUE(real.isConfigured());
    EXPECT_EQ(real.getModel(), "gpt-4o-mini");
}

TEST(OpenAIClientTest, UnconfiguredClientDoesNotCallOut) {
    OpenAIClient client("", "gpt-3.5-turbo", "https://api.openai.com/v1/chat/completions", 5);
    TransportReply reply = client.chatCompletion("system", "user");
    EXPECT_EQ(reply.status, TransportStatus::Unavailable);
    EXPECT_FALSE(reply.error.empty());

    RemoteClassifier classifier(client);
    FunctionUnit unit;
    unit.name = "f";
    ClassifyResult result = classifier.classify(unit, SignalProfile());
    EXPECT_EQ(result.failure, ClassifyFailure::RemoteUnavailable);
}
