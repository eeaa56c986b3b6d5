#include <gtest/gtest.h>
#include "steward/engines/ollama_engine.h"
#include "steward/error_types.h"
#include "test_fakes.h"
#include "test_http_server.h"

using namespace steward;
using steward::engines::OllamaEngine;
using steward::engines::OllamaEngineFactory;
using steward::testing::FakeProvider;
using steward::testing::TestProviderServer;

namespace {

// Answers load, chat and embed requests the way the provider does
void serve_inference(TestProviderServer& provider, const std::string& chat_content) {
    provider.server().Post("/api/generate", [&provider](const httplib::Request& req, httplib::Response& res) {
        provider.record(req.path, req.body);
        auto body = json::parse(req.body);
        if (body["model"] == "broken") {
            res.status = 500;
            res.set_content("{\"error\":\"model requires more system memory\"}", "application/json");
            return;
        }
        res.set_content("{\"model\":\"x\",\"response\":\"\",\"done\":true}", "application/json");
    });
    provider.server().Post("/api/chat", [&provider, chat_content](const httplib::Request& req, httplib::Response& res) {
        provider.record(req.path, req.body);
        json response = {{"message", {{"role", "assistant"}, {"content", chat_content}}}, {"done", true}};
        res.set_content(response.dump(), "application/json");
    });
    provider.server().Post("/api/embed", [&provider](const httplib::Request& req, httplib::Response& res) {
        provider.record(req.path, req.body);
        res.set_content("{\"embeddings\":[[0.25,0.5,0.75],[1.0,1.0,1.0]]}", "application/json");
    });
}

utils::ProviderConfig config_for(const TestProviderServer& provider) {
    utils::ProviderConfig config;
    config.api_url = provider.api_url();
    return config;
}

engines::KindResolver chat_only() {
    return [](const std::string&) { return ModelKind::Chat; };
}

} // namespace

TEST(OllamaEngineTest, ParseJsonContent) {
    EXPECT_EQ(OllamaEngine::parse_json_content("{\"a\":1}")["a"], 1);
    EXPECT_EQ(OllamaEngine::parse_json_content("Here you go:\n```json\n{\"a\": {\"b\": 2}}\n```")["a"]["b"], 2);
    EXPECT_THROW(OllamaEngine::parse_json_content("no json here"), ProviderException);
    EXPECT_THROW(OllamaEngine::parse_json_content("} backwards {"), ProviderException);
}

// Loading a chat model sends an empty generate that keeps the model resident
TEST(OllamaEngineTest, LoadChatModel) {
    TestProviderServer provider;
    serve_inference(provider, "{}");

    OllamaEngine engine(config_for(provider), chat_only());
    std::vector<std::string> progress;
    engine.load("llama3", [&progress](const std::string& text) { progress.push_back(text); });

    EXPECT_EQ(engine.model_id(), "llama3");
    auto requests = provider.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].first, "/api/generate");
    EXPECT_EQ(requests[0].second["model"], "llama3");
    EXPECT_EQ(requests[0].second["prompt"], "");
    EXPECT_EQ(requests[0].second["keep_alive"], -1);
    EXPECT_EQ(progress.back(), "llama3 ready");
}

// Reload releases the old model before loading the new one
TEST(OllamaEngineTest, ReloadUnloadsPrevious) {
    TestProviderServer provider;
    serve_inference(provider, "{}");

    OllamaEngine engine(config_for(provider), chat_only());
    engine.load("llama3", nullptr);
    engine.reload("phi3", nullptr);

    auto requests = provider.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[1].second["model"], "llama3");
    EXPECT_EQ(requests[1].second["keep_alive"], 0);
    EXPECT_EQ(requests[2].second["model"], "phi3");
    EXPECT_EQ(requests[2].second["keep_alive"], -1);
    EXPECT_EQ(engine.model_id(), "phi3");

    engine.unload();
    EXPECT_EQ(engine.model_id(), "");
    EXPECT_EQ(provider.requests().back().second["keep_alive"], 0);
}

// A provider refusal surfaces as ProviderException with its message
TEST(OllamaEngineTest, LoadFailure) {
    TestProviderServer provider;
    serve_inference(provider, "{}");

    OllamaEngine engine(config_for(provider), chat_only());
    try {
        engine.load("broken", nullptr);
        FAIL() << "expected ProviderException";
    } catch (const ProviderException& e) {
        EXPECT_NE(std::string(e.what()).find("more system memory"), std::string::npos);
    }
    EXPECT_EQ(engine.model_id(), "");
}

// Chat requests JSON output and recovers the object from chatty answers
TEST(OllamaEngineTest, ChatParsesJsonAnswer) {
    TestProviderServer provider;
    serve_inference(provider, "Sure! {\"answer\": 42} Hope that helps.");

    OllamaEngine engine(config_for(provider), chat_only());
    EXPECT_THROW(engine.chat({{"prompt", "hi"}}), EngineNotLoadedException);

    engine.load("llama3", nullptr);
    json answer = engine.chat({{"system", "Reply in JSON"}, {"prompt", "What is six times seven?"}});
    EXPECT_EQ(answer["answer"], 42);

    auto request = provider.requests().back();
    EXPECT_EQ(request.first, "/api/chat");
    EXPECT_EQ(request.second["format"], "json");
    EXPECT_EQ(request.second["stream"], false);
    ASSERT_EQ(request.second["messages"].size(), 2u);
    EXPECT_EQ(request.second["messages"][0]["role"], "system");
    EXPECT_EQ(request.second["messages"][1]["content"], "What is six times seven?");
}

// Embedding models load through the embed endpoint and return the first vector
TEST(OllamaEngineTest, EmbeddingModel) {
    TestProviderServer provider;
    serve_inference(provider, "{}");

    FakeProvider installed;
    ModelRegistry registry(&installed);
    OllamaEngineFactory factory(config_for(provider), &registry);

    auto engine = factory.create("nomic-embed-text", nullptr);
    auto requests = provider.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].first, "/api/embed");
    EXPECT_EQ(requests[0].second["model"], "nomic-embed-text");

    json vector = engine->embed({{"input", "hello"}});
    ASSERT_EQ(vector.size(), 3u);
    EXPECT_EQ(vector[0], 0.25);
    EXPECT_EQ(provider.requests().back().second["input"], "hello");

    engine->unload();
    EXPECT_EQ(provider.requests().back().first, "/api/embed");
    EXPECT_EQ(provider.requests().back().second["keep_alive"], 0);
}

// Models unknown to the registry are treated as chat models
TEST(OllamaEngineTest, FactoryDefaultsToChat) {
    TestProviderServer provider;
    serve_inference(provider, "{}");

    OllamaEngineFactory factory(config_for(provider));
    auto engine = factory.create("some-new-model", nullptr);

    EXPECT_EQ(engine->model_id(), "some-new-model");
    EXPECT_EQ(provider.requests()[0].first, "/api/generate");
}
