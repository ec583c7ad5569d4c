#include <gtest/gtest.h>
#include "ai/replicate_ai_client.hpp"

TEST(ReplicateAiClientTest, RequestBodyCarriesPromptsImagesAndSampling)
{
    PipelineSettings settings;
    settings.ai_max_completion_tokens = 1024;
    ReplicateAiClient client(settings);

    auto body = client.buildRequestBody("system", "user", {"https://x/1.jpg", "https://x/2.jpg"});
    const auto &input = body["input"];
    EXPECT_EQ(input["prompt"], "user");
    EXPECT_EQ(input["system_prompt"], "system");
    ASSERT_EQ(input["image_input"].size(), 2u);
    EXPECT_EQ(input["image_input"][1], "https://x/2.jpg");
    EXPECT_DOUBLE_EQ(input["temperature"].get<double>(), 1.0);
    EXPECT_DOUBLE_EQ(input["top_p"].get<double>(), 1.0);
    EXPECT_EQ(input["max_completion_tokens"], 1024);
}

TEST(ReplicateAiClientTest, StreamedOutputIsConcatenated)
{
    auto prediction = nlohmann::json::parse(R"({"status": "succeeded", "output": ["{\"cap", "tion\": ", "\"hi\"}"]})");
    auto text = ReplicateAiClient::extractOutputText(prediction);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "{\"caption\": \"hi\"}");

    EXPECT_EQ(*ReplicateAiClient::extractOutputText(nlohmann::json::parse(R"({"output": "plain"})")), "plain");
    EXPECT_FALSE(ReplicateAiClient::extractOutputText(nlohmann::json::parse(R"({"output": null})")).has_value());
}

TEST(ReplicateAiClientTest, SplitUrl)
{
    auto [base, path] = ReplicateAiClient::splitUrl("https://api.replicate.com/v1/predictions/abc");
    EXPECT_EQ(base, "https://api.replicate.com");
    EXPECT_EQ(path, "/v1/predictions/abc");

    auto [host_only, root] = ReplicateAiClient::splitUrl("http://localhost:8080");
    EXPECT_EQ(host_only, "http://localhost:8080");
    EXPECT_EQ(root, "/");
}

TEST(ReplicateAiClientTest, MissingTokenFailsWithoutNetwork)
{
    PipelineSettings settings;
    settings.ai_api_token.clear();
    ReplicateAiClient client(settings);
    auto response = client.analyze("s", "u", {"https://x/1.jpg"}, std::chrono::milliseconds(1000));
    EXPECT_FALSE(response.success);
    EXPECT_FALSE(response.timed_out);
    EXPECT_NE(response.error_message.find("API token"), std::string::npos);
}
