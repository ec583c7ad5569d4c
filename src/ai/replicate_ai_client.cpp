#include "ai/replicate_ai_client.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <thread>
#include <httplib.h>

namespace
{
    constexpr int MAX_PREFER_WAIT_SECONDS = 60;
    constexpr std::chrono::milliseconds POLL_INTERVAL{1000};

    bool isTerminal(const std::string &status)
    {
        return status == "succeeded" || status == "failed" || status == "canceled";
    }

    AiResponse failure(const std::string &message, bool timed_out = false)
    {
        AiResponse response;
        response.error_message = message;
        response.timed_out = timed_out;
        return response;
    }

    void applyTimeouts(httplib::Client &client, std::chrono::milliseconds remaining)
    {
        auto seconds = std::max<long long>(1, std::chrono::duration_cast<std::chrono::seconds>(remaining).count());
        client.set_connection_timeout(static_cast<time_t>(std::min<long long>(seconds, 30)), 0);
        client.set_read_timeout(static_cast<time_t>(seconds), 0);
        client.set_write_timeout(static_cast<time_t>(seconds), 0);
    }
}

ReplicateAiClient::ReplicateAiClient(const PipelineSettings &settings)
    : settings_(settings)
{
}

std::pair<std::string, std::string> ReplicateAiClient::splitUrl(const std::string &url)
{
    auto scheme_end = url.find("://");
    size_t host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto path_start = url.find('/', host_start);
    if (path_start == std::string::npos)
        return {url, "/"};
    return {url.substr(0, path_start), url.substr(path_start)};
}

nlohmann::json ReplicateAiClient::buildRequestBody(const std::string &system_prompt, const std::string &user_prompt,
                                                   const std::vector<std::string> &sample_refs) const
{
    nlohmann::json input = {
        {"prompt", user_prompt},
        {"system_prompt", system_prompt},
        {"image_input", sample_refs},
        {"temperature", settings_.ai_temperature},
        {"top_p", settings_.ai_top_p},
        {"max_completion_tokens", settings_.ai_max_completion_tokens}};
    return nlohmann::json{{"input", input}};
}

std::optional<std::string> ReplicateAiClient::extractOutputText(const nlohmann::json &prediction)
{
    if (!prediction.is_object() || !prediction.contains("output"))
        return std::nullopt;
    const auto &output = prediction["output"];
    if (output.is_string())
        return output.get<std::string>();
    if (output.is_array())
    {
        std::string joined;
        for (const auto &part : output)
        {
            if (part.is_string())
                joined += part.get<std::string>();
        }
        return joined;
    }
    return std::nullopt;
}

AiResponse ReplicateAiClient::interpret(const nlohmann::json &prediction) const
{
    std::string status = prediction.value("status", "");
    if (status == "succeeded")
    {
        auto text = extractOutputText(prediction);
        if (!text)
            return failure("prediction succeeded without text output");
        AiResponse response;
        response.success = true;
        response.text = *text;
        return response;
    }
    std::string detail;
    if (prediction.contains("error") && !prediction["error"].is_null())
    {
        detail = prediction["error"].is_string() ? prediction["error"].get<std::string>() : prediction["error"].dump();
    }
    return failure("prediction " + status + (detail.empty() ? "" : ": " + detail));
}

AiResponse ReplicateAiClient::analyze(const std::string &system_prompt, const std::string &user_prompt,
                                      const std::vector<std::string> &sample_refs, std::chrono::milliseconds timeout)
{
    if (settings_.ai_api_token.empty())
    {
        return failure("no API token configured (ai.api_token or REPLICATE_API_TOKEN)");
    }
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + timeout;
    auto remaining = [&deadline]()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    };

    auto [base, prefix] = splitUrl(settings_.ai_endpoint);
    if (!prefix.empty() && prefix.back() == '/')
        prefix.pop_back();
    httplib::Client client(base);
    applyTimeouts(client, timeout);

    auto wait_seconds = std::min<long long>(MAX_PREFER_WAIT_SECONDS,
                                            std::max<long long>(1, std::chrono::duration_cast<std::chrono::seconds>(timeout).count()));
    httplib::Headers headers = {
        {"Authorization", "Bearer " + settings_.ai_api_token},
        {"Prefer", "wait=" + std::to_string(wait_seconds)}};

    std::string body = buildRequestBody(system_prompt, user_prompt, sample_refs).dump();
    std::string path = prefix + "/v1/models/" + settings_.ai_model + "/predictions";
    Logger::debug("POST " + base + path + " with " + std::to_string(sample_refs.size()) + " image(s)");

    auto res = client.Post(path, headers, body, "application/json");
    if (!res)
    {
        bool timed_out = remaining().count() <= 0 || res.error() == httplib::Error::Read;
        return failure("request to " + base + " failed: " + httplib::to_string(res.error()), timed_out);
    }
    if (res->status < 200 || res->status >= 300)
    {
        return failure("HTTP " + std::to_string(res->status) + " from predictions endpoint: " + res->body);
    }

    nlohmann::json prediction;
    try
    {
        prediction = nlohmann::json::parse(res->body);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        return failure("unreadable prediction response: " + std::string(e.what()));
    }

    while (!isTerminal(prediction.value("status", "")))
    {
        if (remaining() <= std::chrono::milliseconds(0))
        {
            return failure("prediction did not finish within " + std::to_string(timeout.count()) + " ms", true);
        }
        std::string poll_url;
        if (prediction.contains("urls") && prediction["urls"].is_object())
            poll_url = prediction["urls"].value("get", "");
        if (poll_url.empty())
        {
            return failure("prediction is " + prediction.value("status", "unknown") + " and has no poll URL");
        }
        std::this_thread::sleep_for(std::min(POLL_INTERVAL, std::max(remaining(), std::chrono::milliseconds(1))));

        auto [poll_base, poll_path] = splitUrl(poll_url);
        httplib::Client poller(poll_base);
        applyTimeouts(poller, remaining());
        auto poll = poller.Get(poll_path, httplib::Headers{{"Authorization", "Bearer " + settings_.ai_api_token}});
        if (!poll)
        {
            return failure("polling " + poll_url + " failed: " + httplib::to_string(poll.error()),
                           remaining().count() <= 0);
        }
        if (poll->status < 200 || poll->status >= 300)
        {
            return failure("HTTP " + std::to_string(poll->status) + " while polling prediction: " + poll->body);
        }
        try
        {
            prediction = nlohmann::json::parse(poll->body);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            return failure("unreadable poll response: " + std::string(e.what()));
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    Logger::debug("Prediction " + prediction.value("id", "?") + " " + prediction.value("status", "") + " after " +
                  std::to_string(elapsed.count()) + " ms");
    return interpret(prediction);
}
