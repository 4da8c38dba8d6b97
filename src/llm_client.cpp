#include "llm_client.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <atomic>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace optidex {

namespace {

std::atomic<int> tool_call_counter{0};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* buffer = static_cast<std::string*>(userp);
    size_t total_size = size * nmemb;
    buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace

class LLMClient::Impl {
public:
    explicit Impl(const LLMConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<LLMResponse> chat(const std::vector<std::string>& history,
                             const std::string& tool_definitions_json) {
        json messages = json::array();
        messages.push_back(json{{"role", "system"}, {"content", config_.system_prompt}});

        for (const auto& msg : history) {
            json msg_json = json::parse(msg, nullptr, false);
            if (msg_json.is_discarded() || !msg_json.is_object()) {
                Logger::warn("[LLM] Skipping malformed history message");
                continue;
            }
            if (msg_json.value("role", "") == "system") continue;
            messages.push_back(std::move(msg_json));
        }

        json request;
        request["model"] = config_.model_name;
        request["messages"] = messages;
        request["stream"] = false;
        request["options"] = json{{"temperature", config_.temperature}};

        if (!tool_definitions_json.empty()) {
            json tools = json::parse(tool_definitions_json, nullptr, false);
            if (tools.is_discarded()) {
                Logger::warn("[LLM] Failed to parse tool definitions; sending without tools");
            } else if (!tools.empty()) {
                request["tools"] = tools;
            }
        }

        LOG_LLM("Request to " + config_.endpoint + " (" + std::to_string(messages.size()) + " messages)");
        auto body = post(request, config_.timeout_ms);
        if (body.is_error()) {
            return body.error();
        }
        return LLMClient::parse_response(body.value());
    }

    Result<std::string> analyze(const std::string& image_path, const std::string& prompt) {
        std::ifstream file(image_path, std::ios::binary);
        if (!file) {
            return make_io_error("Cannot read image " + image_path);
        }
        std::ostringstream bytes;
        bytes << file.rdbuf();

        json request;
        request["model"] = config_.vision_model;
        request["messages"] = json::array({
            json::parse(LLMClient::format_image_message(prompt, {utils::base64_encode(bytes.str())}))
        });
        request["stream"] = false;

        LOG_LLM("Vision request to " + config_.vision_model + " for " + image_path);
        auto body = post(request, config_.vision_timeout_ms);
        if (body.is_error()) {
            return body.error();
        }
        auto response = LLMClient::parse_response(body.value());
        if (response.is_error()) {
            return response.error();
        }
        if (response.value().content.empty()) {
            return make_parse_error("Vision model returned no text");
        }
        return response.value().content;
    }

private:
    Result<std::string> post(const json& request, int timeout_ms) {
        std::string request_json = request.dump(-1, ' ', false, json::error_handler_t::replace);

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_network_error("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        std::string response_buffer;

        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 2000L);

        // Image payloads are too large for the debug log
        if (request_json.size() < 16384) {
            Logger::debug("[LLM] Request: " + request_json);
        }

        CURLcode res = curl_easy_perform(curl);
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_timeout_error("LLM request timed out after " + std::to_string(timeout_ms) + "ms");
        }
        if (res != CURLE_OK) {
            return make_network_error(std::string("LLM request failed: ") + curl_easy_strerror(res));
        }
        if (http_code != 200) {
            return make_network_error("LLM returned HTTP " + std::to_string(http_code) + ": " +
                                      response_buffer.substr(0, 200));
        }

        Logger::debug("[LLM] Response: " + response_buffer);
        return response_buffer;
    }

    LLMConfig config_;
};

LLMClient::LLMClient(const LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

LLMClient::~LLMClient() = default;

Result<LLMResponse> LLMClient::chat(const std::vector<std::string>& messages,
                                    const std::string& tool_definitions_json) {
    return pimpl_->chat(messages, tool_definitions_json);
}

Result<std::string> LLMClient::analyze(const std::string& image_path, const std::string& prompt) {
    return pimpl_->analyze(image_path, prompt);
}

std::string LLMClient::format_message(const std::string& role, const std::string& content) {
    return json{{"role", role}, {"content", content}}.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string LLMClient::format_image_message(const std::string& content,
                                           const std::vector<std::string>& base64_images) {
    json message{{"role", "user"}, {"content", content}, {"images", base64_images}};
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string LLMClient::format_tool_result(const std::string& tool_call_id,
                                          const std::string& tool_name,
                                          const std::string& result_content) {
    json result_msg;
    result_msg["role"] = "tool";
    result_msg["tool_call_id"] = tool_call_id;
    result_msg["name"] = tool_name;
    result_msg["content"] = result_content;
    return result_msg.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<LLMResponse> LLMClient::parse_response(const std::string& body) {
    json response_json = json::parse(body, nullptr, false);
    if (response_json.is_discarded()) {
        return make_parse_error("LLM response is not JSON");
    }
    if (!response_json.contains("message") || !response_json["message"].is_object()) {
        return make_parse_error("No message in LLM response");
    }

    LLMResponse response;
    try {
        const json& message = response_json["message"];
        if (message.contains("content") && message["content"].is_string()) {
            response.content = clean_response(message["content"].get<std::string>());
        }

        if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
            for (const auto& tool_call : message["tool_calls"]) {
                ToolCall tc;
                if (tool_call.contains("id") && tool_call["id"].is_string()) {
                    tc.id = tool_call["id"].get<std::string>();
                }
                if (tc.id.empty()) {
                    tc.id = "call_" + std::to_string(++tool_call_counter);
                }
                if (tool_call.contains("function")) {
                    const json& func = tool_call["function"];
                    tc.name = func.value("name", "");
                    if (func.contains("arguments")) {
                        // Ollama sends an object; OpenAI-style servers send a string
                        const json& args = func["arguments"];
                        tc.arguments = args.is_string() ? args.get<std::string>() : args.dump();
                    }
                }
                if (!tc.name.empty()) {
                    response.tool_calls.push_back(std::move(tc));
                }
            }
        }
        response.raw_message = message.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return make_parse_error(std::string("Bad LLM message: ") + e.what());
    }

    return response;
}

std::string LLMClient::clean_response(const std::string& response) {
    std::string result;
    bool last_was_space = true;  // drops leading whitespace
    for (char c : response) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!last_was_space) {
                result += ' ';
                last_was_space = true;
            }
        } else {
            result += c;
            last_was_space = false;
        }
    }
    if (!result.empty() && result.back() == ' ') result.pop_back();
    return result;
}

} // namespace optidex
