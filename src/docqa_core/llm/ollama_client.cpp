#include "docqa_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace docqa_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &generation_model,
                           int timeout_seconds)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      generation_model_(generation_model),
      timeout_seconds_(timeout_seconds) {
  if (timeout_seconds_ <= 0) {
    throw std::invalid_argument("Ollama timeout must be positive, got " +
                                std::to_string(timeout_seconds_));
  }
  setup_server_connection();
}

// The connection itself is opened lazily by the first request; a server that
// is not up yet is reported by is_server_available() rather than here.
void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(timeout_seconds_);
  ollama::setWriteTimeout(timeout_seconds_);
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw OllamaResponseError("Response does not contain embedding field");
    }

    // Handle both the nested and the flat embedding layouts
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw OllamaResponseError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaResponseError("Malformed embedding response: " + std::string(e.what()));
  }
}

// The embeddings endpoint is driven one text at a time; batching and retries
// live in EmbeddingClient.
std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(get_embedding(text));
  }
  return vectors;
}

std::string OllamaClient::generate(const std::string &prompt) {
  try {
    ollama::response response = ollama::generate(generation_model_, prompt);
    std::string text = response.as_simple_string();
    if (text.empty()) {
      throw OllamaResponseError("Generation returned an empty response");
    }
    return text;
  } catch (const ollama::exception &e) {
    throw OllamaError("Generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaResponseError("Malformed generation response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace docqa_core
