#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace docqa_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The server answered, but the payload is not what the API promises. Asking
// again will not help.
class OllamaResponseError : public OllamaError {
 public:
  using OllamaError::OllamaError;
};

// Handle on the hosted models: one embedding model and one generation model
// behind the same Ollama server. Every call is bounded by the configured
// read/write timeout; network, HTTP and timeout failures surface as OllamaError.
class OllamaClient {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &generation_model,
               int timeout_seconds = 60);
  virtual ~OllamaClient() = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  virtual std::vector<float> get_embedding(const std::string &text);

  // Same order and length as the input.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts);

  virtual std::string generate(const std::string &prompt);

  virtual bool is_server_available();

  const std::string &embedding_model() const {
    return embedding_model_;
  }
  const std::string &generation_model() const {
    return generation_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;
  int timeout_seconds_;

  void setup_server_connection();
};

}  // namespace docqa_core
